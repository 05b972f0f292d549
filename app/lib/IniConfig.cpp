#include "IniConfig.hpp"
#include "Logger.hpp"
#include <cstdio>
#include <filesystem>
#include <optional>
#include <system_error>
#include <utility>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace {
template <typename... Args>
void ini_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->log(level, "{}", message);
    } else {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

std::string trim_copy(const std::string& input)
{
    const auto begin = input.find_first_not_of(" \t\r");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(" \t\r");
    return input.substr(begin, end - begin + 1);
}

bool is_comment_or_blank(const std::string& line)
{
    return line.empty() || line.front() == ';' || line.front() == '#';
}

std::optional<std::string> section_name(const std::string& line)
{
    if (line.size() < 2 || line.front() != '[' || line.back() != ']') {
        return std::nullopt;
    }
    return trim_copy(line.substr(1, line.size() - 2));
}

std::optional<std::pair<std::string, std::string>> split_assignment(const std::string& line)
{
    const auto delimiter = line.find('=');
    if (delimiter == std::string::npos) {
        return std::nullopt;
    }
    std::string key = trim_copy(line.substr(0, delimiter));
    if (key.empty()) {
        return std::nullopt;
    }
    return std::make_pair(std::move(key), trim_copy(line.substr(delimiter + 1)));
}
}


bool IniConfig::load(const std::string &filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        ini_log(spdlog::level::info, "Config file not found, using defaults: {}", filename);
        return false;
    }

    data.clear();
    std::string raw_line;
    std::string section;
    while (std::getline(file, raw_line)) {
        const std::string line = trim_copy(raw_line);
        if (is_comment_or_blank(line)) {
            continue;
        }
        if (auto name = section_name(line)) {
            section = *name;
            continue;
        }
        if (auto assignment = split_assignment(line)) {
            data[section][assignment->first] = assignment->second;
        } else {
            ini_log(spdlog::level::warn, "Ignoring malformed config line in {}: '{}'", filename, line);
        }
    }
    return true;
}


std::string IniConfig::getValue(const std::string &section, const std::string &key, const std::string &default_value) const {
    auto sec_it = data.find(section);
    if (sec_it != data.end()) {
        auto key_it = sec_it->second.find(key);
        if (key_it != sec_it->second.end()) {
            return key_it->second;
        }
    }
    return default_value;
}


void IniConfig::setValue(const std::string &section, const std::string &key, const std::string &value) {
    data[section][key] = value;
}


void IniConfig::removeValue(const std::string &section, const std::string &key)
{
    auto sec_it = data.find(section);
    if (sec_it == data.end()) {
        return;
    }
    sec_it->second.erase(key);
    if (sec_it->second.empty()) {
        data.erase(sec_it);
    }
}


bool IniConfig::save(const std::string &filename) const
{
    const std::string temp_name = filename + ".tmp";
    {
        std::ofstream file(temp_name, std::ios::trunc);
        if (!file.is_open()) {
            ini_log(spdlog::level::err, "Failed to open config file for writing: {}", temp_name);
            return false;
        }

        for (const auto &section : data) {
            file << "[" << section.first << "]\n";
            for (const auto &pair : section.second) {
                file << pair.first << " = " << pair.second << "\n";
            }
            file << "\n";
        }

        if (!file.good()) {
            ini_log(spdlog::level::err, "Failed to write config file: {}", temp_name);
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_name, filename, ec);
    if (ec) {
        ini_log(spdlog::level::err, "Failed to replace config file {}: {}", filename, ec.message());
        return false;
    }
    return true;
}


bool IniConfig::hasValue(const std::string& section, const std::string& key) const
{
    const auto sec_it = data.find(section);
    if (sec_it == data.end()) {
        return false;
    }
    return sec_it->second.find(key) != sec_it->second.end();
}


std::string IniConfig::escape(const std::string &value)
{
    std::string result;
    result.reserve(value.size());
    for (char ch : value) {
        switch (ch) {
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default: result += ch; break;
        }
    }
    return result;
}


std::string IniConfig::unescape(const std::string &value)
{
    std::string result;
    result.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        const char ch = value[i];
        if (ch != '\\' || i + 1 >= value.size()) {
            result += ch;
            continue;
        }
        const char next = value[++i];
        switch (next) {
            case 'n': result += '\n'; break;
            case 'r': result += '\r'; break;
            case 't': result += '\t'; break;
            case '\\': result += '\\'; break;
            default:
                result += '\\';
                result += next;
                break;
        }
    }
    return result;
}
