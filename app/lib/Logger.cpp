#include "Logger.hpp"
#include "Settings.hpp"

#include <filesystem>
#include <vector>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {

constexpr std::size_t kMaxLogFileSize = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;

const std::vector<std::string>& logger_names()
{
    static const std::vector<std::string> names = {
        "core_logger",
        "provider_logger",
        "model_logger"
    };
    return names;
}

}


std::string Logger::get_log_directory()
{
    const std::filesystem::path config_file = Settings::define_config_path();
    return (config_file.parent_path() / "logs").string();
}


std::string Logger::get_log_file_path()
{
    return (std::filesystem::path(get_log_directory()) / "dictaflow.log").string();
}


void Logger::setup_loggers()
{
    std::filesystem::create_directories(get_log_directory());

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::warn);

    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        get_log_file_path(), kMaxLogFileSize, kMaxLogFiles);
    file_sink->set_level(spdlog::level::debug);

    for (const auto& name : logger_names()) {
        if (spdlog::get(name)) {
            continue;
        }
        auto logger = std::make_shared<spdlog::logger>(
            name, spdlog::sinks_init_list{console_sink, file_sink});
        logger->set_level(spdlog::level::debug);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    }
}


std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name)
{
    return spdlog::get(name);
}
