#include "Settings.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#ifdef _WIN32
    #include <shlobj.h>
    #include <windows.h>
#endif


namespace {
template <typename... Args>
void settings_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->log(level, "{}", message);
    } else {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

double parse_double_or(const std::string& value, double fallback) {
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

int parse_int_or(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string provider_section(ProviderKind kind) {
    return "Provider." + provider_to_string(kind);
}

const char* credential_env_var(ProviderKind kind) {
    switch (kind) {
        case ProviderKind::Groq: return "GROQ_API_KEY";
        case ProviderKind::Gemini: return "GEMINI_API_KEY";
        default: return nullptr;
    }
}
}


Settings::Settings()
    : prompt(EnhancementOptions::default_prompt()),
      image_prompt(EnhancementOptions::default_image_prompt())
{
    config_path = define_config_path();
    config_dir = std::filesystem::path(config_path).parent_path();

    try {
        if (!std::filesystem::exists(config_dir)) {
            std::filesystem::create_directories(config_dir);
        }
    } catch (const std::filesystem::filesystem_error &e) {
        settings_log(spdlog::level::err, "Error creating configuration directory: {}", e.what());
    }
}


std::string Settings::define_config_path()
{
    std::string AppName = "DictaFlow";
    if (const char* override_root = std::getenv("DICTAFLOW_CONFIG_DIR")) {
        std::filesystem::path base = override_root;
        return (base / AppName / "config.ini").string();
    }
#ifdef _WIN32
    char appDataPath[MAX_PATH];
    if (SUCCEEDED(SHGetFolderPathA(NULL, CSIDL_APPDATA, NULL, 0, appDataPath))) {
        return std::string(appDataPath) + "\\" + AppName + "\\config.ini";
    }
#else
    if (const char* home = std::getenv("HOME")) {
#if defined(__APPLE__)
        return std::string(home) + "/Library/Application Support/" + AppName + "/config.ini";
#else
        return std::string(home) + "/.config/" + AppName + "/config.ini";
#endif
    }
#endif
    return "config.ini";
}


std::string Settings::get_config_dir() const
{
    return config_dir.string();
}


std::string Settings::get_config_path() const
{
    return config_path;
}


bool Settings::load()
{
    if (!config.load(config_path)) {
        return false;
    }

    enhancement_enabled = config.getValue("Enhancement", "Enabled", "false") == "true";
    const std::string provider_value = config.getValue("Enhancement", "Provider", "ollama");
    if (auto kind = provider_from_string(provider_value)) {
        active_provider = *kind;
    } else {
        settings_log(spdlog::level::warn, "Unknown provider '{}' in config, using Ollama", provider_value);
        active_provider = ProviderKind::Ollama;
    }
    set_temperature(parse_double_or(config.getValue("Enhancement", "Temperature", "0.3"), 0.3));
    set_max_tokens(parse_int_or(config.getValue("Enhancement", "MaxTokens", "1000"), 1000));
    prompt = IniConfig::unescape(config.getValue("Enhancement", "Prompt",
                                                 IniConfig::escape(EnhancementOptions::default_prompt())));
    image_prompt = IniConfig::unescape(config.getValue("Enhancement", "ImagePrompt",
                                                       IniConfig::escape(EnhancementOptions::default_image_prompt())));

    selections.clear();
    for (ProviderKind kind : all_providers()) {
        const std::string section = provider_section(kind);
        ProviderSelection selection;
        selection.api_key = config.getValue(section, "ApiKey", "");
        selection.text_model = config.getValue(section, "TextModel", "");
        selection.image_model = config.getValue(section, "ImageModel", "");
        if (!selection.api_key.empty() || !selection.text_model.empty() || !selection.image_model.empty()) {
            selections[kind] = selection;
        }
    }

    transcription_model = config.getValue("Transcription", "Model", "base");
    transcription_warm_status = warm_status_from_string(config.getValue("Transcription", "WarmStatus", "cold"));

    settings_log(spdlog::level::info, "Loaded settings from '{}' (enhancement: {}, provider: {}, transcription model: {})",
                 config_path,
                 enhancement_enabled,
                 provider_to_string(active_provider),
                 transcription_model);
    return true;
}


bool Settings::save()
{
    config.setValue("Enhancement", "Enabled", enhancement_enabled ? "true" : "false");
    config.setValue("Enhancement", "Provider", provider_to_string(active_provider));
    config.setValue("Enhancement", "Temperature", fmt::format("{:.2f}", temperature));
    config.setValue("Enhancement", "MaxTokens", std::to_string(max_tokens));
    config.setValue("Enhancement", "Prompt", IniConfig::escape(prompt));
    config.setValue("Enhancement", "ImagePrompt", IniConfig::escape(image_prompt));

    for (ProviderKind kind : all_providers()) {
        const std::string section = provider_section(kind);
        const ProviderSelection* selection = find_selection(kind);
        auto store = [&](const char* key, const std::string& value) {
            if (value.empty()) {
                config.removeValue(section, key);
            } else {
                config.setValue(section, key, value);
            }
        };
        store("ApiKey", selection ? selection->api_key : std::string());
        store("TextModel", selection ? selection->text_model : std::string());
        store("ImageModel", selection ? selection->image_model : std::string());
    }

    config.setValue("Transcription", "Model", transcription_model);
    config.setValue("Transcription", "WarmStatus", warm_status_to_string(transcription_warm_status));

    return config.save(config_path);
}


Settings::ProviderSelection& Settings::selection_for(ProviderKind kind)
{
    return selections[kind];
}


const Settings::ProviderSelection* Settings::find_selection(ProviderKind kind) const
{
    const auto it = selections.find(kind);
    return it == selections.end() ? nullptr : &it->second;
}


bool Settings::get_enhancement_enabled() const
{
    return enhancement_enabled;
}


void Settings::set_enhancement_enabled(bool value)
{
    enhancement_enabled = value;
}


ProviderKind Settings::get_active_provider() const
{
    return active_provider;
}


void Settings::set_active_provider(ProviderKind kind)
{
    active_provider = kind;
}


double Settings::get_temperature() const
{
    return temperature;
}


void Settings::set_temperature(double value)
{
    if (std::isnan(value)) {
        temperature = EnhancementOptions{}.temperature;
        return;
    }
    temperature = std::clamp(value, 0.0, 1.0);
}


int Settings::get_max_tokens() const
{
    return max_tokens;
}


void Settings::set_max_tokens(int value)
{
    max_tokens = value > 0 ? value : 1000;
}


std::string Settings::get_prompt() const
{
    return prompt;
}


void Settings::set_prompt(const std::string& value)
{
    prompt = value;
}


std::string Settings::get_image_prompt() const
{
    return image_prompt;
}


void Settings::set_image_prompt(const std::string& value)
{
    image_prompt = value;
}


std::string Settings::get_api_key(ProviderKind kind) const
{
    if (const ProviderSelection* selection = find_selection(kind)) {
        if (!selection->api_key.empty()) {
            return selection->api_key;
        }
    }
    if (const char* env_name = credential_env_var(kind)) {
        const char* value = std::getenv(env_name);
        if (value && value[0] != '\0') {
            return std::string(value);
        }
    }
    return {};
}


void Settings::set_api_key(ProviderKind kind, const std::string& key)
{
    selection_for(kind).api_key = key;
}


bool Settings::has_stored_api_key(ProviderKind kind) const
{
    const ProviderSelection* selection = find_selection(kind);
    return selection && !selection->api_key.empty();
}


std::string Settings::get_selected_text_model(ProviderKind kind) const
{
    const ProviderSelection* selection = find_selection(kind);
    return selection ? selection->text_model : std::string();
}


void Settings::set_selected_text_model(ProviderKind kind, const std::string& model_id)
{
    selection_for(kind).text_model = model_id;
}


std::string Settings::get_selected_image_model(ProviderKind kind) const
{
    const ProviderSelection* selection = find_selection(kind);
    return selection ? selection->image_model : std::string();
}


void Settings::set_selected_image_model(ProviderKind kind, const std::string& model_id)
{
    selection_for(kind).image_model = model_id;
}


std::string Settings::get_transcription_model() const
{
    return transcription_model;
}


void Settings::set_transcription_model(const std::string& name)
{
    transcription_model = name;
}


ModelWarmStatus Settings::get_transcription_warm_status() const
{
    return transcription_warm_status;
}


void Settings::set_transcription_warm_status(ModelWarmStatus status)
{
    transcription_warm_status = status;
}
