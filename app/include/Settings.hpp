#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include <IniConfig.hpp>
#include <Types.hpp>
#include <filesystem>
#include <map>
#include <string>


class Settings
{
public:
    Settings();

    bool load();
    bool save();

    static std::string define_config_path();
    std::string get_config_dir() const;
    std::string get_config_path() const;

    bool get_enhancement_enabled() const;
    void set_enhancement_enabled(bool value);

    ProviderKind get_active_provider() const;
    void set_active_provider(ProviderKind kind);

    double get_temperature() const;
    void set_temperature(double value);
    int get_max_tokens() const;
    void set_max_tokens(int value);

    std::string get_prompt() const;
    void set_prompt(const std::string& prompt);
    std::string get_image_prompt() const;
    void set_image_prompt(const std::string& prompt);

    /**
     * @brief Returns the stored API key for a provider, falling back to
     * GROQ_API_KEY / GEMINI_API_KEY when none is stored.
     */
    std::string get_api_key(ProviderKind kind) const;
    void set_api_key(ProviderKind kind, const std::string& key);
    bool has_stored_api_key(ProviderKind kind) const;

    std::string get_selected_text_model(ProviderKind kind) const;
    void set_selected_text_model(ProviderKind kind, const std::string& model_id);
    std::string get_selected_image_model(ProviderKind kind) const;
    void set_selected_image_model(ProviderKind kind, const std::string& model_id);

    std::string get_transcription_model() const;
    void set_transcription_model(const std::string& name);
    ModelWarmStatus get_transcription_warm_status() const;
    void set_transcription_warm_status(ModelWarmStatus status);

private:
    struct ProviderSelection {
        std::string api_key;
        std::string text_model;
        std::string image_model;
    };

    ProviderSelection& selection_for(ProviderKind kind);
    const ProviderSelection* find_selection(ProviderKind kind) const;

    std::string config_path;
    std::filesystem::path config_dir;
    IniConfig config;

    bool enhancement_enabled{false};
    ProviderKind active_provider{ProviderKind::Ollama};
    double temperature{0.3};
    int max_tokens{1000};
    std::string prompt;
    std::string image_prompt;
    std::map<ProviderKind, ProviderSelection> selections;

    std::string transcription_model{"base"};
    ModelWarmStatus transcription_warm_status{ModelWarmStatus::Cold};
};

#endif
