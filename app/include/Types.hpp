#ifndef TYPES_HPP
#define TYPES_HPP

#include <functional>
#include <optional>
#include <string>
#include <vector>

enum class ProviderKind {
    Ollama,
    LMStudio,
    Groq,
    Gemini
};

enum class ProviderCategory {
    Local,
    Remote
};

ProviderCategory provider_category(ProviderKind kind);
bool provider_requires_credential(ProviderKind kind);
std::string provider_to_string(ProviderKind kind);
std::optional<ProviderKind> provider_from_string(const std::string& value);
std::string provider_display_name(ProviderKind kind);
const std::vector<ProviderKind>& all_providers();


struct RemoteAIModel {
    std::string id;
    std::string display_name;
    std::string owned_by;
    int context_window_tokens{0};
    int max_completion_tokens{0};
    bool active{true};

    bool operator==(const RemoteAIModel& other) const { return id == other.id; }
};


struct EnhancementOptions {
    std::string system_prompt = default_prompt();
    std::optional<std::string> context;
    double temperature{0.3};
    int max_tokens{1000};

    static std::string default_prompt();
    static std::string default_image_prompt();
};


enum class ModelWarmStatus {
    Cold,
    Warming,
    Warm
};

std::string warm_status_to_string(ModelWarmStatus status);
ModelWarmStatus warm_status_from_string(const std::string& value);


struct ModelInfo {
    std::string name;
    bool is_downloaded{false};
};


struct CuratedModelInfo {
    std::string display_name;
    std::string internal_name;
    std::string size_label;
    int accuracy_stars{0};
    int speed_stars{0};
    std::string storage_size_label;
    bool is_downloaded{false};
};


using ProgressCallback = std::function<void(double)>;

#endif // TYPES_HPP
