#include "ModelSelection.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

namespace ModelSelection {

namespace {

std::string to_lower_copy(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

bool contains_model(const std::vector<RemoteAIModel>& catalog, const std::string& id)
{
    return std::any_of(catalog.begin(), catalog.end(),
                       [&id](const RemoteAIModel& model) { return model.id == id; });
}

}


std::string flagship_text_model(ProviderKind kind)
{
    switch (kind) {
        case ProviderKind::Ollama:
        case ProviderKind::LMStudio:
            return "gemma3";
        case ProviderKind::Groq:
            return "llama-3.3-70b-versatile";
        case ProviderKind::Gemini:
            return "models/gemini-2.0-flash";
    }
    return {};
}


std::string flagship_image_model(ProviderKind kind)
{
    switch (kind) {
        case ProviderKind::Ollama:
        case ProviderKind::LMStudio:
            return "gemma3";
        case ProviderKind::Groq:
            return "meta-llama/llama-4-maverick-17b-128e-instruct";
        case ProviderKind::Gemini:
            return "models/gemini-2.0-flash";
    }
    return {};
}


const std::vector<std::string>& vision_keywords()
{
    static const std::vector<std::string> keywords = {
        "gemini", "gemma", "llava", "vl", "vision", "minicpm", "moondream", "llama-4"
    };
    return keywords;
}


bool is_vision_model(const RemoteAIModel& model)
{
    const std::string id = to_lower_copy(model.id);
    const std::string name = to_lower_copy(model.display_name);
    return std::any_of(vision_keywords().begin(), vision_keywords().end(),
                       [&](const std::string& keyword) {
                           return id.find(keyword) != std::string::npos ||
                                  name.find(keyword) != std::string::npos;
                       });
}


std::vector<RemoteAIModel> filter_vision_models(const std::vector<RemoteAIModel>& catalog)
{
    std::vector<RemoteAIModel> result;
    std::copy_if(catalog.begin(), catalog.end(), std::back_inserter(result), is_vision_model);
    return result;
}


std::string reconcile_selection(const std::string& current,
                                const std::vector<RemoteAIModel>& catalog,
                                const std::string& flagship)
{
    if (catalog.empty()) {
        return current;
    }
    if (!current.empty() && contains_model(catalog, current)) {
        return current;
    }
    if (!flagship.empty() && contains_model(catalog, flagship)) {
        return flagship;
    }
    return catalog.front().id;
}

} // namespace ModelSelection
