#include "Types.hpp"


ProviderCategory provider_category(ProviderKind kind)
{
    switch (kind) {
        case ProviderKind::Ollama:
        case ProviderKind::LMStudio:
            return ProviderCategory::Local;
        case ProviderKind::Groq:
        case ProviderKind::Gemini:
            return ProviderCategory::Remote;
    }
    return ProviderCategory::Local;
}


bool provider_requires_credential(ProviderKind kind)
{
    return provider_category(kind) == ProviderCategory::Remote;
}


std::string provider_to_string(ProviderKind kind)
{
    switch (kind) {
        case ProviderKind::Ollama: return "ollama";
        case ProviderKind::LMStudio: return "lmstudio";
        case ProviderKind::Groq: return "groq";
        case ProviderKind::Gemini: return "gemini";
    }
    return "ollama";
}


std::optional<ProviderKind> provider_from_string(const std::string& value)
{
    if (value == "ollama") return ProviderKind::Ollama;
    if (value == "lmstudio") return ProviderKind::LMStudio;
    if (value == "groq") return ProviderKind::Groq;
    if (value == "gemini") return ProviderKind::Gemini;
    return std::nullopt;
}


std::string provider_display_name(ProviderKind kind)
{
    switch (kind) {
        case ProviderKind::Ollama: return "Ollama (Local)";
        case ProviderKind::LMStudio: return "LM Studio (Local)";
        case ProviderKind::Groq: return "Groq (Remote)";
        case ProviderKind::Gemini: return "Gemini (Remote)";
    }
    return "Unknown";
}


const std::vector<ProviderKind>& all_providers()
{
    static const std::vector<ProviderKind> kinds = {
        ProviderKind::Ollama,
        ProviderKind::LMStudio,
        ProviderKind::Groq,
        ProviderKind::Gemini
    };
    return kinds;
}


std::string EnhancementOptions::default_prompt()
{
    return "You are a professional editor cleaning up text produced by speech recognition.\n"
           "\n"
           "Your task is to:\n"
           "1. Fix grammar, punctuation, and capitalization\n"
           "2. Correct obvious transcription mistakes\n"
           "3. Keep every piece of information from the original\n"
           "4. Never add information that was not spoken\n"
           "\n"
           "Return only the improved text.";
}


std::string EnhancementOptions::default_image_prompt()
{
    return "You analyze screenshots to give context to a dictation engine.\n"
           "\n"
           "Describe in first person what the user is working on, and list any visible\n"
           "names, technical terms, or vocabulary that could appear in their speech.\n"
           "Keep the answer brief.";
}


std::string warm_status_to_string(ModelWarmStatus status)
{
    switch (status) {
        case ModelWarmStatus::Cold: return "cold";
        case ModelWarmStatus::Warming: return "warming";
        case ModelWarmStatus::Warm: return "warm";
    }
    return "cold";
}


ModelWarmStatus warm_status_from_string(const std::string& value)
{
    if (value == "warming") return ModelWarmStatus::Warming;
    if (value == "warm") return ModelWarmStatus::Warm;
    return ModelWarmStatus::Cold;
}
