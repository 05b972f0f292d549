#include "ProviderRegistry.hpp"
#include "GeminiProvider.hpp"
#include "GroqProvider.hpp"
#include "LMStudioProvider.hpp"
#include "OllamaProvider.hpp"
#include "ProviderSupport.hpp"


ProviderRegistry ProviderRegistry::with_default_providers()
{
    using ProviderSupport::env_or;

    ProviderRegistry registry;
    registry.register_provider(std::make_shared<OllamaProvider>(
        env_or("DICTAFLOW_OLLAMA_URL", OllamaProvider::kDefaultBaseUrl)));
    registry.register_provider(std::make_shared<LMStudioProvider>(
        env_or("DICTAFLOW_LMSTUDIO_URL", LMStudioProvider::kDefaultBaseUrl)));
    registry.register_provider(std::make_shared<GroqProvider>(
        env_or("DICTAFLOW_GROQ_URL", GroqProvider::kDefaultBaseUrl)));
    registry.register_provider(std::make_shared<GeminiProvider>(
        env_or("DICTAFLOW_GEMINI_URL", GeminiProvider::kDefaultBaseUrl)));
    return registry;
}


void ProviderRegistry::register_provider(std::shared_ptr<IEnhancementProvider> provider)
{
    if (!provider) {
        return;
    }
    const ProviderKind kind = provider->kind();
    providers_[kind] = std::move(provider);
}


std::shared_ptr<IEnhancementProvider> ProviderRegistry::get(ProviderKind kind) const
{
    const auto it = providers_.find(kind);
    return it == providers_.end() ? nullptr : it->second;
}
