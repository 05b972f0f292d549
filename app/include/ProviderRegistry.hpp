#pragma once

#include "IEnhancementProvider.hpp"

#include <map>
#include <memory>

/**
 * @brief Owns one provider instance per ProviderKind.
 */
class ProviderRegistry {
public:
    /**
     * @brief Registers the four stock backends. Base URLs may be overridden with
     * DICTAFLOW_OLLAMA_URL, DICTAFLOW_LMSTUDIO_URL, DICTAFLOW_GROQ_URL and DICTAFLOW_GEMINI_URL.
     */
    static ProviderRegistry with_default_providers();

    void register_provider(std::shared_ptr<IEnhancementProvider> provider);
    std::shared_ptr<IEnhancementProvider> get(ProviderKind kind) const;

private:
    std::map<ProviderKind, std::shared_ptr<IEnhancementProvider>> providers_;
};
