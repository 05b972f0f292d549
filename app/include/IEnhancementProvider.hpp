#ifndef IENHANCEMENT_PROVIDER_HPP
#define IENHANCEMENT_PROVIDER_HPP

#include "Types.hpp"

#include <string>
#include <vector>

/**
 * @brief Capability interface shared by every enhancement backend.
 *
 * An empty @p api_key means "no credential". Network and decode failures are
 * reported by throwing ProviderError; is_available() and test_connection()
 * never throw.
 */
class IEnhancementProvider {
public:
    virtual ~IEnhancementProvider() = default;

    virtual ProviderKind kind() const = 0;
    bool requires_credential() const { return provider_requires_credential(kind()); }

    virtual bool is_available(const std::string& api_key) = 0;
    virtual bool test_connection(const std::string& api_key) = 0;

    /**
     * @brief Returns the backend's model catalog sorted by display name.
     */
    virtual std::vector<RemoteAIModel> fetch_models(const std::string& api_key) = 0;

    /**
     * @brief Rewrites a raw transcription using @p model_id.
     * @param on_progress Receives 0.1, 0.2, 0.8 and 1.0 as the call advances.
     */
    virtual std::string enhance(const std::string& text,
                                const std::string& model_id,
                                const EnhancementOptions& options,
                                const std::string& api_key,
                                const ProgressCallback& on_progress) = 0;

    /**
     * @brief Describes a screenshot. Backends without vision support keep the
     * default, which throws ProviderError(CapabilityUnsupported).
     */
    virtual std::string analyze_image(const std::vector<unsigned char>& image_data,
                                      const std::string& model_id,
                                      const std::string& prompt,
                                      const std::string& system_prompt,
                                      const std::string& api_key,
                                      const ProgressCallback& on_progress);
};

#endif // IENHANCEMENT_PROVIDER_HPP
