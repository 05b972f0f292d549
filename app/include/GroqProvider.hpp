#pragma once
#include "HttpClient.hpp"
#include "IEnhancementProvider.hpp"
#include <memory>
#include <string>

namespace spdlog { class logger; }
namespace Json { class Value; }

class GroqProvider : public IEnhancementProvider {
public:
    static constexpr const char* kDefaultBaseUrl = "https://api.groq.com/openai/v1";

    explicit GroqProvider(std::string base_url = kDefaultBaseUrl);

    ProviderKind kind() const override;
    bool is_available(const std::string& api_key) override;
    bool test_connection(const std::string& api_key) override;
    std::vector<RemoteAIModel> fetch_models(const std::string& api_key) override;
    std::string enhance(const std::string& text,
                        const std::string& model_id,
                        const EnhancementOptions& options,
                        const std::string& api_key,
                        const ProgressCallback& on_progress) override;
    std::string analyze_image(const std::vector<unsigned char>& image_data,
                              const std::string& model_id,
                              const std::string& prompt,
                              const std::string& system_prompt,
                              const std::string& api_key,
                              const ProgressCallback& on_progress) override;

private:
    std::string base_url_;
    HttpClient http_;
    std::shared_ptr<spdlog::logger> logger_;

    std::vector<std::string> auth_headers(const std::string& api_key) const;
    std::string complete(const Json::Value& body,
                         const std::string& api_key,
                         long timeout_seconds,
                         const ProgressCallback& on_progress);
};
