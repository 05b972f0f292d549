#include "OllamaProvider.hpp"
#include "EnhancementErrors.hpp"
#include "Logger.hpp"
#include "ProviderSupport.hpp"
#include "ResponseNormalizer.hpp"

namespace {

constexpr long kGenerateTimeoutSeconds = 60;
constexpr int kMaxTokensUpperBound = 2000;
constexpr const char* kSystemMessage = "You are an AI that improves transcribed text while preserving meaning.";

}

OllamaProvider::OllamaProvider(std::string base_url)
    : base_url_(ProviderSupport::trim_trailing_slash(std::move(base_url)))
{
    logger_ = Logger::get_logger("provider_logger");
}

ProviderKind OllamaProvider::kind() const {
    return ProviderKind::Ollama;
}

std::string OllamaProvider::base_url() const {
    return base_url_;
}

bool OllamaProvider::is_available(const std::string&) {
    HttpRequest request;
    request.url = base_url_ + "/api/version";
    request.timeout_seconds = ProviderSupport::kAvailabilityTimeoutSeconds;
    try {
        return http_.perform(request).ok();
    } catch (const ProviderError& ex) {
        if (logger_) {
            logger_->info("Ollama is not reachable at {}: {}", base_url_, ex.what());
        }
        return false;
    }
}

bool OllamaProvider::test_connection(const std::string& api_key) {
    return is_available(api_key);
}

std::vector<RemoteAIModel> OllamaProvider::fetch_models(const std::string&) {
    HttpRequest request;
    request.url = base_url_ + "/api/tags";
    request.timeout_seconds = ProviderSupport::kAvailabilityTimeoutSeconds;

    const HttpResponse response = http_.perform(request);
    ProviderSupport::ensure_ok(response);

    std::vector<RemoteAIModel> models;
    for (const auto& item : ProviderSupport::parse_catalog(response.body, "models")) {
        const std::string name = ProviderSupport::string_or(item, "name", "");
        if (name.empty()) {
            continue;
        }
        RemoteAIModel model;
        model.id = name;
        model.display_name = name;
        model.owned_by = "Local";
        model.context_window_tokens = 8192;
        model.max_completion_tokens = 4096;
        model.active = true;
        models.push_back(std::move(model));
    }

    ProviderSupport::sort_by_display_name(models);
    if (logger_) {
        logger_->info("Ollama reported {} models", models.size());
    }
    return models;
}

std::string OllamaProvider::enhance(const std::string& text,
                                    const std::string& model_id,
                                    const EnhancementOptions& options,
                                    const std::string&,
                                    const ProgressCallback& on_progress) {
    ProviderSupport::require_model(model_id);

    std::string prompt = options.system_prompt;
    if (auto context = ProviderSupport::non_empty_context(options)) {
        prompt += "\n\nCONTEXT:\n" + *context;
    }
    prompt += "\n\nTEXT TO IMPROVE:\n" + text + "\n\nIMPROVED TEXT:";

    Json::Value body;
    body["model"] = model_id;
    body["prompt"] = prompt;
    body["temperature"] = ProviderSupport::clamp_temperature(options.temperature);
    body["max_tokens"] = ProviderSupport::clamp_max_tokens(options.max_tokens, kMaxTokensUpperBound);
    body["stream"] = false;
    body["system"] = kSystemMessage;

    ProviderSupport::report(on_progress, 0.1);
    return generate(ProviderSupport::to_json(body), kGenerateTimeoutSeconds, on_progress);
}

std::string OllamaProvider::analyze_image(const std::vector<unsigned char>& image_data,
                                          const std::string& model_id,
                                          const std::string& prompt,
                                          const std::string&,
                                          const std::string&,
                                          const ProgressCallback& on_progress) {
    ProviderSupport::require_model(model_id);
    ProviderSupport::require_image(image_data);

    Json::Value body;
    body["model"] = model_id;
    body["prompt"] = prompt;
    body["images"].append(ProviderSupport::encode_base64(image_data));
    body["stream"] = false;

    ProviderSupport::report(on_progress, 0.1);
    return generate(ProviderSupport::to_json(body), ProviderSupport::kImageTimeoutSeconds, on_progress);
}

std::string OllamaProvider::generate(const std::string& body, long timeout_seconds, const ProgressCallback& on_progress) {
    HttpRequest request;
    request.method = HttpRequest::Method::Post;
    request.url = base_url_ + "/api/generate";
    request.headers = {"Content-Type: application/json"};
    request.body = body;
    request.timeout_seconds = timeout_seconds;

    ProviderSupport::report(on_progress, 0.2);
    const HttpResponse response = http_.perform(request);
    ProviderSupport::report(on_progress, 0.8);
    ProviderSupport::ensure_ok(response);

    std::string text = ResponseNormalizer::extract_completion_text(response.body,
                                                                   ResponseNormalizer::strict_generate_response);
    ProviderSupport::report(on_progress, 1.0);
    return text;
}
