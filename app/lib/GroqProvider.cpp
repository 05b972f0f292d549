#include "GroqProvider.hpp"
#include "EnhancementErrors.hpp"
#include "Logger.hpp"
#include "ProviderSupport.hpp"
#include "ResponseNormalizer.hpp"

namespace {

constexpr int kMaxTokensUpperBound = 8192;

// Speech and audio models share the catalog but cannot chat.
bool is_chat_model(const std::string& id) {
    return id.find("whisper") == std::string::npos && id.find("tts") == std::string::npos;
}

}

GroqProvider::GroqProvider(std::string base_url)
    : base_url_(ProviderSupport::trim_trailing_slash(std::move(base_url)))
{
    logger_ = Logger::get_logger("provider_logger");
}

ProviderKind GroqProvider::kind() const {
    return ProviderKind::Groq;
}

std::vector<std::string> GroqProvider::auth_headers(const std::string& api_key) const {
    return {
        "Content-Type: application/json",
        "Authorization: Bearer " + api_key
    };
}

bool GroqProvider::is_available(const std::string& api_key) {
    if (api_key.empty()) {
        return false;
    }
    try {
        fetch_models(api_key);
        return true;
    } catch (const ProviderError& ex) {
        if (logger_) {
            logger_->warn("Groq connection check failed: {}", ex.what());
        }
        return false;
    }
}

bool GroqProvider::test_connection(const std::string& api_key) {
    return is_available(api_key);
}

std::vector<RemoteAIModel> GroqProvider::fetch_models(const std::string& api_key) {
    ProviderSupport::require_credential(kind(), api_key);

    HttpRequest request;
    request.url = base_url_ + "/models";
    request.headers = auth_headers(api_key);
    request.timeout_seconds = ProviderSupport::kCatalogTimeoutSeconds;

    const HttpResponse response = http_.perform(request);
    ProviderSupport::ensure_ok(response);

    std::vector<RemoteAIModel> models;
    for (const auto& item : ProviderSupport::parse_catalog(response.body, "data")) {
        const std::string id = ProviderSupport::string_or(item, "id", "");
        const bool active = item.isObject() && item.isMember("active") && item["active"].isBool()
            ? item["active"].asBool()
            : true;
        if (id.empty() || !active || !is_chat_model(id)) {
            continue;
        }
        RemoteAIModel model;
        model.id = id;
        model.display_name = id;
        model.owned_by = ProviderSupport::string_or(item, "owned_by", "Groq");
        model.context_window_tokens = ProviderSupport::int_or(item, "context_window", 8192);
        model.max_completion_tokens = ProviderSupport::int_or(item, "max_completion_tokens", 4096);
        model.active = active;
        models.push_back(std::move(model));
    }

    ProviderSupport::sort_by_display_name(models);
    if (logger_) {
        logger_->info("Groq offers {} chat models", models.size());
    }
    return models;
}

std::string GroqProvider::enhance(const std::string& text,
                                  const std::string& model_id,
                                  const EnhancementOptions& options,
                                  const std::string& api_key,
                                  const ProgressCallback& on_progress) {
    ProviderSupport::require_credential(kind(), api_key);
    ProviderSupport::require_model(model_id);

    Json::Value body;
    body["messages"] = ProviderSupport::chat_text_messages(options.system_prompt,
                                                           ProviderSupport::chat_user_content(text, options));
    body["model"] = model_id;
    body["temperature"] = ProviderSupport::clamp_temperature(options.temperature);
    body["max_completion_tokens"] = ProviderSupport::clamp_max_tokens(options.max_tokens, kMaxTokensUpperBound);
    body["stream"] = false;

    ProviderSupport::report(on_progress, 0.1);
    return complete(body, api_key, ProviderSupport::kCompletionTimeoutSeconds, on_progress);
}

std::string GroqProvider::analyze_image(const std::vector<unsigned char>& image_data,
                                        const std::string& model_id,
                                        const std::string& prompt,
                                        const std::string& system_prompt,
                                        const std::string& api_key,
                                        const ProgressCallback& on_progress) {
    ProviderSupport::require_credential(kind(), api_key);
    ProviderSupport::require_model(model_id);
    ProviderSupport::require_image(image_data);

    Json::Value body;
    body["model"] = model_id;
    body["messages"] = ProviderSupport::chat_image_messages(system_prompt, prompt, image_data);
    body["temperature"] = ProviderSupport::kImageTemperature;
    body["stream"] = false;

    ProviderSupport::report(on_progress, 0.1);
    return complete(body, api_key, ProviderSupport::kImageTimeoutSeconds, on_progress);
}

std::string GroqProvider::complete(const Json::Value& body,
                                   const std::string& api_key,
                                   long timeout_seconds,
                                   const ProgressCallback& on_progress) {
    HttpRequest request;
    request.method = HttpRequest::Method::Post;
    request.url = base_url_ + "/chat/completions";
    request.headers = auth_headers(api_key);
    request.body = ProviderSupport::to_json(body);
    request.timeout_seconds = timeout_seconds;

    ProviderSupport::report(on_progress, 0.2);
    const HttpResponse response = http_.perform(request);
    ProviderSupport::report(on_progress, 0.8);
    ProviderSupport::ensure_ok(response);

    std::string text = ResponseNormalizer::extract_completion_text(response.body,
                                                                   ResponseNormalizer::strict_chat_completion);
    ProviderSupport::report(on_progress, 1.0);
    return text;
}
