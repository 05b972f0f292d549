#include "LMStudioProvider.hpp"
#include "EnhancementErrors.hpp"
#include "Logger.hpp"
#include "ProviderSupport.hpp"
#include "ResponseNormalizer.hpp"

namespace {

constexpr int kMaxTokensUpperBound = 8192;

}

LMStudioProvider::LMStudioProvider(std::string base_url)
    : base_url_(ProviderSupport::trim_trailing_slash(std::move(base_url)))
{
    logger_ = Logger::get_logger("provider_logger");
}

ProviderKind LMStudioProvider::kind() const {
    return ProviderKind::LMStudio;
}

bool LMStudioProvider::is_available(const std::string&) {
    HttpRequest request;
    request.url = base_url_ + "/api/v0/models";
    request.timeout_seconds = ProviderSupport::kAvailabilityTimeoutSeconds;
    try {
        return http_.perform(request).ok();
    } catch (const ProviderError& ex) {
        if (logger_) {
            logger_->info("LM Studio is not reachable at {}: {}", base_url_, ex.what());
        }
        return false;
    }
}

bool LMStudioProvider::test_connection(const std::string& api_key) {
    return is_available(api_key);
}

std::vector<RemoteAIModel> LMStudioProvider::fetch_models(const std::string&) {
    HttpRequest request;
    request.url = base_url_ + "/api/v0/models";
    request.timeout_seconds = ProviderSupport::kCatalogTimeoutSeconds;

    const HttpResponse response = http_.perform(request);
    ProviderSupport::ensure_ok(response);

    std::vector<RemoteAIModel> models;
    for (const auto& item : ProviderSupport::parse_catalog(response.body, "data")) {
        const std::string id = ProviderSupport::string_or(item, "id", "");
        if (id.empty()) {
            continue;
        }
        RemoteAIModel model;
        model.id = id;
        model.display_name = id;
        model.owned_by = ProviderSupport::string_or(item, "publisher", "Local");
        model.context_window_tokens = ProviderSupport::int_or(item, "max_context_length", 8192);
        model.max_completion_tokens = 4096;
        model.active = ProviderSupport::string_or(item, "state", "loaded") != "not-loaded";
        models.push_back(std::move(model));
    }

    ProviderSupport::sort_by_display_name(models);
    if (logger_) {
        logger_->info("LM Studio reported {} models", models.size());
    }
    return models;
}

std::string LMStudioProvider::enhance(const std::string& text,
                                      const std::string& model_id,
                                      const EnhancementOptions& options,
                                      const std::string&,
                                      const ProgressCallback& on_progress) {
    ProviderSupport::require_model(model_id);

    Json::Value body;
    body["messages"] = ProviderSupport::chat_text_messages(options.system_prompt,
                                                           ProviderSupport::chat_user_content(text, options));
    body["model"] = model_id;
    body["temperature"] = ProviderSupport::clamp_temperature(options.temperature);
    body["max_tokens"] = ProviderSupport::clamp_max_tokens(options.max_tokens, kMaxTokensUpperBound);
    body["stream"] = false;

    ProviderSupport::report(on_progress, 0.1);
    return complete(body, ProviderSupport::kCompletionTimeoutSeconds, on_progress);
}

std::string LMStudioProvider::analyze_image(const std::vector<unsigned char>& image_data,
                                            const std::string& model_id,
                                            const std::string& prompt,
                                            const std::string& system_prompt,
                                            const std::string&,
                                            const ProgressCallback& on_progress) {
    ProviderSupport::require_model(model_id);
    ProviderSupport::require_image(image_data);

    Json::Value body;
    body["model"] = model_id;
    body["messages"] = ProviderSupport::chat_image_messages(system_prompt, prompt, image_data);
    body["temperature"] = ProviderSupport::kImageTemperature;
    body["stream"] = false;

    ProviderSupport::report(on_progress, 0.1);
    return complete(body, ProviderSupport::kImageTimeoutSeconds, on_progress);
}

std::string LMStudioProvider::complete(const Json::Value& body, long timeout_seconds, const ProgressCallback& on_progress) {
    HttpRequest request;
    request.method = HttpRequest::Method::Post;
    request.url = base_url_ + "/api/v0/chat/completions";
    request.headers = {"Content-Type: application/json"};
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
