#include "GeminiProvider.hpp"
#include "EnhancementErrors.hpp"
#include "Logger.hpp"
#include "ProviderSupport.hpp"
#include "ResponseNormalizer.hpp"

namespace {

constexpr int kMaxTokensUpperBound = 8192;
constexpr const char* kModelsPrefix = "models/";

}

GeminiProvider::GeminiProvider(std::string base_url)
    : base_url_(ProviderSupport::trim_trailing_slash(std::move(base_url)))
{
    logger_ = Logger::get_logger("provider_logger");
}

ProviderKind GeminiProvider::kind() const {
    return ProviderKind::Gemini;
}

std::string GeminiProvider::strip_models_prefix(const std::string& model_id) {
    const std::string prefix = kModelsPrefix;
    if (model_id.rfind(prefix, 0) == 0) {
        return model_id.substr(prefix.size());
    }
    return model_id;
}

bool GeminiProvider::is_available(const std::string& api_key) {
    if (api_key.empty()) {
        return false;
    }
    try {
        fetch_models(api_key);
        return true;
    } catch (const ProviderError& ex) {
        if (logger_) {
            logger_->warn("Gemini connection check failed: {}", ex.what());
        }
        return false;
    }
}

bool GeminiProvider::test_connection(const std::string& api_key) {
    return is_available(api_key);
}

std::vector<RemoteAIModel> GeminiProvider::fetch_models(const std::string& api_key) {
    ProviderSupport::require_credential(kind(), api_key);

    HttpRequest request;
    request.url = base_url_ + "/models?key=" + api_key;
    request.timeout_seconds = ProviderSupport::kCatalogTimeoutSeconds;

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
        model.display_name = ProviderSupport::string_or(item, "displayName", name);
        model.owned_by = "Google";
        model.context_window_tokens = ProviderSupport::int_or(item, "inputTokenLimit", 131072);
        model.max_completion_tokens = ProviderSupport::int_or(item, "outputTokenLimit", 8192);
        model.active = true;
        models.push_back(std::move(model));
    }

    ProviderSupport::sort_by_display_name(models);
    if (logger_) {
        logger_->info("Gemini offers {} models", models.size());
    }
    return models;
}

std::string GeminiProvider::enhance(const std::string& text,
                                    const std::string& model_id,
                                    const EnhancementOptions& options,
                                    const std::string& api_key,
                                    const ProgressCallback& on_progress) {
    ProviderSupport::require_credential(kind(), api_key);
    ProviderSupport::require_model(model_id);

    std::string user_text;
    if (auto context = ProviderSupport::non_empty_context(options)) {
        user_text += "\n\nCONTEXT:\n" + *context;
    }
    user_text += "\n\nTEXT TO IMPROVE:\n" + text;

    Json::Value body;
    Json::Value instruction_part;
    instruction_part["text"] = options.system_prompt;
    body["system_instruction"]["parts"].append(instruction_part);

    Json::Value text_part;
    text_part["text"] = user_text;
    Json::Value content;
    content["parts"].append(text_part);
    body["contents"].append(content);

    body["generationConfig"]["temperature"] = ProviderSupport::clamp_temperature(options.temperature);
    body["generationConfig"]["maxOutputTokens"] =
        ProviderSupport::clamp_max_tokens(options.max_tokens, kMaxTokensUpperBound);

    ProviderSupport::report(on_progress, 0.1);
    return generate_content(model_id, body, api_key, ProviderSupport::kCompletionTimeoutSeconds, on_progress);
}

std::string GeminiProvider::analyze_image(const std::vector<unsigned char>& image_data,
                                          const std::string& model_id,
                                          const std::string& prompt,
                                          const std::string&,
                                          const std::string& api_key,
                                          const ProgressCallback& on_progress) {
    ProviderSupport::require_credential(kind(), api_key);
    ProviderSupport::require_model(model_id);
    ProviderSupport::require_image(image_data);

    Json::Value image_part;
    image_part["inline_data"]["mime_type"] = ProviderSupport::detect_image_mime(image_data);
    image_part["inline_data"]["data"] = ProviderSupport::encode_base64(image_data);
    Json::Value prompt_part;
    prompt_part["text"] = prompt;

    Json::Value content;
    content["parts"].append(image_part);
    content["parts"].append(prompt_part);

    Json::Value body;
    body["contents"].append(content);
    body["generationConfig"]["temperature"] = ProviderSupport::kImageTemperature;

    ProviderSupport::report(on_progress, 0.1);
    return generate_content(model_id, body, api_key, ProviderSupport::kImageTimeoutSeconds, on_progress);
}

std::string GeminiProvider::generate_content(const std::string& model_id,
                                             const Json::Value& body,
                                             const std::string& api_key,
                                             long timeout_seconds,
                                             const ProgressCallback& on_progress) {
    HttpRequest request;
    request.method = HttpRequest::Method::Post;
    request.url = base_url_ + "/models/" + strip_models_prefix(model_id) + ":generateContent?key=" + api_key;
    request.headers = {"Content-Type: application/json"};
    request.body = ProviderSupport::to_json(body);
    request.timeout_seconds = timeout_seconds;

    ProviderSupport::report(on_progress, 0.2);
    const HttpResponse response = http_.perform(request);
    ProviderSupport::report(on_progress, 0.8);
    ProviderSupport::ensure_ok(response);

    std::string text = ResponseNormalizer::extract_completion_text(response.body,
                                                                   ResponseNormalizer::strict_gemini_candidates);
    ProviderSupport::report(on_progress, 1.0);
    return text;
}
