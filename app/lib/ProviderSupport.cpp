#include "ProviderSupport.hpp"
#include "EnhancementErrors.hpp"
#include "ResponseNormalizer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <QByteArray>

namespace ProviderSupport {

double clamp_temperature(double value)
{
    if (std::isnan(value)) {
        return EnhancementOptions{}.temperature;
    }
    return std::clamp(value, 0.1, 1.0);
}


int clamp_max_tokens(int value, int upper_bound)
{
    return std::clamp(value, 100, upper_bound);
}


std::string detect_image_mime(const std::vector<unsigned char>& data)
{
    static const unsigned char png_magic[] = {0x89, 0x50, 0x4E, 0x47};
    if (data.size() >= sizeof(png_magic) && std::equal(std::begin(png_magic), std::end(png_magic), data.begin())) {
        return "image/png";
    }
    return "image/jpeg";
}


std::string encode_base64(const std::vector<unsigned char>& data)
{
    const QByteArray raw(reinterpret_cast<const char*>(data.data()), static_cast<qsizetype>(data.size()));
    return raw.toBase64().toStdString();
}


void require_credential(ProviderKind kind, const std::string& api_key)
{
    if (api_key.empty()) {
        throw ProviderError::missing_credential(kind);
    }
}


void require_model(const std::string& model_id)
{
    if (model_id.empty()) {
        throw ProviderError::invalid_request("no model selected");
    }
}


void require_image(const std::vector<unsigned char>& data)
{
    if (data.empty()) {
        throw ProviderError::invalid_request("image data is empty");
    }
}


void ensure_ok(const HttpResponse& response)
{
    if (!response.ok()) {
        throw ProviderError::bad_status(response.status, response.body);
    }
}


Json::Value parse_catalog(const std::string& body, const char* array_key)
{
    Json::Value root;
    std::string errors;
    if (!ResponseNormalizer::parse_json(body, root, &errors)) {
        throw ProviderError::decode_failure(errors);
    }
    if (!root.isObject() || !root.isMember(array_key) || !root[array_key].isArray()) {
        throw ProviderError::decode_failure(std::string("missing '") + array_key + "' array");
    }
    return root[array_key];
}


void sort_by_display_name(std::vector<RemoteAIModel>& models)
{
    std::stable_sort(models.begin(), models.end(),
                     [](const RemoteAIModel& lhs, const RemoteAIModel& rhs) {
                         return lhs.display_name < rhs.display_name;
                     });
}


std::string to_json(const Json::Value& value)
{
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, value);
}


std::string string_or(const Json::Value& object, const char* key, const std::string& fallback)
{
    if (object.isObject() && object.isMember(key) && object[key].isString()) {
        const std::string value = object[key].asString();
        if (!value.empty()) {
            return value;
        }
    }
    return fallback;
}


int int_or(const Json::Value& object, const char* key, int fallback)
{
    if (object.isObject() && object.isMember(key) && object[key].isIntegral()) {
        return object[key].asInt();
    }
    return fallback;
}


std::optional<std::string> non_empty_context(const EnhancementOptions& options)
{
    if (options.context && !options.context->empty()) {
        return options.context;
    }
    return std::nullopt;
}


std::string chat_user_content(const std::string& text, const EnhancementOptions& options)
{
    std::string content;
    if (auto context = non_empty_context(options)) {
        content += "<CONTEXT>" + *context + "</CONTEXT>\n\n";
    }
    content += "<RAW_TRANSCRIPTION>" + text + "</RAW_TRANSCRIPTION>";
    return content;
}


Json::Value chat_text_messages(const std::string& system_prompt, const std::string& user_content)
{
    Json::Value messages(Json::arrayValue);
    Json::Value system;
    system["role"] = "system";
    system["content"] = system_prompt;
    messages.append(system);

    Json::Value user;
    user["role"] = "user";
    user["content"] = user_content;
    messages.append(user);
    return messages;
}


Json::Value chat_image_messages(const std::string& system_prompt,
                                const std::string& prompt,
                                const std::vector<unsigned char>& image_data)
{
    Json::Value messages(Json::arrayValue);
    Json::Value system;
    system["role"] = "system";
    system["content"] = system_prompt;
    messages.append(system);

    Json::Value text_part;
    text_part["type"] = "text";
    text_part["text"] = prompt;

    Json::Value image_part;
    image_part["type"] = "image_url";
    image_part["image_url"]["url"] = "data:" + detect_image_mime(image_data) + ";base64," + encode_base64(image_data);

    Json::Value user;
    user["role"] = "user";
    user["content"].append(text_part);
    user["content"].append(image_part);
    messages.append(user);
    return messages;
}


void report(const ProgressCallback& on_progress, double value)
{
    if (on_progress) {
        on_progress(value);
    }
}


std::string trim_trailing_slash(std::string url)
{
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}


std::string env_or(const char* name, const std::string& fallback)
{
    const char* value = std::getenv(name);
    if (value && value[0] != '\0') {
        return std::string(value);
    }
    return fallback;
}

} // namespace ProviderSupport
