#pragma once

#include "HttpClient.hpp"
#include "Types.hpp"

#include <optional>
#include <string>
#include <vector>
#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

namespace ProviderSupport {

constexpr long kAvailabilityTimeoutSeconds = 5;
constexpr long kCatalogTimeoutSeconds = 10;
constexpr long kCompletionTimeoutSeconds = 30;
constexpr long kImageTimeoutSeconds = 60;
constexpr double kImageTemperature = 0.2;

double clamp_temperature(double value);
int clamp_max_tokens(int value, int upper_bound);

std::string detect_image_mime(const std::vector<unsigned char>& data);
std::string encode_base64(const std::vector<unsigned char>& data);

void require_credential(ProviderKind kind, const std::string& api_key);
void require_model(const std::string& model_id);
void require_image(const std::vector<unsigned char>& data);

/**
 * @brief Throws ProviderError(BadStatus) carrying the raw body for any non-200 reply.
 */
void ensure_ok(const HttpResponse& response);

/**
 * @brief Parses a catalog body and returns the array stored under @p array_key.
 * @throws ProviderError(DecodeFailure) when the body is not JSON or lacks the array.
 */
Json::Value parse_catalog(const std::string& body, const char* array_key);

void sort_by_display_name(std::vector<RemoteAIModel>& models);

std::string to_json(const Json::Value& value);
std::string string_or(const Json::Value& object, const char* key, const std::string& fallback);
int int_or(const Json::Value& object, const char* key, int fallback);

std::optional<std::string> non_empty_context(const EnhancementOptions& options);

/**
 * @brief Chat-style user message: optional <CONTEXT> block, then <RAW_TRANSCRIPTION>.
 */
std::string chat_user_content(const std::string& text, const EnhancementOptions& options);

/**
 * @brief OpenAI-style messages array: system prompt plus one user text message.
 */
Json::Value chat_text_messages(const std::string& system_prompt, const std::string& user_content);

/**
 * @brief OpenAI-style messages array whose user message carries text and a data: URL image.
 */
Json::Value chat_image_messages(const std::string& system_prompt,
                                const std::string& prompt,
                                const std::vector<unsigned char>& image_data);

void report(const ProgressCallback& on_progress, double value);

std::string trim_trailing_slash(std::string url);
std::string env_or(const char* name, const std::string& fallback);

} // namespace ProviderSupport
