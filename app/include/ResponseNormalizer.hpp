#ifndef RESPONSE_NORMALIZER_HPP
#define RESPONSE_NORMALIZER_HPP

#include <functional>
#include <optional>
#include <string>
#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

/**
 * Turns raw completion bodies from any backend into clean user-facing text.
 *
 * Decoding is two-tier: a provider-specific strict decoder runs first, and
 * when it yields nothing the untyped fallback walk is tried. The winning text
 * then has reasoning blocks removed and is trimmed.
 */
namespace ResponseNormalizer {

using StrictDecoder = std::function<std::optional<std::string>(const Json::Value& root)>;

bool parse_json(const std::string& body, Json::Value& root, std::string* errors = nullptr);

/**
 * @brief Removes <think>, <thinking>, [thinking] and *thinking* blocks
 * (case-insensitive, across lines) and collapses runs of three or more
 * newlines into one blank line. Idempotent.
 */
std::string clean_thinking_tags(const std::string& text);

std::string trim(const std::string& text);

/**
 * @brief clean_thinking_tags() followed by trim().
 */
std::string finalize(const std::string& text);

/**
 * @brief Untyped walk: candidates[0].content.parts[0].text, then
 * candidates[0].content.text, then candidates[0].output.
 */
std::optional<std::string> fallback_extract_text(const Json::Value& root);

std::optional<std::string> strict_generate_response(const Json::Value& root);
std::optional<std::string> strict_chat_completion(const Json::Value& root);
std::optional<std::string> strict_gemini_candidates(const Json::Value& root);

/**
 * @brief Runs both decode tiers on @p body and finalizes the text.
 * @throws ProviderError with code EmptyResponse when neither tier finds text.
 */
std::string extract_completion_text(const std::string& body, const StrictDecoder& strict);

} // namespace ResponseNormalizer

#endif // RESPONSE_NORMALIZER_HPP
