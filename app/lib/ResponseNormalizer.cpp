#include "ResponseNormalizer.hpp"
#include "EnhancementErrors.hpp"
#include "Logger.hpp"

#include <memory>
#include <sstream>
#include <vector>
#include <QRegularExpression>
#include <QString>

namespace ResponseNormalizer {

namespace {

const Json::Value* member(const Json::Value& value, const char* key)
{
    if (!value.isObject() || !value.isMember(key)) {
        return nullptr;
    }
    return &value[key];
}

const Json::Value* first_element(const Json::Value* value)
{
    if (!value || !value->isArray() || value->empty()) {
        return nullptr;
    }
    return &(*value)[0];
}

std::optional<std::string> non_empty_string(const Json::Value* value)
{
    if (!value || !value->isString()) {
        return std::nullopt;
    }
    std::string text = value->asString();
    if (trim(text).empty()) {
        return std::nullopt;
    }
    return text;
}

const Json::Value* first_candidate_content(const Json::Value& root)
{
    const Json::Value* candidate = first_element(member(root, "candidates"));
    return candidate ? member(*candidate, "content") : nullptr;
}

std::optional<std::string> candidate_content_text(const Json::Value& root)
{
    const Json::Value* content = first_candidate_content(root);
    return content ? non_empty_string(member(*content, "text")) : std::nullopt;
}

std::optional<std::string> candidate_output(const Json::Value& root)
{
    const Json::Value* candidate = first_element(member(root, "candidates"));
    return candidate ? non_empty_string(member(*candidate, "output")) : std::nullopt;
}

const std::vector<QRegularExpression>& thinking_patterns()
{
    const auto options = QRegularExpression::CaseInsensitiveOption |
                         QRegularExpression::DotMatchesEverythingOption;
    static const std::vector<QRegularExpression> patterns = {
        QRegularExpression(QStringLiteral(R"(<think>.*?</think>)"), options),
        QRegularExpression(QStringLiteral(R"(<thinking>.*?</thinking>)"), options),
        QRegularExpression(QStringLiteral(R"(\[thinking\].*?\[/thinking\])"), options),
        QRegularExpression(QStringLiteral(R"(\*thinking\*.*?\*/thinking\*)"), options)
    };
    return patterns;
}

}


bool parse_json(const std::string& body, Json::Value& root, std::string* errors)
{
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string parse_errors;
    const bool ok = reader->parse(body.data(), body.data() + body.size(), &root, &parse_errors);
    if (errors) {
        *errors = parse_errors;
    }
    return ok;
}


std::string clean_thinking_tags(const std::string& text)
{
    QString cleaned = QString::fromStdString(text);
    for (const auto& pattern : thinking_patterns()) {
        cleaned.remove(pattern);
    }
    static const QRegularExpression blank_runs(QStringLiteral(R"(\n\s*\n\s*\n)"));
    cleaned.replace(blank_runs, QStringLiteral("\n\n"));
    return cleaned.toStdString();
}


std::string trim(const std::string& text)
{
    const char* whitespace = " \t\r\n\f\v";
    const auto begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}


std::string finalize(const std::string& text)
{
    return trim(clean_thinking_tags(text));
}


std::optional<std::string> fallback_extract_text(const Json::Value& root)
{
    if (const Json::Value* content = first_candidate_content(root)) {
        const Json::Value* part = first_element(member(*content, "parts"));
        if (auto text = part ? non_empty_string(member(*part, "text")) : std::nullopt) {
            return text;
        }
    }
    if (auto text = candidate_content_text(root)) {
        return text;
    }
    return candidate_output(root);
}


std::optional<std::string> strict_generate_response(const Json::Value& root)
{
    return non_empty_string(member(root, "response"));
}


std::optional<std::string> strict_chat_completion(const Json::Value& root)
{
    const Json::Value* choice = first_element(member(root, "choices"));
    if (!choice) {
        return std::nullopt;
    }
    const Json::Value* message = member(*choice, "message");
    return message ? non_empty_string(member(*message, "content")) : std::nullopt;
}


std::optional<std::string> strict_gemini_candidates(const Json::Value& root)
{
    if (const Json::Value* content = first_candidate_content(root)) {
        const Json::Value* parts = member(*content, "parts");
        if (parts && parts->isArray()) {
            for (const auto& part : *parts) {
                if (auto text = non_empty_string(member(part, "text"))) {
                    return text;
                }
            }
        }
    }
    if (auto text = candidate_content_text(root)) {
        return text;
    }
    return candidate_output(root);
}


std::string extract_completion_text(const std::string& body, const StrictDecoder& strict)
{
    Json::Value root;
    std::string errors;
    if (!parse_json(body, root, &errors)) {
        if (auto logger = Logger::get_logger("provider_logger")) {
            logger->warn("Completion body is not valid JSON: {}", errors);
        }
        throw ProviderError::empty_response();
    }

    std::optional<std::string> text = strict ? strict(root) : std::nullopt;
    if (!text) {
        text = fallback_extract_text(root);
        if (text) {
            if (auto logger = Logger::get_logger("provider_logger")) {
                logger->info("Strict decode found no text, recovered it with the fallback walk");
            }
        }
    }
    if (!text) {
        throw ProviderError::empty_response();
    }

    std::string result = finalize(*text);
    if (result.empty()) {
        throw ProviderError::empty_response();
    }
    return result;
}

} // namespace ResponseNormalizer
