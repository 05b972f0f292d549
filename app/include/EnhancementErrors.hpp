#ifndef ENHANCEMENT_ERRORS_HPP
#define ENHANCEMENT_ERRORS_HPP

#include "Types.hpp"

#include <stdexcept>
#include <utility>
#include <string>

class ProviderError : public std::runtime_error {
public:
    enum class Code {
        MissingCredential,
        Unreachable,
        BadStatus,
        DecodeFailure,
        EmptyResponse,
        CapabilityUnsupported,
        InvalidRequest
    };

    ProviderError(Code code, const std::string& message, long http_status = 0, std::string response_body = {})
        : std::runtime_error(message),
          code_(code),
          http_status_(http_status),
          response_body_(std::move(response_body)) {}

    Code code() const { return code_; }
    long http_status() const { return http_status_; }
    const std::string& response_body() const { return response_body_; }

    static ProviderError missing_credential(ProviderKind kind) {
        return ProviderError(Code::MissingCredential,
                             "API key is required for " + provider_display_name(kind));
    }

    static ProviderError unreachable(const std::string& detail) {
        return ProviderError(Code::Unreachable, "Cannot reach server: " + detail);
    }

    static ProviderError bad_status(long status, const std::string& body) {
        return ProviderError(Code::BadStatus,
                             "Server returned HTTP " + std::to_string(status) + ": " + body,
                             status, body);
    }

    static ProviderError decode_failure(const std::string& detail) {
        return ProviderError(Code::DecodeFailure, "Failed to decode response: " + detail);
    }

    static ProviderError empty_response() {
        return ProviderError(Code::EmptyResponse, "Response contained no text");
    }

    static ProviderError capability_unsupported(ProviderKind kind) {
        return ProviderError(Code::CapabilityUnsupported,
                             provider_display_name(kind) + " does not support image analysis");
    }

    static ProviderError invalid_request(const std::string& detail) {
        return ProviderError(Code::InvalidRequest, "Invalid request: " + detail);
    }

private:
    Code code_;
    long http_status_{0};
    std::string response_body_;
};


class ModelRepositoryError : public std::runtime_error {
public:
    explicit ModelRepositoryError(const std::string& message)
        : std::runtime_error(message) {}
};


class OperationCancelled : public std::runtime_error {
public:
    OperationCancelled()
        : std::runtime_error("Operation cancelled") {}
};

#endif // ENHANCEMENT_ERRORS_HPP
