#pragma once

#include <memory>
#include <string>
#include <vector>

namespace spdlog { class logger; }

struct HttpRequest {
    enum class Method {
        Get,
        Post
    };

    Method method{Method::Get};
    std::string url;
    std::vector<std::string> headers;
    std::string body;
    long timeout_seconds{30};
};

struct HttpResponse {
    long status{0};
    std::string body;

    bool ok() const { return status == 200; }
};

/**
 * @brief Thin libcurl wrapper used by the enhancement providers.
 *
 * perform() throws ProviderError(Unreachable) when the transfer fails
 * (connection refused, DNS failure, timeout). Any HTTP status is returned
 * to the caller unchanged.
 */
class HttpClient {
public:
    HttpClient();

    HttpResponse perform(const HttpRequest& request) const;

    /**
     * @brief Removes query parameters that carry credentials (key=...) before logging.
     */
    static std::string redact_url(const std::string& url);

private:
    std::shared_ptr<spdlog::logger> logger_;
};
