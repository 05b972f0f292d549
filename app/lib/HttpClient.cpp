#include "HttpClient.hpp"
#include "EnhancementErrors.hpp"
#include "Logger.hpp"
#include "TestHooks.hpp"
#include <curl/curl.h>
#include <regex>

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* response) {
    size_t total = size * nmemb;
    response->append(static_cast<const char*>(contents), total);
    return total;
}

struct CurlHandle {
    CURL* handle{curl_easy_init()};
    curl_slist* headers{nullptr};

    ~CurlHandle() {
        if (headers) {
            curl_slist_free_all(headers);
        }
        if (handle) {
            curl_easy_cleanup(handle);
        }
    }
};

const char* method_name(HttpRequest::Method method) {
    return method == HttpRequest::Method::Post ? "POST" : "GET";
}

}

HttpClient::HttpClient()
    : logger_(Logger::get_logger("provider_logger"))
{
}


std::string HttpClient::redact_url(const std::string& url)
{
    static const std::regex key_param("([?&]key=)[^&]*");
    return std::regex_replace(url, key_param, "$1***");
}


HttpResponse HttpClient::perform(const HttpRequest& request) const
{
    if (logger_) {
        logger_->debug("{} {} (timeout {}s)", method_name(request.method), redact_url(request.url),
                       request.timeout_seconds);
    }

    if (auto hook = TestHooks::http_hook()) {
        return hook(request);
    }

    CurlHandle curl;
    if (!curl.handle) {
        throw ProviderError::unreachable("failed to initialize cURL");
    }

    HttpResponse response;
    curl_easy_setopt(curl.handle, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.handle, CURLOPT_TIMEOUT, request.timeout_seconds);
    curl_easy_setopt(curl.handle, CURLOPT_CONNECTTIMEOUT, request.timeout_seconds);
    curl_easy_setopt(curl.handle, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.handle, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.handle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.handle, CURLOPT_NOSIGNAL, 1L);

    if (request.method == HttpRequest::Method::Post) {
        curl_easy_setopt(curl.handle, CURLOPT_POST, 1L);
        curl_easy_setopt(curl.handle, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl.handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    } else {
        curl_easy_setopt(curl.handle, CURLOPT_HTTPGET, 1L);
    }

    for (const auto& header : request.headers) {
        curl.headers = curl_slist_append(curl.headers, header.c_str());
    }
    if (curl.headers) {
        curl_easy_setopt(curl.handle, CURLOPT_HTTPHEADER, curl.headers);
    }

    const CURLcode res = curl_easy_perform(curl.handle);
    if (res != CURLE_OK) {
        if (logger_) {
            logger_->warn("Request to {} failed: {}", redact_url(request.url), curl_easy_strerror(res));
        }
        throw ProviderError::unreachable(curl_easy_strerror(res));
    }

    curl_easy_getinfo(curl.handle, CURLINFO_RESPONSE_CODE, &response.status);
    if (logger_) {
        logger_->debug("{} {} returned HTTP {}", method_name(request.method), redact_url(request.url),
                       response.status);
    }
    return response;
}
