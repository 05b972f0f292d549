#pragma once

#include <functional>
#include <string>

#include <curl/curl.h>

#include "HttpClient.hpp"

namespace TestHooks {

using HttpHook = std::function<HttpResponse(const HttpRequest& request)>;
void set_http_hook(HttpHook hook);
void reset_http_hook();
HttpHook http_hook();

using ModelDownloadHook = std::function<CURLcode(long offset, const std::string& path)>;
void set_model_download_hook(ModelDownloadHook hook);
void reset_model_download_hook();
ModelDownloadHook model_download_hook();

} // namespace TestHooks
