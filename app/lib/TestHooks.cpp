#include "TestHooks.hpp"

#include <mutex>

namespace TestHooks {

namespace {

std::mutex& hook_mutex()
{
    static std::mutex mutex;
    return mutex;
}

HttpHook& http_hook_slot()
{
    static HttpHook hook;
    return hook;
}

ModelDownloadHook& download_hook_slot()
{
    static ModelDownloadHook hook;
    return hook;
}

}

void set_http_hook(HttpHook hook)
{
    std::lock_guard<std::mutex> lock(hook_mutex());
    http_hook_slot() = std::move(hook);
}

void reset_http_hook()
{
    set_http_hook(nullptr);
}

HttpHook http_hook()
{
    std::lock_guard<std::mutex> lock(hook_mutex());
    return http_hook_slot();
}

void set_model_download_hook(ModelDownloadHook hook)
{
    std::lock_guard<std::mutex> lock(hook_mutex());
    download_hook_slot() = std::move(hook);
}

void reset_model_download_hook()
{
    set_model_download_hook(nullptr);
}

ModelDownloadHook model_download_hook()
{
    std::lock_guard<std::mutex> lock(hook_mutex());
    return download_hook_slot();
}

} // namespace TestHooks
