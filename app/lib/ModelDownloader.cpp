#include "ModelDownloader.hpp"
#include "EnhancementErrors.hpp"
#include "Logger.hpp"
#include "TestHooks.hpp"

#include <system_error>

namespace {

constexpr long kConnectTimeoutSeconds = 30;
constexpr long kLowSpeedLimitBytes = 1024;
constexpr long kLowSpeedTimeSeconds = 60;
constexpr long kHttpRangeNotSatisfiable = 416;

bool is_cancelled(const CancellationTokenPtr& cancel)
{
    return cancel && cancel->is_cancelled();
}

}


ModelDownloader::ModelDownloader(std::string download_url,
                                 std::filesystem::path destination,
                                 std::uint64_t expected_size)
    : url_(std::move(download_url)),
      destination_(std::move(destination)),
      expected_size_(expected_size),
      logger_(Logger::get_logger("model_logger"))
{
}


std::filesystem::path ModelDownloader::partial_path() const
{
    std::filesystem::path part = destination_;
    part += ".part";
    return part;
}


size_t ModelDownloader::write_data(void* ptr, size_t size, size_t nmemb, FILE* stream)
{
    return std::fwrite(ptr, size, nmemb, stream);
}


int ModelDownloader::progress_func(void* clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t, curl_off_t)
{
    auto* context = static_cast<TransferContext*>(clientp);
    if (context->cancel && context->cancel->is_cancelled()) {
        return 1;
    }
    if (context->on_progress && *context->on_progress && dltotal > 0) {
        const double total = static_cast<double>(dltotal + context->resume_offset);
        const double done = static_cast<double>(dlnow + context->resume_offset);
        (*context->on_progress)(done / total);
    }
    return 0;
}


long ModelDownloader::determine_resume_offset() const
{
    std::error_code ec;
    const auto path = partial_path();
    if (!std::filesystem::exists(path, ec)) {
        return 0;
    }
    const auto size = std::filesystem::file_size(path, ec);
    return ec ? 0 : static_cast<long>(size);
}


FILE* ModelDownloader::open_output_file(long resume_offset) const
{
    const std::string path = partial_path().string();
    return std::fopen(path.c_str(), resume_offset > 0 ? "ab" : "wb");
}


void ModelDownloader::discard_partial_file() const
{
    std::error_code ec;
    std::filesystem::remove(partial_path(), ec);
}


CURLcode ModelDownloader::perform_transfer(long resume_offset,
                                           const ProgressCallback& on_progress,
                                           const CancellationTokenPtr& cancel,
                                           long& http_code)
{
    http_code = 0;
    if (auto hook = TestHooks::model_download_hook()) {
        const CURLcode code = hook(resume_offset, partial_path().string());
        http_code = code == CURLE_OK ? 200 : 0;
        return code;
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        throw ModelRepositoryError("Failed to initialize cURL for model download");
    }

    FILE* fp = open_output_file(resume_offset);
    if (!fp) {
        curl_easy_cleanup(curl);
        throw ModelRepositoryError("Cannot open " + partial_path().string() + " for writing");
    }

    TransferContext context;
    context.on_progress = &on_progress;
    context.cancel = cancel.get();
    context.resume_offset = resume_offset;

    curl_easy_setopt(curl, CURLOPT_URL, url_.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, kConnectTimeoutSeconds);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, kLowSpeedLimitBytes);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, kLowSpeedTimeSeconds);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_data);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, fp);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_func);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &context);
    if (resume_offset > 0) {
        curl_easy_setopt(curl, CURLOPT_RESUME_FROM_LARGE, static_cast<curl_off_t>(resume_offset));
    }

    const CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    std::fclose(fp);
    curl_easy_cleanup(curl);
    return res;
}


void ModelDownloader::verify_size() const
{
    if (expected_size_ == 0) {
        return;
    }
    std::error_code ec;
    const auto actual = std::filesystem::file_size(partial_path(), ec);
    if (ec) {
        throw ModelRepositoryError("Cannot read downloaded model: " + ec.message());
    }
    if (actual != expected_size_) {
        discard_partial_file();
        if (logger_) {
            logger_->error("Downloaded {} has {} bytes, expected {}", url_, actual, expected_size_);
        }
        throw ModelRepositoryError("Downloaded file has " + std::to_string(actual) +
                                   " bytes, expected " + std::to_string(expected_size_));
    }
}


void ModelDownloader::finalize_download() const
{
    std::error_code ec;
    std::filesystem::rename(partial_path(), destination_, ec);
    if (ec) {
        throw ModelRepositoryError("Failed to move downloaded model into place: " + ec.message());
    }
}


void ModelDownloader::download(const ProgressCallback& on_progress, const CancellationTokenPtr& cancel)
{
    std::error_code ec;
    std::filesystem::create_directories(destination_.parent_path(), ec);
    if (ec) {
        throw ModelRepositoryError("Cannot create model directory: " + ec.message());
    }

    long resume_offset = determine_resume_offset();
    if (logger_) {
        logger_->info("Downloading {} to {} (resume offset {})", url_, destination_.string(), resume_offset);
    }

    long http_code = 0;
    CURLcode res = perform_transfer(resume_offset, on_progress, cancel, http_code);

    const bool range_rejected = res == CURLE_HTTP_RANGE_ERROR ||
        (res == CURLE_HTTP_RETURNED_ERROR && http_code == kHttpRangeNotSatisfiable);
    if (range_rejected && resume_offset > 0 && !is_cancelled(cancel)) {
        if (logger_) {
            logger_->warn("Server rejected resume at byte {}, restarting download of {}", resume_offset, url_);
        }
        discard_partial_file();
        resume_offset = 0;
        res = perform_transfer(resume_offset, on_progress, cancel, http_code);
    }

    if (is_cancelled(cancel)) {
        if (logger_) {
            logger_->info("Download of {} cancelled", url_);
        }
        throw OperationCancelled();
    }

    if (res != CURLE_OK) {
        std::string message = "Download failed: ";
        message += curl_easy_strerror(res);
        if (http_code >= 400) {
            message += " (HTTP " + std::to_string(http_code) + ")";
        }
        if (logger_) {
            logger_->error("{} [{}]", message, url_);
        }
        throw ModelRepositoryError(message);
    }

    verify_size();
    finalize_download();
    if (on_progress) {
        on_progress(1.0);
    }
    if (logger_) {
        logger_->info("Model saved to {}", destination_.string());
    }
}
