#pragma once
#include "CancellableOperations.hpp"
#include "Types.hpp"
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <curl/curl.h>

namespace spdlog { class logger; }

/**
 * @brief Downloads one model file with resume support.
 *
 * Bytes are written to "<destination>.part" and renamed once the transfer
 * completes, so a file at the destination is always complete.
 */
class ModelDownloader
{
public:
    /**
     * @brief Constructs a downloader for the given URL.
     * @param download_url URL of the model to download.
     * @param destination Final path of the downloaded file.
     * @param expected_size Size the finished file must have; 0 when unknown.
     */
    ModelDownloader(std::string download_url,
                    std::filesystem::path destination,
                    std::uint64_t expected_size = 0);

    /**
     * @brief Runs the download on the calling thread.
     *
     * Resumes from an existing partial file. When the server rejects the byte
     * range the partial file is discarded and the download restarts once.
     * @param on_progress Called with the completed fraction (0-1).
     * @param cancel Checked between chunks; cancellation keeps the partial file.
     * @throws ModelRepositoryError on transfer or filesystem failure, or when
     * the finished file does not have the expected size (the partial file is
     * discarded so the next attempt starts over).
     * @throws OperationCancelled when @p cancel fires.
     */
    void download(const ProgressCallback& on_progress, const CancellationTokenPtr& cancel);

    /**
     * @brief Path of the in-progress partial file.
     * @return Destination path with a ".part" suffix.
     */
    std::filesystem::path partial_path() const;
    const std::filesystem::path& destination() const { return destination_; }
    const std::string& url() const { return url_; }

private:
    struct TransferContext {
        const ProgressCallback* on_progress{nullptr};
        CancellationToken* cancel{nullptr};
        long resume_offset{0};
    };

    /**
     * @brief Curl write callback for file download.
     */
    static size_t write_data(void* ptr, size_t size, size_t nmemb, FILE* stream);
    /**
     * @brief Curl progress callback; returns non-zero to abort when cancelled.
     */
    static int progress_func(void* clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t, curl_off_t);

    CURLcode perform_transfer(long resume_offset,
                              const ProgressCallback& on_progress,
                              const CancellationTokenPtr& cancel,
                              long& http_code);
    long determine_resume_offset() const;
    FILE* open_output_file(long resume_offset) const;
    void discard_partial_file() const;
    void verify_size() const;
    void finalize_download() const;

    std::string url_;
    std::filesystem::path destination_;
    std::uint64_t expected_size_;
    std::shared_ptr<spdlog::logger> logger_;
};
