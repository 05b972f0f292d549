#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>

#include "EnhancementErrors.hpp"
#include "ModelDownloader.hpp"
#include "TestHelpers.hpp"

namespace {

std::string read_all(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

}

TEST_CASE("ModelDownloader retries full download after a range error") {
    TempDir tmp;
    const auto destination = tmp.path() / "ggml-base.bin";
    ModelDownloader downloader("http://example.com/ggml-base.bin", destination);
    write_file(downloader.partial_path(), "abc");

    std::atomic<int> attempts{0};
    DownloadHookGuard hook([&](long offset, const std::string& path) -> CURLcode {
        ++attempts;
        if (attempts == 1) {
            REQUIRE(offset == 3);
            return CURLE_HTTP_RANGE_ERROR;
        }
        REQUIRE(offset == 0);
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << "abcdef";
        return CURLE_OK;
    });

    double last_progress = 0.0;
    downloader.download([&](double value) { last_progress = value; }, std::make_shared<CancellationToken>());

    CHECK(attempts.load() == 2);
    CHECK(std::filesystem::file_size(destination) == 6);
    CHECK_FALSE(std::filesystem::exists(downloader.partial_path()));
    CHECK(last_progress == 1.0);
}

TEST_CASE("ModelDownloader resumes from the partial file") {
    TempDir tmp;
    const auto destination = tmp.path() / "models" / "ggml-tiny.bin";
    ModelDownloader downloader("http://example.com/ggml-tiny.bin", destination);
    write_file(downloader.partial_path(), "1234");

    long seen_offset = -1;
    DownloadHookGuard hook([&](long offset, const std::string& path) -> CURLcode {
        seen_offset = offset;
        std::ofstream out(path, std::ios::binary | std::ios::app);
        out << "5678";
        return CURLE_OK;
    });

    downloader.download({}, nullptr);

    CHECK(seen_offset == 4);
    CHECK(read_all(destination) == "12345678");
}

TEST_CASE("ModelDownloader keeps the partial file when the transfer fails") {
    TempDir tmp;
    const auto destination = tmp.path() / "ggml-small.bin";
    ModelDownloader downloader("http://example.com/ggml-small.bin", destination);

    DownloadHookGuard hook([](long, const std::string& path) -> CURLcode {
        std::ofstream out(path, std::ios::binary);
        out << "partial";
        return CURLE_COULDNT_CONNECT;
    });

    CHECK_THROWS_AS(downloader.download({}, nullptr), ModelRepositoryError);
    CHECK_FALSE(std::filesystem::exists(destination));
    CHECK(std::filesystem::exists(downloader.partial_path()));
}

TEST_CASE("ModelDownloader reports cancellation") {
    TempDir tmp;
    const auto destination = tmp.path() / "ggml-medium.bin";
    ModelDownloader downloader("http://example.com/ggml-medium.bin", destination);
    auto token = std::make_shared<CancellationToken>();

    DownloadHookGuard hook([&](long, const std::string&) -> CURLcode {
        token->cancel();
        return CURLE_ABORTED_BY_CALLBACK;
    });

    CHECK_THROWS_AS(downloader.download({}, token), OperationCancelled);
    CHECK_FALSE(std::filesystem::exists(destination));
}

TEST_CASE("ModelDownloader rejects a file of the wrong size") {
    TempDir tmp;
    const auto destination = tmp.path() / "ggml-base.bin";
    ModelDownloader downloader("http://example.com/ggml-base.bin", destination, 6);
    write_file(downloader.partial_path(), "abc");

    DownloadHookGuard hook([](long, const std::string& path) -> CURLcode {
        std::ofstream out(path, std::ios::binary | std::ios::app);
        out << "abcdef";
        return CURLE_OK;
    });

    CHECK_THROWS_AS(downloader.download({}, nullptr), ModelRepositoryError);
    CHECK_FALSE(std::filesystem::exists(destination));
    CHECK_FALSE(std::filesystem::exists(downloader.partial_path()));
}
