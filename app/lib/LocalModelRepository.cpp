#include "LocalModelRepository.hpp"
#include "EnhancementErrors.hpp"
#include "Logger.hpp"
#include "ModelDownloader.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <system_error>
#include <vector>
#include <QStandardPaths>
#include <QString>

namespace {

constexpr const char* kFilePrefix = "ggml-";
constexpr const char* kFileSuffix = ".bin";
constexpr std::size_t kPrewarmChunkSize = 4 * 1024 * 1024;

bool ends_with(const std::string& value, const std::string& suffix)
{
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}


LocalModelRepository::LocalModelRepository(std::filesystem::path storage_dir, ModelManifest manifest)
    : storage_dir_(std::move(storage_dir)),
      manifest_(std::move(manifest)),
      logger_(Logger::get_logger("model_logger"))
{
}


std::filesystem::path LocalModelRepository::default_storage_location()
{
    if (const char* override_dir = std::getenv("DICTAFLOW_MODELS_DIR")) {
        if (override_dir[0] != '\0') {
            return std::filesystem::path(override_dir);
        }
    }
    const QString app_data = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (!app_data.isEmpty()) {
        return std::filesystem::path(app_data.toStdString()) / "models";
    }
    return std::filesystem::current_path() / "models";
}


std::filesystem::path LocalModelRepository::storage_location() const
{
    return storage_dir_;
}


std::filesystem::path LocalModelRepository::model_path(const std::string& name) const
{
    return storage_dir_ / (std::string(kFilePrefix) + name + kFileSuffix);
}


std::string LocalModelRepository::warm_model() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return warm_model_;
}


std::vector<std::string> LocalModelRepository::downloaded_models() const
{
    std::vector<std::string> names;
    std::error_code ec;
    if (!std::filesystem::is_directory(storage_dir_, ec)) {
        return names;
    }
    const std::string prefix = kFilePrefix;
    const std::string suffix = kFileSuffix;
    for (const auto& entry : std::filesystem::directory_iterator(storage_dir_, ec)) {
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        const std::string filename = entry.path().filename().string();
        if (filename.rfind(prefix, 0) != 0 || !ends_with(filename, suffix)) {
            continue;
        }
        names.push_back(filename.substr(prefix.size(), filename.size() - prefix.size() - suffix.size()));
    }
    std::sort(names.begin(), names.end());
    return names;
}


std::vector<std::string> LocalModelRepository::get_available_models()
{
    std::vector<std::string> names = manifest_.names();
    for (const auto& downloaded : downloaded_models()) {
        if (std::find(names.begin(), names.end(), downloaded) == names.end()) {
            names.push_back(downloaded);
        }
    }
    if (manifest_.empty() && logger_) {
        logger_->info("No downloadable models known, listing {} local models", names.size());
    }
    return names;
}


RecommendedModels LocalModelRepository::get_recommended_models()
{
    RecommendedModels recommended;
    recommended.default_model = manifest_.default_model();
    recommended.supported = manifest_.names();
    if (recommended.default_model.empty()) {
        const auto local = downloaded_models();
        if (!local.empty()) {
            recommended.default_model = local.front();
        }
    }
    return recommended;
}


bool LocalModelRepository::is_model_downloaded(const std::string& name)
{
    std::error_code ec;
    return std::filesystem::is_regular_file(model_path(name), ec);
}


std::shared_ptr<std::mutex> LocalModelRepository::transfer_lock(const std::string& name)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = transfer_locks_[name];
    if (!entry) {
        entry = std::make_shared<std::mutex>();
    }
    return entry;
}


void LocalModelRepository::download_model(const std::string& name,
                                          const ProgressCallback& on_progress,
                                          const CancellationTokenPtr& cancel)
{
    const auto file_lock = transfer_lock(name);
    std::lock_guard<std::mutex> transfer(*file_lock);
    if (cancel) {
        cancel->throw_if_cancelled();
    }
    if (is_model_downloaded(name)) {
        if (on_progress) {
            on_progress(1.0);
        }
        return;
    }
    const auto entry = manifest_.find(name);
    if (!entry) {
        throw ModelRepositoryError("Unknown model '" + name + "'");
    }

    ModelDownloader downloader(entry->url, model_path(name), entry->size_bytes);
    downloader.download(on_progress, cancel);
}


void LocalModelRepository::delete_model(const std::string& name)
{
    const auto path = model_path(name);
    std::filesystem::path partial = path;
    partial += ".part";

    std::error_code ec;
    const bool removed = std::filesystem::remove(path, ec);
    if (ec) {
        throw ModelRepositoryError("Failed to delete " + path.string() + ": " + ec.message());
    }
    std::filesystem::remove(partial, ec);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (warm_model_ == name) {
            warm_model_.clear();
        }
    }

    if (!removed) {
        throw ModelRepositoryError("Model '" + name + "' is not downloaded");
    }
    if (logger_) {
        logger_->info("Deleted model {}", name);
    }
}


void LocalModelRepository::prewarm_model(const std::string& name,
                                         const ProgressCallback& on_progress,
                                         const CancellationTokenPtr& cancel)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (warm_model_ == name) {
            if (on_progress) {
                on_progress(1.0);
            }
            return;
        }
    }

    const auto path = model_path(name);
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw ModelRepositoryError("Model '" + name + "' is not downloaded");
    }

    std::error_code ec;
    const auto total = std::filesystem::file_size(path, ec);
    std::vector<char> buffer(kPrewarmChunkSize);
    std::uintmax_t read_bytes = 0;
    // Reading the whole file once pulls it into the page cache.
    while (input) {
        if (cancel) {
            cancel->throw_if_cancelled();
        }
        input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        read_bytes += static_cast<std::uintmax_t>(input.gcount());
        if (on_progress && !ec && total > 0) {
            on_progress(static_cast<double>(read_bytes) / static_cast<double>(total));
        }
    }
    if (input.bad()) {
        throw ModelRepositoryError("Failed to read model file " + path.string());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        warm_model_ = name;
    }
    if (on_progress) {
        on_progress(1.0);
    }
    if (logger_) {
        logger_->info("Model {} is warm ({} bytes)", name, read_bytes);
    }
}
