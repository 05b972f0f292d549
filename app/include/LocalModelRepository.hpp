#pragma once

#include "IModelRepository.hpp"
#include "ModelManifest.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace spdlog { class logger; }

/**
 * @brief Stores ggml speech models as "ggml-<name>.bin" files in one directory.
 */
class LocalModelRepository : public IModelRepository {
public:
    LocalModelRepository(std::filesystem::path storage_dir, ModelManifest manifest);

    /**
     * @brief DICTAFLOW_MODELS_DIR when set, else <app data>/models.
     */
    static std::filesystem::path default_storage_location();

    std::vector<std::string> get_available_models() override;
    RecommendedModels get_recommended_models() override;
    bool is_model_downloaded(const std::string& name) override;
    void download_model(const std::string& name,
                        const ProgressCallback& on_progress,
                        const CancellationTokenPtr& cancel) override;
    void delete_model(const std::string& name) override;
    void prewarm_model(const std::string& name,
                       const ProgressCallback& on_progress,
                       const CancellationTokenPtr& cancel) override;
    std::filesystem::path storage_location() const override;

    std::filesystem::path model_path(const std::string& name) const;
    std::string warm_model() const;

private:
    std::vector<std::string> downloaded_models() const;
    std::shared_ptr<std::mutex> transfer_lock(const std::string& name);

    std::filesystem::path storage_dir_;
    ModelManifest manifest_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::mutex mutex_;
    std::string warm_model_;
    // One transfer per model file at a time; a superseded transfer must
    // release its ".part" file before the next one measures the resume offset.
    std::map<std::string, std::shared_ptr<std::mutex>> transfer_locks_;
};
