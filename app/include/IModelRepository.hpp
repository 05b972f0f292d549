#pragma once

#include "CancellableOperations.hpp"
#include "Types.hpp"

#include <filesystem>
#include <string>
#include <vector>

struct RecommendedModels {
    std::string default_model;
    std::vector<std::string> supported;
};

/**
 * @brief Storage and warm-up backend for on-device speech models.
 *
 * Failures are reported with ModelRepositoryError; a cancelled download or
 * prewarm throws OperationCancelled. Calls may block and are expected to run
 * on a background thread.
 */
class IModelRepository {
public:
    virtual ~IModelRepository() = default;

    virtual std::vector<std::string> get_available_models() = 0;
    virtual RecommendedModels get_recommended_models() = 0;
    virtual bool is_model_downloaded(const std::string& name) = 0;
    virtual void download_model(const std::string& name,
                                const ProgressCallback& on_progress,
                                const CancellationTokenPtr& cancel) = 0;
    virtual void delete_model(const std::string& name) = 0;
    virtual void prewarm_model(const std::string& name,
                               const ProgressCallback& on_progress,
                               const CancellationTokenPtr& cancel) = 0;
    virtual std::filesystem::path storage_location() const = 0;
};
