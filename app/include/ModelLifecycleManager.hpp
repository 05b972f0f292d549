#ifndef MODEL_LIFECYCLE_MANAGER_HPP
#define MODEL_LIFECYCLE_MANAGER_HPP

#include "CancellableOperations.hpp"
#include "CuratedModelCatalog.hpp"
#include "IModelRepository.hpp"
#include "Settings.hpp"
#include "TaskDispatch.hpp"
#include "Types.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace spdlog { class logger; }

struct ModelLifecycleSnapshot {
    std::string selected_model;
    ModelWarmStatus warm_status{ModelWarmStatus::Cold};
    std::string recommended_model;
    std::vector<ModelInfo> available_models;
    std::vector<CuratedModelInfo> curated_models;
    bool fetching{false};
    bool downloading{false};
    std::string downloading_model;
    double download_progress{0.0};
    std::string fetch_error;
    std::string download_error;
    std::string prewarm_error;
    std::string delete_error;
};

/**
 * @brief Download, delete and warm-up state machine for on-device speech models.
 *
 * Intents run on the owner thread; repository work runs on the background
 * executor. Each long operation lives in a keyed slot ("catalog", "download",
 * "prewarm", "delete") and only the newest operation per slot may apply its
 * result. Both executors must outlive the manager.
 */
class ModelLifecycleManager {
public:
    using StateObserver = std::function<void(const ModelLifecycleSnapshot&)>;
    using RevealCallback = std::function<bool(const std::filesystem::path&)>;

    ModelLifecycleManager(Settings& settings,
                          std::shared_ptr<IModelRepository> repository,
                          CuratedModelCatalog curated_catalog,
                          IExecutor& background,
                          IExecutor& owner);
    ~ModelLifecycleManager();

    ModelLifecycleManager(const ModelLifecycleManager&) = delete;
    ModelLifecycleManager& operator=(const ModelLifecycleManager&) = delete;

    /**
     * @brief Resets the persisted warm status to cold and fetches the catalog.
     */
    void start();
    void fetch_models();
    void select_model(const std::string& name);

    void download(const std::string& name);
    void download_selected_model();
    void cancel_download();

    void prewarm(const std::string& name);
    /**
     * @brief Prewarms the selected model unless it is already warm.
     */
    void prewarm_selected_model();

    void delete_model(const std::string& name);
    void delete_selected_model();

    /**
     * @brief Creates the storage directory when missing and reveals it in the file manager.
     * @return False when the directory cannot be created or shown.
     */
    bool open_storage_location();
    void set_reveal_callback(RevealCallback callback);

    ModelLifecycleSnapshot snapshot() const;
    void set_state_observer(StateObserver observer);
    bool is_busy() const;

private:
    struct FetchResult {
        std::string recommended;
        std::vector<ModelInfo> available;
    };

    template <typename Result>
    void run_in_slot(const std::string& key,
                     std::function<Result(const CancellationTokenPtr&)> work,
                     std::function<void(Result)> on_success,
                     std::function<void(const std::string&)> on_failure);

    void set_warm_status(ModelWarmStatus status);
    void mark_downloaded(const std::string& name, bool downloaded);
    void update(const std::function<void(ModelLifecycleSnapshot&)>& mutate);
    void persist();
    void notify();

    Settings& settings_;
    std::shared_ptr<IModelRepository> repository_;
    CuratedModelCatalog curated_catalog_;
    IExecutor& background_;
    IExecutor& owner_;
    OperationSlots slots_;
    RevealCallback reveal_;

    mutable std::mutex mutex_;
    ModelLifecycleSnapshot state_;
    StateObserver observer_;

    std::shared_ptr<int> lifetime_;
    std::shared_ptr<spdlog::logger> logger_;
};

#endif // MODEL_LIFECYCLE_MANAGER_HPP
