#include "ModelLifecycleManager.hpp"
#include "EnhancementErrors.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <exception>
#include <optional>
#include <system_error>
#include <QDesktopServices>
#include <QString>
#include <QUrl>
#include <spdlog/spdlog.h>

namespace {

constexpr const char* kCatalogSlot = "catalog";
constexpr const char* kDownloadSlot = "download";
constexpr const char* kPrewarmSlot = "prewarm";
constexpr const char* kDeleteSlot = "delete";

bool reveal_in_file_manager(const std::filesystem::path& path)
{
    return QDesktopServices::openUrl(QUrl::fromLocalFile(QString::fromStdString(path.string())));
}

}


ModelLifecycleManager::ModelLifecycleManager(Settings& settings,
                                             std::shared_ptr<IModelRepository> repository,
                                             CuratedModelCatalog curated_catalog,
                                             IExecutor& background,
                                             IExecutor& owner)
    : settings_(settings),
      repository_(std::move(repository)),
      curated_catalog_(std::move(curated_catalog)),
      background_(background),
      owner_(owner),
      reveal_(reveal_in_file_manager),
      lifetime_(std::make_shared<int>(0)),
      logger_(Logger::get_logger("model_logger"))
{
}


ModelLifecycleManager::~ModelLifecycleManager()
{
    slots_.cancel_all();
    lifetime_.reset();
}


template <typename Result>
void ModelLifecycleManager::run_in_slot(const std::string& key,
                                        std::function<Result(const CancellationTokenPtr&)> work,
                                        std::function<void(Result)> on_success,
                                        std::function<void(const std::string&)> on_failure)
{
    CancellationTokenPtr token = slots_.begin(key);
    std::weak_ptr<int> guard = lifetime_;
    IExecutor* owner = &owner_;

    background_.post([this, key, token, guard, owner,
                      work = std::move(work),
                      on_success = std::move(on_success),
                      on_failure = std::move(on_failure)]() {
        std::optional<Result> result;
        std::string error;
        try {
            token->throw_if_cancelled();
            result = work(token);
        } catch (const OperationCancelled&) {
            error = "cancelled";
        } catch (const std::exception& ex) {
            error = ex.what();
        }

        owner->post([this, key, token, guard, result, error, on_success, on_failure]() {
            if (guard.expired()) {
                return;
            }
            if (!slots_.finish(key, token)) {
                if (logger_) {
                    logger_->debug("Dropping superseded '{}' result", key);
                }
                return;
            }
            if (result) {
                on_success(*result);
            } else {
                on_failure(error);
            }
        });
    });
}


void ModelLifecycleManager::start()
{
    set_warm_status(ModelWarmStatus::Cold);
    fetch_models();
}


void ModelLifecycleManager::fetch_models()
{
    update([](ModelLifecycleSnapshot& state) { state.fetching = true; });

    auto repository = repository_;
    run_in_slot<FetchResult>(kCatalogSlot,
        [repository](const CancellationTokenPtr& token) {
            FetchResult result;
            result.recommended = repository->get_recommended_models().default_model;
            for (const auto& name : repository->get_available_models()) {
                token->throw_if_cancelled();
                result.available.push_back(ModelInfo{name, repository->is_model_downloaded(name)});
            }
            return result;
        },
        [this](FetchResult result) {
            if (logger_) {
                logger_->info("Speech model catalog: {} models, recommended '{}'",
                              result.available.size(), result.recommended);
            }
            auto curated = curated_catalog_.resolve(result.available);
            update([&](ModelLifecycleSnapshot& state) {
                state.fetching = false;
                state.fetch_error.clear();
                state.recommended_model = std::move(result.recommended);
                state.available_models = std::move(result.available);
                state.curated_models = std::move(curated);
            });
        },
        [this](const std::string& message) {
            if (logger_) {
                logger_->error("Failed to fetch speech models: {}", message);
            }
            update([&](ModelLifecycleSnapshot& state) {
                state.fetching = false;
                state.fetch_error = message;
            });
        });
}


void ModelLifecycleManager::select_model(const std::string& name)
{
    if (name.empty()) {
        return;
    }
    settings_.set_transcription_model(name);
    slots_.cancel(kPrewarmSlot);
    set_warm_status(ModelWarmStatus::Cold);
    if (logger_) {
        logger_->info("Selected speech model '{}'", name);
    }

    if (repository_->is_model_downloaded(name)) {
        prewarm(name);
    }
}


void ModelLifecycleManager::download(const std::string& name)
{
    if (name.empty()) {
        return;
    }
    update([&](ModelLifecycleSnapshot& state) {
        state.downloading = true;
        state.downloading_model = name;
        state.download_progress = 0.0;
        state.download_error.clear();
    });

    auto repository = repository_;
    std::weak_ptr<int> guard = lifetime_;
    IExecutor* owner = &owner_;
    run_in_slot<bool>(kDownloadSlot,
        [this, repository, name, guard, owner](const CancellationTokenPtr& token) {
            repository->download_model(name, [this, guard, owner, token](double progress) {
                owner->post([this, guard, token, progress]() {
                    if (guard.expired() || !slots_.is_current(kDownloadSlot, token)) {
                        return;
                    }
                    update([progress](ModelLifecycleSnapshot& state) { state.download_progress = progress; });
                });
            }, token);
            return true;
        },
        [this, name](bool) {
            update([](ModelLifecycleSnapshot& state) {
                state.downloading = false;
                state.downloading_model.clear();
                state.download_progress = 1.0;
            });
            mark_downloaded(name, repository_->is_model_downloaded(name));
            if (logger_) {
                logger_->info("Downloaded speech model '{}'", name);
            }
            if (name == settings_.get_transcription_model()) {
                prewarm(name);
            }
        },
        [this, name](const std::string& message) {
            if (logger_) {
                logger_->error("Download of '{}' failed: {}", name, message);
            }
            update([&](ModelLifecycleSnapshot& state) {
                state.downloading = false;
                state.downloading_model.clear();
                state.download_progress = 0.0;
                state.download_error = "Failed to download " + name + ": " + message;
            });
        });
}


void ModelLifecycleManager::download_selected_model()
{
    download(settings_.get_transcription_model());
}


void ModelLifecycleManager::cancel_download()
{
    slots_.cancel(kDownloadSlot);
    update([](ModelLifecycleSnapshot& state) {
        state.downloading = false;
        state.downloading_model.clear();
        state.download_progress = 0.0;
    });
}


void ModelLifecycleManager::prewarm(const std::string& name)
{
    if (name.empty()) {
        return;
    }
    if (!repository_->is_model_downloaded(name)) {
        update([&](ModelLifecycleSnapshot& state) {
            state.prewarm_error = "Model '" + name + "' is not downloaded";
        });
        set_warm_status(ModelWarmStatus::Cold);
        return;
    }

    update([](ModelLifecycleSnapshot& state) { state.prewarm_error.clear(); });
    set_warm_status(ModelWarmStatus::Warming);

    auto repository = repository_;
    run_in_slot<bool>(kPrewarmSlot,
        [repository, name](const CancellationTokenPtr& token) {
            repository->prewarm_model(name, {}, token);
            return true;
        },
        [this, name](bool) {
            if (logger_) {
                logger_->info("Speech model '{}' is warm", name);
            }
            set_warm_status(ModelWarmStatus::Warm);
        },
        [this, name](const std::string& message) {
            if (logger_) {
                logger_->warn("Prewarming '{}' failed: {}", name, message);
            }
            update([&](ModelLifecycleSnapshot& state) {
                state.prewarm_error = "Failed to prewarm " + name + ": " + message;
            });
            set_warm_status(ModelWarmStatus::Cold);
        });
}


void ModelLifecycleManager::prewarm_selected_model()
{
    if (settings_.get_transcription_warm_status() == ModelWarmStatus::Warm) {
        if (logger_) {
            logger_->debug("Speech model already warm, skipping prewarm");
        }
        return;
    }
    prewarm(settings_.get_transcription_model());
}


void ModelLifecycleManager::delete_model(const std::string& name)
{
    if (name.empty()) {
        return;
    }
    update([](ModelLifecycleSnapshot& state) { state.delete_error.clear(); });

    auto repository = repository_;
    run_in_slot<bool>(kDeleteSlot,
        [repository, name](const CancellationTokenPtr&) {
            repository->delete_model(name);
            return true;
        },
        [this, name](bool) {
            if (logger_) {
                logger_->info("Deleted speech model '{}'", name);
            }
            if (name == settings_.get_transcription_model()) {
                slots_.cancel(kPrewarmSlot);
                set_warm_status(ModelWarmStatus::Cold);
            }
            mark_downloaded(name, false);
            fetch_models();
        },
        [this, name](const std::string& message) {
            if (logger_) {
                logger_->error("Deleting '{}' failed: {}", name, message);
            }
            update([&](ModelLifecycleSnapshot& state) {
                state.delete_error = "Failed to delete " + name + ": " + message;
            });
        });
}


void ModelLifecycleManager::delete_selected_model()
{
    delete_model(settings_.get_transcription_model());
}


bool ModelLifecycleManager::open_storage_location()
{
    const std::filesystem::path location = repository_->storage_location();
    std::error_code ec;
    std::filesystem::create_directories(location, ec);
    if (ec) {
        if (logger_) {
            logger_->error("Cannot create model directory {}: {}", location.string(), ec.message());
        }
        return false;
    }
    if (!reveal_) {
        return false;
    }
    const bool shown = reveal_(location);
    if (!shown && logger_) {
        logger_->warn("Could not reveal {} in the file manager", location.string());
    }
    return shown;
}


void ModelLifecycleManager::set_reveal_callback(RevealCallback callback)
{
    reveal_ = std::move(callback);
}


void ModelLifecycleManager::set_warm_status(ModelWarmStatus status)
{
    settings_.set_transcription_warm_status(status);
    persist();
    notify();
}


void ModelLifecycleManager::mark_downloaded(const std::string& name, bool downloaded)
{
    update([&](ModelLifecycleSnapshot& state) {
        auto it = std::find_if(state.available_models.begin(), state.available_models.end(),
                               [&name](const ModelInfo& info) { return info.name == name; });
        if (it != state.available_models.end()) {
            it->is_downloaded = downloaded;
        } else if (downloaded) {
            state.available_models.push_back(ModelInfo{name, true});
        }
        state.curated_models = curated_catalog_.resolve(state.available_models);
    });
}


void ModelLifecycleManager::update(const std::function<void(ModelLifecycleSnapshot&)>& mutate)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        mutate(state_);
    }
    notify();
}


void ModelLifecycleManager::persist()
{
    if (!settings_.save() && logger_) {
        logger_->warn("Failed to persist speech model settings to {}", settings_.get_config_path());
    }
}


void ModelLifecycleManager::notify()
{
    StateObserver observer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        observer = observer_;
    }
    if (observer) {
        observer(snapshot());
    }
}


ModelLifecycleSnapshot ModelLifecycleManager::snapshot() const
{
    ModelLifecycleSnapshot result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result = state_;
    }
    result.selected_model = settings_.get_transcription_model();
    result.warm_status = settings_.get_transcription_warm_status();
    return result;
}


void ModelLifecycleManager::set_state_observer(StateObserver observer)
{
    std::lock_guard<std::mutex> lock(mutex_);
    observer_ = std::move(observer);
}


bool ModelLifecycleManager::is_busy() const
{
    return !slots_.empty();
}
