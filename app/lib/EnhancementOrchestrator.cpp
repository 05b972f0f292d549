#include "EnhancementOrchestrator.hpp"
#include "EnhancementErrors.hpp"
#include "Logger.hpp"
#include "ModelSelection.hpp"
#include "ResponseNormalizer.hpp"

#include <QString>
#include <cstdio>
#include <exception>
#include <spdlog/spdlog.h>

namespace {

constexpr qsizetype kMinimumEnhanceableLength = 6;

qsizetype character_count(const std::string& text)
{
    return QString::fromStdString(text).toUcs4().size();
}

std::string unavailable_reason(ProviderKind kind, const std::string& api_key)
{
    if (provider_requires_credential(kind)) {
        return api_key.empty() ? "API key is required"
                               : "Service is unreachable or the API key was rejected";
    }
    return "Server is not running or not reachable";
}

}


EnhancementOrchestrator::EnhancementOrchestrator(Settings& settings,
                                                 ProviderRegistry registry,
                                                 IExecutor& background,
                                                 IExecutor& owner)
    : settings_(settings),
      registry_(std::move(registry)),
      background_(background),
      owner_(owner),
      lifetime_(std::make_shared<int>(0)),
      logger_(Logger::get_logger("core_logger"))
{
}


EnhancementOrchestrator::~EnhancementOrchestrator()
{
    slots_.cancel_all();
    lifetime_.reset();
}


template <typename Result>
void EnhancementOrchestrator::run_async(ProviderKind kind,
                                        Operation operation,
                                        std::function<Result()> work,
                                        std::function<void(Result)> on_success,
                                        std::function<void(const std::string&)> on_failure)
{
    const std::string key = slot_key(kind, operation);
    CancellationTokenPtr token = slots_.begin(key);
    std::weak_ptr<int> guard = lifetime_;
    IExecutor* owner = &owner_;

    // The worker never touches `this`; only the owner-side continuation does,
    // and only after checking the lifetime guard.
    background_.post([this, key, token, guard, owner,
                      work = std::move(work),
                      on_success = std::move(on_success),
                      on_failure = std::move(on_failure)]() {
        std::optional<Result> result;
        std::string error;
        if (!token->is_cancelled()) {
            try {
                result = work();
            } catch (const std::exception& ex) {
                error = ex.what();
            }
        }

        owner->post([this, key, token, guard, result, error, on_success, on_failure]() {
            if (guard.expired()) {
                return;
            }
            if (!slots_.finish(key, token)) {
                if (logger_) {
                    logger_->debug("Dropping superseded result for '{}'", key);
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


std::string EnhancementOrchestrator::slot_key(ProviderKind kind, Operation operation)
{
    const char* name = "availability";
    switch (operation) {
        case Operation::Availability: name = "availability"; break;
        case Operation::TextCatalog: name = "text-catalog"; break;
        case Operation::ImageCatalog: name = "image-catalog"; break;
        case Operation::Connection: name = "connection"; break;
    }
    return std::string(name) + ":" + provider_to_string(kind);
}


std::string EnhancementOrchestrator::scoped_message(ProviderKind kind, const std::string& message)
{
    return provider_display_name(kind) + ": " + message;
}


void EnhancementOrchestrator::activate()
{
    const ProviderKind kind = settings_.get_active_provider();
    auto provider = registry_.get(kind);
    if (!provider) {
        update_state(kind, [&](ProviderViewState& state) {
            state.error = scoped_message(kind, "no client is registered");
        });
        return;
    }

    const std::string api_key = settings_.get_api_key(kind);
    update_state(kind, [](ProviderViewState& state) { state.checking_availability = true; });

    run_async<bool>(kind, Operation::Availability,
        [provider, api_key]() { return provider->is_available(api_key); },
        [this, kind, api_key](bool available) {
            update_state(kind, [&](ProviderViewState& state) {
                state.checking_availability = false;
                state.availability_known = true;
                state.available = available;
                if (available) {
                    state.error.clear();
                } else {
                    state.error = scoped_message(kind, unavailable_reason(kind, api_key));
                }
            });
            if (!available) {
                if (logger_) {
                    logger_->warn("{} is not available", provider_display_name(kind));
                }
                return;
            }
            if (!provider_requires_credential(kind) || !api_key.empty()) {
                load_models();
                load_image_models();
            }
        },
        [this, kind](const std::string& message) {
            update_state(kind, [&](ProviderViewState& state) {
                state.checking_availability = false;
                state.availability_known = true;
                state.available = false;
                state.error = scoped_message(kind, message);
            });
        });
}


void EnhancementOrchestrator::set_enabled(bool enabled)
{
    settings_.set_enhancement_enabled(enabled);
    persist();
    notify();
    if (enabled) {
        activate();
    }
}


void EnhancementOrchestrator::set_active_provider(ProviderKind kind)
{
    cancel_provider_operations(settings_.get_active_provider());

    settings_.set_active_provider(kind);
    persist();
    if (logger_) {
        logger_->info("Active enhancement provider set to {}", provider_display_name(kind));
    }

    update_state(kind, [](ProviderViewState& state) {
        state.error.clear();
        state.image_error.clear();
        state.connection_status.clear();
    });
    activate();
}


void EnhancementOrchestrator::set_credential(ProviderKind kind, const std::string& api_key)
{
    settings_.set_api_key(kind, ResponseNormalizer::trim(api_key));
    persist();
    notify();
}


void EnhancementOrchestrator::load_models()
{
    const ProviderKind kind = settings_.get_active_provider();
    auto provider = registry_.get(kind);
    if (!provider) {
        return;
    }

    const std::string api_key = settings_.get_api_key(kind);
    update_state(kind, [](ProviderViewState& state) { state.loading_models = true; });

    run_async<std::vector<RemoteAIModel>>(kind, Operation::TextCatalog,
        [provider, api_key]() { return provider->fetch_models(api_key); },
        [this, kind](std::vector<RemoteAIModel> models) { apply_text_catalog(kind, std::move(models)); },
        [this, kind](const std::string& message) {
            if (logger_) {
                logger_->warn("Loading {} models failed: {}", provider_display_name(kind), message);
            }
            update_state(kind, [&](ProviderViewState& state) {
                state.loading_models = false;
                state.error = scoped_message(kind, message);
            });
        });
}


void EnhancementOrchestrator::load_image_models()
{
    const ProviderKind kind = settings_.get_active_provider();
    auto provider = registry_.get(kind);
    if (!provider) {
        return;
    }

    const std::string api_key = settings_.get_api_key(kind);
    update_state(kind, [](ProviderViewState& state) { state.loading_image_models = true; });

    run_async<std::vector<RemoteAIModel>>(kind, Operation::ImageCatalog,
        [provider, api_key]() { return provider->fetch_models(api_key); },
        [this, kind](std::vector<RemoteAIModel> models) { apply_image_catalog(kind, std::move(models)); },
        [this, kind](const std::string& message) {
            if (logger_) {
                logger_->warn("Loading {} image models failed: {}", provider_display_name(kind), message);
            }
            update_state(kind, [&](ProviderViewState& state) {
                state.loading_image_models = false;
                state.image_error = scoped_message(kind, message);
            });
        });
}


void EnhancementOrchestrator::test_connection()
{
    const ProviderKind kind = settings_.get_active_provider();
    auto provider = registry_.get(kind);
    if (!provider) {
        return;
    }

    const std::string api_key = settings_.get_api_key(kind);
    update_state(kind, [](ProviderViewState& state) {
        state.testing_connection = true;
        state.connection_status.clear();
    });

    run_async<bool>(kind, Operation::Connection,
        [provider, api_key]() { return provider->test_connection(api_key); },
        [this, kind](bool connected) {
            update_state(kind, [&](ProviderViewState& state) {
                state.testing_connection = false;
                state.connection_status = connected ? "Connection successful" : "Connection failed";
                if (connected) {
                    state.availability_known = true;
                    state.available = true;
                }
            });
            if (connected && provider_requires_credential(kind)) {
                load_models();
                load_image_models();
            }
        },
        [this, kind](const std::string& message) {
            update_state(kind, [&](ProviderViewState& state) {
                state.testing_connection = false;
                state.connection_status = "Connection failed";
                state.error = scoped_message(kind, message);
            });
        });
}


void EnhancementOrchestrator::apply_text_catalog(ProviderKind kind, std::vector<RemoteAIModel> models)
{
    const std::string current = settings_.get_selected_text_model(kind);
    const std::string reconciled =
        ModelSelection::reconcile_selection(current, models, ModelSelection::flagship_text_model(kind));

    if (logger_) {
        logger_->info("{} text catalog: {} models, selection '{}'", provider_display_name(kind), models.size(), reconciled);
    }

    if (reconciled != current) {
        settings_.set_selected_text_model(kind, reconciled);
        persist();
    }

    update_state(kind, [&](ProviderViewState& state) {
        state.loading_models = false;
        state.error.clear();
        state.models = std::move(models);
    });
}


void EnhancementOrchestrator::apply_image_catalog(ProviderKind kind, std::vector<RemoteAIModel> models)
{
    std::vector<RemoteAIModel> vision_models = ModelSelection::filter_vision_models(models);
    const std::string current = settings_.get_selected_image_model(kind);
    const std::string reconciled =
        ModelSelection::reconcile_selection(current, vision_models, ModelSelection::flagship_image_model(kind));

    if (logger_) {
        logger_->info("{} image catalog: {} vision models of {}, selection '{}'",
                      provider_display_name(kind), vision_models.size(), models.size(), reconciled);
    }

    if (reconciled != current) {
        settings_.set_selected_image_model(kind, reconciled);
        persist();
    }

    update_state(kind, [&](ProviderViewState& state) {
        state.loading_image_models = false;
        state.image_error.clear();
        state.image_models = std::move(vision_models);
    });
}


void EnhancementOrchestrator::set_selected_text_model(const std::string& model_id)
{
    settings_.set_selected_text_model(settings_.get_active_provider(), model_id);
    persist();
    notify();
}


void EnhancementOrchestrator::set_selected_image_model(const std::string& model_id)
{
    settings_.set_selected_image_model(settings_.get_active_provider(), model_id);
    persist();
    notify();
}


void EnhancementOrchestrator::set_temperature(double value)
{
    settings_.set_temperature(value);
    persist();
    notify();
}


void EnhancementOrchestrator::set_prompt(const std::string& prompt)
{
    settings_.set_prompt(prompt);
    persist();
}


void EnhancementOrchestrator::set_image_prompt(const std::string& prompt)
{
    settings_.set_image_prompt(prompt);
    persist();
}


void EnhancementOrchestrator::reset_prompt_to_default()
{
    set_prompt(EnhancementOptions::default_prompt());
}


void EnhancementOrchestrator::reset_image_prompt_to_default()
{
    set_image_prompt(EnhancementOptions::default_image_prompt());
}


EnhancementOutcome EnhancementOrchestrator::enhance_transcript(const std::string& text,
                                                               const std::optional<std::string>& context,
                                                               const ProgressCallback& on_progress)
{
    EnhancementOutcome outcome;
    outcome.text = text;

    if (!settings_.get_enhancement_enabled()) {
        return outcome;
    }
    const qsizetype characters = character_count(ResponseNormalizer::trim(text));
    if (characters < kMinimumEnhanceableLength) {
        if (logger_) {
            logger_->debug("Skipping enhancement of a {}-character transcript", characters);
        }
        return outcome;
    }

    const ProviderKind kind = settings_.get_active_provider();
    auto provider = registry_.get(kind);
    if (!provider) {
        outcome.error = scoped_message(kind, "no client is registered");
        return outcome;
    }

    EnhancementOptions options;
    options.system_prompt = settings_.get_prompt().empty() ? EnhancementOptions::default_prompt()
                                                           : settings_.get_prompt();
    options.context = context;
    options.temperature = settings_.get_temperature();
    options.max_tokens = settings_.get_max_tokens();

    try {
        outcome.text = provider->enhance(text,
                                         settings_.get_selected_text_model(kind),
                                         options,
                                         settings_.get_api_key(kind),
                                         on_progress);
        outcome.enhanced = true;
    } catch (const std::exception& ex) {
        outcome.text = text;
        outcome.error = scoped_message(kind, ex.what());
        if (logger_) {
            logger_->error("Enhancement failed, keeping the original transcript: {}", outcome.error);
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_enhancement_error_ = outcome.error;
    }
    notify();
    return outcome;
}


std::string EnhancementOrchestrator::analyze_screenshot(const std::vector<unsigned char>& image_data,
                                                        const ProgressCallback& on_progress)
{
    const ProviderKind kind = settings_.get_active_provider();
    auto provider = registry_.get(kind);
    if (!provider) {
        throw ProviderError::invalid_request("no client is registered for " + provider_display_name(kind));
    }

    const std::string prompt = settings_.get_image_prompt().empty() ? EnhancementOptions::default_image_prompt()
                                                                    : settings_.get_image_prompt();
    return provider->analyze_image(image_data,
                                   settings_.get_selected_image_model(kind),
                                   prompt,
                                   prompt,
                                   settings_.get_api_key(kind),
                                   on_progress);
}


void EnhancementOrchestrator::cancel_provider_operations(ProviderKind kind)
{
    for (Operation operation : {Operation::Availability, Operation::TextCatalog,
                                Operation::ImageCatalog, Operation::Connection}) {
        slots_.cancel(slot_key(kind, operation));
    }
    update_state(kind, [](ProviderViewState& state) {
        state.checking_availability = false;
        state.loading_models = false;
        state.loading_image_models = false;
        state.testing_connection = false;
    });
}


void EnhancementOrchestrator::update_state(ProviderKind kind, const std::function<void(ProviderViewState&)>& mutate)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        mutate(states_[kind]);
    }
    notify();
}


void EnhancementOrchestrator::persist()
{
    if (!settings_.save() && logger_) {
        logger_->warn("Failed to persist enhancement settings to {}", settings_.get_config_path());
    }
}


void EnhancementOrchestrator::notify()
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


EnhancementSnapshot EnhancementOrchestrator::snapshot() const
{
    EnhancementSnapshot result;
    result.enabled = settings_.get_enhancement_enabled();
    result.active_provider = settings_.get_active_provider();
    result.has_credential = !settings_.get_api_key(result.active_provider).empty();
    result.selected_text_model = settings_.get_selected_text_model(result.active_provider);
    result.selected_image_model = settings_.get_selected_image_model(result.active_provider);

    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = states_.find(result.active_provider);
    if (it != states_.end()) {
        result.provider = it->second;
    }
    result.last_enhancement_error = last_enhancement_error_;
    return result;
}


ProviderViewState EnhancementOrchestrator::provider_state(ProviderKind kind) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = states_.find(kind);
    return it == states_.end() ? ProviderViewState{} : it->second;
}


void EnhancementOrchestrator::set_state_observer(StateObserver observer)
{
    std::lock_guard<std::mutex> lock(mutex_);
    observer_ = std::move(observer);
}


bool EnhancementOrchestrator::is_busy() const
{
    return !slots_.empty();
}
