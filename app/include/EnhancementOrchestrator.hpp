#ifndef ENHANCEMENT_ORCHESTRATOR_HPP
#define ENHANCEMENT_ORCHESTRATOR_HPP

#include "CancellableOperations.hpp"
#include "ProviderRegistry.hpp"
#include "Settings.hpp"
#include "TaskDispatch.hpp"
#include "Types.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace spdlog { class logger; }

struct ProviderViewState {
    bool availability_known{false};
    bool available{false};
    bool checking_availability{false};
    bool loading_models{false};
    bool loading_image_models{false};
    bool testing_connection{false};
    std::vector<RemoteAIModel> models;
    std::vector<RemoteAIModel> image_models;
    std::string error;
    std::string image_error;
    std::string connection_status;
};

struct EnhancementSnapshot {
    bool enabled{false};
    ProviderKind active_provider{ProviderKind::Ollama};
    bool has_credential{false};
    std::string selected_text_model;
    std::string selected_image_model;
    ProviderViewState provider;
    std::string last_enhancement_error;
};

struct EnhancementOutcome {
    std::string text;
    bool enhanced{false};
    std::string error;
};

/**
 * @brief Per-provider state machine for availability, credentials and model catalogs.
 *
 * Intents must be issued on the owner thread. Network work runs on the
 * background executor; results are applied through the owner executor, and a
 * result whose operation was superseded or cancelled is dropped. Both
 * executors must outlive the orchestrator.
 */
class EnhancementOrchestrator {
public:
    using StateObserver = std::function<void(const EnhancementSnapshot&)>;

    EnhancementOrchestrator(Settings& settings,
                            ProviderRegistry registry,
                            IExecutor& background,
                            IExecutor& owner);
    ~EnhancementOrchestrator();

    EnhancementOrchestrator(const EnhancementOrchestrator&) = delete;
    EnhancementOrchestrator& operator=(const EnhancementOrchestrator&) = delete;

    void activate();
    void set_enabled(bool enabled);
    void set_active_provider(ProviderKind kind);
    void set_credential(ProviderKind kind, const std::string& api_key);
    void load_models();
    void load_image_models();
    void test_connection();

    void set_selected_text_model(const std::string& model_id);
    void set_selected_image_model(const std::string& model_id);
    void set_temperature(double value);
    void set_prompt(const std::string& prompt);
    void set_image_prompt(const std::string& prompt);
    void reset_prompt_to_default();
    void reset_image_prompt_to_default();

    /**
     * @brief Runs the active provider synchronously on the calling thread.
     *
     * Returns the input unchanged when enhancement is disabled or the text is
     * too short. Provider failures are logged and recorded; the original text
     * is returned so dictation never loses content.
     */
    EnhancementOutcome enhance_transcript(const std::string& text,
                                          const std::optional<std::string>& context,
                                          const ProgressCallback& on_progress = {});

    /**
     * @brief Describes a screenshot with the active provider's image model. Throws ProviderError.
     */
    std::string analyze_screenshot(const std::vector<unsigned char>& image_data,
                                   const ProgressCallback& on_progress = {});

    EnhancementSnapshot snapshot() const;
    ProviderViewState provider_state(ProviderKind kind) const;
    void set_state_observer(StateObserver observer);
    bool is_busy() const;

private:
    enum class Operation {
        Availability,
        TextCatalog,
        ImageCatalog,
        Connection
    };

    template <typename Result>
    void run_async(ProviderKind kind,
                   Operation operation,
                   std::function<Result()> work,
                   std::function<void(Result)> on_success,
                   std::function<void(const std::string&)> on_failure);

    static std::string slot_key(ProviderKind kind, Operation operation);
    static std::string scoped_message(ProviderKind kind, const std::string& message);

    void cancel_provider_operations(ProviderKind kind);
    void apply_text_catalog(ProviderKind kind, std::vector<RemoteAIModel> models);
    void apply_image_catalog(ProviderKind kind, std::vector<RemoteAIModel> models);
    void update_state(ProviderKind kind, const std::function<void(ProviderViewState&)>& mutate);
    void persist();
    void notify();

    Settings& settings_;
    ProviderRegistry registry_;
    IExecutor& background_;
    IExecutor& owner_;
    OperationSlots slots_;

    mutable std::mutex mutex_;
    std::map<ProviderKind, ProviderViewState> states_;
    std::string last_enhancement_error_;
    StateObserver observer_;

    std::shared_ptr<int> lifetime_;
    std::shared_ptr<spdlog::logger> logger_;
};

#endif // ENHANCEMENT_ORCHESTRATOR_HPP
