#include "CuratedModelCatalog.hpp"
#include "EnhancementErrors.hpp"
#include "EnhancementOrchestrator.hpp"
#include "LocalModelRepository.hpp"
#include "Logger.hpp"
#include "ModelLifecycleManager.hpp"
#include "ModelManifest.hpp"
#include "ProviderRegistry.hpp"
#include "Settings.hpp"
#include "TaskDispatch.hpp"

#include <QCoreApplication>
#include <QGuiApplication>
#include <QTimer>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <curl/curl.h>
#include <spdlog/fmt/fmt.h>


bool initialize_loggers()
{
    try {
        Logger::setup_loggers();
        return true;
    } catch (const std::exception &e) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("Failed to initialize loggers: {}", e.what());
        } else {
            std::fprintf(stderr, "Failed to initialize loggers: %s\n", e.what());
        }
        return false;
    }
}

namespace {

constexpr int kPollIntervalMs = 50;

void print_usage()
{
    fmt::print(
        "Usage: dictaflow <command> [arguments]\n"
        "\n"
        "Enhancement:\n"
        "  providers                      List providers and credential state\n"
        "  status                         Show the current configuration\n"
        "  use <provider>                 Activate ollama, lmstudio, groq or gemini\n"
        "  set-key <provider> <key>       Store an API key (empty string clears it)\n"
        "  enable | disable               Toggle transcript enhancement\n"
        "  test                           Test the connection to the active provider\n"
        "  models                         List text and vision models of the active provider\n"
        "  select-text-model <id>         Select the text model\n"
        "  select-image-model <id>        Select the vision model\n"
        "  enhance <text...> [--context <ctx>]\n"
        "  analyze <image-path>           Describe a screenshot\n"
        "\n"
        "Speech models:\n"
        "  speech-models                  List curated and downloadable models\n"
        "  select-speech-model <name>     Select the transcription model\n"
        "  download [name]                Download a model (default: selected)\n"
        "  delete [name]                  Delete a model (default: selected)\n"
        "  prewarm                        Load the selected model into memory\n"
        "  open-storage                   Reveal the model directory\n");
}

std::string stars(int count)
{
    return std::string(static_cast<std::size_t>(count), '*') + std::string(static_cast<std::size_t>(5 - count), '.');
}

/**
 * Runs the event loop until @p busy reports false, so queued results from the
 * background executor get applied on this thread.
 */
void run_until_idle(QCoreApplication& app, const std::function<bool()>& busy)
{
    QTimer timer;
    QObject::connect(&timer, &QTimer::timeout, &app, [&]() {
        if (!busy()) {
            timer.stop();
            app.quit();
        }
    });
    timer.start(kPollIntervalMs);
    app.exec();
}

std::optional<ProviderKind> parse_provider(const std::string& name)
{
    auto kind = provider_from_string(name);
    if (!kind) {
        fmt::print(stderr, "Unknown provider '{}'. Expected ollama, lmstudio, groq or gemini.\n", name);
    }
    return kind;
}

void print_provider_state(const EnhancementSnapshot& snapshot)
{
    const auto& state = snapshot.provider;
    fmt::print("Provider:     {}\n", provider_display_name(snapshot.active_provider));
    if (state.availability_known) {
        fmt::print("Available:    {}\n", state.available ? "yes" : "no");
    }
    if (!state.connection_status.empty()) {
        fmt::print("Connection:   {}\n", state.connection_status);
    }
    if (!state.error.empty()) {
        fmt::print("Error:        {}\n", state.error);
    }
    if (!state.image_error.empty()) {
        fmt::print("Image error:  {}\n", state.image_error);
    }
}

class CommandLine {
public:
    CommandLine(QCoreApplication& app, std::vector<std::string> args)
        : app_(app),
          args_(std::move(args)),
          owner_(&app),
          orchestrator_(settings_, ProviderRegistry::with_default_providers(), background_, owner_)
    {
        settings_.load();
    }

    int run()
    {
        const std::string& command = args_.front();
        if (command == "providers") return list_providers();
        if (command == "status") return show_status();
        if (command == "use") return use_provider();
        if (command == "set-key") return set_key();
        if (command == "enable" || command == "disable") return toggle(command == "enable");
        if (command == "test") return test_connection();
        if (command == "models") return list_models();
        if (command == "select-text-model") return select_text_model();
        if (command == "select-image-model") return select_image_model();
        if (command == "enhance") return enhance();
        if (command == "analyze") return analyze();
        if (command == "speech-models") return list_speech_models();
        if (command == "select-speech-model") return select_speech_model();
        if (command == "download") return download();
        if (command == "delete") return remove();
        if (command == "prewarm") return prewarm();
        if (command == "open-storage") return open_storage();

        fmt::print(stderr, "Unknown command '{}'\n\n", command);
        print_usage();
        return EXIT_FAILURE;
    }

private:
    bool require_args(std::size_t count, const char* usage) const
    {
        if (args_.size() < count + 1) {
            fmt::print(stderr, "Usage: dictaflow {}\n", usage);
            return false;
        }
        return true;
    }

    void wait_for_orchestrator()
    {
        run_until_idle(app_, [this]() { return orchestrator_.is_busy(); });
    }

    ModelLifecycleManager& lifecycle()
    {
        if (!lifecycle_) {
            auto repository = std::make_shared<LocalModelRepository>(
                LocalModelRepository::default_storage_location(), ModelManifest::load_default());
            lifecycle_ = std::make_unique<ModelLifecycleManager>(
                settings_, repository, CuratedModelCatalog::load_default(), background_, owner_);
            lifecycle_->start();
        }
        return *lifecycle_;
    }

    void wait_for_lifecycle()
    {
        run_until_idle(app_, [this]() { return lifecycle_ && lifecycle_->is_busy(); });
    }

    int list_providers()
    {
        const ProviderKind active = settings_.get_active_provider();
        for (ProviderKind kind : all_providers()) {
            std::string credential = "-";
            if (provider_requires_credential(kind)) {
                credential = settings_.get_api_key(kind).empty() ? "no API key" : "API key set";
            }
            fmt::print("{} {:<10} {:<20} {}\n",
                       kind == active ? '*' : ' ',
                       provider_to_string(kind),
                       provider_display_name(kind),
                       credential);
        }
        return EXIT_SUCCESS;
    }

    int show_status()
    {
        const auto snapshot = orchestrator_.snapshot();
        fmt::print("Enhancement:  {}\n", snapshot.enabled ? "enabled" : "disabled");
        fmt::print("Provider:     {}\n", provider_display_name(snapshot.active_provider));
        if (provider_requires_credential(snapshot.active_provider)) {
            fmt::print("API key:      {}\n", snapshot.has_credential ? "set" : "missing");
        }
        fmt::print("Text model:   {}\n", snapshot.selected_text_model.empty() ? "(none)" : snapshot.selected_text_model);
        fmt::print("Image model:  {}\n", snapshot.selected_image_model.empty() ? "(none)" : snapshot.selected_image_model);
        fmt::print("Temperature:  {:.2f}\n", settings_.get_temperature());
        fmt::print("Max tokens:   {}\n", settings_.get_max_tokens());
        fmt::print("Speech model: {} ({})\n", settings_.get_transcription_model(),
                   warm_status_to_string(settings_.get_transcription_warm_status()));
        fmt::print("Config file:  {}\n", settings_.get_config_path());
        return EXIT_SUCCESS;
    }

    int use_provider()
    {
        if (!require_args(1, "use <provider>")) {
            return EXIT_FAILURE;
        }
        const auto kind = parse_provider(args_[1]);
        if (!kind) {
            return EXIT_FAILURE;
        }
        orchestrator_.set_active_provider(*kind);
        wait_for_orchestrator();

        const auto snapshot = orchestrator_.snapshot();
        print_provider_state(snapshot);
        fmt::print("Models:       {} text, {} vision\n",
                   snapshot.provider.models.size(), snapshot.provider.image_models.size());
        return snapshot.provider.error.empty() ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    int set_key()
    {
        if (!require_args(2, "set-key <provider> <key>")) {
            return EXIT_FAILURE;
        }
        const auto kind = parse_provider(args_[1]);
        if (!kind) {
            return EXIT_FAILURE;
        }
        if (!provider_requires_credential(*kind)) {
            fmt::print(stderr, "{} does not use an API key\n", provider_display_name(*kind));
            return EXIT_FAILURE;
        }
        orchestrator_.set_credential(*kind, args_[2]);
        fmt::print("API key for {} {}\n", provider_display_name(*kind),
                   settings_.has_stored_api_key(*kind) ? "saved" : "cleared");
        return EXIT_SUCCESS;
    }

    int toggle(bool enabled)
    {
        orchestrator_.set_enabled(enabled);
        if (!enabled) {
            fmt::print("Enhancement disabled\n");
            return EXIT_SUCCESS;
        }
        wait_for_orchestrator();
        fmt::print("Enhancement enabled\n");
        print_provider_state(orchestrator_.snapshot());
        return EXIT_SUCCESS;
    }

    int test_connection()
    {
        orchestrator_.test_connection();
        wait_for_orchestrator();
        const auto snapshot = orchestrator_.snapshot();
        print_provider_state(snapshot);
        return snapshot.provider.connection_status == "Connection successful" ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    int list_models()
    {
        orchestrator_.activate();
        wait_for_orchestrator();

        const auto snapshot = orchestrator_.snapshot();
        if (!snapshot.provider.error.empty()) {
            print_provider_state(snapshot);
            return EXIT_FAILURE;
        }
        fmt::print("Text models ({}):\n", provider_display_name(snapshot.active_provider));
        for (const auto& model : snapshot.provider.models) {
            fmt::print("{} {:<45} {:<20} ctx {}\n",
                       model.id == snapshot.selected_text_model ? '*' : ' ',
                       model.id, model.owned_by, model.context_window_tokens);
        }
        fmt::print("Vision models:\n");
        for (const auto& model : snapshot.provider.image_models) {
            fmt::print("{} {}\n", model.id == snapshot.selected_image_model ? '*' : ' ', model.id);
        }
        if (!snapshot.provider.image_error.empty()) {
            fmt::print("  ({})\n", snapshot.provider.image_error);
        }
        return EXIT_SUCCESS;
    }

    int select_text_model()
    {
        if (!require_args(1, "select-text-model <id>")) {
            return EXIT_FAILURE;
        }
        orchestrator_.set_selected_text_model(args_[1]);
        fmt::print("Text model: {}\n", args_[1]);
        return EXIT_SUCCESS;
    }

    int select_image_model()
    {
        if (!require_args(1, "select-image-model <id>")) {
            return EXIT_FAILURE;
        }
        orchestrator_.set_selected_image_model(args_[1]);
        fmt::print("Image model: {}\n", args_[1]);
        return EXIT_SUCCESS;
    }

    int enhance()
    {
        std::string text;
        std::optional<std::string> context;
        for (std::size_t i = 1; i < args_.size(); ++i) {
            if (args_[i] == "--context" && i + 1 < args_.size()) {
                context = args_[++i];
                continue;
            }
            if (!text.empty()) {
                text += ' ';
            }
            text += args_[i];
        }
        if (text.empty()) {
            fmt::print(stderr, "Usage: dictaflow enhance <text...> [--context <ctx>]\n");
            return EXIT_FAILURE;
        }

        const auto outcome = orchestrator_.enhance_transcript(text, context);
        fmt::print("{}\n", outcome.text);
        if (!outcome.error.empty()) {
            fmt::print(stderr, "{}\n", outcome.error);
            return EXIT_FAILURE;
        }
        if (!outcome.enhanced) {
            fmt::print(stderr, "(left unchanged)\n");
        }
        return EXIT_SUCCESS;
    }

    int analyze()
    {
        if (!require_args(1, "analyze <image-path>")) {
            return EXIT_FAILURE;
        }
        std::ifstream input(args_[1], std::ios::binary);
        if (!input.is_open()) {
            fmt::print(stderr, "Cannot open {}\n", args_[1]);
            return EXIT_FAILURE;
        }
        std::vector<unsigned char> image((std::istreambuf_iterator<char>(input)),
                                         std::istreambuf_iterator<char>());
        try {
            fmt::print("{}\n", orchestrator_.analyze_screenshot(image));
            return EXIT_SUCCESS;
        } catch (const ProviderError& ex) {
            fmt::print(stderr, "{}: {}\n", provider_display_name(settings_.get_active_provider()), ex.what());
            return EXIT_FAILURE;
        }
    }

    int list_speech_models()
    {
        auto& manager = lifecycle();
        wait_for_lifecycle();

        const auto snapshot = manager.snapshot();
        if (!snapshot.fetch_error.empty()) {
            fmt::print(stderr, "{}\n", snapshot.fetch_error);
            return EXIT_FAILURE;
        }
        fmt::print("Recommended: {}\n\n", snapshot.recommended_model);
        fmt::print("Curated:\n");
        for (const auto& model : snapshot.curated_models) {
            fmt::print("{} {:<8} {:<16} accuracy {} speed {} {:>6} {}\n",
                       model.internal_name == snapshot.selected_model ? '*' : ' ',
                       model.display_name, model.internal_name,
                       stars(model.accuracy_stars), stars(model.speed_stars),
                       model.storage_size_label, model.is_downloaded ? "downloaded" : "");
        }
        fmt::print("\nAll models:\n");
        for (const auto& model : snapshot.available_models) {
            fmt::print("{} {:<24} {}\n",
                       model.name == snapshot.selected_model ? '*' : ' ',
                       model.name, model.is_downloaded ? "downloaded" : "");
        }
        return EXIT_SUCCESS;
    }

    int select_speech_model()
    {
        if (!require_args(1, "select-speech-model <name>")) {
            return EXIT_FAILURE;
        }
        auto& manager = lifecycle();
        manager.select_model(args_[1]);
        wait_for_lifecycle();
        const auto snapshot = manager.snapshot();
        fmt::print("Speech model: {} ({})\n", snapshot.selected_model, warm_status_to_string(snapshot.warm_status));
        return EXIT_SUCCESS;
    }

    int download()
    {
        auto& manager = lifecycle();
        int last_percent = -1;
        manager.set_state_observer([&last_percent](const ModelLifecycleSnapshot& snapshot) {
            if (!snapshot.downloading) {
                return;
            }
            const int percent = static_cast<int>(snapshot.download_progress * 100.0);
            if (percent != last_percent) {
                last_percent = percent;
                fmt::print(stderr, "\rDownloading {}: {:3d}%", snapshot.downloading_model, percent);
                std::fflush(stderr);
            }
        });
        if (args_.size() > 1) {
            manager.download(args_[1]);
        } else {
            manager.download_selected_model();
        }
        wait_for_lifecycle();
        manager.set_state_observer({});
        if (last_percent >= 0) {
            fmt::print(stderr, "\n");
        }

        const auto snapshot = manager.snapshot();
        if (!snapshot.download_error.empty()) {
            fmt::print(stderr, "{}\n", snapshot.download_error);
            return EXIT_FAILURE;
        }
        fmt::print("Download complete\n");
        return EXIT_SUCCESS;
    }

    int remove()
    {
        auto& manager = lifecycle();
        if (args_.size() > 1) {
            manager.delete_model(args_[1]);
        } else {
            manager.delete_selected_model();
        }
        wait_for_lifecycle();
        const auto snapshot = manager.snapshot();
        if (!snapshot.delete_error.empty()) {
            fmt::print(stderr, "{}\n", snapshot.delete_error);
            return EXIT_FAILURE;
        }
        fmt::print("Model deleted\n");
        return EXIT_SUCCESS;
    }

    int prewarm()
    {
        auto& manager = lifecycle();
        manager.prewarm_selected_model();
        wait_for_lifecycle();
        const auto snapshot = manager.snapshot();
        if (!snapshot.prewarm_error.empty()) {
            fmt::print(stderr, "{}\n", snapshot.prewarm_error);
            return EXIT_FAILURE;
        }
        fmt::print("{} is {}\n", snapshot.selected_model, warm_status_to_string(snapshot.warm_status));
        return EXIT_SUCCESS;
    }

    int open_storage()
    {
        auto& manager = lifecycle();
        wait_for_lifecycle();
        if (!manager.open_storage_location()) {
            fmt::print(stderr, "Could not open the model directory\n");
            return EXIT_FAILURE;
        }
        return EXIT_SUCCESS;
    }

    QCoreApplication& app_;
    std::vector<std::string> args_;
    Settings settings_;
    QtMainThreadDispatcher owner_;
    ThreadExecutor background_;
    EnhancementOrchestrator orchestrator_;
    std::unique_ptr<ModelLifecycleManager> lifecycle_;
};

int run_application(int argc, char** argv)
{
    QCoreApplication::setApplicationName(QStringLiteral("DictaFlow"));
    QCoreApplication::setOrganizationName(QStringLiteral("DictaFlow"));

    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty() || args.front() == "--help" || args.front() == "-h") {
        print_usage();
        return args.empty() ? EXIT_FAILURE : EXIT_SUCCESS;
    }

    // Revealing a directory needs the GUI platform plugin; everything else runs headless.
    std::unique_ptr<QCoreApplication> app;
    if (args.front() == "open-storage") {
        app = std::make_unique<QGuiApplication>(argc, argv);
    } else {
        app = std::make_unique<QCoreApplication>(argc, argv);
    }

    CommandLine command_line(*app, std::move(args));
    return command_line.run();
}

} // namespace


int main(int argc, char **argv) {
    if (!initialize_loggers()) {
        return EXIT_FAILURE;
    }
    curl_global_init(CURL_GLOBAL_DEFAULT);
    struct CurlCleanup {
        ~CurlCleanup() { curl_global_cleanup(); }
    } curl_cleanup;

    try {
        return run_application(argc, argv);
    } catch (const std::exception& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("Error: {}", ex.what());
        } else {
            std::fprintf(stderr, "Error: %s\n", ex.what());
        }
        return EXIT_FAILURE;
    }
}
