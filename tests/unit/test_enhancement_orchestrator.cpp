#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "EnhancementErrors.hpp"
#include "EnhancementOrchestrator.hpp"
#include "TestHelpers.hpp"

#include <map>
#include <memory>
#include <stdexcept>

namespace {

class FakeProvider : public IEnhancementProvider {
public:
    explicit FakeProvider(ProviderKind kind) : kind_(kind) {}

    ProviderKind kind() const override { return kind_; }

    bool is_available(const std::string& api_key) override {
        ++availability_calls;
        if (requires_credential() && api_key.empty()) {
            return false;
        }
        return available;
    }

    bool test_connection(const std::string& api_key) override {
        ++connection_calls;
        return is_available(api_key);
    }

    std::vector<RemoteAIModel> fetch_models(const std::string& api_key) override {
        ++fetch_calls;
        last_api_key = api_key;
        if (fail_fetch) {
            throw ProviderError::unreachable("catalog offline");
        }
        if (!catalogs.empty()) {
            auto next = catalogs.front();
            if (catalogs.size() > 1) {
                catalogs.erase(catalogs.begin());
            }
            return next;
        }
        return {};
    }

    std::string enhance(const std::string& text,
                        const std::string& model_id,
                        const EnhancementOptions& options,
                        const std::string& api_key,
                        const ProgressCallback& on_progress) override {
        ++enhance_calls;
        last_text = text;
        last_model = model_id;
        last_options = options;
        last_api_key = api_key;
        if (on_progress) {
            on_progress(1.0);
        }
        if (fail_enhance) {
            throw ProviderError::bad_status(500, "internal error");
        }
        return "Enhanced: " + text;
    }

    std::string analyze_image(const std::vector<unsigned char>& image_data,
                              const std::string& model_id,
                              const std::string& prompt,
                              const std::string& system_prompt,
                              const std::string&,
                              const ProgressCallback&) override {
        last_model = model_id;
        last_image_prompt = prompt;
        last_image_system_prompt = system_prompt;
        last_image_size = image_data.size();
        return "A code editor";
    }

    bool available{true};
    bool fail_fetch{false};
    bool fail_enhance{false};
    std::vector<std::vector<RemoteAIModel>> catalogs;

    int availability_calls{0};
    int connection_calls{0};
    int fetch_calls{0};
    int enhance_calls{0};
    std::string last_text;
    std::string last_model;
    std::string last_api_key;
    std::string last_image_prompt;
    std::string last_image_system_prompt;
    std::size_t last_image_size{0};
    EnhancementOptions last_options;

private:
    ProviderKind kind_;
};

RemoteAIModel model(const std::string& id) {
    RemoteAIModel entry;
    entry.id = id;
    entry.display_name = id;
    return entry;
}

struct Fixture {
    Fixture() {
        ProviderRegistry registry;
        for (ProviderKind kind : all_providers()) {
            auto provider = std::make_shared<FakeProvider>(kind);
            fakes[kind] = provider;
            registry.register_provider(provider);
        }
        registry_ = std::move(registry);
    }

    FakeProvider& fake(ProviderKind kind) { return *fakes.at(kind); }

    IsolatedConfig config;
    Settings settings;
    std::map<ProviderKind, std::shared_ptr<FakeProvider>> fakes;
    ProviderRegistry registry_;
};

void drain(ManualExecutor& background, ManualExecutor& owner) {
    while (background.run_one() || owner.run_one()) {
    }
}

}

TEST_CASE("Activating an available local provider loads both catalogs") {
    Fixture fx;
    fx.fake(ProviderKind::Ollama).catalogs = {{model("mistral"), model("gemma3"), model("llava:7b")}};
    InlineExecutor executor;
    EnhancementOrchestrator orchestrator(fx.settings, fx.registry_, executor, executor);

    orchestrator.activate();

    const auto state = orchestrator.provider_state(ProviderKind::Ollama);
    CHECK(state.availability_known);
    CHECK(state.available);
    CHECK(state.error.empty());
    CHECK(state.models.size() == 3);
    REQUIRE(state.image_models.size() == 2);
    CHECK(state.image_models[0].id == "gemma3");
    CHECK(state.image_models[1].id == "llava:7b");
    CHECK(fx.settings.get_selected_text_model(ProviderKind::Ollama) == "gemma3");
    CHECK(fx.settings.get_selected_image_model(ProviderKind::Ollama) == "gemma3");
    CHECK_FALSE(orchestrator.is_busy());
}

TEST_CASE("An unavailable provider reports a scoped error and loads nothing") {
    Fixture fx;
    fx.fake(ProviderKind::Ollama).available = false;
    InlineExecutor executor;
    EnhancementOrchestrator orchestrator(fx.settings, fx.registry_, executor, executor);

    orchestrator.activate();

    const auto state = orchestrator.provider_state(ProviderKind::Ollama);
    CHECK(state.availability_known);
    CHECK_FALSE(state.available);
    CHECK(state.error == "Ollama (Local): Server is not running or not reachable");
    CHECK(fx.fake(ProviderKind::Ollama).fetch_calls == 0);
}

TEST_CASE("A remote provider without a credential asks for one") {
    Fixture fx;
    fx.settings.set_active_provider(ProviderKind::Groq);
    InlineExecutor executor;
    EnhancementOrchestrator orchestrator(fx.settings, fx.registry_, executor, executor);

    orchestrator.activate();

    const auto state = orchestrator.provider_state(ProviderKind::Groq);
    CHECK_FALSE(state.available);
    CHECK(state.error == "Groq (Remote): API key is required");
    CHECK(fx.fake(ProviderKind::Groq).fetch_calls == 0);
}

TEST_CASE("Setting a credential persists it without loading catalogs") {
    Fixture fx;
    fx.settings.set_active_provider(ProviderKind::Gemini);
    InlineExecutor executor;
    EnhancementOrchestrator orchestrator(fx.settings, fx.registry_, executor, executor);

    orchestrator.set_credential(ProviderKind::Gemini, "  AIza-key \n");

    CHECK(fx.settings.get_api_key(ProviderKind::Gemini) == "AIza-key");
    CHECK(fx.fake(ProviderKind::Gemini).fetch_calls == 0);
    CHECK(fx.fake(ProviderKind::Gemini).availability_calls == 0);
    CHECK(orchestrator.snapshot().has_credential);

    Settings reloaded;
    REQUIRE(reloaded.load());
    CHECK(reloaded.get_api_key(ProviderKind::Gemini) == "AIza-key");
}

TEST_CASE("Switching providers drops the previous provider's in-flight results") {
    Fixture fx;
    fx.fake(ProviderKind::Ollama).catalogs = {{model("gemma3")}};
    fx.fake(ProviderKind::LMStudio).catalogs = {{model("qwen2-vl"), model("phi-4")}};
    ManualExecutor background;
    ManualExecutor owner;
    EnhancementOrchestrator orchestrator(fx.settings, fx.registry_, background, owner);

    orchestrator.load_models();
    CHECK(orchestrator.provider_state(ProviderKind::Ollama).loading_models);

    orchestrator.set_active_provider(ProviderKind::LMStudio);
    CHECK_FALSE(orchestrator.provider_state(ProviderKind::Ollama).loading_models);
    drain(background, owner);

    CHECK(fx.fake(ProviderKind::Ollama).fetch_calls == 0);
    CHECK(orchestrator.provider_state(ProviderKind::Ollama).models.empty());
    CHECK(fx.settings.get_selected_text_model(ProviderKind::Ollama).empty());

    const auto lmstudio = orchestrator.provider_state(ProviderKind::LMStudio);
    CHECK(lmstudio.available);
    CHECK(lmstudio.models.size() == 2);
    REQUIRE(lmstudio.image_models.size() == 1);
    CHECK(lmstudio.image_models[0].id == "qwen2-vl");
    CHECK(fx.settings.get_active_provider() == ProviderKind::LMStudio);
    CHECK(fx.settings.get_selected_text_model(ProviderKind::LMStudio) == "qwen2-vl");
    CHECK_FALSE(orchestrator.is_busy());
}

TEST_CASE("A result that finishes after being superseded is dropped") {
    Fixture fx;
    auto& ollama = fx.fake(ProviderKind::Ollama);
    ollama.catalogs = {{model("first")}, {model("second")}};
    ManualExecutor background;
    ManualExecutor owner;
    EnhancementOrchestrator orchestrator(fx.settings, fx.registry_, background, owner);

    orchestrator.load_models();
    REQUIRE(background.run_one());
    REQUIRE(owner.pending() == 1);

    orchestrator.load_models();
    drain(background, owner);

    const auto state = orchestrator.provider_state(ProviderKind::Ollama);
    REQUIRE(state.models.size() == 1);
    CHECK(state.models[0].id == "second");
    CHECK(ollama.fetch_calls == 2);
}

TEST_CASE("A failed catalog load keeps the previous catalog") {
    Fixture fx;
    auto& ollama = fx.fake(ProviderKind::Ollama);
    ollama.catalogs = {{model("gemma3"), model("mistral")}};
    InlineExecutor executor;
    EnhancementOrchestrator orchestrator(fx.settings, fx.registry_, executor, executor);

    orchestrator.load_models();
    REQUIRE(orchestrator.provider_state(ProviderKind::Ollama).models.size() == 2);

    ollama.fail_fetch = true;
    orchestrator.load_models();

    const auto state = orchestrator.provider_state(ProviderKind::Ollama);
    CHECK(state.models.size() == 2);
    CHECK_FALSE(state.loading_models);
    CHECK(state.error == "Ollama (Local): Cannot reach server: catalog offline");
    CHECK(fx.settings.get_selected_text_model(ProviderKind::Ollama) == "gemma3");
}

TEST_CASE("A successful remote connection test chains both catalog loads") {
    Fixture fx;
    fx.settings.set_active_provider(ProviderKind::Groq);
    fx.settings.set_api_key(ProviderKind::Groq, "gsk_test");
    auto& groq = fx.fake(ProviderKind::Groq);
    groq.catalogs = {{model("llama-3.3-70b-versatile"), model("meta-llama/llama-4-maverick-17b-128e-instruct")}};
    InlineExecutor executor;
    EnhancementOrchestrator orchestrator(fx.settings, fx.registry_, executor, executor);

    orchestrator.test_connection();

    const auto state = orchestrator.provider_state(ProviderKind::Groq);
    CHECK(state.connection_status == "Connection successful");
    CHECK(groq.fetch_calls == 2);
    CHECK(groq.last_api_key == "gsk_test");
    CHECK(fx.settings.get_selected_text_model(ProviderKind::Groq) == "llama-3.3-70b-versatile");
    CHECK(fx.settings.get_selected_image_model(ProviderKind::Groq) ==
          "meta-llama/llama-4-maverick-17b-128e-instruct");
}

TEST_CASE("A failed connection test loads nothing") {
    Fixture fx;
    fx.settings.set_active_provider(ProviderKind::Groq);
    fx.settings.set_api_key(ProviderKind::Groq, "gsk_bad");
    fx.fake(ProviderKind::Groq).available = false;
    InlineExecutor executor;
    EnhancementOrchestrator orchestrator(fx.settings, fx.registry_, executor, executor);

    orchestrator.test_connection();

    CHECK(orchestrator.provider_state(ProviderKind::Groq).connection_status == "Connection failed");
    CHECK(fx.fake(ProviderKind::Groq).fetch_calls == 0);
}

TEST_CASE("Observers see every state change") {
    Fixture fx;
    fx.fake(ProviderKind::Ollama).catalogs = {{model("gemma3")}};
    InlineExecutor executor;
    EnhancementOrchestrator orchestrator(fx.settings, fx.registry_, executor, executor);

    std::vector<EnhancementSnapshot> seen;
    orchestrator.set_state_observer([&](const EnhancementSnapshot& snapshot) { seen.push_back(snapshot); });
    orchestrator.set_enabled(true);

    REQUIRE_FALSE(seen.empty());
    CHECK(seen.front().enabled);
    CHECK(seen.back().provider.models.size() == 1);
    CHECK(seen.back().selected_text_model == "gemma3");
}

TEST_CASE("Transcript enhancement") {
    Fixture fx;
    auto& ollama = fx.fake(ProviderKind::Ollama);
    InlineExecutor executor;
    EnhancementOrchestrator orchestrator(fx.settings, fx.registry_, executor, executor);

    SECTION("disabled enhancement returns the input") {
        const auto outcome = orchestrator.enhance_transcript("hello world again", std::nullopt);
        CHECK(outcome.text == "hello world again");
        CHECK_FALSE(outcome.enhanced);
        CHECK(ollama.enhance_calls == 0);
    }

    SECTION("short transcripts are skipped") {
        fx.settings.set_enhancement_enabled(true);
        const auto outcome = orchestrator.enhance_transcript("  hi.  ", std::nullopt);
        CHECK(outcome.text == "  hi.  ");
        CHECK_FALSE(outcome.enhanced);
        CHECK(ollama.enhance_calls == 0);
    }

    SECTION("the length threshold counts characters, not bytes") {
        fx.settings.set_enhancement_enabled(true);
        const auto short_outcome = orchestrator.enhance_transcript("\u4f60\u597d\u4e16\u754c", std::nullopt);
        CHECK_FALSE(short_outcome.enhanced);
        CHECK(ollama.enhance_calls == 0);

        const auto long_outcome = orchestrator.enhance_transcript("\u4eca\u5929\u5929\u6c14\u5f88\u597d", std::nullopt);
        CHECK(long_outcome.enhanced);
        CHECK(ollama.enhance_calls == 1);
    }

    SECTION("settings flow into the provider call") {
        fx.settings.set_enhancement_enabled(true);
        fx.settings.set_selected_text_model(ProviderKind::Ollama, "gemma3");
        orchestrator.set_temperature(0.7);
        orchestrator.set_prompt("Be brief.");

        double last_progress = 0.0;
        const auto outcome = orchestrator.enhance_transcript("um so the meeting is at noon", std::string("Calendar"),
                                                             [&](double value) { last_progress = value; });
        CHECK(outcome.enhanced);
        CHECK(outcome.error.empty());
        CHECK(outcome.text == "Enhanced: um so the meeting is at noon");
        CHECK(ollama.last_model == "gemma3");
        CHECK(ollama.last_options.system_prompt == "Be brief.");
        CHECK(ollama.last_options.temperature == Catch::Approx(0.7));
        REQUIRE(ollama.last_options.context.has_value());
        CHECK(*ollama.last_options.context == "Calendar");
        CHECK(last_progress == Catch::Approx(1.0));
    }

    SECTION("provider failures keep the original text") {
        fx.settings.set_enhancement_enabled(true);
        fx.settings.set_selected_text_model(ProviderKind::Ollama, "gemma3");
        ollama.fail_enhance = true;

        const auto outcome = orchestrator.enhance_transcript("keep this transcript", std::nullopt);
        CHECK(outcome.text == "keep this transcript");
        CHECK_FALSE(outcome.enhanced);
        CHECK(outcome.error == "Ollama (Local): Server returned HTTP 500: internal error");
        CHECK(orchestrator.snapshot().last_enhancement_error == outcome.error);
    }
}

TEST_CASE("Prompts can be reset to their defaults") {
    Fixture fx;
    InlineExecutor executor;
    EnhancementOrchestrator orchestrator(fx.settings, fx.registry_, executor, executor);

    orchestrator.set_prompt("custom");
    orchestrator.set_image_prompt("custom image");
    orchestrator.reset_prompt_to_default();
    orchestrator.reset_image_prompt_to_default();

    CHECK(fx.settings.get_prompt() == EnhancementOptions::default_prompt());
    CHECK(fx.settings.get_image_prompt() == EnhancementOptions::default_image_prompt());
}

TEST_CASE("Screenshot analysis uses the image model and image prompt") {
    Fixture fx;
    fx.settings.set_active_provider(ProviderKind::LMStudio);
    fx.settings.set_selected_image_model(ProviderKind::LMStudio, "qwen2-vl");
    InlineExecutor executor;
    EnhancementOrchestrator orchestrator(fx.settings, fx.registry_, executor, executor);
    orchestrator.set_image_prompt("What is on screen?");

    const std::vector<unsigned char> image = {0x89, 0x50, 0x4E, 0x47};
    CHECK(orchestrator.analyze_screenshot(image) == "A code editor");

    const auto& lmstudio = fx.fake(ProviderKind::LMStudio);
    CHECK(lmstudio.last_model == "qwen2-vl");
    CHECK(lmstudio.last_image_prompt == "What is on screen?");
    CHECK(lmstudio.last_image_system_prompt == "What is on screen?");
    CHECK(lmstudio.last_image_size == 4);
}

TEST_CASE("Results arriving after the orchestrator is gone are ignored") {
    Fixture fx;
    fx.fake(ProviderKind::Ollama).catalogs = {{model("gemma3")}};
    ManualExecutor background;
    ManualExecutor owner;
    {
        EnhancementOrchestrator orchestrator(fx.settings, fx.registry_, background, owner);
        orchestrator.load_models();
        REQUIRE(background.run_one());
    }
    CHECK(owner.run_all() == 1);
    CHECK(fx.settings.get_selected_text_model(ProviderKind::Ollama).empty());
}
