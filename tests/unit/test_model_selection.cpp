#include <catch2/catch_test_macros.hpp>

#include "ModelSelection.hpp"

namespace {

RemoteAIModel model(const std::string& id, const std::string& display_name = {}) {
    RemoteAIModel entry;
    entry.id = id;
    entry.display_name = display_name.empty() ? id : display_name;
    return entry;
}

}

TEST_CASE("Reconciliation keeps a selection that is still offered") {
    const std::vector<RemoteAIModel> catalog = {model("a"), model("gemma3"), model("b")};
    CHECK(ModelSelection::reconcile_selection("b", catalog, "gemma3") == "b");
}

TEST_CASE("Reconciliation falls back to the flagship, then the first entry") {
    const std::vector<RemoteAIModel> with_flagship = {model("a"), model("gemma3")};
    CHECK(ModelSelection::reconcile_selection("gone", with_flagship, "gemma3") == "gemma3");
    CHECK(ModelSelection::reconcile_selection("", with_flagship, "gemma3") == "gemma3");

    const std::vector<RemoteAIModel> without_flagship = {model("mistral"), model("qwen")};
    CHECK(ModelSelection::reconcile_selection("gone", without_flagship, "gemma3") == "mistral");
}

TEST_CASE("Flagship matching is exact") {
    const std::vector<RemoteAIModel> catalog = {model("llama3"), model("gemma3:12b")};
    CHECK(ModelSelection::reconcile_selection("", catalog, "gemma3") == "llama3");
}

TEST_CASE("An empty catalog leaves the selection untouched") {
    CHECK(ModelSelection::reconcile_selection("kept", {}, "gemma3") == "kept");
}

TEST_CASE("Flagships per provider") {
    CHECK(ModelSelection::flagship_text_model(ProviderKind::Ollama) == "gemma3");
    CHECK(ModelSelection::flagship_text_model(ProviderKind::LMStudio) == "gemma3");
    CHECK(ModelSelection::flagship_text_model(ProviderKind::Groq) == "llama-3.3-70b-versatile");
    CHECK(ModelSelection::flagship_text_model(ProviderKind::Gemini) == "models/gemini-2.0-flash");
    CHECK(ModelSelection::flagship_image_model(ProviderKind::Groq) ==
          "meta-llama/llama-4-maverick-17b-128e-instruct");
}

TEST_CASE("Vision filter matches id or display name case-insensitively and keeps order") {
    const std::vector<RemoteAIModel> catalog = {
        model("zeta-VL-7b"),
        model("mistral"),
        model("custom-1", "Custom Vision Model"),
        model("llava:13b"),
        model("meta-llama/llama-4-scout"),
        model("llama3.1"),
        model("MiniCPM-V"),
        model("moondream2"),
        model("models/gemini-1.5-pro")
    };

    const auto vision = ModelSelection::filter_vision_models(catalog);
    REQUIRE(vision.size() == 7);
    CHECK(vision[0].id == "zeta-VL-7b");
    CHECK(vision[1].id == "custom-1");
    CHECK(vision[2].id == "llava:13b");
    CHECK(vision[3].id == "meta-llama/llama-4-scout");
    CHECK(vision[4].id == "MiniCPM-V");
    CHECK(vision[5].id == "moondream2");
    CHECK(vision[6].id == "models/gemini-1.5-pro");
}
