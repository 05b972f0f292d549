#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "EnhancementErrors.hpp"
#include "GeminiProvider.hpp"
#include "GroqProvider.hpp"
#include "LMStudioProvider.hpp"
#include "OllamaProvider.hpp"
#include "ProviderRegistry.hpp"
#include "ResponseNormalizer.hpp"
#include "TestHelpers.hpp"

#include <algorithm>
#include <limits>
#include <memory>
#include <vector>

namespace {

struct RecordingHook {
    std::vector<HttpRequest> requests;
    HttpResponse reply;
};

Json::Value parse_body(const HttpRequest& request) {
    Json::Value root;
    REQUIRE(ResponseNormalizer::parse_json(request.body, root));
    return root;
}

bool has_header(const HttpRequest& request, const std::string& header) {
    return std::find(request.headers.begin(), request.headers.end(), header) != request.headers.end();
}

std::string completion_reply_for(ProviderKind kind) {
    switch (kind) {
        case ProviderKind::Ollama:
            return R"({"response":"Fixed text."})";
        case ProviderKind::Gemini:
            return R"({"candidates":[{"content":{"parts":[{"text":"Fixed text."}]}}]})";
        default:
            return R"({"choices":[{"message":{"content":"Fixed text."}}]})";
    }
}

double sent_temperature(ProviderKind kind, const Json::Value& body) {
    if (kind == ProviderKind::Gemini) {
        return body["generationConfig"]["temperature"].asDouble();
    }
    return body["temperature"].asDouble();
}

std::unique_ptr<IEnhancementProvider> make_provider(ProviderKind kind) {
    switch (kind) {
        case ProviderKind::Ollama: return std::make_unique<OllamaProvider>("http://ollama.test");
        case ProviderKind::LMStudio: return std::make_unique<LMStudioProvider>("http://lmstudio.test");
        case ProviderKind::Groq: return std::make_unique<GroqProvider>("https://groq.test/v1");
        case ProviderKind::Gemini: return std::make_unique<GeminiProvider>("https://gemini.test/v1beta");
    }
    return nullptr;
}

}

TEST_CASE("Every provider clamps the temperature into [0.1, 1.0]") {
    for (ProviderKind kind : all_providers()) {
        CAPTURE(provider_to_string(kind));
        auto provider = make_provider(kind);
        std::vector<HttpRequest> requests;
        HttpHookGuard hook([&](const HttpRequest& request) {
            requests.push_back(request);
            return http_response(200, completion_reply_for(kind));
        });

        EnhancementOptions hot;
        hot.temperature = 5.0;
        CHECK(provider->enhance("some words here", "m1", hot, "key", {}) == "Fixed text.");

        EnhancementOptions cold;
        cold.temperature = -1.0;
        CHECK(provider->enhance("some words here", "m1", cold, "key", {}) == "Fixed text.");

        EnhancementOptions unset;
        unset.temperature = std::numeric_limits<double>::quiet_NaN();
        CHECK(provider->enhance("some words here", "m1", unset, "key", {}) == "Fixed text.");

        REQUIRE(requests.size() == 3);
        CHECK(sent_temperature(kind, parse_body(requests[0])) == Catch::Approx(1.0));
        CHECK(sent_temperature(kind, parse_body(requests[1])) == Catch::Approx(0.1));
        CHECK(sent_temperature(kind, parse_body(requests[2])) == Catch::Approx(0.3));
    }
}

TEST_CASE("Enhancement reports progress checkpoints in order") {
    auto provider = make_provider(ProviderKind::LMStudio);
    HttpHookGuard hook([](const HttpRequest&) {
        return http_response(200, completion_reply_for(ProviderKind::LMStudio));
    });

    std::vector<double> checkpoints;
    provider->enhance("hello world", "m1", EnhancementOptions{}, "",
                      [&](double value) { checkpoints.push_back(value); });
    REQUIRE(checkpoints.size() == 4);
    CHECK(checkpoints[0] == Catch::Approx(0.1));
    CHECK(checkpoints[1] == Catch::Approx(0.2));
    CHECK(checkpoints[2] == Catch::Approx(0.8));
    CHECK(checkpoints[3] == Catch::Approx(1.0));
}

TEST_CASE("Ollama generate request carries the prompt sections") {
    OllamaProvider provider("http://ollama.test/");
    std::vector<HttpRequest> requests;
    HttpHookGuard hook([&](const HttpRequest& request) {
        requests.push_back(request);
        return http_response(200, R"({"response":"<think>x</think> Better text "})");
    });

    EnhancementOptions options;
    options.system_prompt = "Fix it.";
    options.context = "Slack";
    options.max_tokens = 50000;
    CHECK(provider.enhance("raw text", "gemma3", options, "", {}) == "Better text");

    REQUIRE(requests.size() == 1);
    const auto& request = requests.front();
    CHECK(request.url == "http://ollama.test/api/generate");
    CHECK(request.method == HttpRequest::Method::Post);
    CHECK(request.timeout_seconds == 60);
    const auto body = parse_body(request);
    CHECK(body["model"].asString() == "gemma3");
    CHECK(body["stream"].asBool() == false);
    CHECK(body["max_tokens"].asInt() == 2000);
    CHECK(body["prompt"].asString() == "Fix it.\n\nCONTEXT:\nSlack\n\nTEXT TO IMPROVE:\nraw text\n\nIMPROVED TEXT:");
    CHECK(body.isMember("system"));
}

TEST_CASE("Ollama catalog maps tags into sorted local models") {
    OllamaProvider provider("http://ollama.test");
    HttpHookGuard hook([](const HttpRequest& request) {
        CHECK(request.url == "http://ollama.test/api/tags");
        CHECK(request.timeout_seconds == 5);
        return http_response(200, R"({"models":[{"name":"mistral"},{"name":"gemma3"},{"name":""}]})");
    });

    const auto models = provider.fetch_models("");
    REQUIRE(models.size() == 2);
    CHECK(models[0].id == "gemma3");
    CHECK(models[1].id == "mistral");
    CHECK(models[0].owned_by == "Local");
    CHECK(models[0].context_window_tokens == 8192);
    CHECK(models[0].max_completion_tokens == 4096);
}

TEST_CASE("Local availability is a plain HTTP 200 check") {
    OllamaProvider ollama("http://ollama.test");
    LMStudioProvider lmstudio("http://lmstudio.test");

    SECTION("reachable") {
        std::vector<std::string> urls;
        HttpHookGuard hook([&](const HttpRequest& request) {
            urls.push_back(request.url);
            return http_response(200, "{}");
        });
        CHECK(ollama.is_available(""));
        CHECK(lmstudio.is_available(""));
        REQUIRE(urls.size() == 2);
        CHECK(urls[0] == "http://ollama.test/api/version");
        CHECK(urls[1] == "http://lmstudio.test/api/v0/models");
    }
    SECTION("unreachable") {
        HttpHookGuard hook([](const HttpRequest&) -> HttpResponse {
            throw ProviderError::unreachable("connection refused");
        });
        CHECK_FALSE(ollama.is_available(""));
        CHECK_FALSE(lmstudio.test_connection(""));
    }
    SECTION("non-200") {
        HttpHookGuard hook([](const HttpRequest&) { return http_response(503, "busy"); });
        CHECK_FALSE(ollama.is_available(""));
    }
}

TEST_CASE("LM Studio catalog derives activity from the load state") {
    LMStudioProvider provider("http://lmstudio.test");
    HttpHookGuard hook([](const HttpRequest&) {
        return http_response(200, R"({"data":[
            {"id":"qwen2-vl","publisher":"qwen","max_context_length":32768,"state":"loaded"},
            {"id":"gemma3","state":"not-loaded"}]})");
    });

    const auto models = provider.fetch_models("");
    REQUIRE(models.size() == 2);
    CHECK(models[0].id == "gemma3");
    CHECK_FALSE(models[0].active);
    CHECK(models[0].owned_by == "Local");
    CHECK(models[0].context_window_tokens == 8192);
    CHECK(models[1].id == "qwen2-vl");
    CHECK(models[1].active);
    CHECK(models[1].owned_by == "qwen");
    CHECK(models[1].context_window_tokens == 32768);
}

TEST_CASE("Chat providers wrap the transcript in tagged user content") {
    GroqProvider provider("https://groq.test/v1");
    std::vector<HttpRequest> requests;
    HttpHookGuard hook([&](const HttpRequest& request) {
        requests.push_back(request);
        return http_response(200, completion_reply_for(ProviderKind::Groq));
    });

    EnhancementOptions options;
    options.system_prompt = "Edit.";
    options.context = "Email";
    options.max_tokens = 10;
    provider.enhance("um hello", "llama-3.3-70b-versatile", options, "gsk_test", {});

    REQUIRE(requests.size() == 1);
    const auto& request = requests.front();
    CHECK(request.url == "https://groq.test/v1/chat/completions");
    CHECK(has_header(request, "Authorization: Bearer gsk_test"));
    const auto body = parse_body(request);
    CHECK(body["max_completion_tokens"].asInt() == 100);
    CHECK(body["messages"][0]["role"].asString() == "system");
    CHECK(body["messages"][0]["content"].asString() == "Edit.");
    CHECK(body["messages"][1]["content"].asString() ==
          "<CONTEXT>Email</CONTEXT>\n\n<RAW_TRANSCRIPTION>um hello</RAW_TRANSCRIPTION>");
}

TEST_CASE("Groq catalog drops inactive, speech and audio models") {
    GroqProvider provider("https://groq.test/v1");
    HttpHookGuard hook([](const HttpRequest&) {
        return http_response(200, R"({"data":[
            {"id":"whisper-large-v3","active":true},
            {"id":"playai-tts","active":true},
            {"id":"old-model","active":false},
            {"id":"llama-3.3-70b-versatile","owned_by":"Meta","context_window":131072},
            {"id":"gemma2-9b-it","active":true}]})");
    });

    const auto models = provider.fetch_models("gsk_test");
    REQUIRE(models.size() == 2);
    CHECK(models[0].id == "gemma2-9b-it");
    CHECK(models[1].id == "llama-3.3-70b-versatile");
    CHECK(models[1].owned_by == "Meta");
    CHECK(models[1].context_window_tokens == 131072);
}

TEST_CASE("Remote providers require a credential") {
    GroqProvider groq("https://groq.test/v1");
    GeminiProvider gemini("https://gemini.test/v1beta");
    int calls = 0;
    HttpHookGuard hook([&](const HttpRequest&) {
        ++calls;
        return http_response(200, "{}");
    });

    CHECK_FALSE(groq.is_available(""));
    CHECK_FALSE(gemini.test_connection(""));
    try {
        groq.fetch_models("");
        FAIL("expected MissingCredential");
    } catch (const ProviderError& ex) {
        CHECK(ex.code() == ProviderError::Code::MissingCredential);
    }
    try {
        gemini.enhance("hello world", "models/gemini-2.0-flash", EnhancementOptions{}, "", {});
        FAIL("expected MissingCredential");
    } catch (const ProviderError& ex) {
        CHECK(ex.code() == ProviderError::Code::MissingCredential);
    }
    CHECK(calls == 0);
}

TEST_CASE("Non-200 replies surface the raw body") {
    GroqProvider provider("https://groq.test/v1");
    HttpHookGuard hook([](const HttpRequest&) {
        return http_response(401, R"({"error":{"message":"Invalid API Key"}})");
    });

    try {
        provider.fetch_models("bad");
        FAIL("expected BadStatus");
    } catch (const ProviderError& ex) {
        CHECK(ex.code() == ProviderError::Code::BadStatus);
        CHECK(ex.http_status() == 401);
        CHECK(ex.response_body() == R"({"error":{"message":"Invalid API Key"}})");
        CHECK(std::string(ex.what()).find("Invalid API Key") != std::string::npos);
    }
}

TEST_CASE("An unparsable catalog is a decode failure") {
    LMStudioProvider provider("http://lmstudio.test");
    HttpHookGuard hook([](const HttpRequest&) { return http_response(200, R"({"models":[]})"); });
    try {
        provider.fetch_models("");
        FAIL("expected DecodeFailure");
    } catch (const ProviderError& ex) {
        CHECK(ex.code() == ProviderError::Code::DecodeFailure);
    }
}

TEST_CASE("Gemini puts the key in the query and strips the models prefix") {
    GeminiProvider provider("https://gemini.test/v1beta");
    std::vector<HttpRequest> requests;
    HttpHookGuard hook([&](const HttpRequest& request) {
        requests.push_back(request);
        return http_response(200, completion_reply_for(ProviderKind::Gemini));
    });

    EnhancementOptions options;
    options.system_prompt = "Polish.";
    options.max_tokens = 99999;
    CHECK(provider.enhance("so basically", "models/gemini-2.0-flash", options, "AIza", {}) == "Fixed text.");

    REQUIRE(requests.size() == 1);
    CHECK(requests[0].url == "https://gemini.test/v1beta/models/gemini-2.0-flash:generateContent?key=AIza");
    const auto body = parse_body(requests[0]);
    CHECK(body["system_instruction"]["parts"][0]["text"].asString() == "Polish.");
    CHECK(body["contents"][0]["parts"][0]["text"].asString() == "\n\nTEXT TO IMPROVE:\nso basically");
    CHECK(body["generationConfig"]["maxOutputTokens"].asInt() == 8192);
}

TEST_CASE("Gemini catalog keeps display names and limits") {
    GeminiProvider provider("https://gemini.test/v1beta");
    HttpHookGuard hook([](const HttpRequest& request) {
        CHECK(request.url == "https://gemini.test/v1beta/models?key=AIza");
        return http_response(200, R"({"models":[
            {"name":"models/gemini-2.0-flash","displayName":"Gemini 2.0 Flash","inputTokenLimit":1048576},
            {"name":"models/embedding-001","displayName":"Embedding 001"}]})");
    });

    const auto models = provider.fetch_models("AIza");
    REQUIRE(models.size() == 2);
    CHECK(models[0].display_name == "Embedding 001");
    CHECK(models[0].context_window_tokens == 131072);
    CHECK(models[1].id == "models/gemini-2.0-flash");
    CHECK(models[1].context_window_tokens == 1048576);
    CHECK(models[1].max_completion_tokens == 8192);
    CHECK(models[1].owned_by == "Google");
}

TEST_CASE("Image analysis embeds the picture with its MIME type") {
    const std::vector<unsigned char> png = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A};
    const std::vector<unsigned char> jpeg = {0xFF, 0xD8, 0xFF, 0xE0};

    SECTION("chat style data URL") {
        LMStudioProvider provider("http://lmstudio.test");
        std::vector<HttpRequest> requests;
        HttpHookGuard hook([&](const HttpRequest& request) {
            requests.push_back(request);
            return http_response(200, completion_reply_for(ProviderKind::LMStudio));
        });
        provider.analyze_image(png, "qwen2-vl", "Describe", "System", "", {});
        REQUIRE(requests.size() == 1);
        CHECK(requests[0].timeout_seconds == 60);
        const auto body = parse_body(requests[0]);
        CHECK(body["temperature"].asDouble() == Catch::Approx(0.2));
        const auto url = body["messages"][1]["content"][1]["image_url"]["url"].asString();
        CHECK(url.rfind("data:image/png;base64,", 0) == 0);
    }
    SECTION("Gemini inline data") {
        GeminiProvider provider("https://gemini.test/v1beta");
        std::vector<HttpRequest> requests;
        HttpHookGuard hook([&](const HttpRequest& request) {
            requests.push_back(request);
            return http_response(200, completion_reply_for(ProviderKind::Gemini));
        });
        provider.analyze_image(jpeg, "models/gemini-2.0-flash", "Describe", "System", "AIza", {});
        REQUIRE(requests.size() == 1);
        const auto body = parse_body(requests[0]);
        CHECK(body["contents"][0]["parts"][0]["inline_data"]["mime_type"].asString() == "image/jpeg");
        CHECK(body["contents"][0]["parts"][0]["inline_data"]["data"].asString() == "/9j/4A==");
        CHECK(body["contents"][0]["parts"][1]["text"].asString() == "Describe");
    }
    SECTION("Ollama images array") {
        OllamaProvider provider("http://ollama.test");
        std::vector<HttpRequest> requests;
        HttpHookGuard hook([&](const HttpRequest& request) {
            requests.push_back(request);
            return http_response(200, completion_reply_for(ProviderKind::Ollama));
        });
        provider.analyze_image(jpeg, "gemma3", "Describe", "System", "", {});
        REQUIRE(requests.size() == 1);
        const auto body = parse_body(requests[0]);
        CHECK(body["images"][0].asString() == "/9j/4A==");
    }
}

TEST_CASE("Requests without a model or image are rejected before sending") {
    OllamaProvider provider("http://ollama.test");
    int calls = 0;
    HttpHookGuard hook([&](const HttpRequest&) {
        ++calls;
        return http_response(200, "{}");
    });

    try {
        provider.enhance("hello world", "", EnhancementOptions{}, "", {});
        FAIL("expected InvalidRequest");
    } catch (const ProviderError& ex) {
        CHECK(ex.code() == ProviderError::Code::InvalidRequest);
    }
    try {
        provider.analyze_image({}, "gemma3", "Describe", "System", "", {});
        FAIL("expected InvalidRequest");
    } catch (const ProviderError& ex) {
        CHECK(ex.code() == ProviderError::Code::InvalidRequest);
    }
    CHECK(calls == 0);
}

TEST_CASE("Registry honours base URL overrides") {
    EnvVarGuard ollama_url("DICTAFLOW_OLLAMA_URL", std::string("http://10.0.0.5:11434/"));
    auto registry = ProviderRegistry::with_default_providers();

    for (ProviderKind kind : all_providers()) {
        auto provider = registry.get(kind);
        REQUIRE(provider);
        CHECK(provider->kind() == kind);
    }
    auto ollama = std::dynamic_pointer_cast<OllamaProvider>(registry.get(ProviderKind::Ollama));
    REQUIRE(ollama);
    CHECK(ollama->base_url() == "http://10.0.0.5:11434");
}

TEST_CASE("Redacted URLs hide the Gemini key") {
    CHECK(HttpClient::redact_url("https://x.test/models?key=secret") == "https://x.test/models?key=***");
    CHECK(HttpClient::redact_url("https://x.test/m:gen?alt=json&key=secret") == "https://x.test/m:gen?alt=json&key=***");
}
