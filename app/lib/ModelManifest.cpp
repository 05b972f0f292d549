#include "ModelManifest.hpp"
#include "EnhancementErrors.hpp"
#include "Logger.hpp"
#include "ResponseNormalizer.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace {

constexpr const char* kWhisperBaseUrl = "https://huggingface.co/ggerganov/whisper.cpp/resolve/main/ggml-";

std::string string_field(const Json::Value& object, const char* key)
{
    const Json::Value& value = object[key];
    return value.isString() ? value.asString() : std::string();
}

std::uint64_t size_field(const Json::Value& object)
{
    const Json::Value& value = object["size"];
    return value.isUInt64() ? value.asUInt64() : 0;
}

ManifestEntry whisper_entry(const std::string& name, std::uint64_t size_bytes)
{
    return ManifestEntry{name, std::string(kWhisperBaseUrl) + name + ".bin", size_bytes};
}

}


ModelManifest ModelManifest::builtin()
{
    ModelManifest manifest;
    manifest.add(whisper_entry("tiny", 77691713ULL));
    manifest.add(whisper_entry("base", 147951465ULL));
    manifest.add(whisper_entry("small", 487601967ULL));
    manifest.add(whisper_entry("medium", 1533763059ULL));
    manifest.add(whisper_entry("large-v3-turbo", 1624555275ULL));
    manifest.set_default_model("base");
    return manifest;
}


ModelManifest ModelManifest::from_json(const std::string& json)
{
    Json::Value root;
    std::string errors;
    if (!ResponseNormalizer::parse_json(json, root, &errors) || !root.isObject()) {
        throw ModelRepositoryError("Invalid model manifest: " + errors);
    }
    const Json::Value& models = root["models"];
    if (!models.isArray()) {
        throw ModelRepositoryError("Invalid model manifest: missing 'models' array");
    }

    ModelManifest manifest;
    for (const auto& item : models) {
        if (!item.isObject()) {
            continue;
        }
        ManifestEntry entry;
        entry.name = string_field(item, "name");
        entry.url = string_field(item, "url");
        entry.size_bytes = size_field(item);
        if (entry.name.empty() || entry.url.empty()) {
            continue;
        }
        manifest.add(std::move(entry));
    }

    std::string default_model = string_field(root, "default");
    if (default_model.empty() && !manifest.empty()) {
        default_model = manifest.entries().front().name;
    }
    manifest.set_default_model(std::move(default_model));
    return manifest;
}


ModelManifest ModelManifest::from_file(const std::string& path)
{
    std::ifstream input(path);
    if (!input.is_open()) {
        throw ModelRepositoryError("Cannot open model manifest: " + path);
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return from_json(buffer.str());
}


ModelManifest ModelManifest::load_default()
{
    const char* path = std::getenv("DICTAFLOW_MODEL_MANIFEST");
    if (!path || path[0] == '\0') {
        return builtin();
    }
    try {
        return from_file(path);
    } catch (const ModelRepositoryError& ex) {
        if (auto logger = Logger::get_logger("model_logger")) {
            logger->error("{}; falling back to the built-in model list", ex.what());
        }
        return builtin();
    }
}


std::optional<ManifestEntry> ModelManifest::find(const std::string& name) const
{
    const auto it = std::find_if(entries_.begin(), entries_.end(),
                                 [&name](const ManifestEntry& entry) { return entry.name == name; });
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return *it;
}


std::vector<std::string> ModelManifest::names() const
{
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.name);
    }
    return result;
}


void ModelManifest::add(ManifestEntry entry)
{
    entries_.push_back(std::move(entry));
}


void ModelManifest::set_default_model(std::string name)
{
    default_model_ = std::move(name);
}
