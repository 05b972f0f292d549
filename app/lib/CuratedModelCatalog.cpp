#include "CuratedModelCatalog.hpp"
#include "EnhancementErrors.hpp"
#include "Logger.hpp"
#include "ResponseNormalizer.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace {

int clamp_stars(const Json::Value& value)
{
    if (!value.isNumeric()) {
        return 0;
    }
    return static_cast<int>(std::clamp(value.asDouble(), 0.0, 5.0));
}

std::string string_field(const Json::Value& object, const char* key)
{
    const Json::Value& value = object[key];
    return value.isString() ? value.asString() : std::string();
}

CuratedModelInfo make_entry(const char* display_name, const char* internal_name, const char* size,
                            int accuracy, int speed, const char* storage)
{
    CuratedModelInfo info;
    info.display_name = display_name;
    info.internal_name = internal_name;
    info.size_label = size;
    info.accuracy_stars = accuracy;
    info.speed_stars = speed;
    info.storage_size_label = storage;
    return info;
}

}


CuratedModelCatalog CuratedModelCatalog::builtin()
{
    CuratedModelCatalog catalog;
    catalog.entries_ = {
        make_entry("Small", "base", "Small", 2, 4, "100MB"),
        make_entry("Medium", "small", "Medium", 3, 3, "500MB"),
        make_entry("Large", "large-v3-turbo", "Large", 4, 2, "1GB")
    };
    return catalog;
}


CuratedModelCatalog CuratedModelCatalog::from_json(const std::string& json)
{
    Json::Value root;
    std::string errors;
    if (!ResponseNormalizer::parse_json(json, root, &errors) || !root.isArray()) {
        throw ModelRepositoryError("Invalid curated model list: " + (errors.empty() ? "expected an array" : errors));
    }

    CuratedModelCatalog catalog;
    for (const auto& item : root) {
        if (!item.isObject()) {
            continue;
        }
        CuratedModelInfo info;
        info.display_name = string_field(item, "displayName");
        info.internal_name = string_field(item, "internalName");
        info.size_label = string_field(item, "size");
        info.accuracy_stars = clamp_stars(item["accuracyStars"]);
        info.speed_stars = clamp_stars(item["speedStars"]);
        info.storage_size_label = string_field(item, "storageSize");
        if (info.internal_name.empty()) {
            continue;
        }
        if (info.display_name.empty()) {
            info.display_name = info.internal_name;
        }
        catalog.entries_.push_back(std::move(info));
    }
    return catalog;
}


CuratedModelCatalog CuratedModelCatalog::load_default()
{
    const char* path = std::getenv("DICTAFLOW_CURATED_MODELS");
    if (!path || path[0] == '\0') {
        return builtin();
    }

    auto logger = Logger::get_logger("model_logger");
    std::ifstream input(path);
    if (!input.is_open()) {
        if (logger) {
            logger->warn("Cannot open curated model list {}, using built-in list", path);
        }
        return builtin();
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    try {
        CuratedModelCatalog catalog = from_json(buffer.str());
        if (!catalog.entries_.empty()) {
            return catalog;
        }
        if (logger) {
            logger->warn("Curated model list {} is empty, using built-in list", path);
        }
    } catch (const ModelRepositoryError& ex) {
        if (logger) {
            logger->warn("{}, using built-in list", ex.what());
        }
    }
    return builtin();
}


std::vector<CuratedModelInfo> CuratedModelCatalog::resolve(const std::vector<ModelInfo>& available) const
{
    std::vector<CuratedModelInfo> result = entries_;
    for (auto& info : result) {
        const auto it = std::find_if(available.begin(), available.end(),
                                     [&info](const ModelInfo& model) { return model.name == info.internal_name; });
        info.is_downloaded = it != available.end() && it->is_downloaded;
    }
    return result;
}
