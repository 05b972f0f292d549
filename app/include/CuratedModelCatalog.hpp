#pragma once

#include "Types.hpp"

#include <string>
#include <vector>

/**
 * @brief Hand-picked subset of the speech model catalog with user-facing ratings.
 *
 * JSON layout is an array of
 * {"displayName", "internalName", "size", "accuracyStars", "speedStars", "storageSize"}.
 */
class CuratedModelCatalog {
public:
    static CuratedModelCatalog builtin();
    /**
     * @throws ModelRepositoryError when @p json is not a curated model array.
     */
    static CuratedModelCatalog from_json(const std::string& json);
    /**
     * @brief Reads DICTAFLOW_CURATED_MODELS when set; falls back to builtin() on any error.
     */
    static CuratedModelCatalog load_default();

    const std::vector<CuratedModelInfo>& entries() const { return entries_; }

    /**
     * @brief Copies the entries with is_downloaded joined from @p available by internal name.
     */
    std::vector<CuratedModelInfo> resolve(const std::vector<ModelInfo>& available) const;

private:
    std::vector<CuratedModelInfo> entries_;
};
