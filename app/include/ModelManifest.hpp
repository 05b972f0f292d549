#ifndef MODEL_MANIFEST_HPP
#define MODEL_MANIFEST_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct ManifestEntry {
    std::string name;
    std::string url;
    std::uint64_t size_bytes{0};
};

/**
 * @brief Downloadable speech models and the recommended default.
 *
 * JSON layout: {"default": "base", "models": [{"name": "...", "url": "...", "size": 0}]}
 */
class ModelManifest {
public:
    static ModelManifest builtin();
    static ModelManifest from_json(const std::string& json);
    static ModelManifest from_file(const std::string& path);
    /**
     * @brief Reads DICTAFLOW_MODEL_MANIFEST when set, else returns builtin().
     */
    static ModelManifest load_default();

    const std::vector<ManifestEntry>& entries() const { return entries_; }
    const std::string& default_model() const { return default_model_; }
    std::optional<ManifestEntry> find(const std::string& name) const;
    std::vector<std::string> names() const;
    bool empty() const { return entries_.empty(); }

    void add(ManifestEntry entry);
    void set_default_model(std::string name);

private:
    std::vector<ManifestEntry> entries_;
    std::string default_model_;
};

#endif // MODEL_MANIFEST_HPP
