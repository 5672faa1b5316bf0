#include "hierophant/map_config.hpp"
#include "hierophant/errors.hpp"

#include <cstdint>
#include <string_view>

namespace hierophant {

namespace {

std::string where(const ConfigEntry& entry) {
    return "'" + entry.key + "' (line " + std::to_string(entry.line) + ")";
}

double requireDouble(const ConfigDocument& doc, std::string_view key, double defaultVal) {
    const ConfigEntry* entry = doc.get(key);
    if (!entry) return defaultVal;
    auto v = entry->value.toDouble();
    if (!v) {
        throw ConfigError("expected a number for " + where(*entry) + ", got '" +
                          std::string(entry->value.asString()) + "'");
    }
    return *v;
}

int64_t requireInt64(const ConfigDocument& doc, std::string_view key, int64_t defaultVal) {
    const ConfigEntry* entry = doc.get(key);
    if (!entry) return defaultVal;
    auto v = entry->value.toInt64();
    if (!v) {
        throw ConfigError("expected an integer for " + where(*entry) + ", got '" +
                          std::string(entry->value.asString()) + "'");
    }
    return *v;
}

int requireInt(const ConfigDocument& doc, std::string_view key, int defaultVal) {
    int64_t v = requireInt64(doc, key, defaultVal);
    if (v < INT32_MIN || v > INT32_MAX) {
        throw ConfigError("value for '" + std::string(key) + "' is out of range");
    }
    return static_cast<int>(v);
}

}  // namespace

MapSettings loadMapSettings(const ConfigDocument& doc) {
    MapSettings settings;
    MapConfig& config = settings.config;
    GeneratorSettings& gen = settings.generator;

    config.width = requireDouble(doc, "width", kDefaultMapWidth);
    config.height = requireDouble(doc, "height", kDefaultMapHeight);
    config.territoryCount = requireInt(doc, "territory_count", kDefaultTerritoryCount);

    if (!doc.has("seed")) {
        throw ConfigError("missing required key 'seed'");
    }
    config.seed = requireInt64(doc, "seed", 0);

    gen.sampler.relaxationIterations =
        requireInt(doc, "relaxation_iterations", gen.sampler.relaxationIterations);
    gen.sampler.edgeMargin = requireDouble(doc, "edge_margin", gen.sampler.edgeMargin);

    std::string_view colorMode = doc.getString("color_mode", "terrain");
    if (colorMode == "terrain") {
        gen.colorMode = ColorMode::Terrain;
    } else if (colorMode == "palette") {
        gen.colorMode = ColorMode::Palette;
    } else {
        throw ConfigError("unknown color_mode '" + std::string(colorMode) +
                          "', expected terrain or palette");
    }

    std::string_view degenerate = doc.getString("degenerate_cells", "drop");
    if (degenerate == "drop") {
        gen.degenerateCells = DegenerateCellPolicy::Drop;
    } else if (degenerate == "fail") {
        gen.degenerateCells = DegenerateCellPolicy::Fail;
    } else {
        throw ConfigError("unknown degenerate_cells '" + std::string(degenerate) +
                          "', expected drop or fail");
    }

    int64_t attempts = requireInt64(doc, "name_attempts", 0);
    if (attempts < 0) {
        throw ConfigError("name_attempts must not be negative");
    }
    gen.nameAttempts = static_cast<size_t>(attempts);

    validateMapConfig(config);
    validateSamplerSettings(gen.sampler, config.width, config.height);
    return settings;
}

MapSettings loadMapSettingsFile(const std::string& path) {
    ConfigParser parser;
    auto doc = parser.parseFile(path);
    if (!doc) {
        throw ConfigError("cannot read map config: " + path);
    }
    return loadMapSettings(*doc);
}

}  // namespace hierophant
