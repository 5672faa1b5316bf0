/**
 * @file map_config.hpp
 * @brief Map generation settings loaded from config files
 *
 * Recognized keys:
 * ```
 * width: 1200
 * height: 800
 * territory_count: 20
 * seed: 42                   # required
 * relaxation_iterations: 3
 * edge_margin: 0
 * color_mode: terrain        # terrain | palette
 * degenerate_cells: drop     # drop | fail
 * name_attempts: 0           # 0 = default ceiling
 * ```
 */

#pragma once

#include "hierophant/config_parser.hpp"
#include "hierophant/map_generator.hpp"
#include "hierophant/territory.hpp"

#include <string>

namespace hierophant {

struct MapSettings {
    MapConfig config;
    GeneratorSettings generator;
};

/// Defaults for keys that may be omitted
inline constexpr double kDefaultMapWidth = 1200.0;
inline constexpr double kDefaultMapHeight = 800.0;
inline constexpr int kDefaultTerritoryCount = 20;

/// Build settings from a parsed document.
/// @throws ConfigError for a missing seed, unparsable numbers, unknown enum
///         tokens, or values that fail validation
[[nodiscard]] MapSettings loadMapSettings(const ConfigDocument& doc);

/// Parse and load a file.
/// @throws ConfigError if the file cannot be read or is invalid
[[nodiscard]] MapSettings loadMapSettingsFile(const std::string& path);

}  // namespace hierophant
