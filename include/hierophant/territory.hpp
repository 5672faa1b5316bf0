/**
 * @file territory.hpp
 * @brief Map configuration and generated territory records
 *
 * Territories are produced once per generation call and treated as
 * immutable afterwards; regenerating builds a new list.
 */

#pragma once

#include "hierophant/geometry.hpp"
#include "hierophant/terrain.hpp"

#include <cstdint>
#include <string>

namespace hierophant {

/// Input to a generation run. The seed is always explicit.
struct MapConfig {
    double width = 0.0;
    double height = 0.0;
    int territoryCount = 0;
    int64_t seed = 0;
};

/// Throws ConfigError unless width, height and territoryCount are positive
void validateMapConfig(const MapConfig& config);

struct Resources {
    int food = 0;       ///< [1, 100]
    int gold = 0;       ///< [1, 100]
    int military = 0;   ///< [1, 100]

    [[nodiscard]] bool operator==(const Resources& other) const = default;
};

struct TerritoryMetadata {
    int64_t population = 0;
    Terrain terrain = Terrain::Plains;
    Resources resources;
    std::string culture;
    int development = 0;    ///< Derived from resources, [0, 100]

    [[nodiscard]] bool operator==(const TerritoryMetadata& other) const = default;
};

struct Territory {
    std::string id;             ///< "territory-<generation index>"
    std::string name;           ///< Unique within one run
    std::string color;          ///< "#rrggbb"
    glm::dvec2 center{0.0};     ///< Relaxed seed point
    Polygon borderPoints;       ///< Partitioner winding, no closing duplicate
    double area = 0.0;
    TerritoryMetadata metadata;

    [[nodiscard]] bool operator==(const Territory& other) const = default;
};

/// Stable id for the territory generated at index
[[nodiscard]] std::string territoryId(size_t index);

}  // namespace hierophant
