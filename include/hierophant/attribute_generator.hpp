/**
 * @file attribute_generator.hpp
 * @brief Resources, population, culture and development per territory
 *
 * For a territory generated at index i with map seed s, the point seed is
 * s + i. Terrain and population/culture draw from SeededRandom(s + i),
 * resources from SeededRandom(s + i + 1000).
 */

#pragma once

#include "hierophant/terrain.hpp"
#include "hierophant/territory.hpp"

#include <glm/glm.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace hierophant {

/// Offset added to the point seed for the resource generator
inline constexpr int64_t kResourceSeedOffset = 1000;

/// Assumed territory count used only to normalize population by area
inline constexpr double kPopulationAreaDivisor = 30.0;

struct IntRange {
    int min = 0;
    int max = 0;
};

struct ResourceRanges {
    IntRange food;
    IntRange gold;
    IntRange military;
};

/// Culture names indexed by the culture draw
[[nodiscard]] const std::array<std::string_view, 12>& cultureNames();

/// Per-terrain resource ranges
[[nodiscard]] ResourceRanges resourceRanges(Terrain terrain);

/// Per-terrain base population range
[[nodiscard]] IntRange basePopulationRange(Terrain terrain);

/// Food, gold and military drawn in that order from SeededRandom(seed).
/// Values outside the Terrain enumerators give 50 for all three.
[[nodiscard]] Resources rollResources(Terrain terrain, int64_t seed);

/// round(gold * 0.4 + food * 0.3 + military * 0.3)
[[nodiscard]] int developmentScore(const Resources& resources);

/// round(base * sqrt(area / (width * height / 30))), at least 1
[[nodiscard]] int64_t scalePopulation(int basePopulation, double area, double width, double height);

/// Full metadata for a territory centered at center with the given area.
/// @param pointSeed Map seed plus generation index
[[nodiscard]] TerritoryMetadata generateMetadata(const glm::dvec2& center, double width,
                                                 double height, double area, int64_t pointSeed);

}  // namespace hierophant
