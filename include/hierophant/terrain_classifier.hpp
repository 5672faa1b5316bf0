/**
 * @file terrain_classifier.hpp
 * @brief Position-based terrain classification
 *
 * Terrain depends only on where the point sits in the rectangle and one
 * random draw. Rules are checked in a fixed order and the first match wins:
 *
 *   1. edge < 0.15                 and r < 0.6  -> mountains
 *   2. edge < 0.20 and center < 0.70 and r < 0.7 -> coastal
 *   3. edge < 0.30                 and r < 0.5  -> hills
 *   4. center < 0.50               and r < 0.6  -> plains
 *   5.                                 r < 0.25 -> forest
 *   6. center > 0.60               and r < 0.3  -> desert
 *   7. otherwise                                -> plains
 */

#pragma once

#include "hierophant/terrain.hpp"

#include <glm/glm.hpp>

#include <array>
#include <cstdint>

namespace hierophant {

struct PositionMetrics {
    /// Distance from the rectangle center over the half-diagonal, [0, 1]
    double normalizedCenterDist = 0.0;
    /// Distance to the nearest edge over min(width, height), [0, 0.5]
    double normalizedEdgeDist = 0.0;
};

/// One entry of the ordered rule chain
struct TerrainRule {
    Terrain terrain;
    bool (*matches)(const PositionMetrics& metrics, double r);
};

/// Rules 1-6 in evaluation order (rule 7 is the plains fallback)
[[nodiscard]] const std::array<TerrainRule, 6>& terrainRules();

[[nodiscard]] PositionMetrics measurePosition(const glm::dvec2& point, double width, double height);

/// Apply the rule chain to precomputed metrics and a draw r in [0, 1)
[[nodiscard]] Terrain classifyTerrain(const PositionMetrics& metrics, double r);

/// Classify with r taken as the first draw of SeededRandom(seed)
[[nodiscard]] Terrain classifyTerrain(const glm::dvec2& point, double width, double height,
                                      int64_t seed);

}  // namespace hierophant
