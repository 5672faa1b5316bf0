#include "hierophant/terrain_classifier.hpp"
#include "hierophant/seeded_random.hpp"

#include <algorithm>
#include <cmath>

namespace hierophant {

namespace {

const std::array<TerrainRule, 6> kRules = {{
    {Terrain::Mountains, [](const PositionMetrics& m, double r) {
        return m.normalizedEdgeDist < 0.15 && r < 0.6;
    }},
    {Terrain::Coastal, [](const PositionMetrics& m, double r) {
        return m.normalizedEdgeDist < 0.2 && m.normalizedCenterDist < 0.7 && r < 0.7;
    }},
    {Terrain::Hills, [](const PositionMetrics& m, double r) {
        return m.normalizedEdgeDist < 0.3 && r < 0.5;
    }},
    {Terrain::Plains, [](const PositionMetrics& m, double r) {
        return m.normalizedCenterDist < 0.5 && r < 0.6;
    }},
    {Terrain::Forest, [](const PositionMetrics&, double r) {
        return r < 0.25;
    }},
    {Terrain::Desert, [](const PositionMetrics& m, double r) {
        return m.normalizedCenterDist > 0.6 && r < 0.3;
    }},
}};

}  // namespace

const std::array<TerrainRule, 6>& terrainRules() {
    return kRules;
}

PositionMetrics measurePosition(const glm::dvec2& point, double width, double height) {
    const double cx = width / 2.0;
    const double cy = height / 2.0;
    const double distFromCenter = std::sqrt(std::pow(point.x - cx, 2.0) + std::pow(point.y - cy, 2.0));
    const double halfDiagonal = std::sqrt(std::pow(cx, 2.0) + std::pow(cy, 2.0));

    const double distFromEdge = std::min({point.x, point.y, width - point.x, height - point.y});

    PositionMetrics m;
    m.normalizedCenterDist = distFromCenter / halfDiagonal;
    m.normalizedEdgeDist = distFromEdge / std::min(width, height);
    return m;
}

Terrain classifyTerrain(const PositionMetrics& metrics, double r) {
    for (const auto& rule : kRules) {
        if (rule.matches(metrics, r)) {
            return rule.terrain;
        }
    }
    return Terrain::Plains;
}

Terrain classifyTerrain(const glm::dvec2& point, double width, double height, int64_t seed) {
    SeededRandom rng(seed);
    return classifyTerrain(measurePosition(point, width, height), rng.next());
}

}  // namespace hierophant
