/**
 * @file geometry.hpp
 * @brief Points, polygons, bounds and area math
 */

#pragma once

#include <glm/glm.hpp>

#include <cstddef>
#include <vector>

namespace hierophant {

/// Polygon as an ordered vertex ring without a duplicated closing vertex
using Polygon = std::vector<glm::dvec2>;

// ============================================================================
// Bounds
// ============================================================================

/// Axis-aligned rectangle [minX, maxX] x [minY, maxY]
struct Bounds {
    double minX = 0.0;
    double minY = 0.0;
    double maxX = 0.0;
    double maxY = 0.0;

    [[nodiscard]] static Bounds fromSize(double width, double height) {
        return {0.0, 0.0, width, height};
    }

    [[nodiscard]] double width() const { return maxX - minX; }
    [[nodiscard]] double height() const { return maxY - minY; }
    [[nodiscard]] double area() const { return width() * height(); }
    [[nodiscard]] bool empty() const { return width() <= 0.0 || height() <= 0.0; }

    [[nodiscard]] bool contains(const glm::dvec2& p) const {
        return p.x >= minX && p.x <= maxX && p.y >= minY && p.y <= maxY;
    }

    /// Corners in counter-clockwise order (y axis pointing up)
    [[nodiscard]] Polygon toPolygon() const {
        return {{minX, minY}, {maxX, minY}, {maxX, maxY}, {minX, maxY}};
    }
};

// ============================================================================
// Polygon math
// ============================================================================

/// Shoelace sum / 2 over consecutive vertices, wrapping last to first.
/// Positive for counter-clockwise rings in y-up coordinates.
[[nodiscard]] double signedArea(const Polygon& polygon);

/// Absolute shoelace area.
/// @throws GeometryError if the polygon has fewer than three vertices
[[nodiscard]] double polygonArea(const Polygon& polygon);

/// Mean of the vertices (not the area centroid). Empty polygon gives (0, 0).
[[nodiscard]] glm::dvec2 vertexCentroid(const Polygon& polygon);

// ============================================================================
// Area statistics
// ============================================================================

struct AreaStats {
    size_t count = 0;
    double total = 0.0;
    double mean = 0.0;
    double min = 0.0;
    double max = 0.0;
};

/// Count, total, mean and extremes of a set of areas (all zero when empty)
[[nodiscard]] AreaStats summarizeAreas(const std::vector<double>& areas);

}  // namespace hierophant
