/**
 * @file region_partitioner.hpp
 * @brief Rectangle-bounded Voronoi partition of a point set
 *
 * The generator only depends on the RegionPartitioner interface: given
 * points and a bound, return each point's Voronoi cell clipped to the bound,
 * or nullopt when no cell exists for that point.
 */

#pragma once

#include "hierophant/geometry.hpp"

#include <optional>
#include <vector>

namespace hierophant {

/// One entry per input point, in input order
using CellList = std::vector<std::optional<Polygon>>;

/// Abstract clipped-Voronoi partitioner
class RegionPartitioner {
public:
    virtual ~RegionPartitioner() = default;

    /// Compute the clipped cell of every point.
    /// Returned polygons have no duplicated closing vertex.
    [[nodiscard]] virtual CellList partition(const std::vector<glm::dvec2>& points,
                                             const Bounds& bounds) const = 0;
};

/// Voronoi cells by successive half-plane clipping.
///
/// Each cell starts as the bound rectangle (counter-clockwise) and is clipped
/// by the perpendicular bisector against every other site, nearest first.
/// Clipping stops once the next site is farther than twice the distance from
/// the site to the farthest cell vertex, since no later bisector can reach
/// the cell. Winding stays counter-clockwise throughout.
///
/// Points that repeat an earlier point, lie outside the bound, or whose cell
/// collapses to fewer than three vertices get nullopt.
class HalfPlanePartitioner : public RegionPartitioner {
public:
    /// @param epsilon Relative tolerance. Lengths are compared against
    ///        epsilon * max(width, height) and areas against epsilon * area
    ///        of the bound, so the partition behaves the same at any scale.
    explicit HalfPlanePartitioner(double epsilon = 1e-9);

    [[nodiscard]] CellList partition(const std::vector<glm::dvec2>& points,
                                     const Bounds& bounds) const override;

    /// Cell of points[index] against all other points
    [[nodiscard]] std::optional<Polygon> cellFor(const std::vector<glm::dvec2>& points,
                                                 size_t index,
                                                 const Bounds& bounds) const;

private:
    double epsilon_;

    /// Keep the side of the bisector between site and other that holds site
    [[nodiscard]] static Polygon clipToBisector(const Polygon& cell, const glm::dvec2& site,
                                                const glm::dvec2& other, double tolerance);

    /// Drop consecutive vertices closer than tolerance (including last/first)
    static void removeDuplicateVertices(Polygon& cell, double tolerance);
};

}  // namespace hierophant
