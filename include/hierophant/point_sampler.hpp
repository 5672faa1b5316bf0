/**
 * @file point_sampler.hpp
 * @brief Seed point placement with Lloyd relaxation
 */

#pragma once

#include "hierophant/geometry.hpp"
#include "hierophant/region_partitioner.hpp"

#include <cstdint>
#include <vector>

namespace hierophant {

struct SamplerSettings {
    /// Lloyd iterations applied after the initial uniform draw
    int relaxationIterations = 3;

    /// Inward padding for the initial draw (relaxation may still move points
    /// into the margin)
    double edgeMargin = 0.0;
};

/// @throws ConfigError for negative iterations or a margin that leaves no
///         interior in a width x height rectangle
void validateSamplerSettings(const SamplerSettings& settings, double width, double height);

/// Draw count points uniformly in the rectangle, then relax them.
///
/// Initial points take x then y from SeededRandom(seed). Each iteration moves
/// every point to the vertex mean of its cell; points without a cell stay put
/// for that iteration. The result is more evenly spaced but cells are not
/// equal-area.
///
/// @throws ConfigError for non-positive sizes, negative iterations or a
///         margin that leaves no interior
[[nodiscard]] std::vector<glm::dvec2> samplePoints(int count, double width, double height,
                                                   int64_t seed,
                                                   const RegionPartitioner& partitioner,
                                                   const SamplerSettings& settings = {});

/// One Lloyd step: replace each point by its cell's vertex mean
[[nodiscard]] std::vector<glm::dvec2> relaxPoints(const std::vector<glm::dvec2>& points,
                                                  const Bounds& bounds,
                                                  const RegionPartitioner& partitioner);

}  // namespace hierophant
