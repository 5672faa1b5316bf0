#include "hierophant/point_sampler.hpp"
#include "hierophant/errors.hpp"
#include "hierophant/log.hpp"
#include "hierophant/seeded_random.hpp"

#include <string>

namespace hierophant {

void validateSamplerSettings(const SamplerSettings& settings, double width, double height) {
    if (settings.relaxationIterations < 0) {
        throw ConfigError("relaxation iterations must not be negative");
    }
    const double margin = settings.edgeMargin;
    if (!(margin >= 0.0) || 2.0 * margin >= width || 2.0 * margin >= height) {
        throw ConfigError("edge margin " + std::to_string(margin) + " leaves no interior");
    }
}

std::vector<glm::dvec2> samplePoints(int count, double width, double height, int64_t seed,
                                     const RegionPartitioner& partitioner,
                                     const SamplerSettings& settings) {
    if (count <= 0) {
        throw ConfigError("samplePoints: count must be positive, got " + std::to_string(count));
    }
    if (!(width > 0.0) || !(height > 0.0)) {
        throw ConfigError("samplePoints: width and height must be positive");
    }
    validateSamplerSettings(settings, width, height);

    const double margin = settings.edgeMargin;
    SeededRandom rng(seed);
    const double spanX = width - 2.0 * margin;
    const double spanY = height - 2.0 * margin;

    std::vector<glm::dvec2> points;
    points.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        double x = margin + rng.next() * spanX;
        double y = margin + rng.next() * spanY;
        points.emplace_back(x, y);
    }

    const Bounds bounds = Bounds::fromSize(width, height);
    for (int iter = 0; iter < settings.relaxationIterations; ++iter) {
        points = relaxPoints(points, bounds, partitioner);
    }
    return points;
}

std::vector<glm::dvec2> relaxPoints(const std::vector<glm::dvec2>& points,
                                    const Bounds& bounds,
                                    const RegionPartitioner& partitioner) {
    CellList cells = partitioner.partition(points, bounds);

    std::vector<glm::dvec2> relaxed;
    relaxed.reserve(points.size());
    size_t kept = 0;
    for (size_t i = 0; i < points.size(); ++i) {
        if (i < cells.size() && cells[i] && !cells[i]->empty()) {
            relaxed.push_back(vertexCentroid(*cells[i]));
        } else {
            relaxed.push_back(points[i]);
            ++kept;
        }
    }

    if (kept > 0) {
        Logger("PointSampler").debug(std::to_string(kept) +
                                     " point(s) without a cell kept in place");
    }
    return relaxed;
}

}  // namespace hierophant
