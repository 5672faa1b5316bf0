#include "hierophant/geometry.hpp"
#include "hierophant/errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace hierophant {

double signedArea(const Polygon& polygon) {
    double sum = 0.0;
    const size_t n = polygon.size();
    for (size_t i = 0; i < n; ++i) {
        const glm::dvec2& a = polygon[i];
        const glm::dvec2& b = polygon[(i + 1) % n];
        sum += a.x * b.y;
        sum -= b.x * a.y;
    }
    return sum / 2.0;
}

double polygonArea(const Polygon& polygon) {
    if (polygon.size() < 3) {
        throw GeometryError("polygonArea: polygon has " + std::to_string(polygon.size()) +
                            " vertices, need at least 3");
    }
    return std::abs(signedArea(polygon));
}

glm::dvec2 vertexCentroid(const Polygon& polygon) {
    glm::dvec2 sum{0.0};
    if (polygon.empty()) return sum;
    for (const auto& v : polygon) {
        sum += v;
    }
    return sum / static_cast<double>(polygon.size());
}

AreaStats summarizeAreas(const std::vector<double>& areas) {
    AreaStats stats;
    if (areas.empty()) return stats;

    stats.count = areas.size();
    stats.min = areas.front();
    stats.max = areas.front();
    for (double a : areas) {
        stats.total += a;
        stats.min = std::min(stats.min, a);
        stats.max = std::max(stats.max, a);
    }
    stats.mean = stats.total / static_cast<double>(stats.count);
    return stats;
}

}  // namespace hierophant
