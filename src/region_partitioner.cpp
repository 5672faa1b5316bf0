/**
 * @file region_partitioner.cpp
 * @brief Half-plane clipping Voronoi partitioner
 *
 * For n sites the worst case is O(n^2) clip operations; the radius cutoff
 * makes typical maps close to O(n log n) after the per-site sort.
 */

#include "hierophant/region_partitioner.hpp"

#include <algorithm>
#include <cmath>

namespace hierophant {

HalfPlanePartitioner::HalfPlanePartitioner(double epsilon)
    : epsilon_(epsilon) {
}

CellList HalfPlanePartitioner::partition(const std::vector<glm::dvec2>& points,
                                         const Bounds& bounds) const {
    CellList cells;
    cells.reserve(points.size());
    for (size_t i = 0; i < points.size(); ++i) {
        cells.push_back(cellFor(points, i, bounds));
    }
    return cells;
}

std::optional<Polygon> HalfPlanePartitioner::cellFor(const std::vector<glm::dvec2>& points,
                                                     size_t index,
                                                     const Bounds& bounds) const {
    if (index >= points.size() || bounds.empty()) {
        return std::nullopt;
    }

    const glm::dvec2 site = points[index];
    if (!std::isfinite(site.x) || !std::isfinite(site.y) || !bounds.contains(site)) {
        return std::nullopt;
    }

    // A repeated site has no cell of its own; the first occurrence keeps it
    for (size_t j = 0; j < index; ++j) {
        if (points[j] == site) {
            return std::nullopt;
        }
    }

    std::vector<size_t> order;
    order.reserve(points.size());
    for (size_t j = 0; j < points.size(); ++j) {
        if (j != index && points[j] != site) {
            order.push_back(j);
        }
    }

    std::vector<double> dist2(points.size(), 0.0);
    for (size_t j : order) {
        glm::dvec2 d = points[j] - site;
        dist2[j] = glm::dot(d, d);
    }
    std::stable_sort(order.begin(), order.end(),
                     [&dist2](size_t a, size_t b) { return dist2[a] < dist2[b]; });

    const double lengthTolerance = epsilon_ * std::max(bounds.width(), bounds.height());
    const double areaTolerance = epsilon_ * bounds.area();

    Polygon cell = bounds.toPolygon();
    double radius2 = 0.0;
    for (const auto& v : cell) {
        glm::dvec2 d = v - site;
        radius2 = std::max(radius2, glm::dot(d, d));
    }

    for (size_t j : order) {
        // Bisector lies at half the site distance: unreachable past 2 * radius
        if (dist2[j] > 4.0 * radius2) {
            break;
        }

        cell = clipToBisector(cell, site, points[j], lengthTolerance);
        removeDuplicateVertices(cell, lengthTolerance);
        if (cell.size() < 3) {
            return std::nullopt;
        }

        radius2 = 0.0;
        for (const auto& v : cell) {
            glm::dvec2 d = v - site;
            radius2 = std::max(radius2, glm::dot(d, d));
        }
    }

    if (cell.size() < 3 || std::abs(signedArea(cell)) <= areaTolerance) {
        return std::nullopt;
    }
    return cell;
}

Polygon HalfPlanePartitioner::clipToBisector(const Polygon& cell, const glm::dvec2& site,
                                             const glm::dvec2& other, double tolerance) {
    // Inside when (p - mid) . (other - site) <= 0
    const glm::dvec2 normal = other - site;
    const glm::dvec2 mid = (site + other) * 0.5;
    const double scale = std::sqrt(glm::dot(normal, normal));

    auto side = [&](const glm::dvec2& p) {
        return glm::dot(p - mid, normal) / scale;
    };

    Polygon out;
    out.reserve(cell.size() + 1);

    const size_t n = cell.size();
    for (size_t i = 0; i < n; ++i) {
        const glm::dvec2& cur = cell[i];
        const glm::dvec2& nxt = cell[(i + 1) % n];
        double dc = side(cur);
        double dn = side(nxt);
        bool curIn = dc <= tolerance;
        bool nxtIn = dn <= tolerance;

        if (curIn) {
            out.push_back(cur);
        }
        if (curIn != nxtIn) {
            double t = dc / (dc - dn);
            out.push_back(cur + (nxt - cur) * t);
        }
    }
    return out;
}

void HalfPlanePartitioner::removeDuplicateVertices(Polygon& cell, double tolerance) {
    if (cell.empty()) return;

    Polygon cleaned;
    cleaned.reserve(cell.size());
    for (const auto& v : cell) {
        if (cleaned.empty() || glm::length(v - cleaned.back()) > tolerance) {
            cleaned.push_back(v);
        }
    }
    while (cleaned.size() > 1 && glm::length(cleaned.front() - cleaned.back()) <= tolerance) {
        cleaned.pop_back();
    }
    cell = std::move(cleaned);
}

}  // namespace hierophant
