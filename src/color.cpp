#include "hierophant/color.hpp"
#include "hierophant/seeded_random.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace hierophant {

namespace {

constexpr double kGoldenRatio = 0.618033988749895;

}  // namespace

std::string hslToHex(double h, double s, double l) {
    l /= 100.0;
    const double a = s * std::min(l, 1.0 - l) / 100.0;

    auto channel = [&](double n) {
        double k = std::fmod(n + h / 30.0, 12.0);
        double c = l - a * std::max(std::min({k - 3.0, 9.0 - k, 1.0}), -1.0);
        auto v = static_cast<int>(std::floor(255.0 * c + 0.5));
        return std::clamp(v, 0, 255);
    };

    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", channel(0.0), channel(8.0), channel(4.0));
    return buf;
}

Hsl terrainHsl(Terrain terrain, int index, int64_t seed) {
    const auto i = static_cast<int64_t>(index);
    seed = SeededRandom::reduceSeed(seed);
    switch (terrain) {
        case Terrain::Plains:
            return {80.0 + (i * 15) % 40, 45.0 + seed % 15, 50.0 + (i * 5) % 15};
        case Terrain::Forest:
            return {120.0 + (i * 10) % 30, 50.0 + seed % 20, 40.0 + (i * 5) % 15};
        case Terrain::Mountains:
            return {0.0, 5.0 + seed % 10, 45.0 + (i * 10) % 25};
        case Terrain::Desert:
            return {40.0 + (i * 10) % 30, 55.0 + seed % 15, 55.0 + (i * 5) % 15};
        case Terrain::Hills:
            return {25.0 + (i * 15) % 35, 40.0 + seed % 20, 45.0 + (i * 5) % 15};
        case Terrain::Coastal:
            return {200.0 + (i * 10) % 40, 50.0 + seed % 20, 50.0 + (i * 5) % 15};
    }
    return {static_cast<double>((i * 50) % 360), 50.0, 50.0};
}

std::string terrainColor(Terrain terrain, int index, int64_t seed) {
    const Hsl c = terrainHsl(terrain, index, seed);
    return hslToHex(c.h, c.s, c.l);
}

std::string paletteColor(int index, int64_t seed) {
    seed = SeededRandom::reduceSeed(seed);
    const double hue = std::fmod(index * kGoldenRatio + static_cast<double>(seed) * 0.1, 1.0) * 360.0;
    const double saturation = 50.0 + static_cast<double>(seed % 20);
    const double lightness = 45.0 + static_cast<double>((static_cast<int64_t>(index) * 7 + seed) % 20);
    return hslToHex(hue, saturation, lightness);
}

std::vector<std::string> generatePalette(size_t count, int64_t seed) {
    std::vector<std::string> colors;
    colors.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        colors.push_back(paletteColor(static_cast<int>(i), seed));
    }
    return colors;
}

}  // namespace hierophant
