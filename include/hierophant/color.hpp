/**
 * @file color.hpp
 * @brief Territory display colors
 *
 * Two modes: terrain-aware colors (hue family per terrain, varied by index
 * and map seed) and a terrain-agnostic golden-ratio palette.
 */

#pragma once

#include "hierophant/terrain.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace hierophant {

enum class ColorMode : uint8_t {
    Terrain,
    Palette,
};

/// HSL components before conversion: hue in degrees, s and l in percent
struct Hsl {
    double h = 0.0;
    double s = 0.0;
    double l = 0.0;
};

/// Standard HSL to RGB, formatted "#rrggbb" (lower case, channels rounded)
[[nodiscard]] std::string hslToHex(double h, double s, double l);

/// Terrain-dependent HSL for the territory at index. Like every seeded
/// function here, the seed is taken modulo SeededRandom::kModulus.
[[nodiscard]] Hsl terrainHsl(Terrain terrain, int index, int64_t seed);

[[nodiscard]] std::string terrainColor(Terrain terrain, int index, int64_t seed);

/// Golden-ratio hue spacing, no terrain information
[[nodiscard]] std::string paletteColor(int index, int64_t seed);

/// paletteColor for indices 0..count-1
[[nodiscard]] std::vector<std::string> generatePalette(size_t count, int64_t seed);

}  // namespace hierophant
