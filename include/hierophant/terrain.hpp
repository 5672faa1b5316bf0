/**
 * @file terrain.hpp
 * @brief Terrain categories and their string tokens
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <optional>
#include <string_view>

namespace hierophant {

enum class Terrain : uint8_t {
    Plains,
    Forest,
    Mountains,
    Desert,
    Hills,
    Coastal,
};

inline constexpr size_t kTerrainCount = 6;

/// All terrains in declaration order
inline constexpr std::array<Terrain, kTerrainCount> kAllTerrains = {
    Terrain::Plains, Terrain::Forest, Terrain::Mountains,
    Terrain::Desert, Terrain::Hills, Terrain::Coastal,
};

/// Lower-case token ("plains", "forest", ...); "unknown" for invalid values
[[nodiscard]] std::string_view terrainName(Terrain terrain);

/// Reverse of terrainName
[[nodiscard]] std::optional<Terrain> parseTerrain(std::string_view name);

/// Index into kAllTerrains
[[nodiscard]] constexpr size_t terrainIndex(Terrain terrain) {
    return static_cast<size_t>(terrain);
}

}  // namespace hierophant
