#include "hierophant/terrain.hpp"

namespace hierophant {

std::string_view terrainName(Terrain terrain) {
    switch (terrain) {
        case Terrain::Plains:    return "plains";
        case Terrain::Forest:    return "forest";
        case Terrain::Mountains: return "mountains";
        case Terrain::Desert:    return "desert";
        case Terrain::Hills:     return "hills";
        case Terrain::Coastal:   return "coastal";
    }
    return "unknown";
}

std::optional<Terrain> parseTerrain(std::string_view name) {
    for (Terrain t : kAllTerrains) {
        if (terrainName(t) == name) {
            return t;
        }
    }
    return std::nullopt;
}

}  // namespace hierophant
