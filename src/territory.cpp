#include "hierophant/territory.hpp"
#include "hierophant/errors.hpp"

namespace hierophant {

void validateMapConfig(const MapConfig& config) {
    if (!(config.width > 0.0)) {
        throw ConfigError("map width must be positive, got " + std::to_string(config.width));
    }
    if (!(config.height > 0.0)) {
        throw ConfigError("map height must be positive, got " + std::to_string(config.height));
    }
    if (config.territoryCount <= 0) {
        throw ConfigError("territory count must be positive, got " +
                          std::to_string(config.territoryCount));
    }
}

std::string territoryId(size_t index) {
    return "territory-" + std::to_string(index);
}

}  // namespace hierophant
