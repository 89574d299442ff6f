#include "core/GameConfig.hpp"
#include <stdexcept>

namespace blockfall::core {

void GameConfig::validate() const {
    if (rows <= 0 || cols <= 0) {
        throw std::invalid_argument("GameConfig: rows and cols must be positive");
    }
    if (gravityIntervalMs <= 0) {
        throw std::invalid_argument("GameConfig: gravity interval must be positive");
    }
}

} // namespace blockfall::core
