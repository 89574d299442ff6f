#pragma once

#include <cstdint>
#include <optional>

namespace blockfall::core {

struct GameConfig {
    int rows{20};
    int cols{10};

    int gravityIntervalMs{1000};          // forced descent cadence

    std::optional<std::uint32_t> seed;    // fixed piece sequence when set

    // Throws std::invalid_argument if a dimension or the interval is not positive
    void validate() const;
};

} // namespace blockfall::core
