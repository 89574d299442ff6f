#pragma once

#include "Types.hpp"
#include <cstdint>
#include <optional>
#include <random>

namespace blockfall::core {

class PieceGenerator {
public:
    // Seeds from std::random_device unless a seed is given
    explicit PieceGenerator(std::optional<std::uint32_t> seed = std::nullopt);

    // Uniformly random piece type among the 7
    PieceType next();

private:
    std::mt19937 rng_;
};

} // namespace blockfall::core
