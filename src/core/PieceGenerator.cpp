#include "core/PieceGenerator.hpp"

namespace blockfall::core {

PieceGenerator::PieceGenerator(std::optional<std::uint32_t> seed)
    : rng_{seed ? *seed : std::random_device{}()}
{
}

PieceType PieceGenerator::next() {
    std::uniform_int_distribution<int> dist(0, PieceTypeCount - 1); // 7 types
    return AllPieceTypes[static_cast<std::size_t>(dist(rng_))];
}

} // namespace blockfall::core
