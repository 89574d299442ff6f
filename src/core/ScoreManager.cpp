#include "core/ScoreManager.hpp"

namespace blockfall::core {

std::uint64_t ScoreManager::pointsFor(int lines) noexcept {
    if (lines <= 0) return 0;

    const auto n = static_cast<std::uint64_t>(lines);
    return n * 10 * n;
}

void ScoreManager::addLinesCleared(int lines) noexcept {
    if (lines <= 0) return;

    score_ += pointsFor(lines);
    linesCleared_ += static_cast<std::uint64_t>(lines);
}

} // namespace blockfall::core
