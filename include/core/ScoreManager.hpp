#pragma once

#include <cstdint>

namespace blockfall::core {

class ScoreManager {
public:
    // Adds lines * 10 * lines (10, 40, 90, 160 ...). Non-positive counts are ignored.
    void addLinesCleared(int lines) noexcept;

    std::uint64_t score() const noexcept { return score_; }
    std::uint64_t linesCleared() const noexcept { return linesCleared_; }

    static std::uint64_t pointsFor(int lines) noexcept;

private:
    std::uint64_t score_{0};
    std::uint64_t linesCleared_{0};
};

} // namespace blockfall::core
