#pragma once

#include "Board.hpp"
#include "PieceShape.hpp"
#include "ScoreManager.hpp"
#include <cstdint>
#include <optional>

namespace blockfall::core {

// Everything a host needs to draw one frame: the board, the falling piece,
// the score and whether the game has ended.
// Mutated by PieceController; hosts only read it.
class GameState {
public:
    GameState(int rows = 20, int cols = 10);

    const Board& board() const noexcept { return board_; }
    Board& board() noexcept { return board_; }

    const std::optional<ActivePiece>& activePiece() const noexcept { return activePiece_; }
    std::optional<ActivePiece>& activePiece() noexcept { return activePiece_; }

    std::uint64_t score() const noexcept { return scoreManager_.score(); }
    std::uint64_t linesCleared() const noexcept { return scoreManager_.linesCleared(); }
    std::uint64_t lockedPieces() const noexcept { return lockedPieces_; }

    bool isOver() const noexcept { return over_; }

    void addLinesCleared(int lines) noexcept { scoreManager_.addLinesCleared(lines); }
    void countLockedPiece() noexcept { ++lockedPieces_; }

    // One-way: there is no way back to a running game
    void markOver() noexcept { over_ = true; }

private:
    Board board_;
    ScoreManager scoreManager_;
    std::optional<ActivePiece> activePiece_;
    std::uint64_t lockedPieces_{0};
    bool over_{false};
};

// Fresh game with an empty board and no active piece
GameState createGame(int rows = 20, int cols = 10);

} // namespace blockfall::core
