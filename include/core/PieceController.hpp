#pragma once

#include "GameState.hpp"
#include "PieceGenerator.hpp"
#include "Types.hpp"
#include <cstdint>
#include <optional>

namespace blockfall::core {

enum class PiecePhase {
    Spawning,  // no active piece yet
    Falling,
    GameOver
};

// Owns the lifecycle of the falling piece: spawn, move, rotate, drop and lock.
// Does not own the GameState; caller keeps it alive.
class PieceController {
public:
    explicit PieceController(GameState& game,
                             std::optional<std::uint32_t> seed = std::nullopt);

    PiecePhase phase() const noexcept;

    // Spawn a random piece (or the given type) centered on row 0.
    // If it does not fit the game is over. Returns true if the piece fits.
    bool spawn();
    bool spawn(PieceType type);

    // direction must be -1 (left) or +1 (right). Returns true if the piece moved.
    bool move(int direction);
    bool moveLeft() { return move(-1); }
    bool moveRight() { return move(1); }

    // Clockwise rotation with horizontal kick search.
    // Returns false if the rotation was abandoned.
    bool rotate();

    // One step down. If blocked, the piece locks, lines are swept,
    // score is added and the next piece spawns.
    // Returns true if the piece descended, false if it locked (or nothing happened).
    bool drop();

private:
    GameState& game_;
    PieceGenerator generator_;

    bool canMutate() const noexcept;
    void lockActivePieceAndProcessLines();
};

} // namespace blockfall::core
