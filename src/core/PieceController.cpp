#include "core/PieceController.hpp"
#include <stdexcept>

namespace blockfall::core {

PieceController::PieceController(GameState& game, std::optional<std::uint32_t> seed)
    : game_{game}
    , generator_{seed}
{
}

PiecePhase PieceController::phase() const noexcept {
    if (game_.isOver()) return PiecePhase::GameOver;
    if (!game_.activePiece()) return PiecePhase::Spawning;
    return PiecePhase::Falling;
}

bool PieceController::canMutate() const noexcept {
    return !game_.isOver() && game_.activePiece().has_value();
}

bool PieceController::spawn() {
    if (game_.isOver()) return false;
    return spawn(generator_.next());
}

bool PieceController::spawn(PieceType type) {
    if (game_.isOver()) return false;

    PieceShape shape = PieceShape::forType(type);
    const int col = game_.board().cols() / 2 - shape.width() / 2;

    game_.activePiece() = ActivePiece{std::move(shape), Position{0, col}};

    if (game_.board().collides(*game_.activePiece())) {
        // Stack reached the spawn point
        game_.markOver();
        return false;
    }
    return true;
}

bool PieceController::move(int direction) {
    if (direction != -1 && direction != 1) {
        throw std::invalid_argument("PieceController::move direction must be -1 or +1");
    }
    if (!canMutate()) return false;

    ActivePiece& piece = *game_.activePiece();
    piece.origin.col += direction;
    if (game_.board().collides(piece)) {
        piece.origin.col -= direction;
        return false;
    }
    return true;
}

bool PieceController::rotate() {
    if (!canMutate()) return false;

    ActivePiece& piece = *game_.activePiece();
    const Board& board = game_.board();

    PieceShape original = piece.shape;
    const int originalCol = piece.origin.col;

    piece.shape = original.rotatedClockwise();
    const int width = piece.shape.width();

    // Kick search: +1, -2, +3, -4 ... applied cumulatively to the column,
    // abandoned as soon as the next offset would exceed the rotated width.
    int offset = 1;
    while (board.collides(piece)) {
        piece.origin.col += offset;
        offset = -(offset + (offset > 0 ? 1 : -1));
        if (offset > width) {
            piece.shape = std::move(original);
            piece.origin.col = originalCol;
            return false;
        }
    }
    return true;
}

bool PieceController::drop() {
    if (game_.isOver()) return false;

    if (!game_.activePiece()) {
        spawn();
        return false;
    }

    ActivePiece& piece = *game_.activePiece();
    piece.origin.row += 1;
    if (!game_.board().collides(piece)) {
        return true;
    }

    piece.origin.row -= 1;
    lockActivePieceAndProcessLines();
    spawn();
    return false;
}

void PieceController::lockActivePieceAndProcessLines() {
    game_.board().merge(*game_.activePiece());
    game_.activePiece().reset();
    game_.countLockedPiece();

    const int lines = game_.board().sweepLines();
    game_.addLinesCleared(lines);
}

} // namespace blockfall::core
