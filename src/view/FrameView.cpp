#include "view/FrameView.hpp"

#include <algorithm>

namespace blockfall::view {

Rgb colorFor(core::CellValue value) noexcept {
    if (!core::isValidCellValue(value)) {
        return Palette[0];
    }
    return Palette[value];
}

std::vector<core::CellValue> composeFrame(const core::GameState& game) {
    const core::Board& board = game.board();
    const int rows = board.rows();
    const int cols = board.cols();

    std::vector<core::CellValue> frame = board.cells();

    if (game.activePiece()) {
        const auto& piece = *game.activePiece();
        for (int r = 0; r < piece.shape.rows(); ++r) {
            for (int c = 0; c < piece.shape.cols(); ++c) {
                const core::CellValue v = piece.shape.at(r, c);
                if (v == core::EmptyCell) continue;

                const int row = piece.origin.row + r;
                const int col = piece.origin.col + c;
                if (row >= 0 && row < rows && col >= 0 && col < cols) {
                    frame[static_cast<std::size_t>(row * cols + col)] = v;
                }
            }
        }
    }
    return frame;
}

int fitCellSize(int width, int height, int rows, int cols) noexcept {
    if (rows <= 0 || cols <= 0) return 1;
    const int cell = std::min(width / cols, height / rows);
    return std::max(cell, 1);
}

std::string scoreText(const core::GameState& game) {
    return "Score: " + std::to_string(game.score());
}

} // namespace blockfall::view
