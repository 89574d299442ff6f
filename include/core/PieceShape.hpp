#pragma once // Include guard

#include "Types.hpp" // For CellValue, PieceType
#include <vector>

// Namespace for Blockfall core types
namespace blockfall::core {

// Rectangular matrix of cell values describing a tetromino.
// 0 cells are transparent, nonzero cells carry the piece's type id.
class PieceShape {
public:
    PieceShape(int rows, int cols, std::vector<CellValue> cells);

    // Template for one of the 7 pieces
    static PieceShape forType(PieceType type);

    int rows() const noexcept { return rows_; }
    int cols() const noexcept { return cols_; }
    int width() const noexcept { return cols_; }

    CellValue at(int row, int col) const;

    // 90 degree clockwise rotation (transpose, then reverse each row).
    // Returns a new shape; this one is left untouched.
    PieceShape rotatedClockwise() const;

    bool operator==(const PieceShape& other) const noexcept;
    bool operator!=(const PieceShape& other) const noexcept { return !(*this == other); }

private:
    int rows_;
    int cols_;
    std::vector<CellValue> cells_; // rows_ * cols_, row-major

    int index(int row, int col) const noexcept {
        return row * cols_ + col;
    }
};

// The falling piece: a shape plus the board position of its top-left cell
struct ActivePiece {
    PieceShape shape;
    Position origin;
};

} // namespace blockfall::core
