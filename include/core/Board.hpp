#pragma once

#include "Types.hpp"
#include "PieceShape.hpp"
#include <vector>

namespace blockfall::core {

class Board {
public:
    // Creates an empty rows x cols grid. Throws std::invalid_argument
    // for non-positive dimensions.
    Board(int rows, int cols);

    int rows() const noexcept { return rows_; }
    int cols() const noexcept { return cols_; }

    CellValue cell(int row, int col) const;
    void setCell(int row, int col, CellValue value);

    // Whether a piece cell at (row, col) would collide.
    // Columns outside the board and rows at or below the floor collide;
    // rows above the top are open space.
    bool cellCollides(int row, int col) const noexcept;

    // Check the nonzero cells of `piece` against walls, floor and locked cells
    bool collides(const ActivePiece& piece) const noexcept;

    // Write the piece's cells into the grid
    void merge(const ActivePiece& piece);

    // Remove full rows (row 0 is never checked), return number of cleared lines
    int sweepLines();

    bool isRowFull(int row) const;

    const std::vector<CellValue>& cells() const noexcept { return grid_; }

private:
    int rows_;
    int cols_;
    std::vector<CellValue> grid_; // rows_ * cols_

    int index(int row, int col) const noexcept {
        return row * cols_ + col;
    }

    bool isInside(int row, int col) const noexcept {
        return row >= 0 && row < rows_ && col >= 0 && col < cols_;
    }
};

} // namespace blockfall::core
