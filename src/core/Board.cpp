#include "core/Board.hpp"
#include <algorithm>
#include <stdexcept>

namespace blockfall::core {

Board::Board(int rows, int cols)
    : rows_{rows}
    , cols_{cols}
{
    if (rows <= 0 || cols <= 0) {
        throw std::invalid_argument("Board dimensions must be positive");
    }
    grid_.assign(static_cast<std::size_t>(rows) * static_cast<std::size_t>(cols), EmptyCell);
}

CellValue Board::cell(int row, int col) const {
    if (!isInside(row, col)) {
        throw std::out_of_range("Board::cell out of range");
    }
    return grid_[index(row, col)];
}

void Board::setCell(int row, int col, CellValue value) {
    if (!isInside(row, col)) {
        throw std::out_of_range("Board::setCell out of range");
    }
    if (!isValidCellValue(value)) {
        throw std::invalid_argument("Board::setCell value must be in 0..7");
    }
    grid_[index(row, col)] = value;
}

bool Board::cellCollides(int row, int col) const noexcept {
    if (col < 0 || col >= cols_) {
        return true; // wall
    }
    if (row >= rows_) {
        return true; // floor
    }
    if (row < 0) {
        return false; // above the top: nothing to hit
    }
    return grid_[index(row, col)] != EmptyCell;
}

bool Board::collides(const ActivePiece& piece) const noexcept {
    const PieceShape& shape = piece.shape;
    for (int r = 0; r < shape.rows(); ++r) {
        for (int c = 0; c < shape.cols(); ++c) {
            if (shape.at(r, c) == EmptyCell) continue;
            if (cellCollides(piece.origin.row + r, piece.origin.col + c)) {
                return true;
            }
        }
    }
    return false;
}

void Board::merge(const ActivePiece& piece) {
    const PieceShape& shape = piece.shape;
    for (int r = 0; r < shape.rows(); ++r) {
        for (int c = 0; c < shape.cols(); ++c) {
            const CellValue v = shape.at(r, c);
            if (v == EmptyCell) continue;

            const int row = piece.origin.row + r;
            const int col = piece.origin.col + c;
            if (isInside(row, col)) {
                grid_[index(row, col)] = v;
            }
        }
    }
}

bool Board::isRowFull(int row) const {
    if (row < 0 || row >= rows_) {
        throw std::out_of_range("Board::isRowFull out of range");
    }
    const auto begin = grid_.begin() + index(row, 0);
    return std::none_of(begin, begin + cols_,
                        [](CellValue v) { return v == EmptyCell; });
}

int Board::sweepLines() {
    int cleared = 0;

    // Bottom-up, stopping before row 0: the top row is never cleared
    for (int row = rows_ - 1; row > 0; --row) {
        if (!isRowFull(row)) continue;

        // Drop the full row and push an empty one in at the top
        grid_.erase(grid_.begin() + index(row, 0), grid_.begin() + index(row + 1, 0));
        grid_.insert(grid_.begin(), static_cast<std::size_t>(cols_), EmptyCell);

        ++cleared;
        ++row; // re-check this row index because we just pulled everything down
    }

    return cleared;
}

} // namespace blockfall::core
