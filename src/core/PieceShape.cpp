#include "core/PieceShape.hpp"
#include <stdexcept>

namespace blockfall::core {

PieceShape::PieceShape(int rows, int cols, std::vector<CellValue> cells)
    : rows_{rows}, cols_{cols}, cells_{std::move(cells)}
{
    if (rows <= 0 || cols <= 0) {
        throw std::invalid_argument("PieceShape dimensions must be positive");
    }
    if (cells_.size() != static_cast<std::size_t>(rows * cols)) {
        throw std::invalid_argument("PieceShape cell count does not match dimensions");
    }
    for (CellValue v : cells_) {
        if (!isValidCellValue(v)) {
            throw std::invalid_argument("PieceShape cell value out of range");
        }
    }
}

CellValue PieceShape::at(int row, int col) const {
    if (row < 0 || row >= rows_ || col < 0 || col >= cols_) {
        throw std::out_of_range("PieceShape::at out of range");
    }
    return cells_[index(row, col)];
}

PieceShape PieceShape::rotatedClockwise() const {
    // Rotated shape has the dimensions swapped.
    // Cell (r, c) of the result comes from (rows_ - 1 - c, r) of the source.
    std::vector<CellValue> rotated(cells_.size(), EmptyCell);
    const int newRows = cols_;
    const int newCols = rows_;
    for (int r = 0; r < newRows; ++r) {
        for (int c = 0; c < newCols; ++c) {
            rotated[r * newCols + c] = cells_[index(rows_ - 1 - c, r)];
        }
    }
    return PieceShape{newRows, newCols, std::move(rotated)};
}

bool PieceShape::operator==(const PieceShape& other) const noexcept {
    return rows_ == other.rows_ && cols_ == other.cols_ && cells_ == other.cells_;
}

PieceShape PieceShape::forType(PieceType type) {
    switch (type) {
    case PieceType::I:
        // [I][I][I][I]
        return PieceShape{1, 4, {1, 1, 1, 1}};

    case PieceType::O:
        // [O][O]
        // [O][O]
        return PieceShape{2, 2, {2, 2,
                                 2, 2}};

    case PieceType::S:
        //    [S][S]
        // [S][S]
        return PieceShape{2, 3, {0, 3, 3,
                                 3, 3, 0}};

    case PieceType::Z:
        // [Z][Z]
        //    [Z][Z]
        return PieceShape{2, 3, {4, 4, 0,
                                 0, 4, 4}};

    case PieceType::T:
        //    [T]
        // [T][T][T]
        return PieceShape{2, 3, {0, 5, 0,
                                 5, 5, 5}};

    case PieceType::J:
        // [J]
        // [J][J][J]
        return PieceShape{2, 3, {6, 0, 0,
                                 6, 6, 6}};

    case PieceType::L:
        //       [L]
        // [L][L][L]
        return PieceShape{2, 3, {0, 0, 7,
                                 7, 7, 7}};
    }

    throw std::invalid_argument("PieceShape::forType unknown piece type");
}

} // namespace blockfall::core
