#pragma once // Include guard

#include <cstdint> // For fixed-width integer types
#include <array> // For std::array

// Namespace for Blockfall core types
namespace blockfall::core {

// Value stored in a board cell: 0 = empty, 1..7 = type id of a locked piece
using CellValue = std::uint8_t;

inline constexpr CellValue EmptyCell = 0;
inline constexpr CellValue MaxCellValue = 7;

// Position structure representing a cell in the grid
struct Position {
    int row{};
    int col{};
};

// Piece types. The numeric value doubles as the cell value and palette index.
enum class PieceType : std::uint8_t {
    I = 1,
    O = 2,
    S = 3,
    Z = 4,
    T = 5,
    J = 6,
    L = 7
};

inline constexpr int PieceTypeCount = 7;

inline constexpr std::array<PieceType, PieceTypeCount> AllPieceTypes{
    PieceType::I, PieceType::O, PieceType::S, PieceType::Z,
    PieceType::T, PieceType::J, PieceType::L
};

inline CellValue cellValueOf(PieceType type) noexcept {
    return static_cast<CellValue>(type);
}

inline bool isValidCellValue(int value) noexcept {
    return value >= EmptyCell && value <= MaxCellValue;
}

} // namespace blockfall::core
