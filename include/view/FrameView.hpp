#pragma once

#include "core/GameState.hpp"
#include "core/Types.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

// Host-agnostic pieces of the render contract: what a renderer paints,
// in which colors, and at what cell size.
namespace blockfall::view {

struct Rgb {
    std::uint8_t r{};
    std::uint8_t g{};
    std::uint8_t b{};
};

// Index 0 is the empty-cell background, 1..7 the piece colors
inline constexpr std::array<Rgb, 8> Palette{{
    {0x11, 0x18, 0x27}, // empty   #111827
    {0xEF, 0x44, 0x44}, // I       #EF4444
    {0x3B, 0x82, 0xF6}, // O       #3B82F6
    {0x22, 0xC5, 0x5E}, // S       #22C55E
    {0xA8, 0x55, 0xF7}, // Z       #A855F7
    {0xF9, 0x73, 0x16}, // T       #F97316
    {0xFB, 0xBF, 0x24}, // J       #FBBF24
    {0x63, 0x66, 0xF1}  // L       #6366F1
}};

inline constexpr const char* GameOverCaption = "GAME OVER";
inline constexpr const char* ControlsHint = "Use Arrow Keys to Play";

// Color for a cell value; out-of-range values fall back to the background
Rgb colorFor(core::CellValue value) noexcept;

// Board cells with the active piece's cells laid on top, rows * cols, row-major
std::vector<core::CellValue> composeFrame(const core::GameState& game);

// Largest square cell that fits rows x cols into width x height (at least 1)
int fitCellSize(int width, int height, int rows, int cols) noexcept;

// "Score: N"
std::string scoreText(const core::GameState& game);

} // namespace blockfall::view
