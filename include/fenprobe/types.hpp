#pragma once

/// @file types.hpp
/// Core type aliases and enumerations shared by the board model and the
/// engine session.

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace fenprobe {

// ── Square ──────────────────────────────────────────────────────────────────
// Rank-major as printed: a8=0, b8=1, ..., h8=7, a7=8, ..., h1=63
using Square = std::uint8_t;

inline constexpr int kNumSquares = 64;

/// `file` 0..7 (a..h), `rank` 0..7 (rank 1 = 0).
[[nodiscard]] constexpr Square make_square(int file, int rank) noexcept {
    return static_cast<Square>((7 - rank) * 8 + file);
}

// Named square constants
// clang-format off
enum SquareConstants : Square {
    A8, B8, C8, D8, E8, F8, G8, H8,
    A7, B7, C7, D7, E7, F7, G7, H7,
    A6, B6, C6, D6, E6, F6, G6, H6,
    A5, B5, C5, D5, E5, F5, G5, H5,
    A4, B4, C4, D4, E4, F4, G4, H4,
    A3, B3, C3, D3, E3, F3, G3, H3,
    A2, B2, C2, D2, E2, F2, G2, H2,
    A1, B1, C1, D1, E1, F1, G1, H1,
};
// clang-format on

/// Pawns may only stand on squares in [kFirstPawnSquare, kLastPawnSquare),
/// i.e. ranks 7 down to 2.
inline constexpr Square kFirstPawnSquare = A7;
inline constexpr Square kLastPawnSquare = A1;

/// Number of squares a pawn may stand on.
inline constexpr int kNumPawnSquares = kLastPawnSquare - kFirstPawnSquare;

[[nodiscard]] constexpr bool is_pawn_square(Square sq) noexcept {
    return sq >= kFirstPawnSquare && sq < kLastPawnSquare;
}

// ── Color ───────────────────────────────────────────────────────────────────
enum class Color : std::uint8_t { White = 0, Black = 1 };

/// Side-to-move letter used in position strings. Throws std::invalid_argument
/// for values outside {White, Black}.
[[nodiscard]] inline char color_char(Color c) {
    switch (c) {
        case Color::White:
            return 'w';
        case Color::Black:
            return 'b';
    }
    throw std::invalid_argument("Invalid side to move: " +
                                std::to_string(static_cast<int>(c)));
}

/// Parse "w" or "b". Throws std::invalid_argument on anything else.
[[nodiscard]] inline Color parse_color(std::string_view mover) {
    if (mover == "w")
        return Color::White;
    if (mover == "b")
        return Color::Black;
    throw std::invalid_argument("Invalid side to move: '" + std::string(mover) + "'");
}

// ── PieceType ───────────────────────────────────────────────────────────────
enum class PieceType : std::uint8_t {
    None = 0,
    Pawn = 1,
    Knight = 2,
    Bishop = 3,
    Rook = 4,
    Queen = 5,
    King = 6,
};

}  // namespace fenprobe
