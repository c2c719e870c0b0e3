#pragma once

/// @file board.hpp
/// Mailbox board used to generate candidate positions.
///
/// The board enforces nothing about chess legality: any arrangement of
/// pieces can be built, and it is the engine's job to accept or reject it.

#include <fenprobe/types.hpp>

#include <array>
#include <cstddef>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace fenprobe {

// ── Piece ───────────────────────────────────────────────────────────────────

/// White piece letters in PieceType order; black uses the lowercase letter.
inline constexpr std::string_view kPieceLetters = "PNBRQK";

struct Piece {
    Color color = Color::White;
    PieceType type = PieceType::None;

    [[nodiscard]] constexpr bool operator==(const Piece&) const noexcept = default;

    [[nodiscard]] constexpr bool is_pawn() const noexcept { return type == PieceType::Pawn; }

    /// Letter used in position strings, ' ' for an empty cell.
    [[nodiscard]] constexpr char symbol() const noexcept {
        if (type == PieceType::None)
            return ' ';
        const char upper = kPieceLetters[static_cast<std::size_t>(type) - 1];
        return color == Color::White ? upper : static_cast<char>(upper - 'A' + 'a');
    }

    /// Inverse of symbol(). Anything that is not a piece letter yields kNoPiece.
    [[nodiscard]] static constexpr Piece from_symbol(char ch) noexcept;
};

inline constexpr Piece kNoPiece{};

constexpr Piece Piece::from_symbol(char ch) noexcept {
    const bool black = ch >= 'a' && ch <= 'z';
    const char upper = black ? static_cast<char>(ch - 'a' + 'A') : ch;
    const std::size_t idx = kPieceLetters.find(upper);
    if (idx == std::string_view::npos)
        return kNoPiece;
    return {black ? Color::Black : Color::White, static_cast<PieceType>(idx + 1)};
}

// ── Board ───────────────────────────────────────────────────────────────────

/// 64-cell board, indexed a8=0 .. h1=63.
class Board {
   public:
    Board() noexcept { clear(); }

    // ── Piece placement ─────────────────────────────────────────────────

    /// Place a piece on a square, replacing whatever was there.
    void put_piece(Square sq, Piece p) noexcept { mailbox_[sq] = p; }

    void remove_piece(Square sq) noexcept { mailbox_[sq] = kNoPiece; }

    /// Place each symbol of `pieces` on a uniformly chosen empty square.
    ///
    /// Every symbol is checked before anything is placed; one that is not a
    /// piece letter throws std::invalid_argument. Pawns are placed first, on
    /// ranks 2-7 only, then the other pieces in input order, each without
    /// replacement. Throws ConfigurationError when no candidate square is
    /// left for a piece; pieces placed before the failure stay on the board.
    void scatter(std::string_view pieces, std::mt19937_64& rng);

    // ── Queries ─────────────────────────────────────────────────────────

    /// Piece at a given square (kNoPiece if empty).
    [[nodiscard]] Piece piece_at(Square sq) const noexcept { return mailbox_[sq]; }

    [[nodiscard]] bool is_empty(Square sq) const noexcept {
        return mailbox_[sq].type == PieceType::None;
    }

    /// Number of occupied squares.
    [[nodiscard]] int piece_count() const noexcept;

    /// All empty squares in index order.
    [[nodiscard]] std::vector<Square> empty_squares() const;

    // ── Bulk operations ─────────────────────────────────────────────────

    void clear() noexcept { mailbox_.fill(kNoPiece); }

    void reset_empty() noexcept { clear(); }

    /// Standard starting arrangement.
    void reset_initial() noexcept;

    [[nodiscard]] bool operator==(const Board& other) const noexcept {
        return mailbox_ == other.mailbox_;
    }

    // ── Serialization ───────────────────────────────────────────────────

    /// Position string: placement, mover, then "- - 0 1".
    /// Throws std::invalid_argument if `mover` is not White or Black.
    [[nodiscard]] std::string to_fen(Color mover) const;

    /// Same, with the mover given as "w" or "b".
    [[nodiscard]] std::string to_fen(std::string_view mover) const;

    /// Eight lines of eight characters, '.' for empty squares.
    [[nodiscard]] std::string diagram() const;

    // ── Factory ─────────────────────────────────────────────────────────

    [[nodiscard]] static Board initial() noexcept;

   private:
    std::array<Piece, kNumSquares> mailbox_{};
};

}  // namespace fenprobe
