/// @file board.cpp
/// Board implementation: initial layout, random scatter, position strings.

#include <fenprobe/board.hpp>

#include <fenprobe/errors.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>

namespace fenprobe {

// ── Layout ──────────────────────────────────────────────────────────────────

void Board::reset_initial() noexcept {
    clear();

    constexpr PieceType kBackRank[] = {
        PieceType::Rook, PieceType::Knight, PieceType::Bishop, PieceType::Queen,
        PieceType::King, PieceType::Bishop, PieceType::Knight, PieceType::Rook,
    };

    for (int f = 0; f < 8; ++f) {
        put_piece(make_square(f, 7), {Color::Black, kBackRank[f]});
        put_piece(make_square(f, 6), {Color::Black, PieceType::Pawn});
        put_piece(make_square(f, 1), {Color::White, PieceType::Pawn});
        put_piece(make_square(f, 0), {Color::White, kBackRank[f]});
    }
}

Board Board::initial() noexcept {
    Board b;
    b.reset_initial();
    return b;
}

// ── Queries ─────────────────────────────────────────────────────────────────

int Board::piece_count() const noexcept {
    return static_cast<int>(std::count_if(mailbox_.begin(), mailbox_.end(),
                                          [](Piece p) { return p != kNoPiece; }));
}

std::vector<Square> Board::empty_squares() const {
    std::vector<Square> squares;
    squares.reserve(kNumSquares);
    for (int sq = 0; sq < kNumSquares; ++sq) {
        if (is_empty(static_cast<Square>(sq)))
            squares.push_back(static_cast<Square>(sq));
    }
    return squares;
}

// ── Scatter ─────────────────────────────────────────────────────────────────

void Board::scatter(std::string_view pieces, std::mt19937_64& rng) {
    // Pawns go first: any other order can fill ranks 2-7 and strand them.
    std::vector<Piece> pawns;
    std::vector<Piece> others;
    for (char ch : pieces) {
        Piece p = Piece::from_symbol(ch);
        if (p.type == PieceType::None) {
            throw std::invalid_argument(std::string("Invalid piece symbol: '") + ch + "'");
        }
        (p.is_pawn() ? pawns : others).push_back(p);
    }

    std::vector<Square> empty = empty_squares();
    std::vector<Square> candidates;
    candidates.reserve(empty.size());

    auto place = [&](Piece p) {
        candidates.clear();
        for (Square sq : empty) {
            if (!p.is_pawn() || is_pawn_square(sq))
                candidates.push_back(sq);
        }
        if (candidates.empty()) {
            throw ConfigurationError(std::string("No free square left for piece '") +
                                     p.symbol() + "' (" + std::to_string(piece_count()) +
                                     " placed)");
        }

        std::uniform_int_distribution<std::size_t> pick(0, candidates.size() - 1);
        Square sq = candidates[pick(rng)];
        put_piece(sq, p);
        empty.erase(std::find(empty.begin(), empty.end(), sq));
    };

    for (Piece p : pawns) place(p);
    for (Piece p : others) place(p);
}

// ── Serialization ───────────────────────────────────────────────────────────

std::string Board::to_fen(Color mover) const {
    // Validate first so nothing is built for a bad mover.
    const char side = color_char(mover);

    std::string fen;
    fen.reserve(80);

    for (int row = 0; row < 8; ++row) {
        if (row > 0) fen += '/';
        int empty = 0;
        for (int file = 0; file < 8; ++file) {
            Piece p = mailbox_[row * 8 + file];
            if (p == kNoPiece) {
                ++empty;
            } else {
                if (empty > 0) {
                    fen += static_cast<char>('0' + empty);
                    empty = 0;
                }
                fen += p.symbol();
            }
        }
        if (empty > 0) fen += static_cast<char>('0' + empty);
    }

    fen += ' ';
    fen += side;
    fen += " - - 0 1";
    return fen;
}

std::string Board::to_fen(std::string_view mover) const {
    return to_fen(parse_color(mover));
}

std::string Board::diagram() const {
    std::string out;
    out.reserve(72);
    for (int row = 0; row < 8; ++row) {
        for (int file = 0; file < 8; ++file) {
            Piece p = mailbox_[row * 8 + file];
            out += (p == kNoPiece) ? '.' : p.symbol();
        }
        out += '\n';
    }
    return out;
}

}  // namespace fenprobe
