#pragma once

/// @file evaluation.hpp
/// Engine evaluation results and position status.

#include <chrono>
#include <optional>
#include <string>
#include <variant>

namespace fenprobe {

// ── Score ───────────────────────────────────────────────────────────────────

/// Centipawn score from the mover's point of view.
struct Centipawns {
    int value = 0;

    [[nodiscard]] constexpr bool operator==(const Centipawns&) const noexcept = default;
};

/// Forced mate in `moves`. Positive = the mover mates, negative = the mover is mated.
struct MateIn {
    int moves = 0;

    [[nodiscard]] constexpr bool operator==(const MateIn&) const noexcept = default;
};

using Score = std::variant<Centipawns, MateIn>;

[[nodiscard]] inline bool is_mate(const Score& s) noexcept {
    return std::holds_alternative<MateIn>(s);
}

/// Centipawn value, or std::nullopt for a mate score.
[[nodiscard]] inline std::optional<int> centipawns(const Score& s) noexcept {
    if (const auto* cp = std::get_if<Centipawns>(&s))
        return cp->value;
    return std::nullopt;
}

/// Wire form: "cp 35" or "mate -3".
[[nodiscard]] inline std::string to_string(const Score& s) {
    if (const auto* cp = std::get_if<Centipawns>(&s))
        return "cp " + std::to_string(cp->value);
    return "mate " + std::to_string(std::get<MateIn>(s).moves);
}

// ── Evaluation result ───────────────────────────────────────────────────────

struct EvaluationResult {
    Score score{};
    std::chrono::steady_clock::duration elapsed{};
    std::string best_move;  ///< First token after "bestmove" (may be "(none)").

    [[nodiscard]] double elapsed_seconds() const noexcept {
        return std::chrono::duration<double>(elapsed).count();
    }
};

// ── Position status ─────────────────────────────────────────────────────────

/// Outcome of submitting a position to the engine.
enum class PositionStatus {
    Fault,            ///< The engine died on this position and was restarted.
    MoverInCheck,     ///< Accepted; the side to move is in check.
    MoverNotInCheck,  ///< Accepted; the side to move is not in check.
};

[[nodiscard]] constexpr const char* to_string(PositionStatus s) noexcept {
    switch (s) {
        case PositionStatus::Fault:
            return "Fault";
        case PositionStatus::MoverInCheck:
            return "MoverInCheck";
        case PositionStatus::MoverNotInCheck:
            return "MoverNotInCheck";
    }
    return "?";
}

}  // namespace fenprobe
