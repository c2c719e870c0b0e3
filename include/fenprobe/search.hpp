#pragma once

/// @file search.hpp
/// Random position search: scatter material, keep positions the engine
/// accepts with neither side in check, evaluate them and report.

#include <fenprobe/board.hpp>
#include <fenprobe/engine_session.hpp>
#include <fenprobe/search_config.hpp>

#include <optional>
#include <ostream>
#include <random>
#include <string>
#include <string_view>

namespace fenprobe {

// ── Statistics ──────────────────────────────────────────────────────────────

struct SearchStats {
    int generated = 0;  ///< Boards scattered.
    int faults = 0;     ///< Submissions that crashed the engine.
    int in_check = 0;   ///< Submissions rejected because the mover was in check.
    int found = 0;      ///< Positions evaluated and reported.
};

/// One reported position.
struct Finding {
    int index = 0;  ///< 1-based.
    std::string fen;
    EvaluationResult evaluation;
    bool highlighted = false;
};

// ── Report formatting ───────────────────────────────────────────────────────

inline constexpr std::string_view kHighlightOn = "\x1b[1m\x1b[33m";
inline constexpr std::string_view kHighlightOff = "\x1b[0m";

/// True for a centipawn score with |value| below `threshold`.
[[nodiscard]] bool should_highlight(const Score& score, int threshold) noexcept;

/// "<index:6> evaluation <score:20> duration <seconds:10.3> fen <fen> "
[[nodiscard]] std::string format_report(int index, const EvaluationResult& evaluation,
                                        std::string_view fen);

// ── PositionSearch ──────────────────────────────────────────────────────────

class PositionSearch {
   public:
    /// `session` must be started. Report lines go to `out`.
    PositionSearch(EngineSession& session, SearchConfig config, std::ostream& out);

    /// Run rounds until `config.count` positions have been found.
    SearchStats run();

    /// One round. Returns the finding, or std::nullopt if the board was rejected.
    std::optional<Finding> step();

    [[nodiscard]] const SearchStats& stats() const noexcept { return stats_; }
    [[nodiscard]] const SearchConfig& config() const noexcept { return config_; }

    /// Board of the most recent round.
    [[nodiscard]] const Board& board() const noexcept { return board_; }

   private:
    /// Submit `fen`; true if the engine accepted it with the mover not in check.
    bool accept(const std::string& fen);
    void report(const Finding& finding);

    EngineSession& session_;
    SearchConfig config_;
    std::ostream& out_;
    Board board_;
    std::mt19937_64 rng_;
    SearchStats stats_;
};

}  // namespace fenprobe
