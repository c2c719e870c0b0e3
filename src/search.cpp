/// @file search.cpp
/// Position search loop and report formatting.

#include <fenprobe/search.hpp>

#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <utility>

namespace fenprobe {

// ── Report formatting ───────────────────────────────────────────────────────

bool should_highlight(const Score& score, int threshold) noexcept {
    auto cp = centipawns(score);
    return cp && std::abs(*cp) < threshold;
}

std::string format_report(int index, const EvaluationResult& evaluation, std::string_view fen) {
    std::ostringstream os;
    os << std::setw(6) << index << " evaluation " << std::left << std::setw(20)
       << to_string(evaluation.score) << std::right << " duration " << std::fixed
       << std::setprecision(3) << std::setw(10) << evaluation.elapsed_seconds() << " fen " << fen
       << ' ';
    return os.str();
}

// ── PositionSearch ──────────────────────────────────────────────────────────

PositionSearch::PositionSearch(EngineSession& session, SearchConfig config, std::ostream& out)
    : session_(session), config_(std::move(config)), out_(out) {
    if (config_.seed) {
        rng_.seed(*config_.seed);
    } else {
        std::random_device rd;
        rng_.seed((static_cast<std::uint64_t>(rd()) << 32) | rd());
    }
}

SearchStats PositionSearch::run() {
    while (stats_.found < config_.count) {
        (void)step();
    }
    return stats_;
}

std::optional<Finding> PositionSearch::step() {
    board_.reset_empty();
    board_.scatter(config_.material, rng_);
    ++stats_.generated;

    // With black to move, check means white could capture the king.
    if (!accept(board_.to_fen(Color::Black)))
        return std::nullopt;

    std::string fen = board_.to_fen(Color::White);
    if (!accept(fen))
        return std::nullopt;

    uci::GoLimits limits{config_.depth, config_.movetime_ms()};
    Finding finding;
    finding.evaluation = session_.evaluate(limits);
    finding.index = ++stats_.found;
    finding.fen = std::move(fen);
    finding.highlighted =
        config_.highlight && should_highlight(finding.evaluation.score, config_.highlight_threshold);

    report(finding);
    return finding;
}

bool PositionSearch::accept(const std::string& fen) {
    switch (session_.submit_position(fen)) {
        case PositionStatus::Fault:
            ++stats_.faults;
            return false;
        case PositionStatus::MoverInCheck:
            ++stats_.in_check;
            return false;
        case PositionStatus::MoverNotInCheck:
            return true;
    }
    return false;
}

void PositionSearch::report(const Finding& finding) {
    if (finding.highlighted)
        out_ << kHighlightOn;
    out_ << format_report(finding.index, finding.evaluation, finding.fen);
    if (finding.highlighted)
        out_ << kHighlightOff;
    out_ << std::endl;
}

}  // namespace fenprobe
