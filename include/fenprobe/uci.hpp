#pragma once

/// @file uci.hpp
/// Wire-level helpers for the engine protocol: command formatting and
/// reply parsing. No I/O happens here.

#include <fenprobe/evaluation.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace fenprobe::uci {

// ── Commands and markers ────────────────────────────────────────────────────

inline constexpr std::string_view kUci = "uci";
inline constexpr std::string_view kUciOk = "uciok";
inline constexpr std::string_view kNewGame = "ucinewgame";
inline constexpr std::string_view kIsReady = "isready";
inline constexpr std::string_view kReadyOk = "readyok";
inline constexpr std::string_view kDisplay = "d";
inline constexpr std::string_view kQuit = "quit";

inline constexpr std::string_view kFenPrefix = "Fen: ";
inline constexpr std::string_view kCheckersPrefix = "Checkers:";
inline constexpr std::string_view kInfo = "info";
inline constexpr std::string_view kBestMove = "bestmove";
inline constexpr std::string_view kScore = "score";

/// Search budget for a `go` command. Absent fields are not sent.
struct GoLimits {
    std::optional<int> depth;
    std::optional<int> movetime_ms;

    [[nodiscard]] bool empty() const noexcept { return !depth && !movetime_ms; }
};

// ── Formatting ──────────────────────────────────────────────────────────────

/// "position fen <fen>"
[[nodiscard]] std::string position_command(std::string_view fen);

/// "go [depth N] [movetime M]"
[[nodiscard]] std::string go_command(const GoLimits& limits);

// ── Parsing ─────────────────────────────────────────────────────────────────

/// Strip leading and trailing ASCII whitespace (including '\r').
[[nodiscard]] std::string_view trim(std::string_view line) noexcept;

/// True if the first whitespace-delimited token of `line` equals `token`.
[[nodiscard]] bool starts_with_token(std::string_view line, std::string_view token) noexcept;

/// True if `line` contains a standalone `score` token.
[[nodiscard]] bool has_score(std::string_view line) noexcept;

/// Parse "... score <cp|mate> <int> ..." from an info line.
/// Throws ProtocolError if the marker, the unit or the value is missing or malformed.
[[nodiscard]] Score parse_score(std::string_view info_line);

/// First token after "bestmove", empty if there is none.
[[nodiscard]] std::string parse_best_move(std::string_view line);

// ── Diagnostic dump ─────────────────────────────────────────────────────────

/// Collects the echoed position and check status from the lines of a `d` reply.
class DiagnosticParser {
   public:
    struct Result {
        std::string fen;
        bool in_check = false;
    };

    /// Feed one (trimmed) line. Returns true once the `Checkers:` line has been seen.
    /// Throws ProtocolError on a repeated `Fen:` or `Checkers:` line.
    bool feed(std::string_view line);

    [[nodiscard]] bool done() const noexcept { return in_check_.has_value(); }

    /// Throws ProtocolError if the reply was incomplete.
    [[nodiscard]] Result result() const;

   private:
    std::optional<std::string> fen_;
    std::optional<bool> in_check_;
};

}  // namespace fenprobe::uci
