#pragma once

/// @file search_config.hpp
/// Settings for the position search tool and their command-line parser.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace fenprobe {

inline constexpr std::string_view kDefaultMaterial = "rnbqkbnrppppppppPPPPPPPPRNBQKBNR";
inline constexpr std::string_view kDefaultExecutables = "stockfish,./stockfish";

struct SearchConfig {
    std::string material{kDefaultMaterial};        ///< Pieces scattered each round.
    std::string executables{kDefaultExecutables};  ///< Comma-separated candidates.
    bool highlight = true;
    int highlight_threshold = 20;  ///< Centipawns.
    double movetime_seconds = 1.0;
    std::optional<int> depth;
    int count = 1000;  ///< Positions to find before stopping.
    std::optional<std::uint64_t> seed;
    bool verbose = false;
    bool show_help = false;

    /// Movetime rounded to whole milliseconds.
    [[nodiscard]] int movetime_ms() const noexcept;
};

/// Parse argv. Throws std::invalid_argument on unknown options, missing or
/// malformed values, and on settings that cannot work (e.g. 49 pawns).
[[nodiscard]] SearchConfig parse_command_line(int argc, const char* const* argv);

/// Check a material string: piece letters only, at most 64 pieces and
/// 48 pawns. Throws std::invalid_argument.
void validate_material(std::string_view material);

[[nodiscard]] std::string usage(std::string_view program);

}  // namespace fenprobe
