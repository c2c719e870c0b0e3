/// @file search_config.cpp
/// Command-line parsing for the search tool.

#include <fenprobe/search_config.hpp>

#include <fenprobe/board.hpp>

#include <charconv>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace fenprobe {

// ── Helpers ─────────────────────────────────────────────────────────────────

namespace {

template <typename T>
T parse_number(std::string_view option, std::string_view text) {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        throw std::invalid_argument("Invalid value for " + std::string(option) + ": '" +
                                    std::string(text) + "'");
    }
    return value;
}

double parse_seconds(std::string_view option, std::string_view text) {
    // The whole string must be consumed.
    std::string s(text);
    std::size_t used = 0;
    double value = 0.0;
    try {
        value = std::stod(s, &used);
    } catch (const std::logic_error&) {
        used = 0;
    }
    if (s.empty() || used != s.size() || !std::isfinite(value)) {
        throw std::invalid_argument("Invalid value for " + std::string(option) + ": '" + s +
                                    "'");
    }
    return value;
}

}  // namespace

// ── SearchConfig ────────────────────────────────────────────────────────────

int SearchConfig::movetime_ms() const noexcept {
    return static_cast<int>(std::lround(movetime_seconds * 1000.0));
}

void validate_material(std::string_view material) {
    int pawns = 0;
    for (char ch : material) {
        Piece p = Piece::from_symbol(ch);
        if (p.type == PieceType::None) {
            throw std::invalid_argument(std::string("Invalid piece symbol in material: '") + ch +
                                        "'");
        }
        if (p.is_pawn())
            ++pawns;
    }
    if (material.size() > static_cast<std::size_t>(kNumSquares)) {
        throw std::invalid_argument("Material has " + std::to_string(material.size()) +
                                    " pieces, at most 64 fit on the board");
    }
    if (pawns > kNumPawnSquares) {
        throw std::invalid_argument("Material has " + std::to_string(pawns) + " pawns, at most " +
                                    std::to_string(kNumPawnSquares) + " fit on ranks 2-7");
    }
}

SearchConfig parse_command_line(int argc, const char* const* argv) {
    SearchConfig cfg;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        auto value = [&]() -> std::string_view {
            if (i + 1 >= argc) {
                throw std::invalid_argument("Missing value for " + std::string(arg));
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            cfg.show_help = true;
        } else if (arg == "-m" || arg == "--material") {
            cfg.material = value();
        } else if (arg == "-e" || arg == "--executable") {
            cfg.executables = value();
        } else if (arg == "--no-highlight") {
            cfg.highlight = false;
        } else if (arg == "--highlight-threshold") {
            cfg.highlight_threshold = parse_number<int>(arg, value());
        } else if (arg == "--movetime") {
            cfg.movetime_seconds = parse_seconds(arg, value());
        } else if (arg == "--depth") {
            cfg.depth = parse_number<int>(arg, value());
        } else if (arg == "-n" || arg == "--count") {
            cfg.count = parse_number<int>(arg, value());
        } else if (arg == "--seed") {
            cfg.seed = parse_number<std::uint64_t>(arg, value());
        } else if (arg == "-v" || arg == "--verbose") {
            cfg.verbose = true;
        } else {
            throw std::invalid_argument("Unknown option: " + std::string(arg));
        }
    }

    if (cfg.show_help)
        return cfg;

    validate_material(cfg.material);
    // movetime_ms() must stay within int.
    if (cfg.movetime_seconds * 1000.0 > static_cast<double>(std::numeric_limits<int>::max())) {
        throw std::invalid_argument("--movetime is too large");
    }
    if (cfg.movetime_ms() <= 0) {
        throw std::invalid_argument("--movetime must be positive");
    }
    if (cfg.depth && *cfg.depth <= 0) {
        throw std::invalid_argument("--depth must be positive");
    }
    if (cfg.count <= 0) {
        throw std::invalid_argument("--count must be positive");
    }
    return cfg;
}

std::string usage(std::string_view program) {
    std::string text = "Usage: " + std::string(program) + " [options]\n";
    text +=
        "Find interesting positions using the Stockfish chess engine.\n"
        "\n"
        "  -m, --material <pieces>      material to place randomly on the board\n"
        "                               (default " +
        std::string(kDefaultMaterial) +
        ")\n"
        "  -e, --executable <list>      path to the Stockfish executable; may be a\n"
        "                               comma-separated list (default " +
        std::string(kDefaultExecutables) +
        ")\n"
        "      --no-highlight           do not highlight lines with small absolute\n"
        "                               centipawn value\n"
        "      --highlight-threshold <cp>  highlight threshold (default 20)\n"
        "      --movetime <seconds>     move time for position evaluation (default 1.0)\n"
        "      --depth <n>              also limit the search depth\n"
        "  -n, --count <n>              positions to find (default 1000)\n"
        "      --seed <n>               random seed (default: nondeterministic)\n"
        "  -v, --verbose                trace engine traffic on stderr\n"
        "  -h, --help                   show this help\n";
    return text;
}

}  // namespace fenprobe
