/// @file uci.cpp
/// Protocol formatting and parsing helpers.

#include <fenprobe/uci.hpp>

#include <fenprobe/errors.hpp>

#include <charconv>
#include <string>
#include <vector>

namespace fenprobe::uci {

// ── Helpers ─────────────────────────────────────────────────────────────────

namespace {

bool is_space(char ch) noexcept {
    return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n' || ch == '\f' || ch == '\v';
}

/// Split on whitespace.
std::vector<std::string_view> tokenize(std::string_view sv) {
    std::vector<std::string_view> parts;
    std::size_t i = 0;
    while (i < sv.size()) {
        while (i < sv.size() && is_space(sv[i])) ++i;
        if (i >= sv.size()) break;
        std::size_t start = i;
        while (i < sv.size() && !is_space(sv[i])) ++i;
        parts.push_back(sv.substr(start, i - start));
    }
    return parts;
}

}  // namespace

// ── Formatting ──────────────────────────────────────────────────────────────

std::string position_command(std::string_view fen) {
    std::string cmd = "position fen ";
    cmd += fen;
    return cmd;
}

std::string go_command(const GoLimits& limits) {
    std::string cmd = "go";
    if (limits.depth) {
        cmd += " depth ";
        cmd += std::to_string(*limits.depth);
    }
    if (limits.movetime_ms) {
        cmd += " movetime ";
        cmd += std::to_string(*limits.movetime_ms);
    }
    return cmd;
}

// ── Parsing ─────────────────────────────────────────────────────────────────

std::string_view trim(std::string_view line) noexcept {
    while (!line.empty() && is_space(line.front())) line.remove_prefix(1);
    while (!line.empty() && is_space(line.back())) line.remove_suffix(1);
    return line;
}

bool starts_with_token(std::string_view line, std::string_view token) noexcept {
    line = trim(line);
    if (line.substr(0, token.size()) != token)
        return false;
    return line.size() == token.size() || is_space(line[token.size()]);
}

bool has_score(std::string_view line) noexcept {
    std::size_t pos = 0;
    while ((pos = line.find(kScore, pos)) != std::string_view::npos) {
        bool left_ok = pos == 0 || is_space(line[pos - 1]);
        std::size_t end = pos + kScore.size();
        bool right_ok = end == line.size() || is_space(line[end]);
        if (left_ok && right_ok)
            return true;
        pos = end;
    }
    return false;
}

Score parse_score(std::string_view info_line) {
    auto tokens = tokenize(info_line);
    std::size_t idx = 0;
    while (idx < tokens.size() && tokens[idx] != kScore) ++idx;
    if (idx == tokens.size()) {
        throw ProtocolError("No score in info line: " + std::string(info_line));
    }
    if (idx + 2 >= tokens.size()) {
        throw ProtocolError("Truncated score in info line: " + std::string(info_line));
    }

    std::string_view unit = tokens[idx + 1];
    std::string_view text = tokens[idx + 2];
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        throw ProtocolError("Invalid score value in info line: " + std::string(info_line));
    }

    if (unit == "cp")
        return Centipawns{value};
    if (unit == "mate")
        return MateIn{value};
    throw ProtocolError("Unknown score unit '" + std::string(unit) +
                        "' in info line: " + std::string(info_line));
}

std::string parse_best_move(std::string_view line) {
    auto tokens = tokenize(line);
    if (tokens.size() < 2 || tokens[0] != kBestMove)
        return {};
    return std::string(tokens[1]);
}

// ── DiagnosticParser ────────────────────────────────────────────────────────

bool DiagnosticParser::feed(std::string_view line) {
    if (line.substr(0, kFenPrefix.size()) == kFenPrefix) {
        if (fen_) {
            throw ProtocolError("Duplicate Fen line in diagnostic output");
        }
        fen_ = std::string(line.substr(kFenPrefix.size()));
    } else if (line.substr(0, kCheckersPrefix.size()) == kCheckersPrefix) {
        if (in_check_) {
            throw ProtocolError("Duplicate Checkers line in diagnostic output");
        }
        in_check_ = !trim(line.substr(kCheckersPrefix.size())).empty();
    }
    return done();
}

DiagnosticParser::Result DiagnosticParser::result() const {
    if (!fen_) {
        throw ProtocolError("Diagnostic output has no Fen line");
    }
    if (!in_check_) {
        throw ProtocolError("Diagnostic output has no Checkers line");
    }
    return {*fen_, *in_check_};
}

}  // namespace fenprobe::uci
