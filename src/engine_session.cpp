/// @file engine_session.cpp
/// Engine session: lifecycle, position check, crash recovery, evaluation.

#include <fenprobe/engine_session.hpp>

#include <fenprobe/errors.hpp>

#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

namespace fenprobe {

// ── Construction ────────────────────────────────────────────────────────────

EngineSession::EngineSession(EngineOptions options) : options_(std::move(options)) {}

EngineSession::EngineSession(std::string executable)
    : EngineSession(EngineOptions{std::move(executable), {}, {}}) {}

EngineSession::~EngineSession() {
    if (!process_.valid())
        return;
    try {
        if (process_.write_line(uci::kQuit))
            process_.wait();
    } catch (const ProcessError&) {
        // Process's destructor kills and reaps the child.
    }
}

// ── Lifecycle ───────────────────────────────────────────────────────────────

void EngineSession::start() {
    if (state_ != SessionState::Unstarted && state_ != SessionState::Stopped) {
        throw UsageError(std::string("start() called in state ") + to_string(state_));
    }
    state_ = SessionState::AwaitingResponse;
    try {
        launch();
    } catch (...) {
        state_ = SessionState::Faulted;
        process_ = Process{};
        throw;
    }
    position_loaded_ = false;
    state_ = SessionState::Ready;
}

void EngineSession::stop() {
    if (state_ == SessionState::Unstarted || state_ == SessionState::Stopped) {
        throw UsageError(std::string("stop() called in state ") + to_string(state_));
    }
    if (process_.valid()) {
        if (!try_send(uci::kQuit))
            trace(TraceEvent::Note, "engine input already closed");
        process_.close_input();
        ExitStatus status = process_.wait();
        trace(TraceEvent::Note, "engine stopped: " + status.to_string());
        process_ = Process{};
    }
    position_loaded_ = false;
    state_ = SessionState::Stopped;
}

void EngineSession::launch() {
    process_ = Process::spawn(options_.executable, options_.arguments);
    trace(TraceEvent::Note, "launched " + options_.executable + " (pid " +
                                std::to_string(process_.pid()) + ")");

    send(uci::kUci);
    while (expect_line("uciok") != uci::kUciOk) {
    }
}

void EngineSession::recover() {
    state_ = SessionState::Faulted;
    last_exit_ = process_.wait();
    trace(TraceEvent::Note, "engine crashed: " + last_exit_->to_string());
    process_ = Process{};

    launch();
    ++restarts_;
    trace(TraceEvent::Note, "engine restarted");
}

// ── Position submission ─────────────────────────────────────────────────────

PositionStatus EngineSession::submit_position(std::string_view fen) {
    require_ready("submit_position");
    state_ = SessionState::AwaitingResponse;
    position_loaded_ = false;

    try {
        bool alive = try_send(uci::kNewGame) && try_send(uci::position_command(fen)) &&
                     probe_alive();
        if (!alive) {
            recover();
            state_ = SessionState::Ready;
            return PositionStatus::Fault;
        }

        auto diag = query_diagnostics();
        if (diag.fen != fen) {
            throw ProtocolError("Position was not set correctly: sent '" + std::string(fen) +
                                "', engine reports '" + diag.fen + "'");
        }

        position_loaded_ = true;
        state_ = SessionState::Ready;
        return diag.in_check ? PositionStatus::MoverInCheck : PositionStatus::MoverNotInCheck;
    } catch (...) {
        state_ = SessionState::Faulted;
        throw;
    }
}

bool EngineSession::probe_alive() {
    if (!try_send(uci::kIsReady))
        return false;
    for (;;) {
        if (process_.poll())
            return false;
        auto line = receive();
        if (!line)
            return false;
        if (*line == uci::kReadyOk)
            return true;
    }
}

uci::DiagnosticParser::Result EngineSession::query_diagnostics() {
    send(uci::kDisplay);
    uci::DiagnosticParser parser;
    while (!parser.feed(expect_line("Checkers:"))) {
    }
    return parser.result();
}

// ── Evaluation ──────────────────────────────────────────────────────────────

EvaluationResult EngineSession::evaluate(const uci::GoLimits& limits) {
    require_ready("evaluate");
    if (!position_loaded_) {
        throw UsageError("evaluate() called before a position was accepted");
    }
    if (limits.empty()) {
        throw std::invalid_argument("evaluate() needs a depth or a movetime");
    }
    state_ = SessionState::AwaitingResponse;

    try {
        const auto t0 = std::chrono::steady_clock::now();
        send(uci::go_command(limits));

        std::optional<std::string> info;
        std::string best_move;
        for (;;) {
            std::string line = expect_line("bestmove");
            if (uci::starts_with_token(line, uci::kBestMove)) {
                best_move = uci::parse_best_move(line);
                break;
            }
            if (uci::starts_with_token(line, uci::kInfo) && uci::has_score(line))
                info = std::move(line);
        }
        const auto elapsed = std::chrono::steady_clock::now() - t0;

        if (!info) {
            throw ProtocolError("No info line with a score before bestmove");
        }

        EvaluationResult result{uci::parse_score(*info), elapsed, std::move(best_move)};
        state_ = SessionState::Ready;
        return result;
    } catch (...) {
        state_ = SessionState::Faulted;
        throw;
    }
}

// ── Line I/O ────────────────────────────────────────────────────────────────

bool EngineSession::try_send(std::string_view line) {
    trace(TraceEvent::Send, line);
    return process_.write_line(line);
}

void EngineSession::send(std::string_view line) {
    if (!try_send(line)) {
        throw ProtocolError("Engine closed its input before '" + std::string(line) + "'");
    }
}

std::optional<std::string> EngineSession::receive() {
    auto line = process_.read_line();
    if (!line)
        return std::nullopt;
    std::string trimmed(uci::trim(*line));
    trace(TraceEvent::Receive, trimmed);
    return trimmed;
}

std::string EngineSession::expect_line(std::string_view waiting_for) {
    auto line = receive();
    if (line)
        return std::move(*line);

    last_exit_ = process_.wait();
    trace(TraceEvent::Note, "engine exited: " + last_exit_->to_string());
    throw ProtocolError("Engine exited (" + last_exit_->to_string() + ") while waiting for '" +
                        std::string(waiting_for) + "'");
}

// ── Helpers ─────────────────────────────────────────────────────────────────

void EngineSession::require_ready(std::string_view operation) const {
    if (state_ != SessionState::Ready) {
        throw UsageError(std::string(operation) + "() called in state " + to_string(state_));
    }
}

void EngineSession::trace(TraceEvent event, std::string_view text) const {
    if (options_.trace)
        options_.trace(event, text);
}

}  // namespace fenprobe
