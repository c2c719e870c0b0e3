#pragma once

/// @file engine_session.hpp
/// Session with one external UCI engine process.
///
/// The session owns the process, frames every request/response exchange and
/// hides crash recovery: an engine that dies while a position is being
/// loaded is reaped and relaunched, and the caller only sees
/// PositionStatus::Fault. Every other failure is fatal and thrown.
///
/// Reads never time out. An engine that stops answering blocks the caller.
/// A session is not thread-safe.

#include <fenprobe/evaluation.hpp>
#include <fenprobe/process.hpp>
#include <fenprobe/uci.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fenprobe {

// ── Tracing ─────────────────────────────────────────────────────────────────

enum class TraceEvent {
    Send,     ///< A line written to the engine.
    Receive,  ///< A line read from the engine.
    Note,     ///< Lifecycle event (launch, crash, restart, shutdown).
};

using TraceSink = std::function<void(TraceEvent, std::string_view)>;

// ── Options ─────────────────────────────────────────────────────────────────

struct EngineOptions {
    std::string executable;
    std::vector<std::string> arguments;  ///< Passed after argv[0].
    TraceSink trace;                     ///< Optional.
};

// ── State ───────────────────────────────────────────────────────────────────

enum class SessionState {
    Unstarted,
    Ready,
    AwaitingResponse,
    Faulted,
    Stopped,
};

[[nodiscard]] constexpr const char* to_string(SessionState s) noexcept {
    switch (s) {
        case SessionState::Unstarted:
            return "Unstarted";
        case SessionState::Ready:
            return "Ready";
        case SessionState::AwaitingResponse:
            return "AwaitingResponse";
        case SessionState::Faulted:
            return "Faulted";
        case SessionState::Stopped:
            return "Stopped";
    }
    return "?";
}

// ── EngineSession ───────────────────────────────────────────────────────────

class EngineSession {
   public:
    explicit EngineSession(EngineOptions options);
    explicit EngineSession(std::string executable);

    /// Sends `quit` and reaps the engine if stop() was not called.
    ~EngineSession();

    EngineSession(const EngineSession&) = delete;
    EngineSession& operator=(const EngineSession&) = delete;
    EngineSession(EngineSession&&) = delete;
    EngineSession& operator=(EngineSession&&) = delete;

    /// Launch the engine and complete the `uci` / `uciok` handshake.
    /// Valid from Unstarted or Stopped.
    void start();

    /// Send `quit` and wait for the engine to exit. Valid once started.
    void stop();

    /// Load `fen` into a fresh game and report whether the mover is in check.
    ///
    /// Returns PositionStatus::Fault if the engine died on the position; the
    /// engine has then been restarted and the session is Ready again. Throws
    /// ProtocolError if the engine echoes a different position.
    [[nodiscard]] PositionStatus submit_position(std::string_view fen);

    /// Search the last accepted position and return the final reported score.
    /// At least one limit must be given. A crash here is a ProtocolError.
    [[nodiscard]] EvaluationResult evaluate(const uci::GoLimits& limits);

    [[nodiscard]] EvaluationResult evaluate(std::optional<int> depth,
                                            std::optional<int> movetime_ms) {
        return evaluate(uci::GoLimits{depth, movetime_ms});
    }

    // ── Observers ───────────────────────────────────────────────────────

    [[nodiscard]] SessionState state() const noexcept { return state_; }

    /// Number of crash-triggered relaunches since construction.
    [[nodiscard]] int restart_count() const noexcept { return restarts_; }

    /// How the most recent unexpected exit ended, if any.
    [[nodiscard]] const std::optional<ExitStatus>& last_exit() const noexcept {
        return last_exit_;
    }

    [[nodiscard]] const EngineOptions& options() const noexcept { return options_; }

   private:
    void launch();
    void recover();
    [[nodiscard]] bool probe_alive();
    [[nodiscard]] uci::DiagnosticParser::Result query_diagnostics();

    [[nodiscard]] bool try_send(std::string_view line);
    void send(std::string_view line);
    [[nodiscard]] std::optional<std::string> receive();
    [[nodiscard]] std::string expect_line(std::string_view waiting_for);

    void require_ready(std::string_view operation) const;
    void trace(TraceEvent event, std::string_view text) const;

    EngineOptions options_;
    Process process_;
    SessionState state_ = SessionState::Unstarted;
    bool position_loaded_ = false;
    int restarts_ = 0;
    std::optional<ExitStatus> last_exit_;
};

}  // namespace fenprobe
