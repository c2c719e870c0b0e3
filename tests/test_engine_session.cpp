/// @file test_engine_session.cpp
/// Tests for EngineSession against the fake engine built alongside the tests.

#include <fenprobe/engine_session.hpp>
#include <fenprobe/errors.hpp>

#include <gtest/gtest.h>

#include <csignal>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#ifndef FENPROBE_FAKE_ENGINE
#error "FENPROBE_FAKE_ENGINE must name the fake engine executable"
#endif

namespace fenprobe {

namespace {

constexpr const char* kInCheck = "4k3/8/8/8/8/8/8/4R2K b - - 0 1";
constexpr const char* kQuiet = "4k3/8/8/8/8/8/8/R6K b - - 0 1";
constexpr const char* kLoneKing = "4k3/8/8/8/8/8/8/QR5K b - - 0 1";
constexpr const char* kNoBlackKing = "8/8/8/8/8/8/8/7K w - - 0 1";

}  // namespace

class EngineSessionTest : public ::testing::Test {
   protected:
    EngineOptions options(std::vector<std::string> flags = {}) {
        EngineOptions opts;
        opts.executable = FENPROBE_FAKE_ENGINE;
        opts.arguments = std::move(flags);
        opts.trace = [this](TraceEvent event, std::string_view text) {
            if (event == TraceEvent::Send)
                sent_.emplace_back(text);
            else if (event == TraceEvent::Note)
                notes_.emplace_back(text);
        };
        return opts;
    }

    std::vector<std::string> sent_;
    std::vector<std::string> notes_;
};

// ── Lifecycle ───────────────────────────────────────────────────────────────

TEST_F(EngineSessionTest, StartAndStop) {
    EngineSession s(options());
    EXPECT_EQ(s.state(), SessionState::Unstarted);
    s.start();
    EXPECT_EQ(s.state(), SessionState::Ready);
    ASSERT_FALSE(sent_.empty());
    EXPECT_EQ(sent_.front(), "uci");

    s.stop();
    EXPECT_EQ(s.state(), SessionState::Stopped);
    EXPECT_EQ(sent_.back(), "quit");
    EXPECT_EQ(s.restart_count(), 0);
}

TEST_F(EngineSessionTest, RestartAfterStop) {
    EngineSession s(options());
    s.start();
    s.stop();
    s.start();
    EXPECT_EQ(s.submit_position(kQuiet), PositionStatus::MoverNotInCheck);
    s.stop();
}

TEST_F(EngineSessionTest, DestructorShutsDownStartedEngine) {
    {
        EngineSession s(options());
        s.start();
    }
    EXPECT_EQ(sent_.size(), 1U);
}

TEST_F(EngineSessionTest, UsageErrors) {
    EngineSession s(options());
    EXPECT_THROW(s.stop(), UsageError);
    EXPECT_THROW((void)s.submit_position(kQuiet), UsageError);
    EXPECT_THROW((void)s.evaluate(1, std::nullopt), UsageError);

    s.start();
    EXPECT_THROW(s.start(), UsageError);
    EXPECT_THROW((void)s.evaluate(1, std::nullopt), UsageError);
    s.stop();
    EXPECT_THROW(s.stop(), UsageError);
}

TEST_F(EngineSessionTest, MissingExecutable) {
    EngineSession s("/nonexistent/stockfish");
    EXPECT_THROW(s.start(), ProcessError);
    EXPECT_EQ(s.state(), SessionState::Faulted);
}

TEST_F(EngineSessionTest, EngineExitsDuringHandshake) {
    EngineSession s(options({"--exit-before-uciok"}));
    EXPECT_THROW(s.start(), ProtocolError);
    EXPECT_EQ(s.state(), SessionState::Faulted);
    ASSERT_TRUE(s.last_exit().has_value());
    EXPECT_EQ(s.last_exit()->code, 3);
}

// ── Position submission ─────────────────────────────────────────────────────

TEST_F(EngineSessionTest, ReportsCheck) {
    EngineSession s(options());
    s.start();
    EXPECT_EQ(s.submit_position(kInCheck), PositionStatus::MoverInCheck);
    EXPECT_EQ(s.submit_position(kQuiet), PositionStatus::MoverNotInCheck);
    EXPECT_EQ(s.state(), SessionState::Ready);
}

TEST_F(EngineSessionTest, SubmissionStartsNewGame) {
    EngineSession s(options());
    s.start();
    sent_.clear();
    (void)s.submit_position(kQuiet);
    ASSERT_GE(sent_.size(), 4U);
    EXPECT_EQ(sent_[0], "ucinewgame");
    EXPECT_EQ(sent_[1], std::string("position fen ") + kQuiet);
    EXPECT_EQ(sent_[2], "isready");
    EXPECT_EQ(sent_[3], "d");
}

TEST_F(EngineSessionTest, CrashIsReportedAsFaultAndRecovered) {
    EngineSession s(options());
    s.start();

    EXPECT_EQ(s.submit_position(kNoBlackKing), PositionStatus::Fault);
    EXPECT_EQ(s.state(), SessionState::Ready);
    EXPECT_EQ(s.restart_count(), 1);
    ASSERT_TRUE(s.last_exit().has_value());
    EXPECT_EQ(s.last_exit()->signal, SIGKILL);

    EXPECT_EQ(s.submit_position(kQuiet), PositionStatus::MoverNotInCheck);
    EXPECT_EQ(s.restart_count(), 1);

    EXPECT_EQ(s.submit_position(kNoBlackKing), PositionStatus::Fault);
    EXPECT_EQ(s.restart_count(), 2);
    s.stop();
}

TEST_F(EngineSessionTest, FaultClearsLoadedPosition) {
    EngineSession s(options());
    s.start();
    ASSERT_EQ(s.submit_position(kQuiet), PositionStatus::MoverNotInCheck);
    ASSERT_EQ(s.submit_position(kNoBlackKing), PositionStatus::Fault);
    EXPECT_THROW((void)s.evaluate(1, std::nullopt), UsageError);
}

TEST_F(EngineSessionTest, EchoMismatchIsProtocolError) {
    EngineSession s(options({"--mismatch-fen"}));
    s.start();
    EXPECT_THROW((void)s.submit_position(kQuiet), ProtocolError);
    EXPECT_EQ(s.state(), SessionState::Faulted);
    s.stop();
    EXPECT_EQ(s.state(), SessionState::Stopped);
}

// ── Evaluation ──────────────────────────────────────────────────────────────

TEST_F(EngineSessionTest, EvaluateReturnsLastScore) {
    EngineSession s(options());
    s.start();
    ASSERT_EQ(s.submit_position(kLoneKing), PositionStatus::MoverNotInCheck);

    EvaluationResult r = s.evaluate(2, std::nullopt);
    EXPECT_EQ(r.score, Score{Centipawns{-1400}});
    EXPECT_EQ(r.best_move, "0000");
    EXPECT_GE(r.elapsed_seconds(), 0.0);
    EXPECT_EQ(s.state(), SessionState::Ready);
    EXPECT_EQ(sent_.back(), "go depth 2");
}

TEST_F(EngineSessionTest, EvaluateRepeatsOnSamePosition) {
    EngineSession s(options());
    s.start();
    ASSERT_EQ(s.submit_position(kLoneKing), PositionStatus::MoverNotInCheck);
    EvaluationResult first = s.evaluate(uci::GoLimits{std::nullopt, 50});
    EvaluationResult second = s.evaluate(uci::GoLimits{std::nullopt, 50});
    EXPECT_EQ(first.score, second.score);
}

TEST_F(EngineSessionTest, EvaluateNeedsALimit) {
    EngineSession s(options());
    s.start();
    ASSERT_EQ(s.submit_position(kQuiet), PositionStatus::MoverNotInCheck);
    EXPECT_THROW((void)s.evaluate(uci::GoLimits{}), std::invalid_argument);
    EXPECT_EQ(s.state(), SessionState::Ready);
}

TEST_F(EngineSessionTest, MateScore) {
    EngineSession s(options({"--mate"}));
    s.start();
    ASSERT_EQ(s.submit_position(kLoneKing), PositionStatus::MoverNotInCheck);
    EvaluationResult r = s.evaluate(1, std::nullopt);
    ASSERT_TRUE(is_mate(r.score));
    EXPECT_EQ(r.score, Score{MateIn{-3}});
    EXPECT_FALSE(centipawns(r.score).has_value());
}

TEST_F(EngineSessionTest, NoScoredInfoIsProtocolError) {
    EngineSession s(options({"--no-info"}));
    s.start();
    ASSERT_EQ(s.submit_position(kQuiet), PositionStatus::MoverNotInCheck);
    EXPECT_THROW((void)s.evaluate(1, std::nullopt), ProtocolError);
    EXPECT_EQ(s.state(), SessionState::Faulted);
}

TEST_F(EngineSessionTest, CrashDuringSearchIsFatal) {
    EngineSession s(options({"--crash-on-go"}));
    s.start();
    ASSERT_EQ(s.submit_position(kQuiet), PositionStatus::MoverNotInCheck);
    EXPECT_THROW((void)s.evaluate(1, std::nullopt), ProtocolError);
    EXPECT_EQ(s.state(), SessionState::Faulted);
    EXPECT_EQ(s.restart_count(), 0);
    EXPECT_THROW((void)s.submit_position(kQuiet), UsageError);
    s.stop();
}

// ── Misc ────────────────────────────────────────────────────────────────────

TEST(SessionState, Names) {
    EXPECT_STREQ(to_string(SessionState::Unstarted), "Unstarted");
    EXPECT_STREQ(to_string(SessionState::AwaitingResponse), "AwaitingResponse");
    EXPECT_STREQ(to_string(PositionStatus::MoverInCheck), "MoverInCheck");
}

}  // namespace fenprobe
