/// @file test_stockfish.cpp
/// Session tests against a real Stockfish binary.
///
/// Skipped unless FENPROBE_STOCKFISH names the executable.

#include <fenprobe/board.hpp>
#include <fenprobe/engine_session.hpp>

#include <gtest/gtest.h>

#include <cstdlib>
#include <random>
#include <string>
#include <variant>

namespace fenprobe {

class StockfishTest : public ::testing::Test {
   protected:
    void SetUp() override {
        const char* exe = std::getenv("FENPROBE_STOCKFISH");
        if (!exe || !*exe)
            GTEST_SKIP() << "FENPROBE_STOCKFISH not set";
        executable_ = exe;
    }

    std::string executable_;
};

TEST_F(StockfishTest, InitialPositionIsQuiet) {
    EngineSession s(executable_);
    s.start();
    std::string fen = Board::initial().to_fen(Color::White);
    EXPECT_EQ(s.submit_position(fen), PositionStatus::MoverNotInCheck);

    EvaluationResult r = s.evaluate(8, std::nullopt);
    auto cp = centipawns(r.score);
    ASSERT_TRUE(cp.has_value()) << to_string(r.score);
    EXPECT_LT(*cp, 100);
    EXPECT_GT(*cp, -100);
    EXPECT_FALSE(r.best_move.empty());
    s.stop();
}

TEST_F(StockfishTest, DetectsCheck) {
    EngineSession s(executable_);
    s.start();
    EXPECT_EQ(s.submit_position("4k3/8/8/8/8/8/8/4R2K b - - 0 1"), PositionStatus::MoverInCheck);
    s.stop();
}

TEST_F(StockfishTest, MaterialAdvantageShowsInScore) {
    EngineSession s(executable_);
    s.start();
    ASSERT_EQ(s.submit_position("4k3/8/8/8/8/8/8/QR5K b - - 0 1"),
              PositionStatus::MoverNotInCheck);
    EvaluationResult r = s.evaluate(6, std::nullopt);
    if (auto cp = centipawns(r.score)) {
        EXPECT_LT(*cp, -500);
    } else {
        EXPECT_LT(std::get<MateIn>(r.score).moves, 0);
    }
    s.stop();
}

TEST_F(StockfishTest, RandomPositionsNeverWedgeTheSession) {
    EngineSession s(executable_);
    s.start();
    std::mt19937_64 rng(1);
    Board board;
    for (int i = 0; i < 20; ++i) {
        board.reset_empty();
        board.scatter("KkQqRrBbNnPPPPpppp", rng);
        (void)s.submit_position(board.to_fen(Color::White));
        EXPECT_EQ(s.state(), SessionState::Ready);
    }
    s.stop();
}

}  // namespace fenprobe
