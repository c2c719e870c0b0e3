/// @file test_search.cpp
/// Tests for search.hpp: report formatting and the search loop against the
/// fake engine.

#include <fenprobe/search.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#ifndef FENPROBE_FAKE_ENGINE
#error "FENPROBE_FAKE_ENGINE must name the fake engine executable"
#endif

namespace fenprobe {

namespace {

std::vector<std::string> lines_of(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream is(text);
    std::string line;
    while (std::getline(is, line)) lines.push_back(line);
    return lines;
}

SearchConfig small_config(std::string material, int count) {
    SearchConfig cfg;
    cfg.material = std::move(material);
    cfg.count = count;
    cfg.movetime_seconds = 0.01;
    cfg.seed = 42;
    return cfg;
}

}  // namespace

// ── Report formatting ───────────────────────────────────────────────────────

TEST(Search, FormatReport) {
    EvaluationResult r{Centipawns{35}, std::chrono::milliseconds(1500), "e2e4"};
    EXPECT_EQ(format_report(7, r, "4k3/8/8/8/8/8/8/4K3 w - - 0 1"),
              "     7 evaluation cp 35                duration      1.500 fen "
              "4k3/8/8/8/8/8/8/4K3 w - - 0 1 ");
}

TEST(Search, FormatReportMate) {
    EvaluationResult r{MateIn{-2}, std::chrono::milliseconds(250), "(none)"};
    EXPECT_EQ(format_report(123456, r, "x"),
              "123456 evaluation mate -2              duration      0.250 fen x ");
}

TEST(Search, ShouldHighlight) {
    EXPECT_TRUE(should_highlight(Centipawns{0}, 20));
    EXPECT_TRUE(should_highlight(Centipawns{19}, 20));
    EXPECT_TRUE(should_highlight(Centipawns{-19}, 20));
    EXPECT_FALSE(should_highlight(Centipawns{20}, 20));
    EXPECT_FALSE(should_highlight(Centipawns{-20}, 20));
    EXPECT_FALSE(should_highlight(MateIn{1}, 20));
    EXPECT_FALSE(should_highlight(Centipawns{0}, 0));
}

// ── PositionSearch ──────────────────────────────────────────────────────────

class PositionSearchTest : public ::testing::Test {
   protected:
    void SetUp() override { session_.start(); }
    void TearDown() override {
        if (session_.state() != SessionState::Stopped)
            session_.stop();
    }

    EngineSession session_{std::string(FENPROBE_FAKE_ENGINE)};
    std::ostringstream out_;
};

TEST_F(PositionSearchTest, FindsRequestedCount) {
    PositionSearch search(session_, small_config("KkRrNnPp", 3), out_);
    SearchStats stats = search.run();

    EXPECT_EQ(stats.found, 3);
    EXPECT_EQ(stats.faults, 0);
    EXPECT_EQ(stats.generated, stats.found + stats.faults + stats.in_check);

    auto lines = lines_of(out_.str());
    ASSERT_EQ(lines.size(), 3U);
    for (std::size_t i = 0; i < lines.size(); ++i) {
        EXPECT_NE(lines[i].find(" evaluation cp "), std::string::npos) << lines[i];
        EXPECT_NE(lines[i].find(" w - - 0 1 "), std::string::npos) << lines[i];
        EXPECT_NE(lines[i].find(std::to_string(i + 1) + " evaluation"), std::string::npos);
    }
}

TEST_F(PositionSearchTest, StepReturnsFinding) {
    PositionSearch search(session_, small_config("Kk", 1), out_);
    std::optional<Finding> finding;
    while (!finding) finding = search.step();

    EXPECT_EQ(finding->index, 1);
    EXPECT_EQ(finding->evaluation.score, Score{Centipawns{0}});
    EXPECT_EQ(finding->fen.substr(finding->fen.find(' ')), " w - - 0 1");
    EXPECT_TRUE(finding->highlighted);
    EXPECT_EQ(search.board().to_fen(Color::White), finding->fen);
    EXPECT_EQ(out_.str().rfind(std::string(kHighlightOn), 0), 0U);
    EXPECT_NE(out_.str().find(std::string(kHighlightOff) + "\n"), std::string::npos);
}

TEST_F(PositionSearchTest, NoHighlightWhenDisabled) {
    SearchConfig cfg = small_config("Kk", 2);
    cfg.highlight = false;
    PositionSearch search(session_, cfg, out_);
    search.run();
    EXPECT_EQ(out_.str().find('\x1b'), std::string::npos);
}

TEST_F(PositionSearchTest, LopsidedMaterialIsNotHighlighted) {
    PositionSearch search(session_, small_config("KkQQ", 2), out_);
    search.run();
    EXPECT_EQ(out_.str().find('\x1b'), std::string::npos) << out_.str();
}

TEST_F(PositionSearchTest, CrashingPositionsCountAsFaults) {
    // No black king: the engine dies on every submission.
    PositionSearch search(session_, small_config("KQ", 1), out_);
    for (int i = 0; i < 3; ++i) {
        EXPECT_FALSE(search.step().has_value());
    }
    EXPECT_EQ(search.stats().generated, 3);
    EXPECT_EQ(search.stats().faults, 3);
    EXPECT_EQ(search.stats().found, 0);
    EXPECT_EQ(session_.restart_count(), 3);
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(PositionSearchTest, SameSeedSamePositions) {
    std::ostringstream other;
    PositionSearch a(session_, small_config("KkRrBb", 3), out_);
    a.run();
    PositionSearch b(session_, small_config("KkRrBb", 3), other);
    b.run();

    auto la = lines_of(out_.str());
    auto lb = lines_of(other.str());
    ASSERT_EQ(la.size(), lb.size());
    for (std::size_t i = 0; i < la.size(); ++i) {
        EXPECT_EQ(la[i].substr(la[i].find(" fen ")), lb[i].substr(lb[i].find(" fen ")));
    }
}

}  // namespace fenprobe
