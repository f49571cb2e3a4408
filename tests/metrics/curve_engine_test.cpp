// Tests for the volatility and cumulative curve families.

#include "arcfortune/CurveEngine.h"

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

#include "arcfortune/Smoothing.h"

namespace arcfortune {
namespace {

std::vector<double> wave(std::size_t n) {
    std::vector<double> x;
    for (std::size_t i = 0; i < n; ++i) x.push_back(std::sin(static_cast<double>(i) * 0.1) * 0.8);
    return x;
}

// ---------------------------------------------------------------------------
// Cumulative family
// ---------------------------------------------------------------------------

TEST(CurveEngineTest, TwoSentenceWorkCumulativeTrack) {
    CurveEngine engine{PipelineConfig{}};
    const auto track = engine.build_cumulative({0.95, -0.90});

    ASSERT_EQ(track.running.values.size(), 2u);
    EXPECT_DOUBLE_EQ(track.running.values[0], 0.95);
    EXPECT_NEAR(track.running.values[1], 0.05, 1e-12);
    EXPECT_EQ(track.running.kind, CurveKind::Cumulative);

    // Too short for any cubic window.
    EXPECT_TRUE(track.macroArc.omitted);
    EXPECT_TRUE(track.macroArc.values.empty());
}

TEST(CurveEngineTest, RunningSumMatchesPrefixSums) {
    CurveEngine engine{PipelineConfig{}};
    const auto scores = wave(300);
    const auto track = engine.build_cumulative(scores);

    double acc = 0.0;
    for (std::size_t i = 0; i < scores.size(); ++i) {
        acc += scores[i];
        EXPECT_NEAR(track.running.values[i], acc, 1e-9);
    }
}

TEST(CurveEngineTest, MacroArcUsesFullWindowOnLongWorks) {
    CurveEngine engine{PipelineConfig{}};
    const auto track = engine.build_cumulative(wave(300));

    EXPECT_FALSE(track.macroArc.omitted);
    EXPECT_EQ(track.macroArc.kind, CurveKind::MacroArc);
    EXPECT_EQ(track.macroArc.requestedWindow, 201u);
    EXPECT_EQ(track.macroArc.window, 201u);
    EXPECT_EQ(track.macroArc.degree, 3);
    EXPECT_EQ(track.macroArc.values.size(), 300u);
}

TEST(CurveEngineTest, SecondaryCumulativeCurves) {
    CurveEngine engine{PipelineConfig{}};
    const auto track = engine.build_cumulative(wave(120));

    ASSERT_EQ(track.secondary.size(), 2u);
    EXPECT_EQ(track.secondary[0].kind, CurveKind::CumulativeSmoothed);
    EXPECT_EQ(track.secondary[0].window, 51u);
    EXPECT_EQ(track.secondary[1].kind, CurveKind::CumulativeRolling);
    EXPECT_EQ(track.secondary[1].window, 100u);
    for (const auto& c : track.secondary) EXPECT_EQ(c.values.size(), 120u);
}

// ---------------------------------------------------------------------------
// Volatility family
// ---------------------------------------------------------------------------

TEST(CurveEngineTest, ShortWorkReducesSmoothingWindows) {
    CurveEngine engine{PipelineConfig{}};
    const auto scores = wave(10);
    const auto vol = engine.build_volatility(scores);

    ASSERT_EQ(vol.smoothed.size(), 2u);
    EXPECT_EQ(vol.smoothed[0].requestedWindow, 51u);
    EXPECT_EQ(vol.smoothed[1].requestedWindow, 201u);
    for (const auto& c : vol.smoothed) {
        EXPECT_FALSE(c.omitted);
        EXPECT_EQ(c.window, 9u);
        EXPECT_EQ(c.values.size(), 10u);
        for (double v : c.values) EXPECT_FALSE(is_missing(v));
    }

    ASSERT_EQ(vol.rolling.size(), 2u);
    for (const auto& c : vol.rolling) {
        ASSERT_EQ(c.values.size(), 10u);
        for (double v : c.values) EXPECT_TRUE(is_missing(v));
    }

    const auto track = engine.build_cumulative(scores);
    EXPECT_EQ(track.macroArc.window, 9u);
    EXPECT_EQ(track.macroArc.values.size(), 10u);
}

TEST(CurveEngineTest, ConfiguredWindowsAreHonoured) {
    PipelineConfig config;
    config.rollingWindows = {5};
    config.smoothing = {{7, 2}};
    CurveEngine engine{config};
    const auto vol = engine.build_volatility(wave(40));

    ASSERT_EQ(vol.rolling.size(), 1u);
    EXPECT_EQ(vol.rolling[0].window, 5u);
    ASSERT_EQ(vol.smoothed.size(), 1u);
    EXPECT_EQ(vol.smoothed[0].window, 7u);
    EXPECT_EQ(vol.smoothed[0].degree, 2);
}

TEST(CurveEngineTest, EveryCurveMatchesScoreLength) {
    CurveEngine engine{PipelineConfig{}};
    for (std::size_t n : {5u, 37u, 150u, 420u}) {
        const auto scores = wave(n);
        const auto vol = engine.build_volatility(scores);
        for (const auto& c : vol.rolling) EXPECT_EQ(c.values.size(), n);
        for (const auto& c : vol.smoothed) EXPECT_EQ(c.values.size(), n);
        const auto track = engine.build_cumulative(scores);
        EXPECT_EQ(track.running.values.size(), n);
        EXPECT_EQ(track.macroArc.values.size(), n);
    }
}

TEST(CurveEngineTest, EmptyScoresOmitSmoothing) {
    CurveEngine engine{PipelineConfig{}};
    const auto vol = engine.build_volatility({});
    for (const auto& c : vol.smoothed) EXPECT_TRUE(c.omitted);
    for (const auto& c : vol.rolling) EXPECT_TRUE(c.values.empty());
    const auto track = engine.build_cumulative({});
    EXPECT_TRUE(track.running.values.empty());
    EXPECT_TRUE(track.macroArc.omitted);
}

}  // namespace
}  // namespace arcfortune
