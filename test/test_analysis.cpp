#include <gtest/gtest.h>

#include "kcalfit/analysis.h"
#include "kcalfit/simulate.h"

using namespace kcalfit;

namespace {

AnalysisInput inputFrom(const Journal &journal) {
    AnalysisInput input;
    input.entries = journal.entries.entries();
    input.measurements = journal.measurements.rows();
    input.settings = journal.settings;
    return input;
}

}  // namespace

// ============================================================================
// Simulated journey
// ============================================================================

TEST(SimulateTest, SameSeedSameJournal) {
    const Journal a = simulateJourney(7);
    const Journal b = simulateJourney(7);
    ASSERT_EQ(a.entries.size(), b.entries.size());
    for (std::size_t i = 0; i < a.entries.size(); ++i) {
        EXPECT_EQ(a.entries.entries()[i].date, b.entries.entries()[i].date);
        EXPECT_DOUBLE_EQ(a.entries.entries()[i].weight, b.entries.entries()[i].weight);
    }
    EXPECT_EQ(a.measurements.size(), b.measurements.size());
}

TEST(SimulateTest, CoversTheJourney) {
    const Journal j = simulateJourney(42);
    ASSERT_FALSE(j.entries.empty());
    EXPECT_GE(j.entries.entries().front().date, Date::fromYmd(2023, 1, 1));
    EXPECT_LE(j.entries.entries().back().date, Date::fromYmd(2024, 7, 1));
    EXPECT_GT(j.entries.size(), 100u);
    EXPECT_GT(j.measurements.size(), 0u);
    EXPECT_DOUBLE_EQ(*j.settings.startingBodyFat, 12.0);

    // Every body-fat reading has a weigh-in on the same day.
    for (const auto &m : j.measurements.rows()) {
        bool found = false;
        for (const auto &e : j.entries.entries()) found |= e.date == m.date;
        EXPECT_TRUE(found) << m.date.str();
    }
}

// ============================================================================
// Full recomputation
// ============================================================================

TEST(AnalysisTest, ProducesEveryView) {
    const Journal j = simulateJourney(42);
    const Analysis a = analyze(inputFrom(j));

    EXPECT_FALSE(a.periods.empty());
    ASSERT_TRUE(a.inference.has_value());
    EXPECT_TRUE(isReliable(*a.inference));
    EXPECT_GT(a.inference->weightChangeRate, 0.0);
    EXPECT_GT(a.empirical.intervals, 0);
    EXPECT_EQ(a.bodyComposition.estimates.size(), j.entries.size());
}

TEST(AnalysisTest, WindowLimitsTrendEntries) {
    const Journal j = simulateJourney(42);
    AnalysisInput input = inputFrom(j);
    input.window = TrendWindow{30};
    const Analysis a = analyze(input);

    ASSERT_FALSE(a.trendEntries.empty());
    EXPECT_GE(a.trendEntries.front().date, a.trendEntries.back().date - 29);
    EXPECT_LT(a.trendEntries.size(), j.entries.size());
}

TEST(AnalysisTest, CalibrationConvergesAfterOneCommit) {
    const Journal j = simulateJourney(42);
    AnalysisInput input = inputFrom(j);

    const Analysis first = analyze(input);
    if (commitCalibration(input.settings, first.bodyComposition)) {
        const Analysis second = analyze(input);
        EXPECT_FALSE(second.bodyComposition.newCalibration.has_value());
    }
    const Analysis third = analyze(input);
    EXPECT_FALSE(third.bodyComposition.newCalibration.has_value());
}

TEST(AnalysisTest, NoticeFlagsRecentGain) {
    AnalysisInput input;
    const Date start = Date::fromYmd(2024, 3, 4);
    for (int d = 0; d < 60; ++d) input.entries.push_back({start + d, 80.0, 2400.0});
    for (int d = 60; d < 90; ++d) {
        input.entries.push_back({start + d, 80.0 + 0.05 * (d - 59), 2600.0});
    }

    const Analysis a = analyze(input);
    ASSERT_TRUE(a.notice.has_value());
    EXPECT_EQ(a.notice->direction, NoticeDirection::GainLargerThanExpected);
    EXPECT_GT(a.notice->suggestedAdjustment, 0.0);

    EXPECT_NEAR(a.notice->maintenance, 2400.0, 1e-6);

    input.window = TrendWindow{30};
    const Analysis windowed = analyze(input);
    ASSERT_TRUE(windowed.notice.has_value());
    EXPECT_NEAR(windowed.notice->suggestedAdjustment, a.notice->suggestedAdjustment, 1e-9);
}

TEST(AnalysisTest, EmptyJournal) {
    const Analysis a = analyze(AnalysisInput{});
    EXPECT_TRUE(a.periods.empty());
    EXPECT_FALSE(a.inference.has_value());
    EXPECT_FALSE(a.notice.has_value());
    EXPECT_TRUE(a.bodyComposition.estimates.empty());
}
