#include <gtest/gtest.h>

#include <vector>

#include "kcalfit/intake_notice.h"

using namespace kcalfit;

namespace {

const Date kStart = Date::fromYmd(2024, 2, 5);

class FixedTrend : public TrendModel {
public:
    FixedTrend(double slope, double slopeHalfWidth, double maintenance,
               double maintenanceHalfWidth, double days = 31.0) {
        inference_.weightChangeRate = slope;
        inference_.slopeCI = {slope - slopeHalfWidth, slope + slopeHalfWidth};
        inference_.weightChangeRateCI = inference_.slopeCI;
        inference_.maintenanceCalories = maintenance;
        inference_.confidenceInterval = {maintenance - maintenanceHalfWidth,
                                         maintenance + maintenanceHalfWidth};
        inference_.daysOfData = days;
        inference_.averageIntake = maintenance;
    }

    std::optional<CaloricInference> infer(const std::vector<WeightEntry> &,
                                          ConfidenceLevel) const override {
        return inference_;
    }

private:
    CaloricInference inference_;
};

class FixedEmpirical : public EmpiricalModel {
public:
    FixedEmpirical() = default;
    explicit FixedEmpirical(const EmpiricalEstimate &est) : est_(est) {}

    EmpiricalEstimate estimate(const std::vector<WeightEntry> &,
                               ConfidenceLevel) const override {
        return est_;
    }

private:
    EmpiricalEstimate est_;
};

class RecordingTrend : public FixedTrend {
public:
    using FixedTrend::FixedTrend;

    std::optional<CaloricInference> infer(const std::vector<WeightEntry> &entries,
                                          ConfidenceLevel level) const override {
        seen.push_back(entries);
        return FixedTrend::infer(entries, level);
    }

    mutable std::vector<std::vector<WeightEntry>> seen;
};

class RecordingEmpirical : public EmpiricalModel {
public:
    EmpiricalEstimate estimate(const std::vector<WeightEntry> &entries,
                               ConfidenceLevel) const override {
        seen.push_back(entries);
        return EmpiricalEstimate{};
    }

    mutable std::vector<std::vector<WeightEntry>> seen;
};

std::vector<WeightEntry> loggedDays(std::optional<double> calories,
                                    double rate = 0.0, int days = 90) {
    std::vector<WeightEntry> entries;
    for (int d = 0; d < days; ++d) {
        entries.push_back({kStart + d, 75.0 + rate * d, calories});
    }
    return entries;
}

std::optional<IntakeNotice> detectWith(const TrendModel &trend, double intake) {
    const FixedEmpirical empirical{};
    const IntakeNoticeDetector detector(trend, empirical);
    return detector.detect(loggedDays(intake), ConfidenceLevel::P95);
}

// 60 days at `baselineKcal` gaining `baselineRate`, then 30 days at
// `recentKcal` gaining `recentRate`. `noise` alternates on the baseline.
std::vector<WeightEntry> twoStretches(double baselineRate, double baselineKcal,
                                      double recentRate, double recentKcal,
                                      double noise = 0.0) {
    std::vector<WeightEntry> entries;
    for (int d = 0; d < 60; ++d) {
        const double jitter = (d % 2 == 1) ? noise : -noise;
        entries.push_back({kStart + d, 75.0 + baselineRate * d + jitter, baselineKcal});
    }
    const double handover = 75.0 + baselineRate * 59;
    for (int d = 60; d < 90; ++d) {
        entries.push_back({kStart + d, handover + recentRate * (d - 59), recentKcal});
    }
    return entries;
}

std::optional<IntakeNotice> detectReal(const std::vector<WeightEntry> &entries) {
    const RegressionTrendModel trend;
    const PairwiseEmpiricalModel empirical{};
    const IntakeNoticeDetector detector(trend, empirical);
    return detector.detect(entries, ConfidenceLevel::P95);
}

}  // namespace

// ============================================================================
// Directions
// ============================================================================

TEST(IntakeNoticeTest, GainLargerThanExpected) {
    const FixedTrend trend(0.05, 0.005, 2500.0, 50.0);
    const auto notice = detectWith(trend, 2700.0);
    ASSERT_TRUE(notice.has_value());
    EXPECT_EQ(notice->direction, NoticeDirection::GainLargerThanExpected);
    EXPECT_NEAR(notice->expectedRate, 200.0 / 7700.0, 1e-12);
    EXPECT_NEAR(notice->suggestedAdjustment, 185.0, 1e-6);
    EXPECT_NEAR(notice->noiseBand, 0.005 + 50.0 / 7700.0, 1e-12);
    EXPECT_DOUBLE_EQ(notice->averageIntake, 2700.0);
    EXPECT_DOUBLE_EQ(notice->kcalPerKg, KCAL_PER_KG);
}

TEST(IntakeNoticeTest, GainDespiteDeficit) {
    const FixedTrend trend(0.03, 0.005, 2500.0, 50.0);
    const auto notice = detectWith(trend, 2200.0);
    ASSERT_TRUE(notice.has_value());
    EXPECT_EQ(notice->direction, NoticeDirection::GainDespiteDeficit);
    EXPECT_NEAR(notice->suggestedAdjustment, 531.0, 1e-6);
}

TEST(IntakeNoticeTest, LossDespiteSurplus) {
    const FixedTrend trend(-0.03, 0.005, 2500.0, 50.0);
    const auto notice = detectWith(trend, 2800.0);
    ASSERT_TRUE(notice.has_value());
    EXPECT_EQ(notice->direction, NoticeDirection::LossDespiteSurplus);
    EXPECT_NEAR(notice->suggestedAdjustment, -531.0, 1e-6);
}

TEST(IntakeNoticeTest, LossLargerThanExpected) {
    const FixedTrend trend(-0.08, 0.005, 2500.0, 50.0);
    const auto notice = detectWith(trend, 2200.0);
    ASSERT_TRUE(notice.has_value());
    EXPECT_EQ(notice->direction, NoticeDirection::LossLargerThanExpected);
    EXPECT_NEAR(notice->suggestedAdjustment, -316.0, 1e-6);
    EXPECT_LT(notice->observedRate, notice->expectedRate);
}

TEST(IntakeNoticeTest, DirectionNames) {
    EXPECT_EQ(toString(NoticeDirection::GainDespiteDeficit), "gain_despite_deficit");
    EXPECT_EQ(toString(NoticeDirection::LossLargerThanExpected),
              "loss_larger_than_expected");
}

// ============================================================================
// Silence
// ============================================================================

TEST(IntakeNoticeTest, SmallerLossThanExpectedIsSilent) {
    const FixedTrend trend(-0.01, 0.005, 2500.0, 50.0);
    EXPECT_FALSE(detectWith(trend, 2000.0).has_value());
}

TEST(IntakeNoticeTest, GapWithinNoiseIsSilent) {
    const FixedTrend trend(0.03, 0.005, 2500.0, 50.0);
    EXPECT_FALSE(detectWith(trend, 2700.0).has_value());
}

TEST(IntakeNoticeTest, ShortHistoryIsSilent) {
    const FixedTrend trend(0.05, 0.005, 2500.0, 50.0, 10.0);
    EXPECT_FALSE(detectWith(trend, 2700.0).has_value());
}

TEST(IntakeNoticeTest, NoCaloriesIsSilent) {
    const FixedTrend trend(0.05, 0.005, 2500.0, 50.0);
    const FixedEmpirical empirical{};
    const IntakeNoticeDetector detector(trend, empirical);
    EXPECT_FALSE(detector.detect(loggedDays(std::nullopt), ConfidenceLevel::P95).has_value());
}

TEST(IntakeNoticeTest, JudgesRecentStretchAgainstBaseline) {
    const RecordingTrend trend(0.05, 0.005, 2500.0, 50.0);
    const RecordingEmpirical empirical{};
    const IntakeNoticeDetector detector(trend, empirical, KCAL_PER_KG, 30, 45);
    ASSERT_TRUE(detector.detect(loggedDays(2700.0), ConfidenceLevel::P95).has_value());

    ASSERT_EQ(trend.seen.size(), 2u);
    EXPECT_EQ(trend.seen[0].size(), 30u);
    EXPECT_EQ(trend.seen[0].front().date, kStart + 60);
    EXPECT_EQ(trend.seen[1].size(), 45u);
    EXPECT_EQ(trend.seen[1].front().date, kStart + 15);
    EXPECT_EQ(trend.seen[1].back().date, kStart + 59);
    ASSERT_EQ(empirical.seen.size(), 1u);
    EXPECT_EQ(empirical.seen[0].size(), 45u);
}

// ============================================================================
// Regression and pairwise models
// ============================================================================

TEST(IntakeNoticeModelsTest, GainLargerThanExpected) {
    // Flat at 2500 kcal, then +0.05 kg/day on 2700 kcal: 200 kcal predicts
    // only 0.026 kg/day.
    const auto notice = detectReal(twoStretches(0.0, 2500.0, 0.05, 2700.0));
    ASSERT_TRUE(notice.has_value());
    EXPECT_EQ(notice->direction, NoticeDirection::GainLargerThanExpected);
    EXPECT_NEAR(notice->maintenance, 2500.0, 1e-6);
    EXPECT_NEAR(notice->observedRate, 0.05, 1e-9);
    EXPECT_NEAR(notice->suggestedAdjustment, 185.0, 1e-6);
    EXPECT_DOUBLE_EQ(notice->noiseBand, NOTICE_MIN_NOISE_KG_PER_DAY);
}

TEST(IntakeNoticeModelsTest, GainDespiteDeficit) {
    const auto notice = detectReal(twoStretches(0.0, 2500.0, 0.03, 2300.0));
    ASSERT_TRUE(notice.has_value());
    EXPECT_EQ(notice->direction, NoticeDirection::GainDespiteDeficit);
    EXPECT_NEAR(notice->suggestedAdjustment, 431.0, 1e-6);
}

TEST(IntakeNoticeModelsTest, LossDespiteSurplus) {
    const auto notice = detectReal(twoStretches(0.0, 2500.0, -0.03, 2700.0));
    ASSERT_TRUE(notice.has_value());
    EXPECT_EQ(notice->direction, NoticeDirection::LossDespiteSurplus);
    EXPECT_NEAR(notice->suggestedAdjustment, -431.0, 1e-6);
}

TEST(IntakeNoticeModelsTest, LossLargerThanExpected) {
    const auto notice = detectReal(twoStretches(0.0, 2500.0, -0.08, 2300.0));
    ASSERT_TRUE(notice.has_value());
    EXPECT_EQ(notice->direction, NoticeDirection::LossLargerThanExpected);
    EXPECT_NEAR(notice->suggestedAdjustment, -416.0, 1e-6);
}

TEST(IntakeNoticeModelsTest, NoisyBaselineStillFlagsLargeGain) {
    const auto notice = detectReal(twoStretches(0.0, 2500.0, 0.05, 2700.0, 0.1));
    ASSERT_TRUE(notice.has_value());
    EXPECT_EQ(notice->direction, NoticeDirection::GainLargerThanExpected);
    EXPECT_GT(notice->suggestedAdjustment, 0.0);
    EXPECT_NEAR(notice->maintenance, 2500.0, 5.0);
}

TEST(IntakeNoticeModelsTest, ConsistentJourneyIsSilent) {
    // +0.01 kg/day on 2500 kcal throughout.
    EXPECT_FALSE(detectReal(twoStretches(0.01, 2500.0, 0.01, 2500.0)).has_value());
}

TEST(IntakeNoticeModelsTest, SameIntakeSameTrendIsSilent) {
    EXPECT_FALSE(detectReal(twoStretches(0.0, 2500.0, 0.0, 2500.0)).has_value());
}

TEST(IntakeNoticeModelsTest, NoBaselineIsSilent) {
    // A month of gain on its own cannot separate intake error from a
    // different maintenance.
    EXPECT_FALSE(detectReal(loggedDays(2700.0, 0.05, 31)).has_value());
}

// ============================================================================
// Empirical energy density
// ============================================================================

TEST(IntakeNoticeTest, StableEmpiricalReplacesConstant) {
    EmpiricalEstimate est;
    est.empirical = 5000.0;
    est.maintenance = 2400.0;
    est.empiricalCI = Interval{4900.0, 5100.0};
    est.stability = Stability::Stable;

    const FixedTrend trend(0.05, 0.005, 2500.0, 50.0);
    const FixedEmpirical empirical(est);
    const IntakeNoticeDetector detector(trend, empirical);
    const auto notice = detector.detect(loggedDays(2500.0), ConfidenceLevel::P95);

    ASSERT_TRUE(notice.has_value());
    EXPECT_EQ(notice->direction, NoticeDirection::GainLargerThanExpected);
    EXPECT_DOUBLE_EQ(notice->kcalPerKg, 5000.0);
    EXPECT_DOUBLE_EQ(notice->maintenance, 2400.0);
    EXPECT_NEAR(notice->expectedRate, 0.02, 1e-12);
    EXPECT_NEAR(notice->noiseBand, 0.005 + 0.02 * 0.02, 1e-12);
    EXPECT_NEAR(notice->suggestedAdjustment, 150.0, 1e-6);
}

TEST(IntakeNoticeTest, NoisyEmpiricalIsIgnored) {
    EmpiricalEstimate est;
    est.empirical = 5000.0;
    est.maintenance = 2400.0;
    est.stability = Stability::Noisy;

    const FixedTrend trend(0.05, 0.005, 2500.0, 50.0);
    const FixedEmpirical empirical(est);
    const IntakeNoticeDetector detector(trend, empirical);
    const auto notice = detector.detect(loggedDays(2700.0), ConfidenceLevel::P95);

    ASSERT_TRUE(notice.has_value());
    EXPECT_DOUBLE_EQ(notice->kcalPerKg, KCAL_PER_KG);
    EXPECT_DOUBLE_EQ(notice->maintenance, 2500.0);
}
