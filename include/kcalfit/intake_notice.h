#ifndef KCALFIT_INTAKE_NOTICE_H
#define KCALFIT_INTAKE_NOTICE_H

#include <optional>
#include <string>
#include <vector>

#include "kcalfit/empirical.h"
#include "kcalfit/trend.h"
#include "kcalfit/types.h"

namespace kcalfit {

// Smallest rate gap (kg/day) ever reported as a mismatch.
constexpr double NOTICE_MIN_NOISE_KG_PER_DAY = 0.01;
// The judged stretch is the trailing NOTICE_RECENT_DAYS; the reference
// maintenance comes from up to NOTICE_BASELINE_DAYS before it.
constexpr int NOTICE_RECENT_DAYS = 30;
constexpr int NOTICE_BASELINE_DAYS = 60;

enum class NoticeDirection {
    GainLargerThanExpected,
    GainDespiteDeficit,
    LossDespiteSurplus,
    LossLargerThanExpected,
};

std::string toString(NoticeDirection d);

struct IntakeNotice {
    NoticeDirection direction;
    double suggestedAdjustment;  // kcal/day, positive = more intake
    double observedRate;         // kg/day
    double expectedRate;         // kg/day
    double noiseBand;            // kg/day
    double averageIntake;        // over the recent stretch
    double maintenance;          // reference, from the baseline
    double kcalPerKg;
};

class TrendModel {
public:
    virtual ~TrendModel() = default;
    virtual std::optional<CaloricInference> infer(
        const std::vector<WeightEntry> &entries, ConfidenceLevel level) const = 0;
};

class EmpiricalModel {
public:
    virtual ~EmpiricalModel() = default;
    virtual EmpiricalEstimate estimate(const std::vector<WeightEntry> &entries,
                                       ConfidenceLevel level) const = 0;
};

class RegressionTrendModel : public TrendModel {
public:
    explicit RegressionTrendModel(double kcalPerKg = KCAL_PER_KG)
        : kcalPerKg_(kcalPerKg) {}

    std::optional<CaloricInference> infer(const std::vector<WeightEntry> &entries,
                                          ConfidenceLevel level) const override;

private:
    double kcalPerKg_;
};

class PairwiseEmpiricalModel : public EmpiricalModel {
public:
    EmpiricalEstimate estimate(const std::vector<WeightEntry> &entries,
                               ConfidenceLevel level) const override;
};

class IntakeNoticeDetector {
public:
    IntakeNoticeDetector(const TrendModel &trend, const EmpiricalModel &empirical,
                         double kcalPerKg = KCAL_PER_KG,
                         int recentDays = NOTICE_RECENT_DAYS,
                         int baselineDays = NOTICE_BASELINE_DAYS)
        : trend_(trend), empirical_(empirical), kcalPerKg_(kcalPerKg),
          recentDays_(recentDays), baselineDays_(baselineDays) {}

    // Compares the recent weight trend with the rate the baseline predicts
    // for the recent intake. Empty when either stretch is too short, has no
    // calories, or the mismatch is within noise.
    std::optional<IntakeNotice> detect(const std::vector<WeightEntry> &entries,
                                       ConfidenceLevel level) const;

private:
    const TrendModel &trend_;
    const EmpiricalModel &empirical_;
    double kcalPerKg_;
    int recentDays_;
    int baselineDays_;
};

}  // namespace kcalfit

#endif  // KCALFIT_INTAKE_NOTICE_H
