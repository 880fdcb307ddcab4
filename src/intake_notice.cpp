#include "kcalfit/intake_notice.h"

#include <algorithm>
#include <cmath>

#include "kcalfit/weight_log.h"

namespace kcalfit {

std::string toString(NoticeDirection d) {
    switch (d) {
        case NoticeDirection::GainLargerThanExpected: return "gain_larger_than_expected";
        case NoticeDirection::GainDespiteDeficit: return "gain_despite_deficit";
        case NoticeDirection::LossDespiteSurplus: return "loss_despite_surplus";
        case NoticeDirection::LossLargerThanExpected: return "loss_larger_than_expected";
    }
    return "";
}

std::optional<CaloricInference> RegressionTrendModel::infer(
    const std::vector<WeightEntry> &entries, ConfidenceLevel level) const {
    return inferCalories(entries, level, kcalPerKg_);
}

EmpiricalEstimate PairwiseEmpiricalModel::estimate(
    const std::vector<WeightEntry> &entries, ConfidenceLevel level) const {
    return estimateEmpirical(entries, level);
}

std::optional<IntakeNotice> IntakeNoticeDetector::detect(
    const std::vector<WeightEntry> &entries, ConfidenceLevel level) const {
    const auto sorted = sortedByDate(entries);
    if (sorted.empty()) return std::nullopt;

    const Date recentStart = sorted.back().date - (recentDays_ - 1);
    const Date baselineStart = recentStart - baselineDays_;
    std::vector<WeightEntry> baseline, recent;
    for (const auto &e : sorted) {
        if (e.date >= recentStart) {
            recent.push_back(e);
        } else if (e.date >= baselineStart) {
            baseline.push_back(e);
        }
    }

    const auto inference = trend_.infer(recent, level);
    if (!inference || inference->daysOfData < MIN_DAYS_FOR_INFERENCE)
        return std::nullopt;

    const auto avgIntake = averageIntake(recent);
    if (!avgIntake) return std::nullopt;

    // Reference model, fitted without the stretch being judged.
    double maintenance, maintenanceHalfWidth, kcalPerKg;
    double relativeSpread = 0.0;
    const EmpiricalEstimate emp = empirical_.estimate(baseline, level);
    if (emp.stability == Stability::Stable && emp.empirical && emp.maintenance) {
        maintenance = *emp.maintenance;
        maintenanceHalfWidth = 0.0;
        kcalPerKg = *emp.empirical;
        if (emp.empiricalCI) {
            relativeSpread = (emp.empiricalCI->second - emp.empiricalCI->first) /
                             2.0 / kcalPerKg;
        }
    } else {
        const auto reference = trend_.infer(baseline, level);
        if (!reference || reference->daysOfData < MIN_DAYS_FOR_INFERENCE ||
            !reference->averageIntake)
            return std::nullopt;
        maintenance = reference->maintenanceCalories;
        maintenanceHalfWidth = (reference->confidenceInterval.second -
                                reference->confidenceInterval.first) / 2.0;
        kcalPerKg = kcalPerKg_;
    }

    const double observed = inference->weightChangeRate;
    const double expected = (*avgIntake - maintenance) / kcalPerKg;
    const double gap = observed - expected;

    const double slopeHalfWidth =
        (inference->slopeCI.second - inference->slopeCI.first) / 2.0;
    const double band = std::max(NOTICE_MIN_NOISE_KG_PER_DAY,
                                 slopeHalfWidth + maintenanceHalfWidth / kcalPerKg +
                                     std::abs(expected) * relativeSpread);
    if (std::abs(gap) <= band) return std::nullopt;

    const bool expectGain = *avgIntake >= maintenance;
    const bool observedGain = observed > 0.0;

    NoticeDirection direction;
    if (observedGain && expectGain) {
        if (gap <= 0.0) return std::nullopt;  // smaller gain than expected
        direction = NoticeDirection::GainLargerThanExpected;
    } else if (observedGain) {
        direction = NoticeDirection::GainDespiteDeficit;
    } else if (expectGain) {
        direction = NoticeDirection::LossDespiteSurplus;
    } else {
        if (gap >= 0.0) return std::nullopt;  // smaller loss than expected
        direction = NoticeDirection::LossLargerThanExpected;
    }

    IntakeNotice notice;
    notice.direction = direction;
    notice.suggestedAdjustment = gap * kcalPerKg;
    notice.observedRate = observed;
    notice.expectedRate = expected;
    notice.noiseBand = band;
    notice.averageIntake = *avgIntake;
    notice.maintenance = maintenance;
    notice.kcalPerKg = kcalPerKg;
    return notice;
}

}  // namespace kcalfit
