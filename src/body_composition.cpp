#include "kcalfit/body_composition.h"

#include <algorithm>
#include <map>

#include "kcalfit/trend.h"
#include "kcalfit/weight_log.h"

namespace kcalfit {

namespace {

constexpr double kLeanOnlyKcalPerKg = 2000.0;
constexpr double kMeasuredMargin = 1.0;   // BF% points
constexpr double kCarriedMargin = 3.0;
constexpr double kMarginPerDay = 0.05;
constexpr double kMinFatShare = 0.03;
constexpr double kMinLeanShare = 0.5;

// First body-fat reading per date.
std::map<int, double> bodyFatByDate(const std::vector<BodyMeasurement> &measurements) {
    std::vector<BodyMeasurement> rows = measurements;
    std::stable_sort(rows.begin(), rows.end(),
                     [](const BodyMeasurement &a, const BodyMeasurement &b) {
                         return a.date < b.date;
                     });
    std::map<int, double> res;
    for (const auto &m : rows) {
        if (m.bodyFat) res.emplace(m.date.days, *m.bodyFat);
    }
    return res;
}

// Re-derives one partition factor from the stretch between two anchors.
bool recalibrate(const std::vector<WeightEntry> &sorted, std::size_t from,
                 std::size_t to, double fatAtFrom, double fatAtTo,
                 double kcalPerKg, ConfidenceLevel level, CalibrationFactor &cal) {
    double total = 0.0;
    int count = 0;
    for (std::size_t k = from + 1; k < to; ++k) {
        if (!sorted[k].calories) continue;
        total += *sorted[k].calories;
        ++count;
    }
    if (count == 0) return false;
    const double avgDailyCalories = total / count;

    const std::vector<WeightEntry> segment(sorted.begin() + from,
                                           sorted.begin() + to + 1);
    const auto inference = inferCalories(segment, level, kcalPerKg);
    const auto segmentIntake = averageIntake(segment);
    if (!inference || !segmentIntake) return false;

    const double maintenance = *segmentIntake - inference->weightChangeRate * kcalPerKg;
    const double avgSurplus = avgDailyCalories - maintenance;
    const double days = static_cast<double>(sorted[to].date - sorted[from].date);
    const double theoreticalFatChange = avgSurplus * days / kcalPerKg;

    const double weightChange = sorted[to].weight - sorted[from].weight;
    const double fatMassChange = fatAtTo - fatAtFrom;

    if (avgSurplus > 0 && weightChange > 0 && theoreticalFatChange > 0) {
        const double muscle =
            std::clamp(1.0 - fatMassChange / theoreticalFatChange, 0.0,
                       MAX_MUSCLE_GAIN_FACTOR);
        cal.muscleGainFactor = (cal.muscleGainFactor + muscle) / 2.0;
    } else if (avgSurplus < 0 && weightChange < 0 && theoreticalFatChange < 0) {
        const double fatLoss =
            std::clamp(fatMassChange / theoreticalFatChange, MIN_FAT_LOSS_FACTOR, 1.0);
        cal.fatLossFactor = (cal.fatLossFactor + fatLoss) / 2.0;
    } else {
        return false;
    }
    cal.date = sorted[to].date;
    return true;
}

}  // namespace

double fatFractionFor(double kcalPerKg) {
    return std::clamp((kcalPerKg - kLeanOnlyKcalPerKg) /
                          (KCAL_PER_KG - kLeanOnlyKcalPerKg),
                      0.0, 1.0);
}

BodyCompositionResult estimateBodyComposition(
    const std::vector<WeightEntry> &entries,
    const std::vector<BodyMeasurement> &measurements,
    std::optional<double> startingBodyFat, const CalibrationFactor &calibration,
    const EmpiricalEstimate &empirical, ConfidenceLevel level) {
    BodyCompositionResult result;
    if (entries.empty() || !startingBodyFat) return result;

    const auto sorted = sortedByDate(entries);
    const auto measured = bodyFatByDate(measurements);

    const double kcalPerKg = empirical.empirical.value_or(KCAL_PER_KG);
    const double fatPct = fatFractionFor(kcalPerKg);

    const double startBodyFat = *startingBodyFat;
    double fatMass = sorted.front().weight * startBodyFat / 100.0;
    double leanMass = sorted.front().weight - fatMass;
    double lastKnownBodyFat = startBodyFat;

    std::size_t anchor = 0;
    double anchorFatMass = fatMass;

    CalibrationFactor cal = calibration;
    bool calibrated = false;

    result.estimates.reserve(sorted.size());
    for (std::size_t i = 0; i < sorted.size(); ++i) {
        const WeightEntry &entry = sorted[i];
        const auto m = measured.find(entry.date.days);

        if (m != measured.end()) {
            const double bf = m->second;
            fatMass = entry.weight * bf / 100.0;
            leanMass = entry.weight - fatMass;
            lastKnownBodyFat = bf;
            result.estimates.push_back({entry.date, entry.weight, bf, fatMass,
                                        leanMass,
                                        {bf - kMeasuredMargin, bf + kMeasuredMargin},
                                        false});
            if (i > 0 && (!calibration.date || entry.date > *calibration.date)) {
                calibrated |= recalibrate(sorted, anchor, i, anchorFatMass, fatMass,
                                          kcalPerKg, level, cal);
            }
            anchor = i;
            anchorFatMass = fatMass;
            continue;
        }

        if (i == 0) {
            result.estimates.push_back(
                {entry.date, entry.weight, startBodyFat, fatMass, leanMass,
                 {startBodyFat - kMeasuredMargin, startBodyFat + kMeasuredMargin},
                 false});
            continue;
        }

        const WeightEntry &prev = sorted[i - 1];
        if (entry.calories && prev.calories) {
            const double weightChange = entry.weight - prev.weight;
            fatMass += weightChange * fatPct;
            leanMass += weightChange * (1.0 - fatPct);

            fatMass = std::max(entry.weight * kMinFatShare, fatMass);
            leanMass = std::max(entry.weight * kMinLeanShare, leanMass);

            const double bf = fatMass / entry.weight * 100.0;
            const double daysSinceAnchor =
                static_cast<double>(entry.date - sorted[anchor].date);
            const double margin = 1.0 + daysSinceAnchor * kMarginPerDay;
            result.estimates.push_back(
                {entry.date, entry.weight, bf, fatMass, leanMass,
                 {std::max(3.0, bf - margin), std::min(bf + margin, 60.0)}, true});
        } else {
            // No energy data across this step: keep the last known BF%.
            fatMass = entry.weight * lastKnownBodyFat / 100.0;
            leanMass = entry.weight - fatMass;
            result.estimates.push_back(
                {entry.date, entry.weight, lastKnownBodyFat, fatMass, leanMass,
                 {lastKnownBodyFat - kCarriedMargin, lastKnownBodyFat + kCarriedMargin},
                 true});
        }
    }

    if (calibrated) result.newCalibration = cal;
    return result;
}

bool commitCalibration(Settings &settings, const BodyCompositionResult &result) {
    if (!result.newCalibration) return false;
    settings.calibration = *result.newCalibration;
    return true;
}

}  // namespace kcalfit
