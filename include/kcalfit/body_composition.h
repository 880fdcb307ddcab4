#ifndef KCALFIT_BODY_COMPOSITION_H
#define KCALFIT_BODY_COMPOSITION_H

#include <optional>
#include <vector>

#include "kcalfit/empirical.h"
#include "kcalfit/types.h"

namespace kcalfit {

struct BodyCompositionEstimate {
    Date date;
    double weight;
    double bodyFatPercentage;
    double fatMass;
    double leanMass;
    Interval bodyFatPercentageCI;
    bool isEstimated;  // false for measured anchors and the starting point
};

struct BodyCompositionResult {
    std::vector<BodyCompositionEstimate> estimates;
    std::optional<CalibrationFactor> newCalibration;
};

// Fat share of a weight change implied by an energy density:
// 2000 kcal/kg maps to all lean, 7700 kcal/kg to all fat.
double fatFractionFor(double kcalPerKg);

// One chronological pass; never touches `calibration`. A proposed update is
// returned in newCalibration and only anchors dated after
// calibration.date contribute to it.
BodyCompositionResult estimateBodyComposition(
    const std::vector<WeightEntry> &entries,
    const std::vector<BodyMeasurement> &measurements,
    std::optional<double> startingBodyFat, const CalibrationFactor &calibration,
    const EmpiricalEstimate &empirical, ConfidenceLevel level);

// Writes a proposed calibration into the settings; false when there is none.
bool commitCalibration(Settings &settings, const BodyCompositionResult &result);

}  // namespace kcalfit

#endif  // KCALFIT_BODY_COMPOSITION_H
