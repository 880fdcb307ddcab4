#ifndef KCALFIT_ANALYSIS_H
#define KCALFIT_ANALYSIS_H

#include <optional>
#include <vector>

#include "kcalfit/body_composition.h"
#include "kcalfit/empirical.h"
#include "kcalfit/intake_notice.h"
#include "kcalfit/period_stats.h"
#include "kcalfit/trend.h"
#include "kcalfit/types.h"

namespace kcalfit {

struct AnalysisInput {
    std::vector<WeightEntry> entries;
    std::vector<BodyMeasurement> measurements;
    Settings settings;
    ConfidenceLevel level = ConfidenceLevel::P95;
    TrendWindow window = TrendWindow::all();
    Grouping grouping = Grouping::Week;
    double kcalPerKg = KCAL_PER_KG;
};

struct Analysis {
    std::vector<PeriodStats> periods;
    std::vector<WeightEntry> trendEntries;  // entries inside the trend window
    std::optional<CaloricInference> inference;
    EmpiricalEstimate empirical;
    std::optional<IntakeNotice> notice;
    BodyCompositionResult bodyComposition;
};

// One recomputation over the input; the calibration it may propose is left
// in bodyComposition.newCalibration for the caller to commit.
Analysis analyze(const AnalysisInput &input);

}  // namespace kcalfit

#endif  // KCALFIT_ANALYSIS_H
