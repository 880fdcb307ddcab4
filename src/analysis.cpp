#include "kcalfit/analysis.h"

#include "kcalfit/weight_log.h"

namespace kcalfit {

Analysis analyze(const AnalysisInput &input) {
    Analysis a;
    const auto entries = sortedByDate(input.entries);

    a.periods = periodStats(groupEntries(entries, input.grouping), input.level);

    a.trendEntries = filterByWindow(entries, input.window);
    a.inference = inferCalories(a.trendEntries, input.level, input.kcalPerKg);

    a.empirical = estimateEmpirical(entries, input.level);

    const RegressionTrendModel trend(input.kcalPerKg);
    const PairwiseEmpiricalModel empirical;
    const int recentDays = input.window.isAll() ? NOTICE_RECENT_DAYS : input.window.days;
    const IntakeNoticeDetector detector(trend, empirical, input.kcalPerKg, recentDays);
    a.notice = detector.detect(entries, input.level);

    a.bodyComposition = estimateBodyComposition(
        entries, input.measurements, input.settings.startingBodyFat,
        input.settings.calibration, a.empirical, input.level);
    return a;
}

}  // namespace kcalfit
