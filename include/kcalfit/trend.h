#ifndef KCALFIT_TREND_H
#define KCALFIT_TREND_H

#include <optional>
#include <string>
#include <vector>

#include "kcalfit/types.h"

namespace kcalfit {

// Trailing trend window in days; 0 selects the full history.
struct TrendWindow {
    int days = 0;

    static TrendWindow all() { return TrendWindow{0}; }
    bool isAll() const { return days <= 0; }
};

TrendWindow trendWindowFromString(const std::string &s);  // "14", "30", "60", "all"
std::string toString(const TrendWindow &w);

struct TrendPoint {
    Date date;
    double weight;
    double predicted;
    double predictedLow;
    double predictedHigh;
    double predictedRange;
};

struct CaloricInference {
    double maintenanceCalories = 0.0;
    Interval confidenceInterval{0.0, 0.0};
    double weightChangeRate = 0.0;  // kg/day
    Interval weightChangeRateCI{0.0, 0.0};
    Interval slopeCI{0.0, 0.0};
    double intercept = 0.0;
    double daysOfData = 0.0;
    double r2 = 0.0;
    std::optional<double> averageIntake;
    std::vector<TrendPoint> trend;
};

std::vector<WeightEntry> filterByWindow(const std::vector<WeightEntry> &entries,
                                        const TrendWindow &window);

// Mean of logged calories; empty unless at least two entries carry calories.
std::optional<double> averageIntake(const std::vector<WeightEntry> &entries);

// Regresses weight on elapsed days since the first entry. Empty for < 2 entries.
std::optional<CaloricInference> inferCalories(
    const std::vector<WeightEntry> &entries, ConfidenceLevel level,
    double kcalPerKg = KCAL_PER_KG);

bool isReliable(const CaloricInference &inference);

}  // namespace kcalfit

#endif  // KCALFIT_TREND_H
