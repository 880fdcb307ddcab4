#ifndef KCALFIT_INSIGHTS_H
#define KCALFIT_INSIGHTS_H

#include <optional>
#include <string>
#include <vector>

#include "kcalfit/types.h"

namespace kcalfit {

struct Coverage {
    int weightDays = 0;         // logged days in the trailing 30
    int calorieIntervals = 0;   // adjacent entries both with calories
    std::optional<int> lastBodyFatAge;  // days since newest BF% reading
};

Coverage coverage(const std::vector<WeightEntry> &entries,
                  const std::vector<BodyMeasurement> &measurements,
                  const Date &today);

// Percent of the way from start to goal, clamped to [0, 100].
double goalProgress(double startingWeight, double goalWeight, double currentWeight);

struct IntervalPair {
    Date from;
    Date to;
    double avgCalories;
    double weightRate;
};

// Adjacent calorie-logged pairs, for the calories vs. rate scatter.
std::vector<IntervalPair> intervalPairs(const std::vector<WeightEntry> &entries);

struct FatLeanSplit {
    double fatPct, fatPctLow, fatPctHigh;
    double leanPct, leanPctLow, leanPctHigh;
};

FatLeanSplit fatLeanSplit(double kcalPerKg, const Interval &kcalPerKgCI);

struct FatLeanChange {
    double totalChange;
    double fatKg, fatKgLow, fatKgHigh;
    double leanKg, leanKgLow, leanKgHigh;
};

FatLeanChange fatLeanChange(double startingWeight, double currentWeight,
                            const FatLeanSplit &split);

enum class TrendStrength { Strong, Moderate, Weak };
enum class TrendDirection { Gaining, Losing, Flat };
enum class IntervalCoverage { Good, Fair, Low };

TrendStrength trendStrength(double r2);
TrendDirection trendDirection(double kgPerDay);
IntervalCoverage intervalCoverage(int intervals);

std::string toString(TrendStrength s);
std::string toString(TrendDirection d);
std::string toString(IntervalCoverage c);

// Newest value of a named metric ("bodyFat" or a circumference).
std::optional<double> latestMeasurement(const std::vector<BodyMeasurement> &measurements,
                                        const std::string &metric);

struct AdviceLimits {
    double maxIntakeDeltaPct = 0.25;          // of maintenance
    double maxDailyChangePct = 0.02 / 31.0;   // of body weight
};

struct IntakeAdvice {
    double suggestedIntake;  // kcal/day
    double weeklyChange;     // kg/week
};

std::optional<IntakeAdvice> intakeAdvice(std::optional<double> goalWeight,
                                         double currentWeight, double maintenance,
                                         const AdviceLimits &limits,
                                         double kcalPerKg = KCAL_PER_KG);

}  // namespace kcalfit

#endif  // KCALFIT_INSIGHTS_H
