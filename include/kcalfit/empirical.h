#ifndef KCALFIT_EMPIRICAL_H
#define KCALFIT_EMPIRICAL_H

#include <optional>
#include <string>
#include <vector>

#include "kcalfit/types.h"

namespace kcalfit {

// Relative CI half-width above which an empirical kcal/kg counts as noisy.
constexpr double NOISY_RELATIVE_HALF_WIDTH = 0.5;
constexpr int MIN_EMPIRICAL_INTERVALS = 3;

enum class Stability { Stable, Noisy, Insufficient };

std::string toString(Stability s);

struct CaloriePair {
    double avgCalories;
    double weightRate;  // kg/day
};

struct EmpiricalEstimate {
    std::optional<double> empirical;    // kcal per kg of weight change
    std::optional<double> maintenance;  // kcal/day at zero predicted rate
    std::optional<double> r2;
    int intervals = 0;
    std::optional<double> slope;
    std::optional<Interval> slopeCI;
    std::optional<Interval> empiricalCI;
    Stability stability = Stability::Insufficient;
};

struct EmpiricalPoint {
    std::optional<double> empirical;
    std::optional<double> maintenance;
    std::optional<double> r2;
    int intervals = 0;
};

// Every (i < j) pair of calorie-logged entries with a positive day gap.
std::vector<CaloriePair> caloriePairs(const std::vector<WeightEntry> &entries);

EmpiricalEstimate estimateEmpirical(const std::vector<WeightEntry> &entries,
                                    ConfidenceLevel level);

// Point-only view of an estimate.
EmpiricalPoint pointEstimate(const EmpiricalEstimate &est);

// The empirical kcal/kg when it is stable, otherwise `fallback`.
double kcalPerKgFor(const EmpiricalEstimate &est, double fallback = KCAL_PER_KG);

}  // namespace kcalfit

#endif  // KCALFIT_EMPIRICAL_H
