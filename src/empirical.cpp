#include "kcalfit/empirical.h"

#include <algorithm>
#include <cmath>

#include "kcalfit/stats.h"
#include "kcalfit/weight_log.h"

namespace kcalfit {

std::string toString(Stability s) {
    switch (s) {
        case Stability::Stable: return "stable";
        case Stability::Noisy: return "noisy";
        case Stability::Insufficient: return "insufficient";
    }
    return "insufficient";
}

std::vector<CaloriePair> caloriePairs(const std::vector<WeightEntry> &entries) {
    const auto sorted = sortedByDate(entries);
    std::vector<CaloriePair> pairs;
    for (std::size_t i = 0; i + 1 < sorted.size(); ++i) {
        const auto &curr = sorted[i];
        if (!curr.calories) continue;
        for (std::size_t j = i + 1; j < sorted.size(); ++j) {
            const auto &next = sorted[j];
            if (!next.calories) continue;
            const int days = next.date - curr.date;
            if (days <= 0) continue;
            pairs.push_back({(*curr.calories + *next.calories) / 2.0,
                             (next.weight - curr.weight) / days});
        }
    }
    return pairs;
}

EmpiricalEstimate estimateEmpirical(const std::vector<WeightEntry> &entries,
                                    ConfidenceLevel level) {
    EmpiricalEstimate est;
    const auto pairs = caloriePairs(entries);
    est.intervals = static_cast<int>(pairs.size());
    if (est.intervals < MIN_EMPIRICAL_INTERVALS) return est;

    std::vector<double> x, y;
    x.reserve(pairs.size());
    y.reserve(pairs.size());
    for (const auto &p : pairs) {
        x.push_back(p.avgCalories);
        y.push_back(p.weightRate);
    }

    // Constant calories also lands here: the regression reports slope 0.
    const Regression fit = linearRegression(x, y);
    if (fit.slope == 0.0) return est;

    est.slope = fit.slope;
    est.r2 = fit.r2;
    est.empirical = std::abs(1.0 / fit.slope);
    est.maintenance = -fit.intercept / fit.slope;

    const double margin = zScore(level) * slopeStandardError(x, y, fit);
    const Interval slopeCI{fit.slope - margin, fit.slope + margin};
    est.slopeCI = slopeCI;

    if (slopeCI.first <= 0.0 && slopeCI.second >= 0.0) return est;

    const double a = std::abs(slopeCI.first);
    const double b = std::abs(slopeCI.second);
    est.empiricalCI = Interval{1.0 / std::max(a, b), 1.0 / std::min(a, b)};

    const double halfWidth = (est.empiricalCI->second - est.empiricalCI->first) / 2.0;
    est.stability = halfWidth > NOISY_RELATIVE_HALF_WIDTH * *est.empirical
                        ? Stability::Noisy
                        : Stability::Stable;
    return est;
}

EmpiricalPoint pointEstimate(const EmpiricalEstimate &est) {
    return {est.empirical, est.maintenance, est.r2, est.intervals};
}

double kcalPerKgFor(const EmpiricalEstimate &est, double fallback) {
    if (est.stability == Stability::Stable && est.empirical) return *est.empirical;
    return fallback;
}

}  // namespace kcalfit
