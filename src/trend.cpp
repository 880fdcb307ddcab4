#include "kcalfit/trend.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "kcalfit/stats.h"
#include "kcalfit/weight_log.h"

namespace kcalfit {

TrendWindow trendWindowFromString(const std::string &s) {
    if (s == "all") return TrendWindow::all();
    if (s == "14" || s == "30" || s == "60") return TrendWindow{std::stoi(s)};
    throw std::invalid_argument("Unknown trend window: " + s);
}

std::string toString(const TrendWindow &w) {
    return w.isAll() ? "all" : std::to_string(w.days);
}

std::vector<WeightEntry> filterByWindow(const std::vector<WeightEntry> &entries,
                                        const TrendWindow &window) {
    auto sorted = sortedByDate(entries);
    if (window.isAll() || sorted.empty()) return sorted;

    const Date cutoff = sorted.back().date - (window.days - 1);
    sorted.erase(std::remove_if(sorted.begin(), sorted.end(),
                                [&](const WeightEntry &e) { return e.date < cutoff; }),
                 sorted.end());
    return sorted;
}

std::optional<double> averageIntake(const std::vector<WeightEntry> &entries) {
    double total = 0.0;
    int n = 0;
    for (const auto &e : entries) {
        if (!e.calories) continue;
        total += *e.calories;
        ++n;
    }
    if (n < 2) return std::nullopt;
    return total / n;
}

std::optional<CaloricInference> inferCalories(
    const std::vector<WeightEntry> &entries, ConfidenceLevel level,
    double kcalPerKg) {
    if (entries.size() < 2) return std::nullopt;

    const auto sorted = sortedByDate(entries);
    const Date first = sorted.front().date;

    std::vector<double> x, y;
    x.reserve(sorted.size());
    y.reserve(sorted.size());
    for (const auto &e : sorted) {
        x.push_back(static_cast<double>(e.date - first));
        y.push_back(e.weight);
    }

    const Regression fit = linearRegression(x, y);
    const double slopeSE = slopeStandardError(x, y, fit);
    const double z = zScore(level);

    CaloricInference res;
    res.slopeCI = {fit.slope - z * slopeSE, fit.slope + z * slopeSE};
    res.weightChangeRate = fit.slope;
    res.weightChangeRateCI = res.slopeCI;
    res.intercept = fit.intercept;
    res.r2 = fit.r2;
    res.averageIntake = averageIntake(sorted);

    double lo, hi;
    if (res.averageIntake) {
        const double avg = *res.averageIntake;
        res.maintenanceCalories = avg - fit.slope * kcalPerKg;
        lo = avg - res.weightChangeRateCI.second * kcalPerKg;
        hi = avg - res.weightChangeRateCI.first * kcalPerKg;
    } else {
        res.maintenanceCalories = std::abs(fit.slope * kcalPerKg);
        lo = std::abs(res.weightChangeRateCI.first * kcalPerKg);
        hi = std::abs(res.weightChangeRateCI.second * kcalPerKg);
    }
    res.confidenceInterval = {std::min(lo, hi), std::max(lo, hi)};

    const auto [minX, maxX] = std::minmax_element(x.begin(), x.end());
    res.daysOfData = *maxX - *minX + 1.0;

    res.trend.reserve(sorted.size());
    for (std::size_t i = 0; i < sorted.size(); ++i) {
        TrendPoint p;
        p.date = sorted[i].date;
        p.weight = sorted[i].weight;
        p.predicted = fit.slope * x[i] + fit.intercept;
        p.predictedLow = res.slopeCI.first * x[i] + fit.intercept;
        p.predictedHigh = res.slopeCI.second * x[i] + fit.intercept;
        p.predictedRange = p.predictedHigh - p.predictedLow;
        res.trend.push_back(p);
    }
    return res;
}

bool isReliable(const CaloricInference &inference) {
    return inference.daysOfData >= MIN_DAYS_FOR_INFERENCE;
}

}  // namespace kcalfit
