#include "kcalfit/insights.h"

#include <algorithm>
#include <cmath>
#include <set>

#include "kcalfit/body_composition.h"
#include "kcalfit/weight_log.h"

namespace kcalfit {

Coverage coverage(const std::vector<WeightEntry> &entries,
                  const std::vector<BodyMeasurement> &measurements,
                  const Date &today) {
    Coverage c;
    const auto sorted = sortedByDate(entries);
    if (!sorted.empty()) {
        const Date cutoff = sorted.back().date - 29;
        std::set<int> days;
        for (const auto &e : sorted) {
            if (e.date >= cutoff) days.insert(e.date.days);
        }
        c.weightDays = static_cast<int>(days.size());
    }

    for (std::size_t i = 0; i + 1 < sorted.size(); ++i) {
        if (sorted[i].calories && sorted[i + 1].calories) ++c.calorieIntervals;
    }

    std::optional<Date> newest;
    for (const auto &m : measurements) {
        if (!m.bodyFat) continue;
        if (!newest || m.date > *newest) newest = m.date;
    }
    if (newest) c.lastBodyFatAge = std::max(0, today - *newest);
    return c;
}

double goalProgress(double startingWeight, double goalWeight, double currentWeight) {
    if (goalWeight == startingWeight) return 0.0;
    const double progress =
        (currentWeight - startingWeight) / (goalWeight - startingWeight) * 100.0;
    return std::clamp(progress, 0.0, 100.0);
}

std::vector<IntervalPair> intervalPairs(const std::vector<WeightEntry> &entries) {
    const auto sorted = sortedByDate(entries);
    std::vector<IntervalPair> pairs;
    for (std::size_t i = 0; i + 1 < sorted.size(); ++i) {
        const auto &curr = sorted[i];
        const auto &next = sorted[i + 1];
        if (!curr.calories || !next.calories) continue;
        const int days = next.date - curr.date;
        if (days <= 0) continue;
        pairs.push_back({curr.date, next.date,
                         (*curr.calories + *next.calories) / 2.0,
                         (next.weight - curr.weight) / days});
    }
    return pairs;
}

FatLeanSplit fatLeanSplit(double kcalPerKg, const Interval &kcalPerKgCI) {
    FatLeanSplit s;
    s.fatPct = fatFractionFor(kcalPerKg);
    s.fatPctLow = fatFractionFor(kcalPerKgCI.first);
    s.fatPctHigh = fatFractionFor(kcalPerKgCI.second);
    s.leanPct = 1.0 - s.fatPct;
    s.leanPctLow = 1.0 - s.fatPctHigh;
    s.leanPctHigh = 1.0 - s.fatPctLow;
    return s;
}

FatLeanChange fatLeanChange(double startingWeight, double currentWeight,
                            const FatLeanSplit &split) {
    FatLeanChange c;
    c.totalChange = currentWeight - startingWeight;
    c.fatKg = c.totalChange * split.fatPct;
    c.fatKgLow = c.totalChange * split.fatPctLow;
    c.fatKgHigh = c.totalChange * split.fatPctHigh;
    c.leanKg = c.totalChange * split.leanPct;
    c.leanKgLow = c.totalChange * split.leanPctLow;
    c.leanKgHigh = c.totalChange * split.leanPctHigh;
    return c;
}

TrendStrength trendStrength(double r2) {
    if (r2 > 0.7) return TrendStrength::Strong;
    if (r2 > 0.4) return TrendStrength::Moderate;
    return TrendStrength::Weak;
}

TrendDirection trendDirection(double kgPerDay) {
    if (kgPerDay > 0.005) return TrendDirection::Gaining;
    if (kgPerDay < -0.005) return TrendDirection::Losing;
    return TrendDirection::Flat;
}

IntervalCoverage intervalCoverage(int intervals) {
    if (intervals >= 6) return IntervalCoverage::Good;
    if (intervals >= 3) return IntervalCoverage::Fair;
    return IntervalCoverage::Low;
}

std::string toString(TrendStrength s) {
    switch (s) {
        case TrendStrength::Strong: return "strong";
        case TrendStrength::Moderate: return "moderate";
        case TrendStrength::Weak: return "weak";
    }
    return "weak";
}

std::string toString(TrendDirection d) {
    switch (d) {
        case TrendDirection::Gaining: return "gaining";
        case TrendDirection::Losing: return "losing";
        case TrendDirection::Flat: return "flat";
    }
    return "flat";
}

std::string toString(IntervalCoverage c) {
    switch (c) {
        case IntervalCoverage::Good: return "good";
        case IntervalCoverage::Fair: return "fair";
        case IntervalCoverage::Low: return "low";
    }
    return "low";
}

std::optional<double> latestMeasurement(const std::vector<BodyMeasurement> &measurements,
                                        const std::string &metric) {
    std::optional<double> value;
    std::optional<Date> when;
    for (const auto &m : measurements) {
        std::optional<double> v;
        if (metric == "bodyFat") {
            v = m.bodyFat;
        } else {
            auto it = m.metrics.find(metric);
            if (it != m.metrics.end()) v = it->second;
        }
        if (v && (!when || m.date >= *when)) {
            value = v;
            when = m.date;
        }
    }
    return value;
}

std::optional<IntakeAdvice> intakeAdvice(std::optional<double> goalWeight,
                                         double currentWeight, double maintenance,
                                         const AdviceLimits &limits,
                                         double kcalPerKg) {
    if (!goalWeight || maintenance <= 0.0) return std::nullopt;

    const double deltaMax = std::min(maintenance * limits.maxIntakeDeltaPct,
                                     currentWeight * limits.maxDailyChangePct * kcalPerKg);
    const double delta =
        std::clamp((*goalWeight - currentWeight) * kcalPerKg, -deltaMax, deltaMax);

    IntakeAdvice advice;
    advice.suggestedIntake = maintenance + delta;
    advice.weeklyChange = delta / kcalPerKg * 7.0;
    return advice;
}

}  // namespace kcalfit
