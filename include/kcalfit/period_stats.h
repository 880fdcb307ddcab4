#ifndef KCALFIT_PERIOD_STATS_H
#define KCALFIT_PERIOD_STATS_H

#include <optional>
#include <string>
#include <vector>

#include "kcalfit/types.h"

namespace kcalfit {

enum class Grouping { Week, TwoWeeks, Month, TwoMonths };

Grouping groupingFromString(const std::string &s);  // "1w", "2w", "1m", "2m"
std::string toString(Grouping g);

struct PeriodGroup {
    std::string label;
    Date start;
    Date end;  // inclusive
    std::vector<WeightEntry> entries;
};

struct PeriodStats {
    std::string label;
    Date start;
    Date end;
    double mean = 0.0;
    double sd = 0.0;
    Interval ci{0.0, 0.0};
    int count = 0;
    std::optional<double> change;  // vs. previous period
    std::optional<Interval> changeCI;
};

enum class ChangeSignal { Increase, Decrease, Inconclusive };

// Bucket boundaries containing `date`.
PeriodGroup bucketFor(const Date &date, Grouping grouping);

// Non-empty buckets in ascending start order, entries sorted inside each.
std::vector<PeriodGroup> groupEntries(const std::vector<WeightEntry> &entries,
                                      Grouping grouping);

std::vector<PeriodStats> periodStats(const std::vector<PeriodGroup> &groups,
                                     ConfidenceLevel level);

ChangeSignal changeSignal(const std::optional<Interval> &changeCI);

}  // namespace kcalfit

#endif  // KCALFIT_PERIOD_STATS_H
