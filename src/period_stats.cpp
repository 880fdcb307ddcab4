#include "kcalfit/period_stats.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <map>
#include <sstream>
#include <stdexcept>

#include "kcalfit/stats.h"

namespace kcalfit {

namespace {

constexpr int kMondayEpoch = 4;  // 1970-01-05, first Monday of the epoch

int floorDiv(int a, int b) {
    int q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

Date startOfWeek(const Date &d) { return d - (d.weekday() - 1); }

std::string monthLabel(int year, int month) {
    std::ostringstream ss;
    ss << std::setfill('0') << std::setw(4) << year << '-' << std::setw(2)
       << month;
    return ss.str();
}

}  // namespace

Grouping groupingFromString(const std::string &s) {
    if (s == "1w") return Grouping::Week;
    if (s == "2w") return Grouping::TwoWeeks;
    if (s == "1m") return Grouping::Month;
    if (s == "2m") return Grouping::TwoMonths;
    throw std::invalid_argument("Unknown grouping: " + s);
}

std::string toString(Grouping g) {
    switch (g) {
        case Grouping::Week: return "1w";
        case Grouping::TwoWeeks: return "2w";
        case Grouping::Month: return "1m";
        case Grouping::TwoMonths: return "2m";
    }
    return "1w";
}

PeriodGroup bucketFor(const Date &date, Grouping grouping) {
    PeriodGroup g;
    switch (grouping) {
        case Grouping::Week: {
            g.start = startOfWeek(date);
            g.end = g.start + 6;
            g.label = g.start.str();
            break;
        }
        case Grouping::TwoWeeks: {
            const int weeks = floorDiv(startOfWeek(date).days - kMondayEpoch, 7);
            const int bucketWeek = floorDiv(weeks, 2) * 2;
            g.start = Date{kMondayEpoch + bucketWeek * 7};
            g.end = g.start + 13;
            g.label = g.start.str() + " to " + g.end.str();
            break;
        }
        case Grouping::Month: {
            const int y = date.year();
            const int m = date.month();
            g.start = Date::fromYmd(y, m, 1);
            g.end = Date::fromYmd(y, m, daysInMonth(y, m));
            g.label = monthLabel(y, m);
            break;
        }
        case Grouping::TwoMonths: {
            const int y = date.year();
            const int first = (date.month() - 1) / 2 * 2 + 1;
            g.start = Date::fromYmd(y, first, 1);
            g.end = Date::fromYmd(y, first + 1, daysInMonth(y, first + 1));
            g.label = monthLabel(y, first) + " to " + monthLabel(y, first + 1);
            break;
        }
    }
    return g;
}

std::vector<PeriodGroup> groupEntries(const std::vector<WeightEntry> &entries,
                                      Grouping grouping) {
    std::map<int, PeriodGroup> buckets;  // keyed by start day
    for (const auto &e : entries) {
        PeriodGroup info = bucketFor(e.date, grouping);
        const int key = info.start.days;
        auto it = buckets.find(key);
        if (it == buckets.end()) {
            it = buckets.emplace(key, std::move(info)).first;
        }
        it->second.entries.push_back(e);
    }

    std::vector<PeriodGroup> groups;
    groups.reserve(buckets.size());
    for (auto &kv : buckets) {
        auto &data = kv.second.entries;
        std::stable_sort(data.begin(), data.end(),
                         [](const WeightEntry &a, const WeightEntry &b) {
                             return a.date < b.date;
                         });
        groups.push_back(std::move(kv.second));
    }
    return groups;
}

std::vector<PeriodStats> periodStats(const std::vector<PeriodGroup> &groups,
                                     ConfidenceLevel level) {
    std::vector<PeriodStats> res;
    res.reserve(groups.size());
    const double z = zScore(level);

    for (const auto &group : groups) {
        std::vector<double> weights;
        weights.reserve(group.entries.size());
        for (const auto &e : group.entries) weights.push_back(e.weight);

        PeriodStats s;
        s.label = group.label;
        s.start = group.start;
        s.end = group.end;
        s.count = static_cast<int>(weights.size());
        s.mean = mean(weights);
        s.sd = sampleSD(weights, s.mean);
        s.ci = confidenceInterval(s.mean, s.sd, s.count, level);

        if (!res.empty()) {
            const PeriodStats &prev = res.back();
            const double gain = s.mean - prev.mean;
            const double seCombined = std::sqrt(
                (s.count > 1 ? s.sd * s.sd / s.count : 0.0) +
                (prev.count > 1 ? prev.sd * prev.sd / prev.count : 0.0));
            const double margin = z * seCombined;
            s.change = gain;
            s.changeCI = Interval{gain - margin, gain + margin};
        }
        res.push_back(std::move(s));
    }
    return res;
}

ChangeSignal changeSignal(const std::optional<Interval> &changeCI) {
    if (!changeCI) return ChangeSignal::Inconclusive;
    if (changeCI->first > 0) return ChangeSignal::Increase;
    if (changeCI->second < 0) return ChangeSignal::Decrease;
    return ChangeSignal::Inconclusive;
}

}  // namespace kcalfit
