#include "kcalfit/weight_log.h"

#include <algorithm>
#include <stdexcept>

namespace kcalfit {

WeightLog::WeightLog(const std::vector<WeightEntry> &entries) {
    for (const auto &e : entries) upsert(e);
}

void WeightLog::upsert(const WeightEntry &entry) {
    auto it = std::lower_bound(
        entries_.begin(), entries_.end(), entry.date,
        [](const WeightEntry &e, const Date &d) { return e.date < d; });
    if (it != entries_.end() && it->date == entry.date) {
        *it = entry;
    } else {
        entries_.insert(it, entry);
    }
}

bool WeightLog::remove(const Date &date) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const WeightEntry &e) { return e.date == date; });
    if (it == entries_.end()) return false;
    entries_.erase(it);
    return true;
}

MeasurementLog::MeasurementLog(const std::vector<BodyMeasurement> &rows) {
    for (const auto &m : rows) add(m);
}

void MeasurementLog::add(const BodyMeasurement &m) {
    if (m.empty())
        throw std::invalid_argument("Measurement on " + m.date.str() +
                                    " has no metric");
    auto it = std::upper_bound(
        rows_.begin(), rows_.end(), m.date,
        [](const Date &d, const BodyMeasurement &r) { return d < r.date; });
    rows_.insert(it, m);
}

bool MeasurementLog::removeAt(std::size_t index) {
    if (index >= rows_.size()) return false;
    rows_.erase(rows_.begin() + static_cast<std::ptrdiff_t>(index));
    return true;
}

std::vector<WeightEntry> sortedByDate(std::vector<WeightEntry> entries) {
    std::stable_sort(
        entries.begin(), entries.end(),
        [](const WeightEntry &a, const WeightEntry &b) { return a.date < b.date; });
    return entries;
}

}  // namespace kcalfit
