#ifndef KCALFIT_WEIGHT_LOG_H
#define KCALFIT_WEIGHT_LOG_H

#include <cstddef>
#include <vector>

#include "kcalfit/types.h"

namespace kcalfit {

// Date-ordered weight log holding at most one entry per day.
class WeightLog {
public:
    WeightLog() = default;
    explicit WeightLog(const std::vector<WeightEntry> &entries);

    // Inserts or overwrites the entry for entry.date (last write wins).
    void upsert(const WeightEntry &entry);
    bool remove(const Date &date);

    const std::vector<WeightEntry> &entries() const { return entries_; }
    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::vector<WeightEntry> entries_;
};

// Date-ordered measurement rows; rows sharing a date are kept in insertion order.
class MeasurementLog {
public:
    MeasurementLog() = default;
    explicit MeasurementLog(const std::vector<BodyMeasurement> &rows);

    // Throws std::invalid_argument for a row without any metric.
    void add(const BodyMeasurement &m);
    bool removeAt(std::size_t index);

    const std::vector<BodyMeasurement> &rows() const { return rows_; }
    std::size_t size() const { return rows_.size(); }

private:
    std::vector<BodyMeasurement> rows_;
};

// Stable ascending date sort, used wherever the core needs processing order.
std::vector<WeightEntry> sortedByDate(std::vector<WeightEntry> entries);

}  // namespace kcalfit

#endif  // KCALFIT_WEIGHT_LOG_H
