#ifndef KCALFIT_TYPES_H
#define KCALFIT_TYPES_H

#include <array>
#include <map>
#include <optional>
#include <string>
#include <utility>

#include "kcalfit/date.h"

namespace kcalfit {

constexpr double KCAL_PER_KG = 7700.0;  // energy in 1 kg of body fat
constexpr double MIN_DAYS_FOR_INFERENCE = 14.0;

using Interval = std::pair<double, double>;

struct WeightEntry {
    Date date;
    double weight;                   // kg
    std::optional<double> calories;  // kcal/day
};

// Circumference metrics understood by the measurement log (cm).
extern const std::array<const char *, 9> kCircumferenceMetrics;
bool isCircumferenceMetric(const std::string &name);

struct BodyMeasurement {
    Date date;
    std::optional<double> bodyFat;  // percent
    std::map<std::string, double> metrics;

    bool empty() const { return !bodyFat && metrics.empty(); }
};

enum class ConfidenceLevel { P80, P90, P95, P99 };

double zScore(ConfidenceLevel level);
double confidenceValue(ConfidenceLevel level);  // 0.80 .. 0.99
ConfidenceLevel confidenceFromValue(double value);

// Calibration factors stay inside [0, MAX_MUSCLE_GAIN_FACTOR] and
// [MIN_FAT_LOSS_FACTOR, 1].
constexpr double MAX_MUSCLE_GAIN_FACTOR = 0.7;
constexpr double MIN_FAT_LOSS_FACTOR = 0.5;

struct CalibrationFactor {
    std::optional<Date> date;
    double muscleGainFactor = 0.3;  // share of a surplus stored as lean mass
    double fatLossFactor = 0.9;     // share of a deficit taken from fat
};

// Persisted user settings, loaded and saved with the journal.
struct Settings {
    std::optional<double> startingWeight;
    std::optional<double> goalWeight;
    std::optional<double> startingBodyFat;
    std::optional<double> goalBodyFat;
    std::map<std::string, double> measurementGoals;
    CalibrationFactor calibration;
};

}  // namespace kcalfit

#endif  // KCALFIT_TYPES_H
