#include "kcalfit/types.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace kcalfit {

const std::array<const char *, 9> kCircumferenceMetrics = {
    "neck", "shoulders", "chest", "waist", "hips",
    "biceps", "forearms", "thighs", "calves"};

bool isCircumferenceMetric(const std::string &name) {
    return std::any_of(kCircumferenceMetrics.begin(),
                       kCircumferenceMetrics.end(),
                       [&](const char *m) { return name == m; });
}

double zScore(ConfidenceLevel level) {
    switch (level) {
        case ConfidenceLevel::P80: return 1.28;
        case ConfidenceLevel::P90: return 1.645;
        case ConfidenceLevel::P95: return 1.96;
        case ConfidenceLevel::P99: return 2.576;
    }
    return 1.96;
}

double confidenceValue(ConfidenceLevel level) {
    switch (level) {
        case ConfidenceLevel::P80: return 0.80;
        case ConfidenceLevel::P90: return 0.90;
        case ConfidenceLevel::P95: return 0.95;
        case ConfidenceLevel::P99: return 0.99;
    }
    return 0.95;
}

ConfidenceLevel confidenceFromValue(double value) {
    for (auto level : {ConfidenceLevel::P80, ConfidenceLevel::P90,
                       ConfidenceLevel::P95, ConfidenceLevel::P99}) {
        if (std::abs(confidenceValue(level) - value) < 1e-9) return level;
    }
    throw std::invalid_argument("Unsupported confidence level: " +
                                std::to_string(value));
}

}  // namespace kcalfit
