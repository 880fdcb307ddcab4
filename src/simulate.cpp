#include "kcalfit/simulate.h"

#include <cmath>
#include <cstdlib>
#include <random>
#include <vector>

namespace kcalfit {

namespace {

struct Phase {
    int days;
    double weeklyGain;      // kg/week
    double calorieBase;     // maintenance at phase start
    double surplus;
    double calorieVariation;
    double bodyFatIncrease; // percentage points over the phase
    double muscleGainRatio;
    double muscleLossRatio;
};

const std::vector<Phase> kPhases = {
    {180, 0.3, 2200, 400, 150, 5.0, 0.4, 0.0},     // initial bulk
    {90, -0.3, 2500, -500, 100, -3.0, 0.0, 0.15},  // mini cut
    {275, 0.25, 2450, 300, 200, 4.0, 0.35, 0.0},   // moderate bulk
};

constexpr double kStartWeight = 60.0;
constexpr double kGoalWeight = 75.0;
constexpr double kStartBodyFat = 12.0;
constexpr double kGoalBodyFat = 15.0;

}  // namespace

Journal simulateJourney(std::uint32_t seed) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    auto symmetric = [&]() { return unit(rng) * 2.0 - 1.0; };

    Journal journal;
    journal.settings.startingWeight = kStartWeight;
    journal.settings.goalWeight = kGoalWeight;
    journal.settings.startingBodyFat = kStartBodyFat;
    journal.settings.goalBodyFat = kGoalBodyFat;

    const Date start = Date::fromYmd(2023, 1, 1);
    const Date end = Date::fromYmd(2024, 7, 1);

    std::size_t phaseIndex = 0;
    int phaseStartDay = 0;
    double phaseStartWeight = kStartWeight;
    double phaseStartBodyFat = kStartBodyFat;
    std::vector<Date> bodyFatDates;

    for (Date date = start; date <= end;) {
        const Phase &phase = kPhases[phaseIndex];
        const int daysSinceStart = date - start;
        const int daysIntoPhase = daysSinceStart - phaseStartDay;

        if (daysIntoPhase >= phase.days && phaseIndex + 1 < kPhases.size()) {
            phaseStartDay += phase.days;
            phaseStartWeight += phase.weeklyGain * phase.days / 7.0;
            phaseStartBodyFat += phase.bodyFatIncrease;
            ++phaseIndex;
            continue;
        }

        const double expectedGain = phase.weeklyGain * daysIntoPhase / 7.0;
        const double dailyNoise = symmetric() * 0.2;
        const int weekday = date.weekday();
        const double weekendEffect = (weekday == 6 || weekday == 7) ? 0.2 : 0.0;
        double weight = phaseStartWeight + expectedGain + dailyNoise + weekendEffect;
        if (unit(rng) > 0.97) weight += -0.2 * phase.weeklyGain;  // short plateau
        weight = std::round(weight * 10.0) / 10.0;

        const double bodyFat = phaseStartBodyFat +
                               phase.bodyFatIncrease * daysIntoPhase / phase.days;

        // Maintenance drifts up ~12 kcal per kg gained.
        const double maintenance = phase.calorieBase + (weight - kStartWeight) * 12.0;
        const double calorieNoise = symmetric() * phase.calorieVariation;
        double adjustment = 0.0;
        if (phase.weeklyGain > 0) {
            adjustment = phase.weeklyGain / 7.0 * phase.muscleGainRatio * 2000.0;
        } else {
            adjustment = -phase.weeklyGain / 7.0 * phase.muscleLossRatio * 1000.0;
        }
        const double calories =
            std::round(maintenance + phase.surplus + calorieNoise + adjustment);

        bool logged = unit(rng) > 0.6;

        const int monthsSinceStart = static_cast<int>(daysSinceStart / 30.5);
        bool nearPrevious = false;
        for (const Date &d : bodyFatDates) {
            if (std::abs(d - date) < 15) nearPrevious = true;
        }
        if (monthsSinceStart % 3 == 0 && monthsSinceStart <= 18 && !nearPrevious) {
            BodyMeasurement m;
            m.date = date;
            m.bodyFat = std::round((bodyFat + symmetric() * 0.5) * 10.0) / 10.0;
            journal.measurements.add(m);
            bodyFatDates.push_back(date);
            logged = true;  // a reading always comes with a weigh-in
        }

        if (logged) journal.entries.upsert({date, weight, calories});
        date = date + 1;
    }
    return journal;
}

}  // namespace kcalfit
