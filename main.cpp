#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "kcalfit/analysis.h"
#include "kcalfit/insights.h"
#include "kcalfit/journal.h"
#include "kcalfit/simulate.h"

using namespace kcalfit;

struct Params {
    double kcalPerKg = KCAL_PER_KG;
    double confidence = 0.95;
    std::string window = "all";
    std::string grouping = "1w";
    AdviceLimits limits;
};

Date today() {
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    const std::tm tm = *std::localtime(&now);
    return Date::fromYmd(tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
}

std::string fmtCI(const Interval &ci, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << "[" << ci.first << ", "
       << ci.second << "]";
    return ss.str();
}

void printPeriods(const std::vector<PeriodStats> &periods, double confidence) {
    std::cout << "Period stats (" << std::fixed << std::setprecision(0) << confidence * 100
              << "% CI)\n";
    for (const auto &p : periods) {
        std::cout << std::fixed << std::setprecision(2) << p.label << "  n=" << p.count
                  << "  mean: " << p.mean << " ± " << p.sd << "  CI: " << fmtCI(p.ci, 2);
        if (p.change) {
            const char *mark = "";
            switch (changeSignal(p.changeCI)) {
                case ChangeSignal::Increase: mark = " (+)"; break;
                case ChangeSignal::Decrease: mark = " (-)"; break;
                case ChangeSignal::Inconclusive: break;
            }
            std::cout << "  Δ: " << *p.change << " " << fmtCI(*p.changeCI, 2) << mark;
        }
        std::cout << "\n";
    }
}

void printInference(const Analysis &a, const Params &params) {
    if (!a.inference) {
        std::cerr << "Warning: need at least 2 entries in the selected trend window "
                     "for caloric inference.\n";
        return;
    }
    const CaloricInference &inf = *a.inference;
    if (!isReliable(inf)) {
        std::cerr << "Warning: only " << std::round(inf.daysOfData) << " days in the "
                  << "trend window, inference needs " << MIN_DAYS_FOR_INFERENCE
                  << " to be reliable.\n";
    }

    std::cout << "\nTrend (" << params.window << " days): " << std::fixed
              << std::setprecision(3) << inf.weightChangeRate << " kg/day "
              << fmtCI(inf.weightChangeRateCI, 3) << "  R²: " << std::setprecision(2)
              << inf.r2 << " (" << toString(trendStrength(inf.r2)) << ", "
              << toString(trendDirection(inf.weightChangeRate)) << ")"
              << "  days: " << std::setprecision(0) << inf.daysOfData << "\n";
    std::cout << "Maintenance: " << std::round(inf.maintenanceCalories) << " kcal/day "
              << fmtCI(inf.confidenceInterval, 0) << "\n";

    const EmpiricalEstimate &emp = a.empirical;
    std::cout << "Empirical kcal/kg: ";
    if (emp.empirical) {
        std::cout << std::setprecision(0) << *emp.empirical;
        if (emp.empiricalCI) std::cout << " " << fmtCI(*emp.empiricalCI, 0);
        if (emp.maintenance)
            std::cout << "  maintenance: " << std::round(*emp.maintenance) << " kcal/day";
    } else {
        std::cout << "-";
    }
    std::cout << "  [" << toString(emp.stability) << ", " << emp.intervals
              << " intervals]\n";

    const double kcalPerKg = kcalPerKgFor(emp, params.kcalPerKg);
    const auto split = fatLeanSplit(kcalPerKg, emp.empiricalCI.value_or(Interval{kcalPerKg, kcalPerKg}));
    std::cout << "Surplus/Deficit: " << std::round(inf.weightChangeRate * kcalPerKg)
              << " kcal/day  (fat " << std::setprecision(0) << split.fatPct * 100
              << "% / lean " << split.leanPct * 100 << "%)\n";

    if (a.notice) {
        const IntakeNotice &n = *a.notice;
        std::cout << "Notice: " << toString(n.direction) << "  observed "
                  << std::setprecision(3) << n.observedRate << " vs expected "
                  << n.expectedRate << " kg/day, adjust intake by "
                  << std::showpos << std::setprecision(0) << n.suggestedAdjustment
                  << std::noshowpos << " kcal/day\n";
    }
}

void printBodyComposition(const Analysis &a, const Settings &settings) {
    if (!settings.startingBodyFat) {
        std::cerr << "Warning: set a starting body fat (--starting-bodyfat) to "
                     "estimate body composition.\n";
        return;
    }
    const auto &series = a.bodyComposition.estimates;
    if (series.empty()) return;

    const auto &cur = series.back();
    const double halfWidth = (cur.bodyFatPercentageCI.second - cur.bodyFatPercentageCI.first) / 2;
    std::cout << "\nBody composition (" << cur.date.str() << "): " << std::fixed
              << std::setprecision(1) << cur.bodyFatPercentage << "% ± " << halfWidth
              << "  fat " << cur.fatMass << " kg  lean " << cur.leanMass << " kg"
              << (cur.isEstimated ? "" : "  (measured)") << "\n";
    const CalibrationFactor &cal = settings.calibration;
    std::cout << "Calibration: muscle gain " << std::setprecision(2) << cal.muscleGainFactor
              << "  fat loss " << cal.fatLossFactor;
    if (cal.date) std::cout << "  (" << cal.date->str() << ")";
    std::cout << "\n";
}

void printAdvice(const Journal &journal, const Analysis &a, const Params &params) {
    const auto &entries = journal.entries.entries();
    const Settings &s = journal.settings;
    if (entries.empty()) return;
    const double current = entries.back().weight;

    if (s.goalWeight && s.startingWeight) {
        std::cout << "\nGoal: " << std::fixed << std::setprecision(1) << *s.goalWeight
                  << " kg | Current: " << current << " kg | Progress: "
                  << std::setprecision(0)
                  << goalProgress(*s.startingWeight, *s.goalWeight, current) << "%\n";
    }
    if (!a.inference || !isReliable(*a.inference)) return;

    const double kcalPerKg = kcalPerKgFor(a.empirical, params.kcalPerKg);
    const auto advice = intakeAdvice(s.goalWeight, current, a.inference->maintenanceCalories,
                                     params.limits, kcalPerKg);
    if (!advice) return;
    std::cout << "Suggested intake: " << std::round(advice->suggestedIntake) << " kcal/day\n"
              << "Weekly change: " << std::fixed << std::setprecision(2)
              << advice->weeklyChange << " kg/week\n";
}

int main(int argc, char **argv) {
    CLI::App app{"kcalfit energy balance tracker"};
    Params params;

    std::string filename;
    std::vector<std::string> addEntry;
    std::vector<std::string> measure;
    std::string removeDate;
    std::string todayStr;
    int simulateSeed = -1;
    bool noSave = false;
    bool force = false;
    std::optional<double> goalWeight, startingWeight, startingBodyFat, goalBodyFat;

    app.add_option("file", filename, "Journal file to read and update")->required();
    app.add_option("-c,--confidence", params.confidence, "Confidence level")
        ->check(CLI::IsMember({0.80, 0.90, 0.95, 0.99}))
        ->capture_default_str();
    app.add_option("-w,--window", params.window, "Trend window in days")
        ->check(CLI::IsMember({"14", "30", "60", "all"}))
        ->capture_default_str();
    app.add_option("-g,--grouping", params.grouping, "Period grouping")
        ->check(CLI::IsMember({"1w", "2w", "1m", "2m"}))
        ->capture_default_str();
    app.add_option("-K,--kcalPerKg", params.kcalPerKg, "Fallback kcal per kg")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
    app.add_option("--add", addEntry, "Add or overwrite an entry: DATE WEIGHT [KCAL]")
        ->expected(2, 3);
    app.add_option("--remove", removeDate, "Remove the entry for DATE");
    app.add_option("--measure", measure, "Add a measurement: DATE key=value...")
        ->expected(2, 11);
    app.add_option("--goal-weight", goalWeight, "Goal weight (kg)");
    app.add_option("--starting-weight", startingWeight, "Starting weight (kg)");
    app.add_option("--starting-bodyfat", startingBodyFat, "Starting body fat (%)")
        ->check(CLI::Range(0.0, 100.0));
    app.add_option("--goal-bodyfat", goalBodyFat, "Goal body fat (%)")
        ->check(CLI::Range(0.0, 100.0));
    app.add_option("--simulate", simulateSeed,
                   "Replace the journal with simulated data from SEED");
    app.add_option("--today", todayStr, "Reference date for coverage (YYYY-MM-DD)");
    app.add_option("--maxDailyChangePct", params.limits.maxDailyChangePct,
                   "maximum daily recommended relative weight change goal.")
        ->capture_default_str();
    app.add_option("--maxIntakeDeltaPct", params.limits.maxIntakeDeltaPct,
                   "maximum daily recommended relative calories change goal.")
        ->capture_default_str();
    app.add_flag("--no-save", noSave, "Do not write the journal back");
    app.add_flag("--force", force, "Let --simulate overwrite an existing journal");
    CLI11_PARSE(app, argc, argv);

    try {
        Journal journal = simulateSeed >= 0
                              ? simulateJourney(static_cast<std::uint32_t>(simulateSeed))
                              : loadJournalFile(filename);
        Settings &settings = journal.settings;
        if (goalWeight) settings.goalWeight = goalWeight;
        if (startingWeight) settings.startingWeight = startingWeight;
        if (startingBodyFat) settings.startingBodyFat = startingBodyFat;
        if (goalBodyFat) settings.goalBodyFat = goalBodyFat;

        if (!addEntry.empty()) {
            WeightEntry e;
            e.date = parseDate(addEntry[0]);
            e.weight = std::stod(addEntry[1]);
            if (addEntry.size() == 3) e.calories = std::stod(addEntry[2]);
            if (e.weight <= 0 || (e.calories && *e.calories <= 0))
                throw std::runtime_error("Invalid weight or calories");
            journal.entries.upsert(e);
        }
        if (!removeDate.empty() && !journal.entries.remove(parseDate(removeDate))) {
            std::cerr << "Warning: no entry on " << removeDate << "\n";
        }
        if (!measure.empty()) {
            BodyMeasurement m;
            m.date = parseDate(measure[0]);
            for (std::size_t i = 1; i < measure.size(); ++i) applyMeasurementField(m, measure[i]);
            journal.measurements.add(m);
        }

        AnalysisInput input;
        input.entries = journal.entries.entries();
        input.measurements = journal.measurements.rows();
        input.settings = settings;
        input.level = confidenceFromValue(params.confidence);
        input.window = trendWindowFromString(params.window);
        input.grouping = groupingFromString(params.grouping);
        input.kcalPerKg = params.kcalPerKg;

        Analysis analysis = analyze(input);
        if (commitCalibration(settings, analysis.bodyComposition)) {
            // Recompute once with the committed factor.
            input.settings = settings;
            analysis = analyze(input);
        }

        printPeriods(analysis.periods, params.confidence);
        printInference(analysis, params);
        printBodyComposition(analysis, settings);

        const Date ref = todayStr.empty() ? today() : parseDate(todayStr);
        const Coverage cov = coverage(input.entries, input.measurements, ref);
        std::cout << "\nCoverage: " << cov.weightDays << " weight days (30d), "
                  << cov.calorieIntervals << " calorie intervals ("
                  << toString(intervalCoverage(cov.calorieIntervals)) << "), last BF% "
                  << (cov.lastBodyFatAge ? std::to_string(*cov.lastBodyFatAge) + "d ago"
                                         : std::string("none"))
                  << "\n";

        printAdvice(journal, analysis, params);

        const bool simulated = simulateSeed >= 0;
        if (!noSave && !saveJournalFile(filename, journal, !simulated || force)) {
            std::cerr << "Warning: " << filename << " exists, simulated data not "
                      << "saved (use --force to overwrite).\n";
        }
    } catch (const std::exception &ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
    return 0;
}
