#include "kcalfit/journal.h"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>
#include <vector>

namespace kcalfit {

namespace {

double parseNumber(const std::string &field) {
    std::size_t used = 0;
    const double v = std::stod(field, &used);
    if (used != field.size())
        throw std::invalid_argument("Invalid number: " + field);
    return v;
}

double parsePositive(const std::string &field, const char *what) {
    const double v = parseNumber(field);
    if (!(v > 0)) throw std::invalid_argument(std::string("Invalid ") + what + ": " + field);
    return v;
}

void parseLine(Journal &journal, const std::vector<std::string> &fields) {
    const std::string &key = fields[0];
    Settings &s = journal.settings;

    if (fields.size() == 2 && key == "gw") {
        s.goalWeight = parsePositive(fields[1], "goal weight");
    } else if (fields.size() == 2 && key == "sw") {
        s.startingWeight = parsePositive(fields[1], "starting weight");
    } else if (fields.size() == 2 && (key == "sbf" || key == "gbf")) {
        const double bf = parseNumber(fields[1]);
        if (bf < 0 || bf > 100) throw std::invalid_argument("Invalid body fat: " + fields[1]);
        (key == "sbf" ? s.startingBodyFat : s.goalBodyFat) = bf;
    } else if (fields.size() == 3 && key == "goal") {
        if (!isCircumferenceMetric(fields[1]))
            throw std::invalid_argument("Unknown measurement: " + fields[1]);
        s.measurementGoals[fields[1]] = parsePositive(fields[2], "measurement goal");
    } else if (fields.size() == 4 && key == "calib") {
        CalibrationFactor c;
        if (fields[1] != "-") c.date = parseDate(fields[1]);
        c.muscleGainFactor = parseNumber(fields[2]);
        c.fatLossFactor = parseNumber(fields[3]);
        if (!(c.muscleGainFactor >= 0 && c.muscleGainFactor <= MAX_MUSCLE_GAIN_FACTOR))
            throw std::invalid_argument("Invalid muscle gain factor: " + fields[2]);
        if (!(c.fatLossFactor >= MIN_FAT_LOSS_FACTOR && c.fatLossFactor <= 1))
            throw std::invalid_argument("Invalid fat loss factor: " + fields[3]);
        s.calibration = c;
    } else if (fields.size() >= 3 && key == "m") {
        BodyMeasurement m;
        m.date = parseDate(fields[1]);
        for (std::size_t i = 2; i < fields.size(); ++i) applyMeasurementField(m, fields[i]);
        journal.measurements.add(m);
    } else if (fields.size() == 2 || fields.size() == 3) {
        WeightEntry e;
        e.date = parseDate(fields[0]);
        e.weight = parsePositive(fields[1], "weight");
        if (fields.size() == 3) e.calories = parsePositive(fields[2], "calories");
        journal.entries.upsert(e);
    } else {
        throw std::invalid_argument("Malformed line");
    }
}

}  // namespace

void applyMeasurementField(BodyMeasurement &m, const std::string &token) {
    const auto eq = token.find('=');
    if (eq == std::string::npos || eq == 0)
        throw std::invalid_argument("Expected key=value, got: " + token);
    const std::string key = token.substr(0, eq);
    const double value = parseNumber(token.substr(eq + 1));

    if (key == "bodyFat") {
        if (value < 0 || value > 100)
            throw std::invalid_argument("Invalid body fat: " + token);
        m.bodyFat = value;
    } else if (isCircumferenceMetric(key)) {
        if (!(value > 0)) throw std::invalid_argument("Invalid measurement: " + token);
        m.metrics[key] = value;
    } else {
        throw std::invalid_argument("Unknown measurement: " + key);
    }
}

Journal loadJournal(std::istream &input) {
    Journal journal;
    std::string line;
    int lineNo = 0;

    while (std::getline(input, line)) {
        ++lineNo;
        const auto hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);

        std::istringstream iss(line);
        std::vector<std::string> fields{std::istream_iterator<std::string>{iss},
                                        std::istream_iterator<std::string>{}};
        if (fields.empty()) continue;

        try {
            parseLine(journal, fields);
        } catch (const std::exception &ex) {
            throw JournalError(lineNo, ex.what());
        }
    }
    return journal;
}

void saveJournal(std::ostream &output, const Journal &journal) {
    const Settings &s = journal.settings;
    output << std::setprecision(15);

    output << "# kcalfit journal\n";
    if (s.startingWeight) output << "sw " << *s.startingWeight << "\n";
    if (s.goalWeight) output << "gw " << *s.goalWeight << "\n";
    if (s.startingBodyFat) output << "sbf " << *s.startingBodyFat << "\n";
    if (s.goalBodyFat) output << "gbf " << *s.goalBodyFat << "\n";
    for (const auto &kv : s.measurementGoals) {
        output << "goal " << kv.first << " " << kv.second << "\n";
    }
    output << "calib " << (s.calibration.date ? s.calibration.date->str() : "-")
           << " " << s.calibration.muscleGainFactor << " "
           << s.calibration.fatLossFactor << "\n";

    for (const auto &e : journal.entries.entries()) {
        output << e.date.str() << " " << e.weight;
        if (e.calories) output << " " << *e.calories;
        output << "\n";
    }

    for (const auto &m : journal.measurements.rows()) {
        output << "m " << m.date.str();
        if (m.bodyFat) output << " bodyFat=" << *m.bodyFat;
        for (const auto &kv : m.metrics) output << " " << kv.first << "=" << kv.second;
        output << "\n";
    }
}

Journal loadJournalFile(const std::string &path) {
    std::ifstream file(path);
    if (!file.is_open()) return Journal{};
    return loadJournal(file);
}

bool saveJournalFile(const std::string &path, const Journal &journal,
                     bool overwrite) {
    if (!overwrite && std::ifstream(path).is_open()) return false;
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) throw std::runtime_error("Failed to open " + path + " for writing");
    saveJournal(file, journal);
    if (!file) throw std::runtime_error("Failed to write " + path);
    return true;
}

}  // namespace kcalfit
