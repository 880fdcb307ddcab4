#ifndef KCALFIT_JOURNAL_H
#define KCALFIT_JOURNAL_H

#include <iosfwd>
#include <stdexcept>
#include <string>

#include "kcalfit/types.h"
#include "kcalfit/weight_log.h"

namespace kcalfit {

// Everything the tracker persists between runs.
struct Journal {
    WeightLog entries;
    MeasurementLog measurements;
    Settings settings;
};

class JournalError : public std::runtime_error {
public:
    JournalError(int line, const std::string &what)
        : std::runtime_error("line " + std::to_string(line) + ": " + what),
          line_(line) {}

    int line() const { return line_; }

private:
    int line_;
};

// Text format, one record per line, '#' starts a comment:
//   gw 75 | sw 60 | sbf 12 | gbf 15       goal/starting weight and body fat
//   goal waist 80                          measurement goal
//   calib 2024-03-01 0.35 0.85             calibration ('-' for no date)
//   2024-01-01 70.2 [2300]                 weight entry, calories optional
//   m 2024-01-10 bodyFat=12 waist=80       measurement row
Journal loadJournal(std::istream &input);
void saveJournal(std::ostream &output, const Journal &journal);

// A missing file loads as an empty journal.
Journal loadJournalFile(const std::string &path);
// Returns false, writing nothing, when the file exists and overwrite is off.
bool saveJournalFile(const std::string &path, const Journal &journal,
                     bool overwrite = true);

// Parses "key=value" tokens of a measurement row into m.
void applyMeasurementField(BodyMeasurement &m, const std::string &token);

}  // namespace kcalfit

#endif  // KCALFIT_JOURNAL_H
