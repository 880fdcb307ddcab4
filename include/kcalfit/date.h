#ifndef KCALFIT_DATE_H
#define KCALFIT_DATE_H

#include <string>

namespace kcalfit {

// Calendar day, counted from 1970-01-01 (proleptic Gregorian).
struct Date {
    int days = 0;

    static Date fromYmd(int year, int month, int day);

    int year() const;
    int month() const;  // 1..12
    int day() const;    // 1..31

    // ISO weekday, Monday = 1 .. Sunday = 7
    int weekday() const;

    std::string str() const;

    Date operator+(int n) const { return Date{days + n}; }
    Date operator-(int n) const { return Date{days - n}; }
    int operator-(const Date &other) const { return days - other.days; }

    bool operator==(const Date &o) const { return days == o.days; }
    bool operator!=(const Date &o) const { return days != o.days; }
    bool operator<(const Date &o) const { return days < o.days; }
    bool operator<=(const Date &o) const { return days <= o.days; }
    bool operator>(const Date &o) const { return days > o.days; }
    bool operator>=(const Date &o) const { return days >= o.days; }
};

// Parses YYYY-MM-DD, throws std::runtime_error on failure.
Date parseDate(const std::string &dateStr);

int daysInMonth(int year, int month);

}  // namespace kcalfit

#endif  // KCALFIT_DATE_H
