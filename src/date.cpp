#include "kcalfit/date.h"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace kcalfit {

namespace {

// Day count <-> civil date conversion (H. Hinnant's algorithm).
int daysFromCivil(int y, int m, int d) {
    y -= m <= 2;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const int yoe = y - era * 400;
    const int doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const int doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

void civilFromDays(int z, int &y, int &m, int &d) {
    z += 719468;
    const int era = (z >= 0 ? z : z - 146096) / 146097;
    const int doe = z - era * 146097;
    const int yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = yoe + era * 400 + (m <= 2);
}

bool isLeap(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

}  // namespace

Date Date::fromYmd(int year, int month, int day) {
    return Date{daysFromCivil(year, month, day)};
}

int Date::year() const {
    int y, m, d;
    civilFromDays(days, y, m, d);
    return y;
}

int Date::month() const {
    int y, m, d;
    civilFromDays(days, y, m, d);
    return m;
}

int Date::day() const {
    int y, m, d;
    civilFromDays(days, y, m, d);
    return d;
}

int Date::weekday() const {
    // 1970-01-01 was a Thursday
    int w = (days + 3) % 7;
    if (w < 0) w += 7;
    return w + 1;
}

std::string Date::str() const {
    int y, m, d;
    civilFromDays(days, y, m, d);
    std::ostringstream ss;
    ss << std::setfill('0') << std::setw(4) << y << '-' << std::setw(2) << m
       << '-' << std::setw(2) << d;
    return ss.str();
}

int daysInMonth(int year, int month) {
    static const int lengths[] = {31, 28, 31, 30, 31, 30,
                                  31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeap(year)) return 29;
    return lengths[month - 1];
}

Date parseDate(const std::string &dateStr) {
    std::tm tm = {};
    std::istringstream ss(dateStr);
    ss >> std::get_time(&tm, "%Y-%m-%d");
    if (ss.fail() || ss.peek() != std::char_traits<char>::eof()) {
        throw std::runtime_error("Failed to parse date: " + dateStr);
    }
    const int year = tm.tm_year + 1900;
    const int month = tm.tm_mon + 1;
    if (tm.tm_mday > daysInMonth(year, month)) {
        throw std::runtime_error("Failed to parse date: " + dateStr);
    }
    return Date::fromYmd(year, month, tm.tm_mday);
}

}  // namespace kcalfit
