#include "core/date.h"
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace hedging {

namespace {

// Civil calendar <-> day serial conversions (era-based, valid for the
// proleptic Gregorian calendar).
int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

bool isLeapYear(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned daysInMonth(int y, unsigned m) {
    static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && isLeapYear(y)) ? 29 : kDays[m - 1];
}

} // namespace

Date Date::fromYmd(int year, unsigned month, unsigned day) {
    if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month)) {
        std::ostringstream ss;
        ss << "Invalid calendar date: " << year << "-" << month << "-" << day;
        throw std::invalid_argument(ss.str());
    }
    return Date(daysFromCivil(year, month, day));
}

Date Date::parse(const std::string& text) {
    int year = 0;
    unsigned month = 0;
    unsigned day = 0;
    char sep1 = 0;
    char sep2 = 0;

    std::istringstream iss(text);
    iss >> year >> sep1 >> month >> sep2 >> day;
    if (iss.fail() || sep1 != '-' || sep2 != '-') {
        throw std::invalid_argument("Cannot parse date (expected YYYY-MM-DD): '" + text + "'");
    }
    // Allow a trailing time component, e.g. "2020-02-20 00:00:00"
    std::string rest;
    std::getline(iss, rest);
    if (!rest.empty() && rest[0] != ' ' && rest[0] != 'T') {
        throw std::invalid_argument("Cannot parse date (expected YYYY-MM-DD): '" + text + "'");
    }
    return fromYmd(year, month, day);
}

Date::Ymd Date::toYmd() const {
    int64_t z = serial_ + 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return {static_cast<int>(y + (m <= 2)), m, d};
}

int Date::year() const { return toYmd().year; }
unsigned Date::month() const { return toYmd().month; }
unsigned Date::day() const { return toYmd().day; }

unsigned Date::weekday() const {
    // 1970-01-01 was a Thursday (index 3)
    int64_t w = (serial_ + 3) % 7;
    if (w < 0) {
        w += 7;
    }
    return static_cast<unsigned>(w);
}

Date Date::nextBusinessDay() const {
    Date next = addDays(1);
    while (next.isWeekend()) {
        next = next.addDays(1);
    }
    return next;
}

Date Date::rollForward() const {
    return isWeekend() ? nextBusinessDay() : *this;
}

std::string Date::toString() const {
    const Ymd ymd = toYmd();
    std::ostringstream ss;
    ss << std::setfill('0') << std::setw(4) << ymd.year << "-"
       << std::setw(2) << ymd.month << "-"
       << std::setw(2) << ymd.day;
    return ss.str();
}

} // namespace hedging
