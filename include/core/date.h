#pragma once

#include <cstdint>
#include <ostream>
#include <string>

namespace hedging {

// Calendar date stored as a day serial (days since 1970-01-01, proleptic
// Gregorian). Differences are whole calendar days.
class Date {
public:
    Date() : serial_(0) {}
    explicit Date(int64_t serial) : serial_(serial) {}

    static Date fromYmd(int year, unsigned month, unsigned day);
    // Parses YYYY-MM-DD; throws std::invalid_argument on malformed input
    static Date parse(const std::string& text);

    int64_t serial() const { return serial_; }
    int year() const;
    unsigned month() const;
    unsigned day() const;

    // 0 = Monday ... 6 = Sunday
    unsigned weekday() const;
    bool isWeekend() const { return weekday() >= 5; }

    Date addDays(int64_t days) const { return Date(serial_ + days); }
    Date nextBusinessDay() const;
    // Returns this date if it is a business day, otherwise the next one
    Date rollForward() const;

    std::string toString() const;

    int64_t operator-(const Date& other) const { return serial_ - other.serial_; }
    bool operator==(const Date& other) const { return serial_ == other.serial_; }
    bool operator!=(const Date& other) const { return serial_ != other.serial_; }
    bool operator<(const Date& other) const { return serial_ < other.serial_; }
    bool operator<=(const Date& other) const { return serial_ <= other.serial_; }
    bool operator>(const Date& other) const { return serial_ > other.serial_; }
    bool operator>=(const Date& other) const { return serial_ >= other.serial_; }

private:
    struct Ymd {
        int year;
        unsigned month;
        unsigned day;
    };
    Ymd toYmd() const;

    int64_t serial_;
};

inline std::ostream& operator<<(std::ostream& os, const Date& date) {
    return os << date.toString();
}

} // namespace hedging
