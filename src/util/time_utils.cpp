#include "util/time_utils.hpp"
#include <cctype>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace cth {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civil_from_days(int64_t z, int& year, unsigned& month, unsigned& day) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    day = doy - (153 * mp + 2) / 5 + 1;
    month = mp + (mp < 10 ? 3 : -9);
    year = static_cast<int>(y + (month <= 2));
}

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static const int table[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) return 29;
    return table[month - 1];
}

// Parses "+hh:mm", "-hh:mm", "+hhmm" or "+hh"; returns offset in seconds
std::optional<int> parse_utc_offset(const std::string& text) {
    if (text.size() < 3) return std::nullopt;
    int sign = text[0] == '+' ? 1 : (text[0] == '-' ? -1 : 0);
    if (sign == 0) return std::nullopt;

    std::string digits;
    for (size_t i = 1; i < text.size(); ++i) {
        char c = text[i];
        if (c == ':' && i == 3) continue;
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        digits += c;
    }
    if (digits.size() != 2 && digits.size() != 4) return std::nullopt;

    int hours = std::stoi(digits.substr(0, 2));
    int minutes = digits.size() == 4 ? std::stoi(digits.substr(2, 2)) : 0;
    if (hours > 23 || minutes > 59) return std::nullopt;
    return sign * (hours * 3600 + minutes * 60);
}

} // namespace

std::optional<Timestamp> parse_timestamp(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    if (begin == end) return std::nullopt;

    const std::string s = text.substr(begin, end - begin);
    const bool iso = s.find('T') != std::string::npos;

    std::istringstream in(s);
    std::tm tm{};
    in >> std::get_time(&tm, iso ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%d %H:%M:%S");
    if (in.fail()) return std::nullopt;

    int year = tm.tm_year + 1900;
    int month = tm.tm_mon + 1;
    if (month < 1 || month > 12) return std::nullopt;
    if (tm.tm_mday < 1 || tm.tm_mday > days_in_month(year, month)) return std::nullopt;
    if (tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 59) return std::nullopt;

    std::string rest;
    std::getline(in, rest);

    // Fractional seconds: keep microseconds, drop anything finer
    int64_t micros = 0;
    size_t pos = 0;
    if (pos < rest.size() && rest[pos] == '.') {
        ++pos;
        size_t digits = 0;
        while (pos < rest.size() && std::isdigit(static_cast<unsigned char>(rest[pos]))) {
            if (digits < 6) {
                micros = micros * 10 + (rest[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (size_t i = digits; i < 6; ++i) micros *= 10;
    }

    int offset_seconds = 0;
    std::string zone = rest.substr(pos);
    if (!zone.empty()) {
        if (!iso) return std::nullopt;
        if (zone == "Z" || zone == "z") {
            offset_seconds = 0;
        } else {
            auto offset = parse_utc_offset(zone);
            if (!offset) return std::nullopt;
            offset_seconds = *offset;
        }
    }

    int64_t days = days_from_civil(year, static_cast<unsigned>(month),
                                   static_cast<unsigned>(tm.tm_mday));
    int64_t seconds = days * 86400 + tm.tm_hour * 3600 + tm.tm_min * 60 + tm.tm_sec
                      - offset_seconds;

    return Timestamp(std::chrono::microseconds(seconds * 1000000 + micros));
}

std::string format_timestamp(Timestamp ts) {
    int64_t total_micros = ts.time_since_epoch().count();
    int64_t seconds = total_micros / 1000000;
    int64_t micros = total_micros % 1000000;
    if (micros < 0) {
        micros += 1000000;
        seconds -= 1;
    }
    int64_t days = seconds / 86400;
    int64_t secs_of_day = seconds % 86400;
    if (secs_of_day < 0) {
        secs_of_day += 86400;
        days -= 1;
    }

    int year = 0;
    unsigned month = 0;
    unsigned day = 0;
    civil_from_days(days, year, month, day);

    std::ostringstream out;
    out << std::setfill('0')
        << std::setw(4) << year << '-'
        << std::setw(2) << month << '-'
        << std::setw(2) << day << 'T'
        << std::setw(2) << secs_of_day / 3600 << ':'
        << std::setw(2) << (secs_of_day % 3600) / 60 << ':'
        << std::setw(2) << secs_of_day % 60;
    if (micros != 0) {
        out << '.' << std::setw(6) << micros;
    }
    out << 'Z';
    return out.str();
}

double seconds_between(Timestamp from, Timestamp to) {
    return std::chrono::duration<double>(to - from).count();
}

Timestamp floor_to_minutes(Timestamp ts, int minutes) {
    if (minutes <= 0) minutes = 1;
    // The epoch is aligned to an hour boundary, so flooring the epoch offset
    // to whole buckets matches flooring the minute-of-hour (for divisors of 60)
    const int64_t bucket = static_cast<int64_t>(minutes) * 60 * 1000000;
    int64_t micros = ts.time_since_epoch().count();
    int64_t floored = (micros / bucket) * bucket;
    if (micros < 0 && micros % bucket != 0) floored -= bucket;
    return Timestamp(std::chrono::microseconds(floored));
}

Timestamp now_utc() {
    return std::chrono::time_point_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now());
}

Timestamp make_timestamp(int year, int month, int day, int hour, int minute, int second) {
    int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second;
    return Timestamp(std::chrono::microseconds(seconds * 1000000));
}

} // namespace cth
