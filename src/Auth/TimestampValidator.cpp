/**
 * @file TimestampValidator.cpp
 * @brief Strict timestamp parsing for replay protection
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 */

#include <Hookwarden/Auth/TimestampValidator.hpp>
#include <Hookwarden/Core/Headers.hpp>
#include <Hookwarden/Core/Logger.hpp>
#include <limits>
#include <string>

namespace Hookwarden::Auth {

namespace {

bool isDigit(char c) noexcept {
    return c >= '0' && c <= '9';
}

/// Parse exactly `width` digits at `pos`
bool readDigits(std::string_view s, size_t pos, size_t width, int& out) noexcept {
    if (pos + width > s.size()) {
        return false;
    }
    int value = 0;
    for (size_t i = 0; i < width; ++i) {
        const char c = s[pos + i];
        if (!isDigit(c)) {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

bool isLeapYear(int year) noexcept {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) noexcept {
    static constexpr int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return days[month - 1];
}

/// Days since 1970-01-01 for a proleptic Gregorian date
int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) noexcept {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

bool parseUnix(std::string_view s, int64_t& out) noexcept {
    if (s.empty()) {
        return false;
    }
    if (s == "0") {
        out = 0;
        return true;
    }
    if (s[0] < '1' || s[0] > '9') {
        return false;
    }

    constexpr int64_t maxValue = std::numeric_limits<int64_t>::max();
    int64_t value = 0;
    for (char c : s) {
        if (!isDigit(c)) {
            return false;
        }
        const int digit = c - '0';
        if (value > (maxValue - digit) / 10) {
            return false;
        }
        value = value * 10 + digit;
    }
    out = value;
    return true;
}

bool parseIso8601(std::string_view s, int64_t& out) noexcept {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

    // YYYY-MM-DD
    if (!readDigits(s, 0, 4, year) || s.size() < 19 || s[4] != '-' ||
        !readDigits(s, 5, 2, month) || s[7] != '-' ||
        !readDigits(s, 8, 2, day)) {
        return false;
    }

    const char separator = s[10];
    if (separator != 'T' && separator != ' ') {
        return false;
    }

    // HH:MM:SS
    if (!readDigits(s, 11, 2, hour) || s[13] != ':' ||
        !readDigits(s, 14, 2, minute) || s[16] != ':' ||
        !readDigits(s, 17, 2, second)) {
        return false;
    }

    size_t pos = 19;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        const size_t fractionStart = pos;
        while (pos < s.size() && isDigit(s[pos])) {
            ++pos;
        }
        if (pos == fractionStart) {
            return false;
        }
    }

    const std::string_view zone = s.substr(pos);
    const bool utcZone = zone == "Z" || zone == "+00:00" || zone == "+0000" ||
                         (separator == ' ' && zone == " +0000");
    if (!utcZone) {
        return false;
    }

    if (month < 1 || month > 12) return false;
    if (day < 1 || day > daysInMonth(year, month)) return false;
    if (hour > 23 || minute > 59 || second > 59) return false;

    const int64_t days = daysFromCivil(year, static_cast<unsigned>(month),
                                       static_cast<unsigned>(day));
    out = days * 86400 + hour * 3600 + minute * 60 + second;
    return true;
}

} // namespace

void TimestampValidator::warn(std::string_view message) const {
    if (m_logger) {
        m_logger->warn(std::string("Auth::TimestampValidator validation failed: ") +
                       std::string(message));
    }
}

Result<TimestampValue> TimestampValidator::parse(std::string_view value) const {
    if (value.empty()) {
        return ErrorCode::InvalidTimestamp;
    }

    if (Core::containsControlCharacters(value)) {
        warn("Timestamp contains invalid characters");
        return ErrorCode::InvalidTimestamp;
    }

    if (Core::trim(value).size() != value.size()) {
        warn("Timestamp contains surrounding whitespace");
        return ErrorCode::InvalidTimestamp;
    }

    TimestampValue parsed;
    if (parseIso8601(value, parsed.epochSeconds)) {
        parsed.fromIso8601 = true;
        return parsed;
    }

    if (parseUnix(value, parsed.epochSeconds)) {
        return parsed;
    }

    return ErrorCode::InvalidTimestamp;
}

bool TimestampValidator::isWithinTolerance(std::string_view value, int64_t toleranceSeconds,
                                           SystemClock::time_point now) const {
    if (toleranceSeconds < 0) {
        return false;
    }

    auto parsed = parse(value);
    if (parsed.isFailure()) {
        return false;
    }

    const int64_t ts = parsed.value().epochSeconds;
    if (ts <= 0) {
        return false;
    }

    const int64_t nowSeconds =
        std::chrono::duration_cast<Seconds>(now.time_since_epoch()).count();
    if (nowSeconds < 0) {
        return false;
    }

    // Both operands are non-negative, so the difference cannot overflow
    const int64_t delta = nowSeconds >= ts ? nowSeconds - ts : ts - nowSeconds;
    return delta <= toleranceSeconds;
}

bool TimestampValidator::isValid(std::string_view value, int64_t toleranceSeconds) const {
    return isWithinTolerance(value, toleranceSeconds, SystemClock::now());
}

} // namespace Hookwarden::Auth
