/**
 * @file TimestampValidator.hpp
 * @brief Replay-window validation of request timestamps
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 *
 * Accepts exactly two forms:
 * - Unix seconds: "0" or [1-9][0-9]*
 * - ISO-8601 in UTC: YYYY-MM-DD(T| )HH:MM:SS(.fraction)? followed by
 *   "Z", "+00:00" or "+0000", plus "YYYY-MM-DD HH:MM:SS +0000"
 *
 * Anything else, including any non-UTC offset, is invalid.
 */

#pragma once

#ifndef HOOKWARDEN_AUTH_TIMESTAMP_VALIDATOR_HPP
#define HOOKWARDEN_AUTH_TIMESTAMP_VALIDATOR_HPP

#include <Hookwarden/Core/Types.hpp>
#include <Hookwarden/Core/ErrorCodes.hpp>
#include <cstdint>
#include <string_view>

namespace Hookwarden::Core {
class Logger;
}

namespace Hookwarden::Auth {

/**
 * @brief Parsed timestamp
 */
struct TimestampValue {
    int64_t epochSeconds = 0;
    bool utc = true;           ///< Always true; non-UTC inputs never parse
    bool fromIso8601 = false;
};

/**
 * @brief Parser and tolerance check for signature timestamps
 *
 * Stateless apart from an optional logger for rejection diagnostics.
 */
class TimestampValidator {
public:
    explicit TimestampValidator(Core::Logger* logger = nullptr) noexcept
        : m_logger(logger) {}

    /**
     * @brief Parse a timestamp header value
     * @return Parsed value or ErrorCode::InvalidTimestamp
     */
    Result<TimestampValue> parse(std::string_view value) const;

    /**
     * @brief Check value against now with an inclusive tolerance
     *
     * Timestamps at or before the epoch never pass.
     */
    bool isWithinTolerance(std::string_view value, int64_t toleranceSeconds,
                           SystemClock::time_point now) const;

    /**
     * @brief isWithinTolerance() against the system clock
     */
    bool isValid(std::string_view value, int64_t toleranceSeconds) const;

private:
    void warn(std::string_view message) const;

    Core::Logger* m_logger;
};

} // namespace Hookwarden::Auth

#endif // HOOKWARDEN_AUTH_TIMESTAMP_VALIDATOR_HPP
