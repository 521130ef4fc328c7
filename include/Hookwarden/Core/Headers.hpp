/**
 * @file Headers.hpp
 * @brief Request header map and header value sanitisation
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 *
 * Header values reach the validators exactly as the sender transmitted them.
 * The helpers here answer the questions every validator asks of a raw value
 * before trusting it.
 */

#pragma once

#ifndef HOOKWARDEN_CORE_HEADERS_HPP
#define HOOKWARDEN_CORE_HEADERS_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace Hookwarden::Core {

/**
 * @brief ASCII case-insensitive ordering for header names
 */
struct CaseInsensitiveLess {
    using is_transparent = void;

    bool operator()(std::string_view a, std::string_view b) const noexcept;
};

/// Header name -> raw value; lookups ignore ASCII case
using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;

/**
 * @brief Look up a header by name, ignoring case
 * @return Raw (untrimmed) value, or nullopt if absent
 */
std::optional<std::string_view> findHeader(const HeaderMap& headers, std::string_view name);

/**
 * @brief Strip leading and trailing whitespace and NUL bytes
 */
std::string_view trim(std::string_view value) noexcept;

/**
 * @brief ASCII lower-case copy
 */
std::string toLower(std::string_view value);

/**
 * @brief Whether the value contains a C0 control, DEL, or a UTF-8 encoded C1 control
 */
bool containsControlCharacters(std::string_view value) noexcept;

/**
 * @brief Strict UTF-8 well-formedness (no overlongs, surrogates or values above U+10FFFF)
 */
bool isValidUtf8(std::string_view value) noexcept;

/**
 * @brief Raw header value acceptable to an authenticator
 *
 * Non-empty, equal to its trimmed form, free of control characters and
 * well-formed UTF-8.
 */
bool isCleanHeaderValue(std::string_view value) noexcept;

/**
 * @brief Normalised copy of a header map
 *
 * Names are lower-cased and trimmed, values trimmed; entries left empty
 * after trimming are dropped. Validators never see this copy.
 */
HeaderMap normalizeHeaders(const HeaderMap& headers);

} // namespace Hookwarden::Core

#endif // HOOKWARDEN_CORE_HEADERS_HPP
