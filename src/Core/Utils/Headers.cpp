/**
 * @file Headers.cpp
 * @brief Header lookup and sanitisation helpers
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 */

#include <Hookwarden/Core/Headers.hpp>
#include <algorithm>

namespace Hookwarden::Core {

namespace {

constexpr std::string_view kWhitespace(" \t\n\v\f\r\0", 7);

inline unsigned char lowerAscii(unsigned char c) noexcept {
    return (c >= 'A' && c <= 'Z') ? static_cast<unsigned char>(c + ('a' - 'A')) : c;
}

} // namespace

bool CaseInsensitiveLess::operator()(std::string_view a, std::string_view b) const noexcept {
    return std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(),
        [](char x, char y) {
            return lowerAscii(static_cast<unsigned char>(x)) <
                   lowerAscii(static_cast<unsigned char>(y));
        });
}

std::optional<std::string_view> findHeader(const HeaderMap& headers, std::string_view name) {
    auto it = headers.find(name);
    if (it == headers.end()) {
        return std::nullopt;
    }
    return std::string_view(it->second);
}

std::string_view trim(std::string_view value) noexcept {
    const auto first = value.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(kWhitespace);
    return value.substr(first, last - first + 1);
}

std::string toLower(std::string_view value) {
    std::string out(value);
    for (auto& c : out) {
        c = static_cast<char>(lowerAscii(static_cast<unsigned char>(c)));
    }
    return out;
}

bool containsControlCharacters(std::string_view value) noexcept {
    for (size_t i = 0; i < value.size(); ++i) {
        const auto c = static_cast<unsigned char>(value[i]);
        if (c < 0x20 || c == 0x7F) {
            return true;
        }
        // U+0080..U+009F encode as C2 80..C2 9F
        if (c == 0xC2 && i + 1 < value.size()) {
            const auto next = static_cast<unsigned char>(value[i + 1]);
            if (next >= 0x80 && next <= 0x9F) {
                return true;
            }
        }
    }
    return false;
}

bool isValidUtf8(std::string_view value) noexcept {
    size_t i = 0;
    const size_t n = value.size();

    while (i < n) {
        const auto c = static_cast<unsigned char>(value[i]);

        if (c < 0x80) {
            ++i;
            continue;
        }

        size_t len = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;

        if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c == 0xE0) {
            len = 3; lo = 0xA0;
        } else if ((c >= 0xE1 && c <= 0xEC) || c == 0xEE || c == 0xEF) {
            len = 3;
        } else if (c == 0xED) {
            len = 3; hi = 0x9F;   // no surrogates
        } else if (c == 0xF0) {
            len = 4; lo = 0x90;
        } else if (c >= 0xF1 && c <= 0xF3) {
            len = 4;
        } else if (c == 0xF4) {
            len = 4; hi = 0x8F;   // <= U+10FFFF
        } else {
            return false;
        }

        if (i + len > n) {
            return false;
        }

        const auto second = static_cast<unsigned char>(value[i + 1]);
        if (second < lo || second > hi) {
            return false;
        }
        for (size_t k = 2; k < len; ++k) {
            const auto cont = static_cast<unsigned char>(value[i + k]);
            if (cont < 0x80 || cont > 0xBF) {
                return false;
            }
        }
        i += len;
    }
    return true;
}

bool isCleanHeaderValue(std::string_view value) noexcept {
    if (value.empty()) {
        return false;
    }
    if (trim(value).size() != value.size()) {
        return false;
    }
    if (containsControlCharacters(value)) {
        return false;
    }
    return isValidUtf8(value);
}

HeaderMap normalizeHeaders(const HeaderMap& headers) {
    HeaderMap out;
    for (const auto& [name, value] : headers) {
        auto key = toLower(trim(name));
        if (key.empty()) {
            continue;
        }
        auto trimmed = trim(value);
        if (trimmed.empty()) {
            continue;
        }
        out.emplace(std::move(key), std::string(trimmed));
    }
    return out;
}

} // namespace Hookwarden::Core
