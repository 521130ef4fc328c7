/**
 * @file IpFilter.hpp
 * @brief Client address allow/block filtering
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 *
 * Rules are single addresses or CIDR networks, IPv4 or IPv6. Invalid rules
 * are dropped when a policy is built, never at match time.
 *
 * Evaluation order:
 * 1. Endpoint policy, else global policy, else allow
 * 2. Blocklist match -> deny
 * 3. Non-empty allowlist without a match -> deny
 * 4. Allow
 */

#pragma once

#ifndef HOOKWARDEN_NETWORK_IP_FILTER_HPP
#define HOOKWARDEN_NETWORK_IP_FILTER_HPP

#include <Hookwarden/Core/ErrorCodes.hpp>
#include <Hookwarden/Core/Headers.hpp>
#include <nlohmann/json.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace Hookwarden::Core {
class Logger;
}

namespace Hookwarden::Network {

/// Header consulted when a policy names none
inline constexpr std::string_view DEFAULT_IP_HEADER = "X-Forwarded-For";

/**
 * @brief IPv4 or IPv6 address
 *
 * IPv4 addresses use the first four bytes. IPv4-mapped IPv6 input
 * (::ffff:a.b.c.d) is stored as IPv4.
 */
struct IpAddress {
    std::array<uint8_t, 16> bytes{};
    bool isV4 = true;

    /**
     * @brief Parse a textual address
     * @return Address or ErrorCode::InvalidAddress
     */
    static Result<IpAddress> parse(std::string_view text);

    uint8_t maxPrefix() const noexcept { return isV4 ? 32 : 128; }
    std::string toString() const;

    bool operator==(const IpAddress& other) const noexcept {
        return isV4 == other.isV4 && bytes == other.bytes;
    }
    bool operator<(const IpAddress& other) const noexcept {
        if (isV4 != other.isV4) return isV4;
        return bytes < other.bytes;
    }
};

/**
 * @brief Single address or network
 */
struct IpRule {
    IpAddress network;      ///< Host bits cleared
    uint8_t prefixLength = 32;

    /**
     * @brief Parse "a.b.c.d", "a.b.c.d/n", "x::y" or "x::y/n"
     *
     * Host bits set in a network rule are cleared ("10.1.2.3/8" becomes
     * "10.0.0.0/8").
     *
     * @return Rule, InvalidAddress or InvalidPrefixLength
     */
    static Result<IpRule> parse(std::string_view text);

    /**
     * @brief Whether address lies inside this rule (same family only)
     */
    bool contains(const IpAddress& address) const noexcept;

    std::string toString() const;

    bool operator<(const IpRule& other) const noexcept {
        if (!(network == other.network)) {
            return network < other.network;
        }
        return prefixLength < other.prefixLength;
    }
    bool operator==(const IpRule& other) const noexcept {
        return network == other.network && prefixLength == other.prefixLength;
    }
};

/**
 * @brief Allow/block rule set for one scope (global or endpoint)
 */
struct IpPolicy {
    std::string header = std::string(DEFAULT_IP_HEADER);
    std::set<IpRule> allowlist;
    std::set<IpRule> blocklist;

    /**
     * @brief Build a policy from textual rules, dropping invalid entries
     *
     * Each dropped rule is logged at warning level.
     */
    static IpPolicy fromStrings(std::string_view header,
                                const std::vector<std::string>& allow,
                                const std::vector<std::string>& block,
                                Core::Logger& logger);
};

enum class IpVerdict {
    Allow,
    Deny
};

/**
 * @brief Stateless IP filter
 */
class IpFilter {
public:
    /**
     * @brief Decide whether the request's client address may proceed
     * @param headers Request headers
     * @param endpointPolicy Endpoint scope; replaces global when present
     * @param globalPolicy Global scope
     * @param logger Destination for deny diagnostics
     */
    static IpVerdict evaluate(const Core::HeaderMap& headers,
                              const std::optional<IpPolicy>& endpointPolicy,
                              const std::optional<IpPolicy>& globalPolicy,
                              Core::Logger& logger);

    /**
     * @brief First comma-separated element of the header, trimmed
     * @return nullopt if the header is absent or the element is empty
     */
    static std::optional<std::string> extractClientIp(const Core::HeaderMap& headers,
                                                      std::string_view header);

    /**
     * @brief Evaluate an address against a policy
     */
    static IpVerdict evaluateAddress(const IpAddress& address, const IpPolicy& policy) noexcept;

    /**
     * @brief JSON body for the 403 response
     */
    static nlohmann::json denyResponseBody(std::string_view requestId);
};

} // namespace Hookwarden::Network

#endif // HOOKWARDEN_NETWORK_IP_FILTER_HPP
