/**
 * @file IpFilter.cpp
 * @brief Exact and CIDR address matching for IPv4 and IPv6
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 */

#include <Hookwarden/Network/IpFilter.hpp>
#include <Hookwarden/Core/Logger.hpp>
#include <cstring>
#include <exception>
#include <string>

#if defined(_WIN32)
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <arpa/inet.h>
#include <netinet/in.h>
#endif

namespace Hookwarden::Network {

namespace {

constexpr uint8_t kMappedPrefix[12] = {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0xFF, 0xFF};

/// Clear every bit after the first prefixLength bits
void maskTo(std::array<uint8_t, 16>& bytes, uint8_t prefixLength, size_t width) {
    for (size_t i = 0; i < width; ++i) {
        const int bitsInByte = static_cast<int>(prefixLength) - static_cast<int>(i * 8);
        if (bitsInByte >= 8) {
            continue;
        }
        if (bitsInByte <= 0) {
            bytes[i] = 0;
        } else {
            bytes[i] &= static_cast<uint8_t>(0xFF << (8 - bitsInByte));
        }
    }
}

bool parsePrefix(std::string_view text, uint8_t maxPrefix, uint8_t& out) {
    if (text.empty() || text.size() > 3) {
        return false;
    }
    int value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    if (value > maxPrefix) {
        return false;
    }
    out = static_cast<uint8_t>(value);
    return true;
}

} // namespace

// ============================================================================
// IpAddress
// ============================================================================

Result<IpAddress> IpAddress::parse(std::string_view text) {
    if (text.empty() || text.size() > 64) {
        return ErrorCode::InvalidAddress;
    }
    const std::string str(text);

    IpAddress address;

    in_addr v4{};
    if (inet_pton(AF_INET, str.c_str(), &v4) == 1) {
        std::memcpy(address.bytes.data(), &v4, 4);
        address.isV4 = true;
        return address;
    }

    in6_addr v6{};
    if (inet_pton(AF_INET6, str.c_str(), &v6) == 1) {
        std::memcpy(address.bytes.data(), &v6, 16);
        address.isV4 = false;

        if (std::memcmp(address.bytes.data(), kMappedPrefix, sizeof(kMappedPrefix)) == 0) {
            std::array<uint8_t, 16> mapped{};
            std::memcpy(mapped.data(), address.bytes.data() + 12, 4);
            address.bytes = mapped;
            address.isV4 = true;
        }
        return address;
    }

    return ErrorCode::InvalidAddress;
}

std::string IpAddress::toString() const {
    char buffer[INET6_ADDRSTRLEN] = {};
    if (isV4) {
        in_addr v4{};
        std::memcpy(&v4, bytes.data(), 4);
        if (inet_ntop(AF_INET, &v4, buffer, sizeof(buffer)) == nullptr) {
            return {};
        }
    } else {
        in6_addr v6{};
        std::memcpy(&v6, bytes.data(), 16);
        if (inet_ntop(AF_INET6, &v6, buffer, sizeof(buffer)) == nullptr) {
            return {};
        }
    }
    return buffer;
}

// ============================================================================
// IpRule
// ============================================================================

Result<IpRule> IpRule::parse(std::string_view text) {
    const auto trimmed = Core::trim(text);
    const auto slash = trimmed.find('/');

    auto address = IpAddress::parse(trimmed.substr(0, slash));
    if (address.isFailure()) {
        return address.error();
    }

    IpRule rule;
    rule.network = address.value();
    rule.prefixLength = rule.network.maxPrefix();

    if (slash != std::string_view::npos) {
        if (!parsePrefix(trimmed.substr(slash + 1), rule.network.maxPrefix(), rule.prefixLength)) {
            return ErrorCode::InvalidPrefixLength;
        }
    }

    maskTo(rule.network.bytes, rule.prefixLength, rule.network.isV4 ? 4 : 16);
    return rule;
}

bool IpRule::contains(const IpAddress& address) const noexcept {
    if (address.isV4 != network.isV4) {
        return false;
    }
    std::array<uint8_t, 16> masked = address.bytes;
    maskTo(masked, prefixLength, network.isV4 ? 4 : 16);
    return masked == network.bytes;
}

std::string IpRule::toString() const {
    return network.toString() + "/" + std::to_string(prefixLength);
}

// ============================================================================
// IpPolicy
// ============================================================================

IpPolicy IpPolicy::fromStrings(std::string_view header,
                               const std::vector<std::string>& allow,
                               const std::vector<std::string>& block,
                               Core::Logger& logger) {
    IpPolicy policy;
    if (!header.empty()) {
        policy.header = std::string(header);
    }

    auto load = [&logger](const std::vector<std::string>& entries, std::set<IpRule>& out,
                          std::string_view listName) {
        for (const auto& entry : entries) {
            auto rule = IpRule::parse(entry);
            if (rule.isFailure()) {
                logger.warn("Dropping invalid " + std::string(listName) + " entry '" + entry +
                            "': " + std::string(getErrorMessage(rule.error())));
                continue;
            }
            out.insert(rule.value());
        }
    };

    load(allow, policy.allowlist, "allowlist");
    load(block, policy.blocklist, "blocklist");
    return policy;
}

// ============================================================================
// IpFilter
// ============================================================================

std::optional<std::string> IpFilter::extractClientIp(const Core::HeaderMap& headers,
                                                     std::string_view header) {
    const auto value = Core::findHeader(headers, header);
    if (!value) {
        return std::nullopt;
    }
    const auto first = Core::trim(value->substr(0, value->find(',')));
    if (first.empty()) {
        return std::nullopt;
    }
    return std::string(first);
}

IpVerdict IpFilter::evaluateAddress(const IpAddress& address, const IpPolicy& policy) noexcept {
    for (const auto& rule : policy.blocklist) {
        if (rule.contains(address)) {
            return IpVerdict::Deny;
        }
    }

    if (policy.allowlist.empty()) {
        return IpVerdict::Allow;
    }

    for (const auto& rule : policy.allowlist) {
        if (rule.contains(address)) {
            return IpVerdict::Allow;
        }
    }
    return IpVerdict::Deny;
}

IpVerdict IpFilter::evaluate(const Core::HeaderMap& headers,
                             const std::optional<IpPolicy>& endpointPolicy,
                             const std::optional<IpPolicy>& globalPolicy,
                             Core::Logger& logger) {
    try {
        const IpPolicy* policy = endpointPolicy ? &*endpointPolicy
                               : globalPolicy   ? &*globalPolicy
                                                : nullptr;
        if (policy == nullptr) {
            return IpVerdict::Allow;
        }

        const auto clientIp = extractClientIp(headers, policy->header);
        if (!clientIp) {
            if (!policy->allowlist.empty()) {
                logger.warn("IP filtering denied request: no client address in header '" +
                            policy->header + "'");
                return IpVerdict::Deny;
            }
            return IpVerdict::Allow;
        }

        auto address = IpAddress::parse(*clientIp);
        if (address.isFailure()) {
            logger.warn("IP filtering denied request: unparseable client address in header '" +
                        policy->header + "'");
            return IpVerdict::Deny;
        }

        const IpVerdict verdict = evaluateAddress(address.value(), *policy);
        if (verdict == IpVerdict::Deny) {
            logger.warn("IP filtering denied request from " + address.value().toString());
        }
        return verdict;

    } catch (const std::exception& e) {
        logger.error(std::string("IP filtering failed: ") + e.what());
        return IpVerdict::Deny;
    }
}

nlohmann::json IpFilter::denyResponseBody(std::string_view requestId) {
    return {
        {"error", "ip_filtering_failed"},
        {"message", "IP address not allowed"},
        {"request_id", std::string(requestId)}
    };
}

} // namespace Hookwarden::Network
