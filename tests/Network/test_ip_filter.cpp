/**
 * @file test_ip_filter.cpp
 * @brief Unit tests for client address filtering
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 */

#include <Hookwarden/Network/IpFilter.hpp>
#include "TestHarness.hpp"
#include <gtest/gtest.h>

using namespace Hookwarden;
using namespace Hookwarden::Network;
using namespace Hookwarden::Testing;

namespace {

IpPolicy policy(std::vector<std::string> allow, std::vector<std::string> block,
                std::string_view header = DEFAULT_IP_HEADER) {
    CapturingLogger log;
    return IpPolicy::fromStrings(header, allow, block, log);
}

IpAddress address(std::string_view text) {
    return IpAddress::parse(text).value();
}

} // namespace

// ============================================================================
// Parsing
// ============================================================================

TEST(IpAddress, ParsesBothFamilies) {
    auto v4 = IpAddress::parse("192.168.1.10");
    ASSERT_TRUE(v4.isSuccess());
    EXPECT_TRUE(v4.value().isV4);
    EXPECT_EQ(v4.value().toString(), "192.168.1.10");

    auto v6 = IpAddress::parse("2001:db8::1");
    ASSERT_TRUE(v6.isSuccess());
    EXPECT_FALSE(v6.value().isV4);
    EXPECT_EQ(v6.value().toString(), "2001:db8::1");
}

TEST(IpAddress, V4MappedIsStoredAsV4) {
    auto mapped = IpAddress::parse("::ffff:10.1.2.3");
    ASSERT_TRUE(mapped.isSuccess());
    EXPECT_TRUE(mapped.value().isV4);
    EXPECT_EQ(mapped.value(), address("10.1.2.3"));
}

TEST(IpAddress, RejectsGarbage) {
    for (const char* text : {"", "not-an-ip", "256.1.1.1", "1.2.3", "10.0.0.1/8", "::g", " 10.0.0.1"}) {
        auto result = IpAddress::parse(text);
        ASSERT_RESULT_ERROR(result, ErrorCode::InvalidAddress);
    }
}

TEST(IpRule, SingleAddressIsFullPrefix) {
    auto v4 = IpRule::parse("10.0.0.1");
    ASSERT_TRUE(v4.isSuccess());
    EXPECT_EQ(v4.value().prefixLength, 32);

    auto v6 = IpRule::parse("2001:db8::1");
    ASSERT_TRUE(v6.isSuccess());
    EXPECT_EQ(v6.value().prefixLength, 128);
}

TEST(IpRule, HostBitsAreCleared) {
    auto rule = IpRule::parse("10.1.2.3/8");
    ASSERT_TRUE(rule.isSuccess());
    EXPECT_EQ(rule.value().toString(), "10.0.0.0/8");

    auto v6 = IpRule::parse("2001:db8:abcd::1/32");
    ASSERT_TRUE(v6.isSuccess());
    EXPECT_EQ(v6.value().toString(), "2001:db8::/32");
}

TEST(IpRule, RejectsBadPrefixes) {
    for (const char* text : {"10.0.0.0/33", "10.0.0.0/", "10.0.0.0/-1", "10.0.0.0/8a",
                             "2001:db8::/129", "10.0.0.0/0008"}) {
        auto result = IpRule::parse(text);
        ASSERT_RESULT_ERROR(result, ErrorCode::InvalidPrefixLength);
    }
}

TEST(IpRule, ContainsRespectsFamilyAndPrefix) {
    const auto rule = IpRule::parse("192.168.0.0/16").value();
    EXPECT_TRUE(rule.contains(address("192.168.255.1")));
    EXPECT_FALSE(rule.contains(address("192.169.0.1")));
    EXPECT_FALSE(rule.contains(address("::ffff:c0a9:1")));
    EXPECT_TRUE(rule.contains(address("::ffff:192.168.0.7")));

    const auto any = IpRule::parse("0.0.0.0/0").value();
    EXPECT_TRUE(any.contains(address("8.8.8.8")));
    EXPECT_FALSE(any.contains(address("2001:db8::1")));

    const auto v6 = IpRule::parse("2001:db8::/32").value();
    EXPECT_TRUE(v6.contains(address("2001:db8:ffff::1")));
    EXPECT_FALSE(v6.contains(address("2001:db9::1")));
}

TEST(IpRule, FirstAndLastAddressOfRange) {
    const auto rule = IpRule::parse("192.168.0.0/16").value();
    EXPECT_TRUE(rule.contains(address("192.168.0.0")));
    EXPECT_TRUE(rule.contains(address("192.168.255.255")));
    EXPECT_FALSE(rule.contains(address("192.167.255.255")));
    EXPECT_FALSE(rule.contains(address("192.169.0.0")));

    const auto v6 = IpRule::parse("2001:db8::/32").value();
    EXPECT_TRUE(v6.contains(address("2001:db8::")));
    EXPECT_TRUE(v6.contains(address("2001:db8:ffff:ffff:ffff:ffff:ffff:ffff")));
    EXPECT_FALSE(v6.contains(address("2001:db7:ffff:ffff:ffff:ffff:ffff:ffff")));
}

TEST(IpRule, PrefixEndingInsideAByte) {
    const auto v4 = IpRule::parse("10.0.0.32/27").value();
    EXPECT_FALSE(v4.contains(address("10.0.0.31")));
    EXPECT_TRUE(v4.contains(address("10.0.0.32")));
    EXPECT_TRUE(v4.contains(address("10.0.0.63")));
    EXPECT_FALSE(v4.contains(address("10.0.0.64")));

    const auto v6 = IpRule::parse("2001:db8::8/125").value();
    EXPECT_FALSE(v6.contains(address("2001:db8::7")));
    EXPECT_TRUE(v6.contains(address("2001:db8::8")));
    EXPECT_TRUE(v6.contains(address("2001:db8::f")));
    EXPECT_FALSE(v6.contains(address("2001:db8::10")));

    const auto odd = IpRule::parse("172.16.0.0/12").value();
    EXPECT_TRUE(odd.contains(address("172.31.255.255")));
    EXPECT_FALSE(odd.contains(address("172.32.0.0")));
}

TEST(IpPolicy, InvalidEntriesAreDroppedAndLogged) {
    CapturingLogger log;
    const auto built = IpPolicy::fromStrings("", {"10.0.0.0/8", "bogus"}, {"1.2.3.4/40"}, log);

    EXPECT_EQ(built.header, "X-Forwarded-For");
    EXPECT_EQ(built.allowlist.size(), 1u);
    EXPECT_TRUE(built.blocklist.empty());
    EXPECT_TRUE(log.contains(Core::LogLevel::Warning, "allowlist entry 'bogus'"));
    EXPECT_TRUE(log.contains(Core::LogLevel::Warning, "blocklist entry '1.2.3.4/40'"));
}

TEST(IpPolicy, DuplicateRulesCollapse) {
    const auto built = policy({"10.0.0.0/8", "10.9.9.9/8", "10.0.0.0/8"}, {});
    EXPECT_EQ(built.allowlist.size(), 1u);
}

// ============================================================================
// Evaluation
// ============================================================================

TEST(IpFilter, NoPolicyAllows) {
    CapturingLogger log;
    EXPECT_EQ(IpFilter::evaluate({}, std::nullopt, std::nullopt, log), IpVerdict::Allow);
}

TEST(IpFilter, BlocklistTakesPrecedence) {
    const auto p = policy({"10.0.0.0/8"}, {"10.0.0.5"});
    EXPECT_EQ(IpFilter::evaluateAddress(address("10.0.0.5"), p), IpVerdict::Deny);
    EXPECT_EQ(IpFilter::evaluateAddress(address("10.0.0.6"), p), IpVerdict::Allow);
}

TEST(IpFilter, NonEmptyAllowlistDeniesOthers) {
    const auto p = policy({"10.0.0.0/8"}, {});
    EXPECT_EQ(IpFilter::evaluateAddress(address("11.0.0.1"), p), IpVerdict::Deny);
}

TEST(IpFilter, EmptyListsAllowEverything) {
    const auto p = policy({}, {});
    EXPECT_EQ(IpFilter::evaluateAddress(address("203.0.113.9"), p), IpVerdict::Allow);
    EXPECT_EQ(IpFilter::evaluateAddress(address("2001:db8::9"), p), IpVerdict::Allow);
}

TEST(IpFilter, FirstForwardedAddressIsTheClient) {
    Core::HeaderMap headers{{"x-forwarded-for", " 203.0.113.7 , 10.0.0.1"}};
    EXPECT_EQ(*IpFilter::extractClientIp(headers, "X-Forwarded-For"), "203.0.113.7");

    CapturingLogger log;
    const std::optional<IpPolicy> global = policy({"203.0.113.0/24"}, {});
    EXPECT_EQ(IpFilter::evaluate(headers, std::nullopt, global, log), IpVerdict::Allow);
}

TEST(IpFilter, EmptyFirstElementIsNoAddress) {
    Core::HeaderMap headers{{"X-Forwarded-For", " , 10.0.0.1"}};
    EXPECT_FALSE(IpFilter::extractClientIp(headers, "X-Forwarded-For").has_value());
}

TEST(IpFilter, CustomHeader) {
    Core::HeaderMap headers{{"X-Real-IP", "198.51.100.4"}, {"X-Forwarded-For", "10.0.0.1"}};
    CapturingLogger log;

    const std::optional<IpPolicy> global = policy({"198.51.100.0/24"}, {}, "X-Real-IP");
    EXPECT_EQ(IpFilter::evaluate(headers, std::nullopt, global, log), IpVerdict::Allow);
}

TEST(IpFilter, MissingHeaderWithAllowlistDenies) {
    CapturingLogger log;
    const std::optional<IpPolicy> global = policy({"10.0.0.0/8"}, {});

    EXPECT_EQ(IpFilter::evaluate({}, std::nullopt, global, log), IpVerdict::Deny);
    EXPECT_TRUE(log.contains(Core::LogLevel::Warning, "no client address"));
}

TEST(IpFilter, MissingHeaderWithBlocklistOnlyAllows) {
    CapturingLogger log;
    const std::optional<IpPolicy> global = policy({}, {"10.0.0.0/8"});
    EXPECT_EQ(IpFilter::evaluate({}, std::nullopt, global, log), IpVerdict::Allow);
}

TEST(IpFilter, UnparseableAddressDenies) {
    CapturingLogger log;
    Core::HeaderMap headers{{"X-Forwarded-For", "unknown"}};
    const std::optional<IpPolicy> global = policy({}, {"10.0.0.0/8"});

    EXPECT_EQ(IpFilter::evaluate(headers, std::nullopt, global, log), IpVerdict::Deny);
    EXPECT_TRUE(log.contains(Core::LogLevel::Warning, "unparseable"));
}

TEST(IpFilter, EndpointPolicyReplacesGlobal) {
    CapturingLogger log;
    Core::HeaderMap headers{{"X-Forwarded-For", "10.0.0.1"}};

    const std::optional<IpPolicy> global = policy({}, {"10.0.0.0/8"});
    const std::optional<IpPolicy> endpoint = policy({"10.0.0.0/24"}, {});

    EXPECT_EQ(IpFilter::evaluate(headers, std::nullopt, global, log), IpVerdict::Deny);
    // Global blocklist is not consulted once the endpoint has its own policy
    EXPECT_EQ(IpFilter::evaluate(headers, endpoint, global, log), IpVerdict::Allow);
}

TEST(IpFilter, V4MappedClientMatchesV4Rules) {
    CapturingLogger log;
    Core::HeaderMap headers{{"X-Forwarded-For", "::ffff:10.0.0.1"}};
    const std::optional<IpPolicy> global = policy({}, {"10.0.0.0/8"});

    EXPECT_EQ(IpFilter::evaluate(headers, std::nullopt, global, log), IpVerdict::Deny);
    EXPECT_TRUE(log.contains(Core::LogLevel::Warning, "denied request from 10.0.0.1"));
}

TEST(IpFilter, Ipv6Cidr) {
    CapturingLogger log;
    const std::optional<IpPolicy> global = policy({"2001:db8::/48"}, {});

    Core::HeaderMap inside{{"X-Forwarded-For", "2001:db8:0:1::5"}};
    Core::HeaderMap outside{{"X-Forwarded-For", "2001:db8:1::5"}};
    EXPECT_EQ(IpFilter::evaluate(inside, std::nullopt, global, log), IpVerdict::Allow);
    EXPECT_EQ(IpFilter::evaluate(outside, std::nullopt, global, log), IpVerdict::Deny);
}

TEST(IpFilter, DenyBody) {
    const auto body = IpFilter::denyResponseBody("req-1");
    EXPECT_EQ(body["error"], "ip_filtering_failed");
    EXPECT_EQ(body["message"], "IP address not allowed");
    EXPECT_EQ(body["request_id"], "req-1");
}
