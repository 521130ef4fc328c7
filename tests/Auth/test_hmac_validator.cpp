/**
 * @file test_hmac_validator.cpp
 * @brief Unit tests for the built-in HMAC authenticator
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 *
 * Covers the sender layouts in common use:
 * - GitHub style "sha256=<hex>" simple header
 * - Stripe style "t=<ts>,v1=<hex>" structured header with a template
 * - Slack style separate timestamp header with a version prefix
 */

#include <Hookwarden/Auth/HmacValidator.hpp>
#include <Hookwarden/Core/Crypto.hpp>
#include "TestHarness.hpp"
#include <gtest/gtest.h>
#include <cctype>

using namespace Hookwarden;
using namespace Hookwarden::Auth;
using namespace Hookwarden::Testing;

namespace {

constexpr const char* kSecretEnv = "HOOKWARDEN_TEST_HMAC_SECRET";
constexpr std::string_view kSecret = "s3cr3t";
constexpr std::string_view kPayload = R"({"a":1})";

std::string hexDigest(std::string_view key, std::string_view data,
                      Crypto::HashAlgorithm algorithm = Crypto::HashAlgorithm::SHA256) {
    Crypto::HMAC hmac(asBytes(key), algorithm);
    return Crypto::toHex(hmac.compute(asBytes(data)).value());
}

std::string nowSeconds() {
    return std::to_string(
        std::chrono::duration_cast<Seconds>(SystemClock::now().time_since_epoch()).count());
}

} // namespace

class HmacValidatorTest : public ::testing::Test {
protected:
    HmacValidatorTest() : secret_(kSecretEnv, std::string(kSecret)) {
        github_.secretEnvKey = kSecretEnv;
        github_.header = "X-Hub-Signature-256";
        github_.algorithm = "sha256";
        github_.signatureFormat = SignatureFormat::AlgorithmPrefixed;
    }

    bool validate(std::string_view payload, const Core::HeaderMap& headers, const AuthConfig& config) {
        return validator_.validate(asBytes(payload), headers, config, log_);
    }

    ScopedEnv secret_;
    AuthConfig github_;
    HmacValidator validator_;
    CapturingLogger log_;
};

// ============================================================================
// Simple header
// ============================================================================

TEST_F(HmacValidatorTest, GitHubSignature_IsAccepted) {
    const std::string signature = "sha256=" + hexDigest(kSecret, kPayload);
    EXPECT_TRUE(validate(kPayload, {{"X-Hub-Signature-256", signature}}, github_));
    EXPECT_TRUE(validate(kPayload, {{"x-hub-signature-256", signature}}, github_));
}

TEST_F(HmacValidatorTest, TamperedPayload_IsRejected) {
    const std::string signature = "sha256=" + hexDigest(kSecret, kPayload);
    EXPECT_FALSE(validate(R"({"a":2})", {{"X-Hub-Signature-256", signature}}, github_));
    EXPECT_TRUE(log_.contains(Core::LogLevel::Warning, "Signature mismatch"));
}

TEST_F(HmacValidatorTest, EveryBitFlipOfTheDigest_IsRejected) {
    const std::string digest = hexDigest(kSecret, kPayload);
    for (size_t i = 0; i < digest.size(); ++i) {
        std::string modified = digest;
        modified[i] = modified[i] == '0' ? '1' : '0';
        EXPECT_FALSE(validate(kPayload, {{"X-Hub-Signature-256", "sha256=" + modified}}, github_)) << i;
    }
}

TEST_F(HmacValidatorTest, UppercaseHex_IsRejected) {
    std::string digest = hexDigest(kSecret, kPayload);
    for (auto& c : digest) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    EXPECT_FALSE(validate(kPayload, {{"X-Hub-Signature-256", "sha256=" + digest}}, github_));
}

TEST_F(HmacValidatorTest, WrongPrefix_IsRejected) {
    const std::string digest = hexDigest(kSecret, kPayload);
    EXPECT_FALSE(validate(kPayload, {{"X-Hub-Signature-256", digest}}, github_));
    EXPECT_FALSE(validate(kPayload, {{"X-Hub-Signature-256", "sha1=" + digest}}, github_));
}

TEST_F(HmacValidatorTest, SignatureOnlyFormat) {
    github_.signatureFormat = SignatureFormat::HashOnly;
    github_.header = "X-Signature";
    EXPECT_TRUE(validate(kPayload, {{"X-Signature", hexDigest(kSecret, kPayload)}}, github_));
}

TEST_F(HmacValidatorTest, SecretLongerThanAnyBlock_IsAccepted) {
    const std::string longSecret(8192, 'k');
    ScopedEnv secret(kSecretEnv, longSecret);

    const std::string signature = "sha256=" + hexDigest(longSecret, kPayload);
    EXPECT_TRUE(validate(kPayload, {{"X-Hub-Signature-256", signature}}, github_));
    EXPECT_FALSE(validate(kPayload, {{"X-Hub-Signature-256", "sha256=" + hexDigest(kSecret, kPayload)}},
                          github_));
}

TEST_F(HmacValidatorTest, Sha512Algorithm) {
    github_.algorithm = "sha512";
    const std::string signature = "sha512=" + hexDigest(kSecret, kPayload, Crypto::HashAlgorithm::SHA512);
    EXPECT_TRUE(validate(kPayload, {{"X-Hub-Signature-256", signature}}, github_));
}

TEST_F(HmacValidatorTest, UnsupportedAlgorithm_IsRejected) {
    github_.algorithm = "md5";
    EXPECT_FALSE(validate(kPayload, {{"X-Hub-Signature-256", "md5=00"}}, github_));
    EXPECT_TRUE(log_.contains(Core::LogLevel::Error, "Unsupported algorithm"));
}

TEST_F(HmacValidatorTest, DefaultHeaderName) {
    github_.header.reset();
    github_.signatureFormat = SignatureFormat::HashOnly;
    EXPECT_TRUE(validate(kPayload, {{"X-Signature", hexDigest(kSecret, kPayload)}}, github_));
}

// ============================================================================
// Header hygiene
// ============================================================================

TEST_F(HmacValidatorTest, MissingOrEmptyHeader_IsRejected) {
    EXPECT_FALSE(validate(kPayload, {}, github_));
    EXPECT_FALSE(validate(kPayload, {{"X-Hub-Signature-256", ""}}, github_));
    EXPECT_TRUE(log_.contains(Core::LogLevel::Warning, "X-Hub-Signature-256"));
}

TEST_F(HmacValidatorTest, PaddedOrDirtyHeader_IsRejected) {
    const std::string signature = "sha256=" + hexDigest(kSecret, kPayload);
    EXPECT_FALSE(validate(kPayload, {{"X-Hub-Signature-256", " " + signature}}, github_));
    EXPECT_FALSE(validate(kPayload, {{"X-Hub-Signature-256", signature + "\n"}}, github_));
    EXPECT_FALSE(validate(kPayload, {{"X-Hub-Signature-256", signature + "\xFF"}}, github_));
}

TEST_F(HmacValidatorTest, OverlongHeader_IsRejected) {
    const std::string signature = "sha256=" + std::string(MAX_SIGNATURE_LENGTH, 'a');
    EXPECT_FALSE(validate(kPayload, {{"X-Hub-Signature-256", signature}}, github_));
    EXPECT_TRUE(log_.contains(Core::LogLevel::Warning, "maximum limit"));
}

// ============================================================================
// Secrets
// ============================================================================

TEST_F(HmacValidatorTest, UnsetSecret_FailsClosed) {
    ScopedEnv unset(kSecretEnv, std::nullopt);
    const std::string signature = "sha256=" + hexDigest(kSecret, kPayload);

    EXPECT_FALSE(validate(kPayload, {{"X-Hub-Signature-256", signature}}, github_));
    EXPECT_TRUE(log_.contains(Core::LogLevel::Error, kSecretEnv));
}

TEST_F(HmacValidatorTest, BlankSecret_FailsClosed) {
    ScopedEnv blank(kSecretEnv, std::string("   "));
    EXPECT_FALSE(validate(kPayload, {{"X-Hub-Signature-256", "sha256=" + hexDigest("   ", kPayload)}}, github_));
}

TEST_F(HmacValidatorTest, NoSecretKeyConfigured_FailsClosed) {
    github_.secretEnvKey.clear();
    EXPECT_FALSE(validate(kPayload, {{"X-Hub-Signature-256", "sha256=" + hexDigest(kSecret, kPayload)}}, github_));
}

TEST_F(HmacValidatorTest, SecretValueNeverLogged) {
    validate(kPayload, {{"X-Hub-Signature-256", "sha256=00"}}, github_);
    for (const auto& entry : log_.entries()) {
        EXPECT_EQ(entry.message.find(kSecret), std::string::npos) << entry.message;
    }
}

// ============================================================================
// Structured header (Stripe style)
// ============================================================================

class StructuredHmacTest : public HmacValidatorTest {
protected:
    StructuredHmacTest() {
        stripe_.secretEnvKey = kSecretEnv;
        stripe_.header = "Stripe-Signature";
        stripe_.headerFormat = HeaderFormat::Structured;
        stripe_.signatureFormat = SignatureFormat::HashOnly;
        stripe_.payloadTemplate = "{timestamp}.{body}";
    }

    std::string header(const std::string& timestamp) const {
        return "t=" + timestamp + ",v1=" + hexDigest(kSecret, timestamp + "." + std::string(kPayload));
    }

    AuthConfig stripe_;
};

TEST_F(StructuredHmacTest, FreshSignature_IsAccepted) {
    EXPECT_TRUE(validate(kPayload, {{"Stripe-Signature", header(nowSeconds())}}, stripe_));
}

TEST_F(StructuredHmacTest, StaleTimestamp_IsRejected) {
    const auto stale = std::to_string(
        std::chrono::duration_cast<Seconds>(SystemClock::now().time_since_epoch()).count() - 3600);
    EXPECT_FALSE(validate(kPayload, {{"Stripe-Signature", header(stale)}}, stripe_));
    EXPECT_TRUE(log_.contains(Core::LogLevel::Warning, "Invalid timestamp"));
}

TEST_F(StructuredHmacTest, MissingSignatureKey_IsRejected) {
    EXPECT_FALSE(validate(kPayload, {{"Stripe-Signature", "t=" + nowSeconds() + ",v0=abc"}}, stripe_));
    EXPECT_FALSE(validate(kPayload, {{"Stripe-Signature", "t=" + nowSeconds() + ",v1"}}, stripe_));
}

TEST_F(StructuredHmacTest, TemplateWithoutTimestamp_IsRejected) {
    const std::string value = "v1=" + hexDigest(kSecret, "." + std::string(kPayload));
    EXPECT_FALSE(validate(kPayload, {{"Stripe-Signature", value}}, stripe_));
    EXPECT_TRUE(log_.contains(Core::LogLevel::Warning, "{timestamp}"));
}

TEST(StructuredHeaderParse, CustomSeparators) {
    AuthConfig config;
    config.structuredHeaderSeparator = ";";
    config.keyValueSeparator = ":";
    config.signatureKey = "sig";
    config.timestampKey = "ts";

    auto parsed = HmacValidator::parseStructuredHeader("ts:123; sig:abc;", config);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->signature, "abc");
    ASSERT_TRUE(parsed->timestamp.has_value());
    EXPECT_EQ(*parsed->timestamp, "123");

    EXPECT_FALSE(HmacValidator::parseStructuredHeader("ts:123;garbage", config).has_value());
    EXPECT_FALSE(HmacValidator::parseStructuredHeader("ts:123;sig:", config).has_value());
}

// ============================================================================
// Separate timestamp header (Slack style)
// ============================================================================

TEST_F(HmacValidatorTest, SlackStyleVersionedSignature) {
    AuthConfig slack;
    slack.secretEnvKey = kSecretEnv;
    slack.header = "X-Slack-Signature";
    slack.timestampHeader = "X-Slack-Request-Timestamp";
    slack.signatureFormat = SignatureFormat::VersionPrefixed;
    slack.versionPrefix = "v0";
    slack.payloadTemplate = "{version}:{timestamp}:{body}";

    const std::string ts = nowSeconds();
    const std::string signature = "v0=" + hexDigest(kSecret, "v0:" + ts + ":" + std::string(kPayload));

    EXPECT_TRUE(validate(kPayload, {{"X-Slack-Signature", signature},
                                    {"X-Slack-Request-Timestamp", ts}}, slack));
    EXPECT_FALSE(validate(kPayload, {{"X-Slack-Signature", signature}}, slack));
    EXPECT_FALSE(validate(kPayload, {{"X-Slack-Signature", signature},
                                     {"X-Slack-Request-Timestamp", ts + " "}}, slack));
}

// ============================================================================
// Helpers
// ============================================================================

TEST(ExpandTemplate, SinglePassSubstitution) {
    EXPECT_EQ(HmacValidator::expandTemplate("{version}:{timestamp}:{body}", "v0", "123", "x"),
              "v0:123:x");
    // Placeholders inside the body are not expanded again
    EXPECT_EQ(HmacValidator::expandTemplate("{timestamp}.{body}", "v0", "1", "{timestamp}"),
              "1.{timestamp}");
    EXPECT_EQ(HmacValidator::expandTemplate("{unknown}{body", "v0", "1", "b"), "{unknown}{body");
}

TEST(FormatSignature, RendersEachFormat) {
    AuthConfig config;
    config.algorithm = "sha256";
    config.versionPrefix = "v0";

    config.signatureFormat = SignatureFormat::AlgorithmPrefixed;
    EXPECT_EQ(HmacValidator::formatSignature("ab", config), "sha256=ab");
    config.signatureFormat = SignatureFormat::HashOnly;
    EXPECT_EQ(HmacValidator::formatSignature("ab", config), "ab");
    config.signatureFormat = SignatureFormat::VersionPrefixed;
    EXPECT_EQ(HmacValidator::formatSignature("ab", config), "v0=ab");
}
