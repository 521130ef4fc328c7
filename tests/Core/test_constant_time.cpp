/**
 * @file test_constant_time.cpp
 * @brief Unit tests for constant-time comparison
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 *
 * Tests the constant-time comparison function to ensure:
 * 1. Correct functionality for all input cases
 * 2. Running time does not track the position of the first mismatch
 */

#include <Hookwarden/Core/Crypto.hpp>
#include <Hookwarden/Core/Types.hpp>
#include "TestHarness.hpp"
#include <gtest/gtest.h>
#include <algorithm>

using namespace Hookwarden;
using namespace Hookwarden::Crypto;
using namespace Hookwarden::Testing;

// ============================================================================
// Unit Tests
// ============================================================================

TEST(ConstantTimeCompare, Equal32ByteBuffers_ReturnsTrue) {
    ByteBuffer a(32);
    ByteBuffer b(32);
    for (size_t i = 0; i < 32; ++i) {
        a[i] = static_cast<Byte>(i);
        b[i] = static_cast<Byte>(i);
    }

    EXPECT_TRUE(constantTimeCompare(a, b));
}

TEST(ConstantTimeCompare, DifferenceAtFirstByte_ReturnsFalse) {
    ByteBuffer a(32, 0x00);
    ByteBuffer b(32, 0x00);
    b[0] = 0x01;

    EXPECT_FALSE(constantTimeCompare(a, b));
}

TEST(ConstantTimeCompare, DifferenceAtLastByte_ReturnsFalse) {
    ByteBuffer a(32, 0xAA);
    ByteBuffer b(32, 0xAA);
    b[31] = 0xBB;

    EXPECT_FALSE(constantTimeCompare(a, b));
}

TEST(ConstantTimeCompare, DifferentBufferLengths_ReturnsFalse) {
    ByteBuffer a(32, 0xFF);
    ByteBuffer b(31, 0xFF);

    EXPECT_FALSE(constantTimeCompare(a, b));
    EXPECT_FALSE(constantTimeCompare(b, a));
}

TEST(ConstantTimeCompare, BothEmptyBuffers_ReturnsTrue) {
    ByteBuffer a;
    ByteBuffer b;

    EXPECT_TRUE(constantTimeCompare(a, b));
}

TEST(ConstantTimeCompare, EmptyAgainstNonEmpty_ReturnsFalse) {
    ByteBuffer a;
    ByteBuffer b(1, 0x00);

    EXPECT_FALSE(constantTimeCompare(a, b));
    EXPECT_FALSE(constantTimeCompare(b, a));
}

/**
 * @brief Every single-bit flip of the right-hand side is detected
 */
TEST(ConstantTimeCompare, EverySingleBitFlip_ReturnsFalse) {
    const ByteBuffer original = randomBytes(16);

    BitFlipper::forEachBitFlip(original, [&](const ByteBuffer& modified, size_t bit) {
        EXPECT_FALSE(constantTimeCompare(original, modified)) << "bit " << bit;
    });
}

TEST(ConstantTimeCompare, StringOverload_ComparesRawBytes) {
    EXPECT_TRUE(constantTimeCompare(std::string_view("secret"), std::string_view("secret")));
    EXPECT_FALSE(constantTimeCompare(std::string_view("secret"), std::string_view("Secret")));
    EXPECT_FALSE(constantTimeCompare(std::string_view("secret"), std::string_view("secret ")));

    // No normalisation: NFC and NFD spellings of "é" differ
    EXPECT_FALSE(constantTimeCompare(std::string_view("\xC3\xA9"), std::string_view("e\xCC\x81")));
}

TEST(ConstantTimeCompare, EmbeddedNulBytes_AreCompared) {
    const std::string a("ab\0cd", 5);
    const std::string b("ab\0ce", 5);

    EXPECT_FALSE(constantTimeCompare(std::string_view(a), std::string_view(b)));
    EXPECT_TRUE(constantTimeCompare(std::string_view(a), std::string_view(a)));
}

// ============================================================================
// Timing
// ============================================================================

class ConstantTimeTimingTest : public TimingTestFixture {};

/**
 * @brief Mismatch at the first and at the last byte take comparable time
 *
 * The bound is loose; a short-circuiting memcmp over 4 KiB differs by
 * orders of magnitude.
 */
TEST_F(ConstantTimeTimingTest, MismatchPosition_DoesNotDominateTiming) {
    constexpr size_t size = 4096;
    const ByteBuffer reference(size, 0x5A);
    ByteBuffer early = reference;
    ByteBuffer late = reference;
    early[0] ^= 0xFF;
    late[size - 1] ^= 0xFF;

    volatile bool sink = false;
    std::vector<double> earlyTimes;
    std::vector<double> lateTimes;
    for (int round = 0; round < 5; ++round) {
        earlyTimes.push_back(measureTime([&] { sink = constantTimeCompare(reference, early); }, 2000));
        lateTimes.push_back(measureTime([&] { sink = constantTimeCompare(reference, late); }, 2000));
    }
    (void)sink;

    const double earlyBest = *std::min_element(earlyTimes.begin(), earlyTimes.end());
    const double lateBest = *std::min_element(lateTimes.begin(), lateTimes.end());
    ASSERT_GT(earlyBest, 0.0);
    EXPECT_LT(lateBest / earlyBest, 3.0);
    EXPECT_LT(earlyBest / lateBest, 3.0);
}
