/**
 * @file Crypto.hpp
 * @brief Cryptographic primitives for request authentication
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 *
 * This module provides the primitives the signature validators build on:
 * - HMAC-SHA1/SHA256/SHA384/SHA512 computation
 * - Constant-time byte comparison
 * - Hex encoding/decoding
 * - Secure memory erasure
 */

#pragma once

#ifndef HOOKWARDEN_CORE_CRYPTO_HPP
#define HOOKWARDEN_CORE_CRYPTO_HPP

#include <Hookwarden/Core/Types.hpp>
#include <Hookwarden/Core/ErrorCodes.hpp>
#include <memory>
#include <string>

namespace Hookwarden::Crypto {

// ============================================================================
// Hash Algorithms
// ============================================================================

/**
 * @brief Digest algorithms accepted for webhook signatures
 */
enum class HashAlgorithm {
    SHA1,    // Legacy senders (e.g. GitHub X-Hub-Signature)
    SHA256,
    SHA384,
    SHA512
};

/**
 * @brief Parse a configuration algorithm name ("sha1", "sha256", ...)
 * @param name Lower-case algorithm name
 * @return Algorithm or ErrorCode::UnsupportedAlgorithm
 */
Result<HashAlgorithm> parseHashAlgorithm(std::string_view name);

/**
 * @brief Canonical lower-case name of an algorithm
 */
std::string_view hashAlgorithmName(HashAlgorithm algorithm) noexcept;

// ============================================================================
// HMAC
// ============================================================================

/**
 * @brief HMAC (Hash-based Message Authentication Code)
 *
 * @example
 * ```cpp
 * HMAC hmac(asBytes(secret), HashAlgorithm::SHA256);
 * auto mac = hmac.compute(payload);
 * if (mac.isSuccess()) {
 *     std::string hex = toHex(mac.value());
 * }
 * ```
 */
class HMAC {
public:
    /**
     * @brief Construct HMAC with key
     * @param key HMAC key (copied; erased on destruction)
     * @param algorithm Hash algorithm (default: SHA256)
     */
    explicit HMAC(ByteSpan key, HashAlgorithm algorithm = HashAlgorithm::SHA256);

    ~HMAC();

    HMAC(const HMAC&) = delete;
    HMAC& operator=(const HMAC&) = delete;

    /**
     * @brief Compute HMAC of data (one-shot)
     * @param data Data to authenticate
     * @return HMAC bytes or error
     */
    Result<ByteBuffer> compute(ByteSpan data);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * @brief Convert bytes to lowercase hex string
 */
std::string toHex(ByteSpan data);

/**
 * @brief Constant-time comparison
 *
 * Running time depends only on the lengths of the inputs, never on the
 * position of the first differing byte.
 *
 * @param a First buffer
 * @param b Second buffer
 * @return true if equal
 */
bool constantTimeCompare(ByteSpan a, ByteSpan b) noexcept;

/**
 * @brief Constant-time comparison of two strings' bytes
 */
inline bool constantTimeCompare(std::string_view a, std::string_view b) noexcept {
    return constantTimeCompare(asBytes(a), asBytes(b));
}

/**
 * @brief Securely zero memory
 * @param data Pointer to memory
 * @param size Size in bytes
 */
void secureZero(void* data, size_t size) noexcept;

/**
 * @brief Securely zero a string's contents and clear it
 */
inline void secureZero(std::string& str) noexcept {
    if (!str.empty()) {
        secureZero(str.data(), str.size());
    }
    str.clear();
}

} // namespace Hookwarden::Crypto

#endif // HOOKWARDEN_CORE_CRYPTO_HPP
