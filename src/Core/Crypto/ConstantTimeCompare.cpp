/**
 * @file ConstantTimeCompare.cpp
 * @brief Constant-time comparison for signature and secret verification
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 *
 * Every comparison of attacker-supplied bytes against a secret or an
 * expected signature goes through this function.
 */

#include <Hookwarden/Core/Crypto.hpp>
#include <openssl/crypto.h>

namespace Hookwarden::Crypto {

/**
 * @brief Constant-time comparison of byte arrays
 *
 * **Security Properties:**
 * - Always examines every byte regardless of mismatch position
 * - Delegates to OpenSSL's CRYPTO_memcmp
 *
 * **Implementation Notes:**
 * - Length comparison IS timing-variable. Signature lengths are fixed by the
 *   algorithm and shared secrets are compared only after the caller has
 *   accepted the header, so length leaks nothing beyond what the format
 *   already discloses.
 *
 * @note Thread-safe: Pure function with no state
 */
bool constantTimeCompare(ByteSpan a, ByteSpan b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }

    if (a.empty()) {
        return true;
    }

    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace Hookwarden::Crypto
