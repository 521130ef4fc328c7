/**
 * @file CryptoUtils.cpp
 * @brief Cryptographic utility functions
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 *
 * Hex encoding/decoding and secure erasure.
 */

#include <Hookwarden/Core/Crypto.hpp>
#include <openssl/crypto.h>

namespace Hookwarden::Crypto {

// ============================================================================
// Hex Encoding/Decoding
// ============================================================================

std::string toHex(ByteSpan data) {
    static constexpr char digits[] = "0123456789abcdef";

    std::string out;
    out.reserve(data.size() * 2);

    for (Byte b : data) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }

    return out;
}

// ============================================================================
// Secure erasure
// ============================================================================

void secureZero(void* data, size_t size) noexcept {
    if (data == nullptr || size == 0) {
        return;
    }
    OPENSSL_cleanse(data, size);
}

} // namespace Hookwarden::Crypto
