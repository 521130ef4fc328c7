/**
 * @file HMAC.cpp
 * @brief HMAC (Hash-based Message Authentication Code) implementation
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 *
 * Computes the keyed digests webhook senders attach to their requests, with
 * constant-time verification.
 */

#include <Hookwarden/Core/Crypto.hpp>
#include <openssl/hmac.h>
#include <openssl/evp.h>
#include <openssl/crypto.h>
#include <climits>

namespace Hookwarden::Crypto {

// ============================================================================
// Algorithm names
// ============================================================================

Result<HashAlgorithm> parseHashAlgorithm(std::string_view name) {
    if (name == "sha1")   return HashAlgorithm::SHA1;
    if (name == "sha256") return HashAlgorithm::SHA256;
    if (name == "sha384") return HashAlgorithm::SHA384;
    if (name == "sha512") return HashAlgorithm::SHA512;
    return ErrorCode::UnsupportedAlgorithm;
}

std::string_view hashAlgorithmName(HashAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case HashAlgorithm::SHA1:   return "sha1";
        case HashAlgorithm::SHA256: return "sha256";
        case HashAlgorithm::SHA384: return "sha384";
        case HashAlgorithm::SHA512: return "sha512";
    }
    return "unknown";
}

// ============================================================================
// HMAC::Impl - Implementation details
// ============================================================================

class HMAC::Impl {
public:
    explicit Impl(ByteSpan key, HashAlgorithm algorithm)
        : m_key(key.begin(), key.end()) {

        switch (algorithm) {
            case HashAlgorithm::SHA1:
                m_evp_md = EVP_sha1();
                break;
            case HashAlgorithm::SHA256:
                m_evp_md = EVP_sha256();
                break;
            case HashAlgorithm::SHA384:
                m_evp_md = EVP_sha384();
                break;
            case HashAlgorithm::SHA512:
                m_evp_md = EVP_sha512();
                break;
        }
    }

    ~Impl() {
        if (!m_key.empty()) {
            OPENSSL_cleanse(m_key.data(), m_key.size());
        }
    }

    Result<ByteBuffer> compute(ByteSpan data) {
        if (m_evp_md == nullptr) {
            return ErrorCode::UnsupportedAlgorithm;
        }

        // Keys longer than the block size are hashed by HMAC itself
        if (m_key.size() > INT_MAX) {
            return ErrorCode::InvalidKey;
        }

        unsigned int len = 0;
        ByteBuffer result(EVP_MAX_MD_SIZE);

        // OpenSSL rejects a null data pointer even for zero length
        static const Byte empty = 0;
        const Byte* input = data.empty() ? &empty : data.data();
        const Byte* keyPtr = m_key.empty() ? &empty : m_key.data();

        unsigned char* hmac_result = ::HMAC(
            m_evp_md,
            keyPtr,
            static_cast<int>(m_key.size()),
            input,
            data.size(),
            result.data(),
            &len
        );

        if (hmac_result == nullptr) {
            return ErrorCode::HashFailed;
        }

        result.resize(len);
        return result;
    }

private:
    ByteBuffer m_key;
    const EVP_MD* m_evp_md = nullptr;
};

// ============================================================================
// HMAC - Public API
// ============================================================================

HMAC::HMAC(ByteSpan key, HashAlgorithm algorithm)
    : m_impl(std::make_unique<Impl>(key, algorithm)) {
}

HMAC::~HMAC() = default;

Result<ByteBuffer> HMAC::compute(ByteSpan data) {
    return m_impl->compute(data);
}

} // namespace Hookwarden::Crypto
