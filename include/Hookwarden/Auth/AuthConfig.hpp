/**
 * @file AuthConfig.hpp
 * @brief Per-endpoint authentication configuration
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 */

#pragma once

#ifndef HOOKWARDEN_AUTH_AUTH_CONFIG_HPP
#define HOOKWARDEN_AUTH_AUTH_CONFIG_HPP

#include <Hookwarden/Core/ErrorCodes.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace Hookwarden::Auth {

/**
 * @brief Authentication scheme selected by an endpoint
 */
enum class AuthScheme {
    Hmac,           ///< Built-in "hmac"
    SharedSecret,   ///< Built-in "shared_secret"
    Custom          ///< Registry lookup by AuthConfig::schemeName
};

/**
 * @brief Rendering of the expected signature
 */
enum class SignatureFormat {
    AlgorithmPrefixed,  ///< "sha256=<hex>"       (config: "algorithm=signature")
    HashOnly,           ///< "<hex>"              (config: "signature_only")
    VersionPrefixed     ///< "<version>=<hex>"    (config: "version=signature")
};

/**
 * @brief Layout of the signature header
 */
enum class HeaderFormat {
    Simple,     ///< Header value is the signature
    Structured  ///< "t=1700000000,v1=<hex>" style key/value list
};

Result<SignatureFormat> parseSignatureFormat(std::string_view name);
std::string_view signatureFormatName(SignatureFormat format) noexcept;

Result<HeaderFormat> parseHeaderFormat(std::string_view name);
std::string_view headerFormatName(HeaderFormat format) noexcept;

/**
 * @brief Map a configured scheme name onto the closed scheme enum
 *
 * "hmac" and "shared_secret" (any case) select the built-ins; every other
 * name is Custom.
 */
AuthScheme schemeFromName(std::string_view name);

/// Default signature header for HMAC and custom schemes
inline constexpr std::string_view DEFAULT_HMAC_HEADER = "X-Signature";

/// Default secret header for the shared secret scheme
inline constexpr std::string_view DEFAULT_SHARED_SECRET_HEADER = "Authorization";

/// Signature headers longer than this are rejected before any parsing
inline constexpr size_t MAX_SIGNATURE_LENGTH = 1024;

/**
 * @brief Authentication block of an endpoint
 *
 * Holds the name of the environment variable carrying the secret, never the
 * secret itself. Immutable once the configuration has been loaded.
 */
struct AuthConfig {
    AuthScheme scheme = AuthScheme::Hmac;
    std::string schemeName = "hmac";   ///< Lower-case registry key
    std::string secretEnvKey;

    std::optional<std::string> header; ///< Falls back to the scheme default
    std::string algorithm = "sha256";
    SignatureFormat signatureFormat = SignatureFormat::AlgorithmPrefixed;

    std::optional<std::string> timestampHeader;
    int64_t timestampToleranceSeconds = 300;
    std::string versionPrefix = "v0";
    std::optional<std::string> payloadTemplate;

    HeaderFormat headerFormat = HeaderFormat::Simple;
    std::string signatureKey = "v1";
    std::string timestampKey = "t";
    std::string structuredHeaderSeparator = ",";
    std::string keyValueSeparator = "=";

    /**
     * @brief Configured header, or the default for this scheme
     */
    std::string_view headerName() const noexcept {
        if (header) {
            return *header;
        }
        return scheme == AuthScheme::SharedSecret ? DEFAULT_SHARED_SECRET_HEADER
                                                  : DEFAULT_HMAC_HEADER;
    }
};

} // namespace Hookwarden::Auth

#endif // HOOKWARDEN_AUTH_AUTH_CONFIG_HPP
