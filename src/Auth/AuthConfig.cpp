/**
 * @file AuthConfig.cpp
 * @brief Configuration string mapping for authentication settings
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 */

#include <Hookwarden/Auth/AuthConfig.hpp>
#include <Hookwarden/Core/Headers.hpp>

namespace Hookwarden::Auth {

Result<SignatureFormat> parseSignatureFormat(std::string_view name) {
    if (name == "algorithm=signature") return SignatureFormat::AlgorithmPrefixed;
    if (name == "signature_only")      return SignatureFormat::HashOnly;
    if (name == "version=signature")   return SignatureFormat::VersionPrefixed;
    return ErrorCode::ConfigInvalid;
}

std::string_view signatureFormatName(SignatureFormat format) noexcept {
    switch (format) {
        case SignatureFormat::AlgorithmPrefixed: return "algorithm=signature";
        case SignatureFormat::HashOnly:          return "signature_only";
        case SignatureFormat::VersionPrefixed:   return "version=signature";
    }
    return "unknown";
}

Result<HeaderFormat> parseHeaderFormat(std::string_view name) {
    if (name == "simple")     return HeaderFormat::Simple;
    if (name == "structured") return HeaderFormat::Structured;
    return ErrorCode::ConfigInvalid;
}

std::string_view headerFormatName(HeaderFormat format) noexcept {
    switch (format) {
        case HeaderFormat::Simple:     return "simple";
        case HeaderFormat::Structured: return "structured";
    }
    return "unknown";
}

AuthScheme schemeFromName(std::string_view name) {
    const auto lowered = Core::toLower(name);
    if (lowered == "hmac") {
        return AuthScheme::Hmac;
    }
    if (lowered == "shared_secret") {
        return AuthScheme::SharedSecret;
    }
    return AuthScheme::Custom;
}

} // namespace Hookwarden::Auth
