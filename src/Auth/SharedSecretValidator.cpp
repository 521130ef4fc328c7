/**
 * @file SharedSecretValidator.cpp
 * @brief Shared secret header verification
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 */

#include <Hookwarden/Auth/SharedSecretValidator.hpp>
#include <Hookwarden/Auth/Secret.hpp>
#include <Hookwarden/Core/Crypto.hpp>
#include <Hookwarden/Core/Headers.hpp>
#include <Hookwarden/Core/Logger.hpp>

namespace Hookwarden::Auth {

namespace {

constexpr std::string_view kContext = "Auth::SharedSecret";

std::string failure(std::string_view reason) {
    return std::string(kContext) + " validation failed: " + std::string(reason);
}

} // namespace

bool SharedSecretValidator::validate(ByteSpan /*payload*/,
                                     const Core::HeaderMap& headers,
                                     const AuthConfig& config,
                                     Core::Logger& logger) const {
    try {
        auto secret = fetchSecret(config, logger, kContext);
        if (secret.isFailure()) {
            return false;
        }

        const std::string_view headerName = config.headerName();
        const auto raw = Core::findHeader(headers, headerName);
        if (!raw || raw->empty()) {
            logger.warn(failure("Missing or empty secret header '" + std::string(headerName) + "'"));
            return false;
        }

        if (Core::trim(*raw).size() != raw->size()) {
            logger.warn(failure("Secret contains leading/trailing whitespace"));
            return false;
        }

        if (Core::containsControlCharacters(*raw)) {
            logger.warn(failure("Secret contains control characters"));
            return false;
        }

        if (!Core::isValidUtf8(*raw)) {
            logger.warn(failure("Secret is not valid UTF-8"));
            return false;
        }

        const bool result = Crypto::constantTimeCompare(secret.value().view(), *raw);
        if (result) {
            logger.debug(std::string(kContext) + " validation successful for header '" +
                         std::string(headerName) + "'");
        } else {
            logger.warn(failure("Secret mismatch"));
        }
        return result;

    } catch (const std::exception& e) {
        logger.error(failure(e.what()));
        return false;
    }
}

} // namespace Hookwarden::Auth
