/**
 * @file Secret.cpp
 * @brief Secret retrieval from the process environment
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 */

#include <Hookwarden/Auth/Secret.hpp>
#include <Hookwarden/Auth/AuthConfig.hpp>
#include <Hookwarden/Core/Crypto.hpp>
#include <Hookwarden/Core/Headers.hpp>
#include <Hookwarden/Core/Logger.hpp>
#include <cstdlib>

namespace Hookwarden::Auth {

Secret::Secret(std::string_view value)
    : m_value(value) {}

Secret::~Secret() {
    Crypto::secureZero(m_value);
}

Secret::Secret(Secret&& other)
    : m_value(other.m_value) {
    Crypto::secureZero(other.m_value);
}

Result<Secret> fetchSecret(const AuthConfig& config, Core::Logger& logger,
                           std::string_view context) {
    const std::string prefix = std::string(context) + " validation failed: ";

    if (config.secretEnvKey.empty()) {
        logger.error(prefix + "No secret_env_key configured");
        return ErrorCode::SecretUnavailable;
    }

    const char* value = std::getenv(config.secretEnvKey.c_str());
    if (value == nullptr || Core::trim(value).empty()) {
        logger.error(prefix + "Secret environment variable '" + config.secretEnvKey +
                     "' is not set or blank");
        return ErrorCode::SecretUnavailable;
    }

    return Secret(value);
}

} // namespace Hookwarden::Auth
