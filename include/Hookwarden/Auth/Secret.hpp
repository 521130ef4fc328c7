/**
 * @file Secret.hpp
 * @brief Environment-sourced secrets with guaranteed erasure
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 */

#pragma once

#ifndef HOOKWARDEN_AUTH_SECRET_HPP
#define HOOKWARDEN_AUTH_SECRET_HPP

#include <Hookwarden/Core/ErrorCodes.hpp>
#include <string>
#include <string_view>

namespace Hookwarden::Core {
class Logger;
}

namespace Hookwarden::Auth {

struct AuthConfig;

/**
 * @brief Copy of a secret that is zeroed when it goes out of scope
 */
class Secret {
public:
    explicit Secret(std::string_view value);
    ~Secret();

    Secret(Secret&& other);
    Secret& operator=(Secret&&) = delete;
    Secret(const Secret&) = delete;
    Secret& operator=(const Secret&) = delete;

    std::string_view view() const noexcept { return m_value; }

private:
    std::string m_value;
};

/**
 * @brief Read the secret named by config.secretEnvKey from the environment
 *
 * An unset or blank variable is an operator mistake: it is logged at error
 * level (naming the variable, never a value) and yields
 * ErrorCode::SecretUnavailable so the request fails closed.
 *
 * @param config Endpoint auth configuration
 * @param logger Destination for the error line
 * @param context Prefix for log lines, e.g. "Auth::HMAC"
 */
Result<Secret> fetchSecret(const AuthConfig& config, Core::Logger& logger,
                           std::string_view context);

} // namespace Hookwarden::Auth

#endif // HOOKWARDEN_AUTH_SECRET_HPP
