/**
 * @file SharedSecretValidator.hpp
 * @brief Built-in "shared_secret" authenticator
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 */

#pragma once

#ifndef HOOKWARDEN_AUTH_SHARED_SECRET_VALIDATOR_HPP
#define HOOKWARDEN_AUTH_SHARED_SECRET_VALIDATOR_HPP

#include <Hookwarden/Auth/AuthConfig.hpp>
#include <Hookwarden/Plugins/Plugin.hpp>

namespace Hookwarden::Auth {

/**
 * @brief Compares a header value against a secret from the environment
 *
 * The raw header value must match the secret byte for byte; a value that
 * only matches after trimming is rejected.
 */
class SharedSecretValidator final : public Plugins::AuthPlugin {
public:
    bool validate(ByteSpan payload,
                  const Core::HeaderMap& headers,
                  const AuthConfig& config,
                  Core::Logger& logger) const override;
};

} // namespace Hookwarden::Auth

#endif // HOOKWARDEN_AUTH_SHARED_SECRET_VALIDATOR_HPP
