/**
 * @file HmacValidator.hpp
 * @brief Built-in "hmac" authenticator
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 *
 * Verifies keyed-digest signatures as sent by GitHub, Stripe, Slack and
 * similar senders:
 * - Simple header ("sha256=<hex>", "<hex>" or "v0=<hex>")
 * - Structured header ("t=<ts>,v1=<hex>")
 * - Optional timestamp replay window
 * - Optional signing template over {version}, {timestamp} and {body}
 */

#pragma once

#ifndef HOOKWARDEN_AUTH_HMAC_VALIDATOR_HPP
#define HOOKWARDEN_AUTH_HMAC_VALIDATOR_HPP

#include <Hookwarden/Auth/AuthConfig.hpp>
#include <Hookwarden/Plugins/Plugin.hpp>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace Hookwarden::Auth {

/**
 * @brief Signature and timestamp extracted from a structured header
 */
struct StructuredSignature {
    std::string signature;
    std::optional<std::string> timestamp;
};

/**
 * @brief HMAC signature validator
 *
 * Thread-safe; holds no state.
 */
class HmacValidator final : public Plugins::AuthPlugin {
public:
    bool validate(ByteSpan payload,
                  const Core::HeaderMap& headers,
                  const AuthConfig& config,
                  Core::Logger& logger) const override;

    /**
     * @brief Parse a structured signature header
     * @return nullopt when a pair lacks the key/value separator or the
     *         signature key is missing or empty
     */
    static std::optional<StructuredSignature> parseStructuredHeader(std::string_view value,
                                                                    const AuthConfig& config);

    /**
     * @brief Expand {version}, {timestamp} and {body} in one left-to-right pass
     *
     * Substituted text is never rescanned.
     */
    static std::string expandTemplate(std::string_view tmpl, std::string_view version,
                                      std::string_view timestamp, std::string_view body);

    /**
     * @brief Render a lowercase hex digest per the configured format
     */
    static std::string formatSignature(std::string_view hexDigest, const AuthConfig& config);
};

} // namespace Hookwarden::Auth

#endif // HOOKWARDEN_AUTH_HMAC_VALIDATOR_HPP
