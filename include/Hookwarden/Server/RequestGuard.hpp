/**
 * @file RequestGuard.hpp
 * @brief Per-request admission: IP filter, authentication, handler lookup
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 *
 * The guard runs the checks a routing layer performs before a handler sees a
 * webhook, in this order:
 * 1. IP filter (endpoint policy, else global) -> 403
 * 2. Authentication by scheme -> 401, or 500 when the scheme cannot be resolved
 * 3. Handler lookup -> 500 when absent
 *
 * The guard only reads the registry and configuration it was given; one
 * instance may serve any number of threads.
 */

#pragma once

#ifndef HOOKWARDEN_SERVER_REQUEST_GUARD_HPP
#define HOOKWARDEN_SERVER_REQUEST_GUARD_HPP

#include <Hookwarden/Core/Config.hpp>
#include <Hookwarden/Core/Headers.hpp>
#include <Hookwarden/Core/Types.hpp>
#include <Hookwarden/Plugins/Plugin.hpp>
#include <nlohmann/json.hpp>
#include <memory>
#include <string_view>

namespace Hookwarden::Core {
class Logger;
}

namespace Hookwarden::Plugins {
class PluginRegistry;
}

namespace Hookwarden::Server {

/**
 * @brief Outcome of RequestGuard::check
 */
enum class GuardOutcome {
    Accepted,
    IpDenied,
    AuthFailed,
    AuthMisconfigured,
    HandlerMissing
};

std::string_view guardOutcomeName(GuardOutcome outcome) noexcept;

/**
 * @brief Guard decision with the suggested HTTP response
 */
struct GuardVerdict {
    GuardOutcome outcome = GuardOutcome::Accepted;
    int status = 200;
    nlohmann::json body = nlohmann::json::object();   ///< Empty when accepted
    std::shared_ptr<Plugins::HandlerPlugin> handler;  ///< Set when accepted

    bool accepted() const noexcept { return outcome == GuardOutcome::Accepted; }
};

/**
 * @brief Request admission and dispatch
 *
 * @example
 * ```cpp
 * RequestGuard guard(registry, global, logger);
 * auto verdict = guard.check(endpoint, body, headers, requestId);
 * if (!verdict.accepted()) {
 *     respond(verdict.status, verdict.body);
 * }
 * ```
 */
class RequestGuard {
public:
    RequestGuard(const Plugins::PluginRegistry& registry,
                 const Config::GlobalConfig& global,
                 Core::Logger& logger);

    /**
     * @brief Run IP filtering, authentication and handler lookup
     * @param endpoint Endpoint the request was routed to
     * @param rawPayload Request body exactly as received
     * @param headers Request headers as received (not normalised)
     * @param requestId Identifier echoed in error bodies
     */
    GuardVerdict check(const Config::EndpointConfig& endpoint,
                       ByteSpan rawPayload,
                       const Core::HeaderMap& headers,
                       std::string_view requestId) const;

    /**
     * @brief check() followed by the handler call wrapped in lifecycle hooks
     *
     * The body is parsed as JSON; a body that is not JSON reaches the
     * handler as a string. Headers are normalised first when the global
     * configuration asks for it. A handler exception becomes a 500 response
     * and is reported to the failbot instrument.
     *
     * @return Final status and body
     */
    Plugins::HandlerResponse handle(const Config::EndpointConfig& endpoint,
                                    ByteSpan rawPayload,
                                    const Core::HeaderMap& headers,
                                    std::string_view requestId,
                                    std::string_view method = "POST") const;

    /**
     * @brief Authenticator for an auth block, or nullptr if unresolvable
     */
    std::shared_ptr<const Plugins::AuthPlugin> authenticatorFor(const Auth::AuthConfig& auth) const;

    static nlohmann::json errorBody(std::string_view message, int status, std::string_view requestId);

private:
    GuardVerdict reject(GuardOutcome outcome, int status, nlohmann::json body,
                        const Config::EndpointConfig& endpoint) const;

    const Plugins::PluginRegistry& m_registry;
    const Config::GlobalConfig& m_global;
    Core::Logger& m_logger;
};

} // namespace Hookwarden::Server

#endif // HOOKWARDEN_SERVER_REQUEST_GUARD_HPP
