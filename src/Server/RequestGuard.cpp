/**
 * @file RequestGuard.cpp
 * @brief Request admission and dispatch implementation
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 */

#include <Hookwarden/Server/RequestGuard.hpp>
#include <Hookwarden/Core/Logger.hpp>
#include <Hookwarden/Network/IpFilter.hpp>
#include <Hookwarden/Plugins/PluginRegistry.hpp>

namespace Hookwarden::Server {

namespace {

constexpr std::string_view kMetricPrefix = "hookwarden.request.";

std::string metricName(GuardOutcome outcome) {
    return std::string(kMetricPrefix) + std::string(guardOutcomeName(outcome));
}

} // namespace

std::string_view guardOutcomeName(GuardOutcome outcome) noexcept {
    switch (outcome) {
        case GuardOutcome::Accepted:          return "accepted";
        case GuardOutcome::IpDenied:          return "ip_denied";
        case GuardOutcome::AuthFailed:        return "auth_failed";
        case GuardOutcome::AuthMisconfigured: return "auth_misconfigured";
        case GuardOutcome::HandlerMissing:    return "handler_missing";
    }
    return "unknown";
}

RequestGuard::RequestGuard(const Plugins::PluginRegistry& registry,
                           const Config::GlobalConfig& global,
                           Core::Logger& logger)
    : m_registry(registry)
    , m_global(global)
    , m_logger(logger) {}

nlohmann::json RequestGuard::errorBody(std::string_view message, int status, std::string_view requestId) {
    return {
        {"error", std::string(message)},
        {"code", status},
        {"request_id", std::string(requestId)}
    };
}

std::shared_ptr<const Plugins::AuthPlugin>
RequestGuard::authenticatorFor(const Auth::AuthConfig& auth) const {
    switch (auth.scheme) {
        case Auth::AuthScheme::Hmac:         return m_registry.authPlugin("hmac");
        case Auth::AuthScheme::SharedSecret: return m_registry.authPlugin("shared_secret");
        case Auth::AuthScheme::Custom:       return m_registry.authPlugin(auth.schemeName);
    }
    return nullptr;
}

GuardVerdict RequestGuard::reject(GuardOutcome outcome, int status, nlohmann::json body,
                                  const Config::EndpointConfig& endpoint) const {
    m_registry.stats().increment(metricName(outcome), {{"endpoint", endpoint.path}});

    GuardVerdict verdict;
    verdict.outcome = outcome;
    verdict.status = status;
    verdict.body = std::move(body);
    return verdict;
}

GuardVerdict RequestGuard::check(const Config::EndpointConfig& endpoint,
                                 ByteSpan rawPayload,
                                 const Core::HeaderMap& headers,
                                 std::string_view requestId) const {
    // 1. Client address
    if (Network::IpFilter::evaluate(headers, endpoint.ipFiltering, m_global.ipFiltering, m_logger) ==
        Network::IpVerdict::Deny) {
        return reject(GuardOutcome::IpDenied, 403,
                      Network::IpFilter::denyResponseBody(requestId), endpoint);
    }

    // 2. Authentication
    if (endpoint.auth) {
        auto authenticator = authenticatorFor(*endpoint.auth);
        if (!authenticator) {
            m_logger.error("Endpoint " + endpoint.path + " names unknown auth scheme '" +
                           endpoint.auth->schemeName + "'");
            m_registry.failbot().critical("auth scheme not loaded",
                                          {{"endpoint", endpoint.path},
                                           {"scheme", endpoint.auth->schemeName},
                                           {"request_id", std::string(requestId)}});
            return reject(GuardOutcome::AuthMisconfigured, 500,
                          errorBody("authentication configuration missing or invalid", 500, requestId),
                          endpoint);
        }

        if (!authenticator->validate(rawPayload, headers, *endpoint.auth, m_logger)) {
            return reject(GuardOutcome::AuthFailed, 401,
                          errorBody("authentication failed", 401, requestId), endpoint);
        }
    }

    // 3. Handler
    auto handler = m_registry.handler(endpoint.handler);
    if (!handler) {
        m_logger.error("Endpoint " + endpoint.path + " names unknown handler '" + endpoint.handler + "'");
        m_registry.failbot().report("handler not loaded",
                                    {{"endpoint", endpoint.path},
                                     {"handler", endpoint.handler},
                                     {"request_id", std::string(requestId)}});
        return reject(GuardOutcome::HandlerMissing, 500,
                      errorBody("handler not found", 500, requestId), endpoint);
    }

    m_registry.stats().increment(metricName(GuardOutcome::Accepted), {{"endpoint", endpoint.path}});

    GuardVerdict verdict;
    verdict.handler = std::move(handler);
    return verdict;
}

Plugins::HandlerResponse RequestGuard::handle(const Config::EndpointConfig& endpoint,
                                              ByteSpan rawPayload,
                                              const Core::HeaderMap& headers,
                                              std::string_view requestId,
                                              std::string_view method) const {
    const Plugins::RequestContext context{requestId, method, endpoint.path, headers, m_logger};
    const auto& lifecycle = m_registry.lifecyclePlugins();
    const Plugins::Tags tags{{"endpoint", endpoint.path}, {"request_id", std::string(requestId)}};

    try {
        for (const auto& plugin : lifecycle) {
            plugin->onRequest(context);
        }

        auto verdict = check(endpoint, rawPayload, headers, requestId);
        if (!verdict.accepted()) {
            Plugins::HandlerResponse rejected{verdict.status, std::move(verdict.body)};
            for (const auto& plugin : lifecycle) {
                plugin->onError(context, rejected.body.value("error", std::string(guardOutcomeName(verdict.outcome))));
            }
            return rejected;
        }

        nlohmann::json payload = nlohmann::json::parse(rawPayload.begin(), rawPayload.end(), nullptr, false);
        if (payload.is_discarded()) {
            payload = std::string(rawPayload.begin(), rawPayload.end());
        }

        const Core::HeaderMap handlerHeaders = m_global.normalizeHeaders
            ? Core::normalizeHeaders(headers)
            : headers;

        auto response = m_registry.stats().measure(
            std::string(kMetricPrefix) + "duration", tags, [&]() {
                return verdict.handler->call(payload, handlerHeaders, endpoint.opts, m_logger);
            });

        for (const auto& plugin : lifecycle) {
            plugin->onResponse(context, response);
        }

        m_logger.info("Request " + std::string(requestId) + " processed by " + endpoint.handler);
        return response;

    } catch (const std::exception& e) {
        m_logger.error("Request " + std::string(requestId) + " failed: " + e.what());
        m_registry.failbot().report(e.what(), tags);
        for (const auto& plugin : lifecycle) {
            plugin->onError(context, e.what());
        }
        return {500, errorBody(e.what(), 500, requestId)};
    }
}

} // namespace Hookwarden::Server
