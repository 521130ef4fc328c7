/**
 * @file BuiltIn.cpp
 * @brief Built-in handler implementation
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 */

#include <Hookwarden/Plugins/BuiltIn.hpp>
#include <Hookwarden/Core/Logger.hpp>
#include <ctime>

namespace Hookwarden::Plugins {

namespace {

std::string utcNowIso8601() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &now);
#else
    gmtime_r(&now, &tm);
#endif
    char buffer[32];
    const size_t len = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buffer, len);
}

} // namespace

HandlerResponse DefaultHandler::call(const nlohmann::json& payload,
                                     const Core::HeaderMap& /*headers*/,
                                     const nlohmann::json& /*options*/,
                                     Core::Logger& logger) {
    logger.info("Default handler invoked for webhook");
    if (!payload.is_null()) {
        logger.debug("received payload: " + payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    }

    HandlerResponse response;
    response.body = {
        {"message", "webhook processed successfully"},
        {"handler", "DefaultHandler"},
        {"timestamp", utcNowIso8601()}
    };
    return response;
}

} // namespace Hookwarden::Plugins
