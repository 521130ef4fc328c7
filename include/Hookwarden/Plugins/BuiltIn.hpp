/**
 * @file BuiltIn.hpp
 * @brief Plugins registered before any directory is scanned
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 */

#pragma once

#ifndef HOOKWARDEN_PLUGINS_BUILT_IN_HPP
#define HOOKWARDEN_PLUGINS_BUILT_IN_HPP

#include <Hookwarden/Plugins/Plugin.hpp>

namespace Hookwarden::Plugins {

/**
 * @brief Handler used by endpoints that name "DefaultHandler"
 *
 * Acknowledges the webhook and echoes nothing from the payload.
 */
class DefaultHandler final : public HandlerPlugin {
public:
    HandlerResponse call(const nlohmann::json& payload,
                         const Core::HeaderMap& headers,
                         const nlohmann::json& options,
                         Core::Logger& logger) override;
};

/// Stats sink used until a custom one is loaded
class NullStats final : public StatsInstrument {
public:
    void record(std::string_view, double, const Tags&) override {}
    void increment(std::string_view, const Tags&) override {}
    void timing(std::string_view, std::chrono::duration<double>, const Tags&) override {}
};

/// Failbot sink used until a custom one is loaded
class NullFailbot final : public FailbotInstrument {
public:
    void report(std::string_view, const Tags&) override {}
    void critical(std::string_view, const Tags&) override {}
    void warning(std::string_view, const Tags&) override {}
};

} // namespace Hookwarden::Plugins

#endif // HOOKWARDEN_PLUGINS_BUILT_IN_HPP
