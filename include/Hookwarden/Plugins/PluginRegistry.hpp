/**
 * @file PluginRegistry.hpp
 * @brief Boot-time populated, read-only map of loaded plugins
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 *
 * Only PluginLoader mutates a registry. Once loading has finished the
 * registry may be read from any number of threads without locking.
 */

#pragma once

#ifndef HOOKWARDEN_PLUGINS_PLUGIN_REGISTRY_HPP
#define HOOKWARDEN_PLUGINS_PLUGIN_REGISTRY_HPP

#include <Hookwarden/Plugins/Plugin.hpp>
#include <Hookwarden/Core/ErrorCodes.hpp>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace Hookwarden::Plugins {

/// Creates a new plugin instance; the instance keeps its library loaded
using PluginFactory = std::function<std::shared_ptr<Plugin>()>;

/**
 * @brief Everything known about one admitted plugin
 */
struct PluginDescriptor {
    std::string logicalName;            ///< Registry key
    std::string typeName;               ///< Exported type name
    std::filesystem::path sourcePath;   ///< Canonical path; empty for built-ins
    Capability capability = Capability::Handler;
    bool builtIn = false;
    PluginFactory factory;
    std::shared_ptr<Plugin> instance;   ///< Instance created at admission
};

/**
 * @brief Per-capability plugin registry
 *
 * Keys:
 * - auth: lower-case file stem ("hmac", "shared_secret", "example")
 * - handler: type name ("DefaultHandler", "Team1Handler")
 * - lifecycle: ordered list in load order
 * - stats / failbot: single slot each, last load wins
 */
class PluginRegistry {
public:
    /**
     * @brief Create a registry holding only the built-in plugins
     */
    PluginRegistry();
    ~PluginRegistry();

    PluginRegistry(const PluginRegistry&) = delete;
    PluginRegistry& operator=(const PluginRegistry&) = delete;

    /**
     * @brief Authenticator by scheme name (case-insensitive)
     * @return nullptr if unknown
     */
    std::shared_ptr<const AuthPlugin> authPlugin(std::string_view name) const;

    bool hasAuthPlugin(std::string_view name) const;

    /**
     * @brief New handler instance by name
     *
     * Accepts the type name ("Team1Handler") or its file stem
     * ("team1_handler").
     *
     * @return nullptr if unknown or if construction failed
     */
    std::shared_ptr<HandlerPlugin> handler(std::string_view name) const;

    bool hasHandler(std::string_view name) const;

    /**
     * @brief Lifecycle plugins in load order
     */
    const std::vector<std::shared_ptr<LifecyclePlugin>>& lifecyclePlugins() const noexcept {
        return m_lifecycleInstances;
    }

    StatsInstrument& stats() const noexcept { return *m_statsInstance; }
    FailbotInstrument& failbot() const noexcept { return *m_failbotInstance; }

    /**
     * @brief Descriptors for a capability
     *
     * Auth and handler descriptors come back sorted by key, lifecycle in load
     * order, instruments as the single active descriptor.
     */
    std::vector<const PluginDescriptor*> descriptors(Capability capability) const;

    /**
     * @brief Canonical handler key for a name in either spelling
     */
    static std::string handlerKey(std::string_view name);

private:
    friend class PluginLoader;

    /**
     * @brief Register an admitted plugin
     * @return PluginDuplicate when an auth or handler key is already taken
     */
    VoidResult add(PluginDescriptor descriptor);

    /**
     * @brief Drop every loaded plugin and re-register the built-ins
     */
    void reset();

    void registerBuiltIns();

    std::map<std::string, PluginDescriptor> m_auth;
    std::map<std::string, PluginDescriptor> m_handlers;
    std::vector<PluginDescriptor> m_lifecycle;
    std::vector<std::shared_ptr<LifecyclePlugin>> m_lifecycleInstances;

    PluginDescriptor m_stats;
    PluginDescriptor m_failbot;
    std::shared_ptr<StatsInstrument> m_statsInstance;
    std::shared_ptr<FailbotInstrument> m_failbotInstance;
};

} // namespace Hookwarden::Plugins

#endif // HOOKWARDEN_PLUGINS_PLUGIN_REGISTRY_HPP
