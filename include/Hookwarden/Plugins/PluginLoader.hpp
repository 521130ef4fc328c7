/**
 * @file PluginLoader.hpp
 * @brief Plugin security gate: validates, loads and registers plugins
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 *
 * The only component that maps plugin code into the process. Every file
 * passes, in order:
 * 1. Type name validation (PluginSecurity)
 * 2. Path containment under the configured root
 * 3. Load, entry-point resolution, type name and ABI check
 * 4. Instantiation and capability check
 * 5. Registration
 *
 * Any failure aborts the whole boot.
 */

#pragma once

#ifndef HOOKWARDEN_PLUGINS_PLUGIN_LOADER_HPP
#define HOOKWARDEN_PLUGINS_PLUGIN_LOADER_HPP

#include <Hookwarden/Plugins/PluginRegistry.hpp>
#include <Hookwarden/Core/ErrorCodes.hpp>
#include <filesystem>
#include <initializer_list>
#include <optional>

namespace Hookwarden::Core {
class Logger;
}

namespace Hookwarden::Plugins {

/**
 * @brief Plugin directories per capability; unset entries are skipped
 */
struct PluginDirectories {
    std::optional<std::filesystem::path> handlers;
    std::optional<std::filesystem::path> auth;
    std::optional<std::filesystem::path> lifecycle;
    std::optional<std::filesystem::path> instruments;
};

/**
 * @brief Boot-time plugin loader
 *
 * Single-threaded; must finish before the registry is shared.
 */
class PluginLoader {
public:
    PluginLoader(PluginRegistry& registry, Core::Logger& logger);

    /**
     * @brief Validate and instantiate one plugin without registering it
     *
     * @param sourceFile Plugin shared object
     * @param pluginRoot Directory the file must live under
     * @param required Capability the plugin must implement
     * @return Descriptor, or a Plugin* / path error code
     */
    Result<PluginDescriptor> loadPlugin(const std::filesystem::path& sourceFile,
                                        const std::filesystem::path& pluginRoot,
                                        Capability required);

    /**
     * @brief Load and register every plugin in a directory, in sorted order
     *
     * For Capability::StatsInstrument or Capability::FailbotInstrument the
     * directory is an instruments directory: each plugin may implement
     * either contract and is classified accordingly.
     */
    VoidResult loadDirectory(const std::filesystem::path& directory, Capability capability);

    /**
     * @brief Load auth, handler, lifecycle and instrument directories
     *
     * On failure the registry is returned to its built-in state.
     */
    VoidResult loadAll(const PluginDirectories& directories);

    /**
     * @brief Clear the registry and load again (tests only)
     */
    VoidResult reload(const PluginDirectories& directories);

private:
    Result<PluginDescriptor> admit(const std::filesystem::path& sourceFile,
                                   const std::filesystem::path& pluginRoot,
                                   std::initializer_list<Capability> accepted);

    void logLoaded() const;

    PluginRegistry& m_registry;
    Core::Logger& m_logger;
};

} // namespace Hookwarden::Plugins

#endif // HOOKWARDEN_PLUGINS_PLUGIN_LOADER_HPP
