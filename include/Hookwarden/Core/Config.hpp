/**
 * @file Config.hpp
 * @brief Server and endpoint configuration loading
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 *
 * Configuration is layered: built-in defaults, then a JSON file, then
 * HOOKWARDEN_* environment variables. Files are read with protection against:
 * - Path traversal outside an allowed directory
 * - Symlink swaps between check and open
 * - Oversized files
 */

#pragma once

#ifndef HOOKWARDEN_CORE_CONFIG_HPP
#define HOOKWARDEN_CORE_CONFIG_HPP

#include <Hookwarden/Core/Types.hpp>
#include <Hookwarden/Core/ErrorCodes.hpp>
#include <Hookwarden/Auth/AuthConfig.hpp>
#include <Hookwarden/Network/IpFilter.hpp>
#include <Hookwarden/Plugins/PluginLoader.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Hookwarden::Core {
class Logger;
}

namespace Hookwarden::Plugins {
class PluginRegistry;
}

namespace Hookwarden::Config {

/// Prefix of environment overrides (HOOKWARDEN_LOG_LEVEL, ...)
inline constexpr std::string_view ENV_PREFIX = "HOOKWARDEN_";

/**
 * @brief Server-wide settings
 */
struct GlobalConfig {
    std::optional<std::filesystem::path> handlerPluginDir = std::filesystem::path("./handlers");
    std::optional<std::filesystem::path> authPluginDir;
    std::optional<std::filesystem::path> lifecyclePluginDir;
    std::optional<std::filesystem::path> instrumentsPluginDir;

    std::string logLevel = "info";
    int64_t requestLimit = 1048576;
    int64_t requestTimeout = 30;

    std::string rootPath = "/webhooks";
    std::string healthPath = "/health";
    std::string versionPath = "/version";

    std::string environment = "production";
    bool production = true;

    std::filesystem::path endpointsDir = "./config/endpoints";
    bool useCatchallRoute = false;
    bool normalizeHeaders = true;

    std::optional<Network::IpPolicy> ipFiltering;

    Plugins::PluginDirectories pluginDirectories() const {
        return {handlerPluginDir, authPluginDir, lifecyclePluginDir, instrumentsPluginDir};
    }
};

/**
 * @brief One webhook endpoint
 */
struct EndpointConfig {
    std::string path;
    std::string handler;
    std::optional<Auth::AuthConfig> auth;
    std::optional<Network::IpPolicy> ipFiltering;
    nlohmann::json opts = nlohmann::json::object();
    std::filesystem::path sourceFile;
};

/**
 * @brief Secure configuration loader
 *
 * @example
 * ```cpp
 * ConfigLoader loader(logger);
 * auto global = loader.load("config/hookwarden.json");
 * auto endpoints = loader.loadEndpoints(global.value().endpointsDir);
 * ```
 */
struct ConfigLoaderOptions {
    size_t max_file_size = 1024 * 1024;  // 1MB default
    std::string allowed_directory;       // Restrict to directory
};

class ConfigLoader {
public:
    using Options = ConfigLoaderOptions;

    explicit ConfigLoader(Core::Logger& logger, const Options& options = {});
    ~ConfigLoader();

    /**
     * @brief Load global configuration
     * @param path JSON file, or nullopt for defaults plus environment
     * @return Validated configuration or error
     */
    Result<GlobalConfig> load(const std::optional<std::filesystem::path>& path);

    /**
     * @brief Load global configuration from a JSON document in memory
     */
    Result<GlobalConfig> loadFromMemory(ByteSpan data);

    /**
     * @brief Load and validate one endpoint file
     */
    Result<EndpointConfig> loadEndpoint(const std::filesystem::path& path);

    /**
     * @brief Load every *.json endpoint file in a directory, sorted by name
     *
     * A missing directory yields no endpoints.
     */
    Result<std::vector<EndpointConfig>> loadEndpoints(const std::filesystem::path& directory);

    /**
     * @brief Validate an already parsed endpoint document
     */
    Result<EndpointConfig> parseEndpoint(const nlohmann::json& document, std::string_view origin);

    /**
     * @brief Require every custom auth scheme to resolve in the registry
     * @return ErrorCode::UnknownAuthScheme naming the first offender in the log
     */
    static VoidResult validateAuthSchemes(const std::vector<EndpointConfig>& endpoints,
                                          const Plugins::PluginRegistry& registry,
                                          Core::Logger& logger);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace Hookwarden::Config

#endif // HOOKWARDEN_CORE_CONFIG_HPP
