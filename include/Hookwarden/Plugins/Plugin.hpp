/**
 * @file Plugin.hpp
 * @brief Plugin contracts and the shared-object entry point
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 *
 * A plugin is a shared object exporting exactly one entry point, declared
 * with HOOKWARDEN_PLUGIN(Type). The loader resolves that symbol only after
 * the type name and the file path have been validated, then checks that
 * the instance implements the capability the directory requires.
 *
 * @example
 * ```cpp
 * class Team1Handler : public Hookwarden::Plugins::HandlerPlugin {
 * public:
 *     HandlerResponse call(const nlohmann::json& payload,
 *                          const Hookwarden::Core::HeaderMap& headers,
 *                          const nlohmann::json& options,
 *                          Hookwarden::Core::Logger& logger) override;
 * };
 *
 * HOOKWARDEN_PLUGIN(Team1Handler)
 * ```
 */

#pragma once

#ifndef HOOKWARDEN_PLUGINS_PLUGIN_HPP
#define HOOKWARDEN_PLUGINS_PLUGIN_HPP

#include <Hookwarden/Core/Types.hpp>
#include <Hookwarden/Core/Headers.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <exception>
#include <map>
#include <string>
#include <string_view>
#include <utility>

namespace Hookwarden::Core {
class Logger;
}

namespace Hookwarden::Auth {
struct AuthConfig;
}

namespace Hookwarden::Plugins {

/// Bumped whenever a contract below changes layout
constexpr uint32_t PLUGIN_ABI_VERSION = 1;

/**
 * @brief Contract a plugin directory requires
 */
enum class Capability {
    Auth,
    Handler,
    Lifecycle,
    StatsInstrument,
    FailbotInstrument
};

std::string_view capabilityName(Capability capability) noexcept;

/**
 * @brief Common root of every plugin
 */
class Plugin {
public:
    virtual ~Plugin();
};

// ============================================================================
// Auth
// ============================================================================

/**
 * @brief Request authenticator
 *
 * validate() must never throw; every failure is a false return plus a log
 * line that names headers but never secret material.
 */
class AuthPlugin : public Plugin {
public:
    ~AuthPlugin() override;

    virtual bool validate(ByteSpan payload,
                          const Core::HeaderMap& headers,
                          const Auth::AuthConfig& config,
                          Core::Logger& logger) const = 0;
};

// ============================================================================
// Handler
// ============================================================================

/**
 * @brief Handler result; status 200 unless the handler reports an error
 */
struct HandlerResponse {
    int status = 200;
    nlohmann::json body = nlohmann::json::object();
};

/**
 * @brief Endpoint business logic
 *
 * A fresh instance is created for each request.
 */
class HandlerPlugin : public Plugin {
public:
    ~HandlerPlugin() override;

    /**
     * @param payload Parsed request body (or the raw body as a string)
     * @param headers Request headers
     * @param options Endpoint "opts" object
     * @param logger Request logger
     */
    virtual HandlerResponse call(const nlohmann::json& payload,
                                 const Core::HeaderMap& headers,
                                 const nlohmann::json& options,
                                 Core::Logger& logger) = 0;
};

// ============================================================================
// Lifecycle
// ============================================================================

/**
 * @brief Per-request view handed to lifecycle hooks
 */
struct RequestContext {
    std::string_view requestId;
    std::string_view method;
    std::string_view path;
    const Core::HeaderMap& headers;
    Core::Logger& logger;
};

/**
 * @brief Global request hooks, run for every endpoint in load order
 *
 * All hooks default to no-ops.
 */
class LifecyclePlugin : public Plugin {
public:
    ~LifecyclePlugin() override;

    virtual void onRequest(const RequestContext& context);
    virtual void onResponse(const RequestContext& context, const HandlerResponse& response);
    virtual void onError(const RequestContext& context, std::string_view error);
};

// ============================================================================
// Instruments
// ============================================================================

using Tags = std::map<std::string, std::string>;

/**
 * @brief Metrics sink
 */
class StatsInstrument : public Plugin {
public:
    ~StatsInstrument() override;

    virtual void record(std::string_view metric, double value, const Tags& tags) = 0;
    virtual void increment(std::string_view metric, const Tags& tags) = 0;
    virtual void timing(std::string_view metric, std::chrono::duration<double> duration,
                        const Tags& tags) = 0;

    /**
     * @brief Time fn and report the duration through timing()
     */
    template<typename Fn>
    decltype(auto) measure(std::string_view metric, const Tags& tags, Fn&& fn) {
        struct Timer {
            StatsInstrument& stats;
            std::string_view metric;
            const Tags& tags;
            std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
            ~Timer() {
                stats.timing(metric, std::chrono::steady_clock::now() - start, tags);
            }
        } timer{*this, metric, tags};
        return std::forward<Fn>(fn)();
    }
};

/**
 * @brief Error reporting sink
 */
class FailbotInstrument : public Plugin {
public:
    ~FailbotInstrument() override;

    virtual void report(std::string_view message, const Tags& context) = 0;
    virtual void critical(std::string_view message, const Tags& context) = 0;
    virtual void warning(std::string_view message, const Tags& context) = 0;

    /**
     * @brief Run fn; report and rethrow anything derived from std::exception
     */
    template<typename Fn>
    decltype(auto) capture(const Tags& context, Fn&& fn) {
        try {
            return std::forward<Fn>(fn)();
        } catch (const std::exception& e) {
            report(e.what(), context);
            throw;
        }
    }
};

// ============================================================================
// Entry point
// ============================================================================

/**
 * @brief Table exported by every plugin shared object
 */
struct PluginEntry {
    uint32_t abiVersion;
    const char* typeName;
    Plugin* (*create)();
    void (*destroy)(Plugin*);
};

} // namespace Hookwarden::Plugins

/// Name of the single symbol the loader resolves in a plugin
#define HOOKWARDEN_PLUGIN_ENTRY_SYMBOL "hookwarden_plugin_entry"

#if defined(_WIN32)
#define HOOKWARDEN_PLUGIN_EXPORT __declspec(dllexport)
#else
#define HOOKWARDEN_PLUGIN_EXPORT __attribute__((visibility("default")))
#endif

/**
 * @brief Declare Type as the plugin exported by this shared object
 *
 * Type must be default-constructible; its name must match the file stem
 * (team1_handler.so exports Team1Handler).
 */
#define HOOKWARDEN_PLUGIN(Type)                                                         \
    extern "C" HOOKWARDEN_PLUGIN_EXPORT const ::Hookwarden::Plugins::PluginEntry*       \
    hookwarden_plugin_entry() {                                                         \
        static const ::Hookwarden::Plugins::PluginEntry entry{                          \
            ::Hookwarden::Plugins::PLUGIN_ABI_VERSION,                                  \
            #Type,                                                                      \
            []() -> ::Hookwarden::Plugins::Plugin* { return new Type(); },              \
            [](::Hookwarden::Plugins::Plugin* plugin) { delete plugin; }};              \
        return &entry;                                                                  \
    }

#endif // HOOKWARDEN_PLUGINS_PLUGIN_HPP
