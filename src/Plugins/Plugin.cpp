/**
 * @file Plugin.cpp
 * @brief Out-of-line members of the plugin contracts
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 *
 * The destructors anchor each contract's vtable and type_info in the
 * hookwarden library so that plugins and the host agree on them.
 */

#include <Hookwarden/Plugins/Plugin.hpp>

namespace Hookwarden::Plugins {

std::string_view capabilityName(Capability capability) noexcept {
    switch (capability) {
        case Capability::Auth:              return "auth";
        case Capability::Handler:           return "handler";
        case Capability::Lifecycle:         return "lifecycle";
        case Capability::StatsInstrument:   return "stats";
        case Capability::FailbotInstrument: return "failbot";
    }
    return "unknown";
}

Plugin::~Plugin() = default;
AuthPlugin::~AuthPlugin() = default;
HandlerPlugin::~HandlerPlugin() = default;
LifecyclePlugin::~LifecyclePlugin() = default;
StatsInstrument::~StatsInstrument() = default;
FailbotInstrument::~FailbotInstrument() = default;

void LifecyclePlugin::onRequest(const RequestContext&) {}

void LifecyclePlugin::onResponse(const RequestContext&, const HandlerResponse&) {}

void LifecyclePlugin::onError(const RequestContext&, std::string_view) {}

} // namespace Hookwarden::Plugins
