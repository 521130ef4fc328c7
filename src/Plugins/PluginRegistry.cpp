/**
 * @file PluginRegistry.cpp
 * @brief Plugin registry storage and lookups
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 */

#include <Hookwarden/Plugins/PluginRegistry.hpp>
#include <Hookwarden/Plugins/PluginSecurity.hpp>
#include <Hookwarden/Plugins/BuiltIn.hpp>
#include <Hookwarden/Auth/HmacValidator.hpp>
#include <Hookwarden/Auth/SharedSecretValidator.hpp>
#include <Hookwarden/Core/Headers.hpp>

namespace Hookwarden::Plugins {

namespace {

template<typename T>
PluginDescriptor makeBuiltIn(std::string logicalName, std::string typeName, Capability capability) {
    PluginDescriptor descriptor;
    descriptor.logicalName = std::move(logicalName);
    descriptor.typeName = std::move(typeName);
    descriptor.capability = capability;
    descriptor.builtIn = true;
    descriptor.factory = []() -> std::shared_ptr<Plugin> { return std::make_shared<T>(); };
    descriptor.instance = descriptor.factory();
    return descriptor;
}

} // namespace

PluginRegistry::PluginRegistry() {
    registerBuiltIns();
}

PluginRegistry::~PluginRegistry() = default;

void PluginRegistry::registerBuiltIns() {
    auto hmac = makeBuiltIn<Auth::HmacValidator>("hmac", "HMAC", Capability::Auth);
    m_auth.emplace(hmac.logicalName, std::move(hmac));

    auto shared = makeBuiltIn<Auth::SharedSecretValidator>("shared_secret", "SharedSecret",
                                                           Capability::Auth);
    m_auth.emplace(shared.logicalName, std::move(shared));

    auto handler = makeBuiltIn<DefaultHandler>("DefaultHandler", "DefaultHandler",
                                               Capability::Handler);
    m_handlers.emplace(handler.logicalName, std::move(handler));

    m_stats = makeBuiltIn<NullStats>("stats", "NullStats", Capability::StatsInstrument);
    m_statsInstance = std::static_pointer_cast<StatsInstrument>(m_stats.instance);

    m_failbot = makeBuiltIn<NullFailbot>("failbot", "NullFailbot", Capability::FailbotInstrument);
    m_failbotInstance = std::static_pointer_cast<FailbotInstrument>(m_failbot.instance);
}

void PluginRegistry::reset() {
    m_lifecycleInstances.clear();
    m_statsInstance.reset();
    m_failbotInstance.reset();

    m_auth.clear();
    m_handlers.clear();
    m_lifecycle.clear();
    m_stats = PluginDescriptor{};
    m_failbot = PluginDescriptor{};

    registerBuiltIns();
}

std::string PluginRegistry::handlerKey(std::string_view name) {
    if (!name.empty() && name[0] >= 'a' && name[0] <= 'z') {
        return Security::typeNameFromStem(name);
    }
    return std::string(name);
}

VoidResult PluginRegistry::add(PluginDescriptor descriptor) {
    switch (descriptor.capability) {
        case Capability::Auth: {
            auto key = Core::toLower(descriptor.logicalName);
            if (m_auth.count(key) != 0) {
                return ErrorCode::PluginDuplicate;
            }
            descriptor.logicalName = key;
            m_auth.emplace(std::move(key), std::move(descriptor));
            return VoidResult::Success();
        }

        case Capability::Handler: {
            auto key = descriptor.logicalName;
            if (m_handlers.count(key) != 0) {
                return ErrorCode::PluginDuplicate;
            }
            m_handlers.emplace(std::move(key), std::move(descriptor));
            return VoidResult::Success();
        }

        case Capability::Lifecycle: {
            auto instance = std::dynamic_pointer_cast<LifecyclePlugin>(descriptor.instance);
            if (!instance) {
                return ErrorCode::PluginCapabilityMismatch;
            }
            m_lifecycleInstances.push_back(std::move(instance));
            m_lifecycle.push_back(std::move(descriptor));
            return VoidResult::Success();
        }

        case Capability::StatsInstrument: {
            auto instance = std::dynamic_pointer_cast<StatsInstrument>(descriptor.instance);
            if (!instance) {
                return ErrorCode::PluginCapabilityMismatch;
            }
            m_statsInstance = std::move(instance);
            m_stats = std::move(descriptor);
            return VoidResult::Success();
        }

        case Capability::FailbotInstrument: {
            auto instance = std::dynamic_pointer_cast<FailbotInstrument>(descriptor.instance);
            if (!instance) {
                return ErrorCode::PluginCapabilityMismatch;
            }
            m_failbotInstance = std::move(instance);
            m_failbot = std::move(descriptor);
            return VoidResult::Success();
        }
    }
    return ErrorCode::InvalidArgument;
}

std::shared_ptr<const AuthPlugin> PluginRegistry::authPlugin(std::string_view name) const {
    auto it = m_auth.find(Core::toLower(name));
    if (it == m_auth.end()) {
        return nullptr;
    }
    return std::dynamic_pointer_cast<const AuthPlugin>(
        std::shared_ptr<const Plugin>(it->second.instance));
}

bool PluginRegistry::hasAuthPlugin(std::string_view name) const {
    return m_auth.count(Core::toLower(name)) != 0;
}

std::shared_ptr<HandlerPlugin> PluginRegistry::handler(std::string_view name) const {
    auto it = m_handlers.find(handlerKey(name));
    if (it == m_handlers.end() || !it->second.factory) {
        return nullptr;
    }
    try {
        return std::dynamic_pointer_cast<HandlerPlugin>(it->second.factory());
    } catch (const std::exception&) {
        return nullptr;
    }
}

bool PluginRegistry::hasHandler(std::string_view name) const {
    return m_handlers.count(handlerKey(name)) != 0;
}

std::vector<const PluginDescriptor*> PluginRegistry::descriptors(Capability capability) const {
    std::vector<const PluginDescriptor*> out;
    switch (capability) {
        case Capability::Auth:
            for (const auto& [key, descriptor] : m_auth) {
                out.push_back(&descriptor);
            }
            break;
        case Capability::Handler:
            for (const auto& [key, descriptor] : m_handlers) {
                out.push_back(&descriptor);
            }
            break;
        case Capability::Lifecycle:
            for (const auto& descriptor : m_lifecycle) {
                out.push_back(&descriptor);
            }
            break;
        case Capability::StatsInstrument:
            out.push_back(&m_stats);
            break;
        case Capability::FailbotInstrument:
            out.push_back(&m_failbot);
            break;
    }
    return out;
}

} // namespace Hookwarden::Plugins
