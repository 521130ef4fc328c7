/**
 * @file PluginLoader.cpp
 * @brief Plugin security gate implementation
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 */

#include <Hookwarden/Plugins/PluginLoader.hpp>
#include <Hookwarden/Plugins/PluginSecurity.hpp>
#include <Hookwarden/Plugins/DynamicLibrary.hpp>
#include <Hookwarden/Core/Headers.hpp>
#include <Hookwarden/Core/Logger.hpp>
#include <system_error>

namespace fs = std::filesystem;

namespace Hookwarden::Plugins {

namespace {

using EntryFunction = const PluginEntry* (*)();

bool implements(const Plugin& plugin, Capability capability) {
    switch (capability) {
        case Capability::Auth:              return dynamic_cast<const AuthPlugin*>(&plugin) != nullptr;
        case Capability::Handler:           return dynamic_cast<const HandlerPlugin*>(&plugin) != nullptr;
        case Capability::Lifecycle:         return dynamic_cast<const LifecyclePlugin*>(&plugin) != nullptr;
        case Capability::StatsInstrument:   return dynamic_cast<const StatsInstrument*>(&plugin) != nullptr;
        case Capability::FailbotInstrument: return dynamic_cast<const FailbotInstrument*>(&plugin) != nullptr;
    }
    return false;
}

std::string logicalNameFor(Capability capability, const std::string& stem, const std::string& typeName) {
    switch (capability) {
        case Capability::Auth:              return Core::toLower(stem);
        case Capability::StatsInstrument:   return "stats";
        case Capability::FailbotInstrument: return "failbot";
        default:                            return typeName;
    }
}

bool isInstrument(Capability capability) {
    return capability == Capability::StatsInstrument ||
           capability == Capability::FailbotInstrument;
}

} // namespace

PluginLoader::PluginLoader(PluginRegistry& registry, Core::Logger& logger)
    : m_registry(registry)
    , m_logger(logger) {}

// ============================================================================
// Single plugin
// ============================================================================

Result<PluginDescriptor> PluginLoader::admit(const fs::path& sourceFile,
                                             const fs::path& pluginRoot,
                                             std::initializer_list<Capability> accepted) {
    const std::string file = sourceFile.string();

    // 1. Name
    const std::string stem = sourceFile.stem().string();
    const std::string typeName = Security::typeNameFromStem(stem);
    auto nameCheck = Security::validateTypeName(typeName);
    if (nameCheck.isFailure()) {
        m_logger.critical("Invalid plugin type name '" + typeName + "' derived from " + file +
                          ": " + std::string(getErrorMessage(nameCheck.error())));
        return nameCheck.error();
    }

    // 2. Path
    auto resolved = Security::resolveContainedPath(sourceFile, pluginRoot);
    if (resolved.isFailure()) {
        m_logger.critical("Plugin path rejected: " + file + " (root " + pluginRoot.string() +
                          "): " + std::string(getErrorMessage(resolved.error())));
        return resolved.error();
    }
    const fs::path canonical = resolved.value();

    // 3. Load and entry point
    std::string loadError;
    auto library = DynamicLibrary::open(canonical, &loadError);
    if (library.isFailure()) {
        m_logger.critical("Failed to load plugin " + canonical.string() + ": " + loadError);
        return library.error();
    }
    std::shared_ptr<DynamicLibrary> lib = library.value();

    auto entryFn = reinterpret_cast<EntryFunction>(lib->symbol(HOOKWARDEN_PLUGIN_ENTRY_SYMBOL));
    const PluginEntry* entry = entryFn ? entryFn() : nullptr;
    if (entry == nullptr || entry->create == nullptr || entry->destroy == nullptr) {
        m_logger.critical("Plugin " + canonical.string() + " does not export " +
                          HOOKWARDEN_PLUGIN_ENTRY_SYMBOL);
        return ErrorCode::PluginTypeMissing;
    }

    if (entry->abiVersion != PLUGIN_ABI_VERSION) {
        m_logger.critical("Plugin " + canonical.string() + " was built for ABI version " +
                          std::to_string(entry->abiVersion) + ", expected " +
                          std::to_string(PLUGIN_ABI_VERSION));
        return ErrorCode::PluginAbiMismatch;
    }

    if (entry->typeName == nullptr || typeName != entry->typeName) {
        m_logger.critical("Plugin " + canonical.string() + " exports type '" +
                          std::string(entry->typeName ? entry->typeName : "") +
                          "', expected '" + typeName + "'");
        return ErrorCode::PluginTypeMissing;
    }

    // 4. Instantiate once and check the contract
    PluginFactory factory = [lib, entry]() -> std::shared_ptr<Plugin> {
        Plugin* raw = entry->create();
        if (raw == nullptr) {
            return nullptr;
        }
        return std::shared_ptr<Plugin>(raw, [lib, entry](Plugin* p) { entry->destroy(p); });
    };

    std::shared_ptr<Plugin> instance;
    try {
        instance = factory();
    } catch (const std::exception& e) {
        m_logger.critical("Plugin " + typeName + " threw during construction: " + e.what());
        return ErrorCode::PluginLoadFailed;
    }
    if (!instance) {
        m_logger.critical("Plugin " + typeName + " could not be instantiated");
        return ErrorCode::PluginLoadFailed;
    }

    std::optional<Capability> capability;
    for (Capability candidate : accepted) {
        if (implements(*instance, candidate)) {
            capability = candidate;
            break;
        }
    }
    if (!capability) {
        std::string expected;
        for (Capability candidate : accepted) {
            if (!expected.empty()) expected += " or ";
            expected += std::string(capabilityName(candidate));
        }
        m_logger.critical("Plugin " + typeName + " from " + canonical.string() +
                          " does not implement the " + expected + " contract");
        return ErrorCode::PluginCapabilityMismatch;
    }

    PluginDescriptor descriptor;
    descriptor.logicalName = logicalNameFor(*capability, stem, typeName);
    descriptor.typeName = typeName;
    descriptor.sourcePath = canonical;
    descriptor.capability = *capability;
    descriptor.builtIn = false;
    descriptor.factory = std::move(factory);
    descriptor.instance = std::move(instance);

    m_logger.debug("Admitted " + std::string(capabilityName(*capability)) + " plugin " +
                   typeName + " from " + canonical.string());
    return descriptor;
}

Result<PluginDescriptor> PluginLoader::loadPlugin(const fs::path& sourceFile,
                                                  const fs::path& pluginRoot,
                                                  Capability required) {
    return admit(sourceFile, pluginRoot, {required});
}

// ============================================================================
// Directories
// ============================================================================

VoidResult PluginLoader::loadDirectory(const fs::path& directory, Capability capability) {
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        m_logger.warn("Plugin directory " + directory.string() + " does not exist; skipping " +
                      std::string(capabilityName(capability)) + " plugins");
        return VoidResult::Success();
    }

    auto files = Security::listPluginFiles(directory);
    if (files.isFailure()) {
        m_logger.critical("Cannot read plugin directory " + directory.string());
        return files.error();
    }

    for (const auto& file : files.value()) {
        auto descriptor = isInstrument(capability)
            ? admit(file, directory, {Capability::StatsInstrument, Capability::FailbotInstrument})
            : admit(file, directory, {capability});
        if (descriptor.isFailure()) {
            return descriptor.error();
        }

        const std::string typeName = descriptor.value().typeName;
        const std::string logicalName = descriptor.value().logicalName;
        auto added = m_registry.add(std::move(descriptor.value()));
        if (added.isFailure()) {
            m_logger.critical("Plugin " + typeName + " from " + file.string() +
                              " conflicts with already registered '" + logicalName + "'");
            return added.error();
        }
    }

    return VoidResult::Success();
}

VoidResult PluginLoader::loadAll(const PluginDirectories& directories) {
    auto result = [&]() -> VoidResult {
        if (directories.auth) {
            HOOKWARDEN_TRY(loadDirectory(*directories.auth, Capability::Auth));
        }
        if (directories.handlers) {
            HOOKWARDEN_TRY(loadDirectory(*directories.handlers, Capability::Handler));
        }
        if (directories.lifecycle) {
            HOOKWARDEN_TRY(loadDirectory(*directories.lifecycle, Capability::Lifecycle));
        }
        if (directories.instruments) {
            HOOKWARDEN_TRY(loadDirectory(*directories.instruments, Capability::StatsInstrument));
        }
        return VoidResult::Success();
    }();

    if (result.isFailure()) {
        m_registry.reset();
        return result;
    }

    logLoaded();
    return result;
}

VoidResult PluginLoader::reload(const PluginDirectories& directories) {
    m_registry.reset();
    return loadAll(directories);
}

void PluginLoader::logLoaded() const {
    auto names = [this](Capability capability) {
        std::string out;
        for (const auto* descriptor : m_registry.descriptors(capability)) {
            if (!out.empty()) out += ", ";
            out += descriptor->logicalName;
        }
        return out;
    };

    const auto auth = m_registry.descriptors(Capability::Auth);
    const auto handlers = m_registry.descriptors(Capability::Handler);
    m_logger.info("Loaded " + std::to_string(auth.size()) + " auth plugins: " +
                  names(Capability::Auth));
    m_logger.info("Loaded " + std::to_string(handlers.size()) + " handler plugins: " +
                  names(Capability::Handler));
    m_logger.info("Loaded " + std::to_string(m_registry.lifecyclePlugins().size()) +
                  " lifecycle plugins");
    m_logger.info("Loaded instruments: stats=" +
                  m_registry.descriptors(Capability::StatsInstrument).front()->typeName +
                  ", failbot=" +
                  m_registry.descriptors(Capability::FailbotInstrument).front()->typeName);
}

} // namespace Hookwarden::Plugins
