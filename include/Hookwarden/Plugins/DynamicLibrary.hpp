/**
 * @file DynamicLibrary.hpp
 * @brief RAII handle for a loaded shared object
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 */

#pragma once

#ifndef HOOKWARDEN_PLUGINS_DYNAMIC_LIBRARY_HPP
#define HOOKWARDEN_PLUGINS_DYNAMIC_LIBRARY_HPP

#include <Hookwarden/Core/ErrorCodes.hpp>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace Hookwarden::Plugins {

/// File extension of loadable plugins on this platform
#if defined(_WIN32)
inline constexpr std::string_view SHARED_LIBRARY_EXTENSION = ".dll";
#elif defined(__APPLE__)
inline constexpr std::string_view SHARED_LIBRARY_EXTENSION = ".dylib";
#else
inline constexpr std::string_view SHARED_LIBRARY_EXTENSION = ".so";
#endif

/**
 * @brief Shared object opened with immediate binding and local symbols
 *
 * The library is unloaded when the handle is destroyed. Plugin instances
 * hold a shared_ptr to it so code never disappears under a live object.
 */
class DynamicLibrary {
public:
    /**
     * @brief Open a shared object
     * @param path Canonical path to the library
     * @return Library or ErrorCode::PluginLoadFailed
     */
    static Result<std::shared_ptr<DynamicLibrary>> open(const std::filesystem::path& path,
                                                        std::string* errorMessage = nullptr);

    ~DynamicLibrary();

    DynamicLibrary(const DynamicLibrary&) = delete;
    DynamicLibrary& operator=(const DynamicLibrary&) = delete;

    /**
     * @brief Resolve an exported symbol
     * @return Address or nullptr if not exported
     */
    void* symbol(const char* name) const;

    const std::filesystem::path& path() const noexcept { return m_path; }

private:
    DynamicLibrary(void* handle, std::filesystem::path path);

    void* m_handle;
    std::filesystem::path m_path;
};

} // namespace Hookwarden::Plugins

#endif // HOOKWARDEN_PLUGINS_DYNAMIC_LIBRARY_HPP
