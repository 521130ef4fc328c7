/**
 * @file DynamicLibrary.cpp
 * @brief Cross-platform shared object loading
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 */

#include <Hookwarden/Plugins/DynamicLibrary.hpp>

#if defined(_WIN32)
#include <windows.h>
#else
#include <dlfcn.h>
#endif

namespace Hookwarden::Plugins {

DynamicLibrary::DynamicLibrary(void* handle, std::filesystem::path path)
    : m_handle(handle)
    , m_path(std::move(path)) {}

Result<std::shared_ptr<DynamicLibrary>> DynamicLibrary::open(const std::filesystem::path& path,
                                                             std::string* errorMessage) {
#if defined(_WIN32)
    const std::wstring wide = path.wstring();
    HMODULE handle = ::LoadLibraryW(wide.c_str());
    if (handle == nullptr) {
        if (errorMessage) {
            *errorMessage = "LoadLibraryW failed with error " + std::to_string(::GetLastError());
        }
        return ErrorCode::PluginLoadFailed;
    }
    void* raw = reinterpret_cast<void*>(handle);
#else
    const std::string utf8 = path.string();
    void* raw = ::dlopen(utf8.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (raw == nullptr) {
        if (errorMessage) {
            const char* err = ::dlerror();
            *errorMessage = err ? err : "dlopen failed";
        }
        return ErrorCode::PluginLoadFailed;
    }
#endif

    return std::shared_ptr<DynamicLibrary>(new DynamicLibrary(raw, path));
}

DynamicLibrary::~DynamicLibrary() {
    if (!m_handle) {
        return;
    }
#if defined(_WIN32)
    ::FreeLibrary(reinterpret_cast<HMODULE>(m_handle));
#else
    ::dlclose(m_handle);
#endif
    m_handle = nullptr;
}

void* DynamicLibrary::symbol(const char* name) const {
    if (!m_handle) {
        return nullptr;
    }
#if defined(_WIN32)
    return reinterpret_cast<void*>(::GetProcAddress(reinterpret_cast<HMODULE>(m_handle), name));
#else
    return ::dlsym(m_handle, name);
#endif
}

} // namespace Hookwarden::Plugins
