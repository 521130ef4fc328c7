/**
 * @file PluginSecurity.cpp
 * @brief Plugin type name and path containment checks
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 */

#include <Hookwarden/Plugins/PluginSecurity.hpp>
#include <Hookwarden/Plugins/DynamicLibrary.hpp>
#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace Hookwarden::Plugins::Security {

namespace {

bool isUpper(char c) noexcept { return c >= 'A' && c <= 'Z'; }
bool isLower(char c) noexcept { return c >= 'a' && c <= 'z'; }
bool isDigit(char c) noexcept { return c >= '0' && c <= '9'; }

char toUpper(char c) noexcept { return isLower(c) ? static_cast<char>(c - 'a' + 'A') : c; }
char toLower(char c) noexcept { return isUpper(c) ? static_cast<char>(c - 'A' + 'a') : c; }

} // namespace

// ============================================================================
// Type names
// ============================================================================

std::string typeNameFromStem(std::string_view stem) {
    std::string out;
    out.reserve(stem.size());

    size_t start = 0;
    while (start <= stem.size()) {
        size_t end = stem.find('_', start);
        if (end == std::string_view::npos) {
            end = stem.size();
        }
        const auto part = stem.substr(start, end - start);
        if (!part.empty()) {
            out.push_back(toUpper(part[0]));
            for (size_t i = 1; i < part.size(); ++i) {
                out.push_back(toLower(part[i]));
            }
        }
        start = end + 1;
    }
    return out;
}

std::string stemFromTypeName(std::string_view typeName) {
    std::string out;
    out.reserve(typeName.size() + 4);

    for (size_t i = 0; i < typeName.size(); ++i) {
        const char c = typeName[i];
        if (isUpper(c) && i > 0 && typeName[i - 1] != '_') {
            out.push_back('_');
        }
        out.push_back(toLower(c));
    }
    return out;
}

bool isValidTypeName(std::string_view name) noexcept {
    if (name.empty() || !isUpper(name[0])) {
        return false;
    }
    return std::all_of(name.begin() + 1, name.end(), [](char c) {
        return isUpper(c) || isLower(c) || isDigit(c) || c == '_';
    });
}

const std::vector<std::string_view>& deniedTypeNames() noexcept {
    static const std::vector<std::string_view> names = {
        // File system, I/O and sockets
        "File", "Dir", "IO", "Pathname", "Filesystem", "Path",
        "Socket", "TCPSocket", "UDPSocket", "BasicSocket",
        // Processes and threads
        "Kernel", "Process", "Thread", "Fiber", "Mutex", "ConditionVariable",
        "System", "Exec", "Shell", "Environment",
        // Reflection and serialisation
        "Object", "Class", "Module", "Proc", "Method",
        "Marshal", "YAML", "JSON",
        // Loader machinery
        "DynamicLibrary", "Logger", "Registry", "Loader",
        // Plugin contracts
        "Plugin", "AuthPlugin", "HandlerPlugin", "LifecyclePlugin",
        "StatsInstrument", "FailbotInstrument",
    };
    return names;
}

bool isDeniedTypeName(std::string_view name) noexcept {
    const auto& names = deniedTypeNames();
    return std::any_of(names.begin(), names.end(), [name](std::string_view denied) {
        return denied.size() == name.size() &&
               std::equal(denied.begin(), denied.end(), name.begin(),
                          [](char a, char b) { return toLower(a) == toLower(b); });
    });
}

VoidResult validateTypeName(std::string_view name) {
    if (!isValidTypeName(name)) {
        return ErrorCode::PluginNameInvalid;
    }
    if (isDeniedTypeName(name)) {
        return ErrorCode::PluginNameDenied;
    }
    return VoidResult::Success();
}

// ============================================================================
// Paths
// ============================================================================

Result<fs::path> resolveContainedPath(const fs::path& file, const fs::path& root) {
    std::error_code ec;

    const fs::path canonicalRoot = fs::canonical(root, ec);
    if (ec || !fs::is_directory(canonicalRoot, ec)) {
        return ErrorCode::DirectoryNotFound;
    }

    const fs::path canonicalFile = fs::canonical(file, ec);
    if (ec) {
        return ErrorCode::FileNotFound;
    }

    // Strict descendant: every root component matches and something follows
    auto rootIt = canonicalRoot.begin();
    auto fileIt = canonicalFile.begin();
    for (; rootIt != canonicalRoot.end(); ++rootIt, ++fileIt) {
        if (rootIt->empty()) {
            // Trailing separator yields an empty final element
            continue;
        }
        if (fileIt == canonicalFile.end() || *fileIt != *rootIt) {
            return ErrorCode::PluginPathOutsideRoot;
        }
    }
    if (fileIt == canonicalFile.end()) {
        return ErrorCode::PluginPathOutsideRoot;
    }

    if (!fs::is_regular_file(canonicalFile, ec) || ec) {
        return ErrorCode::InvalidPath;
    }

    return canonicalFile;
}

bool hasSharedLibraryExtension(const fs::path& path) {
    return path.extension() == SHARED_LIBRARY_EXTENSION;
}

Result<std::vector<fs::path>> listPluginFiles(const fs::path& dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec) || ec) {
        return ErrorCode::DirectoryNotFound;
    }

    std::vector<fs::path> files;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return ErrorCode::IOError;
    }

    for (const auto& entry : it) {
        if (hasSharedLibraryExtension(entry.path())) {
            files.push_back(entry.path());
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

} // namespace Hookwarden::Plugins::Security
