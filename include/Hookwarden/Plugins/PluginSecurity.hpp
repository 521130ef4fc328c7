/**
 * @file PluginSecurity.hpp
 * @brief Name and path checks applied before any plugin code is mapped
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 *
 * A plugin file is admitted only if:
 * - its stem maps to a type name matching ^[A-Z][A-Za-z0-9_]*$
 * - that type name is not a reserved runtime or plugin-contract name
 * - it canonicalises to a regular file strictly inside the plugin root
 */

#pragma once

#ifndef HOOKWARDEN_PLUGINS_PLUGIN_SECURITY_HPP
#define HOOKWARDEN_PLUGINS_PLUGIN_SECURITY_HPP

#include <Hookwarden/Core/ErrorCodes.hpp>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace Hookwarden::Plugins::Security {

/**
 * @brief Map a file stem to its type name
 *
 * Splits on '_', capitalises the first letter of each part and lower-cases
 * the rest: "team1_handler" -> "Team1Handler", "git_hub_handler" ->
 * "GitHubHandler". Empty parts are skipped.
 */
std::string typeNameFromStem(std::string_view stem);

/**
 * @brief Inverse of typeNameFromStem: "GitHubHandler" -> "git_hub_handler"
 */
std::string stemFromTypeName(std::string_view typeName);

/**
 * @brief Whether name matches ^[A-Z][A-Za-z0-9_]*$
 */
bool isValidTypeName(std::string_view name) noexcept;

/**
 * @brief Whether name is reserved, ignoring ASCII case
 *
 * Names derived from file stems are never all-caps ("json" -> "Json"), so
 * "JSON" on the list must also catch "Json".
 */
bool isDeniedTypeName(std::string_view name) noexcept;

/**
 * @brief Reserved type names
 */
const std::vector<std::string_view>& deniedTypeNames() noexcept;

/**
 * @brief Combined name check
 * @return Success, PluginNameInvalid or PluginNameDenied
 */
VoidResult validateTypeName(std::string_view name);

/**
 * @brief Resolve a plugin file and require it to live under root
 *
 * Both paths are canonicalised (symlinks and ".." resolved) and compared
 * component by component; the file must be a strict descendant of the
 * root and a regular file.
 *
 * @return Canonical file path, or DirectoryNotFound, FileNotFound,
 *         PluginPathOutsideRoot, InvalidPath
 */
Result<std::filesystem::path> resolveContainedPath(const std::filesystem::path& file,
                                                   const std::filesystem::path& root);

/**
 * @brief Whether path has the platform's shared-library extension
 */
bool hasSharedLibraryExtension(const std::filesystem::path& path);

/**
 * @brief Shared-library files directly inside dir, sorted by name
 */
Result<std::vector<std::filesystem::path>> listPluginFiles(const std::filesystem::path& dir);

} // namespace Hookwarden::Plugins::Security

#endif // HOOKWARDEN_PLUGINS_PLUGIN_SECURITY_HPP
