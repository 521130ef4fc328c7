/**
 * @file Types.hpp
 * @brief Core type definitions for Hookwarden
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 *
 * This file contains fundamental type definitions, constants, and aliases
 * used throughout the Hookwarden codebase. All components should include
 * this header for consistent type usage.
 */

#pragma once

#ifndef HOOKWARDEN_CORE_TYPES_HPP
#define HOOKWARDEN_CORE_TYPES_HPP

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <span>
#include <chrono>

namespace Hookwarden {

// ============================================================================
// Version Information
// ============================================================================

/// Major version number
constexpr uint32_t VERSION_MAJOR = 1;

/// Minor version number
constexpr uint32_t VERSION_MINOR = 0;

/// Patch version number
constexpr uint32_t VERSION_PATCH = 0;

/// Full version string
constexpr const char* VERSION_STRING = "1.0.0";

// ============================================================================
// Fundamental Type Aliases
// ============================================================================

/// Byte type for raw payload operations
using Byte = uint8_t;

/// Span of bytes (non-owning view)
using ByteSpan = std::span<const Byte>;

/// Mutable span of bytes
using MutableByteSpan = std::span<Byte>;

/// Owning byte buffer
using ByteBuffer = std::vector<Byte>;

/// String view for efficient string passing
using StringView = std::string_view;

// ============================================================================
// Time Types
// ============================================================================

/// Wall clock used for replay-window checks
using SystemClock = std::chrono::system_clock;

/// Duration in seconds
using Seconds = std::chrono::seconds;

/// Duration in milliseconds
using Milliseconds = std::chrono::milliseconds;

// ============================================================================
// Helpers
// ============================================================================

/**
 * @brief View a string's characters as bytes
 */
inline ByteSpan asBytes(std::string_view str) noexcept {
    return ByteSpan(reinterpret_cast<const Byte*>(str.data()), str.size());
}

/**
 * @brief View bytes as characters
 */
inline std::string_view asStringView(ByteSpan bytes) noexcept {
    return std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

} // namespace Hookwarden

#endif // HOOKWARDEN_CORE_TYPES_HPP
