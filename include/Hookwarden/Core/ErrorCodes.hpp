/**
 * @file ErrorCodes.hpp
 * @brief Error codes and result types for Hookwarden
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 *
 * This file defines all error codes used throughout Hookwarden, along with
 * a Result type for error handling without exceptions.
 */

#pragma once

#ifndef HOOKWARDEN_CORE_ERROR_CODES_HPP
#define HOOKWARDEN_CORE_ERROR_CODES_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <type_traits>

namespace Hookwarden {

// ============================================================================
// Error Category Enumeration
// ============================================================================

/**
 * @brief Error categories for grouping related errors
 */
enum class ErrorCategory : uint8_t {
    None        = 0x00,  ///< No error
    System      = 0x01,  ///< Operating system errors
    Crypto      = 0x03,  ///< Cryptographic errors
    Network     = 0x04,  ///< Address parsing and filtering errors
    Plugin      = 0x06,  ///< Plugin loading errors
    Config      = 0x08,  ///< Configuration errors
    IO          = 0x09,  ///< File I/O errors
    Parse       = 0x0A,  ///< Parsing errors
    Auth        = 0x0B,  ///< Authentication errors
    Internal    = 0xFF   ///< Internal/unknown errors
};

// ============================================================================
// Error Code Enumeration
// ============================================================================

/**
 * @brief Error codes for all Hookwarden operations
 *
 * Error codes are structured as:
 * - 0x0000: Success
 * - 0x0100-0x01FF: System errors
 * - 0x0300-0x03FF: Crypto errors
 * - 0x0400-0x04FF: Network errors
 * - 0x0600-0x06FF: Plugin errors
 * - 0x0800-0x08FF: Config errors
 * - 0x0900-0x09FF: I/O errors
 * - 0x0A00-0x0AFF: Parse errors
 * - 0x0B00-0x0BFF: Auth errors
 * - 0xFF00-0xFFFF: Internal errors
 */
enum class ErrorCode : uint16_t {
    /// Operation completed successfully
    Success = 0x0000,

    // ========================================================================
    // System Errors (0x0100-0x01FF)
    // ========================================================================

    /// Generic system error
    SystemError = 0x0100,

    /// Feature not supported on this platform
    NotSupported = 0x0107,

    // ========================================================================
    // Cryptographic Errors (0x0300-0x03FF)
    // ========================================================================

    /// Generic cryptographic error
    CryptoError = 0x0300,

    /// Hash computation failed
    HashFailed = 0x0303,

    /// Invalid key format or size
    InvalidKey = 0x0306,

    /// Digest algorithm name not recognised
    UnsupportedAlgorithm = 0x030D,

    // ========================================================================
    // Network Errors (0x0400-0x04FF)
    // ========================================================================

    /// Generic network error
    NetworkError = 0x0400,

    /// Address is not a valid IPv4 or IPv6 literal
    InvalidAddress = 0x0410,

    /// CIDR prefix length missing or out of range
    InvalidPrefixLength = 0x0411,

    // ========================================================================
    // Plugin Errors (0x0600-0x06FF)
    // ========================================================================

    /// Generic plugin error
    PluginError = 0x0600,

    /// Derived type name fails the identifier pattern
    PluginNameInvalid = 0x0601,

    /// Derived type name is on the deny-list
    PluginNameDenied = 0x0602,

    /// Plugin file resolves outside its plugin root
    PluginPathOutsideRoot = 0x0603,

    /// Shared object could not be loaded
    PluginLoadFailed = 0x0604,

    /// Expected type not exported after load
    PluginTypeMissing = 0x0605,

    /// Loaded type does not implement the required capability
    PluginCapabilityMismatch = 0x0606,

    /// Plugin ABI version differs from the host
    PluginAbiMismatch = 0x0607,

    /// Logical name already registered
    PluginDuplicate = 0x0608,

    /// Requested plugin is not registered
    PluginNotFound = 0x0609,

    // ========================================================================
    // Configuration Errors (0x0800-0x08FF)
    // ========================================================================

    /// Generic configuration error
    ConfigError = 0x0800,

    /// Missing required configuration
    ConfigMissing = 0x0801,

    /// Invalid configuration value
    ConfigInvalid = 0x0802,

    /// Configuration file not found
    ConfigFileNotFound = 0x0803,

    /// Configuration parse error
    ConfigParseFailed = 0x0804,

    /// Auth scheme is neither built in nor loaded
    UnknownAuthScheme = 0x0808,

    // ========================================================================
    // I/O Errors (0x0900-0x09FF)
    // ========================================================================

    /// Generic I/O error
    IOError = 0x0900,

    /// File not found
    FileNotFound = 0x0901,

    /// Directory not found
    DirectoryNotFound = 0x0904,

    /// File too large
    FileTooLarge = 0x0909,

    /// Invalid file path
    InvalidPath = 0x090A,

    /// Access denied
    AccessDenied = 0x090B,

    // ========================================================================
    // Parse Errors (0x0A00-0x0AFF)
    // ========================================================================

    /// Generic parse error
    ParseError = 0x0A00,

    /// JSON parse error
    JsonParseFailed = 0x0A01,

    /// Invalid JSON structure
    JsonInvalid = 0x0A02,

    /// Missing required field
    MissingField = 0x0A03,

    /// Invalid field type
    InvalidFieldType = 0x0A04,

    /// Timestamp is neither unix nor UTC ISO-8601
    InvalidTimestamp = 0x0A07,

    // ========================================================================
    // Authentication Errors (0x0B00-0x0BFF)
    // ========================================================================

    /// Generic authentication error
    AuthError = 0x0B00,

    /// Authentication failed
    AuthenticationFailed = 0x0B01,

    /// Secret environment variable missing or blank
    SecretUnavailable = 0x0B07,

    // ========================================================================
    // Internal Errors (0xFF00-0xFFFF)
    // ========================================================================

    /// Unknown internal error
    InternalError = 0xFF00,

    /// Not implemented
    NotImplemented = 0xFF02,

    /// Invalid state
    InvalidState = 0xFF03,

    /// Invalid argument
    InvalidArgument = 0xFF05,

    /// Out of range
    OutOfRange = 0xFF06
};

// ============================================================================
// Error Code Utilities
// ============================================================================

/**
 * @brief Get the category of an error code
 * @param code The error code
 * @return The error category
 */
[[nodiscard]] constexpr ErrorCategory getErrorCategory(ErrorCode code) noexcept {
    uint16_t value = static_cast<uint16_t>(code);
    if (value == 0) return ErrorCategory::None;
    uint8_t category = static_cast<uint8_t>((value >> 8) & 0xFF);
    return static_cast<ErrorCategory>(category);
}

/**
 * @brief Check if an error code represents success
 */
[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::Success;
}

/**
 * @brief Check if an error code represents failure
 */
[[nodiscard]] constexpr bool isFailure(ErrorCode code) noexcept {
    return code != ErrorCode::Success;
}

/**
 * @brief Get human-readable error message
 * @param code The error code
 * @return Error message string
 */
[[nodiscard]] std::string_view getErrorMessage(ErrorCode code) noexcept;

/**
 * @brief Get error category name
 * @param category The error category
 * @return Category name string
 */
[[nodiscard]] std::string_view getCategoryName(ErrorCategory category) noexcept;

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for operations that can fail
 *
 * Holds either a value of type T or an ErrorCode. Use this for error
 * handling without exceptions.
 *
 * @tparam T The success value type
 *
 * @example
 * ```cpp
 * Result<IpRule> rule = IpRule::parse("10.0.0.0/8");
 * if (rule.isFailure()) {
 *     log.Log(LogLevel::Warning, getErrorMessage(rule.error()));
 * }
 * ```
 */
template<typename T>
class Result {
public:
    /// Default constructor creates a failed result
    Result() : m_data(ErrorCode::InternalError) {}

    /// Construct from success value
    Result(const T& value) : m_data(value) {}

    /// Construct from success value (move)
    Result(T&& value) : m_data(std::move(value)) {}

    /// Construct from error code
    Result(ErrorCode error) : m_data(error) {}

    Result(const Result&) = default;
    Result(Result&&) noexcept = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;

    /// Static method to create success result
    [[nodiscard]] static Result Success(T value) {
        return Result(std::move(value));
    }

    /// Static method to create error result
    [[nodiscard]] static Result Error(ErrorCode code) {
        return Result(code);
    }

    /// Check if result is success
    [[nodiscard]] bool isSuccess() const noexcept {
        return std::holds_alternative<T>(m_data);
    }

    /// Check if result is failure
    [[nodiscard]] bool isFailure() const noexcept {
        return std::holds_alternative<ErrorCode>(m_data);
    }

    /// Explicit conversion to bool (true if success)
    [[nodiscard]] explicit operator bool() const noexcept {
        return isSuccess();
    }

    /// Get the success value (throws if failure)
    [[nodiscard]] T& value() & {
        if (isFailure()) {
            throw std::runtime_error("Attempted to access value of failed Result");
        }
        return std::get<T>(m_data);
    }

    /// Get the success value (const, throws if failure)
    [[nodiscard]] const T& value() const & {
        if (isFailure()) {
            throw std::runtime_error("Attempted to access value of failed Result");
        }
        return std::get<T>(m_data);
    }

    /// Get the success value (rvalue, throws if failure)
    [[nodiscard]] T&& value() && {
        if (isFailure()) {
            throw std::runtime_error("Attempted to access value of failed Result");
        }
        return std::get<T>(std::move(m_data));
    }

    /// Get the error code (throws if success)
    [[nodiscard]] ErrorCode error() const {
        if (isSuccess()) {
            throw std::runtime_error("Attempted to access error of successful Result");
        }
        return std::get<ErrorCode>(m_data);
    }

    /// Get value or default if failure
    [[nodiscard]] T valueOr(const T& defaultValue) const & {
        return isSuccess() ? std::get<T>(m_data) : defaultValue;
    }

    /// Get error or Success if no error
    [[nodiscard]] ErrorCode errorOr(ErrorCode defaultError = ErrorCode::Success) const noexcept {
        return isFailure() ? std::get<ErrorCode>(m_data) : defaultError;
    }

private:
    std::variant<T, ErrorCode> m_data;
};

/**
 * @brief Specialization of Result for void (no return value)
 */
template<>
class Result<void> {
public:
    /// Construct success result
    Result() : m_error(ErrorCode::Success) {}

    /// Construct from error code
    Result(ErrorCode error) : m_error(error) {}

    [[nodiscard]] static Result Success() {
        return Result();
    }

    [[nodiscard]] static Result Error(ErrorCode code) {
        return Result(code);
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return m_error == ErrorCode::Success;
    }

    [[nodiscard]] bool isFailure() const noexcept {
        return m_error != ErrorCode::Success;
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return isSuccess();
    }

    [[nodiscard]] ErrorCode error() const noexcept {
        return m_error;
    }

private:
    ErrorCode m_error;
};

/// Alias for Result<void>
using VoidResult = Result<void>;

// ============================================================================
// Convenience Macros
// ============================================================================

/**
 * @brief Return early if result is failure
 *
 * Usage:
 * ```cpp
 * HOOKWARDEN_TRY(someOperation());
 * ```
 */
#define HOOKWARDEN_TRY(expr) \
    do { \
        auto _result = (expr); \
        if (_result.isFailure()) return _result.error(); \
    } while (0)

} // namespace Hookwarden

#endif // HOOKWARDEN_CORE_ERROR_CODES_HPP
