/**
 * @file ErrorCodes.cpp
 * @brief Human-readable descriptions for Hookwarden error codes
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 */

#include <Hookwarden/Core/ErrorCodes.hpp>

namespace Hookwarden {

std::string_view getErrorMessage(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:                  return "Success";

        case ErrorCode::SystemError:              return "System error";
        case ErrorCode::NotSupported:             return "Not supported on this platform";

        case ErrorCode::CryptoError:              return "Cryptographic error";
        case ErrorCode::HashFailed:               return "Hash computation failed";
        case ErrorCode::InvalidKey:               return "Invalid key";
        case ErrorCode::UnsupportedAlgorithm:     return "Unsupported digest algorithm";

        case ErrorCode::NetworkError:             return "Network error";
        case ErrorCode::InvalidAddress:           return "Invalid IP address";
        case ErrorCode::InvalidPrefixLength:      return "Invalid CIDR prefix length";

        case ErrorCode::PluginError:              return "Plugin error";
        case ErrorCode::PluginNameInvalid:        return "Plugin type name is not a valid identifier";
        case ErrorCode::PluginNameDenied:         return "Plugin type name is reserved";
        case ErrorCode::PluginPathOutsideRoot:    return "Plugin path outside of plugin directory";
        case ErrorCode::PluginLoadFailed:         return "Plugin library could not be loaded";
        case ErrorCode::PluginTypeMissing:        return "Plugin type not found after load";
        case ErrorCode::PluginCapabilityMismatch: return "Plugin does not implement the required capability";
        case ErrorCode::PluginAbiMismatch:        return "Plugin ABI version mismatch";
        case ErrorCode::PluginDuplicate:          return "Plugin name already registered";
        case ErrorCode::PluginNotFound:           return "Plugin not found";

        case ErrorCode::ConfigError:              return "Configuration error";
        case ErrorCode::ConfigMissing:            return "Missing required configuration";
        case ErrorCode::ConfigInvalid:            return "Invalid configuration value";
        case ErrorCode::ConfigFileNotFound:       return "Configuration file not found";
        case ErrorCode::ConfigParseFailed:        return "Configuration parse error";
        case ErrorCode::UnknownAuthScheme:        return "Unknown auth scheme";

        case ErrorCode::IOError:                  return "I/O error";
        case ErrorCode::FileNotFound:             return "File not found";
        case ErrorCode::DirectoryNotFound:        return "Directory not found";
        case ErrorCode::FileTooLarge:             return "File too large";
        case ErrorCode::InvalidPath:              return "Invalid path";
        case ErrorCode::AccessDenied:             return "Access denied";

        case ErrorCode::ParseError:               return "Parse error";
        case ErrorCode::JsonParseFailed:          return "JSON parse error";
        case ErrorCode::JsonInvalid:              return "Invalid JSON structure";
        case ErrorCode::MissingField:             return "Missing required field";
        case ErrorCode::InvalidFieldType:         return "Invalid field type";
        case ErrorCode::InvalidTimestamp:         return "Invalid timestamp";

        case ErrorCode::AuthError:                return "Authentication error";
        case ErrorCode::AuthenticationFailed:     return "Authentication failed";
        case ErrorCode::SecretUnavailable:        return "Secret not available in environment";

        case ErrorCode::InternalError:            return "Internal error";
        case ErrorCode::NotImplemented:           return "Not implemented";
        case ErrorCode::InvalidState:             return "Invalid state";
        case ErrorCode::InvalidArgument:          return "Invalid argument";
        case ErrorCode::OutOfRange:               return "Out of range";
    }
    return "Unknown error";
}

std::string_view getCategoryName(ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::None:     return "None";
        case ErrorCategory::System:   return "System";
        case ErrorCategory::Crypto:   return "Crypto";
        case ErrorCategory::Network:  return "Network";
        case ErrorCategory::Plugin:   return "Plugin";
        case ErrorCategory::Config:   return "Config";
        case ErrorCategory::IO:       return "IO";
        case ErrorCategory::Parse:    return "Parse";
        case ErrorCategory::Auth:     return "Auth";
        case ErrorCategory::Internal: return "Internal";
    }
    return "Unknown";
}

} // namespace Hookwarden
