/**
 * @file HmacValidator.cpp
 * @brief HMAC webhook signature verification
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 */

#include <Hookwarden/Auth/HmacValidator.hpp>
#include <Hookwarden/Auth/Secret.hpp>
#include <Hookwarden/Auth/TimestampValidator.hpp>
#include <Hookwarden/Core/Crypto.hpp>
#include <Hookwarden/Core/Headers.hpp>
#include <Hookwarden/Core/Logger.hpp>
#include <vector>

namespace Hookwarden::Auth {

namespace {

constexpr std::string_view kContext = "Auth::HMAC";
constexpr std::string_view kTimestampPlaceholder = "{timestamp}";

std::string failure(std::string_view reason) {
    return std::string(kContext) + " validation failed: " + std::string(reason);
}

std::vector<std::string_view> split(std::string_view value, std::string_view separator) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    while (true) {
        const size_t pos = value.find(separator, start);
        if (pos == std::string_view::npos) {
            parts.push_back(value.substr(start));
            break;
        }
        parts.push_back(value.substr(start, pos - start));
        start = pos + separator.size();
    }
    // Trailing empty fields carry no pair
    while (!parts.empty() && parts.back().empty()) {
        parts.pop_back();
    }
    return parts;
}

} // namespace

// ============================================================================
// Helpers
// ============================================================================

std::optional<StructuredSignature> HmacValidator::parseStructuredHeader(std::string_view value,
                                                                        const AuthConfig& config) {
    if (config.structuredHeaderSeparator.empty() || config.keyValueSeparator.empty()) {
        return std::nullopt;
    }

    std::map<std::string, std::string, std::less<>> pairs;
    for (const auto pair : split(value, config.structuredHeaderSeparator)) {
        const size_t pos = pair.find(config.keyValueSeparator);
        if (pos == std::string_view::npos) {
            return std::nullopt;
        }
        const auto key = Core::trim(pair.substr(0, pos));
        const auto val = Core::trim(pair.substr(pos + config.keyValueSeparator.size()));
        pairs[std::string(key)] = std::string(val);
    }

    auto sig = pairs.find(config.signatureKey);
    if (sig == pairs.end() || sig->second.empty()) {
        return std::nullopt;
    }

    StructuredSignature result;
    result.signature = sig->second;

    auto ts = pairs.find(config.timestampKey);
    if (ts != pairs.end() && !ts->second.empty()) {
        result.timestamp = ts->second;
    }
    return result;
}

std::string HmacValidator::expandTemplate(std::string_view tmpl, std::string_view version,
                                          std::string_view timestamp, std::string_view body) {
    static constexpr std::string_view versionKey = "{version}";
    static constexpr std::string_view bodyKey = "{body}";

    std::string out;
    out.reserve(tmpl.size() + body.size());

    size_t i = 0;
    while (i < tmpl.size()) {
        const auto rest = tmpl.substr(i);
        if (rest.substr(0, versionKey.size()) == versionKey) {
            out.append(version);
            i += versionKey.size();
        } else if (rest.substr(0, kTimestampPlaceholder.size()) == kTimestampPlaceholder) {
            out.append(timestamp);
            i += kTimestampPlaceholder.size();
        } else if (rest.substr(0, bodyKey.size()) == bodyKey) {
            out.append(body);
            i += bodyKey.size();
        } else {
            out.push_back(tmpl[i]);
            ++i;
        }
    }
    return out;
}

std::string HmacValidator::formatSignature(std::string_view hexDigest, const AuthConfig& config) {
    switch (config.signatureFormat) {
        case SignatureFormat::AlgorithmPrefixed:
            return config.algorithm + "=" + std::string(hexDigest);
        case SignatureFormat::HashOnly:
            return std::string(hexDigest);
        case SignatureFormat::VersionPrefixed:
            return config.versionPrefix + "=" + std::string(hexDigest);
    }
    return {};
}

// ============================================================================
// Validation
// ============================================================================

bool HmacValidator::validate(ByteSpan payload,
                             const Core::HeaderMap& headers,
                             const AuthConfig& config,
                             Core::Logger& logger) const {
    try {
        auto secret = fetchSecret(config, logger, kContext);
        if (secret.isFailure()) {
            return false;
        }

        const std::string_view headerName = config.headerName();
        const auto raw = Core::findHeader(headers, headerName);
        if (!raw || raw->empty()) {
            logger.warn(failure("Missing or empty signature header '" +
                                std::string(headerName) + "'"));
            return false;
        }

        if (raw->size() > MAX_SIGNATURE_LENGTH) {
            logger.warn(failure("Signature length exceeds maximum limit of " +
                                std::to_string(MAX_SIGNATURE_LENGTH) + " characters"));
            return false;
        }

        if (!Core::isCleanHeaderValue(*raw)) {
            logger.warn(failure("Signature header '" + std::string(headerName) +
                                "' contains whitespace, control characters or invalid UTF-8"));
            return false;
        }

        auto algorithm = Crypto::parseHashAlgorithm(config.algorithm);
        if (algorithm.isFailure()) {
            logger.error(failure("Unsupported algorithm '" + config.algorithm + "'"));
            return false;
        }

        std::string provided;
        std::optional<std::string> timestamp;

        if (config.headerFormat == HeaderFormat::Structured) {
            auto parsed = parseStructuredHeader(*raw, config);
            if (!parsed) {
                logger.warn(failure("Could not parse structured signature header"));
                return false;
            }
            provided = std::move(parsed->signature);
            timestamp = std::move(parsed->timestamp);
        } else {
            provided = std::string(*raw);
        }

        if (!timestamp && config.timestampHeader) {
            const auto rawTs = Core::findHeader(headers, *config.timestampHeader);
            if (!rawTs || !Core::isCleanHeaderValue(*rawTs)) {
                logger.warn(failure("Missing or malformed timestamp header '" +
                                    *config.timestampHeader + "'"));
                return false;
            }
            timestamp = std::string(*rawTs);
        }

        if (timestamp) {
            TimestampValidator timestamps(&logger);
            if (!timestamps.isValid(*timestamp, config.timestampToleranceSeconds)) {
                logger.warn(failure("Invalid timestamp"));
                return false;
            }
        }

        const std::string_view body = asStringView(payload);
        std::string signingInput;
        if (config.payloadTemplate) {
            const std::string& tmpl = *config.payloadTemplate;
            if (!timestamp && tmpl.find(kTimestampPlaceholder) != std::string::npos) {
                logger.warn(failure("Payload template references {timestamp} but no timestamp was provided"));
                return false;
            }
            signingInput = expandTemplate(tmpl, config.versionPrefix,
                                          timestamp ? std::string_view(*timestamp) : std::string_view(),
                                          body);
        } else {
            signingInput = std::string(body);
        }

        Crypto::HMAC hmac(asBytes(secret.value().view()), algorithm.value());
        auto digest = hmac.compute(asBytes(signingInput));
        if (digest.isFailure()) {
            logger.error(failure(std::string(getErrorMessage(digest.error()))));
            return false;
        }

        const std::string expected = formatSignature(Crypto::toHex(digest.value()), config);
        const bool result = Crypto::constantTimeCompare(expected, provided);

        if (result) {
            logger.debug(std::string(kContext) + " validation successful for header '" +
                         std::string(headerName) + "'");
        } else {
            logger.warn(failure("Signature mismatch"));
        }
        return result;

    } catch (const std::exception& e) {
        logger.error(failure(e.what()));
        return false;
    }
}

} // namespace Hookwarden::Auth
