/**
 * @file ConfigLoader.cpp
 * @brief Implementation of layered, securely read JSON configuration
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 */

#include <Hookwarden/Core/Config.hpp>
#include <Hookwarden/Core/Crypto.hpp>
#include <Hookwarden/Core/Headers.hpp>
#include <Hookwarden/Core/Logger.hpp>
#include <Hookwarden/Plugins/PluginRegistry.hpp>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>
#endif

#include <algorithm>
#include <cstdlib>
#include <system_error>

namespace fs = std::filesystem;
using nlohmann::json;

namespace Hookwarden::Config {

namespace {

constexpr std::string_view kLogLevels[] = {"debug", "info", "warn", "error"};
constexpr std::string_view kEnvironments[] = {"development", "production"};

template<size_t N>
bool isOneOf(std::string_view value, const std::string_view (&options)[N]) {
    return std::find(std::begin(options), std::end(options), value) != std::end(options);
}

bool parsePositiveInt(std::string_view text, int64_t& out) {
    if (text.empty() || text.size() > 18) {
        return false;
    }
    int64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    if (value <= 0) {
        return false;
    }
    out = value;
    return true;
}

} // namespace

class ConfigLoader::Impl {
public:
    Core::Logger& logger;
    Options options;

    Impl(Core::Logger& log, const Options& opts) : logger(log), options(opts) {}

    // ========================================================================
    // Secure file access
    // ========================================================================

    Result<fs::path> canonicalizePath(const fs::path& path) {
        std::error_code ec;
        fs::path resolved = fs::canonical(path, ec);
        if (ec) {
            return ErrorCode::FileNotFound;
        }
        return resolved;
    }

    Result<bool> isPathAllowed(const fs::path& canonicalPath) {
        if (options.allowed_directory.empty()) {
            return true;  // No restriction
        }

        std::error_code ec;
        const fs::path allowed = fs::canonical(options.allowed_directory, ec);
        if (ec) {
            return ErrorCode::DirectoryNotFound;
        }

        // Component-wise: "/etc/hookwarden-evil" is not inside "/etc/hookwarden"
        auto allowedIt = allowed.begin();
        auto pathIt = canonicalPath.begin();
        for (; allowedIt != allowed.end(); ++allowedIt, ++pathIt) {
            if (allowedIt->empty()) {
                continue;
            }
            if (pathIt == canonicalPath.end() || *pathIt != *allowedIt) {
                return false;
            }
        }
        return pathIt != canonicalPath.end();
    }

    Result<ByteBuffer> readFileSecurely(const fs::path& path) {
        auto canonResult = canonicalizePath(path);
        if (canonResult.isFailure()) {
            return canonResult.error();
        }
        const fs::path& canonPath = canonResult.value();

        auto allowedResult = isPathAllowed(canonPath);
        if (allowedResult.isFailure()) {
            return allowedResult.error();
        }
        if (!allowedResult.value()) {
            return ErrorCode::AccessDenied;
        }

#ifdef _WIN32
        HANDLE hFile = CreateFileW(
            canonPath.wstring().c_str(),
            GENERIC_READ,
            FILE_SHARE_READ,
            nullptr,
            OPEN_EXISTING,
            FILE_ATTRIBUTE_NORMAL | FILE_FLAG_SEQUENTIAL_SCAN,
            nullptr
        );
        if (hFile == INVALID_HANDLE_VALUE) {
            return ErrorCode::FileNotFound;
        }

        LARGE_INTEGER fileSize;
        if (!GetFileSizeEx(hFile, &fileSize)) {
            CloseHandle(hFile);
            return ErrorCode::IOError;
        }
        if (static_cast<size_t>(fileSize.QuadPart) > options.max_file_size) {
            CloseHandle(hFile);
            return ErrorCode::FileTooLarge;
        }

        ByteBuffer data(static_cast<size_t>(fileSize.QuadPart));
        DWORD bytesRead = 0;
        const BOOL ok = data.empty() ? TRUE
            : ReadFile(hFile, data.data(), static_cast<DWORD>(data.size()), &bytesRead, nullptr);
        CloseHandle(hFile);
        if (!ok || bytesRead != data.size()) {
            return ErrorCode::IOError;
        }
        return data;
#else
        // O_NOFOLLOW: the canonical path must not have become a symlink since
        int fd = open(canonPath.c_str(), O_RDONLY | O_NOFOLLOW);
        if (fd < 0) {
            return ErrorCode::FileNotFound;
        }

        struct stat st;
        if (fstat(fd, &st) < 0) {
            close(fd);
            return ErrorCode::IOError;
        }
        if (!S_ISREG(st.st_mode)) {
            close(fd);
            return ErrorCode::InvalidPath;
        }
        if (static_cast<size_t>(st.st_size) > options.max_file_size) {
            close(fd);
            return ErrorCode::FileTooLarge;
        }

        ByteBuffer data(static_cast<size_t>(st.st_size));
        size_t total = 0;
        while (total < data.size()) {
            const ssize_t n = read(fd, data.data() + total, data.size() - total);
            if (n <= 0) {
                break;
            }
            total += static_cast<size_t>(n);
        }
        close(fd);

        if (total != data.size()) {
            return ErrorCode::IOError;
        }
        return data;
#endif
    }

    Result<json> parseDocument(ByteSpan data, std::string_view origin) {
        json document = json::parse(data.begin(), data.end(), nullptr, false);
        if (document.is_discarded()) {
            logger.error(std::string(origin) + ": not valid JSON");
            return ErrorCode::JsonParseFailed;
        }
        if (!document.is_object()) {
            logger.error(std::string(origin) + ": top level must be an object");
            return ErrorCode::JsonInvalid;
        }
        return document;
    }

    // ========================================================================
    // Field readers
    // ========================================================================

    VoidResult fieldError(std::string_view origin, std::string_view key, std::string_view what,
                          ErrorCode code = ErrorCode::InvalidFieldType) {
        logger.error(std::string(origin) + ": '" + std::string(key) + "' " + std::string(what));
        return code;
    }

    VoidResult readString(const json& obj, const char* key, std::string& out, std::string_view origin) {
        auto it = obj.find(key);
        if (it == obj.end()) {
            return VoidResult::Success();
        }
        if (!it->is_string() || it->get_ref<const std::string&>().empty()) {
            return fieldError(origin, key, "must be a non-empty string");
        }
        out = it->get<std::string>();
        return VoidResult::Success();
    }

    VoidResult readOptionalString(const json& obj, const char* key, std::optional<std::string>& out,
                                  std::string_view origin) {
        if (!obj.contains(key)) {
            return VoidResult::Success();
        }
        std::string value;
        HOOKWARDEN_TRY(readString(obj, key, value, origin));
        out = std::move(value);
        return VoidResult::Success();
    }

    VoidResult readOptionalPath(const json& obj, const char* key, std::optional<fs::path>& out,
                                std::string_view origin) {
        auto it = obj.find(key);
        if (it == obj.end()) {
            return VoidResult::Success();
        }
        if (it->is_null()) {
            out.reset();
            return VoidResult::Success();
        }
        std::string value;
        HOOKWARDEN_TRY(readString(obj, key, value, origin));
        out = fs::path(value);
        return VoidResult::Success();
    }

    VoidResult readPositiveInt(const json& obj, const char* key, int64_t& out, std::string_view origin) {
        auto it = obj.find(key);
        if (it == obj.end()) {
            return VoidResult::Success();
        }
        if (!it->is_number_integer() || it->get<int64_t>() <= 0) {
            return fieldError(origin, key, "must be a positive integer");
        }
        out = it->get<int64_t>();
        return VoidResult::Success();
    }

    VoidResult readBool(const json& obj, const char* key, bool& out, std::string_view origin) {
        auto it = obj.find(key);
        if (it == obj.end()) {
            return VoidResult::Success();
        }
        if (!it->is_boolean()) {
            return fieldError(origin, key, "must be a boolean");
        }
        out = it->get<bool>();
        return VoidResult::Success();
    }

    // ========================================================================
    // Blocks
    // ========================================================================

    Result<Network::IpPolicy> parseIpFiltering(const json& block, std::string_view origin) {
        if (!block.is_object()) {
            return fieldError(origin, "ip_filtering", "must be an object").error();
        }

        std::string header(Network::DEFAULT_IP_HEADER);
        HOOKWARDEN_TRY(readString(block, "ip_header", header, origin));

        auto readList = [&](const char* key, std::vector<std::string>& out) -> VoidResult {
            auto it = block.find(key);
            if (it == block.end() || it->is_null()) {
                return VoidResult::Success();
            }
            if (!it->is_array()) {
                return fieldError(origin, std::string("ip_filtering.") + key, "must be an array");
            }
            for (const auto& entry : *it) {
                if (!entry.is_string()) {
                    logger.warn(std::string(origin) + ": dropping non-string ip_filtering." + key + " entry");
                    continue;
                }
                out.push_back(entry.get<std::string>());
            }
            return VoidResult::Success();
        };

        std::vector<std::string> allow;
        std::vector<std::string> block_;
        HOOKWARDEN_TRY(readList("allowlist", allow));
        HOOKWARDEN_TRY(readList("blocklist", block_));

        return Network::IpPolicy::fromStrings(header, allow, block_, logger);
    }

    Result<Auth::AuthConfig> parseAuth(const json& block, std::string_view origin) {
        if (!block.is_object()) {
            return fieldError(origin, "auth", "must be an object").error();
        }

        Auth::AuthConfig config;

        std::string type;
        HOOKWARDEN_TRY(readString(block, "scheme", type, origin));
        HOOKWARDEN_TRY(readString(block, "type", type, origin));
        if (type.empty()) {
            return fieldError(origin, "auth.type", "is required", ErrorCode::MissingField).error();
        }
        config.scheme = Auth::schemeFromName(type);
        config.schemeName = Core::toLower(type);

        HOOKWARDEN_TRY(readString(block, "secret_env_key", config.secretEnvKey, origin));
        HOOKWARDEN_TRY(readOptionalString(block, "header", config.header, origin));
        HOOKWARDEN_TRY(readString(block, "algorithm", config.algorithm, origin));
        if (config.scheme == Auth::AuthScheme::Hmac) {
            auto algorithm = Crypto::parseHashAlgorithm(Core::toLower(config.algorithm));
            if (algorithm.isFailure()) {
                return fieldError(origin, "auth.algorithm", "must be one of sha1, sha256, sha384, sha512",
                                  ErrorCode::ConfigInvalid).error();
            }
            // Canonical spelling; it is also the "algorithm=" signature prefix
            config.algorithm = std::string(Crypto::hashAlgorithmName(algorithm.value()));
        }
        HOOKWARDEN_TRY(readOptionalString(block, "timestamp_header", config.timestampHeader, origin));
        HOOKWARDEN_TRY(readPositiveInt(block, "timestamp_tolerance", config.timestampToleranceSeconds, origin));
        HOOKWARDEN_TRY(readString(block, "version_prefix", config.versionPrefix, origin));
        HOOKWARDEN_TRY(readOptionalString(block, "payload_template", config.payloadTemplate, origin));
        HOOKWARDEN_TRY(readString(block, "signature_key", config.signatureKey, origin));
        HOOKWARDEN_TRY(readString(block, "timestamp_key", config.timestampKey, origin));
        HOOKWARDEN_TRY(readString(block, "structured_header_separator", config.structuredHeaderSeparator, origin));
        HOOKWARDEN_TRY(readString(block, "key_value_separator", config.keyValueSeparator, origin));

        std::string format;
        HOOKWARDEN_TRY(readString(block, "format", format, origin));
        if (!format.empty()) {
            auto parsed = Auth::parseSignatureFormat(format);
            if (parsed.isFailure()) {
                return fieldError(origin, "auth.format", "must be one of algorithm=signature, "
                                  "signature_only, version=signature", ErrorCode::ConfigInvalid).error();
            }
            config.signatureFormat = parsed.value();
        }

        std::string headerFormat;
        HOOKWARDEN_TRY(readString(block, "header_format", headerFormat, origin));
        if (!headerFormat.empty()) {
            auto parsed = Auth::parseHeaderFormat(headerFormat);
            if (parsed.isFailure()) {
                return fieldError(origin, "auth.header_format", "must be simple or structured",
                                  ErrorCode::ConfigInvalid).error();
            }
            config.headerFormat = parsed.value();
        }

        if (config.secretEnvKey.empty() && config.scheme != Auth::AuthScheme::Custom) {
            logger.warn(std::string(origin) + ": auth has no secret_env_key; every request will be rejected");
        }

        return config;
    }

    // ========================================================================
    // Global
    // ========================================================================

    VoidResult applyGlobal(const json& doc, GlobalConfig& config, std::string_view origin) {
        HOOKWARDEN_TRY(readOptionalPath(doc, "handler_plugin_dir", config.handlerPluginDir, origin));
        HOOKWARDEN_TRY(readOptionalPath(doc, "auth_plugin_dir", config.authPluginDir, origin));
        HOOKWARDEN_TRY(readOptionalPath(doc, "lifecycle_plugin_dir", config.lifecyclePluginDir, origin));
        HOOKWARDEN_TRY(readOptionalPath(doc, "instruments_plugin_dir", config.instrumentsPluginDir, origin));

        HOOKWARDEN_TRY(readString(doc, "log_level", config.logLevel, origin));
        HOOKWARDEN_TRY(readPositiveInt(doc, "request_limit", config.requestLimit, origin));
        HOOKWARDEN_TRY(readPositiveInt(doc, "request_timeout", config.requestTimeout, origin));
        HOOKWARDEN_TRY(readString(doc, "root_path", config.rootPath, origin));
        HOOKWARDEN_TRY(readString(doc, "health_path", config.healthPath, origin));
        HOOKWARDEN_TRY(readString(doc, "version_path", config.versionPath, origin));
        HOOKWARDEN_TRY(readString(doc, "environment", config.environment, origin));

        std::string endpointsDir;
        HOOKWARDEN_TRY(readString(doc, "endpoints_dir", endpointsDir, origin));
        if (!endpointsDir.empty()) {
            config.endpointsDir = endpointsDir;
        }

        HOOKWARDEN_TRY(readBool(doc, "use_catchall_route", config.useCatchallRoute, origin));
        HOOKWARDEN_TRY(readBool(doc, "normalize_headers", config.normalizeHeaders, origin));

        auto ip = doc.find("ip_filtering");
        if (ip != doc.end() && !ip->is_null()) {
            auto policy = parseIpFiltering(*ip, origin);
            if (policy.isFailure()) {
                return policy.error();
            }
            config.ipFiltering = std::move(policy.value());
        }

        return VoidResult::Success();
    }

    VoidResult applyEnvironment(GlobalConfig& config) {
        auto env = [](const char* name) -> std::optional<std::string> {
            const std::string key = std::string(ENV_PREFIX) + name;
            const char* value = std::getenv(key.c_str());
            if (value == nullptr) {
                return std::nullopt;
            }
            return std::string(value);
        };

        if (auto v = env("HANDLER_PLUGIN_DIR"))     config.handlerPluginDir = fs::path(*v);
        if (auto v = env("AUTH_PLUGIN_DIR"))        config.authPluginDir = fs::path(*v);
        if (auto v = env("LIFECYCLE_PLUGIN_DIR"))   config.lifecyclePluginDir = fs::path(*v);
        if (auto v = env("INSTRUMENTS_PLUGIN_DIR")) config.instrumentsPluginDir = fs::path(*v);
        if (auto v = env("LOG_LEVEL"))              config.logLevel = *v;
        if (auto v = env("ROOT_PATH"))              config.rootPath = *v;
        if (auto v = env("HEALTH_PATH"))            config.healthPath = *v;
        if (auto v = env("VERSION_PATH"))           config.versionPath = *v;
        if (auto v = env("ENVIRONMENT"))            config.environment = *v;
        if (auto v = env("ENDPOINTS_DIR"))          config.endpointsDir = fs::path(*v);

        if (auto v = env("REQUEST_LIMIT")) {
            if (!parsePositiveInt(*v, config.requestLimit)) {
                logger.error("HOOKWARDEN_REQUEST_LIMIT must be a positive integer");
                return ErrorCode::ConfigInvalid;
            }
        }
        if (auto v = env("REQUEST_TIMEOUT")) {
            if (!parsePositiveInt(*v, config.requestTimeout)) {
                logger.error("HOOKWARDEN_REQUEST_TIMEOUT must be a positive integer");
                return ErrorCode::ConfigInvalid;
            }
        }
        return VoidResult::Success();
    }

    VoidResult validateGlobal(GlobalConfig& config) {
        if (!isOneOf(config.logLevel, kLogLevels)) {
            logger.error("log_level must be one of debug, info, warn, error (got '" + config.logLevel + "')");
            return ErrorCode::ConfigInvalid;
        }
        if (!isOneOf(config.environment, kEnvironments)) {
            logger.error("environment must be development or production (got '" + config.environment + "')");
            return ErrorCode::ConfigInvalid;
        }
        for (const std::string* path : {&config.rootPath, &config.healthPath, &config.versionPath}) {
            if (path->empty()) {
                logger.error("root_path, health_path and version_path must not be empty");
                return ErrorCode::ConfigInvalid;
            }
        }
        config.production = config.environment == "production";
        return VoidResult::Success();
    }

    Result<GlobalConfig> finish(const json* document, std::string_view origin) {
        GlobalConfig config;
        if (document) {
            HOOKWARDEN_TRY(applyGlobal(*document, config, origin));
        }
        HOOKWARDEN_TRY(applyEnvironment(config));
        HOOKWARDEN_TRY(validateGlobal(config));
        return config;
    }
};

// ============================================================================
// ConfigLoader - Public API
// ============================================================================

ConfigLoader::ConfigLoader(Core::Logger& logger, const Options& options)
    : m_impl(std::make_unique<Impl>(logger, options)) {}

ConfigLoader::~ConfigLoader() = default;

Result<GlobalConfig> ConfigLoader::load(const std::optional<fs::path>& path) {
    if (!path) {
        return m_impl->finish(nullptr, "defaults");
    }

    const std::string origin = path->string();
    auto data = m_impl->readFileSecurely(*path);
    if (data.isFailure()) {
        m_impl->logger.error("Cannot read configuration file " + origin + ": " +
                             std::string(getErrorMessage(data.error())));
        return data.error() == ErrorCode::FileNotFound ? ErrorCode::ConfigFileNotFound : data.error();
    }

    auto document = m_impl->parseDocument(data.value(), origin);
    if (document.isFailure()) {
        return ErrorCode::ConfigParseFailed;
    }
    return m_impl->finish(&document.value(), origin);
}

Result<GlobalConfig> ConfigLoader::loadFromMemory(ByteSpan data) {
    auto document = m_impl->parseDocument(data, "<memory>");
    if (document.isFailure()) {
        return ErrorCode::ConfigParseFailed;
    }
    return m_impl->finish(&document.value(), "<memory>");
}

Result<EndpointConfig> ConfigLoader::parseEndpoint(const json& document, std::string_view origin) {
    if (!document.is_object()) {
        m_impl->logger.error(std::string(origin) + ": endpoint must be an object");
        return ErrorCode::JsonInvalid;
    }

    EndpointConfig endpoint;
    HOOKWARDEN_TRY(m_impl->readString(document, "path", endpoint.path, origin));
    HOOKWARDEN_TRY(m_impl->readString(document, "handler", endpoint.handler, origin));
    if (endpoint.path.empty()) {
        return m_impl->fieldError(origin, "path", "is required", ErrorCode::MissingField).error();
    }
    if (endpoint.handler.empty()) {
        return m_impl->fieldError(origin, "handler", "is required", ErrorCode::MissingField).error();
    }

    // "request_validator" is the older name of the auth block
    auto auth = document.find("auth");
    if (auth == document.end()) {
        auth = document.find("request_validator");
    }
    if (auth != document.end() && !auth->is_null()) {
        auto parsed = m_impl->parseAuth(*auth, origin);
        if (parsed.isFailure()) {
            return parsed.error();
        }
        endpoint.auth = std::move(parsed.value());
    }

    auto ip = document.find("ip_filtering");
    if (ip != document.end() && !ip->is_null()) {
        auto policy = m_impl->parseIpFiltering(*ip, origin);
        if (policy.isFailure()) {
            return policy.error();
        }
        endpoint.ipFiltering = std::move(policy.value());
    }

    auto opts = document.find("opts");
    if (opts != document.end() && !opts->is_null()) {
        if (!opts->is_object()) {
            return m_impl->fieldError(origin, "opts", "must be an object").error();
        }
        endpoint.opts = *opts;
    }

    return endpoint;
}

Result<EndpointConfig> ConfigLoader::loadEndpoint(const fs::path& path) {
    const std::string origin = path.filename().string();

    auto data = m_impl->readFileSecurely(path);
    if (data.isFailure()) {
        m_impl->logger.error("Cannot read endpoint file " + path.string() + ": " +
                             std::string(getErrorMessage(data.error())));
        return data.error();
    }

    auto document = m_impl->parseDocument(data.value(), origin);
    if (document.isFailure()) {
        return document.error();
    }

    auto endpoint = parseEndpoint(document.value(), origin);
    if (endpoint.isSuccess()) {
        endpoint.value().sourceFile = path;
    }
    return endpoint;
}

Result<std::vector<EndpointConfig>> ConfigLoader::loadEndpoints(const fs::path& directory) {
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        m_impl->logger.warn("Endpoints directory " + directory.string() + " does not exist");
        return std::vector<EndpointConfig>{};
    }

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(directory, ec)) {
        if (entry.path().extension() == ".json") {
            files.push_back(entry.path());
        }
    }
    if (ec) {
        return ErrorCode::IOError;
    }
    std::sort(files.begin(), files.end());

    std::vector<EndpointConfig> endpoints;
    for (const auto& file : files) {
        auto endpoint = loadEndpoint(file);
        if (endpoint.isFailure()) {
            return endpoint.error();
        }
        endpoints.push_back(std::move(endpoint.value()));
    }
    return endpoints;
}

VoidResult ConfigLoader::validateAuthSchemes(const std::vector<EndpointConfig>& endpoints,
                                             const Plugins::PluginRegistry& registry,
                                             Core::Logger& logger) {
    for (const auto& endpoint : endpoints) {
        if (!endpoint.auth || endpoint.auth->scheme != Auth::AuthScheme::Custom) {
            continue;
        }
        if (!registry.hasAuthPlugin(endpoint.auth->schemeName)) {
            logger.critical("Endpoint " + endpoint.path + " uses unknown auth scheme '" +
                            endpoint.auth->schemeName + "'");
            return ErrorCode::UnknownAuthScheme;
        }
    }
    return VoidResult::Success();
}

} // namespace Hookwarden::Config
