/**
 * @file main.cpp
 * @brief hookwarden-preflight entry point
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 *
 * Boots configuration and plugin directories the way a server does, prints
 * the resulting registry as JSON and exits non-zero on any boot defect.
 * With --verify it also replays a captured request against an endpoint.
 *
 * Exit codes: 0 ok, 1 boot defect, 2 request rejected, 64 usage error.
 */

#include <Hookwarden/Auth/AuthConfig.hpp>
#include <Hookwarden/Core/Config.hpp>
#include <Hookwarden/Core/Logger.hpp>
#include <Hookwarden/Plugins/PluginLoader.hpp>
#include <Hookwarden/Plugins/PluginRegistry.hpp>
#include <Hookwarden/Server/RequestGuard.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

using namespace Hookwarden;
namespace fs = std::filesystem;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitBootFailure = 1;
constexpr int kExitRejected = 2;
constexpr int kExitUsage = 64;

struct Options {
    std::optional<fs::path> configFile;
    std::optional<std::string> logLevel;
    std::optional<std::string> verifyPath;
    std::optional<fs::path> payloadFile;
    std::vector<std::string> headers;
    std::string requestId = "preflight";
};

void printUsage(const char* program) {
    std::cerr
        << "Usage: " << program << " [options]\n"
        << "  --config FILE         Global JSON configuration\n"
        << "  --log-level LEVEL     trace, debug, info, warn, error\n"
        << "  --verify PATH         Replay a request against the endpoint at PATH\n"
        << "  --payload FILE        Raw request body for --verify\n"
        << "  --header 'Name: v'    Request header for --verify (repeatable)\n"
        << "  --request-id ID       Request id echoed in error bodies\n";
}

std::optional<Options> parseArguments(int argc, char* argv[]) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << arg << " requires a value\n";
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        std::optional<std::string> value;
        if (arg == "--help" || arg == "-h") {
            return std::nullopt;
        } else if (arg == "--config") {
            if (!(value = next())) return std::nullopt;
            options.configFile = fs::path(*value);
        } else if (arg == "--log-level") {
            if (!(value = next())) return std::nullopt;
            options.logLevel = *value;
        } else if (arg == "--verify") {
            if (!(value = next())) return std::nullopt;
            options.verifyPath = *value;
        } else if (arg == "--payload") {
            if (!(value = next())) return std::nullopt;
            options.payloadFile = fs::path(*value);
        } else if (arg == "--header") {
            if (!(value = next())) return std::nullopt;
            options.headers.push_back(*value);
        } else if (arg == "--request-id") {
            if (!(value = next())) return std::nullopt;
            options.requestId = *value;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return std::nullopt;
        }
    }

    if (options.verifyPath && !options.payloadFile) {
        std::cerr << "--verify requires --payload\n";
        return std::nullopt;
    }
    return options;
}

std::string describeError(ErrorCode code) {
    return "[" + std::string(getCategoryName(getErrorCategory(code))) + "] " +
           std::string(getErrorMessage(code));
}

nlohmann::json describeAuth(const std::optional<Auth::AuthConfig>& auth) {
    if (!auth) {
        return "none";
    }
    nlohmann::json out = {{"scheme", auth->schemeName}, {"header", std::string(auth->headerName())}};
    if (auth->scheme == Auth::AuthScheme::Hmac) {
        out["algorithm"] = auth->algorithm;
        out["format"] = std::string(Auth::signatureFormatName(auth->signatureFormat));
        out["header_format"] = std::string(Auth::headerFormatName(auth->headerFormat));
    }
    return out;
}

nlohmann::json describeRegistry(const Plugins::PluginRegistry& registry) {
    nlohmann::json out = nlohmann::json::object();
    for (auto capability : {Plugins::Capability::Auth, Plugins::Capability::Handler,
                            Plugins::Capability::Lifecycle, Plugins::Capability::StatsInstrument,
                            Plugins::Capability::FailbotInstrument}) {
        nlohmann::json entries = nlohmann::json::array();
        for (const auto* descriptor : registry.descriptors(capability)) {
            entries.push_back({
                {"name", descriptor->logicalName},
                {"type", descriptor->typeName},
                {"built_in", descriptor->builtIn},
                {"source", descriptor->sourcePath.string()}
            });
        }
        out[std::string(Plugins::capabilityName(capability))] = std::move(entries);
    }
    return out;
}

std::optional<ByteBuffer> readPayload(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    return ByteBuffer(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

int verifyRequest(const Options& options,
                  const Plugins::PluginRegistry& registry,
                  const Config::GlobalConfig& global,
                  const std::vector<Config::EndpointConfig>& endpoints,
                  Core::Logger& logger) {
    const Config::EndpointConfig* endpoint = nullptr;
    for (const auto& candidate : endpoints) {
        if (candidate.path == *options.verifyPath) {
            endpoint = &candidate;
            break;
        }
    }
    if (endpoint == nullptr) {
        logger.error("No endpoint configured for path " + *options.verifyPath);
        return kExitUsage;
    }

    auto payload = readPayload(*options.payloadFile);
    if (!payload) {
        logger.error("Cannot read payload file " + options.payloadFile->string());
        return kExitUsage;
    }

    Core::HeaderMap headers;
    for (const auto& line : options.headers) {
        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            logger.error("Malformed header (expected 'Name: value'): " + line);
            return kExitUsage;
        }
        // Values are passed through untrimmed after the single separating space
        std::string value = line.substr(colon + 1);
        if (!value.empty() && value.front() == ' ') {
            value.erase(0, 1);
        }
        headers[line.substr(0, colon)] = value;
    }

    Server::RequestGuard guard(registry, global, logger);
    const auto response = guard.handle(*endpoint, *payload, headers, options.requestId);

    std::cout << nlohmann::json{{"status", response.status}, {"body", response.body}}.dump(2) << std::endl;
    return response.status == 200 ? kExitOk : kExitRejected;
}

int run(const Options& options) {
    Core::Logger& logger = Core::Logger::Instance();
    if (!logger.Initialize(Core::LogLevel::Info, Core::LogOutput::Console)) {
        std::cerr << "Failed to initialise logging\n";
        return kExitBootFailure;
    }

    Config::ConfigLoader loader(logger);
    auto global = loader.load(options.configFile);
    if (global.isFailure()) {
        logger.critical("Configuration rejected: " + describeError(global.error()));
        return kExitBootFailure;
    }
    const Config::GlobalConfig& config = global.value();

    Core::LogLevel level = Core::LogLevel::Info;
    const std::string levelName = options.logLevel.value_or(config.logLevel);
    if (!Core::parseLogLevel(levelName, level)) {
        logger.critical("Unknown log level '" + levelName + "'");
        return kExitUsage;
    }
    logger.SetMinLevel(level);

    Plugins::PluginRegistry registry;
    Plugins::PluginLoader pluginLoader(registry, logger);
    auto loaded = pluginLoader.loadAll(config.pluginDirectories());
    if (loaded.isFailure()) {
        logger.critical("Plugin loading failed: " + describeError(loaded.error()));
        return kExitBootFailure;
    }

    auto endpoints = loader.loadEndpoints(config.endpointsDir);
    if (endpoints.isFailure()) {
        logger.critical("Endpoint configuration rejected: " +
                        describeError(endpoints.error()));
        return kExitBootFailure;
    }

    auto schemes = Config::ConfigLoader::validateAuthSchemes(endpoints.value(), registry, logger);
    if (schemes.isFailure()) {
        return kExitBootFailure;
    }

    for (const auto& endpoint : endpoints.value()) {
        if (!registry.hasHandler(endpoint.handler)) {
            logger.critical("Endpoint " + endpoint.path + " names unknown handler '" +
                            endpoint.handler + "'");
            return kExitBootFailure;
        }
    }

    nlohmann::json report = {
        {"environment", config.environment},
        {"root_path", config.rootPath},
        {"endpoints", nlohmann::json::array()},
        {"plugins", describeRegistry(registry)}
    };
    for (const auto& endpoint : endpoints.value()) {
        report["endpoints"].push_back({
            {"path", config.rootPath + endpoint.path},
            {"handler", endpoint.handler},
            {"auth", describeAuth(endpoint.auth)}
        });
    }

    if (options.verifyPath) {
        return verifyRequest(options, registry, config, endpoints.value(), logger);
    }

    std::cout << report.dump(2) << std::endl;
    return kExitOk;
}

} // namespace

int main(int argc, char* argv[]) {
    auto options = parseArguments(argc, argv);
    if (!options) {
        printUsage(argv[0]);
        return kExitUsage;
    }

    try {
        const int code = run(*options);
        Core::Logger::Instance().Shutdown();
        return code;
    } catch (const std::exception& e) {
        std::cerr << "hookwarden-preflight: " << e.what() << std::endl;
        return kExitBootFailure;
    }
}
