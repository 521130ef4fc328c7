/**
 * @file test_request_guard.cpp
 * @brief Tests for request admission and handler dispatch
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 *
 * Runs against the fixture plugin directories. The custom stats and
 * failbot fixtures keep a journal of calls, read back through their
 * exported journal functions.
 */

#include <Hookwarden/Server/RequestGuard.hpp>
#include <Hookwarden/Core/Config.hpp>
#include <Hookwarden/Core/Crypto.hpp>
#include <Hookwarden/Plugins/DynamicLibrary.hpp>
#include <Hookwarden/Plugins/PluginLoader.hpp>
#include <Hookwarden/Plugins/PluginRegistry.hpp>
#include "TestHarness.hpp"
#include <gtest/gtest.h>

using namespace Hookwarden;
using namespace Hookwarden::Server;
using namespace Hookwarden::Testing;

namespace fs = std::filesystem;

namespace {

constexpr const char* kSecretEnv = "HOOKWARDEN_TEST_GUARD_SECRET";
constexpr std::string_view kSecret = "guard-secret";

using JournalFn = const char* (*)();
using ClearFn = void (*)();

/**
 * Journal exported by an instrument fixture
 *
 * Opening the module again yields the handle the loader already holds,
 * so the journal is the one the registered instrument writes to.
 */
class Journal {
public:
    Journal(const std::string& stem) {
        const auto path = fs::canonical(fixturePluginDir("instruments") / fixtureModule(stem));
        auto library = Plugins::DynamicLibrary::open(path);
        if (library.isSuccess()) {
            m_library = library.value();
            m_read = reinterpret_cast<JournalFn>(m_library->symbol((stem + "_journal").c_str()));
            m_clear = reinterpret_cast<ClearFn>(m_library->symbol((stem + "_clear").c_str()));
        }
    }

    bool ready() const { return m_read != nullptr && m_clear != nullptr; }
    std::string text() const { return m_read ? m_read() : ""; }
    bool contains(std::string_view line) const {
        return text().find(std::string(line) + "\n") != std::string::npos;
    }
    void clear() const {
        if (m_clear) m_clear();
    }

private:
    std::shared_ptr<Plugins::DynamicLibrary> m_library;
    JournalFn m_read = nullptr;
    ClearFn m_clear = nullptr;
};

std::string githubSignature(std::string_view body) {
    Crypto::HMAC hmac(asBytes(kSecret));
    return "sha256=" + Crypto::toHex(hmac.compute(asBytes(body)).value());
}

} // namespace

class RequestGuardTest : public ::testing::Test {
protected:
    RequestGuardTest()
        : secret_(kSecretEnv, std::string(kSecret))
        , guard_(registry_, global_, log_) {}

    void SetUp() override {
        Plugins::PluginDirectories dirs;
        dirs.handlers = fixturePluginDir("handlers");
        dirs.auth = fixturePluginDir("auth");
        dirs.lifecycle = fixturePluginDir("lifecycle");
        dirs.instruments = fixturePluginDir("instruments");

        Plugins::PluginLoader loader(registry_, log_);
        ASSERT_TRUE(loader.loadAll(dirs).isSuccess());

        stats_ = std::make_unique<Journal>("custom_stats");
        failbot_ = std::make_unique<Journal>("custom_failbot");
        ASSERT_TRUE(stats_->ready());
        ASSERT_TRUE(failbot_->ready());
        stats_->clear();
        failbot_->clear();
        log_.clear();
    }

    Config::EndpointConfig endpoint(std::string path, std::string handler) {
        Config::EndpointConfig config;
        config.path = std::move(path);
        config.handler = std::move(handler);
        return config;
    }

    Config::EndpointConfig githubEndpoint() {
        auto config = endpoint("/github", "GitHubHandler");
        Auth::AuthConfig auth;
        auth.secretEnvKey = kSecretEnv;
        auth.header = "X-Hub-Signature-256";
        config.auth = auth;
        return config;
    }

    Plugins::HandlerResponse handle(const Config::EndpointConfig& config, std::string_view body,
                                    const Core::HeaderMap& headers = {}) {
        return guard_.handle(config, asBytes(body), headers, "req-1");
    }

    ScopedEnv secret_;
    CapturingLogger log_;
    Plugins::PluginRegistry registry_;
    Config::GlobalConfig global_;
    RequestGuard guard_;
    std::unique_ptr<Journal> stats_;
    std::unique_ptr<Journal> failbot_;
};

// ============================================================================
// Accepted requests
// ============================================================================

TEST_F(RequestGuardTest, UnauthenticatedEndpointReachesHandler) {
    auto response = handle(endpoint("/plain", "DefaultHandler"), R"({"hello":"world"})");

    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.body["message"], "webhook processed successfully");
    EXPECT_TRUE(stats_->contains("increment hookwarden.request.accepted"));
    EXPECT_TRUE(stats_->contains("timing hookwarden.request.duration"));
    EXPECT_TRUE(log_.contains(Core::LogLevel::Info, "Request req-1 processed by DefaultHandler"));
}

TEST_F(RequestGuardTest, SignedGitHubDelivery) {
    const std::string body = R"({"action":"opened"})";
    Core::HeaderMap headers{{"X-Hub-Signature-256", githubSignature(body)},
                            {"X-GitHub-Event", "pull_request"}};

    auto response = handle(githubEndpoint(), body, headers);
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.body["status"], "success");
    EXPECT_EQ(response.body["event"], "pull_request");
}

TEST_F(RequestGuardTest, OptionsReachHandler) {
    auto config = endpoint("/team1", "Team1Handler");
    config.opts = {{"env", "staging"}};

    auto response = handle(config, R"({"event_type":"custom"})");
    EXPECT_EQ(response.body["status"], "generic_processed");
    EXPECT_EQ(response.body["environment"], "staging");
}

TEST_F(RequestGuardTest, NonJsonBodyReachesHandlerAsString) {
    auto response = handle(endpoint("/team1", "team1_handler"), "plain=text&not=json");
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.body["status"], "processed");
}

TEST_F(RequestGuardTest, LifecycleHooksSeeTheRequest) {
    guard_.handle(endpoint("/plain", "DefaultHandler"), asBytes("{}"), {}, "req-7", "PUT");

    EXPECT_TRUE(log_.contains(Core::LogLevel::Info, "on_request called with method: PUT"));
    EXPECT_TRUE(log_.contains(Core::LogLevel::Info, "on_response req-7 status 200"));
}

TEST_F(RequestGuardTest, CheckReturnsHandlerWithoutCallingIt) {
    Core::HeaderMap headers;
    auto verdict = guard_.check(endpoint("/plain", "GitHubHandler"), asBytes("{}"), headers, "req-1");

    ASSERT_TRUE(verdict.accepted());
    EXPECT_EQ(verdict.status, 200);
    ASSERT_NE(verdict.handler, nullptr);
    EXPECT_FALSE(log_.contains("Processing GitHub webhook"));
}

// ============================================================================
// Rejections
// ============================================================================

TEST_F(RequestGuardTest, IpDeniedBeforeAuthentication) {
    auto config = githubEndpoint();
    config.ipFiltering = Network::IpPolicy::fromStrings("X-Forwarded-For", {"10.0.0.0/8"}, {}, log_);

    Core::HeaderMap headers{{"X-Forwarded-For", "203.0.113.1"}};
    auto response = handle(config, "{}", headers);

    EXPECT_EQ(response.status, 403);
    EXPECT_EQ(response.body["error"], "ip_filtering_failed");
    EXPECT_EQ(response.body["request_id"], "req-1");
    EXPECT_TRUE(stats_->contains("increment hookwarden.request.ip_denied"));
    EXPECT_FALSE(log_.contains("Auth::HMAC"));
}

TEST_F(RequestGuardTest, GlobalIpPolicyApplies) {
    global_.ipFiltering = Network::IpPolicy::fromStrings("", {}, {"203.0.113.0/24"}, log_);

    Core::HeaderMap headers{{"X-Forwarded-For", "203.0.113.1"}};
    EXPECT_EQ(handle(endpoint("/plain", "DefaultHandler"), "{}", headers).status, 403);

    Core::HeaderMap other{{"X-Forwarded-For", "198.51.100.1"}};
    EXPECT_EQ(handle(endpoint("/plain", "DefaultHandler"), "{}", other).status, 200);
}

TEST_F(RequestGuardTest, BadSignatureIsUnauthorized) {
    Core::HeaderMap headers{{"X-Hub-Signature-256", githubSignature("something else")}};
    auto response = handle(githubEndpoint(), R"({"action":"opened"})", headers);

    EXPECT_EQ(response.status, 401);
    EXPECT_EQ(response.body, RequestGuard::errorBody("authentication failed", 401, "req-1"));
    EXPECT_TRUE(stats_->contains("increment hookwarden.request.auth_failed"));
    EXPECT_TRUE(log_.contains(Core::LogLevel::Info, "on_error req-1: authentication failed"));
}

TEST_F(RequestGuardTest, SharedSecretScheme) {
    auto config = endpoint("/slack", "DefaultHandler");
    Auth::AuthConfig auth;
    auth.scheme = Auth::AuthScheme::SharedSecret;
    auth.schemeName = "shared_secret";
    auth.secretEnvKey = kSecretEnv;
    config.auth = auth;

    EXPECT_EQ(handle(config, "{}", {{"Authorization", std::string(kSecret)}}).status, 200);
    EXPECT_EQ(handle(config, "{}", {{"Authorization", "wrong"}}).status, 401);
}

TEST_F(RequestGuardTest, CustomAuthScheme) {
    auto config = endpoint("/example", "DefaultHandler");
    Auth::AuthConfig auth;
    auth.scheme = Auth::AuthScheme::Custom;
    auth.schemeName = "example";
    auth.secretEnvKey = kSecretEnv;
    config.auth = auth;

    EXPECT_EQ(handle(config, "{}", {{"Authorization", "Bearer " + std::string(kSecret)}}).status, 200);
    EXPECT_EQ(handle(config, "{}", {{"Authorization", "Bearer nope"}}).status, 401);
}

TEST_F(RequestGuardTest, UnknownAuthSchemeIsServerError) {
    auto config = endpoint("/okta", "DefaultHandler");
    Auth::AuthConfig auth;
    auth.scheme = Auth::AuthScheme::Custom;
    auth.schemeName = "okta";
    config.auth = auth;

    auto response = handle(config, "{}");
    EXPECT_EQ(response.status, 500);
    EXPECT_EQ(response.body["error"], "authentication configuration missing or invalid");
    EXPECT_EQ(response.body["code"], 500);
    EXPECT_TRUE(failbot_->contains("critical auth scheme not loaded"));
    EXPECT_TRUE(stats_->contains("increment hookwarden.request.auth_misconfigured"));
}

TEST_F(RequestGuardTest, UnknownHandlerIsServerError) {
    auto response = handle(endpoint("/ghost", "GhostHandler"), "{}");

    EXPECT_EQ(response.status, 500);
    EXPECT_EQ(response.body["error"], "handler not found");
    EXPECT_TRUE(failbot_->contains("report handler not loaded"));
    EXPECT_TRUE(stats_->contains("increment hookwarden.request.handler_missing"));
    EXPECT_TRUE(log_.contains(Core::LogLevel::Error, "GhostHandler"));
}

// ============================================================================
// Handler failures
// ============================================================================

TEST_F(RequestGuardTest, HandlerErrorResponsePassesThrough) {
    auto response = handle(endpoint("/boom", "BoomtownWithError"), R"({"boom":true})");

    EXPECT_EQ(response.status, 500);
    EXPECT_EQ(response.body["error"], "boomtown_with_error");
    EXPECT_TRUE(log_.contains(Core::LogLevel::Info, "on_response req-1 status 500"));
    EXPECT_TRUE(failbot_->text().empty());
}

TEST_F(RequestGuardTest, HandlerExceptionBecomesServerError) {
    auto response = handle(endpoint("/boom", "boomtown_with_error"), R"({"boom_throw":true})");

    EXPECT_EQ(response.status, 500);
    EXPECT_EQ(response.body["code"], 500);
    EXPECT_EQ(response.body["request_id"], "req-1");
    EXPECT_NE(response.body["error"].get<std::string>().find("boomtown_with_error"), std::string::npos);
    EXPECT_TRUE(failbot_->contains("report boomtown_with_error: the payload triggered an exception"));
    EXPECT_TRUE(log_.contains(Core::LogLevel::Info, "on_error req-1: boomtown_with_error"));
    // The duration is still reported when the handler throws
    EXPECT_TRUE(stats_->contains("timing hookwarden.request.duration"));
}

// ============================================================================
// Helpers
// ============================================================================

TEST(RequestGuardHelpers, OutcomeNames) {
    EXPECT_EQ(guardOutcomeName(GuardOutcome::Accepted), "accepted");
    EXPECT_EQ(guardOutcomeName(GuardOutcome::IpDenied), "ip_denied");
    EXPECT_EQ(guardOutcomeName(GuardOutcome::AuthFailed), "auth_failed");
    EXPECT_EQ(guardOutcomeName(GuardOutcome::AuthMisconfigured), "auth_misconfigured");
    EXPECT_EQ(guardOutcomeName(GuardOutcome::HandlerMissing), "handler_missing");
}

TEST(RequestGuardHelpers, ErrorBodyShape) {
    const auto body = RequestGuard::errorBody("boom", 500, "abc");
    EXPECT_EQ(body, (nlohmann::json{{"error", "boom"}, {"code", 500}, {"request_id", "abc"}}));
}

TEST(RequestGuardHelpers, AuthenticatorForBuiltIns) {
    Plugins::PluginRegistry registry;
    Config::GlobalConfig global;
    CapturingLogger log;
    RequestGuard guard(registry, global, log);

    Auth::AuthConfig hmac;
    EXPECT_EQ(guard.authenticatorFor(hmac), registry.authPlugin("hmac"));

    Auth::AuthConfig shared;
    shared.scheme = Auth::AuthScheme::SharedSecret;
    EXPECT_EQ(guard.authenticatorFor(shared), registry.authPlugin("shared_secret"));

    Auth::AuthConfig custom;
    custom.scheme = Auth::AuthScheme::Custom;
    custom.schemeName = "missing";
    EXPECT_EQ(guard.authenticatorFor(custom), nullptr);
}
