#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/client_errors.hpp"
#include "registry/server_registry.hpp"
#include "support/scripted_transport.hpp"

namespace {

using mcplink::core::config::ClientSettings;
using mcplink::core::config::ServerConfigMap;
using mcplink::core::errors::ClientError;
using mcplink::core::errors::ErrorKind;
using mcplink::core::errors::get_error;
using mcplink::core::errors::get_value;
using mcplink::core::errors::is_error;
using mcplink::core::errors::Result;
using mcplink::protocol::Progress;
using mcplink::protocol::ServerLaunchSpec;
using mcplink::registry::ServerRegistry;
using mcplink::registry::SessionFactoryBuilder;
using mcplink::session::ConnectionState;
using mcplink::session::ProtocolSession;
using mcplink::session::SessionConfigurator;
using mcplink::session::SessionPtr;
using mcplink::testing::answer_initialize;
using mcplink::testing::full_capabilities;
using mcplink::testing::result_for;
using mcplink::testing::ScriptedTransport;
using nlohmann::json;

using namespace std::chrono_literals;

ClientSettings test_settings() {
    ClientSettings settings;
    settings.request_timeout = 2s;
    return settings;
}

ServerConfigMap servers(const std::vector<std::string>& commands) {
    ServerConfigMap configs;
    for (const auto& command : commands) {
        ServerLaunchSpec spec;
        spec.command = command;
        configs.emplace(command, spec);
    }
    return configs;
}

// Peer behaviour shared by every scripted server: `work` reports progress
// before answering, `bad-progress` reports an invalid value, anything else
// is echoed.
void scripted_peer(ScriptedTransport& peer, const json& message) {
    if (!message.contains("id") || !message.contains("method")) {
        return;
    }
    const std::string method = message.at("method").get<std::string>();
    if (method == "work") {
        peer.push_json(json{{"jsonrpc", "2.0"},
                            {"method", "$/progress"},
                            {"params", {{"operation_id", "op-1"}, {"progress", 0.5},
                                        {"message", "half"}}}});
    } else if (method == "bad-progress") {
        peer.push_json(json{{"jsonrpc", "2.0"},
                            {"method", "$/progress"},
                            {"params", {{"operation_id", "op-1"}, {"progress", 2.0}}}});
    }
    peer.push_json(result_for(message, message.value("params", json::object())));
}

// Launches in-memory servers; a spec whose command is "broken" never starts.
struct ScriptedLaunches {
    std::shared_ptr<std::mutex> mutex = std::make_shared<std::mutex>();
    std::shared_ptr<std::vector<ScriptedTransport*>> peers =
        std::make_shared<std::vector<ScriptedTransport*>>();
    std::shared_ptr<std::atomic_int> launches = std::make_shared<std::atomic_int>(0);

    SessionFactoryBuilder builder() const {
        auto peers_ref = peers;
        auto mutex_ref = mutex;
        auto launches_ref = launches;
        return [peers_ref, mutex_ref, launches_ref](SessionConfigurator configure) {
            return [peers_ref, mutex_ref, launches_ref, configure](
                       const std::string& name,
                       const ServerLaunchSpec& spec) -> Result<SessionPtr> {
                launches_ref->fetch_add(1);
                if (spec.command == "broken") {
                    return ClientError{ErrorKind::Launch, "cannot start", "launch_failed"};
                }
                auto owned = std::make_unique<ScriptedTransport>(
                    answer_initialize(full_capabilities(), scripted_peer));
                {
                    std::lock_guard<std::mutex> lock(*mutex_ref);
                    peers_ref->push_back(owned.get());
                }
                auto session =
                    std::make_shared<ProtocolSession>(name, std::move(owned), test_settings());
                if (configure) {
                    configure(*session);
                }
                session->start();
                auto initialized = session->initialize();
                if (is_error(initialized)) {
                    session->close();
                    return get_error(initialized);
                }
                return session;
            };
        };
    }

    ScriptedTransport* last_peer() const {
        std::lock_guard<std::mutex> lock(*mutex);
        return peers->empty() ? nullptr : peers->back();
    }
};

mcplink::session::Sleeper no_sleep() {
    return [](std::chrono::milliseconds) {};
}

TEST(ServerRegistryTest, ExecuteConnectsLazily) {
    ScriptedLaunches launches;
    ServerRegistry registry(servers({"alpha"}), test_settings(), launches.builder(), no_sleep());
    EXPECT_EQ(registry.state("alpha"), ConnectionState::Unconnected);

    auto result = registry.execute("alpha", "echo", json{{"x", 1}});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), (json{{"x", 1}}));
    EXPECT_EQ(registry.state("alpha"), ConnectionState::Ready);
    EXPECT_TRUE(registry.health().is_tracking("alpha"));
    EXPECT_TRUE(registry.health().is_monitoring());

    auto second = registry.execute("alpha", "echo", json{{"x", 2}});
    ASSERT_FALSE(is_error(second));
    EXPECT_EQ(launches.launches->load(), 1);
}

TEST(ServerRegistryTest, RejectsUnknownAndEmptyServerNames) {
    ScriptedLaunches launches;
    ServerRegistry registry(servers({"alpha"}), test_settings(), launches.builder(), no_sleep());

    auto unknown = registry.execute("beta", "echo");
    ASSERT_TRUE(is_error(unknown));
    EXPECT_EQ(get_error(unknown).kind, ErrorKind::Input);
    EXPECT_EQ(get_error(unknown).code, "unknown_server");

    auto empty = registry.connect("  ");
    ASSERT_TRUE(is_error(empty));
    EXPECT_EQ(get_error(empty).code, "invalid_server_name");
    EXPECT_EQ(launches.launches->load(), 0);
}

TEST(ServerRegistryTest, ConnectTwiceIsDuplicate) {
    ScriptedLaunches launches;
    ServerRegistry registry(servers({"alpha"}), test_settings(), launches.builder(), no_sleep());

    ASSERT_FALSE(is_error(registry.connect("alpha")));
    auto again = registry.connect("alpha");
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).code, "duplicate_connection");
    EXPECT_EQ(registry.state("alpha"), ConnectionState::Ready);
    EXPECT_TRUE(registry.health().is_tracking("alpha"));
}

TEST(ServerRegistryTest, ConnectAllReportsEveryServer) {
    ScriptedLaunches launches;
    ServerRegistry registry(servers({"alpha", "broken", "gamma"}), test_settings(),
                            launches.builder(), no_sleep());

    const auto outcomes = registry.connect_all();
    ASSERT_EQ(outcomes.size(), 3u);
    EXPECT_EQ(outcomes[0].server, "alpha");
    EXPECT_TRUE(outcomes[0].ok());
    EXPECT_EQ(outcomes[1].server, "broken");
    ASSERT_FALSE(outcomes[1].ok());
    EXPECT_EQ(outcomes[1].error->code, "connection_failed");
    EXPECT_EQ(outcomes[2].server, "gamma");
    EXPECT_TRUE(outcomes[2].ok());

    EXPECT_EQ(registry.connected_servers(), (std::vector<std::string>{"alpha", "gamma"}));
    EXPECT_EQ(registry.state("broken"), ConnectionState::Failed);
    EXPECT_FALSE(registry.health().is_tracking("broken"));
    // alpha, gamma once each, broken three times
    EXPECT_EQ(launches.launches->load(), 5);
}

TEST(ServerRegistryTest, ForwardsProgressNotifications) {
    ScriptedLaunches launches;
    std::mutex progress_mutex;
    std::vector<std::pair<std::string, Progress>> seen;
    ServerRegistry registry(
        servers({"alpha"}), test_settings(), launches.builder(), no_sleep(),
        [&](const std::string& server, const Progress& progress) {
            std::lock_guard<std::mutex> lock(progress_mutex);
            seen.emplace_back(server, progress);
        });

    ASSERT_FALSE(is_error(registry.execute("alpha", "bad-progress")));
    ASSERT_FALSE(is_error(registry.execute("alpha", "work")));

    std::lock_guard<std::mutex> lock(progress_mutex);
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].first, "alpha");
    EXPECT_EQ(seen[0].second.operation_id, "op-1");
    EXPECT_DOUBLE_EQ(seen[0].second.progress, 0.5);
    EXPECT_EQ(seen[0].second.message.value_or(""), "half");
}

TEST(ServerRegistryTest, CancelRequiresConnection) {
    ScriptedLaunches launches;
    ServerRegistry registry(servers({"alpha"}), test_settings(), launches.builder(), no_sleep());

    auto cancelled = registry.cancel("alpha", 1);
    ASSERT_TRUE(is_error(cancelled));
    EXPECT_EQ(get_error(cancelled).code, "not_connected");

    ASSERT_FALSE(is_error(registry.connect("alpha")));
    EXPECT_FALSE(is_error(registry.cancel("alpha", 1)));
    ASSERT_NE(launches.last_peer(), nullptr);
    EXPECT_EQ(launches.last_peer()->written_with_method("$/cancel").size(), 1u);
}

TEST(ServerRegistryTest, ReconnectReplacesSession) {
    ScriptedLaunches launches;
    ServerRegistry registry(servers({"alpha"}), test_settings(), launches.builder(), no_sleep());

    auto first = registry.connect("alpha");
    ASSERT_FALSE(is_error(first));
    const SessionPtr old_session = get_value(first);

    EXPECT_TRUE(registry.reconnect("alpha"));
    const SessionPtr new_session = registry.session("alpha");
    ASSERT_NE(new_session, nullptr);
    EXPECT_NE(new_session, old_session);
    EXPECT_FALSE(old_session->is_open());
    EXPECT_TRUE(new_session->is_open());
    EXPECT_FALSE(registry.reconnect("unknown"));
}

TEST(ServerRegistryTest, LostConnectionIsRecoveredByMonitor) {
    ScriptedLaunches launches;
    ServerRegistry registry(servers({"alpha"}), test_settings(), launches.builder(), no_sleep());

    auto first = registry.connect("alpha");
    ASSERT_FALSE(is_error(first));
    const SessionPtr old_session = get_value(first);
    ScriptedTransport* peer = launches.last_peer();
    ASSERT_NE(peer, nullptr);

    peer->finish();

    SessionPtr replacement;
    const auto deadline = std::chrono::steady_clock::now() + 3s;
    while (std::chrono::steady_clock::now() < deadline) {
        replacement = registry.session("alpha");
        if (replacement && replacement != old_session && replacement->is_open()) {
            break;
        }
        std::this_thread::sleep_for(10ms);
    }
    ASSERT_NE(replacement, nullptr);
    EXPECT_NE(replacement, old_session);
    EXPECT_EQ(launches.launches->load(), 2);

    auto result = registry.execute("alpha", "echo", json{{"after", "reconnect"}});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).at("after"), "reconnect");
}

TEST(ServerRegistryTest, CleanupForgetsServer) {
    ScriptedLaunches launches;
    ServerRegistry registry(servers({"alpha"}), test_settings(), launches.builder(), no_sleep());

    auto connected = registry.connect("alpha");
    ASSERT_FALSE(is_error(connected));
    registry.cleanup("alpha");
    registry.cleanup("alpha");
    registry.cleanup("never-configured");

    EXPECT_EQ(registry.state("alpha"), ConnectionState::Unconnected);
    EXPECT_FALSE(registry.health().is_tracking("alpha"));
    EXPECT_FALSE(get_value(connected)->is_open());
}

TEST(ServerRegistryTest, CloseIsIdempotentAndRejectsFurtherWork) {
    ScriptedLaunches launches;
    ServerRegistry registry(servers({"alpha", "beta"}), test_settings(), launches.builder(),
                            no_sleep());

    auto connected = registry.connect("alpha");
    ASSERT_FALSE(is_error(connected));
    registry.close();
    registry.close();

    EXPECT_FALSE(get_value(connected)->is_open());
    EXPECT_FALSE(registry.health().is_monitoring());
    EXPECT_TRUE(registry.connected_servers().empty());

    auto result = registry.execute("alpha", "echo");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "registry_closed");
    auto cancelled = registry.cancel("alpha", 1);
    ASSERT_TRUE(is_error(cancelled));
    EXPECT_EQ(get_error(cancelled).code, "registry_closed");
    EXPECT_FALSE(registry.reconnect("alpha"));
}

TEST(ServerRegistryTest, ListsConfiguredServersInOrder) {
    ScriptedLaunches launches;
    ServerRegistry registry(servers({"zeta", "alpha", "mid"}), test_settings(),
                            launches.builder(), no_sleep());
    EXPECT_EQ(registry.list_servers(), (std::vector<std::string>{"alpha", "mid", "zeta"}));
}

}  // namespace
