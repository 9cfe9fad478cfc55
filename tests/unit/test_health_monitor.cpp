#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "health/health_monitor.hpp"

namespace {

using mcplink::health::HealthMonitor;

using namespace std::chrono_literals;

// Manually advanced time source.
class FakeClock {
public:
    HealthMonitor::Clock source() {
        auto now = now_;
        return [now] { return *now; };
    }

    void advance(std::chrono::milliseconds delta) { *now_ += delta; }

private:
    std::shared_ptr<std::chrono::steady_clock::time_point> now_ =
        std::make_shared<std::chrono::steady_clock::time_point>(std::chrono::steady_clock::now());
};

struct CallbackLog {
    std::mutex mutex;
    std::vector<std::string> reconnects;
    std::vector<std::string> cleanups;
    bool reconnect_result = true;

    HealthMonitor::ReconnectCallback reconnect() {
        return [this](const std::string& name) {
            std::lock_guard<std::mutex> lock(mutex);
            reconnects.push_back(name);
            return reconnect_result;
        };
    }

    HealthMonitor::CleanupCallback cleanup() {
        return [this](const std::string& name) {
            std::lock_guard<std::mutex> lock(mutex);
            cleanups.push_back(name);
        };
    }

    std::size_t reconnect_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return reconnects.size();
    }
};

TEST(HealthMonitorTest, ReconnectsOnceAfterMaxMissedTicks) {
    FakeClock clock;
    CallbackLog log;
    HealthMonitor monitor(30s, 2, log.reconnect(), log.cleanup(), clock.source());
    monitor.register_server("s2");

    clock.advance(30s);
    monitor.check_now();
    EXPECT_EQ(log.reconnect_count(), 0u);
    EXPECT_EQ(monitor.miss_count("s2").value_or(-1), 1);

    clock.advance(30s);
    monitor.check_now();
    ASSERT_EQ(log.reconnect_count(), 1u);
    EXPECT_EQ(log.reconnects[0], "s2");

    // The successful reconnect resets the record.
    monitor.check_now();
    clock.advance(29s);
    monitor.check_now();
    EXPECT_EQ(log.reconnect_count(), 1u);
    EXPECT_TRUE(monitor.is_tracking("s2"));
    EXPECT_EQ(monitor.miss_count("s2").value_or(-1), 0);
    EXPECT_TRUE(log.cleanups.empty());
}

TEST(HealthMonitorTest, HeartbeatResetsMissCounter) {
    FakeClock clock;
    CallbackLog log;
    HealthMonitor monitor(30s, 2, log.reconnect(), log.cleanup(), clock.source());
    monitor.register_server("s1");

    clock.advance(30s);
    monitor.check_now();
    EXPECT_EQ(monitor.miss_count("s1").value_or(-1), 1);

    monitor.update_heartbeat("s1");
    EXPECT_EQ(monitor.miss_count("s1").value_or(-1), 0);

    clock.advance(20s);
    monitor.check_now();
    EXPECT_EQ(monitor.miss_count("s1").value_or(-1), 0);

    clock.advance(10s);
    monitor.check_now();
    EXPECT_EQ(monitor.miss_count("s1").value_or(-1), 1);
    EXPECT_EQ(log.reconnect_count(), 0u);
}

TEST(HealthMonitorTest, FailedReconnectCleansUpAndStopsTracking) {
    FakeClock clock;
    CallbackLog log;
    log.reconnect_result = false;
    HealthMonitor monitor(30s, 2, log.reconnect(), log.cleanup(), clock.source());
    monitor.register_server("s1");
    monitor.register_server("s2");
    monitor.update_heartbeat("s2");

    clock.advance(30s);
    monitor.update_heartbeat("s2");
    monitor.check_now();
    clock.advance(30s);
    monitor.update_heartbeat("s2");
    monitor.check_now();

    ASSERT_EQ(log.reconnects.size(), 1u);
    ASSERT_EQ(log.cleanups.size(), 1u);
    EXPECT_EQ(log.cleanups[0], "s1");
    EXPECT_FALSE(monitor.is_tracking("s1"));
    EXPECT_TRUE(monitor.is_tracking("s2"));

    clock.advance(90s);
    monitor.update_heartbeat("s2");
    monitor.check_now();
    EXPECT_EQ(log.reconnects.size(), 1u);
}

TEST(HealthMonitorTest, MarkConnectionFailedEscalatesWithoutMisses) {
    FakeClock clock;
    CallbackLog log;
    HealthMonitor monitor(30s, 2, log.reconnect(), log.cleanup(), clock.source());
    monitor.register_server("s1");

    monitor.mark_connection_failed("s1", "pipe closed");
    monitor.check_now();
    EXPECT_EQ(log.reconnect_count(), 1u);

    monitor.check_now();
    EXPECT_EQ(log.reconnect_count(), 1u);
}

TEST(HealthMonitorTest, MarkConnectionFailedIgnoresUntrackedServer) {
    FakeClock clock;
    CallbackLog log;
    HealthMonitor monitor(30s, 2, log.reconnect(), log.cleanup(), clock.source());

    monitor.mark_connection_failed("ghost", "pipe closed");
    monitor.check_now();
    EXPECT_EQ(log.reconnect_count(), 0u);
    EXPECT_FALSE(monitor.is_tracking("ghost"));
}

TEST(HealthMonitorTest, UnregisterStopsTracking) {
    FakeClock clock;
    CallbackLog log;
    HealthMonitor monitor(30s, 2, log.reconnect(), log.cleanup(), clock.source());
    monitor.register_server("s1");
    monitor.unregister_server("s1");
    monitor.unregister_server("s1");

    clock.advance(120s);
    monitor.check_now();
    monitor.check_now();
    EXPECT_EQ(log.reconnect_count(), 0u);
    EXPECT_FALSE(monitor.miss_count("s1").has_value());
    EXPECT_EQ(monitor.tracked_count(), 0u);
}

TEST(HealthMonitorTest, MarkConnectionFailedWakesMonitorThread) {
    auto called = std::make_shared<std::promise<std::string>>();
    auto fired = std::make_shared<std::atomic_bool>(false);
    HealthMonitor monitor(
        60s, 2,
        [called, fired](const std::string& name) {
            if (!fired->exchange(true)) {
                called->set_value(name);
            }
            return true;
        },
        [](const std::string&) {});
    monitor.register_server("s1");
    monitor.start_monitoring();

    monitor.mark_connection_failed("s1", "read failed");
    auto future = called->get_future();
    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(future.get(), "s1");
    monitor.stop_monitoring();
}

TEST(HealthMonitorTest, PeriodicTicksDetectSilentServer) {
    auto called = std::make_shared<std::promise<void>>();
    auto fired = std::make_shared<std::atomic_bool>(false);
    HealthMonitor monitor(
        20ms, 2,
        [called, fired](const std::string&) {
            if (!fired->exchange(true)) {
                called->set_value();
            }
            return true;
        },
        [](const std::string&) {});
    monitor.register_server("quiet");
    monitor.start_monitoring();

    auto future = called->get_future();
    EXPECT_EQ(future.wait_for(2s), std::future_status::ready);
    monitor.stop_monitoring();
}

TEST(HealthMonitorTest, StartTwiceIsNoOpAndStopIsIdempotent) {
    CallbackLog log;
    HealthMonitor monitor(30s, 2, log.reconnect(), log.cleanup());
    EXPECT_FALSE(monitor.is_monitoring());

    monitor.start_monitoring();
    monitor.start_monitoring();
    EXPECT_TRUE(monitor.is_monitoring());

    monitor.stop_monitoring();
    monitor.stop_monitoring();
    EXPECT_FALSE(monitor.is_monitoring());

    monitor.start_monitoring();
    EXPECT_TRUE(monitor.is_monitoring());
    monitor.stop_monitoring();
}

}  // namespace
