#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace mcplink::health {

// Tracks liveness of named servers and escalates silent ones through the
// injected callbacks. It never touches sessions or transports itself.
class HealthMonitor {
public:
    using ReconnectCallback = std::function<bool(const std::string& name)>;
    using CleanupCallback = std::function<void(const std::string& name)>;
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    HealthMonitor(std::chrono::milliseconds interval, int max_miss,
                  ReconnectCallback reconnect, CleanupCallback cleanup, Clock clock = {});
    ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    void register_server(const std::string& name);
    void unregister_server(const std::string& name);
    void update_heartbeat(const std::string& name);

    // Escalates on the monitor thread without waiting for the next tick.
    void mark_connection_failed(const std::string& name, const std::string& reason);

    // Starting twice is a no-op; stopping never blocks.
    void start_monitoring();
    void stop_monitoring();
    bool is_monitoring() const;

    // Runs one full tick on the calling thread.
    void check_now();

    bool is_tracking(const std::string& name) const;
    std::optional<int> miss_count(const std::string& name) const;
    std::size_t tracked_count() const;

private:
    struct HeartbeatRecord {
        std::chrono::steady_clock::time_point last_seen;
        int misses = 0;
        bool escalate = false;
        std::string reason;
    };

    void worker_loop();
    void run_check(bool full_tick);
    void escalate(const std::string& name);

    std::chrono::milliseconds interval_;
    int max_miss_;
    ReconnectCallback reconnect_;
    CleanupCallback cleanup_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::unordered_map<std::string, HeartbeatRecord> records_;
    bool running_ = false;
    bool stop_requested_ = false;
    bool escalation_pending_ = false;
    std::thread worker_;

    // Serializes ticks so callbacks for one server never overlap.
    std::mutex check_mutex_;
};

}  // namespace mcplink::health
