#include "health/health_monitor.hpp"

#include <exception>
#include <utility>
#include "core/logging/logger.hpp"

namespace mcplink::health {

HealthMonitor::HealthMonitor(const std::chrono::milliseconds interval, const int max_miss,
                             ReconnectCallback reconnect, CleanupCallback cleanup,
                             Clock clock)
    : interval_(interval),
      max_miss_(max_miss < 1 ? 1 : max_miss),
      reconnect_(std::move(reconnect)),
      cleanup_(std::move(cleanup)),
      clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::steady_clock::now(); };
    }
}

HealthMonitor::~HealthMonitor() {
    stop_monitoring();
    if (worker_.joinable()) {
        if (worker_.get_id() == std::this_thread::get_id()) {
            worker_.detach();
        } else {
            worker_.join();
        }
    }
}

void HealthMonitor::register_server(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    HeartbeatRecord record;
    record.last_seen = clock_();
    records_[name] = record;
    LOG_DEBUG("HealthMonitor: tracking " + name);
}

void HealthMonitor::unregister_server(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (records_.erase(name) > 0) {
        LOG_DEBUG("HealthMonitor: stopped tracking " + name);
    }
}

void HealthMonitor::update_heartbeat(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(name);
    if (it == records_.end()) {
        return;
    }
    it->second.last_seen = clock_();
    it->second.misses = 0;
}

void HealthMonitor::mark_connection_failed(const std::string& name,
                                           const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(name);
        if (it == records_.end()) {
            LOG_DEBUG("HealthMonitor: ignoring failure report for untracked " + name);
            return;
        }
        it->second.escalate = true;
        it->second.reason = reason;
        escalation_pending_ = true;
    }
    LOG_WARN("HealthMonitor: connection to " + name + " failed: " + reason);
    wake_.notify_all();
}

void HealthMonitor::start_monitoring() {
    std::thread previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            // Revives a worker that was asked to stop but has not exited yet.
            stop_requested_ = false;
            return;
        }
        previous = std::move(worker_);
        running_ = true;
        stop_requested_ = false;
        worker_ = std::thread(&HealthMonitor::worker_loop, this);
    }
    if (previous.joinable()) {
        if (previous.get_id() == std::this_thread::get_id()) {
            previous.detach();
        } else {
            previous.join();
        }
    }
    LOG_INFO("HealthMonitor: monitoring started (interval " +
             std::to_string(interval_.count()) + "ms, max misses " +
             std::to_string(max_miss_) + ")");
}

void HealthMonitor::stop_monitoring() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ || stop_requested_) {
            return;
        }
        stop_requested_ = true;
    }
    LOG_INFO("HealthMonitor: monitoring stop requested");
    wake_.notify_all();
}

bool HealthMonitor::is_monitoring() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_ && !stop_requested_;
}

void HealthMonitor::check_now() {
    run_check(true);
}

bool HealthMonitor::is_tracking(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.find(name) != records_.end();
}

std::optional<int> HealthMonitor::miss_count(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(name);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second.misses;
}

std::size_t HealthMonitor::tracked_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

void HealthMonitor::worker_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    auto next_tick = std::chrono::steady_clock::now() + interval_;
    while (true) {
        wake_.wait_until(lock, next_tick,
                         [this] { return stop_requested_ || escalation_pending_; });
        if (stop_requested_) {
            running_ = false;
            stop_requested_ = false;
            return;
        }
        const bool full_tick = std::chrono::steady_clock::now() >= next_tick;
        escalation_pending_ = false;

        lock.unlock();
        run_check(full_tick);
        lock.lock();

        if (full_tick) {
            next_tick = std::chrono::steady_clock::now() + interval_;
        }
    }
}

void HealthMonitor::run_check(const bool full_tick) {
    std::lock_guard<std::mutex> check_lock(check_mutex_);

    std::vector<std::string> due;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_();
        for (auto& entry : records_) {
            HeartbeatRecord& record = entry.second;
            if (full_tick && now - record.last_seen >= interval_) {
                ++record.misses;
                LOG_DEBUG("HealthMonitor: " + entry.first + " missed heartbeat " +
                          std::to_string(record.misses) + "/" + std::to_string(max_miss_));
            }
            if (record.escalate || record.misses >= max_miss_) {
                due.push_back(entry.first);
            }
        }
    }

    for (const auto& name : due) {
        escalate(name);
    }
}

void HealthMonitor::escalate(const std::string& name) {
    std::string reason;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(name);
        if (it == records_.end()) {
            return;
        }
        reason = it->second.escalate ? it->second.reason
                                     : std::to_string(it->second.misses) +
                                           " missed heartbeats";
        it->second.escalate = false;
    }

    LOG_WARN("HealthMonitor: reconnecting " + name + " (" + reason + ")");
    bool reconnected = false;
    if (reconnect_) {
        try {
            reconnected = reconnect_(name);
        } catch (const std::exception& ex) {
            LOG_ERROR("HealthMonitor: reconnect callback for " + name + " threw: " +
                      ex.what());
        }
    }

    if (reconnected) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(name);
        if (it != records_.end()) {
            it->second.last_seen = clock_();
            it->second.misses = 0;
        }
        LOG_INFO("HealthMonitor: " + name + " reconnected");
        return;
    }

    LOG_ERROR("HealthMonitor: reconnect failed for " + name + ", cleaning up");
    {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.erase(name);
    }
    if (cleanup_) {
        try {
            cleanup_(name);
        } catch (const std::exception& ex) {
            LOG_ERROR("HealthMonitor: cleanup callback for " + name + " threw: " + ex.what());
        }
    }
}

}  // namespace mcplink::health
