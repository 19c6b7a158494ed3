#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>

#include "config.h"
#include "redis_client.h"
#include "runner_stats.h"

namespace texq::worker {

struct HeartbeatRecord {
    std::string instance_id;
    int pid = 0;
    int64_t ts = 0;  // epoch milliseconds
};

std::string serialize_heartbeat(const HeartbeatRecord& record);
std::optional<HeartbeatRecord> parse_heartbeat(const std::string& data);

// Periodically overwrites the heartbeat key so gateways can tell a
// dedicated worker is alive.
class HeartbeatPublisher {
public:
    HeartbeatPublisher(RedisClient& redis, std::string key, int interval_ms,
                       std::string instance_id);
    ~HeartbeatPublisher();

    HeartbeatPublisher(const HeartbeatPublisher&) = delete;
    HeartbeatPublisher& operator=(const HeartbeatPublisher&) = delete;

    void start();
    // Deletes the key only if it still names this instance
    void stop();

    // One SET with TTL. Broker failures are logged.
    bool publish_heartbeat();

    int ttl_seconds() const;
    const std::string& instance_id() const { return instance_id_; }

private:
    void run();

    RedisClient& redis_;
    std::string key_;
    int interval_ms_;
    std::string instance_id_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
};

struct HealthReport {
    bool healthy = false;
    DeploymentMode mode = DeploymentMode::Embedded;
    std::string detail;
    std::optional<RunnerSnapshot> runner;
    std::optional<int64_t> heartbeat_age_ms;
};

// Freshness verdict for a raw heartbeat value. Ages below zero (clock
// skew or a forged timestamp) are unhealthy.
HealthReport evaluate_heartbeat(const std::optional<std::string>& raw, int64_t now_ms,
                                int max_age_ms);

// Runner inside this process: only in-process counters matter
struct EmbeddedHealth {
    const RunnerStats* stats = nullptr;

    HealthReport check() const;
};

// Runner in another process: only heartbeat freshness matters
struct DedicatedHealth {
    RedisClient* redis = nullptr;
    std::string key;
    int max_age_ms = 30000;

    HealthReport check() const;
};

using HealthStrategy = std::variant<EmbeddedHealth, DedicatedHealth>;

HealthStrategy select_health_strategy(const Config& config, const RunnerStats* stats,
                                      RedisClient& redis);

HealthReport check_health(const HealthStrategy& strategy);

} // namespace texq::worker
