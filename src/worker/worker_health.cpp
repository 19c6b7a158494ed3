#include "worker_health.h"
#include "errors.h"

#include <algorithm>
#include <iostream>
#include <nlohmann/json.hpp>
#include <unistd.h>

using json = nlohmann::json;

namespace texq::worker {

std::string serialize_heartbeat(const HeartbeatRecord& record) {
    json j;
    j["instanceId"] = record.instance_id;
    j["pid"] = record.pid;
    j["ts"] = record.ts;
    return j.dump();
}

std::optional<HeartbeatRecord> parse_heartbeat(const std::string& data) {
    json j = json::parse(data, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }
    try {
        HeartbeatRecord record;
        record.instance_id = j.at("instanceId").get<std::string>();
        record.pid = j.value("pid", 0);
        record.ts = j.at("ts").get<int64_t>();
        return record;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

HeartbeatPublisher::HeartbeatPublisher(RedisClient& redis, std::string key, int interval_ms,
                                       std::string instance_id)
    : redis_(redis), key_(std::move(key)), interval_ms_(std::max(interval_ms, 1000)),
      instance_id_(std::move(instance_id)) {}

HeartbeatPublisher::~HeartbeatPublisher() {
    stop();
}

int HeartbeatPublisher::ttl_seconds() const {
    return std::max((interval_ms_ * 3 + 999) / 1000, 5);
}

bool HeartbeatPublisher::publish_heartbeat() {
    HeartbeatRecord record;
    record.instance_id = instance_id_;
    record.pid = static_cast<int>(getpid());
    record.ts = to_epoch_ms(Clock::now());
    try {
        redis_.set(key_, serialize_heartbeat(record), ttl_seconds());
        return true;
    } catch (const BrokerError& e) {
        std::cerr << "[Heartbeat] Failed to publish: " << e.what() << std::endl;
        return false;
    }
}

void HeartbeatPublisher::start() {
    if (running_.exchange(true)) {
        return;
    }
    publish_heartbeat();
    thread_ = std::thread(&HeartbeatPublisher::run, this);
    std::cout << "[Heartbeat] Publishing to " << key_ << " every " << interval_ms_
              << "ms (instance " << instance_id_ << ")" << std::endl;
}

void HeartbeatPublisher::run() {
    std::unique_lock<std::mutex> lock(wake_mutex_);
    while (running_) {
        wake_cv_.wait_for(lock, std::chrono::milliseconds(interval_ms_),
                          [this] { return !running_; });
        if (!running_) break;
        lock.unlock();
        publish_heartbeat();
        lock.lock();
    }
}

void HeartbeatPublisher::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
    }
    wake_cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }

    // A newer worker may already own the key
    try {
        auto current = redis_.get(key_);
        if (current) {
            auto record = parse_heartbeat(*current);
            if (record && record->instance_id == instance_id_) {
                redis_.del(key_);
            }
        }
    } catch (const BrokerError& e) {
        std::cerr << "[Heartbeat] Failed to clear heartbeat: " << e.what() << std::endl;
    }
}

HealthReport evaluate_heartbeat(const std::optional<std::string>& raw, int64_t now_ms,
                                int max_age_ms) {
    HealthReport report;
    report.mode = DeploymentMode::Dedicated;
    if (!raw) {
        report.detail = "No worker heartbeat";
        return report;
    }
    auto record = parse_heartbeat(*raw);
    if (!record) {
        report.detail = "Unreadable worker heartbeat";
        return report;
    }

    int64_t age = now_ms - record->ts;
    report.heartbeat_age_ms = age;
    if (age < 0) {
        report.detail = "Worker heartbeat is in the future";
    } else if (age > max_age_ms) {
        report.detail = "Worker heartbeat is stale (" + std::to_string(age) + "ms old)";
    } else {
        report.healthy = true;
        report.detail = "Worker " + record->instance_id + " alive";
    }
    return report;
}

HealthReport EmbeddedHealth::check() const {
    HealthReport report;
    report.mode = DeploymentMode::Embedded;
    if (stats == nullptr) {
        report.detail = "Compile runner not started";
        return report;
    }
    report.runner = stats->snapshot();
    report.healthy = report.runner->running;
    report.detail = report.healthy ? "Compile runner running" : "Compile runner stopped";
    return report;
}

HealthReport DedicatedHealth::check() const {
    std::optional<std::string> raw;
    try {
        raw = redis->get(key);
    } catch (const BrokerError& e) {
        HealthReport report;
        report.mode = DeploymentMode::Dedicated;
        report.detail = std::string("Heartbeat unavailable: ") + e.what();
        return report;
    }
    return evaluate_heartbeat(raw, to_epoch_ms(Clock::now()), max_age_ms);
}

HealthStrategy select_health_strategy(const Config& config, const RunnerStats* stats,
                                      RedisClient& redis) {
    if (config.mode == DeploymentMode::Dedicated) {
        return DedicatedHealth{&redis, config.heartbeat_key, config.heartbeat_max_age_ms};
    }
    return EmbeddedHealth{stats};
}

HealthReport check_health(const HealthStrategy& strategy) {
    return std::visit([](const auto& s) { return s.check(); }, strategy);
}

} // namespace texq::worker
