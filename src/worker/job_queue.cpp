#include "job_queue.h"
#include "errors.h"

#include <iostream>
#include <set>

namespace texq::worker {

namespace {

// KEYS: job hash, wait list, delayed set. ARGV: id, payload, now ms, delay ms
const char* kEnqueueScript = R"lua(
if redis.call('EXISTS', KEYS[1]) == 1 then
  return 0
end
local delay = tonumber(ARGV[4])
if delay > 0 then
  redis.call('HSET', KEYS[1], 'payload', ARGV[2], 'state', 'delayed', 'ts', ARGV[3])
  redis.call('ZADD', KEYS[3], tonumber(ARGV[3]) + delay, ARGV[1])
else
  redis.call('HSET', KEYS[1], 'payload', ARGV[2], 'state', 'waiting', 'ts', ARGV[3])
  redis.call('LPUSH', KEYS[2], ARGV[1])
end
return 1
)lua";

// KEYS: job hash, active list. ARGV: id, now ms
const char* kActivateScript = R"lua(
local state = redis.call('HGET', KEYS[1], 'state')
if state ~= 'waiting' then
  redis.call('LREM', KEYS[2], 0, ARGV[1])
  return false
end
redis.call('HSET', KEYS[1], 'state', 'active', 'ts', ARGV[2])
return redis.call('HGET', KEYS[1], 'payload')
)lua";

// KEYS: job hash, active list. ARGV: id, final state, now ms, retention s
const char* kCompleteScript = R"lua(
redis.call('LREM', KEYS[2], 0, ARGV[1])
if redis.call('EXISTS', KEYS[1]) == 1 then
  redis.call('HSET', KEYS[1], 'state', ARGV[2], 'ts', ARGV[3])
  redis.call('EXPIRE', KEYS[1], tonumber(ARGV[4]))
end
return 1
)lua";

// KEYS: job hash, wait list, delayed set. ARGV: id
const char* kCancelScript = R"lua(
local state = redis.call('HGET', KEYS[1], 'state')
if state == 'waiting' or state == 'delayed' then
  redis.call('LREM', KEYS[2], 0, ARGV[1])
  redis.call('ZREM', KEYS[3], ARGV[1])
  redis.call('DEL', KEYS[1])
  return 'removed'
end
if state then
  return state
end
return 'unknown'
)lua";

// KEYS: delayed set, wait list. ARGV: now ms, job hash prefix
const char* kPromoteScript = R"lua(
local due = redis.call('ZRANGEBYSCORE', KEYS[1], '-inf', ARGV[1])
for _, id in ipairs(due) do
  redis.call('ZREM', KEYS[1], id)
  redis.call('HSET', ARGV[2] .. id, 'state', 'waiting', 'ts', ARGV[1])
  redis.call('LPUSH', KEYS[2], id)
end
return #due
)lua";

// KEYS: active list. ARGV: job hash prefix. Drops ids whose hash is gone
// and returns the ones still marked waiting: popped but never activated.
const char* kStalledScript = R"lua(
local stalled = {}
for _, id in ipairs(redis.call('LRANGE', KEYS[1], 0, -1)) do
  local state = redis.call('HGET', ARGV[1] .. id, 'state')
  if not state then
    redis.call('LREM', KEYS[1], 0, id)
  elseif state == 'waiting' then
    table.insert(stalled, id)
  end
end
return stalled
)lua";

// KEYS: job hash, active list, wait list. ARGV: id
const char* kRequeueScript = R"lua(
if redis.call('HGET', KEYS[1], 'state') ~= 'waiting' then
  return 0
end
if redis.call('LREM', KEYS[2], 0, ARGV[1]) == 0 then
  return 0
end
redis.call('RPUSH', KEYS[3], ARGV[1])
return 1
)lua";

std::string now_ms() {
    return std::to_string(to_epoch_ms(Clock::now()));
}

QueueState parse_queue_state(const std::string& name) {
    if (name == "waiting") return QueueState::Waiting;
    if (name == "delayed") return QueueState::Delayed;
    if (name == "active") return QueueState::Active;
    if (name == "completed") return QueueState::Completed;
    if (name == "failed") return QueueState::Failed;
    return QueueState::Unknown;
}

} // namespace

const char* to_string(QueueState state) {
    switch (state) {
        case QueueState::Waiting: return "waiting";
        case QueueState::Delayed: return "delayed";
        case QueueState::Active: return "active";
        case QueueState::Completed: return "completed";
        case QueueState::Failed: return "failed";
        case QueueState::Unknown: return "unknown";
    }
    return "unknown";
}

JobQueue::JobQueue(RedisClient& redis, std::string name, CancellationRegistry& cancels,
                   int retention_seconds)
    : redis_(redis), name_(std::move(name)), cancels_(cancels),
      retention_seconds_(retention_seconds) {}

std::string JobQueue::job_key(const std::string& job_id) const {
    return name_ + ":job:" + job_id;
}

bool JobQueue::enqueue(const std::string& job_id, const JobPayload& payload, int delay_ms) {
    validate_job_id(job_id);
    try {
        auto reply = redis_.eval(kEnqueueScript,
                                 {job_key(job_id), wait_key(), delayed_key()},
                                 {job_id, serialize_payload(payload), now_ms(),
                                  std::to_string(delay_ms > 0 ? delay_ms : 0)});
        bool added = reply.integer == 1;
        if (!added) {
            std::cout << "[Queue] " << name_ << ": job " << job_id
                      << " already known, enqueue ignored" << std::endl;
        }
        return added;
    } catch (const BrokerError& e) {
        throw InfrastructureUnavailable(std::string("Job queue unavailable: ") + e.what());
    }
}

std::optional<QueuedJob> JobQueue::dequeue(RedisClient& blocking, int timeout_seconds) {
    auto id = blocking.brpoplpush(wait_key(), active_key(), timeout_seconds);
    if (!id) {
        return std::nullopt;
    }

    RedisReply reply;
    try {
        reply = redis_.eval(kActivateScript, {job_key(*id), active_key()}, {*id, now_ms()});
    } catch (const BrokerError& e) {
        // Hand the id back so it is not parked in the active list for good
        std::cerr << "[Queue] " << name_ << ": could not activate " << *id << ": " << e.what()
                  << std::endl;
        requeue(blocking, *id);
        throw;
    }
    if (reply.is_nil()) {
        std::cout << "[Queue] " << name_ << ": job " << *id
                  << " was removed before it started, skipping" << std::endl;
        return std::nullopt;
    }

    QueuedJob job;
    job.id = *id;
    try {
        job.payload = parse_payload(reply.str);
    } catch (const ValidationError& e) {
        std::cerr << "[Queue] " << name_ << ": dropping job " << *id
                  << " with malformed payload: " << e.what() << std::endl;
        complete(*id, true);
        return std::nullopt;
    }
    job.payload.job_id = *id;
    return job;
}

bool JobQueue::requeue(RedisClient& redis, const std::string& job_id) {
    try {
        bool moved = redis.eval(kRequeueScript, {job_key(job_id), active_key(), wait_key()},
                                {job_id}).integer == 1;
        if (moved) {
            std::cout << "[Queue] " << name_ << ": job " << job_id << " returned to the wait list"
                      << std::endl;
        }
        return moved;
    } catch (const BrokerError& e) {
        std::cerr << "[Queue] " << name_ << ": could not requeue " << job_id << ": " << e.what()
                  << std::endl;
        return false;
    }
}

int JobQueue::recover_stalled() {
    auto reply = redis_.eval(kStalledScript, {active_key()}, {name_ + ":job:"});
    std::set<std::string> seen;
    for (const auto& element : reply.elements) {
        seen.insert(element.str);
    }

    // Stalled only once two consecutive passes saw it unactivated
    std::set<std::string> suspects;
    {
        std::lock_guard<std::mutex> lock(stalled_mutex_);
        suspects.swap(stalled_suspects_);
    }
    int recovered = 0;
    std::set<std::string> still_waiting;
    for (const auto& id : seen) {
        if (suspects.count(id) == 0) {
            still_waiting.insert(id);
        } else if (requeue(redis_, id)) {
            recovered++;
        }
    }
    {
        std::lock_guard<std::mutex> lock(stalled_mutex_);
        stalled_suspects_.swap(still_waiting);
    }
    return recovered;
}

long long JobQueue::promote_delayed() {
    return redis_.eval(kPromoteScript, {delayed_key(), wait_key()},
                       {now_ms(), name_ + ":job:"}).integer;
}

void JobQueue::complete(const std::string& job_id, bool failed) {
    redis_.eval(kCompleteScript, {job_key(job_id), active_key()},
                {job_id, failed ? "failed" : "completed", now_ms(),
                 std::to_string(retention_seconds_)});
}

CancelOutcome JobQueue::request_cancel(const std::string& job_id) {
    CancelOutcome outcome;
    try {
        auto reply = redis_.eval(kCancelScript, {job_key(job_id), wait_key(), delayed_key()},
                                 {job_id});
        outcome.was_queued = reply.str == "removed";
        outcome.was_running = reply.str == "active";
    } catch (const BrokerError& e) {
        std::cerr << "[Queue] " << name_ << ": could not confirm cancellation of "
                  << job_id << ": " << e.what() << std::endl;
        outcome.confirmed = false;
    }

    try {
        cancels_.set_cancel(job_id);
    } catch (const BrokerError& e) {
        std::cerr << "[Queue] " << name_ << ": failed to set cancel marker for "
                  << job_id << ": " << e.what() << std::endl;
        outcome.confirmed = false;
    }
    return outcome;
}

QueueState JobQueue::state(const std::string& job_id) {
    auto reply = redis_.command({"HGET", job_key(job_id), "state"});
    if (reply.is_nil()) {
        return QueueState::Unknown;
    }
    return parse_queue_state(reply.str);
}

std::optional<TimePoint> JobQueue::state_since(const std::string& job_id) {
    auto reply = redis_.command({"HGET", job_key(job_id), "ts"});
    if (reply.is_nil() || reply.str.empty()) {
        return std::nullopt;
    }
    try {
        return TimePoint(std::chrono::milliseconds(std::stoll(reply.str)));
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

QueueCounts JobQueue::counts() {
    QueueCounts counts;
    counts.waiting = redis_.llen(wait_key());
    counts.active = redis_.llen(active_key());
    counts.delayed = redis_.zcard(delayed_key());
    return counts;
}

} // namespace texq::worker
