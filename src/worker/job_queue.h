#pragma once

#include <mutex>
#include <optional>
#include <set>
#include <string>

#include "cancellation_registry.h"
#include "job.h"
#include "redis_client.h"

namespace texq::worker {

enum class QueueState { Waiting, Delayed, Active, Completed, Failed, Unknown };

const char* to_string(QueueState state);

struct QueuedJob {
    std::string id;
    JobPayload payload;
};

struct CancelOutcome {
    bool was_queued = false;
    bool was_running = false;
    // False when the broker could not be reached; nothing is known then
    bool confirmed = true;
};

struct QueueCounts {
    long long waiting = 0;
    long long active = 0;
    long long delayed = 0;
};

// Durable job queue on Redis. Every job has a hash holding its payload
// and state; ids move between a wait list, an active list and a delayed
// set. Multi-step transitions run as Lua scripts so they are atomic on
// the broker.
class JobQueue {
public:
    JobQueue(RedisClient& redis, std::string name, CancellationRegistry& cancels,
             int retention_seconds = 3600);

    // False when the id is already known (waiting, delayed, active,
    // completed or failed). Throws InfrastructureUnavailable when the
    // broker cannot be reached.
    bool enqueue(const std::string& job_id, const JobPayload& payload, int delay_ms = 0);

    // Blocks up to timeout_seconds on the given connection, which must not
    // be shared with other threads. Jobs removed while in flight are skipped.
    std::optional<QueuedJob> dequeue(RedisClient& blocking, int timeout_seconds);

    // Moves due delayed jobs to the wait list. Returns how many moved.
    long long promote_delayed();

    // Returns ids popped by a worker that died before activating them to
    // the wait list. Call periodically; returns how many moved back.
    int recover_stalled();

    // Kept for the retention period so late re-enqueues stay no-ops
    void complete(const std::string& job_id, bool failed);

    // Removes waiting/delayed jobs, reports active ones, and always sets
    // the cancel marker.
    CancelOutcome request_cancel(const std::string& job_id);

    QueueState state(const std::string& job_id);
    // When the job was last moved, for spotting jobs orphaned by a dead worker
    std::optional<TimePoint> state_since(const std::string& job_id);
    QueueCounts counts();

    const std::string& name() const { return name_; }
    std::string job_key(const std::string& job_id) const;

private:
    std::string wait_key() const { return name_ + ":wait"; }
    std::string active_key() const { return name_ + ":active"; }
    std::string delayed_key() const { return name_ + ":delayed"; }

    bool requeue(RedisClient& redis, const std::string& job_id);

    RedisClient& redis_;
    std::string name_;
    CancellationRegistry& cancels_;
    int retention_seconds_;

    std::mutex stalled_mutex_;
    std::set<std::string> stalled_suspects_;
};

} // namespace texq::worker
