#pragma once

#include <optional>
#include <string>
#include <vector>

#include "job.h"
#include "redis_client.h"

namespace texq::worker {

struct StatusEvent {
    std::string job_id;
    std::string project_id;
    JobStatus status = JobStatus::Queued;

    // Completion details, only sent for terminal statuses
    std::string logs;
    std::optional<int64_t> duration_ms;
    std::vector<ParsedLogEntry> errors;
    std::optional<std::string> pdf_url;
    std::string artifact_hash;
};

// Fire-and-forget fan-out of job status changes over Redis pub/sub.
// Delivery is at most once per publish; nothing is retried.
class StatusPublisher {
public:
    StatusPublisher(RedisClient& redis, std::string channel);

    // Never throws. Returns false when the message could not be sent.
    bool publish(const StatusEvent& event);

    // JSON body of an event as subscribers receive it
    static std::string to_message(const StatusEvent& event);

    const std::string& channel() const { return channel_; }

private:
    RedisClient& redis_;
    std::string channel_;
};

} // namespace texq::worker
