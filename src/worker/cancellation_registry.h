#pragma once

#include <string>

#include "redis_client.h"

namespace texq::worker {

// Cancel markers shared between the process accepting a cancel request
// and the worker running the job. A marker only records the request;
// whether work stopped is up to the engine's next poll.
class CancellationRegistry {
public:
    // Throws ConfigError when ttl_seconds does not outlive the compile timeout.
    CancellationRegistry(RedisClient& redis, std::string key_prefix,
                         int ttl_seconds, int max_compile_timeout_s);

    // Idempotent. Throws BrokerError when the marker could not be written.
    void set_cancel(const std::string& job_id);

    // Broker failures are logged and read as "not canceled".
    bool is_canceled(const std::string& job_id);

    void clear(const std::string& job_id);

    std::string key_for(const std::string& job_id) const;
    int ttl_seconds() const { return ttl_seconds_; }

private:
    RedisClient& redis_;
    std::string key_prefix_;
    int ttl_seconds_;
};

} // namespace texq::worker
