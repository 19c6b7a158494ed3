#include "cancellation_registry.h"
#include "errors.h"

#include <iostream>

namespace texq::worker {

CancellationRegistry::CancellationRegistry(RedisClient& redis, std::string key_prefix,
                                           int ttl_seconds, int max_compile_timeout_s)
    : redis_(redis), key_prefix_(std::move(key_prefix)), ttl_seconds_(ttl_seconds) {
    if (ttl_seconds_ <= max_compile_timeout_s) {
        throw ConfigError("Cancel marker TTL (" + std::to_string(ttl_seconds_) +
                          "s) must exceed the compile timeout (" +
                          std::to_string(max_compile_timeout_s) + "s)");
    }
}

std::string CancellationRegistry::key_for(const std::string& job_id) const {
    return key_prefix_ + ":cancel:" + job_id;
}

void CancellationRegistry::set_cancel(const std::string& job_id) {
    redis_.set(key_for(job_id), "1", ttl_seconds_);
}

bool CancellationRegistry::is_canceled(const std::string& job_id) {
    try {
        return redis_.exists(key_for(job_id));
    } catch (const BrokerError& e) {
        std::cerr << "[Cancel] Cancel check failed for " << job_id << ": " << e.what() << std::endl;
        return false;
    }
}

void CancellationRegistry::clear(const std::string& job_id) {
    try {
        redis_.del(key_for(job_id));
    } catch (const BrokerError& e) {
        std::cerr << "[Cancel] Failed to clear marker for " << job_id << ": " << e.what() << std::endl;
    }
}

} // namespace texq::worker
