#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

#include "job.h"

namespace texq::worker {

// Snapshot of the in-process runner, served by embedded health checks
struct RunnerSnapshot {
    bool running = false;
    int active_jobs = 0;
    int max_concurrent = 0;
    int64_t total_processed = 0;
    int64_t total_errors = 0;
    int64_t uptime_ms = 0;

    // Timing of finished compiles (in milliseconds)
    int64_t min_job_time_ms = 0;
    int64_t max_job_time_ms = 0;
    int64_t avg_job_time_ms = 0;
};

// Counters for tracking runner activity
class RunnerStats {
public:
    explicit RunnerStats(int max_concurrent);

    void mark_started();
    void mark_stopped();

    void record_job_start(const std::string& job_id);

    // Any terminal outcome counts as processed; error and timeout also count as errors
    void record_job_complete(const std::string& job_id, JobStatus status);

    // Infrastructure failure: the job never produced an outcome
    void record_job_failure(const std::string& job_id);

    // Job was claimed but turned out not to be runnable any more
    void record_job_skipped(const std::string& job_id);

    RunnerSnapshot snapshot() const;

private:
    void finish_job(const std::string& job_id);

    std::chrono::steady_clock::time_point started_at_;
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> job_start_times_;

    bool running_ = false;
    int max_concurrent_;
    int64_t total_processed_ = 0;
    int64_t total_errors_ = 0;
    int64_t timed_jobs_ = 0;
    int64_t total_job_time_ms_ = 0;
    int64_t min_job_time_ms_ = 0;
    int64_t max_job_time_ms_ = 0;

    mutable std::mutex stats_mutex_;
};

} // namespace texq::worker
