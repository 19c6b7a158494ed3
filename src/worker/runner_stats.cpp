#include "runner_stats.h"

#include <algorithm>

namespace texq::worker {

RunnerStats::RunnerStats(int max_concurrent)
    : started_at_(std::chrono::steady_clock::now()), max_concurrent_(max_concurrent) {}

void RunnerStats::mark_started() {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    running_ = true;
    started_at_ = std::chrono::steady_clock::now();
}

void RunnerStats::mark_stopped() {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    running_ = false;
}

void RunnerStats::record_job_start(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    job_start_times_[job_id] = std::chrono::steady_clock::now();
}

void RunnerStats::record_job_complete(const std::string& job_id, JobStatus status) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    total_processed_++;
    if (status == JobStatus::Error || status == JobStatus::Timeout) {
        total_errors_++;
    }
    finish_job(job_id);
}

void RunnerStats::record_job_failure(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    total_errors_++;
    job_start_times_.erase(job_id);
}

void RunnerStats::record_job_skipped(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    job_start_times_.erase(job_id);
}

void RunnerStats::finish_job(const std::string& job_id) {
    auto it = job_start_times_.find(job_id);
    if (it == job_start_times_.end()) {
        return;
    }
    int64_t elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - it->second).count();
    job_start_times_.erase(it);

    min_job_time_ms_ = timed_jobs_ == 0 ? elapsed : std::min(min_job_time_ms_, elapsed);
    max_job_time_ms_ = std::max(max_job_time_ms_, elapsed);
    total_job_time_ms_ += elapsed;
    timed_jobs_++;
}

RunnerSnapshot RunnerStats::snapshot() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    RunnerSnapshot snapshot;
    snapshot.running = running_;
    snapshot.active_jobs = static_cast<int>(job_start_times_.size());
    snapshot.max_concurrent = max_concurrent_;
    snapshot.total_processed = total_processed_;
    snapshot.total_errors = total_errors_;
    snapshot.uptime_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_at_).count();
    snapshot.min_job_time_ms = min_job_time_ms_;
    snapshot.max_job_time_ms = max_job_time_ms_;
    if (timed_jobs_ > 0) {
        snapshot.avg_job_time_ms = total_job_time_ms_ / timed_jobs_;
    }
    return snapshot;
}

} // namespace texq::worker
