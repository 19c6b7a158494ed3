#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "cancellation_registry.h"
#include "compiler.h"
#include "config.h"
#include "job_persistence.h"
#include "job_queue.h"
#include "job_store.h"
#include "runner_stats.h"
#include "status_publisher.h"

namespace texq::worker {

// A queue the runner pulls from and where its jobs' state is written
struct QueueBinding {
    JobQueue* queue = nullptr;
    JobPersistence* persistence = nullptr;
    // Ephemeral queues keep their records in the job store
    JobMode mode = JobMode::Ephemeral;
};

struct RunnerOptions {
    int concurrency = 5;
    int dequeue_timeout_s = 1;
    std::chrono::milliseconds maintenance_interval = std::chrono::seconds(60);
    // Queued/compiling records older than this with no live queue entry are abandoned
    std::chrono::milliseconds stale_after = std::chrono::seconds(180);
    std::string builds_root;
    std::string projects_root;
    std::string public_base_url;

    static RunnerOptions from_config(const Config& config);
};

// Pulls jobs from the bound queues with one thread per concurrency slot,
// runs them through the compiler and reports every transition.
class JobRunner {
public:
    JobRunner(RunnerOptions options, RedisConfig redis_config, Compiler& compiler,
              CancellationRegistry& cancels, JobStore& store, StatusPublisher& publisher,
              RunnerStats& stats, std::vector<QueueBinding> bindings);
    ~JobRunner();

    JobRunner(const JobRunner&) = delete;
    JobRunner& operator=(const JobRunner&) = delete;

    void start();
    // Waits for running compiles to finish
    void stop();
    bool running() const { return running_; }

    // Runs one dequeued job to a terminal state. Never throws.
    void process_job(const QueuedJob& job, const QueueBinding& binding);

    // Marks ephemeral records abandoned by a dead worker as errors.
    // Returns how many were marked.
    int cleanup_stale_jobs(JobQueue& queue);

    // Reaper, delayed promotion and stale cleanup in one pass
    void run_maintenance();

    std::string output_url(const std::string& job_id) const;

private:
    struct Workspace {
        std::string work_dir;
        std::string main_file;
        Engine engine = Engine::Auto;
        std::string project_id;
        std::string project_dir;
        std::string build_dir;
    };

    void worker_loop(int index);
    void maintenance_loop();

    bool prepare_workspace(const QueuedJob& job, const QueueBinding& binding, Workspace& ws);
    void finish_canceled_before_start(const QueuedJob& job, const QueueBinding& binding,
                                      const Workspace& ws);
    void fail_job(const QueuedJob& job, const QueueBinding& binding, const std::string& project_id,
                  const std::string& error, int64_t duration_ms);
    void complete_queue_entry(const QueueBinding& binding, const std::string& job_id, bool failed);

    RunnerOptions options_;
    RedisConfig redis_config_;
    Compiler& compiler_;
    CancellationRegistry& cancels_;
    JobStore& store_;
    StatusPublisher& publisher_;
    RunnerStats& stats_;
    std::vector<QueueBinding> bindings_;

    std::atomic<bool> running_{false};
    std::vector<std::thread> workers_;
    std::thread maintenance_thread_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
};

// canceled, then timeout, then error (nonzero exit, error entries or no
// PDF), else success
JobStatus determine_status(const RunOutcome& outcome, int error_count);

// Project directories arrive in queue payloads and must resolve inside
// projects_root. Throws ValidationError otherwise.
std::string resolve_project_dir(const std::string& projects_root, const std::string& project_dir);

} // namespace texq::worker
