#include "job_runner.h"
#include "errors.h"
#include "hash_utils.h"
#include "log_parser.h"

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace texq::worker {

namespace {

constexpr const char* kCanceledLogs = "Build canceled by user.";
constexpr const char* kCanceledBeforeStart = "Build canceled before starting.";
constexpr const char* kInterrupted = "Build interrupted - worker restarted. Please recompile.";
// Records this young may still be on their way into the queue
constexpr auto kEnqueueGrace = std::chrono::seconds(30);

int64_t elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
}

std::vector<ParsedLogEntry> only_errors(const std::vector<ParsedLogEntry>& entries) {
    std::vector<ParsedLogEntry> errors;
    for (const auto& entry : entries) {
        if (entry.type == LogEntryType::Error) {
            errors.push_back(entry);
        }
    }
    return errors;
}

void remove_build_dir(const std::string& build_dir) {
    if (build_dir.empty()) return;
    std::error_code ec;
    fs::remove_all(build_dir, ec);
    if (ec) {
        std::cerr << "[Runner] Failed to remove build dir " << build_dir << ": "
                  << ec.message() << std::endl;
    }
}

} // namespace

RunnerOptions RunnerOptions::from_config(const Config& config) {
    RunnerOptions options;
    options.concurrency = config.max_concurrent;
    options.stale_after = std::chrono::seconds(config.compile_timeout_s + 60);
    options.builds_root = config.builds_root();
    options.projects_root = config.projects_root;
    options.public_base_url = config.public_base_url;
    return options;
}

JobStatus determine_status(const RunOutcome& outcome, int error_count) {
    if (outcome.canceled) return JobStatus::Canceled;
    if (outcome.timed_out) return JobStatus::Timeout;
    if (outcome.exit_code != 0 || error_count > 0 || !outcome.pdf_path) return JobStatus::Error;
    return JobStatus::Success;
}

std::string resolve_project_dir(const std::string& projects_root, const std::string& project_dir) {
    std::error_code ec;
    fs::path root = fs::weakly_canonical(projects_root, ec);
    if (ec || projects_root.empty()) {
        throw ValidationError("Projects root is not configured");
    }
    // Relative directories name a project under the root
    fs::path requested = fs::path(project_dir).is_absolute() ? fs::path(project_dir)
                                                              : root / project_dir;
    fs::path dir = fs::weakly_canonical(requested, ec);
    if (ec) {
        throw ValidationError("Invalid project directory: " + project_dir);
    }

    auto rel = dir.lexically_relative(root);
    if (rel.empty() || rel == "." || *rel.begin() == "..") {
        throw ValidationError("Project directory outside projects root: " + project_dir);
    }
    if (!fs::is_directory(dir, ec)) {
        throw ValidationError("Project directory does not exist: " + project_dir);
    }
    return dir.string();
}

JobRunner::JobRunner(RunnerOptions options, RedisConfig redis_config, Compiler& compiler,
                     CancellationRegistry& cancels, JobStore& store, StatusPublisher& publisher,
                     RunnerStats& stats, std::vector<QueueBinding> bindings)
    : options_(std::move(options)), redis_config_(std::move(redis_config)),
      compiler_(compiler), cancels_(cancels), store_(store), publisher_(publisher),
      stats_(stats), bindings_(std::move(bindings)) {}

JobRunner::~JobRunner() {
    stop();
}

std::string JobRunner::output_url(const std::string& job_id) const {
    return options_.public_base_url + "/" + job_id + "/output";
}

void JobRunner::start() {
    if (running_.exchange(true)) {
        return;
    }
    stats_.mark_started();

    for (const auto& binding : bindings_) {
        if (binding.mode == JobMode::Ephemeral) {
            cleanup_stale_jobs(*binding.queue);
        }
    }
    store_.purge_expired();

    for (int i = 0; i < options_.concurrency; i++) {
        workers_.emplace_back(&JobRunner::worker_loop, this, i);
    }
    maintenance_thread_ = std::thread(&JobRunner::maintenance_loop, this);

    std::cout << "[Runner] Started with concurrency " << options_.concurrency << " on";
    for (const auto& binding : bindings_) {
        std::cout << " " << binding.queue->name();
    }
    std::cout << std::endl;
}

void JobRunner::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
    }
    wake_cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    if (maintenance_thread_.joinable()) {
        maintenance_thread_.join();
    }
    stats_.mark_stopped();
    std::cout << "[Runner] Stopped" << std::endl;
}

void JobRunner::worker_loop(int index) {
    // Blocking pops hold the connection, so every worker gets its own
    RedisClient blocking(redis_config_);

    while (running_) {
        for (const auto& binding : bindings_) {
            if (!running_) break;
            try {
                auto job = binding.queue->dequeue(blocking, options_.dequeue_timeout_s);
                if (job) {
                    process_job(*job, binding);
                }
            } catch (const BrokerError& e) {
                std::cerr << "[Runner] Worker " << index << " lost the broker: " << e.what()
                          << std::endl;
                std::unique_lock<std::mutex> lock(wake_mutex_);
                wake_cv_.wait_for(lock, std::chrono::seconds(2), [this] { return !running_; });
            }
        }
    }
}

void JobRunner::maintenance_loop() {
    std::unique_lock<std::mutex> lock(wake_mutex_);
    while (running_) {
        wake_cv_.wait_for(lock, options_.maintenance_interval, [this] { return !running_; });
        if (!running_) break;
        lock.unlock();
        run_maintenance();
        lock.lock();
    }
}

void JobRunner::run_maintenance() {
    try {
        store_.purge_expired();
        for (const auto& binding : bindings_) {
            binding.queue->promote_delayed();
            binding.queue->recover_stalled();
            if (binding.mode == JobMode::Ephemeral) {
                cleanup_stale_jobs(*binding.queue);
            }
        }
    } catch (const Error& e) {
        std::cerr << "[Runner] Maintenance pass failed: " << e.what() << std::endl;
    }
}

int JobRunner::cleanup_stale_jobs(JobQueue& queue) {
    int cleaned = 0;
    auto now = Clock::now();

    for (const auto& job_id : store_.list_jobs()) {
        auto record = store_.read(job_id);
        if (!record || is_terminal(record->status)) {
            continue;
        }
        if (now - record->created_at < kEnqueueGrace) {
            continue;
        }

        try {
            QueueState state = queue.state(job_id);
            if (state == QueueState::Waiting || state == QueueState::Delayed) {
                continue;
            }
            if (state == QueueState::Active) {
                auto since = queue.state_since(job_id);
                if (!since || now - *since < options_.stale_after) {
                    continue;
                }
            }

            JobPatch patch;
            patch.status = JobStatus::Error;
            patch.message = kInterrupted;
            patch.exit_code = -1;
            patch.completed_at = now;
            store_.patch(job_id, patch);
            queue.complete(job_id, true);
            cleaned++;
        } catch (const StateConflict&) {
            // Finished by its worker while we looked
            continue;
        } catch (const Error& e) {
            std::cerr << "[Runner] Failed to clean stale job " << job_id << ": " << e.what()
                      << std::endl;
        }
    }

    if (cleaned > 0) {
        std::cout << "[Runner] Cleaned " << cleaned << " stale job(s) from a previous worker"
                  << std::endl;
    }
    return cleaned;
}

bool JobRunner::prepare_workspace(const QueuedJob& job, const QueueBinding& binding,
                                  Workspace& ws) {
    const std::string& id = job.id;
    auto current = binding.persistence->current_status(id);

    if (job.payload.mode == JobMode::Ephemeral) {
        auto record = store_.read(id);
        if (!record) {
            std::cerr << "[Runner] Job " << id << ": metadata not found or expired, dropping"
                      << std::endl;
            complete_queue_entry(binding, id, true);
            return false;
        }
        current = record->status;
        ws.work_dir = store_.job_dir(id);
        ws.main_file = record->main_file;
        ws.engine = record->requested_engine;
    }

    if (current && is_terminal(*current)) {
        std::cout << "[Runner] Job " << id << " already " << to_string(*current)
                  << ", skipping redelivery" << std::endl;
        complete_queue_entry(binding, id, false);
        return false;
    }

    if (job.payload.mode == JobMode::Project) {
        ws.project_id = job.payload.project_id;
        ws.project_dir = resolve_project_dir(options_.projects_root, job.payload.project_dir);
        ws.main_file = job.payload.main_file;
        ws.engine = job.payload.engine;

        // Compile in a private copy so concurrent edits cannot race the build
        ws.build_dir = (fs::path(options_.builds_root) / id).string();
        remove_build_dir(ws.build_dir);
        fs::create_directories(ws.build_dir);
        fs::copy(ws.project_dir, ws.build_dir,
                 fs::copy_options::recursive | fs::copy_options::overwrite_existing);
        ws.work_dir = ws.build_dir;
    }
    return true;
}

void JobRunner::process_job(const QueuedJob& job, const QueueBinding& binding) {
    auto start_time = std::chrono::steady_clock::now();
    const std::string& id = job.id;
    std::cout << "[Runner] Job " << id << " active (" << to_string(job.payload.mode) << ")"
              << std::endl;

    Workspace ws;
    try {
        if (!prepare_workspace(job, binding, ws)) {
            return;
        }
    } catch (const std::exception& e) {
        std::cerr << "[Runner] Job " << id << " could not be prepared: " << e.what() << std::endl;
        fail_job(job, binding, job.payload.project_id, e.what(), elapsed_ms(start_time));
        stats_.record_job_failure(id);
        remove_build_dir(ws.build_dir);
        return;
    }

    stats_.record_job_start(id);
    try {
        if (cancels_.is_canceled(id)) {
            finish_canceled_before_start(job, binding, ws);
            stats_.record_job_complete(id, JobStatus::Canceled);
            remove_build_dir(ws.build_dir);
            return;
        }

        CompileRequest request;
        request.job_id = id;
        request.work_dir = ws.work_dir;
        request.main_file = ws.main_file;
        request.engine = ws.engine;

        // Recorded before the container exists so a timeout still reports it
        Engine engine = Compiler::resolve_engine(request);
        JobPatch starting;
        starting.engine_used = engine;
        starting.started_at = Clock::now();
        try {
            binding.persistence->on_status_change(id, JobStatus::Compiling, starting);
        } catch (const StateConflict& e) {
            std::cout << "[Runner] Job " << id << " is no longer runnable: " << e.what()
                      << std::endl;
            complete_queue_entry(binding, id, false);
            stats_.record_job_skipped(id);
            remove_build_dir(ws.build_dir);
            return;
        }
        StatusEvent compiling;
        compiling.job_id = id;
        compiling.project_id = ws.project_id;
        compiling.status = JobStatus::Compiling;
        publisher_.publish(compiling);

        RunOutcome outcome = compiler_.run(request, engine, [this, &id] {
            return cancels_.is_canceled(id);
        });
        std::cout << "[Runner] Container finished for job " << id << ", processing results..."
                  << std::endl;

        LogSummary summary = summarize_log(outcome.logs);
        JobStatus status = determine_status(outcome, summary.error_count);

        JobPatch done;
        done.engine_used = engine;
        done.logs = outcome.canceled ? kCanceledLogs : outcome.logs;
        done.entries = summary.entries;
        done.error_count = summary.error_count;
        done.warning_count = summary.warning_count;
        done.duration_ms = elapsed_ms(start_time);
        done.exit_code = outcome.exit_code;
        done.completed_at = Clock::now();
        if (status == JobStatus::Canceled) {
            done.message = kCanceledLogs;
        } else if (status == JobStatus::Timeout) {
            done.message = "Compilation timed out after " + format_timeout(compiler_.limits().timeout);
        } else if (outcome.infrastructure_error) {
            done.message = "Compilation infrastructure error: " + *outcome.infrastructure_error;
        }

        std::optional<std::string> pdf_url;
        std::string artifact_hash;
        if (outcome.pdf_path) {
            artifact_hash = compute_file_hash(*outcome.pdf_path);
            done.artifact_hash = artifact_hash;
            std::string pdf_name = pdf_name_for(ws.main_file);
            if (job.payload.mode == JobMode::Project) {
                fs::path target = fs::path(ws.project_dir) / pdf_name;
                fs::create_directories(target.parent_path());
                fs::copy_file(*outcome.pdf_path, target, fs::copy_options::overwrite_existing);
                pdf_url = "/api/projects/" + ws.project_id + "/pdf";
            } else {
                pdf_url = output_url(id);
            }
            done.pdf_file = pdf_name;
        }

        binding.persistence->on_status_change(id, status, done);

        StatusEvent event;
        event.job_id = id;
        event.project_id = ws.project_id;
        event.status = status;
        event.logs = *done.logs;
        event.duration_ms = done.duration_ms;
        if (!outcome.canceled) {
            event.errors = only_errors(summary.entries);
        }
        event.pdf_url = pdf_url;
        event.artifact_hash = artifact_hash;
        publisher_.publish(event);

        complete_queue_entry(binding, id, status != JobStatus::Success);
        cancels_.clear(id);
        stats_.record_job_complete(id, status);
        std::cout << "[Runner] Job " << id << " completed with status=" << to_string(status)
                  << " in " << *done.duration_ms << "ms" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[Runner] Job " << id << " failed: " << e.what() << std::endl;
        fail_job(job, binding, ws.project_id, e.what(), elapsed_ms(start_time));
        stats_.record_job_failure(id);
    }
    remove_build_dir(ws.build_dir);
}

void JobRunner::finish_canceled_before_start(const QueuedJob& job, const QueueBinding& binding,
                                             const Workspace& ws) {
    std::cout << "[Runner] Job " << job.id << " canceled before start" << std::endl;
    JobPatch patch;
    patch.message = kCanceledBeforeStart;
    patch.logs = kCanceledBeforeStart;
    patch.exit_code = -1;
    patch.completed_at = Clock::now();
    try {
        binding.persistence->on_status_change(job.id, JobStatus::Canceled, patch);
    } catch (const StateConflict& e) {
        // Already marked by whoever accepted the cancel
        std::cout << "[Runner] Job " << job.id << ": " << e.what() << std::endl;
    }

    StatusEvent event;
    event.job_id = job.id;
    event.project_id = ws.project_id;
    event.status = JobStatus::Canceled;
    event.logs = kCanceledBeforeStart;
    publisher_.publish(event);

    complete_queue_entry(binding, job.id, true);
    cancels_.clear(job.id);
}

void JobRunner::fail_job(const QueuedJob& job, const QueueBinding& binding,
                         const std::string& project_id, const std::string& error,
                         int64_t duration_ms) {
    std::string message = "Compilation infrastructure error: " + error;

    JobPatch patch;
    patch.message = message;
    patch.logs = "Internal compilation error: " + error;
    patch.exit_code = -1;
    patch.duration_ms = duration_ms;
    patch.completed_at = Clock::now();
    try {
        binding.persistence->on_status_change(job.id, JobStatus::Error, patch);
    } catch (const std::exception& e) {
        std::cerr << "[Runner] Job " << job.id << ": could not record failure: " << e.what()
                  << std::endl;
    }

    StatusEvent event;
    event.job_id = job.id;
    event.project_id = project_id;
    event.status = JobStatus::Error;
    event.logs = *patch.logs;
    event.duration_ms = duration_ms;
    event.errors.push_back({LogEntryType::Error, "system", 0, message});
    publisher_.publish(event);

    complete_queue_entry(binding, job.id, true);
}

void JobRunner::complete_queue_entry(const QueueBinding& binding, const std::string& job_id,
                                     bool failed) {
    try {
        binding.queue->complete(job_id, failed);
    } catch (const BrokerError& e) {
        std::cerr << "[Runner] Job " << job_id << ": could not complete queue entry: "
                  << e.what() << std::endl;
    }
}

} // namespace texq::worker
