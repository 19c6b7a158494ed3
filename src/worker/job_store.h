#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "job.h"

namespace texq::worker {

// File-backed store for one-shot compile jobs. Each job owns a directory
// under the root holding metadata.json, the staged source, the raw log,
// the parsed diagnostics and the PDF. Every record expires; after that it
// reads as absent and the reaper deletes it.
class JobStore {
public:
    using NowFn = std::function<TimePoint()>;

    JobStore(std::string root, std::chrono::minutes ttl, NowFn now = Clock::now);

    // Stages the source and writes a queued record. Throws StateConflict
    // when the id already exists.
    JobRecord create(const std::string& job_id, const std::string& source,
                     Engine requested_engine, const std::string& main_file = "main.tex",
                     const std::string& user_id = "");

    // Applies the set fields. Throws StateConflict on a missing record or a
    // status change that would move the job backwards.
    JobRecord patch(const std::string& job_id, const JobPatch& patch);

    // Deletes the job directory. No-op when absent.
    void remove(const std::string& job_id);

    // nullopt when missing, expired or unreadable
    std::optional<JobRecord> read(const std::string& job_id);

    std::string write_logs(const std::string& job_id, const std::string& logs);
    std::optional<std::string> read_logs(const std::string& job_id);

    std::string write_errors(const std::string& job_id, const std::vector<ParsedLogEntry>& entries);
    std::optional<std::vector<ParsedLogEntry>> read_errors(const std::string& job_id);

    std::optional<std::string> read_pdf(const std::string& job_id);

    std::string job_dir(const std::string& job_id) const;
    std::string pdf_path(const std::string& job_id, const std::string& main_file) const;

    std::vector<std::string> list_jobs() const;
    // Jobs past expires_at, and directories whose metadata cannot be read
    // once they are older than the TTL.
    std::vector<std::string> expired_jobs();
    int purge_expired();

    std::chrono::minutes ttl() const { return ttl_; }
    const std::string& root() const { return root_; }

private:
    std::optional<JobRecord> load(const std::string& job_id) const;
    void save(const JobRecord& record) const;
    bool expired(const JobRecord& record) const;

    std::string root_;
    std::chrono::minutes ttl_;
    NowFn now_;
    mutable std::mutex mutex_;
};

} // namespace texq::worker
