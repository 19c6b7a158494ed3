#pragma once

#include <map>
#include <string>

#include "job.h"
#include "job_store.h"
#include "redis_client.h"

namespace texq::worker {

// Called by the runner at every status transition of a job it owns.
// Implementations throw StateConflict for transitions that would move a
// job backwards.
class JobPersistence {
public:
    virtual ~JobPersistence() = default;

    virtual void on_status_change(const std::string& job_id, JobStatus status,
                                  const JobPatch& fields) = 0;

    // Current status, nullopt when the job has no record
    virtual std::optional<JobStatus> current_status(const std::string& job_id) = 0;
};

// One-shot jobs: writes the ephemeral job store
class StorePersistence : public JobPersistence {
public:
    explicit StorePersistence(JobStore& store) : store_(store) {}

    void on_status_change(const std::string& job_id, JobStatus status,
                          const JobPatch& fields) override;
    std::optional<JobStatus> current_status(const std::string& job_id) override;

private:
    JobStore& store_;
};

// Project builds: writes a Redis hash per build that the web tier copies
// into its own records.
class BuildRecordPersistence : public JobPersistence {
public:
    BuildRecordPersistence(RedisClient& redis, std::string key_prefix,
                           int retention_seconds = 86400);

    void on_status_change(const std::string& job_id, JobStatus status,
                          const JobPatch& fields) override;
    std::optional<JobStatus> current_status(const std::string& job_id) override;

    std::map<std::string, std::string> read(const std::string& job_id);
    std::string key_for(const std::string& job_id) const;

private:
    RedisClient& redis_;
    std::string key_prefix_;
    int retention_seconds_;
};

} // namespace texq::worker
