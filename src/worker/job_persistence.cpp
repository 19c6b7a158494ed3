#include "job_persistence.h"
#include "errors.h"
#include "json_codec.h"

using json = nlohmann::json;

namespace texq::worker {

void StorePersistence::on_status_change(const std::string& job_id, JobStatus status,
                                        const JobPatch& fields) {
    JobPatch patch = fields;
    patch.status = status;
    if (fields.logs) {
        patch.logs_file = store_.write_logs(job_id, *fields.logs);
    }
    if (fields.entries) {
        patch.errors_file = store_.write_errors(job_id, *fields.entries);
    }
    store_.patch(job_id, patch);
}

std::optional<JobStatus> StorePersistence::current_status(const std::string& job_id) {
    auto record = store_.read(job_id);
    if (!record) {
        return std::nullopt;
    }
    return record->status;
}

BuildRecordPersistence::BuildRecordPersistence(RedisClient& redis, std::string key_prefix,
                                               int retention_seconds)
    : redis_(redis), key_prefix_(std::move(key_prefix)), retention_seconds_(retention_seconds) {}

std::string BuildRecordPersistence::key_for(const std::string& job_id) const {
    return key_prefix_ + ":build:" + job_id;
}

std::map<std::string, std::string> BuildRecordPersistence::read(const std::string& job_id) {
    return redis_.hgetall(key_for(job_id));
}

std::optional<JobStatus> BuildRecordPersistence::current_status(const std::string& job_id) {
    auto fields = read(job_id);
    auto it = fields.find("status");
    if (it == fields.end()) {
        return std::nullopt;
    }
    return parse_status(it->second);
}

void BuildRecordPersistence::on_status_change(const std::string& job_id, JobStatus status,
                                              const JobPatch& fields) {
    auto current = current_status(job_id);
    if (current && !can_transition(*current, status)) {
        throw StateConflict(std::string("Illegal status change ") + to_string(*current) +
                            " -> " + to_string(status) + " for build " + job_id);
    }

    std::map<std::string, std::string> values;
    values["status"] = to_string(status);
    values["schemaVersion"] = std::to_string(kStatusSchemaVersion);
    if (fields.engine_used) values["engineUsed"] = to_string(*fields.engine_used);
    if (fields.pdf_file) values["pdfFile"] = *fields.pdf_file;
    if (fields.artifact_hash) values["artifactHash"] = *fields.artifact_hash;
    if (fields.warning_count) values["warningCount"] = std::to_string(*fields.warning_count);
    if (fields.error_count) values["errorCount"] = std::to_string(*fields.error_count);
    if (fields.duration_ms) values["durationMs"] = std::to_string(*fields.duration_ms);
    if (fields.exit_code) values["exitCode"] = std::to_string(*fields.exit_code);
    if (fields.message) values["message"] = *fields.message;
    if (fields.started_at) values["startedAt"] = format_timestamp(*fields.started_at);
    if (fields.completed_at) values["completedAt"] = format_timestamp(*fields.completed_at);
    if (fields.logs) values["logs"] = *fields.logs;
    if (fields.entries) {
        values["errors"] = json(*fields.entries).dump(-1, ' ', false,
                                                      json::error_handler_t::replace);
    }

    redis_.hset(key_for(job_id), values);
    redis_.expire(key_for(job_id), retention_seconds_);
}

} // namespace texq::worker
