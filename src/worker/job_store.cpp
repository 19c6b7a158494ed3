#include "job_store.h"
#include "errors.h"
#include "json_codec.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace texq::worker {

namespace {

constexpr const char* kMetadataFile = "metadata.json";
constexpr const char* kLogsFile = "compile.log";
constexpr const char* kErrorsFile = "errors.json";

std::optional<std::string> read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }
    return std::string((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
}

// Write to a sibling temp file and rename over the target
void write_file_atomic(const fs::path& path, const std::string& data) {
    fs::path tmp = path;
    tmp += ".tmp-" + std::to_string(getpid());
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw InfrastructureUnavailable("Cannot write " + tmp.string());
        }
        out << data;
        out.flush();
        if (!out) {
            throw InfrastructureUnavailable("Short write to " + tmp.string());
        }
    }
    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw InfrastructureUnavailable("Cannot replace " + path.string());
    }
}

} // namespace

JobStore::JobStore(std::string root, std::chrono::minutes ttl, NowFn now)
    : root_(std::move(root)), ttl_(ttl), now_(std::move(now)) {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        std::cerr << "[Store] Cannot create " << root_ << ": " << ec.message() << std::endl;
    }
}

std::string JobStore::job_dir(const std::string& job_id) const {
    return (fs::path(root_) / job_id).string();
}

std::string JobStore::pdf_path(const std::string& job_id, const std::string& main_file) const {
    return (fs::path(job_dir(job_id)) / pdf_name_for(main_file)).string();
}

bool JobStore::expired(const JobRecord& record) const {
    return now_() >= record.expires_at;
}

std::optional<JobRecord> JobStore::load(const std::string& job_id) const {
    auto text = read_file(fs::path(job_dir(job_id)) / kMetadataFile);
    if (!text) {
        return std::nullopt;
    }
    json j = json::parse(*text, nullptr, false);
    if (j.is_discarded()) {
        std::cerr << "[Store] Unparseable metadata for " << job_id << std::endl;
        return std::nullopt;
    }
    try {
        return record_from_json(j);
    } catch (const ValidationError& e) {
        std::cerr << "[Store] Rejecting metadata for " << job_id << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

void JobStore::save(const JobRecord& record) const {
    JobRecord current = record;
    current.schema_version = kStatusSchemaVersion;
    write_file_atomic(fs::path(job_dir(record.id)) / kMetadataFile,
                      record_to_json(current).dump(2, ' ', false, json::error_handler_t::replace));
}

JobRecord JobStore::create(const std::string& job_id, const std::string& source,
                           Engine requested_engine, const std::string& main_file,
                           const std::string& user_id) {
    validate_job_id(job_id);
    validate_main_file(main_file);

    std::lock_guard<std::mutex> lock(mutex_);
    fs::path dir = job_dir(job_id);
    std::error_code ec;
    if (fs::exists(dir / kMetadataFile, ec)) {
        throw StateConflict("Compile job " + job_id + " already exists");
    }

    fs::path source_path = dir / main_file;
    fs::create_directories(source_path.parent_path(), ec);
    if (ec) {
        throw InfrastructureUnavailable("Cannot create job directory: " + ec.message());
    }
    write_file_atomic(source_path, source);

    JobRecord record;
    record.id = job_id;
    record.user_id = user_id;
    record.status = JobStatus::Queued;
    record.requested_engine = requested_engine;
    record.main_file = main_file;
    record.source_file = main_file;
    record.created_at = now_();
    record.expires_at = record.created_at + ttl_;
    save(record);
    return record;
}

JobRecord JobStore::patch(const std::string& job_id, const JobPatch& patch) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto loaded = load(job_id);
    if (!loaded) {
        throw StateConflict("Compile job " + job_id + " not found");
    }
    JobRecord record = *loaded;

    if (patch.status) {
        if (!can_transition(record.status, *patch.status)) {
            throw StateConflict(std::string("Illegal status change ") + to_string(record.status) +
                                " -> " + to_string(*patch.status) + " for " + job_id);
        }
        record.status = *patch.status;
    }
    if (patch.engine_used) record.engine_used = patch.engine_used;
    if (patch.pdf_file) record.pdf_file = *patch.pdf_file;
    if (patch.logs_file) record.logs_file = *patch.logs_file;
    if (patch.errors_file) record.errors_file = *patch.errors_file;
    if (patch.artifact_hash) record.artifact_hash = *patch.artifact_hash;
    if (patch.warning_count) record.warning_count = *patch.warning_count;
    if (patch.error_count) record.error_count = *patch.error_count;
    if (patch.duration_ms) record.duration_ms = patch.duration_ms;
    if (patch.exit_code) record.exit_code = patch.exit_code;
    if (patch.message) record.message = *patch.message;
    if (patch.started_at) record.started_at = patch.started_at;
    if (patch.completed_at) record.completed_at = patch.completed_at;

    // Results stay readable for a full TTL after completion
    if (patch.status && is_terminal(*patch.status)) {
        if (!record.completed_at) {
            record.completed_at = now_();
        }
        record.expires_at = *record.completed_at + ttl_;
    }

    save(record);
    return record;
}

void JobStore::remove(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    fs::remove_all(job_dir(job_id), ec);
    if (ec) {
        std::cerr << "[Store] Failed to remove " << job_id << ": " << ec.message() << std::endl;
    }
}

std::optional<JobRecord> JobStore::read(const std::string& job_id) {
    auto record = load(job_id);
    if (!record || expired(*record)) {
        return std::nullopt;
    }
    return record;
}

std::string JobStore::write_logs(const std::string& job_id, const std::string& logs) {
    write_file_atomic(fs::path(job_dir(job_id)) / kLogsFile, logs);
    return kLogsFile;
}

std::optional<std::string> JobStore::read_logs(const std::string& job_id) {
    auto record = read(job_id);
    if (!record || record->logs_file.empty()) {
        return std::nullopt;
    }
    return read_file(fs::path(job_dir(job_id)) / record->logs_file);
}

std::string JobStore::write_errors(const std::string& job_id,
                                   const std::vector<ParsedLogEntry>& entries) {
    json j = entries;
    write_file_atomic(fs::path(job_dir(job_id)) / kErrorsFile,
                      j.dump(2, ' ', false, json::error_handler_t::replace));
    return kErrorsFile;
}

std::optional<std::vector<ParsedLogEntry>> JobStore::read_errors(const std::string& job_id) {
    auto record = read(job_id);
    if (!record || record->errors_file.empty()) {
        return std::nullopt;
    }
    auto text = read_file(fs::path(job_dir(job_id)) / record->errors_file);
    if (!text) {
        return std::nullopt;
    }
    json j = json::parse(*text, nullptr, false);
    if (j.is_discarded()) {
        return std::nullopt;
    }
    try {
        return j.get<std::vector<ParsedLogEntry>>();
    } catch (const json::exception& e) {
        std::cerr << "[Store] Malformed errors file for " << job_id << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

std::optional<std::string> JobStore::read_pdf(const std::string& job_id) {
    auto record = read(job_id);
    if (!record || record->pdf_file.empty()) {
        return std::nullopt;
    }
    return read_file(fs::path(job_dir(job_id)) / record->pdf_file);
}

std::vector<std::string> JobStore::list_jobs() const {
    std::vector<std::string> ids;
    std::error_code ec;
    for (fs::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_directory(ec)) {
            ids.push_back(it->path().filename().string());
        }
    }
    return ids;
}

std::vector<std::string> JobStore::expired_jobs() {
    std::vector<std::string> expired_ids;
    for (const auto& job_id : list_jobs()) {
        auto record = load(job_id);
        if (record) {
            if (expired(*record)) {
                expired_ids.push_back(job_id);
            }
            continue;
        }

        // No readable metadata: may be mid-create, so only reap old directories
        std::error_code ec;
        auto mtime = fs::last_write_time(job_dir(job_id), ec);
        if (ec) continue;
        auto age = fs::file_time_type::clock::now() - mtime;
        if (age > ttl_) {
            expired_ids.push_back(job_id);
        }
    }
    return expired_ids;
}

int JobStore::purge_expired() {
    int purged = 0;
    for (const auto& job_id : expired_jobs()) {
        remove(job_id);
        purged++;
    }
    if (purged > 0) {
        std::cout << "[Store] Purged " << purged << " expired compile job(s)" << std::endl;
    }
    return purged;
}

} // namespace texq::worker
