#include "json_codec.h"
#include "errors.h"

using json = nlohmann::json;

namespace texq {

namespace {

void put_time(json& j, const char* key, const std::optional<TimePoint>& tp) {
    if (tp) {
        j[key] = format_timestamp(*tp);
    } else {
        j[key] = nullptr;
    }
}

TimePoint require_time(const json& j, const char* key) {
    auto tp = parse_timestamp(j.at(key).get<std::string>());
    if (!tp) {
        throw ValidationError(std::string("Bad timestamp in ") + key);
    }
    return *tp;
}

std::optional<TimePoint> optional_time(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    return require_time(j, key);
}

template <typename T>
std::optional<T> optional_value(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    return j.at(key).get<T>();
}

} // namespace

void to_json(json& j, const ParsedLogEntry& entry) {
    j = json{
        {"type", to_string(entry.type)},
        {"file", entry.file},
        {"line", entry.line},
        {"message", entry.message},
    };
}

void from_json(const json& j, ParsedLogEntry& entry) {
    auto type = parse_log_entry_type(j.at("type").get<std::string>());
    entry.type = type ? *type : LogEntryType::Info;
    entry.file = j.at("file").get<std::string>();
    entry.line = j.at("line").get<int>();
    entry.message = j.at("message").get<std::string>();
}

json record_to_json(const JobRecord& record) {
    json j;
    j["schemaVersion"] = record.schema_version;
    j["jobId"] = record.id;
    j["userId"] = record.user_id;
    j["status"] = to_string(record.status);
    j["requestedEngine"] = to_string(record.requested_engine);
    j["engineUsed"] = record.engine_used ? json(to_string(*record.engine_used)) : json(nullptr);
    j["mainFile"] = record.main_file;
    j["sourceFile"] = record.source_file;
    j["pdfFile"] = record.pdf_file;
    j["logsFile"] = record.logs_file;
    j["errorsFile"] = record.errors_file;
    j["artifactHash"] = record.artifact_hash;
    j["warningCount"] = record.warning_count;
    j["errorCount"] = record.error_count;
    j["durationMs"] = record.duration_ms ? json(*record.duration_ms) : json(nullptr);
    j["exitCode"] = record.exit_code ? json(*record.exit_code) : json(nullptr);
    j["message"] = record.message;
    j["createdAt"] = format_timestamp(record.created_at);
    put_time(j, "startedAt", record.started_at);
    put_time(j, "completedAt", record.completed_at);
    j["expiresAt"] = format_timestamp(record.expires_at);
    return j;
}

JobRecord record_from_json(const json& j) {
    if (!j.is_object()) {
        throw ValidationError("Job metadata is not an object");
    }

    JobRecord record;
    try {
        // Records written before versioning carry no schemaVersion
        record.schema_version = j.value("schemaVersion", 1);
        if (record.schema_version < 1 || record.schema_version > kStatusSchemaVersion) {
            throw ValidationError("Unsupported job metadata schema " +
                                  std::to_string(record.schema_version));
        }

        record.id = j.at("jobId").get<std::string>();
        record.user_id = j.value("userId", "");

        std::string status = j.at("status").get<std::string>();
        auto parsed = parse_status(status, record.schema_version);
        if (!parsed) {
            throw ValidationError("Status '" + status + "' is not valid in schema " +
                                  std::to_string(record.schema_version));
        }
        record.status = *parsed;

        auto requested = parse_engine(j.value("requestedEngine", "auto"));
        record.requested_engine = requested ? *requested : Engine::Auto;
        if (auto used = optional_value<std::string>(j, "engineUsed")) {
            record.engine_used = parse_engine(*used);
        }

        record.main_file = j.value("mainFile", "main.tex");
        record.source_file = j.value("sourceFile", "");
        record.pdf_file = j.value("pdfFile", "");
        record.logs_file = j.value("logsFile", "");
        record.errors_file = j.value("errorsFile", "");
        record.artifact_hash = j.value("artifactHash", "");
        record.warning_count = j.value("warningCount", 0);
        record.error_count = j.value("errorCount", 0);
        record.duration_ms = optional_value<int64_t>(j, "durationMs");
        record.exit_code = optional_value<int>(j, "exitCode");
        record.message = j.value("message", "");
        record.created_at = require_time(j, "createdAt");
        record.started_at = optional_time(j, "startedAt");
        record.completed_at = optional_time(j, "completedAt");
        record.expires_at = require_time(j, "expiresAt");
    } catch (const json::exception& e) {
        throw ValidationError(std::string("Malformed job metadata: ") + e.what());
    }
    return record;
}

} // namespace texq
