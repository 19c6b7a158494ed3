#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace texq {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Job lifecycle. Order matters: a job only moves forward.
enum class JobStatus { Queued, Compiling, Success, Error, Timeout, Canceled };

// Version of the persisted status vocabulary. Schema 1 knew only
// queued/compiling/success/error; schema 2 added timeout and canceled.
constexpr int kStatusSchemaVersion = 2;

enum class Engine { Auto, Pdflatex, Xelatex, Lualatex, Latex };

enum class JobMode { Ephemeral, Project };

enum class LogEntryType { Error, Warning, Info };

struct ParsedLogEntry {
    LogEntryType type;
    std::string file;
    int line;
    std::string message;

    bool operator==(const ParsedLogEntry& other) const {
        return type == other.type && file == other.file &&
               line == other.line && message == other.message;
    }
};

// Queue payload. Inline source is staged in the job store before enqueue,
// so only project jobs carry a path.
struct JobPayload {
    std::string job_id;
    JobMode mode = JobMode::Ephemeral;
    std::string user_id;
    std::string project_id;
    std::string project_dir;
    std::string main_file = "main.tex";
    Engine engine = Engine::Auto;
};

// Metadata of a job as persisted by the ephemeral store.
struct JobRecord {
    std::string id;
    std::string user_id;
    JobStatus status = JobStatus::Queued;
    Engine requested_engine = Engine::Auto;
    std::optional<Engine> engine_used;
    std::string main_file = "main.tex";
    std::string source_file;
    std::string pdf_file;
    std::string logs_file;
    std::string errors_file;
    std::string artifact_hash;
    int warning_count = 0;
    int error_count = 0;
    std::optional<int64_t> duration_ms;
    std::optional<int> exit_code;
    std::string message;
    TimePoint created_at;
    std::optional<TimePoint> started_at;
    std::optional<TimePoint> completed_at;
    TimePoint expires_at;
    int schema_version = kStatusSchemaVersion;
};

// Fields carried alongside a status change. Unset fields are left untouched.
struct JobPatch {
    std::optional<JobStatus> status;
    std::optional<Engine> engine_used;
    std::optional<std::string> pdf_file;
    std::optional<std::string> logs_file;
    std::optional<std::string> errors_file;
    std::optional<std::string> artifact_hash;
    std::optional<int> warning_count;
    std::optional<int> error_count;
    std::optional<int64_t> duration_ms;
    std::optional<int> exit_code;
    std::optional<std::string> message;
    std::optional<TimePoint> started_at;
    std::optional<TimePoint> completed_at;

    // Raw transcript and parsed diagnostics. File-backed persistence turns
    // these into logs_file/errors_file.
    std::optional<std::string> logs;
    std::optional<std::vector<ParsedLogEntry>> entries;
};

const char* to_string(JobStatus status);
std::optional<JobStatus> parse_status(const std::string& name,
                                      int schema_version = kStatusSchemaVersion);
bool is_terminal(JobStatus status);
bool can_transition(JobStatus from, JobStatus to);

const char* to_string(Engine engine);
std::optional<Engine> parse_engine(const std::string& name);
// Throws ValidationError listing the accepted names.
Engine require_engine(const std::string& name);
// latexmk switch selecting the engine. Auto has none.
const char* latexmk_flag(Engine engine);

const char* to_string(LogEntryType type);
std::optional<LogEntryType> parse_log_entry_type(const std::string& name);

const char* to_string(JobMode mode);

// Throw ValidationError when the value cannot safely name a directory or key.
void validate_job_id(const std::string& job_id);
void validate_main_file(const std::string& main_file);

// "chapter/main.tex" -> "chapter/main.pdf"
std::string pdf_name_for(const std::string& main_file);

std::string serialize_payload(const JobPayload& payload);
// Throws ValidationError on malformed payloads.
JobPayload parse_payload(const std::string& data);

std::string format_timestamp(TimePoint tp);
std::optional<TimePoint> parse_timestamp(const std::string& text);
int64_t to_epoch_ms(TimePoint tp);

} // namespace texq
