#include "job.h"
#include "errors.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace texq {

const char* to_string(JobStatus status) {
    switch (status) {
        case JobStatus::Queued: return "queued";
        case JobStatus::Compiling: return "compiling";
        case JobStatus::Success: return "success";
        case JobStatus::Error: return "error";
        case JobStatus::Timeout: return "timeout";
        case JobStatus::Canceled: return "canceled";
    }
    return "error";
}

std::optional<JobStatus> parse_status(const std::string& name, int schema_version) {
    if (name == "queued") return JobStatus::Queued;
    if (name == "compiling") return JobStatus::Compiling;
    if (name == "success") return JobStatus::Success;
    if (name == "error") return JobStatus::Error;
    if (schema_version >= 2) {
        if (name == "timeout") return JobStatus::Timeout;
        if (name == "canceled") return JobStatus::Canceled;
    }
    return std::nullopt;
}

bool is_terminal(JobStatus status) {
    return status == JobStatus::Success || status == JobStatus::Error ||
           status == JobStatus::Timeout || status == JobStatus::Canceled;
}

bool can_transition(JobStatus from, JobStatus to) {
    if (is_terminal(from)) return false;
    switch (from) {
        case JobStatus::Queued:
            // A queued job may be canceled or fail on infrastructure before it starts.
            return to == JobStatus::Queued || to == JobStatus::Compiling ||
                   to == JobStatus::Canceled || to == JobStatus::Error;
        case JobStatus::Compiling:
            return to == JobStatus::Compiling || is_terminal(to);
        default:
            return false;
    }
}

const char* to_string(Engine engine) {
    switch (engine) {
        case Engine::Auto: return "auto";
        case Engine::Pdflatex: return "pdflatex";
        case Engine::Xelatex: return "xelatex";
        case Engine::Lualatex: return "lualatex";
        case Engine::Latex: return "latex";
    }
    return "auto";
}

std::optional<Engine> parse_engine(const std::string& name) {
    if (name == "auto") return Engine::Auto;
    if (name == "pdflatex") return Engine::Pdflatex;
    if (name == "xelatex") return Engine::Xelatex;
    if (name == "lualatex") return Engine::Lualatex;
    if (name == "latex") return Engine::Latex;
    return std::nullopt;
}

Engine require_engine(const std::string& name) {
    auto engine = parse_engine(name);
    if (!engine) {
        throw ValidationError("Invalid engine. Use one of: auto, pdflatex, xelatex, lualatex, latex");
    }
    return *engine;
}

const char* latexmk_flag(Engine engine) {
    switch (engine) {
        case Engine::Latex: return "-pdfdvi";
        case Engine::Pdflatex: return "-pdf";
        case Engine::Xelatex: return "-xelatex";
        case Engine::Lualatex: return "-lualatex";
        case Engine::Auto: return "";
    }
    return "";
}

const char* to_string(LogEntryType type) {
    switch (type) {
        case LogEntryType::Error: return "error";
        case LogEntryType::Warning: return "warning";
        case LogEntryType::Info: return "info";
    }
    return "info";
}

std::optional<LogEntryType> parse_log_entry_type(const std::string& name) {
    if (name == "error") return LogEntryType::Error;
    if (name == "warning") return LogEntryType::Warning;
    if (name == "info") return LogEntryType::Info;
    return std::nullopt;
}

const char* to_string(JobMode mode) {
    return mode == JobMode::Project ? "project" : "ephemeral";
}

void validate_job_id(const std::string& job_id) {
    if (job_id.empty() || job_id.size() > 128) {
        throw ValidationError("Job id must be 1-128 characters");
    }
    for (char c : job_id) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            throw ValidationError("Job id may only contain letters, digits, '-' and '_'");
        }
    }
}

void validate_main_file(const std::string& main_file) {
    if (main_file.empty() || main_file.size() > 500) {
        throw ValidationError("Main file path must be 1-500 characters");
    }
    if (main_file.front() == '/' || main_file.find('\\') != std::string::npos) {
        throw ValidationError("Main file must be a relative path");
    }
    std::stringstream ss(main_file);
    std::string segment;
    while (std::getline(ss, segment, '/')) {
        if (segment.empty() || segment == "." || segment == "..") {
            throw ValidationError("Malformed main file path: " + main_file);
        }
    }
    if (main_file.size() < 5 || main_file.compare(main_file.size() - 4, 4, ".tex") != 0) {
        throw ValidationError("Main file must be a .tex file");
    }
}

std::string pdf_name_for(const std::string& main_file) {
    std::string name = main_file;
    if (name.size() >= 4) {
        std::string ext = name.substr(name.size() - 4);
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        if (ext == ".tex") {
            name.resize(name.size() - 4);
        }
    }
    return name + ".pdf";
}

std::string serialize_payload(const JobPayload& payload) {
    json j;
    j["jobId"] = payload.job_id;
    j["mode"] = to_string(payload.mode);
    j["userId"] = payload.user_id;
    j["engine"] = to_string(payload.engine);
    j["mainFile"] = payload.main_file;
    if (payload.mode == JobMode::Project) {
        j["projectId"] = payload.project_id;
        j["projectDir"] = payload.project_dir;
    }
    return j.dump();
}

JobPayload parse_payload(const std::string& data) {
    json j = json::parse(data, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw ValidationError("Malformed job payload");
    }

    JobPayload payload;
    try {
        payload.job_id = j.at("jobId").get<std::string>();
        std::string mode = j.value("mode", "ephemeral");
        if (mode == "project") {
            payload.mode = JobMode::Project;
        } else if (mode == "ephemeral") {
            payload.mode = JobMode::Ephemeral;
        } else {
            throw ValidationError("Unknown job mode: " + mode);
        }
        payload.user_id = j.value("userId", "");
        payload.project_id = j.value("projectId", "");
        payload.project_dir = j.value("projectDir", "");
        payload.main_file = j.value("mainFile", "main.tex");
        payload.engine = require_engine(j.value("engine", "auto"));
    } catch (const json::exception& e) {
        throw ValidationError(std::string("Malformed job payload: ") + e.what());
    }

    validate_job_id(payload.job_id);
    validate_main_file(payload.main_file);
    if (payload.mode == JobMode::Project && payload.project_dir.empty()) {
        throw ValidationError("Project job without project directory");
    }
    return payload;
}

std::string format_timestamp(TimePoint tp) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    int millis = static_cast<int>(ms % 1000);
    if (millis < 0) {
        millis += 1000;
        secs -= 1;
    }
    std::tm tm_utc{};
    gmtime_r(&secs, &tm_utc);

    std::ostringstream ss;
    ss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S") << '.'
       << std::setw(3) << std::setfill('0') << millis << 'Z';
    return ss.str();
}

std::optional<TimePoint> parse_timestamp(const std::string& text) {
    std::tm tm_utc{};
    std::istringstream ss(text);
    ss >> std::get_time(&tm_utc, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }

    int millis = 0;
    if (ss.peek() == '.') {
        ss.get();
        std::string digits;
        while (std::isdigit(ss.peek())) {
            digits.push_back(static_cast<char>(ss.get()));
        }
        digits.resize(3, '0');
        millis = std::stoi(digits);
    }

    std::time_t secs = timegm(&tm_utc);
    return Clock::time_point(std::chrono::seconds(secs)) + std::chrono::milliseconds(millis);
}

int64_t to_epoch_ms(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace texq
