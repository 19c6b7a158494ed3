#include "compile_service_impl.h"
#include "hash_utils.h"

#include <filesystem>
#include <iostream>

namespace texq::gateway {

namespace {

const char* terminal_error_message(JobStatus status) {
    switch (status) {
        case JobStatus::Timeout: return "Compilation timed out";
        case JobStatus::Canceled: return "Compilation canceled";
        default: return "Compilation failed";
    }
}

void fill_entry(api::LogEntry* out, const ParsedLogEntry& entry) {
    out->set_type(to_string(entry.type));
    out->set_file(entry.file);
    out->set_line(entry.line);
    out->set_message(entry.message);
}

} // namespace

api::JobStatus to_proto(JobStatus status) {
    switch (status) {
        case JobStatus::Queued: return api::JOB_STATUS_QUEUED;
        case JobStatus::Compiling: return api::JOB_STATUS_COMPILING;
        case JobStatus::Success: return api::JOB_STATUS_SUCCESS;
        case JobStatus::Error: return api::JOB_STATUS_ERROR;
        case JobStatus::Timeout: return api::JOB_STATUS_TIMEOUT;
        case JobStatus::Canceled: return api::JOB_STATUS_CANCELED;
    }
    return api::JOB_STATUS_UNSPECIFIED;
}

grpc::Status to_grpc_status(const Error& error) {
    switch (error.kind()) {
        case ErrorKind::Validation:
            return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, error.what());
        case ErrorKind::InfrastructureUnavailable:
        case ErrorKind::Broker:
            return grpc::Status(grpc::StatusCode::UNAVAILABLE, error.what());
        case ErrorKind::StateConflict:
            return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, error.what());
        case ErrorKind::Config:
            return grpc::Status(grpc::StatusCode::INTERNAL, error.what());
    }
    return grpc::Status(grpc::StatusCode::INTERNAL, error.what());
}

CompileServiceImpl::CompileServiceImpl(const Config& config, RedisClient& redis,
                                       worker::JobStore& store, worker::JobQueue& queue,
                                       worker::StatusPublisher& publisher,
                                       worker::HealthStrategy health,
                                       worker::ContainerRuntime* runtime)
    : config_(config), redis_(redis), store_(store), queue_(queue), publisher_(publisher),
      health_(std::move(health)), runtime_(runtime) {}

std::optional<JobRecord> CompileServiceImpl::find_job(const std::string& job_id) {
    validate_job_id(job_id);
    return store_.read(job_id);
}

void CompileServiceImpl::publish_status(const std::string& job_id, JobStatus status,
                                        const std::string& logs) {
    worker::StatusEvent event;
    event.job_id = job_id;
    event.status = status;
    event.logs = logs;
    publisher_.publish(event);
}

grpc::Status CompileServiceImpl::Submit(grpc::ServerContext* context,
                                        const api::SubmitRequest* request,
                                        api::SubmitResponse* response) {
    std::string job_id;
    try {
        if (request->source().empty()) {
            throw ValidationError("Source must not be empty");
        }
        if (request->source().size() > config_.max_source_bytes) {
            throw ValidationError("Source exceeds " + std::to_string(config_.max_source_bytes) +
                                  " bytes");
        }
        Engine engine = require_engine(request->engine().empty() ? "auto" : request->engine());
        std::string main_file = request->main_file().empty() ? "main.tex" : request->main_file();
        validate_main_file(main_file);
        job_id = request->job_id().empty() ? generate_uuid() : request->job_id();
        validate_job_id(job_id);

        // Refuse rather than queue work nobody will pick up
        if (config_.mode == DeploymentMode::Dedicated) {
            auto health = worker::check_health(health_);
            if (!health.healthy) {
                std::cerr << "[Gateway] Refusing " << job_id << ": " << health.detail << std::endl;
                return grpc::Status(grpc::StatusCode::UNAVAILABLE,
                                    "Compilation worker unavailable");
            }
        } else if (runtime_) {
            if (!runtime_->ping()) {
                std::cerr << "[Gateway] Refusing " << job_id << ": " << runtime_->name()
                          << " runtime unreachable" << std::endl;
                return grpc::Status(grpc::StatusCode::UNAVAILABLE,
                                    "Compilation runtime unavailable");
            }
            if (!runtime_->image_exists(config_.compiler_image)) {
                std::cerr << "[Gateway] Refusing " << job_id << ": image "
                          << config_.compiler_image << " missing" << std::endl;
                return grpc::Status(grpc::StatusCode::UNAVAILABLE,
                                    "Compiler image " + config_.compiler_image + " not available");
            }
        }

        try {
            store_.create(job_id, request->source(), engine, main_file, request->user_id());
        } catch (const StateConflict& e) {
            return grpc::Status(grpc::StatusCode::ALREADY_EXISTS, e.what());
        }

        JobPayload payload;
        payload.job_id = job_id;
        payload.mode = JobMode::Ephemeral;
        payload.user_id = request->user_id();
        payload.main_file = main_file;
        payload.engine = engine;

        bool added = false;
        try {
            added = queue_.enqueue(job_id, payload);
        } catch (const InfrastructureUnavailable&) {
            store_.remove(job_id);
            throw;
        }
        if (!added) {
            store_.remove(job_id);
            return grpc::Status(grpc::StatusCode::ALREADY_EXISTS,
                                "Compile job " + job_id + " was already submitted");
        }
    } catch (const Error& e) {
        std::cerr << "[Gateway] Submit failed: " << e.what() << std::endl;
        return to_grpc_status(e);
    }

    publish_status(job_id, JobStatus::Queued);
    std::cout << "[Gateway] Accepted compile job " << job_id << std::endl;

    std::string base = config_.public_base_url + "/" + job_id;
    response->set_job_id(job_id);
    response->set_status(api::JOB_STATUS_QUEUED);
    response->set_poll_url(base);
    response->set_output_url(base + "/output");
    response->set_cancel_url(base + "/cancel");
    return grpc::Status::OK;
}

grpc::Status CompileServiceImpl::GetJob(grpc::ServerContext* context,
                                        const api::JobRequest* request,
                                        api::JobResponse* response) {
    std::optional<JobRecord> record;
    try {
        record = find_job(request->job_id());
    } catch (const Error& e) {
        return to_grpc_status(e);
    }
    if (!record) {
        return grpc::Status(grpc::StatusCode::NOT_FOUND, "Compile job not found or expired");
    }

    response->set_job_id(record->id);
    response->set_status(to_proto(record->status));
    response->set_requested_engine(to_string(record->requested_engine));
    if (record->engine_used) {
        response->set_engine_used(to_string(*record->engine_used));
    }
    response->set_main_file(record->main_file);
    response->set_warning_count(record->warning_count);
    response->set_error_count(record->error_count);
    response->set_duration_ms(record->duration_ms.value_or(0));
    if (record->exit_code) {
        response->set_exit_code(*record->exit_code);
        response->set_has_exit_code(true);
    }
    response->set_message(record->message);
    response->set_created_at(format_timestamp(record->created_at));
    if (record->started_at) response->set_started_at(format_timestamp(*record->started_at));
    if (record->completed_at) response->set_completed_at(format_timestamp(*record->completed_at));
    response->set_expires_at(format_timestamp(record->expires_at));
    response->set_has_pdf(!record->pdf_file.empty());
    response->set_artifact_hash(record->artifact_hash);
    return grpc::Status::OK;
}

grpc::Status CompileServiceImpl::GetOutput(grpc::ServerContext* context,
                                           const api::JobRequest* request,
                                           api::OutputResponse* response) {
    std::optional<JobRecord> record;
    try {
        record = find_job(request->job_id());
    } catch (const Error& e) {
        return to_grpc_status(e);
    }
    if (!record) {
        return grpc::Status(grpc::StatusCode::NOT_FOUND, "Compile job not found or expired");
    }
    if (!is_terminal(record->status)) {
        return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION,
                            std::string("Compile job is still ") + to_string(record->status));
    }

    const std::string& job_id = record->id;
    response->set_job_id(job_id);
    response->set_status(to_proto(record->status));
    if (record->engine_used) {
        response->set_engine_used(to_string(*record->engine_used));
    }
    response->set_duration_ms(record->duration_ms.value_or(0));
    response->set_logs(store_.read_logs(job_id).value_or(record->message));
    if (auto entries = store_.read_errors(job_id)) {
        for (const auto& entry : *entries) {
            if (entry.type == LogEntryType::Error) {
                fill_entry(response->add_errors(), entry);
            }
        }
    }

    if (record->status != JobStatus::Success) {
        response->set_error(record->message.empty() ? terminal_error_message(record->status)
                                                    : record->message);
        return grpc::Status::OK;
    }

    auto pdf = store_.read_pdf(job_id);
    if (!pdf) {
        return grpc::Status(grpc::StatusCode::NOT_FOUND, "PDF not available");
    }
    response->set_pdf(*pdf);
    response->set_artifact_hash(record->artifact_hash);
    return grpc::Status::OK;
}

grpc::Status CompileServiceImpl::Cancel(grpc::ServerContext* context,
                                        const api::JobRequest* request,
                                        api::CancelResponse* response) {
    std::optional<JobRecord> record;
    try {
        record = find_job(request->job_id());
    } catch (const Error& e) {
        return to_grpc_status(e);
    }
    if (!record) {
        return grpc::Status(grpc::StatusCode::NOT_FOUND, "Compile job not found or expired");
    }

    const std::string& job_id = record->id;
    response->set_job_id(job_id);
    if (is_terminal(record->status)) {
        response->set_status(to_proto(record->status));
        response->set_message("Compile job already completed");
        return grpc::Status::OK;
    }

    auto outcome = queue_.request_cancel(job_id);
    if (!outcome.confirmed) {
        return grpc::Status(grpc::StatusCode::UNAVAILABLE, "Could not confirm cancellation");
    }
    response->set_was_queued(outcome.was_queued);
    response->set_was_running(outcome.was_running);
    response->set_status(api::JOB_STATUS_CANCELED);

    if (outcome.was_queued && !outcome.was_running) {
        // No worker will ever see it, so finish the record here
        JobPatch patch;
        patch.status = JobStatus::Canceled;
        patch.message = "Build canceled before starting.";
        patch.exit_code = -1;
        patch.completed_at = Clock::now();
        try {
            store_.patch(job_id, patch);
            publish_status(job_id, JobStatus::Canceled, *patch.message);
        } catch (const StateConflict& e) {
            std::cerr << "[Gateway] Cancel of " << job_id << " raced completion: " << e.what()
                      << std::endl;
        } catch (const Error& e) {
            return to_grpc_status(e);
        }
        response->set_message(*patch.message);
    } else {
        response->set_message("Cancel requested");
    }

    std::cout << "[Gateway] Cancel accepted for " << job_id << " (queued=" << outcome.was_queued
              << ", running=" << outcome.was_running << ")" << std::endl;
    return grpc::Status::OK;
}

grpc::Status CompileServiceImpl::Health(grpc::ServerContext* context,
                                        const api::HealthRequest* request,
                                        api::HealthResponse* response) {
    auto report = worker::check_health(health_);
    response->set_healthy(report.healthy);
    response->set_mode(to_string(report.mode));
    response->set_detail(report.detail);
    if (report.runner) {
        response->set_active_jobs(report.runner->active_jobs);
        response->set_max_concurrent(report.runner->max_concurrent);
        response->set_total_processed(report.runner->total_processed);
        response->set_total_errors(report.runner->total_errors);
        response->set_uptime_ms(report.runner->uptime_ms);
    }
    if (report.heartbeat_age_ms) {
        response->set_heartbeat_age_ms(*report.heartbeat_age_ms);
    }

    if (request->diagnostic()) {
        response->set_redis_connected(redis_.ping());
        try {
            auto counts = queue_.counts();
            response->set_queue_waiting(counts.waiting);
            response->set_queue_active(counts.active);
        } catch (const BrokerError& e) {
            std::cerr << "[Gateway] Queue counts unavailable: " << e.what() << std::endl;
        }
        if (runtime_) {
            response->set_runtime_reachable(runtime_->ping());
            response->set_image_present(runtime_->image_exists(config_.compiler_image));
        }
        std::error_code ec;
        response->set_storage_present(std::filesystem::is_directory(config_.storage_path, ec));
    }
    return grpc::Status::OK;
}

} // namespace texq::gateway
