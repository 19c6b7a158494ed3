#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "compile_client.h"

using texq::client::CompileClient;
using texq::client::status_name;

namespace {

void print_usage() {
    std::cerr << "Usage: texq-cli [--server host:port] <command> [args]\n"
              << "  submit <file.tex> [--engine e] [--job-id id] [--wait] [--timeout s] [--output out.pdf]\n"
              << "  status <job-id>\n"
              << "  output <job-id> <out.pdf>\n"
              << "  cancel <job-id>\n"
              << "  health [--diagnostic]" << std::endl;
}

int report_failure(const std::string& what, const grpc::Status& status) {
    std::cerr << what << " failed: " << status.error_message()
              << " (code " << status.error_code() << ")" << std::endl;
    return status.error_code() == grpc::StatusCode::UNAVAILABLE ? 3 : 1;
}

void print_job(const texq::api::JobResponse& job) {
    std::cout << "Job:      " << job.job_id() << "\n"
              << "Status:   " << status_name(job.status()) << "\n"
              << "Engine:   " << (job.engine_used().empty() ? job.requested_engine() : job.engine_used())
              << "\n"
              << "Created:  " << job.created_at() << "\n";
    if (!job.completed_at().empty()) {
        std::cout << "Finished: " << job.completed_at() << " (" << job.duration_ms() << "ms)\n";
    }
    if (job.has_exit_code()) {
        std::cout << "Exit:     " << job.exit_code() << "\n";
    }
    std::cout << "Errors:   " << job.error_count() << ", warnings: " << job.warning_count() << "\n";
    if (!job.message().empty()) {
        std::cout << "Message:  " << job.message() << "\n";
    }
    std::cout << "Expires:  " << job.expires_at() << std::endl;
}

int write_output(CompileClient& client, const std::string& job_id, const std::string& path) {
    texq::api::OutputResponse output;
    grpc::Status status = client.GetOutput(job_id, output);
    if (!status.ok()) {
        return report_failure("Output", status);
    }
    for (const auto& entry : output.errors()) {
        std::cerr << "[ERROR] " << entry.file();
        if (entry.line() > 0) std::cerr << ":" << entry.line();
        std::cerr << ": " << entry.message() << std::endl;
    }
    if (output.status() != texq::api::JOB_STATUS_SUCCESS) {
        std::cerr << output.error() << " (" << status_name(output.status()) << ")" << std::endl;
        return 2;
    }

    std::ofstream out(path, std::ios::binary);
    if (!out.is_open()) {
        std::cerr << "Cannot write " << path << std::endl;
        return 1;
    }
    out.write(output.pdf().data(), static_cast<std::streamsize>(output.pdf().size()));
    std::cout << "Wrote " << output.pdf().size() << " bytes to " << path
              << " (engine " << output.engine_used() << ", " << output.duration_ms() << "ms)"
              << std::endl;
    return 0;
}

int cmd_submit(CompileClient& client, const std::vector<std::string>& args) {
    if (args.empty()) {
        print_usage();
        return 1;
    }

    texq::api::SubmitRequest request;
    bool wait = false;
    int timeout_s = 300;
    std::string output_path;
    std::string file = args[0];
    for (size_t i = 1; i < args.size(); i++) {
        if (args[i] == "--engine" && i + 1 < args.size()) {
            request.set_engine(args[++i]);
        } else if (args[i] == "--job-id" && i + 1 < args.size()) {
            request.set_job_id(args[++i]);
        } else if (args[i] == "--wait") {
            wait = true;
        } else if (args[i] == "--timeout" && i + 1 < args.size()) {
            timeout_s = std::atoi(args[++i].c_str());
        } else if (args[i] == "--output" && i + 1 < args.size()) {
            output_path = args[++i];
            wait = true;
        }
    }

    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
        std::cerr << "Cannot read " << file << std::endl;
        return 1;
    }
    request.set_source(std::string((std::istreambuf_iterator<char>(in)),
                                   std::istreambuf_iterator<char>()));

    texq::api::SubmitResponse response;
    grpc::Status status = client.Submit(request, response);
    if (!status.ok()) {
        return report_failure("Submit", status);
    }
    std::cout << "Submitted " << response.job_id() << " (" << status_name(response.status())
              << ")\n  poll:   " << response.poll_url()
              << "\n  output: " << response.output_url()
              << "\n  cancel: " << response.cancel_url() << std::endl;
    if (!wait) {
        return 0;
    }

    texq::api::JobResponse job;
    status = client.WaitForCompletion(response.job_id(), std::chrono::seconds(timeout_s), job);
    if (!status.ok()) {
        return report_failure("Wait", status);
    }
    print_job(job);
    if (!output_path.empty()) {
        return write_output(client, response.job_id(), output_path);
    }
    return job.status() == texq::api::JOB_STATUS_SUCCESS ? 0 : 2;
}

int cmd_status(CompileClient& client, const std::string& job_id) {
    texq::api::JobResponse job;
    grpc::Status status = client.GetJob(job_id, job);
    if (!status.ok()) {
        return report_failure("Status", status);
    }
    print_job(job);
    return 0;
}

int cmd_cancel(CompileClient& client, const std::string& job_id) {
    texq::api::CancelResponse response;
    grpc::Status status = client.Cancel(job_id, response);
    if (!status.ok()) {
        return report_failure("Cancel", status);
    }
    std::cout << response.job_id() << ": " << status_name(response.status()) << " - "
              << response.message() << std::endl;
    return 0;
}

int cmd_health(CompileClient& client, bool diagnostic) {
    texq::api::HealthResponse health;
    grpc::Status status = client.Health(diagnostic, health);
    if (!status.ok()) {
        return report_failure("Health", status);
    }
    std::cout << (health.healthy() ? "healthy" : "unhealthy") << " (" << health.mode() << "): "
              << health.detail() << std::endl;
    if (health.mode() == "embedded") {
        std::cout << "  active " << health.active_jobs() << "/" << health.max_concurrent()
                  << ", processed " << health.total_processed()
                  << ", errors " << health.total_errors() << std::endl;
    } else {
        std::cout << "  heartbeat age " << health.heartbeat_age_ms() << "ms" << std::endl;
    }
    if (diagnostic) {
        std::cout << "  redis " << (health.redis_connected() ? "up" : "down")
                  << ", queue waiting " << health.queue_waiting()
                  << " active " << health.queue_active()
                  << ", runtime " << (health.runtime_reachable() ? "up" : "down")
                  << ", image " << (health.image_present() ? "present" : "missing")
                  << ", storage " << (health.storage_present() ? "present" : "missing")
                  << std::endl;
    }
    return health.healthy() ? 0 : 3;
}

} // namespace

int main(int argc, char** argv) {
    std::string server = "localhost:50051";
    const char* env_server = std::getenv("TEXQ_SERVER");
    if (env_server) {
        server = env_server;
    }

    std::vector<std::string> args;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--server" && i + 1 < argc) {
            server = argv[++i];
        } else {
            args.push_back(arg);
        }
    }
    if (args.empty()) {
        print_usage();
        return 1;
    }

    CompileClient client(server);
    std::string command = args[0];
    std::vector<std::string> rest(args.begin() + 1, args.end());

    if (command == "submit") {
        return cmd_submit(client, rest);
    } else if (command == "status" && rest.size() == 1) {
        return cmd_status(client, rest[0]);
    } else if (command == "output" && rest.size() == 2) {
        return write_output(client, rest[0], rest[1]);
    } else if (command == "cancel" && rest.size() == 1) {
        return cmd_cancel(client, rest[0]);
    } else if (command == "health") {
        return cmd_health(client, !rest.empty() && rest[0] == "--diagnostic");
    }

    print_usage();
    return 1;
}
