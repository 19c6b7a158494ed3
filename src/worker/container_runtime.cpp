#include "container_runtime.h"
#include "errors.h"

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <thread>
#include <unistd.h>

namespace texq::worker {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string short_id(const std::string& id) {
    return id.substr(0, 12);
}

std::string format_cpus(double cpus) {
    std::ostringstream out;
    out << cpus;
    return out.str();
}

bool binary_on_path(const std::string& binary) {
    if (binary.find('/') != std::string::npos) {
        return access(binary.c_str(), X_OK) == 0;
    }
    const char* path = std::getenv("PATH");
    if (!path) return false;

    std::stringstream dirs(path);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) continue;
        if (access((dir + "/" + binary).c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

} // namespace

// ---- DockerRuntime ----

DockerRuntime::DockerRuntime(std::string docker_bin)
    : docker_bin_(std::move(docker_bin)) {}

ProcessResult DockerRuntime::docker(const std::vector<std::string>& args,
                                    std::chrono::milliseconds timeout) const {
    ProcessOptions options;
    options.argv.push_back(docker_bin_);
    options.argv.insert(options.argv.end(), args.begin(), args.end());
    return Subprocess::run(options, timeout);
}

std::vector<std::string> DockerRuntime::create_args(const ContainerSpec& spec) const {
    std::vector<std::string> args = {
        "create",
        "--network", "none",
        "--cap-drop", "ALL",
        "--security-opt", "no-new-privileges",
        "--pids-limit", std::to_string(spec.pids_limit),
        "--volume", spec.work_dir + ":/work",
        "--workdir", "/work",
    };
    if (spec.memory_bytes > 0) {
        // Equal swap limit: no swap on top of the memory ceiling
        args.push_back("--memory");
        args.push_back(std::to_string(spec.memory_bytes));
        args.push_back("--memory-swap");
        args.push_back(std::to_string(spec.memory_bytes));
    }
    if (spec.cpus > 0) {
        args.push_back("--cpus");
        args.push_back(format_cpus(spec.cpus));
    }
    for (const auto& [key, value] : spec.labels) {
        args.push_back("--label");
        args.push_back(key + "=" + value);
    }
    args.push_back(spec.image);
    args.insert(args.end(), spec.command.begin(), spec.command.end());
    return args;
}

std::string DockerRuntime::create(const ContainerSpec& spec) {
    auto result = docker(create_args(spec));
    if (result.exit_code != 0) {
        throw InfrastructureUnavailable("docker create failed: " + trim(result.output));
    }

    // Pull progress may precede the id; the id is always the last line
    std::string output = trim(result.output);
    size_t newline = output.find_last_of('\n');
    std::string id = newline == std::string::npos ? output : output.substr(newline + 1);
    if (id.empty()) {
        throw InfrastructureUnavailable("docker create returned no container id");
    }
    std::cout << "[Docker] Container created: " << short_id(id) << std::endl;
    return id;
}

void DockerRuntime::start(const std::string& id) {
    auto result = docker({"start", id});
    if (result.exit_code != 0) {
        throw InfrastructureUnavailable("docker start failed: " + trim(result.output));
    }
    std::cout << "[Docker] Container started: " << short_id(id) << std::endl;
}

std::optional<int> DockerRuntime::wait(const std::string& id, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        auto result = docker({"inspect", "--format", "{{.State.Running}} {{.State.ExitCode}}", id});
        if (result.exit_code != 0) {
            throw InfrastructureUnavailable("docker inspect failed: " + trim(result.output));
        }

        std::istringstream state(trim(result.output));
        std::string running;
        int exit_code = -1;
        state >> running >> exit_code;
        if (running == "false") {
            return exit_code;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return std::nullopt;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(remaining, std::chrono::milliseconds(200)));
    }
}

void DockerRuntime::kill(const std::string& id) {
    auto result = docker({"kill", id});
    if (result.exit_code != 0) {
        // Usually the container already exited
        std::cerr << "[Docker] kill " << short_id(id) << ": " << trim(result.output) << std::endl;
    }
}

std::string DockerRuntime::logs(const std::string& id) {
    auto result = docker({"logs", id}, std::chrono::seconds(10));
    if (result.timed_out) {
        std::cerr << "[Docker] Log collection timed out, using "
                  << result.output.size() << " bytes collected so far" << std::endl;
    } else if (result.exit_code != 0) {
        throw InfrastructureUnavailable("docker logs failed: " + trim(result.output));
    }
    return result.output;
}

void DockerRuntime::remove(const std::string& id) {
    auto result = docker({"rm", "--force", id});
    if (result.exit_code != 0) {
        throw InfrastructureUnavailable("docker rm failed: " + trim(result.output));
    }
}

bool DockerRuntime::image_exists(const std::string& image) {
    return docker({"image", "inspect", "--format", "{{.Id}}", image}).exit_code == 0;
}

bool DockerRuntime::ping() {
    return docker({"version", "--format", "{{.Server.Version}}"}, std::chrono::seconds(5)).exit_code == 0;
}

// ---- ProcessRuntime ----

std::string ProcessRuntime::create(const ContainerSpec& spec) {
    if (spec.command.empty()) {
        throw InfrastructureUnavailable("No command to run");
    }

    ProcessOptions options;
    options.argv = spec.command;
    options.working_dir = spec.work_dir;
    options.memory_limit_bytes = spec.memory_bytes;
    options.cpu_seconds = spec.timeout_s > 0 ? spec.timeout_s + 5 : 0;
    options.max_processes = spec.pids_limit;

    std::lock_guard<std::mutex> lock(mutex_);
    std::string id = "proc-" + std::to_string(next_id_++);
    processes_[id] = std::make_shared<Subprocess>(std::move(options));
    return id;
}

std::shared_ptr<Subprocess> ProcessRuntime::find(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = processes_.find(id);
    if (it == processes_.end()) {
        throw InfrastructureUnavailable("No such process: " + id);
    }
    return it->second;
}

void ProcessRuntime::start(const std::string& id) {
    find(id)->start();
}

std::optional<int> ProcessRuntime::wait(const std::string& id, std::chrono::milliseconds timeout) {
    auto process = find(id);
    if (!process->wait_for(timeout)) {
        return std::nullopt;
    }
    return process->exit_code();
}

void ProcessRuntime::kill(const std::string& id) {
    find(id)->kill();
}

std::string ProcessRuntime::logs(const std::string& id) {
    return find(id)->output();
}

void ProcessRuntime::remove(const std::string& id) {
    std::shared_ptr<Subprocess> process;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = processes_.find(id);
        if (it == processes_.end()) return;
        process = it->second;
        processes_.erase(it);
    }
    // Destructor kills and reaps whatever is left
    process.reset();
}

bool ProcessRuntime::image_exists(const std::string&) {
    return binary_on_path("latexmk");
}

std::unique_ptr<ContainerRuntime> make_runtime(RuntimeKind kind, const std::string& docker_bin) {
    if (kind == RuntimeKind::Process) {
        return std::make_unique<ProcessRuntime>();
    }
    return std::make_unique<DockerRuntime>(docker_bin);
}

} // namespace texq::worker
