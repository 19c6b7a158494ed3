#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "config.h"
#include "subprocess.h"

namespace texq::worker {

// One sandboxed compile. The host work directory is mounted at /work.
struct ContainerSpec {
    std::string image;
    std::vector<std::string> command;
    std::string work_dir;
    int64_t memory_bytes = 0;
    double cpus = 0.0;
    int pids_limit = 256;
    int timeout_s = 120;
    std::map<std::string, std::string> labels;
};

// Boundary to whatever actually runs the compiler. Every call may throw
// InfrastructureUnavailable.
class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    virtual std::string create(const ContainerSpec& spec) = 0;
    virtual void start(const std::string& id) = 0;
    // Exit code once the container stopped, nullopt if still running after timeout.
    virtual std::optional<int> wait(const std::string& id, std::chrono::milliseconds timeout) = 0;
    virtual void kill(const std::string& id) = 0;
    virtual std::string logs(const std::string& id) = 0;
    virtual void remove(const std::string& id) = 0;

    virtual bool image_exists(const std::string& image) = 0;
    virtual bool ping() = 0;
    virtual const char* name() const = 0;
};

// Drives the docker CLI. Containers get no network, no capabilities,
// no-new-privileges and the ContainerSpec memory, cpu and pid ceilings.
class DockerRuntime : public ContainerRuntime {
public:
    explicit DockerRuntime(std::string docker_bin = "docker");

    std::string create(const ContainerSpec& spec) override;
    void start(const std::string& id) override;
    std::optional<int> wait(const std::string& id, std::chrono::milliseconds timeout) override;
    void kill(const std::string& id) override;
    std::string logs(const std::string& id) override;
    void remove(const std::string& id) override;

    bool image_exists(const std::string& image) override;
    bool ping() override;
    const char* name() const override { return "docker"; }

    // Full argument vector of "docker create", exposed for inspection
    std::vector<std::string> create_args(const ContainerSpec& spec) const;

private:
    ProcessResult docker(const std::vector<std::string>& args,
                         std::chrono::milliseconds timeout = std::chrono::seconds(30)) const;

    std::string docker_bin_;
};

// Runs the compiler binary directly on the host inside its own process
// group with rlimits. For hosts without a docker daemon; the image name
// is ignored and network isolation is not available.
class ProcessRuntime : public ContainerRuntime {
public:
    ProcessRuntime() = default;

    std::string create(const ContainerSpec& spec) override;
    void start(const std::string& id) override;
    std::optional<int> wait(const std::string& id, std::chrono::milliseconds timeout) override;
    void kill(const std::string& id) override;
    std::string logs(const std::string& id) override;
    void remove(const std::string& id) override;

    bool image_exists(const std::string& image) override;
    bool ping() override { return true; }
    const char* name() const override { return "process"; }

private:
    std::shared_ptr<Subprocess> find(const std::string& id);

    std::map<std::string, std::shared_ptr<Subprocess>> processes_;
    std::mutex mutex_;
    uint64_t next_id_ = 1;
};

std::unique_ptr<ContainerRuntime> make_runtime(RuntimeKind kind, const std::string& docker_bin);

} // namespace texq::worker
