#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <sys/types.h>
#include <vector>

namespace texq {

struct ProcessOptions {
    std::vector<std::string> argv;
    std::string working_dir;
    // Resource ceilings applied in the child before exec. 0 means unlimited.
    int64_t memory_limit_bytes = 0;
    int64_t cpu_seconds = 0;
    int64_t max_processes = 0;
};

struct ProcessResult {
    int exit_code = -1;  // -1 when killed by a signal or never started
    int term_signal = 0;
    bool timed_out = false;
    std::string output;  // stdout and stderr interleaved
};

// Child process in its own process group with stdout/stderr captured
// through one pipe. The destructor kills and reaps a still-running child.
class Subprocess {
public:
    explicit Subprocess(ProcessOptions options);
    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

    // Throws InfrastructureUnavailable when fork or pipe fail.
    void start();

    // Waits up to timeout while draining output. True once the child exited.
    bool wait_for(std::chrono::milliseconds timeout);

    // SIGKILL to the whole process group.
    void kill();

    bool running() const { return pid_ > 0 && !exited_; }
    bool exited() const { return exited_; }
    int exit_code() const { return exit_code_; }
    int term_signal() const { return term_signal_; }
    const std::string& output() const { return output_; }
    pid_t pid() const { return pid_; }

    // Start, wait up to timeout, kill and reap on timeout.
    static ProcessResult run(const ProcessOptions& options, std::chrono::milliseconds timeout);

private:
    bool reap(bool block);
    void drain(int timeout_ms);
    void drain_to_eof();
    void close_pipe();

    ProcessOptions options_;
    pid_t pid_ = -1;
    int out_fd_ = -1;
    bool exited_ = false;
    int exit_code_ = -1;
    int term_signal_ = 0;
    std::string output_;
};

} // namespace texq
