#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "config.h"
#include "container_runtime.h"
#include "job.h"

namespace texq::worker {

struct CompileRequest {
    std::string job_id;
    std::string work_dir;
    std::string main_file = "main.tex";
    Engine engine = Engine::Auto;
};

struct RunOutcome {
    std::string logs;
    int exit_code = -1;
    bool exited_normally = false;
    bool timed_out = false;
    bool canceled = false;
    std::optional<std::string> pdf_path;
    int64_t duration_ms = 0;
    // Set when the runtime itself failed, as opposed to the document
    std::optional<std::string> infrastructure_error;
};

// "12 seconds" for whole seconds, "250 ms" otherwise
std::string format_timeout(std::chrono::milliseconds timeout);

// Ceilings applied to every run. Jobs cannot raise them.
struct CompilerLimits {
    std::string image = "texq-compiler";
    std::chrono::milliseconds timeout = std::chrono::seconds(120);
    int64_t memory_bytes = 1024LL * 1024 * 1024;
    double cpus = 1.5;
    int pids_limit = 256;
    int max_concurrent = 5;
    std::chrono::milliseconds poll_interval = std::chrono::milliseconds(500);

    static CompilerLimits from_config(const Config& config);
};

// Returns true once cancellation of the running job was requested.
using CancelCheck = std::function<bool()>;

// Container execution engine
class Compiler {
public:
    Compiler(ContainerRuntime& runtime, CompilerLimits limits);

    // Picks the engine for auto requests from the main file's magic
    // comments and package hints. Non-auto requests are returned as is.
    static Engine resolve_engine(const CompileRequest& request);
    static Engine detect_engine(const std::string& source);

    // latexmk invocation for a resolved engine
    static std::vector<std::string> build_command(Engine engine, const std::string& main_file);

    // Runs one compile inside the sandbox. Never throws: runtime failures
    // come back as exit_code -1 with infrastructure_error set. A timeout or
    // cancel already observed survives a later runtime failure.
    RunOutcome run(const CompileRequest& request, Engine engine, const CancelCheck& should_cancel);

    int active_runs() const;
    const CompilerLimits& limits() const { return limits_; }
    ContainerRuntime& runtime() { return runtime_; }

private:
    class SlotGuard {
    public:
        explicit SlotGuard(Compiler& compiler);
        ~SlotGuard();

    private:
        Compiler& compiler_;
    };

    void execute(const CompileRequest& request, Engine engine, const CancelCheck& should_cancel,
                 std::string& container_id, RunOutcome& outcome);
    void stop_and_collect(const std::string& container_id, RunOutcome& outcome);

    ContainerRuntime& runtime_;
    CompilerLimits limits_;

    mutable std::mutex slots_mutex_;
    std::condition_variable slots_cv_;
    int active_ = 0;
};

} // namespace texq::worker
