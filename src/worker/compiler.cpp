#include "compiler.h"
#include "errors.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <regex>
#include <sstream>

namespace fs = std::filesystem;

namespace texq::worker {

namespace {

const std::regex kMagicProgram(R"(^%\s*!\s*TE[Xx]\s+(?:TS-)?program\s*=\s*(\w+))",
                               std::regex::icase);
const std::regex kLuaHint(R"(\\usepackage(?:\[[^\]]*\])?\{[^}]*\b(?:luacode|luatextra)\b[^}]*\}|\\directlua)");
const std::regex kXeHint(R"(\\usepackage(?:\[[^\]]*\])?\{[^}]*\b(?:fontspec|unicode-math|polyglossia)\b[^}]*\})");

// Magic comments only count in the preamble head
constexpr int kMagicCommentLines = 20;

int64_t elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
}

std::string short_id(const std::string& id) {
    return id.substr(0, 12);
}

} // namespace

std::string format_timeout(std::chrono::milliseconds timeout) {
    if (timeout.count() % 1000 == 0) {
        return std::to_string(timeout.count() / 1000) + " seconds";
    }
    return std::to_string(timeout.count()) + " ms";
}

CompilerLimits CompilerLimits::from_config(const Config& config) {
    CompilerLimits limits;
    limits.image = config.compiler_image;
    limits.timeout = std::chrono::seconds(config.compile_timeout_s);
    limits.memory_bytes = parse_memory_string(config.compile_memory);
    limits.cpus = config.compile_cpus;
    limits.pids_limit = config.pids_limit;
    limits.max_concurrent = config.max_concurrent;
    return limits;
}

Compiler::SlotGuard::SlotGuard(Compiler& compiler) : compiler_(compiler) {
    std::unique_lock<std::mutex> lock(compiler_.slots_mutex_);
    compiler_.slots_cv_.wait(lock, [this] {
        return compiler_.active_ < compiler_.limits_.max_concurrent;
    });
    compiler_.active_++;
}

Compiler::SlotGuard::~SlotGuard() {
    {
        std::lock_guard<std::mutex> lock(compiler_.slots_mutex_);
        compiler_.active_--;
    }
    compiler_.slots_cv_.notify_one();
}

Compiler::Compiler(ContainerRuntime& runtime, CompilerLimits limits)
    : runtime_(runtime), limits_(std::move(limits)) {
    if (limits_.max_concurrent < 1) {
        limits_.max_concurrent = 1;
    }
}

Engine Compiler::detect_engine(const std::string& source) {
    std::istringstream lines(source);
    std::string line;
    for (int i = 0; i < kMagicCommentLines && std::getline(lines, line); i++) {
        std::smatch m;
        if (std::regex_search(line, m, kMagicProgram)) {
            std::string program = m[1].str();
            for (auto& c : program) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            auto engine = parse_engine(program);
            if (engine && *engine != Engine::Auto) {
                return *engine;
            }
        }
    }

    if (std::regex_search(source, kLuaHint)) {
        return Engine::Lualatex;
    }
    if (std::regex_search(source, kXeHint)) {
        return Engine::Xelatex;
    }
    return Engine::Pdflatex;
}

Engine Compiler::resolve_engine(const CompileRequest& request) {
    if (request.engine != Engine::Auto) {
        return request.engine;
    }

    std::ifstream file(fs::path(request.work_dir) / request.main_file);
    if (!file.is_open()) {
        return Engine::Pdflatex;
    }
    std::string source((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
    return detect_engine(source);
}

std::vector<std::string> Compiler::build_command(Engine engine, const std::string& main_file) {
    if (engine == Engine::Auto) {
        engine = Engine::Pdflatex;
    }
    return {
        "latexmk",
        latexmk_flag(engine),
        "-cd",
        "-gg",
        "-interaction=nonstopmode",
        "-halt-on-error",
        "-file-line-error",
        main_file,
    };
}

int Compiler::active_runs() const {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    return active_;
}

RunOutcome Compiler::run(const CompileRequest& request, Engine engine,
                         const CancelCheck& should_cancel) {
    auto start_time = std::chrono::steady_clock::now();
    SlotGuard slot(*this);

    std::cout << "[Docker] Starting compilation: job=" << request.job_id
              << " file=" << request.main_file << " engine=" << to_string(engine)
              << " runtime=" << runtime_.name() << std::endl;

    RunOutcome outcome;
    std::string container_id;
    try {
        execute(request, engine, should_cancel, container_id, outcome);
    } catch (const std::exception& e) {
        std::cerr << "[Docker] Container error: " << e.what() << std::endl;
        outcome.infrastructure_error = e.what();
        outcome.exit_code = -1;
        outcome.exited_normally = false;
        outcome.pdf_path.reset();
        if (outcome.logs.empty()) {
            outcome.logs = std::string("[Docker] Container error: ") + e.what();
        }
    }

    if (!container_id.empty()) {
        try {
            runtime_.remove(container_id);
        } catch (const std::exception& e) {
            std::cerr << "[Docker] Failed to remove container " << short_id(container_id)
                      << ": " << e.what() << std::endl;
        }
    }

    outcome.duration_ms = elapsed_ms(start_time);
    return outcome;
}

void Compiler::stop_and_collect(const std::string& container_id, RunOutcome& outcome) {
    // Only the logs degrade here; the verdict is already decided
    try {
        runtime_.kill(container_id);
        runtime_.wait(container_id, std::chrono::seconds(5));
        outcome.logs = runtime_.logs(container_id);
    } catch (const std::exception& e) {
        std::cerr << "[Docker] Could not collect logs from " << short_id(container_id) << ": "
                  << e.what() << std::endl;
        outcome.logs = std::string("[Docker] Logs unavailable: ") + e.what();
    }
}

void Compiler::execute(const CompileRequest& request, Engine engine,
                       const CancelCheck& should_cancel, std::string& container_id,
                       RunOutcome& outcome) {
    auto canceled = [&] { return should_cancel && should_cancel(); };

    if (canceled()) {
        outcome.canceled = true;
        return;
    }

    ContainerSpec spec;
    spec.image = limits_.image;
    spec.command = build_command(engine, request.main_file);
    spec.work_dir = request.work_dir;
    spec.memory_bytes = limits_.memory_bytes;
    spec.cpus = limits_.cpus;
    spec.pids_limit = limits_.pids_limit;
    spec.timeout_s = static_cast<int>(
        std::chrono::duration_cast<std::chrono::seconds>(limits_.timeout).count());
    spec.labels["texq.job"] = request.job_id;

    container_id = runtime_.create(spec);
    if (canceled()) {
        outcome.canceled = true;
        return;
    }

    runtime_.start(container_id);
    auto deadline = std::chrono::steady_clock::now() + limits_.timeout;
    if (canceled()) {
        outcome.canceled = true;
        stop_and_collect(container_id, outcome);
        return;
    }

    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            std::cerr << "[Docker] Container " << short_id(container_id) << " timed out after "
                      << format_timeout(limits_.timeout) << std::endl;
            outcome.timed_out = true;
            outcome.exit_code = -1;
            stop_and_collect(container_id, outcome);
            return;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        auto code = runtime_.wait(container_id, std::min(remaining, limits_.poll_interval));
        if (code) {
            outcome.exit_code = *code;
            outcome.exited_normally = true;
            break;
        }
        if (canceled()) {
            std::cout << "[Docker] Container " << short_id(container_id)
                      << " killed on cancel request" << std::endl;
            outcome.canceled = true;
            stop_and_collect(container_id, outcome);
            return;
        }
    }

    std::cout << "[Docker] Container " << short_id(container_id) << " exited with code "
              << outcome.exit_code << std::endl;
    outcome.logs = runtime_.logs(container_id);

    // The PDF decides success, not the exit code
    fs::path pdf = fs::path(request.work_dir) / pdf_name_for(request.main_file);
    std::error_code ec;
    if (fs::is_regular_file(pdf, ec) && fs::file_size(pdf, ec) > 0 && !ec) {
        outcome.pdf_path = pdf.string();
    }
}

} // namespace texq::worker
