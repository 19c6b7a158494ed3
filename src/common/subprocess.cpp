#include "subprocess.h"
#include "errors.h"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace texq {

namespace {

void apply_limit(int resource, int64_t value) {
    if (value <= 0) return;
    struct rlimit limit;
    limit.rlim_cur = static_cast<rlim_t>(value);
    limit.rlim_max = static_cast<rlim_t>(value);
    setrlimit(resource, &limit);
}

} // namespace

Subprocess::Subprocess(ProcessOptions options) : options_(std::move(options)) {}

Subprocess::~Subprocess() {
    if (running()) {
        kill();
        reap(true);
    }
    close_pipe();
}

void Subprocess::start() {
    if (options_.argv.empty()) {
        throw InfrastructureUnavailable("Subprocess started without a command");
    }

    int fds[2];
    if (pipe(fds) != 0) {
        throw InfrastructureUnavailable(std::string("pipe: ") + std::strerror(errno));
    }

    // Build argv before fork; the child must not allocate
    std::vector<char*> cargv;
    cargv.reserve(options_.argv.size() + 1);
    for (auto& s : options_.argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        close(fds[0]);
        close(fds[1]);
        throw InfrastructureUnavailable(std::string("fork: ") + std::strerror(errno));
    }

    if (pid == 0) {
        setpgid(0, 0);
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGPIPE, SIG_DFL);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(fds[1], STDOUT_FILENO);
        dup2(fds[1], STDERR_FILENO);
        close(fds[0]);
        close(fds[1]);
        if (!options_.working_dir.empty() && chdir(options_.working_dir.c_str()) != 0) {
            perror("chdir");
            _exit(126);
        }
        apply_limit(RLIMIT_AS, options_.memory_limit_bytes);
        apply_limit(RLIMIT_CPU, options_.cpu_seconds);
        apply_limit(RLIMIT_NPROC, options_.max_processes);
        execvp(cargv[0], cargv.data());
        perror("execvp");
        _exit(127);
    }

    setpgid(pid, pid);
    close(fds[1]);
    out_fd_ = fds[0];
    fcntl(out_fd_, F_SETFL, fcntl(out_fd_, F_GETFL) | O_NONBLOCK);
    pid_ = pid;
}

bool Subprocess::wait_for(std::chrono::milliseconds timeout) {
    if (pid_ <= 0) return false;
    if (exited_) return true;

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (reap(false)) {
            drain_to_eof();
            return true;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            return false;
        }
        drain(static_cast<int>(std::min<long long>(remaining, 50)));
    }
}

void Subprocess::kill() {
    if (pid_ > 0 && !exited_) {
        ::kill(-pid_, SIGKILL);
        ::kill(pid_, SIGKILL);
    }
}

bool Subprocess::reap(bool block) {
    if (exited_) return true;
    int status = 0;
    pid_t r;
    do {
        r = waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (r < 0 && errno == EINTR);

    if (r == pid_) {
        exited_ = true;
        if (WIFEXITED(status)) {
            exit_code_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_code_ = -1;
            term_signal_ = WTERMSIG(status);
        }
        return true;
    }
    if (r < 0) {
        // ECHILD: someone else reaped it; nothing more to learn
        exited_ = true;
        return true;
    }
    return false;
}

void Subprocess::drain(int timeout_ms) {
    if (out_fd_ < 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms));
        return;
    }
    struct pollfd pfd = {out_fd_, POLLIN, 0};
    int ready = poll(&pfd, 1, timeout_ms);
    if (ready <= 0) return;

    char buffer[4096];
    while (true) {
        ssize_t n = read(out_fd_, buffer, sizeof(buffer));
        if (n > 0) {
            output_.append(buffer, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            close_pipe();
        }
        // EAGAIN: nothing more for now
        return;
    }
}

void Subprocess::drain_to_eof() {
    // Grandchildren may keep the pipe open; give them a short grace period
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(200);
    while (out_fd_ >= 0 && std::chrono::steady_clock::now() < deadline) {
        drain(20);
    }
    close_pipe();
}

void Subprocess::close_pipe() {
    if (out_fd_ >= 0) {
        close(out_fd_);
        out_fd_ = -1;
    }
}

ProcessResult Subprocess::run(const ProcessOptions& options, std::chrono::milliseconds timeout) {
    Subprocess process(options);
    process.start();

    ProcessResult result;
    if (!process.wait_for(timeout)) {
        result.timed_out = true;
        process.kill();
        process.reap(true);
        process.drain_to_eof();
    }
    result.exit_code = process.exit_code();
    result.term_signal = process.term_signal();
    result.output = process.output();
    return result;
}

} // namespace texq
