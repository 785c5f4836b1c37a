#include "process.hpp"
#include "platform.hpp"
#include <core/constants.hpp>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fmt/format.h>

extern char** environ;

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    close_output();
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept
    : pid_(other.pid_), output_fd_(other.output_fd_),
      reaped_(other.reaped_), exit_code_(other.exit_code_) {
    other.pid_ = -1;
    other.output_fd_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        close_output();
        pid_ = other.pid_;
        output_fd_ = other.output_fd_;
        reaped_ = other.reaped_;
        exit_code_ = other.exit_code_;
        other.pid_ = -1;
        other.output_fd_ = -1;
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

void ProcessHandle::close_output() {
    if (output_fd_ >= 0) {
        ::close(output_fd_);
        output_fd_ = -1;
    }
}

void ProcessHandle::set_exited(int status) {
    reaped_ = true;
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = 128 + WTERMSIG(status);
    } else {
        exit_code_ = -1;
    }
}

bool ProcessHandle::running() {
    if (pid_ <= 0 || reaped_) return false;
    int status;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == pid_) {
        set_exited(status);
        return false;
    }
    return ret == 0;  // 0 means still running
}

int ProcessHandle::wait(int timeout_ms) {
    if (pid_ <= 0) return -1;
    if (reaped_) return exit_code_;

    if (timeout_ms < 0) {
        int status;
        pid_t ret;
        do {
            ret = waitpid(pid_, &status, 0);
        } while (ret < 0 && errno == EINTR);
        if (ret == pid_) set_exited(status);
        return reaped_ ? exit_code_ : -1;
    }

    // Poll with timeout
    int elapsed = 0;
    while (elapsed < timeout_ms) {
        if (!running()) return reaped_ ? exit_code_ : -1;
        sleep_ms(TERMINATE_POLL_MS);
        elapsed += TERMINATE_POLL_MS;
    }
    return -1;  // timed out
}

void ProcessHandle::terminate() {
    if (pid_ <= 0 || reaped_) return;
    kill(pid_, SIGTERM);
    if (wait(TERMINATE_GRACE_MS) >= 0 || reaped_) return;
    kill(pid_, SIGKILL);
    wait();
}

// ── spawn_captured ───────────────────────────────────────────

namespace {

// Failure stages the child reports back over the exec-status pipe
enum : int {
    CHILD_CHDIR_FAILED = 1,
    CHILD_EXEC_FAILED  = 2,
};

void set_cloexec(int fd) {
    int flags = fcntl(fd, F_GETFD);
    if (flags >= 0) fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
}

// Async-signal-safe report from the forked child, then exit.
[[noreturn]] void child_fail(int status_fd, int stage) {
    int payload[2] = {stage, errno};
    ssize_t ignored = ::write(status_fd, payload, sizeof(payload));
    (void)ignored;
    _exit(127);
}

} // namespace

Result<ProcessHandle> spawn_captured(const std::string& program,
                                     const std::vector<std::string>& args,
                                     const std::map<std::string, std::string>& env,
                                     const std::string& cwd) {
    if (program.empty()) {
        return Result<ProcessHandle>::Err("missing command");
    }

    // Build argv/envp before fork(): the child must not allocate.
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(program.c_str()));
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    std::vector<std::string> env_strings;
    std::vector<char*> envp;
    if (!env.empty()) {
        env_strings.reserve(env.size());
        for (const auto& [k, v] : env) env_strings.push_back(k + "=" + v);
        for (auto& s : env_strings) envp.push_back(s.data());
        envp.push_back(nullptr);
    }

    int out_pipe[2];
    if (pipe(out_pipe) != 0) {
        return Result<ProcessHandle>::Err(fmt::format("pipe failed: {}", std::strerror(errno)));
    }
    int status_pipe[2];
    if (pipe(status_pipe) != 0) {
        int err = errno;
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        return Result<ProcessHandle>::Err(fmt::format("pipe failed: {}", std::strerror(err)));
    }
    set_cloexec(out_pipe[0]);
    set_cloexec(status_pipe[0]);
    set_cloexec(status_pipe[1]);

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        ::close(status_pipe[0]);
        ::close(status_pipe[1]);
        return Result<ProcessHandle>::Err(fmt::format("fork failed: {}", std::strerror(err)));
    }

    if (pid == 0) {
        // Child process
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            if (devnull != STDIN_FILENO) ::close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(out_pipe[1], STDERR_FILENO);
        if (out_pipe[1] > STDERR_FILENO) ::close(out_pipe[1]);

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            child_fail(status_pipe[1], CHILD_CHDIR_FAILED);
        }
        if (!envp.empty()) {
            environ = envp.data();
        }
        execvp(program.c_str(), argv.data());
        child_fail(status_pipe[1], CHILD_EXEC_FAILED);
    }

    // Parent
    ::close(out_pipe[1]);
    ::close(status_pipe[1]);

    ProcessHandle handle;
    handle.pid_ = pid;
    handle.output_fd_ = out_pipe[0];

    // The status pipe closes on successful exec (CLOEXEC); data means failure.
    int payload[2] = {0, 0};
    ssize_t n;
    do {
        n = ::read(status_pipe[0], payload, sizeof(payload));
    } while (n < 0 && errno == EINTR);
    ::close(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(payload))) {
        handle.wait();
        if (payload[0] == CHILD_CHDIR_FAILED) {
            return Result<ProcessHandle>::Err(fmt::format(
                "cannot enter working directory '{}': {}", cwd, std::strerror(payload[1])));
        }
        return Result<ProcessHandle>::Err(fmt::format(
            "failed to start '{}': {}", program, std::strerror(payload[1])));
    }

    return Result<ProcessHandle>::Ok(std::move(handle));
}

} // namespace platform
