#pragma once

#include <map>
#include <string>
#include <vector>
#include <core/types.hpp>

namespace platform {

// Handle to a spawned child process whose stdout and stderr share one pipe.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // True if the process is still running.
    bool running();

    // Wait for the process to exit. Returns the exit code, 128 + signal
    // for a signaled child, or -1 on timeout / invalid handle.
    // timeout_ms = -1 means indefinite wait.
    int wait(int timeout_ms = -1);

    // Terminate the process (SIGTERM, then SIGKILL after a grace period).
    void terminate();

    // Read end of the merged stdout/stderr pipe, -1 once closed.
    int output_fd() const { return output_fd_; }
    void close_output();

    int native_handle() const { return pid_; }

private:
    // Records the exit status of a reaped child.
    void set_exited(int status);

    int pid_ = -1;
    int output_fd_ = -1;
    bool reaped_ = false;
    int exit_code_ = -1;

    friend Result<ProcessHandle> spawn_captured(const std::string& program,
                                                const std::vector<std::string>& args,
                                                const std::map<std::string, std::string>& env,
                                                const std::string& cwd);
};

// Spawn `program` with `args` (no shell involved; PATH is searched).
// stdout and stderr are merged into one pipe readable via output_fd();
// stdin is /dev/null. `env` replaces the child's environment unless empty,
// in which case the caller's environment is inherited. `cwd` empty means
// the caller's working directory.
// Errors (pipe/fork failure, bad working directory, exec failure) are
// reported synchronously.
Result<ProcessHandle> spawn_captured(const std::string& program,
                                     const std::vector<std::string>& args,
                                     const std::map<std::string, std::string>& env = {},
                                     const std::string& cwd = "");

} // namespace platform
