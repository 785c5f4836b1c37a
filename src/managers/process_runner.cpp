#include "process_runner.hpp"
#include "bridge_log.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>
#include <fmt/format.h>

// ── EventChannel ────────────────────────────────────────────

void EventChannel::push(StreamEvent ev) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(ev));
    }
    cv_.notify_one();
}

StreamEvent EventChannel::pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !queue_.empty(); });
    StreamEvent ev = std::move(queue_.front());
    queue_.pop_front();
    return ev;
}

// ── ProcessStream ───────────────────────────────────────────

ProcessStream::~ProcessStream() {
    if (!finished_) {
        abandoned_ = true;
    }
    if (reader_.joinable()) {
        reader_.join();
    }
}

bool ProcessStream::next(StreamEvent& out) {
    if (finished_) return false;
    out = channel_.pop();
    if (out.is_terminal()) finished_ = true;
    return true;
}

void ProcessStream::start_reader(platform::ProcessHandle proc, std::string label) {
    reader_ = std::thread(&ProcessStream::reader_loop, this, std::move(proc), std::move(label));
}

void ProcessStream::reader_loop(platform::ProcessHandle proc, std::string label) {
    const int fd = proc.output_fd();
    std::string full;
    std::string pending;
    char buf[PROCESS_READ_BUF_SIZE];

    auto fail = [&](const std::string& msg) {
        proc.terminate();
        dipole_log(fmt::format("{}: {} (pid {} terminated)", label, msg, proc.native_handle()));
        channel_.push(StreamEvent::error(msg));
    };

    while (true) {
        if (abandoned_) {
            fail("invocation abandoned by consumer");
            return;
        }

        // Bounded wait so an abandoned stream is noticed promptly
        struct pollfd pfd = {fd, POLLIN, 0};
        int ready = poll(&pfd, 1, TERMINATE_POLL_MS);
        if (ready < 0) {
            if (errno == EINTR) continue;
            fail(fmt::format("poll failed: {}", std::strerror(errno)));
            return;
        }
        if (ready == 0) continue;

        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            fail(fmt::format("read failed: {}", std::strerror(errno)));
            return;
        }
        if (n == 0) break;  // EOF: every writer closed the pipe

        full.append(buf, static_cast<size_t>(n));
        pending.append(buf, static_cast<size_t>(n));

        size_t nl;
        while ((nl = pending.find('\n')) != std::string::npos) {
            channel_.push(StreamEvent::line(pending.substr(0, nl)));
            pending.erase(0, nl + 1);
        }
    }

    if (!pending.empty()) {
        channel_.push(StreamEvent::line(pending));
    }

    proc.close_output();
    int code = proc.wait();
    dipole_log(fmt::format("{}: exit={} output({} bytes)", label, code, full.size()));
    channel_.push(StreamEvent::end(code, std::move(full)));
}

// ── ProcessRunner ───────────────────────────────────────────

ProcessRunner::ProcessRunner(Environment env_overrides, std::filesystem::path default_cwd)
    : env_overrides_(std::move(env_overrides)), default_cwd_(std::move(default_cwd)) {}

ProcessRunner::Environment ProcessRunner::build_environment(const Environment& env) const {
    Environment merged = platform::current_environment();
    for (const auto& [k, v] : env_overrides_) merged[k] = v;
    for (const auto& [k, v] : env) merged[k] = v;
    return merged;
}

std::unique_ptr<ProcessStream> ProcessRunner::start(const std::vector<std::string>& command,
                                                    const Environment& env,
                                                    const std::filesystem::path& cwd) const {
    auto stream = std::make_unique<ProcessStream>(ProcessStream::Key());

    if (command.empty()) {
        stream->channel_.push(StreamEvent::error("empty command"));
        return stream;
    }

    const std::filesystem::path dir = cwd.empty() ? default_cwd_ : cwd;
    dipole_log_argv("runner", command);

    std::vector<std::string> args(command.begin() + 1, command.end());
    auto spawned = platform::spawn_captured(command[0], args, build_environment(env), dir.string());
    if (spawned.is_err()) {
        dipole_log("runner: spawn failed: " + spawned.error);
        stream->channel_.push(StreamEvent::error(spawned.error));
        return stream;
    }

    dipole_log(fmt::format("runner: started pid {} in '{}'",
                           spawned.value.native_handle(), dir.string()));
    stream->start_reader(std::move(spawned.value), command[0]);
    return stream;
}

StreamEvent ProcessRunner::run(const std::vector<std::string>& command,
                               const EventCallback& on_event,
                               const Environment& env,
                               const std::filesystem::path& cwd) const {
    auto stream = start(command, env, cwd);
    StreamEvent ev = StreamEvent::error("no events");
    while (stream->next(ev)) {
        if (on_event) on_event(ev);
    }
    return ev;
}
