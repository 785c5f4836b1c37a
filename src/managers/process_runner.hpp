#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <platform/process.hpp>

// One event of a running invocation. A stream is zero or more Line events
// followed by exactly one End or Error.
struct StreamEvent {
    enum class Kind { Line, End, Error };

    Kind kind = Kind::Line;
    std::string text;       // Line: line without '\n'; End: full output; Error: message
    int exit_code = -1;     // End only

    static StreamEvent line(std::string s) { return {Kind::Line, std::move(s), -1}; }
    static StreamEvent end(int code, std::string full) { return {Kind::End, std::move(full), code}; }
    static StreamEvent error(std::string msg) { return {Kind::Error, std::move(msg), -1}; }

    bool is_terminal() const { return kind != Kind::Line; }
};

// Unbounded blocking queue between the reader thread and the consumer.
class EventChannel {
public:
    void push(StreamEvent ev);

    // Blocks until an event is available.
    StreamEvent pop();

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<StreamEvent> queue_;
};

// Events of one spawned command. The reader thread owns the child process;
// destroying the stream before the terminal event kills the child.
class ProcessStream {
public:
    // Only ProcessRunner can mint a key, so only it creates streams.
    class Key {
        friend class ProcessRunner;
        Key() {}
    };

    explicit ProcessStream(Key) {}
    ~ProcessStream();

    ProcessStream(const ProcessStream&) = delete;
    ProcessStream& operator=(const ProcessStream&) = delete;

    // Blocks for the next event. Returns false once the terminal event has
    // already been delivered (nothing is produced after it).
    bool next(StreamEvent& out);

    bool finished() const { return finished_; }

private:
    friend class ProcessRunner;

    void start_reader(platform::ProcessHandle proc, std::string label);
    void reader_loop(platform::ProcessHandle proc, std::string label);

    EventChannel channel_;
    std::thread reader_;
    bool finished_ = false;

    // Set when the consumer goes away early; the reader then kills the child.
    std::atomic<bool> abandoned_{false};
};

class ProcessRunner {
public:
    using Environment = std::map<std::string, std::string>;
    using EventCallback = std::function<void(const StreamEvent&)>;

    // `env_overrides` are layered over the caller's environment for every
    // spawn; `default_cwd` is used when a call passes no working directory.
    explicit ProcessRunner(Environment env_overrides = {},
                           std::filesystem::path default_cwd = {});

    // Spawn `command` (argv[0] is the program, PATH is searched) and return
    // its event stream. Spawn failures arrive as a single Error event.
    std::unique_ptr<ProcessStream> start(const std::vector<std::string>& command,
                                         const Environment& env = {},
                                         const std::filesystem::path& cwd = {}) const;

    // Drive a stream to completion, calling `on_event` for every event
    // (terminal one included). Returns the terminal event.
    StreamEvent run(const std::vector<std::string>& command,
                    const EventCallback& on_event = nullptr,
                    const Environment& env = {},
                    const std::filesystem::path& cwd = {}) const;

    // Caller environment + configured overrides + `env` (later wins).
    Environment build_environment(const Environment& env) const;

    const std::filesystem::path& default_cwd() const { return default_cwd_; }

private:
    Environment env_overrides_;
    std::filesystem::path default_cwd_;
};
