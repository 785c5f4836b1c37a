#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <functional>
#include <filesystem>
#include <json/json.h>
#include <core/types.hpp>
#include <core/constants.hpp>
#include "session_store.hpp"
#include "progress_tracker.hpp"
#include "log_buffer.hpp"
#include "deployment_history.hpp"
#include "invocation.hpp"
#include "process_runner.hpp"

class Config;

// Everything one interactive session owns. Never shared between sessions.
struct SessionContext {
    SessionStore session;
    ProgressTracker progress;
    LogBuffer log;
    std::optional<std::string> preview_url;     // last known deployment URL

    SessionContext() = default;
    explicit SessionContext(SessionStore store) : session(std::move(store)) {}
};

struct BridgeSettings {
    std::vector<std::string> tool_command;
    std::filesystem::path tool_root;
    std::filesystem::path history_file;
    std::map<std::string, std::string> environment;
    bool no_llm = false;
    int refresh_every = DEFAULT_LOG_REFRESH_LINES;

    static BridgeSettings from_config(const Config& config);
};

// Result of one finished invocation (plan, deploy, diagnose, undeploy)
struct InvocationOutcome {
    int exit_code = -1;
    std::string raw_output;                 // everything the tool printed
    std::optional<Json::Value> record;      // trailing JSON object, if any
    std::string reply;                      // serialized record, or raw output

    bool success() const { return exit_code == 0; }
    const char* status() const { return success() ? "success" : "failed"; }
};

struct DeployOptions {
    std::string path;
    bool dry_run = false;
    bool yes = true;                        // --yes --non-interactive
    RequestOverrides overrides;
};

struct DiagnoseOptions {
    std::string path;                       // optional project path
    std::optional<std::string> log_path;
    std::optional<std::string> record_id;
};

struct PrefsUpdate {
    SessionPrefs prefs;                     // merged result
    std::string reply;                      // {"type":"PrefsUpdated", ...prefs}
};

// Named deployment operations on top of the external tool. Each call runs
// to completion before returning; the session is passed in explicitly.
class ToolBridge {
public:
    using RefreshCallback = std::function<void(const LogBuffer&)>;
    using LineCallback = std::function<void(const std::string&)>;

    explicit ToolBridge(BridgeSettings settings);

    Result<InvocationOutcome> plan(SessionContext& ctx, const std::string& path,
                                   const RequestOverrides& overrides = {});

    // Streams into ctx.log and calls `refresh` every refresh_every lines
    // and once more when the tool exits.
    Result<InvocationOutcome> deploy(SessionContext& ctx, const DeployOptions& opts,
                                     const RefreshCallback& refresh = nullptr);

    Result<InvocationOutcome> diagnose(SessionContext& ctx, const DiagnoseOptions& opts);

    TailLogsResult tail_logs(SessionContext& ctx, const std::string& record_id);

    PrefsUpdate modify_preferences(SessionContext& ctx, const SessionPrefs& partial);

    // Normalize and remember `url` as the session's preview URL.
    std::string show_preview(SessionContext& ctx, const std::string& url);

    Result<InvocationOutcome> undeploy(SessionContext& ctx, const std::string& record_id);

    // Optional sink for every output line of plan/diagnose/undeploy
    void set_line_callback(LineCallback cb) { on_line_ = std::move(cb); }

    const BridgeSettings& settings() const { return settings_; }

private:
    std::vector<std::string> argv_for(InvocationRequest& req) const;

    // Run a request and extract its trailing record. `reply` falls back to
    // the raw output when nothing parses.
    Result<InvocationOutcome> run_json(const InvocationRequest& req);

    BridgeSettings settings_;
    ProcessRunner runner_;
    LineCallback on_line_;
};

// JSON text of {"type":"PrefsUpdated", ...prefs}
std::string prefs_reply(const SessionPrefs& prefs);
