#pragma once

#include <string>
#include <vector>
#include <optional>
#include "session_store.hpp"

enum class Operation { Plan, Deploy, Diagnose, Undeploy };

// Verb passed to the external tool: "plan", "deploy", ...
const char* operation_verb(Operation op);

// One execution of the external tool. Built fresh per call, never mutated
// after build_request() returns.
struct InvocationRequest {
    Operation operation = Operation::Plan;
    std::string path;                           // project directory ("" = omit for diagnose)
    std::optional<std::string> provider;
    std::optional<std::string> method;
    std::optional<std::string> session_id;
    bool json_only = false;
    bool dry_run = false;
    bool skip_confirmation = false;             // --yes --non-interactive
    bool no_llm = false;
    std::optional<std::string> log_path;        // diagnose
    std::optional<std::string> record_id;       // diagnose, undeploy
};

// Explicit per-call values; present fields win over session preferences.
struct RequestOverrides {
    std::optional<std::string> provider;
    std::optional<std::string> method;
    std::optional<std::string> session_id;
};

// Start a request for `op` from the session's current state.
// Plan and deploy carry provider/method (override, else prefs) and the
// session id (override, else the session's own). json_only is set for
// plan, diagnose and undeploy.
InvocationRequest build_request(Operation op, const SessionStore& session,
                                const RequestOverrides& overrides = {});

// Full argument vector: tool_command followed by the verb and its flags.
std::vector<std::string> build_argv(const InvocationRequest& request,
                                    const std::vector<std::string>& tool_command);
