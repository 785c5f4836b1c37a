#include "invocation.hpp"

const char* operation_verb(Operation op) {
    switch (op) {
        case Operation::Plan:     return "plan";
        case Operation::Deploy:   return "deploy";
        case Operation::Diagnose: return "diagnose";
        case Operation::Undeploy: return "undeploy";
    }
    return "plan";
}

static std::optional<std::string> pick(const std::optional<std::string>& explicit_value,
                                       const std::optional<std::string>& fallback) {
    if (explicit_value && !explicit_value->empty()) return explicit_value;
    return fallback;
}

InvocationRequest build_request(Operation op, const SessionStore& session,
                                const RequestOverrides& overrides) {
    InvocationRequest req;
    req.operation = op;

    req.session_id = pick(overrides.session_id, session.session_id());

    // Only plan and deploy take provider/method
    if (op == Operation::Plan || op == Operation::Deploy) {
        const auto& prefs = session.prefs();
        req.provider = pick(overrides.provider, prefs.provider);
        req.method = pick(overrides.method, prefs.method);
    }

    req.json_only = (op != Operation::Deploy);
    return req;
}

static void add_flag(std::vector<std::string>& argv, const char* flag,
                     const std::optional<std::string>& value) {
    if (value && !value->empty()) {
        argv.push_back(flag);
        argv.push_back(*value);
    }
}

std::vector<std::string> build_argv(const InvocationRequest& req,
                                    const std::vector<std::string>& tool_command) {
    std::vector<std::string> argv = tool_command;
    argv.push_back(operation_verb(req.operation));

    switch (req.operation) {
        case Operation::Plan:
            argv.push_back("--path");
            argv.push_back(req.path.empty() ? "." : req.path);
            if (req.json_only) argv.push_back("--json-only");
            add_flag(argv, "--provider", req.provider);
            add_flag(argv, "--method", req.method);
            add_flag(argv, "--session", req.session_id);
            break;

        case Operation::Deploy:
            argv.push_back("--path");
            argv.push_back(req.path.empty() ? "." : req.path);
            add_flag(argv, "--provider", req.provider);
            add_flag(argv, "--method", req.method);
            add_flag(argv, "--session", req.session_id);
            if (req.dry_run) argv.push_back("--dry-run");
            if (req.skip_confirmation) {
                argv.push_back("--yes");
                argv.push_back("--non-interactive");
            }
            break;

        case Operation::Diagnose:
            if (req.json_only) argv.push_back("--json-only");
            if (!req.path.empty()) {
                argv.push_back("--path");
                argv.push_back(req.path);
            }
            add_flag(argv, "--log", req.log_path);
            add_flag(argv, "--id", req.record_id);
            break;

        case Operation::Undeploy:
            add_flag(argv, "--id", req.record_id);
            if (req.json_only) argv.push_back("--json-only");
            break;
    }

    if (req.no_llm) argv.push_back("--no-llm");
    return argv;
}
