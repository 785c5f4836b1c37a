#include "tool_bridge.hpp"
#include "bridge_log.hpp"
#include "result_extractor.hpp"
#include <core/config.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

BridgeSettings BridgeSettings::from_config(const Config& config) {
    BridgeSettings s;
    s.tool_command = config.tool().command;
    s.tool_root = config.tool_root();
    s.history_file = config.history_path();
    s.environment = config.environment();
    s.no_llm = config.tool().no_llm;
    s.refresh_every = config.ui().refresh_every;
    return s;
}

std::string prefs_reply(const SessionPrefs& prefs) {
    Json::Value reply(Json::objectValue);
    reply["type"] = "PrefsUpdated";
    if (prefs.provider) reply["provider"] = *prefs.provider;
    if (prefs.method) reply["method"] = *prefs.method;
    if (prefs.output_dir) reply["output_dir"] = *prefs.output_dir;
    if (prefs.domain) reply["domain"] = *prefs.domain;
    return serialize_record(reply);
}

ToolBridge::ToolBridge(BridgeSettings settings)
    : settings_(std::move(settings)),
      runner_(settings_.environment, settings_.tool_root) {
    if (settings_.refresh_every < 1) settings_.refresh_every = 1;
}

std::vector<std::string> ToolBridge::argv_for(InvocationRequest& req) const {
    req.no_llm = settings_.no_llm;
    return build_argv(req, settings_.tool_command);
}

Result<InvocationOutcome> ToolBridge::run_json(const InvocationRequest& req) {
    InvocationRequest r = req;
    auto argv = argv_for(r);

    StreamEvent last = runner_.run(argv, [this](const StreamEvent& ev) {
        if (ev.kind == StreamEvent::Kind::Line && on_line_) on_line_(ev.text);
    });

    if (last.kind == StreamEvent::Kind::Error) {
        return Result<InvocationOutcome>::Err(last.text);
    }

    InvocationOutcome out;
    out.exit_code = last.exit_code;
    out.raw_output = std::move(last.text);
    out.record = extract_last_json_object(out.raw_output);
    out.reply = out.record ? serialize_record(*out.record) : out.raw_output;
    return Result<InvocationOutcome>::Ok(std::move(out));
}

// ── Plan ────────────────────────────────────────────────────

Result<InvocationOutcome> ToolBridge::plan(SessionContext& ctx, const std::string& path,
                                          const RequestOverrides& overrides) {
    ctx.progress.begin_plan();

    InvocationRequest req = build_request(Operation::Plan, ctx.session, overrides);
    req.path = path;
    dipole_log(fmt::format("bridge: plan path='{}' session={}", path, req.session_id.value_or("")));

    auto result = run_json(req);
    if (result.is_err()) {
        ctx.progress.fail();
        dipole_log("bridge: plan failed: " + result.error);
        return result;
    }

    if (result.value.record) {
        ctx.progress.complete_plan();
    } else {
        dipole_log("bridge: plan produced no JSON record, returning raw output");
    }
    dipole_log(fmt::format("bridge: plan exit={}", result.value.exit_code));
    return result;
}

// ── Deploy ──────────────────────────────────────────────────

Result<InvocationOutcome> ToolBridge::deploy(SessionContext& ctx, const DeployOptions& opts,
                                            const RefreshCallback& refresh) {
    ctx.progress.begin_deploy();
    ctx.log.reset();

    InvocationRequest req = build_request(Operation::Deploy, ctx.session, opts.overrides);
    req.path = opts.path;
    req.dry_run = opts.dry_run;
    req.skip_confirmation = opts.yes;
    auto argv = argv_for(req);
    dipole_log(fmt::format("bridge: deploy path='{}' dry_run={} session={}",
                           opts.path, opts.dry_run, req.session_id.value_or("")));

    const size_t every = static_cast<size_t>(settings_.refresh_every);
    StreamEvent last = runner_.run(argv, [&](const StreamEvent& ev) {
        if (ev.kind != StreamEvent::Kind::Line) return;
        ctx.log.append(ev.text);
        if (refresh && ctx.log.size() % every == 0) refresh(ctx.log);
    });

    // Final flush
    if (refresh) refresh(ctx.log);

    if (last.kind == StreamEvent::Kind::Error) {
        ctx.progress.fail();
        dipole_log("bridge: deploy failed: " + last.text);
        return Result<InvocationOutcome>::Err(last.text);
    }

    InvocationOutcome out;
    out.exit_code = last.exit_code;
    out.raw_output = std::move(last.text);
    dipole_log(fmt::format("bridge: deploy finished: {} (exit {}, {} lines)",
                           out.status(), out.exit_code, ctx.log.size()));

    ctx.progress.begin_verify();

    auto record = extract_last_json_object(out.raw_output);
    if (!record) {
        out.record = make_error_record(NO_RECORD_CAPTURED_MSG);
        out.reply = serialize_record(*out.record);
        ctx.progress.complete_verify();
        dipole_log("bridge: deploy produced no JSON record");
        return Result<InvocationOutcome>::Ok(std::move(out));
    }

    out.record = std::move(record);
    out.reply = serialize_record(*out.record);

    if (auto url = record_url(*out.record)) {
        ctx.preview_url = normalize_url(*url);
        ctx.progress.complete_preview();
        dipole_log("bridge: deploy url " + *ctx.preview_url);
    } else {
        ctx.progress.complete_verify();
    }
    return Result<InvocationOutcome>::Ok(std::move(out));
}

// ── Diagnose ────────────────────────────────────────────────

Result<InvocationOutcome> ToolBridge::diagnose(SessionContext& ctx, const DiagnoseOptions& opts) {
    bool has_log = opts.log_path && !opts.log_path->empty();
    bool has_id = opts.record_id && !opts.record_id->empty();
    if (!has_log && !has_id) {
        dipole_log("bridge: diagnose rejected, no log path or record id");
        return Result<InvocationOutcome>::Err(DIAGNOSE_MISSING_INPUT_MSG);
    }

    InvocationRequest req = build_request(Operation::Diagnose, ctx.session);
    req.path = opts.path;
    if (has_log) req.log_path = opts.log_path;
    if (has_id) req.record_id = opts.record_id;
    dipole_log(fmt::format("bridge: diagnose log='{}' id='{}'",
                           opts.log_path.value_or(""), opts.record_id.value_or("")));

    auto result = run_json(req);
    if (result.is_err()) {
        dipole_log("bridge: diagnose failed: " + result.error);
    } else {
        dipole_log(fmt::format("bridge: diagnose exit={} record={}",
                               result.value.exit_code, result.value.record.has_value()));
    }
    return result;
}

// ── TailLogs ────────────────────────────────────────────────

TailLogsResult ToolBridge::tail_logs(SessionContext&, const std::string& record_id) {
    DeploymentHistory history(settings_.history_file, settings_.tool_root);
    auto result = history.tail_logs(record_id, TAIL_LOG_MAX_LINES);
    if (!result.ok()) {
        dipole_log(fmt::format("bridge: tail {} -> {}", record_id, result.text));
    }
    return result;
}

// ── Preferences / preview ───────────────────────────────────

PrefsUpdate ToolBridge::modify_preferences(SessionContext& ctx, const SessionPrefs& partial) {
    PrefsUpdate update;
    update.prefs = ctx.session.merge(partial);
    update.reply = prefs_reply(update.prefs);
    dipole_log("bridge: prefs " + update.reply);
    return update;
}

std::string ToolBridge::show_preview(SessionContext& ctx, const std::string& url) {
    std::string fixed = normalize_url(url);
    ctx.preview_url = fixed;
    dipole_log("bridge: preview " + fixed);
    return fixed;
}

// ── Undeploy ────────────────────────────────────────────────

Result<InvocationOutcome> ToolBridge::undeploy(SessionContext& ctx, const std::string& record_id) {
    std::string id = record_id;
    trim(id);
    if (id.empty()) {
        dipole_log("bridge: undeploy rejected, no record id");
        return Result<InvocationOutcome>::Err(UNDEPLOY_MISSING_INPUT_MSG);
    }

    InvocationRequest req = build_request(Operation::Undeploy, ctx.session);
    req.record_id = id;
    dipole_log("bridge: undeploy id=" + id);

    auto result = run_json(req);
    if (result.is_err()) {
        dipole_log("bridge: undeploy failed: " + result.error);
    }
    return result;
}
