#include "command_helpers.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>

static RequestOverrides overrides_from(const CommandArgs& args) {
    RequestOverrides o;
    o.provider = args.get("provider");
    o.method = args.get("method");
    o.session_id = args.get("session");
    return o;
}

// Tool output of plan/diagnose/undeploy is echoed as it arrives
static void stream_tool_output(BaseCLI& cli) {
    cli.bridge->set_line_callback([](const std::string& line) {
        std::cout << theme::output(line);
        std::cout.flush();
    });
}

static void print_outcome(const InvocationOutcome& out) {
    if (out.record) {
        print_reply(out.reply, true);
    } else {
        std::cout << theme::info("No JSON record in tool output, see above.");
    }
}

void do_plan(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_session()) return;

    auto parsed = parse_command_args(arg);
    if (parsed.is_err()) {
        std::cout << theme::fail(parsed.error);
        return;
    }
    const auto& args = parsed.value;
    std::string path = args.first_or(".");

    std::cout << theme::step("Planning " + path);
    stream_tool_output(cli);
    auto result = cli.bridge->plan(*cli.session, path, overrides_from(args));
    if (result.is_err()) {
        std::cout << theme::fail("Plan failed: " + result.error);
        return;
    }
    print_outcome(result.value);
}

void do_deploy(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_session()) return;

    auto parsed = parse_command_args(arg, {"dry-run", "no-yes"});
    if (parsed.is_err()) {
        std::cout << theme::fail(parsed.error);
        return;
    }
    const auto& args = parsed.value;

    DeployOptions opts;
    opts.path = args.first_or(".");
    opts.dry_run = args.has("dry-run");
    opts.yes = !args.has("no-yes");
    opts.overrides = overrides_from(args);

    std::cout << theme::step(fmt::format("Deploying {}{}", opts.path, opts.dry_run ? " (dry run)" : ""));
    std::cout << "\n";

    // Print whatever arrived since the previous refresh
    size_t shown = 0;
    auto refresh = [&shown](const LogBuffer& log) {
        const auto& lines = log.lines();
        for (; shown < lines.size(); shown++) {
            std::cout << theme::output(lines[shown]);
        }
        std::cout.flush();
    };

    auto result = cli.bridge->deploy(*cli.session, opts, refresh);
    std::cout << "\n";
    if (result.is_err()) {
        std::cout << theme::fail("Deploy failed: " + result.error);
        return;
    }

    const auto& out = result.value;
    if (out.success()) {
        std::cout << theme::ok(fmt::format("Deploy finished: {}", out.status()));
    } else {
        std::cout << theme::fail(fmt::format("Deploy finished: {} (exit {})", out.status(), out.exit_code));
    }
    print_reply(out.reply, true);

    if (cli.session->preview_url) {
        std::cout << theme::kv("Preview", theme::teal(*cli.session->preview_url));
    }
}

void do_diagnose(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_session()) return;

    auto parsed = parse_command_args(arg);
    if (parsed.is_err()) {
        std::cout << theme::fail(parsed.error);
        return;
    }
    const auto& args = parsed.value;

    DiagnoseOptions opts;
    opts.path = args.get("path").value_or("");
    opts.log_path = args.get("log");
    opts.record_id = args.get("id");
    // A lone positional is a record id
    if (!opts.record_id && !opts.log_path && !args.positional.empty()) {
        opts.record_id = args.positional.front();
    }

    stream_tool_output(cli);
    auto result = cli.bridge->diagnose(*cli.session, opts);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        std::cout << theme::step("Usage: diagnose [--path P] --log <file> | --id <record>");
        return;
    }
    print_outcome(result.value);
}

void do_undeploy(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_session()) return;

    auto parsed = parse_command_args(arg);
    if (parsed.is_err()) {
        std::cout << theme::fail(parsed.error);
        return;
    }
    std::string id = parsed.value.get("id").value_or(parsed.value.first_or(""));

    stream_tool_output(cli);
    auto result = cli.bridge->undeploy(*cli.session, id);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        std::cout << theme::step("Usage: undeploy <record-id>");
        return;
    }
    print_outcome(result.value);
}

void register_deploy_commands(BaseCLI& cli) {
    cli.add_command("plan", do_plan, "Plan a deployment: plan [path] [--provider P] [--method M]");
    cli.add_command("deploy", do_deploy, "Deploy and stream logs: deploy [path] [--dry-run]");
    cli.add_command("diagnose", do_diagnose, "Diagnose a failure: --log <file> or --id <record>");
    cli.add_command("undeploy", do_undeploy, "Suggest teardown steps for a record");
}
