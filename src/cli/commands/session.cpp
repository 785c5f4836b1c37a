#include "command_helpers.hpp"
#include "../theme.hpp"
#include <iostream>

static std::string pref_or_dash(const std::optional<std::string>& v) {
    return v ? *v : theme::dim("-");
}

void do_prefs(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_session()) return;

    auto parsed = parse_command_args(arg);
    if (parsed.is_err()) {
        std::cout << theme::fail(parsed.error);
        return;
    }
    const auto& args = parsed.value;

    SessionPrefs partial;
    partial.provider = args.get("provider");
    partial.method = args.get("method");
    partial.output_dir = args.get("output-dir");
    partial.domain = args.get("domain");

    if (!partial.empty()) {
        auto update = cli.bridge->modify_preferences(*cli.session, partial);
        std::cout << theme::ok("Preferences updated");
        std::cout << theme::log(update.reply);
    }

    const auto& prefs = cli.session->session.prefs();
    std::cout << theme::section("Preferences");
    std::cout << theme::kv("Provider", pref_or_dash(prefs.provider));
    std::cout << theme::kv("Method", pref_or_dash(prefs.method));
    std::cout << theme::kv("Output", pref_or_dash(prefs.output_dir));
    std::cout << theme::kv("Domain", pref_or_dash(prefs.domain));
    std::cout << "\n";
}

void do_preview(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_session()) return;

    auto parsed = parse_command_args(arg);
    if (parsed.is_err()) {
        std::cout << theme::fail(parsed.error);
        return;
    }
    std::string url = parsed.value.first_or("");
    if (!url.empty()) {
        url = cli.bridge->show_preview(*cli.session, url);
    } else if (cli.session->preview_url) {
        url = *cli.session->preview_url;
    } else {
        std::cout << theme::dim("    No deployment URL yet.") << "\n";
        return;
    }
    std::cout << theme::kv("Preview", theme::teal(url));
}

void do_status(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_session()) return;

    const auto& ctx = *cli.session;
    std::cout << theme::section("Session");
    std::cout << theme::kv("Session", ctx.session.session_id());
    std::cout << theme::kv("Tool root", cli.bridge->settings().tool_root.string());
    std::cout << theme::kv("Provider", pref_or_dash(ctx.session.prefs().provider));
    std::cout << theme::kv("Method", pref_or_dash(ctx.session.prefs().method));
    std::cout << theme::kv("Preview", ctx.preview_url ? theme::teal(*ctx.preview_url) : theme::dim("-"));
    std::cout << theme::kv("Log", std::to_string(ctx.log.size()) + " lines");
    std::cout << "\n" << render_stepper(ctx.progress.state()) << "\n";
}

void register_session_commands(BaseCLI& cli) {
    cli.add_command("prefs", do_prefs, "Show or set --provider, --method, --output-dir, --domain");
    cli.add_command("preview", do_preview, "Show or set the preview URL");
    cli.add_command("status", do_status, "Session, preferences and deploy progress");
}
