#include "command_helpers.hpp"
#include "../theme.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <iostream>
#include <fmt/format.h>

void do_logs(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_session()) return;

    auto parsed = parse_command_args(arg);
    if (parsed.is_err()) {
        std::cout << theme::fail(parsed.error);
        return;
    }
    std::string id = parsed.value.first_or("");
    if (id.empty()) {
        std::cout << theme::fail("Missing record id.");
        std::cout << theme::step("Usage: logs <record-id>");
        return;
    }

    auto result = cli.bridge->tail_logs(*cli.session, id);
    if (!result.ok()) {
        std::cout << theme::fail(result.text);
        return;
    }

    std::cout << "\n";
    for (const auto& line : split_lines(result.text)) {
        std::cout << theme::output(line);
    }
    std::cout << "\n";
}

void do_buffer(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_session()) return;

    const auto& log = cli.session->log;
    if (log.empty()) {
        std::cout << theme::dim("    No deploy output captured yet.") << "\n";
        return;
    }

    std::string a = arg;
    trim(a);
    int n = safe_stoi(a, BUFFER_PREVIEW_LINES);
    if (n <= 0) n = BUFFER_PREVIEW_LINES;

    const auto& lines = log.lines();
    size_t first = lines.size() > static_cast<size_t>(n) ? lines.size() - n : 0;

    std::cout << "\n";
    for (size_t i = first; i < lines.size(); i++) {
        std::cout << theme::output(lines[i]);
    }
    std::cout << theme::dim(fmt::format("    ({} of {} lines)", lines.size() - first, lines.size()))
              << "\n\n";
}

void do_save_log(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_session()) return;

    auto parsed = parse_command_args(arg);
    if (parsed.is_err()) {
        std::cout << theme::fail(parsed.error);
        return;
    }
    std::string path = parsed.value.first_or("");
    if (path.empty()) {
        path = fmt::format("dipole-{}.log", cli.session->session.session_id());
    }

    auto r = cli.session->log.save_to(path);
    if (r.is_err()) {
        std::cout << theme::fail(r.error);
        return;
    }
    std::cout << theme::ok(fmt::format("Saved {} lines to {}", cli.session->log.size(), path));
}

void register_logs_commands(BaseCLI& cli) {
    cli.add_command("logs", do_logs, "Show the stored log of a deployment record");
    cli.add_command("buffer", do_buffer, "Show the captured output of the last deploy");
    cli.add_command("save-log", do_save_log, "Write the last deploy's output to a file");
}
