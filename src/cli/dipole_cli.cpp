#include "dipole_cli.hpp"
#include "preflight.hpp"
#include "theme.hpp"
#include "commands/command_helpers.hpp"
#include <iostream>
#include <sstream>
#include <cstdlib>
#include <core/config.hpp>
#include <managers/bridge_log.hpp>
#include <util/string_utils.hpp>
#include <readline/readline.h>
#include <readline/history.h>

DipoleCLI::DipoleCLI() : BaseCLI() {
    register_all_commands();
}

void DipoleCLI::register_all_commands() {
    add_command("help", [this](BaseCLI& cli, const std::string& arg) {
        this->print_help();
    }, "Show this help message");

    add_command("quit", [](BaseCLI& cli, const std::string& arg) {
        cli.save_session();
        std::cout << theme::dim("Bye.") << "\n";
        exit(0);
    }, "Exit dipole");

    add_command("exit", [](BaseCLI& cli, const std::string& arg) {
        cli.save_session();
        std::cout << theme::dim("Bye.") << "\n";
        exit(0);
    }, "Exit dipole");

    add_command("clear", [](BaseCLI& cli, const std::string& arg) {
        std::cout << "\033[2J\033[H" << std::flush;
    }, "Clear the screen");

    add_command("setup", [this](BaseCLI& cli, const std::string& arg) {
        this->run_setup();
    }, "Create ~/.dipole/config.yaml");

    register_deploy_commands(*this);
    register_session_commands(*this);
    register_logs_commands(*this);

#ifdef DIPOLE_DEV
    add_command("debug", [](BaseCLI& cli, const std::string& arg) {
        if (arg == "log-path") {
            std::cout << theme::kv("Debug log", dipole_log_path());
        } else {
            std::cout << theme::fail("Unknown debug command: " + arg);
            std::cout << theme::step("Available: debug log-path");
        }
    }, "Dev debugging commands");
#endif
}

void DipoleCLI::attach_progress_view() {
    if (!session) return;
    session->progress.set_listener([](const ProgressState& state) {
        std::cout << render_stepper(state);
    });
}

void DipoleCLI::run_repl(const std::optional<std::string>& resume_id) {
    std::cout << theme::banner();

    // Preflight
    std::cout << theme::section("Preflight");
    auto issues = run_preflight_checks();
    for (const auto& issue : issues) {
        std::cout << (issue.is_hint ? theme::info(issue.message) : theme::fail(issue.message));
        std::cout << theme::step(issue.fix);
    }
    if (has_errors(issues)) {
        std::cout << "\n";
        return;
    }
    if (!require_config()) return;
    std::cout << theme::check("Config loaded");

    persist_session = true;
    init_session(resume_id);
    attach_progress_view();

    std::cout << theme::section(resume_id ? "Resumed" : "Ready");
    std::cout << theme::kv("Session", session->session.session_id());
    std::cout << theme::kv("Tool", StringUtils::join_args(config->tool().command));
    std::cout << theme::kv("Root", config->tool_root().string());
    if (session->preview_url) {
        std::cout << theme::kv("Preview", theme::teal(*session->preview_url));
    }
    std::cout << theme::divider();
    std::cout << theme::dim("    Type 'help' for commands, 'quit' to exit.") << "\n\n";

    std::string line;
    while (true) {
        std::string prompt = get_prompt_string();
        char* raw = readline(prompt.c_str());
        if (!raw) {
            break;  // EOF / Ctrl-D
        }

        line = raw;
        free(raw);

        if (line.empty()) {
            continue;
        }

        add_history(line.c_str());

        std::istringstream iss(line);
        std::string command;
        iss >> command;

        std::string args;
        std::getline(iss, args);
        if (!args.empty() && args[0] == ' ') {
            args = args.substr(1);
        }

        execute_command(command, args);
        save_session();
    }

    save_session();
    std::cout << "\n";
}

void DipoleCLI::run_setup() {
    bool existed = global_config_exists();
    auto result = create_default_global_config();
    if (result.is_err()) {
        std::cout << theme::fail("Failed to create config file: " + result.error);
        return;
    }

    if (existed) {
        std::cout << theme::info("Config already exists at " + get_global_config_path().string());
    } else {
        std::cout << theme::ok("Config file ready at " + get_global_config_path().string());
    }
    std::cout << theme::step("Edit tool.command and tool.root to point at your deploy tool.");
}

void DipoleCLI::run_command(const std::string& command, const std::vector<std::string>& args,
                            const std::optional<std::string>& resume_id) {
    if (command != "setup" && command != "help" && config) {
        init_session(resume_id);
        attach_progress_view();
    }

    // Re-quote so words with spaces survive the command's own tokenizer
    execute_command(command, StringUtils::join_args(args));
    save_session();
}
