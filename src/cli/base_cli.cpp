#include "base_cli.hpp"
#include "theme.hpp"
#include <managers/bridge_log.hpp>
#include <iostream>
#include <fmt/format.h>

BaseCLI::BaseCLI() {
    auto config_result = Config::load();
    if (config_result.is_ok()) {
        config = config_result.value;
    } else {
        config_error = config_result.error;
        dipole_log("config: " + config_error);
    }
}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::require_config() {
    if (!config.has_value()) {
        std::cout << theme::fail("Configuration error: " + config_error);
        std::cout << theme::step("Fix " + get_global_config_path().string() + " or ./dipole.yaml");
        return false;
    }
    return true;
}

bool BaseCLI::require_session() {
    if (!require_config()) {
        return false;
    }
    if (!session || !bridge) {
        init_session();
    }
    return true;
}

void BaseCLI::init_session(const std::optional<std::string>& resume_id) {
    if (!config) return;

    if (resume_id) {
        auto saved = SessionFile::for_session(*resume_id).load();
        if (saved.session_id.empty()) {
            std::cout << theme::info("No saved session '" + *resume_id + "', starting it fresh.");
            session = std::make_unique<SessionContext>(SessionStore(*resume_id, config->default_prefs()));
        } else {
            session = std::make_unique<SessionContext>(SessionStore(saved.session_id, saved.prefs));
            if (!saved.preview_url.empty()) session->preview_url = saved.preview_url;
        }
        persist_session = true;
    } else {
        session = std::make_unique<SessionContext>();
        session->session.merge(config->default_prefs());
    }

    bridge = std::make_unique<ToolBridge>(BridgeSettings::from_config(config.value()));
    dipole_log("session: " + session->session.session_id());
}

void BaseCLI::save_session() {
    if (!session || !persist_session) return;

    SavedSession saved;
    saved.session_id = session->session.session_id();
    saved.prefs = session->session.prefs();
    saved.preview_url = session->preview_url.value_or("");

    auto r = SessionFile::for_session(saved.session_id).save(saved);
    if (r.is_err()) {
        std::cout << theme::fail(r.error);
    }
}

void BaseCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type 'help' for available commands.");
        return;
    }

    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        dipole_log(fmt::format("command '{}' threw: {}", command, e.what()));
        std::cout << theme::fail(std::string(e.what()));
    }
}

void BaseCLI::print_help() const {
    // Group commands by category
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Deploy",  {"plan", "deploy", "undeploy", "diagnose"}},
        {"Session", {"prefs", "preview", "status"}},
        {"Logs",    {"logs", "buffer", "save-log"}},
        {"General", {"setup", "help", "clear", "quit", "exit"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        bool has_any = false;
        for (const auto& name : cmd_names) {
            if (commands_.count(name)) {
                has_any = true;
                break;
            }
        }
        if (!has_any) continue;

        std::cout << "\n" << theme::color::CORAL << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::TEAL
                          << fmt::format("    {:<14}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n";
}

std::string BaseCLI::get_prompt_string() const {
    // Readline uses \001 and \002 to wrap non-printing chars so it can
    // compute the visible prompt width correctly for cursor positioning.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };

    if (!session) {
        return rl_esc(theme::color::TEAL) + "dipole"
             + rl_esc(theme::color::RESET) + "> ";
    }

    std::string prompt = rl_esc(theme::color::TEAL) + "dipole"
                       + rl_esc(theme::color::RESET) + ":"
                       + rl_esc(theme::color::CORAL) + session->session.session_id()
                       + rl_esc(theme::color::RESET);

    const auto& provider = session->session.prefs().provider;
    if (provider) {
        prompt += "@" + rl_esc(theme::color::GREEN) + *provider + rl_esc(theme::color::RESET);
    }
    return prompt + "> ";
}
