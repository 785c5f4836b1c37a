#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <core/config.hpp>
#include <managers/tool_bridge.hpp>

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    bool require_config();
    bool require_session();

    // Start a fresh session, or resume a saved one when `resume_id` is given.
    void init_session(const std::optional<std::string>& resume_id = std::nullopt);

    // Persist prefs and preview URL to ~/.dipole/sessions/<id>.yaml
    void save_session();

    void execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    // Public state
    std::optional<Config> config;
    std::string config_error;
    std::unique_ptr<SessionContext> session;
    std::unique_ptr<ToolBridge> bridge;
    bool persist_session = false;

    // Returns the prompt string for readline
    std::string get_prompt_string() const;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
};
