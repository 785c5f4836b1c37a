#pragma once

#include "../base_cli.hpp"
#include <core/types.hpp>
#include <managers/progress_tracker.hpp>
#include <map>
#include <set>
#include <string>
#include <vector>

// Shared helpers used by command files (deploy.cpp, session.cpp, logs.cpp)

// Words of a command's argument string: positionals, "--key value"
// options, and bare "--flag" switches.
struct CommandArgs {
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;     // keyed without "--"
    std::set<std::string> switches;                 // keyed without "--"

    std::optional<std::string> get(const std::string& key) const;
    bool has(const std::string& flag) const { return switches.count(flag) > 0; }
    std::string first_or(const std::string& fallback) const {
        return positional.empty() ? fallback : positional.front();
    }
};

// `switch_names` lists the flags that take no value; every other "--name"
// consumes the following word.
Result<CommandArgs> parse_command_args(const std::string& arg,
                                       const std::set<std::string>& switch_names = {});

// Print a tool reply: a JSON record indented, raw output as-is.
void print_reply(const std::string& reply, bool is_record);

// One-line progress stepper: Plan, Deploy, Verify, Preview
std::string render_stepper(const ProgressState& state);

// Forward declarations for command handlers
void do_plan(BaseCLI& cli, const std::string& arg);
void do_deploy(BaseCLI& cli, const std::string& arg);
void do_diagnose(BaseCLI& cli, const std::string& arg);
void do_undeploy(BaseCLI& cli, const std::string& arg);
void do_prefs(BaseCLI& cli, const std::string& arg);
void do_preview(BaseCLI& cli, const std::string& arg);
void do_status(BaseCLI& cli, const std::string& arg);
void do_logs(BaseCLI& cli, const std::string& arg);
void do_buffer(BaseCLI& cli, const std::string& arg);
void do_save_log(BaseCLI& cli, const std::string& arg);
