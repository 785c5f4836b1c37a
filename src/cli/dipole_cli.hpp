#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>
#include <optional>

// Forward declarations for command registration
void register_deploy_commands(BaseCLI& cli);
void register_session_commands(BaseCLI& cli);
void register_logs_commands(BaseCLI& cli);

class DipoleCLI : public BaseCLI {
public:
    DipoleCLI();

    // Interactive session; `resume_id` reloads ~/.dipole/sessions/<id>.yaml
    void run_repl(const std::optional<std::string>& resume_id = std::nullopt);

    // Write ~/.dipole/config.yaml if missing
    void run_setup();

    // One-shot: `dipole <command> [args]`
    void run_command(const std::string& command, const std::vector<std::string>& args,
                     const std::optional<std::string>& resume_id = std::nullopt);

private:
    void register_all_commands();

    // Redraw the stepper whenever progress moves
    void attach_progress_view();
};
