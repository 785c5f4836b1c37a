#pragma once

#include <string>
#include <map>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Defaults only (no files read)
    static Config defaults(const fs::path& project_dir = fs::current_path());

    // Load global config from ~/.dipole/config.yaml
    static Result<Config> load_global();

    // Load project config from ./dipole.yaml
    static Result<Config> load_project(const fs::path& dir = fs::current_path());

    // Load both and combine (project keys override global ones).
    // Missing files are not an error; malformed ones are.
    static Result<Config> load(const fs::path& project_dir = fs::current_path());

    // Accessors
    const ToolConfig& tool() const { return tool_; }
    const UiConfig& ui() const { return ui_; }
    const std::map<std::string, std::string>& environment() const { return environment_; }
    const SessionPrefs& default_prefs() const { return default_prefs_; }
    const fs::path& project_dir() const { return project_dir_; }

    // Working directory for spawned tool processes (tool.root resolved
    // against the project directory).
    fs::path tool_root() const;

    // Deployment history file (tool.history resolved against tool_root()).
    fs::path history_path() const;

public:
    Config() = default;

private:
    ToolConfig tool_;
    UiConfig ui_;
    std::map<std::string, std::string> environment_;
    SessionPrefs default_prefs_;
    fs::path project_dir_;

    // Overlay the keys present in a YAML file onto `config`.
    static Result<void> overlay_file(const fs::path& path, Config& config);
};

// Helper to check if configs exist
bool global_config_exists();
bool project_config_exists(const fs::path& dir = fs::current_path());

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
fs::path get_project_config_path(const fs::path& dir = fs::current_path());

// Create default global config
Result<void> create_default_global_config();
