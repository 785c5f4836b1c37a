#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>

namespace fs = std::filesystem;

// Optional scalar -> optional<string>; absent keys leave `out` untouched.
static void overlay_pref(const YAML::Node& node, const char* key,
                         std::optional<std::string>& out) {
    if (node[key] && node[key].IsScalar()) {
        out = node[key].as<std::string>();
    }
}

static void overlay_tool_config(const YAML::Node& node, ToolConfig& tool) {
    auto cmd = node["command"];
    if (cmd) {
        // Accept a list (preferred) or a single program name
        if (cmd.IsSequence()) {
            tool.command = cmd.as<std::vector<std::string>>();
        } else if (cmd.IsScalar()) {
            tool.command = {cmd.as<std::string>()};
        }
    }
    if (node["root"] && node["root"].IsScalar()) {
        tool.root = node["root"].as<std::string>();
    }
    if (node["history"] && node["history"].IsScalar()) {
        tool.history = node["history"].as<std::string>();
    }
    if (node["no_llm"]) {
        tool.no_llm = node["no_llm"].as<bool>(false);
    }
}

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

bool project_config_exists(const fs::path& dir) {
    return fs::exists(get_project_config_path(dir));
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".dipole";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

fs::path get_project_config_path(const fs::path& dir) {
    return dir / "dipole.yaml";
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err("Failed to create " + config_path.parent_path().string() +
                                 ": " + ec.message());
    }

    const char* default_config = R"(# dipole configuration
# Project-level dipole.yaml files override anything set here.

tool:
  command: ["node", "agent/cli/index.js"]   # deploy tool argv prefix
  root: "."                                 # working directory for the tool
  history: "state/deployments.json"         # deployment history (relative to root)
  no_llm: false                             # pass --no-llm to the tool

# Passed through to the tool untouched, e.g. FAST_DEPLOY_MOCK: "success"
environment: {}

ui:
  refresh_every: 5                          # live log refresh cadence (lines)

# Optional: initial session preferences
# defaults:
#   provider: "netlify"
#   method: "cli"
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err("Failed to create config file at " + config_path.string());
    }
    out << default_config;
    return Result<void>::Ok();
}

Config Config::defaults(const fs::path& project_dir) {
    Config config;
    config.tool_.command = {DEFAULT_TOOL_PROGRAM, DEFAULT_TOOL_SCRIPT};
    config.tool_.root = ".";
    config.tool_.history = DEFAULT_HISTORY_FILE;
    config.ui_.refresh_every = DEFAULT_LOG_REFRESH_LINES;
    config.project_dir_ = project_dir;
    return config;
}

Result<void> Config::overlay_file(const fs::path& path, Config& config) {
    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (!root || root.IsNull()) {
            return Result<void>::Ok();   // empty file
        }
        if (!root.IsMap()) {
            return Result<void>::Err(path.string() + ": top level must be a mapping");
        }

        if (root["tool"] && root["tool"].IsMap()) {
            overlay_tool_config(root["tool"], config.tool_);
        }

        if (root["environment"] && root["environment"].IsMap()) {
            for (const auto& kv : root["environment"]) {
                config.environment_[kv.first.as<std::string>()] = kv.second.as<std::string>("");
            }
        }

        if (root["ui"] && root["ui"].IsMap()) {
            int every = root["ui"]["refresh_every"].as<int>(config.ui_.refresh_every);
            config.ui_.refresh_every = every > 0 ? every : 1;
        }

        if (root["defaults"] && root["defaults"].IsMap()) {
            const auto& d = root["defaults"];
            overlay_pref(d, "provider", config.default_prefs_.provider);
            overlay_pref(d, "method", config.default_prefs_.method);
            overlay_pref(d, "output_dir", config.default_prefs_.output_dir);
            overlay_pref(d, "domain", config.default_prefs_.domain);
        }

        if (config.tool_.command.empty()) {
            return Result<void>::Err(path.string() + ": tool.command must not be empty");
        }
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to parse " + path.string() + ": " + e.what());
    }
}

Result<Config> Config::load_global() {
    if (!global_config_exists()) {
        return Result<Config>::Err("Global config not found at " + get_global_config_path().string());
    }

    Config config = defaults();
    auto r = overlay_file(get_global_config_path(), config);
    if (r.is_err()) return Result<Config>::Err(r.error);
    return Result<Config>::Ok(config);
}

Result<Config> Config::load_project(const fs::path& dir) {
    if (!project_config_exists(dir)) {
        return Result<Config>::Err("Project config not found at " + get_project_config_path(dir).string());
    }

    Config config = defaults(dir);
    auto r = overlay_file(get_project_config_path(dir), config);
    if (r.is_err()) return Result<Config>::Err(r.error);
    return Result<Config>::Ok(config);
}

Result<Config> Config::load(const fs::path& project_dir) {
    Config config = defaults(project_dir);

    if (global_config_exists()) {
        auto r = overlay_file(get_global_config_path(), config);
        if (r.is_err()) return Result<Config>::Err(r.error);
    }

    if (project_config_exists(project_dir)) {
        auto r = overlay_file(get_project_config_path(project_dir), config);
        if (r.is_err()) return Result<Config>::Err(r.error);
    }

    return Result<Config>::Ok(config);
}

fs::path Config::tool_root() const {
    fs::path root = tool_.root.empty() ? fs::path(".") : fs::path(tool_.root);
    if (root.is_relative()) {
        root = project_dir_ / root;
    }
    return root.lexically_normal();
}

fs::path Config::history_path() const {
    fs::path p = tool_.history.empty() ? fs::path(DEFAULT_HISTORY_FILE) : fs::path(tool_.history);
    if (p.is_relative()) {
        p = tool_root() / p;
    }
    return p.lexically_normal();
}
