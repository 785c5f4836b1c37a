#include "preflight.hpp"
#include <core/config.hpp>
#include <filesystem>
#include <cstdlib>
#include <fmt/format.h>

namespace fs = std::filesystem;

// PATH lookup the way execvp does it
static bool program_on_path(const std::string& program) {
    if (program.find('/') != std::string::npos) {
        return fs::exists(program);
    }
    const char* path = std::getenv("PATH");
    if (!path) return false;

    std::string dirs = path;
    size_t start = 0;
    while (start <= dirs.size()) {
        auto end = dirs.find(':', start);
        if (end == std::string::npos) end = dirs.size();
        std::string dir = dirs.substr(start, end - start);
        if (dir.empty()) dir = ".";
        std::error_code ec;
        if (fs::exists(fs::path(dir) / program, ec)) return true;
        start = end + 1;
    }
    return false;
}

std::vector<PreflightIssue> check_global_config() {
    std::vector<PreflightIssue> issues;

    if (!global_config_exists()) {
        issues.push_back({
            "No global config at " + get_global_config_path().string(),
            "Run 'dipole setup' to create one (defaults are used meanwhile)",
            true
        });
        return issues;
    }

    auto result = Config::load_global();
    if (result.is_err()) {
        issues.push_back({"Failed to parse global config: " + result.error, "Check YAML syntax"});
    }
    return issues;
}

std::vector<PreflightIssue> check_project_config() {
    std::vector<PreflightIssue> issues;

    if (!project_config_exists()) {
        return issues;   // optional
    }

    auto result = Config::load_project();
    if (result.is_err()) {
        issues.push_back({"Failed to parse dipole.yaml: " + result.error, "Check YAML syntax"});
    }
    return issues;
}

std::vector<PreflightIssue> check_tool(const Config& config) {
    std::vector<PreflightIssue> issues;

    fs::path root = config.tool_root();
    if (!fs::is_directory(root)) {
        issues.push_back({
            fmt::format("Tool root '{}' is not a directory", root.string()),
            "Set tool.root in dipole.yaml"
        });
        return issues;
    }

    const auto& cmd = config.tool().command;
    if (!cmd.empty() && !program_on_path(cmd.front())) {
        issues.push_back({
            fmt::format("'{}' not found on PATH", cmd.front()),
            "Install it or set tool.command in dipole.yaml"
        });
    }

    if (!fs::exists(config.history_path())) {
        issues.push_back({
            "No deployment history yet at " + config.history_path().string(),
            "'logs' works after the first deploy",
            true
        });
    }
    return issues;
}

bool has_errors(const std::vector<PreflightIssue>& issues) {
    for (const auto& issue : issues) {
        if (!issue.is_hint) return true;
    }
    return false;
}

std::vector<PreflightIssue> run_preflight_checks() {
    std::vector<PreflightIssue> all;

    // Broken config files make the tool check meaningless
    auto project_issues = check_project_config();
    all.insert(all.end(), project_issues.begin(), project_issues.end());

    auto global_issues = check_global_config();
    all.insert(all.end(), global_issues.begin(), global_issues.end());
    if (has_errors(all)) return all;

    auto config = Config::load();
    if (config.is_err()) {
        all.push_back({config.error, "Check YAML syntax"});
        return all;
    }

    auto tool_issues = check_tool(config.value);
    all.insert(all.end(), tool_issues.begin(), tool_issues.end());
    return all;
}
