#include "deployment_history.hpp"
#include "bridge_log.hpp"
#include <core/utils.hpp>
#include <json/json.h>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

DeploymentHistory::DeploymentHistory(fs::path history_file, fs::path root)
    : history_file_(std::move(history_file)), root_(std::move(root)) {}

static std::string string_field(const Json::Value& rec, const char* key) {
    const Json::Value& v = rec[key];
    return v.isString() ? v.asString() : "";
}

Result<std::vector<HistoryEntry>> DeploymentHistory::load() const {
    std::ifstream in(history_file_);
    if (!in) {
        return Result<std::vector<HistoryEntry>>::Err("Cannot open " + history_file_.string());
    }

    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    Json::Value root;
    std::string errs;
    if (!Json::parseFromStream(builder, in, &root, &errs)) {
        return Result<std::vector<HistoryEntry>>::Err(
            fmt::format("Malformed {}: {}", history_file_.filename().string(), errs));
    }
    if (!root.isArray()) {
        return Result<std::vector<HistoryEntry>>::Err(
            history_file_.filename().string() + " is not a JSON array");
    }

    std::vector<HistoryEntry> entries;
    for (const auto& rec : root) {
        if (!rec.isObject()) continue;
        HistoryEntry e;
        e.id = string_field(rec, "id");
        e.logs_path = string_field(rec, "logsPath");
        e.provider = string_field(rec, "provider");
        e.url = string_field(rec, "url");
        e.status = string_field(rec, "status");
        entries.push_back(std::move(e));
    }
    return Result<std::vector<HistoryEntry>>::Ok(std::move(entries));
}

Result<std::optional<HistoryEntry>> DeploymentHistory::find_latest(const std::string& record_id) const {
    auto loaded = load();
    if (loaded.is_err()) {
        return Result<std::optional<HistoryEntry>>::Err(loaded.error);
    }

    const auto& entries = loaded.value;
    for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
        if (it->id == record_id) {
            return Result<std::optional<HistoryEntry>>::Ok(*it);
        }
    }
    return Result<std::optional<HistoryEntry>>::Ok(std::nullopt);
}

fs::path DeploymentHistory::resolve_logs_path(const std::string& logs_path) const {
    fs::path p(logs_path);
    if (p.is_relative() && !root_.empty()) p = root_ / p;
    return p;
}

TailLogsResult DeploymentHistory::tail_logs(const std::string& record_id, size_t max_lines) const {
    TailLogsResult result;

    if (!exists()) {
        result.status = TailStatus::NoHistory;
        result.text = "No deployments.json found.";
        return result;
    }

    auto found = find_latest(record_id);
    if (found.is_err()) {
        result.status = TailStatus::ReadError;
        result.text = "Error: " + found.error;
        return result;
    }
    if (!found.value) {
        result.status = TailStatus::RecordNotFound;
        result.text = "No record found for id " + record_id;
        return result;
    }

    const HistoryEntry& entry = *found.value;
    if (entry.logs_path.empty()) {
        result.status = TailStatus::LogFileMissing;
        result.text = "No logs found at (none)";
        return result;
    }

    fs::path log_file = resolve_logs_path(entry.logs_path);
    if (!fs::exists(log_file)) {
        result.status = TailStatus::LogFileMissing;
        result.text = "No logs found at " + entry.logs_path;
        return result;
    }

    std::ifstream in(log_file);
    if (!in) {
        result.status = TailStatus::ReadError;
        result.text = "Error: cannot read " + log_file.string();
        return result;
    }
    std::stringstream ss;
    ss << in.rdbuf();

    dipole_log(fmt::format("history: tail {} from {}", record_id, log_file.string()));
    result.text = last_lines(ss.str(), max_lines);
    return result;
}
