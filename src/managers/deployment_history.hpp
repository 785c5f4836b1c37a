#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// One deployment attempt persisted by the external tool
struct HistoryEntry {
    std::string id;
    std::string logs_path;          // "" when the tool recorded none
    std::string provider;
    std::string url;
    std::string status;
};

enum class TailStatus {
    Ok,
    NoHistory,          // history file missing
    RecordNotFound,     // no entry with that id
    LogFileMissing,     // entry found, log file absent
    ReadError,          // history or log unreadable / malformed
};

struct TailLogsResult {
    TailStatus status = TailStatus::Ok;
    std::string text;               // log tail on Ok, message otherwise

    bool ok() const { return status == TailStatus::Ok; }
};

// Read-only view of the tool's deployments.json (a JSON array, appended
// by the tool, newest last).
class DeploymentHistory {
public:
    // Relative logsPath values are resolved against `root`.
    DeploymentHistory(fs::path history_file, fs::path root);

    bool exists() const { return fs::exists(history_file_); }

    Result<std::vector<HistoryEntry>> load() const;

    // Newest entry with this id. Err on a malformed file; Ok(nullopt) if absent.
    Result<std::optional<HistoryEntry>> find_latest(const std::string& record_id) const;

    // Last `max_lines` lines of the record's log file.
    TailLogsResult tail_logs(const std::string& record_id, size_t max_lines) const;

    const fs::path& path() const { return history_file_; }

private:
    fs::path resolve_logs_path(const std::string& logs_path) const;

    fs::path history_file_;
    fs::path root_;
};
