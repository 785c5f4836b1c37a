#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>

// Raw output lines of the current invocation, in arrival order.
// Cleared when a new deploy starts; kept until then.
class LogBuffer {
public:
    void append(const std::string& line) { lines_.push_back(line); }
    void reset() { lines_.clear(); }

    const std::vector<std::string>& lines() const { return lines_; }
    size_t size() const { return lines_.size(); }
    bool empty() const { return lines_.empty(); }

    // Point-in-time concatenation, one line per '\n'.
    std::string text() const;

    // Last `n` lines joined with '\n'.
    std::string tail(size_t n) const;

    // Write the current snapshot to a file (overwrites).
    Result<void> save_to(const std::filesystem::path& path) const;

private:
    std::vector<std::string> lines_;
};
