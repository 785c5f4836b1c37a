#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Per-session deployment preferences. Every field is optional; an unset
// field means "let the deploy tool decide".
struct SessionPrefs {
    std::optional<std::string> provider;     // vercel | netlify
    std::optional<std::string> method;       // cli | api
    std::optional<std::string> output_dir;   // build output directory override
    std::optional<std::string> domain;       // custom domain suggestion

    bool empty() const {
        return !provider && !method && !output_dir && !domain;
    }

    bool operator==(const SessionPrefs& o) const {
        return provider == o.provider && method == o.method &&
               output_dir == o.output_dir && domain == o.domain;
    }
    bool operator!=(const SessionPrefs& o) const { return !(*this == o); }
};

// External deploy tool settings
struct ToolConfig {
    std::vector<std::string> command;   // argv prefix, e.g. {"node", "agent/cli/index.js"}
    std::string root;                   // working directory for every spawn
    std::string history;                // deployments.json (relative to root unless absolute)
    bool no_llm = false;                // pass --no-llm to the tool
};

struct UiConfig {
    int refresh_every = 5;              // live log refresh cadence, in lines
};
