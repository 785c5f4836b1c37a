#pragma once

// ── External tool defaults ──────────────────────────────────
constexpr const char* DEFAULT_TOOL_PROGRAM = "node";
constexpr const char* DEFAULT_TOOL_SCRIPT  = "agent/cli/index.js";
constexpr const char* DEFAULT_HISTORY_FILE = "state/deployments.json";

// ── Process I/O ─────────────────────────────────────────────
constexpr int PROCESS_READ_BUF_SIZE      = 4096;
constexpr int TERMINATE_GRACE_MS         = 2000;  // SIGTERM -> SIGKILL window
constexpr int TERMINATE_POLL_MS          = 100;

// ── Live log / tail ─────────────────────────────────────────
constexpr int DEFAULT_LOG_REFRESH_LINES  = 5;     // redraw live log every N lines
constexpr int TAIL_LOG_MAX_LINES         = 200;   // TailLogs returns at most this many
constexpr int BUFFER_PREVIEW_LINES       = 40;    // 'buffer' command shows this many

// ── Session ─────────────────────────────────────────────────
constexpr const char* SESSION_ID_PREFIX  = "s-";
constexpr int SESSION_ID_HEX_DIGITS      = 8;

// ── Messages shared with callers ────────────────────────────
constexpr const char* NO_RECORD_CAPTURED_MSG = "Deploy finished but no JSON record captured.";
constexpr const char* DIAGNOSE_MISSING_INPUT_MSG = "Provide either a log path or a record id.";
constexpr const char* UNDEPLOY_MISSING_INPUT_MSG = "Provide a record id.";
