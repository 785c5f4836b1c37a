#pragma once

#include <string>
#include <vector>
#include <ctime>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Ensure a URL carries an explicit scheme, defaulting to https://.
// "example.com" -> "https://example.com", "//example.com" -> "https://example.com",
// "http://x" and "https://x" are kept. Surrounding whitespace is dropped.
std::string normalize_url(const std::string& url);

// Split text into lines on '\n' (a trailing '\r' is dropped from each line).
// A trailing newline does not produce an empty last line.
std::vector<std::string> split_lines(const std::string& text);

// Last `max_lines` lines of `text`, joined with '\n' (no trailing newline).
std::string last_lines(const std::string& text, size_t max_lines);

// New session identifier: "s-" followed by 8 lowercase hex digits.
std::string generate_session_id();
