#pragma once

#include <optional>
#include <string>
#include <json/json.h>

// Recover the trailing JSON object from mixed human/machine tool output.
//
// Scans backward for '{' and tries to parse each suffix starting there as a
// complete JSON document (only whitespace may follow it). The first suffix
// that parses wins, so a record with nested objects is returned whole rather
// than as an inner fragment. Returns nullopt when nothing parses; callers
// fall back to the raw text.
std::optional<Json::Value> extract_last_json_object(const std::string& text);

// Parse `text` as exactly one JSON document. nullopt on any error.
std::optional<Json::Value> parse_json(const std::string& text);

// Compact single-line rendering of a record.
std::string serialize_record(const Json::Value& record);

// The record's "url" when it is a non-empty string.
std::optional<std::string> record_url(const Json::Value& record);

// {"type": "Error", "message": message}
Json::Value make_error_record(const std::string& message);
