#pragma once

#include <string>
#include <vector>
#include <optional>

namespace StringUtils {

// Split a command line into words. Whitespace separates words; single and
// double quotes group, backslash escapes the next character (except inside
// single quotes). nullopt on an unterminated quote.
std::optional<std::vector<std::string>> split_args(const std::string& line);

// Quote a word so split_args() gives it back unchanged.
std::string quote_arg(const std::string& word);

// quote_arg() each word and join with spaces.
std::string join_args(const std::vector<std::string>& words);

}
