#include "string_utils.hpp"
#include <cctype>

namespace StringUtils {

std::optional<std::vector<std::string>> split_args(const std::string& line) {
    std::vector<std::string> words;
    std::string current;
    bool in_word = false;
    char quote = 0;

    for (size_t i = 0; i < line.size(); i++) {
        char c = line[i];

        if (quote == '\'') {
            if (c == '\'') quote = 0;
            else current += c;
            continue;
        }
        if (quote == '"') {
            if (c == '"') {
                quote = 0;
            } else if (c == '\\' && i + 1 < line.size() &&
                       (line[i + 1] == '"' || line[i + 1] == '\\')) {
                current += line[++i];
            } else {
                current += c;
            }
            continue;
        }

        if (std::isspace(static_cast<unsigned char>(c))) {
            if (in_word) {
                words.push_back(current);
                current.clear();
                in_word = false;
            }
            continue;
        }

        in_word = true;
        if (c == '\'' || c == '"') {
            quote = c;
        } else if (c == '\\' && i + 1 < line.size()) {
            current += line[++i];
        } else {
            current += c;
        }
    }

    if (quote != 0) return std::nullopt;
    if (in_word) words.push_back(current);
    return words;
}

std::string quote_arg(const std::string& word) {
    if (!word.empty() && word.find_first_of(" \t\n'\"\\") == std::string::npos) {
        return word;
    }
    // Single quotes keep everything literal; an embedded ' closes, escapes, reopens
    std::string out = "'";
    for (char c : word) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

std::string join_args(const std::vector<std::string>& words) {
    std::string out;
    for (size_t i = 0; i < words.size(); i++) {
        if (i > 0) out += ' ';
        out += quote_arg(words[i]);
    }
    return out;
}

}
