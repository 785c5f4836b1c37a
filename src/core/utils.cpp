#include "utils.hpp"
#include "constants.hpp"
#include <chrono>
#include <ctime>
#include <random>
#include <fmt/format.h>

std::string now_iso() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string normalize_url(const std::string& url) {
    std::string s = url;
    trim(s);
    if (s.empty()) return s;
    if (s.rfind("http://", 0) == 0 || s.rfind("https://", 0) == 0) {
        return s;
    }
    if (s.rfind("//", 0) == 0) {
        return "https:" + s;
    }
    return "https://" + s;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        auto nl = text.find('\n', start);
        if (nl == std::string::npos) nl = text.size();
        std::string line = text.substr(start, nl - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
        start = nl + 1;
    }
    return lines;
}

std::string last_lines(const std::string& text, size_t max_lines) {
    auto lines = split_lines(text);
    size_t first = lines.size() > max_lines ? lines.size() - max_lines : 0;

    std::string out;
    for (size_t i = first; i < lines.size(); i++) {
        if (i > first) out += '\n';
        out += lines[i];
    }
    return out;
}

std::string generate_session_id() {
    static std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<uint32_t> dist;
    return fmt::format("{}{:0{}x}", SESSION_ID_PREFIX, dist(rng), SESSION_ID_HEX_DIGITS);
}
