#pragma once

#include <string>
#include <fmt/format.h>

namespace theme {

// Dipole colors (ANSI escape sequences)
// Teal:  #2EC4B6
// Coral: #FF7F50
namespace color {
    const std::string TEAL      = "\033[38;2;46;196;182m";
    const std::string CORAL     = "\033[38;2;255;127;80m";
    const std::string GRAY      = "\033[90m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// Colored spans for values inside a line
inline std::string teal(const std::string& s)    { return color::TEAL + s + color::RESET; }
inline std::string dim(const std::string& s)     { return color::DIM + s + color::RESET; }
inline std::string green(const std::string& s)   { return color::GREEN + s + color::RESET; }
inline std::string red(const std::string& s)     { return color::RED + s + color::RESET; }
inline std::string yellow(const std::string& s)  { return color::YELLOW + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

// 44-column rule, callers add their own spacing
inline std::string rule() {
    std::string line;
    for (int i = 0; i < 44; i++) line += "\xe2\x94\x80";
    return color::DIM + "  " + line + color::RESET + "\n";
}

// Clears the screen before the title
inline std::string banner() {
    return
        "\033[2J\033[H\n"
        + color::TEAL + color::BOLD
        + "  Dipole\n"
        + color::RESET + color::DIM + "  v0.4.0\n"
        + "  Deploy can be even faster"
        + color::RESET + "\n\n"
        + rule();
}

inline std::string section(const std::string& title) {
    return "\n" + color::CORAL + color::BOLD + "  " + title + color::RESET + "\n\n";
}

inline std::string divider() {
    return "\n" + rule() + "\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string check(const std::string& msg) {
    return color::GREEN + "    \xe2\x9c\x93 " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return color::TEAL + "    ~ " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::CORAL + "    > " + color::RESET + msg + "\n";
}

// Bridge status lines, dimmer than tool output
inline std::string log(const std::string& msg) {
    return "\033[38;2;80;80;80m    \xc2\xb7 " + msg + "\033[0m\n";
}

// One line of streamed tool output
inline std::string output(const std::string& line) {
    return color::GRAY + "    \xe2\x94\x82 " + color::RESET + line + "\n";
}

// status and prefs rows
inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<10}", key) + color::RESET + value + "\n";
}

} // namespace theme
