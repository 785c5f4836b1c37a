#include "platform.hpp"
#include <cstdlib>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#  include <stdlib.h>
#  define DIPOLE_ENVIRON _environ
#else
#  include <unistd.h>
extern char** environ;
#  define DIPOLE_ENVIRON environ
#endif

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
    if (!home) home = std::getenv("HOME");
#else
    const char* home = std::getenv("HOME");
#endif
    if (!home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

std::map<std::string, std::string> current_environment() {
    std::map<std::string, std::string> env;
    for (char** e = DIPOLE_ENVIRON; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        // Skip malformed entries and Windows' hidden "=C:" drive variables
        if (eq == std::string::npos || eq == 0) continue;
        env[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    return env;
}

void sleep_ms(int ms) {
#ifdef _WIN32
    Sleep(ms);
#else
    usleep(static_cast<useconds_t>(ms) * 1000);
#endif
}

} // namespace platform
