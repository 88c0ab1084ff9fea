#include "platform.hpp"
#include <cstdlib>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#else
#  include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace platform {

std::optional<fs::path> find_home_dir() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
    if (!home || !*home) home = std::getenv("HOME");
#else
    const char* home = std::getenv("HOME");
#endif
    if (!home || !*home) return std::nullopt;
    return fs::path(home);
}

fs::path home_dir() {
    auto home = find_home_dir();
    return home ? *home : temp_dir();
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

std::optional<std::string> get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value) return std::nullopt;
    return std::string(value);
}

std::string control_path(const std::string& prefix) {
#ifdef _WIN32
    // Windows OpenSSH has no unix sockets; fs::path would also mangle the \\.\ prefix.
    return std::string("\\\\.\\pipe\\") + prefix + "%C";
#else
    return (temp_dir() / (prefix + "%C")).string();
#endif
}

void sleep_ms(int ms) {
#ifdef _WIN32
    Sleep(ms);
#else
    usleep(static_cast<useconds_t>(ms) * 1000);
#endif
}

} // namespace platform
