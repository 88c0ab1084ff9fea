#pragma once

#include <string>
#include <optional>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE then HOME on Windows),
// or nullopt when neither is set.
std::optional<std::filesystem::path> find_home_dir();

// Like find_home_dir() but falls back to the temp directory.
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Value of an environment variable, nullopt when unset.
std::optional<std::string> get_env(const std::string& name);

// Address of the ssh ControlMaster channel for this platform.
// Windows: named pipe \\.\pipe\<prefix>%C
// Unix:    <temp dir>/<prefix>%C (unix domain socket)
// The result is handed to ssh verbatim; %C is expanded by OpenSSH.
std::string control_path(const std::string& prefix);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
