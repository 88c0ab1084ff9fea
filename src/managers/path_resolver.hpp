#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Expand a local path: a leading "~" becomes the home directory, and
// %USERPROFILE% %APPDATA% %LOCALAPPDATA% %HOME% (or the $VAR spelling) are
// substituted anywhere. Variables that are not set are left as written.
std::string expand_local_path(const std::string& path);

// Make a remote path safe to place inside double quotes in a remote shell
// command: "~" becomes "$HOME" so the shell expands it, and " ` $ \ are
// backslash-escaped. A leading "$HOME" or "${HOME}" is kept as written.
std::string to_remote_shell_path(const std::string& remote_path);

// Expand a glob (*, ?, [...], [!...], and ** as a whole path component).
// Returns matching paths in sorted order; unreadable directories are skipped.
// Malformed patterns are an error.
Result<std::vector<fs::path>> expand_glob(const std::string& pattern);
