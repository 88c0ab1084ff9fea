#pragma once

#include <string>
#include <core/types.hpp>

// Remote paths that must never be the target of rm -rf: "", "/", "~", "$HOME".
// Compared after trimming whitespace, collapsing repeated slashes, dropping a
// trailing "/" or "/." and reading "${HOME}" as "$HOME", so "~/" and "//" are
// refused too. "." is refused as well: a remote shell starts in the home directory.
bool is_dangerous_remote_path(const std::string& remote_path);

// Err naming the path and the refused action when the path is dangerous.
// action reads as a verb phrase, e.g. "sync into", "remove".
Result<void> check_remote_path(const std::string& remote_path, const std::string& action);
