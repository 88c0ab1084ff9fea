#include "safety_guard.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

// "${HOME}" spelled as "$HOME", runs of '/' collapsed, trailing "/" and "/."
// removed. "/" on its own stays "/".
static std::string normalize_remote_path(const std::string& remote_path) {
    std::string p = replace_all(trimmed(remote_path), "${HOME}", "$HOME");

    std::string collapsed;
    for (char c : p) {
        if (c == '/' && !collapsed.empty() && collapsed.back() == '/') continue;
        collapsed += c;
    }

    while (collapsed.size() > 1) {
        if (collapsed.back() == '/') {
            collapsed.pop_back();
        } else if (collapsed.size() >= 2 && collapsed.compare(collapsed.size() - 2, 2, "/.") == 0) {
            collapsed.erase(collapsed.size() - 2);
            if (collapsed.empty()) collapsed = "/";
        } else {
            break;
        }
    }
    return collapsed;
}

bool is_dangerous_remote_path(const std::string& remote_path) {
    std::string p = normalize_remote_path(remote_path);
    return p.empty() || p == "/" || p == "." || p == "~" || p == "$HOME";
}

Result<void> check_remote_path(const std::string& remote_path, const std::string& action) {
    if (!is_dangerous_remote_path(remote_path)) {
        return Result<void>::Ok();
    }
    std::string err = fmt::format("Refusing to {} dangerous remote path: '{}'", action, remote_path);
    log_error(err);
    return Result<void>::Err(err);
}
