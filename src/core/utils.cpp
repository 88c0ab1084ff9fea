#include "utils.hpp"
#include "types.hpp"
#include <fmt/format.h>

std::string replace_all(std::string s, const std::string& from, const std::string& to) {
    if (from.empty()) return s;
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < s.size()) {
        size_t nl = s.find('\n', start);
        std::string line = s.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
        if (nl == std::string::npos) break;
        start = nl + 1;
    }
    return lines;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

// ── Connection descriptor ───────────────────────────────────

std::string to_string(AuthMethod method) {
    return method == AuthMethod::Password ? "password" : "key";
}

Result<AuthMethod> parse_auth_method(const std::string& value) {
    if (value == "password") return Result<AuthMethod>::Ok(AuthMethod::Password);
    if (value == "key") return Result<AuthMethod>::Ok(AuthMethod::Key);
    return Result<AuthMethod>::Err(
        fmt::format("Unknown auth_method '{}' (expected 'password' or 'key')", value));
}

Result<void> ConnectionDescriptor::validate() const {
    if (trimmed(host).empty()) {
        return Result<void>::Err("Connection host is empty");
    }
    if (trimmed(username).empty()) {
        return Result<void>::Err("Connection username is empty");
    }
    if (port < 1 || port > 65535) {
        return Result<void>::Err(fmt::format("Invalid port {} (must be 1-65535)", port));
    }
    return Result<void>::Ok();
}
