#pragma once

#include <string>
#include <vector>

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Copying variant of trim().
inline std::string trimmed(std::string s) {
    trim(s);
    return s;
}

// Replace every occurrence of `from` with `to`.
std::string replace_all(std::string s, const std::string& from, const std::string& to);

// Split on '\n', dropping a trailing '\r' from each line. Empty lines are kept.
std::vector<std::string> split_lines(const std::string& s);

bool starts_with(const std::string& s, const std::string& prefix);
