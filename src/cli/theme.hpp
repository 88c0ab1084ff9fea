#pragma once

#include <string>
#include <fmt/format.h>
#include <core/constants.hpp>

namespace theme {

// 24-bit accent (#3E78B2) and label (#80633A), plain ANSI for the rest
namespace color {
    const std::string BLUE   = "\033[38;2;62;120;178m";
    const std::string BROWN  = "\033[38;2;128;99;58m";
    const std::string RED    = "\033[91m";
    const std::string GREEN  = "\033[92m";
    const std::string YELLOW = "\033[93m";
    const std::string BOLD   = "\033[1m";
    const std::string DIM    = "\033[2m";
    const std::string RESET  = "\033[0m";
}

inline std::string paint(const std::string& code, const std::string& s) {
    return code + s + color::RESET;
}

inline std::string dim(const std::string& s)   { return paint(color::DIM, s); }
inline std::string green(const std::string& s) { return paint(color::GREEN, s); }
inline std::string red(const std::string& s)   { return paint(color::RED, s); }

// ── Layout ──────────────────────────────────────────────

inline std::string rule(size_t width = 44) {
    std::string line;
    for (size_t i = 0; i < width; i++) line += "\xe2\x94\x80";
    return paint(color::DIM, "  " + line) + "\n";
}

inline std::string banner() {
    return "\n" + paint(color::BLUE + color::BOLD, "  sshmirror") + "\n"
         + dim(fmt::format("  v{}\n  Config sync over one SSH master connection", VERSION_STRING))
         + "\n\n" + rule();
}

inline std::string section(const std::string& title) {
    return "\n" + paint(color::BROWN + color::BOLD, "  " + title) + "\n\n";
}

inline std::string divider() {
    return "\n" + rule() + "\n";
}

// ── Status lines ────────────────────────────────────────
// One indented line: a colored marker, then the message.

inline std::string mark(const std::string& code, char marker, const std::string& msg) {
    return paint(code, fmt::format("    {} ", marker)) + msg + "\n";
}

inline std::string ok(const std::string& msg)   { return mark(color::GREEN, '+', msg); }
inline std::string fail(const std::string& msg) { return mark(color::RED, 'x', msg); }
inline std::string info(const std::string& msg) { return mark(color::BLUE, '~', msg); }
inline std::string step(const std::string& msg) { return mark(color::BROWN, '>', msg); }
inline std::string warn(const std::string& msg) { return mark(color::YELLOW, '!', msg); }

inline std::string kv(const std::string& key, const std::string& value) {
    return dim(fmt::format("    {:<12}", key)) + value + "\n";
}

// "src -> dst" as an ok line with the arrow dimmed
inline std::string transfer(const std::string& entry) {
    auto arrow = entry.find(" -> ");
    if (arrow == std::string::npos) return ok(entry);
    return ok(entry.substr(0, arrow) + dim(" -> ") + entry.substr(arrow + 4));
}

} // namespace theme
