#include "path_resolver.hpp"
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <optional>
#include <regex>
#include <set>
#include <utility>

// ── Local expansion ────────────────────────────────────────

std::string expand_local_path(const std::string& path) {
    std::string result = path;

    bool tilde = result == "~" || starts_with(result, "~/");
#ifdef _WIN32
    tilde = tilde || starts_with(result, "~\\");
#endif
    if (tilde) {
        auto home = platform::find_home_dir();
        if (home) result = home->string() + result.substr(1);
    }

    auto home_var = platform::get_env("HOME");
    if (!home_var) home_var = platform::get_env("USERPROFILE");

    const std::pair<std::string, std::optional<std::string>> vars[] = {
        {"USERPROFILE", platform::get_env("USERPROFILE")},
        {"APPDATA", platform::get_env("APPDATA")},
        {"LOCALAPPDATA", platform::get_env("LOCALAPPDATA")},
        {"HOME", home_var},
    };
    for (const auto& [name, value] : vars) {
        if (!value) continue;
        result = replace_all(result, "%" + name + "%", *value);
        result = replace_all(result, "$" + name, *value);
    }
    return result;
}

std::string to_remote_shell_path(const std::string& remote_path) {
    std::string out;
    std::string rest = remote_path;

    // A leading $HOME / ${HOME} written by the user stays expandable
    for (const std::string var : {"${HOME}", "$HOME"}) {
        if (starts_with(rest, var) && (rest.size() == var.size() || rest[var.size()] == '/')) {
            out = var;
            rest = rest.substr(var.size());
            break;
        }
    }

    for (char c : rest) {
        switch (c) {
            case '~':
                out += "$HOME";
                break;
            case '"':
            case '`':
            case '$':
            case '\\':
                out += '\\';
                out += c;
                break;
            default:
                out += c;
        }
    }
    return out;
}

// ── Glob expansion ─────────────────────────────────────────

namespace {

struct Segment {
    enum Kind { Literal, Wildcard, Recursive } kind;
    std::string text;
    std::regex re;
};

bool has_wildcard(const std::string& s) {
    return s.find_first_of("*?[") != std::string::npos;
}

// One path component of a glob as an anchored regex.
Result<std::regex> component_regex(const std::string& comp) {
    static const std::string specials = ".^$|()+{}\\]";
    std::string re;

    for (size_t i = 0; i < comp.size(); ++i) {
        char c = comp[i];
        if (c == '*') {
            re += ".*";
        } else if (c == '?') {
            re += '.';
        } else if (c == '[') {
            size_t j = i + 1;
            bool negate = j < comp.size() && (comp[j] == '!' || comp[j] == '^');
            if (negate) j++;
            // A ']' directly after the opening bracket is a literal member
            size_t close = comp.find(']', j + 1);
            if (j >= comp.size() || close == std::string::npos) {
                return Result<std::regex>::Err(
                    fmt::format("unclosed character class in '{}'", comp));
            }
            re += negate ? "[^" : "[";
            for (size_t k = j; k < close; ++k) {
                char b = comp[k];
                if (b == '\\' || b == '[' || b == ']' || b == '^') re += '\\';
                re += b;
            }
            re += ']';
            i = close;
        } else {
            if (specials.find(c) != std::string::npos) re += '\\';
            re += c;
        }
    }

    try {
        return Result<std::regex>::Ok(std::regex(re));
    } catch (const std::regex_error& e) {
        return Result<std::regex>::Err(fmt::format("invalid pattern '{}': {}", comp, e.what()));
    }
}

// Sorted entry names of dir. Unreadable directories yield nothing.
std::vector<std::string> list_names(const fs::path& dir, bool dirs_only) {
    std::vector<std::string> names;
    std::error_code ec;
    fs::directory_iterator it(dir.empty() ? fs::path(".") : dir,
                              fs::directory_options::skip_permission_denied, ec);
    if (ec) return names;

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        if (dirs_only) {
            std::error_code dec;
            if (!it->is_directory(dec) || it->is_symlink(dec)) continue;
        }
        names.push_back(it->path().filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

void walk(const fs::path& base, const std::vector<Segment>& segs, size_t idx,
          std::vector<fs::path>& out) {
    if (idx == segs.size()) {
        if (!base.empty()) out.push_back(base);
        return;
    }

    const Segment& seg = segs[idx];
    bool last = idx + 1 == segs.size();
    std::error_code ec;

    switch (seg.kind) {
        case Segment::Literal: {
            fs::path next = base / seg.text;
            if (last ? fs::exists(next, ec) : fs::is_directory(next, ec)) {
                walk(next, segs, idx + 1, out);
            }
            break;
        }
        case Segment::Recursive: {
            // Zero directories, then descend keeping ** active
            walk(base, segs, idx + 1, out);
            for (const auto& name : list_names(base, true)) {
                walk(base / name, segs, idx, out);
            }
            break;
        }
        case Segment::Wildcard: {
            for (const auto& name : list_names(base, false)) {
                if (!std::regex_match(name, seg.re)) continue;
                fs::path next = base / name;
                if (last || fs::is_directory(next, ec)) {
                    walk(next, segs, idx + 1, out);
                }
            }
            break;
        }
    }
}

} // namespace

Result<std::vector<fs::path>> expand_glob(const std::string& pattern) {
    using R = Result<std::vector<fs::path>>;

    std::string pat = pattern;
#ifdef _WIN32
    std::replace(pat.begin(), pat.end(), '\\', '/');
#endif
    if (pat.empty()) return R::Ok({});

    fs::path root;
    if (pat[0] == '/') root = "/";

    std::vector<std::string> comps;
    size_t start = 0;
    while (start <= pat.size()) {
        size_t slash = pat.find('/', start);
        std::string comp = pat.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
        if (!comp.empty()) comps.push_back(comp);
        if (slash == std::string::npos) break;
        start = slash + 1;
    }

#ifdef _WIN32
    if (!comps.empty() && comps[0].size() == 2 && comps[0][1] == ':') {
        root = comps[0] + "/";
        comps.erase(comps.begin());
    }
#endif

    std::vector<Segment> segs;
    for (const auto& comp : comps) {
        if (comp == "**") {
            segs.push_back({Segment::Recursive, comp, {}});
        } else if (comp.find("**") != std::string::npos) {
            return R::Err(fmt::format(
                "invalid glob '{}': '**' must be a whole path component", pattern));
        } else if (has_wildcard(comp)) {
            auto re = component_regex(comp);
            if (re.is_err()) return R::Err(fmt::format("invalid glob '{}': {}", pattern, re.error));
            segs.push_back({Segment::Wildcard, comp, std::move(re.value)});
        } else {
            segs.push_back({Segment::Literal, comp, {}});
        }
    }

    std::vector<fs::path> found;
    walk(root, segs, 0, found);

    // "**/**" and friends can reach the same path twice
    std::vector<fs::path> unique;
    std::set<std::string> seen;
    for (auto& p : found) {
        if (seen.insert(p.string()).second) unique.push_back(std::move(p));
    }
    return R::Ok(std::move(unique));
}
