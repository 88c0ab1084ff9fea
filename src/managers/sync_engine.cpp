#include "sync_engine.hpp"
#include "path_resolver.hpp"
#include "safety_guard.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <filesystem>

namespace fs = std::filesystem;

static bool local_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

static std::string failure(const std::string& what, const SSHResult& r) {
    std::string err = trimmed(r.stderr_data);
    return err.empty() ? fmt::format("{} (exit {})", what, r.exit_code)
                       : fmt::format("{}: {}", what, err);
}

SyncEngine::SyncEngine(const SessionManager& session)
    : session_(session) {
}

// ── Command helpers ────────────────────────────────────────

Result<SSHResult> SyncEngine::run_remote(const std::string& remote_cmd,
                                         const std::string& input) const {
    auto cmd = session_.create_shell_command();
    if (cmd.is_err()) return Result<SSHResult>::Err(cmd.error);
    cmd.value.arg(remote_cmd);
    if (!input.empty()) cmd.value.input(input);
    return Result<SSHResult>::Ok(session_.runner().run(cmd.value));
}

Result<SSHResult> SyncEngine::run_copy(std::initializer_list<std::string> operands) const {
    auto cmd = session_.create_copy_command();
    if (cmd.is_err()) return Result<SSHResult>::Err(cmd.error);
    for (const auto& op : operands) cmd.value.arg(op);
    return Result<SSHResult>::Ok(session_.runner().run(cmd.value));
}

// ── Transfers ──────────────────────────────────────────────

Result<std::vector<std::string>> SyncEngine::sync_single_file(const std::string& local_path,
                                                              const std::string& remote_path) const {
    using R = Result<std::vector<std::string>>;

    std::string expanded = expand_local_path(local_path);
    if (!local_exists(expanded)) return R::Ok({});

    auto target = session_.target_str();
    if (target.is_err()) return R::Err(target.error);

    std::string remote_target = to_remote_shell_path(remote_path);
    auto mkdir = run_remote(fmt::format("mkdir -p \"$(dirname \"{}\")\"", remote_target));
    if (mkdir.is_err()) return R::Err(mkdir.error);
    if (mkdir.value.failed()) return R::Err(failure("Failed to create remote directory", mkdir.value));

    auto copy = run_copy({expanded, target.value + ":" + remote_path});
    if (copy.is_err()) return R::Err(copy.error);
    if (copy.value.failed()) return R::Err(failure("scp failed", copy.value));

    return R::Ok({fmt::format("{} -> {}", local_path, remote_path)});
}

Result<std::vector<std::string>> SyncEngine::sync_directory(const std::string& local_path,
                                                            const std::string& remote_path) const {
    using R = Result<std::vector<std::string>>;

    // Checked before anything else: the remote side gets rm -rf
    auto safe = check_remote_path(remote_path, "sync into");
    if (safe.is_err()) return R::Err(safe.error);

    std::string expanded = expand_local_path(local_path);
    if (!local_exists(expanded)) return R::Ok({});

    auto target = session_.target_str();
    if (target.is_err()) return R::Err(target.error);

    std::string remote_target = to_remote_shell_path(remote_path);
    auto prepare = run_remote(fmt::format("mkdir -p \"$(dirname \"{0}\")\" && rm -rf \"{0}\"",
                                          remote_target));
    if (prepare.is_err()) return R::Err(prepare.error);
    if (prepare.value.failed()) return R::Err(failure("Failed to prepare remote directory", prepare.value));

    auto copy = run_copy({"-r", expanded, target.value + ":" + remote_path});
    if (copy.is_err()) return R::Err(copy.error);
    if (copy.value.failed()) return R::Err(failure("scp directory sync failed", copy.value));

    return R::Ok({fmt::format("{} -> {}", local_path, remote_path)});
}

Result<std::vector<std::string>> SyncEngine::sync_pattern_files(const std::string& local_pattern,
                                                                const std::string& remote_dir) const {
    using R = Result<std::vector<std::string>>;

    auto matches = expand_glob(expand_local_path(local_pattern));
    if (matches.is_err()) return R::Err(fmt::format("Invalid glob pattern: {}", matches.error));
    if (matches.value.empty()) return R::Ok({});

    auto target = session_.target_str();
    if (target.is_err()) return R::Err(target.error);

    auto mkdir = run_remote(fmt::format("mkdir -p \"{}\"", to_remote_shell_path(remote_dir)));
    if (mkdir.is_err()) return R::Err(mkdir.error);
    if (mkdir.value.failed()) {
        log_warn(failure(fmt::format("mkdir {} failed", remote_dir), mkdir.value));
    }

    std::vector<std::string> synced;
    for (const auto& file : matches.value) {
        std::string file_str = file.string();
        std::string file_name = file.filename().string();

        auto copy = run_copy({file_str, fmt::format("{}:{}/{}", target.value, remote_dir, file_name)});
        if (copy.is_err()) return R::Err(copy.error);
        if (copy.value.failed()) {
            log_warn(failure(fmt::format("scp of pattern file {} failed", file_str), copy.value));
            continue;
        }
        synced.push_back(fmt::format("{} -> {}/{}", file_str, remote_dir, file_name));
    }
    return R::Ok(std::move(synced));
}

Result<std::vector<std::string>> SyncEngine::sync_file_mapping(const SSHFileMapping& mapping) const {
    if (mapping.is_directory) {
        return sync_directory(mapping.local_path, mapping.remote_path);
    }
    if (mapping.is_pattern) {
        return sync_pattern_files(mapping.local_path, mapping.remote_path);
    }
    return sync_single_file(mapping.local_path, mapping.remote_path);
}

SyncResult SyncEngine::sync_mappings(const std::vector<SSHFileMapping>& mappings,
                                     const std::optional<std::string>& module_filter) const {
    SyncResult result;

    for (const auto& mapping : mappings) {
        if (!mapping.enabled) continue;
        if (module_filter && mapping.module != *module_filter) continue;

        auto files = sync_file_mapping(mapping);
        if (files.is_err()) {
            result.errors.push_back(fmt::format("{}: {}", mapping.name, files.error));
        } else if (files.value.empty()) {
            result.skipped_files.push_back(mapping.name);
        } else {
            result.synced_files.insert(result.synced_files.end(),
                                       files.value.begin(), files.value.end());
        }
    }

    result.success = result.errors.empty();
    log_info(fmt::format("Sync finished: {} synced, {} skipped, {} errors",
                         result.synced_files.size(), result.skipped_files.size(),
                         result.errors.size()));
    return result;
}

// ── Remote file operations ─────────────────────────────────

Result<std::string> SyncEngine::read_remote_file(const std::string& path) const {
    std::string p = to_remote_shell_path(path);
    auto r = run_remote(fmt::format("if [ -f \"{0}\" ]; then cat \"{0}\"; fi", p));
    if (r.is_err()) return Result<std::string>::Err(r.error);
    if (r.value.failed()) return Result<std::string>::Err(failure("SSH command failed", r.value));
    return Result<std::string>::Ok(std::move(r.value.stdout_data));
}

Result<void> SyncEngine::write_remote_file(const std::string& path, const std::string& content) const {
    std::string p = to_remote_shell_path(path);
    auto r = run_remote(fmt::format("mkdir -p \"$(dirname \"{0}\")\" && cat > \"{0}\"", p), content);
    if (r.is_err()) return Result<void>::Err(r.error);
    if (r.value.failed()) return Result<void>::Err(failure("SSH write command failed", r.value));
    return Result<void>::Ok();
}

Result<void> SyncEngine::create_remote_symlink(const std::string& target,
                                               const std::string& link_path) const {
    // The link path is rm -rf'd before ln -s
    auto safe = check_remote_path(link_path, "replace");
    if (safe.is_err()) return safe;

    std::string t = to_remote_shell_path(target);
    std::string l = to_remote_shell_path(link_path);
    auto r = run_remote(fmt::format(
        "mkdir -p \"$(dirname \"{0}\")\" && rm -rf \"{0}\" && ln -s \"{1}\" \"{0}\"", l, t));
    if (r.is_err()) return Result<void>::Err(r.error);
    if (r.value.failed()) return Result<void>::Err(failure("Remote symlink failed", r.value));
    return Result<void>::Ok();
}

Result<void> SyncEngine::remove_remote_path(const std::string& path) const {
    auto safe = check_remote_path(path, "remove");
    if (safe.is_err()) return safe;

    auto r = run_remote(fmt::format("rm -rf \"{}\"", to_remote_shell_path(path)));
    if (r.is_err()) return Result<void>::Err(r.error);
    if (r.value.failed()) return Result<void>::Err(failure("Remote delete failed", r.value));
    return Result<void>::Ok();
}

Result<std::vector<std::string>> SyncEngine::list_remote_dir(const std::string& path) const {
    using R = Result<std::vector<std::string>>;

    std::string p = to_remote_shell_path(path);
    auto r = run_remote(fmt::format("if [ -d \"{0}\" ]; then ls -1 \"{0}\"; fi", p));
    if (r.is_err()) return R::Err(r.error);
    if (r.value.failed()) return R::Err(failure("Listing remote directory failed", r.value));

    std::vector<std::string> entries;
    for (const auto& line : split_lines(r.value.stdout_data)) {
        if (!line.empty()) entries.push_back(line);
    }
    return R::Ok(std::move(entries));
}

bool SyncEngine::check_remote_symlink_exists(const std::string& link_path,
                                             const std::string& expected_target) const {
    std::string l = to_remote_shell_path(link_path);
    std::string t = to_remote_shell_path(expected_target);
    auto r = run_remote(fmt::format(
        "[ -L \"{0}\" ] && [ \"$(readlink \"{0}\")\" = \"{1}\" ] && echo yes || echo no", l, t));
    if (r.is_err() || r.value.failed()) return false;
    return trimmed(r.value.stdout_data) == "yes";
}
