#pragma once

#include <string>
#include <vector>
#include <optional>
#include <initializer_list>
#include <core/types.hpp>
#include <ssh/session.hpp>

// SyncEngine: pushes local files to the remote host over the session's
// ControlMaster and runs small remote file operations.
//
// Every call assumes the caller already ran session.ensure_connected().
// Nothing here changes session state; commands come from the session and
// run through its runner.
//
// Local sources that do not exist are "nothing to do", never an error.
// Destructive operations go through the dangerous-path guard first.
class SyncEngine {
public:
    explicit SyncEngine(const SessionManager& session);

    // ── Transfers ──────────────────────────────────────────────

    // mkdir -p the remote parent, then scp. Returns ["local -> remote"].
    Result<std::vector<std::string>> sync_single_file(const std::string& local_path,
                                                      const std::string& remote_path) const;

    // Replaces the remote directory: mkdir -p parent && rm -rf target, then scp -r.
    Result<std::vector<std::string>> sync_directory(const std::string& local_path,
                                                    const std::string& remote_path) const;

    // Copies each glob match into remote_dir. Per-file failures are logged
    // and skipped; the successes are returned.
    Result<std::vector<std::string>> sync_pattern_files(const std::string& local_pattern,
                                                        const std::string& remote_dir) const;

    // Dispatch on is_directory / is_pattern.
    Result<std::vector<std::string>> sync_file_mapping(const SSHFileMapping& mapping) const;

    // Enabled mappings (optionally one module), in order, each independent.
    SyncResult sync_mappings(const std::vector<SSHFileMapping>& mappings,
                             const std::optional<std::string>& module_filter = std::nullopt) const;

    // ── Remote file operations ─────────────────────────────────

    // File contents, or "" if the remote file does not exist.
    Result<std::string> read_remote_file(const std::string& path) const;

    // mkdir -p the parent and stream content into the file via stdin.
    Result<void> write_remote_file(const std::string& path, const std::string& content) const;

    // mkdir -p parent, rm -rf the link path, ln -s. Not crash-safe.
    Result<void> create_remote_symlink(const std::string& target, const std::string& link_path) const;

    Result<void> remove_remote_path(const std::string& path) const;

    // Entry names of a remote directory; empty if it does not exist.
    Result<std::vector<std::string>> list_remote_dir(const std::string& path) const;

    // True only if link_path is a symlink whose readlink equals expected_target.
    bool check_remote_symlink_exists(const std::string& link_path,
                                     const std::string& expected_target) const;

private:
    const SessionManager& session_;

    // Run a shell command on the remote host. Err only if no command can be built.
    Result<SSHResult> run_remote(const std::string& remote_cmd,
                                 const std::string& input = "") const;

    // Run scp with the given operands appended.
    Result<SSHResult> run_copy(std::initializer_list<std::string> operands) const;
};
