#pragma once

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <optional>
#include <core/types.hpp>
#include <ssh/session.hpp>
#include "sync_engine.hpp"

// Headless facade: one SessionManager and its SyncEngine behind a mutex.
// Any frontend (the CLI here) goes through this instead of the managers.
class MirrorService {
public:
    explicit MirrorService(const SshSettings& settings,
                           std::shared_ptr<CommandRunner> runner = std::make_shared<ProcessRunner>(),
                           std::string control_path = "");

    // ── Connection lifecycle ──────────────────────────────────

    Result<void> connect(const ConnectionDescriptor& conn);
    void disconnect();
    SessionStatus status();
    std::string failure_reason();
    std::optional<ConnectionDescriptor> descriptor();

    // Liveness check with reconnect. Returns true if a reconnect happened
    // and succeeded; the error if the session could not be restored.
    Result<bool> heal();

    ConnectionTestResult test_connection(const ConnectionDescriptor& conn);

    // ── Sync ──────────────────────────────────────────────────

    // Fails fast when another sync holds the lock.
    Result<SyncResult> sync(const std::vector<SSHFileMapping>& mappings,
                            const std::optional<std::string>& module_filter = std::nullopt);

    // ── Remote file operations (each reconnects first if needed) ──

    Result<std::string> read_file(const std::string& path);
    Result<void> write_file(const std::string& path, const std::string& content);
    Result<void> create_symlink(const std::string& target, const std::string& link_path);
    Result<void> remove_path(const std::string& path);
    Result<std::vector<std::string>> list_dir(const std::string& path);
    bool check_symlink(const std::string& link_path, const std::string& expected_target);

    // Direct access for tests and diagnostics. Not synchronized.
    SessionManager& session() { return session_; }

private:
    std::mutex mutex_;
    SessionManager session_;
    SyncEngine engine_;
};
