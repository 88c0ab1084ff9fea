#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <core/types.hpp>
#include "command.hpp"
#include "command_factory.hpp"

enum class SessionStatus {
    Disconnected,   // initial, and after disconnect()
    Connecting,     // master being spawned
    Connected,      // master verified alive
    Failed,         // spawn or health check failed, see failure_reason()
};

std::string to_string(SessionStatus status);

// SessionManager: one OpenSSH ControlMaster for one target.
//
// connect() spawns "ssh -M ... -N -f" which authenticates once and leaves a
// background master listening on the control path. Every later ssh/scp
// command from create_shell_command()/create_copy_command() rides that
// channel without re-authenticating. ensure_connected() is the single
// recovery point after the transport drops.
//
// Not thread-safe: callers serialize access (see MirrorService). The sync
// lock is a separate non-blocking flag for "a batch is running".
class SessionManager {
public:
    explicit SessionManager(const SshSettings& settings,
                            std::shared_ptr<CommandRunner> runner = std::make_shared<ProcessRunner>(),
                            std::string control_path = "");
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Reuses a live master for the same descriptor id, otherwise tears down
    // the old one and spawns a new master.
    Result<void> connect(const ConnectionDescriptor& conn);

    // "ssh -O check" against the control path. False when nothing is configured.
    bool is_alive() const;

    // Liveness check, then reconnect with the remembered descriptor if needed.
    Result<void> ensure_connected();

    // Best-effort "ssh -O exit"; forgets the descriptor.
    void disconnect();

    Result<SshCommand> create_shell_command() const;
    Result<SshCommand> create_copy_command() const;
    Result<std::string> target_str() const;

    // One-shot login check with full authentication, independent of the master.
    ConnectionTestResult test_connection(const ConnectionDescriptor& conn) const;

    bool try_acquire_sync_lock();
    void release_sync_lock();
    bool sync_in_progress() const { return syncing_.load(); }

    SessionStatus status() const { return status_; }
    const std::string& failure_reason() const { return failure_reason_; }
    const std::optional<ConnectionDescriptor>& descriptor() const { return conn_; }
    const std::string& control_path() const { return factory_.control_path(); }
    const CommandFactory& factory() const { return factory_; }
    CommandRunner& runner() const { return *runner_; }

    // Number of master spawns attempted over this manager's lifetime.
    int spawn_count() const { return spawn_count_; }

private:
    CommandFactory factory_;
    std::shared_ptr<CommandRunner> runner_;
    std::optional<ConnectionDescriptor> conn_;
    SessionStatus status_ = SessionStatus::Disconnected;
    std::string failure_reason_;
    std::atomic<bool> syncing_{false};
    int spawn_count_ = 0;
    std::optional<std::chrono::steady_clock::time_point> last_failure_;

    // Tear down whatever is there and start a new master for conn
    Result<void> spawn_master(const ConnectionDescriptor& conn);
    void set_failed(const std::string& reason);
    bool reconnect_suppressed() const;
};
