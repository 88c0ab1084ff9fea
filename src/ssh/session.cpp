#include "session.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

static fs::path resolve_app_data_dir(const SshSettings& settings) {
    if (!settings.app_data_dir.empty()) return fs::path(settings.app_data_dir);
    return platform::home_dir() / APP_DIR_NAME;
}

std::string to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::Disconnected: return "disconnected";
        case SessionStatus::Connecting:   return "connecting";
        case SessionStatus::Connected:    return "connected";
        case SessionStatus::Failed:       return "failed";
    }
    return "unknown";
}

SessionManager::SessionManager(const SshSettings& settings,
                               std::shared_ptr<CommandRunner> runner,
                               std::string control_path)
    : factory_(control_path.empty() ? platform::control_path(CONTROL_PATH_PREFIX)
                                    : std::move(control_path),
               settings,
               KeyFileStore(resolve_app_data_dir(settings))),
      runner_(std::move(runner)) {
}

SessionManager::~SessionManager() {
    disconnect();
}

// ── Lifecycle ──────────────────────────────────────────────

Result<void> SessionManager::connect(const ConnectionDescriptor& conn) {
    auto valid = conn.validate();
    if (valid.is_err()) return valid;

    // Same target and the master still answers: nothing to do
    if (conn_ && conn_->id == conn.id && is_alive()) {
        status_ = SessionStatus::Connected;
        return Result<void>::Ok();
    }

    return spawn_master(conn);
}

Result<void> SessionManager::spawn_master(const ConnectionDescriptor& conn) {
    disconnect();

    status_ = SessionStatus::Connecting;
    failure_reason_.clear();
    conn_ = conn;

    spawn_count_++;
    SSHResult result = runner_->run(factory_.master_command(conn));

    if (result.success()) {
        status_ = SessionStatus::Connected;
        last_failure_.reset();
        log_info(fmt::format("SSH master connection established: {}:{}", conn.target(), conn.port));
        return Result<void>::Ok();
    }

    std::string err = fmt::format("SSH master connection failed: {}", trimmed(result.stderr_data));
    set_failed(err);
    log_error(err);
    return Result<void>::Err(err);
}

bool SessionManager::is_alive() const {
    if (!conn_) return false;
    SshCommand cmd = factory_.control_command(*conn_, "check");
    cmd.timeout_secs(factory_.settings().check_timeout);
    return runner_->run(cmd).success();
}

Result<void> SessionManager::ensure_connected() {
    if (is_alive()) {
        status_ = SessionStatus::Connected;
        return Result<void>::Ok();
    }

    if (!conn_) {
        return Result<void>::Err("No SSH session configured");
    }

    if (reconnect_suppressed()) {
        return Result<void>::Err(fmt::format(
            "Reconnect suppressed for {}s after a failed attempt: {}",
            factory_.settings().min_reconnect_interval_secs, failure_reason_));
    }

    log_warn(fmt::format("SSH master connection to {} lost, reconnecting...", conn_->target()));
    ConnectionDescriptor conn = *conn_;
    return spawn_master(conn);
}

void SessionManager::disconnect() {
    if (conn_) {
        // Ignored: the master may already be gone
        runner_->run(factory_.control_command(*conn_, "exit"));
        log_info(fmt::format("SSH master connection closed: {}:{}", conn_->target(), conn_->port));
    }
    conn_.reset();
    status_ = SessionStatus::Disconnected;
    failure_reason_.clear();
}

// ── Command templates ──────────────────────────────────────

Result<SshCommand> SessionManager::create_shell_command() const {
    if (!conn_) return Result<SshCommand>::Err("SSH session not established");
    return Result<SshCommand>::Ok(factory_.shell_command(*conn_));
}

Result<SshCommand> SessionManager::create_copy_command() const {
    if (!conn_) return Result<SshCommand>::Err("SSH session not established");
    return Result<SshCommand>::Ok(factory_.copy_command(*conn_));
}

Result<std::string> SessionManager::target_str() const {
    if (!conn_) return Result<std::string>::Err("SSH session not established");
    return Result<std::string>::Ok(conn_->target());
}

// ── Connection test ────────────────────────────────────────

ConnectionTestResult SessionManager::test_connection(const ConnectionDescriptor& conn) const {
    ConnectionTestResult out;

    auto valid = conn.validate();
    if (valid.is_err()) {
        out.error = valid.error;
        return out;
    }

    SSHResult r = runner_->run(factory_.login_check_command(conn));
    if (r.success() && r.stdout_data.find(CONNECTED_MARKER) != std::string::npos) {
        out.connected = true;
        for (const auto& line : split_lines(r.stdout_data)) {
            if (line.find(CONNECTED_MARKER) != std::string::npos) continue;
            std::string info = trimmed(line);
            if (!info.empty()) {
                out.server_info = info;
                break;
            }
        }
        return out;
    }

    std::string err = trimmed(r.stderr_data);
    out.error = err.empty() ? "Connection failed" : err;
    return out;
}

// ── Sync lock ──────────────────────────────────────────────

bool SessionManager::try_acquire_sync_lock() {
    bool expected = false;
    return syncing_.compare_exchange_strong(expected, true);
}

void SessionManager::release_sync_lock() {
    syncing_.store(false);
}

// ── Internal ───────────────────────────────────────────────

void SessionManager::set_failed(const std::string& reason) {
    status_ = SessionStatus::Failed;
    failure_reason_ = reason;
    last_failure_ = std::chrono::steady_clock::now();
}

bool SessionManager::reconnect_suppressed() const {
    int interval = factory_.settings().min_reconnect_interval_secs;
    if (interval <= 0 || !last_failure_) return false;
    return std::chrono::steady_clock::now() - *last_failure_ < std::chrono::seconds(interval);
}
