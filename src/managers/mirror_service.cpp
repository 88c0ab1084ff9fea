#include "mirror_service.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

namespace {

// Releases a held sync lock when it goes out of scope
class SyncLockRelease {
public:
    explicit SyncLockRelease(SessionManager& session) : session_(session) {}
    ~SyncLockRelease() { session_.release_sync_lock(); }

    SyncLockRelease(const SyncLockRelease&) = delete;
    SyncLockRelease& operator=(const SyncLockRelease&) = delete;

private:
    SessionManager& session_;
};

} // namespace

MirrorService::MirrorService(const SshSettings& settings,
                             std::shared_ptr<CommandRunner> runner,
                             std::string control_path)
    : session_(settings, std::move(runner), std::move(control_path)),
      engine_(session_) {
}

// ── Connection lifecycle ──────────────────────────────────────

Result<void> MirrorService::connect(const ConnectionDescriptor& conn) {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.connect(conn);
}

void MirrorService::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    session_.disconnect();
}

SessionStatus MirrorService::status() {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.status();
}

std::string MirrorService::failure_reason() {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.failure_reason();
}

std::optional<ConnectionDescriptor> MirrorService::descriptor() {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.descriptor();
}

Result<bool> MirrorService::heal() {
    std::lock_guard<std::mutex> lock(mutex_);
    int spawned = session_.spawn_count();
    auto r = session_.ensure_connected();
    if (r.is_err()) return Result<bool>::Err(r.error);
    return Result<bool>::Ok(session_.spawn_count() != spawned);
}

ConnectionTestResult MirrorService::test_connection(const ConnectionDescriptor& conn) {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.test_connection(conn);
}

// ── Sync ──────────────────────────────────────────────────────

Result<SyncResult> MirrorService::sync(const std::vector<SSHFileMapping>& mappings,
                                       const std::optional<std::string>& module_filter) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!session_.try_acquire_sync_lock()) {
        return Result<SyncResult>::Err("A sync is already in progress");
    }
    SyncLockRelease release(session_);

    auto ready = session_.ensure_connected();
    if (ready.is_err()) return Result<SyncResult>::Err(ready.error);

    if (module_filter) {
        log_info(fmt::format("Syncing module '{}'", *module_filter));
    }
    return Result<SyncResult>::Ok(engine_.sync_mappings(mappings, module_filter));
}

// ── Remote file operations ────────────────────────────────────

Result<std::string> MirrorService::read_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ready = session_.ensure_connected();
    if (ready.is_err()) return Result<std::string>::Err(ready.error);
    return engine_.read_remote_file(path);
}

Result<void> MirrorService::write_file(const std::string& path, const std::string& content) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ready = session_.ensure_connected();
    if (ready.is_err()) return ready;
    return engine_.write_remote_file(path, content);
}

Result<void> MirrorService::create_symlink(const std::string& target, const std::string& link_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ready = session_.ensure_connected();
    if (ready.is_err()) return ready;
    return engine_.create_remote_symlink(target, link_path);
}

Result<void> MirrorService::remove_path(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ready = session_.ensure_connected();
    if (ready.is_err()) return ready;
    return engine_.remove_remote_path(path);
}

Result<std::vector<std::string>> MirrorService::list_dir(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ready = session_.ensure_connected();
    if (ready.is_err()) return Result<std::vector<std::string>>::Err(ready.error);
    return engine_.list_remote_dir(path);
}

bool MirrorService::check_symlink(const std::string& link_path, const std::string& expected_target) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (session_.ensure_connected().is_err()) return false;
    return engine_.check_remote_symlink_exists(link_path, expected_target);
}
