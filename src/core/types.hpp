#pragma once

#include <string>
#include <optional>
#include <vector>
#include <cstdint>
#include "constants.hpp"

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Outcome of one ssh/scp subprocess
struct SSHResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }
};

// ── Connection ──────────────────────────────────────────────

enum class AuthMethod {
    Password,
    Key,
};

std::string to_string(AuthMethod method);
Result<AuthMethod> parse_auth_method(const std::string& value);

struct ConnectionDescriptor {
    std::string id;
    std::string host;
    int port = 22;
    std::string username;
    AuthMethod auth_method = AuthMethod::Key;
    std::string password;
    std::string private_key_path;     // user-supplied path, may be empty
    std::string private_key_content;  // pasted PEM text, wins over the path when well-formed
    std::string passphrase;

    // "user@host"
    std::string target() const { return username + "@" + host; }

    // Rejects empty host/user and ports outside 1-65535.
    Result<void> validate() const;
};

// Tool names and timing knobs for the ssh/scp subprocesses
struct SshSettings {
    std::string ssh_program = DEFAULT_SSH_PROGRAM;
    std::string scp_program = DEFAULT_SCP_PROGRAM;
    std::string sshpass_program = DEFAULT_SSHPASS_PROGRAM;
    int connect_timeout = DEFAULT_CONNECT_TIMEOUT_SECS;
    int keepalive_interval = DEFAULT_KEEPALIVE_INTERVAL;
    int keepalive_count_max = DEFAULT_KEEPALIVE_COUNT_MAX;
    int check_timeout = DEFAULT_CHECK_TIMEOUT_SECS;
    int min_reconnect_interval_secs = DEFAULT_MIN_RECONNECT_SECS;
    std::string app_data_dir;               // key storage root; empty = ~/.sshmirror
};

// Result of a one-shot login check (does not touch the master connection)
struct ConnectionTestResult {
    bool connected = false;
    std::optional<std::string> error;
    std::optional<std::string> server_info;
};

// ── Sync ────────────────────────────────────────────────────

struct SSHFileMapping {
    std::string name;
    std::string module;        // grouping key for selective sync
    std::string local_path;
    std::string remote_path;
    bool is_directory = false;
    bool is_pattern = false;   // local_path is a glob, remote_path a directory
    bool enabled = true;
};

struct SyncResult {
    bool success = true;
    std::vector<std::string> synced_files;   // "source -> destination"
    std::vector<std::string> skipped_files;  // mapping names with nothing to send
    std::vector<std::string> errors;         // "mapping-name: message"
};

