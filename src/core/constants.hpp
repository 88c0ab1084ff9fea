#pragma once

#include <cstddef>

// ── SSH options ─────────────────────────────────────────────
// Accept first-seen host keys without prompting, verify them afterwards.
constexpr const char* SSH_HOST_KEY_POLICY = "StrictHostKeyChecking=accept-new";

// Marker echoed by the one-shot login check.
constexpr const char* CONNECTED_MARKER = "__connected__";

// Control socket / pipe name. %C is expanded by OpenSSH from host, port and user.
constexpr const char* CONTROL_PATH_PREFIX = "sshmirror-ssh-ctrl-";

// ── Timeouts ────────────────────────────────────────────────
constexpr int DEFAULT_CONNECT_TIMEOUT_SECS   = 10;   // ssh -o ConnectTimeout
constexpr int DEFAULT_KEEPALIVE_INTERVAL     = 30;   // ServerAliveInterval
constexpr int DEFAULT_KEEPALIVE_COUNT_MAX    = 3;    // unanswered keepalives before the master drops
constexpr int DEFAULT_CHECK_TIMEOUT_SECS     = 15;   // wall clock cap on "-O check"
constexpr int DEFAULT_MIN_RECONNECT_SECS     = 0;    // 0 = reconnect on every ensure_connected()

// ── Log truncation ──────────────────────────────────────────
constexpr size_t LOG_OUTPUT_LIMIT            = 500;

// ── Default tool names ──────────────────────────────────────
constexpr const char* DEFAULT_SSH_PROGRAM     = "ssh";
constexpr const char* DEFAULT_SCP_PROGRAM     = "scp";
constexpr const char* DEFAULT_SSHPASS_PROGRAM = "sshpass";

// ── Local layout ────────────────────────────────────────────
constexpr const char* APP_DIR_NAME   = ".sshmirror";
constexpr const char* KEY_DIR_NAME   = ".ssh";
constexpr const char* CONFIG_FILE    = "config.yaml";
constexpr const char* VERSION_STRING = "0.3.0";
