#include "command_factory.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

CommandFactory::CommandFactory(std::string control_path, SshSettings settings, KeyFileStore keys)
    : control_path_(std::move(control_path)),
      settings_(std::move(settings)),
      keys_(std::move(keys)) {
}

// ── Authenticating commands ────────────────────────────────

SshCommand CommandFactory::authenticated_base(const ConnectionDescriptor& conn) const {
    SshCommand cmd;
    if (conn.auth_method == AuthMethod::Password && !conn.password.empty()) {
        // sshpass -e reads SSHPASS, so the password stays out of the process list
        cmd = SshCommand(settings_.sshpass_program);
        cmd.args({"-e", settings_.ssh_program});
        cmd.env("SSHPASS", conn.password);
    } else {
        cmd = SshCommand(settings_.ssh_program);
    }

    cmd.args({"-p", std::to_string(conn.port)});
    cmd.args({"-o", SSH_HOST_KEY_POLICY});
    cmd.args({"-o", fmt::format("ConnectTimeout={}", settings_.connect_timeout)});

    if (conn.auth_method == AuthMethod::Key) {
        auto key_path = keys_.resolve_key_path(conn.private_key_path, conn.private_key_content);
        if (key_path.is_err()) {
            log_warn(fmt::format("Private key unavailable for {}: {}", conn.target(), key_path.error));
        } else if (!key_path.value.empty()) {
            cmd.args({"-i", key_path.value});
            // Nobody can answer a passphrase prompt
            if (conn.passphrase.empty()) {
                cmd.args({"-o", "BatchMode=yes"});
            }
        }
    }
    return cmd;
}

SshCommand CommandFactory::master_command(const ConnectionDescriptor& conn) const {
    SshCommand cmd = authenticated_base(conn);
    cmd.args({
        "-M",
        "-S", control_path_,
        "-o", "ControlPersist=yes",
        "-o", fmt::format("ServerAliveInterval={}", settings_.keepalive_interval),
        "-o", fmt::format("ServerAliveCountMax={}", settings_.keepalive_count_max),
        "-N",
        "-f",
        conn.target(),
    });
    return cmd;
}

SshCommand CommandFactory::login_check_command(const ConnectionDescriptor& conn) const {
    SshCommand cmd = authenticated_base(conn);
    cmd.arg(conn.target());
    cmd.arg(fmt::format("echo {} && uname -a", CONNECTED_MARKER));
    return cmd;
}

// ── Reusing commands ───────────────────────────────────────

SshCommand CommandFactory::control_command(const ConnectionDescriptor& conn,
                                           const std::string& op) const {
    SshCommand cmd(settings_.ssh_program);
    cmd.args({
        "-S", control_path_,
        "-O", op,
        "-p", std::to_string(conn.port),
        conn.target(),
    });
    return cmd;
}

SshCommand CommandFactory::shell_command(const ConnectionDescriptor& conn) const {
    SshCommand cmd(settings_.ssh_program);
    cmd.args({
        "-S", control_path_,
        "-o", "ControlMaster=no",
        "-p", std::to_string(conn.port),
        "-o", fmt::format("ConnectTimeout={}", settings_.connect_timeout),
        "-o", SSH_HOST_KEY_POLICY,
        conn.target(),
    });
    return cmd;
}

SshCommand CommandFactory::copy_command(const ConnectionDescriptor& conn) const {
    SshCommand cmd(settings_.scp_program);
    cmd.args({
        "-o", "ControlPath=" + control_path_,
        "-o", "ControlMaster=no",
        "-P", std::to_string(conn.port),
        "-o", fmt::format("ConnectTimeout={}", settings_.connect_timeout),
        "-o", SSH_HOST_KEY_POLICY,
    });
    return cmd;
}
