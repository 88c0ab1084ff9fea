#pragma once

#include <string>
#include <core/types.hpp>
#include "command.hpp"
#include "key_file.hpp"

// CommandFactory: builds every ssh/scp invocation for one control path.
//
// Two families of command:
//   authenticating: master_command(), login_check_command(). Carry credentials
//                   (sshpass env var or -i key) because they negotiate auth.
//   reusing:        shell_command(), copy_command(), control_command().
//                   Point at the control path, never become a master and
//                   carry no credentials.
class CommandFactory {
public:
    CommandFactory(std::string control_path, SshSettings settings, KeyFileStore keys);

    // ssh -M ... -N -f user@host: starts the ControlMaster in the background.
    SshCommand master_command(const ConnectionDescriptor& conn) const;

    // ssh -S <ctl> -O <op> -p <port> user@host  (op: "check", "exit")
    SshCommand control_command(const ConnectionDescriptor& conn, const std::string& op) const;

    // ssh reusing the master; append the remote command with arg().
    SshCommand shell_command(const ConnectionDescriptor& conn) const;

    // scp reusing the master; append sources and destination with arg().
    SshCommand copy_command(const ConnectionDescriptor& conn) const;

    // Standalone one-shot login check that echoes a marker and uname -a.
    SshCommand login_check_command(const ConnectionDescriptor& conn) const;

    const std::string& control_path() const { return control_path_; }
    const SshSettings& settings() const { return settings_; }
    const KeyFileStore& keys() const { return keys_; }

private:
    std::string control_path_;
    SshSettings settings_;
    KeyFileStore keys_;

    // ssh (or sshpass -e ssh) with port, host key policy, timeout and key options.
    SshCommand authenticated_base(const ConnectionDescriptor& conn) const;
};
