#pragma once

#include <string>
#include <vector>
#include <utility>
#include <initializer_list>
#include <core/types.hpp>

// A ready-to-run ssh/scp/sshpass invocation.
//
// Built by CommandFactory, completed by the caller (remote command, copy
// operands), executed by a CommandRunner. Secrets travel in env(), never in args().
class SshCommand {
public:
    SshCommand() = default;
    explicit SshCommand(std::string program) : program_(std::move(program)) {}

    SshCommand& arg(const std::string& a) {
        args_.push_back(a);
        return *this;
    }

    SshCommand& args(std::initializer_list<std::string> list) {
        args_.insert(args_.end(), list.begin(), list.end());
        return *this;
    }

    SshCommand& env(const std::string& key, const std::string& value) {
        env_.emplace_back(key, value);
        return *this;
    }

    SshCommand& input(std::string data) {
        input_ = std::move(data);
        return *this;
    }

    SshCommand& timeout_secs(int secs) {
        timeout_secs_ = secs;
        return *this;
    }

    const std::string& program() const { return program_; }
    const std::vector<std::string>& arg_list() const { return args_; }
    const std::vector<std::pair<std::string, std::string>>& env_list() const { return env_; }
    const std::string& stdin_data() const { return input_; }
    int timeout() const { return timeout_secs_; }

    // Program and arguments joined for logs. Env values are not included.
    std::string display() const;

private:
    std::string program_;
    std::vector<std::string> args_;
    std::vector<std::pair<std::string, std::string>> env_;
    std::string input_;
    int timeout_secs_ = 0;  // 0 = no wall clock limit
};

// Executes SshCommands. Tests substitute a fake that records commands.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // A command that cannot be started yields exit_code -1 with the reason
    // in stderr_data. Never throws.
    virtual SSHResult run(const SshCommand& cmd) = 0;
};

// Runs commands as real subprocesses via platform::run().
class ProcessRunner : public CommandRunner {
public:
    SSHResult run(const SshCommand& cmd) override;
};
