#include "command.hpp"
#include <platform/process.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

std::string SshCommand::display() const {
    std::string out = program_;
    for (const auto& a : args_) {
        if (a.find_first_of(" \t\"'$") != std::string::npos) {
            out += " '" + a + "'";
        } else {
            out += " " + a;
        }
    }
    return out;
}

SSHResult ProcessRunner::run(const SshCommand& cmd) {
    platform::ProcessSpec spec;
    spec.program = cmd.program();
    spec.args = cmd.arg_list();
    spec.env = cmd.env_list();
    spec.input = cmd.stdin_data();
    spec.timeout_ms = cmd.timeout() > 0 ? cmd.timeout() * 1000 : -1;

    auto out = platform::run(spec);
    if (!out.started) {
        SSHResult r{-1, "", out.error};
        log_ssh("run", cmd.display(), r);
        return r;
    }

    SSHResult r{out.exit_code, std::move(out.stdout_data), std::move(out.stderr_data)};
    if (out.timed_out) {
        r.exit_code = -1;
        if (!r.stderr_data.empty()) r.stderr_data += "\n";
        r.stderr_data += fmt::format("{} timed out after {}s", cmd.program(), cmd.timeout());
    }
    log_ssh("run", cmd.display(), r);
    return r;
}
