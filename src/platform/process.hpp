#pragma once

#include <string>
#include <vector>
#include <utility>

namespace platform {

// What to run. The program is looked up on PATH.
struct ProcessSpec {
    std::string program;
    std::vector<std::string> args;
    // Added to (or overriding) the parent's environment, child only.
    std::vector<std::pair<std::string, std::string>> env;
    // Written to the child's stdin, which is then closed. Empty = stdin closed immediately.
    std::string input;
    // Wall clock limit. -1 means wait indefinitely.
    int timeout_ms = -1;
};

struct ProcessOutput {
    bool started = false;      // false if fork/exec (CreateProcess) failed
    bool timed_out = false;    // true if the child was killed after timeout_ms
    int exit_code = -1;
    std::string stdout_data;
    std::string stderr_data;
    std::string error;         // why the process could not be started
};

// Run a child process to completion, capturing stdout and stderr.
//
// Collection stops once the child has exited and its pipes are drained, even
// if a grandchild (e.g. a backgrounded "ssh -f") still holds them open.
ProcessOutput run(const ProcessSpec& spec);

} // namespace platform
