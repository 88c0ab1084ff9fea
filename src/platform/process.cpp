#include "process.hpp"
#include "platform.hpp"

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#  include <atomic>
#  include <thread>
#  include <map>
#  include <algorithm>
#  include <cstring>
#  include <functional>
#else
#  include <unistd.h>
#  include <sys/wait.h>
#  include <signal.h>
#  include <fcntl.h>
#  include <poll.h>
#  include <cerrno>
#  include <cstring>
#  include <mutex>
extern char** environ;
#endif

#include <chrono>
#include <fmt/format.h>

namespace platform {

static constexpr int POLL_MS = 50;
static constexpr int TERMINATE_GRACE_MS = 2000;

#ifdef _WIN32

// CommandLineToArgvW-compatible quoting.
static std::string quote_arg(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\"") == std::string::npos) return arg;
    std::string out = "\"";
    size_t backslashes = 0;
    for (char c : arg) {
        if (c == '\\') { ++backslashes; continue; }
        if (c == '"') {
            out.append(backslashes * 2 + 1, '\\');
            out += '"';
        } else {
            out.append(backslashes, '\\');
            out += c;
        }
        backslashes = 0;
    }
    out.append(backslashes * 2, '\\');
    out += '"';
    return out;
}

// Parent environment with spec.env applied, as a CreateProcess block.
static std::string build_env_block(const ProcessSpec& spec) {
    std::map<std::string, std::string> vars;
    char* block = GetEnvironmentStringsA();
    if (block) {
        for (const char* p = block; *p; p += std::strlen(p) + 1) {
            std::string entry(p);
            auto eq = entry.find('=', 1);  // entries like "=C:=C:\" start with '='
            if (eq == std::string::npos) continue;
            vars[entry.substr(0, eq)] = entry.substr(eq + 1);
        }
        FreeEnvironmentStringsA(block);
    }
    for (const auto& [key, value] : spec.env) vars[key] = value;

    std::string out;
    for (const auto& [key, value] : vars) {
        out += key + "=" + value;
        out.push_back('\0');
    }
    out.push_back('\0');
    return out;
}

static void pump_pipe(HANDLE h, std::string& out, const std::atomic<bool>& stop) {
    char buf[4096];
    while (true) {
        DWORD avail = 0;
        if (!PeekNamedPipe(h, nullptr, 0, nullptr, &avail, nullptr)) break;  // EOF
        if (avail == 0) {
            if (stop) break;
            Sleep(POLL_MS);
            continue;
        }
        DWORD n = 0;
        DWORD want = std::min<DWORD>(avail, sizeof(buf));
        if (!ReadFile(h, buf, want, &n, nullptr) || n == 0) break;
        out.append(buf, n);
    }
}

ProcessOutput run(const ProcessSpec& spec) {
    ProcessOutput result;

    SECURITY_ATTRIBUTES sa = {};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;

    HANDLE in_r = nullptr, in_w = nullptr;
    HANDLE out_r = nullptr, out_w = nullptr;
    HANDLE err_r = nullptr, err_w = nullptr;
    if (!CreatePipe(&in_r, &in_w, &sa, 0) ||
        !CreatePipe(&out_r, &out_w, &sa, 0) ||
        !CreatePipe(&err_r, &err_w, &sa, 0)) {
        for (HANDLE h : {in_r, in_w, out_r, out_w, err_r, err_w})
            if (h) CloseHandle(h);
        result.error = fmt::format("failed to create pipes: error {}", GetLastError());
        return result;
    }
    // Parent-side ends must not leak into the child
    SetHandleInformation(in_w, HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(out_r, HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(err_r, HANDLE_FLAG_INHERIT, 0);

    std::string cmdline = quote_arg(spec.program);
    for (const auto& arg : spec.args) cmdline += " " + quote_arg(arg);

    std::string env_block;
    if (!spec.env.empty()) env_block = build_env_block(spec);

    STARTUPINFOA si = {};
    si.cb = sizeof(si);
    si.dwFlags |= STARTF_USESTDHANDLES;
    si.hStdInput = in_r;
    si.hStdOutput = out_w;
    si.hStdError = err_w;
    PROCESS_INFORMATION pi = {};

    BOOL ok = CreateProcessA(nullptr, cmdline.data(), nullptr, nullptr, TRUE,
                             CREATE_NO_WINDOW,
                             env_block.empty() ? nullptr : env_block.data(),
                             nullptr, &si, &pi);
    CloseHandle(in_r);
    CloseHandle(out_w);
    CloseHandle(err_w);
    if (!ok) {
        result.error = fmt::format("failed to execute {}: error {}", spec.program, GetLastError());
        CloseHandle(in_w);
        CloseHandle(out_r);
        CloseHandle(err_r);
        return result;
    }
    result.started = true;

    std::atomic<bool> stop{false};
    std::thread out_thread(pump_pipe, out_r, std::ref(result.stdout_data), std::cref(stop));
    std::thread err_thread(pump_pipe, err_r, std::ref(result.stderr_data), std::cref(stop));
    std::thread in_thread([&spec, in_w] {
        size_t written = 0;
        while (written < spec.input.size()) {
            DWORD n = 0;
            DWORD chunk = static_cast<DWORD>(std::min<size_t>(spec.input.size() - written, 65536));
            if (!WriteFile(in_w, spec.input.data() + written, chunk, &n, nullptr)) break;
            written += n;
        }
        CloseHandle(in_w);
    });

    DWORD ms = (spec.timeout_ms < 0) ? INFINITE : static_cast<DWORD>(spec.timeout_ms);
    if (WaitForSingleObject(pi.hProcess, ms) == WAIT_TIMEOUT) {
        TerminateProcess(pi.hProcess, 1);
        WaitForSingleObject(pi.hProcess, TERMINATE_GRACE_MS);
        result.timed_out = true;
    }
    DWORD code = 1;
    GetExitCodeProcess(pi.hProcess, &code);
    result.exit_code = result.timed_out ? -1 : static_cast<int>(code);

    stop = true;
    in_thread.join();
    out_thread.join();
    err_thread.join();

    CloseHandle(out_r);
    CloseHandle(err_r);
    CloseHandle(pi.hThread);
    CloseHandle(pi.hProcess);
    return result;
}

#else // Unix

namespace {

// A child that exits before reading all of its stdin must not kill us.
void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, [] {
        struct sigaction sa;
        std::memset(&sa, 0, sizeof(sa));
        sa.sa_handler = SIG_IGN;
        sigaction(SIGPIPE, &sa, nullptr);
    });
}

void set_flag(int fd, int get_cmd, int set_cmd, int flag) {
    int flags = fcntl(fd, get_cmd);
    if (flags >= 0) fcntl(fd, set_cmd, flags | flag);
}

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Read whatever is buffered. Returns false on EOF or a hard error.
bool drain_fd(int fd, std::string& out) {
    char buf[4096];
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

int decode_status(int status) {
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

void terminate_child(pid_t pid) {
    kill(pid, SIGTERM);
    for (int waited = 0; waited < TERMINATE_GRACE_MS; waited += POLL_MS) {
        if (waitpid(pid, nullptr, WNOHANG) == pid) return;
        sleep_ms(POLL_MS);
    }
    kill(pid, SIGKILL);
    waitpid(pid, nullptr, 0);
}

} // namespace

ProcessOutput run(const ProcessSpec& spec) {
    ProcessOutput result;
    ignore_sigpipe();

    // [0]=stdin [1]=stdout [2]=stderr [3]=exec error report
    int pipes[4][2] = {{-1, -1}, {-1, -1}, {-1, -1}, {-1, -1}};
    for (auto& p : pipes) {
        if (pipe(p) < 0) {
            result.error = fmt::format("pipe() failed: {}", std::strerror(errno));
            for (auto& q : pipes) { close_fd(q[0]); close_fd(q[1]); }
            return result;
        }
    }
    set_flag(pipes[3][1], F_GETFD, F_SETFD, FD_CLOEXEC);

    // Everything the child needs is built before fork().
    std::vector<std::string> env_storage;
    std::vector<char*> envp;
    if (!spec.env.empty()) {
        for (char** e = environ; e && *e; ++e) {
            std::string entry(*e);
            bool overridden = false;
            for (const auto& [key, value] : spec.env) {
                if (entry.compare(0, key.size() + 1, key + "=") == 0) { overridden = true; break; }
            }
            if (!overridden) env_storage.push_back(entry);
        }
        for (const auto& [key, value] : spec.env) env_storage.push_back(key + "=" + value);
        for (auto& s : env_storage) envp.push_back(s.data());
        envp.push_back(nullptr);
    }

    std::vector<const char*> argv;
    argv.push_back(spec.program.c_str());
    for (const auto& a : spec.args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        result.error = fmt::format("fork() failed: {}", std::strerror(errno));
        for (auto& q : pipes) { close_fd(q[0]); close_fd(q[1]); }
        return result;
    }

    if (pid == 0) {
        // Child process
        dup2(pipes[0][0], STDIN_FILENO);
        dup2(pipes[1][1], STDOUT_FILENO);
        dup2(pipes[2][1], STDERR_FILENO);
        for (int i = 0; i < 3; i++) {
            close(pipes[i][0]);
            close(pipes[i][1]);
        }
        close(pipes[3][0]);

        if (!envp.empty()) environ = envp.data();
        execvp(spec.program.c_str(), const_cast<char* const*>(argv.data()));

        int err = errno;
        ssize_t ignored = write(pipes[3][1], &err, sizeof(err));
        (void)ignored;
        _exit(127);  // exec failed
    }

    // Parent
    close_fd(pipes[0][0]);
    close_fd(pipes[1][1]);
    close_fd(pipes[2][1]);
    close_fd(pipes[3][1]);

    // The report pipe closes on successful exec (CLOEXEC) or carries errno.
    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(pipes[3][0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(pipes[3][0]);

    int in_fd = pipes[0][1];
    int out_fd = pipes[1][0];
    int err_fd = pipes[2][0];

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        waitpid(pid, nullptr, 0);
        close_fd(in_fd);
        close_fd(out_fd);
        close_fd(err_fd);
        result.error = fmt::format("failed to execute {}: {}", spec.program, std::strerror(exec_errno));
        return result;
    }
    result.started = true;

    set_flag(out_fd, F_GETFL, F_SETFL, O_NONBLOCK);
    set_flag(err_fd, F_GETFL, F_SETFL, O_NONBLOCK);
    if (spec.input.empty()) {
        close_fd(in_fd);
    } else {
        set_flag(in_fd, F_GETFL, F_SETFL, O_NONBLOCK);
    }

    size_t written = 0;
    int status = 0;
    auto start = std::chrono::steady_clock::now();

    while (true) {
        std::vector<pollfd> fds;
        if (out_fd >= 0) fds.push_back({out_fd, POLLIN, 0});
        if (err_fd >= 0) fds.push_back({err_fd, POLLIN, 0});
        if (in_fd >= 0) fds.push_back({in_fd, POLLOUT, 0});

        if (fds.empty()) {
            sleep_ms(POLL_MS);
        } else if (poll(fds.data(), fds.size(), POLL_MS) < 0 && errno != EINTR) {
            sleep_ms(POLL_MS);
        }

        for (const auto& p : fds) {
            if (p.revents == 0) continue;
            if (p.fd == in_fd) {
                if (p.revents & POLLOUT) {
                    ssize_t w = write(in_fd, spec.input.data() + written, spec.input.size() - written);
                    if (w > 0) written += static_cast<size_t>(w);
                    else if (w < 0 && errno != EAGAIN && errno != EINTR) close_fd(in_fd);
                    if (written >= spec.input.size()) close_fd(in_fd);
                }
                if (in_fd >= 0 && (p.revents & (POLLERR | POLLHUP))) close_fd(in_fd);
            } else if (p.fd == out_fd) {
                if (!drain_fd(out_fd, result.stdout_data)) close_fd(out_fd);
            } else if (p.fd == err_fd) {
                if (!drain_fd(err_fd, result.stderr_data)) close_fd(err_fd);
            }
        }

        if (waitpid(pid, &status, WNOHANG) == pid) {
            // Child is gone: take what is buffered and stop, even if a
            // detached grandchild still holds the write ends.
            if (out_fd >= 0) drain_fd(out_fd, result.stdout_data);
            if (err_fd >= 0) drain_fd(err_fd, result.stderr_data);
            result.exit_code = decode_status(status);
            break;
        }

        if (spec.timeout_ms >= 0) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start).count();
            if (elapsed > spec.timeout_ms) {
                terminate_child(pid);
                result.timed_out = true;
                result.exit_code = -1;
                break;
            }
        }
    }

    close_fd(in_fd);
    close_fd(out_fd);
    close_fd(err_fd);
    return result;
}

#endif

} // namespace platform
