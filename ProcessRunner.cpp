// ProcessRunner.cpp
//
// fork/exec with everything allocated before the fork: the child only calls
// async-signal-safe functions (setpgid, dup2, chdir, execve, write, _exit).
// Exec failures travel back over a close-on-exec pipe.
#include "ProcessRunner.hpp"
#include "Log.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <chrono>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace MidiFlow {

namespace {

struct Pipe {
    int fds[2] = {-1, -1};
    bool open() {
#if defined(__linux__)
        return ::pipe2(fds, O_CLOEXEC) == 0;
#else
        if (::pipe(fds) != 0) return false;
        ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
        ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
        return true;
#endif
    }
    void closeRead() { if (fds[0] >= 0) { ::close(fds[0]); fds[0] = -1; } }
    void closeWrite() { if (fds[1] >= 0) { ::close(fds[1]); fds[1] = -1; } }
    ~Pipe() { closeRead(); closeWrite(); }
};

bool isExecutableFile(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

std::vector<std::string> buildEnvironment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq != std::string::npos && overrides.count(entry.substr(0, eq))) continue;
        env.push_back(std::move(entry));
    }
    for (const auto& kv : overrides) env.push_back(kv.first + "=" + kv.second);
    return env;
}

std::vector<char*> pointers(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) out.push_back(s.data());
    out.push_back(nullptr);
    return out;
}

[[noreturn]] void childFail(int errorFd, const char* stage) {
    const int code = errno;
    // "<stage>:<errno>" is parsed by the parent
    char buf[64];
    int len = 0;
    for (const char* p = stage; *p && len < 40; ++p) buf[len++] = *p;
    buf[len++] = ':';
    char digits[16];
    int n = 0;
    int v = code;
    do { digits[n++] = static_cast<char>('0' + v % 10); v /= 10; } while (v > 0 && n < 15);
    while (n > 0) buf[len++] = digits[--n];
    ssize_t ignored = ::write(errorFd, buf, static_cast<size_t>(len));
    (void)ignored;
    ::_exit(127);
}

void appendBounded(std::string& sink, const char* data, size_t len, size_t limit) {
    if (sink.size() >= limit) return;
    sink.append(data, std::min(len, limit - sink.size()));
}

} // namespace

std::optional<std::string> findExecutable(const std::string& name) {
    if (name.empty()) return std::nullopt;
    if (name.find('/') != std::string::npos) {
        if (isExecutableFile(name)) return name;
        return std::nullopt;
    }
    const char* path = std::getenv("PATH");
    std::string dirs = path ? path : "/usr/local/bin:/usr/bin:/bin";
    size_t start = 0;
    while (start <= dirs.size()) {
        size_t end = dirs.find(':', start);
        if (end == std::string::npos) end = dirs.size();
        std::string dir = dirs.substr(start, end - start);
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + name;
        if (isExecutableFile(candidate)) return candidate;
        start = end + 1;
    }
    return std::nullopt;
}

ProcessResult runProcess(const ProcessOptions& options) {
    ProcessResult result;
    const auto t0 = std::chrono::steady_clock::now();
    auto elapsed = [&] {
        return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
    };

    if (options.argv.empty()) {
        result.error = "empty command line";
        return result;
    }
    auto exe = findExecutable(options.argv[0]);
    if (!exe) {
        result.error = fmt::format("'{}' not found on PATH", options.argv[0]);
        return result;
    }

    std::vector<std::string> args = options.argv;
    std::vector<std::string> env = buildEnvironment(options.env);
    std::vector<char*> argvPtrs = pointers(args);
    std::vector<char*> envPtrs = pointers(env);
    std::string exePath = *exe;
    const char* cwd = options.cwd.empty() ? nullptr : options.cwd.c_str();

    Pipe outPipe, errPipe, statusPipe;
    if (!outPipe.open() || !errPipe.open() || !statusPipe.open()) {
        result.error = fmt::format("pipe: {}", std::strerror(errno));
        return result;
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        result.error = fmt::format("fork: {}", std::strerror(errno));
        return result;
    }
    if (pid == 0) {
        ::setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        if (::dup2(outPipe.fds[1], STDOUT_FILENO) < 0) childFail(statusPipe.fds[1], "dup2");
        if (::dup2(errPipe.fds[1], STDERR_FILENO) < 0) childFail(statusPipe.fds[1], "dup2");
        if (cwd && ::chdir(cwd) != 0) childFail(statusPipe.fds[1], "chdir");
        ::execve(exePath.c_str(), argvPtrs.data(), envPtrs.data());
        childFail(statusPipe.fds[1], "exec");
    }

    // Also set from the parent so the group exists before any kill
    ::setpgid(pid, pid);
    outPipe.closeWrite();
    errPipe.closeWrite();
    statusPipe.closeWrite();

    // Wait for exec (status pipe closes) or an error report
    std::string status;
    char buf[4096];
    for (;;) {
        ssize_t n = ::read(statusPipe.fds[0], buf, sizeof(buf));
        if (n > 0) { status.append(buf, static_cast<size_t>(n)); continue; }
        if (n < 0 && errno == EINTR) continue;
        break;
    }
    if (!status.empty()) {
        int wstatus = 0;
        while (::waitpid(pid, &wstatus, 0) < 0 && errno == EINTR) {}
        auto colon = status.find(':');
        int code = colon == std::string::npos ? 0 : std::atoi(status.c_str() + colon + 1);
        result.error = fmt::format("{} failed: {}", status.substr(0, colon), std::strerror(code));
        result.elapsedMs = elapsed();
        return result;
    }
    result.launched = true;

    const auto deadline = t0 + std::chrono::milliseconds(options.timeoutMs);
    bool outOpen = true, errOpen = true;
    bool reaped = false;
    int wstatus = 0;
    // Poll in short slices so a child that exits while a background
    // grandchild still holds the pipes open is noticed
    while (!reaped) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            result.timedOut = true;
            break;
        }
        int waitMs = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count()) + 1;
        if (waitMs > 20) waitMs = 20;
        struct pollfd fds[2];
        nfds_t count = 0;
        if (outOpen) fds[count++] = {outPipe.fds[0], POLLIN, 0};
        if (errOpen) fds[count++] = {errPipe.fds[0], POLLIN, 0};
        int ready = 0;
        if (count > 0) ready = ::poll(fds, count, waitMs);
        else ::usleep(2000);
        if (ready < 0 && errno != EINTR) {
            result.error = fmt::format("poll: {}", std::strerror(errno));
            break;
        }
        for (nfds_t i = 0; ready > 0 && i < count; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            const bool isOut = fds[i].fd == outPipe.fds[0];
            ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                appendBounded(isOut ? result.out : result.err, buf, static_cast<size_t>(n), options.outputLimit);
            } else if (n == 0 || errno != EINTR) {
                (isOut ? outOpen : errOpen) = false;
            }
        }
        pid_t r = ::waitpid(pid, &wstatus, WNOHANG);
        if (r == pid) reaped = true;
        else if (r < 0 && errno != EINTR) break;
    }

    // Collect what the child wrote before exiting
    for (int* fd : {&outPipe.fds[0], &errPipe.fds[0]}) {
        if (!reaped) break;
        std::string& sink = fd == &outPipe.fds[0] ? result.out : result.err;
        struct pollfd pfd = {*fd, POLLIN, 0};
        while (::poll(&pfd, 1, 0) > 0 && (pfd.revents & POLLIN)) {
            ssize_t n = ::read(*fd, buf, sizeof(buf));
            if (n <= 0) break;
            appendBounded(sink, buf, static_cast<size_t>(n), options.outputLimit);
        }
    }

    if (!reaped) {
        ::kill(-pid, SIGKILL);
        while (::waitpid(pid, &wstatus, 0) < 0 && errno == EINTR) {}
    }
    if (!result.timedOut) {
        if (WIFEXITED(wstatus)) result.exitCode = WEXITSTATUS(wstatus);
        else if (WIFSIGNALED(wstatus)) result.termSignal = WTERMSIG(wstatus);
    }
    result.elapsedMs = elapsed();
    MIDIFLOW_TRACE("process '{}' finished in {:.1f} ms (exit {}, signal {}, timeout {})", options.argv[0],
                   result.elapsedMs, result.exitCode, result.termSignal, result.timedOut);
    return result;
}

} // namespace MidiFlow
