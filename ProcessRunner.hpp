// ProcessRunner.hpp
//
// Runs a child process in its own process group with a wall-clock timeout.
// stdout and stderr are captured (bounded) for diagnostics. On timeout the
// whole process group is killed. POSIX only.
#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace MidiFlow {

struct ProcessOptions {
    std::vector<std::string> argv; // argv[0] is resolved on PATH unless it contains '/'
    std::map<std::string, std::string> env; // added to (or overriding) the inherited environment
    std::string cwd;
    int timeoutMs = 5000;
    size_t outputLimit = 64 * 1024; // per stream
};

struct ProcessResult {
    bool launched = false;
    bool timedOut = false;
    int exitCode = -1;   // valid when the child exited normally
    int termSignal = 0;  // nonzero when the child was killed by a signal
    std::string error;   // launch failure description
    std::string out;
    std::string err;
    double elapsedMs = 0.0;

    bool succeeded() const { return launched && !timedOut && termSignal == 0 && exitCode == 0; }
};

// Never throws for child failures; everything is reported in the result
ProcessResult runProcess(const ProcessOptions& options);

// Searches PATH for an executable file named `name`
std::optional<std::string> findExecutable(const std::string& name);

} // namespace MidiFlow
