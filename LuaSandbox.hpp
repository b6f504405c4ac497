// LuaSandbox.hpp
//
// Runs user scripts (Lua 5.4) in a fresh, capability-scoped interpreter per
// invocation. A script sees exactly three read-only globals besides a
// reduced standard library:
//
//   event    device, channel, control, value, kind, timestamp
//   node     id, title, kind, config, inputs
//   context  log(...), now(), read_file(path), workspace
//
// There is no io, os, package, debug or coroutine library, no load/dofile
// and no bytecode loading. context.read_file only reads beneath the
// invocation's allowed directories. A wall-clock deadline is enforced by an
// instruction-count hook and memory is capped per interpreter.
#pragma once
#include "ControlEvent.hpp"
#include "NodeKinds.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace MidiFlow {

struct ScriptInvocation {
    std::string source;
    int timeoutMs = 1000;
    std::vector<std::string> allowedPaths;
    size_t memoryLimit = 32 * 1024 * 1024;

    ControlEvent event;
    int nodeId = 0;
    std::string nodeTitle;
    std::string nodeKind;
    nlohmann::json config;
    std::map<std::string, Value> inputs;
    std::string workspaceId;
};

struct ScriptResult {
    bool ok = false;
    bool timedOut = false;
    std::string error;
    std::vector<std::string> logs;
    double elapsedMs = 0.0;
};

class LuaSandbox {
public:
    // Compiles without running; returns the compiler message on error
    static std::optional<std::string> checkSyntax(const std::string& source);

    static ScriptResult run(const ScriptInvocation& invocation);
};

} // namespace MidiFlow
