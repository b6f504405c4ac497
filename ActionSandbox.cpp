// ActionSandbox.cpp
#include "ActionSandbox.hpp"
#include "CommandTemplate.hpp"
#include "Log.hpp"
#include "ProcessRunner.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <exception>

namespace MidiFlow {

namespace {

constexpr size_t kDiagnosticsLimit = 2048;

std::string truncated(const std::string& text) {
    if (text.size() <= kDiagnosticsLimit) return text;
    return text.substr(0, kDiagnosticsLimit) + "...";
}

const Value* findInput(const ActionRequest& request, const std::string& name) {
    auto it = request.inputs.find(name);
    return it == request.inputs.end() ? nullptr : &it->second;
}

} // namespace

const char* actionFailureKindName(ActionFailureKind kind) {
    switch (kind) {
        case ActionFailureKind::SinkNotFound: return "SinkNotFound";
        case ActionFailureKind::NonZeroExit: return "NonZeroExit";
        case ActionFailureKind::ScriptError: return "ScriptError";
        case ActionFailureKind::Timeout: return "Timeout";
        case ActionFailureKind::LaunchFailed: return "LaunchFailed";
        case ActionFailureKind::Rejected: return "Rejected";
    }
    return "Unknown";
}

// ---------------------------------------------------------------------------
// Volume
// ---------------------------------------------------------------------------

VolumeExecutor::VolumeExecutor(std::shared_ptr<VolumeBackend> b) : backend(std::move(b)) {}

ActionOutcome VolumeExecutor::execute(const ActionRequest& request) {
    const auto& config = std::get<VolumeConfig>(request.config);
    const Value* level = findInput(request, "level");
    const double* raw = level ? std::get_if<double>(level) : nullptr;
    if (!raw) return ActionOutcome::success("no level value");

    const double clamped = std::clamp(*raw, 0.0, 1.0);
    auto result = backend->setLevel(config.sink, clamped, config.timeoutMs);
    switch (result.status) {
        case VolumeResult::Status::Ok:
            return ActionOutcome::success(fmt::format("{} set to {:.3f}", config.sink.empty() ? "default sink" : config.sink, clamped));
        case VolumeResult::Status::SinkNotFound:
            return ActionOutcome::failed(ActionFailureKind::SinkNotFound, result.detail);
        case VolumeResult::Status::TimedOut:
            return ActionOutcome::failed(ActionFailureKind::Timeout, result.detail);
        case VolumeResult::Status::Failed:
            break;
    }
    return ActionOutcome::failed(ActionFailureKind::LaunchFailed, result.detail);
}

// ---------------------------------------------------------------------------
// Shell
// ---------------------------------------------------------------------------

std::map<std::string, std::string> ShellExecutor::templateValues(const ActionRequest& request) {
    const ControlEvent& event = request.context.event;
    std::map<std::string, std::string> values;
    const Value* value = findInput(request, "value");
    values["value"] = value && !std::holds_alternative<std::monostate>(*value) ? valueToString(*value)
                                                                              : valueToString(Value{event.rawValue});
    const Value* trigger = findInput(request, "trigger");
    values["trigger"] = trigger ? valueToString(*trigger) : "";
    values["device"] = event.device;
    values["channel"] = std::to_string(event.channel);
    values["control"] = std::to_string(event.control);
    values["node"] = std::to_string(request.node);
    values["timestamp"] = valueToString(Value{event.timestampMs});
    values["workspace"] = request.context.workspaceId;
    return values;
}

std::map<std::string, std::string> ShellExecutor::environment(const ActionRequest& request) {
    const auto values = templateValues(request);
    return {
        {"MIDI_VALUE", values.at("value")},
        {"MIDI_CONTROL", values.at("control")},
        {"MIDI_CHANNEL", values.at("channel")},
        {"MIDI_DEVICE", values.at("device")},
        {"MIDI_TYPE", eventKindName(request.context.event.kind)},
        {"MIDIFLOW_WORKSPACE_ID", values.at("workspace")},
    };
}

ActionOutcome ShellExecutor::execute(const ActionRequest& request) {
    const auto& config = std::get<ShellCommandConfig>(request.config);
    std::string command;
    try {
        command = renderShellCommand(config.command, templateValues(request));
    } catch (const fmt::format_error& e) {
        return ActionOutcome::failed(ActionFailureKind::LaunchFailed, fmt::format("bad command template: {}", e.what()));
    }

    ProcessOptions options;
    options.argv = {"/bin/sh", "-c", command};
    options.env = environment(request);
    options.cwd = config.cwd;
    options.timeoutMs = config.timeoutMs;
    MIDIFLOW_DEBUG("node {} running: {}", request.node, command);
    auto result = runProcess(options);

    std::string output = result.out;
    if (!result.err.empty()) output += (output.empty() ? "" : "\n") + result.err;
    ActionOutcome outcome;
    if (!result.launched) {
        outcome = ActionOutcome::failed(ActionFailureKind::LaunchFailed, result.error);
    } else if (result.timedOut) {
        outcome = ActionOutcome::failed(ActionFailureKind::Timeout,
                                        fmt::format("command exceeded {} ms and was killed", config.timeoutMs),
                                        truncated(output));
    } else if (result.termSignal != 0) {
        outcome = ActionOutcome::failed(ActionFailureKind::NonZeroExit,
                                        fmt::format("command killed by signal {}", result.termSignal), truncated(output));
    } else if (result.exitCode != 0) {
        outcome = ActionOutcome::failed(ActionFailureKind::NonZeroExit,
                                        fmt::format("command exited with status {}", result.exitCode), truncated(output));
    } else {
        outcome = ActionOutcome::success(truncated(output));
    }
    outcome.elapsedMs = result.elapsedMs;
    return outcome;
}

// ---------------------------------------------------------------------------
// Script
// ---------------------------------------------------------------------------

ActionOutcome ScriptExecutor::execute(const ActionRequest& request) {
    const auto& config = std::get<ScriptConfig>(request.config);
    ScriptInvocation invocation;
    invocation.source = config.source;
    invocation.timeoutMs = config.timeoutMs;
    invocation.allowedPaths = config.allowedPaths;
    invocation.event = request.context.event;
    invocation.nodeId = request.node;
    invocation.nodeTitle = request.title;
    invocation.nodeKind = nodeTemplate(NodeKind::Script).typeId;
    invocation.config = configToJson(request.config);
    invocation.inputs = request.inputs;
    invocation.workspaceId = request.context.workspaceId;

    auto result = LuaSandbox::run(invocation);
    std::string log;
    for (const auto& line : result.logs) {
        if (!log.empty()) log += '\n';
        log += line;
    }
    ActionOutcome outcome;
    if (result.timedOut) {
        outcome = ActionOutcome::failed(ActionFailureKind::Timeout,
                                        fmt::format("script exceeded {} ms", config.timeoutMs), truncated(log));
    } else if (!result.ok) {
        outcome = ActionOutcome::failed(ActionFailureKind::ScriptError, result.error, truncated(log));
    } else {
        outcome = ActionOutcome::success(truncated(log));
    }
    outcome.elapsedMs = result.elapsedMs;
    return outcome;
}

// ---------------------------------------------------------------------------
// Sandbox
// ---------------------------------------------------------------------------

ActionSandbox::ActionSandbox(WorkerPool& p) : pool(p) {}

void ActionSandbox::installDefaultExecutors() {
    setExecutor(NodeKind::Volume, std::make_shared<VolumeExecutor>(makeDefaultVolumeBackend()));
    setExecutor(NodeKind::ShellCommand, std::make_shared<ShellExecutor>());
    setExecutor(NodeKind::Script, std::make_shared<ScriptExecutor>());
}

void ActionSandbox::setExecutor(NodeKind kind, std::shared_ptr<ActionExecutor> executor) {
    std::lock_guard<std::mutex> lock(mutex);
    executors[kind] = std::move(executor);
}

std::shared_ptr<ActionExecutor> ActionSandbox::executorFor(NodeKind kind) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = executors.find(kind);
    return it == executors.end() ? nullptr : it->second;
}

void ActionSandbox::setFailureListener(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex);
    failureListener = std::move(listener);
}

void ActionSandbox::setResultListener(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex);
    resultListener = std::move(listener);
}

bool ActionSandbox::submit(ActionRequest request) {
    const NodeId node = request.node;
    const std::string title = request.title;
    const NodeKind kind = kindOf(request.config);
    const bool accepted = pool.submit(node, [this, req = std::move(request)] { run(req); });
    if (accepted) {
        ++submittedCount;
        return true;
    }
    ++rejectedCount;
    report({node, title, kind,
            ActionOutcome::failed(ActionFailureKind::Rejected,
                                  fmt::format("worker queue full ({} pending)", pool.capacity()))});
    return false;
}

void ActionSandbox::run(const ActionRequest& request) {
    const NodeKind kind = kindOf(request.config);
    ActionReport rep{request.node, request.title, kind, {}};
    auto executor = executorFor(kind);
    if (!executor) {
        rep.outcome = ActionOutcome::failed(ActionFailureKind::LaunchFailed,
                                            fmt::format("no executor for {}", nodeTemplate(kind).typeId));
    } else {
        try {
            rep.outcome = executor->execute(request);
        } catch (const std::exception& e) {
            rep.outcome = ActionOutcome::failed(
                kind == NodeKind::Script ? ActionFailureKind::ScriptError : ActionFailureKind::LaunchFailed, e.what());
        }
    }
    report(rep);
}

void ActionSandbox::report(const ActionReport& rep) {
    if (rep.outcome.ok) {
        ++succeededCount;
        MIDIFLOW_DEBUG("node {} ({}) ok in {:.1f} ms", rep.node, rep.title, rep.outcome.elapsedMs);
    } else {
        if (rep.outcome.failure == ActionFailureKind::Timeout) ++timedOutCount;
        if (rep.outcome.failure != ActionFailureKind::Rejected) ++failedCount;
        MIDIFLOW_WARN("node {} ({}) failed: {}: {}", rep.node, rep.title, actionFailureKindName(rep.outcome.failure),
                      rep.outcome.message);
        if (!rep.outcome.diagnostics.empty()) MIDIFLOW_DEBUG("node {} output: {}", rep.node, rep.outcome.diagnostics);
    }

    Listener failure;
    Listener result;
    {
        std::lock_guard<std::mutex> lock(mutex);
        failure = failureListener;
        result = resultListener;
    }
    try {
        if (!rep.outcome.ok && failure) failure(rep);
        if (result) result(rep);
    } catch (const std::exception& e) {
        MIDIFLOW_ERROR("action listener threw: {}", e.what());
    }
}

ActionSandbox::Stats ActionSandbox::stats() const {
    Stats s;
    s.submitted = submittedCount.load();
    s.rejected = rejectedCount.load();
    s.succeeded = succeededCount.load();
    s.failed = failedCount.load();
    s.timedOut = timedOutCount.load();
    return s;
}

} // namespace MidiFlow
