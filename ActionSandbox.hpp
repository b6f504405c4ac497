// ActionSandbox.hpp
//
// Executes terminal action nodes off the dispatch path. Requests go to the
// worker pool keyed by node id, so one node's invocations run in order while
// different nodes run in parallel. Every invocation ends in an ActionOutcome;
// failures are logged and forwarded to the failure listener and never reach
// the caller as exceptions.
#pragma once
#include "Evaluator.hpp"
#include "LuaSandbox.hpp"
#include "VolumeBackend.hpp"
#include "WorkerPool.hpp"
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace MidiFlow {

enum class ActionFailureKind { SinkNotFound, NonZeroExit, ScriptError, Timeout, LaunchFailed, Rejected };

const char* actionFailureKindName(ActionFailureKind kind);

struct ActionOutcome {
    bool ok = true;
    ActionFailureKind failure = ActionFailureKind::LaunchFailed; // meaningful when !ok
    std::string message;
    std::string diagnostics; // captured output or script log, truncated
    double elapsedMs = 0.0;

    static ActionOutcome success(std::string diagnostics = {}) {
        ActionOutcome o;
        o.diagnostics = std::move(diagnostics);
        return o;
    }
    static ActionOutcome failed(ActionFailureKind kind, std::string message, std::string diagnostics = {}) {
        ActionOutcome o;
        o.ok = false;
        o.failure = kind;
        o.message = std::move(message);
        o.diagnostics = std::move(diagnostics);
        return o;
    }
};

struct ActionReport {
    NodeId node = 0;
    std::string title;
    NodeKind kind = NodeKind::Volume;
    ActionOutcome outcome;
};

// Performs one activation. Implementations must honor the node's timeout
// and report failures in the outcome.
class ActionExecutor {
public:
    virtual ~ActionExecutor() = default;
    virtual ActionOutcome execute(const ActionRequest& request) = 0;
};

class VolumeExecutor : public ActionExecutor {
public:
    explicit VolumeExecutor(std::shared_ptr<VolumeBackend> backend);
    ActionOutcome execute(const ActionRequest& request) override;

private:
    std::shared_ptr<VolumeBackend> backend;
};

class ShellExecutor : public ActionExecutor {
public:
    ActionOutcome execute(const ActionRequest& request) override;

    // Template placeholders and child environment for one request
    static std::map<std::string, std::string> templateValues(const ActionRequest& request);
    static std::map<std::string, std::string> environment(const ActionRequest& request);
};

class ScriptExecutor : public ActionExecutor {
public:
    ActionOutcome execute(const ActionRequest& request) override;
};

class ActionSandbox {
public:
    using Listener = std::function<void(const ActionReport&)>;

    explicit ActionSandbox(WorkerPool& pool);
    ActionSandbox(const ActionSandbox&) = delete;
    ActionSandbox& operator=(const ActionSandbox&) = delete;

    // Volume (system backend), shell and script executors
    void installDefaultExecutors();
    void setExecutor(NodeKind kind, std::shared_ptr<ActionExecutor> executor);

    // Never blocks. Returns false when the pool refused the request; the
    // Rejected failure has then already been reported.
    bool submit(ActionRequest request);

    void setFailureListener(Listener listener);
    // Called for every finished invocation, successful or not
    void setResultListener(Listener listener);

    void waitIdle() { pool.waitIdle(); }

    struct Stats {
        unsigned long long submitted = 0;
        unsigned long long rejected = 0;
        unsigned long long succeeded = 0;
        unsigned long long failed = 0;
        unsigned long long timedOut = 0;
    };
    Stats stats() const;

private:
    void run(const ActionRequest& request);
    void report(const ActionReport& report);
    std::shared_ptr<ActionExecutor> executorFor(NodeKind kind) const;

    WorkerPool& pool;
    mutable std::mutex mutex; // executors and listeners
    std::map<NodeKind, std::shared_ptr<ActionExecutor>> executors;
    Listener failureListener;
    Listener resultListener;

    std::atomic<unsigned long long> submittedCount{0};
    std::atomic<unsigned long long> rejectedCount{0};
    std::atomic<unsigned long long> succeededCount{0};
    std::atomic<unsigned long long> failedCount{0};
    std::atomic<unsigned long long> timedOutCount{0};
};

} // namespace MidiFlow
