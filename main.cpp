// main.cpp
//
// Headless MidiFlow runtime. Parses CLI (CLI11), restores the workspace
// snapshot, and runs the engine:
// - Control events are read as NDJSON from a file or stdin
// - Actions run on the worker pool through the action sandbox
// - The workspace is checkpointed while it changes and saved on shutdown
#include "ActionSandbox.hpp"
#include "Dispatcher.hpp"
#include "EventSource.hpp"
#include "FlowEngine.hpp"
#include "FlowError.hpp"
#include "Log.hpp"
#include "WorkerPool.hpp"
#include "Workspace.hpp"
#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <thread>

namespace {

std::atomic<bool> running(true);

void onSignal(int) {
    running = false;
}

void writePerf(FILE* fp, const MidiFlow::FlowEngine& engine, const MidiFlow::ActionSandbox& sandbox,
               const MidiFlow::Dispatcher& dispatcher) {
    if (!fp) return;
    auto es = engine.stats();
    auto as = sandbox.stats();
    auto ds = dispatcher.stats();
    std::fprintf(fp,
        "{\"type\":\"perf\",\"eventsDelivered\":%llu,\"eventsUnbound\":%llu,\"eventsLearned\":%llu,"
        "\"evalCount\":%llu,\"evalTimeNsAccum\":%llu,\"evalTimeNsMax\":%llu,\"nodesEvaluated\":%llu,"
        "\"readyQueueMax\":%llu,\"actionsSubmitted\":%llu,\"actionsRejected\":%llu,\"actionsFailed\":%llu,"
        "\"actionsTimedOut\":%llu,\"timestampsClamped\":%llu}\n",
        es.eventsDelivered, es.eventsUnbound, es.eventsLearned, es.eval.evalCount, es.eval.evalTimeNsAccum,
        es.eval.evalTimeNsMax, es.eval.nodesEvaluated, es.eval.readyQueueMax, es.actionsSubmitted,
        es.actionsRejected, as.failed, as.timedOut, ds.clamped);
    std::fflush(fp);
}

} // namespace

int main(int argc, char** argv) {
    std::string workspacePath = "workspace.json";
    std::string workspaceId = "default";
    std::string eventsPath;
    std::string logLevelName = "info";
    int workers = 4;
    int queueCapacity = 256;
    int eventQueue = 4096;
    int checkpointSec = 30;
    bool noSave = false;
    std::string perfOut;       // NDJSON file
    int perfIntervalMs = 1000; // summary interval
    CLI::App app{"midiflow"};
    try {
        app.add_option("--workspace", workspacePath, "Path to the workspace snapshot (JSON)");
        app.add_option("--workspace-id", workspaceId, "Workspace id used when the snapshot has none");
        app.add_option("--events", eventsPath, "NDJSON control events to replay ('-' reads stdin)");
        app.add_option("--workers", workers, "Action worker threads")->check(CLI::Range(1, 256));
        app.add_option("--queue-capacity", queueCapacity, "Pending actions before new ones are rejected")->check(CLI::Range(1, 1 << 20));
        app.add_option("--event-queue", eventQueue, "Buffered control events before producers wait")->check(CLI::Range(1, 1 << 20));
        app.add_option("--checkpoint-interval", checkpointSec, "Checkpoint interval seconds (0=off)")->check(CLI::NonNegativeNumber);
        app.add_option("--log-level", logLevelName, "trace|debug|info|warn|error|off");
        app.add_flag("--no-save", noSave, "Do not write the workspace on shutdown or checkpoints");
        app.add_option("--perf-out", perfOut, "Write NDJSON perf summaries to file");
        app.add_option("--perf-interval", perfIntervalMs, "Perf summary interval ms")->check(CLI::PositiveNumber);
        app.allow_extras(false);
        app.set_config("--config");
        app.set_help_all_flag("--help-all", "Show all help");
        app.parse(argc, argv);
    } catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    auto level = MidiFlow::parseLogLevel(logLevelName);
    if (!level) {
        fmt::print(stderr, "unknown log level '{}'\n", logLevelName);
        return 2;
    }
    MidiFlow::setLogLevel(*level);

    MidiFlow::WorkerPool pool(static_cast<size_t>(workers), static_cast<size_t>(queueCapacity));
    MidiFlow::ActionSandbox sandbox(pool);
    sandbox.installDefaultExecutors();
    MidiFlow::FlowEngine engine(sandbox, workspaceId);

    try {
        if (std::filesystem::exists(workspacePath)) {
            engine.restore(MidiFlow::readWorkspaceFile(workspacePath));
        } else {
            MIDIFLOW_INFO("no workspace at {}; starting empty", workspacePath);
        }
    } catch (const std::exception& e) {
        MIDIFLOW_ERROR("cannot load workspace {}: {}", workspacePath, e.what());
        return 1;
    }

    auto save = [&](const char* reason) {
        if (noSave) return;
        try {
            MidiFlow::writeWorkspaceFile(workspacePath, engine.snapshot());
            MIDIFLOW_INFO("workspace saved to {} ({})", workspacePath, reason);
        } catch (const std::exception& e) {
            MIDIFLOW_ERROR("saving workspace failed: {}", e.what());
        }
    };

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    MidiFlow::Dispatcher dispatcher(engine, static_cast<size_t>(eventQueue));
    dispatcher.start();
    if (!eventsPath.empty()) {
        try {
            dispatcher.addSource(MidiFlow::NdjsonEventSource::open(eventsPath));
        } catch (const std::exception& e) {
            MIDIFLOW_ERROR("{}", e.what());
            dispatcher.stop();
            return 1;
        }
    }

    fmt::print(stderr, "midiflow started. workspace='{}', events='{}', workers={}\n", workspacePath,
               eventsPath.empty() ? "none" : eventsPath, pool.workerCount());

    FILE* perfFile = perfOut.empty() ? nullptr : std::fopen(perfOut.c_str(), "w");
    if (!perfOut.empty() && !perfFile) MIDIFLOW_WARN("cannot open perf output {}", perfOut);

    using Steady = std::chrono::steady_clock;
    auto lastCheckpoint = Steady::now();
    auto lastPerf = Steady::now();
    auto savedRevision = engine.revision();
    while (running) {
        // Replay mode ends with the input
        if (!eventsPath.empty() && dispatcher.activeSources() == 0) {
            dispatcher.waitIdle();
            break;
        }
        auto now = Steady::now();
        if (checkpointSec > 0 && now - lastCheckpoint >= std::chrono::seconds(checkpointSec)) {
            auto rev = engine.revision();
            if (rev != savedRevision) {
                save("checkpoint");
                savedRevision = rev;
            }
            lastCheckpoint = now;
        }
        if (perfFile && now - lastPerf >= std::chrono::milliseconds(perfIntervalMs)) {
            writePerf(perfFile, engine, sandbox, dispatcher);
            lastPerf = now;
        }
        // Small delay to prevent CPU overuse
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    // Cleanup: stop input, let running actions finish, then persist
    dispatcher.stop();
    sandbox.waitIdle();
    pool.shutdown();
    if (engine.revision() != savedRevision) save("shutdown");
    writePerf(perfFile, engine, sandbox, dispatcher);
    if (perfFile) std::fclose(perfFile);

    auto es = engine.stats();
    auto as = sandbox.stats();
    fmt::print(stderr, "midiflow stopped. events={} unbound={} actions={} failed={} rejected={}\n",
               es.eventsDelivered, es.eventsUnbound, as.submitted, as.failed, as.rejected);
    return 0;
}
