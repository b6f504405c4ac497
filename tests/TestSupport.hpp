// TestSupport.hpp
//
// Recording executors and a fake volume backend shared by the tests.
#pragma once
#include "ActionSandbox.hpp"
#include "ControlEvent.hpp"
#include "FlowEngine.hpp"
#include "VolumeBackend.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace MidiFlowTest {

using namespace std::chrono_literals;

inline MidiFlow::ControlEvent cc(const std::string& device, int channel, int control, double value,
                                 MidiFlow::EventKind kind = MidiFlow::EventKind::Continuous, double timestamp = 0.0) {
    MidiFlow::ControlEvent e;
    e.device = device;
    e.channel = channel;
    e.control = control;
    e.rawValue = value;
    e.kind = kind;
    e.timestampMs = timestamp;
    return e;
}

inline bool waitUntil(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = 3000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate()) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(2ms);
    }
    return true;
}

inline double numberInput(const MidiFlow::ActionRequest& request, const std::string& port) {
    auto it = request.inputs.find(port);
    if (it == request.inputs.end()) return -1.0;
    const double* v = std::get_if<double>(&it->second);
    return v ? *v : -1.0;
}

// Records every request it is asked to execute
class RecordingExecutor : public MidiFlow::ActionExecutor {
public:
    MidiFlow::ActionOutcome execute(const MidiFlow::ActionRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex);
        seen.push_back(request);
        return outcome;
    }

    std::vector<MidiFlow::ActionRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex);
        return seen;
    }

    size_t count() const {
        std::lock_guard<std::mutex> lock(mutex);
        return seen.size();
    }

    MidiFlow::ActionOutcome outcome = MidiFlow::ActionOutcome::success();

private:
    mutable std::mutex mutex;
    std::vector<MidiFlow::ActionRequest> seen;
};

// Blocks every execution until release() is called
class GateExecutor : public MidiFlow::ActionExecutor {
public:
    MidiFlow::ActionOutcome execute(const MidiFlow::ActionRequest&) override {
        std::unique_lock<std::mutex> lock(mutex);
        ++started;
        changed.notify_all();
        changed.wait(lock, [this] { return open; });
        return MidiFlow::ActionOutcome::success();
    }

    void release() {
        std::lock_guard<std::mutex> lock(mutex);
        open = true;
        changed.notify_all();
    }

    bool waitStarted(int n) {
        std::unique_lock<std::mutex> lock(mutex);
        return changed.wait_for(lock, 3s, [&] { return started >= n; });
    }

private:
    std::mutex mutex;
    std::condition_variable changed;
    int started = 0;
    bool open = false;
};

class FakeVolumeBackend : public MidiFlow::VolumeBackend {
public:
    std::string name() const override { return "fake"; }

    std::vector<MidiFlow::AudioSink> listSinks(int) override { return sinks; }

    MidiFlow::VolumeResult setLevel(const std::string& sink, double level, int) override {
        std::lock_guard<std::mutex> lock(mutex);
        const std::string id = sink.empty() ? "@DEFAULT@" : sink;
        if (!sink.empty()) {
            bool known = false;
            for (const auto& s : sinks) known = known || s.id == sink || s.name == sink;
            if (!known) return {MidiFlow::VolumeResult::Status::SinkNotFound, "unknown sink '" + sink + "'"};
        }
        history.emplace_back(id, level);
        return {};
    }

    std::vector<std::pair<std::string, double>> levels() const {
        std::lock_guard<std::mutex> lock(mutex);
        return history;
    }

    std::vector<MidiFlow::AudioSink> sinks{{"48", "Speakers"}, {"52", "Headphones"}};

private:
    mutable std::mutex mutex;
    std::vector<std::pair<std::string, double>> history;
};

// Collects reports from the sandbox listeners
class ReportLog {
public:
    void add(const MidiFlow::ActionReport& report) {
        std::lock_guard<std::mutex> lock(mutex);
        reports.push_back(report);
    }

    std::vector<MidiFlow::ActionReport> all() const {
        std::lock_guard<std::mutex> lock(mutex);
        return reports;
    }

    size_t count() const {
        std::lock_guard<std::mutex> lock(mutex);
        return reports.size();
    }

    MidiFlow::ActionSandbox::Listener listener() {
        return [this](const MidiFlow::ActionReport& r) { add(r); };
    }

private:
    mutable std::mutex mutex;
    std::vector<MidiFlow::ActionReport> reports;
};

// Pool, sandbox and engine wired to fakes. Volume goes to a fake backend,
// shell and script requests are recorded instead of run.
struct EngineRig {
    explicit EngineRig(size_t workers = 2, size_t capacity = 64)
        : pool(workers, capacity), sandbox(pool), engine(sandbox, "rig") {
        sandbox.setExecutor(MidiFlow::NodeKind::Volume, std::make_shared<MidiFlow::VolumeExecutor>(volume));
        sandbox.setExecutor(MidiFlow::NodeKind::ShellCommand, recorder);
        sandbox.setExecutor(MidiFlow::NodeKind::Script, recorder);
        sandbox.setResultListener(reports.listener());
        sandbox.setFailureListener(failures.listener());
    }
    ~EngineRig() { pool.shutdown(); }

    std::shared_ptr<FakeVolumeBackend> volume = std::make_shared<FakeVolumeBackend>();
    std::shared_ptr<RecordingExecutor> recorder = std::make_shared<RecordingExecutor>();
    ReportLog reports;
    ReportLog failures;
    MidiFlow::WorkerPool pool;
    MidiFlow::ActionSandbox sandbox;
    MidiFlow::FlowEngine engine;
};

} // namespace MidiFlowTest
