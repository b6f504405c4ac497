// WorkerPool.cpp
#include "WorkerPool.hpp"
#include "Log.hpp"
#include <exception>

namespace MidiFlow {

WorkerPool::WorkerPool(size_t workers, size_t capacity) : maxQueued(capacity == 0 ? 1 : capacity) {
    if (workers == 0) workers = 1;
    threads.reserve(workers);
    for (size_t i = 0; i < workers; ++i) threads.emplace_back([this] { workerLoop(); });
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::submit(int key, Task task) {
    std::lock_guard<std::mutex> lock(mutex);
    if (stopping || queuedCount >= maxQueued) return false;
    Strand& strand = strands[key];
    strand.tasks.push_back(std::move(task));
    ++queuedCount;
    if (!strand.scheduled) {
        strand.scheduled = true;
        runnable.push_back(key);
        workAvailable.notify_one();
    }
    return true;
}

void WorkerPool::workerLoop() {
    std::unique_lock<std::mutex> lock(mutex);
    for (;;) {
        workAvailable.wait(lock, [this] { return stopping || !runnable.empty(); });
        if (runnable.empty()) {
            if (stopping) return;
            continue;
        }
        const int key = runnable.front();
        runnable.pop_front();
        Strand& strand = strands[key];
        Task task = std::move(strand.tasks.front());
        strand.tasks.pop_front();
        --queuedCount;
        ++activeCount;

        lock.unlock();
        try {
            task();
        } catch (const std::exception& e) {
            MIDIFLOW_ERROR("worker task for key {} threw: {}", key, e.what());
        }
        lock.lock();

        --activeCount;
        Strand& after = strands[key];
        if (after.tasks.empty()) {
            strands.erase(key);
        } else {
            runnable.push_back(key);
            workAvailable.notify_one();
        }
        if (queuedCount == 0 && activeCount == 0) idle.notify_all();
    }
}

void WorkerPool::waitIdle() {
    std::unique_lock<std::mutex> lock(mutex);
    idle.wait(lock, [this] { return queuedCount == 0 && activeCount == 0; });
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (stopping && threads.empty()) return;
        stopping = true;
    }
    workAvailable.notify_all();
    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }
    threads.clear();
}

size_t WorkerPool::queued() const {
    std::lock_guard<std::mutex> lock(mutex);
    return queuedCount;
}

} // namespace MidiFlow
