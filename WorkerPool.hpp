// WorkerPool.hpp
//
// Bounded pool of worker threads with keyed strands: tasks submitted with
// the same key run one at a time in submission order, tasks with different
// keys run in parallel. submit() never blocks; it refuses the task when the
// queue is full or the pool is shutting down.
#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace MidiFlow {

class WorkerPool {
public:
    using Task = std::function<void()>;

    // `capacity` bounds the number of queued (not yet running) tasks
    WorkerPool(size_t workers, size_t capacity);
    ~WorkerPool();
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    bool submit(int key, Task task);
    // Blocks until nothing is queued or running
    void waitIdle();
    // Runs what is already queued, then joins the workers. Idempotent.
    void shutdown();

    size_t queued() const;
    size_t capacity() const { return maxQueued; }
    size_t workerCount() const { return threads.size(); }

private:
    struct Strand {
        std::deque<Task> tasks;
        bool scheduled = false; // in `runnable` or currently running
    };

    void workerLoop();

    mutable std::mutex mutex;
    std::condition_variable workAvailable;
    std::condition_variable idle;
    std::unordered_map<int, Strand> strands;
    std::deque<int> runnable;
    size_t queuedCount = 0;
    size_t activeCount = 0;
    size_t maxQueued;
    bool stopping = false;
    std::vector<std::thread> threads;
};

} // namespace MidiFlow
