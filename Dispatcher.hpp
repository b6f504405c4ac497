// Dispatcher.hpp
//
// The dispatch loop. Every event source gets a producer thread that moves
// its events into one bounded FIFO; a single dispatch thread drains the FIFO
// into FlowEngine::deliver(). Events of one device keep their production
// order; across devices the order is arrival order. Per-device timestamps
// that go backwards are clamped to the last seen value.
#pragma once
#include "EventSource.hpp"
#include "FlowEngine.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

namespace MidiFlow {

class Dispatcher {
public:
    // `queueCapacity` bounds buffered events; producers wait when it is full
    explicit Dispatcher(FlowEngine& engine, size_t queueCapacity = 4096);
    ~Dispatcher();
    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    void start();
    // Closes every source, joins all threads. Events still queued are dropped.
    void stop();

    // Sources may be added and removed while running
    int addSource(std::shared_ptr<EventSource> source);
    // Closes the source, drops its queued events and cancels a learn session
    // restricted to its device
    bool removeSource(int sourceId);

    // Injects an event from the calling thread. Returns false when the queue
    // is full or the dispatcher is stopped.
    bool post(const ControlEvent& event);

    // Blocks until the queue is empty and no event is being delivered
    void waitIdle();
    // Sources whose producer has not reached the end of input yet
    size_t activeSources() const;

    struct Stats {
        unsigned long long received = 0;
        unsigned long long dispatched = 0;
        unsigned long long clamped = 0;
        unsigned long long dropped = 0;
        unsigned long long failed = 0;
    };
    Stats stats() const;

private:
    struct SourceSlot {
        int id = 0;
        std::shared_ptr<EventSource> source;
        std::thread producer;
        std::atomic<bool> finished{false};
        std::atomic<bool> closing{false};
    };
    struct Queued {
        int sourceId;
        ControlEvent event;
    };

    void producerLoop(SourceSlot* slot);
    void dispatchLoop();
    bool enqueue(int sourceId, ControlEvent event, const SourceSlot* slot);
    void startProducer(SourceSlot& slot);

    FlowEngine& engine;
    size_t capacity;

    mutable std::mutex queueMutex;
    std::condition_variable queueChanged;
    std::deque<Queued> queue;
    bool running = false;
    bool stopping = false;
    bool delivering = false;

    mutable std::mutex sourcesMutex;
    std::map<int, std::unique_ptr<SourceSlot>> sources;
    int nextSourceId = 1;

    std::map<std::string, double> lastTimestamp; // dispatch thread only
    std::thread dispatchThread;
    Stats counters; // guarded by queueMutex
};

} // namespace MidiFlow
