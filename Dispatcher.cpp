// Dispatcher.cpp
#include "Dispatcher.hpp"
#include "Log.hpp"
#include <algorithm>
#include <exception>

namespace MidiFlow {

Dispatcher::Dispatcher(FlowEngine& e, size_t queueCapacity) : engine(e), capacity(queueCapacity == 0 ? 1 : queueCapacity) {}

Dispatcher::~Dispatcher() {
    stop();
}

void Dispatcher::start() {
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        if (running) return;
        running = true;
        stopping = false;
    }
    dispatchThread = std::thread([this] { dispatchLoop(); });
    std::lock_guard<std::mutex> lock(sourcesMutex);
    for (auto& entry : sources) {
        if (!entry.second->producer.joinable() && !entry.second->finished) startProducer(*entry.second);
    }
}

void Dispatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        stopping = true;
    }
    queueChanged.notify_all();

    std::map<int, std::unique_ptr<SourceSlot>> closing;
    {
        std::lock_guard<std::mutex> lock(sourcesMutex);
        closing.swap(sources);
    }
    for (auto& entry : closing) {
        entry.second->closing = true;
        entry.second->source->close();
    }
    queueChanged.notify_all();
    for (auto& entry : closing) {
        if (entry.second->producer.joinable()) entry.second->producer.join();
    }
    if (dispatchThread.joinable()) dispatchThread.join();

    std::lock_guard<std::mutex> lock(queueMutex);
    counters.dropped += queue.size();
    queue.clear();
    running = false;
}

void Dispatcher::startProducer(SourceSlot& slot) {
    SourceSlot* raw = &slot;
    slot.producer = std::thread([this, raw] { producerLoop(raw); });
}

int Dispatcher::addSource(std::shared_ptr<EventSource> source) {
    auto slot = std::make_unique<SourceSlot>();
    slot->source = std::move(source);
    bool isRunning;
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        isRunning = running && !stopping;
    }
    std::lock_guard<std::mutex> lock(sourcesMutex);
    slot->id = nextSourceId++;
    const int id = slot->id;
    MIDIFLOW_INFO("event source {} added (device {})", id, slot->source->device());
    if (isRunning) startProducer(*slot);
    sources.emplace(id, std::move(slot));
    return id;
}

bool Dispatcher::removeSource(int sourceId) {
    std::unique_ptr<SourceSlot> slot;
    {
        std::lock_guard<std::mutex> lock(sourcesMutex);
        auto it = sources.find(sourceId);
        if (it == sources.end()) return false;
        slot = std::move(it->second);
        sources.erase(it);
    }
    slot->closing = true;
    slot->source->close();
    queueChanged.notify_all();
    if (slot->producer.joinable()) slot->producer.join();

    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        auto end = std::remove_if(queue.begin(), queue.end(), [sourceId](const Queued& q) { return q.sourceId == sourceId; });
        dropped = static_cast<size_t>(std::distance(end, queue.end()));
        queue.erase(end, queue.end());
        counters.dropped += dropped;
    }
    queueChanged.notify_all();
    const std::string device = slot->source->device();
    engine.deviceClosed(device);
    MIDIFLOW_INFO("event source {} removed (device {}, {} queued events dropped)", sourceId, device, dropped);
    return true;
}

bool Dispatcher::enqueue(int sourceId, ControlEvent event, const SourceSlot* slot) {
    std::unique_lock<std::mutex> lock(queueMutex);
    if (slot) {
        queueChanged.wait(lock, [&] { return stopping || slot->closing || queue.size() < capacity; });
        if (stopping || slot->closing) return false;
    } else if (stopping || !running || queue.size() >= capacity) {
        return false;
    }
    queue.push_back({sourceId, std::move(event)});
    ++counters.received;
    queueChanged.notify_all();
    return true;
}

bool Dispatcher::post(const ControlEvent& event) {
    return enqueue(0, event, nullptr);
}

void Dispatcher::producerLoop(SourceSlot* slot) {
    while (!slot->closing) {
        auto event = slot->source->next();
        if (!event) break;
        if (!enqueue(slot->id, std::move(*event), slot)) break;
    }
    slot->finished = true;
    MIDIFLOW_DEBUG("event source {} finished", slot->id);
    queueChanged.notify_all();
}

void Dispatcher::dispatchLoop() {
    std::unique_lock<std::mutex> lock(queueMutex);
    for (;;) {
        queueChanged.wait(lock, [this] { return stopping || !queue.empty(); });
        if (stopping) return;
        Queued item = std::move(queue.front());
        queue.pop_front();
        delivering = true;
        queueChanged.notify_all();
        lock.unlock();

        ControlEvent& event = item.event;
        bool clamped = false;
        auto last = lastTimestamp.find(event.device);
        if (last != lastTimestamp.end() && event.timestampMs < last->second) {
            MIDIFLOW_WARN("device {} timestamp went backwards ({} < {}); clamped", event.device, event.timestampMs,
                          last->second);
            event.timestampMs = last->second;
            clamped = true;
        }
        lastTimestamp[event.device] = event.timestampMs;

        bool failed = false;
        try {
            engine.deliver(event);
        } catch (const std::exception& e) {
            failed = true;
            MIDIFLOW_ERROR("delivering {} failed: {}", toString(event.key()), e.what());
        }

        lock.lock();
        delivering = false;
        ++counters.dispatched;
        if (clamped) ++counters.clamped;
        if (failed) ++counters.failed;
        queueChanged.notify_all();
    }
}

void Dispatcher::waitIdle() {
    std::unique_lock<std::mutex> lock(queueMutex);
    queueChanged.wait(lock, [this] { return !running || stopping || (queue.empty() && !delivering); });
}

size_t Dispatcher::activeSources() const {
    std::lock_guard<std::mutex> lock(sourcesMutex);
    return static_cast<size_t>(std::count_if(sources.begin(), sources.end(),
                                             [](const auto& entry) { return !entry.second->finished; }));
}

Dispatcher::Stats Dispatcher::stats() const {
    std::lock_guard<std::mutex> lock(queueMutex);
    return counters;
}

} // namespace MidiFlow
