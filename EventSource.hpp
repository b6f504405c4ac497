// EventSource.hpp
//
// Event source adapters. Each adapter is one device: it yields normalized
// control events until it is exhausted or closed, and is read by its own
// producer thread in the Dispatcher.
#pragma once
#include "ControlEvent.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace MidiFlow {

class EventSource {
public:
    virtual ~EventSource() = default;
    virtual std::string device() const = 0;
    // Blocks until an event is available. Returns nullopt once the source is
    // exhausted or closed; it is not restartable.
    virtual std::optional<ControlEvent> next() = 0;
    // Makes a blocked next() return; idempotent
    virtual void close() = 0;
};

// In-process virtual device fed by push()
class QueueEventSource : public EventSource {
public:
    explicit QueueEventSource(std::string device);

    // Stamps the device id and, when the event has none, a timestamp in ms
    // since the source was created. Returns false once closed.
    bool push(ControlEvent event);
    bool push(int channel, int control, double value, EventKind kind = EventKind::Continuous);

    std::string device() const override { return deviceId; }
    std::optional<ControlEvent> next() override;
    void close() override;

private:
    std::string deviceId;
    std::chrono::steady_clock::time_point created;
    std::mutex mutex;
    std::condition_variable available;
    std::deque<ControlEvent> pending;
    bool closed = false;
};

// One JSON event per line (see eventFromJson) read from a file descriptor.
// Blank lines and lines starting with '#' are skipped; malformed lines are
// logged and skipped. Lines without "device" use the source's device id;
// lines without "timestamp" get milliseconds since the source was opened.
class NdjsonEventSource : public EventSource {
public:
    // "-" reads standard input
    static std::unique_ptr<NdjsonEventSource> open(const std::string& path, const std::string& device = "ndjson");

    NdjsonEventSource(int fd, bool ownsFd, std::string device);
    ~NdjsonEventSource() override;
    NdjsonEventSource(const NdjsonEventSource&) = delete;
    NdjsonEventSource& operator=(const NdjsonEventSource&) = delete;

    std::string device() const override { return deviceId; }
    std::optional<ControlEvent> next() override;
    void close() override;

    unsigned long long malformedLines() const { return malformed; }

private:
    bool readLine(std::string& line);

    int fd;
    bool ownsFd;
    std::string deviceId;
    std::chrono::steady_clock::time_point created;
    std::string buffer;
    bool eof = false;
    std::mutex closeMutex;
    bool closed = false;
    unsigned long long lineNumber = 0;
    unsigned long long malformed = 0;
};

} // namespace MidiFlow
