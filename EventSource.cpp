// EventSource.cpp
#include "EventSource.hpp"
#include "FlowError.hpp"
#include "Log.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <stdexcept>
#include <unistd.h>

namespace MidiFlow {

// ---------------------------------------------------------------------------
// QueueEventSource
// ---------------------------------------------------------------------------

QueueEventSource::QueueEventSource(std::string device)
    : deviceId(std::move(device)), created(std::chrono::steady_clock::now()) {}

bool QueueEventSource::push(ControlEvent event) {
    event.device = deviceId;
    if (event.timestampMs <= 0.0) {
        event.timestampMs = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - created).count();
    }
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (closed) return false;
        pending.push_back(std::move(event));
    }
    available.notify_one();
    return true;
}

bool QueueEventSource::push(int channel, int control, double value, EventKind kind) {
    ControlEvent event;
    event.channel = channel;
    event.control = control;
    event.rawValue = value;
    event.kind = kind;
    return push(std::move(event));
}

std::optional<ControlEvent> QueueEventSource::next() {
    std::unique_lock<std::mutex> lock(mutex);
    available.wait(lock, [this] { return closed || !pending.empty(); });
    if (closed) return std::nullopt;
    ControlEvent event = std::move(pending.front());
    pending.pop_front();
    return event;
}

void QueueEventSource::close() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        closed = true;
        pending.clear();
    }
    available.notify_all();
}

// ---------------------------------------------------------------------------
// NdjsonEventSource
// ---------------------------------------------------------------------------

std::unique_ptr<NdjsonEventSource> NdjsonEventSource::open(const std::string& path, const std::string& device) {
    if (path == "-") return std::make_unique<NdjsonEventSource>(STDIN_FILENO, false, device);
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) throw std::runtime_error("cannot open event file " + path + ": " + std::strerror(errno));
    return std::make_unique<NdjsonEventSource>(fd, true, device);
}

NdjsonEventSource::NdjsonEventSource(int f, bool owns, std::string device)
    : fd(f), ownsFd(owns), deviceId(std::move(device)), created(std::chrono::steady_clock::now()) {}

NdjsonEventSource::~NdjsonEventSource() {
    if (ownsFd && fd >= 0) ::close(fd);
}

void NdjsonEventSource::close() {
    std::lock_guard<std::mutex> lock(closeMutex);
    closed = true;
}

bool NdjsonEventSource::readLine(std::string& line) {
    char chunk[4096];
    for (;;) {
        auto newline = buffer.find('\n');
        if (newline != std::string::npos) {
            line = buffer.substr(0, newline);
            buffer.erase(0, newline + 1);
            return true;
        }
        if (eof) {
            if (buffer.empty()) return false;
            line.swap(buffer);
            buffer.clear();
            return true;
        }
        {
            std::lock_guard<std::mutex> lock(closeMutex);
            if (closed) return false;
        }
        // Short poll slices so close() is noticed while waiting on stdin
        struct pollfd pfd = {fd, POLLIN, 0};
        int ready = ::poll(&pfd, 1, 100);
        if (ready < 0) {
            if (errno == EINTR) continue;
            MIDIFLOW_ERROR("event source {}: poll failed: {}", deviceId, std::strerror(errno));
            eof = true;
            continue;
        }
        if (ready == 0) continue;
        ssize_t n = ::read(fd, chunk, sizeof(chunk));
        if (n > 0) {
            buffer.append(chunk, static_cast<size_t>(n));
        } else if (n == 0) {
            eof = true;
        } else if (errno != EINTR && errno != EAGAIN) {
            MIDIFLOW_ERROR("event source {}: read failed: {}", deviceId, std::strerror(errno));
            eof = true;
        }
    }
}

std::optional<ControlEvent> NdjsonEventSource::next() {
    std::string line;
    while (readLine(line)) {
        ++lineNumber;
        auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') continue;
        try {
            auto json = nlohmann::json::parse(line);
            if (json.is_object() && !json.contains("device")) json["device"] = deviceId;
            ControlEvent event = eventFromJson(json);
            if (!json.contains("timestamp") || !json.at("timestamp").is_number()) {
                event.timestampMs =
                    std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - created).count();
            }
            return event;
        } catch (const nlohmann::json::exception& e) {
            ++malformed;
            MIDIFLOW_WARN("event source {} line {}: {}", deviceId, lineNumber, e.what());
        } catch (const FlowError& e) {
            ++malformed;
            MIDIFLOW_WARN("event source {} line {}: {}", deviceId, lineNumber, e.what());
        }
    }
    return std::nullopt;
}

} // namespace MidiFlow
