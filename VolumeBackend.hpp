// VolumeBackend.hpp
//
// Audio sink control used by Volume nodes. The production backend drives
// PipeWire through wpctl or PulseAudio through pactl, whichever is on PATH.
#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace MidiFlow {

struct AudioSink {
    std::string id;
    std::string name;
};

struct VolumeResult {
    enum class Status { Ok, SinkNotFound, Failed, TimedOut };
    Status status = Status::Ok;
    std::string detail;

    bool ok() const { return status == Status::Ok; }
};

class VolumeBackend {
public:
    virtual ~VolumeBackend() = default;
    virtual std::string name() const = 0;
    virtual std::vector<AudioSink> listSinks(int timeoutMs) = 0;
    // `sink` is a sink id or name; empty selects the default sink.
    // `level` is already clamped to [0, 1].
    virtual VolumeResult setLevel(const std::string& sink, double level, int timeoutMs) = 0;
};

class CommandVolumeBackend : public VolumeBackend {
public:
    enum class Tool { None, Wpctl, Pactl };

    // Picks wpctl, then pactl, from PATH
    static Tool detectTool();
    explicit CommandVolumeBackend(Tool tool = detectTool());

    std::string name() const override;
    std::vector<AudioSink> listSinks(int timeoutMs) override;
    VolumeResult setLevel(const std::string& sink, double level, int timeoutMs) override;

    // Parsers for the listing commands' output
    static std::vector<AudioSink> parseWpctlStatus(const std::string& output);
    static std::vector<AudioSink> parsePactlSinks(const std::string& output);

private:
    std::optional<std::string> resolveSink(const std::string& sink, int timeoutMs);
    std::optional<std::string> findCached(const std::string& sink) const;

    Tool tool;
    std::mutex cacheMutex;
    std::vector<AudioSink> cachedSinks;
    bool cacheLoaded = false;
};

std::unique_ptr<VolumeBackend> makeDefaultVolumeBackend();

} // namespace MidiFlow
