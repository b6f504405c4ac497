// VolumeBackend.cpp
#include "VolumeBackend.hpp"
#include "Log.hpp"
#include "ProcessRunner.hpp"
#include <fmt/core.h>
#include <cctype>
#include <cmath>
#include <regex>
#include <sstream>

namespace MidiFlow {

CommandVolumeBackend::Tool CommandVolumeBackend::detectTool() {
    if (findExecutable("wpctl")) return Tool::Wpctl;
    if (findExecutable("pactl")) return Tool::Pactl;
    return Tool::None;
}

CommandVolumeBackend::CommandVolumeBackend(Tool t) : tool(t) {
    if (tool == Tool::None) {
        MIDIFLOW_WARN("no supported volume backend found; install PipeWire (wpctl) or PulseAudio (pactl)");
    }
}

std::string CommandVolumeBackend::name() const {
    switch (tool) {
        case Tool::Wpctl: return "wpctl";
        case Tool::Pactl: return "pactl";
        default: return "none";
    }
}

std::vector<AudioSink> CommandVolumeBackend::parseWpctlStatus(const std::string& output) {
    // Audio
    //  ├─ Sinks:
    //  │  *   48. Built-in Audio Analog Stereo        [vol: 0.40]
    //  ├─ Sources:
    static const std::regex entry(R"((\d+)\.\s+([^\[]+))");
    static const std::regex header(R"(([A-Za-z][A-Za-z ]*):\s*$)");
    std::vector<AudioSink> sinks;
    bool inAudio = false;
    bool inSinks = false;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        if (line.rfind("Audio", 0) == 0) { inAudio = true; inSinks = false; continue; }
        if (!line.empty() && std::isalpha(static_cast<unsigned char>(line[0]))) { inAudio = false; inSinks = false; continue; }
        std::smatch m;
        if (std::regex_search(line, m, header) && !std::regex_search(line, entry)) {
            inSinks = inAudio && m[1].str() == "Sinks";
            continue;
        }
        if (!inSinks || !std::regex_search(line, m, entry)) continue;
        std::string sinkName = m[2].str();
        while (!sinkName.empty() && std::isspace(static_cast<unsigned char>(sinkName.back()))) sinkName.pop_back();
        sinks.push_back({m[1].str(), sinkName});
    }
    return sinks;
}

std::vector<AudioSink> CommandVolumeBackend::parsePactlSinks(const std::string& output) {
    // 0	alsa_output.pci-0000_00_1f.3.analog-stereo	module-alsa-card.c	s16le 2ch 44100Hz	SUSPENDED
    std::vector<AudioSink> sinks;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        auto tab = line.find('\t');
        if (tab == std::string::npos) continue;
        auto next = line.find('\t', tab + 1);
        sinks.push_back({line.substr(0, tab), line.substr(tab + 1, next == std::string::npos ? std::string::npos : next - tab - 1)});
    }
    return sinks;
}

std::vector<AudioSink> CommandVolumeBackend::listSinks(int timeoutMs) {
    ProcessOptions options;
    options.timeoutMs = timeoutMs;
    if (tool == Tool::Wpctl) options.argv = {"wpctl", "status"};
    else if (tool == Tool::Pactl) options.argv = {"pactl", "list", "short", "sinks"};
    else return {};

    auto result = runProcess(options);
    if (!result.succeeded()) {
        MIDIFLOW_WARN("{} sink listing failed: {}", name(), result.error.empty() ? result.err : result.error);
        return {};
    }
    auto sinks = tool == Tool::Wpctl ? parseWpctlStatus(result.out) : parsePactlSinks(result.out);
    std::lock_guard<std::mutex> lock(cacheMutex);
    cachedSinks = sinks;
    cacheLoaded = true;
    return sinks;
}

std::optional<std::string> CommandVolumeBackend::findCached(const std::string& sink) const {
    for (const auto& s : cachedSinks) {
        if (s.id == sink || s.name == sink) return s.id;
    }
    return std::nullopt;
}

std::optional<std::string> CommandVolumeBackend::resolveSink(const std::string& sink, int timeoutMs) {
    if (sink.empty()) return std::string(tool == Tool::Wpctl ? "@DEFAULT_AUDIO_SINK@" : "@DEFAULT_SINK@");
    if (sink.front() == '@') return sink;
    {
        std::lock_guard<std::mutex> lock(cacheMutex);
        if (cacheLoaded) {
            if (auto id = findCached(sink)) return id;
        }
    }
    // Cache miss: the sink may have appeared since the last listing
    listSinks(timeoutMs);
    std::lock_guard<std::mutex> lock(cacheMutex);
    return findCached(sink);
}

VolumeResult CommandVolumeBackend::setLevel(const std::string& sink, double level, int timeoutMs) {
    if (tool == Tool::None) return {VolumeResult::Status::Failed, "no volume backend (wpctl or pactl) on PATH"};
    auto id = resolveSink(sink, timeoutMs);
    if (!id) return {VolumeResult::Status::SinkNotFound, fmt::format("unknown sink '{}'", sink)};

    ProcessOptions options;
    options.timeoutMs = timeoutMs;
    if (tool == Tool::Wpctl) {
        options.argv = {"wpctl", "set-volume", *id, fmt::format("{:.3f}", level)};
    } else {
        options.argv = {"pactl", "set-sink-volume", *id, fmt::format("{}%", static_cast<int>(std::lround(level * 100.0)))};
    }
    auto result = runProcess(options);
    if (result.timedOut) return {VolumeResult::Status::TimedOut, fmt::format("{} timed out", name())};
    if (!result.succeeded()) {
        return {VolumeResult::Status::Failed,
                result.error.empty() ? fmt::format("{} exited with {}: {}", name(), result.exitCode, result.err) : result.error};
    }
    return {};
}

std::unique_ptr<VolumeBackend> makeDefaultVolumeBackend() {
    return std::make_unique<CommandVolumeBackend>();
}

} // namespace MidiFlow
