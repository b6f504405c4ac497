// ControlEvent.hpp
//
// Normalized control events as produced by event source adapters, and the
// (device, channel, control) identity used to bind them to graph ports.
#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <tuple>

namespace MidiFlow {

enum class EventKind { Continuous, Trigger };

const char* eventKindName(EventKind kind);

// Identity of one physical control on one device
struct ControlKey {
    std::string device;
    int channel = 0;
    int control = 0;

    bool operator<(const ControlKey& other) const {
        return std::tie(device, channel, control) < std::tie(other.device, other.channel, other.control);
    }
    bool operator==(const ControlKey& other) const {
        return device == other.device && channel == other.channel && control == other.control;
    }
    bool operator!=(const ControlKey& other) const { return !(*this == other); }
};

std::string toString(const ControlKey& key);

struct ControlEvent {
    std::string device;
    int channel = 0;
    int control = 0;
    double rawValue = 0.0;
    EventKind kind = EventKind::Continuous;
    double timestampMs = 0.0;

    ControlKey key() const { return ControlKey{device, channel, control}; }
};

// JSON form: {"device":"1","channel":1,"control":7,"value":64,
//             "kind":"continuous","timestamp":12.5}
// "kind" and "timestamp" are optional. Numeric devices are accepted and
// converted to their decimal string. Throws FlowError(InvalidConfig).
ControlEvent eventFromJson(const nlohmann::json& json);

nlohmann::json keyToJson(const ControlKey& key);
ControlKey keyFromJson(const nlohmann::json& json);

// Integer that fits an int; nullopt for other values and out-of-range numbers
std::optional<int> jsonToInt(const nlohmann::json& value);

} // namespace MidiFlow
