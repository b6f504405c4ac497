// ControlEvent.cpp
#include "ControlEvent.hpp"
#include "FlowError.hpp"
#include <fmt/core.h>
#include <cstdint>
#include <limits>

namespace MidiFlow {

const char* eventKindName(EventKind kind) {
    return kind == EventKind::Trigger ? "trigger" : "continuous";
}

std::string toString(const ControlKey& key) {
    return fmt::format("{}/ch{}/cc{}", key.device, key.channel, key.control);
}

std::optional<int> jsonToInt(const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        const auto v = value.get<std::uint64_t>();
        if (v > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) return std::nullopt;
        return static_cast<int>(v);
    }
    if (value.is_number_integer()) {
        const auto v = value.get<std::int64_t>();
        if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) return std::nullopt;
        return static_cast<int>(v);
    }
    return std::nullopt;
}

static std::string deviceFromJson(const nlohmann::json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number_integer()) return v.dump();
    throw FlowError(ErrorCode::InvalidConfig, "event device must be a string or an integer");
}

ControlKey keyFromJson(const nlohmann::json& json) {
    if (!json.is_object() || !json.contains("device") || !json.contains("channel") || !json.contains("control")) {
        throw FlowError(ErrorCode::InvalidConfig, "control key requires device, channel and control");
    }
    ControlKey key;
    key.device = deviceFromJson(json.at("device"));
    auto channel = jsonToInt(json.at("channel"));
    auto control = jsonToInt(json.at("control"));
    if (!channel || !control) {
        throw FlowError(ErrorCode::InvalidConfig, "control key channel and control must be integers");
    }
    key.channel = *channel;
    key.control = *control;
    return key;
}

nlohmann::json keyToJson(const ControlKey& key) {
    return nlohmann::json{{"device", key.device}, {"channel", key.channel}, {"control", key.control}};
}

ControlEvent eventFromJson(const nlohmann::json& json) {
    ControlKey key = keyFromJson(json);
    ControlEvent event;
    event.device = key.device;
    event.channel = key.channel;
    event.control = key.control;
    if (!json.contains("value") || !json.at("value").is_number()) {
        throw FlowError(ErrorCode::InvalidConfig, "event value must be a number");
    }
    event.rawValue = json.at("value").get<double>();
    if (json.contains("kind")) {
        if (!json.at("kind").is_string()) throw FlowError(ErrorCode::InvalidConfig, "event kind must be a string");
        const auto kind = json.at("kind").get<std::string>();
        if (kind == "trigger") event.kind = EventKind::Trigger;
        else if (kind == "continuous") event.kind = EventKind::Continuous;
        else throw FlowError(ErrorCode::InvalidConfig, "unknown event kind '" + kind + "'");
    }
    if (json.contains("timestamp") && json.at("timestamp").is_number()) {
        event.timestampMs = json.at("timestamp").get<double>();
    }
    return event;
}

} // namespace MidiFlow
