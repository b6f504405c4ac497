// NodeKinds.cpp
//
// Catalog, JSON configuration codec, port layout and pure evaluation of the
// node kinds.
#include "NodeKinds.hpp"
#include "CommandTemplate.hpp"
#include "ControlEvent.hpp"
#include "FlowError.hpp"
#include "LuaSandbox.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <cmath>
#include <set>

namespace MidiFlow {

const std::vector<NodeTemplate>& nodeCatalog() {
    static const std::vector<NodeTemplate> catalog = {
        {NodeKind::MidiInput, "midi.input", "MIDI Input", "Input",
         "Entry point for bound controller events; one port per control."},
        {NodeKind::ValueMap, "logic.mapper", "Value Mapper", "Processing",
         "Maps a raw controller range onto a target range with a curve."},
        {NodeKind::Volume, "action.volume", "Volume Control", "Action",
         "Sets the level of a PipeWire/PulseAudio sink."},
        {NodeKind::ShellCommand, "action.command", "Command Runner", "Action",
         "Runs a shell command rendered from a template."},
        {NodeKind::Script, "action.script", "Script Action", "Action",
         "Runs a sandboxed Lua snippet."},
    };
    return catalog;
}

const NodeTemplate& nodeTemplate(NodeKind kind) {
    for (const auto& t : nodeCatalog()) {
        if (t.kind == kind) return t;
    }
    throw FlowError(ErrorCode::NotFound, "no catalog entry for node kind");
}

std::optional<NodeKind> kindFromTypeId(const std::string& typeId) {
    for (const auto& t : nodeCatalog()) {
        if (t.typeId == typeId) return t.kind;
    }
    return std::nullopt;
}

NodeKind kindOf(const NodeConfig& config) {
    return static_cast<NodeKind>(config.index());
}

bool isActionKind(NodeKind kind) {
    return kind == NodeKind::Volume || kind == NodeKind::ShellCommand || kind == NodeKind::Script;
}

int actionTimeoutMs(const NodeConfig& config) {
    if (auto* v = std::get_if<VolumeConfig>(&config)) return v->timeoutMs;
    if (auto* s = std::get_if<ShellCommandConfig>(&config)) return s->timeoutMs;
    if (auto* sc = std::get_if<ScriptConfig>(&config)) return sc->timeoutMs;
    return 0;
}

bool suppressesRepeats(const NodeConfig& config) {
    if (auto* v = std::get_if<VolumeConfig>(&config)) return v->suppressRepeats;
    if (auto* s = std::get_if<ShellCommandConfig>(&config)) return s->suppressRepeats;
    if (auto* sc = std::get_if<ScriptConfig>(&config)) return sc->suppressRepeats;
    return false;
}

const char* valueTypeName(ValueType type) {
    switch (type) {
        case ValueType::Continuous: return "continuous";
        case ValueType::Trigger: return "trigger";
        case ValueType::String: return "string";
    }
    return "continuous";
}

std::optional<ValueType> valueTypeFromName(const std::string& name) {
    if (name == "continuous") return ValueType::Continuous;
    if (name == "trigger") return ValueType::Trigger;
    if (name == "string") return ValueType::String;
    return std::nullopt;
}

const char* curveName(Curve curve) {
    switch (curve) {
        case Curve::Linear: return "linear";
        case Curve::Log: return "log";
        case Curve::Exp: return "exp";
        case Curve::Step: return "step";
        case Curve::Piecewise: return "piecewise";
    }
    return "linear";
}

static std::optional<Curve> curveFromName(const std::string& name) {
    if (name == "linear") return Curve::Linear;
    if (name == "log") return Curve::Log;
    if (name == "exp") return Curve::Exp;
    if (name == "step") return Curve::Step;
    if (name == "piecewise") return Curve::Piecewise;
    return std::nullopt;
}

NodeConfig defaultConfig(NodeKind kind) {
    switch (kind) {
        case NodeKind::MidiInput: return MidiInputConfig{};
        case NodeKind::ValueMap: return ValueMapConfig{};
        case NodeKind::Volume: return VolumeConfig{};
        case NodeKind::ShellCommand: return ShellCommandConfig{};
        case NodeKind::Script: return ScriptConfig{};
    }
    throw FlowError(ErrorCode::InvalidConfig, "unknown node kind");
}

// ---------------------------------------------------------------------------
// JSON field readers. Absent fields keep their default.

[[noreturn]] static void invalid(const std::string& message) {
    throw FlowError(ErrorCode::InvalidConfig, message);
}

static void readNumber(const nlohmann::json& j, const char* key, double& out) {
    if (!j.contains(key)) return;
    if (!j.at(key).is_number()) invalid(fmt::format("'{}' must be a number", key));
    out = j.at(key).get<double>();
}

static void readInt(const nlohmann::json& j, const char* key, int& out) {
    if (!j.contains(key)) return;
    auto value = jsonToInt(j.at(key));
    if (!value) invalid(fmt::format("'{}' must be an integer", key));
    out = *value;
}

static void readBool(const nlohmann::json& j, const char* key, bool& out) {
    if (!j.contains(key)) return;
    if (!j.at(key).is_boolean()) invalid(fmt::format("'{}' must be a boolean", key));
    out = j.at(key).get<bool>();
}

static void readString(const nlohmann::json& j, const char* key, std::string& out) {
    if (!j.contains(key)) return;
    if (!j.at(key).is_string()) invalid(fmt::format("'{}' must be a string", key));
    out = j.at(key).get<std::string>();
}

NodeConfig parseConfig(NodeKind kind, const nlohmann::json& json) {
    if (!json.is_null() && !json.is_object()) invalid("node configuration must be a JSON object");
    const nlohmann::json j = json.is_null() ? nlohmann::json::object() : json;
    NodeConfig config = defaultConfig(kind);

    switch (kind) {
        case NodeKind::MidiInput: {
            auto& c = std::get<MidiInputConfig>(config);
            if (j.contains("controls")) {
                if (!j.at("controls").is_array()) invalid("'controls' must be an array");
                c.controls.clear();
                for (const auto& entry : j.at("controls")) {
                    MidiInputConfig::Control control;
                    if (entry.is_string()) {
                        control.name = entry.get<std::string>();
                    } else if (entry.is_object()) {
                        readString(entry, "name", control.name);
                        std::string type = valueTypeName(control.type);
                        readString(entry, "type", type);
                        auto vt = valueTypeFromName(type);
                        if (!vt) invalid(fmt::format("unknown port type '{}'", type));
                        control.type = *vt;
                    } else {
                        invalid("each control must be a name or an object");
                    }
                    c.controls.push_back(std::move(control));
                }
            }
            break;
        }
        case NodeKind::ValueMap: {
            auto& c = std::get<ValueMapConfig>(config);
            readNumber(j, "input_min", c.inMin);
            readNumber(j, "input_max", c.inMax);
            readNumber(j, "output_min", c.outMin);
            readNumber(j, "output_max", c.outMax);
            readInt(j, "steps", c.steps);
            readBool(j, "invert", c.invert);
            readBool(j, "round", c.round);
            std::string curve = curveName(c.curve);
            readString(j, "curve", curve);
            auto parsed = curveFromName(curve);
            if (!parsed) invalid(fmt::format("unknown curve '{}'", curve));
            c.curve = *parsed;
            if (j.contains("points")) {
                if (!j.at("points").is_array()) invalid("'points' must be an array of [x, y] pairs");
                for (const auto& p : j.at("points")) {
                    if (!p.is_array() || p.size() != 2 || !p[0].is_number() || !p[1].is_number()) {
                        invalid("'points' must be an array of [x, y] pairs");
                    }
                    c.points.emplace_back(p[0].get<double>(), p[1].get<double>());
                }
            }
            break;
        }
        case NodeKind::Volume: {
            auto& c = std::get<VolumeConfig>(config);
            readString(j, "sink", c.sink);
            readInt(j, "timeout_ms", c.timeoutMs);
            readBool(j, "suppress_repeats", c.suppressRepeats);
            break;
        }
        case NodeKind::ShellCommand: {
            auto& c = std::get<ShellCommandConfig>(config);
            readString(j, "command", c.command);
            readString(j, "cwd", c.cwd);
            readInt(j, "timeout_ms", c.timeoutMs);
            readBool(j, "suppress_repeats", c.suppressRepeats);
            break;
        }
        case NodeKind::Script: {
            auto& c = std::get<ScriptConfig>(config);
            readString(j, "script", c.source);
            readInt(j, "timeout_ms", c.timeoutMs);
            readBool(j, "suppress_repeats", c.suppressRepeats);
            if (j.contains("allowed_paths")) {
                if (!j.at("allowed_paths").is_array()) invalid("'allowed_paths' must be an array of strings");
                for (const auto& p : j.at("allowed_paths")) {
                    if (!p.is_string()) invalid("'allowed_paths' must be an array of strings");
                    c.allowedPaths.push_back(p.get<std::string>());
                }
            }
            break;
        }
    }

    validateConfig(config);
    return config;
}

nlohmann::json configToJson(const NodeConfig& config) {
    nlohmann::json j = nlohmann::json::object();
    switch (kindOf(config)) {
        case NodeKind::MidiInput: {
            const auto& c = std::get<MidiInputConfig>(config);
            j["controls"] = nlohmann::json::array();
            for (const auto& control : c.controls) {
                j["controls"].push_back({{"name", control.name}, {"type", valueTypeName(control.type)}});
            }
            break;
        }
        case NodeKind::ValueMap: {
            const auto& c = std::get<ValueMapConfig>(config);
            j["input_min"] = c.inMin;
            j["input_max"] = c.inMax;
            j["output_min"] = c.outMin;
            j["output_max"] = c.outMax;
            j["curve"] = curveName(c.curve);
            j["steps"] = c.steps;
            j["invert"] = c.invert;
            j["round"] = c.round;
            if (!c.points.empty()) {
                j["points"] = nlohmann::json::array();
                for (const auto& p : c.points) j["points"].push_back({p.first, p.second});
            }
            break;
        }
        case NodeKind::Volume: {
            const auto& c = std::get<VolumeConfig>(config);
            j["sink"] = c.sink;
            j["timeout_ms"] = c.timeoutMs;
            j["suppress_repeats"] = c.suppressRepeats;
            break;
        }
        case NodeKind::ShellCommand: {
            const auto& c = std::get<ShellCommandConfig>(config);
            j["command"] = c.command;
            j["cwd"] = c.cwd;
            j["timeout_ms"] = c.timeoutMs;
            j["suppress_repeats"] = c.suppressRepeats;
            break;
        }
        case NodeKind::Script: {
            const auto& c = std::get<ScriptConfig>(config);
            j["script"] = c.source;
            j["timeout_ms"] = c.timeoutMs;
            j["allowed_paths"] = c.allowedPaths;
            j["suppress_repeats"] = c.suppressRepeats;
            break;
        }
    }
    return j;
}

static void validateTimeout(int timeoutMs) {
    if (timeoutMs <= 0 || timeoutMs > 600000) {
        invalid(fmt::format("timeout_ms must be within 1..600000, got {}", timeoutMs));
    }
}

void validateConfig(const NodeConfig& config) {
    switch (kindOf(config)) {
        case NodeKind::MidiInput: {
            const auto& c = std::get<MidiInputConfig>(config);
            if (c.controls.empty()) invalid("a MIDI input needs at least one control");
            std::set<std::string> seen;
            for (const auto& control : c.controls) {
                if (control.name.empty()) invalid("control names must not be empty");
                if (control.type == ValueType::String) invalid("controls carry numbers, not strings");
                if (!seen.insert(control.name).second) invalid(fmt::format("duplicate control '{}'", control.name));
            }
            break;
        }
        case NodeKind::ValueMap: {
            const auto& c = std::get<ValueMapConfig>(config);
            if (!std::isfinite(c.inMin) || !std::isfinite(c.inMax) || !std::isfinite(c.outMin) || !std::isfinite(c.outMax)) {
                invalid("mapping bounds must be finite");
            }
            if (c.inMax == c.inMin) invalid("input_min and input_max must differ");
            if (c.curve == Curve::Step && c.steps < 1) invalid("steps must be at least 1");
            if (c.curve == Curve::Piecewise) {
                if (c.points.size() < 2) invalid("a piecewise curve needs at least two points");
                for (size_t i = 0; i < c.points.size(); ++i) {
                    const auto& p = c.points[i];
                    if (p.first < 0.0 || p.first > 1.0) invalid("piecewise x values must lie in [0, 1]");
                    if (!std::isfinite(p.second)) invalid("piecewise y values must be finite");
                    if (i > 0 && p.first <= c.points[i - 1].first) invalid("piecewise x values must increase");
                }
            }
            break;
        }
        case NodeKind::Volume: {
            validateTimeout(std::get<VolumeConfig>(config).timeoutMs);
            break;
        }
        case NodeKind::ShellCommand: {
            const auto& c = std::get<ShellCommandConfig>(config);
            validateTimeout(c.timeoutMs);
            if (c.command.empty()) invalid("command must not be empty");
            std::string error;
            if (!checkCommandTemplate(c.command, error)) invalid("bad command template: " + error);
            break;
        }
        case NodeKind::Script: {
            const auto& c = std::get<ScriptConfig>(config);
            validateTimeout(c.timeoutMs);
            if (c.source.empty()) invalid("script must not be empty");
            if (auto err = LuaSandbox::checkSyntax(c.source)) invalid("script does not compile: " + *err);
            for (const auto& p : c.allowedPaths) {
                if (p.empty()) invalid("allowed paths must not be empty");
            }
            break;
        }
    }
}

std::vector<PortSpec> portsFor(const NodeConfig& config) {
    std::vector<PortSpec> ports;
    switch (kindOf(config)) {
        case NodeKind::MidiInput:
            for (const auto& control : std::get<MidiInputConfig>(config).controls) {
                ports.push_back({control.name, PortDirection::Input, control.type});
            }
            for (const auto& control : std::get<MidiInputConfig>(config).controls) {
                ports.push_back({control.name, PortDirection::Output, control.type});
            }
            break;
        case NodeKind::ValueMap:
            ports.push_back({"in", PortDirection::Input, ValueType::Continuous});
            ports.push_back({"out", PortDirection::Output, ValueType::Continuous});
            break;
        case NodeKind::Volume:
            ports.push_back({"level", PortDirection::Input, ValueType::Continuous});
            break;
        case NodeKind::ShellCommand:
        case NodeKind::Script:
            ports.push_back({"trigger", PortDirection::Input, ValueType::Trigger});
            ports.push_back({"value", PortDirection::Input, ValueType::Continuous});
            break;
    }
    return ports;
}

static double applyCurve(const ValueMapConfig& c, double x) {
    static const double e = std::exp(1.0);
    switch (c.curve) {
        case Curve::Linear:
            return x;
        case Curve::Log:
            return std::log1p(x * (e - 1.0));
        case Curve::Exp:
            return (std::exp(x) - 1.0) / (e - 1.0);
        case Curve::Step: {
            const double steps = static_cast<double>(std::max(1, c.steps));
            return std::round(x * steps) / steps;
        }
        case Curve::Piecewise: {
            const auto& pts = c.points;
            if (pts.empty()) return x;
            if (x <= pts.front().first) return pts.front().second;
            if (x >= pts.back().first) return pts.back().second;
            for (size_t i = 1; i < pts.size(); ++i) {
                if (x <= pts[i].first) {
                    const auto& a = pts[i - 1];
                    const auto& b = pts[i];
                    const double t = (x - a.first) / (b.first - a.first);
                    return a.second + t * (b.second - a.second);
                }
            }
            return pts.back().second;
        }
    }
    return x;
}

double mapValue(const ValueMapConfig& c, double raw) {
    if (!std::isfinite(raw)) raw = c.inMin;
    double x = (raw - c.inMin) / (c.inMax - c.inMin);
    x = std::clamp(x, 0.0, 1.0);
    if (c.invert) x = 1.0 - x;
    x = applyCurve(c, x);
    double y = c.outMin + x * (c.outMax - c.outMin);
    y = std::clamp(y, std::min(c.outMin, c.outMax), std::max(c.outMin, c.outMax));
    if (c.round) y = std::round(y);
    return y;
}

void evaluateNode(const NodeConfig& config,
                  const std::vector<Value>& inputs,
                  const std::vector<bool>& inputWritten,
                  std::vector<Value>& outputs,
                  std::vector<bool>& outputWritten) {
    outputWritten.assign(outputs.size(), false);
    switch (kindOf(config)) {
        case NodeKind::MidiInput:
            // Pass-through: control i feeds output i
            for (size_t i = 0; i < inputs.size() && i < outputs.size(); ++i) {
                if (!inputWritten[i]) continue;
                outputs[i] = inputs[i];
                outputWritten[i] = true;
            }
            break;
        case NodeKind::ValueMap:
            if (!inputs.empty() && inputWritten[0] && !outputs.empty()) {
                if (auto* raw = std::get_if<double>(&inputs[0])) {
                    outputs[0] = mapValue(std::get<ValueMapConfig>(config), *raw);
                    outputWritten[0] = true;
                }
            }
            break;
        default:
            // Action kinds have no outputs
            break;
    }
}

bool valuesEqual(const Value& a, const Value& b) {
    return a == b;
}

std::string valueToString(const Value& v) {
    if (auto* d = std::get_if<double>(&v)) {
        if (std::floor(*d) == *d && std::fabs(*d) < 1e15) return fmt::format("{}", static_cast<long long>(*d));
        return fmt::format("{:.6g}", *d);
    }
    if (auto* s = std::get_if<std::string>(&v)) return *s;
    return "";
}

nlohmann::json valueToJson(const Value& v) {
    if (auto* d = std::get_if<double>(&v)) return *d;
    if (auto* s = std::get_if<std::string>(&v)) return *s;
    return nullptr;
}

} // namespace MidiFlow
