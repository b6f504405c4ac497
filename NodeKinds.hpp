// NodeKinds.hpp
//
// The closed set of node kinds. Each kind carries its own configuration
// payload inside the NodeConfig variant, declares its ports from that
// configuration, and has a pure evaluation function used by the evaluator.
// Action kinds (Volume, ShellCommand, Script) have no outputs; their effect
// runs in the action sandbox.
#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace MidiFlow {

enum class NodeKind { MidiInput, ValueMap, Volume, ShellCommand, Script };
enum class PortDirection { Input, Output };
enum class ValueType { Continuous, Trigger, String };

// Scalar value that can sit on a port. Continuous and trigger ports carry a
// double; monostate means "never written".
using Value = std::variant<std::monostate, double, std::string>;

struct PortSpec {
    std::string name;
    PortDirection direction;
    ValueType type;
};

// One input/output port pair per configured control. The input is the
// binding target, the output of the same name feeds the graph.
struct MidiInputConfig {
    struct Control {
        std::string name;
        ValueType type = ValueType::Continuous;
    };
    std::vector<Control> controls{{"value", ValueType::Continuous}};
};

enum class Curve { Linear, Log, Exp, Step, Piecewise };

struct ValueMapConfig {
    double inMin = 0.0;
    double inMax = 127.0;
    double outMin = 0.0;
    double outMax = 1.0;
    Curve curve = Curve::Linear;
    int steps = 8;
    // Normalized (x, y) breakpoints for Curve::Piecewise, x strictly increasing
    std::vector<std::pair<double, double>> points;
    bool invert = false;
    bool round = false;
};

struct VolumeConfig {
    std::string sink; // empty selects the default sink
    int timeoutMs = 2000;
    bool suppressRepeats = false;
};

struct ShellCommandConfig {
    std::string command; // template, e.g. "notify-send 'level {value}'"
    std::string cwd;
    int timeoutMs = 5000;
    bool suppressRepeats = false;
};

struct ScriptConfig {
    std::string source; // Lua
    int timeoutMs = 1000;
    std::vector<std::string> allowedPaths; // directories readable through context.read_file
    bool suppressRepeats = false;
};

using NodeConfig = std::variant<MidiInputConfig, ValueMapConfig, VolumeConfig, ShellCommandConfig, ScriptConfig>;

// Catalog entry describing how a kind is presented and persisted
struct NodeTemplate {
    NodeKind kind;
    std::string typeId; // persisted type string, e.g. "logic.mapper"
    std::string title;
    std::string category;
    std::string description;
};

const std::vector<NodeTemplate>& nodeCatalog();
const NodeTemplate& nodeTemplate(NodeKind kind);
std::optional<NodeKind> kindFromTypeId(const std::string& typeId);

NodeKind kindOf(const NodeConfig& config);
bool isActionKind(NodeKind kind);
int actionTimeoutMs(const NodeConfig& config);
bool suppressesRepeats(const NodeConfig& config);

const char* valueTypeName(ValueType type);
std::optional<ValueType> valueTypeFromName(const std::string& name);
const char* curveName(Curve curve);

NodeConfig defaultConfig(NodeKind kind);

// Builds a typed configuration from JSON, starting from the kind's defaults.
// Throws FlowError(InvalidConfig) when a field has the wrong type or the
// resulting configuration is not usable.
NodeConfig parseConfig(NodeKind kind, const nlohmann::json& json);
nlohmann::json configToJson(const NodeConfig& config);

// Throws FlowError(InvalidConfig) describing the first problem found.
void validateConfig(const NodeConfig& config);

std::vector<PortSpec> portsFor(const NodeConfig& config);

// Clamped mapping of raw into [outMin, outMax]. Pure: equal inputs give
// bit-identical outputs.
double mapValue(const ValueMapConfig& config, double raw);

// Evaluates one node. `inputWritten[i]` tells which inputs were written in
// the current pass; the function fills `outputs` and sets `outputWritten`
// for every output it produced.
void evaluateNode(const NodeConfig& config,
                  const std::vector<Value>& inputs,
                  const std::vector<bool>& inputWritten,
                  std::vector<Value>& outputs,
                  std::vector<bool>& outputWritten);

bool valuesEqual(const Value& a, const Value& b);
std::string valueToString(const Value& v);
nlohmann::json valueToJson(const Value& v);

} // namespace MidiFlow
