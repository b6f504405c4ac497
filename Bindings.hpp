// Bindings.hpp
//
// Binding table (control identity -> input port) and the learn-mode state
// machine that captures the next qualifying event into a binding.
//
// Conflict policy: a control key maps to exactly one port. Binding a key
// that is already bound moves it to the new port (last write wins). One
// port may be driven by several keys.
#pragma once
#include "ControlEvent.hpp"
#include "MidiFlowCore.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace MidiFlow {

struct Binding {
    ControlKey key;
    PortRef target;
};

class BindingTable {
public:
    // Returns the port the key was bound to before, if any
    std::optional<PortRef> bind(const ControlKey& key, const PortRef& target);
    bool unbind(const ControlKey& key);
    size_t unbindNode(NodeId node);
    size_t unbindPort(const PortRef& target);
    // Drops bindings whose target is no longer an input port of the graph
    size_t prune(const Graph& graph);
    void clear() { table.clear(); }

    std::optional<PortRef> resolve(const ControlKey& key) const;
    std::vector<Binding> bindings() const;
    std::vector<Binding> bindingsFor(NodeId node) const;
    size_t size() const { return table.size(); }

private:
    std::map<ControlKey, PortRef> table;
};

enum class LearnState { Idle, Learning };

class Learner {
public:
    // Enters Learning for `target`, whose declared type is `type`. When
    // `device` is set only events from that device qualify.
    // Throws LearnInProgress if already learning, TypeMismatch for string ports.
    void begin(const PortRef& target, ValueType type, const std::optional<std::string>& device = std::nullopt);
    void cancel();
    bool cancelIfTargets(NodeId node);
    bool cancelIfDevice(const std::string& device);

    LearnState state() const { return pending ? LearnState::Learning : LearnState::Idle; }
    std::optional<PortRef> target() const;

    // If learning and the event qualifies, returns the captured binding and
    // returns to Idle. Non-qualifying events leave the state untouched.
    std::optional<Binding> capture(const ControlEvent& event);

private:
    struct Pending {
        PortRef target;
        ValueType type;
        std::optional<std::string> device;
    };
    std::optional<Pending> pending;
};

} // namespace MidiFlow
