// Bindings.cpp
#include "Bindings.hpp"
#include "FlowError.hpp"
#include "Log.hpp"

namespace MidiFlow {

std::optional<PortRef> BindingTable::bind(const ControlKey& key, const PortRef& target) {
    std::optional<PortRef> previous;
    auto it = table.find(key);
    if (it != table.end()) {
        previous = it->second;
        it->second = target;
    } else {
        table.emplace(key, target);
    }
    return previous;
}

bool BindingTable::unbind(const ControlKey& key) {
    return table.erase(key) > 0;
}

size_t BindingTable::unbindNode(NodeId node) {
    size_t removed = 0;
    for (auto it = table.begin(); it != table.end();) {
        if (it->second.node == node) {
            it = table.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t BindingTable::unbindPort(const PortRef& target) {
    size_t removed = 0;
    for (auto it = table.begin(); it != table.end();) {
        if (it->second == target) {
            it = table.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t BindingTable::prune(const Graph& graph) {
    size_t removed = 0;
    for (auto it = table.begin(); it != table.end();) {
        if (!graph.findInput(it->second)) {
            MIDIFLOW_DEBUG("dropping binding {} -> {}", toString(it->first), toString(it->second));
            it = table.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::optional<PortRef> BindingTable::resolve(const ControlKey& key) const {
    auto it = table.find(key);
    if (it == table.end()) return std::nullopt;
    return it->second;
}

std::vector<Binding> BindingTable::bindings() const {
    std::vector<Binding> out;
    out.reserve(table.size());
    for (const auto& entry : table) out.push_back({entry.first, entry.second});
    return out;
}

std::vector<Binding> BindingTable::bindingsFor(NodeId node) const {
    std::vector<Binding> out;
    for (const auto& entry : table) {
        if (entry.second.node == node) out.push_back({entry.first, entry.second});
    }
    return out;
}

// ---------------------------------------------------------------------------
// Learner
// ---------------------------------------------------------------------------

void Learner::begin(const PortRef& target, ValueType type, const std::optional<std::string>& device) {
    if (pending) {
        throw FlowError(ErrorCode::LearnInProgress,
                        "already learning for " + toString(pending->target));
    }
    if (type == ValueType::String) {
        throw FlowError(ErrorCode::TypeMismatch, toString(target) + " is a string port and cannot be learned");
    }
    pending = Pending{target, type, device};
}

void Learner::cancel() {
    pending.reset();
}

bool Learner::cancelIfTargets(NodeId node) {
    if (!pending || pending->target.node != node) return false;
    pending.reset();
    return true;
}

bool Learner::cancelIfDevice(const std::string& device) {
    if (!pending || !pending->device || *pending->device != device) return false;
    pending.reset();
    return true;
}

std::optional<PortRef> Learner::target() const {
    if (!pending) return std::nullopt;
    return pending->target;
}

std::optional<Binding> Learner::capture(const ControlEvent& event) {
    if (!pending) return std::nullopt;
    if (pending->device && *pending->device != event.device) return std::nullopt;
    const bool wantsTrigger = pending->type == ValueType::Trigger;
    if (wantsTrigger != (event.kind == EventKind::Trigger)) return std::nullopt;

    Binding binding{event.key(), pending->target};
    pending.reset();
    return binding;
}

} // namespace MidiFlow
