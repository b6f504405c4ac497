// FlowEngine.cpp
#include "FlowEngine.hpp"
#include "FlowError.hpp"
#include "Log.hpp"
#include "Workspace.hpp"
#include <fmt/core.h>

namespace MidiFlow {

FlowEngine::FlowEngine(ActionSandbox& s, std::string workspaceId)
    : evaluator(graph), sandbox(s), wsId(std::move(workspaceId)) {}

// ---------------------------------------------------------------------------
// Graph edits
// ---------------------------------------------------------------------------

NodeId FlowEngine::addNode(NodeKind kind, const nlohmann::json& config, const std::string& title) {
    NodeConfig parsed = parseConfig(kind, config);
    std::lock_guard<std::mutex> lock(mutex);
    NodeId id = graph.addNode(std::move(parsed), title);
    MIDIFLOW_DEBUG("added node {} ({})", id, nodeTemplate(kind).typeId);
    return id;
}

NodeId FlowEngine::addNode(const std::string& typeId, const nlohmann::json& config, const std::string& title) {
    auto kind = kindFromTypeId(typeId);
    if (!kind) throw FlowError(ErrorCode::InvalidConfig, fmt::format("unknown node type '{}'", typeId));
    return addNode(*kind, config, title);
}

EdgeId FlowEngine::connect(const PortRef& from, const PortRef& to) {
    std::lock_guard<std::mutex> lock(mutex);
    return graph.connect(from, to);
}

void FlowEngine::disconnect(EdgeId edge) {
    std::lock_guard<std::mutex> lock(mutex);
    graph.disconnect(edge);
}

void FlowEngine::removeNode(NodeId id) {
    std::lock_guard<std::mutex> lock(mutex);
    graph.removeNode(id);
    if (size_t dropped = bindingTable.unbindNode(id)) {
        MIDIFLOW_INFO("removed {} binding(s) to deleted node {}", dropped, id);
        ++stateRevision;
    }
    if (learner.cancelIfTargets(id)) MIDIFLOW_INFO("learning cancelled: node {} was removed", id);
}

void FlowEngine::setNodeConfig(NodeId id, const nlohmann::json& config) {
    std::lock_guard<std::mutex> lock(mutex);
    NodeConfig parsed = parseConfig(graph.node(id).kind(), config);
    graph.setNodeConfig(id, std::move(parsed));
    if (size_t dropped = bindingTable.prune(graph)) {
        MIDIFLOW_INFO("removed {} binding(s) to vanished ports of node {}", dropped, id);
        ++stateRevision;
    }
    if (auto target = learner.target()) {
        const Port* port = graph.findInput(*target);
        if (!port || port->type == ValueType::String) {
            learner.cancel();
            MIDIFLOW_INFO("learning cancelled: {} no longer exists", toString(*target));
        }
    }
}

void FlowEngine::setNodeTitle(NodeId id, const std::string& title) {
    std::lock_guard<std::mutex> lock(mutex);
    graph.setNodeTitle(id, title);
}

// ---------------------------------------------------------------------------
// Bindings and learning
// ---------------------------------------------------------------------------

const Port& FlowEngine::requireBindableInput(const PortRef& target) const {
    const Port* port = graph.findInput(target);
    if (!port) throw FlowError(ErrorCode::NotFound, fmt::format("no input port {}", toString(target)));
    if (port->type == ValueType::String) {
        throw FlowError(ErrorCode::TypeMismatch, fmt::format("{} is a string port and cannot be bound", toString(target)));
    }
    return *port;
}

void FlowEngine::bind(const ControlKey& key, const PortRef& target) {
    std::lock_guard<std::mutex> lock(mutex);
    requireBindableInput(target);
    auto previous = bindingTable.bind(key, target);
    if (previous && *previous != target) {
        MIDIFLOW_INFO("{} rebound from {} to {}", toString(key), toString(*previous), toString(target));
    }
    ++stateRevision;
}

bool FlowEngine::unbind(const ControlKey& key) {
    std::lock_guard<std::mutex> lock(mutex);
    if (!bindingTable.unbind(key)) return false;
    ++stateRevision;
    return true;
}

std::vector<Binding> FlowEngine::bindings() const {
    std::lock_guard<std::mutex> lock(mutex);
    return bindingTable.bindings();
}

void FlowEngine::beginLearn(const PortRef& target, const std::optional<std::string>& device) {
    std::lock_guard<std::mutex> lock(mutex);
    if (learner.state() == LearnState::Learning) {
        throw FlowError(ErrorCode::LearnInProgress, fmt::format("already learning for {}", toString(*learner.target())));
    }
    const Port& port = requireBindableInput(target);
    learner.begin(target, port.type, device);
    MIDIFLOW_INFO("learning {}{}", toString(target), device ? " from device " + *device : std::string());
}

void FlowEngine::cancelLearn() {
    std::lock_guard<std::mutex> lock(mutex);
    learner.cancel();
}

LearnState FlowEngine::learnState() const {
    std::lock_guard<std::mutex> lock(mutex);
    return learner.state();
}

std::optional<PortRef> FlowEngine::learnTarget() const {
    std::lock_guard<std::mutex> lock(mutex);
    return learner.target();
}

void FlowEngine::deviceClosed(const std::string& device) {
    std::lock_guard<std::mutex> lock(mutex);
    if (learner.cancelIfDevice(device)) MIDIFLOW_INFO("learning cancelled: device {} closed", device);
}

// ---------------------------------------------------------------------------
// Profiles
// ---------------------------------------------------------------------------

std::string FlowEngine::captureProfile(const std::string& name, NodeId midiNode) {
    std::lock_guard<std::mutex> lock(mutex);
    const Profile& profile = profileStore.capture(name, graph, bindingTable, midiNode);
    ++stateRevision;
    return profile.id;
}

size_t FlowEngine::applyProfile(const std::string& profileId, NodeId midiNode) {
    std::lock_guard<std::mutex> lock(mutex);
    size_t applied = profileStore.apply(profileId, graph, bindingTable, midiNode);
    if (applied > 0) ++stateRevision;
    return applied;
}

bool FlowEngine::removeProfile(const std::string& profileId) {
    std::lock_guard<std::mutex> lock(mutex);
    if (!profileStore.remove(profileId)) return false;
    ++stateRevision;
    return true;
}

std::vector<Profile> FlowEngine::profiles() const {
    std::lock_guard<std::mutex> lock(mutex);
    return profileStore.profiles();
}

// ---------------------------------------------------------------------------
// Events
// ---------------------------------------------------------------------------

DeliveryResult FlowEngine::deliver(const ControlEvent& event) {
    DeliveryResult result;
    std::lock_guard<std::mutex> lock(mutex);
    ++counters.eventsDelivered;

    if (auto learned = learner.capture(event)) {
        auto previous = bindingTable.bind(learned->key, learned->target);
        if (previous && *previous != learned->target) {
            MIDIFLOW_INFO("learned {} -> {} (was bound to {})", toString(learned->key), toString(learned->target),
                          toString(*previous));
        } else {
            MIDIFLOW_INFO("learned {} -> {}", toString(learned->key), toString(learned->target));
        }
        ++stateRevision;
        ++counters.eventsLearned;
        result.status = DeliveryResult::Status::Learned;
        result.learned = std::move(learned);
        return result;
    }

    auto target = bindingTable.resolve(event.key());
    if (!target) {
        MIDIFLOW_DEBUG("unbound event {} value {}", toString(event.key()), event.rawValue);
        ++counters.eventsUnbound;
        return result;
    }

    auto requests = evaluator.propagate(*target, EventContext{event, wsId});
    result.status = DeliveryResult::Status::Dispatched;
    for (auto& request : requests) {
        if (sandbox.submit(std::move(request))) ++result.actionsSubmitted;
        else ++result.actionsRejected;
    }
    counters.actionsSubmitted += result.actionsSubmitted;
    counters.actionsRejected += result.actionsRejected;
    return result;
}

// ---------------------------------------------------------------------------
// Snapshot
// ---------------------------------------------------------------------------

nlohmann::json FlowEngine::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex);
    return workspaceToJson(wsId, graph, bindingTable, profileStore);
}

void FlowEngine::restore(const nlohmann::json& document) {
    WorkspaceData data = parseWorkspace(document);
    {
        // Edge consistency is only known once the nodes exist
        Graph scratch;
        BindingTable scratchBindings;
        ProfileStore scratchProfiles;
        applyWorkspace(data, scratch, scratchBindings, scratchProfiles);
    }
    std::lock_guard<std::mutex> lock(mutex);
    applyWorkspace(data, graph, bindingTable, profileStore);
    learner.cancel();
    if (!data.workspaceId.empty()) wsId = data.workspaceId;
    ++stateRevision;
    MIDIFLOW_INFO("workspace '{}' restored: {} nodes, {} connections, {} bindings, {} profiles", wsId,
                  graph.nodeCount(), graph.edgeCount(), bindingTable.size(), profileStore.profiles().size());
}

unsigned long long FlowEngine::revision() const {
    std::lock_guard<std::mutex> lock(mutex);
    return graph.revision() + stateRevision;
}

std::string FlowEngine::workspaceId() const {
    std::lock_guard<std::mutex> lock(mutex);
    return wsId;
}

FlowEngine::Stats FlowEngine::stats() const {
    std::lock_guard<std::mutex> lock(mutex);
    Stats s = counters;
    s.eval = evaluator.perfStats();
    return s;
}

} // namespace MidiFlow
