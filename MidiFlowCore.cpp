// MidiFlowCore.cpp
//
// Graph model implementation: arena bookkeeping, edit validation, cascade on
// removal and the cached topological order (Kahn's algorithm with a
// creation-order tie break).
#include "MidiFlowCore.hpp"
#include "FlowError.hpp"
#include "Log.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <functional>
#include <queue>

namespace MidiFlow {

std::string toString(const PortRef& ref) {
    return fmt::format("{}.{}", ref.node, ref.port);
}

int Node::inputIndex(const std::string& name) const {
    for (size_t i = 0; i < inputs.size(); ++i) {
        if (inputs[i].name == name) return static_cast<int>(i);
    }
    return -1;
}

int Node::outputIndex(const std::string& name) const {
    for (size_t i = 0; i < outputs.size(); ++i) {
        if (outputs[i].name == name) return static_cast<int>(i);
    }
    return -1;
}

// ---------------------------------------------------------------------------
// Nodes
// ---------------------------------------------------------------------------

void Graph::buildPorts(Node& node) {
    std::vector<Port> inputs;
    std::vector<Port> outputs;
    for (const auto& decl : portsFor(node.config)) {
        Port port{decl.name, decl.direction, decl.type, Value{}};
        // Keep the cached value of a port that survives a reconfiguration
        const auto& previous = decl.direction == PortDirection::Input ? node.inputs : node.outputs;
        for (const auto& old : previous) {
            if (old.name == decl.name && old.type == decl.type) port.value = old.value;
        }
        (decl.direction == PortDirection::Input ? inputs : outputs).push_back(std::move(port));
    }
    node.inputs = std::move(inputs);
    node.outputs = std::move(outputs);
}

NodeId Graph::addNode(NodeKind kind, const nlohmann::json& config, const std::string& title) {
    return addNode(parseConfig(kind, config), title);
}

NodeId Graph::addNode(NodeConfig config, const std::string& title) {
    if (nodes.empty()) nodes.emplace_back();
    const NodeId id = static_cast<NodeId>(nodes.size());
    restoreNode(id, std::move(config), title);
    return id;
}

void Graph::restoreNode(NodeId id, NodeConfig config, const std::string& title) {
    if (id <= 0) throw FlowError(ErrorCode::InvalidConfig, fmt::format("invalid node id {}", id));
    if (nodes.empty()) nodes.emplace_back();
    if (static_cast<size_t>(id) < nodes.size()) {
        throw FlowError(ErrorCode::InvalidConfig, fmt::format("node id {} is not newer than existing nodes", id));
    }
    validateConfig(config);
    nodes.resize(static_cast<size_t>(id) + 1);

    Node node;
    node.id = id;
    node.title = title.empty() ? nodeTemplate(kindOf(config)).title : title;
    node.config = std::move(config);
    buildPorts(node);
    nodes[id] = std::move(node);
    ++liveNodes;
    structureChanged({GraphChangeType::NodeAdded, id, 0});
}

void Graph::removeNode(NodeId id) {
    Node& node = requireNode(id);
    std::vector<EdgeId> touching = node.incoming;
    touching.insert(touching.end(), node.outgoing.begin(), node.outgoing.end());
    for (EdgeId e : touching) eraseEdge(e);
    nodes[id].reset();
    --liveNodes;
    structureChanged({GraphChangeType::NodeRemoved, id, 0});
}

void Graph::setNodeConfig(NodeId id, const nlohmann::json& config) {
    Node& node = requireNode(id);
    setNodeConfig(id, parseConfig(node.kind(), config));
}

void Graph::setNodeConfig(NodeId id, NodeConfig config) {
    Node& node = requireNode(id);
    if (kindOf(config) != node.kind()) {
        throw FlowError(ErrorCode::InvalidConfig, "a node's kind cannot change");
    }
    validateConfig(config);

    // Edges whose port vanished or changed type are dropped with the edit
    const auto specs = portsFor(config);
    auto survives = [&](const std::string& name, PortDirection dir, ValueType type) {
        return std::any_of(specs.begin(), specs.end(), [&](const PortSpec& s) {
            return s.name == name && s.direction == dir && s.type == type;
        });
    };
    std::vector<EdgeId> doomed;
    for (EdgeId e : node.incoming) {
        const Port* p = findInput(edgeArena[e]->to);
        if (!p || !survives(p->name, PortDirection::Input, p->type)) doomed.push_back(e);
    }
    for (EdgeId e : node.outgoing) {
        const Port* p = findOutput(edgeArena[e]->from);
        if (!p || !survives(p->name, PortDirection::Output, p->type)) doomed.push_back(e);
    }
    for (EdgeId e : doomed) eraseEdge(e);

    node.config = std::move(config);
    buildPorts(node);
    structureChanged({GraphChangeType::NodeReconfigured, id, 0});
}

void Graph::setNodeTitle(NodeId id, const std::string& title) {
    requireNode(id).title = title;
    ++revisionCounter;
}

void Graph::clear() {
    nodes.clear();
    edgeArena.clear();
    liveNodes = 0;
    liveEdges = 0;
    structureChanged({GraphChangeType::Cleared, 0, 0});
}

// ---------------------------------------------------------------------------
// Edges
// ---------------------------------------------------------------------------

void Graph::checkConnect(const PortRef& from, const PortRef& to) const {
    const Node* src = findNode(from.node);
    const Node* dst = findNode(to.node);
    if (!src) throw FlowError(ErrorCode::NotFound, fmt::format("no node {}", from.node));
    if (!dst) throw FlowError(ErrorCode::NotFound, fmt::format("no node {}", to.node));

    const Port* out = findOutput(from);
    const Port* in = findInput(to);
    if (!out) {
        if (src->inputIndex(from.port) >= 0) {
            throw FlowError(ErrorCode::TypeMismatch, fmt::format("{} is an input, not an output", toString(from)));
        }
        throw FlowError(ErrorCode::NotFound, fmt::format("no output port {}", toString(from)));
    }
    if (!in) {
        if (dst->outputIndex(to.port) >= 0) {
            throw FlowError(ErrorCode::TypeMismatch, fmt::format("{} is an output, not an input", toString(to)));
        }
        throw FlowError(ErrorCode::NotFound, fmt::format("no input port {}", toString(to)));
    }
    if (out->type != in->type) {
        throw FlowError(ErrorCode::TypeMismatch,
                        fmt::format("{} is {} but {} is {}", toString(from), valueTypeName(out->type),
                                    toString(to), valueTypeName(in->type)));
    }
    for (EdgeId e : dst->incoming) {
        if (edgeArena[e]->to.port == to.port) {
            throw FlowError(ErrorCode::PortOccupied, fmt::format("{} already has an incoming edge", toString(to)));
        }
    }
    // The new edge closes a cycle iff the source is reachable from the destination
    if (from.node == to.node || reachable(to.node, from.node)) {
        throw FlowError(ErrorCode::CycleDetected,
                        fmt::format("edge {} -> {} would create a cycle", toString(from), toString(to)));
    }
}

EdgeId Graph::connect(const PortRef& from, const PortRef& to) {
    checkConnect(from, to);
    if (edgeArena.empty()) edgeArena.emplace_back();
    return insertEdge(static_cast<EdgeId>(edgeArena.size()), from, to);
}

EdgeId Graph::restoreEdge(EdgeId id, const PortRef& from, const PortRef& to) {
    if (id <= 0) throw FlowError(ErrorCode::InvalidConfig, fmt::format("invalid edge id {}", id));
    if (static_cast<size_t>(id) < edgeArena.size() && edgeArena[id]) {
        throw FlowError(ErrorCode::InvalidConfig, fmt::format("edge id {} already in use", id));
    }
    checkConnect(from, to);
    return insertEdge(id, from, to);
}

EdgeId Graph::insertEdge(EdgeId id, const PortRef& from, const PortRef& to) {
    if (edgeArena.size() <= static_cast<size_t>(id)) edgeArena.resize(static_cast<size_t>(id) + 1);
    edgeArena[id] = Edge{id, from, to};
    nodes[from.node]->outgoing.push_back(id);
    nodes[to.node]->incoming.push_back(id);
    ++liveEdges;
    structureChanged({GraphChangeType::EdgeAdded, to.node, id});
    return id;
}

void Graph::disconnect(EdgeId id) {
    if (!findEdge(id)) throw FlowError(ErrorCode::NotFound, fmt::format("no edge {}", id));
    eraseEdge(id);
}

void Graph::eraseEdge(EdgeId id) {
    const Edge edge = *edgeArena[id];
    auto drop = [id](std::vector<EdgeId>& list) {
        list.erase(std::remove(list.begin(), list.end(), id), list.end());
    };
    if (auto* src = findNode(edge.from.node)) drop(src->outgoing);
    if (auto* dst = findNode(edge.to.node)) drop(dst->incoming);
    edgeArena[id].reset();
    --liveEdges;
    structureChanged({GraphChangeType::EdgeRemoved, edge.to.node, id});
}

// ---------------------------------------------------------------------------
// Lookup
// ---------------------------------------------------------------------------

const Node* Graph::findNode(NodeId id) const {
    if (id <= 0 || static_cast<size_t>(id) >= nodes.size() || !nodes[id]) return nullptr;
    return &*nodes[id];
}

Node* Graph::findNode(NodeId id) {
    if (id <= 0 || static_cast<size_t>(id) >= nodes.size() || !nodes[id]) return nullptr;
    return &*nodes[id];
}

const Node& Graph::node(NodeId id) const {
    const Node* n = findNode(id);
    if (!n) throw FlowError(ErrorCode::NotFound, fmt::format("no node {}", id));
    return *n;
}

Node& Graph::requireNode(NodeId id) {
    Node* n = findNode(id);
    if (!n) throw FlowError(ErrorCode::NotFound, fmt::format("no node {}", id));
    return *n;
}

const Edge* Graph::findEdge(EdgeId id) const {
    if (id <= 0 || static_cast<size_t>(id) >= edgeArena.size() || !edgeArena[id]) return nullptr;
    return &*edgeArena[id];
}

const Port* Graph::findInput(const PortRef& ref) const {
    const Node* n = findNode(ref.node);
    if (!n) return nullptr;
    int idx = n->inputIndex(ref.port);
    return idx < 0 ? nullptr : &n->inputs[idx];
}

const Port* Graph::findOutput(const PortRef& ref) const {
    const Node* n = findNode(ref.node);
    if (!n) return nullptr;
    int idx = n->outputIndex(ref.port);
    return idx < 0 ? nullptr : &n->outputs[idx];
}

std::vector<NodeId> Graph::nodeIds() const {
    std::vector<NodeId> ids;
    ids.reserve(liveNodes);
    for (const auto& n : nodes) {
        if (n) ids.push_back(n->id);
    }
    return ids;
}

std::vector<Edge> Graph::edges() const {
    std::vector<Edge> out;
    out.reserve(liveEdges);
    for (const auto& e : edgeArena) {
        if (e) out.push_back(*e);
    }
    return out;
}

bool Graph::reachable(NodeId from, NodeId to) const {
    if (!findNode(from) || !findNode(to)) return false;
    std::vector<bool> seen(nodes.size(), false);
    std::vector<NodeId> stack{from};
    while (!stack.empty()) {
        NodeId current = stack.back();
        stack.pop_back();
        if (current == to) return true;
        if (seen[current]) continue;
        seen[current] = true;
        for (EdgeId e : nodes[current]->outgoing) {
            NodeId next = edgeArena[e]->to.node;
            if (!seen[next]) stack.push_back(next);
        }
    }
    return false;
}

const std::vector<NodeId>& Graph::topologicalOrder() const {
    if (topoValid) return topoCache;

    std::vector<int> inDegree(nodes.size(), 0);
    for (const auto& e : edgeArena) {
        if (e) ++inDegree[e->to.node];
    }
    // Min-heap on id: independent nodes come out in creation order
    std::priority_queue<NodeId, std::vector<NodeId>, std::greater<NodeId>> ready;
    for (const auto& n : nodes) {
        if (n && inDegree[n->id] == 0) ready.push(n->id);
    }

    topoCache.clear();
    topoCache.reserve(liveNodes);
    while (!ready.empty()) {
        NodeId current = ready.top();
        ready.pop();
        topoCache.push_back(current);
        for (EdgeId e : nodes[current]->outgoing) {
            NodeId next = edgeArena[e]->to.node;
            if (--inDegree[next] == 0) ready.push(next);
        }
    }

    if (topoCache.size() != liveNodes) {
        // Unreachable while connect() rejects cycles
        throw std::runtime_error("Cycle detected in flow graph");
    }
    topoValid = true;
    return topoCache;
}

// ---------------------------------------------------------------------------
// Observers
// ---------------------------------------------------------------------------

int Graph::addObserver(Observer observer) {
    const int token = nextObserverToken++;
    observers.emplace_back(token, std::move(observer));
    return token;
}

void Graph::removeObserver(int token) {
    observers.erase(std::remove_if(observers.begin(), observers.end(),
                                   [token](const auto& o) { return o.first == token; }),
                    observers.end());
}

void Graph::structureChanged(const GraphChange& change) {
    topoValid = false;
    ++revisionCounter;
    MIDIFLOW_TRACE("graph change type={} node={} edge={}", static_cast<int>(change.type), change.node, change.edge);
    for (const auto& o : observers) o.second(change);
}

} // namespace MidiFlow
