// MidiFlowCore.hpp
//
// In-memory graph model: nodes, typed ports and edges stored in arenas
// indexed by integer id. Adjacency is kept as edge-id lists on each node.
// The graph enforces its invariants on every edit (port types match, one
// incoming edge per input, no cycles) and notifies observers of every
// structural change. The topological order is computed lazily and cached
// until the next structural change.
//
// The graph is not internally synchronized; FlowEngine serializes access.
#pragma once
#include "NodeKinds.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace MidiFlow {

using NodeId = int;
using EdgeId = int;

// Addresses one port by node and port name. Direction is implied by use:
// edge sources and destinations, binding targets (always inputs).
struct PortRef {
    NodeId node = 0;
    std::string port;

    bool operator==(const PortRef& other) const { return node == other.node && port == other.port; }
    bool operator!=(const PortRef& other) const { return !(*this == other); }
};

std::string toString(const PortRef& ref);

struct Port {
    std::string name;
    PortDirection direction;
    ValueType type;
    Value value;
};

struct Node {
    NodeId id = 0;
    std::string title;
    NodeConfig config;
    std::vector<Port> inputs;
    std::vector<Port> outputs;
    std::vector<EdgeId> incoming;
    std::vector<EdgeId> outgoing;

    NodeKind kind() const { return kindOf(config); }
    int inputIndex(const std::string& name) const;
    int outputIndex(const std::string& name) const;
};

struct Edge {
    EdgeId id = 0;
    PortRef from; // output port
    PortRef to;   // input port
};

enum class GraphChangeType { NodeAdded, NodeRemoved, NodeReconfigured, EdgeAdded, EdgeRemoved, Cleared };

struct GraphChange {
    GraphChangeType type;
    NodeId node = 0;
    EdgeId edge = 0;
};

class Graph {
public:
    using Observer = std::function<void(const GraphChange&)>;

    Graph() = default;
    Graph(const Graph&) = delete;
    Graph& operator=(const Graph&) = delete;

    // Node lifecycle. Titles default to the catalog title of the kind.
    NodeId addNode(NodeKind kind, const nlohmann::json& config, const std::string& title = {});
    NodeId addNode(NodeConfig config, const std::string& title = {});
    // Re-creates a node with a known id (snapshot restore). Ids must be
    // restored in increasing order to keep creation order.
    void restoreNode(NodeId id, NodeConfig config, const std::string& title);
    void removeNode(NodeId id);
    void setNodeConfig(NodeId id, NodeConfig config);
    void setNodeConfig(NodeId id, const nlohmann::json& config);
    void setNodeTitle(NodeId id, const std::string& title);
    void clear();

    // Edge lifecycle
    EdgeId connect(const PortRef& from, const PortRef& to);
    EdgeId restoreEdge(EdgeId id, const PortRef& from, const PortRef& to);
    void disconnect(EdgeId id);

    // Lookup
    const Node* findNode(NodeId id) const;
    Node* findNode(NodeId id);
    const Node& node(NodeId id) const; // throws NotFound
    const Edge* findEdge(EdgeId id) const;
    const Port* findInput(const PortRef& ref) const;
    const Port* findOutput(const PortRef& ref) const;
    std::vector<NodeId> nodeIds() const; // creation order
    std::vector<Edge> edges() const;     // creation order
    size_t nodeCount() const { return liveNodes; }
    size_t edgeCount() const { return liveEdges; }
    // True when `to` can be reached from `from` following edges
    bool reachable(NodeId from, NodeId to) const;

    // Deterministic order honoring every edge; ties by creation order
    const std::vector<NodeId>& topologicalOrder() const;

    // Bumped on every edit, used for checkpoint dirtiness
    unsigned long long revision() const { return revisionCounter; }

    int addObserver(Observer observer);
    void removeObserver(int token);

private:
    Node& requireNode(NodeId id);
    void buildPorts(Node& node);
    void checkConnect(const PortRef& from, const PortRef& to) const;
    EdgeId insertEdge(EdgeId id, const PortRef& from, const PortRef& to);
    void eraseEdge(EdgeId id);
    void structureChanged(const GraphChange& change);

    std::vector<std::optional<Node>> nodes; // index == NodeId, slot 0 unused
    std::vector<std::optional<Edge>> edgeArena; // index == EdgeId, slot 0 unused
    size_t liveNodes = 0;
    size_t liveEdges = 0;
    unsigned long long revisionCounter = 0;

    mutable std::vector<NodeId> topoCache;
    mutable bool topoValid = false;

    std::vector<std::pair<int, Observer>> observers;
    int nextObserverToken = 1;
};

} // namespace MidiFlow
