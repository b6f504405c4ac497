// Evaluator.hpp
//
// Event propagation through the graph. One call to propagate() is one pass:
// the bound input port is written, then nodes are evaluated from a ready
// queue ordered by topological index. A node is enqueued only when one of
// its inputs was written in the pass, and the generation stamp makes every
// node evaluate at most once per pass (diamonds included). Action nodes
// reached by the pass are returned as ActionRequests for the sandbox.
//
// Not synchronized; FlowEngine calls it under its graph mutex.
#pragma once
#include "ControlEvent.hpp"
#include "MidiFlowCore.hpp"
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace MidiFlow {

using Generation = unsigned long long;

struct EventContext {
    ControlEvent event;
    std::string workspaceId;
};

// Everything an action needs, copied out of the graph so the worker never
// touches graph state
struct ActionRequest {
    NodeId node = 0;
    std::string title;
    NodeConfig config;
    std::map<std::string, Value> inputs;
    EventContext context;
    Generation generation = 0;
};

class Evaluator {
public:
    explicit Evaluator(Graph& graph);
    ~Evaluator();
    Evaluator(const Evaluator&) = delete;
    Evaluator& operator=(const Evaluator&) = delete;

    // Writes `event` into the input port `target` and propagates downstream.
    // Unknown targets produce no requests.
    std::vector<ActionRequest> propagate(const PortRef& target, const EventContext& context);

    // Performance counters (lightweight, resettable)
    struct PerfStats {
        unsigned long long evalCount = 0;
        unsigned long long nodesEvaluated = 0;
        unsigned long long dependentsEnqueued = 0;
        unsigned long long readyQueueMax = 0;
        unsigned long long actionsProduced = 0;
        unsigned long long actionsSuppressed = 0;
        unsigned long long evalTimeNsAccum = 0;
        unsigned long long evalTimeNsMin = (unsigned long long)-1;
        unsigned long long evalTimeNsMax = 0;
    };
    const PerfStats& perfStats() const { return perf; }
    PerfStats getAndResetPerfStats() {
        PerfStats out = perf;
        perf = PerfStats{};
        return out;
    }

private:
    void onGraphChange(const GraphChange& change);
    void ensureTopoIndex();
    void writeInput(Node& node, int index, const Value& value);
    void enqueueNode(NodeId id);
    bool isRepeat(NodeId id, const std::map<std::string, Value>& inputs) const;

    Graph& graph;
    int observerToken = 0;

    Generation evalGeneration = 0;
    std::vector<int> topoIndex; // NodeId -> position in topological order
    bool topoIndexValid = false;
    std::vector<Generation> readyStamp; // NodeId -> generation it was last enqueued in
    std::vector<std::pair<int, NodeId>> readyQueue; // min-heap on topo index
    std::unordered_map<NodeId, std::vector<bool>> written; // inputs written this pass
    std::unordered_map<NodeId, std::map<std::string, Value>> lastInvoked;

    PerfStats perf;
};

} // namespace MidiFlow
