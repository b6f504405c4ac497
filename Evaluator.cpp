// Evaluator.cpp
#include "Evaluator.hpp"
#include "Log.hpp"
#include <algorithm>
#include <chrono>
#include <functional>

namespace MidiFlow {

Evaluator::Evaluator(Graph& g) : graph(g) {
    observerToken = graph.addObserver([this](const GraphChange& change) { onGraphChange(change); });
}

Evaluator::~Evaluator() {
    graph.removeObserver(observerToken);
}

// Invalidation runs inside the same critical section as the edit
void Evaluator::onGraphChange(const GraphChange& change) {
    topoIndexValid = false;
    switch (change.type) {
        case GraphChangeType::NodeRemoved:
        case GraphChangeType::NodeReconfigured:
            lastInvoked.erase(change.node);
            break;
        case GraphChangeType::Cleared:
            lastInvoked.clear();
            break;
        default:
            break;
    }
}

void Evaluator::ensureTopoIndex() {
    if (topoIndexValid) return;
    const auto& order = graph.topologicalOrder();
    NodeId maxId = 0;
    for (NodeId id : order) maxId = std::max(maxId, id);
    topoIndex.assign(static_cast<size_t>(maxId) + 1, -1);
    for (size_t i = 0; i < order.size(); ++i) topoIndex[order[i]] = static_cast<int>(i);
    if (readyStamp.size() < topoIndex.size()) readyStamp.resize(topoIndex.size(), 0);
    topoIndexValid = true;
}

void Evaluator::enqueueNode(NodeId id) {
    // Dedup by generation and stable order by topo index
    if (readyStamp[id] == evalGeneration) return;
    readyStamp[id] = evalGeneration;
    readyQueue.emplace_back(topoIndex[id], id);
    std::push_heap(readyQueue.begin(), readyQueue.end(), std::greater<std::pair<int, NodeId>>());
    ++perf.dependentsEnqueued;
}

void Evaluator::writeInput(Node& node, int index, const Value& value) {
    node.inputs[index].value = value;
    auto& flags = written[node.id];
    if (flags.size() != node.inputs.size()) flags.assign(node.inputs.size(), false);
    flags[index] = true;
    enqueueNode(node.id);
}

bool Evaluator::isRepeat(NodeId id, const std::map<std::string, Value>& inputs) const {
    auto it = lastInvoked.find(id);
    if (it == lastInvoked.end() || it->second.size() != inputs.size()) return false;
    return std::equal(inputs.begin(), inputs.end(), it->second.begin(), [](const auto& a, const auto& b) {
        return a.first == b.first && valuesEqual(a.second, b.second);
    });
}

std::vector<ActionRequest> Evaluator::propagate(const PortRef& target, const EventContext& context) {
    std::vector<ActionRequest> requests;
    Node* start = graph.findNode(target.node);
    const int startIndex = start ? start->inputIndex(target.port) : -1;
    if (startIndex < 0) {
        MIDIFLOW_DEBUG("propagate: no input port {}", toString(target));
        return requests;
    }

    auto t0 = std::chrono::steady_clock::now();
    ensureTopoIndex();
    ++evalGeneration;
    readyQueue.clear();
    written.clear();

    writeInput(*start, startIndex, Value{context.event.rawValue});

    std::vector<Value> inputs;
    std::vector<Value> outputs;
    std::vector<bool> outputWritten;
    while (!readyQueue.empty()) {
        std::pop_heap(readyQueue.begin(), readyQueue.end(), std::greater<std::pair<int, NodeId>>());
        const NodeId id = readyQueue.back().second;
        readyQueue.pop_back();
        Node* node = graph.findNode(id);
        if (!node) continue;
        ++perf.nodesEvaluated;

        if (isActionKind(node->kind())) {
            ActionRequest request;
            request.node = id;
            request.title = node->title;
            request.config = node->config;
            for (const auto& port : node->inputs) request.inputs.emplace(port.name, port.value);
            request.context = context;
            request.generation = evalGeneration;
            if (suppressesRepeats(node->config) && isRepeat(id, request.inputs)) {
                MIDIFLOW_TRACE("node {} skipped: inputs unchanged", id);
                ++perf.actionsSuppressed;
                continue;
            }
            lastInvoked[id] = request.inputs;
            requests.push_back(std::move(request));
            ++perf.actionsProduced;
            continue;
        }

        inputs.clear();
        for (const auto& port : node->inputs) inputs.push_back(port.value);
        auto& inputWritten = written[id];
        inputWritten.resize(node->inputs.size(), false);
        outputs.clear();
        for (const auto& port : node->outputs) outputs.push_back(port.value);
        evaluateNode(node->config, inputs, inputWritten, outputs, outputWritten);

        for (size_t i = 0; i < outputs.size(); ++i) {
            if (!outputWritten[i]) continue;
            node->outputs[i].value = outputs[i];
            for (EdgeId e : node->outgoing) {
                const Edge* edge = graph.findEdge(e);
                if (!edge || edge->from.port != node->outputs[i].name) continue;
                Node* dst = graph.findNode(edge->to.node);
                if (!dst) continue;
                const int dstIndex = dst->inputIndex(edge->to.port);
                if (dstIndex >= 0) writeInput(*dst, dstIndex, outputs[i]);
            }
        }
        if (readyQueue.size() > perf.readyQueueMax) perf.readyQueueMax = readyQueue.size();
    }

    auto t1 = std::chrono::steady_clock::now();
    auto ns = (unsigned long long)std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count();
    ++perf.evalCount;
    perf.evalTimeNsAccum += ns;
    if (ns < perf.evalTimeNsMin) perf.evalTimeNsMin = ns;
    if (ns > perf.evalTimeNsMax) perf.evalTimeNsMax = ns;
    return requests;
}

} // namespace MidiFlow
