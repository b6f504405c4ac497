// FlowEngine.hpp
//
// The engine facade: owns the graph, bindings, learn state, profiles and
// the evaluator, and is the single entry point for edits and events. One
// mutex serializes every edit with event evaluation, so a propagation pass
// never observes a half-applied edit. Action requests produced by a pass are
// handed to the ActionSandbox before the lock is released; the sandbox never
// blocks.
//
// Action listeners run on worker threads (or, for Rejected failures, on the
// delivering thread while the engine lock is held) and must not call back
// into the engine.
#pragma once
#include "ActionSandbox.hpp"
#include "Bindings.hpp"
#include "ControlEvent.hpp"
#include "Evaluator.hpp"
#include "MidiFlowCore.hpp"
#include "Profiles.hpp"
#include <nlohmann/json.hpp>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace MidiFlow {

struct DeliveryResult {
    enum class Status { Dispatched, Learned, Unbound };
    Status status = Status::Unbound;
    std::optional<Binding> learned;
    size_t actionsSubmitted = 0;
    size_t actionsRejected = 0;
};

class FlowEngine {
public:
    explicit FlowEngine(ActionSandbox& sandbox, std::string workspaceId = "default");
    FlowEngine(const FlowEngine&) = delete;
    FlowEngine& operator=(const FlowEngine&) = delete;

    // Graph edits
    NodeId addNode(NodeKind kind, const nlohmann::json& config = nlohmann::json::object(), const std::string& title = {});
    NodeId addNode(const std::string& typeId, const nlohmann::json& config = nlohmann::json::object(), const std::string& title = {});
    EdgeId connect(const PortRef& from, const PortRef& to);
    void disconnect(EdgeId edge);
    // Cascades to edges, bindings and a learn session targeting the node
    void removeNode(NodeId id);
    // Bindings on ports that vanish with the new configuration are dropped
    void setNodeConfig(NodeId id, const nlohmann::json& config);
    void setNodeTitle(NodeId id, const std::string& title);

    // Bindings. Throws NotFound for an unknown input port, TypeMismatch for
    // string ports. Rebinding a bound key moves it.
    void bind(const ControlKey& key, const PortRef& target);
    bool unbind(const ControlKey& key);
    std::vector<Binding> bindings() const;

    // Learning
    void beginLearn(const PortRef& target, const std::optional<std::string>& device = std::nullopt);
    void cancelLearn();
    LearnState learnState() const;
    std::optional<PortRef> learnTarget() const;
    // An event source went away: cancels a learn session restricted to it
    void deviceClosed(const std::string& device);

    // Profiles
    std::string captureProfile(const std::string& name, NodeId midiNode);
    size_t applyProfile(const std::string& profileId, NodeId midiNode);
    bool removeProfile(const std::string& profileId);
    std::vector<Profile> profiles() const;

    // The single event entry point
    DeliveryResult deliver(const ControlEvent& event);

    // Workspace snapshot. restore() validates the whole document before
    // replacing anything and cancels learning.
    nlohmann::json snapshot() const;
    void restore(const nlohmann::json& document);

    // Read-only access to the graph under the engine lock
    template <typename Fn>
    auto inspect(Fn&& fn) const {
        std::lock_guard<std::mutex> lock(mutex);
        return fn(static_cast<const Graph&>(graph));
    }

    // Bumped by every edit that changes persisted state
    unsigned long long revision() const;
    std::string workspaceId() const;

    struct Stats {
        unsigned long long eventsDelivered = 0;
        unsigned long long eventsUnbound = 0;
        unsigned long long eventsLearned = 0;
        unsigned long long actionsSubmitted = 0;
        unsigned long long actionsRejected = 0;
        Evaluator::PerfStats eval;
    };
    Stats stats() const;

private:
    const Port& requireBindableInput(const PortRef& target) const;

    mutable std::mutex mutex;
    Graph graph;
    BindingTable bindingTable;
    Learner learner;
    ProfileStore profileStore;
    Evaluator evaluator;
    ActionSandbox& sandbox;
    std::string wsId;
    unsigned long long stateRevision = 0; // bindings and profiles
    Stats counters;
};

} // namespace MidiFlow
