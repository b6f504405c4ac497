#include <catch2/catch.hpp>

#include "FlowError.hpp"
#include "TestSupport.hpp"

using namespace MidiFlow;
using namespace MidiFlowTest;

namespace {

ErrorCode codeOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const FlowError& e) {
        return e.code();
    }
    FAIL("expected a FlowError");
    return ErrorCode::NotFound;
}

struct VolumeChain {
    NodeId midi;
    NodeId mapper;
    NodeId volume;
};

VolumeChain addVolumeChain(FlowEngine& engine, const std::string& sink = "48") {
    VolumeChain c;
    c.midi = engine.addNode(NodeKind::MidiInput);
    c.mapper = engine.addNode("logic.mapper");
    c.volume = engine.addNode(NodeKind::Volume, {{"sink", sink}});
    engine.connect({c.midi, "value"}, {c.mapper, "in"});
    engine.connect({c.mapper, "out"}, {c.volume, "level"});
    return c;
}

} // namespace

TEST_CASE("a bound controller drives the volume sink", "[engine]") {
    EngineRig rig;
    auto chain = addVolumeChain(rig.engine);
    rig.engine.bind({"1", 1, 7}, {chain.midi, "value"});

    auto result = rig.engine.deliver(cc("1", 1, 7, 127));
    REQUIRE(result.status == DeliveryResult::Status::Dispatched);
    REQUIRE(result.actionsSubmitted == 1);
    rig.sandbox.waitIdle();
    rig.engine.deliver(cc("1", 1, 7, 0));
    rig.sandbox.waitIdle();

    auto levels = rig.volume->levels();
    REQUIRE(levels.size() == 2);
    REQUIRE(levels[0] == std::make_pair(std::string("48"), 1.0));
    REQUIRE(levels[1] == std::make_pair(std::string("48"), 0.0));
    REQUIRE(rig.reports.count() == 2);
    REQUIRE(rig.failures.count() == 0);
}

TEST_CASE("unbound events are counted and dropped", "[engine]") {
    EngineRig rig;
    addVolumeChain(rig.engine);
    auto result = rig.engine.deliver(cc("1", 1, 7, 100));
    REQUIRE(result.status == DeliveryResult::Status::Unbound);
    REQUIRE(rig.engine.stats().eventsUnbound == 1);
    rig.sandbox.waitIdle();
    REQUIRE(rig.volume->levels().empty());
}

TEST_CASE("learn binds the next event and consumes it", "[engine][learn]") {
    EngineRig rig;
    auto chain = addVolumeChain(rig.engine);
    NodeId pads = rig.engine.addNode(NodeKind::MidiInput, {{"controls", {"p", "q"}}});

    rig.engine.beginLearn({pads, "p"});
    REQUIRE(rig.engine.learnState() == LearnState::Learning);
    REQUIRE(codeOf([&] { rig.engine.beginLearn({pads, "q"}); }) == ErrorCode::LearnInProgress);

    auto learned = rig.engine.deliver(cc("1", 1, 7, 64));
    REQUIRE(learned.status == DeliveryResult::Status::Learned);
    REQUIRE(learned.learned->target == PortRef{pads, "p"});
    REQUIRE(rig.engine.learnState() == LearnState::Idle);

    // Learning the same control for another port moves the binding
    rig.engine.beginLearn({pads, "q"});
    rig.engine.deliver(cc("1", 1, 7, 10));
    auto bindings = rig.engine.bindings();
    REQUIRE(bindings.size() == 1);
    REQUIRE(bindings[0].key == ControlKey{"1", 1, 7});
    REQUIRE(bindings[0].target == PortRef{pads, "q"});

    // Rebinding to the chain makes the next event dispatch
    rig.engine.bind({"1", 1, 7}, {chain.midi, "value"});
    REQUIRE(rig.engine.deliver(cc("1", 1, 7, 127)).status == DeliveryResult::Status::Dispatched);
    rig.sandbox.waitIdle();
    REQUIRE(rig.volume->levels().size() == 1);
    REQUIRE(rig.engine.stats().eventsLearned == 2);
}

TEST_CASE("learn rejects unknown targets", "[engine][learn]") {
    EngineRig rig;
    auto chain = addVolumeChain(rig.engine);
    REQUIRE(codeOf([&] { rig.engine.beginLearn({chain.midi, "nope"}); }) == ErrorCode::NotFound);
    REQUIRE(codeOf([&] { rig.engine.beginLearn({chain.mapper, "out"}); }) == ErrorCode::NotFound);
    REQUIRE(rig.engine.learnState() == LearnState::Idle);
    REQUIRE(codeOf([&] { rig.engine.bind({"1", 1, 1}, {42, "value"}); }) == ErrorCode::NotFound);
}

TEST_CASE("removing a node cascades", "[engine]") {
    EngineRig rig;
    auto chain = addVolumeChain(rig.engine);
    rig.engine.bind({"1", 1, 7}, {chain.midi, "value"});
    rig.engine.bind({"1", 1, 8}, {chain.mapper, "in"});

    rig.engine.removeNode(chain.mapper);
    REQUIRE(rig.engine.inspect([](const Graph& g) { return g.edgeCount(); }) == 0);
    REQUIRE(rig.engine.bindings().size() == 1);

    rig.engine.beginLearn({chain.midi, "value"});
    rig.engine.removeNode(chain.midi);
    REQUIRE(rig.engine.learnState() == LearnState::Idle);
    REQUIRE(rig.engine.bindings().empty());
    REQUIRE(rig.engine.deliver(cc("1", 1, 7, 1)).status == DeliveryResult::Status::Unbound);
}

TEST_CASE("closing a device cancels learning restricted to it", "[engine][learn]") {
    EngineRig rig;
    NodeId m = rig.engine.addNode(NodeKind::MidiInput);
    rig.engine.beginLearn({m, "value"}, std::string("nano"));
    rig.engine.deviceClosed("other");
    REQUIRE(rig.engine.learnState() == LearnState::Learning);
    rig.engine.deviceClosed("nano");
    REQUIRE(rig.engine.learnState() == LearnState::Idle);
}

TEST_CASE("reconfiguring drops bindings on vanished ports", "[engine]") {
    EngineRig rig;
    NodeId m = rig.engine.addNode(NodeKind::MidiInput, {{"controls", {"a", "b"}}});
    rig.engine.bind({"1", 1, 1}, {m, "a"});
    rig.engine.bind({"1", 1, 2}, {m, "b"});
    rig.engine.beginLearn({m, "b"});

    const auto before = rig.engine.revision();
    REQUIRE(codeOf([&] { rig.engine.setNodeConfig(m, {{"controls", "a"}}); }) == ErrorCode::InvalidConfig);
    REQUIRE(rig.engine.bindings().size() == 2);
    REQUIRE(rig.engine.revision() == before);

    rig.engine.setNodeConfig(m, {{"controls", {"a"}}});
    REQUIRE(rig.engine.bindings().size() == 1);
    REQUIRE(rig.engine.learnState() == LearnState::Idle);
    REQUIRE(rig.engine.revision() > before);
}

TEST_CASE("fan-out reaches every action", "[engine]") {
    EngineRig rig;
    NodeId m = rig.engine.addNode(NodeKind::MidiInput);
    NodeId s1 = rig.engine.addNode(NodeKind::ShellCommand, {{"command", "echo one {value}"}});
    NodeId s2 = rig.engine.addNode(NodeKind::Script, {{"script", "context.log(event.value)"}});
    rig.engine.connect({m, "value"}, {s1, "value"});
    rig.engine.connect({m, "value"}, {s2, "value"});
    rig.engine.bind({"1", 1, 7}, {m, "value"});

    REQUIRE(rig.engine.deliver(cc("1", 1, 7, 99)).actionsSubmitted == 2);
    rig.sandbox.waitIdle();
    auto requests = rig.recorder->requests();
    REQUIRE(requests.size() == 2);
    for (const auto& r : requests) {
        REQUIRE(numberInput(r, "value") == 99.0);
        REQUIRE(r.context.workspaceId == "rig");
        REQUIRE(r.context.event.control == 7);
    }
}

TEST_CASE("a full queue rejects without blocking the engine", "[engine][sandbox]") {
    EngineRig rig(1, 1);
    auto gate = std::make_shared<GateExecutor>();
    rig.sandbox.setExecutor(NodeKind::Script, gate);
    NodeId m = rig.engine.addNode(NodeKind::MidiInput);
    NodeId s = rig.engine.addNode(NodeKind::Script, {{"script", "context.log('slow')"}});
    rig.engine.connect({m, "value"}, {s, "value"});
    rig.engine.bind({"1", 1, 7}, {m, "value"});

    REQUIRE(rig.engine.deliver(cc("1", 1, 7, 1)).actionsSubmitted == 1);
    REQUIRE(gate->waitStarted(1));
    // The first action is still running; delivery returns regardless
    REQUIRE(rig.engine.deliver(cc("1", 1, 7, 2)).actionsSubmitted == 1);
    auto third = rig.engine.deliver(cc("1", 1, 7, 3));
    REQUIRE(third.actionsSubmitted == 0);
    REQUIRE(third.actionsRejected == 1);

    auto failures = rig.failures.all();
    REQUIRE(failures.size() == 1);
    REQUIRE(failures[0].node == s);
    REQUIRE(failures[0].outcome.failure == ActionFailureKind::Rejected);

    gate->release();
    rig.sandbox.waitIdle();
    REQUIRE(rig.sandbox.stats().submitted == 2);
    REQUIRE(rig.sandbox.stats().rejected == 1);
    REQUIRE(rig.engine.stats().actionsRejected == 1);
}

TEST_CASE("action failures reach the failure listener", "[engine][sandbox]") {
    EngineRig rig;
    auto chain = addVolumeChain(rig.engine, "99");
    rig.engine.bind({"1", 1, 7}, {chain.midi, "value"});
    rig.engine.deliver(cc("1", 1, 7, 64));
    rig.sandbox.waitIdle();

    auto failures = rig.failures.all();
    REQUIRE(failures.size() == 1);
    REQUIRE(failures[0].kind == NodeKind::Volume);
    REQUIRE(failures[0].outcome.failure == ActionFailureKind::SinkNotFound);
    REQUIRE(rig.sandbox.stats().failed == 1);
}

TEST_CASE("profiles through the engine", "[engine][profiles]") {
    EngineRig rig;
    NodeId a = rig.engine.addNode(NodeKind::MidiInput, {{"controls", {"fader", "knob"}}});
    NodeId b = rig.engine.addNode(NodeKind::MidiInput, {{"controls", {"fader"}}});
    rig.engine.bind({"nano", 1, 1}, {a, "fader"});
    rig.engine.bind({"nano", 1, 2}, {a, "knob"});

    const std::string id = rig.engine.captureProfile("Nano", a);
    REQUIRE(rig.engine.profiles().size() == 1);
    REQUIRE(rig.engine.applyProfile(id, b) == 1);

    // Control 1 moved to the second node, control 2 stayed
    auto bindings = rig.engine.bindings();
    REQUIRE(bindings.size() == 2);
    for (const auto& binding : bindings) {
        if (binding.key.control == 1) REQUIRE(binding.target == PortRef{b, "fader"});
        else REQUIRE(binding.target == PortRef{a, "knob"});
    }
    REQUIRE(codeOf([&] { rig.engine.applyProfile("missing", b); }) == ErrorCode::NotFound);
    REQUIRE(rig.engine.removeProfile(id));
    REQUIRE_FALSE(rig.engine.removeProfile(id));
}

TEST_CASE("unknown node types are rejected", "[engine]") {
    EngineRig rig;
    REQUIRE(codeOf([&] { rig.engine.addNode("logic.gate"); }) == ErrorCode::InvalidConfig);
    REQUIRE(rig.engine.inspect([](const Graph& g) { return g.nodeCount(); }) == 0);
}

TEST_CASE("a runaway script times out without holding up other nodes", "[engine][script]") {
    EngineRig rig;
    rig.sandbox.setExecutor(NodeKind::Script, std::make_shared<ScriptExecutor>());
    NodeId slowIn = rig.engine.addNode(NodeKind::MidiInput);
    NodeId slow = rig.engine.addNode(NodeKind::Script, {{"script", "while true do end"}, {"timeout_ms", 200}});
    NodeId fastIn = rig.engine.addNode(NodeKind::MidiInput);
    NodeId fast = rig.engine.addNode(NodeKind::Script, {{"script", "context.log('fast', event.value)"}});
    rig.engine.connect({slowIn, "value"}, {slow, "value"});
    rig.engine.connect({fastIn, "value"}, {fast, "value"});
    rig.engine.bind({"1", 1, 7}, {slowIn, "value"});
    rig.engine.bind({"1", 1, 8}, {fastIn, "value"});

    const auto t0 = std::chrono::steady_clock::now();
    REQUIRE(rig.engine.deliver(cc("1", 1, 7, 1)).actionsSubmitted == 1);
    REQUIRE(rig.engine.deliver(cc("1", 1, 8, 2)).actionsSubmitted == 1);
    auto fastDone = [&] {
        for (const auto& r : rig.reports.all()) {
            if (r.node == fast) return true;
        }
        return false;
    };
    REQUIRE(waitUntil(fastDone, 150ms));
    REQUIRE(std::chrono::steady_clock::now() - t0 < 200ms);
    REQUIRE(rig.failures.count() == 0);

    REQUIRE(waitUntil([&] { return rig.failures.count() == 1; }));
    auto failures = rig.failures.all();
    REQUIRE(failures[0].node == slow);
    REQUIRE(failures[0].outcome.failure == ActionFailureKind::Timeout);
    REQUIRE(std::chrono::steady_clock::now() - t0 < 1500ms);

    REQUIRE(rig.engine.deliver(cc("1", 1, 8, 3)).actionsSubmitted == 1);
    rig.sandbox.waitIdle();
    REQUIRE(rig.reports.count() == 3);
    REQUIRE(rig.sandbox.stats().timedOut == 1);
}
