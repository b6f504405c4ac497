#include <catch2/catch.hpp>

#include "FlowError.hpp"
#include "MidiFlowCore.hpp"
#include <algorithm>

using namespace MidiFlow;

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

int position(const std::vector<NodeId>& order, NodeId id) {
    return static_cast<int>(std::find(order.begin(), order.end(), id) - order.begin());
}

nlohmann::json twoControls() {
    return {{"controls", {{{"name", "knob"}, {"type", "continuous"}}, {{"name", "pad"}, {"type", "trigger"}}}}};
}

} // namespace

TEST_CASE("addNode validates configuration", "[graph]") {
    Graph g;
    NodeId m = g.addNode(NodeKind::MidiInput, nlohmann::json::object());
    REQUIRE(m == 1);
    REQUIRE(g.node(m).title == "MIDI Input");
    REQUIRE(g.node(m).inputs.size() == 1);
    REQUIRE(g.node(m).outputs.size() == 1);

    REQUIRE(codeOf([&] { g.addNode(NodeKind::ValueMap, {{"input_min", 5}, {"input_max", 5}}); }) == ErrorCode::InvalidConfig);
    REQUIRE(codeOf([&] { g.addNode(NodeKind::ValueMap, {{"curve", "sine"}}); }) == ErrorCode::InvalidConfig);
    REQUIRE(codeOf([&] { g.addNode(NodeKind::ShellCommand, nlohmann::json::object()); }) == ErrorCode::InvalidConfig);
    REQUIRE(g.nodeCount() == 1);
}

TEST_CASE("connect enforces port rules", "[graph]") {
    Graph g;
    NodeId m = g.addNode(NodeKind::MidiInput, twoControls());
    NodeId v = g.addNode(NodeKind::ValueMap, nlohmann::json::object());
    NodeId x = g.addNode(NodeKind::Volume, nlohmann::json::object());
    const auto revision = g.revision();

    SECTION("type mismatch") {
        REQUIRE(codeOf([&] { g.connect({m, "pad"}, {v, "in"}); }) == ErrorCode::TypeMismatch);
    }
    SECTION("wrong direction") {
        REQUIRE(codeOf([&] { g.connect({v, "in"}, {x, "level"}); }) == ErrorCode::TypeMismatch);
        REQUIRE(codeOf([&] { g.connect({m, "knob"}, {v, "out"}); }) == ErrorCode::TypeMismatch);
    }
    SECTION("unknown node or port") {
        REQUIRE(codeOf([&] { g.connect({m, "missing"}, {v, "in"}); }) == ErrorCode::NotFound);
        REQUIRE(codeOf([&] { g.connect({m, "knob"}, {42, "in"}); }) == ErrorCode::NotFound);
    }
    SECTION("occupied input") {
        NodeId m2 = g.addNode(NodeKind::MidiInput, nlohmann::json::object());
        g.connect({m, "knob"}, {v, "in"});
        REQUIRE(codeOf([&] { g.connect({m2, "value"}, {v, "in"}); }) == ErrorCode::PortOccupied);
        REQUIRE(g.edgeCount() == 1);
    }
    SECTION("failed edits leave the graph untouched") {
        (void)codeOf([&] { g.connect({m, "pad"}, {v, "in"}); });
        REQUIRE(g.edgeCount() == 0);
        REQUIRE(g.revision() == revision);
    }
}

TEST_CASE("fan-out is allowed from one output", "[graph]") {
    Graph g;
    NodeId m = g.addNode(NodeKind::MidiInput, nlohmann::json::object());
    NodeId v1 = g.addNode(NodeKind::ValueMap, nlohmann::json::object());
    NodeId v2 = g.addNode(NodeKind::ValueMap, nlohmann::json::object());
    g.connect({m, "value"}, {v1, "in"});
    g.connect({m, "value"}, {v2, "in"});
    REQUIRE(g.edgeCount() == 2);
    REQUIRE(g.node(m).outgoing.size() == 2);
}

TEST_CASE("cycles are rejected before insertion", "[graph]") {
    Graph g;
    NodeId a = g.addNode(NodeKind::ValueMap, nlohmann::json::object());
    NodeId b = g.addNode(NodeKind::ValueMap, nlohmann::json::object());
    NodeId m = g.addNode(NodeKind::MidiInput, {{"controls", {"x", "y"}}});
    g.connect({a, "out"}, {b, "in"});
    g.connect({b, "out"}, {m, "x"});

    const auto edges = g.edgeCount();
    const auto order = g.topologicalOrder();
    REQUIRE(codeOf([&] { g.connect({m, "x"}, {a, "in"}); }) == ErrorCode::CycleDetected);
    REQUIRE(codeOf([&] { g.connect({m, "x"}, {m, "y"}); }) == ErrorCode::CycleDetected);
    REQUIRE(g.edgeCount() == edges);
    REQUIRE(g.topologicalOrder() == order);
}

TEST_CASE("topological order honors edges and creation order", "[graph]") {
    Graph g;
    NodeId x = g.addNode(NodeKind::Volume, nlohmann::json::object());
    NodeId v = g.addNode(NodeKind::ValueMap, nlohmann::json::object());
    NodeId m = g.addNode(NodeKind::MidiInput, nlohmann::json::object());
    NodeId lone = g.addNode(NodeKind::ValueMap, nlohmann::json::object());

    REQUIRE(g.topologicalOrder() == std::vector<NodeId>{x, v, m, lone});

    g.connect({m, "value"}, {v, "in"});
    g.connect({v, "out"}, {x, "level"});
    const auto& order = g.topologicalOrder();
    REQUIRE(order.size() == 4);
    for (const auto& e : g.edges()) {
        REQUIRE(position(order, e.from.node) < position(order, e.to.node));
    }
    // Independent nodes keep creation order
    REQUIRE(order == std::vector<NodeId>{m, v, x, lone});
}

TEST_CASE("removeNode cascades to edges and notifies observers", "[graph]") {
    Graph g;
    NodeId m = g.addNode(NodeKind::MidiInput, nlohmann::json::object());
    NodeId v = g.addNode(NodeKind::ValueMap, nlohmann::json::object());
    NodeId x = g.addNode(NodeKind::Volume, nlohmann::json::object());
    g.connect({m, "value"}, {v, "in"});
    g.connect({v, "out"}, {x, "level"});
    g.topologicalOrder();

    std::vector<GraphChangeType> changes;
    int token = g.addObserver([&](const GraphChange& c) { changes.push_back(c.type); });
    g.removeNode(v);
    g.removeObserver(token);

    REQUIRE(g.findNode(v) == nullptr);
    REQUIRE(g.edgeCount() == 0);
    REQUIRE(g.node(m).outgoing.empty());
    REQUIRE(g.node(x).incoming.empty());
    REQUIRE(std::count(changes.begin(), changes.end(), GraphChangeType::EdgeRemoved) == 2);
    REQUIRE(changes.back() == GraphChangeType::NodeRemoved);
    REQUIRE(g.topologicalOrder() == std::vector<NodeId>{m, x});

    // Ids are never reused
    REQUIRE(g.addNode(NodeKind::ValueMap, nlohmann::json::object()) == 4);
}

TEST_CASE("setNodeConfig drops edges on vanished ports", "[graph]") {
    Graph g;
    NodeId m = g.addNode(NodeKind::MidiInput, {{"controls", {"a", "b"}}});
    NodeId v1 = g.addNode(NodeKind::ValueMap, nlohmann::json::object());
    NodeId v2 = g.addNode(NodeKind::ValueMap, nlohmann::json::object());
    g.connect({m, "a"}, {v1, "in"});
    g.connect({m, "b"}, {v2, "in"});

    REQUIRE(codeOf([&] { g.setNodeConfig(m, nlohmann::json{{"controls", nlohmann::json::array()}}); }) ==
            ErrorCode::InvalidConfig);
    REQUIRE(g.edgeCount() == 2);

    g.setNodeConfig(m, nlohmann::json{{"controls", {"a"}}});
    REQUIRE(g.edgeCount() == 1);
    REQUIRE(g.edges().front().to.node == v1);
    REQUIRE(g.findInput({m, "b"}) == nullptr);
}

TEST_CASE("disconnect removes exactly one edge", "[graph]") {
    Graph g;
    NodeId m = g.addNode(NodeKind::MidiInput, nlohmann::json::object());
    NodeId v = g.addNode(NodeKind::ValueMap, nlohmann::json::object());
    EdgeId e = g.connect({m, "value"}, {v, "in"});
    g.disconnect(e);
    REQUIRE(g.edgeCount() == 0);
    REQUIRE(codeOf([&] { g.disconnect(e); }) == ErrorCode::NotFound);
    // The freed input accepts a new edge
    REQUIRE(g.connect({m, "value"}, {v, "in"}) != e);
}
