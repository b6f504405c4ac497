#include <catch2/catch.hpp>

#include "FlowError.hpp"
#include "TestSupport.hpp"
#include "Workspace.hpp"
#include <unistd.h>
#include <filesystem>
#include <fstream>

using namespace MidiFlow;
using namespace MidiFlowTest;
using Catch::Detail::Approx;

namespace {

void buildStudio(FlowEngine& engine) {
    NodeId m = engine.addNode(NodeKind::MidiInput, {{"controls", {"fader", {{"name", "pad"}, {"type", "trigger"}}}}}, "Desk");
    NodeId v = engine.addNode(NodeKind::ValueMap, {{"curve", "log"}, {"output_max", 0.8}});
    NodeId x = engine.addNode(NodeKind::Volume, {{"sink", "48"}});
    NodeId s = engine.addNode(NodeKind::ShellCommand, {{"command", "notify-send pad"}});
    engine.connect({m, "fader"}, {v, "in"});
    engine.connect({v, "out"}, {x, "level"});
    engine.connect({m, "pad"}, {s, "trigger"});
    engine.bind({"nano", 1, 7}, {m, "fader"});
    engine.bind({"nano", 1, 36}, {m, "pad"});
    engine.captureProfile("Nano layout", m);
}

std::string tempPath(const std::string& name) {
    return (std::filesystem::temp_directory_path() /
            ("midiflow-ws-" + std::to_string(::getpid()) + "-" + name)).string();
}

} // namespace

TEST_CASE("snapshot and restore reproduce the workspace", "[workspace]") {
    EngineRig original;
    buildStudio(original.engine);
    const auto doc = original.engine.snapshot();
    REQUIRE(doc.at("version") == kWorkspaceVersion);
    REQUIRE(doc.at("workspace_id") == "rig");
    REQUIRE(doc.at("nodes").size() == 4);
    REQUIRE(doc.at("connections").size() == 3);
    REQUIRE(doc.at("bindings").size() == 2);
    REQUIRE(doc.at("profiles").size() == 1);
    REQUIRE(doc.at("nodes")[1].at("type") == "logic.mapper");

    EngineRig copy;
    copy.engine.restore(doc);
    REQUIRE(copy.engine.snapshot() == doc);
    REQUIRE(copy.engine.workspaceId() == "rig");

    // The restored graph behaves like the original
    copy.engine.deliver(cc("nano", 1, 7, 127));
    copy.sandbox.waitIdle();
    auto levels = copy.volume->levels();
    REQUIRE(levels.size() == 1);
    REQUIRE(levels[0].second == Approx(0.8));
}

TEST_CASE("ids continue after a restore", "[workspace]") {
    EngineRig rig;
    buildStudio(rig.engine);
    EngineRig copy;
    copy.engine.restore(rig.engine.snapshot());
    NodeId next = copy.engine.addNode(NodeKind::ValueMap);
    REQUIRE(next == 5);
}

TEST_CASE("an invalid document leaves the engine unchanged", "[workspace]") {
    EngineRig rig;
    buildStudio(rig.engine);
    const auto before = rig.engine.snapshot();
    rig.engine.beginLearn({1, "fader"});

    SECTION("edges that do not fit the nodes") {
        auto doc = before;
        doc["connections"].push_back({{"id", 9}, {"source_node", 1}, {"source_port", "fader"},
                                      {"target_node", 4}, {"target_port", "trigger"}});
        REQUIRE_THROWS_AS(rig.engine.restore(doc), FlowError);
    }
    SECTION("a cycle") {
        auto doc = before;
        doc["connections"].push_back({{"source_node", 2}, {"source_port", "out"},
                                      {"target_node", 1}, {"target_port", "fader"}});
        REQUIRE_THROWS_AS(rig.engine.restore(doc), FlowError);
    }
    SECTION("an unknown node type") {
        auto doc = before;
        doc["nodes"][0]["type"] = "midi.output";
        REQUIRE_THROWS_AS(rig.engine.restore(doc), FlowError);
    }
    SECTION("a bad node configuration") {
        auto doc = before;
        doc["nodes"][1]["config"]["curve"] = "sine";
        REQUIRE_THROWS_AS(rig.engine.restore(doc), FlowError);
    }
    SECTION("a newer version") {
        auto doc = before;
        doc["version"] = kWorkspaceVersion + 1;
        REQUIRE_THROWS_AS(rig.engine.restore(doc), FlowError);
    }
    SECTION("an out-of-range node id") {
        auto doc = before;
        doc["nodes"][1]["id"] = 4294967396LL;
        REQUIRE_THROWS_AS(rig.engine.restore(doc), FlowError);
    }
    SECTION("an out-of-range binding channel") {
        auto doc = before;
        doc["bindings"][0]["channel"] = 4294967297LL;
        REQUIRE_THROWS_AS(rig.engine.restore(doc), FlowError);
    }
    SECTION("duplicate node ids") {
        auto doc = before;
        doc["nodes"][1]["id"] = 1;
        REQUIRE_THROWS_AS(rig.engine.restore(doc), FlowError);
    }

    REQUIRE(rig.engine.snapshot() == before);
    REQUIRE(rig.engine.learnState() == LearnState::Learning);
}

TEST_CASE("stale bindings are dropped on load", "[workspace]") {
    EngineRig rig;
    buildStudio(rig.engine);
    auto doc = rig.engine.snapshot();
    doc["bindings"].push_back({{"device", "nano"}, {"channel", 1}, {"control", 9}, {"node", 1}, {"port", "gone"}});
    doc["bindings"].push_back({{"device", "nano"}, {"channel", 1}, {"control", 10}, {"node", 42}, {"port", "fader"}});

    EngineRig copy;
    copy.engine.restore(doc);
    REQUIRE(copy.engine.bindings().size() == 2);
}

TEST_CASE("documents without edge ids or optional sections load", "[workspace]") {
    auto doc = nlohmann::json::parse(R"({
        "nodes": [
            {"id": 3, "type": "midi.input", "config": {}},
            {"id": 7, "type": "action.volume", "title": "Main"}
        ],
        "connections": [
            {"source_node": 3, "source_port": "value", "target_node": 7, "target_port": "level"}
        ]
    })");
    EngineRig rig;
    rig.engine.restore(doc);
    auto snap = rig.engine.snapshot();
    REQUIRE(snap.at("connections")[0].at("id") == 1);
    REQUIRE(snap.at("nodes")[1].at("title") == "Main");
    REQUIRE(snap.at("nodes")[0].at("title") == "MIDI Input");
    REQUIRE(rig.engine.workspaceId() == "rig");
    REQUIRE(rig.engine.addNode(NodeKind::ValueMap) == 8);
}

TEST_CASE("workspace files", "[workspace]") {
    EngineRig rig;
    buildStudio(rig.engine);
    const std::string path = tempPath("studio.json");
    writeWorkspaceFile(path, rig.engine.snapshot());
    REQUIRE(readWorkspaceFile(path) == rig.engine.snapshot());
    REQUIRE_FALSE(std::filesystem::exists(path + ".tmp"));
    std::filesystem::remove(path);

    REQUIRE_THROWS_AS(readWorkspaceFile(tempPath("missing.json")), std::runtime_error);

    const std::string garbage = tempPath("garbage.json");
    std::ofstream(garbage) << "{ not json";
    REQUIRE_THROWS_AS(readWorkspaceFile(garbage), std::runtime_error);
    std::filesystem::remove(garbage);
}
