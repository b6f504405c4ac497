// Workspace.hpp
//
// Persisted workspace document:
//
//   {
//     "version": 1,
//     "workspace_id": "studio",
//     "nodes":       [{"id": 1, "type": "midi.input", "title": "Knobs", "config": {...}}],
//     "connections": [{"id": 1, "source_node": 1, "source_port": "value",
//                      "target_node": 2, "target_port": "in"}],
//     "bindings":    [{"device": "1", "channel": 1, "control": 7, "node": 1, "port": "value"}],
//     "profiles":    [{"id": "...", "name": "...", "entries": [...]}]
//   }
//
// Loading parses and validates the whole document before anything is
// applied, so a bad document leaves the engine untouched.
#pragma once
#include "Bindings.hpp"
#include "MidiFlowCore.hpp"
#include "Profiles.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace MidiFlow {

constexpr int kWorkspaceVersion = 1;

struct WorkspaceData {
    struct NodeEntry {
        NodeId id = 0;
        std::string title;
        NodeConfig config;
    };
    std::string workspaceId;
    std::vector<NodeEntry> nodes; // ascending id
    std::vector<Edge> edges;      // ascending id
    std::vector<Binding> bindings;
    std::vector<Profile> profiles;
};

nlohmann::json workspaceToJson(const std::string& workspaceId, const Graph& graph, const BindingTable& bindings,
                               const ProfileStore& profiles);

// Throws FlowError(InvalidConfig) on malformed documents or node configs
WorkspaceData parseWorkspace(const nlohmann::json& json);

// Replaces the contents of graph, bindings and profiles. Bindings whose port
// does not exist are dropped with a warning. Throws FlowError if the edges
// are inconsistent; callers validate against a scratch graph first.
void applyWorkspace(const WorkspaceData& data, Graph& graph, BindingTable& bindings, ProfileStore& profiles);

// File helpers. Saving writes a sibling temporary and renames it over the
// target. Both throw std::runtime_error on I/O failure.
nlohmann::json readWorkspaceFile(const std::string& path);
void writeWorkspaceFile(const std::string& path, const nlohmann::json& json);

} // namespace MidiFlow
