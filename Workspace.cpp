// Workspace.cpp
#include "Workspace.hpp"
#include "FlowError.hpp"
#include "Log.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <stdexcept>

namespace MidiFlow {

nlohmann::json workspaceToJson(const std::string& workspaceId, const Graph& graph, const BindingTable& bindings,
                               const ProfileStore& profiles) {
    nlohmann::json out;
    out["version"] = kWorkspaceVersion;
    out["workspace_id"] = workspaceId;

    nlohmann::json nodes = nlohmann::json::array();
    for (NodeId id : graph.nodeIds()) {
        const Node& n = graph.node(id);
        nodes.push_back({{"id", id},
                         {"type", nodeTemplate(n.kind()).typeId},
                         {"title", n.title},
                         {"config", configToJson(n.config)}});
    }
    out["nodes"] = std::move(nodes);

    nlohmann::json connections = nlohmann::json::array();
    for (const auto& e : graph.edges()) {
        connections.push_back({{"id", e.id},
                               {"source_node", e.from.node},
                               {"source_port", e.from.port},
                               {"target_node", e.to.node},
                               {"target_port", e.to.port}});
    }
    out["connections"] = std::move(connections);

    nlohmann::json bound = nlohmann::json::array();
    for (const auto& b : bindings.bindings()) {
        nlohmann::json j = keyToJson(b.key);
        j["node"] = b.target.node;
        j["port"] = b.target.port;
        bound.push_back(std::move(j));
    }
    out["bindings"] = std::move(bound);
    out["profiles"] = profiles.toJson();
    return out;
}

static const nlohmann::json& requireField(const nlohmann::json& obj, const char* key, const char* what) {
    if (!obj.is_object() || !obj.contains(key)) {
        throw FlowError(ErrorCode::InvalidConfig, fmt::format("{} is missing '{}'", what, key));
    }
    return obj.at(key);
}

static int requireInt(const nlohmann::json& obj, const char* key, const char* what) {
    const auto& v = requireField(obj, key, what);
    auto value = jsonToInt(v);
    if (!value) throw FlowError(ErrorCode::InvalidConfig, fmt::format("{} '{}' must be an integer", what, key));
    return *value;
}

static std::string requireString(const nlohmann::json& obj, const char* key, const char* what) {
    const auto& v = requireField(obj, key, what);
    if (!v.is_string()) throw FlowError(ErrorCode::InvalidConfig, fmt::format("{} '{}' must be a string", what, key));
    return v.get<std::string>();
}

static const nlohmann::json& optionalArray(const nlohmann::json& doc, const char* key) {
    static const nlohmann::json empty = nlohmann::json::array();
    if (!doc.contains(key)) return empty;
    const auto& v = doc.at(key);
    if (!v.is_array()) throw FlowError(ErrorCode::InvalidConfig, fmt::format("workspace '{}' must be an array", key));
    return v;
}

WorkspaceData parseWorkspace(const nlohmann::json& doc) {
    if (!doc.is_object()) throw FlowError(ErrorCode::InvalidConfig, "workspace must be a JSON object");
    int version = kWorkspaceVersion;
    if (doc.contains("version")) {
        auto v = jsonToInt(doc.at("version"));
        if (!v) throw FlowError(ErrorCode::InvalidConfig, "workspace 'version' must be an integer");
        version = *v;
    }
    if (version > kWorkspaceVersion) {
        throw FlowError(ErrorCode::InvalidConfig, fmt::format("workspace version {} is newer than supported {}", version, kWorkspaceVersion));
    }

    WorkspaceData data;
    if (doc.contains("workspace_id") && doc.at("workspace_id").is_string()) {
        data.workspaceId = doc.at("workspace_id").get<std::string>();
    }

    for (const auto& jn : optionalArray(doc, "nodes")) {
        WorkspaceData::NodeEntry entry;
        entry.id = requireInt(jn, "id", "node");
        const std::string type = requireString(jn, "type", "node");
        auto kind = kindFromTypeId(type);
        if (!kind) throw FlowError(ErrorCode::InvalidConfig, fmt::format("node {} has unknown type '{}'", entry.id, type));
        if (jn.contains("title") && jn.at("title").is_string()) entry.title = jn.at("title").get<std::string>();
        entry.config = parseConfig(*kind, jn.contains("config") ? jn.at("config") : nlohmann::json::object());
        data.nodes.push_back(std::move(entry));
    }
    std::sort(data.nodes.begin(), data.nodes.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
    for (size_t i = 1; i < data.nodes.size(); ++i) {
        if (data.nodes[i].id == data.nodes[i - 1].id) {
            throw FlowError(ErrorCode::InvalidConfig, fmt::format("duplicate node id {}", data.nodes[i].id));
        }
    }

    int nextEdgeId = 1;
    for (const auto& jc : optionalArray(doc, "connections")) {
        Edge e;
        e.id = jc.contains("id") ? requireInt(jc, "id", "connection") : 0;
        e.from = {requireInt(jc, "source_node", "connection"), requireString(jc, "source_port", "connection")};
        e.to = {requireInt(jc, "target_node", "connection"), requireString(jc, "target_port", "connection")};
        data.edges.push_back(std::move(e));
    }
    // Older documents carry no edge ids
    for (const auto& e : data.edges) nextEdgeId = std::max(nextEdgeId, e.id + 1);
    for (auto& e : data.edges) {
        if (e.id == 0) e.id = nextEdgeId++;
    }
    std::sort(data.edges.begin(), data.edges.end(), [](const Edge& a, const Edge& b) { return a.id < b.id; });

    for (const auto& jb : optionalArray(doc, "bindings")) {
        Binding b;
        b.key = keyFromJson(jb);
        b.target = {requireInt(jb, "node", "binding"), requireString(jb, "port", "binding")};
        data.bindings.push_back(std::move(b));
    }

    if (doc.contains("profiles")) {
        ProfileStore store;
        store.fromJson(doc.at("profiles"));
        data.profiles = store.profiles();
    }
    return data;
}

void applyWorkspace(const WorkspaceData& data, Graph& graph, BindingTable& bindings, ProfileStore& profiles) {
    graph.clear();
    bindings.clear();
    profiles.clear();
    for (const auto& n : data.nodes) graph.restoreNode(n.id, n.config, n.title);
    for (const auto& e : data.edges) graph.restoreEdge(e.id, e.from, e.to);
    for (const auto& b : data.bindings) {
        const Port* port = graph.findInput(b.target);
        if (!port) {
            MIDIFLOW_WARN("workspace binding {} -> {} targets no input port; dropped", toString(b.key), toString(b.target));
            continue;
        }
        if (port->type == ValueType::String) {
            MIDIFLOW_WARN("workspace binding {} -> {} targets a string port; dropped", toString(b.key), toString(b.target));
            continue;
        }
        bindings.bind(b.key, b.target);
    }
    for (const auto& p : data.profiles) profiles.add(p);
}

nlohmann::json readWorkspaceFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.good()) throw std::runtime_error("cannot open workspace file: " + path);
    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(fmt::format("workspace file {} is not valid JSON: {}", path, e.what()));
    }
    return j;
}

void writeWorkspaceFile(const std::string& path, const nlohmann::json& json) {
    const std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.good()) throw std::runtime_error("cannot write workspace file: " + tmp);
        out << json.dump(2) << "\n";
        out.flush();
        if (!out.good()) throw std::runtime_error("failed writing workspace file: " + tmp);
    }
    if (std::rename(tmp.c_str(), path.c_str()) != 0) {
        std::remove(tmp.c_str());
        throw std::runtime_error("cannot replace workspace file: " + path);
    }
}

} // namespace MidiFlow
