// Profiles.cpp
#include "Profiles.hpp"
#include "FlowError.hpp"
#include "Log.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <mutex>
#include <random>

namespace MidiFlow {

std::string newProfileId() {
    static std::mutex mutex;
    static std::mt19937_64 rng{std::random_device{}()};
    std::lock_guard<std::mutex> lock(mutex);
    return fmt::format("{:016x}{:016x}", rng(), rng());
}

static const Node& requireMidiInput(const Graph& graph, NodeId id) {
    const Node& node = graph.node(id);
    if (node.kind() != NodeKind::MidiInput) {
        throw FlowError(ErrorCode::InvalidConfig, fmt::format("node {} is not a MIDI input node", id));
    }
    return node;
}

const Profile& ProfileStore::capture(const std::string& name, const Graph& graph, const BindingTable& bindings,
                                     NodeId midiNode) {
    const Node& node = requireMidiInput(graph, midiNode);
    Profile profile;
    profile.id = newProfileId();
    profile.name = name.empty() ? node.title : name;
    for (const auto& b : bindings.bindingsFor(midiNode)) {
        profile.entries.push_back({b.key, b.target.port});
    }
    MIDIFLOW_INFO("captured profile '{}' with {} controls from node {}", profile.name, profile.entries.size(), midiNode);
    items.push_back(std::move(profile));
    return items.back();
}

size_t ProfileStore::apply(const std::string& profileId, const Graph& graph, BindingTable& bindings,
                           NodeId midiNode) const {
    const Profile* profile = find(profileId);
    if (!profile) throw FlowError(ErrorCode::NotFound, fmt::format("no profile '{}'", profileId));
    const Node& node = requireMidiInput(graph, midiNode);

    size_t applied = 0;
    for (const auto& entry : profile->entries) {
        if (node.inputIndex(entry.port) < 0) {
            MIDIFLOW_DEBUG("profile '{}': node {} has no port '{}'", profile->name, midiNode, entry.port);
            continue;
        }
        bindings.bind(entry.key, PortRef{midiNode, entry.port});
        ++applied;
    }
    MIDIFLOW_INFO("applied profile '{}' to node {} ({} of {} controls)", profile->name, midiNode, applied,
                  profile->entries.size());
    return applied;
}

void ProfileStore::add(Profile profile) {
    auto it = std::find_if(items.begin(), items.end(), [&](const Profile& p) { return p.id == profile.id; });
    if (it != items.end()) *it = std::move(profile);
    else items.push_back(std::move(profile));
}

bool ProfileStore::remove(const std::string& profileId) {
    auto it = std::find_if(items.begin(), items.end(), [&](const Profile& p) { return p.id == profileId; });
    if (it == items.end()) return false;
    items.erase(it);
    return true;
}

const Profile* ProfileStore::find(const std::string& profileId) const {
    auto it = std::find_if(items.begin(), items.end(), [&](const Profile& p) { return p.id == profileId; });
    return it == items.end() ? nullptr : &*it;
}

nlohmann::json ProfileStore::toJson() const {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& p : items) {
        nlohmann::json entries = nlohmann::json::array();
        for (const auto& e : p.entries) {
            nlohmann::json j = keyToJson(e.key);
            j["port"] = e.port;
            entries.push_back(std::move(j));
        }
        out.push_back({{"id", p.id}, {"name", p.name}, {"entries", std::move(entries)}});
    }
    return out;
}

void ProfileStore::fromJson(const nlohmann::json& json) {
    if (!json.is_array()) throw FlowError(ErrorCode::InvalidConfig, "profiles must be an array");
    std::vector<Profile> loaded;
    for (const auto& jp : json) {
        if (!jp.is_object() || !jp.contains("id") || !jp.at("id").is_string()) {
            throw FlowError(ErrorCode::InvalidConfig, "profile requires a string id");
        }
        Profile p;
        p.id = jp.at("id").get<std::string>();
        if (jp.contains("name") && jp.at("name").is_string()) p.name = jp.at("name").get<std::string>();
        if (jp.contains("entries")) {
            if (!jp.at("entries").is_array()) {
                throw FlowError(ErrorCode::InvalidConfig, fmt::format("profile '{}' entries must be an array", p.id));
            }
            for (const auto& je : jp.at("entries")) {
                if (!je.is_object() || !je.contains("port") || !je.at("port").is_string()) {
                    throw FlowError(ErrorCode::InvalidConfig, fmt::format("profile '{}' entry requires a port", p.id));
                }
                p.entries.push_back({keyFromJson(je), je.at("port").get<std::string>()});
            }
        }
        loaded.push_back(std::move(p));
    }
    items = std::move(loaded);
}

} // namespace MidiFlow
