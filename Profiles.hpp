// Profiles.hpp
//
// Reusable controller layouts. A profile records which control drives which
// MidiInput port *name*, independent of node ids, so the same layout can be
// applied to any MidiInput node of any graph.
#pragma once
#include "Bindings.hpp"
#include "ControlEvent.hpp"
#include "MidiFlowCore.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace MidiFlow {

struct ProfileEntry {
    ControlKey key;
    std::string port;
};

struct Profile {
    std::string id; // 32 hex digits
    std::string name;
    std::vector<ProfileEntry> entries;
};

class ProfileStore {
public:
    // Records every binding that targets `midiNode`. Throws NotFound for an
    // unknown node and InvalidConfig if it is not a MidiInput node.
    const Profile& capture(const std::string& name, const Graph& graph, const BindingTable& bindings, NodeId midiNode);

    // Binds each entry whose port name exists on `midiNode`; returns the
    // number of bindings made. Throws NotFound for an unknown profile or node.
    size_t apply(const std::string& profileId, const Graph& graph, BindingTable& bindings, NodeId midiNode) const;

    // Inserts or replaces by id
    void add(Profile profile);
    bool remove(const std::string& profileId);
    const Profile* find(const std::string& profileId) const;
    const std::vector<Profile>& profiles() const { return items; }
    void clear() { items.clear(); }

    nlohmann::json toJson() const;
    // Replaces the store contents. Throws FlowError(InvalidConfig).
    void fromJson(const nlohmann::json& json);

private:
    std::vector<Profile> items; // insertion order
};

std::string newProfileId();

} // namespace MidiFlow
