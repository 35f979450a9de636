#pragma once

#include "store.h"
#include <nlohmann/json.hpp>
#include <map>
#include <string>

namespace swarm {

// Merges a node's local view of a named state into the swarm-wide hash
// swarm:state:<key>, one sub-key per contributing node.
//
// A peer blob wins field by field over the local copy when its timestamp is
// newer than the merged timestamp. Fields the local copy lacks are always
// adopted. This node's own sub-key is skipped so repeated syncs of the same
// local state return the same result.
class state_synchronizer {
public:
    state_synchronizer(store_interface& store, const swarm_keys& keys, const std::string& node_id);

    // One read and one write. Returns local_state unchanged when the store
    // fails or local_state is not a serializable object. Never throws.
    nlohmann::json sync(const std::string& state_key, const nlohmann::json& local_state);

    // Merge step alone, no I/O. peers maps node id to serialized blob.
    static nlohmann::json merge(const nlohmann::json& local_state,
                                const std::map<std::string, std::string>& peers,
                                const std::string& self_id);

private:
    store_interface& store;
    swarm_keys keys;
    std::string node_id;
};

} // namespace swarm
