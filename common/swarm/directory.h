#pragma once

#include "node.h"
#include "store.h"
#include <string>
#include <vector>
#include <optional>

namespace swarm {

// View of the swarm's peers, backed by the shared nodes hash.
// Every method performs store I/O and may throw store_error.
class node_directory {
public:
    node_directory(store_interface& store, const swarm_keys& keys);

    // Idempotent upsert of a node entry
    void register_node(const swarm_node& node);

    // Remove a node entry; returns false if it was not present
    bool unregister_node(const std::string& node_id);

    // Read one entry; nullopt when missing or unreadable
    std::optional<swarm_node> get_node(const std::string& node_id);

    // All readable entries. Malformed blobs are skipped.
    std::vector<swarm_node> snapshot();

    // Delete every entry whose heartbeat is older than timeout_seconds.
    // Malformed entries are left alone. Returns the evicted ids.
    std::vector<std::string> sweep_stale(double now, double timeout_seconds);

private:
    store_interface& store;
    swarm_keys keys;
};

} // namespace swarm
