#include "directory.h"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace swarm {

node_directory::node_directory(store_interface& store, const swarm_keys& keys)
    : store(store), keys(keys) {}

void node_directory::register_node(const swarm_node& node) {
    store.hset(keys.nodes(), node.node_id, node.to_json());
}

bool node_directory::unregister_node(const std::string& node_id) {
    return store.hdel(keys.nodes(), node_id);
}

std::optional<swarm_node> node_directory::get_node(const std::string& node_id) {
    auto blob = store.hget(keys.nodes(), node_id);
    if (!blob) {
        return std::nullopt;
    }
    try {
        return swarm_node::from_json(*blob);
    } catch (const json::exception& e) {
        SPDLOG_DEBUG("Unreadable directory entry {}: {}", node_id, e.what());
        return std::nullopt;
    }
}

std::vector<swarm_node> node_directory::snapshot() {
    std::vector<swarm_node> nodes;
    for (const auto& [node_id, blob] : store.hgetall(keys.nodes())) {
        try {
            nodes.push_back(swarm_node::from_json(blob));
        } catch (const json::exception& e) {
            SPDLOG_DEBUG("Skipping unreadable directory entry {}: {}", node_id, e.what());
        }
    }
    return nodes;
}

std::vector<std::string> node_directory::sweep_stale(double now, double timeout_seconds) {
    std::vector<std::string> evicted;
    for (const auto& node : snapshot()) {
        if (node.heartbeat_age(now) > timeout_seconds) {
            if (store.hdel(keys.nodes(), node.node_id)) {
                SPDLOG_INFO("Removed stale node: {} (last heartbeat {:.1f}s ago)",
                            node.node_id, node.heartbeat_age(now));
            }
            evicted.push_back(node.node_id);
        }
    }
    return evicted;
}

} // namespace swarm
