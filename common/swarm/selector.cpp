#include "selector.h"

namespace swarm {

std::optional<std::string> select_node(const std::string& task_type,
                                       const std::vector<swarm_node>& snapshot,
                                       const std::string& self_id,
                                       double now,
                                       double max_age_seconds) {
    const swarm_node* best = nullptr;

    for (const auto& node : snapshot) {
        // Don't delegate to ourselves
        if (node.node_id == self_id) {
            continue;
        }
        if (!node.has_capability(task_type)) {
            continue;
        }
        // Too stale to pick, even if not yet evicted
        if (node.heartbeat_age(now) > max_age_seconds) {
            continue;
        }
        if (best == nullptr || node.load_factor < best->load_factor) {
            best = &node;
        }
    }

    if (best == nullptr) {
        return std::nullopt;
    }
    return best->node_id;
}

} // namespace swarm
