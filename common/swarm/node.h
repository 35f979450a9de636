#pragma once

#include <string>
#include <vector>

namespace swarm {

// Node status (informational, eviction is driven by last_heartbeat age)
enum node_status {
    NODE_STATUS_ACTIVE,      // Accepting work
    NODE_STATUS_BUSY,        // Concurrency budget exhausted
    NODE_STATUS_OFFLINE      // Shutting down or unreachable
};

// Convert node status to string
const char* node_status_to_string(node_status status);

// Directory entry for one peer
struct swarm_node {
    std::string node_id;                    // Unique per process lifetime
    std::string instance_url;               // Address for out-of-band calls
    std::vector<std::string> capabilities;  // Task types this node executes
    double load_factor = 0.0;               // active / max_concurrent, in [0,1]
    double last_heartbeat = 0.0;            // Epoch seconds of last self-report
    node_status status = NODE_STATUS_ACTIVE;

    // Serialize to JSON
    std::string to_json() const;

    // Deserialize from JSON, throws on malformed input
    static swarm_node from_json(const std::string& json_str);

    // Check if node declares capability
    bool has_capability(const std::string& capability) const;

    // Seconds since last heartbeat
    double heartbeat_age(double now) const;

    bool operator==(const swarm_node& other) const;
};

} // namespace swarm
