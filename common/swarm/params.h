#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace swarm {

struct coordinator_params {
    // Identity
    std::string node_id;                    // Defaults to "swarm-" + 8 hex digits
    std::string instance_url;
    std::vector<std::string> capabilities;  // Empty: advertise every registered executor

    // Store
    std::string store_url;                  // redis://host:port
    std::string key_prefix;                 // Namespace of all shared keys
    int store_pool_size;
    bool enabled;                           // Off: initialize() never touches the store

    // Liveness
    int64_t heartbeat_interval_ms;
    int64_t node_timeout_ms;                // Eviction age
    int64_t selection_max_age_ms;           // Peers older than this are never picked
    int64_t error_backoff_ms;               // Wait after a failed tick

    // Delegation / processing
    int max_concurrent_tasks;
    int64_t poll_interval_ms;               // Delegator status polling
    int64_t task_retention_ms;              // Terminal status records older than this are swept, 0 = keep

    // Logging
    std::string log_level;
};

// Default parameters
coordinator_params coordinator_default_params();

// Defaults overridden by SWARM_* / REDIS_URL environment variables
coordinator_params coordinator_params_from_env();

// Returns false and fills error when the parameters are inconsistent
bool validate_params(const coordinator_params& params, std::string& error);

// Split a comma separated list, trimming blanks and dropping empty items
std::vector<std::string> split_list(const std::string& value);

} // namespace swarm
