#pragma once

#include "task.h"
#include "store.h"
#include "directory.h"
#include "failure.h"
#include <nlohmann/json.hpp>
#include <string>
#include <optional>
#include <cstdint>

namespace swarm {

// How a delegation ended
enum delegation_outcome {
    DELEGATION_OUTCOME_COMPLETED,    // Peer returned a result
    DELEGATION_OUTCOME_FAILED,       // Peer's executor raised
    DELEGATION_OUTCOME_NO_PEER,      // Nothing eligible, nothing enqueued
    DELEGATION_OUTCOME_TIMEOUT,      // Requester stopped waiting
    DELEGATION_OUTCOME_STORE_ERROR,  // Store failed while enqueuing or waiting
    DELEGATION_OUTCOME_UNAVAILABLE,  // Coordinator not connected
    DELEGATION_OUTCOME_INVALID_TASK  // Task could not be serialized, nothing enqueued
};

// Convert delegation outcome to string
const char* delegation_outcome_to_string(delegation_outcome outcome);

struct delegation_result {
    delegation_outcome outcome = DELEGATION_OUTCOME_NO_PEER;
    std::string task_id;                  // Empty when nothing was enqueued
    std::string node_id;                  // Selected peer
    std::optional<nlohmann::json> result; // Set only when completed
    std::string error;

    bool ok() const { return outcome == DELEGATION_OUTCOME_COMPLETED; }

    // Serialize to JSON
    std::string to_json() const;
};

struct delegator_options {
    int64_t poll_interval_ms = 1000;
    double selection_max_age_seconds = 60.0;
};

// Producer side of delegation: picks a peer, enqueues the task on its
// capability queue and waits for a terminal status record.
class task_delegator {
public:
    task_delegator(store_interface& store,
                   const swarm_keys& keys,
                   const std::string& node_id,
                   const delegator_options& options = delegator_options(),
                   failure_history* failures = nullptr);

    // Result of a completed delegation, nullopt otherwise. Never throws.
    std::optional<nlohmann::json> delegate(const std::string& task_type,
                                           const nlohmann::json& payload,
                                           int priority = 1,
                                           int timeout_seconds = 300);

    // Same as delegate() with the outcome spelled out
    delegation_result delegate_detailed(const std::string& task_type,
                                        const nlohmann::json& payload,
                                        int priority = 1,
                                        int timeout_seconds = 300);

private:
    delegation_result wait_for_completion(const swarm_task& task, delegation_result res);

    // Mark a still-pending task timed out and pull it from its queue
    void retract(const swarm_task& task);

    void record_failure(error_type error, const std::string& message, const swarm_task& task);

    store_interface& store;
    swarm_keys keys;
    node_directory directory;
    std::string node_id;
    delegator_options options;
    failure_history* failures;
};

} // namespace swarm
