#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <cstdint>
#include <optional>

namespace swarm {

// Task lifecycle. Transitions only move forward:
// pending -> assigned -> completed | failed, pending -> timeout.
enum task_status {
    TASK_STATUS_PENDING,
    TASK_STATUS_ASSIGNED,
    TASK_STATUS_COMPLETED,
    TASK_STATUS_FAILED,
    TASK_STATUS_TIMEOUT
};

// Convert task status to string
const char* task_status_to_string(task_status status);

// Parse task status; returns nullopt for unknown strings
std::optional<task_status> task_status_from_string(const std::string& str);

// True for completed, failed and timeout
bool task_status_is_terminal(task_status status);

// Delegable unit of work
struct swarm_task {
    std::string task_id;         // "task-" + 32 hex digits
    std::string task_type;       // Capability required to execute
    nlohmann::json payload;      // Opaque input for the executor
    std::string requester_id;    // Originating node
    int priority = 1;            // Informational only
    int timeout_seconds = 300;   // Requester's wait ceiling
    double created_at = 0.0;     // Epoch seconds
    std::optional<std::string> assigned_to;
    task_status status = TASK_STATUS_PENDING;
    std::optional<nlohmann::json> result;

    // Build a new pending task with a fresh id and created_at = now
    static swarm_task create(const std::string& task_type,
                             const nlohmann::json& payload,
                             const std::string& requester_id,
                             int priority = 1,
                             int timeout_seconds = 300);

    // Serialize to JSON
    std::string to_json() const;

    // Deserialize from JSON, throws nlohmann::json::exception on malformed input
    static swarm_task from_json(const std::string& json_str);

    bool operator==(const swarm_task& other) const;
    bool operator!=(const swarm_task& other) const { return !(*this == other); }
};

// Entry of the shared task status hash
struct task_status_record {
    task_status status = TASK_STATUS_PENDING;
    std::optional<std::string> assigned_to;
    std::optional<std::string> processed_by;
    std::optional<nlohmann::json> result;
    std::optional<std::string> error;
    double created_at = 0.0;
    double assigned_at = 0.0;
    double completed_at = 0.0;
    double failed_at = 0.0;
    double timed_out_at = 0.0;

    // Serialize to JSON, zero timestamps are omitted
    std::string to_json() const;

    // Deserialize from JSON, throws on malformed input or unknown status
    static task_status_record from_json(const std::string& json_str);

    // Most recent transition time, used by the retention sweep
    double last_transition() const;
};

// Generate "task-" + 128 random bits as hex
std::string generate_task_id();

// Generate a short random hex string (node id suffixes)
std::string generate_hex(size_t digits);

// Get current timestamp in milliseconds
int64_t get_timestamp_ms();

// Get current timestamp in (fractional) seconds
double get_timestamp();

} // namespace swarm
