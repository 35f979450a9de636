#pragma once

#include <string>
#include <vector>
#include <map>
#include <cstdint>
#include <memory>

namespace swarm {

// Error types
enum error_type {
    ERROR_TYPE_NONE,
    ERROR_TYPE_CONNECTION,      // Shared store unreachable or failing
    ERROR_TYPE_NO_PEER,         // No eligible node for the capability
    ERROR_TYPE_TIMEOUT,         // Requester stopped waiting
    ERROR_TYPE_EXECUTION,       // Executor raised
    ERROR_TYPE_INVALID_TASK,    // Queue entry could not be decoded
    ERROR_TYPE_NO_HANDLER,      // Claimed task type has no executor
    ERROR_TYPE_INTERNAL
};

// Convert error type to string
const char* error_type_to_string(error_type type);

// Failure record
struct failure_record {
    std::string task_id;         // Affected task (if any)
    std::string task_type;       // Capability involved
    std::string node_id;         // Node that observed the failure
    error_type error;            // Error type
    std::string error_message;   // Error details
    int64_t timestamp;           // Failure timestamp (ms)

    // Serialize to JSON
    std::string to_json() const;
};

// Bounded, thread-safe history of recent failures
class failure_history {
public:
    failure_history(size_t max_size = 100);
    ~failure_history();

    // Record failure, evicting the oldest beyond max_size
    void record(const failure_record& record);

    // Convenience overload stamping the current time
    void record(error_type error,
                const std::string& message,
                const std::string& task_id = "",
                const std::string& task_type = "",
                const std::string& node_id = "");

    // Most recent first
    std::vector<failure_record> recent(int limit = 100) const;

    // Failures seen per type since construction (not bounded by max_size)
    std::map<error_type, int64_t> counts() const;

    size_t size() const;

    void clear();

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

} // namespace swarm
