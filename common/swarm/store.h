#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <cstdint>

namespace swarm {

// Raised by store implementations on connectivity or protocol failures
class store_error : public std::runtime_error {
public:
    explicit store_error(const std::string& what) : std::runtime_error(what) {}
};

// Outcome of an atomic pop-and-claim
enum claim_outcome {
    CLAIM_OUTCOME_EMPTY,      // Queue was empty
    CLAIM_OUTCOME_CLAIMED,    // Task popped and marked assigned to caller
    CLAIM_OUTCOME_ABANDONED,  // Task popped but its record was no longer pending
    CLAIM_OUTCOME_INVALID     // Popped blob was not a task
};

const char* claim_outcome_to_string(claim_outcome outcome);

struct claim_result {
    claim_outcome outcome = CLAIM_OUTCOME_EMPTY;
    std::string payload;     // Popped task blob (empty when queue was empty)
};

// Key schema of the shared store
struct swarm_keys {
    std::string prefix = "swarm";

    std::string nodes() const { return prefix + ":nodes"; }
    std::string queue(const std::string& task_type) const { return prefix + ":tasks:" + task_type; }
    std::string task_status() const { return prefix + ":task_status"; }
    std::string state(const std::string& state_key) const { return prefix + ":state:" + state_key; }
};

// Shared key-value store used as the only coordination substrate.
// All methods may throw store_error.
class store_interface {
public:
    virtual ~store_interface() = default;

    // Connectivity probe
    virtual bool ping() = 0;

    // Hash operations
    virtual void hset(const std::string& key, const std::string& field, const std::string& value) = 0;
    virtual std::optional<std::string> hget(const std::string& key, const std::string& field) = 0;
    virtual std::map<std::string, std::string> hgetall(const std::string& key) = 0;
    virtual bool hdel(const std::string& key, const std::string& field) = 0;

    // List operations (FIFO: push tail, pop head)
    virtual void rpush(const std::string& key, const std::string& value) = 0;
    virtual std::optional<std::string> lpop(const std::string& key) = 0;
    virtual int64_t llen(const std::string& key) = 0;
    virtual int64_t lrem(const std::string& key, const std::string& value) = 0;

    // Atomically pop the head of queue_key and, if the popped task's record in
    // status_key is missing or pending, overwrite it with
    // {status: assigned, assigned_to: node_id, assigned_at: now}.
    virtual claim_result claim_next(const std::string& queue_key,
                                    const std::string& status_key,
                                    const std::string& node_id,
                                    double now) = 0;

    // Atomically replace status_key[task_id] with record_json iff the current
    // record's status is one of allowed_from ("none" matches a missing record).
    virtual bool advance_status(const std::string& status_key,
                                const std::string& task_id,
                                const std::string& record_json,
                                const std::vector<std::string>& allowed_from) = 0;
};

// In-process store. Peers sharing one instance form a swarm inside a single
// process; used for standalone mode and tests.
class memory_store : public store_interface {
public:
    memory_store();
    ~memory_store();

    bool ping() override;

    void hset(const std::string& key, const std::string& field, const std::string& value) override;
    std::optional<std::string> hget(const std::string& key, const std::string& field) override;
    std::map<std::string, std::string> hgetall(const std::string& key) override;
    bool hdel(const std::string& key, const std::string& field) override;

    void rpush(const std::string& key, const std::string& value) override;
    std::optional<std::string> lpop(const std::string& key) override;
    int64_t llen(const std::string& key) override;
    int64_t lrem(const std::string& key, const std::string& value) override;

    claim_result claim_next(const std::string& queue_key,
                            const std::string& status_key,
                            const std::string& node_id,
                            double now) override;

    bool advance_status(const std::string& status_key,
                        const std::string& task_id,
                        const std::string& record_json,
                        const std::vector<std::string>& allowed_from) override;

    // Simulate a connectivity loss: every operation throws store_error
    void set_available(bool available);

    // Total number of list entries across all keys
    size_t total_queued() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

} // namespace swarm
