#pragma once

#include "params.h"
#include "node.h"
#include "store.h"
#include "executor.h"
#include "failure.h"
#include "delegator.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <memory>
#include <optional>

namespace swarm {

// Point-in-time view of this node's swarm participation
struct swarm_status {
    bool swarm_enabled = false;
    std::string node_id;
    int active_nodes = 0;
    std::vector<swarm_node> nodes;
    std::vector<std::string> active_tasks;
    std::vector<std::string> capabilities;
    std::string reason;                     // Set when not participating

    // Serialize to JSON
    std::string to_json() const;
};

// Redis store for params.store_url. Throws store_error on a malformed URL.
std::shared_ptr<store_interface> make_store(const coordinator_params& params);

// One node's membership in the swarm: owns the directory entry, the
// heartbeat thread, the task processor and the delegator/synchronizer used
// by the host. Construct one per process and hand it to whoever needs it.
class swarm_coordinator {
public:
    // A null store is replaced by make_store(params) in initialize()
    swarm_coordinator(const coordinator_params& params,
                      std::shared_ptr<store_interface> store,
                      const executor_registry& executors);
    ~swarm_coordinator();

    swarm_coordinator(const swarm_coordinator&) = delete;
    swarm_coordinator& operator=(const swarm_coordinator&) = delete;

    // Validate, connect, register and start the heartbeat. Returns false
    // (and stays unavailable) when disabled, misconfigured or the store does
    // not answer. Never throws.
    bool initialize();

    // Stop heartbeat, cancel and drain executions, unregister. Idempotent.
    void shutdown();

    bool is_available() const;

    // One heartbeat: refresh own entry, evict stale peers, claim work,
    // sweep expired status records. False when unavailable or the store
    // failed; the failure is logged and recorded.
    bool tick();

    // Delegate to the least loaded peer, nullopt unless completed
    std::optional<nlohmann::json> delegate(const std::string& task_type,
                                           const nlohmann::json& payload,
                                           int priority = 1,
                                           int timeout_seconds = 300);

    delegation_result delegate_detailed(const std::string& task_type,
                                        const nlohmann::json& payload,
                                        int priority = 1,
                                        int timeout_seconds = 300);

    // Merge local_state with the swarm's view; local_state when unavailable
    nlohmann::json sync(const std::string& state_key, const nlohmann::json& local_state);

    // Run one poll-and-claim cycle outside the heartbeat; 0 when unavailable
    int poll();

    // Delete terminal status records older than task_retention. Returns the
    // number removed, 0 when the store fails.
    size_t sweep_task_records(double now);

    swarm_status status();

    const failure_history& failures() const;

    const std::string& node_id() const;

    // Advertised capabilities (resolved from the executors when not configured)
    const std::vector<std::string>& capabilities() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

} // namespace swarm
