#pragma once

#include "task.h"
#include "store.h"
#include "executor.h"
#include "failure.h"
#include <string>
#include <vector>
#include <memory>
#include <cstdint>

namespace swarm {

// Consumer side of delegation: claims tasks from the capability queues this
// node serves and runs them on supervised threads.
class task_processor {
public:
    task_processor(store_interface& store,
                   const swarm_keys& keys,
                   const std::string& node_id,
                   const std::vector<std::string>& capabilities,
                   const executor_registry& executors,
                   int max_concurrent_tasks,
                   failure_history* failures = nullptr);
    ~task_processor();

    task_processor(const task_processor&) = delete;
    task_processor& operator=(const task_processor&) = delete;

    // One poll-and-claim cycle: at most one task per capability, nothing when
    // saturated. Store errors are logged, never thrown. Returns the number of
    // tasks claimed.
    int poll_and_claim();

    // Run one claimed task to a terminal status record (synchronous)
    void execute(const swarm_task& task);

    // Join executions that have finished
    size_t reap();

    // Cancel and wait for in-flight executions. Returns true when all
    // returned within timeout_ms (negative: no limit).
    bool drain(int64_t timeout_ms = -1);

    // Tasks currently executing on this node
    size_t active_count() const;
    std::vector<std::string> active_tasks() const;

    // active_count / max_concurrent_tasks, clamped to [0,1]
    double load_factor() const;

    int max_concurrent() const;

    const std::vector<std::string>& capabilities() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

} // namespace swarm
