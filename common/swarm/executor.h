#pragma once

#include "task.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <atomic>
#include <functional>

namespace swarm {

// Cooperative cancellation flag handed to executors. Raised when the owning
// processor shuts down; long-running executors should check it.
class cancel_token {
public:
    bool is_cancelled() const { return cancelled.load(); }
    void cancel() { cancelled.store(true); }
    void reset() { cancelled.store(false); }

private:
    std::atomic<bool> cancelled{false};
};

// Business logic for one task type (abstract base class).
// execute() returns the task result or throws to report failure.
class task_executor {
public:
    virtual ~task_executor() = default;

    virtual nlohmann::json execute(const swarm_task& task, const cancel_token& cancel) = 0;
};

// Executor wrapping a callback
class function_executor : public task_executor {
public:
    using handler = std::function<nlohmann::json(const swarm_task&)>;

    explicit function_executor(handler fn);

    nlohmann::json execute(const swarm_task& task, const cancel_token& cancel) override;

private:
    handler fn;
};

// Typed task_type -> executor mapping, checked against the capabilities a
// node advertises before it joins the swarm.
class executor_registry {
public:
    // Register (or replace) the executor for task_type
    void add(const std::string& task_type, std::shared_ptr<task_executor> executor);
    void add(const std::string& task_type, function_executor::handler fn);

    // nullptr when no executor is registered
    std::shared_ptr<task_executor> find(const std::string& task_type) const;

    bool has(const std::string& task_type) const;

    // Registered task types, sorted
    std::vector<std::string> task_types() const;

    // Capabilities that have no registered executor
    std::vector<std::string> missing(const std::vector<std::string>& capabilities) const;

    bool empty() const { return executors.empty(); }

private:
    std::map<std::string, std::shared_ptr<task_executor>> executors;
};

} // namespace swarm
