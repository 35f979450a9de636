#pragma once

#include "executor.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace swarm {

// Owns every execution thread spawned by a processor so they can be reaped,
// cancelled and drained as one unit. Destruction cancels and joins.
class task_group {
public:
    using job = std::function<void(const cancel_token&)>;

    task_group();
    ~task_group();

    task_group(const task_group&) = delete;
    task_group& operator=(const task_group&) = delete;

    // Start job on its own thread
    void spawn(const std::string& name, job fn);

    // Join threads whose job has returned; returns how many were joined
    size_t reap();

    // Block until every job has returned or timeout_ms elapses (negative:
    // no limit). Returns true when nothing is left running.
    bool wait(int64_t timeout_ms = -1);

    // Raise the shared cancel token
    void cancel();

    // Jobs that have not returned yet
    size_t running() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

} // namespace swarm
