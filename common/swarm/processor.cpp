#include "processor.h"
#include "supervisor.h"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <mutex>
#include <set>
#include <stdexcept>

using json = nlohmann::json;

namespace swarm {

struct task_processor::impl {
    store_interface& store;
    swarm_keys keys;
    std::string node_id;
    std::vector<std::string> capabilities;
    executor_registry executors;
    int max_concurrent;
    failure_history* failures;

    std::set<std::string> active;
    mutable std::mutex mutex;

    // Declared last: destroyed first, joining executions while the rest is alive
    task_group group;

    impl(store_interface& s, const swarm_keys& k, const std::string& id,
         const std::vector<std::string>& caps, const executor_registry& execs,
         int max, failure_history* f)
        : store(s), keys(k), node_id(id), capabilities(caps), executors(execs),
          max_concurrent(max), failures(f) {}

    void record_failure(error_type error, const std::string& message,
                        const std::string& task_id, const std::string& task_type) {
        if (failures) {
            failures->record(error, message, task_id, task_type, node_id);
        }
    }

    // Write a terminal record; only an assigned record may be advanced.
    // A record that cannot be serialized is replaced by a failed one.
    void finish(const std::string& task_id, const task_status_record& rec) {
        std::string blob;
        try {
            blob = rec.to_json();
        } catch (const json::exception& e) {
            SPDLOG_ERROR("Task {} produced an unserializable record: {}", task_id, e.what());
            record_failure(ERROR_TYPE_EXECUTION, e.what(), task_id, "");

            task_status_record failed;
            failed.status = TASK_STATUS_FAILED;
            failed.assigned_to = rec.assigned_to;
            failed.processed_by = rec.processed_by;
            failed.error = std::string("unserializable result: ") + e.what();
            failed.failed_at = get_timestamp();
            blob = failed.to_json();
        }

        try {
            if (!store.advance_status(keys.task_status(), task_id, blob, {"assigned"})) {
                SPDLOG_WARN("Status of task {} changed while executing, {} result discarded",
                            task_id, task_status_to_string(rec.status));
            }
        } catch (const store_error& e) {
            SPDLOG_ERROR("Failed to record status of task {}: {}", task_id, e.what());
            record_failure(ERROR_TYPE_CONNECTION, e.what(), task_id, "");
        }
    }

    void fail_claimed(const std::string& task_id, const std::string& task_type,
                      error_type error, const std::string& message) {
        task_status_record rec;
        rec.status = TASK_STATUS_FAILED;
        rec.assigned_to = node_id;
        rec.processed_by = node_id;
        rec.error = message;
        rec.failed_at = get_timestamp();
        finish(task_id, rec);
        record_failure(error, message, task_id, task_type);
    }

    // Drops a task from the active set when its execution scope ends
    struct active_guard {
        impl& owner;
        const std::string& task_id;
        ~active_guard() {
            std::lock_guard<std::mutex> lock(owner.mutex);
            owner.active.erase(task_id);
        }
    };

    void run(const swarm_task& task, const cancel_token& cancel) {
        active_guard guard{*this, task.task_id};

        SPDLOG_INFO("Executing task {} of type {}", task.task_id, task.task_type);

        task_status_record rec;
        rec.assigned_to = node_id;
        rec.processed_by = node_id;

        auto fail = [&](const std::string& message) {
            SPDLOG_ERROR("Task execution failed: {} ({})", task.task_id, message);
            rec.result.reset();
            rec.status = TASK_STATUS_FAILED;
            rec.error = message;
            rec.failed_at = get_timestamp();
            record_failure(ERROR_TYPE_EXECUTION, message, task.task_id, task.task_type);
        };

        try {
            auto executor = executors.find(task.task_type);
            if (!executor) {
                throw std::runtime_error("no executor registered for task type: " + task.task_type);
            }
            rec.result = executor->execute(task, cancel);
            rec.status = TASK_STATUS_COMPLETED;
            rec.completed_at = get_timestamp();
        } catch (const std::exception& e) {
            fail(e.what());
        } catch (...) {
            fail("unknown exception");
        }

        finish(task.task_id, rec);
    }

    size_t active_count() const {
        std::lock_guard<std::mutex> lock(mutex);
        return active.size();
    }
};

task_processor::task_processor(store_interface& store,
                               const swarm_keys& keys,
                               const std::string& node_id,
                               const std::vector<std::string>& capabilities,
                               const executor_registry& executors,
                               int max_concurrent_tasks,
                               failure_history* failures)
    : pimpl(std::make_unique<impl>(store, keys, node_id, capabilities, executors,
                                   std::max(1, max_concurrent_tasks), failures)) {}

task_processor::~task_processor() = default;

int task_processor::poll_and_claim() {
    reap();

    // Backpressure: no polling while the concurrency budget is used up
    if (pimpl->active_count() >= static_cast<size_t>(pimpl->max_concurrent)) {
        return 0;
    }

    int claimed = 0;

    for (const auto& capability : pimpl->capabilities) {
        if (pimpl->active_count() >= static_cast<size_t>(pimpl->max_concurrent)) {
            break;
        }

        claim_result claim;
        try {
            claim = pimpl->store.claim_next(pimpl->keys.queue(capability),
                                            pimpl->keys.task_status(),
                                            pimpl->node_id,
                                            get_timestamp());
        } catch (const store_error& e) {
            SPDLOG_ERROR("Error polling queue for {}: {}", capability, e.what());
            pimpl->record_failure(ERROR_TYPE_CONNECTION, e.what(), "", capability);
            continue;
        }

        switch (claim.outcome) {
            case CLAIM_OUTCOME_EMPTY:
                continue;
            case CLAIM_OUTCOME_INVALID:
                SPDLOG_WARN("Dropped undecodable entry from {} queue", capability);
                pimpl->record_failure(ERROR_TYPE_INVALID_TASK, "undecodable queue entry", "", capability);
                continue;
            case CLAIM_OUTCOME_ABANDONED:
                SPDLOG_INFO("Dropped task abandoned by its requester from {} queue", capability);
                continue;
            case CLAIM_OUTCOME_CLAIMED:
                break;
        }

        swarm_task task;
        try {
            task = swarm_task::from_json(claim.payload);
        } catch (const json::exception& e) {
            // claim_next only accepts blobs with a task_id
            std::string task_id = json::parse(claim.payload, nullptr, false).value("task_id", "");
            SPDLOG_ERROR("Claimed task {} is malformed: {}", task_id, e.what());
            pimpl->fail_claimed(task_id, capability, ERROR_TYPE_INVALID_TASK,
                                std::string("malformed task: ") + e.what());
            continue;
        }

        if (task.task_type != capability || !pimpl->executors.has(task.task_type)) {
            SPDLOG_WARN("Claimed task {} of unsupported type {}", task.task_id, task.task_type);
            pimpl->fail_claimed(task.task_id, task.task_type, ERROR_TYPE_NO_HANDLER,
                                "no executor registered for task type: " + task.task_type);
            continue;
        }

        task.assigned_to = pimpl->node_id;
        task.status = TASK_STATUS_ASSIGNED;

        {
            std::lock_guard<std::mutex> lock(pimpl->mutex);
            pimpl->active.insert(task.task_id);
        }

        impl* state = pimpl.get();
        pimpl->group.spawn(task.task_id, [state, task](const cancel_token& cancel) {
            state->run(task, cancel);
        });
        claimed++;
    }

    return claimed;
}

void task_processor::execute(const swarm_task& task) {
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        pimpl->active.insert(task.task_id);
    }
    cancel_token token;
    pimpl->run(task, token);
}

size_t task_processor::reap() {
    return pimpl->group.reap();
}

bool task_processor::drain(int64_t timeout_ms) {
    pimpl->group.cancel();
    return pimpl->group.wait(timeout_ms);
}

size_t task_processor::active_count() const {
    return pimpl->active_count();
}

std::vector<std::string> task_processor::active_tasks() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    return std::vector<std::string>(pimpl->active.begin(), pimpl->active.end());
}

double task_processor::load_factor() const {
    double load = static_cast<double>(active_count()) / pimpl->max_concurrent;
    return std::min(1.0, std::max(0.0, load));
}

int task_processor::max_concurrent() const {
    return pimpl->max_concurrent;
}

const std::vector<std::string>& task_processor::capabilities() const {
    return pimpl->capabilities;
}

} // namespace swarm
