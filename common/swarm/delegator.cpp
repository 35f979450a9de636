#include "delegator.h"
#include "selector.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <thread>

using json = nlohmann::json;

namespace swarm {

const char* delegation_outcome_to_string(delegation_outcome outcome) {
    switch (outcome) {
        case DELEGATION_OUTCOME_COMPLETED:   return "completed";
        case DELEGATION_OUTCOME_FAILED:      return "failed";
        case DELEGATION_OUTCOME_NO_PEER:     return "no_peer";
        case DELEGATION_OUTCOME_TIMEOUT:     return "timeout";
        case DELEGATION_OUTCOME_STORE_ERROR: return "store_error";
        case DELEGATION_OUTCOME_UNAVAILABLE: return "unavailable";
        case DELEGATION_OUTCOME_INVALID_TASK: return "invalid_task";
        default:                             return "unknown";
    }
}

std::string delegation_result::to_json() const {
    json j;
    j["outcome"] = delegation_outcome_to_string(outcome);
    if (!task_id.empty()) j["task_id"] = task_id;
    if (!node_id.empty()) j["node_id"] = node_id;
    if (result) j["result"] = *result;
    if (!error.empty()) j["error"] = error;
    return j.dump();
}

task_delegator::task_delegator(store_interface& store,
                               const swarm_keys& keys,
                               const std::string& node_id,
                               const delegator_options& options,
                               failure_history* failures)
    : store(store), keys(keys), directory(store, keys), node_id(node_id),
      options(options), failures(failures) {}

std::optional<json> task_delegator::delegate(const std::string& task_type,
                                             const json& payload,
                                             int priority,
                                             int timeout_seconds) {
    return delegate_detailed(task_type, payload, priority, timeout_seconds).result;
}

delegation_result task_delegator::delegate_detailed(const std::string& task_type,
                                                    const json& payload,
                                                    int priority,
                                                    int timeout_seconds) {
    delegation_result res;
    swarm_task task = swarm_task::create(task_type, payload, node_id, priority, timeout_seconds);

    std::string blob;
    try {
        blob = task.to_json();
    } catch (const json::exception& e) {
        SPDLOG_ERROR("Task of type {} cannot be serialized: {}", task_type, e.what());
        res.outcome = DELEGATION_OUTCOME_INVALID_TASK;
        res.error = std::string("unserializable task: ") + e.what();
        record_failure(ERROR_TYPE_INVALID_TASK, res.error, task);
        return res;
    }

    try {
        auto target = select_node(task_type, directory.snapshot(), node_id,
                                  get_timestamp(), options.selection_max_age_seconds);
        if (!target) {
            SPDLOG_INFO("No suitable node found for task type: {}", task_type);
            res.outcome = DELEGATION_OUTCOME_NO_PEER;
            res.error = "no eligible node for task type: " + task_type;
            record_failure(ERROR_TYPE_NO_PEER, res.error, task);
            return res;
        }
        res.node_id = *target;

        // Pending record first: a claimant that pops immediately finds it
        task_status_record pending;
        pending.status = TASK_STATUS_PENDING;
        pending.created_at = task.created_at;
        if (!store.advance_status(keys.task_status(), task.task_id, pending.to_json(), {"none"})) {
            res.outcome = DELEGATION_OUTCOME_STORE_ERROR;
            res.error = "status record already exists for " + task.task_id;
            SPDLOG_ERROR("Task delegation failed: {}", res.error);
            record_failure(ERROR_TYPE_INTERNAL, res.error, task);
            return res;
        }
        store.rpush(keys.queue(task_type), blob);
        res.task_id = task.task_id;

        SPDLOG_INFO("Delegated task {} ({}) to node {}", task.task_id, task_type, res.node_id);
    } catch (const store_error& e) {
        SPDLOG_ERROR("Task delegation failed: {}", e.what());
        res.outcome = DELEGATION_OUTCOME_STORE_ERROR;
        res.error = e.what();
        record_failure(ERROR_TYPE_CONNECTION, res.error, task);
        return res;
    }

    return wait_for_completion(task, res);
}

delegation_result task_delegator::wait_for_completion(const swarm_task& task, delegation_result res) {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::seconds(std::max(0, task.timeout_seconds));
    const auto interval = std::chrono::milliseconds(std::max<int64_t>(1, options.poll_interval_ms));

    while (clock::now() < deadline) {
        try {
            auto blob = store.hget(keys.task_status(), task.task_id);
            if (blob) {
                try {
                    auto rec = task_status_record::from_json(*blob);
                    if (rec.status == TASK_STATUS_COMPLETED) {
                        res.outcome = DELEGATION_OUTCOME_COMPLETED;
                        res.result = rec.result ? *rec.result : json(nullptr);
                        return res;
                    }
                    if (rec.status == TASK_STATUS_FAILED) {
                        res.outcome = DELEGATION_OUTCOME_FAILED;
                        res.error = rec.error.value_or("unknown error");
                        SPDLOG_ERROR("Delegated task failed: {}", res.error);
                        record_failure(ERROR_TYPE_EXECUTION, res.error, task);
                        return res;
                    }
                } catch (const std::exception& e) {
                    SPDLOG_DEBUG("Unreadable status record for {}: {}", task.task_id, e.what());
                }
            }
        } catch (const store_error& e) {
            SPDLOG_ERROR("Error waiting for task completion: {}", e.what());
            res.outcome = DELEGATION_OUTCOME_STORE_ERROR;
            res.error = e.what();
            record_failure(ERROR_TYPE_CONNECTION, res.error, task);
            return res;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
        if (remaining.count() <= 0) {
            break;
        }
        std::this_thread::sleep_for(std::min(interval, remaining));
    }

    SPDLOG_WARN("Task {} timed out", task.task_id);
    res.outcome = DELEGATION_OUTCOME_TIMEOUT;
    res.error = "no terminal status within " + std::to_string(task.timeout_seconds) + "s";
    record_failure(ERROR_TYPE_TIMEOUT, res.error, task);
    retract(task);
    return res;
}

void task_delegator::retract(const swarm_task& task) {
    task_status_record rec;
    rec.status = TASK_STATUS_TIMEOUT;
    rec.created_at = task.created_at;
    rec.timed_out_at = get_timestamp();

    try {
        if (store.advance_status(keys.task_status(), task.task_id, rec.to_json(), {"pending"})) {
            store.lrem(keys.queue(task.task_type), task.to_json());
            SPDLOG_DEBUG("Retracted unclaimed task {}", task.task_id);
        }
    } catch (const store_error& e) {
        SPDLOG_WARN("Could not retract task {}: {}", task.task_id, e.what());
    }
}

void task_delegator::record_failure(error_type error, const std::string& message, const swarm_task& task) {
    if (failures) {
        failures->record(error, message, task.task_id, task.task_type, node_id);
    }
}

} // namespace swarm
