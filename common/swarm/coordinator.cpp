#include "coordinator.h"
#include "directory.h"
#include "processor.h"
#include "sync.h"
#include "redis-store.h"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/ranges.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

using json = nlohmann::json;

namespace swarm {

std::string swarm_status::to_json() const {
    json j;
    j["swarm_enabled"] = swarm_enabled;
    j["node_id"] = node_id;
    if (!swarm_enabled) {
        j["reason"] = reason;
        return j.dump();
    }
    j["active_nodes"] = active_nodes;
    j["nodes"] = json::array();
    for (const auto& node : nodes) {
        j["nodes"].push_back(json::parse(node.to_json()));
    }
    j["active_tasks"] = active_tasks;
    j["capabilities"] = capabilities;
    if (!reason.empty()) {
        j["reason"] = reason;
    }
    return j.dump();
}

std::shared_ptr<store_interface> make_store(const coordinator_params& params) {
    return std::make_shared<redis_store>(params.store_url, params.store_pool_size);
}

struct swarm_coordinator::impl {
    coordinator_params params;
    std::shared_ptr<store_interface> store;
    executor_registry executors;
    swarm_keys keys;
    std::vector<std::string> capabilities;
    failure_history failures;

    std::unique_ptr<node_directory> directory;
    std::unique_ptr<task_processor> processor;
    std::unique_ptr<task_delegator> delegator;
    std::unique_ptr<state_synchronizer> synchronizer;

    std::atomic<bool> available{false};

    std::thread heartbeat;
    std::mutex mutex;
    std::condition_variable cv;
    bool stopping = false;

    // Serializes ticks from the heartbeat thread and from the host
    std::mutex tick_mutex;

    swarm_node self_node(double now) const {
        swarm_node node;
        node.node_id = params.node_id;
        node.instance_url = params.instance_url;
        node.capabilities = capabilities;
        node.load_factor = processor->load_factor();
        node.last_heartbeat = now;
        node.status = processor->active_count() >= static_cast<size_t>(processor->max_concurrent())
            ? NODE_STATUS_BUSY : NODE_STATUS_ACTIVE;
        return node;
    }

    // Delete expired terminal status records, throws store_error
    size_t sweep_records(double now) {
        if (params.task_retention_ms <= 0) {
            return 0;
        }

        const double retention = params.task_retention_ms / 1000.0;
        const std::string key = keys.task_status();
        size_t removed = 0;

        for (const auto& [task_id, blob] : store->hgetall(key)) {
            task_status_record rec;
            try {
                rec = task_status_record::from_json(blob);
            } catch (const std::exception& e) {
                SPDLOG_DEBUG("Skipping unreadable status record {}: {}", task_id, e.what());
                continue;
            }
            if (!task_status_is_terminal(rec.status)) {
                continue;
            }
            double last = rec.last_transition();
            if (last > 0.0 && now - last > retention && store->hdel(key, task_id)) {
                removed++;
            }
        }

        if (removed > 0) {
            SPDLOG_DEBUG("Removed {} expired task status record(s)", removed);
        }
        return removed;
    }

    // One heartbeat, throws store_error
    void run_tick() {
        std::lock_guard<std::mutex> lock(tick_mutex);
        double now = get_timestamp();

        directory->register_node(self_node(now));
        directory->sweep_stale(now, params.node_timeout_ms / 1000.0);
        processor->poll_and_claim();
        sweep_records(now);
    }

    void heartbeat_loop() {
        SPDLOG_INFO("Heartbeat started for {} every {}ms", params.node_id, params.heartbeat_interval_ms);

        while (true) {
            int64_t wait_ms = params.heartbeat_interval_ms;
            try {
                run_tick();
            } catch (const std::exception& e) {
                SPDLOG_ERROR("Heartbeat loop error: {}", e.what());
                failures.record(ERROR_TYPE_CONNECTION, e.what(), "", "", params.node_id);
                wait_ms = params.error_backoff_ms;
            }

            std::unique_lock<std::mutex> lock(mutex);
            if (cv.wait_for(lock, std::chrono::milliseconds(wait_ms), [this] { return stopping; })) {
                break;
            }
        }

        SPDLOG_DEBUG("Heartbeat stopped for {}", params.node_id);
    }
};

swarm_coordinator::swarm_coordinator(const coordinator_params& params,
                                     std::shared_ptr<store_interface> store,
                                     const executor_registry& executors)
    : pimpl(std::make_unique<impl>()) {
    pimpl->params = params;
    pimpl->store = std::move(store);
    pimpl->executors = executors;
    pimpl->keys.prefix = params.key_prefix.empty() ? "swarm" : params.key_prefix;
    pimpl->capabilities = params.capabilities.empty() ? executors.task_types() : params.capabilities;
}

swarm_coordinator::~swarm_coordinator() {
    shutdown();
}

bool swarm_coordinator::initialize() {
    if (pimpl->available) {
        return true;
    }

    const auto& params = pimpl->params;

    if (!params.enabled) {
        SPDLOG_INFO("Swarm protocol disabled for node {}", params.node_id);
        return false;
    }

    std::string error;
    if (!validate_params(params, error)) {
        SPDLOG_ERROR("Invalid swarm parameters: {}", error);
        return false;
    }

    auto missing = pimpl->executors.missing(pimpl->capabilities);
    if (!missing.empty()) {
        for (const auto& capability : missing) {
            SPDLOG_ERROR("Capability {} has no registered executor", capability);
        }
        return false;
    }
    if (pimpl->capabilities.empty()) {
        SPDLOG_WARN("Node {} advertises no capabilities, it will only delegate", params.node_id);
    }

    try {
        if (!pimpl->store) {
            pimpl->store = make_store(params);
        }
        if (!pimpl->store->ping()) {
            SPDLOG_WARN("Store not available at {}. Swarm protocol disabled.", params.store_url);
            return false;
        }

        store_interface& store = *pimpl->store;
        pimpl->directory = std::make_unique<node_directory>(store, pimpl->keys);
        pimpl->processor = std::make_unique<task_processor>(store, pimpl->keys, params.node_id,
                                                            pimpl->capabilities, pimpl->executors,
                                                            params.max_concurrent_tasks, &pimpl->failures);

        delegator_options opts;
        opts.poll_interval_ms = params.poll_interval_ms;
        opts.selection_max_age_seconds = params.selection_max_age_ms / 1000.0;
        pimpl->delegator = std::make_unique<task_delegator>(store, pimpl->keys, params.node_id,
                                                            opts, &pimpl->failures);
        pimpl->synchronizer = std::make_unique<state_synchronizer>(store, pimpl->keys, params.node_id);

        pimpl->directory->register_node(pimpl->self_node(get_timestamp()));
    } catch (const std::exception& e) {
        SPDLOG_ERROR("Failed to initialize swarm coordinator: {}", e.what());
        pimpl->failures.record(ERROR_TYPE_CONNECTION, e.what(), "", "", params.node_id);
        pimpl->synchronizer.reset();
        pimpl->delegator.reset();
        pimpl->processor.reset();
        pimpl->directory.reset();
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        pimpl->stopping = false;
    }
    pimpl->available = true;
    pimpl->heartbeat = std::thread(&impl::heartbeat_loop, pimpl.get());

    SPDLOG_INFO("Swarm coordinator initialized for node {} with capabilities [{}]",
                params.node_id, fmt::join(pimpl->capabilities, ", "));
    return true;
}

void swarm_coordinator::shutdown() {
    if (!pimpl->available.exchange(false)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        pimpl->stopping = true;
    }
    pimpl->cv.notify_all();
    if (pimpl->heartbeat.joinable()) {
        pimpl->heartbeat.join();
    }

    if (pimpl->processor->active_count() > 0) {
        SPDLOG_INFO("Waiting for {} running task(s)", pimpl->processor->active_count());
    }
    pimpl->processor->drain();

    try {
        pimpl->directory->unregister_node(pimpl->params.node_id);
    } catch (const store_error& e) {
        SPDLOG_ERROR("Error during swarm shutdown: {}", e.what());
    }

    SPDLOG_INFO("Swarm coordinator for node {} shut down", pimpl->params.node_id);
}

bool swarm_coordinator::is_available() const {
    return pimpl->available;
}

bool swarm_coordinator::tick() {
    if (!pimpl->available) {
        return false;
    }

    try {
        pimpl->run_tick();
    } catch (const std::exception& e) {
        SPDLOG_ERROR("Heartbeat tick failed: {}", e.what());
        pimpl->failures.record(ERROR_TYPE_CONNECTION, e.what(), "", "", pimpl->params.node_id);
        return false;
    }
    return true;
}

std::optional<json> swarm_coordinator::delegate(const std::string& task_type,
                                                const json& payload,
                                                int priority,
                                                int timeout_seconds) {
    return delegate_detailed(task_type, payload, priority, timeout_seconds).result;
}

delegation_result swarm_coordinator::delegate_detailed(const std::string& task_type,
                                                       const json& payload,
                                                       int priority,
                                                       int timeout_seconds) {
    if (!pimpl->available) {
        delegation_result res;
        res.outcome = DELEGATION_OUTCOME_UNAVAILABLE;
        res.error = "coordinator_unavailable";
        return res;
    }
    return pimpl->delegator->delegate_detailed(task_type, payload, priority, timeout_seconds);
}

json swarm_coordinator::sync(const std::string& state_key, const json& local_state) {
    if (!pimpl->available) {
        return local_state;
    }
    return pimpl->synchronizer->sync(state_key, local_state);
}

int swarm_coordinator::poll() {
    if (!pimpl->available) {
        return 0;
    }
    return pimpl->processor->poll_and_claim();
}

size_t swarm_coordinator::sweep_task_records(double now) {
    if (!pimpl->available) {
        return 0;
    }

    try {
        return pimpl->sweep_records(now);
    } catch (const store_error& e) {
        SPDLOG_ERROR("Task record sweep failed: {}", e.what());
        pimpl->failures.record(ERROR_TYPE_CONNECTION, e.what(), "", "", pimpl->params.node_id);
        return 0;
    }
}

swarm_status swarm_coordinator::status() {
    swarm_status st;
    st.node_id = pimpl->params.node_id;

    if (!pimpl->available) {
        st.reason = "coordinator_unavailable";
        return st;
    }

    st.swarm_enabled = true;
    st.capabilities = pimpl->capabilities;
    st.active_tasks = pimpl->processor->active_tasks();

    try {
        st.nodes = pimpl->directory->snapshot();
    } catch (const store_error& e) {
        SPDLOG_ERROR("Failed to read node directory: {}", e.what());
        st.reason = "store_error";
    }
    st.active_nodes = static_cast<int>(st.nodes.size());

    return st;
}

const failure_history& swarm_coordinator::failures() const {
    return pimpl->failures;
}

const std::string& swarm_coordinator::node_id() const {
    return pimpl->params.node_id;
}

const std::vector<std::string>& swarm_coordinator::capabilities() const {
    return pimpl->capabilities;
}

} // namespace swarm
