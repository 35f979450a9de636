#include "sync.h"
#include "task.h"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace swarm {

static double blob_timestamp(const json& blob) {
    auto it = blob.find("timestamp");
    if (it == blob.end() || !it->is_number()) {
        return 0.0;
    }
    return it->get<double>();
}

state_synchronizer::state_synchronizer(store_interface& store, const swarm_keys& keys, const std::string& node_id)
    : store(store), keys(keys), node_id(node_id) {}

json state_synchronizer::merge(const json& local_state,
                               const std::map<std::string, std::string>& peers,
                               const std::string& self_id) {
    json merged = local_state;

    for (const auto& [peer_id, blob] : peers) {
        if (peer_id == self_id) {
            continue;
        }

        json peer = json::parse(blob, nullptr, false);
        if (peer.is_discarded() || !peer.is_object()) {
            SPDLOG_DEBUG("Skipping unreadable state blob from {}", peer_id);
            continue;
        }

        bool newer = blob_timestamp(peer) > blob_timestamp(merged);
        for (const auto& [field, value] : peer.items()) {
            if (newer || !merged.contains(field)) {
                merged[field] = value;
            }
        }
    }

    return merged;
}

json state_synchronizer::sync(const std::string& state_key, const json& local_state) {
    if (!local_state.is_object()) {
        SPDLOG_WARN("State {} is not an object, not synchronized", state_key);
        return local_state;
    }

    const std::string key = keys.state(state_key);

    try {
        json merged = merge(local_state, store.hgetall(key), node_id);

        json stamped = local_state;
        stamped["timestamp"] = get_timestamp();
        stamped["node_id"] = node_id;
        store.hset(key, node_id, stamped.dump());

        return merged;
    } catch (const store_error& e) {
        SPDLOG_ERROR("State synchronization failed: {}", e.what());
        return local_state;
    } catch (const json::exception& e) {
        SPDLOG_ERROR("State {} cannot be serialized: {}", state_key, e.what());
        return local_state;
    }
}

} // namespace swarm
