#include "store.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <deque>
#include <mutex>
#include <atomic>

using json = nlohmann::json;

namespace swarm {

const char* claim_outcome_to_string(claim_outcome outcome) {
    switch (outcome) {
        case CLAIM_OUTCOME_EMPTY: return "empty";
        case CLAIM_OUTCOME_CLAIMED: return "claimed";
        case CLAIM_OUTCOME_ABANDONED: return "abandoned";
        case CLAIM_OUTCOME_INVALID: return "invalid";
        default: return "unknown";
    }
}

// Status of a record blob, "none" when missing, "unknown" when unreadable
static std::string record_status(const std::optional<std::string>& blob) {
    if (!blob) {
        return "none";
    }
    try {
        json j = json::parse(*blob);
        if (j.is_object() && j.contains("status") && j["status"].is_string()) {
            return j["status"].get<std::string>();
        }
    } catch (const json::exception&) {
    }
    return "unknown";
}

struct memory_store::impl {
    std::map<std::string, std::map<std::string, std::string>> hashes;
    std::map<std::string, std::deque<std::string>> lists;
    mutable std::mutex mutex;
    std::atomic<bool> available{true};

    void check() const {
        if (!available) {
            throw store_error("memory store unavailable");
        }
    }

    std::optional<std::string> get(const std::string& key, const std::string& field) const {
        auto it = hashes.find(key);
        if (it == hashes.end()) return std::nullopt;
        auto fit = it->second.find(field);
        if (fit == it->second.end()) return std::nullopt;
        return fit->second;
    }
};

memory_store::memory_store() : pimpl(std::make_unique<impl>()) {}

memory_store::~memory_store() = default;

bool memory_store::ping() {
    return pimpl->available;
}

void memory_store::hset(const std::string& key, const std::string& field, const std::string& value) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    pimpl->check();
    pimpl->hashes[key][field] = value;
}

std::optional<std::string> memory_store::hget(const std::string& key, const std::string& field) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    pimpl->check();
    return pimpl->get(key, field);
}

std::map<std::string, std::string> memory_store::hgetall(const std::string& key) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    pimpl->check();
    auto it = pimpl->hashes.find(key);
    if (it == pimpl->hashes.end()) {
        return {};
    }
    return it->second;
}

bool memory_store::hdel(const std::string& key, const std::string& field) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    pimpl->check();
    auto it = pimpl->hashes.find(key);
    if (it == pimpl->hashes.end()) {
        return false;
    }
    bool removed = it->second.erase(field) > 0;
    if (it->second.empty()) {
        pimpl->hashes.erase(it);
    }
    return removed;
}

void memory_store::rpush(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    pimpl->check();
    pimpl->lists[key].push_back(value);
}

std::optional<std::string> memory_store::lpop(const std::string& key) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    pimpl->check();
    auto it = pimpl->lists.find(key);
    if (it == pimpl->lists.end() || it->second.empty()) {
        return std::nullopt;
    }
    std::string value = it->second.front();
    it->second.pop_front();
    return value;
}

int64_t memory_store::llen(const std::string& key) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    pimpl->check();
    auto it = pimpl->lists.find(key);
    return it == pimpl->lists.end() ? 0 : static_cast<int64_t>(it->second.size());
}

int64_t memory_store::lrem(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    pimpl->check();
    auto it = pimpl->lists.find(key);
    if (it == pimpl->lists.end()) {
        return 0;
    }
    auto& list = it->second;
    auto before = list.size();
    list.erase(std::remove(list.begin(), list.end(), value), list.end());
    return static_cast<int64_t>(before - list.size());
}

claim_result memory_store::claim_next(const std::string& queue_key,
                                      const std::string& status_key,
                                      const std::string& node_id,
                                      double now) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    pimpl->check();

    claim_result result;
    auto it = pimpl->lists.find(queue_key);
    if (it == pimpl->lists.end() || it->second.empty()) {
        return result;
    }
    result.payload = it->second.front();
    it->second.pop_front();

    std::string task_id;
    try {
        json task = json::parse(result.payload);
        if (!task.is_object() || !task.contains("task_id") || !task["task_id"].is_string()) {
            result.outcome = CLAIM_OUTCOME_INVALID;
            return result;
        }
        task_id = task["task_id"].get<std::string>();
    } catch (const json::exception&) {
        result.outcome = CLAIM_OUTCOME_INVALID;
        return result;
    }

    std::string current = record_status(pimpl->get(status_key, task_id));
    if (current != "none" && current != "pending") {
        result.outcome = CLAIM_OUTCOME_ABANDONED;
        return result;
    }

    json claim;
    claim["status"] = "assigned";
    claim["assigned_to"] = node_id;
    claim["assigned_at"] = now;
    pimpl->hashes[status_key][task_id] = claim.dump();

    result.outcome = CLAIM_OUTCOME_CLAIMED;
    return result;
}

bool memory_store::advance_status(const std::string& status_key,
                                  const std::string& task_id,
                                  const std::string& record_json,
                                  const std::vector<std::string>& allowed_from) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    pimpl->check();

    std::string current = record_status(pimpl->get(status_key, task_id));
    if (std::find(allowed_from.begin(), allowed_from.end(), current) == allowed_from.end()) {
        return false;
    }
    pimpl->hashes[status_key][task_id] = record_json;
    return true;
}

void memory_store::set_available(bool available) {
    pimpl->available = available;
}

size_t memory_store::total_queued() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    size_t total = 0;
    for (const auto& [key, list] : pimpl->lists) {
        total += list.size();
    }
    return total;
}

} // namespace swarm
