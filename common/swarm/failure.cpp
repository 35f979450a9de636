#include "failure.h"
#include "task.h"
#include <nlohmann/json.hpp>
#include <deque>
#include <mutex>

using json = nlohmann::json;

namespace swarm {

// Convert error type to string
const char* error_type_to_string(error_type type) {
    switch (type) {
        case ERROR_TYPE_NONE: return "none";
        case ERROR_TYPE_CONNECTION: return "connection";
        case ERROR_TYPE_NO_PEER: return "no_peer";
        case ERROR_TYPE_TIMEOUT: return "timeout";
        case ERROR_TYPE_EXECUTION: return "execution";
        case ERROR_TYPE_INVALID_TASK: return "invalid_task";
        case ERROR_TYPE_NO_HANDLER: return "no_handler";
        case ERROR_TYPE_INTERNAL: return "internal";
        default: return "unknown";
    }
}

// failure_record implementation
std::string failure_record::to_json() const {
    json j;
    j["task_id"] = task_id;
    j["task_type"] = task_type;
    j["node_id"] = node_id;
    j["error"] = error_type_to_string(error);
    j["error_message"] = error_message;
    j["timestamp"] = timestamp;
    // messages come from executors and may carry arbitrary bytes
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

// failure_history implementation
struct failure_history::impl {
    std::deque<failure_record> records;
    std::map<error_type, int64_t> counts;
    size_t max_size;
    mutable std::mutex mutex;

    impl(size_t max) : max_size(max) {}
};

failure_history::failure_history(size_t max_size)
    : pimpl(std::make_unique<impl>(max_size)) {}

failure_history::~failure_history() = default;

void failure_history::record(const failure_record& record) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    pimpl->records.push_back(record);
    pimpl->counts[record.error]++;

    // Enforce max size
    while (pimpl->records.size() > pimpl->max_size) {
        pimpl->records.pop_front();
    }
}

void failure_history::record(error_type error,
                             const std::string& message,
                             const std::string& task_id,
                             const std::string& task_type,
                             const std::string& node_id) {
    failure_record rec;
    rec.task_id = task_id;
    rec.task_type = task_type;
    rec.node_id = node_id;
    rec.error = error;
    rec.error_message = message;
    rec.timestamp = get_timestamp_ms();
    record(rec);
}

std::vector<failure_record> failure_history::recent(int limit) const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    std::vector<failure_record> result;
    int count = 0;

    // Return most recent first
    for (auto rit = pimpl->records.rbegin(); rit != pimpl->records.rend(); ++rit) {
        if (limit > 0 && count >= limit) break;
        result.push_back(*rit);
        count++;
    }

    return result;
}

std::map<error_type, int64_t> failure_history::counts() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    return pimpl->counts;
}

size_t failure_history::size() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    return pimpl->records.size();
}

void failure_history::clear() {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    pimpl->records.clear();
    pimpl->counts.clear();
}

} // namespace swarm
