#include "task.h"
#include <chrono>
#include <random>
#include <sstream>
#include <mutex>
#include <algorithm>
#include <stdexcept>

using json = nlohmann::json;

namespace swarm {

// Helper to produce random hex digits
std::string generate_hex(size_t digits) {
    static std::random_device rd;
    static std::mt19937_64 gen(rd());
    static std::uniform_int_distribution<> dis(0, 15);
    static std::mutex gen_mutex;

    std::lock_guard<std::mutex> lock(gen_mutex);
    std::stringstream ss;
    ss << std::hex;
    for (size_t i = 0; i < digits; i++) {
        ss << dis(gen);
    }
    return ss.str();
}

std::string generate_task_id() {
    return "task-" + generate_hex(32);
}

// Get current timestamp in milliseconds
int64_t get_timestamp_ms() {
    auto now = std::chrono::system_clock::now();
    auto duration = now.time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

double get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto duration = now.time_since_epoch();
    return std::chrono::duration_cast<std::chrono::microseconds>(duration).count() / 1e6;
}

const char* task_status_to_string(task_status status) {
    switch (status) {
        case TASK_STATUS_PENDING: return "pending";
        case TASK_STATUS_ASSIGNED: return "assigned";
        case TASK_STATUS_COMPLETED: return "completed";
        case TASK_STATUS_FAILED: return "failed";
        case TASK_STATUS_TIMEOUT: return "timeout";
        default: return "unknown";
    }
}

std::optional<task_status> task_status_from_string(const std::string& str) {
    if (str == "pending") return TASK_STATUS_PENDING;
    if (str == "assigned") return TASK_STATUS_ASSIGNED;
    if (str == "completed") return TASK_STATUS_COMPLETED;
    if (str == "failed") return TASK_STATUS_FAILED;
    if (str == "timeout") return TASK_STATUS_TIMEOUT;
    return std::nullopt;
}

bool task_status_is_terminal(task_status status) {
    return status == TASK_STATUS_COMPLETED ||
           status == TASK_STATUS_FAILED ||
           status == TASK_STATUS_TIMEOUT;
}

// swarm_task implementation
swarm_task swarm_task::create(const std::string& task_type,
                              const json& payload,
                              const std::string& requester_id,
                              int priority,
                              int timeout_seconds) {
    swarm_task task;
    task.task_id = generate_task_id();
    task.task_type = task_type;
    task.payload = payload;
    task.requester_id = requester_id;
    task.priority = priority;
    task.timeout_seconds = timeout_seconds;
    task.created_at = get_timestamp();
    task.status = TASK_STATUS_PENDING;
    return task;
}

std::string swarm_task::to_json() const {
    json j;
    j["task_id"] = task_id;
    j["task_type"] = task_type;
    j["payload"] = payload;
    j["requester_id"] = requester_id;
    j["priority"] = priority;
    j["timeout_seconds"] = timeout_seconds;
    j["created_at"] = created_at;
    j["assigned_to"] = assigned_to ? json(*assigned_to) : json(nullptr);
    j["status"] = task_status_to_string(status);
    j["result"] = result ? *result : json(nullptr);
    return j.dump();
}

swarm_task swarm_task::from_json(const std::string& json_str) {
    json j = json::parse(json_str);
    swarm_task task;
    task.task_id = j.at("task_id").get<std::string>();
    task.task_type = j.at("task_type").get<std::string>();
    task.payload = j.value("payload", json::object());
    task.requester_id = j.value("requester_id", "");
    task.priority = j.value("priority", 1);
    task.timeout_seconds = j.value("timeout_seconds", 300);
    task.created_at = j.value("created_at", 0.0);

    auto assigned = j.find("assigned_to");
    if (assigned != j.end() && assigned->is_string()) {
        task.assigned_to = assigned->get<std::string>();
    }

    auto status = task_status_from_string(j.value("status", "pending"));
    task.status = status.value_or(TASK_STATUS_PENDING);

    auto res = j.find("result");
    if (res != j.end() && !res->is_null()) {
        task.result = *res;
    }
    return task;
}

bool swarm_task::operator==(const swarm_task& other) const {
    return task_id == other.task_id &&
           task_type == other.task_type &&
           payload == other.payload &&
           requester_id == other.requester_id &&
           priority == other.priority &&
           timeout_seconds == other.timeout_seconds &&
           created_at == other.created_at &&
           assigned_to == other.assigned_to &&
           status == other.status &&
           result == other.result;
}

// task_status_record implementation
std::string task_status_record::to_json() const {
    json j;
    j["status"] = task_status_to_string(status);
    if (assigned_to) j["assigned_to"] = *assigned_to;
    if (processed_by) j["processed_by"] = *processed_by;
    if (result) j["result"] = *result;
    if (error) j["error"] = *error;
    if (created_at > 0) j["created_at"] = created_at;
    if (assigned_at > 0) j["assigned_at"] = assigned_at;
    if (completed_at > 0) j["completed_at"] = completed_at;
    if (failed_at > 0) j["failed_at"] = failed_at;
    if (timed_out_at > 0) j["timed_out_at"] = timed_out_at;
    return j.dump();
}

task_status_record task_status_record::from_json(const std::string& json_str) {
    json j = json::parse(json_str);
    task_status_record rec;

    auto status = task_status_from_string(j.at("status").get<std::string>());
    if (!status) {
        throw std::invalid_argument("unknown task status: " + j.at("status").get<std::string>());
    }
    rec.status = *status;

    if (j.contains("assigned_to") && j["assigned_to"].is_string()) {
        rec.assigned_to = j["assigned_to"].get<std::string>();
    }
    if (j.contains("processed_by") && j["processed_by"].is_string()) {
        rec.processed_by = j["processed_by"].get<std::string>();
    }
    if (j.contains("result")) {
        rec.result = j["result"];
    }
    if (j.contains("error") && !j["error"].is_null()) {
        rec.error = j["error"].is_string() ? j["error"].get<std::string>() : j["error"].dump();
    }
    rec.created_at = j.value("created_at", 0.0);
    rec.assigned_at = j.value("assigned_at", 0.0);
    rec.completed_at = j.value("completed_at", 0.0);
    rec.failed_at = j.value("failed_at", 0.0);
    rec.timed_out_at = j.value("timed_out_at", 0.0);
    return rec;
}

double task_status_record::last_transition() const {
    return std::max({created_at, assigned_at, completed_at, failed_at, timed_out_at});
}

} // namespace swarm
