#include "params.h"
#include "task.h"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <limits>

namespace swarm {

coordinator_params coordinator_default_params() {
    coordinator_params params;

    // Identity defaults
    params.node_id = "swarm-" + generate_hex(8);
    params.instance_url = "http://localhost:8001";
    params.capabilities = {};

    // Store defaults
    params.store_url = "redis://localhost:6379";
    params.key_prefix = "swarm";
    params.store_pool_size = 4;
    params.enabled = true;

    // Liveness defaults
    params.heartbeat_interval_ms = 30000;
    params.node_timeout_ms = 90000;
    params.selection_max_age_ms = 60000;
    params.error_backoff_ms = 5000;

    // Work defaults
    params.max_concurrent_tasks = 3;
    params.poll_interval_ms = 1000;
    params.task_retention_ms = 3600000;

    params.log_level = "info";

    return params;
}

static const char* env_or_null(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return nullptr;
    }
    return value;
}

// Durations above this (about 31 years) are rejected
static const double max_env_seconds = 1e9;

static int64_t env_seconds_as_ms(const char* name, int64_t fallback_ms) {
    const char* value = env_or_null(name);
    if (!value) {
        return fallback_ms;
    }
    char* end = nullptr;
    double seconds = std::strtod(value, &end);
    if (end == value || *end != '\0' || !(seconds >= 0 && seconds <= max_env_seconds)) {
        SPDLOG_WARN("Ignoring invalid {}='{}'", name, value);
        return fallback_ms;
    }
    return static_cast<int64_t>(seconds * 1000.0);
}

static int env_int(const char* name, int fallback) {
    const char* value = env_or_null(name);
    if (!value) {
        return fallback;
    }
    char* end = nullptr;
    long parsed = std::strtol(value, &end, 10);
    if (end == value || *end != '\0' ||
        parsed < std::numeric_limits<int>::min() || parsed > std::numeric_limits<int>::max()) {
        SPDLOG_WARN("Ignoring invalid {}='{}'", name, value);
        return fallback;
    }
    return static_cast<int>(parsed);
}

static bool env_flag(const char* name, bool fallback) {
    const char* value = env_or_null(name);
    if (!value) {
        return fallback;
    }
    std::string v(value);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    SPDLOG_WARN("Ignoring invalid {}='{}'", name, value);
    return fallback;
}

coordinator_params coordinator_params_from_env() {
    coordinator_params params = coordinator_default_params();

    if (const char* v = env_or_null("SWARM_NODE_ID")) params.node_id = v;
    if (const char* v = env_or_null("SWARM_INSTANCE_URL")) params.instance_url = v;
    if (const char* v = env_or_null("SWARM_CAPABILITIES")) params.capabilities = split_list(v);
    if (const char* v = env_or_null("REDIS_URL")) params.store_url = v;
    if (const char* v = env_or_null("SWARM_KEY_PREFIX")) params.key_prefix = v;
    if (const char* v = env_or_null("SWARM_LOG_LEVEL")) params.log_level = v;

    params.enabled = env_flag("SWARM_PROTOCOL", params.enabled);
    params.heartbeat_interval_ms = env_seconds_as_ms("SWARM_HEARTBEAT_INTERVAL", params.heartbeat_interval_ms);
    params.node_timeout_ms = env_seconds_as_ms("SWARM_NODE_TIMEOUT", params.node_timeout_ms);
    params.task_retention_ms = env_seconds_as_ms("SWARM_TASK_RETENTION", params.task_retention_ms);
    params.max_concurrent_tasks = env_int("SWARM_MAX_CONCURRENT_TASKS", params.max_concurrent_tasks);

    return params;
}

bool validate_params(const coordinator_params& params, std::string& error) {
    if (params.node_id.empty()) {
        error = "node_id must not be empty";
        return false;
    }
    if (params.heartbeat_interval_ms <= 0) {
        error = "heartbeat_interval must be positive";
        return false;
    }
    if (params.node_timeout_ms <= params.heartbeat_interval_ms) {
        error = "node_timeout must exceed heartbeat_interval";
        return false;
    }
    if (params.selection_max_age_ms <= 0 || params.poll_interval_ms <= 0 || params.error_backoff_ms <= 0) {
        error = "selection_max_age, poll_interval and error_backoff must be positive";
        return false;
    }
    if (params.max_concurrent_tasks < 1) {
        error = "max_concurrent_tasks must be at least 1";
        return false;
    }
    if (params.task_retention_ms < 0) {
        error = "task_retention must not be negative";
        return false;
    }
    return true;
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto first = item.find_first_not_of(" \t");
        if (first == std::string::npos) continue;
        auto last = item.find_last_not_of(" \t");
        items.push_back(item.substr(first, last - first + 1));
    }
    return items;
}

} // namespace swarm
