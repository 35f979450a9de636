// Test suite for swarm data model, configuration and failure tracking

#include "../common/swarm/task.h"
#include "../common/swarm/node.h"
#include "../common/swarm/failure.h"
#include "../common/swarm/executor.h"
#include "../common/swarm/params.h"
#include "../common/swarm/log.h"

#include <nlohmann/json.hpp>
#include <iostream>
#include <set>
#include <cstdlib>
#include <cmath>
#include <spdlog/spdlog.h>

using namespace swarm;
using json = nlohmann::json;

// Test helpers
#define TEST_ASSERT(cond, msg) do { \
    if (!(cond)) { \
        std::cerr << "FAIL: " << msg << " at " << __FILE__ << ":" << __LINE__ << std::endl; \
        return false; \
    } \
} while(0)

#define RUN_TEST(test_func) do { \
    std::cout << "Running " << #test_func << "..." << std::endl; \
    if (test_func()) { \
        std::cout << "  PASS" << std::endl; \
        passed++; \
    } else { \
        std::cout << "  FAIL" << std::endl; \
        failed++; \
    } \
    total++; \
} while(0)

static bool is_hex(const std::string& s) {
    return s.find_first_not_of("0123456789abcdef") == std::string::npos;
}

// Test 1: Task id format
static bool test_task_id_generation() {
    std::set<std::string> ids;
    for (int i = 0; i < 1000; i++) {
        std::string id = generate_task_id();
        TEST_ASSERT(id.size() == 37, "Task id should be task- plus 32 hex digits");
        TEST_ASSERT(id.compare(0, 5, "task-") == 0, "Task id should start with task-");
        TEST_ASSERT(is_hex(id.substr(5)), "Task id suffix should be lowercase hex");
        ids.insert(id);
    }
    TEST_ASSERT(ids.size() == 1000, "Task ids should be unique");

    std::string hex = generate_hex(8);
    TEST_ASSERT(hex.size() == 8 && is_hex(hex), "generate_hex should return 8 hex digits");

    return true;
}

// Test 2: Timestamps
static bool test_timestamp_generation() {
    int64_t ms = get_timestamp_ms();
    double s = get_timestamp();
    TEST_ASSERT(ms > 1600000000000LL, "Millisecond timestamp should be epoch based");
    TEST_ASSERT(s > 1600000000.0, "Second timestamp should be epoch based");
    TEST_ASSERT(std::abs(s * 1000.0 - ms) < 1000.0, "Both clocks should agree");
    return true;
}

// Test 3: Task wire round trip
static bool test_task_serialization() {
    swarm_task task = swarm_task::create("calc", json{{"expr", "2+2"}}, "node-a", 2, 30);
    TEST_ASSERT(task.status == TASK_STATUS_PENDING, "New task should be pending");
    TEST_ASSERT(!task.assigned_to, "New task should be unassigned");
    TEST_ASSERT(task.created_at > 0, "New task should carry created_at");

    swarm_task decoded = swarm_task::from_json(task.to_json());
    TEST_ASSERT(decoded == task, "Decoded task should equal original");

    task.assigned_to = "node-b";
    task.status = TASK_STATUS_COMPLETED;
    task.result = json{{"value", 4}};
    decoded = swarm_task::from_json(task.to_json());
    TEST_ASSERT(decoded == task, "Decoded completed task should equal original");
    TEST_ASSERT((*decoded.result)["value"] == 4, "Result should survive");

    return true;
}

// Test 4: Task wire field names
static bool test_task_wire_format() {
    swarm_task task = swarm_task::create("echo", json{{"text", "hi"}}, "node-a");
    json j = json::parse(task.to_json());

    TEST_ASSERT(j["task_type"] == "echo", "task_type field");
    TEST_ASSERT(j["requester_id"] == "node-a", "requester_id field");
    TEST_ASSERT(j["priority"] == 1, "Default priority should be 1");
    TEST_ASSERT(j["timeout_seconds"] == 300, "Default timeout should be 300");
    TEST_ASSERT(j["status"] == "pending", "status field");
    TEST_ASSERT(j["assigned_to"].is_null(), "assigned_to should be null");
    TEST_ASSERT(j["result"].is_null(), "result should be null");
    TEST_ASSERT(j["created_at"].is_number_float(), "created_at should be fractional seconds");

    // Missing optional fields take defaults
    swarm_task minimal = swarm_task::from_json(R"({"task_id":"task-1","task_type":"echo"})");
    TEST_ASSERT(minimal.priority == 1 && minimal.timeout_seconds == 300, "Defaults on decode");
    TEST_ASSERT(minimal.status == TASK_STATUS_PENDING, "Default status on decode");

    bool threw = false;
    try {
        swarm_task::from_json(R"({"task_type":"echo"})");
    } catch (const json::exception&) {
        threw = true;
    }
    TEST_ASSERT(threw, "Task without task_id should not decode");

    return true;
}

// Test 5: Status record encoding
static bool test_status_record_serialization() {
    task_status_record rec;
    rec.status = TASK_STATUS_COMPLETED;
    rec.processed_by = "node-b";
    rec.result = json{{"ok", true}};
    rec.completed_at = 1700000000.5;

    json j = json::parse(rec.to_json());
    TEST_ASSERT(j["status"] == "completed", "Status string");
    TEST_ASSERT(j["processed_by"] == "node-b", "processed_by");
    TEST_ASSERT(!j.contains("failed_at"), "Zero timestamps should be omitted");
    TEST_ASSERT(!j.contains("error"), "Unset error should be omitted");

    task_status_record decoded = task_status_record::from_json(rec.to_json());
    TEST_ASSERT(decoded.status == TASK_STATUS_COMPLETED, "Status decodes");
    TEST_ASSERT(decoded.result && (*decoded.result)["ok"] == true, "Result decodes");
    TEST_ASSERT(decoded.last_transition() == 1700000000.5, "Last transition is completed_at");

    bool threw = false;
    try {
        task_status_record::from_json(R"({"status":"lost"})");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    TEST_ASSERT(threw, "Unknown status should be rejected");

    return true;
}

// Test 6: Status enums
static bool test_status_conversion() {
    TEST_ASSERT(std::string(task_status_to_string(TASK_STATUS_ASSIGNED)) == "assigned", "assigned");
    TEST_ASSERT(std::string(task_status_to_string(TASK_STATUS_TIMEOUT)) == "timeout", "timeout");
    TEST_ASSERT(task_status_from_string("failed") == TASK_STATUS_FAILED, "failed parses");
    TEST_ASSERT(!task_status_from_string("Failed"), "Parsing is case sensitive");

    TEST_ASSERT(!task_status_is_terminal(TASK_STATUS_PENDING), "pending is not terminal");
    TEST_ASSERT(!task_status_is_terminal(TASK_STATUS_ASSIGNED), "assigned is not terminal");
    TEST_ASSERT(task_status_is_terminal(TASK_STATUS_COMPLETED), "completed is terminal");
    TEST_ASSERT(task_status_is_terminal(TASK_STATUS_FAILED), "failed is terminal");
    TEST_ASSERT(task_status_is_terminal(TASK_STATUS_TIMEOUT), "timeout is terminal");

    TEST_ASSERT(std::string(node_status_to_string(NODE_STATUS_BUSY)) == "busy", "busy");
    return true;
}

// Test 7: Node wire round trip
static bool test_node_serialization() {
    swarm_node node;
    node.node_id = "swarm-1a2b3c4d";
    node.instance_url = "http://localhost:8001";
    node.capabilities = {"calc", "echo"};
    node.load_factor = 0.5;
    node.last_heartbeat = 1700000000.25;
    node.status = NODE_STATUS_BUSY;

    swarm_node decoded = swarm_node::from_json(node.to_json());
    TEST_ASSERT(decoded == node, "Decoded node should equal original");
    TEST_ASSERT(decoded.has_capability("calc"), "Capability lookup");
    TEST_ASSERT(!decoded.has_capability("summarize"), "Missing capability");
    TEST_ASSERT(decoded.heartbeat_age(1700000010.25) == 10.0, "Heartbeat age");

    bool threw = false;
    try {
        swarm_node::from_json(R"({"node_id":"x"})");
    } catch (const json::exception&) {
        threw = true;
    }
    TEST_ASSERT(threw, "Node without last_heartbeat should not decode");

    return true;
}

// Test 8: Failure history
static bool test_failure_history() {
    failure_history history(3);
    history.record(ERROR_TYPE_TIMEOUT, "first", "task-1", "calc", "node-a");
    history.record(ERROR_TYPE_EXECUTION, "second", "task-2", "calc", "node-b");
    history.record(ERROR_TYPE_NO_PEER, "third");
    history.record(ERROR_TYPE_EXECUTION, "fourth");

    TEST_ASSERT(history.size() == 3, "History should be bounded");

    auto recent = history.recent(2);
    TEST_ASSERT(recent.size() == 2, "Limit respected");
    TEST_ASSERT(recent[0].error_message == "fourth", "Most recent first");
    TEST_ASSERT(recent[1].error_message == "third", "Then older");

    auto counts = history.counts();
    TEST_ASSERT(counts[ERROR_TYPE_EXECUTION] == 2, "Counts are not bounded by history size");
    TEST_ASSERT(counts[ERROR_TYPE_TIMEOUT] == 1, "Timeout counted");

    json j = json::parse(recent[0].to_json());
    TEST_ASSERT(j["error"] == "execution", "Error type serialized as string");

    history.clear();
    TEST_ASSERT(history.size() == 0, "Clear empties history");

    TEST_ASSERT(std::string(error_type_to_string(ERROR_TYPE_NO_HANDLER)) == "no_handler", "no_handler");
    TEST_ASSERT(std::string(error_type_to_string(ERROR_TYPE_CONNECTION)) == "connection", "connection");
    return true;
}

// Test 9: Executor registry
static bool test_executor_registry() {
    executor_registry registry;
    TEST_ASSERT(registry.empty(), "New registry is empty");

    registry.add("echo", [](const swarm_task& task) { return task.payload; });
    registry.add("calc", [](const swarm_task&) { return json{{"value", 4}}; });

    TEST_ASSERT(registry.has("echo"), "echo registered");
    TEST_ASSERT(!registry.has("summarize"), "summarize not registered");
    TEST_ASSERT(registry.find("summarize") == nullptr, "find returns null for unknown type");

    auto types = registry.task_types();
    TEST_ASSERT(types.size() == 2 && types[0] == "calc" && types[1] == "echo", "Types sorted");

    auto missing = registry.missing({"echo", "summarize"});
    TEST_ASSERT(missing.size() == 1 && missing[0] == "summarize", "Missing capability reported");

    cancel_token token;
    swarm_task task = swarm_task::create("echo", json{{"ok", true}}, "node-a");
    json result = registry.find("echo")->execute(task, token);
    TEST_ASSERT(result["ok"] == true, "Executor runs handler");

    bool threw = false;
    try {
        function_executor empty(nullptr);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    TEST_ASSERT(threw, "Empty handler rejected");

    token.cancel();
    TEST_ASSERT(token.is_cancelled(), "Token raised");
    token.reset();
    TEST_ASSERT(!token.is_cancelled(), "Token reset");

    return true;
}

// Test 10: Default parameters
static bool test_default_params() {
    coordinator_params params = coordinator_default_params();
    TEST_ASSERT(params.node_id.compare(0, 6, "swarm-") == 0, "Default node id prefix");
    TEST_ASSERT(params.node_id.size() == 14, "Default node id has 8 hex digits");
    TEST_ASSERT(params.store_url == "redis://localhost:6379", "Default store url");
    TEST_ASSERT(params.heartbeat_interval_ms == 30000, "Default heartbeat interval");
    TEST_ASSERT(params.node_timeout_ms == 90000, "Default node timeout");
    TEST_ASSERT(params.max_concurrent_tasks == 3, "Default concurrency");
    TEST_ASSERT(params.enabled, "Enabled by default");

    std::string error;
    TEST_ASSERT(validate_params(params, error), "Defaults are valid");

    coordinator_params other = coordinator_default_params();
    TEST_ASSERT(other.node_id != params.node_id, "Each default node id is fresh");
    return true;
}

// Test 11: Parameter validation
static bool test_validate_params() {
    std::string error;

    coordinator_params params = coordinator_default_params();
    params.node_timeout_ms = params.heartbeat_interval_ms;
    TEST_ASSERT(!validate_params(params, error), "Timeout must exceed heartbeat");
    TEST_ASSERT(!error.empty(), "Error message filled");

    params = coordinator_default_params();
    params.max_concurrent_tasks = 0;
    TEST_ASSERT(!validate_params(params, error), "Zero concurrency rejected");

    params = coordinator_default_params();
    params.heartbeat_interval_ms = 0;
    TEST_ASSERT(!validate_params(params, error), "Zero heartbeat rejected");

    params = coordinator_default_params();
    params.node_id.clear();
    TEST_ASSERT(!validate_params(params, error), "Empty node id rejected");

    params = coordinator_default_params();
    params.task_retention_ms = 0;
    TEST_ASSERT(validate_params(params, error), "Retention may be disabled");

    return true;
}

// Test 12: Environment overrides
static bool test_params_from_env() {
    setenv("SWARM_NODE_ID", "node-env", 1);
    setenv("SWARM_CAPABILITIES", "calc, echo,,summarize ", 1);
    setenv("REDIS_URL", "redis://cache:6380", 1);
    setenv("SWARM_HEARTBEAT_INTERVAL", "2.5", 1);
    setenv("SWARM_NODE_TIMEOUT", "10", 1);
    setenv("SWARM_MAX_CONCURRENT_TASKS", "not-a-number", 1);
    setenv("SWARM_PROTOCOL", "off", 1);

    coordinator_params params = coordinator_params_from_env();

    unsetenv("SWARM_NODE_ID");
    unsetenv("SWARM_CAPABILITIES");
    unsetenv("REDIS_URL");
    unsetenv("SWARM_HEARTBEAT_INTERVAL");
    unsetenv("SWARM_NODE_TIMEOUT");
    unsetenv("SWARM_MAX_CONCURRENT_TASKS");
    unsetenv("SWARM_PROTOCOL");

    TEST_ASSERT(params.node_id == "node-env", "Node id from env");
    TEST_ASSERT(params.capabilities.size() == 3, "Capabilities split and trimmed");
    TEST_ASSERT(params.capabilities[2] == "summarize", "Trailing blank trimmed");
    TEST_ASSERT(params.store_url == "redis://cache:6380", "Store url from env");
    TEST_ASSERT(params.heartbeat_interval_ms == 2500, "Fractional seconds accepted");
    TEST_ASSERT(params.node_timeout_ms == 10000, "Timeout from env");
    TEST_ASSERT(params.max_concurrent_tasks == 3, "Invalid value falls back to default");
    TEST_ASSERT(!params.enabled, "Protocol switch honoured");

    return true;
}

// Test 13: Out-of-range and non-ASCII environment values
static bool test_params_from_env_out_of_range() {
    setenv("SWARM_NODE_TIMEOUT", "1e300", 1);
    setenv("SWARM_HEARTBEAT_INTERVAL", "nan", 1);
    setenv("SWARM_MAX_CONCURRENT_TASKS", "99999999999999", 1);
    setenv("SWARM_PROTOCOL", "\xe9t\xe9", 1);

    coordinator_params params = coordinator_params_from_env();

    setenv("SWARM_PROTOCOL", "OFF", 1);
    coordinator_params upper = coordinator_params_from_env();

    unsetenv("SWARM_NODE_TIMEOUT");
    unsetenv("SWARM_HEARTBEAT_INTERVAL");
    unsetenv("SWARM_MAX_CONCURRENT_TASKS");
    unsetenv("SWARM_PROTOCOL");

    TEST_ASSERT(params.node_timeout_ms == 90000, "Huge duration falls back to default");
    TEST_ASSERT(params.heartbeat_interval_ms == 30000, "NaN duration falls back to default");
    TEST_ASSERT(params.max_concurrent_tasks == 3, "Out-of-range count falls back to default");
    TEST_ASSERT(params.enabled, "Non-ASCII switch value ignored");
    TEST_ASSERT(!upper.enabled, "Switch value is case-insensitive");
    return true;
}

// Test 14: Logging setup
static bool test_log_init() {
    log_init("debug");
    TEST_ASSERT(spdlog::get_level() == spdlog::level::debug, "Level applied");
    log_init("chatty");
    TEST_ASSERT(spdlog::get_level() == spdlog::level::info, "Unknown level falls back to info");
    log_init("off");
    TEST_ASSERT(spdlog::get_level() == spdlog::level::off, "off honoured");
    log_init("warn");
    return true;
}

int main() {
    std::cout << "=== Swarm Wire Format Tests ===" << std::endl << std::endl;

    int total = 0;
    int passed = 0;
    int failed = 0;

    // Data model
    RUN_TEST(test_task_id_generation);
    RUN_TEST(test_timestamp_generation);
    RUN_TEST(test_task_serialization);
    RUN_TEST(test_task_wire_format);
    RUN_TEST(test_status_record_serialization);
    RUN_TEST(test_status_conversion);
    RUN_TEST(test_node_serialization);

    // Failure handling
    RUN_TEST(test_failure_history);

    // Executors
    RUN_TEST(test_executor_registry);

    // Configuration
    RUN_TEST(test_default_params);
    RUN_TEST(test_validate_params);
    RUN_TEST(test_params_from_env);
    RUN_TEST(test_params_from_env_out_of_range);
    RUN_TEST(test_log_init);

    std::cout << std::endl << "=== Test Results ===" << std::endl;
    std::cout << "Total:  " << total << std::endl;
    std::cout << "Passed: " << passed << std::endl;
    std::cout << "Failed: " << failed << std::endl;

    if (failed == 0) {
        std::cout << std::endl << "All tests passed! ✓" << std::endl;
        return 0;
    } else {
        std::cout << std::endl << "Some tests failed! ✗" << std::endl;
        return 1;
    }
}
