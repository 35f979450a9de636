#include "executor.h"
#include <stdexcept>

namespace swarm {

function_executor::function_executor(handler fn) : fn(std::move(fn)) {
    if (!this->fn) {
        throw std::invalid_argument("function_executor requires a callable");
    }
}

nlohmann::json function_executor::execute(const swarm_task& task, const cancel_token&) {
    return fn(task);
}

void executor_registry::add(const std::string& task_type, std::shared_ptr<task_executor> executor) {
    if (!executor) {
        throw std::invalid_argument("null executor for task type: " + task_type);
    }
    executors[task_type] = std::move(executor);
}

void executor_registry::add(const std::string& task_type, function_executor::handler fn) {
    add(task_type, std::make_shared<function_executor>(std::move(fn)));
}

std::shared_ptr<task_executor> executor_registry::find(const std::string& task_type) const {
    auto it = executors.find(task_type);
    if (it == executors.end()) {
        return nullptr;
    }
    return it->second;
}

bool executor_registry::has(const std::string& task_type) const {
    return executors.find(task_type) != executors.end();
}

std::vector<std::string> executor_registry::task_types() const {
    std::vector<std::string> types;
    for (const auto& [type, executor] : executors) {
        types.push_back(type);
    }
    return types;
}

std::vector<std::string> executor_registry::missing(const std::vector<std::string>& capabilities) const {
    std::vector<std::string> result;
    for (const auto& capability : capabilities) {
        if (!has(capability)) {
            result.push_back(capability);
        }
    }
    return result;
}

} // namespace swarm
