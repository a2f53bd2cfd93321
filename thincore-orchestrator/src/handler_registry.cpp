/**
 * @file handler_registry.cpp
 * @brief Implementation of HandlerRegistry
 */

#include "handler_registry.hpp"
#include "builtin_handlers.hpp"
#include "errors.hpp"

namespace thincore {

HandlerRegistry::HandlerRegistry() {
    registry_[TaskType::CONCAT] = []() { return std::make_unique<ConcatHandler>(); };
}

std::unique_ptr<TaskHandler> HandlerRegistry::create_handler(const std::string& task_type) const {
    auto it = registry_.find(task_type);
    if (it == registry_.end()) {
        std::string types;
        for (const auto& pair : registry_) {
            if (!types.empty()) types += ", ";
            types += pair.first;
        }
        throw ConfigurationError("Unknown task type: " + task_type + ". Available types: " + types);
    }

    return it->second();
}

void HandlerRegistry::register_handler(const std::string& task_type, FactoryFunction factory_fn) {
    if (task_type.empty()) {
        throw ConfigurationError("Task type cannot be empty");
    }
    if (registry_.find(task_type) != registry_.end()) {
        throw ConfigurationError("Task type already registered: " + task_type);
    }
    registry_[task_type] = std::move(factory_fn);
}

bool HandlerRegistry::is_registered(const std::string& task_type) const {
    return registry_.find(task_type) != registry_.end();
}

std::vector<std::string> HandlerRegistry::list_task_types() const {
    std::vector<std::string> types;
    types.reserve(registry_.size());
    for (const auto& pair : registry_) {
        types.push_back(pair.first);
    }
    return types;
}

void register_llm_handler(HandlerRegistry& registry, std::shared_ptr<ModelGateway> gateway) {
    if (!gateway) {
        throw ConfigurationError("llm handler requires a model gateway");
    }
    registry.register_handler(TaskType::LLM, [gateway]() {
        return std::make_unique<LlmHandler>(gateway);
    });
}

} // namespace thincore
