/**
 * @file handler_registry.hpp
 * @brief Registry of task handlers by task type
 *
 * A worker's capabilities are exactly the task types registered with it.
 *
 * Design Pattern: Factory Method with Registry
 * - Each task type registers a factory function
 * - Workers request handlers by task type
 */

#ifndef THINCORE_HANDLER_REGISTRY_HPP
#define THINCORE_HANDLER_REGISTRY_HPP

#include "task_handler.hpp"
#include "model_gateway.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace thincore {

/**
 * @brief Built-in task type identifiers
 */
namespace TaskType {
    constexpr const char* CONCAT = "concat";
    constexpr const char* LLM = "llm";
}

/**
 * @brief Registry of handler factories
 *
 * Usage Example:
 *   @code
 *   HandlerRegistry registry;                  // concat registered
 *   register_llm_handler(registry, gateway);
 *   auto handler = registry.create_handler("llm");
 *   @endcode
 */
class HandlerRegistry {
public:
    using FactoryFunction = std::function<std::unique_ptr<TaskHandler>()>;

    /**
     * @brief Constructor - registers handlers that need no external service
     */
    HandlerRegistry();

    /**
     * @brief Create a handler instance by task type
     *
     * @throws ConfigurationError If the task type is unknown
     */
    std::unique_ptr<TaskHandler> create_handler(const std::string& task_type) const;

    /**
     * @brief Register a handler type
     *
     * @throws ConfigurationError If task_type is already registered
     */
    void register_handler(const std::string& task_type, FactoryFunction factory_fn);

    bool is_registered(const std::string& task_type) const;

    /**
     * @brief Registered task types, sorted
     */
    std::vector<std::string> list_task_types() const;

private:
    std::map<std::string, FactoryFunction> registry_;
};

/**
 * @brief Register the llm handler against a gateway
 */
void register_llm_handler(HandlerRegistry& registry, std::shared_ptr<ModelGateway> gateway);

} // namespace thincore

#endif // THINCORE_HANDLER_REGISTRY_HPP
