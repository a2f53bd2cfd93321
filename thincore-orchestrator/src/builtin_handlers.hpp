/**
 * @file builtin_handlers.hpp
 * @brief Handlers shipped with the core
 */

#ifndef THINCORE_BUILTIN_HANDLERS_HPP
#define THINCORE_BUILTIN_HANDLERS_HPP

#include "task_handler.hpp"
#include "model_gateway.hpp"
#include <memory>

namespace thincore {

/**
 * @brief Joins its inputs in order
 *
 * Params, if non-empty, are used verbatim as the separator. Unpaid.
 */
class ConcatHandler : public TaskHandler {
public:
    HandlerInfo get_info() const override;
    TaskResult execute(TaskContext& ctx) override;
};

/**
 * @brief Forwards a task to the model gateway and returns the completion
 *
 * Paid. The reported cost is settled; when the gateway reports none, the
 * reserved estimate is charged.
 */
class LlmHandler : public TaskHandler {
public:
    explicit LlmHandler(std::shared_ptr<ModelGateway> gateway);

    HandlerInfo get_info() const override;
    TaskResult execute(TaskContext& ctx) override;

private:
    std::shared_ptr<ModelGateway> gateway_;
};

} // namespace thincore

#endif // THINCORE_BUILTIN_HANDLERS_HPP
