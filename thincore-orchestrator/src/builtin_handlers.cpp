/**
 * @file builtin_handlers.cpp
 * @brief concat and llm handlers
 */

#include "builtin_handlers.hpp"
#include "handler_registry.hpp"
#include "cost_guard.hpp"
#include "errors.hpp"

namespace thincore {

namespace {

// Reserved per llm call when the run spec gives no estimate
const int64_t LLM_DEFAULT_ESTIMATE = COST_UNITS_PER_CURRENCY / 20;

} // namespace

HandlerInfo ConcatHandler::get_info() const {
    return HandlerInfo(TaskType::CONCAT, "Concatenate inputs", false, std::chrono::milliseconds(10000), 0);
}

TaskResult ConcatHandler::execute(TaskContext& ctx) {
    size_t total = 0;
    for (const auto& input : ctx.inputs) {
        total += input.size() + ctx.params.size();
    }

    Bytes output;
    output.reserve(total);
    for (size_t i = 0; i < ctx.inputs.size(); ++i) {
        if (i > 0) {
            output += ctx.params;
        }
        output += ctx.inputs[i];
    }
    return TaskResult(output, "application/octet-stream", 0);
}

LlmHandler::LlmHandler(std::shared_ptr<ModelGateway> gateway)
    : gateway_(std::move(gateway))
{
    if (!gateway_) {
        throw ConfigurationError("LlmHandler requires a model gateway");
    }
}

HandlerInfo LlmHandler::get_info() const {
    return HandlerInfo(TaskType::LLM, "Model gateway completion", true,
                       std::chrono::milliseconds(120000), LLM_DEFAULT_ESTIMATE);
}

TaskResult LlmHandler::execute(TaskContext& ctx) {
    if (ctx.inputs.empty()) {
        throw TaskExecutionError("llm task " + ctx.task_key + " has no inputs");
    }

    GatewayRequest request;
    request.run_id = ctx.run_id;
    request.task_key = ctx.task_key;
    request.task_type = ctx.task_type;
    request.input_hashes = ctx.input_hashes;
    request.params = ctx.params;

    GatewayResponse response = gateway_->complete(request);
    if (response.body.empty()) {
        throw TaskExecutionError("Model gateway returned an empty completion for " + ctx.task_key);
    }

    int64_t cost = response.cost_units >= 0 ? response.cost_units : ctx.estimated_cost;
    std::string content_type = response.content_type.empty() ? "text/plain" : response.content_type;
    return TaskResult(response.body, content_type, cost);
}

} // namespace thincore
