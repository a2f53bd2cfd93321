/**
 * @file task_handler.hpp
 * @brief Interface for the code that performs one task type
 *
 * Handlers are the only place where task semantics live; the worker agent
 * around them is generic. A handler sees its inputs as bytes already fetched
 * from the artifact store and returns its output as bytes.
 *
 * Design Principles:
 * - Stateless: each execute call is independent
 * - Deterministic inputs: everything that influences the output is in the
 *   input artifacts or the params, which together form the task key
 * - Not shared between threads: each worker creates its own instances
 */

#ifndef THINCORE_TASK_HANDLER_HPP
#define THINCORE_TASK_HANDLER_HPP

#include "hash/content_hash.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace thincore {

using artifacts::Bytes;

/**
 * @brief Handler metadata and capabilities
 */
struct HandlerInfo {
    std::string task_type;               ///< Task type served (e.g., "llm")
    std::string name;                    ///< Human-readable name
    bool paid;                           ///< Execution costs money and passes the cost guard
    std::chrono::milliseconds max_duration; ///< Expected upper bound; should stay below the lease timeout
    int64_t default_estimate;            ///< Cost units reserved when the task names no estimate

    HandlerInfo(
        const std::string& task_type_,
        const std::string& name_,
        bool paid_ = false,
        std::chrono::milliseconds max_duration_ = std::chrono::milliseconds(60000),
        int64_t default_estimate_ = 0
    ) : task_type(task_type_), name(name_), paid(paid_),
        max_duration(max_duration_), default_estimate(default_estimate_) {}
};

/**
 * @brief Everything a handler may read while executing
 */
struct TaskContext {
    std::string run_id;
    std::string task_key;
    std::string task_type;
    std::vector<std::string> input_hashes;
    std::vector<Bytes> inputs;           ///< Same order as input_hashes
    Bytes params;
    int attempt;
    int64_t estimated_cost;              ///< Units reserved for this execution (0 when unpaid)
    std::function<bool()> cancelled;     ///< Polled by long-running handlers

    TaskContext() : attempt(0), estimated_cost(0) {}

    bool is_cancelled() const { return cancelled && cancelled(); }
};

/**
 * @brief Output of a successful execution
 */
struct TaskResult {
    Bytes output;
    std::string content_type;
    int64_t actual_cost;                 ///< Cost units to settle

    TaskResult() : actual_cost(0) {}
    TaskResult(const Bytes& output_, const std::string& content_type_, int64_t actual_cost_ = 0)
        : output(output_), content_type(content_type_), actual_cost(actual_cost_) {}
};

/**
 * @brief Abstract interface for task handlers
 *
 * Errors:
 * - TaskExecutionError: the task failed; the worker nacks and it is retried
 *   until its attempts are exhausted
 * - TransientIOError: a dependency was unavailable; nacked the same way
 * - CostCeilingExceeded: never thrown by handlers; the worker reserves first
 */
class TaskHandler {
public:
    virtual ~TaskHandler() = default;

    virtual HandlerInfo get_info() const = 0;

    /**
     * @brief Perform the task
     *
     * @param ctx Inputs and params
     * @return Output bytes and actual cost
     * @throws TaskExecutionError If the task cannot be completed
     */
    virtual TaskResult execute(TaskContext& ctx) = 0;
};

} // namespace thincore

#endif // THINCORE_TASK_HANDLER_HPP
