/**
 * @file task_router.hpp
 * @brief Durable task queue abstraction with consumer groups and leases
 *
 * One queue per task type. Delivery is at-least-once: a claimed message that
 * is not acknowledged within the lease timeout is handed to another consumer
 * in the same group with its attempt incremented. After max_attempts
 * deliveries a message is moved to the dead-letter queue of its task type
 * instead of being delivered again. The router never deduplicates; exactly
 * once effect is the job of the resume cache one layer up.
 *
 * Every terminal transition (ack, dead letter) publishes a CompletionEvent on
 * the run's completion stream, which the planner consumes.
 */

#ifndef THINCORE_TASK_ROUTER_HPP
#define THINCORE_TASK_ROUTER_HPP

#include "task_envelope.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace thincore {

/**
 * @brief Delivery parameters shared by all router backends
 */
struct RouterConfig {
    std::chrono::milliseconds lease_timeout;  ///< Idle time before a claim may be taken over
    int max_attempts;                         ///< Deliveries before dead-lettering

    RouterConfig()
        : lease_timeout(std::chrono::milliseconds(300000)),
          max_attempts(3) {}
};

/**
 * @brief What nack did with the message
 */
enum class NackResult {
    REQUEUED,        ///< Back on the queue tail with attempt + 1
    DEAD_LETTERED,   ///< Attempts exhausted, moved to the dead-letter queue
    STALE            ///< Lease no longer held by the caller; nothing changed
};

/**
 * @brief Entry of a dead-letter queue
 */
struct DeadLetterEntry {
    TaskEnvelope envelope;
    CompletionStatus status;
    std::string reason;
    int64_t dead_lettered_at_ms;             ///< Unix epoch milliseconds

    DeadLetterEntry() : status(CompletionStatus::FAILED), dead_lettered_at_ms(0) {}
};

/**
 * @brief Task router interface
 *
 * Implementations must be safe for concurrent use by several threads.
 * Queue backend failures surface as TransientIOError.
 */
class TaskRouter {
public:
    virtual ~TaskRouter() = default;

    /**
     * @brief Append an envelope to the queue of its task type
     */
    virtual void enqueue(const TaskEnvelope& envelope) = 0;

    /**
     * @brief Claim the next message for any of the given task types
     *
     * Expired leases held by other consumers of the group are taken over
     * first. A taken-over message whose attempt reaches max_attempts is
     * dead-lettered as FAILED and not returned.
     *
     * @param consumer_group Group the worker competes in
     * @param worker_id Consumer name, unique within the group
     * @param task_types Capabilities the worker declares
     * @param block_timeout Maximum wait when nothing is available
     * @return Envelope with lease_token set, or std::nullopt on timeout
     */
    virtual std::optional<TaskEnvelope> claim(
        const std::string& consumer_group,
        const std::string& worker_id,
        const std::vector<std::string>& task_types,
        std::chrono::milliseconds block_timeout
    ) = 0;

    /**
     * @brief Acknowledge a claimed message and publish a DONE event
     *
     * Acknowledging a message that is no longer pending (already acked after
     * a takeover) is a no-op and publishes nothing.
     *
     * @return true if this call removed the message from the pending set
     */
    virtual bool ack(const TaskEnvelope& envelope, const TaskOutcome& outcome) = 0;

    /**
     * @brief Return a claimed message for redelivery
     */
    virtual NackResult nack(const TaskEnvelope& envelope, const std::string& reason) = 0;

    /**
     * @brief Move a claimed message to the dead-letter queue and publish a terminal event
     *
     * @return false if the caller's lease was stale and nothing changed
     */
    virtual bool dead_letter(
        const TaskEnvelope& envelope,
        CompletionStatus status,
        const std::string& reason
    ) = 0;

    /**
     * @brief Position just after the newest completion event of a run
     *
     * Polling from this cursor yields only events published afterwards.
     */
    virtual std::string completion_cursor(const std::string& run_id) = 0;

    /**
     * @brief Read completion events after a cursor
     *
     * @param run_id Run to read
     * @param cursor Updated to the position after the last returned event
     * @param timeout Maximum wait when no event is available
     */
    virtual std::vector<CompletionEvent> poll_completions(
        const std::string& run_id,
        std::string& cursor,
        std::chrono::milliseconds timeout
    ) = 0;

    /**
     * @brief Inspect the dead-letter queue of a task type, oldest first
     */
    virtual std::vector<DeadLetterEntry> dead_letters(const std::string& task_type) = 0;

    /**
     * @brief Messages of a task type not yet acknowledged by a group (waiting + claimed)
     */
    virtual size_t queue_depth(const std::string& task_type, const std::string& consumer_group) = 0;

    virtual std::string describe() const = 0;

    virtual const RouterConfig& config() const = 0;
};

} // namespace thincore

#endif // THINCORE_TASK_ROUTER_HPP
