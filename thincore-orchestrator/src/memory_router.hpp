/**
 * @file memory_router.hpp
 * @brief In-process task router for local mode and tests
 */

#ifndef THINCORE_MEMORY_ROUTER_HPP
#define THINCORE_MEMORY_ROUTER_HPP

#include "task_router.hpp"
#include "logger.hpp"
#include <condition_variable>
#include <map>
#include <mutex>

namespace thincore {

/**
 * @brief Task router held in process memory
 *
 * Mirrors the Redis Streams semantics: each task type is an append-only log,
 * each consumer group keeps its own read position and pending set, and leases
 * are measured on the steady clock. Nothing survives the process.
 *
 * Queues, dead letters and completion events are kept for the life of the
 * router, so a consumer group created late still sees every message. One
 * router serves one local run, which bounds them by the tasks of that run.
 */
class MemoryTaskRouter : public TaskRouter {
public:
    explicit MemoryTaskRouter(const RouterConfig& config = RouterConfig(), Logger* logger = nullptr);

    void enqueue(const TaskEnvelope& envelope) override;

    std::optional<TaskEnvelope> claim(
        const std::string& consumer_group,
        const std::string& worker_id,
        const std::vector<std::string>& task_types,
        std::chrono::milliseconds block_timeout
    ) override;

    bool ack(const TaskEnvelope& envelope, const TaskOutcome& outcome) override;
    NackResult nack(const TaskEnvelope& envelope, const std::string& reason) override;
    bool dead_letter(const TaskEnvelope& envelope, CompletionStatus status, const std::string& reason) override;

    std::string completion_cursor(const std::string& run_id) override;
    std::vector<CompletionEvent> poll_completions(
        const std::string& run_id,
        std::string& cursor,
        std::chrono::milliseconds timeout
    ) override;

    std::vector<DeadLetterEntry> dead_letters(const std::string& task_type) override;
    size_t queue_depth(const std::string& task_type, const std::string& consumer_group) override;

    std::string describe() const override { return "local"; }
    const RouterConfig& config() const override { return config_; }

    /**
     * @brief Make every outstanding lease eligible for takeover immediately
     *
     * Simulates workers that crashed after claiming.
     */
    void expire_leases();

    /// Total number of deliveries handed out, takeovers included
    size_t delivery_count() const;

private:
    using Clock = std::chrono::steady_clock;

    struct Message {
        uint64_t id;
        TaskEnvelope envelope;
    };

    struct Pending {
        Message message;
        std::string consumer;
        uint64_t delivery;           ///< Serial of the current delivery, part of the lease token
        int attempt;                 ///< Effective attempt of the current delivery
        Clock::time_point deadline;
    };

    struct Group {
        std::map<std::string, size_t> next_index;   ///< Per task type read position
        std::map<uint64_t, Pending> pending;        ///< By message id
    };

    struct Lease {
        std::string group;
        uint64_t message_id;
        uint64_t delivery;
    };

    RouterConfig config_;
    Logger* logger_;

    mutable std::mutex mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable events_cv_;

    std::map<std::string, std::vector<Message>> queues_;
    std::map<std::string, Group> groups_;
    std::map<std::string, std::vector<DeadLetterEntry>> dead_letters_;
    std::map<std::string, std::vector<CompletionEvent>> events_;
    uint64_t next_message_id_;
    uint64_t next_delivery_;
    size_t deliveries_;

    // Helpers; caller holds mutex_
    TaskEnvelope deliver(Pending& pending, const std::string& group, const std::string& worker_id, int attempt);
    std::optional<TaskEnvelope> take_over_expired(
        Group& group,
        const std::string& group_name,
        const std::string& worker_id,
        const std::vector<std::string>& task_types
    );
    std::optional<TaskEnvelope> deliver_new(
        Group& group,
        const std::string& group_name,
        const std::string& worker_id,
        const std::vector<std::string>& task_types
    );
    void push_dead_letter(const TaskEnvelope& envelope, CompletionStatus status, const std::string& reason);
    void publish(const CompletionEvent& event);
    Pending* find_owned(const Lease& lease);

    static std::string make_token(const std::string& group, uint64_t message_id, uint64_t delivery);
    static Lease parse_token(const std::string& token);
};

} // namespace thincore

#endif // THINCORE_MEMORY_ROUTER_HPP
