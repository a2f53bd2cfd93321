/**
 * @file redis_router.hpp
 * @brief Task router on Redis Streams
 *
 * Layout:
 *   <prefix>:tasks:<task_type>    stream, one consumer group per worker pool
 *   <prefix>:dlq:<task_type>      stream of dead-lettered envelopes
 *   <prefix>:events:<run_id>      stream of completion events
 *
 * Claims use XREADGROUP; expired leases are found with XPENDING and taken over
 * with XCLAIM, whose delivery counter yields the effective attempt. Ack, nack
 * and dead-letter run as Lua scripts that first check the lease (consumer and
 * delivery count) and then remove the message from the pending set and
 * publish its completion event atomically. A stale holder's ack is refused.
 *
 * Retention: a task entry is deleted (XDEL) by the script that settles it,
 * once every consumer group has read it and none still holds it. A group
 * created later starts from the entries still retained. Dead-letter and
 * completion event streams are kept for inspection and resume; delete
 * <prefix>:events:<run_id> once a run is finished for good.
 */

#ifndef THINCORE_REDIS_ROUTER_HPP
#define THINCORE_REDIS_ROUTER_HPP

#include "task_router.hpp"
#include "logger.hpp"
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <set>

namespace sw { namespace redis { class Redis; } }

namespace thincore {

class RedisTaskRouter : public TaskRouter {
public:
    /**
     * @brief Constructor
     *
     * @param redis Shared connection pool
     * @param config Lease timeout and attempt bound
     * @param key_prefix Prefix for every key (default "thincore")
     * @param logger Optional logger, singleton if null
     */
    RedisTaskRouter(
        std::shared_ptr<sw::redis::Redis> redis,
        const RouterConfig& config = RouterConfig(),
        const std::string& key_prefix = "thincore",
        Logger* logger = nullptr
    );

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

    std::string describe() const override { return "redis (prefix " + key_prefix_ + ")"; }
    const RouterConfig& config() const override { return config_; }

private:
    struct Lease {
        std::string group;
        std::string entry_id;
        std::string consumer;
        long long deliveries;
    };

    std::shared_ptr<sw::redis::Redis> redis_;
    RouterConfig config_;
    std::string key_prefix_;
    Logger* logger_;

    std::mutex mutex_;
    std::set<std::pair<std::string, std::string>> known_groups_;   ///< (stream, group)
    std::map<std::pair<std::string, std::string>, std::deque<TaskEnvelope>> prefetched_;  ///< (group, worker)

    void ensure_group(const std::string& stream, const std::string& group);
    std::optional<TaskEnvelope> take_over_expired(
        const std::string& group,
        const std::string& worker_id,
        const std::string& task_type
    );
    std::optional<TaskEnvelope> next_prefetched(const std::string& group, const std::string& worker_id);
    bool reconfirm(const TaskEnvelope& envelope);
    bool move_to_dead_letter(
        const Lease& lease,
        const TaskEnvelope& envelope,
        CompletionStatus status,
        const std::string& reason
    );

    static std::string make_token(const Lease& lease);
    static Lease parse_token(const std::string& token);
};

} // namespace thincore

#endif // THINCORE_REDIS_ROUTER_HPP
