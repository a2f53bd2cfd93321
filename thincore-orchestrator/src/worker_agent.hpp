/**
 * @file worker_agent.hpp
 * @brief Stateless worker loop: claim, check, execute, record, acknowledge
 *
 * A worker holds no state between tasks. Everything it needs arrives in the
 * envelope or lives in the shared services (router, store, manifest, ledger,
 * run control), so any number of workers on any number of machines can serve
 * the same queues.
 *
 * Per task:
 *   1. run cancelled or halted      -> dead-letter as cancelled / halted
 *   2. task key does not verify     -> dead-letter as failed
 *   3. manifest already has result  -> ack with it; no execution, no charge
 *   4. load inputs from the store
 *   5. paid handler: reserve cost   -> denied: mark run halted, nack
 *   6. execute, put output, append manifest entry, settle, ack
 */

#ifndef THINCORE_WORKER_AGENT_HPP
#define THINCORE_WORKER_AGENT_HPP

#include "cost_guard.hpp"
#include "handler_registry.hpp"
#include "logger.hpp"
#include "manifest.hpp"
#include "run_control.hpp"
#include "store/artifact_store.hpp"
#include "task_router.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace thincore {

/**
 * @brief Worker configuration
 */
struct WorkerConfig {
    std::string consumer_group;              ///< Group the worker competes in
    std::string worker_id;                   ///< Unique within the group
    std::vector<std::string> task_types;     ///< Empty: every registered type
    std::chrono::milliseconds claim_timeout; ///< Blocking claim; bounds shutdown latency
    std::chrono::milliseconds error_backoff; ///< Pause after a transient backend failure
    size_t max_tasks;                        ///< Stop after this many tasks; 0 for no limit

    WorkerConfig()
        : consumer_group("workers"),
          worker_id("worker-1"),
          claim_timeout(std::chrono::milliseconds(1000)),
          error_backoff(std::chrono::milliseconds(500)),
          max_tasks(0) {}
};

/**
 * @brief What happened to one claimed task
 */
enum class TaskDisposition {
    COMPLETED,        ///< Executed, recorded and acknowledged
    REUSED,           ///< Acknowledged with an output already in the manifest
    REQUEUED,         ///< Nacked for another attempt
    DEAD_LETTERED,    ///< Moved to the dead-letter queue
    HALTED,           ///< Cost reservation denied
    ABANDONED,        ///< Run cancelled mid-task; left for lease expiry
    STALE             ///< Lease lost to another worker before the task finished
};

std::string disposition_to_string(TaskDisposition disposition);

/**
 * @brief Worker counters
 */
struct WorkerStats {
    size_t claimed = 0;
    size_t completed = 0;
    size_t reused = 0;
    size_t requeued = 0;
    size_t dead_lettered = 0;
    size_t halted = 0;
    size_t abandoned = 0;
    size_t transient_errors = 0;
    size_t errors = 0;                ///< Non-transient failures caught by run()
    int64_t cost_charged = 0;
};

/**
 * @brief Worker agent
 *
 * Usage Example:
 *   @code
 *   WorkerAgent worker(config, router, store, manifest, guard, control, registry);
 *   std::thread t([&]() { worker.run(); });
 *   ...
 *   worker.request_stop();
 *   t.join();
 *   @endcode
 */
class WorkerAgent {
public:
    WorkerAgent(
        const WorkerConfig& config,
        std::shared_ptr<TaskRouter> router,
        std::shared_ptr<artifacts::ArtifactStore> store,
        std::shared_ptr<ManifestLog> manifest,
        std::shared_ptr<CostGuard> cost_guard,
        std::shared_ptr<RunControl> run_control,
        std::shared_ptr<const HandlerRegistry> registry,
        Logger* logger = nullptr
    );

    /**
     * @brief Claim and process tasks until request_stop() or max_tasks
     *
     * Transient backend failures are logged and retried after a pause. Other
     * ThinCore errors are logged and counted; the loop carries on.
     */
    void run();

    /**
     * @brief Claim at most one task and process it
     * @return true if a task was claimed
     */
    bool run_once();

    /**
     * @brief Process a claimed envelope
     */
    TaskDisposition process(const TaskEnvelope& envelope);

    void request_stop() { stop_requested_ = true; }
    bool stop_requested() const { return stop_requested_; }

    const std::vector<std::string>& task_types() const { return task_types_; }
    WorkerStats get_stats() const;

private:
    WorkerConfig config_;
    std::shared_ptr<TaskRouter> router_;
    std::shared_ptr<artifacts::ArtifactStore> store_;
    std::shared_ptr<ManifestLog> manifest_;
    std::shared_ptr<CostGuard> cost_guard_;
    std::shared_ptr<RunControl> run_control_;
    std::shared_ptr<const HandlerRegistry> registry_;
    Logger* logger_;

    std::vector<std::string> task_types_;
    std::map<std::string, std::unique_ptr<TaskHandler>> handlers_;
    std::atomic<bool> stop_requested_;

    mutable std::mutex stats_mutex_;
    WorkerStats stats_;

    TaskHandler& handler_for(const std::string& task_type);
    TaskDisposition dead_letter(const TaskEnvelope& envelope, const LogContext& ctx,
                                CompletionStatus status, const std::string& reason);
    TaskDisposition nack(const TaskEnvelope& envelope, const LogContext& ctx, const std::string& reason);
    TaskDisposition halt(const TaskEnvelope& envelope, const LogContext& ctx);
    TaskDisposition execute(const TaskEnvelope& envelope, LogContext& ctx, TaskHandler& handler);
    void count(TaskDisposition disposition);
};

} // namespace thincore

#endif // THINCORE_WORKER_AGENT_HPP
