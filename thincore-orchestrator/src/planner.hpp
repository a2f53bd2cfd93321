/**
 * @file planner.hpp
 * @brief Turns a run spec into dispatched tasks and folds completions back in
 *
 * The Planner is responsible for:
 * - Storing the run spec and its source documents as artifacts
 * - Computing task keys once all upstream outputs are known
 * - Resolving ready nodes through the resume cache before dispatching
 * - Consuming completion events and advancing the DAG
 * - Honouring cancellation and cost halts
 *
 * Node states: blocked -> ready -> dispatched -> done | failed. A node with a
 * failed or skipped upstream stays blocked, unless it is best-effort, in
 * which case it is skipped.
 */

#ifndef THINCORE_ORCHESTRATOR_PLANNER_HPP
#define THINCORE_ORCHESTRATOR_PLANNER_HPP

#include "cost_guard.hpp"
#include "logger.hpp"
#include "manifest.hpp"
#include "resume_cache.hpp"
#include "run_control.hpp"
#include "run_spec.hpp"
#include "store/artifact_store.hpp"
#include "task_router.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace thincore {
namespace orchestrator {

/**
 * @brief State of a DAG node within a planner session
 */
enum class NodeState {
    BLOCKED,      ///< Waiting on upstream nodes
    READY,        ///< Task key known, not yet resolved or dispatched
    DISPATCHED,   ///< Enqueued, awaiting a completion event
    DONE,
    FAILED,
    SKIPPED       ///< Best-effort node below a failure
};

std::string node_state_to_string(NodeState state);

/**
 * @brief Per-node outcome
 */
struct NodeStatus {
    std::string id;
    std::string task_type;
    NodeState state;
    std::string task_key;             ///< Empty while blocked
    std::string artifact_hash;        ///< Set when DONE
    int64_t cost_charged;             ///< Charged in this session
    bool cached;                      ///< Resolved without dispatch
    std::string reason;               ///< Failure or skip cause

    NodeStatus() : state(NodeState::BLOCKED), cost_charged(0), cached(false) {}
};

/**
 * @brief Result of a planner session
 */
struct RunResult {
    std::string run_id;
    RunStatus status;
    std::vector<NodeStatus> nodes;    ///< Execution order
    size_t dispatched;
    size_t cached;
    size_t completed;                 ///< Done via a completion event
    size_t failed;
    size_t skipped;
    size_t blocked;
    int64_t session_cost;             ///< Charged by tasks completed in this session
    int64_t total_cost;               ///< Settled spend of the run across sessions
    double elapsed_ms;

    RunResult()
        : status(RunStatus::RUNNING), dispatched(0), cached(0), completed(0), failed(0),
          skipped(0), blocked(0), session_cost(0), total_cost(0), elapsed_ms(0.0) {}

    const NodeStatus* find_node(const std::string& id) const;

    /**
     * @brief Process exit code: completed 0, failed 1, halted 3, cancelled 4
     */
    int exit_code() const;
};

/**
 * @brief Planner configuration
 */
struct PlannerConfig {
    std::chrono::milliseconds poll_timeout;      ///< Completion wait per loop; bounds reaction to cancel
    std::chrono::milliseconds error_backoff;     ///< Pause after a transient backend failure
    int max_consecutive_errors;                  ///< Transient failures tolerated in a row
    std::vector<std::string> consult_runs;       ///< Prior runs whose outputs may be reused

    PlannerConfig()
        : poll_timeout(std::chrono::milliseconds(1000)),
          error_backoff(std::chrono::milliseconds(1000)),
          max_consecutive_errors(30) {}
};

/**
 * @brief DAG planner for one run at a time
 *
 * Usage Example:
 *   @code
 *   Planner planner(config, router, store, manifest, guard, control);
 *   std::string run_id = planner.submit(parse_run_spec_from_file("run.json"), ceiling);
 *   RunResult result = planner.execute(run_id);
 *   return result.exit_code();
 *   @endcode
 */
class Planner {
public:
    Planner(
        const PlannerConfig& config,
        std::shared_ptr<TaskRouter> router,
        std::shared_ptr<artifacts::ArtifactStore> store,
        std::shared_ptr<ManifestLog> manifest,
        std::shared_ptr<CostGuard> cost_guard,
        std::shared_ptr<RunControl> run_control,
        Logger* logger = nullptr
    );

    /**
     * @brief Register a run
     *
     * Source documents are stored as artifacts and the spec, rewritten to
     * reference them by hash, is stored too and recorded in run control.
     *
     * @param spec Validated run spec with a run id
     * @param ceiling Cost units, or UNLIMITED_CEILING
     * @return The run id
     * @throws RunSpecError if the run id is missing or invalid
     * @throws ConfigurationError if a source file cannot be read
     */
    std::string submit(const RunSpec& spec, int64_t ceiling);

    /**
     * @brief Re-register an existing run for another session
     *
     * @param ceiling New ceiling, or std::nullopt to keep the recorded one
     * @throws ConfigurationError if the run is unknown
     */
    void resume(const std::string& run_id, std::optional<int64_t> ceiling);

    /**
     * @brief Drive a registered run until nothing more can progress
     *
     * @throws IntegrityError if the manifest, spec or an event is corrupt
     * @throws TransientIOError if backends stay unavailable
     */
    RunResult execute(const std::string& run_id);

    /**
     * @brief Make a running execute() return after its current poll
     *
     * Nodes still dispatched are reported as blocked and the session ends
     * failed. Safe to call from another thread.
     */
    void request_stop() { stop_requested_ = true; }

    /**
     * @brief Spec stored for a run
     */
    RunSpec load_spec(const std::string& run_id);

private:
    struct Node {
        const TaskSpec* task;
        NodeStatus status;
        std::vector<std::string> dependencies;
        std::vector<std::string> input_hashes;

        Node() : task(nullptr) {}
    };

    struct Session {
        std::string run_id;
        RunSpec spec;
        std::vector<std::string> order;
        std::map<std::string, Node> nodes;
        std::map<std::string, std::vector<std::string>> in_flight;   ///< task_key -> node ids
        std::unique_ptr<ResumeCacheManager> cache;
        std::string cursor;
        bool cancelled;
        bool halted;
        RunResult result;

        Session() : cancelled(false), halted(false) {}
    };

    PlannerConfig config_;
    std::shared_ptr<TaskRouter> router_;
    std::shared_ptr<artifacts::ArtifactStore> store_;
    std::shared_ptr<ManifestLog> manifest_;
    std::shared_ptr<CostGuard> cost_guard_;
    std::shared_ptr<RunControl> run_control_;
    Logger* logger_;
    std::atomic<bool> stop_requested_;

    void build_nodes(Session& session);
    bool advance(Session& session);
    bool unblock(Session& session, Node& node);
    void resolve_ready(Session& session, Node& node);
    void apply_event(Session& session, const CompletionEvent& event);
    void transition(Session& session, Node& node, NodeState next);
    void refresh_flags(Session& session);
    RunResult finish(Session& session, std::chrono::steady_clock::time_point started);
};

} // namespace orchestrator
} // namespace thincore

#endif // THINCORE_ORCHESTRATOR_PLANNER_HPP
