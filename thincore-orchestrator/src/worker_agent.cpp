/**
 * @file worker_agent.cpp
 * @brief Implementation of WorkerAgent
 */

#include "worker_agent.hpp"
#include "errors.hpp"
#include <optional>
#include <thread>

namespace thincore {

std::string disposition_to_string(TaskDisposition disposition) {
    switch (disposition) {
        case TaskDisposition::COMPLETED: return "completed";
        case TaskDisposition::REUSED: return "reused";
        case TaskDisposition::REQUEUED: return "requeued";
        case TaskDisposition::DEAD_LETTERED: return "dead_lettered";
        case TaskDisposition::HALTED: return "halted";
        case TaskDisposition::ABANDONED: return "abandoned";
        case TaskDisposition::STALE: return "stale";
        default: return "unknown";
    }
}

WorkerAgent::WorkerAgent(
    const WorkerConfig& config,
    std::shared_ptr<TaskRouter> router,
    std::shared_ptr<artifacts::ArtifactStore> store,
    std::shared_ptr<ManifestLog> manifest,
    std::shared_ptr<CostGuard> cost_guard,
    std::shared_ptr<RunControl> run_control,
    std::shared_ptr<const HandlerRegistry> registry,
    Logger* logger
)
    : config_(config),
      router_(std::move(router)),
      store_(std::move(store)),
      manifest_(std::move(manifest)),
      cost_guard_(std::move(cost_guard)),
      run_control_(std::move(run_control)),
      registry_(std::move(registry)),
      logger_(logger ? logger : &Logger::get_instance()),
      stop_requested_(false) {

    if (!router_ || !store_ || !manifest_ || !cost_guard_ || !run_control_ || !registry_) {
        throw ConfigurationError("WorkerAgent requires a router, store, manifest, cost guard, "
                                 "run control and handler registry");
    }
    if (config_.worker_id.empty() || config_.consumer_group.empty()) {
        throw ConfigurationError("Worker id and consumer group cannot be empty");
    }

    task_types_ = config_.task_types.empty() ? registry_->list_task_types() : config_.task_types;
    if (task_types_.empty()) {
        throw ConfigurationError("Worker " + config_.worker_id + " declares no task types");
    }

    LogContext ctx;
    ctx.worker_id = config_.worker_id;
    ctx.phase = "start";
    for (const auto& type : task_types_) {
        TaskHandler& handler = handler_for(type);
        if (handler.get_info().max_duration >= router_->config().lease_timeout) {
            logger_->log_warning(ctx, "Handler for '" + type + "' may run longer than the lease timeout; "
                                      "its tasks can be redelivered while still executing");
        }
    }
}

WorkerStats WorkerAgent::get_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void WorkerAgent::count(TaskDisposition disposition) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    switch (disposition) {
        case TaskDisposition::COMPLETED: stats_.completed++; break;
        case TaskDisposition::REUSED: stats_.reused++; break;
        case TaskDisposition::REQUEUED: stats_.requeued++; break;
        case TaskDisposition::DEAD_LETTERED: stats_.dead_lettered++; break;
        case TaskDisposition::HALTED: stats_.halted++; break;
        case TaskDisposition::ABANDONED: stats_.abandoned++; break;
        case TaskDisposition::STALE: break;
    }
}

TaskHandler& WorkerAgent::handler_for(const std::string& task_type) {
    auto it = handlers_.find(task_type);
    if (it == handlers_.end()) {
        it = handlers_.emplace(task_type, registry_->create_handler(task_type)).first;
    }
    return *it->second;
}

void WorkerAgent::run() {
    LogContext ctx;
    ctx.worker_id = config_.worker_id;
    ctx.phase = "claim";

    std::string types;
    for (const auto& type : task_types_) {
        if (!types.empty()) types += ",";
        types += type;
    }
    logger_->log_info(ctx, "Worker started", {
        {"group", config_.consumer_group},
        {"task_types", types},
        {"router", router_->describe()},
        {"store", store_->describe()}
    });

    size_t processed = 0;
    while (!stop_requested_) {
        if (config_.max_tasks > 0 && processed >= config_.max_tasks) {
            break;
        }

        try {
            if (run_once()) {
                processed++;
            }
        } catch (const TransientIOError& e) {
            {
                std::lock_guard<std::mutex> lock(stats_mutex_);
                stats_.transient_errors++;
            }
            logger_->log_warning(ctx, std::string("Backend unavailable, backing off: ") + e.what());
            std::this_thread::sleep_for(config_.error_backoff);
        } catch (const ThinCoreError& e) {
            // The message stays pending and is dead-lettered once its attempts run out
            {
                std::lock_guard<std::mutex> lock(stats_mutex_);
                stats_.errors++;
            }
            logger_->log_error(ctx, std::string("Task processing failed: ") + e.what());
            std::this_thread::sleep_for(config_.error_backoff);
        }
    }

    WorkerStats stats = get_stats();
    logger_->log_info(ctx, "Worker stopped", {
        {"claimed", std::to_string(stats.claimed)},
        {"completed", std::to_string(stats.completed)},
        {"reused", std::to_string(stats.reused)},
        {"dead_lettered", std::to_string(stats.dead_lettered)},
        {"cost_units", std::to_string(stats.cost_charged)}
    });
}

bool WorkerAgent::run_once() {
    auto envelope = router_->claim(config_.consumer_group, config_.worker_id, task_types_, config_.claim_timeout);
    if (!envelope) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.claimed++;
    }
    count(process(*envelope));
    return true;
}

TaskDisposition WorkerAgent::dead_letter(
    const TaskEnvelope& envelope,
    const LogContext& ctx,
    CompletionStatus status,
    const std::string& reason
) {
    if (!router_->dead_letter(envelope, status, reason)) {
        logger_->log_warning(ctx, "Lease lost before dead-lettering: " + reason);
        return TaskDisposition::STALE;
    }
    logger_->log_task_dead_lettered(ctx, status_to_string(status), reason);
    return TaskDisposition::DEAD_LETTERED;
}

TaskDisposition WorkerAgent::nack(const TaskEnvelope& envelope, const LogContext& ctx, const std::string& reason) {
    switch (router_->nack(envelope, reason)) {
        case NackResult::REQUEUED:
            logger_->log_warning(ctx, "Task requeued after attempt " + std::to_string(envelope.attempt + 1) +
                                      ": " + reason);
            return TaskDisposition::REQUEUED;
        case NackResult::DEAD_LETTERED:
            logger_->log_task_dead_lettered(ctx, status_to_string(CompletionStatus::FAILED),
                                            "attempts exhausted: " + reason);
            return TaskDisposition::DEAD_LETTERED;
        case NackResult::STALE:
        default:
            logger_->log_warning(ctx, "Lease lost before nack: " + reason);
            return TaskDisposition::STALE;
    }
}

TaskDisposition WorkerAgent::halt(const TaskEnvelope& envelope, const LogContext& ctx) {
    run_control_->mark_halted(envelope.run_id);

    // A plain nack on the final attempt would report the task as failed
    if (envelope.attempt + 1 >= router_->config().max_attempts) {
        dead_letter(envelope, ctx, CompletionStatus::HALTED, "cost ceiling reached");
        return TaskDisposition::HALTED;
    }

    TaskDisposition disposition = nack(envelope, ctx, "cost ceiling reached");
    return disposition == TaskDisposition::STALE ? disposition : TaskDisposition::HALTED;
}

TaskDisposition WorkerAgent::process(const TaskEnvelope& envelope) {
    LogContext ctx(envelope.run_id, envelope.task_key, envelope.task_type);
    ctx.worker_id = config_.worker_id;
    ctx.phase = "claim";
    logger_->log_task_claimed(ctx, envelope.attempt);

    if (run_control_->is_cancelled(envelope.run_id)) {
        return dead_letter(envelope, ctx, CompletionStatus::CANCELLED, "run cancelled");
    }
    if (run_control_->is_halted(envelope.run_id)) {
        return dead_letter(envelope, ctx, CompletionStatus::HALTED, "run halted at cost ceiling");
    }

    ctx.phase = "verify";
    try {
        verify_task_key(envelope);
    } catch (const IntegrityError& e) {
        return dead_letter(envelope, ctx, CompletionStatus::FAILED, e.what());
    }

    if (!registry_->is_registered(envelope.task_type)) {
        return dead_letter(envelope, ctx, CompletionStatus::FAILED,
                           "no handler for task type '" + envelope.task_type + "'");
    }

    // Redelivery of a task whose result was recorded before the ack got through
    std::optional<ManifestEntry> recorded;
    try {
        recorded = manifest_->find_done(envelope.run_id, envelope.task_key);
    } catch (const IntegrityError& e) {
        return dead_letter(envelope, ctx, CompletionStatus::FAILED, e.what());
    }
    if (recorded && store_->exists(recorded->resolution)) {
        if (router_->ack(envelope, TaskOutcome(recorded->resolution, 0))) {
            logger_->log_task_cached(ctx, recorded->resolution);
        }
        return TaskDisposition::REUSED;
    }

    return execute(envelope, ctx, handler_for(envelope.task_type));
}

TaskDisposition WorkerAgent::execute(const TaskEnvelope& envelope, LogContext& ctx, TaskHandler& handler) {
    TaskContext task;
    task.run_id = envelope.run_id;
    task.task_key = envelope.task_key;
    task.task_type = envelope.task_type;
    task.input_hashes = envelope.input_hashes;
    task.params = envelope.params;
    task.attempt = envelope.attempt;
    std::string run_id = envelope.run_id;
    std::shared_ptr<RunControl> control = run_control_;
    task.cancelled = [control, run_id]() { return control->is_cancelled(run_id); };

    ctx.phase = "load";
    try {
        for (const auto& hash : envelope.input_hashes) {
            task.inputs.push_back(store_->get(hash));
        }
    } catch (const NotFoundError& e) {
        return dead_letter(envelope, ctx, CompletionStatus::FAILED, std::string("input unavailable: ") + e.what());
    } catch (const IntegrityError& e) {
        return dead_letter(envelope, ctx, CompletionStatus::FAILED, e.what());
    } catch (const TransientIOError& e) {
        return nack(envelope, ctx, e.what());
    }

    HandlerInfo info = handler.get_info();
    Reservation reservation;
    if (info.paid) {
        ctx.phase = "reserve";
        int64_t estimate = envelope.estimated_cost >= 0 ? envelope.estimated_cost : info.default_estimate;
        try {
            reservation = cost_guard_->require(envelope.run_id, estimate, &ctx);
        } catch (const CostCeilingExceeded&) {
            return halt(envelope, ctx);
        }
        task.estimated_cost = reservation.amount;
    }

    ctx.phase = "execute";
    auto start = std::chrono::steady_clock::now();
    TaskResult result;
    try {
        result = handler.execute(task);
        if (result.actual_cost < 0) {
            throw TaskExecutionError("handler reported a negative cost");
        }
    } catch (const IntegrityError& e) {
        cost_guard_->release(envelope.run_id, reservation.amount);
        return dead_letter(envelope, ctx, CompletionStatus::FAILED, e.what());
    } catch (const TransientIOError& e) {
        cost_guard_->release(envelope.run_id, reservation.amount);
        return nack(envelope, ctx, e.what());
    } catch (const std::exception& e) {
        cost_guard_->release(envelope.run_id, reservation.amount);
        return nack(envelope, ctx, e.what());
    }
    double duration_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();

    if (run_control_->is_cancelled(envelope.run_id)) {
        cost_guard_->settle(envelope.run_id, reservation.amount, result.actual_cost);
        logger_->log_warning(ctx, "Run cancelled during execution; leaving task for lease expiry");
        return TaskDisposition::ABANDONED;
    }

    ctx.phase = "record";
    std::string artifact_hash;
    try {
        artifact_hash = store_->put(result.output, result.content_type);
        manifest_->append(envelope.run_id,
                          ManifestEntry::done(envelope.task_key, artifact_hash, result.actual_cost, envelope.task_type));
    } catch (const IntegrityError& e) {
        cost_guard_->settle(envelope.run_id, reservation.amount, result.actual_cost);
        return dead_letter(envelope, ctx, CompletionStatus::FAILED, e.what());
    } catch (const TransientIOError& e) {
        // The work was paid for even though its result is lost
        cost_guard_->settle(envelope.run_id, reservation.amount, result.actual_cost);
        return nack(envelope, ctx, e.what());
    }

    ctx.phase = "settle";
    cost_guard_->settle(envelope.run_id, reservation.amount, result.actual_cost);
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.cost_charged += result.actual_cost;
    }

    if (!router_->ack(envelope, TaskOutcome(artifact_hash, result.actual_cost))) {
        logger_->log_warning(ctx, "Acknowledged after another worker took over the lease");
        return TaskDisposition::STALE;
    }

    logger_->log_task_completed(ctx, artifact_hash, result.actual_cost, duration_ms);
    return TaskDisposition::COMPLETED;
}

} // namespace thincore
