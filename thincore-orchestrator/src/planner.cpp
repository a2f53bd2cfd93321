/**
 * @file planner.cpp
 * @brief Implementation of Planner
 */

#include "planner.hpp"
#include "config_parser.hpp"
#include "errors.hpp"
#include <fstream>
#include <sstream>
#include <thread>

namespace thincore {
namespace orchestrator {

std::string node_state_to_string(NodeState state) {
    switch (state) {
        case NodeState::BLOCKED: return "blocked";
        case NodeState::READY: return "ready";
        case NodeState::DISPATCHED: return "dispatched";
        case NodeState::DONE: return "done";
        case NodeState::FAILED: return "failed";
        case NodeState::SKIPPED: return "skipped";
        default: return "unknown";
    }
}

const NodeStatus* RunResult::find_node(const std::string& id) const {
    for (const auto& node : nodes) {
        if (node.id == id) {
            return &node;
        }
    }
    return nullptr;
}

int RunResult::exit_code() const {
    switch (status) {
        case RunStatus::COMPLETED: return 0;
        case RunStatus::HALTED: return 3;
        case RunStatus::CANCELLED: return 4;
        case RunStatus::FAILED:
        case RunStatus::RUNNING:
        default: return 1;
    }
}

Planner::Planner(
    const PlannerConfig& config,
    std::shared_ptr<TaskRouter> router,
    std::shared_ptr<artifacts::ArtifactStore> store,
    std::shared_ptr<ManifestLog> manifest,
    std::shared_ptr<CostGuard> cost_guard,
    std::shared_ptr<RunControl> run_control,
    Logger* logger
)
    : config_(config),
      router_(std::move(router)),
      store_(std::move(store)),
      manifest_(std::move(manifest)),
      cost_guard_(std::move(cost_guard)),
      run_control_(std::move(run_control)),
      logger_(logger ? logger : &Logger::get_instance()),
      stop_requested_(false) {

    if (!router_ || !store_ || !manifest_ || !cost_guard_ || !run_control_) {
        throw ConfigurationError("Planner requires a router, store, manifest, cost guard and run control");
    }
}

std::string Planner::submit(const RunSpec& spec, int64_t ceiling) {
    validate_run_id(spec.run_id);
    validate_run_spec(spec);

    RunSpec stored = spec;
    for (auto& pair : stored.sources) {
        SourceDocument& source = pair.second;
        if (source.kind == SourceKind::PATH) {
            std::ifstream file(source.value, std::ios::binary);
            if (!file.is_open()) {
                throw ConfigurationError("Cannot read source '" + source.name + "' from " + source.value);
            }
            std::ostringstream buffer;
            buffer << file.rdbuf();
            source.value = store_->put(buffer.str(), "application/octet-stream");
        } else if (source.kind == SourceKind::TEXT) {
            source.value = store_->put(source.value, "text/plain");
        } else if (!store_->exists(source.value)) {
            throw RunSpecError("Source '" + source.name + "' names artifact " + source.value +
                               " which is not in the store");
        }
        source.kind = SourceKind::ARTIFACT;
    }

    for (const auto& task : stored.tasks) {
        for (const auto& input : task.inputs) {
            InputReference ref = parse_input_reference(input);
            if (ref.kind == InputKind::ARTIFACT && !store_->exists(ref.target)) {
                throw RunSpecError("Task '" + task.id + "' names artifact " + ref.target +
                                   " which is not in the store");
            }
        }
    }

    std::string spec_hash = store_->put(serialize_run_spec(stored), "application/json");

    LogContext ctx(spec.run_id);
    ctx.phase = "plan";
    auto existing = run_control_->get(spec.run_id);
    if (existing && existing->spec_hash != spec_hash) {
        logger_->log_warning(ctx, "Run spec differs from the one previously recorded; "
                                  "only tasks with unchanged keys will be reused");
    }

    run_control_->register_run(spec.run_id, spec_hash, ceiling);
    logger_->log_info(ctx, "Run submitted", {
        {"spec_hash", spec_hash},
        {"tasks", std::to_string(stored.tasks.size())},
        {"sources", std::to_string(stored.sources.size())},
        {"ceiling", CostGuard::format_units(ceiling)}
    });
    return spec.run_id;
}

void Planner::resume(const std::string& run_id, std::optional<int64_t> ceiling) {
    auto record = run_control_->get(run_id);
    if (!record || record->spec_hash.empty()) {
        throw ConfigurationError("Unknown run: " + run_id);
    }

    int64_t effective = ceiling ? *ceiling : record->ceiling;
    run_control_->register_run(run_id, record->spec_hash, effective);

    LogContext ctx(run_id);
    ctx.phase = "plan";
    logger_->log_info(ctx, "Run resumed", {
        {"previous_status", run_status_to_string(record->status)},
        {"ceiling", CostGuard::format_units(effective)}
    });
}

RunSpec Planner::load_spec(const std::string& run_id) {
    auto record = run_control_->get(run_id);
    if (!record || record->spec_hash.empty()) {
        throw ConfigurationError("Unknown run: " + run_id);
    }

    artifacts::Bytes bytes = store_->get(record->spec_hash);
    RunSpec spec;
    try {
        spec = parse_run_spec_from_string(bytes);
    } catch (const ConfigurationError& e) {
        throw IntegrityError("Stored spec " + record->spec_hash + " of run " + run_id +
                             " is invalid: " + e.what());
    }
    spec.run_id = run_id;
    return spec;
}

void Planner::build_nodes(Session& session) {
    session.order = compute_execution_order(session.spec);
    for (const auto& id : session.order) {
        Node node;
        node.task = session.spec.find_task(id);
        node.dependencies = task_dependencies(*node.task);
        node.status.id = id;
        node.status.task_type = node.task->type;
        session.nodes[id] = node;
    }
}

void Planner::transition(Session& session, Node& node, NodeState next) {
    LogContext ctx(session.run_id, node.status.task_key, node.status.task_type);
    ctx.phase = node.status.id;
    logger_->log_state_transition(ctx, node_state_to_string(node.status.state), node_state_to_string(next));
    node.status.state = next;
}

void Planner::refresh_flags(Session& session) {
    session.cancelled = run_control_->is_cancelled(session.run_id);
    session.halted = session.halted || run_control_->is_halted(session.run_id);
}

bool Planner::unblock(Session& session, Node& node) {
    bool all_done = true;
    for (const auto& dep : node.dependencies) {
        const NodeStatus& upstream = session.nodes.at(dep).status;
        if (upstream.state == NodeState::FAILED || upstream.state == NodeState::SKIPPED) {
            node.status.reason = "upstream " + dep + " " + node_state_to_string(upstream.state);
            if (node.task->best_effort) {
                transition(session, node, NodeState::SKIPPED);
                return true;
            }
            return false;
        }
        if (upstream.state != NodeState::DONE) {
            all_done = false;
        }
    }
    if (!all_done) {
        return false;
    }

    node.input_hashes.clear();
    for (const auto& input : node.task->inputs) {
        InputReference ref = parse_input_reference(input);
        switch (ref.kind) {
            case InputKind::SOURCE: {
                const SourceDocument& source = session.spec.sources.at(ref.target);
                if (source.kind != SourceKind::ARTIFACT) {
                    throw IntegrityError("Source '" + ref.target + "' of run " + session.run_id +
                                         " was never stored");
                }
                node.input_hashes.push_back(source.value);
                break;
            }
            case InputKind::ARTIFACT:
                node.input_hashes.push_back(ref.target);
                break;
            case InputKind::TASK:
                node.input_hashes.push_back(session.nodes.at(ref.target).status.artifact_hash);
                break;
        }
    }

    node.status.task_key = compute_task_key(node.task->type, node.input_hashes, node.task->params);
    transition(session, node, NodeState::READY);
    return true;
}

void Planner::resolve_ready(Session& session, Node& node) {
    const std::string& key = node.status.task_key;
    LogContext ctx(session.run_id, key, node.status.task_type);
    ctx.phase = "dispatch";

    Resolution resolution = session.cache->resolve(key);

    if (resolution.is_resolved()) {
        if (resolution.from_prior_run) {
            ManifestEntry entry = ManifestEntry::done(key, resolution.artifact_hash, 0, node.status.task_type);
            manifest_->append(session.run_id, entry);
            session.cache->record(entry);
        }
        node.status.artifact_hash = resolution.artifact_hash;
        node.status.cached = true;
        logger_->log_task_cached(ctx, resolution.artifact_hash);
        transition(session, node, NodeState::DONE);
        session.result.cached++;
        return;
    }

    // Another node with the same key is already in flight
    if (resolution.is_pending()) {
        session.in_flight[key].push_back(node.status.id);
        transition(session, node, NodeState::DISPATCHED);
        return;
    }

    refresh_flags(session);
    if (session.cancelled || session.halted) {
        return;
    }

    if (session.cache->recorded_failure(key)) {
        logger_->log_info(ctx, "Retrying task that failed in an earlier session", {{"node", node.status.id}});
    }

    TaskEnvelope envelope;
    envelope.run_id = session.run_id;
    envelope.task_key = key;
    envelope.task_type = node.status.task_type;
    envelope.input_hashes = node.input_hashes;
    envelope.params = node.task->params;
    envelope.estimated_cost = node.task->estimated_cost;

    router_->enqueue(envelope);
    session.cache->mark_pending(key);
    session.in_flight[key].push_back(node.status.id);
    logger_->log_task_dispatched(ctx, envelope.attempt);
    transition(session, node, NodeState::DISPATCHED);
    session.result.dispatched++;
}

bool Planner::advance(Session& session) {
    bool progressed = false;
    bool changed = true;

    while (changed && !session.cancelled) {
        changed = false;
        for (const auto& id : session.order) {
            Node& node = session.nodes.at(id);
            if (node.status.state == NodeState::BLOCKED && unblock(session, node)) {
                changed = true;
            }
            if (node.status.state == NodeState::READY) {
                resolve_ready(session, node);
                if (node.status.state != NodeState::READY) {
                    changed = true;
                }
            }
            if (session.cancelled) {
                break;
            }
        }
        progressed = progressed || changed;
    }
    return progressed;
}

void Planner::apply_event(Session& session, const CompletionEvent& event) {
    LogContext ctx(session.run_id, event.task_key, event.task_type);
    ctx.phase = "complete";

    auto it = session.in_flight.find(event.task_key);
    if (it == session.in_flight.end()) {
        logger_->log_debug(ctx, "Ignoring completion for a task not in flight", {
            {"status", status_to_string(event.status)}
        });
        return;
    }
    std::vector<std::string> ids = it->second;
    session.in_flight.erase(it);

    switch (event.status) {
        case CompletionStatus::DONE: {
            session.cache->record(ManifestEntry::done(event.task_key, event.artifact_hash,
                                                      event.cost_charged, event.task_type));
            session.result.session_cost += event.cost_charged;
            for (size_t i = 0; i < ids.size(); ++i) {
                Node& node = session.nodes.at(ids[i]);
                node.status.artifact_hash = event.artifact_hash;
                node.status.cost_charged = i == 0 ? event.cost_charged : 0;
                transition(session, node, NodeState::DONE);
                session.result.completed++;
            }
            break;
        }
        case CompletionStatus::FAILED: {
            ManifestEntry entry = ManifestEntry::failed(event.task_key, event.task_type);
            manifest_->append(session.run_id, entry);
            session.cache->record(entry);
            for (const auto& id : ids) {
                Node& node = session.nodes.at(id);
                node.status.reason = event.reason;
                transition(session, node, NodeState::FAILED);
            }
            logger_->log_error(ctx, "Task failed after " + std::to_string(event.attempt + 1) +
                                    " attempt(s): " + event.reason);
            break;
        }
        case CompletionStatus::CANCELLED:
        case CompletionStatus::HALTED: {
            session.cache->clear_pending(event.task_key);
            for (const auto& id : ids) {
                Node& node = session.nodes.at(id);
                node.status.reason = event.reason;
                transition(session, node, NodeState::READY);
            }
            if (event.status == CompletionStatus::HALTED) {
                session.halted = true;
            }
            break;
        }
    }
}

RunResult Planner::execute(const std::string& run_id) {
    auto started = std::chrono::steady_clock::now();

    auto record = run_control_->get(run_id);
    if (!record) {
        throw ConfigurationError("Unknown run: " + run_id);
    }

    Session session;
    session.run_id = run_id;
    session.result.run_id = run_id;
    session.spec = load_spec(run_id);

    LogContext ctx(run_id);
    ctx.phase = "plan";

    try {
        session.cache = std::make_unique<ResumeCacheManager>(manifest_, store_, logger_);
        session.cache->load(run_id);
        if (!config_.consult_runs.empty()) {
            session.cache->also_consult(config_.consult_runs);
        }

        LedgerSnapshot ledger = cost_guard_->ledger().open_run(run_id, record->ceiling,
                                                               session.cache->recorded_cost());
        logger_->log_info(ctx, "Ledger opened", {
            {"spent", CostGuard::format_units(ledger.spent)},
            {"ceiling", CostGuard::format_units(ledger.ceiling)}
        });

        session.cursor = router_->completion_cursor(run_id);
        build_nodes(session);
        logger_->log_state_transition(ctx, run_status_to_string(record->status),
                                      run_status_to_string(RunStatus::RUNNING));

        int consecutive_errors = 0;
        while (true) {
            try {
                refresh_flags(session);
                if (session.cancelled) {
                    break;
                }

                advance(session);
                if (session.cancelled || session.in_flight.empty()) {
                    break;
                }
                if (stop_requested_) {
                    logger_->log_warning(ctx, "Planner stopped with " + std::to_string(session.in_flight.size()) +
                                              " task(s) in flight");
                    break;
                }

                auto events = router_->poll_completions(run_id, session.cursor, config_.poll_timeout);
                for (const auto& event : events) {
                    apply_event(session, event);
                }
                consecutive_errors = 0;
            } catch (const TransientIOError& e) {
                if (++consecutive_errors > config_.max_consecutive_errors) {
                    throw;
                }
                logger_->log_warning(ctx, std::string("Backend unavailable, retrying: ") + e.what());
                std::this_thread::sleep_for(config_.error_backoff);
            }
        }
    } catch (const IntegrityError& e) {
        logger_->log_error(ctx, std::string("Run aborted: ") + e.what());
        run_control_->set_status(run_id, RunStatus::FAILED);
        throw;
    }

    return finish(session, started);
}

RunResult Planner::finish(Session& session, std::chrono::steady_clock::time_point started) {
    RunResult& result = session.result;

    bool all_done = true;
    for (const auto& id : session.order) {
        const NodeStatus& status = session.nodes.at(id).status;
        result.nodes.push_back(status);
        switch (status.state) {
            case NodeState::DONE: break;
            case NodeState::FAILED: result.failed++; all_done = false; break;
            case NodeState::SKIPPED: result.skipped++; all_done = false; break;
            default: result.blocked++; all_done = false; break;
        }
    }

    if (all_done) {
        result.status = RunStatus::COMPLETED;
    } else if (session.cancelled) {
        result.status = RunStatus::CANCELLED;
    } else if (session.halted) {
        result.status = RunStatus::HALTED;
    } else {
        result.status = RunStatus::FAILED;
    }

    result.total_cost = cost_guard_->snapshot(session.run_id).spent;
    result.elapsed_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - started).count();

    run_control_->set_status(session.run_id, result.status);

    LogContext ctx(session.run_id);
    ctx.phase = "summary";
    logger_->log_run_summary(ctx, run_status_to_string(result.status), {
        {"dispatched", std::to_string(result.dispatched)},
        {"cached", std::to_string(result.cached)},
        {"completed", std::to_string(result.completed)},
        {"failed", std::to_string(result.failed)},
        {"skipped", std::to_string(result.skipped)},
        {"blocked", std::to_string(result.blocked)},
        {"session_cost", CostGuard::format_units(result.session_cost)},
        {"total_cost", CostGuard::format_units(result.total_cost)},
        {"elapsed_ms", std::to_string(static_cast<int64_t>(result.elapsed_ms))}
    });
    return result;
}

} // namespace orchestrator
} // namespace thincore
