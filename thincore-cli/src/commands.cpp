/**
 * @file commands.cpp
 * @brief run, resume, worker, cancel, status and dead-letters
 *
 * Results go to stdout as JSON; progress and diagnostics go to the logger
 * (stderr).
 */

#include "commands.hpp"
#include "config_parser.hpp"
#include "errors.hpp"
#include "planner.hpp"
#include "services.hpp"
#include "worker_agent.hpp"
#include <atomic>
#include <csignal>
#include <exception>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace thincore {
namespace cli {

using orchestrator::CoreConfig;
using orchestrator::Planner;
using orchestrator::RunResult;
using orchestrator::ServiceBundle;

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void handle_interrupt(int) {
    g_interrupted = 1;
}

void install_interrupt_handlers() {
    g_interrupted = 0;
    std::signal(SIGINT, handle_interrupt);
    std::signal(SIGTERM, handle_interrupt);
}

/**
 * @brief Worker threads serving the in-process queue of a local run
 *
 * An exception escaping a worker is kept and rethrown by stop(). When the
 * last worker exits on its own, on_exhausted is called so the planner does
 * not wait for completions nobody will produce.
 */
class LocalWorkerPool {
public:
    LocalWorkerPool(const ServiceBundle& services, int count, std::function<void()> on_exhausted)
        : on_exhausted_(std::move(on_exhausted)), stopping_(false) {
        for (int i = 0; i < count; ++i) {
            WorkerConfig config = orchestrator::make_worker_config(
                services.config, "local-" + std::to_string(i + 1));
            workers_.push_back(std::make_unique<WorkerAgent>(
                config, services.router, services.store, services.manifest,
                services.cost_guard, services.run_control, services.handlers));
        }
        errors_.resize(workers_.size());
        running_ = workers_.size();
        for (size_t i = 0; i < workers_.size(); ++i) {
            threads_.emplace_back([this, i]() {
                try {
                    workers_[i]->run();
                } catch (const std::exception& e) {
                    LogContext ctx;
                    ctx.worker_id = "local-" + std::to_string(i + 1);
                    Logger::get_instance().log_error(ctx, std::string("Worker stopped: ") + e.what());
                    errors_[i] = std::current_exception();
                }
                if (--running_ == 0 && !stopping_ && on_exhausted_) {
                    on_exhausted_();
                }
            });
        }
    }

    ~LocalWorkerPool() {
        join_all();
    }

    void stop() {
        join_all();
        for (const auto& error : errors_) {
            if (error) {
                std::rethrow_exception(error);
            }
        }
    }

    WorkerStats totals() const {
        WorkerStats total;
        for (const auto& worker : workers_) {
            WorkerStats stats = worker->get_stats();
            total.claimed += stats.claimed;
            total.completed += stats.completed;
            total.reused += stats.reused;
            total.requeued += stats.requeued;
            total.dead_lettered += stats.dead_lettered;
            total.halted += stats.halted;
            total.abandoned += stats.abandoned;
            total.transient_errors += stats.transient_errors;
            total.errors += stats.errors;
            total.cost_charged += stats.cost_charged;
        }
        return total;
    }

private:
    std::vector<std::unique_ptr<WorkerAgent>> workers_;
    std::vector<std::thread> threads_;
    std::vector<std::exception_ptr> errors_;
    std::function<void()> on_exhausted_;
    std::atomic<size_t> running_;
    std::atomic<bool> stopping_;

    void join_all() {
        stopping_ = true;
        for (auto& worker : workers_) {
            worker->request_stop();
        }
        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    }
};

Planner make_planner(const ServiceBundle& services) {
    return Planner(orchestrator::make_planner_config(services.config), services.router, services.store,
                   services.manifest, services.cost_guard, services.run_control);
}

json stats_to_json(const WorkerStats& stats) {
    json j;
    j["claimed"] = stats.claimed;
    j["completed"] = stats.completed;
    j["reused"] = stats.reused;
    j["requeued"] = stats.requeued;
    j["dead_lettered"] = stats.dead_lettered;
    j["halted"] = stats.halted;
    j["abandoned"] = stats.abandoned;
    j["transient_errors"] = stats.transient_errors;
    j["errors"] = stats.errors;
    j["cost_charged"] = CostGuard::format_units(stats.cost_charged);
    return j;
}

json result_to_json(const RunResult& result) {
    json j;
    j["run_id"] = result.run_id;
    j["status"] = run_status_to_string(result.status);
    j["dispatched"] = result.dispatched;
    j["cached"] = result.cached;
    j["completed"] = result.completed;
    j["failed"] = result.failed;
    j["skipped"] = result.skipped;
    j["blocked"] = result.blocked;
    j["session_cost"] = CostGuard::format_units(result.session_cost);
    j["total_cost"] = CostGuard::format_units(result.total_cost);
    j["elapsed_ms"] = result.elapsed_ms;

    json nodes = json::array();
    for (const auto& node : result.nodes) {
        json n;
        n["id"] = node.id;
        n["type"] = node.task_type;
        n["state"] = orchestrator::node_state_to_string(node.state);
        n["task_key"] = node.task_key;
        n["artifact"] = node.artifact_hash;
        n["cost_charged"] = CostGuard::format_units(node.cost_charged);
        n["cached"] = node.cached;
        if (!node.reason.empty()) {
            n["reason"] = node.reason;
        }
        nodes.push_back(n);
    }
    j["nodes"] = nodes;
    return j;
}

std::string format_ceiling(int64_t ceiling) {
    return ceiling == UNLIMITED_CEILING ? "unlimited" : CostGuard::format_units(ceiling);
}

/**
 * @brief Execute a registered run; local mode serves it with in-process workers
 */
int drive(const ServiceBundle& services, Planner& planner, const std::string& run_id) {
    RunResult result;
    if (services.config.is_local()) {
        LocalWorkerPool pool(services, services.config.local_workers, [&planner]() { planner.request_stop(); });
        result = planner.execute(run_id);
        pool.stop();
        json output = result_to_json(result);
        output["workers"] = stats_to_json(pool.totals());
        std::cout << output.dump(2) << std::endl;
    } else {
        result = planner.execute(run_id);
        std::cout << result_to_json(result).dump(2) << std::endl;
    }
    return result.exit_code();
}

} // anonymous namespace

orchestrator::ConfigOverrides build_overrides(const CLIArgs& args) {
    orchestrator::ConfigOverrides overrides;
    if (!args.queue_url.empty()) overrides["queue_url"] = args.queue_url;
    if (!args.store_url.empty()) overrides["store_url"] = args.store_url;
    if (!args.state_dir.empty()) overrides["state_dir"] = args.state_dir;
    if (!args.local_workers.empty()) overrides["local_workers"] = args.local_workers;
    if (!args.log_level.empty()) overrides["log_level"] = args.log_level;
    if (!args.consumer_group.empty()) overrides["consumer_group"] = args.consumer_group;
    if (!args.cost_ceiling.empty()) overrides["cost_ceiling"] = args.cost_ceiling;
    if (!args.consult_runs.empty()) {
        std::string joined;
        for (const auto& run : args.consult_runs) {
            if (!joined.empty()) joined += ",";
            joined += run;
        }
        overrides["consult_runs"] = joined;
    }
    return overrides;
}

int cmd_run(const CLIArgs& args, const CoreConfig& config) {
    orchestrator::RunSpec spec = orchestrator::parse_run_spec_from_file(args.spec_path);
    if (!spec.run_id.empty() && spec.run_id != args.target) {
        Logger::get_instance().log_warning(LogContext(args.target),
            "Run spec names run '" + spec.run_id + "'; using '" + args.target + "'");
    }
    spec.run_id = args.target;

    ServiceBundle services = orchestrator::build_services(config);
    Planner planner = make_planner(services);
    planner.submit(spec, config.cost_ceiling);
    return drive(services, planner, args.target);
}

int cmd_resume(const CLIArgs& args, const CoreConfig& config) {
    std::optional<int64_t> ceiling;
    if (config.source_of("cost_ceiling") != orchestrator::ConfigSource::DEFAULT) {
        ceiling = config.cost_ceiling;
    }

    ServiceBundle services = orchestrator::build_services(config);
    Planner planner = make_planner(services);
    planner.resume(args.target, ceiling);
    return drive(services, planner, args.target);
}

int cmd_worker(const CLIArgs& args, const CoreConfig& config) {
    if (config.is_local()) {
        std::cerr << "Error: the worker command needs a shared queue (--queue redis://...); "
                     "local runs start their own workers\n";
        return EXIT_USAGE;
    }

    ServiceBundle services = orchestrator::build_services(config);
    WorkerConfig worker_config = orchestrator::make_worker_config(
        config, args.worker_id.empty() ? orchestrator::default_worker_id() : args.worker_id);
    worker_config.task_types = args.task_types;
    worker_config.max_tasks = args.max_tasks;

    WorkerAgent worker(worker_config, services.router, services.store, services.manifest,
                       services.cost_guard, services.run_control, services.handlers);

    install_interrupt_handlers();
    std::atomic<bool> finished(false);
    std::exception_ptr error;
    std::thread loop([&]() {
        try {
            worker.run();
        } catch (const std::exception&) {
            error = std::current_exception();
        }
        finished = true;
    });

    while (!finished) {
        if (g_interrupted) {
            worker.request_stop();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    loop.join();
    if (error) {
        std::rethrow_exception(error);
    }

    json output;
    output["worker_id"] = worker_config.worker_id;
    output["task_types"] = worker.task_types();
    output["stats"] = stats_to_json(worker.get_stats());
    std::cout << output.dump(2) << std::endl;
    return EXIT_OK;
}

int cmd_cancel(const CLIArgs& args, const CoreConfig& config) {
    ServiceBundle services = orchestrator::build_services(config);
    if (!services.run_control->get(args.target)) {
        std::cerr << "Error: Unknown run: " << args.target << "\n";
        return EXIT_FAILED;
    }
    services.run_control->cancel(args.target);
    Logger::get_instance().log_info(LogContext(args.target), "Cancellation requested");

    json output;
    output["run_id"] = args.target;
    output["cancelled"] = true;
    std::cout << output.dump(2) << std::endl;
    return EXIT_OK;
}

int cmd_status(const CLIArgs& args, const CoreConfig& config) {
    ServiceBundle services = orchestrator::build_services(config);
    std::optional<RunRecord> record = services.run_control->get(args.target);
    if (!record) {
        std::cerr << "Error: Unknown run: " << args.target << "\n";
        return EXIT_FAILED;
    }

    std::vector<ManifestEntry> entries = services.manifest->replay(args.target);
    std::map<std::string, ManifestEntry> resolved = fold_manifest(entries);
    size_t done = 0;
    size_t failed = 0;
    for (const auto& item : resolved) {
        if (item.second.is_failed()) {
            ++failed;
        } else {
            ++done;
        }
    }

    json output;
    output["run_id"] = record->run_id;
    output["status"] = run_status_to_string(record->status);
    output["spec_hash"] = record->spec_hash;
    output["ceiling"] = format_ceiling(record->ceiling);
    output["cancelled"] = record->cancelled;
    output["halted"] = record->halted;
    output["updated_at_ms"] = record->updated_at_ms;
    output["manifest"] = {
        {"entries", entries.size()},
        {"done", done},
        {"failed", failed},
        {"cost_charged", CostGuard::format_units(total_cost(entries))}
    };

    LedgerSnapshot snapshot = services.cost_guard->snapshot(args.target);
    if (snapshot.opened) {
        output["ledger"] = {
            {"spent", CostGuard::format_units(snapshot.spent)},
            {"in_flight", CostGuard::format_units(snapshot.in_flight)},
            {"ceiling", format_ceiling(snapshot.ceiling)}
        };
    }
    std::cout << output.dump(2) << std::endl;
    return EXIT_OK;
}

int cmd_dead_letters(const CLIArgs& args, const CoreConfig& config) {
    ServiceBundle services = orchestrator::build_services(config);
    json entries = json::array();
    for (const auto& entry : services.router->dead_letters(args.target)) {
        json e;
        e["run_id"] = entry.envelope.run_id;
        e["task_key"] = entry.envelope.task_key;
        e["task_type"] = entry.envelope.task_type;
        e["attempt"] = entry.envelope.attempt;
        e["status"] = status_to_string(entry.status);
        e["reason"] = entry.reason;
        e["dead_lettered_at_ms"] = entry.dead_lettered_at_ms;
        entries.push_back(e);
    }
    std::cout << entries.dump(2) << std::endl;
    return EXIT_OK;
}

} // namespace cli
} // namespace thincore
