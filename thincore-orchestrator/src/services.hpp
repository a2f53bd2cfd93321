/**
 * @file services.hpp
 * @brief Wiring of the shared services for a deployment mode
 *
 * Local mode (queue_url "local"): in-memory router and ledger, manifests and
 * run records as files under state_dir. Planner and workers must share the
 * process.
 *
 * Fleet mode (queue_url redis://...): Redis router, manifest, ledger and run
 * control under key_prefix, shared by any number of processes.
 */

#ifndef THINCORE_ORCHESTRATOR_SERVICES_HPP
#define THINCORE_ORCHESTRATOR_SERVICES_HPP

#include "core_config.hpp"
#include "cost_guard.hpp"
#include "handler_registry.hpp"
#include "logger.hpp"
#include "manifest.hpp"
#include "planner.hpp"
#include "run_control.hpp"
#include "spend_ledger.hpp"
#include "store/artifact_store.hpp"
#include "task_router.hpp"
#include "worker_agent.hpp"
#include <memory>
#include <string>

namespace thincore {
namespace orchestrator {

/**
 * @brief Services shared by planner and workers
 */
struct ServiceBundle {
    CoreConfig config;
    std::shared_ptr<artifacts::ArtifactStore> store;
    std::shared_ptr<TaskRouter> router;
    std::shared_ptr<ManifestLog> manifest;
    std::shared_ptr<SpendLedger> ledger;
    std::shared_ptr<CostGuard> cost_guard;
    std::shared_ptr<RunControl> run_control;
    std::shared_ptr<HandlerRegistry> handlers;
};

/**
 * @brief Apply log settings to the singleton logger
 */
void configure_logging(const CoreConfig& config);

/**
 * @brief Open every service for the configured mode
 *
 * @throws ConfigurationError on unusable settings
 * @throws TransientIOError if Redis cannot be reached
 */
ServiceBundle build_services(const CoreConfig& config, Logger* logger = nullptr);

/**
 * @brief Built-in handlers, plus llm when a gateway URL is configured
 */
std::shared_ptr<HandlerRegistry> build_handler_registry(const CoreConfig& config);

PlannerConfig make_planner_config(const CoreConfig& config);

WorkerConfig make_worker_config(const CoreConfig& config, const std::string& worker_id);

/**
 * @brief Default worker id: <hostname>-<pid>
 */
std::string default_worker_id();

} // namespace orchestrator
} // namespace thincore

#endif // THINCORE_ORCHESTRATOR_SERVICES_HPP
