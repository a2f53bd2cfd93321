/**
 * @file services.cpp
 * @brief Service wiring for local and Redis deployments
 */

#include "services.hpp"
#include "errors.hpp"
#include "file_manifest.hpp"
#include "memory_router.hpp"
#include "model_gateway.hpp"
#include "redis_ledger.hpp"
#include "redis_manifest.hpp"
#include "redis_router.hpp"
#include "redis_run_control.hpp"
#include "redis_support.hpp"
#include "store/store_factory.hpp"
#include <unistd.h>

namespace thincore {
namespace orchestrator {

void configure_logging(const CoreConfig& config) {
    LoggerConfig logger_config;
    logger_config.min_level = string_to_level(config.log_level);
    logger_config.enable_console = true;
    logger_config.enable_json = config.log_json;
    logger_config.enable_file = !config.log_file.empty();
    if (logger_config.enable_file) {
        logger_config.log_file_path = config.log_file;
    }
    Logger::get_instance().configure(logger_config);
}

std::shared_ptr<HandlerRegistry> build_handler_registry(const CoreConfig& config) {
    auto registry = std::make_shared<HandlerRegistry>();
    if (!config.gateway_url.empty()) {
        register_llm_handler(*registry, std::make_shared<HttpModelGateway>(config.gateway_url));
    }
    return registry;
}

ServiceBundle build_services(const CoreConfig& config, Logger* logger) {
    validate_core_config(config);
    Logger* log = logger ? logger : &Logger::get_instance();

    ServiceBundle services;
    services.config = config;
    services.store = artifacts::open_artifact_store(config.store_url);
    services.handlers = build_handler_registry(config);

    if (config.is_local()) {
        services.router = std::make_shared<MemoryTaskRouter>(config.router_config(), log);
        services.manifest = std::make_shared<FileManifestLog>(config.state_dir);
        services.ledger = std::make_shared<MemorySpendLedger>();
        services.run_control = std::make_shared<FileRunControl>(config.state_dir);
    } else {
        auto redis = connect_redis(config.queue_url);
        services.router = std::make_shared<RedisTaskRouter>(redis, config.router_config(), config.key_prefix, log);
        services.manifest = std::make_shared<RedisManifestLog>(redis, config.key_prefix);
        services.ledger = std::make_shared<RedisSpendLedger>(redis, config.key_prefix);
        services.run_control = std::make_shared<RedisRunControl>(redis, config.key_prefix);
    }
    services.cost_guard = std::make_shared<CostGuard>(services.ledger, log);

    LogContext ctx;
    ctx.phase = "start";
    log->log_info(ctx, "Services ready", {
        {"router", services.router->describe()},
        {"store", Logger::mask_url(services.store->describe())},
        {"manifest", services.manifest->describe()},
        {"ledger", services.ledger->describe()}
    });
    return services;
}

PlannerConfig make_planner_config(const CoreConfig& config) {
    PlannerConfig planner;
    planner.poll_timeout = std::chrono::milliseconds(config.claim_timeout_ms);
    planner.consult_runs = config.consult_runs;
    return planner;
}

WorkerConfig make_worker_config(const CoreConfig& config, const std::string& worker_id) {
    WorkerConfig worker;
    worker.consumer_group = config.consumer_group;
    worker.worker_id = worker_id;
    worker.claim_timeout = std::chrono::milliseconds(config.claim_timeout_ms);
    return worker;
}

std::string default_worker_id() {
    char host[256] = {0};
    if (::gethostname(host, sizeof(host) - 1) != 0 || host[0] == '\0') {
        return "worker-" + std::to_string(::getpid());
    }
    return std::string(host) + "-" + std::to_string(::getpid());
}

} // namespace orchestrator
} // namespace thincore
