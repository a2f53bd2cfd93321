/**
 * @file commands.hpp
 * @brief Subcommands of the thincore executable
 */

#ifndef THINCORE_CLI_COMMANDS_HPP
#define THINCORE_CLI_COMMANDS_HPP

#include "core_config.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace thincore {
namespace cli {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;

struct CLIArgs {
    std::string command;                 ///< run, resume, worker, cancel, status, dead-letters
    std::string target;                  ///< run id, or task type for dead-letters
    std::string spec_path;
    std::string cost_ceiling;            ///< Empty: configured value
    std::string config_path;
    std::string queue_url;
    std::string store_url;
    std::string state_dir;
    std::string local_workers;
    std::string log_level;
    std::string consumer_group;
    std::string worker_id;
    std::vector<std::string> task_types;
    std::vector<std::string> consult_runs;
    size_t max_tasks = 0;
    bool help = false;
};

/**
 * @brief Explicit configuration layer built from the command-line flags
 */
orchestrator::ConfigOverrides build_overrides(const CLIArgs& args);

/**
 * @brief Submit a run spec and drive it to the end
 * @return Run exit code
 */
int cmd_run(const CLIArgs& args, const orchestrator::CoreConfig& config);

/**
 * @brief Drive a previously submitted run again
 *
 * The recorded ceiling is kept unless one is configured explicitly.
 */
int cmd_resume(const CLIArgs& args, const orchestrator::CoreConfig& config);

/**
 * @brief Serve task queues until interrupted
 */
int cmd_worker(const CLIArgs& args, const orchestrator::CoreConfig& config);

int cmd_cancel(const CLIArgs& args, const orchestrator::CoreConfig& config);

int cmd_status(const CLIArgs& args, const orchestrator::CoreConfig& config);

int cmd_dead_letters(const CLIArgs& args, const orchestrator::CoreConfig& config);

} // namespace cli
} // namespace thincore

#endif // THINCORE_CLI_COMMANDS_HPP
