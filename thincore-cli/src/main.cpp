#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include "commands.hpp"
#include "core_config.hpp"
#include "errors.hpp"
#include "run_spec.hpp"
#include "services.hpp"

using namespace thincore;
using thincore::cli::CLIArgs;

namespace {

void print_usage(const char* program_name) {
    std::cerr << "thincore v0.3.0\n\n";
    std::cerr << "Usage: " << program_name << " <command> [arguments] [options]\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  run <run_id> --spec <file>  Submit a run spec and execute it\n";
    std::cerr << "  resume <run_id>             Execute a submitted run again, reusing finished tasks\n";
    std::cerr << "  worker                      Serve task queues until interrupted (shared queue only)\n";
    std::cerr << "  cancel <run_id>             Request cancellation of a run\n";
    std::cerr << "  status <run_id>             Show the run record and manifest summary\n";
    std::cerr << "  dead-letters <task_type>    List dead-lettered tasks of a type\n\n";
    std::cerr << "Run options:\n";
    std::cerr << "  --spec <path>               JSON run spec (run)\n";
    std::cerr << "  --cost-ceiling <amount>     Spending ceiling in currency, or 'unlimited'\n";
    std::cerr << "                              (default: 10.00; resume keeps the recorded ceiling)\n";
    std::cerr << "  --consult <run,run>         Prior runs whose outputs may be reused\n";
    std::cerr << "  --local-workers <n>         Worker threads for local runs (default: 2)\n\n";
    std::cerr << "Worker options:\n";
    std::cerr << "  --types <a,b>               Task types to serve (default: every registered type)\n";
    std::cerr << "  --group <name>              Consumer group (default: workers)\n";
    std::cerr << "  --id <name>                 Worker id (default: <hostname>-<pid>)\n";
    std::cerr << "  --max-tasks <n>             Exit after n tasks (default: no limit)\n\n";
    std::cerr << "Common options:\n";
    std::cerr << "  --config <path>             JSON configuration file\n";
    std::cerr << "  --queue <url>               'local' or redis://host:port (default: local)\n";
    std::cerr << "  --store <url>               memory:, file://<dir> or http(s)://<host>\n";
    std::cerr << "                              (default: file://./.thincore/artifacts)\n";
    std::cerr << "  --state-dir <path>          Local manifests and run records (default: ./.thincore/state)\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Settings can also come from THINCORE_<KEY> environment variables,\n";
    std::cerr << "e.g. THINCORE_QUEUE_URL; command-line flags take precedence.\n\n";
    std::cerr << "Exit codes: 0 completed, 1 failed, 2 usage or configuration error,\n";
    std::cerr << "            3 halted at the cost ceiling, 4 cancelled\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  1. Local run:\n";
    std::cerr << "     " << program_name << " run exp-1 --spec run.json --cost-ceiling 5\n\n";
    std::cerr << "  2. Fleet run with two workers:\n";
    std::cerr << "     " << program_name << " worker --queue redis://localhost:6379 --types llm &\n";
    std::cerr << "     " << program_name << " worker --queue redis://localhost:6379 --types concat &\n";
    std::cerr << "     " << program_name << " run exp-1 --spec run.json --queue redis://localhost:6379\n";
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--spec" && i + 1 < argc) {
            args.spec_path = argv[++i];
        } else if (arg == "--cost-ceiling" && i + 1 < argc) {
            args.cost_ceiling = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--queue" && i + 1 < argc) {
            args.queue_url = argv[++i];
        } else if (arg == "--store" && i + 1 < argc) {
            args.store_url = argv[++i];
        } else if (arg == "--state-dir" && i + 1 < argc) {
            args.state_dir = argv[++i];
        } else if (arg == "--local-workers" && i + 1 < argc) {
            args.local_workers = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--types" && i + 1 < argc) {
            args.task_types = split_list(argv[++i]);
        } else if (arg == "--group" && i + 1 < argc) {
            args.consumer_group = argv[++i];
        } else if (arg == "--id" && i + 1 < argc) {
            args.worker_id = argv[++i];
        } else if (arg == "--consult" && i + 1 < argc) {
            args.consult_runs = split_list(argv[++i]);
        } else if (arg == "--max-tasks" && i + 1 < argc) {
            std::string value = argv[++i];
            if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
                std::cerr << "Error: --max-tasks must be a non-negative integer\n\n";
                return false;
            }
            args.max_tasks = static_cast<size_t>(std::stoull(value));
        } else if (!arg.empty() && arg[0] != '-' && args.command.empty()) {
            args.command = arg;
        } else if (!arg.empty() && arg[0] != '-' && args.target.empty()) {
            args.target = arg;
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;
    const std::string& cmd = args.command;

    if (cmd != "run" && cmd != "resume" && cmd != "worker" && cmd != "cancel" &&
        cmd != "status" && cmd != "dead-letters") {
        std::cerr << "Error: Unknown command: " << cmd << "\n";
        return false;
    }

    if (cmd == "run" || cmd == "resume" || cmd == "cancel" || cmd == "status") {
        if (args.target.empty()) {
            std::cerr << "Error: " << cmd << " requires a run id\n";
            valid = false;
        } else {
            try {
                orchestrator::validate_run_id(args.target);
            } catch (const ConfigurationError& e) {
                std::cerr << "Error: " << e.what() << "\n";
                valid = false;
            }
        }
    } else if (cmd == "dead-letters") {
        if (args.target.empty()) {
            std::cerr << "Error: dead-letters requires a task type\n";
            valid = false;
        }
    } else if (!args.target.empty()) {
        std::cerr << "Error: Unexpected argument: " << args.target << "\n";
        valid = false;
    }

    if (cmd == "run" && args.spec_path.empty()) {
        std::cerr << "Error: --spec is required\n";
        valid = false;
    }
    if (cmd != "run" && !args.spec_path.empty()) {
        std::cerr << "Error: --spec is only accepted by run\n";
        valid = false;
    }

    return valid;
}

int dispatch(const CLIArgs& args, const orchestrator::CoreConfig& config) {
    if (args.command == "run") return cli::cmd_run(args, config);
    if (args.command == "resume") return cli::cmd_resume(args, config);
    if (args.command == "worker") return cli::cmd_worker(args, config);
    if (args.command == "cancel") return cli::cmd_cancel(args, config);
    if (args.command == "status") return cli::cmd_status(args, config);
    return cli::cmd_dead_letters(args, config);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    // Parse arguments
    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return cli::EXIT_USAGE;
    }

    // Handle help
    if (args.help) {
        print_usage(argv[0]);
        return cli::EXIT_OK;
    }

    // If no arguments provided, show usage
    if (argc == 1) {
        print_usage(argv[0]);
        return cli::EXIT_OK;
    }

    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return cli::EXIT_USAGE;
    }

    orchestrator::CoreConfig config;
    try {
        config = orchestrator::load_core_config(args.config_path, cli::build_overrides(args));
        orchestrator::configure_logging(config);
    } catch (const ConfigurationError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return cli::EXIT_USAGE;
    }

    try {
        return dispatch(args, config);
    } catch (const ConfigurationError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return cli::EXIT_USAGE;
    } catch (const ThinCoreError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return cli::EXIT_FAILED;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return cli::EXIT_FAILED;
    }
}
