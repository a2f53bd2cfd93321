/**
 * @file core_config.hpp
 * @brief Deployment settings shared by the planner, workers and the CLI
 *
 * Settings are layered, highest priority first:
 * 1. Explicit values (command-line flags)
 * 2. Environment variables: THINCORE_<KEY>, e.g. THINCORE_QUEUE_URL
 * 3. JSON configuration file (--config)
 * 4. Built-in defaults
 *
 * Every setting has one key used by all layers: the JSON field name, the
 * override map key, and (upper-cased, prefixed) the environment variable.
 */

#ifndef THINCORE_ORCHESTRATOR_CORE_CONFIG_HPP
#define THINCORE_ORCHESTRATOR_CORE_CONFIG_HPP

#include "task_router.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace thincore {
namespace orchestrator {

/**
 * @brief Layer a setting was taken from
 */
enum class ConfigSource {
    DEFAULT,
    CONFIG_FILE,
    ENVIRONMENT,
    EXPLICIT
};

std::string config_source_to_string(ConfigSource source);

/// Explicit settings by key, e.g. {"queue_url", "redis://localhost:6379"}
using ConfigOverrides = std::map<std::string, std::string>;

/**
 * @brief Resolved deployment configuration
 */
struct CoreConfig {
    std::string queue_url;                 ///< "local" or redis://...
    std::string store_url;                 ///< memory:, file://dir, http(s)://...
    std::string state_dir;                 ///< Local manifests and run records
    std::string gateway_url;               ///< Model gateway; empty disables the llm handler
    std::string consumer_group;
    std::string key_prefix;                ///< Redis key prefix
    int64_t lease_timeout_ms;
    int max_attempts;
    int64_t cost_ceiling;                  ///< Cost units, UNLIMITED_CEILING for no limit
    std::string log_level;
    std::string log_file;                  ///< Empty: console only
    bool log_json;
    int local_workers;                     ///< Worker threads in local mode
    int64_t claim_timeout_ms;              ///< Blocking claim / poll interval
    std::vector<std::string> consult_runs; ///< Prior runs whose results may be reused

    std::map<std::string, ConfigSource> sources;

    CoreConfig();

    bool is_local() const { return queue_url == "local"; }

    RouterConfig router_config() const;

    /**
     * @brief Source of one setting (DEFAULT if never overridden)
     */
    ConfigSource source_of(const std::string& key) const;

    /**
     * @brief One-line summary with credentials in URLs masked
     */
    std::string to_string() const;
};

/**
 * @brief Keys accepted by every layer
 */
const std::vector<std::string>& config_keys();

/**
 * @brief Parse a cost ceiling: a currency amount or "unlimited"
 *
 * @return Cost units, or UNLIMITED_CEILING
 * @throws ConfigurationError for negative or malformed amounts
 */
int64_t parse_cost_ceiling(const std::string& text);

/**
 * @brief Apply one setting
 * @throws ConfigurationError for unknown keys or malformed values
 */
void apply_setting(CoreConfig& config, const std::string& key, const std::string& value, ConfigSource source);

/**
 * @brief Apply a JSON configuration file; string values are env-expanded
 * @throws ConfigurationError if the file cannot be read or parsed
 */
void apply_config_file(CoreConfig& config, const std::string& file_path);

/**
 * @brief Apply every THINCORE_<KEY> environment variable that is set
 */
void apply_environment(CoreConfig& config);

/**
 * @brief Check value ranges
 * @throws ConfigurationError on the first invalid setting
 */
void validate_core_config(const CoreConfig& config);

/**
 * @brief Build a configuration from all layers
 *
 * @param config_file_path JSON file, or empty for none
 * @param overrides Explicit values
 */
CoreConfig load_core_config(const std::string& config_file_path, const ConfigOverrides& overrides);

} // namespace orchestrator
} // namespace thincore

#endif // THINCORE_ORCHESTRATOR_CORE_CONFIG_HPP
