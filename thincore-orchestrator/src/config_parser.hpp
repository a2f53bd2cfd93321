#ifndef THINCORE_ORCHESTRATOR_CONFIG_PARSER_HPP
#define THINCORE_ORCHESTRATOR_CONFIG_PARSER_HPP

#include "run_spec.hpp"
#include <string>

namespace thincore {
namespace orchestrator {

/**
 * @brief Exception thrown when a JSON document cannot be parsed
 */
class ConfigParseError : public ConfigurationError {
public:
    explicit ConfigParseError(const std::string& message)
        : ConfigurationError(message) {}
};

/**
 * @brief Parses a run spec from a JSON file
 *
 * Relative source paths are resolved against the directory of the file.
 *
 * @param file_path Path to the JSON run spec
 * @return Parsed and validated run spec
 * @throws ConfigParseError if the file cannot be read or the JSON is invalid
 * @throws RunSpecError if the run spec is invalid
 */
RunSpec parse_run_spec_from_file(const std::string& file_path);

/**
 * @brief Parses a run spec from a JSON string
 *
 * Task fields: id, type, inputs, params (string or JSON value), params_hex,
 * estimated_cost (currency), estimated_cost_units, best_effort.
 * Source fields: exactly one of path, text, artifact.
 *
 * @throws ConfigParseError if the JSON is invalid
 * @throws RunSpecError if the run spec is invalid
 */
RunSpec parse_run_spec_from_string(const std::string& json_string);

/**
 * @brief Canonical JSON of a run spec, as stored in the artifact store
 *
 * Params are written hex-encoded and costs in units, so parsing the result
 * reproduces the spec exactly.
 */
std::string serialize_run_spec(const RunSpec& spec);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 *
 * @param value String potentially containing variable references
 * @return String with variables expanded
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves file paths relative to config file directory
 *
 * Absolute paths are returned unchanged.
 *
 * @param path File path to resolve
 * @param config_file_path Path to the configuration file
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace orchestrator
} // namespace thincore

#endif // THINCORE_ORCHESTRATOR_CONFIG_PARSER_HPP
