#ifndef THINCORE_ORCHESTRATOR_RUN_SPEC_HPP
#define THINCORE_ORCHESTRATOR_RUN_SPEC_HPP

#include "errors.hpp"
#include "hash/content_hash.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace thincore {
namespace orchestrator {

/**
 * @brief Exception thrown when a run spec is invalid
 */
class RunSpecError : public ConfigurationError {
public:
    explicit RunSpecError(const std::string& message)
        : ConfigurationError(message) {}
};

/**
 * @brief How a source document is supplied
 */
enum class SourceKind {
    PATH,       ///< File read at submit time
    TEXT,       ///< Inline text
    ARTIFACT    ///< Already in the store
};

/**
 * @brief External input document of a run
 */
struct SourceDocument {
    std::string name;         // e.g., "speech_a"
    SourceKind kind;
    std::string value;        // Path, inline text or artifact hash

    SourceDocument() : kind(SourceKind::PATH) {}
    SourceDocument(const std::string& name_, SourceKind kind_, const std::string& value_)
        : name(name_), kind(kind_), value(value_) {}
};

/**
 * @brief Kind of a task input reference
 */
enum class InputKind {
    SOURCE,     // "source:<name>"
    ARTIFACT,   // "artifact:<hash>"
    TASK        // "<task id>"
};

struct InputReference {
    InputKind kind;
    std::string target;       // Source name, normalized hash or task id

    InputReference() : kind(InputKind::TASK) {}
    InputReference(InputKind kind_, const std::string& target_) : kind(kind_), target(target_) {}
};

/**
 * @brief Task node of the run DAG
 */
struct TaskSpec {
    std::string id;                        // Unique within the run, e.g., "analyse"
    std::string type;                      // Handler task type: "llm", "concat", ...
    std::vector<std::string> inputs;       // Ordered input references
    artifacts::Bytes params;               // Opaque, passed to the handler
    int64_t estimated_cost;                // Cost units, negative for the handler default
    bool best_effort;                      // Skipped, not left blocked, when an upstream task fails

    TaskSpec() : estimated_cost(-1), best_effort(false) {}
    TaskSpec(const std::string& id_, const std::string& type_)
        : id(id_), type(type_), estimated_cost(-1), best_effort(false) {}
};

/**
 * @brief Complete run description
 */
struct RunSpec {
    std::string run_id;
    std::string description;
    std::map<std::string, SourceDocument> sources;
    std::vector<TaskSpec> tasks;

    RunSpec() = default;

    const TaskSpec* find_task(const std::string& id) const;
};

/**
 * @brief Checks that a run id is usable as a file name and key segment
 *
 * Allowed: 1-128 characters from [A-Za-z0-9._-], not starting with '.'.
 *
 * @throws RunSpecError if the id is invalid
 */
void validate_run_id(const std::string& run_id);

/**
 * @brief Parses an input reference string
 *
 * @throws RunSpecError on an empty reference, empty target or malformed hash
 */
InputReference parse_input_reference(const std::string& input_ref);

/**
 * @brief Validates a run spec for correctness
 *
 * Validates:
 * - At least one task exists
 * - Task IDs are non-empty and unique, task types are non-empty
 * - Every input references a declared source, a well-formed artifact hash
 *   or another task
 * - No circular dependencies
 *
 * The run id itself is checked separately (it may come from the command line).
 *
 * @throws RunSpecError if validation fails
 */
void validate_run_spec(const RunSpec& spec);

/**
 * @brief Task ids a task depends on, in input order, without duplicates
 */
std::vector<std::string> task_dependencies(const TaskSpec& task);

/**
 * @brief Computes a topological order of the tasks (Kahn's algorithm)
 *
 * Ties are broken by declaration order.
 *
 * @throws RunSpecError if circular dependencies are detected
 */
std::vector<std::string> compute_execution_order(const RunSpec& spec);

} // namespace orchestrator
} // namespace thincore

#endif // THINCORE_ORCHESTRATOR_RUN_SPEC_HPP
