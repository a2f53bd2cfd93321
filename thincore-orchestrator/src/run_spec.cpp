#include "run_spec.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <queue>
#include <set>
#include <sstream>

namespace thincore {
namespace orchestrator {

namespace {

const std::string SOURCE_PREFIX = "source:";
const std::string ARTIFACT_PREFIX = "artifact:";
const size_t MAX_RUN_ID_LENGTH = 128;

bool starts_with(const std::string& value, const std::string& prefix) {
    return value.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

const TaskSpec* RunSpec::find_task(const std::string& id) const {
    for (const auto& task : tasks) {
        if (task.id == id) {
            return &task;
        }
    }
    return nullptr;
}

void validate_run_id(const std::string& run_id) {
    if (run_id.empty()) {
        throw RunSpecError("Run ID cannot be empty");
    }
    if (run_id.size() > MAX_RUN_ID_LENGTH) {
        throw RunSpecError("Run ID longer than " + std::to_string(MAX_RUN_ID_LENGTH) + " characters");
    }
    if (run_id[0] == '.') {
        throw RunSpecError("Run ID cannot start with '.': " + run_id);
    }
    for (char c : run_id) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '.' && c != '_' && c != '-') {
            throw RunSpecError("Run ID contains invalid character '" + std::string(1, c) + "': " + run_id);
        }
    }
}

InputReference parse_input_reference(const std::string& input_ref) {
    if (input_ref.empty()) {
        throw RunSpecError("Input reference cannot be empty");
    }

    if (starts_with(input_ref, SOURCE_PREFIX)) {
        std::string name = input_ref.substr(SOURCE_PREFIX.size());
        if (name.empty()) {
            throw RunSpecError("Source reference has no name: " + input_ref);
        }
        return {InputKind::SOURCE, name};
    }

    if (starts_with(input_ref, ARTIFACT_PREFIX)) {
        std::string hash = input_ref.substr(ARTIFACT_PREFIX.size());
        try {
            return {InputKind::ARTIFACT, artifacts::normalize_digest(hash)};
        } catch (const IntegrityError&) {
            throw RunSpecError("Artifact reference is not a SHA-256 digest: " + input_ref);
        }
    }

    return {InputKind::TASK, input_ref};
}

std::vector<std::string> task_dependencies(const TaskSpec& task) {
    std::vector<std::string> deps;
    for (const auto& input : task.inputs) {
        InputReference ref = parse_input_reference(input);
        if (ref.kind == InputKind::TASK &&
            std::find(deps.begin(), deps.end(), ref.target) == deps.end()) {
            deps.push_back(ref.target);
        }
    }
    return deps;
}

void validate_run_spec(const RunSpec& spec) {
    // Check: At least one task exists
    if (spec.tasks.empty()) {
        throw RunSpecError("Run must contain at least one task");
    }

    // Check: All task IDs are unique
    std::set<std::string> task_ids;
    for (const auto& task : spec.tasks) {
        if (task.id.empty()) {
            throw RunSpecError("Task ID cannot be empty");
        }
        if (starts_with(task.id, SOURCE_PREFIX) || starts_with(task.id, ARTIFACT_PREFIX)) {
            throw RunSpecError("Task ID cannot use a reserved prefix: " + task.id);
        }
        if (!task_ids.insert(task.id).second) {
            throw RunSpecError("Duplicate task ID: " + task.id);
        }
        if (task.type.empty()) {
            throw RunSpecError("Task type cannot be empty for task: " + task.id);
        }
    }

    for (const auto& pair : spec.sources) {
        if (pair.second.kind != SourceKind::TEXT && pair.second.value.empty()) {
            throw RunSpecError("Source '" + pair.first + "' has no path or artifact");
        }
    }

    // Check: All inputs resolve
    for (const auto& task : spec.tasks) {
        for (const auto& input : task.inputs) {
            InputReference ref = parse_input_reference(input);
            if (ref.kind == InputKind::SOURCE && spec.sources.find(ref.target) == spec.sources.end()) {
                throw RunSpecError("Task '" + task.id + "' references unknown source: " + input);
            }
            if (ref.kind == InputKind::TASK) {
                if (ref.target == task.id) {
                    throw RunSpecError("Task '" + task.id + "' depends on itself");
                }
                if (task_ids.find(ref.target) == task_ids.end()) {
                    throw RunSpecError("Task '" + task.id + "' references unknown task: " + input);
                }
            }
        }
    }

    // Check: No circular dependencies
    compute_execution_order(spec);
}

std::vector<std::string> compute_execution_order(const RunSpec& spec) {
    std::map<std::string, int> in_degree;
    std::map<std::string, std::vector<std::string>> dependents;

    for (const auto& task : spec.tasks) {
        in_degree[task.id] = 0;
    }
    for (const auto& task : spec.tasks) {
        for (const auto& dep : task_dependencies(task)) {
            if (in_degree.find(dep) == in_degree.end()) {
                continue;
            }
            dependents[dep].push_back(task.id);
            in_degree[task.id]++;
        }
    }

    // Kahn's algorithm, seeded in declaration order
    std::queue<std::string> ready_queue;
    for (const auto& task : spec.tasks) {
        if (in_degree[task.id] == 0) {
            ready_queue.push(task.id);
        }
    }

    std::vector<std::string> execution_order;
    while (!ready_queue.empty()) {
        std::string current_id = ready_queue.front();
        ready_queue.pop();
        execution_order.push_back(current_id);

        for (const auto& dependent : dependents[current_id]) {
            if (--in_degree[dependent] == 0) {
                ready_queue.push(dependent);
            }
        }
    }

    if (execution_order.size() != spec.tasks.size()) {
        std::ostringstream oss;
        oss << "Circular dependency detected. Tasks not in execution order:";
        for (const auto& task : spec.tasks) {
            if (std::find(execution_order.begin(), execution_order.end(), task.id) == execution_order.end()) {
                oss << " " << task.id;
            }
        }
        throw RunSpecError(oss.str());
    }

    return execution_order;
}

} // namespace orchestrator
} // namespace thincore
