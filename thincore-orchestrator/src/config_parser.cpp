#include "config_parser.hpp"
#include "cost_guard.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace thincore {
namespace orchestrator {

namespace {

SourceDocument parse_source(const std::string& name, const json& source_json) {
    if (!source_json.is_object()) {
        throw ConfigParseError("Source '" + name + "' must be an object");
    }

    int given = static_cast<int>(source_json.contains("path")) +
                static_cast<int>(source_json.contains("text")) +
                static_cast<int>(source_json.contains("artifact"));
    if (given != 1) {
        throw RunSpecError("Source '" + name + "' must have exactly one of path, text or artifact");
    }

    if (source_json.contains("path")) {
        return SourceDocument(name, SourceKind::PATH,
                              expand_environment_variables(source_json["path"].get<std::string>()));
    }
    if (source_json.contains("text")) {
        return SourceDocument(name, SourceKind::TEXT, source_json["text"].get<std::string>());
    }

    std::string hash = source_json["artifact"].get<std::string>();
    try {
        return SourceDocument(name, SourceKind::ARTIFACT, artifacts::normalize_digest(hash));
    } catch (const IntegrityError&) {
        throw RunSpecError("Source '" + name + "' artifact is not a SHA-256 digest: " + hash);
    }
}

TaskSpec parse_task(const json& task_json) {
    TaskSpec task;

    if (!task_json.contains("id")) {
        throw ConfigParseError("Task missing required field: id");
    }
    task.id = task_json["id"].get<std::string>();

    if (!task_json.contains("type")) {
        throw ConfigParseError("Task '" + task.id + "' missing required field: type");
    }
    task.type = task_json["type"].get<std::string>();

    if (task_json.contains("inputs")) {
        for (const auto& input : task_json["inputs"]) {
            task.inputs.push_back(input.get<std::string>());
        }
    }

    // Params: plain string (env-expanded), any other JSON value (dumped), or hex
    if (task_json.contains("params_hex")) {
        try {
            task.params = artifacts::from_hex(task_json["params_hex"].get<std::string>());
        } catch (const IntegrityError& e) {
            throw ConfigParseError("Task '" + task.id + "' has invalid params_hex: " + e.what());
        }
    } else if (task_json.contains("params")) {
        const json& params = task_json["params"];
        task.params = params.is_string()
            ? expand_environment_variables(params.get<std::string>())
            : params.dump();
    }

    if (task_json.contains("estimated_cost_units")) {
        task.estimated_cost = task_json["estimated_cost_units"].get<int64_t>();
    } else if (task_json.contains("estimated_cost")) {
        try {
            task.estimated_cost = CostGuard::to_units(task_json["estimated_cost"].get<double>());
        } catch (const ConfigurationError&) {
            throw RunSpecError("Task '" + task.id + "' has a negative or invalid estimated_cost");
        }
    }

    if (task_json.contains("best_effort")) {
        task.best_effort = task_json["best_effort"].get<bool>();
    }

    return task;
}

} // namespace

std::string expand_environment_variables(const std::string& value) {
    std::string result;
    size_t pos = 0;

    while (pos < value.size()) {
        if (value[pos] != '$') {
            result += value[pos++];
            continue;
        }

        size_t start = pos++;
        bool braces = pos < value.size() && value[pos] == '{';
        if (braces) {
            pos++;
        }

        size_t name_start = pos;
        while (pos < value.size() &&
               (std::isalnum(static_cast<unsigned char>(value[pos])) || value[pos] == '_')) {
            pos++;
        }
        std::string var_name = value.substr(name_start, pos - name_start);

        if (braces) {
            if (pos >= value.size() || value[pos] != '}') {
                // Unterminated ${...}: keep literally
                result += value.substr(start, pos - start);
                continue;
            }
            pos++;
        }

        if (var_name.empty()) {
            result += value.substr(start, pos - start);
            continue;
        }

        const char* env_value = std::getenv(var_name.c_str());
        result += env_value ? env_value : "";
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    fs::path p(path);

    if (p.is_absolute()) {
        return path;
    }

    fs::path config_dir = fs::path(config_file_path).parent_path();
    return (config_dir / p).string();
}

RunSpec parse_run_spec_from_string(const std::string& json_string) {
    RunSpec spec;

    try {
        json j = json::parse(json_string);
        if (!j.is_object()) {
            throw ConfigParseError("Run spec must be a JSON object");
        }

        if (j.contains("run_id")) {
            spec.run_id = j["run_id"].get<std::string>();
        }
        if (j.contains("description")) {
            spec.description = j["description"].get<std::string>();
        }

        if (j.contains("sources")) {
            for (auto it = j["sources"].begin(); it != j["sources"].end(); ++it) {
                spec.sources[it.key()] = parse_source(it.key(), it.value());
            }
        }

        if (!j.contains("tasks")) {
            throw ConfigParseError("Missing required field: tasks");
        }
        for (const auto& task_json : j["tasks"]) {
            spec.tasks.push_back(parse_task(task_json));
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }

    validate_run_spec(spec);
    if (!spec.run_id.empty()) {
        validate_run_id(spec.run_id);
    }

    return spec;
}

RunSpec parse_run_spec_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open run spec: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    RunSpec spec = parse_run_spec_from_string(buffer.str());

    for (auto& pair : spec.sources) {
        if (pair.second.kind == SourceKind::PATH) {
            pair.second.value = resolve_relative_path(pair.second.value, file_path);
        }
    }

    return spec;
}

std::string serialize_run_spec(const RunSpec& spec) {
    json j;
    j["run_id"] = spec.run_id;
    j["description"] = spec.description;

    json sources = json::object();
    for (const auto& pair : spec.sources) {
        const SourceDocument& source = pair.second;
        switch (source.kind) {
            case SourceKind::PATH: sources[pair.first] = {{"path", source.value}}; break;
            case SourceKind::TEXT: sources[pair.first] = {{"text", source.value}}; break;
            case SourceKind::ARTIFACT: sources[pair.first] = {{"artifact", source.value}}; break;
        }
    }
    j["sources"] = sources;

    json tasks = json::array();
    for (const auto& task : spec.tasks) {
        json t;
        t["id"] = task.id;
        t["type"] = task.type;
        t["inputs"] = task.inputs;
        t["params_hex"] = artifacts::to_hex(task.params);
        t["estimated_cost_units"] = task.estimated_cost;
        t["best_effort"] = task.best_effort;
        tasks.push_back(t);
    }
    j["tasks"] = tasks;

    return j.dump(2);
}

} // namespace orchestrator
} // namespace thincore
