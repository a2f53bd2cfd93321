/**
 * @file test_run_spec.cpp
 * @brief Unit tests for run spec validation and JSON parsing
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/config_parser.hpp"
#include "../src/run_spec.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace thincore;
using namespace thincore::orchestrator;

namespace {

RunSpec make_chain() {
    RunSpec spec;
    spec.run_id = "exp-1";
    spec.sources["doc"] = SourceDocument("doc", SourceKind::TEXT, "text");
    TaskSpec a("a", "concat");
    a.inputs = {"source:doc"};
    TaskSpec b("b", "concat");
    b.inputs = {"a"};
    TaskSpec c("c", "concat");
    c.inputs = {"a", "b", "a"};
    spec.tasks = {c, a, b};
    return spec;
}

const char* FULL_SPEC = R"({
  "run_id": "exp-7",
  "description": "framework analysis",
  "sources": {
    "speech": {"path": "corpus/speech.txt"},
    "framework": {"text": "populism v2"}
  },
  "tasks": [
    {"id": "analyse", "type": "llm", "inputs": ["source:speech", "source:framework"],
     "params": "model=${THINCORE_TEST_MODEL}", "estimated_cost": 0.02},
    {"id": "stats", "type": "concat", "inputs": ["analyse"], "params": {"separator": "\n"}},
    {"id": "synth", "type": "llm", "inputs": ["analyse", "stats"], "best_effort": true,
     "params_hex": "00ff", "estimated_cost_units": 1500}
  ]
})";

} // anonymous namespace

TEST_CASE("Run id validation", "[run_spec]") {
    REQUIRE_NOTHROW(validate_run_id("exp-1"));
    REQUIRE_NOTHROW(validate_run_id("Exp_2.retry"));
    REQUIRE_NOTHROW(validate_run_id(std::string(128, 'a')));

    REQUIRE_THROWS_AS(validate_run_id(""), RunSpecError);
    REQUIRE_THROWS_AS(validate_run_id(".hidden"), RunSpecError);
    REQUIRE_THROWS_AS(validate_run_id("../escape"), RunSpecError);
    REQUIRE_THROWS_AS(validate_run_id("has space"), RunSpecError);
    REQUIRE_THROWS_AS(validate_run_id("a:b"), RunSpecError);
    REQUIRE_THROWS_AS(validate_run_id(std::string(129, 'a')), RunSpecError);
}

TEST_CASE("Input references", "[run_spec]") {
    std::string digest = artifacts::sha256_hex(std::string("x"));

    SECTION("Sources, artifacts and tasks") {
        InputReference source = parse_input_reference("source:doc");
        REQUIRE(source.kind == InputKind::SOURCE);
        REQUIRE(source.target == "doc");

        InputReference artifact = parse_input_reference("artifact:sha256:" + digest);
        REQUIRE(artifact.kind == InputKind::ARTIFACT);
        REQUIRE(artifact.target == digest);

        InputReference task = parse_input_reference("analyse");
        REQUIRE(task.kind == InputKind::TASK);
        REQUIRE(task.target == "analyse");
    }

    SECTION("Malformed references") {
        REQUIRE_THROWS_AS(parse_input_reference(""), RunSpecError);
        REQUIRE_THROWS_AS(parse_input_reference("source:"), RunSpecError);
        REQUIRE_THROWS_AS(parse_input_reference("artifact:1234"), RunSpecError);
    }
}

TEST_CASE("Run spec validation", "[run_spec]") {
    RunSpec spec = make_chain();
    REQUIRE_NOTHROW(validate_run_spec(spec));

    SECTION("Execution order respects dependencies") {
        auto order = compute_execution_order(spec);
        REQUIRE(order == std::vector<std::string>{"a", "b", "c"});
    }

    SECTION("Dependencies are deduplicated in input order") {
        REQUIRE(task_dependencies(*spec.find_task("c")) == std::vector<std::string>{"a", "b"});
        REQUIRE(task_dependencies(*spec.find_task("a")).empty());
        REQUIRE(spec.find_task("missing") == nullptr);
    }

    SECTION("Independent tasks keep declaration order") {
        RunSpec flat;
        flat.tasks = {TaskSpec("z", "concat"), TaskSpec("y", "concat"), TaskSpec("x", "concat")};
        REQUIRE(compute_execution_order(flat) == std::vector<std::string>{"z", "y", "x"});
    }

    SECTION("Empty run") {
        spec.tasks.clear();
        REQUIRE_THROWS_AS(validate_run_spec(spec), RunSpecError);
    }

    SECTION("Duplicate ids") {
        spec.tasks.push_back(TaskSpec("a", "concat"));
        REQUIRE_THROWS_AS(validate_run_spec(spec), RunSpecError);
    }

    SECTION("Empty id or type") {
        spec.tasks.push_back(TaskSpec("", "concat"));
        REQUIRE_THROWS_AS(validate_run_spec(spec), RunSpecError);
        spec.tasks.back() = TaskSpec("d", "");
        REQUIRE_THROWS_AS(validate_run_spec(spec), RunSpecError);
    }

    SECTION("Reserved prefix") {
        spec.tasks.push_back(TaskSpec("source:x", "concat"));
        REQUIRE_THROWS_AS(validate_run_spec(spec), RunSpecError);
    }

    SECTION("Unknown references") {
        spec.tasks[0].inputs.push_back("source:missing");
        REQUIRE_THROWS_AS(validate_run_spec(spec), RunSpecError);
        spec.tasks[0].inputs.back() = "nobody";
        REQUIRE_THROWS_AS(validate_run_spec(spec), RunSpecError);
    }

    SECTION("Self dependency") {
        spec.tasks[0].inputs.push_back("c");
        REQUIRE_THROWS_AS(validate_run_spec(spec), RunSpecError);
    }

    SECTION("Cycle") {
        spec.tasks[1].inputs.push_back("c");
        try {
            validate_run_spec(spec);
            FAIL("expected RunSpecError");
        } catch (const RunSpecError& e) {
            std::string message = e.what();
            REQUIRE(message.find("Circular dependency") != std::string::npos);
            REQUIRE(message.find(" a") != std::string::npos);
        }
    }

    SECTION("Path source without a path") {
        spec.sources["empty"] = SourceDocument("empty", SourceKind::PATH, "");
        REQUIRE_THROWS_AS(validate_run_spec(spec), RunSpecError);
    }
}

TEST_CASE("Run spec JSON parsing", "[run_spec][config_parser]") {
    setenv("THINCORE_TEST_MODEL", "large", 1);
    RunSpec spec = parse_run_spec_from_string(FULL_SPEC);

    REQUIRE(spec.run_id == "exp-7");
    REQUIRE(spec.description == "framework analysis");
    REQUIRE(spec.sources.size() == 2);
    REQUIRE(spec.sources["speech"].kind == SourceKind::PATH);
    REQUIRE(spec.sources["framework"].kind == SourceKind::TEXT);
    REQUIRE(spec.tasks.size() == 3);

    const TaskSpec* analyse = spec.find_task("analyse");
    REQUIRE(analyse->params == "model=large");
    REQUIRE(analyse->estimated_cost == 20000);
    REQUIRE_FALSE(analyse->best_effort);

    const TaskSpec* stats = spec.find_task("stats");
    REQUIRE(stats->params == "{\"separator\":\"\\n\"}");
    REQUIRE(stats->estimated_cost == -1);

    const TaskSpec* synth = spec.find_task("synth");
    REQUIRE(synth->params == std::string("\x00\xff", 2));
    REQUIRE(synth->estimated_cost == 1500);
    REQUIRE(synth->best_effort);

    SECTION("Serialization preserves meaning") {
        RunSpec reparsed = parse_run_spec_from_string(serialize_run_spec(spec));
        REQUIRE(reparsed.run_id == spec.run_id);
        REQUIRE(reparsed.sources["speech"].value == "corpus/speech.txt");
        REQUIRE(reparsed.find_task("synth")->params == synth->params);
        REQUIRE(reparsed.find_task("synth")->best_effort);
        REQUIRE(reparsed.find_task("analyse")->estimated_cost == 20000);
        REQUIRE(reparsed.find_task("stats")->inputs == stats->inputs);
    }
    unsetenv("THINCORE_TEST_MODEL");
}

TEST_CASE("Run spec JSON errors", "[run_spec][config_parser]") {
    SECTION("Not JSON") {
        REQUIRE_THROWS_AS(parse_run_spec_from_string("{"), ConfigParseError);
        REQUIRE_THROWS_AS(parse_run_spec_from_string("[]"), ConfigParseError);
    }

    SECTION("Missing fields") {
        REQUIRE_THROWS_AS(parse_run_spec_from_string("{}"), ConfigParseError);
        REQUIRE_THROWS_AS(parse_run_spec_from_string(R"({"tasks":[{"type":"llm"}]})"), ConfigParseError);
        REQUIRE_THROWS_AS(parse_run_spec_from_string(R"({"tasks":[{"id":"a"}]})"), ConfigParseError);
    }

    SECTION("Wrong types") {
        REQUIRE_THROWS_AS(parse_run_spec_from_string(R"({"tasks":[{"id":1,"type":"llm"}]})"), ConfigParseError);
    }

    SECTION("Ambiguous source") {
        REQUIRE_THROWS_AS(parse_run_spec_from_string(
            R"({"sources":{"s":{"path":"a","text":"b"}},"tasks":[{"id":"a","type":"concat"}]})"), RunSpecError);
    }

    SECTION("Negative estimate") {
        REQUIRE_THROWS_AS(parse_run_spec_from_string(
            R"({"tasks":[{"id":"a","type":"llm","estimated_cost":-1}]})"), RunSpecError);
    }

    SECTION("Invalid run id") {
        REQUIRE_THROWS_AS(parse_run_spec_from_string(
            R"({"run_id":"a/b","tasks":[{"id":"a","type":"concat"}]})"), RunSpecError);
    }

    SECTION("Validation runs after parsing") {
        REQUIRE_THROWS_AS(parse_run_spec_from_string(
            R"({"tasks":[{"id":"a","type":"concat","inputs":["b"]},{"id":"b","type":"concat","inputs":["a"]}]})"),
            RunSpecError);
    }

    SECTION("Errors are configuration errors") {
        REQUIRE_THROWS_AS(parse_run_spec_from_string("{"), ConfigurationError);
    }
}

TEST_CASE("Run spec files", "[run_spec][config_parser]") {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "thincore_run_spec";
    fs::remove_all(dir);
    fs::create_directories(dir);

    {
        std::ofstream out(dir / "run.json");
        out << R"({"sources":{"rel":{"path":"corpus/a.txt"},"abs":{"path":"/data/b.txt"}},)"
            << R"("tasks":[{"id":"a","type":"concat","inputs":["source:rel","source:abs"]}]})";
    }

    RunSpec spec = parse_run_spec_from_file((dir / "run.json").string());
    REQUIRE(spec.sources["rel"].value == (dir / "corpus/a.txt").string());
    REQUIRE(spec.sources["abs"].value == "/data/b.txt");

    REQUIRE_THROWS_AS(parse_run_spec_from_file((dir / "absent.json").string()), ConfigParseError);

    fs::remove_all(dir);
}

TEST_CASE("Environment variable expansion", "[config_parser]") {
    setenv("THINCORE_TEST_VAR", "value", 1);
    unsetenv("THINCORE_TEST_UNSET");

    REQUIRE(expand_environment_variables("${THINCORE_TEST_VAR}/x") == "value/x");
    REQUIRE(expand_environment_variables("$THINCORE_TEST_VAR-y") == "value-y");
    REQUIRE(expand_environment_variables("a${THINCORE_TEST_UNSET}b") == "ab");
    REQUIRE(expand_environment_variables("cost $5") == "cost ");
    REQUIRE(expand_environment_variables("price $ only") == "price $ only");
    REQUIRE(expand_environment_variables("${unterminated") == "${unterminated");
    REQUIRE(expand_environment_variables("${}") == "${}");
    REQUIRE(expand_environment_variables("plain") == "plain");

    unsetenv("THINCORE_TEST_VAR");
}

TEST_CASE("Relative path resolution", "[config_parser]") {
    REQUIRE(resolve_relative_path("/abs/file.txt", "/etc/run.json") == "/abs/file.txt");
    REQUIRE(resolve_relative_path("data/file.txt", "/etc/specs/run.json") == "/etc/specs/data/file.txt");
    REQUIRE(resolve_relative_path("file.txt", "run.json") == "file.txt");
}
