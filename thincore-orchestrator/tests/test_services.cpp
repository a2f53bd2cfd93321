/**
 * @file test_services.cpp
 * @brief Service wiring for local mode, and the Redis backends against a live server
 *
 * Redis cases are hidden and need THINCORE_TEST_REDIS_URL. Configuring with
 * -DTHINCORE_TEST_REDIS_URL=redis://localhost:6379 registers them as their
 * own CTest entry; by hand:
 *   THINCORE_TEST_REDIS_URL=redis://localhost:6379 ./thincore_orchestrator_tests "[redis]"
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/planner.hpp"
#include "../src/redis_support.hpp"
#include "../src/services.hpp"
#include "../src/worker_agent.hpp"
#include "errors.hpp"
#include "ledger_cases.hpp"
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <thread>
#include <unistd.h>

using namespace thincore;
using namespace thincore::orchestrator;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

void quiet_logger() {
    LoggerConfig config;
    config.enable_console = false;
    config.enable_file = false;
    Logger::get_instance().configure(config);
}

std::string redis_url() {
    const char* url = std::getenv("THINCORE_TEST_REDIS_URL");
    return url ? url : "";
}

/// Hidden cases are only selected on purpose, so a missing server is a failure
void require_redis() {
    INFO("THINCORE_TEST_REDIS_URL must point at a Redis server for [redis] tests");
    REQUIRE_FALSE(redis_url().empty());
}

/// Unique key prefix so repeated runs never see each other's keys
std::string test_prefix() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return "thincore-test-" + std::to_string(::getpid()) + "-" +
           std::to_string(std::chrono::duration_cast<std::chrono::microseconds>(now).count());
}

CoreConfig redis_config() {
    CoreConfig config;
    config.queue_url = redis_url();
    config.store_url = "memory:";
    config.key_prefix = test_prefix();
    config.lease_timeout_ms = 200;
    config.claim_timeout_ms = 50;
    return config;
}

TaskEnvelope make_envelope(const std::string& run_id, const std::string& input_hash) {
    TaskEnvelope envelope;
    envelope.run_id = run_id;
    envelope.task_type = "concat";
    envelope.input_hashes = {input_hash};
    envelope.task_key = compute_task_key("concat", envelope.input_hashes, "");
    return envelope;
}

} // anonymous namespace

TEST_CASE("Local services", "[services]") {
    quiet_logger();
    fs::path root = fs::temp_directory_path() / "thincore_services";
    fs::remove_all(root);

    CoreConfig config;
    config.store_url = "file://" + (root / "store").string();
    config.state_dir = (root / "state").string();
    config.consumer_group = "analysts";
    config.claim_timeout_ms = 250;
    config.consult_runs = {"exp-0"};

    ServiceBundle services = build_services(config);
    REQUIRE(services.router->describe() == "local");
    REQUIRE(services.manifest->describe() == "file://" + config.state_dir);
    REQUIRE(services.handlers->list_task_types() == std::vector<std::string>{"concat"});
    REQUIRE(services.cost_guard != nullptr);

    SECTION("Gateway URL enables llm") {
        config.gateway_url = "http://127.0.0.1:1";
        REQUIRE(build_handler_registry(config)->is_registered("llm"));
    }

    SECTION("Planner and worker settings follow the configuration") {
        PlannerConfig planner = make_planner_config(config);
        REQUIRE(planner.poll_timeout == 250ms);
        REQUIRE(planner.consult_runs == std::vector<std::string>{"exp-0"});

        WorkerConfig worker = make_worker_config(config, "w-9");
        REQUIRE(worker.consumer_group == "analysts");
        REQUIRE(worker.worker_id == "w-9");
        REQUIRE(worker.claim_timeout == 250ms);
    }

    SECTION("Invalid configuration is rejected before anything opens") {
        config.max_attempts = 0;
        REQUIRE_THROWS_AS(build_services(config), ConfigurationError);
    }

    REQUIRE_FALSE(default_worker_id().empty());
    fs::remove_all(root);
}

TEST_CASE("Redis task router", "[.redis]") {
    require_redis();
    quiet_logger();
    ServiceBundle services = build_services(redis_config());
    auto& router = *services.router;
    std::string input = services.store->put("input");

    SECTION("Claim, ack and completion event") {
        std::string cursor = router.completion_cursor("exp-1");
        TaskEnvelope envelope = make_envelope("exp-1", input);
        router.enqueue(envelope);
        REQUIRE(router.queue_depth("concat", "workers") == 1);

        auto claimed = router.claim("workers", "w-1", {"concat"}, 100ms);
        REQUIRE(claimed.has_value());
        REQUIRE(claimed->task_key == envelope.task_key);
        REQUIRE(claimed->attempt == 0);
        REQUIRE_FALSE(claimed->lease_token.empty());

        std::string output = services.store->put("output");
        REQUIRE(router.ack(*claimed, TaskOutcome(output, 7)));
        REQUIRE_FALSE(router.ack(*claimed, TaskOutcome(output, 7)));

        auto events = router.poll_completions("exp-1", cursor, 100ms);
        REQUIRE(events.size() == 1);
        REQUIRE(events[0].status == CompletionStatus::DONE);
        REQUIRE(events[0].artifact_hash == output);
        REQUIRE(events[0].cost_charged == 7);
        REQUIRE(router.queue_depth("concat", "workers") == 0);
    }

    SECTION("Nack until dead-lettered") {
        router.enqueue(make_envelope("exp-1", input));
        for (int attempt = 0; attempt < 2; ++attempt) {
            auto claimed = router.claim("workers", "w-1", {"concat"}, 100ms);
            REQUIRE(claimed->attempt == attempt);
            REQUIRE(router.nack(*claimed, "boom") == NackResult::REQUEUED);
        }
        auto last = router.claim("workers", "w-1", {"concat"}, 100ms);
        REQUIRE(router.nack(*last, "boom") == NackResult::DEAD_LETTERED);

        auto dead = router.dead_letters("concat");
        REQUIRE(dead.size() == 1);
        REQUIRE(dead[0].status == CompletionStatus::FAILED);
        REQUIRE(dead[0].reason == "boom");
    }

    SECTION("Expired leases are taken over") {
        router.enqueue(make_envelope("exp-1", input));
        auto first = router.claim("workers", "w-1", {"concat"}, 100ms);
        REQUIRE(first.has_value());
        std::this_thread::sleep_for(300ms);

        auto second = router.claim("workers", "w-2", {"concat"}, 100ms);
        REQUIRE(second.has_value());
        REQUIRE(second->task_key == first->task_key);
        REQUIRE(second->attempt == 1);
        REQUIRE(router.nack(*first, "late") == NackResult::STALE);

        std::string output = services.store->put("output");
        REQUIRE_FALSE(router.ack(*first, TaskOutcome(output, 0)));
        REQUIRE(router.ack(*second, TaskOutcome(output, 0)));
    }

    SECTION("Entries buffered from a multi-type read are reconfirmed") {
        TaskEnvelope other = make_envelope("exp-1", input);
        other.task_type = "echo";
        router.enqueue(make_envelope("exp-1", input));
        router.enqueue(other);

        auto first = router.claim("workers", "w-1", {"concat", "echo"}, 100ms);
        REQUIRE(first.has_value());
        REQUIRE(first->task_type == "concat");
        REQUIRE(router.ack(*first, TaskOutcome(services.store->put("output"), 0)));

        SECTION("Still held: handed out with a fresh lease") {
            std::this_thread::sleep_for(300ms);
            auto buffered = router.claim("workers", "w-1", {"concat", "echo"}, 100ms);
            REQUIRE(buffered.has_value());
            REQUIRE(buffered->task_type == "echo");
            REQUIRE(buffered->attempt == 0);
            REQUIRE_FALSE(router.claim("workers", "w-2", {"echo"}, 50ms).has_value());
        }

        SECTION("Taken over meanwhile: dropped") {
            std::this_thread::sleep_for(300ms);
            auto taken = router.claim("workers", "w-2", {"echo"}, 100ms);
            REQUIRE(taken.has_value());
            REQUIRE(taken->attempt == 1);

            REQUIRE_FALSE(router.claim("workers", "w-1", {"concat", "echo"}, 50ms).has_value());
            REQUIRE(router.ack(*taken, TaskOutcome(services.store->put("output"), 0)));
        }
    }

    SECTION("Settled entries are deleted from the task stream") {
        auto redis = connect_redis(redis_url(), 1);
        RedisKeys keys(services.config.key_prefix);
        router.enqueue(make_envelope("exp-1", input));
        router.enqueue(make_envelope("exp-2", input));
        REQUIRE(redis->xlen(keys.tasks("concat")) == 2);

        auto acked = router.claim("workers", "w-1", {"concat"}, 100ms);
        REQUIRE(router.ack(*acked, TaskOutcome(services.store->put("output"), 0)));
        REQUIRE(redis->xlen(keys.tasks("concat")) == 1);

        auto nacked = router.claim("workers", "w-1", {"concat"}, 100ms);
        REQUIRE(router.nack(*nacked, "retry") == NackResult::REQUEUED);
        REQUIRE(redis->xlen(keys.tasks("concat")) == 1);
        REQUIRE(router.queue_depth("concat", "workers") == 1);
    }
}

TEST_CASE("Redis manifest, ledger and run control", "[.redis]") {
    require_redis();
    quiet_logger();
    ServiceBundle services = build_services(redis_config());

    SECTION("Manifest appends replay in order") {
        std::string key = artifacts::sha256_hex(std::string("key"));
        std::string hash = artifacts::sha256_hex(std::string("artifact"));
        services.manifest->append("exp-1", ManifestEntry::failed(key, "concat"));
        services.manifest->append("exp-1", ManifestEntry::done(key, hash, 5, "concat"));

        auto entries = services.manifest->replay("exp-1");
        REQUIRE(entries.size() == 2);
        REQUIRE(entries[0].is_failed());
        REQUIRE(services.manifest->find_done("exp-1", key)->resolution == hash);
        REQUIRE(services.manifest->replay("exp-2").empty());
    }

    SECTION("Ledger scripts decide like the admission rule") {
        testing::check_admission(*services.ledger, "exp-admission-");
    }

    SECTION("Reopening keeps live reservations") {
        services.ledger->open_run("exp-1", 1000, 0);
        Reservation first = services.ledger->reserve("exp-1", 600);
        REQUIRE(first.granted);
        REQUIRE(services.ledger->open_run("exp-1", 1000, 0).in_flight == 600);
        REQUIRE_FALSE(services.ledger->reserve("exp-1", 600).granted);
        services.ledger->release("exp-1", first.amount);
    }

    SECTION("Ledger enforces the ceiling") {
        services.ledger->open_run("exp-1", 100, 0);
        Reservation first = services.ledger->reserve("exp-1", 60);
        REQUIRE(first.granted);
        REQUIRE_FALSE(services.ledger->reserve("exp-1", 60).granted);
        services.ledger->settle("exp-1", first.amount, 50);

        LedgerSnapshot snapshot = services.ledger->snapshot("exp-1");
        REQUIRE(snapshot.spent == 50);
        REQUIRE(snapshot.in_flight == 0);
        REQUIRE(services.ledger->open_run("exp-1", 100, 20).spent == 50);
    }

    SECTION("Run control flags") {
        services.run_control->register_run("exp-1", "spec", 100);
        services.run_control->cancel("exp-1");
        services.run_control->mark_halted("exp-1");
        REQUIRE(services.run_control->is_cancelled("exp-1"));
        REQUIRE(services.run_control->is_halted("exp-1"));

        services.run_control->register_run("exp-1", "spec", 200);
        auto record = services.run_control->get("exp-1");
        REQUIRE_FALSE(record->cancelled);
        REQUIRE(record->ceiling == 200);
        REQUIRE_FALSE(services.run_control->get("exp-404").has_value());
    }
}

TEST_CASE("Redis end-to-end run", "[.redis]") {
    require_redis();
    quiet_logger();
    CoreConfig config = redis_config();
    ServiceBundle services = build_services(config);

    WorkerAgent worker(make_worker_config(config, "redis-worker"), services.router, services.store,
                       services.manifest, services.cost_guard, services.run_control, services.handlers);
    std::thread thread([&worker]() { worker.run(); });

    RunSpec spec;
    spec.run_id = "exp-1";
    spec.sources["doc"] = SourceDocument("doc", SourceKind::TEXT, "doc");
    TaskSpec twice("twice", "concat");
    twice.inputs = {"source:doc", "source:doc"};
    spec.tasks = {twice};

    Planner planner(make_planner_config(config), services.router, services.store, services.manifest,
                    services.cost_guard, services.run_control);
    planner.submit(spec, UNLIMITED_CEILING);
    RunResult cold = planner.execute("exp-1");

    planner.resume("exp-1", std::nullopt);
    RunResult warm = planner.execute("exp-1");

    worker.request_stop();
    thread.join();

    REQUIRE(cold.status == RunStatus::COMPLETED);
    REQUIRE(cold.dispatched == 1);
    REQUIRE(services.store->get(cold.find_node("twice")->artifact_hash) == "docdoc");
    REQUIRE(warm.dispatched == 0);
    REQUIRE(warm.cached == 1);
}
