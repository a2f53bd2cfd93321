/**
 * @file test_resume_cache.cpp
 * @brief Unit tests for ResumeCacheManager
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/resume_cache.hpp"
#include "errors.hpp"
#include "store/memory_store.hpp"

using namespace thincore;

namespace {

std::string key_of(const std::string& name) {
    return artifacts::sha256_hex("key:" + name);
}

struct CacheFixture {
    std::shared_ptr<MemoryManifestLog> manifest = std::make_shared<MemoryManifestLog>();
    std::shared_ptr<artifacts::MemoryArtifactStore> store = std::make_shared<artifacts::MemoryArtifactStore>();

    std::string done(const std::string& run_id, const std::string& name, int64_t cost) {
        std::string hash = store->put("output of " + name);
        manifest->append(run_id, ManifestEntry::done(key_of(name), hash, cost, "llm"));
        return hash;
    }
};

} // anonymous namespace

TEST_CASE("ResumeCacheManager construction", "[resume_cache]") {
    auto store = std::make_shared<artifacts::MemoryArtifactStore>();
    REQUIRE_THROWS_AS(ResumeCacheManager(nullptr, store), ConfigurationError);
}

TEST_CASE("ResumeCacheManager resolves from the run manifest", "[resume_cache]") {
    CacheFixture fx;
    std::string a = fx.done("exp-1", "a", 100);
    fx.manifest->append("exp-1", ManifestEntry::failed(key_of("b"), "llm"));

    ResumeCacheManager cache(fx.manifest, fx.store);
    cache.load("exp-1");

    REQUIRE(cache.run_id() == "exp-1");
    REQUIRE(cache.entry_count() == 2);
    REQUIRE(cache.recorded_cost() == 100);

    SECTION("Done entry is a hit") {
        Resolution resolution = cache.resolve(key_of("a"));
        REQUIRE(resolution.is_resolved());
        REQUIRE(resolution.artifact_hash == a);
        REQUIRE_FALSE(resolution.from_prior_run);
        REQUIRE(cache.get_stats().hits == 1);
    }

    SECTION("Failed entry must be dispatched again") {
        REQUIRE(cache.resolve(key_of("b")).is_absent());
        REQUIRE(cache.recorded_failure(key_of("b")).has_value());
        REQUIRE_FALSE(cache.recorded_failure(key_of("a")).has_value());
    }

    SECTION("Unknown key is absent") {
        REQUIRE(cache.resolve(key_of("z")).is_absent());
        REQUIRE(cache.get_stats().misses == 1);
    }

    SECTION("Lost artifact is recomputed, not an error") {
        fx.store->erase(a);
        REQUIRE(cache.resolve(key_of("a")).is_absent());
        REQUIRE(cache.get_stats().lost_artifacts == 1);

        std::string recomputed = fx.store->put("output of a, again");
        cache.record(ManifestEntry::done(key_of("a"), recomputed, 100, "llm"));
        Resolution resolution = cache.resolve(key_of("a"));
        REQUIRE(resolution.is_resolved());
        REQUIRE(resolution.artifact_hash == recomputed);
    }
}

TEST_CASE("ResumeCacheManager pending dispatches", "[resume_cache]") {
    CacheFixture fx;
    ResumeCacheManager cache(fx.manifest, fx.store);
    cache.load("exp-1");

    cache.mark_pending(key_of("a"));
    REQUIRE(cache.resolve(key_of("a")).is_pending());

    SECTION("Recording the result resolves it") {
        std::string hash = fx.store->put("out");
        cache.record(ManifestEntry::done(key_of("a"), hash, 40, "llm"));
        REQUIRE(cache.resolve(key_of("a")).is_resolved());
        REQUIRE(cache.recorded_cost() == 40);
    }

    SECTION("Clearing makes it dispatchable again") {
        cache.clear_pending(key_of("a"));
        REQUIRE(cache.resolve(key_of("a")).is_absent());
    }

    SECTION("A failure clears pending and never replaces a success") {
        cache.record(ManifestEntry::failed(key_of("a"), "llm"));
        REQUIRE(cache.resolve(key_of("a")).is_absent());

        std::string hash = fx.store->put("out");
        cache.record(ManifestEntry::done(key_of("a"), hash, 0, "llm"));
        cache.record(ManifestEntry::failed(key_of("a"), "llm"));
        REQUIRE(cache.resolve(key_of("a")).is_resolved());
    }

    SECTION("Reloading forgets pending state") {
        cache.load("exp-1");
        REQUIRE(cache.resolve(key_of("a")).is_absent());
    }
}

TEST_CASE("ResumeCacheManager consults prior runs", "[resume_cache]") {
    CacheFixture fx;
    std::string earlier = fx.done("exp-0", "shared", 500);
    fx.manifest->append("exp-0", ManifestEntry::failed(key_of("broken"), "llm"));
    std::string own = fx.done("exp-1", "own", 10);

    ResumeCacheManager cache(fx.manifest, fx.store);
    cache.load("exp-1");
    cache.also_consult({"exp-0", "exp-1"});

    SECTION("Prior done entry resolves") {
        Resolution resolution = cache.resolve(key_of("shared"));
        REQUIRE(resolution.is_resolved());
        REQUIRE(resolution.from_prior_run);
        REQUIRE(resolution.artifact_hash == earlier);
        REQUIRE(cache.get_stats().prior_run_hits == 1);
    }

    SECTION("Prior failures are ignored") {
        REQUIRE(cache.resolve(key_of("broken")).is_absent());
    }

    SECTION("Own entries take precedence and prior cost is not counted") {
        REQUIRE_FALSE(cache.resolve(key_of("own")).from_prior_run);
        REQUIRE(cache.recorded_cost() == 10);
    }
}

TEST_CASE("ResumeCacheManager surfaces manifest corruption", "[resume_cache]") {
    CacheFixture fx;
    fx.manifest->append_raw("exp-1", "{\"task_key\":");
    ResumeCacheManager cache(fx.manifest, fx.store);
    REQUIRE_THROWS_AS(cache.load("exp-1"), IntegrityError);
}
