#include <catch2/catch_test_macros.hpp>
#include "store/http_store.hpp"
#include "api/http_client.hpp"
#include "errors.hpp"

using namespace thincore;
using namespace thincore::artifacts;

// Port 9 (discard) is closed on test hosts; every request fails to connect.
static const char* UNREACHABLE_URL = "http://127.0.0.1:9";

TEST_CASE("HttpClient retry classification", "[http_client]") {
    SECTION("Transient statuses are retried") {
        REQUIRE(HttpClient::should_retry(408));
        REQUIRE(HttpClient::should_retry(429));
        REQUIRE(HttpClient::should_retry(500));
        REQUIRE(HttpClient::should_retry(503));
    }

    SECTION("Client errors are not retried") {
        REQUIRE_FALSE(HttpClient::should_retry(400));
        REQUIRE_FALSE(HttpClient::should_retry(401));
        REQUIRE_FALSE(HttpClient::should_retry(404));
        REQUIRE_FALSE(HttpClient::should_retry(200));
    }

    SECTION("Default schedule is 1s, 2s, 4s") {
        RetryPolicy policy;
        REQUIRE(policy.delays_ms == std::vector<int>{1000, 2000, 4000});
        REQUIRE(policy.max_attempts() == 4);
    }
}

TEST_CASE("HttpClient strips trailing slash", "[http_client]") {
    HttpClient client("http://artifacts:9000/");
    REQUIRE(client.base_url() == "http://artifacts:9000");
}

TEST_CASE("HttpArtifactStore against an unavailable service", "[http_store]") {
    HttpArtifactStore store(UNREACHABLE_URL, 500);
    RetryPolicy fast;
    fast.delays_ms = {1, 1};
    store.set_retry_policy(fast);

    SECTION("put surfaces TransientIOError after retries") {
        REQUIRE_THROWS_AS(store.put("payload"), TransientIOError);
    }

    SECTION("get surfaces TransientIOError, never NotFound or empty bytes") {
        std::string hash = sha256_hex(std::string("payload"));
        REQUIRE_THROWS_AS(store.get(hash), TransientIOError);
    }

    SECTION("exists surfaces TransientIOError") {
        std::string hash = sha256_hex(std::string("payload"));
        REQUIRE_THROWS_AS(store.exists(hash), TransientIOError);
    }

    SECTION("Malformed hash fails before any request") {
        REQUIRE_THROWS_AS(store.get("zzz"), IntegrityError);
    }

    REQUIRE(store.describe() == UNREACHABLE_URL);
}
