/**
 * @file test_cost_guard.cpp
 * @brief Unit tests for the spend ledger admission rule and CostGuard
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/cost_guard.hpp"
#include "ledger_cases.hpp"
#include "errors.hpp"
#include <atomic>
#include <cmath>
#include <limits>
#include <thread>
#include <vector>

using namespace thincore;

namespace {

LedgerSnapshot opened(int64_t ceiling, int64_t spent = 0, int64_t in_flight = 0) {
    LedgerSnapshot snapshot;
    snapshot.opened = true;
    snapshot.ceiling = ceiling;
    snapshot.spent = spent;
    snapshot.in_flight = in_flight;
    return snapshot;
}

} // anonymous namespace

TEST_CASE("Reservation admission rule", "[cost_guard]") {
    SECTION("Unopened runs are denied") {
        REQUIRE_FALSE(reservation_allowed(LedgerSnapshot(), 0));
    }

    SECTION("Unlimited ceiling admits anything") {
        REQUIRE(reservation_allowed(opened(UNLIMITED_CEILING, 1000000000), 1000000000));
    }

    SECTION("Within budget") {
        REQUIRE(reservation_allowed(opened(100, 40, 20), 40));
        REQUIRE_FALSE(reservation_allowed(opened(100, 40, 20), 41));
    }

    SECTION("Denied once the ceiling is reached, even for free work") {
        REQUIRE_FALSE(reservation_allowed(opened(100, 100), 0));
        REQUIRE_FALSE(reservation_allowed(opened(100, 60, 40), 0));
        REQUIRE_FALSE(reservation_allowed(opened(0), 0));
    }
}

TEST_CASE("MemorySpendLedger decides like the admission rule", "[cost_guard]") {
    MemorySpendLedger ledger;
    testing::check_admission(ledger, "exp-");
}

TEST_CASE("MemorySpendLedger accounting", "[cost_guard]") {
    MemorySpendLedger ledger;

    SECTION("Reserve before open is denied") {
        REQUIRE_FALSE(ledger.reserve("exp-1", 10).granted);
    }

    ledger.open_run("exp-1", 100, 0);

    SECTION("Reserve, settle and release move the counters") {
        Reservation first = ledger.reserve("exp-1", 30);
        Reservation second = ledger.reserve("exp-1", 30);
        REQUIRE(first.granted);
        REQUIRE(second.granted);
        REQUIRE(ledger.snapshot("exp-1").in_flight == 60);

        ledger.settle("exp-1", first.amount, 25);
        ledger.release("exp-1", second.amount);

        LedgerSnapshot snapshot = ledger.snapshot("exp-1");
        REQUIRE(snapshot.spent == 25);
        REQUIRE(snapshot.in_flight == 0);
        REQUIRE(ledger.global_spent() == 25);
    }

    SECTION("Actual cost above the estimate is still recorded") {
        Reservation reservation = ledger.reserve("exp-1", 10);
        ledger.settle("exp-1", reservation.amount, 95);
        REQUIRE(ledger.snapshot("exp-1").spent == 95);
        REQUIRE_FALSE(ledger.reserve("exp-1", 10).granted);
    }

    SECTION("Negative estimate is rejected") {
        REQUIRE_THROWS_AS(ledger.reserve("exp-1", -1), ConfigurationError);
    }

    SECTION("Reopening keeps the larger spent and live reservations") {
        ledger.settle("exp-1", ledger.reserve("exp-1", 50).amount, 50);
        Reservation live = ledger.reserve("exp-1", 20);

        LedgerSnapshot reopened = ledger.open_run("exp-1", 200, 30);
        REQUIRE(reopened.spent == 50);
        REQUIRE(reopened.in_flight == 20);
        REQUIRE(reopened.ceiling == 200);

        ledger.release("exp-1", live.amount);
        REQUIRE(ledger.snapshot("exp-1").in_flight == 0);
        REQUIRE(ledger.open_run("exp-2", 100, 70).spent == 70);
    }

    SECTION("A resumed session cannot reserve budget a worker still holds") {
        ledger.open_run("exp-3", 1000, 0);
        Reservation first = ledger.reserve("exp-3", 600);
        REQUIRE(first.granted);

        ledger.open_run("exp-3", 1000, 0);
        REQUIRE_FALSE(ledger.reserve("exp-3", 600).granted);

        ledger.settle("exp-3", first.amount, 600);
        REQUIRE(ledger.snapshot("exp-3").spent <= 1000);
    }
}

TEST_CASE("CostGuard reservations", "[cost_guard]") {
    auto ledger = std::make_shared<MemorySpendLedger>();
    CostGuard guard(ledger);
    ledger->open_run("exp-1", CostGuard::to_units(0.10), 0);

    SECTION("require grants within budget") {
        Reservation reservation = guard.require("exp-1", CostGuard::to_units(0.04));
        REQUIRE(reservation.granted);
        REQUIRE(reservation.amount == 40000);
        guard.settle("exp-1", reservation.amount, 30000);
        REQUIRE(guard.snapshot("exp-1").spent == 30000);
    }

    SECTION("require throws when denied") {
        guard.require("exp-1", CostGuard::to_units(0.06));
        REQUIRE_FALSE(guard.reserve("exp-1", CostGuard::to_units(0.06)).granted);
        REQUIRE_THROWS_AS(guard.require("exp-1", CostGuard::to_units(0.06)), CostCeilingExceeded);
    }

    SECTION("Negative actual cost is a task error") {
        Reservation reservation = guard.require("exp-1", 10);
        REQUIRE_THROWS_AS(guard.settle("exp-1", reservation.amount, -1), TaskExecutionError);
    }

    SECTION("Release of nothing is a no-op") {
        guard.release("exp-1", 0);
        REQUIRE(guard.snapshot("exp-1").in_flight == 0);
    }

    SECTION("Missing ledger") {
        REQUIRE_THROWS_AS(CostGuard(nullptr), ConfigurationError);
    }
}

TEST_CASE("CostGuard unit conversion", "[cost_guard]") {
    REQUIRE(CostGuard::to_units(0.02) == 20000);
    REQUIRE(CostGuard::to_units(10.0) == 10 * COST_UNITS_PER_CURRENCY);
    REQUIRE(CostGuard::to_units(0.0000004) == 0);
    REQUIRE(CostGuard::to_units(0.0000006) == 1);
    REQUIRE_THROWS_AS(CostGuard::to_units(-0.01), ConfigurationError);
    REQUIRE_THROWS_AS(CostGuard::to_units(std::numeric_limits<double>::infinity()), ConfigurationError);
    REQUIRE_THROWS_AS(CostGuard::to_units(std::nan("")), ConfigurationError);

    REQUIRE(CostGuard::format_units(20000) == "0.020000");
    REQUIRE(CostGuard::format_units(12500000) == "12.500000");
    REQUIRE(CostGuard::format_units(0) == "0.000000");
    REQUIRE(CostGuard::format_units(UNLIMITED_CEILING) == "unlimited");
}

TEST_CASE("Concurrent reservations never exceed the ceiling", "[cost_guard]") {
    auto ledger = std::make_shared<MemorySpendLedger>();
    CostGuard guard(ledger);
    const int64_t ceiling = 1000;
    const int64_t estimate = 7;
    ledger->open_run("exp-1", ceiling, 0);

    std::atomic<int64_t> max_committed(0);
    std::atomic<int> granted(0);
    std::vector<std::thread> workers;
    for (int w = 0; w < 8; ++w) {
        workers.emplace_back([&]() {
            for (int i = 0; i < 100; ++i) {
                Reservation reservation = guard.reserve("exp-1", estimate);
                if (!reservation.granted) {
                    continue;
                }
                granted++;
                int64_t committed = reservation.snapshot.spent + reservation.snapshot.in_flight;
                int64_t seen = max_committed.load();
                while (committed > seen && !max_committed.compare_exchange_weak(seen, committed)) {
                }
                guard.settle("exp-1", reservation.amount, estimate);
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    LedgerSnapshot snapshot = guard.snapshot("exp-1");
    REQUIRE(snapshot.spent <= ceiling);
    REQUIRE(snapshot.in_flight == 0);
    REQUIRE(max_committed.load() <= ceiling);
    REQUIRE(granted.load() == static_cast<int>(ceiling / estimate));
    REQUIRE(snapshot.spent == granted.load() * estimate);
}
