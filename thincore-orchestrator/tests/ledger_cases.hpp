/**
 * @file ledger_cases.hpp
 * @brief Admission cases every SpendLedger backend must decide like reservation_allowed
 */

#ifndef THINCORE_TEST_LEDGER_CASES_HPP
#define THINCORE_TEST_LEDGER_CASES_HPP

#include <catch2/catch_test_macros.hpp>
#include "../src/spend_ledger.hpp"
#include <string>
#include <vector>

namespace thincore {
namespace testing {

struct AdmissionCase {
    const char* name;
    int64_t ceiling;
    int64_t spent;
    int64_t in_flight;
    int64_t estimate;
    bool granted;
};

inline const std::vector<AdmissionCase>& admission_cases() {
    static const std::vector<AdmissionCase> cases = {
        {"within budget", 100, 40, 20, 40, true},
        {"one unit over", 100, 40, 20, 41, false},
        {"exact fill", 100, 0, 0, 100, true},
        {"ceiling reached by spend, free work", 100, 100, 0, 0, false},
        {"ceiling reached by reservations, free work", 100, 60, 40, 0, false},
        {"zero ceiling", 0, 0, 0, 0, false},
        {"already overspent", 100, 150, 0, 0, false},
        {"unlimited", UNLIMITED_CEILING, 500000000, 1000000, 1000000000, true}
    };
    return cases;
}

/**
 * @brief Put a ledger into each case's state and compare its decision
 *
 * In-flight units are reserved under an unlimited ceiling first; reopening
 * with the case's ceiling keeps them.
 */
inline void check_admission(SpendLedger& ledger, const std::string& run_prefix) {
    const auto& cases = admission_cases();
    for (size_t i = 0; i < cases.size(); ++i) {
        const AdmissionCase& c = cases[i];
        INFO(c.name);
        std::string run_id = run_prefix + std::to_string(i);

        ledger.open_run(run_id, UNLIMITED_CEILING, c.spent);
        if (c.in_flight > 0) {
            REQUIRE(ledger.reserve(run_id, c.in_flight).granted);
        }
        LedgerSnapshot state = ledger.open_run(run_id, c.ceiling, c.spent);
        REQUIRE(state.spent == c.spent);
        REQUIRE(state.in_flight == c.in_flight);

        REQUIRE(reservation_allowed(state, c.estimate) == c.granted);
        Reservation reservation = ledger.reserve(run_id, c.estimate);
        REQUIRE(reservation.granted == c.granted);
        REQUIRE(ledger.snapshot(run_id).in_flight == c.in_flight + (c.granted ? c.estimate : 0));
    }
}

} // namespace testing
} // namespace thincore

#endif // THINCORE_TEST_LEDGER_CASES_HPP
