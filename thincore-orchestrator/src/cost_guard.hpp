/**
 * @file cost_guard.hpp
 * @brief Admission control for paid task execution
 */

#ifndef THINCORE_COST_GUARD_HPP
#define THINCORE_COST_GUARD_HPP

#include "logger.hpp"
#include "spend_ledger.hpp"
#include <memory>
#include <string>

namespace thincore {

/// Cost units per unit of currency
constexpr int64_t COST_UNITS_PER_CURRENCY = 1000000;

/**
 * @brief Cost guard over a spend ledger
 *
 * Workers reserve the estimated cost before a paid call and settle the actual
 * cost afterwards; a reservation for a task that ends without a paid result is
 * released. Every decision is logged as a cost_decision event.
 *
 * Usage Example:
 *   @code
 *   CostGuard guard(ledger);
 *   auto reservation = guard.require("exp-1", CostGuard::to_units(0.02));
 *   // ... paid call ...
 *   guard.settle("exp-1", reservation.amount, actual_units);
 *   @endcode
 */
class CostGuard {
public:
    explicit CostGuard(std::shared_ptr<SpendLedger> ledger, Logger* logger = nullptr);

    /**
     * @brief Attempt a reservation
     * @return Reservation with granted set accordingly
     */
    Reservation reserve(const std::string& run_id, int64_t estimate_units, const LogContext* ctx = nullptr);

    /**
     * @brief Reserve or throw
     * @throws CostCeilingExceeded if the reservation is denied
     */
    Reservation require(const std::string& run_id, int64_t estimate_units, const LogContext* ctx = nullptr);

    void settle(const std::string& run_id, int64_t reserved_units, int64_t actual_units);
    void release(const std::string& run_id, int64_t reserved_units);
    LedgerSnapshot snapshot(const std::string& run_id);

    SpendLedger& ledger() { return *ledger_; }

    /**
     * @brief Convert a currency amount to cost units, rounding to nearest
     * @throws ConfigurationError for negative or non-finite amounts
     */
    static int64_t to_units(double amount);

    /**
     * @brief Format cost units as a currency amount ("0.020000")
     */
    static std::string format_units(int64_t units);

private:
    std::shared_ptr<SpendLedger> ledger_;
    Logger* logger_;
};

} // namespace thincore

#endif // THINCORE_COST_GUARD_HPP
