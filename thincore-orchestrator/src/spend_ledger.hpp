/**
 * @file spend_ledger.hpp
 * @brief Per-run spend counters with atomic reserve/settle
 *
 * All amounts are integer cost units (one millionth of the configured
 * currency), so increments are exact.
 */

#ifndef THINCORE_SPEND_LEDGER_HPP
#define THINCORE_SPEND_LEDGER_HPP

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace thincore {

/// Ceiling value meaning "no limit"; only set when explicitly configured
constexpr int64_t UNLIMITED_CEILING = -1;

/**
 * @brief Point-in-time view of a run's ledger
 */
struct LedgerSnapshot {
    bool opened;             ///< Ceiling has been set for the run
    int64_t spent;           ///< Settled cost
    int64_t in_flight;       ///< Granted, not yet settled or released
    int64_t ceiling;         ///< UNLIMITED_CEILING or a budget >= 0

    LedgerSnapshot() : opened(false), spent(0), in_flight(0), ceiling(0) {}

    bool unlimited() const { return ceiling < 0; }
    bool exhausted() const { return opened && !unlimited() && spent + in_flight >= ceiling; }
};

/**
 * @brief Result of a reservation attempt
 */
struct Reservation {
    bool granted;
    int64_t amount;          ///< Reserved units when granted
    LedgerSnapshot snapshot; ///< Ledger state as seen by the check

    Reservation() : granted(false), amount(0) {}
};

/**
 * @brief Admission rule shared by every backend
 *
 * Denied once spent + in_flight has reached the ceiling, and whenever
 * granting would push spent + in_flight + estimate above it. A run whose
 * ceiling was never set is denied.
 */
inline bool reservation_allowed(const LedgerSnapshot& snapshot, int64_t estimate) {
    if (!snapshot.opened) {
        return false;
    }
    if (snapshot.unlimited()) {
        return true;
    }
    int64_t committed = snapshot.spent + snapshot.in_flight;
    return committed < snapshot.ceiling && committed + estimate <= snapshot.ceiling;
}

/**
 * @brief Spend ledger interface
 *
 * Every method is one atomic operation on the backing store.
 * Backend failures surface as TransientIOError.
 */
class SpendLedger {
public:
    virtual ~SpendLedger() = default;

    /**
     * @brief Start a planner session for a run
     *
     * Sets the ceiling and raises spent to at least recorded_spent (the cost
     * recorded in the manifest). Reservations still in flight are kept; only
     * settle and release reduce them.
     */
    virtual LedgerSnapshot open_run(const std::string& run_id, int64_t ceiling, int64_t recorded_spent) = 0;

    /**
     * @brief Check-and-increment in_flight by estimate
     */
    virtual Reservation reserve(const std::string& run_id, int64_t estimate) = 0;

    /**
     * @brief Convert a reservation into spend: in_flight -= reserved, spent += actual
     */
    virtual void settle(const std::string& run_id, int64_t reserved, int64_t actual) = 0;

    /**
     * @brief Drop a reservation without charging
     */
    virtual void release(const std::string& run_id, int64_t reserved) = 0;

    virtual LedgerSnapshot snapshot(const std::string& run_id) = 0;

    /**
     * @brief Spend settled across all runs
     */
    virtual int64_t global_spent() = 0;

    virtual std::string describe() const = 0;
};

/**
 * @brief Ledger in process memory, guarded by a mutex
 */
class MemorySpendLedger : public SpendLedger {
public:
    MemorySpendLedger() : global_spent_(0) {}

    LedgerSnapshot open_run(const std::string& run_id, int64_t ceiling, int64_t recorded_spent) override;
    Reservation reserve(const std::string& run_id, int64_t estimate) override;
    void settle(const std::string& run_id, int64_t reserved, int64_t actual) override;
    void release(const std::string& run_id, int64_t reserved) override;
    LedgerSnapshot snapshot(const std::string& run_id) override;
    int64_t global_spent() override;
    std::string describe() const override { return "memory"; }

private:
    std::mutex mutex_;
    std::map<std::string, LedgerSnapshot> runs_;
    int64_t global_spent_;
};

} // namespace thincore

#endif // THINCORE_SPEND_LEDGER_HPP
