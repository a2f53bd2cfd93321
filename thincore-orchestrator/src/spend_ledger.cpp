/**
 * @file spend_ledger.cpp
 * @brief In-memory spend ledger
 */

#include "spend_ledger.hpp"
#include "errors.hpp"
#include <algorithm>

namespace thincore {

LedgerSnapshot MemorySpendLedger::open_run(const std::string& run_id, int64_t ceiling, int64_t recorded_spent) {
    std::lock_guard<std::mutex> lock(mutex_);
    LedgerSnapshot& run = runs_[run_id];
    run.opened = true;
    run.ceiling = ceiling;
    run.spent = std::max(run.spent, recorded_spent);
    return run;
}

Reservation MemorySpendLedger::reserve(const std::string& run_id, int64_t estimate) {
    if (estimate < 0) {
        throw ConfigurationError("Reservation estimate must not be negative");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    Reservation reservation;
    auto it = runs_.find(run_id);
    if (it != runs_.end()) {
        reservation.snapshot = it->second;
    }

    if (!reservation_allowed(reservation.snapshot, estimate)) {
        return reservation;
    }

    it->second.in_flight += estimate;
    reservation.granted = true;
    reservation.amount = estimate;
    reservation.snapshot = it->second;
    return reservation;
}

void MemorySpendLedger::settle(const std::string& run_id, int64_t reserved, int64_t actual) {
    std::lock_guard<std::mutex> lock(mutex_);
    LedgerSnapshot& run = runs_[run_id];
    run.in_flight = std::max<int64_t>(0, run.in_flight - reserved);
    if (actual > 0) {
        run.spent += actual;
        global_spent_ += actual;
    }
}

void MemorySpendLedger::release(const std::string& run_id, int64_t reserved) {
    settle(run_id, reserved, 0);
}

LedgerSnapshot MemorySpendLedger::snapshot(const std::string& run_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    return it == runs_.end() ? LedgerSnapshot() : it->second;
}

int64_t MemorySpendLedger::global_spent() {
    std::lock_guard<std::mutex> lock(mutex_);
    return global_spent_;
}

} // namespace thincore
