/**
 * @file cost_guard.cpp
 * @brief Cost guard implementation
 */

#include "cost_guard.hpp"
#include "errors.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace thincore {

CostGuard::CostGuard(std::shared_ptr<SpendLedger> ledger, Logger* logger)
    : ledger_(std::move(ledger))
    , logger_(logger ? logger : &Logger::get_instance())
{
    if (!ledger_) {
        throw ConfigurationError("CostGuard requires a spend ledger");
    }
}

Reservation CostGuard::reserve(const std::string& run_id, int64_t estimate_units, const LogContext* ctx) {
    Reservation reservation = ledger_->reserve(run_id, estimate_units);

    LogContext log_ctx = ctx ? *ctx : LogContext(run_id);
    log_ctx.phase = "reserve";
    logger_->log_cost_decision(
        log_ctx,
        reservation.granted,
        estimate_units,
        reservation.snapshot.spent,
        reservation.snapshot.in_flight,
        reservation.snapshot.ceiling
    );
    return reservation;
}

Reservation CostGuard::require(const std::string& run_id, int64_t estimate_units, const LogContext* ctx) {
    Reservation reservation = reserve(run_id, estimate_units, ctx);
    if (!reservation.granted) {
        throw CostCeilingExceeded(run_id);
    }
    return reservation;
}

void CostGuard::settle(const std::string& run_id, int64_t reserved_units, int64_t actual_units) {
    if (actual_units < 0) {
        throw TaskExecutionError("Negative actual cost " + std::to_string(actual_units));
    }
    ledger_->settle(run_id, reserved_units, actual_units);
}

void CostGuard::release(const std::string& run_id, int64_t reserved_units) {
    if (reserved_units > 0) {
        ledger_->release(run_id, reserved_units);
    }
}

LedgerSnapshot CostGuard::snapshot(const std::string& run_id) {
    return ledger_->snapshot(run_id);
}

int64_t CostGuard::to_units(double amount) {
    if (!std::isfinite(amount) || amount < 0) {
        throw ConfigurationError("Invalid cost amount " + std::to_string(amount));
    }
    return static_cast<int64_t>(std::llround(amount * COST_UNITS_PER_CURRENCY));
}

std::string CostGuard::format_units(int64_t units) {
    if (units < 0) {
        return "unlimited";
    }
    std::ostringstream oss;
    oss << units / COST_UNITS_PER_CURRENCY << "."
        << std::setw(6) << std::setfill('0') << units % COST_UNITS_PER_CURRENCY;
    return oss.str();
}

} // namespace thincore
