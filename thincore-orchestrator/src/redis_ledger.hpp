/**
 * @file redis_ledger.hpp
 * @brief Spend ledger shared by a worker fleet through Redis
 *
 * Layout:
 *   <prefix>:ledger:<run_id>    hash {spent, in_flight, ceiling}
 *   <prefix>:ledger:_global     integer, spend across all runs
 *
 * Every operation is a single Lua script, so check-and-increment happens in
 * one round trip and concurrent workers cannot both pass a stale check.
 */

#ifndef THINCORE_REDIS_LEDGER_HPP
#define THINCORE_REDIS_LEDGER_HPP

#include "spend_ledger.hpp"
#include <memory>

namespace sw { namespace redis { class Redis; } }

namespace thincore {

class RedisSpendLedger : public SpendLedger {
public:
    RedisSpendLedger(std::shared_ptr<sw::redis::Redis> redis, const std::string& key_prefix = "thincore");

    LedgerSnapshot open_run(const std::string& run_id, int64_t ceiling, int64_t recorded_spent) override;
    Reservation reserve(const std::string& run_id, int64_t estimate) override;
    void settle(const std::string& run_id, int64_t reserved, int64_t actual) override;
    void release(const std::string& run_id, int64_t reserved) override;
    LedgerSnapshot snapshot(const std::string& run_id) override;
    int64_t global_spent() override;
    std::string describe() const override { return "redis (prefix " + key_prefix_ + ")"; }

private:
    std::shared_ptr<sw::redis::Redis> redis_;
    std::string key_prefix_;

    std::vector<long long> run_script(
        const char* what,
        const char* script,
        const std::string& run_id,
        const std::vector<std::string>& args
    );
};

} // namespace thincore

#endif // THINCORE_REDIS_LEDGER_HPP
