/**
 * @file redis_ledger.cpp
 * @brief Lua-scripted spend ledger
 */

#include "redis_ledger.hpp"
#include "redis_support.hpp"
#include <iterator>

namespace thincore {

namespace {

// Every script returns {opened, spent, in_flight, ceiling[, granted]}

const char* OPEN_SCRIPT = R"lua(
local spent = tonumber(redis.call('HGET', KEYS[1], 'spent') or '0')
local recorded = tonumber(ARGV[2])
if recorded > spent then
    spent = recorded
end
local in_flight = tonumber(redis.call('HGET', KEYS[1], 'in_flight') or '0')
redis.call('HSET', KEYS[1], 'spent', spent, 'in_flight', in_flight, 'ceiling', ARGV[1])
return {1, spent, in_flight, tonumber(ARGV[1])}
)lua";

const char* RESERVE_SCRIPT = R"lua(
local ceiling = redis.call('HGET', KEYS[1], 'ceiling')
local spent = tonumber(redis.call('HGET', KEYS[1], 'spent') or '0')
local in_flight = tonumber(redis.call('HGET', KEYS[1], 'in_flight') or '0')
if not ceiling then
    return {0, spent, in_flight, 0, 0}
end
ceiling = tonumber(ceiling)
local estimate = tonumber(ARGV[1])
local committed = spent + in_flight
if ceiling >= 0 and (committed >= ceiling or committed + estimate > ceiling) then
    return {1, spent, in_flight, ceiling, 0}
end
in_flight = redis.call('HINCRBY', KEYS[1], 'in_flight', estimate)
return {1, spent, in_flight, ceiling, 1}
)lua";

const char* SETTLE_SCRIPT = R"lua(
local in_flight = tonumber(redis.call('HGET', KEYS[1], 'in_flight') or '0') - tonumber(ARGV[1])
if in_flight < 0 then
    in_flight = 0
end
redis.call('HSET', KEYS[1], 'in_flight', in_flight)
local actual = tonumber(ARGV[2])
if actual > 0 then
    redis.call('HINCRBY', KEYS[1], 'spent', actual)
    redis.call('INCRBY', KEYS[2], actual)
end
local ceiling = redis.call('HGET', KEYS[1], 'ceiling')
return {ceiling and 1 or 0, tonumber(redis.call('HGET', KEYS[1], 'spent') or '0'), in_flight, tonumber(ceiling or '0')}
)lua";

const char* SNAPSHOT_SCRIPT = R"lua(
local ceiling = redis.call('HGET', KEYS[1], 'ceiling')
return {
    ceiling and 1 or 0,
    tonumber(redis.call('HGET', KEYS[1], 'spent') or '0'),
    tonumber(redis.call('HGET', KEYS[1], 'in_flight') or '0'),
    tonumber(ceiling or '0')
}
)lua";

LedgerSnapshot to_snapshot(const std::vector<long long>& values) {
    if (values.size() < 4) {
        throw ThinCoreError("Ledger script returned " + std::to_string(values.size()) + " values");
    }
    LedgerSnapshot snapshot;
    snapshot.opened = values[0] == 1;
    snapshot.spent = values[1];
    snapshot.in_flight = values[2];
    snapshot.ceiling = values[3];
    return snapshot;
}

} // namespace

RedisSpendLedger::RedisSpendLedger(std::shared_ptr<sw::redis::Redis> redis, const std::string& key_prefix)
    : redis_(std::move(redis))
    , key_prefix_(key_prefix)
{
    if (!redis_) {
        throw ConfigurationError("RedisSpendLedger requires a connection");
    }
}

std::vector<long long> RedisSpendLedger::run_script(
    const char* what,
    const char* script,
    const std::string& run_id,
    const std::vector<std::string>& args
) {
    RedisKeys keys(key_prefix_);
    std::vector<std::string> script_keys = {keys.ledger(run_id), keys.ledger_global()};
    std::vector<long long> values;
    redis_call(what, [&]() {
        redis_->eval(script, script_keys.begin(), script_keys.end(), args.begin(), args.end(),
                     std::back_inserter(values));
    });
    return values;
}

LedgerSnapshot RedisSpendLedger::open_run(const std::string& run_id, int64_t ceiling, int64_t recorded_spent) {
    return to_snapshot(run_script("ledger open", OPEN_SCRIPT, run_id,
                                  {std::to_string(ceiling), std::to_string(recorded_spent)}));
}

Reservation RedisSpendLedger::reserve(const std::string& run_id, int64_t estimate) {
    if (estimate < 0) {
        throw ConfigurationError("Reservation estimate must not be negative");
    }

    auto values = run_script("ledger reserve", RESERVE_SCRIPT, run_id, {std::to_string(estimate)});
    Reservation reservation;
    reservation.snapshot = to_snapshot(values);
    reservation.granted = values.size() > 4 && values[4] == 1;
    reservation.amount = reservation.granted ? estimate : 0;
    return reservation;
}

void RedisSpendLedger::settle(const std::string& run_id, int64_t reserved, int64_t actual) {
    run_script("ledger settle", SETTLE_SCRIPT, run_id, {std::to_string(reserved), std::to_string(actual)});
}

void RedisSpendLedger::release(const std::string& run_id, int64_t reserved) {
    run_script("ledger release", SETTLE_SCRIPT, run_id, {std::to_string(reserved), "0"});
}

LedgerSnapshot RedisSpendLedger::snapshot(const std::string& run_id) {
    return to_snapshot(run_script("ledger snapshot", SNAPSHOT_SCRIPT, run_id, {}));
}

int64_t RedisSpendLedger::global_spent() {
    RedisKeys keys(key_prefix_);
    auto value = redis_call("GET", [&]() { return redis_->get(keys.ledger_global()); });
    if (!value) {
        return 0;
    }
    try {
        return std::stoll(*value);
    } catch (const std::logic_error&) {
        throw IntegrityError("Global spend counter holds a non-integer value");
    }
}

} // namespace thincore
