/**
 * @file redis_run_control.cpp
 * @brief Redis hash run control implementation
 */

#include "redis_run_control.hpp"
#include "redis_support.hpp"
#include <chrono>
#include <iterator>
#include <unordered_map>

namespace thincore {

namespace {

std::string now_epoch_ms_string() {
    return std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

int64_t parse_field(const std::unordered_map<std::string, std::string>& fields,
                    const std::string& name, const std::string& run_id) {
    auto it = fields.find(name);
    if (it == fields.end()) {
        return 0;
    }
    try {
        return std::stoll(it->second);
    } catch (const std::logic_error&) {
        throw IntegrityError("Run record " + run_id + " has a non-integer " + name);
    }
}

} // namespace

RedisRunControl::RedisRunControl(std::shared_ptr<sw::redis::Redis> redis, const std::string& key_prefix)
    : redis_(std::move(redis))
    , key_prefix_(key_prefix)
{
    if (!redis_) {
        throw ConfigurationError("RedisRunControl requires a connection");
    }
}

void RedisRunControl::register_run(const std::string& run_id, const std::string& spec_hash, int64_t ceiling) {
    RedisKeys keys(key_prefix_);
    std::unordered_map<std::string, std::string> fields = {
        {"run_id", run_id},
        {"spec_hash", spec_hash},
        {"ceiling", std::to_string(ceiling)},
        {"status", run_status_to_string(RunStatus::RUNNING)},
        {"cancelled", "0"},
        {"halted", "0"},
        {"updated_at", now_epoch_ms_string()}
    };
    redis_call("HSET run", [&]() {
        redis_->hset(keys.run(run_id), fields.begin(), fields.end());
    });
}

std::optional<RunRecord> RedisRunControl::get(const std::string& run_id) {
    RedisKeys keys(key_prefix_);
    std::unordered_map<std::string, std::string> fields;
    redis_call("HGETALL run", [&]() {
        redis_->hgetall(keys.run(run_id), std::inserter(fields, fields.end()));
    });
    if (fields.empty()) {
        return std::nullopt;
    }

    RunRecord record;
    record.run_id = run_id;
    auto spec = fields.find("spec_hash");
    if (spec != fields.end()) {
        record.spec_hash = spec->second;
    }
    record.ceiling = parse_field(fields, "ceiling", run_id);
    auto status = fields.find("status");
    record.status = status == fields.end() ? RunStatus::RUNNING : string_to_run_status(status->second);
    record.cancelled = parse_field(fields, "cancelled", run_id) == 1;
    record.halted = parse_field(fields, "halted", run_id) == 1;
    record.updated_at_ms = parse_field(fields, "updated_at", run_id);
    return record;
}

void RedisRunControl::set_field(const std::string& run_id, const std::string& field, const std::string& value) {
    RedisKeys keys(key_prefix_);
    std::unordered_map<std::string, std::string> fields = {
        {field, value},
        {"updated_at", now_epoch_ms_string()}
    };
    redis_call("HSET run", [&]() {
        redis_->hset(keys.run(run_id), fields.begin(), fields.end());
    });
}

bool RedisRunControl::flag(const std::string& run_id, const std::string& field) {
    RedisKeys keys(key_prefix_);
    auto value = redis_call("HGET run", [&]() { return redis_->hget(keys.run(run_id), field); });
    return value && *value == "1";
}

void RedisRunControl::cancel(const std::string& run_id) {
    set_field(run_id, "cancelled", "1");
}

bool RedisRunControl::is_cancelled(const std::string& run_id) {
    return flag(run_id, "cancelled");
}

void RedisRunControl::mark_halted(const std::string& run_id) {
    set_field(run_id, "halted", "1");
}

void RedisRunControl::clear_halted(const std::string& run_id) {
    set_field(run_id, "halted", "0");
}

bool RedisRunControl::is_halted(const std::string& run_id) {
    return flag(run_id, "halted");
}

void RedisRunControl::set_status(const std::string& run_id, RunStatus status) {
    set_field(run_id, "status", run_status_to_string(status));
}

} // namespace thincore
