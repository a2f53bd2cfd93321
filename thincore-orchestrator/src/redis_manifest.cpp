/**
 * @file redis_manifest.cpp
 * @brief Redis list manifest implementation
 */

#include "redis_manifest.hpp"
#include "redis_support.hpp"
#include <iterator>

namespace thincore {

namespace {

// RPUSH the line and, for done entries, index the first one per task key
const char* APPEND_SCRIPT = R"lua(
redis.call('RPUSH', KEYS[1], ARGV[1])
if ARGV[2] == '1' then
    redis.call('HSETNX', KEYS[2], ARGV[3], ARGV[1])
end
return 1
)lua";

} // namespace

RedisManifestLog::RedisManifestLog(std::shared_ptr<sw::redis::Redis> redis, const std::string& key_prefix)
    : redis_(std::move(redis))
    , key_prefix_(key_prefix)
{
    if (!redis_) {
        throw ConfigurationError("RedisManifestLog requires a connection");
    }
}

void RedisManifestLog::append(const std::string& run_id, const ManifestEntry& entry) {
    RedisKeys keys(key_prefix_);
    std::vector<std::string> script_keys = {keys.manifest(run_id), keys.manifest_index(run_id)};
    std::vector<std::string> args = {
        encode_manifest_entry(entry),
        entry.is_failed() ? "0" : "1",
        entry.task_key
    };
    redis_call("manifest append", [&]() {
        return redis_->eval<long long>(APPEND_SCRIPT, script_keys.begin(), script_keys.end(),
                                       args.begin(), args.end());
    });
}

std::vector<ManifestEntry> RedisManifestLog::replay(const std::string& run_id) {
    RedisKeys keys(key_prefix_);
    std::vector<std::string> lines;
    redis_call("LRANGE", [&]() {
        redis_->lrange(keys.manifest(run_id), 0, -1, std::back_inserter(lines));
    });

    std::vector<ManifestEntry> entries;
    entries.reserve(lines.size());
    for (const auto& line : lines) {
        entries.push_back(decode_manifest_entry(line));
    }
    return entries;
}

std::optional<ManifestEntry> RedisManifestLog::find_done(const std::string& run_id, const std::string& task_key) {
    RedisKeys keys(key_prefix_);
    auto line = redis_call("HGET", [&]() {
        return redis_->hget(keys.manifest_index(run_id), task_key);
    });
    if (!line) {
        return std::nullopt;
    }
    return decode_manifest_entry(*line);
}

} // namespace thincore
