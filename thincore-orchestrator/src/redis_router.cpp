/**
 * @file redis_router.cpp
 * @brief Redis Streams task router implementation
 */

#include "redis_router.hpp"
#include "redis_support.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <iterator>
#include <string>
#include <tuple>
#include <unordered_map>

using json = nlohmann::json;

namespace thincore {

namespace {

using Attrs = std::vector<std::pair<std::string, std::string>>;
using Item = std::pair<std::string, sw::redis::Optional<Attrs>>;
using ItemStream = std::vector<Item>;
using PendingInfo = std::tuple<std::string, std::string, long long, long long>;

// Lua helpers prepended to the scripts that settle an entry. forget_entry
// deletes it once no consumer group still has to read or settle it.
const char* FORGET_ENTRY_LUA = R"lua(
local function id_before(a, b)
    local a_ms, a_seq = string.match(a, '^(%d+)-(%d+)$')
    local b_ms, b_seq = string.match(b, '^(%d+)-(%d+)$')
    a_ms, b_ms = tonumber(a_ms), tonumber(b_ms)
    if a_ms ~= b_ms then
        return a_ms < b_ms
    end
    return tonumber(a_seq) < tonumber(b_seq)
end

local function forget_entry(stream, id)
    for _, g in ipairs(redis.call('XINFO', 'GROUPS', stream)) do
        local name, last
        for i = 1, #g, 2 do
            if g[i] == 'name' then name = g[i + 1]
            elseif g[i] == 'last-delivered-id' then last = g[i + 1] end
        end
        if id_before(last, id) or #redis.call('XPENDING', stream, name, id, id, 1) > 0 then
            return 0
        end
    end
    redis.call('XDEL', stream, id)
    return 1
end
)lua";

// XACK and publish the DONE event, only while the lease of consumer ARGV[3]
// with delivery count ARGV[4] is still current
const std::string ACK_SCRIPT = std::string(FORGET_ENTRY_LUA) + R"lua(
local pending = redis.call('XPENDING', KEYS[1], ARGV[1], ARGV[2], ARGV[2], 1)
if #pending == 0 or pending[1][2] ~= ARGV[3] or tonumber(pending[1][4]) ~= tonumber(ARGV[4]) then
    return 0
end
redis.call('XACK', KEYS[1], ARGV[1], ARGV[2])
forget_entry(KEYS[1], ARGV[2])
redis.call('XADD', KEYS[2], '*', unpack(ARGV, 5))
return 1
)lua";

// Confirm a buffered delivery is still held by ARGV[3] with delivery count
// ARGV[4] and restart its idle clock; JUSTID leaves the count unchanged
const char* RECONFIRM_SCRIPT = R"lua(
local pending = redis.call('XPENDING', KEYS[1], ARGV[1], ARGV[2], ARGV[2], 1)
if #pending == 0 or pending[1][2] ~= ARGV[3] or tonumber(pending[1][4]) ~= tonumber(ARGV[4]) then
    return 0
end
redis.call('XCLAIM', KEYS[1], ARGV[1], ARGV[3], 0, ARGV[2], 'JUSTID')
return 1
)lua";

// Release a lease held by ARGV[3] with delivery count ARGV[4], then either
// re-append the entry (ARGV[5] == 'requeue') or move it to the dead-letter
// stream and publish its terminal event. ARGV[6] is the entry field count.
const std::string RELEASE_SCRIPT = std::string(FORGET_ENTRY_LUA) + R"lua(
local pending = redis.call('XPENDING', KEYS[1], ARGV[1], ARGV[2], ARGV[2], 1)
if #pending == 0 or pending[1][2] ~= ARGV[3] or tonumber(pending[1][4]) ~= tonumber(ARGV[4]) then
    return -1
end
redis.call('XACK', KEYS[1], ARGV[1], ARGV[2])
forget_entry(KEYS[1], ARGV[2])
local n = tonumber(ARGV[6])
if ARGV[5] == 'requeue' then
    redis.call('XADD', KEYS[1], '*', unpack(ARGV, 7, 6 + n))
    return 1
end
redis.call('XADD', KEYS[2], '*', unpack(ARGV, 7, 6 + n))
redis.call('XADD', KEYS[3], '*', unpack(ARGV, 7 + n))
return 2
)lua";

// Waiting plus pending entries of one group
const char* DEPTH_SCRIPT = R"lua(
if redis.call('EXISTS', KEYS[1]) == 0 then
    return 0
end
local groups = redis.call('XINFO', 'GROUPS', KEYS[1])
for _, g in ipairs(groups) do
    local name, pending, last
    for i = 1, #g, 2 do
        if g[i] == 'name' then name = g[i + 1]
        elseif g[i] == 'pending' then pending = g[i + 1]
        elseif g[i] == 'last-delivered-id' then last = g[i + 1] end
    end
    if name == ARGV[1] then
        local waiting = redis.call('XRANGE', KEYS[1], '(' .. last, '+')
        return pending + #waiting
    end
end
return redis.call('XLEN', KEYS[1])
)lua";

int64_t now_epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

void append_fields(std::vector<std::string>& args, const WireFields& fields) {
    for (const auto& [name, value] : fields) {
        args.push_back(name);
        args.push_back(value);
    }
}

std::string field_or_empty(const Attrs& attrs, const std::string& name) {
    for (const auto& [key, value] : attrs) {
        if (key == name) {
            return value;
        }
    }
    return "";
}

} // namespace

RedisTaskRouter::RedisTaskRouter(
    std::shared_ptr<sw::redis::Redis> redis,
    const RouterConfig& config,
    const std::string& key_prefix,
    Logger* logger
)
    : redis_(std::move(redis))
    , config_(config)
    , key_prefix_(key_prefix)
    , logger_(logger ? logger : &Logger::get_instance())
{
    if (!redis_) {
        throw ConfigurationError("RedisTaskRouter requires a connection");
    }
    if (config_.max_attempts < 1) {
        throw ConfigurationError("max_attempts must be at least 1");
    }
    if (config_.lease_timeout.count() <= 0) {
        throw ConfigurationError("lease_timeout must be positive");
    }
}

std::string RedisTaskRouter::make_token(const Lease& lease) {
    return json::array({lease.group, lease.entry_id, lease.consumer, lease.deliveries}).dump();
}

RedisTaskRouter::Lease RedisTaskRouter::parse_token(const std::string& token) {
    try {
        json j = json::parse(token);
        Lease lease;
        lease.group = j.at(0).get<std::string>();
        lease.entry_id = j.at(1).get<std::string>();
        lease.consumer = j.at(2).get<std::string>();
        lease.deliveries = j.at(3).get<long long>();
        return lease;
    } catch (const json::exception&) {
        throw IntegrityError("Malformed lease token '" + token + "'");
    }
}

void RedisTaskRouter::ensure_group(const std::string& stream, const std::string& group) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (known_groups_.count({stream, group})) {
            return;
        }
    }

    try {
        redis_->xgroup_create(stream, group, "0", true);
    } catch (const sw::redis::ReplyError& e) {
        if (std::string(e.what()).find("BUSYGROUP") == std::string::npos) {
            throw ThinCoreError("Redis rejected XGROUP CREATE on " + stream + ": " + e.what());
        }
    } catch (const sw::redis::Error& e) {
        throw TransientIOError("Redis XGROUP CREATE failed: " + std::string(e.what()));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    known_groups_.insert({stream, group});
}

void RedisTaskRouter::enqueue(const TaskEnvelope& envelope) {
    RedisKeys keys(key_prefix_);
    WireFields fields = encode_envelope(envelope);
    redis_call("XADD", [&]() {
        return redis_->xadd(keys.tasks(envelope.task_type), "*", fields.begin(), fields.end());
    });
}

std::optional<TaskEnvelope> RedisTaskRouter::take_over_expired(
    const std::string& group,
    const std::string& worker_id,
    const std::string& task_type
) {
    RedisKeys keys(key_prefix_);
    const std::string stream = keys.tasks(task_type);
    const long long lease_ms = config_.lease_timeout.count();

    std::vector<PendingInfo> pending;
    redis_call("XPENDING", [&]() {
        redis_->xpending(stream, group, "-", "+", 16, std::back_inserter(pending));
    });

    for (const auto& [entry_id, owner, idle_ms, deliveries] : pending) {
        if (idle_ms < lease_ms) {
            continue;
        }

        ItemStream claimed;
        redis_call("XCLAIM", [&]() {
            redis_->xclaim(stream, group, worker_id, config_.lease_timeout, entry_id,
                           std::back_inserter(claimed));
        });
        if (claimed.empty()) {
            continue;  // another consumer took it first
        }

        Lease lease;
        lease.group = group;
        lease.entry_id = entry_id;
        lease.consumer = worker_id;
        lease.deliveries = deliveries + 1;

        if (!claimed.front().second) {
            // Entry trimmed from the stream; nothing left to deliver
            redis_call("XACK", [&]() { return redis_->xack(stream, group, entry_id); });
            continue;
        }

        TaskEnvelope envelope = decode_envelope(*claimed.front().second);
        int first_attempt = envelope.attempt;
        envelope.attempt = first_attempt + static_cast<int>(lease.deliveries) - 1;
        envelope.lease_token = make_token(lease);

        if (envelope.attempt >= config_.max_attempts) {
            envelope.attempt -= 1;
            std::string reason = "lease expired on final attempt " + std::to_string(envelope.attempt + 1) +
                                 " of " + std::to_string(config_.max_attempts) + " (last owner " + owner + ")";
            if (move_to_dead_letter(lease, envelope, CompletionStatus::FAILED, reason)) {
                LogContext ctx(envelope.run_id, envelope.task_key, envelope.task_type);
                ctx.worker_id = worker_id;
                ctx.phase = "route";
                logger_->log_task_dead_lettered(ctx, "failed", reason);
            }
            continue;
        }

        return envelope;
    }
    return std::nullopt;
}

std::optional<TaskEnvelope> RedisTaskRouter::claim(
    const std::string& consumer_group,
    const std::string& worker_id,
    const std::vector<std::string>& task_types,
    std::chrono::milliseconds block_timeout
) {
    if (task_types.empty()) {
        throw ConfigurationError("claim requires at least one task type");
    }

    RedisKeys keys(key_prefix_);
    for (const auto& task_type : task_types) {
        ensure_group(keys.tasks(task_type), consumer_group);
    }

    while (auto buffered = next_prefetched(consumer_group, worker_id)) {
        if (reconfirm(*buffered)) {
            return buffered;
        }
        LogContext ctx(buffered->run_id, buffered->task_key, buffered->task_type);
        ctx.worker_id = worker_id;
        ctx.phase = "route";
        logger_->log_debug(ctx, "Buffered delivery was taken over by another consumer; dropped");
    }

    for (const auto& task_type : task_types) {
        auto taken = take_over_expired(consumer_group, worker_id, task_type);
        if (taken) {
            return taken;
        }
    }

    std::vector<std::pair<std::string, std::string>> streams;
    for (const auto& task_type : task_types) {
        streams.emplace_back(keys.tasks(task_type), ">");
    }

    std::unordered_map<std::string, ItemStream> result;
    auto timeout = std::max(block_timeout, std::chrono::milliseconds(1));
    redis_call("XREADGROUP", [&]() {
        redis_->xreadgroup(consumer_group, worker_id, streams.begin(), streams.end(),
                           timeout, 1, std::inserter(result, result.end()));
    });

    // COUNT applies per stream, so several types may deliver at once. The rest
    // stay pending under this worker and are reconfirmed before being handed out
    std::vector<TaskEnvelope> delivered;
    for (const auto& task_type : task_types) {
        auto it = result.find(keys.tasks(task_type));
        if (it == result.end()) {
            continue;
        }
        for (const auto& [entry_id, attrs] : it->second) {
            if (!attrs) {
                continue;
            }
            TaskEnvelope envelope = decode_envelope(*attrs);
            Lease lease;
            lease.group = consumer_group;
            lease.entry_id = entry_id;
            lease.consumer = worker_id;
            lease.deliveries = 1;
            envelope.lease_token = make_token(lease);
            delivered.push_back(std::move(envelope));
        }
    }

    if (delivered.empty()) {
        return std::nullopt;
    }

    TaskEnvelope first = std::move(delivered.front());
    if (delivered.size() > 1) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& buffered = prefetched_[{consumer_group, worker_id}];
        for (size_t i = 1; i < delivered.size(); ++i) {
            buffered.push_back(std::move(delivered[i]));
        }
    }
    return first;
}

std::optional<TaskEnvelope> RedisTaskRouter::next_prefetched(const std::string& group, const std::string& worker_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = prefetched_.find({group, worker_id});
    if (it == prefetched_.end() || it->second.empty()) {
        return std::nullopt;
    }
    TaskEnvelope envelope = std::move(it->second.front());
    it->second.pop_front();
    return envelope;
}

bool RedisTaskRouter::reconfirm(const TaskEnvelope& envelope) {
    Lease lease = parse_token(envelope.lease_token);
    RedisKeys keys(key_prefix_);

    std::vector<std::string> script_keys = {keys.tasks(envelope.task_type)};
    std::vector<std::string> args = {lease.group, lease.entry_id, lease.consumer, std::to_string(lease.deliveries)};
    long long held = redis_call("reconfirm script", [&]() {
        return redis_->eval<long long>(RECONFIRM_SCRIPT, script_keys.begin(), script_keys.end(),
                                       args.begin(), args.end());
    });
    return held == 1;
}

bool RedisTaskRouter::ack(const TaskEnvelope& envelope, const TaskOutcome& outcome) {
    Lease lease = parse_token(envelope.lease_token);
    RedisKeys keys(key_prefix_);

    std::vector<std::string> script_keys = {keys.tasks(envelope.task_type), keys.events(envelope.run_id)};
    std::vector<std::string> args = {lease.group, lease.entry_id, lease.consumer, std::to_string(lease.deliveries)};
    append_fields(args, encode_event(make_done_event(envelope, outcome)));

    long long acked = redis_call("ack script", [&]() {
        return redis_->eval<long long>(ACK_SCRIPT, script_keys.begin(), script_keys.end(),
                                       args.begin(), args.end());
    });
    return acked == 1;
}

bool RedisTaskRouter::move_to_dead_letter(
    const Lease& lease,
    const TaskEnvelope& envelope,
    CompletionStatus status,
    const std::string& reason
) {
    RedisKeys keys(key_prefix_);
    std::vector<std::string> script_keys = {
        keys.tasks(envelope.task_type),
        keys.dlq(envelope.task_type),
        keys.events(envelope.run_id)
    };

    WireFields entry = encode_envelope(envelope);
    entry.emplace_back("status", status_to_string(status));
    entry.emplace_back("reason", reason);
    entry.emplace_back("dead_lettered_at", std::to_string(now_epoch_ms()));

    std::vector<std::string> args = {
        lease.group, lease.entry_id, lease.consumer, std::to_string(lease.deliveries),
        "dead", std::to_string(entry.size() * 2)
    };
    append_fields(args, entry);
    append_fields(args, encode_event(make_terminal_event(envelope, status, reason)));

    long long result = redis_call("dead-letter script", [&]() {
        return redis_->eval<long long>(RELEASE_SCRIPT, script_keys.begin(), script_keys.end(),
                                       args.begin(), args.end());
    });
    return result == 2;
}

NackResult RedisTaskRouter::nack(const TaskEnvelope& envelope, const std::string& reason) {
    Lease lease = parse_token(envelope.lease_token);

    if (envelope.attempt + 1 >= config_.max_attempts) {
        return move_to_dead_letter(lease, envelope, CompletionStatus::FAILED, reason)
            ? NackResult::DEAD_LETTERED
            : NackResult::STALE;
    }

    RedisKeys keys(key_prefix_);
    std::vector<std::string> script_keys = {
        keys.tasks(envelope.task_type),
        keys.dlq(envelope.task_type),
        keys.events(envelope.run_id)
    };

    TaskEnvelope retry = envelope;
    retry.attempt = envelope.attempt + 1;
    WireFields entry = encode_envelope(retry);

    std::vector<std::string> args = {
        lease.group, lease.entry_id, lease.consumer, std::to_string(lease.deliveries),
        "requeue", std::to_string(entry.size() * 2)
    };
    append_fields(args, entry);

    long long result = redis_call("nack script", [&]() {
        return redis_->eval<long long>(RELEASE_SCRIPT, script_keys.begin(), script_keys.end(),
                                       args.begin(), args.end());
    });
    return result == 1 ? NackResult::REQUEUED : NackResult::STALE;
}

bool RedisTaskRouter::dead_letter(
    const TaskEnvelope& envelope,
    CompletionStatus status,
    const std::string& reason
) {
    return move_to_dead_letter(parse_token(envelope.lease_token), envelope, status, reason);
}

std::string RedisTaskRouter::completion_cursor(const std::string& run_id) {
    RedisKeys keys(key_prefix_);
    ItemStream newest;
    redis_call("XREVRANGE", [&]() {
        redis_->xrevrange(keys.events(run_id), "+", "-", 1, std::back_inserter(newest));
    });
    return newest.empty() ? "0-0" : newest.front().first;
}

std::vector<CompletionEvent> RedisTaskRouter::poll_completions(
    const std::string& run_id,
    std::string& cursor,
    std::chrono::milliseconds timeout
) {
    RedisKeys keys(key_prefix_);
    const std::string stream = keys.events(run_id);
    if (cursor.empty()) {
        cursor = "0-0";
    }

    std::unordered_map<std::string, ItemStream> result;
    auto wait = std::max(timeout, std::chrono::milliseconds(1));
    redis_call("XREAD", [&]() {
        redis_->xread(stream, cursor, wait, 256, std::inserter(result, result.end()));
    });

    std::vector<CompletionEvent> events;
    auto it = result.find(stream);
    if (it == result.end()) {
        return events;
    }
    for (const auto& [entry_id, attrs] : it->second) {
        cursor = entry_id;
        if (attrs) {
            events.push_back(decode_event(*attrs));
        }
    }
    return events;
}

std::vector<DeadLetterEntry> RedisTaskRouter::dead_letters(const std::string& task_type) {
    RedisKeys keys(key_prefix_);
    ItemStream entries;
    redis_call("XRANGE", [&]() {
        redis_->xrange(keys.dlq(task_type), "-", "+", std::back_inserter(entries));
    });

    std::vector<DeadLetterEntry> result;
    for (const auto& [entry_id, attrs] : entries) {
        if (!attrs) {
            continue;
        }
        DeadLetterEntry entry;
        entry.envelope = decode_envelope(*attrs);
        entry.status = string_to_status(field_or_empty(*attrs, "status"));
        entry.reason = field_or_empty(*attrs, "reason");
        std::string at = field_or_empty(*attrs, "dead_lettered_at");
        try {
            entry.dead_lettered_at_ms = at.empty() ? 0 : std::stoll(at);
        } catch (const std::logic_error&) {
            throw IntegrityError("Dead-letter entry " + entry_id + " has a malformed timestamp");
        }
        result.push_back(std::move(entry));
    }
    return result;
}

size_t RedisTaskRouter::queue_depth(const std::string& task_type, const std::string& consumer_group) {
    RedisKeys keys(key_prefix_);
    std::vector<std::string> script_keys = {keys.tasks(task_type)};
    std::vector<std::string> args = {consumer_group};
    long long depth = redis_call("depth script", [&]() {
        return redis_->eval<long long>(DEPTH_SCRIPT, script_keys.begin(), script_keys.end(),
                                       args.begin(), args.end());
    });
    return depth < 0 ? 0 : static_cast<size_t>(depth);
}

} // namespace thincore
