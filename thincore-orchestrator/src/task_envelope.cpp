/**
 * @file task_envelope.cpp
 * @brief Task key derivation and wire encoding
 */

#include "task_envelope.hpp"
#include "errors.hpp"
#include <map>
#include <sstream>

namespace thincore {

namespace {

const char* TASK_KEY_DOMAIN = "thincore.task.v1";

std::map<std::string, std::string> to_map(const WireFields& fields) {
    std::map<std::string, std::string> result;
    for (const auto& [name, value] : fields) {
        result[name] = value;
    }
    return result;
}

const std::string& require_field(
    const std::map<std::string, std::string>& fields,
    const std::string& name,
    const std::string& what
) {
    auto it = fields.find(name);
    if (it == fields.end()) {
        throw IntegrityError(what + " is missing field '" + name + "'");
    }
    return it->second;
}

int64_t parse_int(const std::string& value, const std::string& what) {
    try {
        size_t consumed = 0;
        long long parsed = std::stoll(value, &consumed);
        if (consumed != value.size()) {
            throw IntegrityError(what + " is not an integer: '" + value + "'");
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw IntegrityError(what + " is not an integer: '" + value + "'");
    }
}

std::string join_hashes(const std::vector<std::string>& hashes) {
    std::ostringstream oss;
    for (size_t i = 0; i < hashes.size(); ++i) {
        if (i > 0) oss << ",";
        oss << hashes[i];
    }
    return oss.str();
}

std::vector<std::string> split_hashes(const std::string& joined) {
    std::vector<std::string> hashes;
    if (joined.empty()) {
        return hashes;
    }
    size_t start = 0;
    while (true) {
        size_t comma = joined.find(',', start);
        hashes.push_back(artifacts::normalize_digest(joined.substr(start, comma - start)));
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return hashes;
}

} // namespace

std::string status_to_string(CompletionStatus status) {
    switch (status) {
        case CompletionStatus::DONE: return "done";
        case CompletionStatus::FAILED: return "failed";
        case CompletionStatus::CANCELLED: return "cancelled";
        case CompletionStatus::HALTED: return "halted";
        default: return "unknown";
    }
}

CompletionStatus string_to_status(const std::string& value) {
    if (value == "done") return CompletionStatus::DONE;
    if (value == "failed") return CompletionStatus::FAILED;
    if (value == "cancelled") return CompletionStatus::CANCELLED;
    if (value == "halted") return CompletionStatus::HALTED;
    throw IntegrityError("Unknown completion status '" + value + "'");
}

std::string compute_task_key(
    const std::string& task_type,
    const std::vector<std::string>& input_hashes,
    const Bytes& params
) {
    artifacts::Sha256Builder builder;
    builder.update_framed(TASK_KEY_DOMAIN);
    builder.update_framed(task_type);
    builder.update_framed(std::to_string(input_hashes.size()));
    for (const auto& hash : input_hashes) {
        builder.update_framed(artifacts::normalize_digest(hash));
    }
    builder.update_framed(params);
    return builder.hex_digest();
}

void verify_task_key(const TaskEnvelope& envelope) {
    std::string expected = compute_task_key(envelope.task_type, envelope.input_hashes, envelope.params);
    if (artifacts::normalize_digest(envelope.task_key) != expected) {
        throw IntegrityError("Task key " + envelope.task_key + " does not match its inputs (expected " +
                             expected + ")");
    }
}

WireFields encode_envelope(const TaskEnvelope& envelope) {
    return {
        {"run_id", envelope.run_id},
        {"task_key", envelope.task_key},
        {"task_type", envelope.task_type},
        {"input_hashes", join_hashes(envelope.input_hashes)},
        {"params", envelope.params},
        {"attempt", std::to_string(envelope.attempt)},
        {"estimated_cost", std::to_string(envelope.estimated_cost)},
    };
}

TaskEnvelope decode_envelope(const WireFields& fields) {
    auto map = to_map(fields);
    const std::string what = "Task envelope";

    TaskEnvelope envelope;
    envelope.run_id = require_field(map, "run_id", what);
    envelope.task_key = artifacts::normalize_digest(require_field(map, "task_key", what));
    envelope.task_type = require_field(map, "task_type", what);
    envelope.input_hashes = split_hashes(require_field(map, "input_hashes", what));
    envelope.params = require_field(map, "params", what);
    envelope.attempt = static_cast<int>(parse_int(require_field(map, "attempt", what), "attempt"));
    auto estimate = map.find("estimated_cost");
    if (estimate != map.end()) {
        envelope.estimated_cost = parse_int(estimate->second, "estimated_cost");
    }

    if (envelope.run_id.empty() || envelope.task_type.empty()) {
        throw IntegrityError("Task envelope has an empty run_id or task_type");
    }
    return envelope;
}

WireFields encode_event(const CompletionEvent& event) {
    return {
        {"run_id", event.run_id},
        {"task_key", event.task_key},
        {"task_type", event.task_type},
        {"status", status_to_string(event.status)},
        {"artifact_hash", event.artifact_hash},
        {"cost_charged", std::to_string(event.cost_charged)},
        {"attempt", std::to_string(event.attempt)},
        {"reason", event.reason},
    };
}

CompletionEvent decode_event(const WireFields& fields) {
    auto map = to_map(fields);
    const std::string what = "Completion event";

    CompletionEvent event;
    event.run_id = require_field(map, "run_id", what);
    event.task_key = require_field(map, "task_key", what);
    event.task_type = require_field(map, "task_type", what);
    event.status = string_to_status(require_field(map, "status", what));
    event.artifact_hash = require_field(map, "artifact_hash", what);
    event.cost_charged = parse_int(require_field(map, "cost_charged", what), "cost_charged");
    event.attempt = static_cast<int>(parse_int(require_field(map, "attempt", what), "attempt"));
    auto reason = map.find("reason");
    if (reason != map.end()) {
        event.reason = reason->second;
    }

    if (event.status == CompletionStatus::DONE) {
        event.artifact_hash = artifacts::normalize_digest(event.artifact_hash);
    }
    return event;
}

CompletionEvent make_done_event(const TaskEnvelope& envelope, const TaskOutcome& outcome) {
    CompletionEvent event;
    event.run_id = envelope.run_id;
    event.task_key = envelope.task_key;
    event.task_type = envelope.task_type;
    event.status = CompletionStatus::DONE;
    event.artifact_hash = outcome.artifact_hash;
    event.cost_charged = outcome.cost_charged;
    event.attempt = envelope.attempt;
    return event;
}

CompletionEvent make_terminal_event(
    const TaskEnvelope& envelope,
    CompletionStatus status,
    const std::string& reason
) {
    CompletionEvent event;
    event.run_id = envelope.run_id;
    event.task_key = envelope.task_key;
    event.task_type = envelope.task_type;
    event.status = status;
    event.attempt = envelope.attempt;
    event.reason = reason;
    return event;
}

} // namespace thincore
