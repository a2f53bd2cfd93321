/**
 * @file task_envelope.hpp
 * @brief Units of work and their completion events as they travel the queue
 *
 * A TaskEnvelope is everything a worker needs to perform one task: the task
 * type selecting the handler, input artifact hashes, opaque params, and the
 * task key that identifies the work for caching. The task key is a pure
 * function of (task_type, input_hashes, params), so a worker can recompute
 * and verify it.
 */

#ifndef THINCORE_TASK_ENVELOPE_HPP
#define THINCORE_TASK_ENVELOPE_HPP

#include "hash/content_hash.hpp"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace thincore {

using artifacts::Bytes;

/// Ordered field list, the shape of a Redis stream entry
using WireFields = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Terminal status reported for a task
 */
enum class CompletionStatus {
    DONE,        ///< Output artifact stored
    FAILED,      ///< Attempts exhausted or unrecoverable input
    CANCELLED,   ///< Run was cancelled before the task completed
    HALTED       ///< Run hit its cost ceiling before the task was paid for
};

std::string status_to_string(CompletionStatus status);

/**
 * @brief Parse completion status
 * @throws IntegrityError on an unknown value
 */
CompletionStatus string_to_status(const std::string& value);

/**
 * @brief Message carried by the task router
 */
struct TaskEnvelope {
    std::string run_id;                      ///< Owning run
    std::string task_key;                    ///< Cache key (hex digest)
    std::string task_type;                   ///< Handler capability required
    std::vector<std::string> input_hashes;   ///< Ordered input artifacts
    Bytes params;                            ///< Opaque, task-type-specific
    int attempt;                             ///< 0 on first delivery
    int64_t estimated_cost;                  ///< Cost units to reserve; negative selects the handler default. Not part of the key
    std::string lease_token;                 ///< Set by the router at claim time; never serialized

    TaskEnvelope() : attempt(0), estimated_cost(-1) {}
};

/**
 * @brief Result a worker acknowledges with
 */
struct TaskOutcome {
    std::string artifact_hash;
    int64_t cost_charged;                    ///< Cost units

    TaskOutcome() : cost_charged(0) {}
    TaskOutcome(const std::string& hash, int64_t cost) : artifact_hash(hash), cost_charged(cost) {}
};

/**
 * @brief Event published by the router when a task reaches a terminal state
 */
struct CompletionEvent {
    std::string run_id;
    std::string task_key;
    std::string task_type;
    CompletionStatus status;
    std::string artifact_hash;               ///< Set when status is DONE
    int64_t cost_charged;
    int attempt;
    std::string reason;                      ///< Set for non-DONE statuses

    CompletionEvent() : status(CompletionStatus::DONE), cost_charged(0), attempt(0) {}
};

/**
 * @brief Derive the task key
 *
 * SHA-256 over a length-prefixed encoding of the task type, the number of
 * inputs, each input hash and the params. Input hashes are normalized first,
 * so "sha256:ABC..." and "abc..." yield the same key.
 *
 * @throws IntegrityError if an input hash is malformed
 */
std::string compute_task_key(
    const std::string& task_type,
    const std::vector<std::string>& input_hashes,
    const Bytes& params
);

/**
 * @brief Recompute the key of an envelope and compare
 * @throws IntegrityError on mismatch
 */
void verify_task_key(const TaskEnvelope& envelope);

/**
 * @brief Stream entry fields for an envelope (lease_token excluded)
 */
WireFields encode_envelope(const TaskEnvelope& envelope);

/**
 * @brief Rebuild an envelope from stream entry fields
 * @throws IntegrityError on missing or malformed fields
 */
TaskEnvelope decode_envelope(const WireFields& fields);

WireFields encode_event(const CompletionEvent& event);

/**
 * @throws IntegrityError on missing or malformed fields
 */
CompletionEvent decode_event(const WireFields& fields);

/**
 * @brief Build the completion event for an acknowledged envelope
 */
CompletionEvent make_done_event(const TaskEnvelope& envelope, const TaskOutcome& outcome);

/**
 * @brief Build a terminal non-DONE event
 */
CompletionEvent make_terminal_event(
    const TaskEnvelope& envelope,
    CompletionStatus status,
    const std::string& reason
);

} // namespace thincore

#endif // THINCORE_TASK_ENVELOPE_HPP
