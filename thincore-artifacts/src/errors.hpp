#pragma once

#include <stdexcept>
#include <string>

namespace thincore {

/**
 * Base class for all thincore errors
 */
class ThinCoreError : public std::runtime_error {
public:
    explicit ThinCoreError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Store or queue temporarily unavailable.
 *
 * Retried with backoff by the client that hit it; never reported as a task failure.
 */
class TransientIOError : public ThinCoreError {
public:
    explicit TransientIOError(const std::string& message)
        : ThinCoreError("Transient I/O error: " + message) {}
};

/**
 * Requested artifact does not exist in the store
 */
class NotFoundError : public ThinCoreError {
public:
    explicit NotFoundError(const std::string& hash)
        : ThinCoreError("Artifact not found: " + hash), hash_(hash) {}

    const std::string& hash() const { return hash_; }

private:
    std::string hash_;
};

/**
 * Hash mismatch or corrupted manifest entry. Fatal, never retried.
 */
class IntegrityError : public ThinCoreError {
public:
    explicit IntegrityError(const std::string& message)
        : ThinCoreError("Integrity error: " + message) {}
};

/**
 * Worker-side failure while performing a task
 */
class TaskExecutionError : public ThinCoreError {
public:
    explicit TaskExecutionError(const std::string& message)
        : ThinCoreError("Task execution failed: " + message) {}
};

/**
 * Run spending ceiling reached. A deliberate halt rather than a failure.
 */
class CostCeilingExceeded : public ThinCoreError {
public:
    explicit CostCeilingExceeded(const std::string& run_id)
        : ThinCoreError("Cost ceiling reached for run " + run_id), run_id_(run_id) {}

    const std::string& run_id() const { return run_id_; }

private:
    std::string run_id_;
};

/**
 * Invalid configuration value or run specification
 */
class ConfigurationError : public ThinCoreError {
public:
    explicit ConfigurationError(const std::string& message)
        : ThinCoreError("Configuration error: " + message) {}
};

} // namespace thincore
