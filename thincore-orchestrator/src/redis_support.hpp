/**
 * @file redis_support.hpp
 * @brief Connection, key layout and error translation shared by the Redis backends
 *
 * Internal header: includes redis-plus-plus and is only used by .cpp files so
 * the client library stays out of the public interface.
 */

#ifndef THINCORE_REDIS_SUPPORT_HPP
#define THINCORE_REDIS_SUPPORT_HPP

#include "errors.hpp"
#include <sw/redis++/redis++.h>
#include <memory>
#include <string>
#include <utility>

namespace thincore {

/**
 * @brief Key names under a common prefix
 */
struct RedisKeys {
    std::string prefix;

    explicit RedisKeys(const std::string& key_prefix) : prefix(key_prefix) {}

    std::string tasks(const std::string& task_type) const { return prefix + ":tasks:" + task_type; }
    std::string dlq(const std::string& task_type) const { return prefix + ":dlq:" + task_type; }
    std::string events(const std::string& run_id) const { return prefix + ":events:" + run_id; }
    std::string manifest(const std::string& run_id) const { return prefix + ":manifest:" + run_id; }
    std::string manifest_index(const std::string& run_id) const { return prefix + ":manifest-index:" + run_id; }
    std::string run(const std::string& run_id) const { return prefix + ":run:" + run_id; }
    std::string ledger(const std::string& run_id) const { return prefix + ":ledger:" + run_id; }
    std::string ledger_global() const { return prefix + ":ledger:_global"; }
};

/**
 * @brief Open a pooled connection from a redis:// URL
 * @throws TransientIOError if the server cannot be reached
 */
std::shared_ptr<sw::redis::Redis> connect_redis(const std::string& url, size_t pool_size = 8);

/**
 * @brief Run a Redis operation, translating client exceptions
 *
 * Connection, timeout and closed-connection failures become TransientIOError;
 * protocol or script errors become ThinCoreError.
 */
template <typename Fn>
auto redis_call(const std::string& what, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const sw::redis::ReplyError& e) {
        throw ThinCoreError("Redis rejected " + what + ": " + e.what());
    } catch (const sw::redis::Error& e) {
        throw TransientIOError("Redis " + what + " failed: " + std::string(e.what()));
    }
}

} // namespace thincore

#endif // THINCORE_REDIS_SUPPORT_HPP
