/**
 * @file redis_support.cpp
 * @brief Redis connection setup
 */

#include "redis_support.hpp"
#include "logger.hpp"

namespace thincore {

std::shared_ptr<sw::redis::Redis> connect_redis(const std::string& url, size_t pool_size) {
    try {
        sw::redis::ConnectionOptions connection(url);
        connection.connect_timeout = std::chrono::milliseconds(2000);

        sw::redis::ConnectionPoolOptions pool;
        pool.size = pool_size;
        pool.wait_timeout = std::chrono::milliseconds(5000);

        auto redis = std::make_shared<sw::redis::Redis>(connection, pool);
        redis->ping();
        return redis;
    } catch (const sw::redis::Error& e) {
        throw TransientIOError("Cannot connect to " + Logger::mask_url(url) + ": " + e.what());
    }
}

} // namespace thincore
