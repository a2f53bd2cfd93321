/**
 * @file redis_run_control.hpp
 * @brief Run control shared through a Redis hash: <prefix>:run:<run_id>
 */

#ifndef THINCORE_REDIS_RUN_CONTROL_HPP
#define THINCORE_REDIS_RUN_CONTROL_HPP

#include "run_control.hpp"
#include <memory>

namespace sw { namespace redis { class Redis; } }

namespace thincore {

class RedisRunControl : public RunControl {
public:
    RedisRunControl(std::shared_ptr<sw::redis::Redis> redis, const std::string& key_prefix = "thincore");

    void register_run(const std::string& run_id, const std::string& spec_hash, int64_t ceiling) override;
    std::optional<RunRecord> get(const std::string& run_id) override;
    void cancel(const std::string& run_id) override;
    bool is_cancelled(const std::string& run_id) override;
    void mark_halted(const std::string& run_id) override;
    void clear_halted(const std::string& run_id) override;
    bool is_halted(const std::string& run_id) override;
    void set_status(const std::string& run_id, RunStatus status) override;

private:
    std::shared_ptr<sw::redis::Redis> redis_;
    std::string key_prefix_;

    void set_field(const std::string& run_id, const std::string& field, const std::string& value);
    bool flag(const std::string& run_id, const std::string& field);
};

} // namespace thincore

#endif // THINCORE_REDIS_RUN_CONTROL_HPP
