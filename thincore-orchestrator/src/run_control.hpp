/**
 * @file run_control.hpp
 * @brief Run-level flags and status visible to the planner and every worker
 */

#ifndef THINCORE_RUN_CONTROL_HPP
#define THINCORE_RUN_CONTROL_HPP

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace thincore {

/**
 * @brief Lifecycle status of a run
 */
enum class RunStatus {
    RUNNING,
    COMPLETED,
    FAILED,       ///< At least one node failed
    HALTED,       ///< Cost ceiling reached; resumable with a higher ceiling
    CANCELLED
};

std::string run_status_to_string(RunStatus status);

/**
 * @throws IntegrityError on an unknown value
 */
RunStatus string_to_run_status(const std::string& value);

/**
 * @brief Stored control record of a run
 */
struct RunRecord {
    std::string run_id;
    std::string spec_hash;           ///< Artifact holding the run spec
    int64_t ceiling;                 ///< Cost units, UNLIMITED_CEILING for no limit
    RunStatus status;
    bool cancelled;
    bool halted;
    int64_t updated_at_ms;

    RunRecord() : ceiling(0), status(RunStatus::RUNNING), cancelled(false), halted(false), updated_at_ms(0) {}
};

/**
 * @brief Run control interface
 *
 * Backend failures surface as TransientIOError.
 */
class RunControl {
public:
    virtual ~RunControl() = default;

    /**
     * @brief Create or refresh a run record for a new planner session
     *
     * Clears cancelled and halted, sets status RUNNING.
     */
    virtual void register_run(const std::string& run_id, const std::string& spec_hash, int64_t ceiling) = 0;

    virtual std::optional<RunRecord> get(const std::string& run_id) = 0;

    virtual void cancel(const std::string& run_id) = 0;
    virtual bool is_cancelled(const std::string& run_id) = 0;

    virtual void mark_halted(const std::string& run_id) = 0;
    virtual void clear_halted(const std::string& run_id) = 0;
    virtual bool is_halted(const std::string& run_id) = 0;

    virtual void set_status(const std::string& run_id, RunStatus status) = 0;

    /**
     * @brief Spec artifact recorded for a run, if the run is known
     */
    std::optional<std::string> spec_hash(const std::string& run_id);

    /**
     * @brief Recorded status, if the run is known
     */
    std::optional<RunStatus> status(const std::string& run_id);
};

/**
 * @brief Run records as JSON files: <state_dir>/<run_id>.run.json
 *
 * Updates are read-modify-write under an exclusive flock on a sidecar lock
 * file and published with an atomic rename.
 */
class FileRunControl : public RunControl {
public:
    explicit FileRunControl(const std::filesystem::path& state_dir);

    void register_run(const std::string& run_id, const std::string& spec_hash, int64_t ceiling) override;
    std::optional<RunRecord> get(const std::string& run_id) override;
    void cancel(const std::string& run_id) override;
    bool is_cancelled(const std::string& run_id) override;
    void mark_halted(const std::string& run_id) override;
    void clear_halted(const std::string& run_id) override;
    bool is_halted(const std::string& run_id) override;
    void set_status(const std::string& run_id, RunStatus status) override;

private:
    std::filesystem::path state_dir_;
    std::mutex mutex_;

    std::filesystem::path record_path(const std::string& run_id) const;
    std::optional<RunRecord> read_record(const std::string& run_id) const;
    void write_record(const RunRecord& record) const;

    template <typename Fn>
    void update(const std::string& run_id, Fn&& mutate);
};

} // namespace thincore

#endif // THINCORE_RUN_CONTROL_HPP
