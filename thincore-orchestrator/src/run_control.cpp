/**
 * @file run_control.cpp
 * @brief Run status helpers and file-backed run control
 */

#include "run_control.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace thincore {

namespace {

int64_t now_epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

class FileLock {
public:
    explicit FileLock(const fs::path& path)
        : fd_(::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644))
    {
        if (fd_ < 0) {
            throw TransientIOError("Cannot open lock file " + path.string() + ": " + std::strerror(errno));
        }
        if (::flock(fd_, LOCK_EX) != 0) {
            int err = errno;
            ::close(fd_);
            throw TransientIOError("Cannot lock " + path.string() + ": " + std::strerror(err));
        }
    }

    ~FileLock() {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

private:
    int fd_;
};

} // namespace

std::string run_status_to_string(RunStatus status) {
    switch (status) {
        case RunStatus::RUNNING: return "running";
        case RunStatus::COMPLETED: return "completed";
        case RunStatus::FAILED: return "failed";
        case RunStatus::HALTED: return "halted";
        case RunStatus::CANCELLED: return "cancelled";
        default: return "unknown";
    }
}

RunStatus string_to_run_status(const std::string& value) {
    if (value == "running") return RunStatus::RUNNING;
    if (value == "completed") return RunStatus::COMPLETED;
    if (value == "failed") return RunStatus::FAILED;
    if (value == "halted") return RunStatus::HALTED;
    if (value == "cancelled") return RunStatus::CANCELLED;
    throw IntegrityError("Unknown run status '" + value + "'");
}

std::optional<std::string> RunControl::spec_hash(const std::string& run_id) {
    auto record = get(run_id);
    if (!record) {
        return std::nullopt;
    }
    return record->spec_hash;
}

std::optional<RunStatus> RunControl::status(const std::string& run_id) {
    auto record = get(run_id);
    if (!record) {
        return std::nullopt;
    }
    return record->status;
}

FileRunControl::FileRunControl(const fs::path& state_dir)
    : state_dir_(state_dir)
{
    std::error_code ec;
    fs::create_directories(state_dir_, ec);
    if (ec) {
        throw TransientIOError("Cannot create state directory " + state_dir_.string() + ": " + ec.message());
    }
}

fs::path FileRunControl::record_path(const std::string& run_id) const {
    return state_dir_ / (run_id + ".run.json");
}

std::optional<RunRecord> FileRunControl::read_record(const std::string& run_id) const {
    fs::path path = record_path(run_id);
    std::ifstream file(path);
    if (!file.is_open()) {
        std::error_code ec;
        if (!fs::exists(path, ec) && !ec) {
            return std::nullopt;
        }
        throw TransientIOError("Cannot open run record " + path.string());
    }

    try {
        json j = json::parse(file);
        RunRecord record;
        record.run_id = j.at("run_id").get<std::string>();
        record.spec_hash = j.value("spec_hash", std::string());
        record.ceiling = j.at("ceiling").get<int64_t>();
        record.status = string_to_run_status(j.at("status").get<std::string>());
        record.cancelled = j.value("cancelled", false);
        record.halted = j.value("halted", false);
        record.updated_at_ms = j.value("updated_at", static_cast<int64_t>(0));
        return record;
    } catch (const json::exception& e) {
        throw IntegrityError("Corrupt run record " + path.string() + ": " + e.what());
    }
}

void FileRunControl::write_record(const RunRecord& record) const {
    json j;
    j["run_id"] = record.run_id;
    j["spec_hash"] = record.spec_hash;
    j["ceiling"] = record.ceiling;
    j["status"] = run_status_to_string(record.status);
    j["cancelled"] = record.cancelled;
    j["halted"] = record.halted;
    j["updated_at"] = record.updated_at_ms;

    fs::path target = record_path(record.run_id);
    fs::path temp = target;
    temp += ".tmp." + std::to_string(::getpid());

    {
        std::ofstream file(temp, std::ios::trunc);
        if (!file.is_open()) {
            throw TransientIOError("Cannot write " + temp.string());
        }
        file << j.dump(2) << "\n";
        if (!file.good()) {
            throw TransientIOError("Short write to " + temp.string());
        }
    }

    std::error_code ec;
    fs::rename(temp, target, ec);
    if (ec) {
        throw TransientIOError("Cannot publish run record " + target.string() + ": " + ec.message());
    }
}

template <typename Fn>
void FileRunControl::update(const std::string& run_id, Fn&& mutate) {
    std::lock_guard<std::mutex> guard(mutex_);
    fs::path lock_path = record_path(run_id);
    lock_path += ".lock";
    FileLock lock(lock_path);

    RunRecord record;
    auto existing = read_record(run_id);
    if (existing) {
        record = *existing;
    } else {
        record.run_id = run_id;
    }

    mutate(record);
    record.updated_at_ms = now_epoch_ms();
    write_record(record);
}

void FileRunControl::register_run(const std::string& run_id, const std::string& spec_hash, int64_t ceiling) {
    update(run_id, [&](RunRecord& record) {
        record.spec_hash = spec_hash;
        record.ceiling = ceiling;
        record.status = RunStatus::RUNNING;
        record.cancelled = false;
        record.halted = false;
    });
}

std::optional<RunRecord> FileRunControl::get(const std::string& run_id) {
    std::lock_guard<std::mutex> guard(mutex_);
    return read_record(run_id);
}

void FileRunControl::cancel(const std::string& run_id) {
    update(run_id, [](RunRecord& record) { record.cancelled = true; });
}

bool FileRunControl::is_cancelled(const std::string& run_id) {
    auto record = get(run_id);
    return record && record->cancelled;
}

void FileRunControl::mark_halted(const std::string& run_id) {
    update(run_id, [](RunRecord& record) { record.halted = true; });
}

void FileRunControl::clear_halted(const std::string& run_id) {
    update(run_id, [](RunRecord& record) { record.halted = false; });
}

bool FileRunControl::is_halted(const std::string& run_id) {
    auto record = get(run_id);
    return record && record->halted;
}

void FileRunControl::set_status(const std::string& run_id, RunStatus status) {
    update(run_id, [status](RunRecord& record) { record.status = status; });
}

} // namespace thincore
