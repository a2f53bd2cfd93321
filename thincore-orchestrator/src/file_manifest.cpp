/**
 * @file file_manifest.cpp
 * @brief JSON-lines manifest implementation
 */

#include "file_manifest.hpp"
#include "errors.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace thincore {

namespace {

// Closes the descriptor and drops the lock on every exit path
class LockedAppendFile {
public:
    explicit LockedAppendFile(const fs::path& path)
        : fd_(::open(path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644))
    {
        if (fd_ < 0) {
            throw TransientIOError("Cannot open manifest " + path.string() + ": " + std::strerror(errno));
        }
        if (::flock(fd_, LOCK_EX) != 0) {
            int err = errno;
            ::close(fd_);
            throw TransientIOError("Cannot lock manifest " + path.string() + ": " + std::strerror(err));
        }
    }

    ~LockedAppendFile() {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }

    LockedAppendFile(const LockedAppendFile&) = delete;
    LockedAppendFile& operator=(const LockedAppendFile&) = delete;

    void write_line(const std::string& line) {
        std::string data = line + "\n";
        ssize_t written = ::write(fd_, data.data(), data.size());
        if (written != static_cast<ssize_t>(data.size())) {
            throw TransientIOError("Short write to manifest: " + std::string(std::strerror(errno)));
        }
        if (::fsync(fd_) != 0) {
            throw TransientIOError("fsync of manifest failed: " + std::string(std::strerror(errno)));
        }
    }

private:
    int fd_;
};

} // namespace

FileManifestLog::FileManifestLog(const fs::path& state_dir)
    : state_dir_(state_dir)
{
    std::error_code ec;
    fs::create_directories(state_dir_, ec);
    if (ec) {
        throw TransientIOError("Cannot create state directory " + state_dir_.string() + ": " + ec.message());
    }
}

fs::path FileManifestLog::path_for(const std::string& run_id) const {
    return state_dir_ / (run_id + ".manifest.jsonl");
}

void FileManifestLog::append(const std::string& run_id, const ManifestEntry& entry) {
    std::string line = encode_manifest_entry(entry);
    std::lock_guard<std::mutex> lock(mutex_);
    LockedAppendFile file(path_for(run_id));
    file.write_line(line);
}

std::vector<ManifestEntry> FileManifestLog::replay(const std::string& run_id) {
    fs::path path = path_for(run_id);
    std::vector<ManifestEntry> entries;

    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) {
            throw TransientIOError("Cannot stat manifest " + path.string() + ": " + ec.message());
        }
        return entries;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw TransientIOError("Cannot open manifest " + path.string());
    }

    std::string line;
    size_t line_number = 0;
    while (std::getline(file, line)) {
        line_number++;
        if (line.empty()) {
            continue;
        }
        try {
            entries.push_back(decode_manifest_entry(line));
        } catch (const IntegrityError& e) {
            throw IntegrityError(path.string() + ":" + std::to_string(line_number) + ": " + e.what());
        }
    }
    if (file.bad()) {
        throw TransientIOError("Read error on manifest " + path.string());
    }
    return entries;
}

std::optional<ManifestEntry> FileManifestLog::find_done(const std::string& run_id, const std::string& task_key) {
    for (const auto& entry : replay(run_id)) {
        if (entry.task_key == task_key && !entry.is_failed()) {
            return entry;
        }
    }
    return std::nullopt;
}

} // namespace thincore
