#pragma once

#include "run_state.h"
#include <filesystem>
#include <optional>
#include <string>
#include <sys/types.h>

namespace nanoflow::core {

class CheckpointStore;

// Exclusive writer lock on a run id, released on destruction.
// Holds flock() on the lock file; the file also records the owner pid.
class WriterLock {
public:
    WriterLock() = default;
    ~WriterLock();

    WriterLock(WriterLock&& other) noexcept;
    WriterLock& operator=(WriterLock&& other) noexcept;
    WriterLock(const WriterLock&) = delete;
    WriterLock& operator=(const WriterLock&) = delete;

    bool held() const { return fd_ >= 0; }
    const std::filesystem::path& path() const { return path_; }

    // Removes the lock file only while it is still the file this lock holds
    void release();

private:
    friend class CheckpointStore;
    WriterLock(std::filesystem::path path, int fd) : path_(std::move(path)), fd_(fd) {}

    std::filesystem::path path_;
    int fd_ = -1;
};

// Durable RunState persistence: one JSON document per run id, replaced
// atomically (write temp, fsync, rename, fsync directory).
class CheckpointStore {
public:
    explicit CheckpointStore(std::filesystem::path dir);

    // nullopt if no checkpoint exists. Throws PersistenceError if it cannot be parsed.
    std::optional<RunState> load(const std::string& run_id) const;

    // Throws ConcurrentWriterError if another live process holds the run's lock,
    // PersistenceError if the state cannot be durably written.
    void save(const RunState& state) const;

    // Take the writer lock. Stale locks left by dead processes are taken over.
    // Throws ConcurrentWriterError if a live process owns it.
    WriterLock acquire(const std::string& run_id) const;

    // Pid recorded in the run's lock file, if any
    std::optional<pid_t> lock_owner(const std::string& run_id) const;

    bool exists(const std::string& run_id) const;

    std::filesystem::path state_path(const std::string& run_id) const;
    std::filesystem::path lock_path(const std::string& run_id) const;
    const std::filesystem::path& dir() const { return dir_; }

    // Run ids become file names: letters, digits, '.', '_' and '-'
    static bool is_valid_run_id(const std::string& run_id);

private:
    std::filesystem::path dir_;

    void check_run_id(const std::string& run_id) const;
    void ensure_dir() const;
};

} // namespace nanoflow::core
