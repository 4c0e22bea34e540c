#include "checkpoint_store.h"
#include "errors.h"
#include "utils/file_utils.h"
#include <spdlog/spdlog.h>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <signal.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace nanoflow::core {

namespace {

bool process_alive(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    return ::kill(pid, 0) == 0 || errno == EPERM;
}

std::string errno_text() {
    return std::strerror(errno);
}

void write_fully(int fd, const std::string& data, const std::filesystem::path& path) {
    const char* p = data.data();
    size_t left = data.size();
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw PersistenceError("Failed to write " + path.string() + ": " + errno_text());
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
}

void sync_directory(const std::filesystem::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        throw PersistenceError("Failed to open " + dir.string() + ": " + errno_text());
    }
    int rc = ::fsync(fd);
    int err = errno;
    ::close(fd);
    if (rc != 0) {
        throw PersistenceError("Failed to sync " + dir.string() + ": " + std::strerror(err));
    }
}

// True while path still names the file open on fd
bool same_file(int fd, const std::filesystem::path& path) {
    struct stat by_fd {};
    struct stat by_path {};
    if (::fstat(fd, &by_fd) != 0 || ::stat(path.c_str(), &by_path) != 0) {
        return false;
    }
    return by_fd.st_dev == by_path.st_dev && by_fd.st_ino == by_path.st_ino;
}

} // anonymous namespace

// WriterLock

WriterLock::~WriterLock() {
    release();
}

WriterLock::WriterLock(WriterLock&& other) noexcept
    : path_(std::move(other.path_))
    , fd_(other.fd_) {
    other.path_.clear();
    other.fd_ = -1;
}

WriterLock& WriterLock::operator=(WriterLock&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        fd_ = other.fd_;
        other.path_.clear();
        other.fd_ = -1;
    }
    return *this;
}

void WriterLock::release() {
    if (fd_ < 0) {
        return;
    }
    // Unlink before unlocking so a waiting writer never locks a file that is about to vanish
    if (same_file(fd_, path_)) {
        if (::unlink(path_.c_str()) != 0) {
            spdlog::warn("Failed to remove lock {}: {}", path_.string(), errno_text());
        }
    } else {
        spdlog::warn("Lock {} was replaced by another writer, leaving it in place", path_.string());
    }
    ::close(fd_);
    fd_ = -1;
    path_.clear();
}

// CheckpointStore

CheckpointStore::CheckpointStore(std::filesystem::path dir)
    : dir_(std::move(dir)) {
}

bool CheckpointStore::is_valid_run_id(const std::string& run_id) {
    if (run_id.empty() || run_id == "." || run_id == "..") {
        return false;
    }
    for (char c : run_id) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '.' && c != '_' && c != '-') {
            return false;
        }
    }
    return true;
}

void CheckpointStore::check_run_id(const std::string& run_id) const {
    if (!is_valid_run_id(run_id)) {
        throw ConfigurationError("Invalid run id '" + run_id +
                                 "': use letters, digits, '.', '_' and '-'");
    }
}

void CheckpointStore::ensure_dir() const {
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec || !utils::is_directory(dir_)) {
        throw PersistenceError("Cannot create checkpoint directory " + dir_.string() +
                               (ec ? ": " + ec.message() : ""));
    }
}

std::filesystem::path CheckpointStore::state_path(const std::string& run_id) const {
    return dir_ / (run_id + ".json");
}

std::filesystem::path CheckpointStore::lock_path(const std::string& run_id) const {
    return dir_ / (run_id + ".lock");
}

bool CheckpointStore::exists(const std::string& run_id) const {
    std::error_code ec;
    return is_valid_run_id(run_id) && std::filesystem::exists(state_path(run_id), ec);
}

std::optional<pid_t> CheckpointStore::lock_owner(const std::string& run_id) const {
    auto content = utils::read_file(lock_path(run_id));
    if (!content) {
        return std::nullopt;
    }
    const char* begin = content->c_str();
    char* end = nullptr;
    long pid = std::strtol(begin, &end, 10);
    if (end == begin || pid <= 0) {
        return std::nullopt;
    }
    return static_cast<pid_t>(pid);
}

std::optional<RunState> CheckpointStore::load(const std::string& run_id) const {
    check_run_id(run_id);
    auto path = state_path(run_id);

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::nullopt;
    }

    auto content = utils::read_file(path);
    if (!content) {
        throw PersistenceError("Cannot read checkpoint " + path.string());
    }

    auto j = nlohmann::json::parse(*content, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw PersistenceError("Corrupt checkpoint " + path.string());
    }

    try {
        auto state = RunState::from_json(j);
        if (state.run_id != run_id) {
            throw PersistenceError("Checkpoint " + path.string() + " belongs to run '" + state.run_id + "'");
        }
        return state;
    } catch (const nlohmann::json::exception& e) {
        throw PersistenceError("Invalid checkpoint " + path.string() + ": " + e.what());
    }
}

void CheckpointStore::save(const RunState& state) const {
    check_run_id(state.run_id);
    ensure_dir();

    auto owner = lock_owner(state.run_id);
    if (owner && *owner != ::getpid() && process_alive(*owner)) {
        throw ConcurrentWriterError("Run '" + state.run_id + "' is being written by process " +
                                    std::to_string(*owner));
    }

    auto path = state_path(state.run_id);
    auto tmp = path;
    tmp += ".tmp";

    std::string data = state.to_json().dump(2);
    data += '\n';

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw PersistenceError("Failed to open " + tmp.string() + ": " + errno_text());
    }

    try {
        write_fully(fd, data, tmp);
        if (::fsync(fd) != 0) {
            throw PersistenceError("Failed to sync " + tmp.string() + ": " + errno_text());
        }
    } catch (const PersistenceError&) {
        ::close(fd);
        ::unlink(tmp.c_str());
        throw;
    }

    if (::close(fd) != 0) {
        ::unlink(tmp.c_str());
        throw PersistenceError("Failed to close " + tmp.string() + ": " + errno_text());
    }

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        auto err = errno_text();
        ::unlink(tmp.c_str());
        throw PersistenceError("Failed to replace " + path.string() + ": " + err);
    }

    sync_directory(dir_);
}

WriterLock CheckpointStore::acquire(const std::string& run_id) const {
    check_run_id(run_id);
    ensure_dir();
    auto path = lock_path(run_id);

    // Retry only when the file was unlinked between open and flock
    for (int pass = 0; pass < 3; ++pass) {
        int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (fd < 0) {
            throw PersistenceError("Failed to create lock " + path.string() + ": " + errno_text());
        }

        if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
            int err = errno;
            ::close(fd);
            if (err == EWOULDBLOCK) {
                auto owner = lock_owner(run_id);
                throw ConcurrentWriterError("Run '" + run_id + "' is locked by process " +
                                            (owner ? std::to_string(*owner) : std::string("unknown")));
            }
            throw PersistenceError("Failed to lock " + path.string() + ": " + std::strerror(err));
        }

        if (!same_file(fd, path)) {
            ::close(fd);
            continue;
        }

        // A live pid without a held flock comes from a writer on a filesystem without flock support
        auto owner = lock_owner(run_id);
        if (owner && *owner != ::getpid() && process_alive(*owner)) {
            ::close(fd);
            throw ConcurrentWriterError("Run '" + run_id + "' is locked by process " +
                                        std::to_string(*owner));
        }
        if (owner && *owner != ::getpid()) {
            spdlog::warn("Taking over stale lock {} of process {}", path.string(), *owner);
        }

        WriterLock lock(path, fd);
        std::string pid = std::to_string(::getpid()) + "\n";
        if (::ftruncate(fd, 0) != 0) {
            throw PersistenceError("Failed to truncate lock " + path.string() + ": " + errno_text());
        }
        write_fully(fd, pid, path);
        if (::fsync(fd) != 0) {
            throw PersistenceError("Failed to write lock " + path.string() + ": " + errno_text());
        }
        spdlog::debug("Acquired writer lock {}", path.string());
        return lock;
    }

    throw ConcurrentWriterError("Run '" + run_id + "' lock is contended");
}

} // namespace nanoflow::core
