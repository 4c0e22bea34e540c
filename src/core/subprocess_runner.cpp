#include "subprocess_runner.h"
#include "utils/tail_buffer.h"
#include <spdlog/spdlog.h>
#include <array>
#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace nanoflow::core {

namespace {

using Clock = std::chrono::steady_clock;

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Async-signal-safe write used between fork and exec
void write_all(int fd, const char* s) {
    size_t len = std::strlen(s);
    while (len > 0) {
        ssize_t n = ::write(fd, s, len);
        if (n <= 0) {
            return;
        }
        s += n;
        len -= static_cast<size_t>(n);
    }
}

// errno as text without touching the allocator (child side of fork)
void write_errno(int fd, int err) {
    switch (err) {
        case ENOENT: write_all(fd, "No such file or directory"); return;
        case EACCES: write_all(fd, "Permission denied"); return;
        case ENOEXEC: write_all(fd, "Exec format error"); return;
        case ENOTDIR: write_all(fd, "Not a directory"); return;
        case E2BIG: write_all(fd, "Argument list too long"); return;
        case ELOOP: write_all(fd, "Too many levels of symbolic links"); return;
        case ENOMEM: write_all(fd, "Cannot allocate memory"); return;
        default: break;
    }
    char digits[16];
    int pos = static_cast<int>(sizeof(digits)) - 1;
    digits[pos] = '\0';
    unsigned int value = err < 0 ? 0u : static_cast<unsigned int>(err);
    do {
        digits[--pos] = static_cast<char>('0' + value % 10);
        value /= 10;
    } while (value > 0 && pos > 0);
    write_all(fd, "errno ");
    write_all(fd, digits + pos);
}

void set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

// Read everything currently available. Returns false once the pipe hit EOF.
bool drain(int fd, utils::TailBuffer& buffer) {
    char chunk[4096];
    while (true) {
        ssize_t n = ::read(fd, chunk, sizeof(chunk));
        if (n > 0) {
            buffer.append(chunk, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

std::string errno_message(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

} // anonymous namespace

SubprocessRunner::SubprocessRunner(SubprocessOptions options)
    : options_(options) {
}

ProcessOutcome SubprocessRunner::run(const ExecutionPlan& plan,
                                     const std::vector<std::string>& args,
                                     std::chrono::milliseconds timeout,
                                     const CancellationToken& cancel) {
    ProcessOutcome outcome;
    const auto start = Clock::now();
    auto finish = [&]() {
        outcome.duration = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
        return outcome;
    };

    // Everything the child touches is prepared before fork
    const std::string exe = plan.executable_path.string();
    const std::string cwd = plan.cwd.string();

    std::vector<std::string> argv_storage;
    argv_storage.push_back(exe);
    argv_storage.insert(argv_storage.end(), args.begin(), args.end());
    std::vector<char*> argv;
    for (auto& arg : argv_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_storage;
    for (const auto& [key, value] : plan.env) {
        env_storage.push_back(key + "=" + value);
    }
    std::vector<char*> envp;
    for (auto& entry : env_storage) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int stdout_file = -1;

    if (plan.stdout_path) {
        stdout_file = ::open(plan.stdout_path->c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (stdout_file < 0) {
            outcome.spawn_error = errno_message("Cannot open " + plan.stdout_path->string());
            return finish();
        }
    } else if (::pipe(stdout_pipe) != 0) {
        outcome.spawn_error = errno_message("Failed to create pipes");
        return finish();
    }

    if (::pipe(stderr_pipe) != 0) {
        outcome.spawn_error = errno_message("Failed to create pipes");
        close_fd(stdout_pipe[0]);
        close_fd(stdout_pipe[1]);
        close_fd(stdout_file);
        return finish();
    }

    pid_t pid = ::fork();

    if (pid < 0) {
        outcome.spawn_error = errno_message("Failed to fork process");
        close_fd(stdout_pipe[0]);
        close_fd(stdout_pipe[1]);
        close_fd(stderr_pipe[0]);
        close_fd(stderr_pipe[1]);
        close_fd(stdout_file);
        return finish();
    }

    if (pid == 0) {
        // Child process: own process group so the whole tree can be signalled
        ::setpgid(0, 0);

        int out_fd = plan.stdout_path ? stdout_file : stdout_pipe[1];
        ::dup2(out_fd, STDOUT_FILENO);
        ::dup2(stderr_pipe[1], STDERR_FILENO);

        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }

        for (int fd : {stdout_pipe[0], stdout_pipe[1], stderr_pipe[0], stderr_pipe[1], stdout_file}) {
            if (fd > STDERR_FILENO) {
                ::close(fd);
            }
        }

        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
            write_all(STDERR_FILENO, "nanoflow: cannot change directory to ");
            write_all(STDERR_FILENO, cwd.c_str());
            write_all(STDERR_FILENO, "\n");
            _exit(126);
        }

        ::execve(exe.c_str(), argv.data(), envp.data());

        // If execve returns, it failed
        int err = errno;
        write_all(STDERR_FILENO, "nanoflow: failed to execute ");
        write_all(STDERR_FILENO, exe.c_str());
        write_all(STDERR_FILENO, ": ");
        write_errno(STDERR_FILENO, err);
        write_all(STDERR_FILENO, "\n");
        _exit(127);
    }

    // Parent process. Also set the group here to close the race with killpg.
    ::setpgid(pid, pid);
    spdlog::debug("Spawned pid {}: {}", pid, exe);

    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(stdout_file);

    int stdout_fd = stdout_pipe[0];
    int stderr_fd = stderr_pipe[0];
    if (stdout_fd >= 0) set_nonblocking(stdout_fd);
    set_nonblocking(stderr_fd);

    utils::TailBuffer stdout_buf(options_.tail_bytes);
    utils::TailBuffer stderr_buf(options_.tail_bytes);

    const auto deadline = start + timeout;
    bool exited = false;
    bool reaped = false;
    int status = 0;
    bool terminating = false;
    bool killed = false;
    Clock::time_point kill_at;
    Clock::time_point exited_at;

    while (true) {
        auto now = Clock::now();

        if (!exited && !terminating) {
            if (cancel.requested()) {
                outcome.canceled = true;
                terminating = true;
            } else if (now >= deadline) {
                outcome.timed_out = true;
                terminating = true;
            }
            if (terminating) {
                spdlog::debug("Terminating process group {} ({})", pid,
                              outcome.canceled ? "canceled" : "timed out");
                ::killpg(pid, SIGTERM);
                kill_at = now + options_.kill_grace;
            }
        }

        // The leader may be gone while other members of its group still run
        if (terminating && !killed && now >= kill_at) {
            spdlog::debug("Process group {} still running after SIGTERM, sending SIGKILL", pid);
            ::killpg(pid, SIGKILL);
            killed = true;
        }

        if (!exited) {
            pid_t r = ::waitpid(pid, &status, WNOHANG);
            if (r == pid) {
                exited = true;
                reaped = true;
                exited_at = now;
            } else if (r < 0 && errno != EINTR) {
                exited = true;
                exited_at = now;
            }
        }

        // Grandchildren may keep the pipes open after the child exits
        bool pipes_open = stdout_fd >= 0 || stderr_fd >= 0;
        if (exited && (!pipes_open || now - exited_at >= options_.kill_grace)) {
            if (terminating && !killed) {
                ::killpg(pid, SIGKILL);
                killed = true;
            }
            break;
        }

        std::array<pollfd, 2> fds{};
        nfds_t nfds = 0;
        if (stdout_fd >= 0) {
            fds[nfds].fd = stdout_fd;
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_fd >= 0) {
            fds[nfds].fd = stderr_fd;
            fds[nfds].events = POLLIN;
            ++nfds;
        }

        auto wait_ms = static_cast<int>(options_.poll_interval.count());
        int rc = ::poll(nfds > 0 ? fds.data() : nullptr, nfds, wait_ms);
        if (rc < 0 && errno != EINTR) {
            std::this_thread::sleep_for(options_.poll_interval);
        }

        if (stdout_fd >= 0 && !drain(stdout_fd, stdout_buf)) {
            close_fd(stdout_fd);
        }
        if (stderr_fd >= 0 && !drain(stderr_fd, stderr_buf)) {
            close_fd(stderr_fd);
        }
    }

    close_fd(stdout_fd);
    close_fd(stderr_fd);

    if (reaped) {
        outcome.exit_code = decode_status(status);
    }
    outcome.stdout_tail = stdout_buf.str();
    outcome.stderr_tail = stderr_buf.str();

    finish();
    spdlog::debug("pid {} finished: exit={} timed_out={} canceled={} ({} ms)", pid,
                  outcome.exit_code, outcome.timed_out, outcome.canceled, outcome.duration.count());
    return outcome;
}

} // namespace nanoflow::core
