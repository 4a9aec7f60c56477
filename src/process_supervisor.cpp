#include "process_supervisor.h"
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>

namespace coderun {

const char* to_string(SupervisorState state) {
    switch (state) {
        case SupervisorState::IDLE: return "idle";
        case SupervisorState::DISPATCHED: return "dispatched";
        case SupervisorState::RUNNING: return "running";
        case SupervisorState::COMPLETED: return "completed";
        case SupervisorState::TIMED_OUT: return "timed_out";
        case SupervisorState::SPAWN_FAILED: return "spawn_failed";
    }
    return "unknown";
}

namespace {

using Clock = std::chrono::steady_clock;

constexpr const char* DEFAULT_SEARCH_PATH = "/usr/local/bin:/usr/bin:/bin";
constexpr int MAX_READS_PER_PUMP = 16;

// Owns one file descriptor
class ScopedFd {
public:
    explicit ScopedFd(int fd = -1) : fd_(fd) {}
    ~ScopedFd() { reset(); }

    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    ScopedFd(ScopedFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    ScopedFd& operator=(ScopedFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    int get() const { return fd_; }
    explicit operator bool() const { return fd_ >= 0; }

    void reset(int fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_;
};

bool make_pipe(ScopedFd& read_end, ScopedFd& write_end) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        return false;
    }
    read_end.reset(fds[0]);
    write_end.reset(fds[1]);
    return true;
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags >= 0) {
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

// Writing stdin to a child that already exited must not kill the service
void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, [] { signal(SIGPIPE, SIG_IGN); });
}

// Minimal environment: the parent's secrets are not handed to untrusted code
std::vector<std::string> build_environment(const ProcessSpec& spec) {
    std::map<std::string, std::string> env;
    const char* path = std::getenv("PATH");
    env["PATH"] = (path && *path) ? path : DEFAULT_SEARCH_PATH;
    env["LANG"] = "C.UTF-8";
    if (!spec.working_dir.empty()) {
        env["HOME"] = spec.working_dir;
        env["TMPDIR"] = spec.working_dir;
    }
    for (const auto& [key, value] : spec.environment) {
        env[key] = value;
    }

    std::vector<std::string> entries;
    entries.reserve(env.size());
    for (const auto& [key, value] : env) {
        entries.push_back(key + "=" + value);
    }
    return entries;
}

std::vector<char*> to_c_array(const std::vector<std::string>& strings) {
    std::vector<char*> result;
    result.reserve(strings.size() + 1);
    for (const auto& s : strings) {
        result.push_back(const_cast<char*>(s.c_str()));
    }
    result.push_back(nullptr);
    return result;
}

// Runs in the forked child: only async-signal-safe calls from here on
[[noreturn]] void exec_child(int stdin_fd, int stdout_fd, int stderr_fd, int error_fd,
                             const char* working_dir, const char* path,
                             char* const argv[], char* const envp[]) {
    setpgid(0, 0);
    signal(SIGPIPE, SIG_DFL);

    sigset_t empty_mask;
    sigemptyset(&empty_mask);
    sigprocmask(SIG_SETMASK, &empty_mask, nullptr);

    if (dup2(stdin_fd, STDIN_FILENO) != -1 &&
        dup2(stdout_fd, STDOUT_FILENO) != -1 &&
        dup2(stderr_fd, STDERR_FILENO) != -1 &&
        (working_dir == nullptr || chdir(working_dir) == 0)) {
        execve(path, argv, envp);
    }

    int err = errno;
    ssize_t ignored = write(error_fd, &err, sizeof(err));
    (void)ignored;
    _exit(EXEC_FAILURE_EXIT_CODE);
}

int slice_ms(Clock::time_point now, Clock::time_point limit) {
    if (now >= limit) {
        return 0;
    }
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(limit - now).count();
    return static_cast<int>(std::min<long long>(remaining + 1, POLL_INTERVAL_MS));
}

// Parent-side view of a running child: pipes, capture buffers and wait status
class ChildProcess {
public:
    ChildProcess(pid_t pid, ScopedFd stdout_fd, ScopedFd stderr_fd, ScopedFd stdin_fd,
                 const std::optional<std::string>& stdin_data, size_t max_capture_bytes)
        : pid_(pid),
          stdin_fd_(std::move(stdin_fd)),
          max_capture_bytes_(max_capture_bytes) {
        out_.fd = std::move(stdout_fd);
        err_.fd = std::move(stderr_fd);
        set_nonblocking(out_.fd.get());
        set_nonblocking(err_.fd.get());

        if (stdin_fd_) {
            stdin_data_ = stdin_data.value_or("");
            if (stdin_data_.empty()) {
                stdin_fd_.reset();
            } else {
                set_nonblocking(stdin_fd_.get());
            }
        }
    }

    ~ChildProcess() {
        if (!reaped_) {
            signal_group(SIGKILL);
            reap();
        }
    }

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    bool streams_open() const { return out_.fd || err_.fd; }

    // Waits up to timeout_ms for pipe activity, then moves data in both directions
    void pump(int timeout_ms) {
        std::vector<pollfd> fds;
        std::vector<Stream*> targets;
        if (out_.fd) {
            fds.push_back({out_.fd.get(), POLLIN, 0});
            targets.push_back(&out_);
        }
        if (err_.fd) {
            fds.push_back({err_.fd.get(), POLLIN, 0});
            targets.push_back(&err_);
        }
        int stdin_index = -1;
        if (stdin_fd_) {
            stdin_index = static_cast<int>(fds.size());
            fds.push_back({stdin_fd_.get(), POLLOUT, 0});
        }

        if (fds.empty()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms));
            return;
        }

        int ready = poll(fds.data(), fds.size(), timeout_ms);
        if (ready <= 0) {
            return;  // Timeout or EINTR; the caller re-checks its deadline
        }

        for (size_t i = 0; i < targets.size(); ++i) {
            if (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) {
                read_stream(*targets[i]);
            }
        }
        if (stdin_index >= 0 && fds[stdin_index].revents != 0) {
            write_stdin();
        }
    }

    // Non-reaping check so the process group id stays reserved until reap()
    bool leader_exited() {
        if (exited_) {
            return true;
        }
        siginfo_t info;
        std::memset(&info, 0, sizeof(info));
        if (waitid(P_PID, pid_, &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
            if (errno == EINTR) {
                return false;
            }
            exited_ = true;
            return true;
        }
        if (info.si_pid == 0) {
            return false;
        }
        exited_ = true;
        exit_code_ = (info.si_code == CLD_EXITED) ? info.si_status : -info.si_status;
        return true;
    }

    void signal_group(int sig) {
        if (!reaped_) {
            ::killpg(pid_, sig);
        }
    }

    void reap() {
        if (reaped_) {
            return;
        }
        int status = 0;
        pid_t result;
        do {
            result = waitpid(pid_, &status, 0);
        } while (result == -1 && errno == EINTR);

        if (result == pid_) {
            if (WIFEXITED(status)) {
                exit_code_ = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                exit_code_ = -WTERMSIG(status);
            }
        }
        exited_ = true;
        reaped_ = true;
    }

    int exit_code() const { return exit_code_; }

    std::string take_stdout() { return std::move(out_.data); }
    std::string take_stderr() { return std::move(err_.data); }
    bool stdout_overflow() const { return out_.overflow; }
    bool stderr_overflow() const { return err_.overflow; }

private:
    struct Stream {
        ScopedFd fd;
        std::string data;
        bool overflow = false;
    };

    void read_stream(Stream& stream) {
        char buffer[PIPE_BUFFER_SIZE];
        for (int i = 0; i < MAX_READS_PER_PUMP; ++i) {
            ssize_t bytes_read = read(stream.fd.get(), buffer, sizeof(buffer));
            if (bytes_read > 0) {
                size_t room = max_capture_bytes_ > stream.data.size()
                    ? max_capture_bytes_ - stream.data.size() : 0;
                size_t keep = std::min(room, static_cast<size_t>(bytes_read));
                stream.data.append(buffer, keep);
                if (keep < static_cast<size_t>(bytes_read)) {
                    stream.overflow = true;
                }
                continue;
            }
            if (bytes_read == 0) {
                stream.fd.reset();
                return;
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                stream.fd.reset();
            }
            return;
        }
    }

    void write_stdin() {
        while (stdin_offset_ < stdin_data_.size()) {
            ssize_t written = write(stdin_fd_.get(), stdin_data_.data() + stdin_offset_,
                                    stdin_data_.size() - stdin_offset_);
            if (written > 0) {
                stdin_offset_ += static_cast<size_t>(written);
                continue;
            }
            if (written < 0 && errno == EINTR) {
                continue;
            }
            if (written < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                return;
            }
            break;  // EPIPE: the child stopped reading
        }
        stdin_fd_.reset();  // EOF for the child
    }

    pid_t pid_;
    Stream out_;
    Stream err_;
    ScopedFd stdin_fd_;
    std::string stdin_data_;
    size_t stdin_offset_ = 0;
    size_t max_capture_bytes_;
    bool exited_ = false;
    bool reaped_ = false;
    int exit_code_ = -1;
};

} // namespace

ProcessSupervisor::ProcessSupervisor(const Config& config) : config_(config) {
    ignore_sigpipe_once();
}

std::optional<std::string> ProcessSupervisor::resolve_executable(const std::string& binary) {
    if (binary.empty()) {
        return std::nullopt;
    }
    if (binary.find('/') != std::string::npos) {
        if (access(binary.c_str(), X_OK) == 0) {
            return binary;
        }
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    std::istringstream search((path_env && *path_env) ? path_env : DEFAULT_SEARCH_PATH);
    std::string dir;
    while (std::getline(search, dir, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        std::string candidate = dir + "/" + binary;
        struct stat st;
        if (stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
            access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return std::nullopt;
}

ProcessOutcome ProcessSupervisor::run(const ProcessSpec& spec) const {
    ProcessOutcome outcome;
    outcome.state = SupervisorState::DISPATCHED;
    outcome.timeout = spec.timeout;
    const auto start = Clock::now();

    auto spawn_failed = [&outcome, start](int err, const std::string& what) {
        outcome.state = SupervisorState::SPAWN_FAILED;
        outcome.spawn_errno = err;
        outcome.error_message = what + ": " + std::strerror(err);
        outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
        return outcome;
    };

    if (spec.argv.empty()) {
        return spawn_failed(EINVAL, "Empty command");
    }

    auto path = resolve_executable(spec.argv.front());
    if (!path) {
        return spawn_failed(ENOENT, "Executable not found: " + spec.argv.front());
    }

    ScopedFd stdout_read, stdout_write;
    ScopedFd stderr_read, stderr_write;
    ScopedFd error_read, error_write;
    ScopedFd stdin_read, stdin_write;

    if (!make_pipe(stdout_read, stdout_write) ||
        !make_pipe(stderr_read, stderr_write) ||
        !make_pipe(error_read, error_write)) {
        return spawn_failed(errno, "Failed to create pipes");
    }
    if (spec.stdin_data) {
        if (!make_pipe(stdin_read, stdin_write)) {
            return spawn_failed(errno, "Failed to create stdin pipe");
        }
    } else {
        stdin_read.reset(open("/dev/null", O_RDONLY | O_CLOEXEC));
        if (!stdin_read) {
            return spawn_failed(errno, "Failed to open /dev/null");
        }
    }

    // Everything the child needs is built before fork
    const auto env_strings = build_environment(spec);
    auto argv = to_c_array(spec.argv);
    auto envp = to_c_array(env_strings);
    const char* working_dir = spec.working_dir.empty() ? nullptr : spec.working_dir.c_str();

    pid_t pid = fork();
    if (pid == -1) {
        int err = errno;
        std::cerr << "[Supervisor] fork failed: " << std::strerror(err) << std::endl;
        return spawn_failed(err, "Failed to fork process");
    }
    if (pid == 0) {
        exec_child(stdin_read.get(), stdout_write.get(), stderr_write.get(), error_write.get(),
                   working_dir, path->c_str(), argv.data(), envp.data());
    }

    // Also set from the parent so the group exists before any kill; EACCES after exec is harmless
    setpgid(pid, pid);

    stdout_write.reset();
    stderr_write.reset();
    error_write.reset();
    stdin_read.reset();

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(error_read.get(), &child_errno, sizeof(child_errno));
    } while (n == -1 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {}
        return spawn_failed(child_errno, "Failed to execute " + spec.argv.front());
    }

    outcome.state = SupervisorState::RUNNING;
    ChildProcess child(pid, std::move(stdout_read), std::move(stderr_read),
                       std::move(stdin_write), spec.stdin_data, config_.max_capture_bytes);

    const auto deadline = start + spec.timeout;
    std::optional<Clock::time_point> drain_deadline;
    bool timed_out = false;

    while (true) {
        const auto now = Clock::now();
        if (child.leader_exited()) {
            if (!child.streams_open()) {
                break;
            }
            if (!drain_deadline) {
                drain_deadline = now + config_.drain_timeout;
            }
            if (now >= *drain_deadline) {
                break;
            }
        } else if (now >= deadline) {
            timed_out = true;
            break;
        }
        child.pump(slice_ms(now, drain_deadline ? *drain_deadline : deadline));
    }

    if (timed_out) {
        child.signal_group(SIGTERM);
        const auto grace_deadline = Clock::now() + config_.kill_grace;
        while (!child.leader_exited() && Clock::now() < grace_deadline) {
            child.pump(slice_ms(Clock::now(), grace_deadline));
        }
    }

    // The leader is at most a zombie here, so the group id cannot have been reused
    child.signal_group(SIGKILL);

    const auto final_drain = Clock::now() + config_.drain_timeout;
    while (child.streams_open() && Clock::now() < final_drain) {
        child.pump(slice_ms(Clock::now(), final_drain));
    }
    child.reap();

    outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
    outcome.exit_code = child.exit_code();
    outcome.stdout_overflow = child.stdout_overflow();
    outcome.stderr_overflow = child.stderr_overflow();
    outcome.stdout_output = child.take_stdout();
    outcome.stderr_output = child.take_stderr();

    if (timed_out) {
        outcome.state = SupervisorState::TIMED_OUT;
        outcome.error_message = "Process timed out after " +
            std::to_string(spec.timeout.count()) + " ms";
    } else {
        outcome.state = SupervisorState::COMPLETED;
    }
    return outcome;
}

} // namespace coderun
