#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "constants.h"

namespace coderun {

// Lifecycle of one supervised execution
enum class SupervisorState {
    IDLE,
    DISPATCHED,     // Handed to a worker
    RUNNING,        // Child created
    COMPLETED,      // Exited before the deadline
    TIMED_OUT,      // Deadline hit, process group killed
    SPAWN_FAILED    // Pipes, fork or exec failed
};

const char* to_string(SupervisorState state);

struct ProcessSpec {
    std::vector<std::string> argv;                 // argv[0] is resolved against PATH
    std::string working_dir;
    std::optional<std::string> stdin_data;         // /dev/null when absent
    std::map<std::string, std::string> environment;
    std::chrono::milliseconds timeout{DEFAULT_TIMEOUT_SECONDS * 1000};
};

struct ProcessOutcome {
    SupervisorState state = SupervisorState::IDLE;
    int exit_code = -1;                            // -signal when killed by a signal
    std::string stdout_output;
    std::string stderr_output;
    bool stdout_overflow = false;                  // Capture cap reached, rest discarded
    bool stderr_overflow = false;
    std::chrono::milliseconds elapsed{0};
    std::chrono::milliseconds timeout{0};          // Deadline that was applied
    int spawn_errno = 0;
    std::string error_message;
};

// Runs one command in its own process group with a wall-clock deadline.
//
// The child is placed in a new process group so that a timeout can
// signal the whole subtree. On expiry the group receives SIGTERM, then
// SIGKILL after the grace period. Any process left in the group when
// the leader exits is killed as well, so nothing outlives run().
class ProcessSupervisor {
public:
    struct Config {
        std::chrono::milliseconds kill_grace;
        std::chrono::milliseconds drain_timeout;
        size_t max_capture_bytes;

        Config() :
            kill_grace(DEFAULT_KILL_GRACE_MS),
            drain_timeout(DRAIN_TIMEOUT_MS),
            max_capture_bytes(MAX_CAPTURE_BYTES) {}
    };

    explicit ProcessSupervisor(const Config& config = Config());

    // Blocks until the child is reaped. Never throws for child failures.
    ProcessOutcome run(const ProcessSpec& spec) const;

    const Config& config() const { return config_; }

    // PATH lookup (or X_OK check for paths containing '/')
    static std::optional<std::string> resolve_executable(const std::string& binary);

private:
    Config config_;
};

} // namespace coderun
