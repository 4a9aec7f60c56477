#pragma once

#include <chrono>
#include <map>
#include <string>
#include "constants.h"
#include "language_profile.h"

namespace coderun {

// Runtime settings for CodeExecutor
struct ExecutorConfig {
    size_t worker_count;
    size_t max_output_length;
    size_t max_code_bytes;
    std::string temp_root;                          // Empty means the system temp dir
    std::chrono::milliseconds kill_grace;
    std::chrono::milliseconds probe_timeout;
    std::chrono::seconds availability_ttl;
    bool verbose;                                   // Informational log lines on stderr
    std::map<std::string, LanguageTimeouts> language_timeouts;

    ExecutorConfig() :
        worker_count(DEFAULT_WORKER_COUNT),
        max_output_length(DEFAULT_MAX_OUTPUT_LENGTH),
        max_code_bytes(DEFAULT_MAX_CODE_BYTES),
        kill_grace(DEFAULT_KILL_GRACE_MS),
        probe_timeout(DEFAULT_PROBE_TIMEOUT_MS),
        availability_ttl(DEFAULT_AVAILABILITY_TTL_SECONDS),
        verbose(false) {}

    // Throws std::invalid_argument for out-of-range values
    void validate() const;
};

class ConfigLoader {
public:
    // Missing keys keep their defaults; throws std::runtime_error on
    // unreadable files, malformed JSON or wrongly typed values
    static ExecutorConfig load_file(const std::string& path);
    static ExecutorConfig load_string(const std::string& json_text);

    // Whole-string base-10 integer for a command-line override;
    // throws std::invalid_argument naming the option otherwise
    static long parse_integer(const std::string& text, const std::string& option);
};

} // namespace coderun
