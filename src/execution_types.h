#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "availability_prober.h"
#include "security_screener.h"

namespace coderun {

enum class ErrorKind {
    NONE,
    UNSUPPORTED_LANGUAGE,
    RUNTIME_UNAVAILABLE,
    SECURITY_VIOLATION,
    SYNTAX_ERROR,           // validate() only
    TIMEOUT_EXPIRED,
    SPAWN_FAILED,
    EXECUTION_ERROR
};

// "UnsupportedLanguage", "TimeoutExpired", ...; empty for NONE
const char* to_string(ErrorKind kind);

struct ExecutionRequest {
    std::string code;
    std::optional<std::string> language;      // Detected when absent
    std::optional<std::string> stdin_data;
    std::optional<int> timeout_seconds;
};

struct ExecutionResult {
    bool success = false;
    std::string language;
    std::string stdout_output;
    std::string stderr_output;
    int return_code = -1;
    double execution_time = 0.0;              // Seconds; 0 for rejected requests
    int timeout_used = 0;                     // Seconds
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    ErrorKind error = ErrorKind::NONE;
    std::string error_message;
    std::vector<SecurityViolation> violations;
    std::vector<std::string> supported_languages;
};

struct ValidationReport {
    bool valid = true;
    std::string language;
    std::vector<std::string> warnings;
    std::vector<std::string> errors;
    std::vector<SecurityViolation> security_issues;
    ErrorKind error = ErrorKind::NONE;        // First problem found
};

struct LanguageInfo {
    std::string language;
    std::vector<std::string> command;
    std::string file_extension;
    int timeout = 0;
    int max_timeout = 0;
    bool available = false;
    std::string version;
};

struct ServiceStatus {
    bool available = false;                   // At least one runtime answers
    std::vector<std::string> supported_languages;
    std::map<std::string, RuntimeAvailability> language_availability;
    std::string temp_directory;
    std::vector<std::string> security_features;
    size_t worker_count = 0;
    size_t max_output_length = 0;
    size_t max_code_bytes = 0;
};

struct ExecutorStats {
    uint64_t submitted = 0;
    uint64_t rejected = 0;                    // Refused before dispatch
    uint64_t dispatched = 0;                  // Handed to the supervisor
    uint64_t completed = 0;
    uint64_t timed_out = 0;
    uint64_t spawn_failures = 0;
};

} // namespace coderun
