#pragma once

#include <cstddef>  // for size_t

namespace coderun {

// Code limits
constexpr size_t DEFAULT_MAX_CODE_BYTES = 10 * 1024;              // 10KB screener ceiling
constexpr size_t LONG_CODE_WARNING_BYTES = 50 * 1024;             // validate() warns above 50KB
constexpr size_t DETECT_SAMPLE_BYTES = 16 * 1024;                 // Leading text the detector looks at
constexpr size_t DETECT_MAX_LINE_LENGTH = 1000;                   // Longer lines are cut before matching

// Output limits
constexpr size_t DEFAULT_MAX_OUTPUT_LENGTH = 10000;               // Per stream, after normalization
constexpr size_t MAX_CAPTURE_BYTES = 1024 * 1024;                 // Per stream, kept while draining
constexpr const char* TRUNCATION_MARKER = "\n... (output truncated)";

// Time limits
constexpr int DEFAULT_TIMEOUT_SECONDS = 10;                       // Used when the request names none
constexpr int MAX_TIMEOUT_SECONDS = 30;                           // Hard ceiling per language
constexpr int DEFAULT_KILL_GRACE_MS = 500;                        // SIGTERM -> SIGKILL delay
constexpr int DRAIN_TIMEOUT_MS = 1000;                            // Final drain after a kill
constexpr int DEFAULT_PROBE_TIMEOUT_MS = 5000;                    // Runtime --version probe
constexpr int DEFAULT_AVAILABILITY_TTL_SECONDS = 60;              // Probe cache lifetime

// Worker pool
constexpr int DEFAULT_WORKER_COUNT = 2;
constexpr int MAX_WORKER_COUNT = 64;

// Buffer sizes
constexpr size_t PIPE_BUFFER_SIZE = 4096;                         // Read buffer size
constexpr int POLL_INTERVAL_MS = 50;                              // Poll slice while waiting

// Temp files
constexpr const char* TEMP_DIR_PREFIX = "coderun_";
constexpr size_t SCRIPT_ID_BYTES = 8;                             // 16 hex chars

// Exit status reported for a child whose exec failed
constexpr int EXEC_FAILURE_EXIT_CODE = 127;

} // namespace coderun
