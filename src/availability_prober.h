#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include "constants.h"
#include "language_profile.h"
#include "process_supervisor.h"

namespace coderun {

// Result of one runtime probe
struct RuntimeAvailability {
    bool available = false;
    std::string version;        // First line printed by "<binary> --version"
    std::string detail;         // Why the runtime is unavailable
};

// Checks whether a language's interpreter is installed.
// A binary missing from PATH is reported without spawning anything;
// otherwise "<binary> --version" runs under a short deadline. Results
// are cached so the execution path pays for at most one probe per TTL.
class AvailabilityProber {
public:
    struct Config {
        std::chrono::milliseconds probe_timeout;
        std::chrono::seconds cache_ttl;

        Config() :
            probe_timeout(DEFAULT_PROBE_TIMEOUT_MS),
            cache_ttl(DEFAULT_AVAILABILITY_TTL_SECONDS) {}
    };

    AvailabilityProber(const LanguageTable& table,
                       const ProcessSupervisor& supervisor,
                       const Config& config = Config());

    // Cached; unknown languages are unavailable
    bool is_available(const std::string& language);
    RuntimeAvailability availability(const std::string& language);

    // Answer available without spawning: a fresh cache entry, or a
    // binary missing from PATH. nullopt means a probe is still needed.
    std::optional<RuntimeAvailability> known_availability(const std::string& language);

    // Bypasses the cache and refreshes it
    RuntimeAvailability probe(const std::string& language);

    // Every language in the table
    std::map<std::string, RuntimeAvailability> status();

    void invalidate();

private:
    RuntimeAvailability missing_runtime(const std::string& language, const std::string& detail);

    struct CacheEntry {
        RuntimeAvailability result;
        std::chrono::steady_clock::time_point checked_at;
    };

    const LanguageTable& table_;
    const ProcessSupervisor& supervisor_;
    Config config_;
    mutable std::mutex mutex_;
    std::map<std::string, CacheEntry> cache_;
};

} // namespace coderun
