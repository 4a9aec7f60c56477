#include "availability_prober.h"
#include <iostream>
#include <sstream>

namespace coderun {

namespace {

std::string first_line(const std::string& text) {
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty()) {
            return line;
        }
    }
    return "";
}

} // namespace

AvailabilityProber::AvailabilityProber(const LanguageTable& table,
                                       const ProcessSupervisor& supervisor,
                                       const Config& config)
    : table_(table), supervisor_(supervisor), config_(config) {}

bool AvailabilityProber::is_available(const std::string& language) {
    return availability(language).available;
}

RuntimeAvailability AvailabilityProber::availability(const std::string& language) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(language);
        if (it != cache_.end() &&
            std::chrono::steady_clock::now() - it->second.checked_at < config_.cache_ttl) {
            return it->second.result;
        }
    }
    return probe(language);
}

std::optional<RuntimeAvailability> AvailabilityProber::known_availability(const std::string& language) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(language);
        if (it != cache_.end() &&
            std::chrono::steady_clock::now() - it->second.checked_at < config_.cache_ttl) {
            return it->second.result;
        }
    }

    const LanguageProfile* profile = table_.find(language);
    if (!profile) {
        RuntimeAvailability result;
        result.detail = "unsupported language";
        return result;
    }
    if (!ProcessSupervisor::resolve_executable(profile->binary())) {
        return missing_runtime(language, "runtime_not_found: " + profile->binary());
    }
    return std::nullopt;
}

RuntimeAvailability AvailabilityProber::probe(const std::string& language) {
    RuntimeAvailability result;
    const LanguageProfile* profile = table_.find(language);
    if (!profile) {
        result.detail = "unsupported language";
        return result;
    }

    if (!ProcessSupervisor::resolve_executable(profile->binary())) {
        return missing_runtime(language, "runtime_not_found: " + profile->binary());
    }

    ProcessSpec spec;
    spec.argv = {profile->binary(), profile->version_flag};
    spec.timeout = config_.probe_timeout;

    ProcessOutcome outcome = supervisor_.run(spec);
    if (outcome.state == SupervisorState::COMPLETED && outcome.exit_code == 0) {
        result.available = true;
        result.version = first_line(outcome.stdout_output);
        if (result.version.empty()) {
            result.version = first_line(outcome.stderr_output);
        }
    } else if (outcome.state == SupervisorState::TIMED_OUT) {
        result.detail = "version probe timed out";
    } else if (outcome.state == SupervisorState::SPAWN_FAILED) {
        result.detail = outcome.error_message;
    } else {
        result.detail = "version probe exited with code " + std::to_string(outcome.exit_code);
    }

    if (!result.available) {
        std::cerr << "[Prober] " << language << " unavailable (" << result.detail << ")" << std::endl;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    cache_[language] = {result, std::chrono::steady_clock::now()};
    return result;
}

RuntimeAvailability AvailabilityProber::missing_runtime(const std::string& language,
                                                        const std::string& detail) {
    RuntimeAvailability result;
    result.detail = detail;
    std::cerr << "[Prober] " << language << " unavailable (" << detail << ")" << std::endl;

    std::lock_guard<std::mutex> lock(mutex_);
    cache_[language] = {result, std::chrono::steady_clock::now()};
    return result;
}

std::map<std::string, RuntimeAvailability> AvailabilityProber::status() {
    std::map<std::string, RuntimeAvailability> all;
    for (const auto& name : table_.names()) {
        all[name] = availability(name);
    }
    return all;
}

void AvailabilityProber::invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
}

} // namespace coderun
