#include "code_executor.h"
#include "file_utils.h"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <memory>
#include <sstream>

namespace coderun {

namespace fs = std::filesystem;

namespace {

ProcessSupervisor::Config supervisor_config(const ExecutorConfig& config) {
    ProcessSupervisor::Config supervisor;
    supervisor.kill_grace = config.kill_grace;
    return supervisor;
}

AvailabilityProber::Config prober_config(const ExecutorConfig& config) {
    AvailabilityProber::Config prober;
    prober.probe_timeout = config.probe_timeout;
    prober.cache_ttl = config.availability_ttl;
    return prober;
}

fs::path temp_root(const ExecutorConfig& config) {
    return config.temp_root.empty() ? fs::temp_directory_path() : fs::path(config.temp_root);
}

bool is_blank(const std::string& code) {
    return std::all_of(code.begin(), code.end(),
        [](unsigned char c) { return std::isspace(c); });
}

std::string normalize_language(std::string language) {
    auto first = language.find_first_not_of(" \t\r\n");
    auto last = language.find_last_not_of(" \t\r\n");
    language = first == std::string::npos ? "" : language.substr(first, last - first + 1);
    std::transform(language.begin(), language.end(), language.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return language;
}

std::string join(const std::vector<std::string>& items, const std::string& separator) {
    std::ostringstream out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out << separator;
        out << items[i];
    }
    return out.str();
}

double to_seconds(std::chrono::milliseconds elapsed) {
    return static_cast<double>(elapsed.count()) / 1000.0;
}

} // namespace

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "";
        case ErrorKind::UNSUPPORTED_LANGUAGE: return "UnsupportedLanguage";
        case ErrorKind::RUNTIME_UNAVAILABLE: return "RuntimeUnavailable";
        case ErrorKind::SECURITY_VIOLATION: return "SecurityViolation";
        case ErrorKind::SYNTAX_ERROR: return "SyntaxError";
        case ErrorKind::TIMEOUT_EXPIRED: return "TimeoutExpired";
        case ErrorKind::SPAWN_FAILED: return "SpawnFailed";
        case ErrorKind::EXECUTION_ERROR: return "ExecutionError";
    }
    return "ExecutionError";
}

CodeExecutor::CodeExecutor(const ExecutorConfig& config)
    : config_((config.validate(), config)),
      languages_(LanguageTable::defaults(config.language_timeouts)),
      screener_(config.max_code_bytes),
      supervisor_(supervisor_config(config)),
      prober_(languages_, supervisor_, prober_config(config)),
      normalizer_(config.max_output_length),
      temp_dir_(FileUtils::create_private_directory(temp_root(config), TEMP_DIR_PREFIX)),
      pool_(config.worker_count) {
    log_info("Ready with " + std::to_string(config_.worker_count) +
             " workers, temp directory " + temp_dir_.string());
}

CodeExecutor::~CodeExecutor() {
    pool_.shutdown();

    std::error_code ec;
    fs::remove_all(temp_dir_, ec);
    if (ec) {
        std::cerr << "[Executor] Could not clean up temp directory " << temp_dir_
                  << ": " << ec.message() << std::endl;
    }
}

std::future<ExecutionResult> CodeExecutor::submit(const ExecutionRequest& request) {
    ++submitted_;

    Admission admission = admit(request);
    if (admission.rejection) {
        std::promise<ExecutionResult> ready;
        ready.set_value(std::move(*admission.rejection));
        return ready.get_future();
    }

    const LanguageProfile* profile = admission.profile;
    return pool_.submit([this, request, profile]() { return dispatch(request, *profile); });
}

ExecutionResult CodeExecutor::execute(const ExecutionRequest& request) {
    return submit(request).get();
}

CodeExecutor::Admission CodeExecutor::admit(const ExecutionRequest& request) {
    Admission admission;
    const std::string requested = request.language ? normalize_language(*request.language) : "";

    if (is_blank(request.code)) {
        admission.rejection = reject(ErrorKind::EXECUTION_ERROR, requested, "No code provided");
        return admission;
    }

    const std::string language = request.language ? requested : detector_.detect(request.code);

    const LanguageProfile* profile = languages_.find(language);
    if (!profile) {
        ExecutionResult result = reject(ErrorKind::UNSUPPORTED_LANGUAGE, language,
            "Unsupported language: " + language + ". Supported: " + join(languages_.names(), ", "));
        result.supported_languages = languages_.names();
        admission.rejection = std::move(result);
        return admission;
    }

    // Cached or PATH-level answer only; a cold version probe runs on the worker
    auto known = prober_.known_availability(language);
    if (known && !known->available) {
        admission.rejection = reject(ErrorKind::RUNTIME_UNAVAILABLE, language,
            "Runtime for " + language + " is not available on this system");
        return admission;
    }

    SecurityVerdict verdict = screener_.screen(request.code, language);
    if (!verdict.safe) {
        ExecutionResult result = reject(ErrorKind::SECURITY_VIOLATION, language,
                                        "Security violation detected: " + verdict.summary());
        result.violations = verdict.violations;
        admission.rejection = std::move(result);
        return admission;
    }

    admission.profile = profile;
    return admission;
}

ExecutionResult CodeExecutor::dispatch(const ExecutionRequest& request, const LanguageProfile& profile) {
    if (!prober_.is_available(profile.name)) {
        return reject(ErrorKind::RUNTIME_UNAVAILABLE, profile.name,
                      "Runtime for " + profile.name + " is not available on this system");
    }

    const std::string fingerprint = FileUtils::sha256_string(request.code).substr(0, 12);
    try {
        return run(request, profile, fingerprint);
    } catch (const std::exception& e) {
        std::cerr << "[Executor] " << fingerprint << " failed before launch: " << e.what() << std::endl;
        ExecutionResult result;
        result.language = profile.name;
        result.error = ErrorKind::EXECUTION_ERROR;
        result.error_message = std::string("Execution error: ") + e.what();
        return result;
    }
}

ExecutionResult CodeExecutor::run(const ExecutionRequest& request,
                                  const LanguageProfile& profile,
                                  const std::string& fingerprint) {
    const std::chrono::seconds timeout = profile.effective_timeout(request.timeout_seconds);

    std::unique_ptr<TempScript> script;
    if (profile.launch_mode == LaunchMode::SCRIPT_FILE) {
        script = std::make_unique<TempScript>(temp_dir_, profile.file_extension,
                                              profile.script_text(request.code));
    }

    ProcessSpec spec;
    spec.argv = profile.build_argv(request.code, script ? script->path().string() : "");
    spec.working_dir = temp_dir_.string();
    spec.stdin_data = request.stdin_data;
    spec.environment = profile.environment;
    spec.timeout = timeout;

    ++dispatched_;
    log_info(fingerprint + " running " + profile.name + " (timeout " +
             std::to_string(timeout.count()) + "s)");

    ProcessOutcome outcome = supervisor_.run(spec);

    ExecutionResult result;
    result.language = profile.name;
    result.timeout_used = static_cast<int>(timeout.count());
    result.return_code = outcome.exit_code;
    result.execution_time = to_seconds(outcome.elapsed);

    NormalizedOutput output = normalizer_.normalize(std::move(outcome.stdout_output),
                                                    std::move(outcome.stderr_output));
    result.stdout_output = std::move(output.stdout_text);
    result.stderr_output = std::move(output.stderr_text);
    result.stdout_truncated = output.stdout_truncated || outcome.stdout_overflow;
    result.stderr_truncated = output.stderr_truncated || outcome.stderr_overflow;

    switch (outcome.state) {
        case SupervisorState::COMPLETED:
            ++completed_;
            result.success = true;
            break;
        case SupervisorState::TIMED_OUT:
            ++timed_out_;
            result.error = ErrorKind::TIMEOUT_EXPIRED;
            result.error_message = "Code execution timed out after " +
                                   std::to_string(timeout.count()) + " seconds";
            break;
        case SupervisorState::SPAWN_FAILED:
            ++spawn_failures_;
            result.error = (outcome.spawn_errno == ENOENT || outcome.spawn_errno == EACCES)
                ? ErrorKind::RUNTIME_UNAVAILABLE
                : ErrorKind::SPAWN_FAILED;
            result.error_message = "Failed to start " + profile.binary() + ": " + outcome.error_message;
            result.execution_time = 0.0;
            break;
        default:
            result.error = ErrorKind::EXECUTION_ERROR;
            result.error_message = std::string("Unexpected supervisor state: ") + to_string(outcome.state);
            break;
    }

    log_info(fingerprint + " " + to_string(outcome.state) + " exit=" +
             std::to_string(outcome.exit_code) + " in " + std::to_string(outcome.elapsed.count()) + "ms");
    return result;
}

ExecutionResult CodeExecutor::reject(ErrorKind kind, const std::string& language,
                                     const std::string& message) {
    ++rejected_;
    log_info("Rejected: " + message);

    ExecutionResult result;
    result.language = language;
    result.error = kind;
    result.error_message = message;
    return result;
}

ValidationReport CodeExecutor::validate(const std::string& code,
                                        const std::optional<std::string>& language) const {
    ValidationReport report;
    report.language = language ? normalize_language(*language) : detector_.detect(code);

    if (is_blank(code)) {
        report.valid = false;
        report.errors.push_back("No code provided");
        report.error = ErrorKind::EXECUTION_ERROR;
        return report;
    }

    if (!languages_.contains(report.language)) {
        report.valid = false;
        report.errors.push_back("Unsupported language: " + report.language + ". Supported: " +
                                join(languages_.names(), ", "));
        report.error = ErrorKind::UNSUPPORTED_LANGUAGE;
        return report;
    }

    SecurityVerdict verdict = screener_.screen(code, report.language);
    if (!verdict.safe) {
        report.valid = false;
        report.security_issues = verdict.violations;
        report.error = ErrorKind::SECURITY_VIOLATION;
    }

    if (auto issue = syntax_checker_.check(code, report.language)) {
        report.valid = false;
        report.errors.push_back("Syntax error: " + issue->to_string());
        if (report.error == ErrorKind::NONE) {
            report.error = ErrorKind::SYNTAX_ERROR;
        }
    }

    if (code.size() > LONG_CODE_WARNING_BYTES) {
        report.warnings.push_back("Code is very long and may hit execution limits");
    }
    return report;
}

std::string CodeExecutor::detect_language(const std::string& code) const {
    return detector_.detect(code);
}

std::optional<LanguageInfo> CodeExecutor::get_language_info(const std::string& language) {
    const LanguageProfile* profile = languages_.find(normalize_language(language));
    if (!profile) {
        return std::nullopt;
    }

    RuntimeAvailability availability = prober_.availability(profile->name);

    LanguageInfo info;
    info.language = profile->name;
    info.command = profile->command;
    info.file_extension = profile->file_extension;
    info.timeout = static_cast<int>(profile->default_timeout.count());
    info.max_timeout = static_cast<int>(profile->max_timeout.count());
    info.available = availability.available;
    info.version = availability.version;
    return info;
}

ServiceStatus CodeExecutor::get_service_status() {
    ServiceStatus status;
    status.supported_languages = languages_.names();
    status.language_availability = prober_.status();
    status.available = std::any_of(status.language_availability.begin(),
                                   status.language_availability.end(),
        [](const auto& entry) { return entry.second.available; });
    status.temp_directory = temp_dir_.string();
    status.security_features = {
        "pattern_filtering",
        "timeout_protection",
        "process_group_termination",
        "output_truncation",
        "private_temp_directory"
    };
    status.worker_count = pool_.worker_count();
    status.max_output_length = normalizer_.max_length();
    status.max_code_bytes = screener_.max_code_bytes();
    return status;
}

ExecutorStats CodeExecutor::get_stats() const {
    ExecutorStats stats;
    stats.submitted = submitted_.load();
    stats.rejected = rejected_.load();
    stats.dispatched = dispatched_.load();
    stats.completed = completed_.load();
    stats.timed_out = timed_out_.load();
    stats.spawn_failures = spawn_failures_.load();
    return stats;
}

void CodeExecutor::log_info(const std::string& message) const {
    if (config_.verbose) {
        std::cerr << "[Executor] " << message << std::endl;
    }
}

} // namespace coderun
