#pragma once

#include <atomic>
#include <filesystem>
#include <future>
#include <optional>
#include <string>
#include <vector>
#include "availability_prober.h"
#include "config.h"
#include "execution_types.h"
#include "language_detector.h"
#include "language_profile.h"
#include "output_normalizer.h"
#include "process_supervisor.h"
#include "security_screener.h"
#include "syntax_checker.h"
#include "worker_pool.h"

namespace coderun {

// Entry point for running snippets.
//
// A request is checked in order: empty code, language support, runtime
// availability, security screen. These checks run on the caller's thread,
// so a rejection is ready at once even while every worker is busy. Only a
// request that passes all four reaches the pool and the supervisor.
// Every failure after construction comes back as an ExecutionResult with
// success == false.
class CodeExecutor {
public:
    // Throws std::invalid_argument for a bad config and std::runtime_error
    // when the private temp directory cannot be created
    explicit CodeExecutor(const ExecutorConfig& config = ExecutorConfig());
    ~CodeExecutor();

    CodeExecutor(const CodeExecutor&) = delete;
    CodeExecutor& operator=(const CodeExecutor&) = delete;

    // Rejections come back as an already-satisfied future; accepted
    // requests are queued and ready once the child is reaped
    std::future<ExecutionResult> submit(const ExecutionRequest& request);

    // submit(request).get()
    ExecutionResult execute(const ExecutionRequest& request);

    // Static checks only, never starts a process
    ValidationReport validate(const std::string& code,
                              const std::optional<std::string>& language = std::nullopt) const;

    std::string detect_language(const std::string& code) const;

    // nullopt for unsupported languages
    std::optional<LanguageInfo> get_language_info(const std::string& language);

    ServiceStatus get_service_status();
    ExecutorStats get_stats() const;
    std::vector<std::string> supported_languages() const { return languages_.names(); }

    const std::filesystem::path& temp_directory() const { return temp_dir_; }
    const ExecutorConfig& config() const { return config_; }

private:
    struct Admission {
        const LanguageProfile* profile = nullptr;
        std::optional<ExecutionResult> rejection;
    };

    Admission admit(const ExecutionRequest& request);
    ExecutionResult dispatch(const ExecutionRequest& request, const LanguageProfile& profile);
    ExecutionResult run(const ExecutionRequest& request, const LanguageProfile& profile,
                        const std::string& fingerprint);
    ExecutionResult reject(ErrorKind kind, const std::string& language, const std::string& message);

    void log_info(const std::string& message) const;

    ExecutorConfig config_;
    LanguageTable languages_;
    LanguageDetector detector_;
    SecurityScreener screener_;
    SyntaxChecker syntax_checker_;
    ProcessSupervisor supervisor_;
    AvailabilityProber prober_;
    OutputNormalizer normalizer_;
    std::filesystem::path temp_dir_;

    std::atomic<uint64_t> submitted_{0};
    std::atomic<uint64_t> rejected_{0};
    std::atomic<uint64_t> dispatched_{0};
    std::atomic<uint64_t> completed_{0};
    std::atomic<uint64_t> timed_out_{0};
    std::atomic<uint64_t> spawn_failures_{0};

    // Declared last so its workers stop before the members they use
    WorkerPool pool_;
};

} // namespace coderun
