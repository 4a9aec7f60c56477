#include <gtest/gtest.h>
#include "code_executor.h"
#include "file_utils.h"
#include <algorithm>
#include <filesystem>
#include <stdexcept>

namespace coderun {
namespace {

class CodeExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = FileUtils::create_private_directory(std::filesystem::temp_directory_path(),
                                                   "coderun_executor_test_");
        config.temp_root = root.string();
        executor = std::make_unique<CodeExecutor>(config);
    }

    void TearDown() override {
        executor.reset();
        std::filesystem::remove_all(root);
    }

    static bool installed(const std::string& binary) {
        return ProcessSupervisor::resolve_executable(binary).has_value();
    }

    static ExecutionRequest request(const std::string& code,
                                    std::optional<std::string> language = std::nullopt) {
        ExecutionRequest req;
        req.code = code;
        req.language = std::move(language);
        return req;
    }

    std::filesystem::path root;
    ExecutorConfig config;
    std::unique_ptr<CodeExecutor> executor;
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(CodeExecutorTest, CreatesPrivateTempDirectory) {
    const auto& dir = executor->temp_directory();
    EXPECT_TRUE(std::filesystem::is_directory(dir));
    EXPECT_EQ(dir.parent_path(), root);
    EXPECT_EQ(dir.filename().string().rfind(TEMP_DIR_PREFIX, 0), 0u);
}

TEST_F(CodeExecutorTest, TempDirectoryRemovedOnDestruction) {
    auto dir = executor->temp_directory();
    executor.reset();
    EXPECT_FALSE(std::filesystem::exists(dir));
}

TEST_F(CodeExecutorTest, MissingTempRootAbortsConstruction) {
    ExecutorConfig bad;
    bad.temp_root = (root / "does" / "not" / "exist").string();
    EXPECT_THROW(CodeExecutor{bad}, std::runtime_error);
}

TEST_F(CodeExecutorTest, InvalidConfigAbortsConstruction) {
    ExecutorConfig bad;
    bad.temp_root = root.string();
    bad.worker_count = 0;
    EXPECT_THROW(CodeExecutor{bad}, std::invalid_argument);
}

// ============================================================================
// Rejections (no process is started)
// ============================================================================

TEST_F(CodeExecutorTest, EmptyCodeRejected) {
    auto result = executor->execute(request("  \n\t ", std::string("python")));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, ErrorKind::EXECUTION_ERROR);
    EXPECT_EQ(result.error_message, "No code provided");
    EXPECT_EQ(result.execution_time, 0.0);
    EXPECT_EQ(executor->get_stats().dispatched, 0u);
}

TEST_F(CodeExecutorTest, UnsupportedLanguageRejected) {
    auto result = executor->execute(request("DISPLAY 'HI'.", std::string("cobol")));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, ErrorKind::UNSUPPORTED_LANGUAGE);
    EXPECT_EQ(result.language, "cobol");
    EXPECT_EQ(result.supported_languages, executor->supported_languages());
    EXPECT_EQ(result.error_message,
              "Unsupported language: cobol. Supported: python, javascript, bash");
    EXPECT_EQ(result.execution_time, 0.0);

    auto stats = executor->get_stats();
    EXPECT_EQ(stats.submitted, 1u);
    EXPECT_EQ(stats.rejected, 1u);
    EXPECT_EQ(stats.dispatched, 0u);
}

TEST_F(CodeExecutorTest, SecurityViolationRejected) {
    if (!installed("python3")) {
        GTEST_SKIP() << "python3 is not installed";
    }
    auto result = executor->execute(request("import os\nos.system('ls')", std::string("python")));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, ErrorKind::SECURITY_VIOLATION);
    ASSERT_EQ(result.violations.size(), 1u);
    EXPECT_EQ(result.violations[0].category, "system_calls");
    EXPECT_EQ(result.stdout_output, "");
    EXPECT_EQ(result.execution_time, 0.0);
    EXPECT_EQ(executor->get_stats().dispatched, 0u);
}

TEST_F(CodeExecutorTest, OversizedCodeRejected) {
    if (!installed("python3")) {
        GTEST_SKIP() << "python3 is not installed";
    }
    std::string code = "x = 1\n";
    while (code.size() <= DEFAULT_MAX_CODE_BYTES) {
        code += "x += 1\n";
    }
    auto result = executor->execute(request(code, std::string("python")));
    EXPECT_EQ(result.error, ErrorKind::SECURITY_VIOLATION);
    ASSERT_FALSE(result.violations.empty());
    EXPECT_EQ(result.violations.back().category, "size_limit");
}

TEST_F(CodeExecutorTest, OversizedWhitespaceRejectedWithoutCrashing) {
    if (!installed("python3")) {
        GTEST_SKIP() << "python3 is not installed";
    }
    const std::string padded = std::string(50000, ' ') + "x = 1";

    auto detected = executor->execute(request(padded));
    EXPECT_EQ(detected.language, "python");
    EXPECT_EQ(detected.error, ErrorKind::SECURITY_VIOLATION);
    ASSERT_EQ(detected.violations.size(), 1u);
    EXPECT_EQ(detected.violations[0].category, "size_limit");

    auto fork_bomb = executor->execute(request(":" + std::string(50000, ' ') + "x",
                                               std::string("python")));
    EXPECT_EQ(fork_bomb.error, ErrorKind::SECURITY_VIOLATION);

    auto report = executor->validate(padded);
    EXPECT_FALSE(report.valid);
    EXPECT_EQ(report.error, ErrorKind::SECURITY_VIOLATION);
    EXPECT_EQ(executor->get_stats().dispatched, 0u);
}

// ============================================================================
// Execution
// ============================================================================

TEST_F(CodeExecutorTest, PythonRunsAndReportsTimeoutUsed) {
    if (!installed("python3")) {
        GTEST_SKIP() << "python3 is not installed";
    }
    auto result = executor->execute(request("print(6 * 7)", std::string("python")));
    EXPECT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(result.error, ErrorKind::NONE);
    EXPECT_TRUE(result.error_message.empty());
    EXPECT_EQ(result.stdout_output, "42\n");
    EXPECT_EQ(result.return_code, 0);
    EXPECT_EQ(result.timeout_used, DEFAULT_TIMEOUT_SECONDS);
    EXPECT_GT(result.execution_time, 0.0);
}

TEST_F(CodeExecutorTest, LanguageNameIsNormalized) {
    if (!installed("python3")) {
        GTEST_SKIP() << "python3 is not installed";
    }
    auto result = executor->execute(request("print('ok')", std::string(" Python ")));
    EXPECT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(result.language, "python");
}

TEST_F(CodeExecutorTest, DetectsLanguageWhenOmitted) {
    if (!installed("bash")) {
        GTEST_SKIP() << "bash is not installed";
    }
    auto result = executor->execute(request("echo detected"));
    EXPECT_EQ(result.language, "bash");
    EXPECT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(result.stdout_output, "detected\n");
}

TEST_F(CodeExecutorTest, ProgramFailureIsReportedThroughReturnCode) {
    if (!installed("python3")) {
        GTEST_SKIP() << "python3 is not installed";
    }
    auto result = executor->execute(request("print('before')\n1 / 0", std::string("python")));
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.return_code, 1);
    EXPECT_EQ(result.stdout_output, "before\n");
    EXPECT_NE(result.stderr_output.find("ZeroDivisionError"), std::string::npos);
}

TEST_F(CodeExecutorTest, StdinReachesProgram) {
    if (!installed("python3")) {
        GTEST_SKIP() << "python3 is not installed";
    }
    ExecutionRequest req = request("import sys\nprint(sys.stdin.read().upper(), end='')",
                                   std::string("python"));
    req.stdin_data = "shout\n";
    auto result = executor->execute(req);
    EXPECT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(result.stdout_output, "SHOUT\n");
}

TEST_F(CodeExecutorTest, RequestedTimeoutIsClamped) {
    if (!installed("python3")) {
        GTEST_SKIP() << "python3 is not installed";
    }
    ExecutionRequest req = request("print(1)", std::string("python"));
    req.timeout_seconds = 1000;
    EXPECT_EQ(executor->execute(req).timeout_used, MAX_TIMEOUT_SECONDS);

    req.timeout_seconds = 0;
    EXPECT_EQ(executor->execute(req).timeout_used, DEFAULT_TIMEOUT_SECONDS);

    req.timeout_seconds = 2;
    EXPECT_EQ(executor->execute(req).timeout_used, 2);
}

TEST_F(CodeExecutorTest, LongOutputIsTruncated) {
    if (!installed("python3")) {
        GTEST_SKIP() << "python3 is not installed";
    }
    auto result = executor->execute(request("print('x' * 20000)", std::string("python")));
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.stdout_truncated);
    EXPECT_EQ(result.stdout_output, std::string(DEFAULT_MAX_OUTPUT_LENGTH, 'x') + TRUNCATION_MARKER);
    EXPECT_FALSE(result.stderr_truncated);
}

TEST_F(CodeExecutorTest, ScriptFilesAreRemovedAfterRun) {
    if (!installed("bash")) {
        GTEST_SKIP() << "bash is not installed";
    }
    auto result = executor->execute(request("echo \"$0\"", std::string("bash")));
    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_NE(result.stdout_output.find(".sh"), std::string::npos);
    EXPECT_TRUE(std::filesystem::is_empty(executor->temp_directory()));
}

TEST_F(CodeExecutorTest, TimeoutIsClassified) {
    if (!installed("bash")) {
        GTEST_SKIP() << "bash is not installed";
    }
    ExecutionRequest req = request("echo partial; while :; do :; done", std::string("bash"));
    req.timeout_seconds = 1;
    auto result = executor->execute(req);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, ErrorKind::TIMEOUT_EXPIRED);
    EXPECT_EQ(result.error_message, "Code execution timed out after 1 seconds");
    EXPECT_EQ(result.timeout_used, 1);
    EXPECT_EQ(result.stdout_output, "partial\n");
    EXPECT_EQ(executor->get_stats().timed_out, 1u);
}

// ============================================================================
// validate()
// ============================================================================

TEST_F(CodeExecutorTest, ValidateAcceptsCleanCode) {
    auto report = executor->validate("def f(x):\n    return x * 2\n", std::string("python"));
    EXPECT_TRUE(report.valid);
    EXPECT_EQ(report.error, ErrorKind::NONE);
    EXPECT_TRUE(report.errors.empty());
    EXPECT_TRUE(report.security_issues.empty());
}

TEST_F(CodeExecutorTest, ValidateReportsSyntaxError) {
    auto report = executor->validate("print('unclosed'", std::string("python"));
    EXPECT_FALSE(report.valid);
    EXPECT_EQ(report.error, ErrorKind::SYNTAX_ERROR);
    ASSERT_EQ(report.errors.size(), 1u);
    EXPECT_EQ(report.errors[0], "Syntax error: line 1, column 6: '(' was never closed");
}

TEST_F(CodeExecutorTest, ValidateReportsSecurityIssues) {
    auto report = executor->validate("import subprocess", std::string("python"));
    EXPECT_FALSE(report.valid);
    EXPECT_EQ(report.error, ErrorKind::SECURITY_VIOLATION);
    ASSERT_EQ(report.security_issues.size(), 1u);
    EXPECT_EQ(report.security_issues[0].pattern, "subprocess");
}

TEST_F(CodeExecutorTest, ValidateUnsupportedLanguage) {
    auto report = executor->validate("puts 1", std::string("ruby"));
    EXPECT_FALSE(report.valid);
    EXPECT_EQ(report.error, ErrorKind::UNSUPPORTED_LANGUAGE);
}

TEST_F(CodeExecutorTest, ValidateWarnsAboutLongCode) {
    std::string code;
    while (code.size() <= LONG_CODE_WARNING_BYTES) {
        code += "echo filler line\n";
    }
    auto report = executor->validate(code, std::string("bash"));
    ASSERT_EQ(report.warnings.size(), 1u);
    EXPECT_EQ(report.warnings[0], "Code is very long and may hit execution limits");
}

TEST_F(CodeExecutorTest, ValidateDetectsLanguageAndNeverRuns) {
    auto report = executor->validate("console.log('hi')");
    EXPECT_EQ(report.language, "javascript");
    EXPECT_TRUE(report.valid);

    auto stats = executor->get_stats();
    EXPECT_EQ(stats.submitted, 0u);
    EXPECT_EQ(stats.dispatched, 0u);
}

// ============================================================================
// Introspection
// ============================================================================

TEST_F(CodeExecutorTest, DetectLanguage) {
    EXPECT_EQ(executor->detect_language("print('hi')"), "python");
    EXPECT_EQ(executor->detect_language("console.log('hi')"), "javascript");
    EXPECT_EQ(executor->detect_language("echo hi"), "bash");
}

TEST_F(CodeExecutorTest, LanguageInfo) {
    auto info = executor->get_language_info("javascript");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->language, "javascript");
    EXPECT_EQ(info->file_extension, ".js");
    EXPECT_EQ(info->command.front(), "node");
    EXPECT_EQ(info->timeout, DEFAULT_TIMEOUT_SECONDS);
    EXPECT_EQ(info->max_timeout, MAX_TIMEOUT_SECONDS);
    EXPECT_EQ(info->available, installed("node"));

    EXPECT_FALSE(executor->get_language_info("cobol").has_value());
}

TEST_F(CodeExecutorTest, ServiceStatus) {
    auto status = executor->get_service_status();
    EXPECT_EQ(status.supported_languages, executor->supported_languages());
    EXPECT_EQ(status.language_availability.size(), 3u);
    EXPECT_EQ(status.temp_directory, executor->temp_directory().string());
    EXPECT_EQ(status.worker_count, static_cast<size_t>(DEFAULT_WORKER_COUNT));
    EXPECT_EQ(status.max_output_length, DEFAULT_MAX_OUTPUT_LENGTH);
    EXPECT_EQ(status.max_code_bytes, DEFAULT_MAX_CODE_BYTES);
    EXPECT_FALSE(status.security_features.empty());
    EXPECT_EQ(status.language_availability.at("bash").available, installed("bash"));
}

} // namespace
} // namespace coderun
