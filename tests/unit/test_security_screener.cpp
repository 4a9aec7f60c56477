#include <gtest/gtest.h>
#include "security_screener.h"
#include <string>
#include <algorithm>

namespace coderun {
namespace {

class SecurityScreenerTest : public ::testing::Test {
protected:
    static bool has_category(const SecurityVerdict& verdict, const std::string& category) {
        return std::any_of(verdict.violations.begin(), verdict.violations.end(),
            [&category](const SecurityViolation& v) { return v.category == category; });
    }

    SecurityScreener screener;
};

TEST_F(SecurityScreenerTest, SafeCodePasses) {
    auto verdict = screener.screen("total = sum(range(10))\nprint(total)", "python");
    EXPECT_TRUE(verdict.safe);
    EXPECT_TRUE(verdict.violations.empty());
    EXPECT_EQ(verdict.summary(), "");
}

TEST_F(SecurityScreenerTest, SystemCallIsFlagged) {
    auto verdict = screener.screen("import os; os.system('ls')", "python");
    EXPECT_FALSE(verdict.safe);
    ASSERT_EQ(verdict.violations.size(), 1u);
    EXPECT_EQ(verdict.violations[0].category, "system_calls");
    EXPECT_EQ(verdict.violations[0].pattern, "os.system");
}

TEST_F(SecurityScreenerTest, MatchingIsCaseInsensitive) {
    auto verdict = screener.screen("OS.SYSTEM('ls')", "python");
    EXPECT_FALSE(verdict.safe);
    EXPECT_TRUE(has_category(verdict, "system_calls"));
}

TEST_F(SecurityScreenerTest, LanguageDoesNotMatter) {
    // A denylisted call inside a string literal of another language is still flagged
    auto verdict = screener.screen("echo 'os.system(\"ls\")'", "bash");
    EXPECT_FALSE(verdict.safe);
    EXPECT_TRUE(has_category(verdict, "system_calls"));
}

TEST_F(SecurityScreenerTest, FirstMatchPerCategoryOnly) {
    auto verdict = screener.screen("import subprocess\neval('1')\nexec('2')", "python");
    ASSERT_EQ(verdict.violations.size(), 1u);
    EXPECT_EQ(verdict.violations[0].category, "system_calls");
    EXPECT_EQ(verdict.violations[0].pattern, "subprocess");
}

TEST_F(SecurityScreenerTest, SeveralCategories) {
    std::string code = "data = open('/etc/passwd').read()\n"
                       "import socket\ns = socket.socket()\n"
                       "import shutil\nshutil.rmtree('/tmp/x')\n";
    auto verdict = screener.screen(code, "python");
    EXPECT_FALSE(verdict.safe);
    EXPECT_TRUE(has_category(verdict, "file_access"));
    EXPECT_TRUE(has_category(verdict, "network"));
    EXPECT_TRUE(has_category(verdict, "dangerous_modules"));
    EXPECT_EQ(verdict.violations.size(), 3u);
}

TEST_F(SecurityScreenerTest, DestructiveShellCommands) {
    EXPECT_FALSE(screener.screen("rm -rf /", "bash").safe);
    EXPECT_FALSE(screener.screen("rm -fr ~/data", "bash").safe);
    EXPECT_FALSE(screener.screen("sudo reboot", "bash").safe);
    EXPECT_FALSE(screener.screen("curl http://example.com", "bash").safe);
    EXPECT_FALSE(screener.screen("pip install requests", "bash").safe);
    EXPECT_FALSE(screener.screen(":(){ :|:& };:", "bash").safe);
}

TEST_F(SecurityScreenerTest, JavaScriptEscapes) {
    auto verdict = screener.screen("const cp = require('child_process');", "javascript");
    EXPECT_TRUE(has_category(verdict, "system_calls"));

    verdict = screener.screen("fetch('http://example.com').then(r => r.text())", "javascript");
    EXPECT_TRUE(has_category(verdict, "network"));
}

TEST_F(SecurityScreenerTest, SimilarHarmlessWordsPass) {
    EXPECT_TRUE(screener.screen("evaluate = 3\nprint(evaluate)", "python").safe);
    EXPECT_TRUE(screener.screen("echo summary", "bash").safe);
}

TEST_F(SecurityScreenerTest, SizeLimit) {
    SecurityScreener small(64);
    auto verdict = small.screen(std::string(65, 'x'), "python");
    EXPECT_FALSE(verdict.safe);
    ASSERT_EQ(verdict.violations.size(), 1u);
    EXPECT_EQ(verdict.violations[0].category, "size_limit");
    EXPECT_EQ(verdict.violations[0].pattern, "code exceeds 64 bytes");

    EXPECT_TRUE(small.screen(std::string(64, 'x'), "python").safe);
}

TEST_F(SecurityScreenerTest, OversizedCodeSkipsPatternMatching) {
    SecurityScreener small(64);
    auto verdict = small.screen("os.system('x')" + std::string(100, ' '), "python");
    ASSERT_EQ(verdict.violations.size(), 1u);
    EXPECT_EQ(verdict.violations[0].category, "size_limit");
}

TEST_F(SecurityScreenerTest, LongWhitespaceRunsAreHandled) {
    SecurityScreener roomy(1024 * 1024);
    auto fork_bomb = roomy.screen(":" + std::string(50000, ' ') + "() { :|:& };:", "bash");
    EXPECT_FALSE(fork_bomb.safe);
    ASSERT_EQ(fork_bomb.violations.size(), 1u);
    EXPECT_EQ(fork_bomb.violations[0].pattern, "fork bomb");

    auto spaced = roomy.screen("os.system" + std::string(50000, '\n') + "('ls')", "python");
    EXPECT_FALSE(spaced.safe);

    EXPECT_TRUE(roomy.screen(std::string(50000, ' ') + "x = 1", "python").safe);
}

TEST_F(SecurityScreenerTest, SummaryListsEveryViolation) {
    auto verdict = screener.screen("os.system('x'); socket.socket()", "python");
    EXPECT_EQ(verdict.summary(), "system_calls: os.system, network: socket.");
}

TEST_F(SecurityScreenerTest, CustomRules) {
    SecurityScreener custom({{"custom", R"(\bforbidden\b)", "forbidden"}}, 1024);
    EXPECT_FALSE(custom.screen("this is FORBIDDEN", "python").safe);
    EXPECT_TRUE(custom.screen("os.system('ls')", "python").safe);

    custom.add_rule({"network", R"(\bsocket\.)", "socket."});
    EXPECT_FALSE(custom.screen("socket.socket()", "python").safe);
}

} // namespace
} // namespace coderun
