#pragma once

#include <optional>
#include <string>

namespace coderun {

struct SyntaxIssue {
    int line = 0;       // 1-based
    int column = 0;     // 1-based
    std::string message;

    std::string to_string() const;
};

// Structural syntax check that runs in-process, so validation never
// starts an interpreter. It tracks strings, comments and nesting:
//   python      brackets, quotes, triple-quoted strings, # comments
//   javascript  brackets, quotes, template literals, comments, regex literals
//   bash        quotes, if/fi, case/esac, do/done
// Only the first problem is reported. A clean result does not mean the
// interpreter will accept the code.
class SyntaxChecker {
public:
    bool supports(const std::string& language) const;

    std::optional<SyntaxIssue> check(const std::string& code, const std::string& language) const;

private:
    std::optional<SyntaxIssue> check_python(const std::string& code) const;
    std::optional<SyntaxIssue> check_javascript(const std::string& code) const;
    std::optional<SyntaxIssue> check_bash(const std::string& code) const;
};

} // namespace coderun
