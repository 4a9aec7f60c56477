#include "syntax_checker.h"
#include <cctype>
#include <cstring>
#include <set>
#include <vector>

namespace coderun {

std::string SyntaxIssue::to_string() const {
    return "line " + std::to_string(line) + ", column " + std::to_string(column) + ": " + message;
}

namespace {

// Position-tracking reader over the source text
struct Cursor {
    const std::string& text;
    size_t pos = 0;
    int line = 1;
    int column = 1;

    explicit Cursor(const std::string& source) : text(source) {}

    bool done() const { return pos >= text.size(); }

    char peek(size_t ahead = 0) const {
        return pos + ahead < text.size() ? text[pos + ahead] : '\0';
    }

    void advance() {
        if (text[pos++] == '\n') {
            ++line;
            column = 1;
        } else {
            ++column;
        }
    }

    bool starts_with(const std::string& token) const {
        return text.compare(pos, token.size(), token) == 0;
    }

    void skip_to_end_of_line() {
        while (!done() && peek() != '\n') {
            advance();
        }
    }
};

struct OpenBracket {
    char ch;
    int line;
    int column;
    bool template_expression = false;   // "${" inside a JS template literal
};

SyntaxIssue make_issue(int line, int column, const std::string& message) {
    SyntaxIssue issue;
    issue.line = line;
    issue.column = column;
    issue.message = message;
    return issue;
}

bool is_open_bracket(char c) { return c == '(' || c == '[' || c == '{'; }
bool is_close_bracket(char c) { return c == ')' || c == ']' || c == '}'; }

char closing_for(char open) {
    switch (open) {
        case '(': return ')';
        case '[': return ']';
        default: return '}';
    }
}

std::optional<SyntaxIssue> close_bracket(std::vector<OpenBracket>& stack, char c, int line, int column) {
    if (stack.empty()) {
        return make_issue(line, column, std::string("unmatched '") + c + "'");
    }
    const OpenBracket& top = stack.back();
    if (closing_for(top.ch) != c) {
        return make_issue(line, column, std::string("closing '") + c +
            "' does not match '" + top.ch + "' opened on line " + std::to_string(top.line));
    }
    stack.pop_back();
    return std::nullopt;
}

std::optional<SyntaxIssue> unclosed(const std::vector<OpenBracket>& stack) {
    if (stack.empty()) {
        return std::nullopt;
    }
    const OpenBracket& top = stack.back();
    return make_issue(top.line, top.column, std::string("'") + top.ch + "' was never closed");
}

// Single-line string with backslash escapes; the cursor is on the opening quote
bool scan_quoted(Cursor& cur, char quote) {
    cur.advance();
    while (!cur.done()) {
        char c = cur.peek();
        if (c == '\\') {
            cur.advance();
            if (!cur.done()) cur.advance();
            continue;
        }
        if (c == '\n') {
            return false;
        }
        cur.advance();
        if (c == quote) {
            return true;
        }
    }
    return false;
}

bool regex_allowed_after(char previous) {
    return previous == '\0' || std::strchr("(,=:[!&|?{};+-*%<>~^", previous) != nullptr;
}

} // namespace

bool SyntaxChecker::supports(const std::string& language) const {
    return language == "python" || language == "javascript" || language == "bash";
}

std::optional<SyntaxIssue> SyntaxChecker::check(const std::string& code, const std::string& language) const {
    if (language == "python") return check_python(code);
    if (language == "javascript") return check_javascript(code);
    if (language == "bash") return check_bash(code);
    return std::nullopt;
}

std::optional<SyntaxIssue> SyntaxChecker::check_python(const std::string& code) const {
    Cursor cur(code);
    std::vector<OpenBracket> stack;

    while (!cur.done()) {
        const char c = cur.peek();
        const int line = cur.line;
        const int column = cur.column;

        if (c == '#') {
            cur.skip_to_end_of_line();
            continue;
        }

        if (c == '\'' || c == '"') {
            const std::string triple(3, c);
            if (cur.starts_with(triple)) {
                for (int i = 0; i < 3; ++i) cur.advance();
                bool closed = false;
                while (!cur.done()) {
                    if (cur.peek() == '\\') {
                        cur.advance();
                        if (!cur.done()) cur.advance();
                        continue;
                    }
                    if (cur.starts_with(triple)) {
                        for (int i = 0; i < 3; ++i) cur.advance();
                        closed = true;
                        break;
                    }
                    cur.advance();
                }
                if (!closed) {
                    return make_issue(line, column, "unterminated triple-quoted string literal");
                }
                continue;
            }
            if (!scan_quoted(cur, c)) {
                return make_issue(line, column, "unterminated string literal");
            }
            continue;
        }

        if (is_open_bracket(c)) {
            stack.push_back({c, line, column});
        } else if (is_close_bracket(c)) {
            if (auto issue = close_bracket(stack, c, line, column)) {
                return issue;
            }
        }
        cur.advance();
    }

    return unclosed(stack);
}

std::optional<SyntaxIssue> SyntaxChecker::check_javascript(const std::string& code) const {
    Cursor cur(code);
    std::vector<OpenBracket> stack;
    char last_significant = '\0';

    // Scans template text up to the closing backtick or the next "${"
    auto scan_template = [&cur, &stack](int line, int column) -> std::optional<SyntaxIssue> {
        while (!cur.done()) {
            const char t = cur.peek();
            if (t == '\\') {
                cur.advance();
                if (!cur.done()) cur.advance();
                continue;
            }
            if (t == '`') {
                cur.advance();
                return std::nullopt;
            }
            if (t == '$' && cur.peek(1) == '{') {
                stack.push_back({'{', cur.line, cur.column, true});
                cur.advance();
                cur.advance();
                return std::nullopt;
            }
            cur.advance();
        }
        return make_issue(line, column, "unterminated template literal");
    };

    while (!cur.done()) {
        const char c = cur.peek();
        const int line = cur.line;
        const int column = cur.column;

        if (c == '/' && cur.peek(1) == '/') {
            cur.skip_to_end_of_line();
            continue;
        }
        if (c == '/' && cur.peek(1) == '*') {
            cur.advance();
            cur.advance();
            while (!cur.done() && !cur.starts_with("*/")) {
                cur.advance();
            }
            if (cur.done()) {
                return make_issue(line, column, "unterminated comment");
            }
            cur.advance();
            cur.advance();
            continue;
        }
        if (c == '/' && regex_allowed_after(last_significant)) {
            cur.advance();
            bool in_class = false;
            bool closed = false;
            while (!cur.done() && cur.peek() != '\n') {
                const char r = cur.peek();
                cur.advance();
                if (r == '\\') {
                    if (!cur.done() && cur.peek() != '\n') cur.advance();
                } else if (r == '[') {
                    in_class = true;
                } else if (r == ']') {
                    in_class = false;
                } else if (r == '/' && !in_class) {
                    closed = true;
                    break;
                }
            }
            if (!closed) {
                return make_issue(line, column, "unterminated regular expression literal");
            }
            while (std::isalpha(static_cast<unsigned char>(cur.peek()))) {
                cur.advance();
            }
            last_significant = ')';
            continue;
        }

        if (c == '\'' || c == '"') {
            if (!scan_quoted(cur, c)) {
                return make_issue(line, column, "unterminated string literal");
            }
            last_significant = c;
            continue;
        }

        if (c == '`') {
            cur.advance();
            if (auto issue = scan_template(line, column)) {
                return issue;
            }
            last_significant = c;
            continue;
        }

        if (c == '}' && !stack.empty() && stack.back().template_expression) {
            stack.pop_back();
            cur.advance();
            if (auto issue = scan_template(line, column)) {
                return issue;
            }
            last_significant = '`';
            continue;
        }

        if (is_open_bracket(c)) {
            stack.push_back({c, line, column});
        } else if (is_close_bracket(c)) {
            if (auto issue = close_bracket(stack, c, line, column)) {
                return issue;
            }
        }
        if (!std::isspace(static_cast<unsigned char>(c))) {
            last_significant = c;
        }
        cur.advance();
    }

    if (!stack.empty() && stack.back().template_expression) {
        return make_issue(stack.back().line, stack.back().column, "unterminated template literal");
    }
    return unclosed(stack);
}

std::optional<SyntaxIssue> SyntaxChecker::check_bash(const std::string& code) const {
    struct Block {
        std::string keyword;
        int line;
        int column;
    };

    static const std::set<std::string> kCommandLeaders = {
        "then", "do", "else", "elif", "if", "while", "until", "!", "{", "time"
    };

    Cursor cur(code);
    std::vector<Block> blocks;
    std::string word;
    int word_line = 1;
    int word_column = 1;
    bool command_position = true;
    std::string heredoc_delimiter;
    bool heredoc_strip_tabs = false;

    auto flush_word = [&]() -> std::optional<SyntaxIssue> {
        if (word.empty()) {
            return std::nullopt;
        }
        if (command_position) {
            if (word == "if" || word == "case" || word == "do") {
                blocks.push_back({word, word_line, word_column});
            } else if (word == "fi" || word == "esac" || word == "done") {
                const std::string opener = word == "fi" ? "if" : (word == "esac" ? "case" : "do");
                if (blocks.empty() || blocks.back().keyword != opener) {
                    return make_issue(word_line, word_column, "unexpected '" + word + "'");
                }
                blocks.pop_back();
            }
        }
        command_position = kCommandLeaders.count(word) > 0;
        word.clear();
        return std::nullopt;
    };

    auto append = [&](char c) {
        if (word.empty()) {
            word_line = cur.line;
            word_column = cur.column;
        }
        word += c;
    };

    while (!cur.done()) {
        const char c = cur.peek();
        const int line = cur.line;
        const int column = cur.column;

        if (c == '\\') {
            append(c);
            cur.advance();
            if (!cur.done()) {
                append(cur.peek());
                cur.advance();
            }
            continue;
        }

        if (c == '\'') {
            append(c);
            cur.advance();
            while (!cur.done() && cur.peek() != '\'') {
                word += cur.peek();
                cur.advance();
            }
            if (cur.done()) {
                return make_issue(line, column, "unterminated single-quoted string");
            }
            word += '\'';
            cur.advance();
            continue;
        }

        if (c == '"' || (c == '$' && cur.peek(1) == '\'')) {
            const char quote = c == '"' ? '"' : '\'';
            append(c);
            if (c == '$') {
                cur.advance();
                word += quote;
            }
            cur.advance();
            bool closed = false;
            while (!cur.done()) {
                const char q = cur.peek();
                word += q;
                cur.advance();
                if (q == '\\') {
                    if (!cur.done()) {
                        word += cur.peek();
                        cur.advance();
                    }
                } else if (q == quote) {
                    closed = true;
                    break;
                }
            }
            if (!closed) {
                return make_issue(line, column, quote == '"'
                    ? "unterminated double-quoted string"
                    : "unterminated $'...' string");
            }
            continue;
        }

        if (c == '#' && word.empty()) {
            cur.skip_to_end_of_line();
            continue;
        }

        if (c == '<' && cur.peek(1) == '<' && cur.peek(2) != '<') {
            if (auto issue = flush_word()) return issue;
            cur.advance();
            cur.advance();
            heredoc_strip_tabs = cur.peek() == '-';
            if (heredoc_strip_tabs) cur.advance();
            while (cur.peek() == ' ' || cur.peek() == '\t') cur.advance();
            heredoc_delimiter.clear();
            while (!cur.done() && !std::isspace(static_cast<unsigned char>(cur.peek())) &&
                   std::strchr(";|&()<>", cur.peek()) == nullptr) {
                if (cur.peek() != '\'' && cur.peek() != '"') {
                    heredoc_delimiter += cur.peek();
                }
                cur.advance();
            }
            command_position = false;
            continue;
        }

        if (c == '\n') {
            if (auto issue = flush_word()) return issue;
            cur.advance();
            command_position = true;

            if (!heredoc_delimiter.empty()) {
                bool terminated = false;
                while (!cur.done()) {
                    size_t end = code.find('\n', cur.pos);
                    std::string body_line = code.substr(cur.pos, end == std::string::npos
                        ? std::string::npos : end - cur.pos);
                    if (heredoc_strip_tabs) {
                        body_line.erase(0, body_line.find_first_not_of('\t') == std::string::npos
                            ? body_line.size() : body_line.find_first_not_of('\t'));
                    }
                    cur.skip_to_end_of_line();
                    if (!cur.done()) cur.advance();
                    if (body_line == heredoc_delimiter) {
                        terminated = true;
                        break;
                    }
                }
                if (!terminated) {
                    return make_issue(line, column, "here-document delimited by '" +
                                      heredoc_delimiter + "' is never terminated");
                }
                heredoc_delimiter.clear();
            }
            continue;
        }

        if (c == ' ' || c == '\t') {
            if (auto issue = flush_word()) return issue;
            cur.advance();
            continue;
        }

        if (std::strchr(";&|()", c) != nullptr) {
            if (auto issue = flush_word()) return issue;
            cur.advance();
            command_position = true;
            continue;
        }

        append(c);
        cur.advance();
    }

    if (auto issue = flush_word()) {
        return issue;
    }
    if (!heredoc_delimiter.empty()) {
        return make_issue(cur.line, cur.column, "here-document delimited by '" +
                          heredoc_delimiter + "' is never terminated");
    }
    if (!blocks.empty()) {
        const Block& open = blocks.back();
        const std::string closer = open.keyword == "if" ? "fi" : (open.keyword == "case" ? "esac" : "done");
        return make_issue(open.line, open.column,
                          "'" + open.keyword + "' is never closed (missing '" + closer + "')");
    }
    return std::nullopt;
}

} // namespace coderun
