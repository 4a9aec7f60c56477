#include "language_detector.h"
#include "constants.h"
#include <sstream>

namespace coderun {

namespace {

bool matches_any_line(const std::regex& regex, const std::vector<std::string>& lines) {
    for (const auto& line : lines) {
        if (std::regex_search(line, regex)) {
            return true;
        }
    }
    return false;
}

// Bounded sample; std::regex recursion depth grows with the matched length
std::vector<std::string> split_lines(const std::string& code) {
    std::vector<std::string> lines;
    std::istringstream stream(code.size() > DETECT_SAMPLE_BYTES
                              ? code.substr(0, DETECT_SAMPLE_BYTES) : code);
    std::string line;
    while (std::getline(stream, line)) {
        if (line.size() > DETECT_MAX_LINE_LENGTH) {
            line.resize(DETECT_MAX_LINE_LENGTH);
        }
        lines.push_back(line);
    }
    return lines;
}

} // namespace

std::vector<LanguageDetector::Rule> LanguageDetector::default_rules() {
    return {
        // Python
        {"python", R"(\bimport\s+\w+)"},
        {"python", R"(\bfrom\s+\w+\s+import\b)"},
        {"python", R"(\bdef\s+\w+\s*\()"},
        {"python", R"(\bclass\s+\w+\s*[:(])"},
        {"python", R"(__name__)"},
        {"python", R"(\bprint\s*\()"},
        {"python", R"(^\s*#.*python)"},

        // JavaScript
        {"javascript", R"(\bconsole\.log\s*\()"},
        {"javascript", R"(\bfunction\s+\w+\s*\()"},
        {"javascript", R"(\b(const|let|var)\s+\w+\s*=)"},
        {"javascript", R"(\brequire\s*\()"},
        {"javascript", R"(=>)"},
        {"javascript", R"(^\s*//)"},

        // Bash
        {"bash", R"(^#!.*\b(ba)?sh\b)"},
        {"bash", R"(\becho\s+)"},
        {"bash", R"(\bexport\s+\w+)"},
        {"bash", R"(\$\{?\w+)"},
        {"bash", R"(^\s*#.*bash)"},
    };
}

LanguageDetector::LanguageDetector()
    : LanguageDetector(default_rules()) {}

LanguageDetector::LanguageDetector(const std::vector<Rule>& rules,
                                   std::string default_language)
    : default_language_(std::move(default_language)) {
    for (const auto& rule : rules) {
        add_rule(rule);
    }
}

void LanguageDetector::add_rule(const Rule& rule) {
    rules_.push_back({rule, std::regex(rule.pattern, std::regex::ECMAScript | std::regex::optimize)});
}

std::map<std::string, int> LanguageDetector::score(const std::string& code) const {
    std::map<std::string, int> scores;
    const auto lines = split_lines(code);

    for (const auto& compiled : rules_) {
        scores.emplace(compiled.rule.language, 0);
        if (matches_any_line(compiled.regex, lines)) {
            scores[compiled.rule.language] += compiled.rule.weight;
        }
    }
    return scores;
}

std::string LanguageDetector::detect(const std::string& code) const {
    const auto scores = score(code);

    std::string best;
    int best_score = 0;
    bool tied = false;
    for (const auto& [language, value] : scores) {
        if (value > best_score) {
            best = language;
            best_score = value;
            tied = false;
        } else if (value == best_score && value > 0) {
            tied = true;
        }
    }

    if (best_score == 0 || tied) {
        return default_language_;
    }
    return best;
}

} // namespace coderun
