#pragma once

#include <map>
#include <regex>
#include <string>
#include <vector>

namespace coderun {

// Heuristic language classifier driven by an ordered rule list.
// Each matching rule adds its weight to the rule's language; the
// strictly highest score wins, anything else yields the default.
class LanguageDetector {
public:
    struct Rule {
        std::string language;
        std::string pattern;     // ECMAScript regex, matched line by line
        int weight = 1;
    };

    LanguageDetector();
    explicit LanguageDetector(const std::vector<Rule>& rules,
                              std::string default_language = "python");

    // Rules must be added before the detector is shared between threads
    void add_rule(const Rule& rule);

    std::string detect(const std::string& code) const;

    // Per-language aggregate score, for diagnostics
    std::map<std::string, int> score(const std::string& code) const;

    const std::string& default_language() const { return default_language_; }

    static std::vector<Rule> default_rules();

private:
    struct CompiledRule {
        Rule rule;
        std::regex regex;
    };

    std::vector<CompiledRule> rules_;
    std::string default_language_;
};

} // namespace coderun
