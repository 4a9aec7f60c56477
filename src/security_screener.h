#pragma once

#include <regex>
#include <string>
#include <vector>
#include "constants.h"

namespace coderun {

struct SecurityViolation {
    std::string category;    // e.g. "system_calls"
    std::string pattern;     // human-readable form of the rule that matched
};

struct SecurityVerdict {
    bool safe = true;
    std::vector<SecurityViolation> violations;

    // "system_calls: os.system, network: socket."
    std::string summary() const;
};

// Deny-list scanner over the code text. It never executes anything.
//
// This is a best-effort filter, not a security boundary: it matches
// literal spellings, so code that assembles a call at runtime
// ("os" + ".system", getattr, string escapes) passes it. Only the
// first match per category is recorded.
class SecurityScreener {
public:
    struct Rule {
        std::string category;
        std::string pattern;       // ECMAScript regex, matched case-insensitively
        std::string description;   // reported back as SecurityViolation::pattern
    };

    explicit SecurityScreener(size_t max_code_bytes = DEFAULT_MAX_CODE_BYTES);
    SecurityScreener(const std::vector<Rule>& rules, size_t max_code_bytes);

    void add_rule(const Rule& rule);

    // The language is accepted for interface symmetry; every rule applies to every language
    SecurityVerdict screen(const std::string& code, const std::string& language) const;

    size_t max_code_bytes() const { return max_code_bytes_; }

    static std::vector<Rule> default_rules();

private:
    struct CompiledRule {
        Rule rule;
        std::regex regex;
    };

    std::vector<CompiledRule> rules_;
    size_t max_code_bytes_;
};

} // namespace coderun
