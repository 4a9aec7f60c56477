#include "security_screener.h"
#include <cctype>
#include <set>
#include <sstream>

namespace coderun {

namespace {

// Collapses each whitespace run to one space. Rules only use \s* and \s+,
// so matches are unchanged while std::regex recursion stays shallow.
std::string squeeze_whitespace(const std::string& code) {
    std::string out;
    out.reserve(code.size());
    bool in_space = false;
    for (char c : code) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!in_space) {
                out += ' ';
            }
            in_space = true;
        } else {
            out += c;
            in_space = false;
        }
    }
    return out;
}

} // namespace

std::string SecurityVerdict::summary() const {
    std::ostringstream oss;
    for (size_t i = 0; i < violations.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << violations[i].category << ": " << violations[i].pattern;
    }
    return oss.str();
}

std::vector<SecurityScreener::Rule> SecurityScreener::default_rules() {
    return {
        // Filesystem access
        {"file_access", R"(\bwith\s+open\b)", "with open"},
        {"file_access", R"(\bopen\s*\()", "open("},
        {"file_access", R"(\bfile\s*\()", "file("},

        // Process / interpreter escape
        {"system_calls", R"(\bos\.system\b)", "os.system"},
        {"system_calls", R"(\bos\.popen\b)", "os.popen"},
        {"system_calls", R"(\bsubprocess\b)", "subprocess"},
        {"system_calls", R"(\bexec\s*\()", "exec("},
        {"system_calls", R"(\beval\s*\()", "eval("},
        {"system_calls", R"(__import__)", "__import__"},
        {"system_calls", R"(\bchild_process\b)", "child_process"},

        // Network
        {"network", R"(\bsocket\.)", "socket."},
        {"network", R"(\brequests\.)", "requests."},
        {"network", R"(\burllib\b)", "urllib."},
        {"network", R"(\bhttp\.client\b)", "http.client"},
        {"network", R"(\bfetch\s*\()", "fetch("},
        {"network", R"(\baxios\.)", "axios."},
        {"network", R"(xmlhttprequest)", "XMLHttpRequest"},

        // Destructive shell commands
        {"destructive_commands", R"(\brm\s+-[a-z]*r[a-z]*f|\brm\s+-[a-z]*f[a-z]*r)", "rm -rf"},
        {"destructive_commands", R"(\bsudo\b)", "sudo"},
        {"destructive_commands", R"(\bsu\s+)", "su"},
        {"destructive_commands", R"(\bchmod\s+)", "chmod"},
        {"destructive_commands", R"(\bchown\s+)", "chown"},
        {"destructive_commands", R"(\bcurl\b)", "curl"},
        {"destructive_commands", R"(\bwget\b)", "wget"},
        {"destructive_commands", R"(\bpip3?\s+install\b)", "pip install"},
        {"destructive_commands", R"(\bnpm\s+(install|i)\b)", "npm install"},
        {"destructive_commands", R"(\bapt(-get)?\s+install\b)", "apt install"},
        {"destructive_commands", R"(\bgit\s+clone\b)", "git clone"},
        {"destructive_commands", R"(\bmkfs\b)", "mkfs"},
        {"destructive_commands", R"(\bdd\s+if=)", "dd if="},
        {"destructive_commands", R"(:\s*\(\s*\)\s*\{\s*:\s*\|\s*:\s*&\s*\}\s*;\s*:)", "fork bomb"},

        // Destructive library calls
        {"dangerous_modules", R"(\bos\.(remove|rmdir|unlink)\b)", "os.remove"},
        {"dangerous_modules", R"(\bshutil\.rmtree\b)", "shutil.rmtree"},
    };
}

SecurityScreener::SecurityScreener(size_t max_code_bytes)
    : SecurityScreener(default_rules(), max_code_bytes) {}

SecurityScreener::SecurityScreener(const std::vector<Rule>& rules, size_t max_code_bytes)
    : max_code_bytes_(max_code_bytes) {
    for (const auto& rule : rules) {
        add_rule(rule);
    }
}

void SecurityScreener::add_rule(const Rule& rule) {
    rules_.push_back({rule, std::regex(rule.pattern,
        std::regex::ECMAScript | std::regex::icase | std::regex::optimize)});
}

SecurityVerdict SecurityScreener::screen(const std::string& code, const std::string& /*language*/) const {
    SecurityVerdict verdict;

    // Oversized code is rejected before any pattern runs
    if (code.size() > max_code_bytes_) {
        verdict.violations.push_back({"size_limit",
            "code exceeds " + std::to_string(max_code_bytes_) + " bytes"});
        verdict.safe = false;
        return verdict;
    }

    const std::string text = squeeze_whitespace(code);
    std::set<std::string> flagged_categories;

    for (const auto& compiled : rules_) {
        if (flagged_categories.count(compiled.rule.category)) {
            continue;
        }
        if (std::regex_search(text, compiled.regex)) {
            verdict.violations.push_back({compiled.rule.category, compiled.rule.description});
            flagged_categories.insert(compiled.rule.category);
        }
    }

    verdict.safe = verdict.violations.empty();
    return verdict;
}

} // namespace coderun
