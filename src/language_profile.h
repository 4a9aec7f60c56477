#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace coderun {

// How the snippet reaches the interpreter
enum class LaunchMode {
    INLINE,       // Passed as an argument (python3 -c CODE)
    SCRIPT_FILE   // Written to a temp file first (node FILE)
};

// Placeholders substituted in LanguageProfile::command
constexpr const char* CODE_PLACEHOLDER = "{code}";
constexpr const char* FILE_PLACEHOLDER = "{file}";

// Static per-language launch configuration
struct LanguageProfile {
    std::string name;                              // "python", "javascript", "bash"
    std::vector<std::string> command;              // argv template, first entry is the binary
    std::string file_extension;                    // ".py", ".js", ".sh"
    std::chrono::seconds default_timeout{0};
    std::chrono::seconds max_timeout{0};
    LaunchMode launch_mode = LaunchMode::INLINE;
    std::string script_prelude;                    // Prepended to SCRIPT_FILE scripts
    std::map<std::string, std::string> environment;
    std::string version_flag = "--version";

    const std::string& binary() const { return command.front(); }

    // Substitute placeholders; script_path is ignored for INLINE profiles
    std::vector<std::string> build_argv(const std::string& code,
                                        const std::string& script_path) const;

    // Text written to the script file
    std::string script_text(const std::string& code) const { return script_prelude + code; }

    // min(requested, max_timeout); absent or non-positive requests use the default
    std::chrono::seconds effective_timeout(std::optional<int> requested_seconds) const;
};

// Timeout override for one language, read from the config file
struct LanguageTimeouts {
    int default_timeout_seconds = 0;   // 0 keeps the built-in value
    int max_timeout_seconds = 0;
};

// Immutable registry of supported languages, built once at startup
class LanguageTable {
public:
    explicit LanguageTable(std::vector<LanguageProfile> profiles);

    // python, javascript and bash, with optional timeout overrides
    static LanguageTable defaults(
        const std::map<std::string, LanguageTimeouts>& overrides = {});

    const LanguageProfile* find(const std::string& name) const;
    bool contains(const std::string& name) const { return find(name) != nullptr; }

    std::vector<std::string> names() const;
    const std::vector<LanguageProfile>& profiles() const { return profiles_; }

private:
    std::vector<LanguageProfile> profiles_;
};

// Built-in profiles
namespace BuiltInLanguages {
    LanguageProfile python();
    LanguageProfile javascript();
    LanguageProfile bash();
}

} // namespace coderun
