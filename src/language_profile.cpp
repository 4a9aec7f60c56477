#include "language_profile.h"
#include "constants.h"
#include <algorithm>
#include <stdexcept>

namespace coderun {

std::vector<std::string> LanguageProfile::build_argv(const std::string& code,
                                                     const std::string& script_path) const {
    std::vector<std::string> argv;
    argv.reserve(command.size());
    for (const auto& arg : command) {
        if (arg == CODE_PLACEHOLDER) {
            argv.push_back(code);
        } else if (arg == FILE_PLACEHOLDER) {
            argv.push_back(script_path);
        } else {
            argv.push_back(arg);
        }
    }
    return argv;
}

std::chrono::seconds LanguageProfile::effective_timeout(std::optional<int> requested_seconds) const {
    if (!requested_seconds || *requested_seconds <= 0) {
        return std::min(default_timeout, max_timeout);
    }
    return std::min(std::chrono::seconds(*requested_seconds), max_timeout);
}

LanguageTable::LanguageTable(std::vector<LanguageProfile> profiles)
    : profiles_(std::move(profiles)) {
    for (const auto& profile : profiles_) {
        if (profile.name.empty() || profile.command.empty()) {
            throw std::invalid_argument("Language profile needs a name and a command");
        }
        if (profile.max_timeout.count() <= 0) {
            throw std::invalid_argument("Language profile " + profile.name +
                                        " needs a positive max timeout");
        }
    }
}

LanguageTable LanguageTable::defaults(const std::map<std::string, LanguageTimeouts>& overrides) {
    std::vector<LanguageProfile> profiles = {
        BuiltInLanguages::python(),
        BuiltInLanguages::javascript(),
        BuiltInLanguages::bash()
    };

    for (auto& profile : profiles) {
        auto it = overrides.find(profile.name);
        if (it == overrides.end()) continue;
        if (it->second.max_timeout_seconds > 0) {
            profile.max_timeout = std::chrono::seconds(it->second.max_timeout_seconds);
        }
        if (it->second.default_timeout_seconds > 0) {
            profile.default_timeout = std::chrono::seconds(it->second.default_timeout_seconds);
        }
    }

    return LanguageTable(std::move(profiles));
}

const LanguageProfile* LanguageTable::find(const std::string& name) const {
    auto it = std::find_if(profiles_.begin(), profiles_.end(),
        [&name](const LanguageProfile& profile) { return profile.name == name; });
    return it == profiles_.end() ? nullptr : &*it;
}

std::vector<std::string> LanguageTable::names() const {
    std::vector<std::string> result;
    result.reserve(profiles_.size());
    for (const auto& profile : profiles_) {
        result.push_back(profile.name);
    }
    return result;
}

namespace BuiltInLanguages {

LanguageProfile python() {
    LanguageProfile profile;
    profile.name = "python";
    profile.command = {"python3", "-c", CODE_PLACEHOLDER};
    profile.file_extension = ".py";
    profile.default_timeout = std::chrono::seconds(DEFAULT_TIMEOUT_SECONDS);
    profile.max_timeout = std::chrono::seconds(MAX_TIMEOUT_SECONDS);
    profile.launch_mode = LaunchMode::INLINE;
    profile.environment = {
        {"PYTHONDONTWRITEBYTECODE", "1"},
        {"PYTHONUNBUFFERED", "1"}
    };
    return profile;
}

LanguageProfile javascript() {
    LanguageProfile profile;
    profile.name = "javascript";
    profile.command = {"node", FILE_PLACEHOLDER};
    profile.file_extension = ".js";
    profile.default_timeout = std::chrono::seconds(DEFAULT_TIMEOUT_SECONDS);
    profile.max_timeout = std::chrono::seconds(MAX_TIMEOUT_SECONDS);
    profile.launch_mode = LaunchMode::SCRIPT_FILE;
    return profile;
}

LanguageProfile bash() {
    LanguageProfile profile;
    profile.name = "bash";
    profile.command = {"bash", FILE_PLACEHOLDER};
    profile.file_extension = ".sh";
    profile.default_timeout = std::chrono::seconds(DEFAULT_TIMEOUT_SECONDS);
    profile.max_timeout = std::chrono::seconds(MAX_TIMEOUT_SECONDS);
    profile.launch_mode = LaunchMode::SCRIPT_FILE;
    return profile;
}

} // namespace BuiltInLanguages

} // namespace coderun
