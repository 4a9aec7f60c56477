#include "config.h"
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <json/json.h>

namespace coderun {

namespace {

size_t read_size(const Json::Value& root, const char* key, size_t fallback) {
    if (!root.isMember(key)) {
        return fallback;
    }
    const Json::Value& value = root[key];
    if (!value.isUInt64()) {
        throw std::runtime_error(std::string("Config key '") + key +
                                 "' must be a non-negative integer");
    }
    return static_cast<size_t>(value.asUInt64());
}

int read_int(const Json::Value& root, const char* key, int fallback) {
    if (!root.isMember(key)) {
        return fallback;
    }
    const Json::Value& value = root[key];
    if (!value.isInt()) {
        throw std::runtime_error(std::string("Config key '") + key + "' must be an integer");
    }
    return value.asInt();
}

} // namespace

void ExecutorConfig::validate() const {
    if (worker_count == 0 || worker_count > static_cast<size_t>(MAX_WORKER_COUNT)) {
        throw std::invalid_argument("worker_count must be between 1 and " +
                                    std::to_string(MAX_WORKER_COUNT));
    }
    if (max_output_length == 0) {
        throw std::invalid_argument("max_output_length must be positive");
    }
    if (max_code_bytes == 0) {
        throw std::invalid_argument("max_code_bytes must be positive");
    }
    if (kill_grace.count() < 0 || probe_timeout.count() <= 0 || availability_ttl.count() < 0) {
        throw std::invalid_argument("kill_grace_ms, probe_timeout_ms and "
                                    "availability_ttl_seconds must not be negative");
    }
    for (const auto& [language, timeouts] : language_timeouts) {
        if (timeouts.default_timeout_seconds < 0 || timeouts.max_timeout_seconds < 0) {
            throw std::invalid_argument("Timeouts for " + language + " must not be negative");
        }
    }
}

ExecutorConfig ConfigLoader::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open config file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_string(buffer.str());
}

ExecutorConfig ConfigLoader::load_string(const std::string& json_text) {
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream(json_text);

    if (!Json::parseFromStream(builder, stream, &root, &errors)) {
        throw std::runtime_error("Failed to parse config JSON: " + errors);
    }
    if (!root.isObject()) {
        throw std::runtime_error("Config root must be a JSON object");
    }

    ExecutorConfig config;
    config.worker_count = read_size(root, "worker_count", config.worker_count);
    config.max_output_length = read_size(root, "max_output_length", config.max_output_length);
    config.max_code_bytes = read_size(root, "max_code_bytes", config.max_code_bytes);
    config.kill_grace = std::chrono::milliseconds(
        read_int(root, "kill_grace_ms", static_cast<int>(config.kill_grace.count())));
    config.probe_timeout = std::chrono::milliseconds(
        read_int(root, "probe_timeout_ms", static_cast<int>(config.probe_timeout.count())));
    config.availability_ttl = std::chrono::seconds(
        read_int(root, "availability_ttl_seconds", static_cast<int>(config.availability_ttl.count())));

    if (root.isMember("temp_root")) {
        if (!root["temp_root"].isString()) {
            throw std::runtime_error("Config key 'temp_root' must be a string");
        }
        config.temp_root = root["temp_root"].asString();
    }
    if (root.isMember("verbose")) {
        if (!root["verbose"].isBool()) {
            throw std::runtime_error("Config key 'verbose' must be a boolean");
        }
        config.verbose = root["verbose"].asBool();
    }

    if (root.isMember("languages")) {
        const Json::Value& languages = root["languages"];
        if (!languages.isObject()) {
            throw std::runtime_error("Config key 'languages' must be an object");
        }
        for (const auto& name : languages.getMemberNames()) {
            const Json::Value& entry = languages[name];
            if (!entry.isObject()) {
                throw std::runtime_error("Config entry languages." + name + " must be an object");
            }
            LanguageTimeouts timeouts;
            timeouts.default_timeout_seconds = read_int(entry, "default_timeout", 0);
            timeouts.max_timeout_seconds = read_int(entry, "max_timeout", 0);
            config.language_timeouts[name] = timeouts;
        }
    }

    try {
        config.validate();
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Invalid config: ") + e.what());
    }
    return config;
}

long ConfigLoader::parse_integer(const std::string& text, const std::string& option) {
    errno = 0;
    char* end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (text.empty() || end != text.c_str() + text.size() || errno == ERANGE ||
        value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        throw std::invalid_argument(option + " expects an integer, got '" + text + "'");
    }
    return value;
}

} // namespace coderun
