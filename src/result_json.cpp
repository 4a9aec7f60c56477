#include "result_json.h"

namespace coderun {

namespace {

Json::Value string_array(const std::vector<std::string>& items) {
    Json::Value array(Json::arrayValue);
    for (const auto& item : items) {
        array.append(item);
    }
    return array;
}

Json::Value violation_array(const std::vector<SecurityViolation>& violations) {
    Json::Value array(Json::arrayValue);
    for (const auto& violation : violations) {
        array.append(to_json(violation));
    }
    return array;
}

} // namespace

Json::Value to_json(const SecurityViolation& violation) {
    Json::Value json;
    json["category"] = violation.category;
    json["pattern"] = violation.pattern;
    return json;
}

Json::Value to_json(const ExecutionResult& result) {
    Json::Value json;
    json["success"] = result.success;
    json["language"] = result.language;
    json["stdout"] = result.stdout_output;
    json["stderr"] = result.stderr_output;
    json["return_code"] = result.return_code;
    json["execution_time"] = result.execution_time;
    json["timeout"] = result.timeout_used;
    json["stdout_truncated"] = result.stdout_truncated;
    json["stderr_truncated"] = result.stderr_truncated;

    if (result.error != ErrorKind::NONE) {
        json["error"] = result.error_message;
        json["error_type"] = to_string(result.error);
    }
    if (!result.violations.empty()) {
        json["violations"] = violation_array(result.violations);
    }
    if (!result.supported_languages.empty()) {
        json["supported_languages"] = string_array(result.supported_languages);
    }
    return json;
}

Json::Value to_json(const ValidationReport& report) {
    Json::Value json;
    json["valid"] = report.valid;
    json["language"] = report.language;
    json["warnings"] = string_array(report.warnings);
    json["errors"] = string_array(report.errors);
    json["security_issues"] = violation_array(report.security_issues);
    if (report.error != ErrorKind::NONE) {
        json["error_type"] = to_string(report.error);
    }
    return json;
}

Json::Value to_json(const LanguageInfo& info) {
    Json::Value json;
    json["language"] = info.language;
    json["command"] = string_array(info.command);
    json["file_extension"] = info.file_extension;
    json["timeout"] = info.timeout;
    json["max_timeout"] = info.max_timeout;
    json["available"] = info.available;
    if (!info.version.empty()) {
        json["version"] = info.version;
    }
    return json;
}

Json::Value to_json(const ServiceStatus& status) {
    Json::Value json;
    json["available"] = status.available;
    json["supported_languages"] = string_array(status.supported_languages);

    Json::Value availability(Json::objectValue);
    for (const auto& [language, runtime] : status.language_availability) {
        availability[language] = runtime.available;
    }
    json["language_availability"] = availability;

    Json::Value versions(Json::objectValue);
    for (const auto& [language, runtime] : status.language_availability) {
        versions[language] = runtime.available ? runtime.version : runtime.detail;
    }
    json["runtime_details"] = versions;

    json["temp_directory"] = status.temp_directory;
    json["security_features"] = string_array(status.security_features);

    Json::Value configuration;
    configuration["worker_count"] = static_cast<Json::UInt64>(status.worker_count);
    configuration["max_output_length"] = static_cast<Json::UInt64>(status.max_output_length);
    configuration["max_code_bytes"] = static_cast<Json::UInt64>(status.max_code_bytes);
    json["configuration"] = configuration;
    return json;
}

Json::Value to_json(const ExecutorStats& stats) {
    Json::Value json;
    json["submitted"] = static_cast<Json::UInt64>(stats.submitted);
    json["rejected"] = static_cast<Json::UInt64>(stats.rejected);
    json["dispatched"] = static_cast<Json::UInt64>(stats.dispatched);
    json["completed"] = static_cast<Json::UInt64>(stats.completed);
    json["timed_out"] = static_cast<Json::UInt64>(stats.timed_out);
    json["spawn_failures"] = static_cast<Json::UInt64>(stats.spawn_failures);
    return json;
}

std::string write_json(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, value);
}

} // namespace coderun
