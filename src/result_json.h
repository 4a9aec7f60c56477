#pragma once

#include <string>
#include <json/json.h>
#include "execution_types.h"

namespace coderun {

Json::Value to_json(const SecurityViolation& violation);
Json::Value to_json(const ExecutionResult& result);
Json::Value to_json(const ValidationReport& report);
Json::Value to_json(const LanguageInfo& info);
Json::Value to_json(const ServiceStatus& status);
Json::Value to_json(const ExecutorStats& stats);

// Indented document for the CLI
std::string write_json(const Json::Value& value);

} // namespace coderun
