#include "stagecraft/types.hpp"

#include <sstream>

#include "stagecraft/jsonlite.hpp"

namespace stagecraft {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::stagefile_parse_error: return "stagefile_parse_error";
    case ErrorCode::json_parse_error: return "json_parse_error";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::cyclic_dependency: return "cyclic_dependency";
    case ErrorCode::unknown_base: return "unknown_base";
    case ErrorCode::duplicate_stage: return "duplicate_stage";
    case ErrorCode::unknown_target: return "unknown_target";
    case ErrorCode::instruction_failed: return "instruction_failed";
    case ErrorCode::input_missing: return "input_missing";
    case ErrorCode::spawn_failed: return "spawn_failed";
    case ErrorCode::timeout: return "timeout";
    case ErrorCode::build_cancelled: return "build_cancelled";
    case ErrorCode::cache_integrity_failed: return "cache_integrity_failed";
    case ErrorCode::base_unavailable: return "base_unavailable";
    case ErrorCode::no_entrypoint: return "no_entrypoint";
    case ErrorCode::invalid_healthcheck: return "invalid_healthcheck";
    case ErrorCode::process_crashed: return "process_crashed";
    case ErrorCode::start_period_exceeded: return "start_period_exceeded";
  }
  return "";
}

std::string to_string(ErrorCategory category) {
  switch (category) {
    case ErrorCategory::none: return "";
    case ErrorCategory::input: return "InputError";
    case ErrorCategory::planning: return "PlanningError";
    case ErrorCategory::execution: return "ExecutionError";
    case ErrorCategory::assembly: return "AssemblyError";
    case ErrorCategory::runtime: return "RuntimeError";
  }
  return "";
}

ErrorCategory category_of(ErrorCode code) {
  switch (code) {
    case ErrorCode::none:
      return ErrorCategory::none;
    case ErrorCode::stagefile_parse_error:
    case ErrorCode::json_parse_error:
    case ErrorCode::config_invalid:
      return ErrorCategory::input;
    case ErrorCode::cyclic_dependency:
    case ErrorCode::unknown_base:
    case ErrorCode::duplicate_stage:
    case ErrorCode::unknown_target:
      return ErrorCategory::planning;
    case ErrorCode::instruction_failed:
    case ErrorCode::input_missing:
    case ErrorCode::spawn_failed:
    case ErrorCode::timeout:
    case ErrorCode::build_cancelled:
    case ErrorCode::cache_integrity_failed:
    case ErrorCode::base_unavailable:
      return ErrorCategory::execution;
    case ErrorCode::no_entrypoint:
    case ErrorCode::invalid_healthcheck:
      return ErrorCategory::assembly;
    case ErrorCode::process_crashed:
    case ErrorCode::start_period_exceeded:
      return ErrorCategory::runtime;
  }
  return ErrorCategory::none;
}

ErrorCategory BuildError::category() const {
  if (category_override != ErrorCategory::none)
    return category_override;
  return category_of(code);
}

std::string BuildError::message() const {
  if (ok())
    return "";
  std::ostringstream o;
  o << to_string(code);
  if (!stage.empty())
    o << ": stage '" << stage << "'";
  if (instruction_index >= 0)
    o << " step " << (instruction_index + 1);
  if (code == ErrorCode::instruction_failed ||
      code == ErrorCode::process_crashed)
    o << ": exit code " << exit_code;
  if (!detail.empty())
    o << " (" << detail << ")";
  return o.str();
}

std::string BuildError::to_json() const {
  std::ostringstream o;
  o << "{\"code\":\"" << to_string(code) << "\""
    << ",\"category\":\"" << to_string(category()) << "\""
    << ",\"stage\":\"" << jsonlite::escape(stage) << "\""
    << ",\"instruction_index\":" << instruction_index
    << ",\"exit_code\":" << exit_code
    << ",\"fingerprint\":\"" << fingerprint << "\""
    << ",\"detail\":\"" << jsonlite::escape(detail) << "\""
    << "}";
  return o.str();
}

BuildError make_error(ErrorCode code, std::string detail) {
  BuildError e;
  e.code = code;
  e.detail = std::move(detail);
  return e;
}

}  // namespace stagecraft
