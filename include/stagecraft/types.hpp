#pragma once

// stagecraft/types.hpp - Error taxonomy shared by every stagecraft module.
//
// ERROR MODEL:
//   Errors are values. Module entry points return a result struct with an
//   `ok` flag and a BuildError; nothing throws across a module boundary.
//   A BuildError carries enough context (stage, instruction index, exit
//   code, fingerprint) to reproduce the failing step in isolation.
//
// CATEGORIES:
//   planning   - stage graph is cyclic or unresolved; reported before any
//                execution begins.
//   execution  - an instruction failed; the build is aborted, no image is
//                produced and the failed step is not cached.
//   assembly   - the final snapshot cannot become an image (no entrypoint,
//                invalid healthcheck).
//   runtime    - the supervised process crashed or missed its start period.
//                Restart is an external policy decision.
//   input      - malformed recipe, JSON or configuration.

#include <string>

namespace stagecraft {

enum class ErrorCode {
  none,
  // input
  stagefile_parse_error,
  json_parse_error,
  config_invalid,
  // planning
  cyclic_dependency,
  unknown_base,
  duplicate_stage,
  unknown_target,
  // execution
  instruction_failed,
  input_missing,
  spawn_failed,
  timeout,
  build_cancelled,
  cache_integrity_failed,
  base_unavailable,
  // assembly
  no_entrypoint,
  invalid_healthcheck,
  // runtime
  process_crashed,
  start_period_exceeded,
};

enum class ErrorCategory {
  none,
  input,
  planning,
  execution,
  assembly,
  runtime,
};

std::string to_string(ErrorCode code);
std::string to_string(ErrorCategory category);

// Category of a code. spawn_failed is classified as execution; the
// supervisor reports its own spawn failures with category() overridden to
// runtime through BuildError::category_override.
ErrorCategory category_of(ErrorCode code);

struct BuildError {
  ErrorCode code{ErrorCode::none};
  std::string stage;
  int instruction_index{-1};  // zero-based; -1 when not tied to a step
  int exit_code{0};
  std::string fingerprint;
  std::string detail;
  ErrorCategory category_override{ErrorCategory::none};

  bool ok() const { return code == ErrorCode::none; }
  ErrorCategory category() const;

  // One-line human-readable message, e.g.
  //   "instruction_failed: stage 'base' step 3: exit code 100 (...)".
  std::string message() const;
  std::string to_json() const;
};

BuildError make_error(ErrorCode code, std::string detail);

}  // namespace stagecraft
