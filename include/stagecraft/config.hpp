#pragma once

// stagecraft/config.hpp - Engine configuration.
//
// Precedence, lowest to highest:
//   built-in defaults -> STAGECRAFT_* environment -> JSON file (--config)
//   -> CLI flags (applied by the caller).
//
// Environment keys:
//   STAGECRAFT_CACHE_DIR          layer cache + content store root
//   STAGECRAFT_BASES_DIR          directory of base root filesystems
//   STAGECRAFT_CAS_COMPRESSION    off | zstd
//   STAGECRAFT_STEP_TIMEOUT_MS    per-RUN deadline, 0 = none
//   STAGECRAFT_MAX_OUTPUT_BYTES   captured stdout/stderr cap per step
//   STAGECRAFT_EVENT_LOG          JSONL event sink

#include <cstdint>
#include <string>
#include <vector>

namespace stagecraft {

struct EngineConfig {
  std::string cache_root{".stagecraft/cache/v1"};
  std::string bases_dir{".stagecraft/bases"};
  std::string compression{"off"};
  std::uint64_t step_timeout_ms{0};
  std::size_t max_output_bytes{65536};
  std::string event_log;

  static EngineConfig from_env();
};

struct ConfigValidationResult {
  bool ok{false};
  std::string config_version;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

// Check a JSON config document without applying it. Unknown keys are
// warnings; wrong types and unsupported values are errors.
ConfigValidationResult validate_config(const std::string& config_json);

// Apply a JSON config file on top of `base`. On failure returns `base`
// unchanged and reports through *result.
EngineConfig load_config(const std::string& path, const EngineConfig& base,
                         ConfigValidationResult* result);

std::string config_to_json(const EngineConfig& config);

}  // namespace stagecraft
