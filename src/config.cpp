#include "stagecraft/config.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <set>
#include <variant>

#include "stagecraft/cas.hpp"
#include "stagecraft/jsonlite.hpp"

namespace stagecraft {

namespace {

const std::set<std::string>& known_string_keys() {
  static const std::set<std::string> keys = {"config_version", "cache_dir", "bases_dir",
                                             "compression", "event_log"};
  return keys;
}

const std::set<std::string>& known_integer_keys() {
  static const std::set<std::string> keys = {"step_timeout_ms", "max_output_bytes"};
  return keys;
}

std::string env_or(const char* key, const std::string& def) {
  const char* v = std::getenv(key);
  return (v && v[0]) ? std::string(v) : def;
}

std::uint64_t env_u64_or(const char* key, std::uint64_t def) {
  const char* v = std::getenv(key);
  if (!v || !v[0])
    return def;
  char* end = nullptr;
  const unsigned long long parsed = std::strtoull(v, &end, 10);
  if (end == v || *end != '\0')
    return def;
  return parsed;
}

}  // namespace

EngineConfig EngineConfig::from_env() {
  EngineConfig c;
  c.cache_root = env_or("STAGECRAFT_CACHE_DIR", c.cache_root);
  c.bases_dir = env_or("STAGECRAFT_BASES_DIR", c.bases_dir);
  c.compression = env_or("STAGECRAFT_CAS_COMPRESSION", c.compression);
  c.step_timeout_ms = env_u64_or("STAGECRAFT_STEP_TIMEOUT_MS", c.step_timeout_ms);
  c.max_output_bytes = env_u64_or("STAGECRAFT_MAX_OUTPUT_BYTES", c.max_output_bytes);
  c.event_log = env_or("STAGECRAFT_EVENT_LOG", c.event_log);
  return c;
}

ConfigValidationResult validate_config(const std::string& config_json) {
  ConfigValidationResult r;
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(config_json, &err);
  if (err) {
    r.errors.push_back(err->code + ": " + err->message);
    return r;
  }

  for (const auto& [key, value] : obj) {
    if (known_string_keys().contains(key)) {
      if (!std::holds_alternative<std::string>(value.v))
        r.errors.push_back(key + ": expected string");
    } else if (known_integer_keys().contains(key)) {
      if (!std::holds_alternative<std::uint64_t>(value.v))
        r.errors.push_back(key + ": expected non-negative integer");
    } else {
      r.warnings.push_back("unknown key: " + key);
    }
  }

  r.config_version = jsonlite::get_string(obj, "config_version");
  if (r.config_version.empty())
    r.warnings.push_back("config_version not set");

  if (obj.contains("compression")) {
    const std::string comp = jsonlite::get_string(obj, "compression");
    if (comp != "off" && comp != "zstd") {
      r.errors.push_back("compression: unsupported value '" + comp + "'");
    } else {
      const auto supported = supported_compression();
      if (std::find(supported.begin(), supported.end(), comp) == supported.end())
        r.warnings.push_back("compression: '" + comp + "' not available in this build, objects will be stored uncompressed");
    }
  }
  if (obj.contains("max_output_bytes") && jsonlite::get_u64(obj, "max_output_bytes", 1) == 0)
    r.errors.push_back("max_output_bytes: must be positive");

  r.ok = r.errors.empty();
  return r;
}

EngineConfig load_config(const std::string& path, const EngineConfig& base,
                         ConfigValidationResult* result) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    if (result) {
      *result = ConfigValidationResult{};
      result->errors.push_back("cannot read config file: " + path);
    }
    return base;
  }
  const std::string text((std::istreambuf_iterator<char>(ifs)),
                         std::istreambuf_iterator<char>());
  ConfigValidationResult r = validate_config(text);
  if (result)
    *result = r;
  if (!r.ok)
    return base;

  auto obj = jsonlite::parse(text, nullptr);
  EngineConfig c = base;
  c.cache_root = jsonlite::get_string(obj, "cache_dir", c.cache_root);
  c.bases_dir = jsonlite::get_string(obj, "bases_dir", c.bases_dir);
  c.compression = jsonlite::get_string(obj, "compression", c.compression);
  c.event_log = jsonlite::get_string(obj, "event_log", c.event_log);
  c.step_timeout_ms = jsonlite::get_u64(obj, "step_timeout_ms", c.step_timeout_ms);
  c.max_output_bytes = jsonlite::get_u64(obj, "max_output_bytes", c.max_output_bytes);
  return c;
}

std::string config_to_json(const EngineConfig& config) {
  jsonlite::Object o;
  o["cache_dir"] = config.cache_root;
  o["bases_dir"] = config.bases_dir;
  o["compression"] = config.compression;
  o["step_timeout_ms"] = config.step_timeout_ms;
  o["max_output_bytes"] = static_cast<std::uint64_t>(config.max_output_bytes);
  o["event_log"] = config.event_log;
  return jsonlite::to_json(o);
}

}  // namespace stagecraft
