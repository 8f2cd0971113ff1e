#include "stagecraft/version.hpp"

#include <sstream>

namespace stagecraft {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.engine_semver   = ENGINE_SEMVER;
  m.hash_primitive  = "blake3";
  // Deterministic within a single build.
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"fingerprint_schema\":" << m.fingerprint_schema
    << ",\"hash_algorithm\":" << m.hash_algorithm
    << ",\"cas_format\":" << m.cas_format
    << ",\"layer_format\":" << m.layer_format
    << ",\"descriptor_format\":" << m.descriptor_format
    << ",\"engine_semver\":\"" << m.engine_semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace stagecraft
