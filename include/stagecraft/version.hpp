#pragma once

// stagecraft/version.hpp - Explicit version manifest for every persisted format.
//
// PURPOSE:
//   Prevent silent format drift across the fingerprint scheme, the content
//   store layout, the layer index and the image descriptor. Every component
//   that reads or writes a versioned format refers to its constant here.
//
// INVARIANT:
//   All version constants are compile-time. FINGERPRINT_SCHEMA_VERSION is
//   hashed into every fingerprint, so bumping it invalidates every cached
//   layer on purpose. Never bump it for a change that keeps layer contents
//   identical.

#include <cstdint>
#include <string>

namespace stagecraft {
namespace version {

constexpr const char* ENGINE_SEMVER = "0.3.0";

// ---------------------------------------------------------------------------
// FINGERPRINT_SCHEMA_VERSION
// Version 1 = BLAKE3("fp:" || canonical JSON {v, parent, instr, inputs}).
// ---------------------------------------------------------------------------
constexpr uint32_t FINGERPRINT_SCHEMA_VERSION = 1;

// ---------------------------------------------------------------------------
// HASH_ALGORITHM_VERSION
// Version 1 = BLAKE3 (BLAKE3_OUT_LEN=32 bytes, hex-encoded to 64 chars).
// ---------------------------------------------------------------------------
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

// ---------------------------------------------------------------------------
// CAS_FORMAT_VERSION
// On-disk layout of content store blobs and their .meta sidecars.
// Version 1 = AB/CD/<64-char-digest> sharding with JSON .meta files.
// ---------------------------------------------------------------------------
constexpr uint32_t CAS_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// LAYER_FORMAT_VERSION
// Layer index entries (<root>/layers/AB/<fingerprint>) and snapshot records.
// ---------------------------------------------------------------------------
constexpr uint32_t LAYER_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// DESCRIPTOR_FORMAT_VERSION
// Canonical JSON schema of ImageDescriptor. Adding or removing a field
// requires a bump because the descriptor digest covers every field.
// ---------------------------------------------------------------------------
constexpr uint32_t DESCRIPTOR_FORMAT_VERSION = 1;

struct VersionManifest {
  uint32_t fingerprint_schema{FINGERPRINT_SCHEMA_VERSION};
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  uint32_t cas_format{CAS_FORMAT_VERSION};
  uint32_t layer_format{LAYER_FORMAT_VERSION};
  uint32_t descriptor_format{DESCRIPTOR_FORMAT_VERSION};
  std::string engine_semver;
  std::string hash_primitive;
  std::string build_timestamp;  // from __DATE__/__TIME__
};

VersionManifest current_manifest();

std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace stagecraft
