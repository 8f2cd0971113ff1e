#pragma once

#include <string>
#include <string_view>

namespace stagecraft {

struct HashRuntimeInfo {
  std::string primitive;
  std::string backend;
  std::string version;
  bool blake3_available{false};
};

// Core BLAKE3 hashing (64-char lowercase hex).
std::string blake3_hex(std::string_view payload);
HashRuntimeInfo hash_runtime_info();

// Stream-hash a file in 64 KB chunks and return a 64-char hex digest.
// Returns "" if the file cannot be opened.
std::string hash_file_blake3_hex(const std::string& path);

// Domain-separated hashing. The prefixes are part of the on-disk contract:
//   "cas:"  content store keys
//   "fp:"   layer fingerprints
//   "base:" external base identities
//   "tree:" file tree digests
//   "img:"  image descriptor digests
std::string hash_domain(std::string_view domain, std::string_view payload);
std::string cas_content_hash(std::string_view raw_bytes);
std::string fingerprint_hash(std::string_view canonical_json);
std::string tree_hash(std::string_view canonical_json);
std::string descriptor_hash(std::string_view canonical_json);

// True for a 64-char lowercase hex string.
bool is_hex_digest(std::string_view digest);

}  // namespace stagecraft
