#pragma once

// stagecraft/cas.hpp - Content-addressed blob storage.
//
// DESIGN INVARIANTS (must not be broken by any implementation):
//   1. Key = BLAKE3("cas:" + original_bytes). Content-addressed, never
//      location-addressed.
//   2. Writes are atomic: tmp+rename on the same filesystem.
//   3. Reads verify integrity: stored_blob_hash and the content key are both
//      checked before data is returned.
//   4. Fail-closed: an integrity failure returns nullopt, never corrupted
//      data.
//   5. Deduplication: a second put() of the same content returns the same
//      digest without rewriting the object.
//
// File contents of every Snapshot and every Snapshot record live here. Blobs
// are never modified after they are written, which is what makes snapshot
// trees copy-on-write.

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace stagecraft {

struct CasObjectInfo {
  std::string digest;
  std::string encoding{"identity"};
  std::size_t original_size{0};
  std::size_t stored_size{0};
  std::string stored_blob_hash;
  uint64_t created_at_unix_ts{0};
};

struct CasVerifyReport {
  std::size_t objects_checked{0};
  std::vector<std::string> corrupted;  // digests failing the integrity check
  bool ok() const { return corrupted.empty(); }
};

// Abstract storage interface. Implementations MUST be safe for concurrent
// calls from several build pipelines.
class IContentStore {
 public:
  virtual ~IContentStore() = default;

  // Store data. Returns the content digest on success, "" on failure.
  // compression: "off" (identity) or "zstd" (if built with
  // STAGECRAFT_WITH_ZSTD). Idempotent.
  virtual std::string put(const std::string& data,
                          const std::string& compression = "off") = 0;

  // Retrieve data by digest. Returns nullopt if missing or corrupted.
  virtual std::optional<std::string> get(const std::string& digest) const = 0;

  virtual bool contains(const std::string& digest) const = 0;
  virtual std::optional<CasObjectInfo> info(const std::string& digest) const = 0;

  // Enumerate stored objects in digest order. limit 0 = unlimited.
  virtual std::vector<CasObjectInfo> scan_objects(
      std::size_t limit = 0, const std::string& start_after = "") const = 0;

  virtual std::size_t size() const = 0;
  virtual std::string backend_id() const = 0;
};

// Local filesystem store. Objects are sharded as
//   <root>/objects/AB/CD/<digest>
//   <root>/objects/AB/CD/<digest>.meta
// with an append-only <root>/index.ndjson for fast enumeration.
class ContentStore : public IContentStore {
 public:
  explicit ContentStore(std::string root = ".stagecraft/cache/v1/cas");

  std::string put(const std::string& data,
                  const std::string& compression = "off") override;
  std::optional<std::string> get(const std::string& digest) const override;
  bool contains(const std::string& digest) const override;
  std::optional<CasObjectInfo> info(const std::string& digest) const override;
  std::vector<CasObjectInfo> scan_objects(
      std::size_t limit = 0,
      const std::string& start_after = "") const override;
  std::size_t size() const override;
  std::string backend_id() const override { return "local_fs"; }

  // Re-read every object and report the ones whose bytes no longer match
  // their digest.
  CasVerifyReport verify() const;

  const std::string& root() const { return root_; }
  std::string object_path(const std::string& digest) const;

 private:
  std::string meta_path(const std::string& digest) const;
  std::string index_path() const;
  void load_index() const;
  void save_index_entry(const CasObjectInfo& info) const;

  std::string root_;
  mutable std::mutex index_mu_;
  mutable std::map<std::string, CasObjectInfo> index_;
  mutable bool index_loaded_{false};
};

// Compression modes accepted by this build ("off", plus "zstd" when linked).
std::vector<std::string> supported_compression();

}  // namespace stagecraft
