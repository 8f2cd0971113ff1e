#pragma once

// stagecraft/layer_cache.hpp - Fingerprint -> Snapshot index.
//
// LAYOUT:
//   <root>/layers/AB/<fingerprint>   content-store digest of the snapshot
//                                    record (one line, written atomically)
//   <content store>                  the snapshot record itself
//
// Every read goes through the content store, so a corrupted record is
// reported as a miss plus an integrity failure, never returned.
//
// CONCURRENCY:
//   get() takes a shared lock on the in-memory index only. put() is
//   idempotent; writers to the same fingerprint stripe are serialized to
//   avoid duplicate work, not for correctness: a fingerprint always maps
//   to identical content.

#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "stagecraft/cas.hpp"
#include "stagecraft/snapshot.hpp"

namespace stagecraft {

class ILayerCache {
 public:
  virtual ~ILayerCache() = default;
  virtual std::optional<SnapshotHandle> get(const std::string& fingerprint) = 0;
  virtual bool put(const std::string& fingerprint, const SnapshotHandle& snapshot) = 0;
};

struct LayerCacheStats {
  std::uint64_t entries{0};
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t puts{0};
  std::uint64_t integrity_failures{0};
};

struct LayerVerifyReport {
  std::size_t entries_checked{0};
  std::vector<std::string> broken;  // fingerprints whose record is unusable
  bool ok() const { return broken.empty(); }
};

class LayerCache : public ILayerCache {
 public:
  LayerCache(std::shared_ptr<IContentStore> store, std::string root,
             std::string compression = "off");

  std::optional<SnapshotHandle> get(const std::string& fingerprint) override;
  bool put(const std::string& fingerprint, const SnapshotHandle& snapshot) override;

  bool contains(const std::string& fingerprint) const;
  LayerCacheStats stats() const;
  std::vector<std::string> fingerprints() const;
  LayerVerifyReport verify() const;

  const std::string& root() const { return root_; }

 private:
  static constexpr std::size_t kWriteStripes = 64;

  std::string entry_path(const std::string& fingerprint) const;
  std::optional<std::string> record_digest(const std::string& fingerprint) const;
  std::optional<SnapshotHandle> load(const std::string& fingerprint,
                                     const std::string& digest) const;
  std::mutex& stripe_for(const std::string& fingerprint);

  std::shared_ptr<IContentStore> store_;
  std::string root_;
  std::string compression_;

  mutable std::shared_mutex index_mu_;
  std::unordered_map<std::string, SnapshotHandle> index_;
  std::array<std::mutex, kWriteStripes> write_stripes_;

  std::atomic<std::uint64_t> hits_{0};
  std::atomic<std::uint64_t> misses_{0};
  std::atomic<std::uint64_t> puts_{0};
  mutable std::atomic<std::uint64_t> integrity_failures_{0};
};

}  // namespace stagecraft
