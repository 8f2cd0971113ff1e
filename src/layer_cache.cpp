#include "stagecraft/layer_cache.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <functional>
#include <random>

#include "stagecraft/hash.hpp"

namespace fs = std::filesystem;

namespace stagecraft {

namespace {

bool write_entry_atomic(const fs::path& target, const std::string& line) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec) return false;
  const fs::path tmp = target.parent_path() / (".tmp_" + std::to_string(rng()));
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) return false;
    ofs << line << "\n";
    if (!ofs) {
      fs::remove(tmp, ec);
      return false;
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    fs::remove(tmp, ec);
    return false;
  }
  return true;
}

}  // namespace

LayerCache::LayerCache(std::shared_ptr<IContentStore> store, std::string root,
                       std::string compression)
    : store_(std::move(store)), root_(std::move(root)), compression_(std::move(compression)) {
  std::error_code ec;
  fs::create_directories(fs::path(root_) / "layers", ec);
}

std::string LayerCache::entry_path(const std::string& fingerprint) const {
  return (fs::path(root_) / "layers" / fingerprint.substr(0, 2) / fingerprint).string();
}

std::mutex& LayerCache::stripe_for(const std::string& fingerprint) {
  return write_stripes_[std::hash<std::string>{}(fingerprint) % kWriteStripes];
}

std::optional<std::string> LayerCache::record_digest(const std::string& fingerprint) const {
  std::ifstream ifs(entry_path(fingerprint));
  if (!ifs) return std::nullopt;
  std::string digest;
  std::getline(ifs, digest);
  if (!is_hex_digest(digest)) return std::nullopt;
  return digest;
}

std::optional<SnapshotHandle> LayerCache::load(const std::string& fingerprint,
                                               const std::string& digest) const {
  auto record = store_->get(digest);
  if (!record) {
    integrity_failures_.fetch_add(1, std::memory_order_relaxed);
    return std::nullopt;
  }
  std::string error;
  auto snapshot = snapshot_from_json(*record, &error);
  // A record filed under the wrong fingerprint is as bad as a corrupt one.
  if (!snapshot || snapshot->fingerprint != fingerprint) {
    integrity_failures_.fetch_add(1, std::memory_order_relaxed);
    return std::nullopt;
  }
  return std::make_shared<const Snapshot>(std::move(*snapshot));
}

std::optional<SnapshotHandle> LayerCache::get(const std::string& fingerprint) {
  if (!is_hex_digest(fingerprint)) {
    misses_.fetch_add(1, std::memory_order_relaxed);
    return std::nullopt;
  }
  {
    std::shared_lock<std::shared_mutex> lk(index_mu_);
    auto it = index_.find(fingerprint);
    if (it != index_.end()) {
      hits_.fetch_add(1, std::memory_order_relaxed);
      return it->second;
    }
  }

  // Not in memory: another process may have written it.
  auto digest = record_digest(fingerprint);
  std::optional<SnapshotHandle> loaded;
  if (digest) loaded = load(fingerprint, *digest);
  if (!loaded) {
    misses_.fetch_add(1, std::memory_order_relaxed);
    return std::nullopt;
  }
  {
    std::unique_lock<std::shared_mutex> lk(index_mu_);
    index_.emplace(fingerprint, *loaded);
  }
  hits_.fetch_add(1, std::memory_order_relaxed);
  return loaded;
}

bool LayerCache::put(const std::string& fingerprint, const SnapshotHandle& snapshot) {
  if (!snapshot || !is_hex_digest(fingerprint) || snapshot->fingerprint != fingerprint)
    return false;

  std::lock_guard<std::mutex> stripe(stripe_for(fingerprint));
  {
    std::shared_lock<std::shared_mutex> lk(index_mu_);
    if (index_.contains(fingerprint)) return true;
  }

  const std::string digest = store_->put(snapshot_to_json(*snapshot), compression_);
  if (digest.empty()) return false;
  if (record_digest(fingerprint) != digest) {
    if (!write_entry_atomic(entry_path(fingerprint), digest)) return false;
  }
  {
    std::unique_lock<std::shared_mutex> lk(index_mu_);
    index_.emplace(fingerprint, snapshot);
  }
  puts_.fetch_add(1, std::memory_order_relaxed);
  return true;
}

bool LayerCache::contains(const std::string& fingerprint) const {
  if (!is_hex_digest(fingerprint)) return false;
  {
    std::shared_lock<std::shared_mutex> lk(index_mu_);
    if (index_.contains(fingerprint)) return true;
  }
  std::error_code ec;
  return fs::exists(entry_path(fingerprint), ec);
}

std::vector<std::string> LayerCache::fingerprints() const {
  std::vector<std::string> out;
  std::error_code ec;
  const fs::path layers = fs::path(root_) / "layers";
  for (auto it = fs::recursive_directory_iterator(layers, ec);
       !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (!it->is_regular_file(ec)) continue;
    const std::string name = it->path().filename().string();
    if (is_hex_digest(name)) out.push_back(name);
  }
  std::sort(out.begin(), out.end());
  return out;
}

LayerCacheStats LayerCache::stats() const {
  LayerCacheStats s;
  s.entries = fingerprints().size();
  s.hits = hits_.load(std::memory_order_relaxed);
  s.misses = misses_.load(std::memory_order_relaxed);
  s.puts = puts_.load(std::memory_order_relaxed);
  s.integrity_failures = integrity_failures_.load(std::memory_order_relaxed);
  return s;
}

LayerVerifyReport LayerCache::verify() const {
  LayerVerifyReport report;
  for (const auto& fp : fingerprints()) {
    ++report.entries_checked;
    auto digest = record_digest(fp);
    auto snapshot = digest ? load(fp, *digest) : std::nullopt;
    if (!snapshot) {
      report.broken.push_back(fp);
      continue;
    }
    // The record is fine; every file blob it references must be too.
    for (const auto& [path, e] : (*snapshot)->tree) {
      if (e.kind == EntryKind::file && !store_->get(e.digest)) {
        report.broken.push_back(fp);
        break;
      }
    }
  }
  return report;
}

}  // namespace stagecraft
