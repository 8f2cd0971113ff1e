#include "stagecraft/cas.hpp"

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>

#if defined(STAGECRAFT_WITH_ZSTD)
#include <zstd.h>
#endif

#include "stagecraft/hash.hpp"
#include "stagecraft/jsonlite.hpp"

namespace fs = std::filesystem;

namespace stagecraft {

namespace {
#if defined(STAGECRAFT_WITH_ZSTD)
std::string compress_zstd(const std::string& data) {
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
  if (ZSTD_isError(n))
    return {};
  out.resize(n);
  return out;
}

std::string decompress_zstd(const std::string& data, std::size_t original_size) {
  std::string out;
  out.resize(original_size);
  size_t n = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
  if (ZSTD_isError(n))
    return {};
  out.resize(n);
  return out;
}
#endif

// Unique temporary filename so concurrent writers never share a tmp file.
std::string make_tmp_name(const fs::path& dir) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;
  return (dir / (".tmp_" + std::to_string(dist(rng)))).string();
}

// Atomic write: write to temp file, then rename into place.
bool atomic_write(const fs::path& target, const std::string& data) {
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec)
    return false;
  const std::string tmp = make_tmp_name(target.parent_path());
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs)
      return false;
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!ofs) {
      std::remove(tmp.c_str());
      return false;
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    std::remove(tmp.c_str());
    return false;
  }
  return true;
}

std::string info_to_json(const CasObjectInfo& info) {
  jsonlite::Object o;
  o["digest"] = info.digest;
  o["encoding"] = info.encoding;
  o["original_size"] = static_cast<std::uint64_t>(info.original_size);
  o["stored_size"] = static_cast<std::uint64_t>(info.stored_size);
  o["stored_blob_hash"] = info.stored_blob_hash;
  o["created_at"] = info.created_at_unix_ts;
  return jsonlite::to_json(o);
}

std::optional<CasObjectInfo> info_from_json(const std::string& text) {
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(text, &err);
  if (err)
    return std::nullopt;
  CasObjectInfo inf;
  inf.digest = jsonlite::get_string(obj, "digest");
  inf.encoding = jsonlite::get_string(obj, "encoding", "identity");
  inf.original_size = jsonlite::get_u64(obj, "original_size");
  inf.stored_size = jsonlite::get_u64(obj, "stored_size");
  inf.stored_blob_hash = jsonlite::get_string(obj, "stored_blob_hash");
  inf.created_at_unix_ts = jsonlite::get_u64(obj, "created_at");
  if (!is_hex_digest(inf.digest))
    return std::nullopt;
  return inf;
}

std::string read_file(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(ifs)),
                     std::istreambuf_iterator<char>());
}

}  // namespace

std::vector<std::string> supported_compression() {
#if defined(STAGECRAFT_WITH_ZSTD)
  return {"off", "zstd"};
#else
  return {"off"};
#endif
}

ContentStore::ContentStore(std::string root) : root_(std::move(root)) {
  std::error_code ec;
  fs::create_directories(fs::path(root_) / "objects", ec);
}

std::string ContentStore::object_path(const std::string& digest) const {
  return (fs::path(root_) / "objects" / digest.substr(0, 2) /
          digest.substr(2, 2) / digest)
      .string();
}

std::string ContentStore::meta_path(const std::string& digest) const {
  return object_path(digest) + ".meta";
}

std::string ContentStore::index_path() const {
  return (fs::path(root_) / "index.ndjson").string();
}

void ContentStore::load_index() const {
  std::lock_guard<std::mutex> lk(index_mu_);
  if (index_loaded_)
    return;

  std::ifstream ifs(index_path());
  std::string line;
  while (std::getline(ifs, line)) {
    if (line.empty())
      continue;
    // A torn trailing line from a crashed writer is skipped; the object's
    // .meta file is still authoritative for info().
    auto inf = info_from_json(line);
    if (inf)
      index_[inf->digest] = std::move(*inf);
  }
  index_loaded_ = true;
}

void ContentStore::save_index_entry(const CasObjectInfo& info) const {
  const std::string line = info_to_json(info) + "\n";
  std::lock_guard<std::mutex> lk(index_mu_);
  std::ofstream ofs(index_path(), std::ios::binary | std::ios::app);
  ofs.write(line.data(), static_cast<std::streamsize>(line.size()));
}

std::string ContentStore::put(const std::string& data,
                              const std::string& compression) {
  const std::string digest = cas_content_hash(data);
  if (!is_hex_digest(digest))
    return {};

  const fs::path target = object_path(digest);
  const fs::path meta = meta_path(digest);
  std::error_code ec;
  if (fs::exists(target, ec) && fs::exists(meta, ec)) {
    // Dedup, but never hand back a digest whose stored bytes are corrupt.
    auto existing = get(digest);
    if (existing.has_value())
      return digest;
  }

  std::string stored = data;
  std::string encoding = "identity";
#if defined(STAGECRAFT_WITH_ZSTD)
  if (compression == "zstd") {
    auto c = compress_zstd(data);
    if (!c.empty()) {
      stored = std::move(c);
      encoding = "zstd";
    }
  }
#else
  (void)compression;
#endif

  if (!atomic_write(target, stored))
    return {};

  CasObjectInfo info;
  info.digest = digest;
  info.encoding = encoding;
  info.original_size = data.size();
  info.stored_size = stored.size();
  info.stored_blob_hash = blake3_hex(stored);
  info.created_at_unix_ts = static_cast<uint64_t>(std::time(nullptr));

  if (!atomic_write(meta, info_to_json(info))) {
    fs::remove(target, ec);
    return {};
  }

  bool fresh = false;
  {
    std::lock_guard<std::mutex> lk(index_mu_);
    fresh = !index_.contains(digest);
    index_[digest] = info;
  }
  if (fresh)
    save_index_entry(info);
  return digest;
}

std::optional<CasObjectInfo> ContentStore::info(const std::string& digest) const {
  if (!is_hex_digest(digest))
    return std::nullopt;

  load_index();
  {
    std::lock_guard<std::mutex> lk(index_mu_);
    auto it = index_.find(digest);
    if (it != index_.end())
      return it->second;
  }

  // Written by another process after our index was loaded.
  std::error_code ec;
  if (!fs::exists(meta_path(digest), ec))
    return std::nullopt;
  auto inf = info_from_json(read_file(meta_path(digest)));
  if (!inf || inf->digest != digest)
    return std::nullopt;
  std::lock_guard<std::mutex> lk(index_mu_);
  index_[digest] = *inf;
  return inf;
}

std::optional<std::string> ContentStore::get(const std::string& digest) const {
  if (!is_hex_digest(digest))
    return std::nullopt;
  const fs::path p = object_path(digest);
  std::error_code ec;
  if (!fs::exists(p, ec))
    return std::nullopt;
  std::string data = read_file(p);

  auto meta = info(digest);
  if (!meta)
    return std::nullopt;

  // Stored blob hash is plain BLAKE3 over the bytes on disk.
  if (blake3_hex(data) != meta->stored_blob_hash)
    return std::nullopt;

  if (meta->encoding == "zstd") {
#if defined(STAGECRAFT_WITH_ZSTD)
    data = decompress_zstd(data, meta->original_size);
#else
    return std::nullopt;
#endif
  }

  if (cas_content_hash(data) != digest)
    return std::nullopt;
  return data;
}

bool ContentStore::contains(const std::string& digest) const {
  if (!is_hex_digest(digest))
    return false;
  std::error_code ec;
  return fs::exists(object_path(digest), ec);
}

std::size_t ContentStore::size() const {
  load_index();
  std::lock_guard<std::mutex> lk(index_mu_);
  return index_.size();
}

std::vector<CasObjectInfo> ContentStore::scan_objects(
    std::size_t limit, const std::string& start_after) const {
  load_index();
  std::vector<CasObjectInfo> out;
  std::lock_guard<std::mutex> lk(index_mu_);
  auto it = start_after.empty() ? index_.begin() : index_.upper_bound(start_after);
  for (; it != index_.end(); ++it) {
    if (limit > 0 && out.size() >= limit)
      break;
    out.push_back(it->second);
  }
  return out;
}

CasVerifyReport ContentStore::verify() const {
  CasVerifyReport report;
  std::string start_after;
  constexpr std::size_t batch_size = 1000;
  while (true) {
    auto batch = scan_objects(batch_size, start_after);
    for (const auto& obj : batch) {
      ++report.objects_checked;
      if (!get(obj.digest).has_value())
        report.corrupted.push_back(obj.digest);
      start_after = obj.digest;
    }
    if (batch.size() < batch_size)
      break;
  }
  return report;
}

}  // namespace stagecraft
