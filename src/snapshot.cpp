#include "stagecraft/snapshot.hpp"

#include <sys/stat.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>

#include "stagecraft/hash.hpp"
#include "stagecraft/version.hpp"

namespace fs = std::filesystem;

namespace stagecraft {

namespace {

EntryKind kind_from_name(const std::string& s) {
  if (s == "dir") return EntryKind::directory;
  if (s == "symlink") return EntryKind::symlink;
  return EntryKind::file;
}

jsonlite::Value healthcheck_to_value(const HealthcheckSpec& hc) {
  jsonlite::Object o;
  o["command"] = jsonlite::to_array(hc.command);
  o["interval_ms"] = static_cast<std::int64_t>(hc.interval_ms);
  o["timeout_ms"] = static_cast<std::int64_t>(hc.timeout_ms);
  o["start_period_ms"] = static_cast<std::int64_t>(hc.start_period_ms);
  o["retries"] = static_cast<std::int64_t>(hc.retries);
  return o;
}

bool under_skip(const std::string& rel, const std::set<std::string>& skip) {
  for (const auto& s : skip) {
    if (rel == s) return true;
    if (rel.size() > s.size() && rel.compare(0, s.size(), s) == 0 && rel[s.size()] == '/')
      return true;
  }
  return false;
}

bool write_file(const fs::path& p, const std::string& data, std::uint32_t mode) {
  std::error_code ec;
  fs::create_directories(p.parent_path(), ec);
  std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
  if (!ofs) return false;
  ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
  if (!ofs) return false;
  ofs.close();
  return ::chmod(p.c_str(), static_cast<mode_t>(mode & 07777)) == 0;
}

// Remove whatever sits at `p` (file, symlink or directory tree) without
// following symlinks.
void remove_path(const fs::path& p) {
  std::error_code ec;
  const auto st = fs::symlink_status(p, ec);
  if (ec || !fs::exists(st)) return;
  if (fs::is_directory(st)) {
    // Children may have had their write bit cleared by a RUN step.
    for (auto it = fs::recursive_directory_iterator(p, fs::directory_options::none, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
      if (it->is_directory(ec) && !it->is_symlink(ec)) ::chmod(it->path().c_str(), 0755);
    }
    ::chmod(p.c_str(), 0755);
  }
  fs::remove_all(p, ec);
}

}  // namespace

std::string entry_kind_name(EntryKind kind) {
  switch (kind) {
    case EntryKind::file: return "file";
    case EntryKind::directory: return "dir";
    case EntryKind::symlink: return "symlink";
  }
  return "file";
}

jsonlite::Value tree_to_value(const FileTree& tree) {
  jsonlite::Object out;
  for (const auto& [path, e] : tree) {
    jsonlite::Object o;
    o["kind"] = entry_kind_name(e.kind);
    o["mode"] = static_cast<std::uint64_t>(e.mode);
    if (e.kind == EntryKind::file) {
      o["digest"] = e.digest;
      o["size"] = e.size;
    } else if (e.kind == EntryKind::symlink) {
      o["target"] = e.link_target;
    }
    out[path] = std::move(o);
  }
  return out;
}

jsonlite::Value runtime_config_to_value(const RuntimeConfig& config) {
  jsonlite::Object o;
  o["env"] = jsonlite::to_object(config.env);
  o["workdir"] = config.workdir;
  jsonlite::Array ports;
  for (int p : config.exposed_ports) ports.emplace_back(static_cast<std::uint64_t>(p));
  o["exposed_ports"] = std::move(ports);
  o["entrypoint"] = jsonlite::to_array(config.entrypoint);
  o["healthcheck"] = config.healthcheck ? healthcheck_to_value(*config.healthcheck)
                                        : jsonlite::Value{nullptr};
  return o;
}

std::optional<RuntimeConfig> runtime_config_from_value(const jsonlite::Object& obj) {
  RuntimeConfig c;
  c.env = jsonlite::get_string_map(obj, "env");
  c.workdir = jsonlite::get_string(obj, "workdir", "/");
  if (const auto* ports = jsonlite::get_array(obj, "exposed_ports")) {
    for (const auto& p : *ports) {
      const auto* u = std::get_if<std::uint64_t>(&p.v);
      if (!u || *u < 1 || *u > 65535) return std::nullopt;
      c.exposed_ports.insert(static_cast<int>(*u));
    }
  }
  c.entrypoint = jsonlite::get_string_array(obj, "entrypoint");
  if (const auto* hc = jsonlite::get_object(obj, "healthcheck")) {
    HealthcheckSpec spec;
    spec.command = jsonlite::get_string_array(*hc, "command");
    spec.interval_ms = jsonlite::get_i64(*hc, "interval_ms", spec.interval_ms);
    spec.timeout_ms = jsonlite::get_i64(*hc, "timeout_ms", spec.timeout_ms);
    spec.start_period_ms = jsonlite::get_i64(*hc, "start_period_ms", spec.start_period_ms);
    spec.retries = static_cast<int>(jsonlite::get_i64(*hc, "retries", spec.retries));
    c.healthcheck = std::move(spec);
  }
  return c;
}

std::string snapshot_to_json(const Snapshot& snapshot) {
  jsonlite::Object o;
  o["format_version"] = static_cast<std::uint64_t>(version::LAYER_FORMAT_VERSION);
  o["fingerprint"] = snapshot.fingerprint;
  o["parent"] = snapshot.parent_fingerprint;
  o["base_ref"] = snapshot.base_ref;
  o["created_by"] = snapshot.created_by;
  o["tree"] = tree_to_value(snapshot.tree);
  o["config"] = runtime_config_to_value(snapshot.config);
  return jsonlite::to_json(o);
}

std::optional<Snapshot> snapshot_from_json(const std::string& text, std::string* error) {
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(text, &err);
  if (err) {
    if (error) *error = err->code + ": " + err->message;
    return std::nullopt;
  }
  if (jsonlite::get_u64(obj, "format_version") != version::LAYER_FORMAT_VERSION) {
    if (error) *error = "unsupported layer format_version";
    return std::nullopt;
  }
  Snapshot s;
  s.fingerprint = jsonlite::get_string(obj, "fingerprint");
  s.parent_fingerprint = jsonlite::get_string(obj, "parent");
  s.base_ref = jsonlite::get_string(obj, "base_ref");
  s.created_by = jsonlite::get_string(obj, "created_by");
  if (const auto* tree = jsonlite::get_object(obj, "tree")) {
    for (const auto& [path, v] : *tree) {
      const auto* eo = std::get_if<jsonlite::Object>(&v.v);
      if (!eo) {
        if (error) *error = "malformed tree entry: " + path;
        return std::nullopt;
      }
      FileEntry e;
      e.kind = kind_from_name(jsonlite::get_string(*eo, "kind"));
      e.mode = static_cast<std::uint32_t>(jsonlite::get_u64(*eo, "mode", 0644));
      e.digest = jsonlite::get_string(*eo, "digest");
      e.size = jsonlite::get_u64(*eo, "size");
      e.link_target = jsonlite::get_string(*eo, "target");
      if (e.kind == EntryKind::file && !is_hex_digest(e.digest)) {
        if (error) *error = "tree entry without digest: " + path;
        return std::nullopt;
      }
      s.tree.emplace(path, std::move(e));
    }
  }
  const auto* cfg = jsonlite::get_object(obj, "config");
  auto config = cfg ? runtime_config_from_value(*cfg) : std::nullopt;
  if (!config) {
    if (error) *error = "malformed runtime config";
    return std::nullopt;
  }
  s.config = std::move(*config);
  return s;
}

std::string tree_digest(const FileTree& tree) {
  return tree_hash(jsonlite::to_json(tree_to_value(tree)));
}

void remove_materialized(const std::string& root_dir) {
  remove_path(fs::path(root_dir));
}

SyncResult sync_tree(const FileTree& tree, const std::string& root_dir,
                     const IContentStore& store, const FileTree* current) {
  SyncResult r;
  const fs::path root(root_dir);
  std::error_code ec;

  if (!current) {
    remove_path(root);
  }
  fs::create_directories(root, ec);
  if (ec) {
    r.error = "cannot create " + root_dir + ": " + ec.message();
    return r;
  }

  // Removals first, deepest paths first.
  if (current) {
    for (auto it = current->rbegin(); it != current->rend(); ++it) {
      auto want = tree.find(it->first);
      if (want == tree.end() || want->second.kind != it->second.kind) {
        remove_path(root / it->first);
        ++r.removed;
      }
    }
  }

  std::vector<std::pair<fs::path, std::uint32_t>> dir_modes;
  for (const auto& [path, e] : tree) {
    const fs::path p = root / path;
    const FileEntry* had = nullptr;
    if (current) {
      auto it = current->find(path);
      if (it != current->end()) had = &it->second;
    }
    if (e.kind == EntryKind::directory) {
      fs::create_directories(p, ec);
      if (ec) {
        r.error = "mkdir " + path + ": " + ec.message();
        return r;
      }
      ::chmod(p.c_str(), 0755);
      dir_modes.emplace_back(p, e.mode);
      if (!had) ++r.written;
      continue;
    }
    if (had && *had == e) continue;
    if (had) remove_path(p);
    if (e.kind == EntryKind::symlink) {
      fs::create_directories(p.parent_path(), ec);
      fs::create_symlink(e.link_target, p, ec);
      if (ec) {
        r.error = "symlink " + path + ": " + ec.message();
        return r;
      }
    } else {
      auto data = store.get(e.digest);
      if (!data) {
        r.error = "content store is missing or has a corrupt blob for " + path + " (" + e.digest + ")";
        return r;
      }
      if (!write_file(p, *data, e.mode)) {
        r.error = "write " + path + " failed";
        return r;
      }
    }
    ++r.written;
  }
  // Apply directory modes last so read-only directories can still be filled.
  for (auto it = dir_modes.rbegin(); it != dir_modes.rend(); ++it) {
    ::chmod(it->first.c_str(), static_cast<mode_t>(it->second & 07777));
  }
  r.ok = true;
  return r;
}

CaptureResult capture_tree(const std::string& root_dir, IContentStore& store,
                           const std::string& compression,
                           const std::set<std::string>& skip) {
  CaptureResult r;
  const fs::path root(root_dir);
  std::error_code ec;
  auto it = fs::recursive_directory_iterator(root, fs::directory_options::none, ec);
  if (ec) {
    r.error = "cannot read " + root_dir + ": " + ec.message();
    return r;
  }
  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      r.error = "walk " + root_dir + ": " + ec.message();
      return r;
    }
    const fs::path& p = it->path();
    const std::string rel = p.lexically_relative(root).generic_string();
    if (under_skip(rel, skip)) {
      if (it->is_directory(ec) && !it->is_symlink(ec)) it.disable_recursion_pending();
      continue;
    }
    struct stat st{};
    if (::lstat(p.c_str(), &st) != 0) {
      r.error = "lstat " + rel + " failed";
      return r;
    }
    FileEntry e;
    e.mode = static_cast<std::uint32_t>(st.st_mode & 07777);
    if (S_ISLNK(st.st_mode)) {
      e.kind = EntryKind::symlink;
      e.link_target = fs::read_symlink(p, ec).string();
      if (ec) {
        r.error = "readlink " + rel + ": " + ec.message();
        return r;
      }
      e.mode = 0777;
    } else if (S_ISDIR(st.st_mode)) {
      e.kind = EntryKind::directory;
    } else if (S_ISREG(st.st_mode)) {
      std::ifstream ifs(p, std::ios::binary);
      if (!ifs) {
        r.error = "cannot read " + rel;
        return r;
      }
      const std::string data((std::istreambuf_iterator<char>(ifs)),
                             std::istreambuf_iterator<char>());
      e.kind = EntryKind::file;
      e.size = data.size();
      const std::string digest = cas_content_hash(data);
      if (!store.contains(digest)) ++r.blobs_written;
      e.digest = store.put(data, compression);
      if (e.digest.empty()) {
        r.error = "content store write failed for " + rel;
        return r;
      }
    } else {
      // Sockets, FIFOs and device nodes are not part of an image.
      continue;
    }
    r.tree.emplace(rel, std::move(e));
  }
  r.ok = true;
  return r;
}

}  // namespace stagecraft
