#include "stagecraft/base_registry.hpp"

#include <filesystem>

#include "stagecraft/fingerprint.hpp"

namespace fs = std::filesystem;

namespace stagecraft {

LocalBaseRegistry::LocalBaseRegistry(std::string bases_dir,
                                     std::shared_ptr<IContentStore> store,
                                     std::string compression)
    : bases_dir_(std::move(bases_dir)),
      store_(std::move(store)),
      compression_(std::move(compression)) {}

std::string LocalBaseRegistry::sanitize(const std::string& ref) {
  std::string out = ref;
  for (auto& c : out) {
    if (c == '/' || c == ':') c = '_';
  }
  return out;
}

void LocalBaseRegistry::register_base(const std::string& ref, const std::string& dir,
                                      RuntimeConfig config) {
  std::lock_guard<std::mutex> lk(mu_);
  registered_[ref] = Registered{dir, std::move(config)};
  resolved_.erase(ref);
}

std::optional<std::string> LocalBaseRegistry::directory_for(const std::string& ref) const {
  if (ref.empty() || ref == "." || ref == "..") return std::nullopt;
  std::error_code ec;
  const fs::path dir = fs::path(bases_dir_) / sanitize(ref);
  if (fs::is_directory(dir, ec)) return dir.string();
  return std::nullopt;
}

bool LocalBaseRegistry::contains(const std::string& ref) const {
  if (ref == "scratch") return true;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (registered_.contains(ref)) return true;
  }
  return directory_for(ref).has_value();
}

std::optional<SnapshotHandle> LocalBaseRegistry::resolve(const std::string& ref,
                                                         BuildError* error) {
  std::unique_lock<std::mutex> lk(mu_);
  if (auto it = resolved_.find(ref); it != resolved_.end()) return it->second;

  std::optional<std::string> dir;
  RuntimeConfig config;
  if (auto it = registered_.find(ref); it != registered_.end()) {
    dir = it->second.dir;
    config = it->second.config;
  } else if (ref != "scratch") {
    dir = directory_for(ref);
    if (!dir) {
      if (error) {
        *error = make_error(ErrorCode::base_unavailable, "no base found for '" + ref + "'");
      }
      return std::nullopt;
    }
  }

  auto snapshot = std::make_shared<Snapshot>();
  snapshot->base_ref = ref;
  snapshot->created_by = "FROM " + ref;
  snapshot->config = std::move(config);
  if (dir) {
    auto captured = capture_tree(*dir, *store_, compression_);
    if (!captured.ok) {
      if (error) {
        *error = make_error(ErrorCode::base_unavailable,
                            "cannot capture base '" + ref + "': " + captured.error);
      }
      return std::nullopt;
    }
    snapshot->tree = std::move(captured.tree);
  }
  snapshot->fingerprint =
      base_fingerprint(ref, tree_digest(snapshot->tree),
                       jsonlite::to_json(runtime_config_to_value(snapshot->config)));

  SnapshotHandle handle = std::move(snapshot);
  resolved_.emplace(ref, handle);
  return handle;
}

}  // namespace stagecraft
