#pragma once

// stagecraft/snapshot.hpp - Immutable filesystem + runtime-config state
// produced by one build step.
//
// A Snapshot never owns file bytes: every regular file is a digest into the
// content store. Deriving a child snapshot copies the (path -> entry) map and
// shares all unchanged blobs with its parent, so earlier layers are never
// modified.

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "stagecraft/cas.hpp"
#include "stagecraft/jsonlite.hpp"

namespace stagecraft {

enum class EntryKind { file, directory, symlink };

struct FileEntry {
  EntryKind kind{EntryKind::file};
  std::string digest;  // content store key, files only
  std::uint64_t size{0};
  std::uint32_t mode{0644};
  std::string link_target;  // symlinks only

  bool operator==(const FileEntry&) const = default;
};

// Keys are rootfs-relative paths without a leading '/' ("app/server.py").
using FileTree = std::map<std::string, FileEntry>;

struct HealthcheckSpec {
  std::vector<std::string> command;
  std::int64_t interval_ms{30000};
  std::int64_t timeout_ms{30000};
  std::int64_t start_period_ms{0};
  int retries{3};

  bool operator==(const HealthcheckSpec&) const = default;
};

struct RuntimeConfig {
  std::map<std::string, std::string> env;
  std::string workdir{"/"};
  std::set<int> exposed_ports;
  std::vector<std::string> entrypoint;
  std::optional<HealthcheckSpec> healthcheck;

  bool operator==(const RuntimeConfig&) const = default;
};

struct Snapshot {
  std::string fingerprint;
  std::string parent_fingerprint;
  std::string base_ref;    // external base this chain started from
  std::string created_by;  // instruction summary, informational
  FileTree tree;
  RuntimeConfig config;
};

using SnapshotHandle = std::shared_ptr<const Snapshot>;

jsonlite::Value tree_to_value(const FileTree& tree);
jsonlite::Value runtime_config_to_value(const RuntimeConfig& config);
std::optional<RuntimeConfig> runtime_config_from_value(const jsonlite::Object& obj);

std::string snapshot_to_json(const Snapshot& snapshot);
std::optional<Snapshot> snapshot_from_json(const std::string& text, std::string* error);

// Digest over the canonical tree ("tree:" domain). Order-independent by
// construction since FileTree is sorted.
std::string tree_digest(const FileTree& tree);

std::string entry_kind_name(EntryKind kind);

struct SyncResult {
  bool ok{false};
  std::string error;
  std::size_t written{0};
  std::size_t removed{0};
};

// Make `root_dir` hold exactly `tree`. When `current` describes what is on
// disk already (the tree of the previous sync or capture), only the
// difference is applied; otherwise root_dir is cleared and fully rebuilt.
SyncResult sync_tree(const FileTree& tree, const std::string& root_dir,
                     const IContentStore& store, const FileTree* current);

// Remove a materialized root filesystem, including directories whose write
// bit was cleared by a RUN step.
void remove_materialized(const std::string& root_dir);

struct CaptureResult {
  bool ok{false};
  std::string error;
  FileTree tree;
  std::size_t blobs_written{0};
};

// Walk `root_dir` and build its FileTree, storing new file contents in the
// store. Entries under any path in `skip` (rootfs-relative) are ignored.
CaptureResult capture_tree(const std::string& root_dir, IContentStore& store,
                           const std::string& compression,
                           const std::set<std::string>& skip = {});

}  // namespace stagecraft
