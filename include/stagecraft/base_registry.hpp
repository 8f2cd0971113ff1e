#pragma once

// stagecraft/base_registry.hpp - Resolution of external base references.
//
// A reference resolves, in order, to:
//   "scratch"                  the empty snapshot
//   a registered base          register_base(ref, dir, config)
//   <bases_dir>/<sanitized>    a directory named after the reference with
//                              '/' and ':' replaced by '_'
//                              ("python:3.11-slim" -> "python_3.11-slim")
// The mapping is not injective: "python:3.11-slim" and "python_3.11-slim"
// name the same directory. Register a base explicitly to tell them apart.
// A base directory is captured into the content store once per process and
// fingerprinted as {ref, tree digest}, so editing the directory invalidates
// every layer built on it.

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "stagecraft/cas.hpp"
#include "stagecraft/snapshot.hpp"
#include "stagecraft/types.hpp"

namespace stagecraft {

class IBaseResolver {
 public:
  virtual ~IBaseResolver() = default;
  // Cheap existence check used by the planner; does not capture anything.
  virtual bool contains(const std::string& ref) const = 0;
  virtual std::optional<SnapshotHandle> resolve(const std::string& ref, BuildError* error) = 0;
};

class LocalBaseRegistry : public IBaseResolver {
 public:
  LocalBaseRegistry(std::string bases_dir, std::shared_ptr<IContentStore> store,
                    std::string compression = "off");

  void register_base(const std::string& ref, const std::string& dir,
                     RuntimeConfig config = {});

  bool contains(const std::string& ref) const override;
  std::optional<SnapshotHandle> resolve(const std::string& ref, BuildError* error) override;

  static std::string sanitize(const std::string& ref);

 private:
  struct Registered {
    std::string dir;
    RuntimeConfig config;
  };

  std::optional<std::string> directory_for(const std::string& ref) const;

  std::string bases_dir_;
  std::shared_ptr<IContentStore> store_;
  std::string compression_;

  mutable std::mutex mu_;
  std::map<std::string, Registered> registered_;
  std::map<std::string, SnapshotHandle> resolved_;
};

}  // namespace stagecraft
