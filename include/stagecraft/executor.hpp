#pragma once

// stagecraft/executor.hpp - Applies one stage's instructions on top of a
// base snapshot, consulting the layer cache for every step.
//
// STEP CONTRACT:
//   fingerprint = compute_fingerprint(previous fingerprint, instruction,
//                                     COPY input digests)
//   cache hit   -> reuse the cached snapshot, nothing executes
//   cache miss  -> execute, then put(fingerprint, new snapshot)
//   failure     -> the stage stops; the failed step is never cached
//
// RUN steps execute inside one scratch root filesystem per executor. The
// executor remembers which tree is on disk and only applies the difference
// before the next RUN. The scratch directory is removed when the executor
// is destroyed.

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "stagecraft/cas.hpp"
#include "stagecraft/layer_cache.hpp"
#include "stagecraft/recipe.hpp"
#include "stagecraft/snapshot.hpp"
#include "stagecraft/types.hpp"

namespace stagecraft {

struct BuildContext {
  std::string context_dir{"."};
  std::string work_root;  // scratch parent; defaults to <context>/.stagecraft/tmp
  std::uint64_t step_timeout_ms{0};
  std::size_t max_output_bytes{65536};
  const std::atomic<bool>* cancel{nullptr};
  std::string compression{"off"};
};

struct StepRecord {
  std::string stage;
  int index{0};
  std::string keyword;
  std::string summary;
  std::string fingerprint;
  bool cached{false};
  std::uint64_t duration_ns{0};
};

struct StageResult {
  bool ok{false};
  BuildError error;
  SnapshotHandle snapshot;
  std::vector<StepRecord> steps;
};

using StepCallback = std::function<void(const StepRecord&)>;

class StageExecutor {
 public:
  StageExecutor(ILayerCache& cache, IContentStore& store, BuildContext ctx);
  ~StageExecutor();
  StageExecutor(const StageExecutor&) = delete;
  StageExecutor& operator=(const StageExecutor&) = delete;

  // Called after every step, cached or executed.
  void set_step_callback(StepCallback cb) { on_step_ = std::move(cb); }

  StageResult run(const Stage& stage, const SnapshotHandle& base);

 private:
  struct StepOutcome {
    bool ok{false};
    BuildError error;
    FileTree tree;
    RuntimeConfig config;
  };

  StepOutcome execute_run(const RunInstr& run, const Snapshot& parent);
  StepOutcome execute_copy(const CopyInstr& copy, const Snapshot& parent);
  StepOutcome execute_metadata(const Instruction& instr, const Snapshot& parent);

  const std::string& scratch_rootfs();
  bool cancelled() const { return ctx_.cancel && ctx_.cancel->load(); }

  ILayerCache& cache_;
  IContentStore& store_;
  BuildContext ctx_;
  StepCallback on_step_;

  std::string scratch_;
  std::optional<FileTree> on_disk_;  // tree currently materialized in scratch_
};

// Resolve `path` against `workdir` into a normalized absolute path.
std::string resolve_in_workdir(const std::string& workdir, const std::string& path);

}  // namespace stagecraft
