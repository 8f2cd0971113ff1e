#pragma once

// stagecraft/build.hpp - End-to-end build: plan, execute every stage in plan
// order, assemble the target stage into an ImageDescriptor.
//
// A failure anywhere aborts the build: no descriptor is produced. Steps that
// completed before the failure stay in the layer cache, so the next build
// resumes at the failed step.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "stagecraft/assembler.hpp"
#include "stagecraft/base_registry.hpp"
#include "stagecraft/cas.hpp"
#include "stagecraft/executor.hpp"
#include "stagecraft/layer_cache.hpp"
#include "stagecraft/recipe.hpp"
#include "stagecraft/types.hpp"

namespace stagecraft {

struct BuildOptions {
  std::string target;  // "" = last declared stage
  BuildContext context;
  StepCallback on_step;
};

struct BuildMetrics {
  std::uint64_t steps_executed{0};
  std::uint64_t cache_hits{0};
  std::uint64_t cache_misses{0};
  std::uint64_t duration_ns{0};
};

struct BuildResult {
  bool ok{false};
  BuildError error;
  std::optional<ImageDescriptor> image;
  std::vector<StepRecord> steps;
  BuildMetrics metrics;

  std::string to_json() const;
};

BuildResult build_image(const Recipe& recipe, const BuildOptions& options,
                        ILayerCache& cache, IContentStore& store,
                        IBaseResolver& resolver);

}  // namespace stagecraft
