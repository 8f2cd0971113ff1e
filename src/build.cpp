#include "stagecraft/build.hpp"

#include <map>

#include "stagecraft/observability.hpp"
#include "stagecraft/planner.hpp"

namespace stagecraft {

std::string BuildResult::to_json() const {
  jsonlite::Object o;
  o["ok"] = ok;
  jsonlite::Array step_list;
  for (const auto& s : steps) {
    jsonlite::Object st;
    st["stage"] = s.stage;
    st["index"] = static_cast<std::int64_t>(s.index);
    st["instruction"] = s.keyword;
    st["fingerprint"] = s.fingerprint;
    st["cached"] = s.cached;
    step_list.emplace_back(std::move(st));
  }
  o["steps"] = std::move(step_list);

  jsonlite::Object m;
  m["steps_executed"] = metrics.steps_executed;
  m["cache_hits"] = metrics.cache_hits;
  m["cache_misses"] = metrics.cache_misses;
  m["duration_ms"] = metrics.duration_ns / 1000000;
  o["metrics"] = std::move(m);

  if (image) {
    std::optional<jsonlite::JsonError> err;
    o["image"] = jsonlite::parse(descriptor_to_json(*image), &err);
  }
  if (!ok) {
    std::optional<jsonlite::JsonError> err;
    o["error"] = jsonlite::parse(error.to_json(), &err);
  }
  return jsonlite::to_json(o);
}

namespace {

BuildResult build_stages(const Recipe& recipe, const BuildOptions& options,
                         ILayerCache& cache, IContentStore& store,
                         IBaseResolver& resolver) {
  BuildResult result;
  auto fail = [&](BuildError err) {
    result.ok = false;
    result.error = std::move(err);
    return result;
  };

  const PlanResult plan = plan_build(recipe, resolver, options.target);
  if (!plan.ok) return fail(plan.error);

  StageExecutor executor(cache, store, options.context);
  executor.set_step_callback([&](const StepRecord& rec) {
    if (rec.cached) {
      ++result.metrics.cache_hits;
    } else {
      ++result.metrics.cache_misses;
      ++result.metrics.steps_executed;
    }
    if (options.on_step) options.on_step(rec);
  });

  struct Built {
    SnapshotHandle snapshot;
    std::vector<std::string> layers;
  };
  std::map<std::string, Built> built;
  std::vector<std::string> stage_order;

  for (std::size_t idx : plan.order) {
    const Stage& stage = recipe.stages[idx];
    stage_order.push_back(stage.name);

    Built b;
    SnapshotHandle base;
    auto parent = built.find(stage.base);
    if (parent != built.end()) {
      base = parent->second.snapshot;
      b.layers = parent->second.layers;
    } else {
      BuildError err;
      auto resolved = resolver.resolve(stage.base, &err);
      if (!resolved) {
        err.stage = stage.name;
        return fail(std::move(err));
      }
      base = *resolved;
      b.layers.push_back(base->fingerprint);
    }

    StageResult sr = executor.run(stage, base);
    for (auto& rec : sr.steps) {
      b.layers.push_back(rec.fingerprint);
      result.steps.push_back(std::move(rec));
    }
    if (!sr.ok) return fail(std::move(sr.error));
    b.snapshot = sr.snapshot;
    built[stage.name] = std::move(b);
  }

  const Stage& target = recipe.stages[plan.target];
  const Built& final_stage = built.at(target.name);
  AssembleResult assembled = assemble_image(*final_stage.snapshot, target.name,
                                            stage_order, final_stage.layers);
  if (!assembled.ok) return fail(std::move(assembled.error));

  result.image = std::move(assembled.image);
  result.ok = true;
  return result;
}

}  // namespace

BuildResult build_image(const Recipe& recipe, const BuildOptions& options,
                        ILayerCache& cache, IContentStore& store,
                        IBaseResolver& resolver) {
  auto& stats = global_engine_stats();
  stats.builds_started.fetch_add(1, std::memory_order_relaxed);
  std::uint64_t duration_ns = 0;
  BuildResult result;
  {
    ScopeTimer timer(duration_ns);
    result = build_stages(recipe, options, cache, store, resolver);
  }
  result.metrics.duration_ns = duration_ns;
  if (result.ok) {
    stats.builds_succeeded.fetch_add(1, std::memory_order_relaxed);
  } else {
    stats.builds_failed.fetch_add(1, std::memory_order_relaxed);
    stats.record_failure(result.error.code);
  }
  return result;
}

}  // namespace stagecraft
