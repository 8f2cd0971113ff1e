#include "stagecraft/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>

#include "stagecraft/jsonlite.hpp"

namespace stagecraft {

namespace {

// std::bit_width gives floor(log2(x)) + 1 in O(1) (BSR/CLZ).
inline size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

std::atomic<StepEventHook> g_step_hook{nullptr};
std::atomic<HealthEventHook> g_health_hook{nullptr};

std::mutex g_log_mu;
std::string g_log_path_override;

std::string event_log_path() {
  {
    std::lock_guard<std::mutex> lk(g_log_mu);
    if (!g_log_path_override.empty()) return g_log_path_override;
  }
  const char* p = std::getenv("STAGECRAFT_EVENT_LOG");
  return (p && p[0]) ? std::string(p) : std::string();
}

void append_line(const std::string& json) {
  const std::string path = event_log_path();
  if (path.empty()) return;
  const std::string line = json + "\n";
  // O_APPEND makes single small writes atomic across processes.
  std::lock_guard<std::mutex> lk(g_log_mu);
  if (FILE* f = std::fopen(path.c_str(), "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  const size_t b = bucket_for_us(us);
  buckets_[b].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  uint64_t counts[kBuckets];
  for (size_t i = 0; i < kBuckets; ++i) {
    counts[i] = buckets_[i].load(std::memory_order_relaxed);
  }

  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += counts[i];
    if (cumulative >= target) {
      // Midpoint of bucket i. Bucket 0 covers [0,1)us.
      const double bucket_lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double bucket_hi = static_cast<double>(1ULL << i);
      return (bucket_lo + bucket_hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(192);
  char buf[32];
  out += "{\"count\":";
  out += std::to_string(count());
  out += ",\"mean_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", mean_us());
  out += buf;
  out += ",\"p50_ms\":";
  std::snprintf(buf, sizeof(buf), "%.3f", percentile(0.50) / 1000.0);
  out += buf;
  out += ",\"p95_ms\":";
  std::snprintf(buf, sizeof(buf), "%.3f", percentile(0.95) / 1000.0);
  out += buf;
  out += ",\"p99_ms\":";
  std::snprintf(buf, sizeof(buf), "%.3f", percentile(0.99) / 1000.0);
  out += buf;
  out += '}';
  return out;
}

void EngineStats::record_failure(ErrorCode code) {
  if (code == ErrorCode::none) return;
  std::lock_guard<std::mutex> lk(failure_mu_);
  ++failures_by_code_[to_string(code)];
}

void EngineStats::record_step(const StepEvent& ev) {
  if (ev.cached) {
    cache_hits.fetch_add(1, std::memory_order_relaxed);
  } else {
    cache_misses.fetch_add(1, std::memory_order_relaxed);
    steps_executed.fetch_add(1, std::memory_order_relaxed);
    if (ev.ok) cache_puts.fetch_add(1, std::memory_order_relaxed);
    step_latency.record(ev.duration_ns);
  }
}

void EngineStats::record_health(const HealthEvent& ev) {
  if (ev.from != ev.to) transitions.fetch_add(1, std::memory_order_relaxed);
}

void EngineStats::record_probe(bool ok, uint64_t duration_ns) {
  probes_run.fetch_add(1, std::memory_order_relaxed);
  probe_latency.record(duration_ns);
  if (!ok) probe_failures.fetch_add(1, std::memory_order_relaxed);
}

std::string EngineStats::to_json() const {
  const uint64_t hits = cache_hits.load(std::memory_order_relaxed);
  const uint64_t misses = cache_misses.load(std::memory_order_relaxed);
  const double hit_rate = (hits + misses) > 0
      ? static_cast<double>(hits) / static_cast<double>(hits + misses)
      : 0.0;

  jsonlite::Object builds;
  builds["started"] = builds_started.load(std::memory_order_relaxed);
  builds["succeeded"] = builds_succeeded.load(std::memory_order_relaxed);
  builds["failed"] = builds_failed.load(std::memory_order_relaxed);

  jsonlite::Object cache;
  cache["hits"] = hits;
  cache["misses"] = misses;
  cache["puts"] = cache_puts.load(std::memory_order_relaxed);
  cache["hit_rate"] = hit_rate;

  jsonlite::Object health;
  health["probes_run"] = probes_run.load(std::memory_order_relaxed);
  health["probe_failures"] = probe_failures.load(std::memory_order_relaxed);
  health["transitions"] = transitions.load(std::memory_order_relaxed);

  jsonlite::Object failures;
  {
    std::lock_guard<std::mutex> lk(failure_mu_);
    for (const auto& [code, n] : failures_by_code_) failures[code] = n;
  }

  jsonlite::Object o;
  o["builds"] = std::move(builds);
  o["steps_executed"] = steps_executed.load(std::memory_order_relaxed);
  o["cache"] = std::move(cache);
  o["health"] = std::move(health);
  o["failures"] = std::move(failures);
  // Histograms already serialize themselves; splice them in textually.
  std::string out = jsonlite::to_json(o);
  out.pop_back();
  out += ",\"step_latency\":" + step_latency.to_json();
  out += ",\"probe_latency\":" + probe_latency.to_json();
  out += "}";
  return out;
}

EngineStats& global_engine_stats() {
  static EngineStats inst;
  return inst;
}

void set_step_event_hook(StepEventHook hook) {
  g_step_hook.store(hook, std::memory_order_release);
}

void set_health_event_hook(HealthEventHook hook) {
  g_health_hook.store(hook, std::memory_order_release);
}

void set_event_log_path(const std::string& path) {
  std::lock_guard<std::mutex> lk(g_log_mu);
  g_log_path_override = path;
}

std::string step_event_to_json(const StepEvent& ev) {
  jsonlite::Object o;
  o["event"] = "step";
  o["stage"] = ev.stage;
  o["index"] = static_cast<std::int64_t>(ev.index);
  o["instruction"] = ev.instruction;
  o["fingerprint"] = ev.fingerprint;
  o["cached"] = ev.cached;
  o["ok"] = ev.ok;
  o["error_code"] = ev.error_code;
  o["duration_ns"] = ev.duration_ns;
  return jsonlite::to_json(o);
}

std::string health_event_to_json(const HealthEvent& ev) {
  jsonlite::Object o;
  o["event"] = "health";
  o["from"] = ev.from;
  o["to"] = ev.to;
  o["reason"] = ev.reason;
  o["exit_code"] = static_cast<std::int64_t>(ev.exit_code);
  o["probe_duration_ns"] = ev.probe_duration_ns;
  o["probe_ok"] = ev.probe_ok;
  o["consecutive_failures"] = static_cast<std::int64_t>(ev.consecutive_failures);
  o["error_code"] = ev.error_code;
  o["at_ms"] = ev.at_ms;
  return jsonlite::to_json(o);
}

void emit_step_event(const StepEvent& ev) {
  global_engine_stats().record_step(ev);

  StepEventHook hook = g_step_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }
  append_line(step_event_to_json(ev));
}

void emit_health_event(const HealthEvent& ev) {
  global_engine_stats().record_health(ev);

  HealthEventHook hook = g_health_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }
  append_line(health_event_to_json(ev));
}

}  // namespace stagecraft
