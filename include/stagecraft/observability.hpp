#pragma once

// stagecraft/observability.hpp - Structured build and runtime events.
//
// DESIGN:
//   Two observable units:
//     StepEvent   - one per build step (cache hit or execution).
//     HealthEvent - one per supervisor state transition or runtime error.
//   Each event is recorded into the process-wide EngineStats and, when an
//   event log is configured (STAGECRAFT_EVENT_LOG or set_event_log_path()),
//   appended to it as one JSON line. A registered hook replaces the file
//   sink.
//
//   Event attributes carry only digests and metadata, never process output.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

#include "stagecraft/types.hpp"

namespace stagecraft {

struct StepEvent {
  std::string stage;
  int index{0};
  std::string instruction;  // instruction keyword, e.g. "RUN"
  std::string fingerprint;
  bool cached{false};
  bool ok{true};
  std::string error_code;
  uint64_t duration_ns{0};
};

struct HealthEvent {
  std::string from;
  std::string to;
  std::string reason;
  int exit_code{0};
  uint64_t probe_duration_ns{0};  // 0 when no probe was involved
  bool probe_ok{true};
  int consecutive_failures{0};
  std::string error_code;
  uint64_t at_ms{0};  // milliseconds since launch
};

// Power-of-two bucket histogram. Bucket i covers [2^(i-1), 2^i) us.
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(uint64_t duration_ns);

  // Approximate percentile in microseconds, p in [0.0, 1.0].
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  uint64_t sum_us() const { return sum_us_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  alignas(64) std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<uint64_t> count_{0};
  alignas(64) std::atomic<uint64_t> sum_us_{0};
};

// Thread-safe aggregate statistics. Exposed by `stagecraft doctor` and
// `stagecraft cache stats`.
class EngineStats {
 public:
  void record_step(const StepEvent& ev);
  void record_health(const HealthEvent& ev);
  // Probes are counted whether or not they cause a transition.
  void record_probe(bool ok, uint64_t duration_ns);
  void record_failure(ErrorCode code);
  std::string to_json() const;

  std::atomic<uint64_t> builds_started{0};
  std::atomic<uint64_t> builds_succeeded{0};
  std::atomic<uint64_t> builds_failed{0};

  std::atomic<uint64_t> steps_executed{0};
  std::atomic<uint64_t> cache_hits{0};
  std::atomic<uint64_t> cache_misses{0};
  std::atomic<uint64_t> cache_puts{0};

  std::atomic<uint64_t> probes_run{0};
  std::atomic<uint64_t> probe_failures{0};
  std::atomic<uint64_t> transitions{0};

  LatencyHistogram step_latency;
  LatencyHistogram probe_latency;

 private:
  mutable std::mutex failure_mu_;
  std::map<std::string, uint64_t> failures_by_code_;
};

EngineStats& global_engine_stats();

// Emit events (fire-and-forget; I/O errors on the sink are ignored so a
// broken log never fails a build).
void emit_step_event(const StepEvent& ev);
void emit_health_event(const HealthEvent& ev);

using StepEventHook = void (*)(const StepEvent&);
using HealthEventHook = void (*)(const HealthEvent&);
void set_step_event_hook(StepEventHook hook);
void set_health_event_hook(HealthEventHook hook);

// Overrides STAGECRAFT_EVENT_LOG. Empty string restores the environment
// lookup.
void set_event_log_path(const std::string& path);

std::string step_event_to_json(const StepEvent& ev);
std::string health_event_to_json(const HealthEvent& ev);

// RAII duration capture.
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ns;
  explicit ScopeTimer(uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace stagecraft
