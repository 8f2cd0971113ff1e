#pragma once

// stagecraft/supervisor.hpp - Launches an image's entrypoint and tracks its
// health.
//
// STATE MACHINE:
//   Starting --first successful probe--> Ready --> Healthy
//   Starting --failed probe at/after start-period, no prior success--> Unhealthy
//   Healthy  --`retries` consecutive failed probes--> Unhealthy
//   Unhealthy --one successful probe--> Healthy
//   any      --process exit or cancel()--> Terminated
// Without a healthcheck the process goes Starting -> Ready at launch and
// stays Ready until it exits.
//
// Probes run at launch + k * interval. A probe that fails before the start
// period has elapsed is not counted. The end of the start period is not a
// transition on its own: Starting -> Unhealthy happens at the first failed
// probe slot at or after it, so with interval > start-period it lands at
// `interval`, not at `start-period`. A probe that exceeds its timeout is
// killed and counts as a failure. Nothing is restarted automatically: what
// happens on Unhealthy is decided by the RemediationPolicy.
//
// HealthStateMachine is the pure part (time is an input); the supervisor
// drives it from one monitor thread.

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "stagecraft/assembler.hpp"
#include "stagecraft/sandbox.hpp"
#include "stagecraft/snapshot.hpp"
#include "stagecraft/types.hpp"

namespace stagecraft {

enum class ProcessState { starting, ready, healthy, unhealthy, terminated };

std::string to_string(ProcessState state);

struct StateTransition {
  ProcessState from{ProcessState::starting};
  ProcessState to{ProcessState::starting};
  std::string reason;
  std::uint64_t at_ms{0};  // since launch
  int exit_code{0};        // Terminated only
};

class HealthStateMachine {
 public:
  explicit HealthStateMachine(std::optional<HealthcheckSpec> spec);

  // Starting -> Ready when no healthcheck is declared, nothing otherwise.
  std::vector<StateTransition> on_launch();

  // Feed one probe result completed at `at_ms` after launch. Returns the
  // transitions it caused (zero, one, or two for Starting -> Ready -> Healthy).
  std::vector<StateTransition> on_probe(bool ok, std::uint64_t at_ms);
  std::vector<StateTransition> on_exit(int exit_code, std::uint64_t at_ms,
                                       const std::string& reason);

  ProcessState state() const { return state_; }
  int consecutive_failures() const { return consecutive_failures_; }
  bool ever_healthy() const { return ever_healthy_; }
  const std::optional<HealthcheckSpec>& spec() const { return spec_; }

  // Time of the k-th probe (k >= 1).
  std::uint64_t probe_time_ms(std::uint64_t k) const;

 private:
  void move_to(ProcessState to, const std::string& reason, std::uint64_t at_ms,
               int exit_code, std::vector<StateTransition>* out);

  std::optional<HealthcheckSpec> spec_;
  ProcessState state_{ProcessState::starting};
  int consecutive_failures_{0};
  bool ever_healthy_{false};
};

class RemediationPolicy {
 public:
  virtual ~RemediationPolicy() = default;
  virtual std::string name() const = 0;
  // Called after every transition; true terminates the process.
  virtual bool should_terminate(const StateTransition& transition) const = 0;
};

class MarkOnlyPolicy : public RemediationPolicy {
 public:
  std::string name() const override { return "mark-only"; }
  bool should_terminate(const StateTransition&) const override { return false; }
};

class TerminateOnUnhealthyPolicy : public RemediationPolicy {
 public:
  std::string name() const override { return "terminate-on-unhealthy"; }
  bool should_terminate(const StateTransition& t) const override {
    return t.to == ProcessState::unhealthy;
  }
};

// "mark-only" or "terminate-on-unhealthy"; nullptr otherwise.
std::shared_ptr<RemediationPolicy> make_policy(const std::string& name);

struct SupervisorOptions {
  std::map<std::string, std::string> env_overrides;  // applied over descriptor env
  std::string rootfs;       // materialized image root; "" = current directory
  std::string output_path;  // entrypoint stdout/stderr; "" = inherited
  std::chrono::milliseconds grace{2000};  // SIGTERM -> SIGKILL on cancel
  std::shared_ptr<RemediationPolicy> policy;  // nullptr = mark-only
};

class BootstrapSupervisor {
 public:
  BootstrapSupervisor(ImageDescriptor image, SupervisorOptions options);
  ~BootstrapSupervisor();
  BootstrapSupervisor(const BootstrapSupervisor&) = delete;
  BootstrapSupervisor& operator=(const BootstrapSupervisor&) = delete;

  // Launch the entrypoint and the monitor thread. On failure the state is
  // Terminated and runtime_error() holds spawn_failed.
  bool start();

  ProcessState state() const;
  std::vector<StateTransition> transitions() const;

  // True once `state` has been entered at least once (Ready is transient
  // when a healthcheck is declared). False on timeout.
  bool wait_for(ProcessState state, std::chrono::milliseconds timeout) const;

  // Exit code once Terminated; nullopt on timeout.
  std::optional<int> wait_terminated(std::chrono::milliseconds timeout) const;

  // SIGTERM, SIGKILL after the grace period, then Terminated. Blocks until
  // the monitor thread has finished. Idempotent.
  void cancel();

  std::optional<int> exit_code() const;
  BuildError runtime_error() const;
  pid_t pid() const;

 private:
  void monitor();
  void record(const std::vector<StateTransition>& ts, std::uint64_t probe_duration_ns,
              bool probe_ok, ErrorCode code);
  bool run_probe(std::uint64_t* duration_ns);
  std::uint64_t since_launch_ms() const;

  ImageDescriptor image_;
  SupervisorOptions options_;
  ProcessSpec spec_;
  ManagedProcess process_;
  HealthStateMachine machine_;

  std::chrono::steady_clock::time_point launched_at_;
  std::atomic<bool> cancel_flag_{false};
  std::thread monitor_;

  mutable std::mutex mu_;
  mutable std::condition_variable cv_;
  ProcessState state_{ProcessState::starting};
  std::vector<StateTransition> history_;
  std::optional<int> exit_code_;
  BuildError error_;
  pid_t pid_{-1};
  bool done_{false};
};

}  // namespace stagecraft
