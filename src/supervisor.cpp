#include "stagecraft/supervisor.hpp"

#include <algorithm>
#include <filesystem>

#include "stagecraft/observability.hpp"

namespace fs = std::filesystem;

namespace stagecraft {

std::string to_string(ProcessState state) {
  switch (state) {
    case ProcessState::starting: return "Starting";
    case ProcessState::ready: return "Ready";
    case ProcessState::healthy: return "Healthy";
    case ProcessState::unhealthy: return "Unhealthy";
    case ProcessState::terminated: return "Terminated";
  }
  return "";
}

// ---------------------------------------------------------------------------
// HealthStateMachine
// ---------------------------------------------------------------------------

HealthStateMachine::HealthStateMachine(std::optional<HealthcheckSpec> spec)
    : spec_(std::move(spec)) {}

void HealthStateMachine::move_to(ProcessState to, const std::string& reason,
                                 std::uint64_t at_ms, int exit_code,
                                 std::vector<StateTransition>* out) {
  StateTransition t;
  t.from = state_;
  t.to = to;
  t.reason = reason;
  t.at_ms = at_ms;
  t.exit_code = exit_code;
  state_ = to;
  out->push_back(std::move(t));
}

std::vector<StateTransition> HealthStateMachine::on_launch() {
  std::vector<StateTransition> out;
  if (!spec_ && state_ == ProcessState::starting) {
    move_to(ProcessState::ready, "launched without healthcheck", 0, 0, &out);
  }
  return out;
}

std::vector<StateTransition> HealthStateMachine::on_probe(bool ok, std::uint64_t at_ms) {
  std::vector<StateTransition> out;
  if (!spec_ || state_ == ProcessState::terminated) return out;

  if (ok) {
    consecutive_failures_ = 0;
    if (state_ == ProcessState::starting) {
      move_to(ProcessState::ready, "first successful probe", at_ms, 0, &out);
      move_to(ProcessState::healthy, "probe succeeded", at_ms, 0, &out);
      ever_healthy_ = true;
    } else if (state_ == ProcessState::unhealthy) {
      move_to(ProcessState::healthy, "probe succeeded", at_ms, 0, &out);
      ever_healthy_ = true;
    }
    return out;
  }

  if (state_ == ProcessState::starting) {
    // Failures inside the start period are not counted.
    if (static_cast<std::int64_t>(at_ms) < spec_->start_period_ms) return out;
    ++consecutive_failures_;
    move_to(ProcessState::unhealthy, "start period exceeded", at_ms, 0, &out);
    return out;
  }
  ++consecutive_failures_;
  if (state_ == ProcessState::healthy && consecutive_failures_ >= spec_->retries) {
    move_to(ProcessState::unhealthy,
            std::to_string(consecutive_failures_) + " consecutive probe failures", at_ms, 0,
            &out);
  }
  return out;
}

std::vector<StateTransition> HealthStateMachine::on_exit(int exit_code, std::uint64_t at_ms,
                                                         const std::string& reason) {
  std::vector<StateTransition> out;
  if (state_ != ProcessState::terminated) {
    move_to(ProcessState::terminated, reason, at_ms, exit_code, &out);
  }
  return out;
}

std::uint64_t HealthStateMachine::probe_time_ms(std::uint64_t k) const {
  if (!spec_) return 0;
  return k * static_cast<std::uint64_t>(spec_->interval_ms);
}

std::shared_ptr<RemediationPolicy> make_policy(const std::string& name) {
  if (name == "mark-only") return std::make_shared<MarkOnlyPolicy>();
  if (name == "terminate-on-unhealthy") return std::make_shared<TerminateOnUnhealthyPolicy>();
  return nullptr;
}

// ---------------------------------------------------------------------------
// BootstrapSupervisor
// ---------------------------------------------------------------------------

BootstrapSupervisor::BootstrapSupervisor(ImageDescriptor image, SupervisorOptions options)
    : image_(std::move(image)),
      options_(std::move(options)),
      machine_(image_.healthcheck) {
  if (!options_.policy) options_.policy = std::make_shared<MarkOnlyPolicy>();

  spec_.env = image_.env;
  for (const auto& [k, v] : options_.env_overrides) spec_.env[k] = v;
  if (!spec_.env.contains("PATH")) spec_.env["PATH"] = kDefaultPath;
  if (!options_.rootfs.empty()) {
    spec_.env["STAGECRAFT_ROOTFS"] = options_.rootfs;
    spec_.cwd = options_.rootfs + image_.workdir;
  }
  if (!image_.entrypoint.empty()) {
    spec_.command = image_.entrypoint.front();
    spec_.argv.assign(image_.entrypoint.begin() + 1, image_.entrypoint.end());
  }
}

BootstrapSupervisor::~BootstrapSupervisor() { cancel(); }

std::uint64_t BootstrapSupervisor::since_launch_ms() const {
  return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                        std::chrono::steady_clock::now() - launched_at_)
                                        .count());
}

void BootstrapSupervisor::record(const std::vector<StateTransition>& ts,
                                 std::uint64_t probe_duration_ns, bool probe_ok,
                                 ErrorCode code) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& t : ts) {
      history_.push_back(t);
      state_ = t.to;
      if (t.to == ProcessState::terminated) {
        exit_code_ = t.exit_code;
        done_ = true;
      }
    }
  }
  cv_.notify_all();

  for (const auto& t : ts) {
    HealthEvent ev;
    ev.from = to_string(t.from);
    ev.to = to_string(t.to);
    ev.reason = t.reason;
    ev.exit_code = t.exit_code;
    ev.probe_duration_ns = probe_duration_ns;
    ev.probe_ok = probe_ok;
    ev.consecutive_failures = machine_.consecutive_failures();
    ev.error_code = to_string(code);
    ev.at_ms = t.at_ms;
    emit_health_event(ev);
  }
}

bool BootstrapSupervisor::start() {
  auto fail = [&](ErrorCode code, const std::string& detail, int exit_code) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      error_ = make_error(code, detail);
      error_.exit_code = exit_code;
      error_.fingerprint = image_.fingerprint;
      error_.category_override = ErrorCategory::runtime;
    }
    record(machine_.on_exit(exit_code, 0, detail), 0, true, code);
    return false;
  };

  if (spec_.command.empty()) {
    return fail(ErrorCode::spawn_failed, "image has no entrypoint", 127);
  }
  if (image_.healthcheck) {
    const BuildError err = validate_healthcheck(*image_.healthcheck);
    if (!err.ok()) return fail(err.code, err.detail, 0);
  }
  if (!spec_.cwd.empty()) {
    std::error_code ec;
    fs::create_directories(spec_.cwd, ec);
  }

  launched_at_ = std::chrono::steady_clock::now();
  std::string error;
  if (!process_.launch(spec_, options_.output_path, &error)) {
    return fail(ErrorCode::spawn_failed, error, 127);
  }
  {
    std::lock_guard<std::mutex> lk(mu_);
    pid_ = process_.pid();
  }
  record(machine_.on_launch(), 0, true, ErrorCode::none);
  monitor_ = std::thread(&BootstrapSupervisor::monitor, this);
  return true;
}

bool BootstrapSupervisor::run_probe(std::uint64_t* duration_ns) {
  const HealthcheckSpec& hc = *image_.healthcheck;
  ProcessSpec probe = spec_;
  probe.command = hc.command.front();
  probe.argv.assign(hc.command.begin() + 1, hc.command.end());
  probe.timeout_ms = static_cast<std::uint64_t>(hc.timeout_ms);
  probe.max_output_bytes = 4096;
  probe.cancel = &cancel_flag_;

  const ProcessResult r = run_process(probe);
  *duration_ns = r.duration_ns;
  const bool ok = !r.spawn_failed && !r.timed_out && !r.cancelled && r.exit_code == 0;
  if (!r.cancelled) global_engine_stats().record_probe(ok, r.duration_ns);
  return ok;
}

void BootstrapSupervisor::monitor() {
  constexpr auto kTick = std::chrono::milliseconds(20);
  const bool probing = machine_.spec().has_value();
  std::uint64_t k = 1;

  while (true) {
    const auto next_probe = launched_at_ + std::chrono::milliseconds(machine_.probe_time_ms(k));
    {
      std::unique_lock<std::mutex> lk(mu_);
      auto until = std::chrono::steady_clock::now() + kTick;
      if (probing && next_probe < until) until = next_probe;
      cv_.wait_until(lk, until, [this] { return cancel_flag_.load(); });
    }

    if (cancel_flag_.load()) {
      const int code = process_.terminate(options_.grace);
      record(machine_.on_exit(code, since_launch_ms(), "cancelled"), 0, true, ErrorCode::none);
      break;
    }

    if (auto code = process_.poll()) {
      ErrorCode err = ErrorCode::none;
      if (*code != 0) {
        err = ErrorCode::process_crashed;
        std::lock_guard<std::mutex> lk(mu_);
        error_ = make_error(err, "entrypoint exited with code " + std::to_string(*code));
        error_.exit_code = *code;
        error_.fingerprint = image_.fingerprint;
      }
      record(machine_.on_exit(*code, since_launch_ms(), "process exited"), 0, true, err);
      break;
    }

    if (!probing || std::chrono::steady_clock::now() < next_probe) continue;

    std::uint64_t duration_ns = 0;
    const bool ok = run_probe(&duration_ns);
    if (cancel_flag_.load()) continue;
    // An exit during the probe is reported as Terminated, not as a failure.
    if (!ok && process_.poll()) continue;

    const std::uint64_t now_ms = since_launch_ms();
    // Probe slots missed while a slow probe ran are skipped.
    const auto interval = static_cast<std::uint64_t>(machine_.spec()->interval_ms);
    k = std::max(k + 1, now_ms / interval + 1);

    const auto ts = machine_.on_probe(ok, now_ms);
    ErrorCode err = ErrorCode::none;
    for (const auto& t : ts) {
      if (t.from == ProcessState::starting && t.to == ProcessState::unhealthy) {
        err = ErrorCode::start_period_exceeded;
        std::lock_guard<std::mutex> lk(mu_);
        error_ = make_error(err, "no successful probe within the start period");
        error_.fingerprint = image_.fingerprint;
      }
    }
    record(ts, duration_ns, ok, err);

    const bool remediate = std::any_of(ts.begin(), ts.end(), [this](const StateTransition& t) {
      return options_.policy->should_terminate(t);
    });
    if (remediate) {
      const int code = process_.terminate(options_.grace);
      record(machine_.on_exit(code, since_launch_ms(),
                              "terminated by " + options_.policy->name() + " policy"),
             0, true, ErrorCode::none);
      break;
    }
  }
}

void BootstrapSupervisor::cancel() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    cancel_flag_.store(true);
  }
  cv_.notify_all();
  if (monitor_.joinable()) {
    monitor_.join();
    return;
  }
  if (state() != ProcessState::terminated) {
    record(machine_.on_exit(130, 0, "cancelled before launch"), 0, true, ErrorCode::none);
  }
}

ProcessState BootstrapSupervisor::state() const {
  std::lock_guard<std::mutex> lk(mu_);
  return state_;
}

std::vector<StateTransition> BootstrapSupervisor::transitions() const {
  std::lock_guard<std::mutex> lk(mu_);
  return history_;
}

bool BootstrapSupervisor::wait_for(ProcessState state, std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lk(mu_);
  return cv_.wait_for(lk, timeout, [&] {
    if (state_ == state) return true;
    return std::any_of(history_.begin(), history_.end(),
                       [&](const StateTransition& t) { return t.to == state; });
  });
}

std::optional<int> BootstrapSupervisor::wait_terminated(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lk(mu_);
  if (!cv_.wait_for(lk, timeout, [&] { return done_; })) return std::nullopt;
  return exit_code_;
}

std::optional<int> BootstrapSupervisor::exit_code() const {
  std::lock_guard<std::mutex> lk(mu_);
  return exit_code_;
}

BuildError BootstrapSupervisor::runtime_error() const {
  std::lock_guard<std::mutex> lk(mu_);
  return error_;
}

pid_t BootstrapSupervisor::pid() const {
  std::lock_guard<std::mutex> lk(mu_);
  return pid_;
}

}  // namespace stagecraft
