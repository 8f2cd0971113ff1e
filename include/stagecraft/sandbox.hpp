#pragma once

// stagecraft/sandbox.hpp - Process spawning for build steps, probes and the
// supervised entrypoint.
//
// Every child runs in its own process group (setsid) so a timeout or a
// cancellation can kill the whole tree with kill(-pgid). The child
// environment is exactly ProcessSpec::env; nothing is inherited from the
// engine's own environment.
//
// Exit code conventions (shell-compatible):
//   124  deadline exceeded
//   127  executable not found / exec failed
//   130  cancelled
//   128+N  killed by signal N

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace stagecraft {

inline constexpr const char* kDefaultPath =
    "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";

struct ProcessSpec {
  std::string command;            // bare name (PATH lookup) or path
  std::vector<std::string> argv;  // arguments after argv[0]
  std::map<std::string, std::string> env;
  std::string cwd;
  std::uint64_t timeout_ms{0};  // 0 = no deadline
  std::size_t max_output_bytes{65536};
  const std::atomic<bool>* cancel{nullptr};
};

struct ProcessResult {
  int exit_code{0};
  bool timed_out{false};
  bool cancelled{false};
  bool spawn_failed{false};
  bool stdout_truncated{false};
  bool stderr_truncated{false};
  std::string stdout_text;
  std::string stderr_text;
  std::string error_message;
  std::uint64_t duration_ns{0};
};

// Resolve `name` against a colon-separated search path. Names containing a
// '/' are returned unchanged if executable. Returns "" when not found.
std::string resolve_executable(const std::string& name,
                               const std::string& search_path);

// Run to completion, capturing stdout/stderr up to max_output_bytes each.
ProcessResult run_process(const ProcessSpec& spec);

// Long-running child with inherited or redirected stdio. Used by the
// supervisor for the entrypoint. The destructor terminates a still-running
// child.
class ManagedProcess {
 public:
  ManagedProcess() = default;
  ~ManagedProcess();
  ManagedProcess(const ManagedProcess&) = delete;
  ManagedProcess& operator=(const ManagedProcess&) = delete;

  // Non-blocking launch. When output_path is non-empty, stdout and stderr
  // are appended to that file; otherwise they are inherited. Returns false
  // and fills *error when the executable cannot be resolved or exec fails.
  bool launch(const ProcessSpec& spec, const std::string& output_path,
              std::string* error);

  pid_t pid() const { return pid_; }
  bool running() const { return pid_ > 0 && !exit_code_.has_value(); }

  // Reap without blocking. Returns the exit code once the child has exited.
  std::optional<int> poll();

  // Block until the child exits.
  int wait();

  // SIGTERM the process group, SIGKILL after `grace`. Returns the exit code.
  int terminate(std::chrono::milliseconds grace);

 private:
  pid_t pid_{-1};
  std::optional<int> exit_code_;
};

}  // namespace stagecraft
