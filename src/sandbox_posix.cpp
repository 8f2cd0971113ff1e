#include "stagecraft/sandbox.hpp"

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cstring>
#include <sstream>
#include <thread>

namespace stagecraft {

namespace {

void append_limited(std::string& dst, const char* src, ssize_t n,
                    std::size_t limit, bool& truncated) {
  if (n <= 0)
    return;
  const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
  const std::size_t take =
      std::min<std::size_t>(static_cast<std::size_t>(n), avail);
  dst.append(src, take);
  if (take < static_cast<std::size_t>(n)) {
    truncated = true;
  }
}

int decode_status(int status) {
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return 128 + WTERMSIG(status);
  return 1;
}

bool is_executable_file(const std::string& p) {
  struct stat st{};
  if (::stat(p.c_str(), &st) != 0)
    return false;
  return S_ISREG(st.st_mode) && ::access(p.c_str(), X_OK) == 0;
}

std::string search_path_of(const ProcessSpec& spec) {
  auto it = spec.env.find("PATH");
  return it != spec.env.end() ? it->second : std::string(kDefaultPath);
}

// Owned argv/envp storage for execve. Built in the parent; the child only
// touches the raw pointer arrays.
struct ExecImage {
  std::string path;
  std::vector<std::string> args;
  std::vector<std::string> envs;
  std::vector<char*> argv;
  std::vector<char*> envp;

  ExecImage(const ProcessSpec& spec, std::string resolved) : path(std::move(resolved)) {
    args.push_back(spec.command);
    args.insert(args.end(), spec.argv.begin(), spec.argv.end());
    for (auto& s : args)
      argv.push_back(s.data());
    argv.push_back(nullptr);
    for (const auto& [k, v] : spec.env)
      envs.push_back(k + "=" + v);
    for (auto& e : envs)
      envp.push_back(e.data());
    envp.push_back(nullptr);
  }
};

// Child-side setup shared by run_process and ManagedProcess. Only
// async-signal-safe calls after fork.
[[noreturn]] void exec_child(const ExecImage& img, const std::string& cwd,
                             int report_fd) {
  if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
    int e = errno;
    if (report_fd >= 0)
      (void)!::write(report_fd, &e, sizeof(e));
    _exit(127);
  }
  ::execve(img.path.c_str(), img.argv.data(), img.envp.data());
  int e = errno;
  if (report_fd >= 0)
    (void)!::write(report_fd, &e, sizeof(e));
  _exit(127);
}

void kill_group(pid_t pid, int sig) {
  ::kill(-pid, sig);
  ::kill(pid, sig);
}

// Relative paths such as "./start.sh" are relative to the child's cwd.
std::string command_in_cwd(const ProcessSpec& spec) {
  const std::string& c = spec.command;
  if (spec.cwd.empty() || c.empty() || c.front() == '/' || c.find('/') == std::string::npos)
    return c;
  return spec.cwd + "/" + c;
}

}  // namespace

std::string resolve_executable(const std::string& name,
                               const std::string& search_path) {
  if (name.empty())
    return {};
  if (name.find('/') != std::string::npos)
    return is_executable_file(name) ? name : std::string();
  std::stringstream ss(search_path);
  std::string dir;
  while (std::getline(ss, dir, ':')) {
    if (dir.empty())
      continue;
    const std::string candidate = dir + "/" + name;
    if (is_executable_file(candidate))
      return candidate;
  }
  return {};
}

ProcessResult run_process(const ProcessSpec& spec) {
  ProcessResult result;
  const auto started = std::chrono::steady_clock::now();

  const std::string resolved = resolve_executable(command_in_cwd(spec), search_path_of(spec));
  if (resolved.empty()) {
    result.spawn_failed = true;
    result.exit_code = 127;
    result.error_message = "executable not found: " + spec.command;
    return result;
  }
  ExecImage img(spec, resolved);

  int out_pipe[2];
  int err_pipe[2];
  if (::pipe(out_pipe) != 0) {
    result.spawn_failed = true;
    result.error_message = std::string("pipe: ") + std::strerror(errno);
    return result;
  }
  if (::pipe(err_pipe) != 0) {
    ::close(out_pipe[0]);
    ::close(out_pipe[1]);
    result.spawn_failed = true;
    result.error_message = std::string("pipe: ") + std::strerror(errno);
    return result;
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]})
      ::close(fd);
    result.spawn_failed = true;
    result.error_message = std::string("fork: ") + std::strerror(errno);
    return result;
  }

  if (pid == 0) {
    ::setsid();
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
      ::close(devnull);
    }
    ::close(out_pipe[0]);
    ::close(out_pipe[1]);
    ::close(err_pipe[0]);
    ::close(err_pipe[1]);
    exec_child(img, spec.cwd, -1);
  }

  ::close(out_pipe[1]);
  ::close(err_pipe[1]);
  ::fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
  ::fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

  const bool has_deadline = spec.timeout_ms > 0;
  const auto deadline = started + std::chrono::milliseconds(spec.timeout_ms);
  char buf[4096];
  int status = 0;
  while (true) {
    ssize_t n = ::read(out_pipe[0], buf, sizeof(buf));
    append_limited(result.stdout_text, buf, n, spec.max_output_bytes,
                   result.stdout_truncated);
    n = ::read(err_pipe[0], buf, sizeof(buf));
    append_limited(result.stderr_text, buf, n, spec.max_output_bytes,
                   result.stderr_truncated);

    pid_t w = ::waitpid(pid, &status, WNOHANG);
    if (w == pid)
      break;
    if (spec.cancel && spec.cancel->load()) {
      kill_group(pid, SIGKILL);
      ::waitpid(pid, &status, 0);
      result.cancelled = true;
      break;
    }
    if (has_deadline && std::chrono::steady_clock::now() >= deadline) {
      kill_group(pid, SIGKILL);
      ::waitpid(pid, &status, 0);
      result.timed_out = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }

  // Drain what the child wrote before exiting. Grandchildren that kept the
  // pipe open were killed with the group on timeout/cancel; on a normal exit
  // we stop at the first empty read.
  while (true) {
    ssize_t n = ::read(out_pipe[0], buf, sizeof(buf));
    if (n <= 0)
      break;
    append_limited(result.stdout_text, buf, n, spec.max_output_bytes,
                   result.stdout_truncated);
  }
  while (true) {
    ssize_t n = ::read(err_pipe[0], buf, sizeof(buf));
    if (n <= 0)
      break;
    append_limited(result.stderr_text, buf, n, spec.max_output_bytes,
                   result.stderr_truncated);
  }
  ::close(out_pipe[0]);
  ::close(err_pipe[0]);

  if (result.cancelled) {
    result.exit_code = 130;
    result.error_message = "cancelled";
  } else if (result.timed_out) {
    result.exit_code = 124;
    result.error_message = "timeout after " + std::to_string(spec.timeout_ms) + "ms";
  } else {
    result.exit_code = decode_status(status);
  }
  result.duration_ns = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(
          std::chrono::steady_clock::now() - started)
          .count());
  return result;
}

// ---------------------------------------------------------------------------
// ManagedProcess
// ---------------------------------------------------------------------------

ManagedProcess::~ManagedProcess() {
  if (running())
    terminate(std::chrono::milliseconds(500));
}

bool ManagedProcess::launch(const ProcessSpec& spec,
                            const std::string& output_path,
                            std::string* error) {
  const std::string resolved = resolve_executable(command_in_cwd(spec), search_path_of(spec));
  if (resolved.empty()) {
    if (error)
      *error = "executable not found: " + spec.command;
    return false;
  }
  ExecImage img(spec, resolved);

  int out_fd = -1;
  if (!output_path.empty()) {
    out_fd = ::open(output_path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (out_fd < 0) {
      if (error)
        *error = "cannot open " + output_path + ": " + std::strerror(errno);
      return false;
    }
  }

  // CLOEXEC pipe: closed silently on a successful exec, carries errno
  // otherwise.
  int report[2];
  if (::pipe2(report, O_CLOEXEC) != 0) {
    if (out_fd >= 0)
      ::close(out_fd);
    if (error)
      *error = std::string("pipe: ") + std::strerror(errno);
    return false;
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    ::close(report[0]);
    ::close(report[1]);
    if (out_fd >= 0)
      ::close(out_fd);
    if (error)
      *error = std::string("fork: ") + std::strerror(errno);
    return false;
  }
  if (pid == 0) {
    ::setsid();
    ::close(report[0]);
    if (out_fd >= 0) {
      ::dup2(out_fd, STDOUT_FILENO);
      ::dup2(out_fd, STDERR_FILENO);
    }
    exec_child(img, spec.cwd, report[1]);
  }

  ::close(report[1]);
  if (out_fd >= 0)
    ::close(out_fd);

  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(report[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  ::close(report[0]);

  pid_ = pid;
  exit_code_.reset();
  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    int status = 0;
    ::waitpid(pid, &status, 0);
    exit_code_ = decode_status(status);
    if (error)
      *error = "exec " + resolved + ": " + std::strerror(child_errno);
    return false;
  }
  return true;
}

std::optional<int> ManagedProcess::poll() {
  if (exit_code_ || pid_ <= 0)
    return exit_code_;
  int status = 0;
  pid_t w = ::waitpid(pid_, &status, WNOHANG);
  if (w == pid_)
    exit_code_ = decode_status(status);
  return exit_code_;
}

int ManagedProcess::wait() {
  if (exit_code_ || pid_ <= 0)
    return exit_code_.value_or(-1);
  int status = 0;
  pid_t w;
  do {
    w = ::waitpid(pid_, &status, 0);
  } while (w < 0 && errno == EINTR);
  exit_code_ = (w == pid_) ? decode_status(status) : -1;
  return *exit_code_;
}

int ManagedProcess::terminate(std::chrono::milliseconds grace) {
  if (!running())
    return exit_code_.value_or(-1);
  kill_group(pid_, SIGTERM);
  const auto deadline = std::chrono::steady_clock::now() + grace;
  while (std::chrono::steady_clock::now() < deadline) {
    if (poll())
      return *exit_code_;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  kill_group(pid_, SIGKILL);
  return wait();
}

}  // namespace stagecraft
