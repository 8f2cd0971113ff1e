#include "stagecraft/probe.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>

namespace stagecraft {

namespace {

using Clock = std::chrono::steady_clock;

int remaining_ms(Clock::time_point deadline) {
  const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
  return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

std::uint64_t elapsed_ns(Clock::time_point start) {
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start).count());
}

// Closes the socket on scope exit.
struct FdGuard {
  int fd{-1};
  ~FdGuard() {
    if (fd >= 0) ::close(fd);
  }
};

// Connect to the first address that accepts before the deadline. Returns
// the connected non-blocking socket, or -1 with *error filled.
int connect_before(const ProbeTarget& t, Clock::time_point deadline, std::string* error) {
  struct addrinfo hints{};
  struct addrinfo* res = nullptr;
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  const int gai = ::getaddrinfo(t.host.c_str(), t.port.c_str(), &hints, &res);
  if (gai != 0) {
    *error = std::string("resolve ") + t.host + ": " + ::gai_strerror(gai);
    return -1;
  }

  int connected = -1;
  *error = "connection refused";
  for (auto* rp = res; rp && connected < 0; rp = rp->ai_next) {
    const int fd = ::socket(rp->ai_family, rp->ai_socktype | SOCK_CLOEXEC, rp->ai_protocol);
    if (fd < 0) continue;
    ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL, 0) | O_NONBLOCK);

    int rc = ::connect(fd, rp->ai_addr, rp->ai_addrlen);
    if (rc != 0 && errno == EINPROGRESS) {
      struct pollfd pfd{fd, POLLOUT, 0};
      rc = ::poll(&pfd, 1, remaining_ms(deadline));
      if (rc == 0) {
        *error = "connect timed out";
        ::close(fd);
        break;
      }
      int so_error = 0;
      socklen_t len = sizeof(so_error);
      if (rc < 0 || ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0 || so_error != 0) {
        *error = std::string("connect: ") + std::strerror(so_error ? so_error : errno);
        ::close(fd);
        continue;
      }
      rc = 0;
    }
    if (rc == 0) {
      connected = fd;
    } else {
      *error = std::string("connect: ") + std::strerror(errno);
      ::close(fd);
    }
  }
  ::freeaddrinfo(res);
  return connected;
}

}  // namespace

std::optional<ProbeTarget> parse_probe_url(const std::string& url) {
  const auto sep = url.find("://");
  if (sep == std::string::npos) return std::nullopt;
  ProbeTarget t;
  t.scheme = url.substr(0, sep);
  if (t.scheme != "tcp" && t.scheme != "http") return std::nullopt;

  std::string rest = url.substr(sep + 3);
  const auto slash = rest.find('/');
  if (slash != std::string::npos) {
    t.path = rest.substr(slash);
    rest = rest.substr(0, slash);
  }

  if (!rest.empty() && rest.front() == '[') {
    // [v6addr]:port
    const auto close = rest.find(']');
    if (close == std::string::npos) return std::nullopt;
    t.host = rest.substr(1, close - 1);
    if (close + 1 < rest.size() && rest[close + 1] == ':') t.port = rest.substr(close + 2);
  } else {
    const auto colon = rest.rfind(':');
    t.host = rest.substr(0, colon);
    if (colon != std::string::npos) t.port = rest.substr(colon + 1);
  }
  if (t.port.empty() && t.scheme == "http") t.port = "80";
  if (t.host.empty() || t.port.empty()) return std::nullopt;
  for (char c : t.port) {
    if (c < '0' || c > '9') return std::nullopt;
  }
  return t;
}

ProbeResult tcp_probe(const ProbeTarget& target, std::uint64_t timeout_ms) {
  ProbeResult r;
  const auto start = Clock::now();
  const auto deadline = start + std::chrono::milliseconds(timeout_ms);
  FdGuard sock{connect_before(target, deadline, &r.error)};
  r.ok = sock.fd >= 0;
  if (r.ok) r.error.clear();
  r.duration_ns = elapsed_ns(start);
  return r;
}

ProbeResult http_probe(const ProbeTarget& target, std::uint64_t timeout_ms) {
  ProbeResult r;
  const auto start = Clock::now();
  const auto deadline = start + std::chrono::milliseconds(timeout_ms);
  auto finish = [&](std::string error) {
    r.error = std::move(error);
    r.duration_ns = elapsed_ns(start);
    return r;
  };

  FdGuard sock{connect_before(target, deadline, &r.error)};
  if (sock.fd < 0) return finish(r.error);

  const std::string request = "GET " + target.path + " HTTP/1.0\r\nHost: " + target.host +
                              "\r\nUser-Agent: stagecraft-probe\r\nConnection: close\r\n\r\n";
  std::size_t sent = 0;
  while (sent < request.size()) {
    struct pollfd pfd{sock.fd, POLLOUT, 0};
    const int rc = ::poll(&pfd, 1, remaining_ms(deadline));
    if (rc == 0) return finish("send timed out");
    if (rc < 0 && errno != EINTR) return finish(std::string("poll: ") + std::strerror(errno));
    if (rc < 0) continue;
    const ssize_t n = ::send(sock.fd, request.data() + sent, request.size() - sent, MSG_NOSIGNAL);
    if (n < 0 && errno != EAGAIN && errno != EINTR) {
      return finish(std::string("send: ") + std::strerror(errno));
    }
    if (n > 0) sent += static_cast<std::size_t>(n);
  }

  // Only the status line matters.
  std::string head;
  char buf[512];
  while (head.find("\r\n") == std::string::npos && head.size() < 4096) {
    struct pollfd pfd{sock.fd, POLLIN, 0};
    const int rc = ::poll(&pfd, 1, remaining_ms(deadline));
    if (rc == 0) return finish("response timed out");
    if (rc < 0 && errno != EINTR) return finish(std::string("poll: ") + std::strerror(errno));
    if (rc < 0) continue;
    const ssize_t n = ::recv(sock.fd, buf, sizeof(buf), 0);
    if (n < 0 && (errno == EAGAIN || errno == EINTR)) continue;
    if (n < 0) return finish(std::string("recv: ") + std::strerror(errno));
    if (n == 0) break;
    head.append(buf, static_cast<std::size_t>(n));
  }

  // "HTTP/1.x NNN reason"
  if (head.rfind("HTTP/", 0) != 0) return finish("malformed HTTP response");
  const auto sp = head.find(' ');
  if (sp == std::string::npos || sp + 4 > head.size()) return finish("malformed HTTP status line");
  int code = 0;
  for (std::size_t i = sp + 1; i < sp + 4; ++i) {
    if (head[i] < '0' || head[i] > '9') return finish("malformed HTTP status code");
    code = code * 10 + (head[i] - '0');
  }
  r.status_code = code;
  r.ok = code >= 200 && code < 400;
  return finish(r.ok ? "" : "HTTP status " + std::to_string(code));
}

ProbeResult probe_url(const std::string& url, std::uint64_t timeout_ms) {
  const auto target = parse_probe_url(url);
  if (!target) {
    ProbeResult r;
    r.error = "unsupported probe URL '" + url + "' (expected tcp://host:port or http://host:port/path)";
    return r;
  }
  return target->scheme == "tcp" ? tcp_probe(*target, timeout_ms)
                                 : http_probe(*target, timeout_ms);
}

}  // namespace stagecraft
