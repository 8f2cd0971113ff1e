#pragma once

// stagecraft/probe.hpp - Built-in liveness probes.
//
//   tcp://host:port          healthy when a TCP connection is accepted
//   http://host:port/path    healthy on an HTTP 2xx or 3xx status line
//
// Used by `stagecraft probe`, which lets a healthcheck command check the
// service without curl or wget inside the image. Every probe is bounded by
// one overall deadline covering resolution, connect, send and receive.

#include <cstdint>
#include <optional>
#include <string>

namespace stagecraft {

struct ProbeTarget {
  std::string scheme;  // "tcp" or "http"
  std::string host;
  std::string port;
  std::string path{"/"};
};

struct ProbeResult {
  bool ok{false};
  int status_code{0};  // http only
  std::string error;
  std::uint64_t duration_ns{0};
};

// Returns nullopt for unsupported schemes or a missing host or port.
std::optional<ProbeTarget> parse_probe_url(const std::string& url);

ProbeResult tcp_probe(const ProbeTarget& target, std::uint64_t timeout_ms);
ProbeResult http_probe(const ProbeTarget& target, std::uint64_t timeout_ms);

// Dispatch on the URL scheme.
ProbeResult probe_url(const std::string& url, std::uint64_t timeout_ms);

}  // namespace stagecraft
