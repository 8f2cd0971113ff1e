#pragma once

// stagecraft/recipe.hpp - Stagefile (Dockerfile-style build recipe) model
// and parser.
//
// Supported syntax:
//   FROM <ref> [AS <name>]
//   ENV K=V [K2=V2 ...]          ENV K value with spaces
//   RUN <shell command>          RUN ["exe", "arg"]
//   COPY <src>... <dest>         COPY ["src", "dest"]
//   EXPOSE <port>[/tcp|/udp] ...
//   HEALTHCHECK [--interval=D] [--timeout=D] [--start-period=D]
//               [--retries=N] CMD <command>
//   HEALTHCHECK NONE
//   CMD <command>                ENTRYPOINT <command>
//   WORKDIR <path>
// Keywords are case-insensitive, '#' starts a comment line and a trailing
// '\' continues an instruction on the next line. Durations are sequences of
// <number><unit> with unit ms, s, m or h ("1m30s", "500ms").

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "stagecraft/jsonlite.hpp"
#include "stagecraft/types.hpp"

namespace stagecraft {

// Shell form is stored already expanded to {"/bin/sh", "-c", text}.
struct CommandLine {
  std::vector<std::string> argv;
  bool shell_form{false};
};

struct EnvInstr {
  std::vector<std::pair<std::string, std::string>> vars;
};

struct RunInstr {
  CommandLine command;
};

struct CopyInstr {
  std::vector<std::string> sources;  // relative to the build context
  std::string dest;
};

struct ExposeInstr {
  std::vector<int> ports;
};

struct HealthcheckInstr {
  bool none{false};  // HEALTHCHECK NONE
  CommandLine command;
  std::int64_t interval_ms{30000};
  std::int64_t timeout_ms{30000};
  std::int64_t start_period_ms{0};
  int retries{3};
};

// CMD and ENTRYPOINT both set the entrypoint; the last one wins.
struct EntrypointInstr {
  CommandLine command;
};

struct WorkdirInstr {
  std::string path;
};

using InstructionBody = std::variant<EnvInstr, RunInstr, CopyInstr, ExposeInstr,
                                     HealthcheckInstr, EntrypointInstr, WorkdirInstr>;

struct Instruction {
  InstructionBody body;
  std::string keyword;  // as written, upper-cased ("CMD", "ENTRYPOINT", ...)
  int line{0};

  // Short human-readable form for progress output.
  std::string summary() const;
};

struct Stage {
  std::string name;
  std::string base;
  std::vector<Instruction> instructions;
  int line{0};
};

struct Recipe {
  std::vector<Stage> stages;
};

struct ParseResult {
  bool ok{false};
  BuildError error;
  Recipe recipe;
};

ParseResult parse_stagefile(const std::string& text);

// Canonical JSON value of an instruction. Two instructions with the same
// meaning canonicalize identically regardless of spelling (whitespace,
// keyword case, CMD vs ENTRYPOINT).
jsonlite::Value canonicalize_instruction(const Instruction& instr);

// Parse a duration such as "30s", "1m30s", "500ms", "-5s" or "0" into
// milliseconds.
std::optional<std::int64_t> parse_duration_ms(const std::string& text);

}  // namespace stagecraft
