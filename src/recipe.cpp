#include "stagecraft/recipe.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <type_traits>

namespace stagecraft {

namespace {

struct LogicalLine {
  std::string text;
  int line{0};
};

std::string trim(const std::string& s) {
  size_t b = 0;
  while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  size_t e = s.size();
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

std::string upper(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return s;
}

std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

// Join '\' continuations and drop comments and blank lines. Comment lines
// inside a continuation are skipped without ending it.
std::vector<LogicalLine> logical_lines(const std::string& text) {
  std::vector<LogicalLine> out;
  std::istringstream in(text);
  std::string raw;
  int lineno = 0;
  bool continuing = false;
  LogicalLine cur;
  while (std::getline(in, raw)) {
    ++lineno;
    if (!raw.empty() && raw.back() == '\r') raw.pop_back();
    const std::string t = trim(raw);
    if (t.empty() || t[0] == '#') continue;
    if (!continuing) {
      cur = LogicalLine{};
      cur.line = lineno;
    }
    std::string body = raw;
    while (!body.empty() && std::isspace(static_cast<unsigned char>(body.back()))) body.pop_back();
    if (!body.empty() && body.back() == '\\') {
      body.pop_back();
      cur.text += body;
      continuing = true;
      continue;
    }
    cur.text += body;
    continuing = false;
    out.push_back(cur);
  }
  if (continuing && !trim(cur.text).empty()) out.push_back(cur);
  return out;
}

// Shell-like word splitting with "..." and '...' quoting and backslash
// escapes. Returns false on an unterminated quote.
bool split_words(const std::string& s, std::vector<std::string>* words) {
  words->clear();
  std::string cur;
  bool in_word = false;
  for (size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (std::isspace(static_cast<unsigned char>(c))) {
      if (in_word) {
        words->push_back(cur);
        cur.clear();
        in_word = false;
      }
      continue;
    }
    in_word = true;
    if (c == '\\' && i + 1 < s.size()) {
      cur += s[++i];
    } else if (c == '"' || c == '\'') {
      const char q = c;
      bool closed = false;
      for (++i; i < s.size(); ++i) {
        if (s[i] == q) { closed = true; break; }
        if (q == '"' && s[i] == '\\' && i + 1 < s.size()) {
          cur += s[++i];
        } else {
          cur += s[i];
        }
      }
      if (!closed) return false;
    } else {
      cur += c;
    }
  }
  if (in_word) words->push_back(cur);
  return true;
}

// Exec form: a JSON array of strings. Anything else is shell form, as in
// Docker.
std::optional<std::vector<std::string>> parse_json_array(const std::string& rest) {
  if (rest.empty() || rest[0] != '[') return std::nullopt;
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse("{\"a\":" + rest + "}", &err);
  if (err) return std::nullopt;
  const jsonlite::Array* arr = jsonlite::get_array(obj, "a");
  if (!arr) return std::nullopt;
  std::vector<std::string> out;
  for (const auto& v : *arr) {
    const auto* s = std::get_if<std::string>(&v.v);
    if (!s) return std::nullopt;
    out.push_back(*s);
  }
  return out;
}

std::optional<CommandLine> parse_command(const std::string& rest) {
  if (rest.empty()) return std::nullopt;
  CommandLine cmd;
  if (auto exec = parse_json_array(rest)) {
    if (exec->empty()) return std::nullopt;
    cmd.argv = std::move(*exec);
    cmd.shell_form = false;
    return cmd;
  }
  cmd.argv = {"/bin/sh", "-c", rest};
  cmd.shell_form = true;
  return cmd;
}

bool is_valid_env_key(const std::string& k) {
  if (k.empty()) return false;
  return std::none_of(k.begin(), k.end(), [](char c) {
    return c == '=' || std::isspace(static_cast<unsigned char>(c));
  });
}

std::string compact(const std::string& s, size_t max_len) {
  if (s.size() <= max_len) return s;
  return s.substr(0, max_len - 3) + "...";
}

std::string argv_text(const CommandLine& cmd) {
  if (cmd.shell_form && cmd.argv.size() == 3) return cmd.argv[2];
  return jsonlite::to_json(jsonlite::Value{jsonlite::to_array(cmd.argv)});
}

class StagefileParser {
 public:
  ParseResult run(const std::string& text) {
    ParseResult result;
    for (const auto& ll : logical_lines(text)) {
      line_ = ll.line;
      const std::string t = trim(ll.text);
      size_t sp = 0;
      while (sp < t.size() && !std::isspace(static_cast<unsigned char>(t[sp]))) ++sp;
      const std::string kw = upper(t.substr(0, sp));
      const std::string rest = trim(t.substr(sp));
      if (!dispatch(kw, rest, &result.recipe)) {
        result.error = error_;
        return result;
      }
    }
    if (result.recipe.stages.empty()) {
      line_ = 0;
      fail("recipe declares no stages (missing FROM)");
      result.error = error_;
      return result;
    }
    result.ok = true;
    return result;
  }

 private:
  bool fail(const std::string& msg) {
    error_ = make_error(ErrorCode::stagefile_parse_error,
                        line_ > 0 ? "line " + std::to_string(line_) + ": " + msg : msg);
    return false;
  }

  bool add(Recipe* recipe, InstructionBody body, const std::string& kw) {
    if (recipe->stages.empty()) return fail(kw + " before FROM");
    Instruction instr;
    instr.body = std::move(body);
    instr.keyword = kw;
    instr.line = line_;
    recipe->stages.back().instructions.push_back(std::move(instr));
    return true;
  }

  bool dispatch(const std::string& kw, const std::string& rest, Recipe* recipe) {
    if (kw == "FROM") return parse_from(rest, recipe);
    if (kw == "ENV") return parse_env(rest, recipe);
    if (kw == "RUN") {
      auto cmd = parse_command(rest);
      if (!cmd) return fail("RUN requires a command");
      return add(recipe, RunInstr{std::move(*cmd)}, kw);
    }
    if (kw == "CMD" || kw == "ENTRYPOINT") {
      auto cmd = parse_command(rest);
      if (!cmd) return fail(kw + " requires a command");
      return add(recipe, EntrypointInstr{std::move(*cmd)}, kw);
    }
    if (kw == "COPY") return parse_copy(rest, recipe);
    if (kw == "EXPOSE") return parse_expose(rest, recipe);
    if (kw == "HEALTHCHECK") return parse_healthcheck(rest, recipe);
    if (kw == "WORKDIR") {
      std::vector<std::string> words;
      if (!split_words(rest, &words)) return fail("unterminated quote");
      if (words.size() != 1) return fail("WORKDIR requires exactly one path");
      return add(recipe, WorkdirInstr{words[0]}, kw);
    }
    if (kw == "ADD" || kw == "ARG" || kw == "LABEL" || kw == "USER" || kw == "VOLUME" ||
        kw == "ONBUILD" || kw == "SHELL" || kw == "STOPSIGNAL" || kw == "MAINTAINER") {
      return fail("unsupported instruction " + kw);
    }
    return fail("unknown instruction '" + kw + "'");
  }

  bool parse_from(const std::string& rest, Recipe* recipe) {
    std::vector<std::string> words;
    if (!split_words(rest, &words)) return fail("unterminated quote");
    Stage stage;
    stage.line = line_;
    if (words.size() == 1) {
      stage.name = std::to_string(recipe->stages.size());
    } else if (words.size() == 3 && upper(words[1]) == "AS" && !words[2].empty()) {
      stage.name = words[2];
    } else {
      return fail("expected FROM <ref> [AS <name>]");
    }
    stage.base = words[0];
    recipe->stages.push_back(std::move(stage));
    return true;
  }

  bool parse_env(const std::string& rest, Recipe* recipe) {
    std::vector<std::string> words;
    if (!split_words(rest, &words)) return fail("unterminated quote");
    if (words.empty()) return fail("ENV requires at least one variable");
    EnvInstr env;
    const size_t first_eq = rest.find('=');
    size_t first_space = 0;
    while (first_space < rest.size() && !std::isspace(static_cast<unsigned char>(rest[first_space]))) ++first_space;
    if (first_eq != std::string::npos && first_eq < first_space) {
      for (const auto& w : words) {
        const size_t eq = w.find('=');
        if (eq == std::string::npos) return fail("ENV expects K=V pairs, got '" + w + "'");
        const std::string key = w.substr(0, eq);
        if (!is_valid_env_key(key)) return fail("invalid ENV key '" + key + "'");
        env.vars.emplace_back(key, w.substr(eq + 1));
      }
    } else {
      // Legacy form: ENV KEY value with spaces
      const std::string key = rest.substr(0, first_space);
      const std::string value = trim(rest.substr(first_space));
      if (!is_valid_env_key(key)) return fail("invalid ENV key '" + key + "'");
      if (value.empty()) return fail("ENV " + key + " requires a value");
      env.vars.emplace_back(key, value);
    }
    return add(recipe, std::move(env), "ENV");
  }

  bool parse_copy(const std::string& rest, Recipe* recipe) {
    std::vector<std::string> words;
    if (auto exec = parse_json_array(rest)) {
      words = std::move(*exec);
    } else if (!split_words(rest, &words)) {
      return fail("unterminated quote");
    }
    if (!words.empty() && words[0].rfind("--", 0) == 0)
      return fail("unsupported COPY option " + words[0]);
    if (words.size() < 2) return fail("COPY requires at least one source and a destination");
    CopyInstr copy;
    copy.dest = words.back();
    words.pop_back();
    for (auto& src : words) {
      if (!src.empty() && src[0] == '/') return fail("COPY source must be relative to the build context: " + src);
      std::stringstream ss(src);
      std::string part;
      while (std::getline(ss, part, '/')) {
        if (part == "..") return fail("COPY source escapes the build context: " + src);
      }
      copy.sources.push_back(std::move(src));
    }
    return add(recipe, std::move(copy), "COPY");
  }

  bool parse_expose(const std::string& rest, Recipe* recipe) {
    std::vector<std::string> words;
    if (!split_words(rest, &words)) return fail("unterminated quote");
    if (words.empty()) return fail("EXPOSE requires at least one port");
    ExposeInstr expose;
    for (const auto& w : words) {
      std::string port_text = w;
      const size_t slash = w.find('/');
      if (slash != std::string::npos) {
        const std::string proto = lower(w.substr(slash + 1));
        if (proto != "tcp" && proto != "udp") return fail("invalid EXPOSE protocol in '" + w + "'");
        port_text = w.substr(0, slash);
      }
      if (port_text.empty() || port_text.size() > 5 ||
          !std::all_of(port_text.begin(), port_text.end(), [](char c) { return c >= '0' && c <= '9'; }))
        return fail("invalid EXPOSE port '" + w + "'");
      const int port = std::stoi(port_text);
      if (port < 1 || port > 65535) return fail("EXPOSE port out of range: " + w);
      expose.ports.push_back(port);
    }
    return add(recipe, std::move(expose), "EXPOSE");
  }

  bool parse_healthcheck(const std::string& rest_in, Recipe* recipe) {
    HealthcheckInstr hc;
    std::string rest = rest_in;
    bool any_option = false;
    while (rest.rfind("--", 0) == 0) {
      size_t sp = 0;
      while (sp < rest.size() && !std::isspace(static_cast<unsigned char>(rest[sp]))) ++sp;
      const std::string opt = rest.substr(0, sp);
      rest = trim(rest.substr(sp));
      const size_t eq = opt.find('=');
      if (eq == std::string::npos) return fail("HEALTHCHECK option requires a value: " + opt);
      const std::string name = opt.substr(2, eq - 2);
      const std::string value = opt.substr(eq + 1);
      any_option = true;
      if (name == "retries") {
        const size_t digits_from = (!value.empty() && value[0] == '-') ? 1 : 0;
        if (value.size() <= digits_from || value.size() > 9 ||
            !std::all_of(value.begin() + static_cast<std::ptrdiff_t>(digits_from), value.end(),
                         [](char c) { return c >= '0' && c <= '9'; }))
          return fail("invalid --retries value '" + value + "'");
        hc.retries = std::stoi(value);
        continue;
      }
      auto ms = parse_duration_ms(value);
      if (!ms) return fail("invalid duration '" + value + "' for --" + name);
      if (name == "interval") hc.interval_ms = *ms;
      else if (name == "timeout") hc.timeout_ms = *ms;
      else if (name == "start-period") hc.start_period_ms = *ms;
      else return fail("unknown HEALTHCHECK option --" + name);
    }
    size_t sp = 0;
    while (sp < rest.size() && !std::isspace(static_cast<unsigned char>(rest[sp]))) ++sp;
    const std::string sub = upper(rest.substr(0, sp));
    const std::string cmd_text = trim(rest.substr(sp));
    if (sub == "NONE") {
      if (any_option || !cmd_text.empty()) return fail("HEALTHCHECK NONE takes no options or arguments");
      hc.none = true;
      return add(recipe, std::move(hc), "HEALTHCHECK");
    }
    if (sub != "CMD") return fail("HEALTHCHECK expects CMD or NONE");
    auto cmd = parse_command(cmd_text);
    if (!cmd) return fail("HEALTHCHECK CMD requires a command");
    hc.command = std::move(*cmd);
    return add(recipe, std::move(hc), "HEALTHCHECK");
  }

  int line_{0};
  BuildError error_;
};

}  // namespace

std::optional<std::int64_t> parse_duration_ms(const std::string& text) {
  std::string s = trim(text);
  if (s.empty()) return std::nullopt;
  bool negative = false;
  if (s[0] == '-' || s[0] == '+') {
    negative = s[0] == '-';
    s = s.substr(1);
  }
  if (s == "0") return 0;
  double total = 0.0;
  size_t i = 0;
  bool any = false;
  while (i < s.size()) {
    const size_t start = i;
    while (i < s.size() && (std::isdigit(static_cast<unsigned char>(s[i])) || s[i] == '.')) ++i;
    if (i == start) return std::nullopt;
    const std::string number = s.substr(start, i - start);
    if (std::count(number.begin(), number.end(), '.') > 1) return std::nullopt;
    double amount = 0.0;
    std::size_t used = 0;
    try {
      amount = std::stod(number, &used);
    } catch (const std::exception&) {
      return std::nullopt;
    }
    if (used != number.size()) return std::nullopt;
    double unit_ms = 0.0;
    if (s.compare(i, 2, "ms") == 0) { unit_ms = 1.0; i += 2; }
    else if (s.compare(i, 1, "s") == 0) { unit_ms = 1000.0; i += 1; }
    else if (s.compare(i, 1, "m") == 0) { unit_ms = 60000.0; i += 1; }
    else if (s.compare(i, 1, "h") == 0) { unit_ms = 3600000.0; i += 1; }
    else return std::nullopt;
    total += amount * unit_ms;
    any = true;
  }
  if (!any) return std::nullopt;
  const auto ms = static_cast<std::int64_t>(std::llround(total));
  return negative ? -ms : ms;
}

ParseResult parse_stagefile(const std::string& text) {
  StagefileParser parser;
  return parser.run(text);
}

std::string Instruction::summary() const {
  std::string detail;
  if (const auto* e = std::get_if<EnvInstr>(&body)) {
    for (const auto& [k, v] : e->vars) {
      if (!detail.empty()) detail += " ";
      detail += k + "=" + v;
    }
  } else if (const auto* r = std::get_if<RunInstr>(&body)) {
    detail = argv_text(r->command);
  } else if (const auto* c = std::get_if<CopyInstr>(&body)) {
    for (const auto& s : c->sources) detail += s + " ";
    detail += c->dest;
  } else if (const auto* x = std::get_if<ExposeInstr>(&body)) {
    for (int p : x->ports) {
      if (!detail.empty()) detail += " ";
      detail += std::to_string(p);
    }
  } else if (const auto* h = std::get_if<HealthcheckInstr>(&body)) {
    detail = h->none ? "NONE" : "CMD " + argv_text(h->command);
  } else if (const auto* en = std::get_if<EntrypointInstr>(&body)) {
    detail = argv_text(en->command);
  } else if (const auto* w = std::get_if<WorkdirInstr>(&body)) {
    detail = w->path;
  }
  return keyword + " " + compact(detail, 72);
}

jsonlite::Value canonicalize_instruction(const Instruction& instr) {
  using jsonlite::Array;
  using jsonlite::Object;
  Object o;
  std::visit(
      [&o](const auto& b) {
        using T = std::decay_t<decltype(b)>;
        if constexpr (std::is_same_v<T, EnvInstr>) {
          o["op"] = "set-environment-variable";
          Array vars;
          for (const auto& [k, v] : b.vars) vars.emplace_back(Array{jsonlite::Value{k}, jsonlite::Value{v}});
          o["vars"] = std::move(vars);
        } else if constexpr (std::is_same_v<T, RunInstr>) {
          o["op"] = "run-shell-step";
          o["argv"] = jsonlite::to_array(b.command.argv);
        } else if constexpr (std::is_same_v<T, CopyInstr>) {
          o["op"] = "copy-files";
          o["sources"] = jsonlite::to_array(b.sources);
          o["dest"] = b.dest;
        } else if constexpr (std::is_same_v<T, ExposeInstr>) {
          o["op"] = "declare-exposed-port";
          Array ports;
          for (int p : b.ports) ports.emplace_back(static_cast<std::uint64_t>(p));
          o["ports"] = std::move(ports);
        } else if constexpr (std::is_same_v<T, HealthcheckInstr>) {
          o["op"] = "declare-healthcheck";
          o["none"] = b.none;
          o["argv"] = jsonlite::to_array(b.command.argv);
          o["interval_ms"] = static_cast<std::int64_t>(b.interval_ms);
          o["timeout_ms"] = static_cast<std::int64_t>(b.timeout_ms);
          o["start_period_ms"] = static_cast<std::int64_t>(b.start_period_ms);
          o["retries"] = static_cast<std::int64_t>(b.retries);
        } else if constexpr (std::is_same_v<T, EntrypointInstr>) {
          o["op"] = "set-entrypoint";
          o["argv"] = jsonlite::to_array(b.command.argv);
        } else if constexpr (std::is_same_v<T, WorkdirInstr>) {
          o["op"] = "set-workdir";
          o["path"] = b.path;
        }
      },
      instr.body);
  return jsonlite::Value{std::move(o)};
}

}  // namespace stagecraft
