#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "stagecraft/assembler.hpp"
#include "stagecraft/base_registry.hpp"
#include "stagecraft/build.hpp"
#include "stagecraft/cas.hpp"
#include "stagecraft/config.hpp"
#include "stagecraft/hash.hpp"
#include "stagecraft/jsonlite.hpp"
#include "stagecraft/layer_cache.hpp"
#include "stagecraft/observability.hpp"
#include "stagecraft/planner.hpp"
#include "stagecraft/probe.hpp"
#include "stagecraft/recipe.hpp"
#include "stagecraft/snapshot.hpp"
#include "stagecraft/supervisor.hpp"
#include "stagecraft/version.hpp"

namespace fs = std::filesystem;

namespace {

std::atomic<bool> g_interrupted{false};

void on_signal(int) { g_interrupted.store(true); }

bool read_file(const std::string &path, std::string *out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs)
    return false;
  out->assign((std::istreambuf_iterator<char>(ifs)),
              std::istreambuf_iterator<char>());
  return true;
}

bool write_file(const std::string &path, const std::string &data) {
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  ofs << data;
  return static_cast<bool>(ofs);
}

// Flags shared by every command. Positional arguments are collected in
// order, the command name excluded.
struct Args {
  std::vector<std::string> positional;
  std::string config;
  std::string target;
  std::string context{"."};
  std::string output;
  std::string rootfs;
  std::string policy{"mark-only"};
  std::string log;
  std::uint64_t timeout_ms{5000};
  std::map<std::string, std::string> env;
  std::string error;
};

Args parse_args(int argc, char **argv, int first) {
  Args a;
  for (int i = first; i < argc; ++i) {
    const std::string arg = argv[i];
    auto value = [&](std::string *dst) {
      if (i + 1 >= argc) {
        a.error = arg + " requires a value";
        return;
      }
      *dst = argv[++i];
    };
    if (arg == "--config") {
      value(&a.config);
    } else if (arg == "--target") {
      value(&a.target);
    } else if (arg == "--context") {
      value(&a.context);
    } else if (arg == "--output" || arg == "-o") {
      value(&a.output);
    } else if (arg == "--rootfs") {
      value(&a.rootfs);
    } else if (arg == "--policy") {
      value(&a.policy);
    } else if (arg == "--log") {
      value(&a.log);
    } else if (arg == "--timeout-ms") {
      std::string v;
      value(&v);
      char *end = nullptr;
      a.timeout_ms = std::strtoull(v.c_str(), &end, 10);
      if (v.empty() || *end != '\0')
        a.error = "--timeout-ms expects an integer";
    } else if (arg == "--env" || arg == "-e") {
      std::string kv;
      value(&kv);
      const auto eq = kv.find('=');
      if (eq == std::string::npos || eq == 0)
        a.error = "--env expects KEY=VALUE, got '" + kv + "'";
      else
        a.env[kv.substr(0, eq)] = kv.substr(eq + 1);
    } else if (arg.rfind("--", 0) == 0) {
      a.error = "unknown flag " + arg;
    } else {
      a.positional.push_back(arg);
    }
    if (!a.error.empty())
      break;
  }
  return a;
}

// 2 for problems with the input (recipe, plan, descriptor), 1 for failures
// while executing or running.
int exit_code_for(const stagecraft::BuildError &e) {
  switch (e.category()) {
  case stagecraft::ErrorCategory::input:
  case stagecraft::ErrorCategory::planning:
  case stagecraft::ErrorCategory::assembly:
    return 2;
  default:
    return 1;
  }
}

int report_input_error(const std::string &detail) {
  const auto err =
      stagecraft::make_error(stagecraft::ErrorCode::config_invalid, detail);
  std::cerr << "error: " << err.message() << "\n";
  std::cout << "{\"ok\":false,\"error\":" << err.to_json() << "}\n";
  return 2;
}

// Engine state assembled from defaults, environment and --config.
struct Engine {
  stagecraft::EngineConfig config;
  std::shared_ptr<stagecraft::ContentStore> store;
  std::unique_ptr<stagecraft::LayerCache> cache;
  std::unique_ptr<stagecraft::LocalBaseRegistry> bases;
};

bool open_engine(const Args &args, Engine *engine, std::string *error) {
  engine->config = stagecraft::EngineConfig::from_env();
  if (!args.config.empty()) {
    stagecraft::ConfigValidationResult vr;
    engine->config = stagecraft::load_config(args.config, engine->config, &vr);
    for (const auto &w : vr.warnings)
      std::cerr << "warning: " << args.config << ": " << w << "\n";
    if (!vr.ok) {
      std::string joined;
      for (const auto &e : vr.errors)
        joined += (joined.empty() ? "" : "; ") + e;
      *error = args.config + ": " + joined;
      return false;
    }
  }
  if (!engine->config.event_log.empty())
    stagecraft::set_event_log_path(engine->config.event_log);

  const std::string &root = engine->config.cache_root;
  engine->store = std::make_shared<stagecraft::ContentStore>(root + "/cas");
  engine->cache = std::make_unique<stagecraft::LayerCache>(
      engine->store, root, engine->config.compression);
  engine->bases = std::make_unique<stagecraft::LocalBaseRegistry>(
      engine->config.bases_dir, engine->store, engine->config.compression);
  return true;
}

bool load_recipe(const Args &args, stagecraft::Recipe *recipe,
                 stagecraft::BuildError *error) {
  const std::string path = args.positional.empty()
                               ? (fs::path(args.context) / "Stagefile").string()
                               : args.positional.front();
  std::string text;
  if (!read_file(path, &text)) {
    *error = stagecraft::make_error(stagecraft::ErrorCode::stagefile_parse_error,
                                    "cannot read " + path);
    return false;
  }
  auto parsed = stagecraft::parse_stagefile(text);
  if (!parsed.ok) {
    *error = parsed.error;
    error->detail = path + ": " + error->detail;
    return false;
  }
  *recipe = std::move(parsed.recipe);
  return true;
}

bool load_descriptor(const std::string &path, stagecraft::ImageDescriptor *out,
                     stagecraft::BuildError *error) {
  std::string text;
  if (!read_file(path, &text)) {
    *error = stagecraft::make_error(stagecraft::ErrorCode::json_parse_error,
                                    "cannot read " + path);
    return false;
  }
  auto image = stagecraft::descriptor_from_json(text, error);
  if (!image)
    return false;
  *out = std::move(*image);
  return true;
}

std::string ms_since(std::chrono::steady_clock::time_point start) {
  return std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::steady_clock::now() - start)
                            .count());
}

void print_usage() {
  std::cerr
      << "usage: stagecraft <command> [args]\n"
         "  build [Stagefile] [--context DIR] [--target STAGE] [-o FILE]\n"
         "  plan [Stagefile] [--context DIR] [--target STAGE]\n"
         "  inspect DESCRIPTOR\n"
         "  run DESCRIPTOR [--env K=V]... [--rootfs DIR] [--policy NAME] "
         "[--log FILE]\n"
         "  probe URL [--timeout-ms N]\n"
         "  cache stats|verify\n"
         "  config validate FILE | config show\n"
         "  digest FILE...\n"
         "  doctor\n"
         "  version\n"
         "common flags: --config FILE\n";
}

int cmd_build(const Args &args) {
  Engine engine;
  std::string cfg_error;
  if (!open_engine(args, &engine, &cfg_error))
    return report_input_error(cfg_error);

  stagecraft::Recipe recipe;
  stagecraft::BuildError error;
  if (!load_recipe(args, &recipe, &error)) {
    std::cerr << "[build] " << error.message() << "\n";
    std::cout << "{\"ok\":false,\"error\":" << error.to_json() << "}\n";
    return exit_code_for(error);
  }

  std::atomic<bool> cancel{false};
  stagecraft::BuildOptions options;
  options.target = args.target;
  options.context.context_dir = args.context;
  options.context.step_timeout_ms = engine.config.step_timeout_ms;
  options.context.max_output_bytes = engine.config.max_output_bytes;
  options.context.compression = engine.config.compression;
  options.context.cancel = &cancel;
  options.on_step = [](const stagecraft::StepRecord &rec) {
    std::cerr << "[build] " << rec.stage << " #" << rec.index + 1 << " "
              << rec.summary << (rec.cached ? " (cached)" : "") << " "
              << rec.duration_ns / 1000000 << "ms\n";
  };

  // Ctrl-C cancels the in-flight step.
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);
  std::atomic<bool> finished{false};
  std::thread watcher([&] {
    while (!finished.load()) {
      if (g_interrupted.load())
        cancel.store(true);
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
  });

  const auto result = stagecraft::build_image(recipe, options, *engine.cache,
                                              *engine.store, *engine.bases);
  finished.store(true);
  watcher.join();

  if (!result.ok) {
    std::cerr << "[build] failed: " << result.error.message() << "\n";
    std::cout << result.to_json() << "\n";
    return exit_code_for(result.error);
  }
  std::cerr << "[build] image " << result.image->digest.substr(0, 12) << " ("
            << result.metrics.steps_executed << " executed, "
            << result.metrics.cache_hits << " cached, "
            << result.metrics.duration_ns / 1000000 << "ms)\n";
  if (!args.output.empty()) {
    if (!write_file(args.output, stagecraft::descriptor_to_json(*result.image))) {
      std::cerr << "[build] cannot write " << args.output << "\n";
      return 1;
    }
  }
  std::cout << result.to_json() << "\n";
  return 0;
}

int cmd_plan(const Args &args) {
  Engine engine;
  std::string cfg_error;
  if (!open_engine(args, &engine, &cfg_error))
    return report_input_error(cfg_error);

  stagecraft::Recipe recipe;
  stagecraft::BuildError error;
  if (!load_recipe(args, &recipe, &error)) {
    std::cout << "{\"ok\":false,\"error\":" << error.to_json() << "}\n";
    return exit_code_for(error);
  }
  const auto plan = stagecraft::plan_build(recipe, *engine.bases, args.target);
  std::cout << stagecraft::plan_to_json(recipe, plan) << "\n";
  return plan.ok ? 0 : exit_code_for(plan.error);
}

int cmd_inspect(const Args &args) {
  if (args.positional.empty()) {
    print_usage();
    return 2;
  }
  stagecraft::ImageDescriptor image;
  stagecraft::BuildError error;
  if (!load_descriptor(args.positional.front(), &image, &error)) {
    std::cout << "{\"ok\":false,\"error\":" << error.to_json() << "}\n";
    return exit_code_for(error);
  }
  std::cout << stagecraft::descriptor_to_json(image) << "\n";
  return 0;
}

int cmd_run(const Args &args) {
  if (args.positional.empty()) {
    print_usage();
    return 2;
  }
  Engine engine;
  std::string cfg_error;
  if (!open_engine(args, &engine, &cfg_error))
    return report_input_error(cfg_error);

  stagecraft::ImageDescriptor image;
  stagecraft::BuildError error;
  if (!load_descriptor(args.positional.front(), &image, &error)) {
    std::cerr << "[run] " << error.message() << "\n";
    return exit_code_for(error);
  }
  auto policy = stagecraft::make_policy(args.policy);
  if (!policy)
    return report_input_error("unknown policy '" + args.policy + "'");

  auto snapshot = engine.cache->get(image.fingerprint);
  if (!snapshot) {
    error = stagecraft::make_error(
        stagecraft::ErrorCode::cache_integrity_failed,
        "layer " + image.fingerprint.substr(0, 12) +
            " is not in the layer cache; rebuild the image");
    std::cerr << "[run] " << error.message() << "\n";
    return 1;
  }
  if (stagecraft::tree_digest((*snapshot)->tree) != image.rootfs_digest) {
    error = stagecraft::make_error(stagecraft::ErrorCode::cache_integrity_failed,
                                   "cached root filesystem does not match the "
                                   "descriptor");
    std::cerr << "[run] " << error.message() << "\n";
    return 1;
  }

  const std::string rootfs =
      args.rootfs.empty()
          ? (fs::path(".stagecraft") / "run" / image.digest.substr(0, 16))
                .string()
          : args.rootfs;
  const auto sync = stagecraft::sync_tree((*snapshot)->tree, rootfs,
                                          *engine.store, nullptr);
  if (!sync.ok) {
    std::cerr << "[run] materialize " << rootfs << ": " << sync.error << "\n";
    return 1;
  }
  std::error_code ec;
  const std::string abs_rootfs = fs::absolute(rootfs, ec).string();
  std::cerr << "[run] rootfs " << abs_rootfs << " (" << sync.written
            << " entries)\n";

  stagecraft::SupervisorOptions options;
  options.env_overrides = args.env;
  options.rootfs = abs_rootfs;
  options.output_path = args.log;
  options.policy = policy;

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  stagecraft::BootstrapSupervisor supervisor(image, options);
  const auto started = std::chrono::steady_clock::now();
  if (!supervisor.start()) {
    std::cerr << "[run] " << supervisor.runtime_error().message() << "\n";
    return 1;
  }
  std::cerr << "[run] pid " << supervisor.pid() << " policy " << policy->name()
            << "\n";

  std::size_t printed = 0;
  auto print_transitions = [&] {
    const auto history = supervisor.transitions();
    for (; printed < history.size(); ++printed) {
      const auto &t = history[printed];
      std::cerr << "[run] +" << t.at_ms << "ms "
                << stagecraft::to_string(t.from) << " -> "
                << stagecraft::to_string(t.to) << " (" << t.reason << ")\n";
    }
  };

  std::optional<int> code;
  while (!code) {
    code = supervisor.wait_terminated(std::chrono::milliseconds(100));
    print_transitions();
    if (!code && g_interrupted.load()) {
      std::cerr << "[run] interrupted after " << ms_since(started)
                << "ms, stopping\n";
      supervisor.cancel();
      code = supervisor.exit_code();
    }
  }
  print_transitions();

  const auto runtime_error = supervisor.runtime_error();
  stagecraft::jsonlite::Object out;
  out["exit_code"] = static_cast<std::int64_t>(code.value_or(-1));
  out["state"] = stagecraft::to_string(supervisor.state());
  out["ok"] = runtime_error.ok();
  if (!runtime_error.ok()) {
    std::cerr << "[run] " << runtime_error.message() << "\n";
    out["error"] = stagecraft::jsonlite::parse(runtime_error.to_json(), nullptr);
  }
  std::cout << stagecraft::jsonlite::to_json(out) << "\n";
  return runtime_error.ok() ? 0 : 1;
}

int cmd_probe(const Args &args) {
  if (args.positional.empty()) {
    print_usage();
    return 2;
  }
  const auto r = stagecraft::probe_url(args.positional.front(), args.timeout_ms);
  stagecraft::jsonlite::Object out;
  out["ok"] = r.ok;
  out["url"] = args.positional.front();
  out["duration_ms"] = static_cast<std::uint64_t>(r.duration_ns / 1000000);
  if (r.status_code != 0)
    out["status"] = static_cast<std::int64_t>(r.status_code);
  if (!r.error.empty())
    out["error"] = r.error;
  std::cout << stagecraft::jsonlite::to_json(out) << "\n";
  return r.ok ? 0 : 1;
}

int cmd_cache(const Args &args) {
  const std::string sub = args.positional.empty() ? "stats" : args.positional.front();
  Engine engine;
  std::string cfg_error;
  if (!open_engine(args, &engine, &cfg_error))
    return report_input_error(cfg_error);

  if (sub == "stats") {
    const auto s = engine.cache->stats();
    std::cout << "{\"layers\":" << s.entries
              << ",\"objects\":" << engine.store->size()
              << ",\"root\":\"" << stagecraft::jsonlite::escape(engine.config.cache_root)
              << "\",\"backend\":\"" << engine.store->backend_id() << "\"}\n";
    return 0;
  }
  if (sub == "verify") {
    const auto objects = engine.store->verify();
    const auto layers = engine.cache->verify();
    stagecraft::jsonlite::Object out;
    out["ok"] = objects.ok() && layers.ok();
    out["objects_checked"] = static_cast<std::uint64_t>(objects.objects_checked);
    out["corrupted_objects"] = stagecraft::jsonlite::to_array(objects.corrupted);
    out["layers_checked"] = static_cast<std::uint64_t>(layers.entries_checked);
    out["broken_layers"] = stagecraft::jsonlite::to_array(layers.broken);
    std::cout << stagecraft::jsonlite::to_json(out) << "\n";
    return objects.ok() && layers.ok() ? 0 : 1;
  }
  print_usage();
  return 2;
}

int cmd_config(const Args &args) {
  const std::string sub = args.positional.empty() ? "show" : args.positional.front();
  if (sub == "validate") {
    if (args.positional.size() < 2) {
      print_usage();
      return 2;
    }
    std::string text;
    if (!read_file(args.positional[1], &text))
      return report_input_error("cannot read " + args.positional[1]);
    const auto r = stagecraft::validate_config(text);
    stagecraft::jsonlite::Object out;
    out["ok"] = r.ok;
    out["config_version"] = r.config_version;
    out["errors"] = stagecraft::jsonlite::to_array(r.errors);
    out["warnings"] = stagecraft::jsonlite::to_array(r.warnings);
    std::cout << stagecraft::jsonlite::to_json(out) << "\n";
    return r.ok ? 0 : 2;
  }
  if (sub == "show") {
    Engine engine;
    std::string cfg_error;
    if (!open_engine(args, &engine, &cfg_error))
      return report_input_error(cfg_error);
    std::cout << stagecraft::config_to_json(engine.config) << "\n";
    return 0;
  }
  print_usage();
  return 2;
}

int cmd_digest(const Args &args) {
  if (args.positional.empty()) {
    print_usage();
    return 2;
  }
  int rc = 0;
  for (const auto &path : args.positional) {
    std::string data;
    if (!read_file(path, &data)) {
      std::cerr << "cannot read " << path << "\n";
      rc = 1;
      continue;
    }
    std::cout << "{\"path\":\"" << stagecraft::jsonlite::escape(path)
              << "\",\"blake3\":\"" << stagecraft::blake3_hex(data)
              << "\",\"cas\":\"" << stagecraft::cas_content_hash(data)
              << "\",\"size\":" << data.size() << "}\n";
  }
  return rc;
}

int cmd_doctor(const Args &args) {
  std::vector<std::string> blockers;
  const auto h = stagecraft::hash_runtime_info();
  if (!h.blake3_available)
    blockers.push_back("blake3_not_available");
  // Official BLAKE3 vectors.
  if (stagecraft::blake3_hex("") !=
          "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262" ||
      stagecraft::blake3_hex("hello") !=
          "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f")
    blockers.push_back("hash_vectors_failed");
  if (stagecraft::resolve_executable("sh", stagecraft::kDefaultPath).empty())
    blockers.push_back("no_posix_shell");

  Engine engine;
  std::string cfg_error;
  const bool config_ok = open_engine(args, &engine, &cfg_error);
  if (!config_ok)
    blockers.push_back("config_invalid");
  bool compression_ok = false;
  for (const auto &c : stagecraft::supported_compression())
    compression_ok = compression_ok || c == engine.config.compression;
  if (!compression_ok)
    blockers.push_back("compression_unsupported");

  std::error_code ec;
  fs::create_directories(engine.config.cache_root, ec);
  if (ec)
    blockers.push_back("cache_dir_not_writable");

  stagecraft::jsonlite::Object out;
  out["ok"] = blockers.empty();
  out["blockers"] = stagecraft::jsonlite::to_array(blockers);
  out["engine_version"] = stagecraft::version::ENGINE_SEMVER;
  out["hash_primitive"] = h.primitive;
  out["hash_backend"] = h.backend;
  out["hash_version"] = h.version;
  out["compression_capabilities"] =
      stagecraft::jsonlite::to_array(stagecraft::supported_compression());
  if (config_ok) {
    out["config"] = stagecraft::jsonlite::parse(
        stagecraft::config_to_json(engine.config), nullptr);
  }
  out["stats"] = stagecraft::jsonlite::parse(
      stagecraft::global_engine_stats().to_json(), nullptr);
  std::cout << stagecraft::jsonlite::to_json(out) << "\n";
  return blockers.empty() ? 0 : 2;
}

} // namespace

int main(int argc, char **argv) {
  if (argc < 2) {
    print_usage();
    return 2;
  }
  const std::string cmd = argv[1];
  if (cmd == "--help" || cmd == "-h" || cmd == "help") {
    print_usage();
    return 0;
  }

  const Args args = parse_args(argc, argv, 2);
  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    print_usage();
    return 2;
  }

  if (cmd == "version") {
    std::cout << stagecraft::version::manifest_to_json(
                     stagecraft::version::current_manifest())
              << "\n";
    return 0;
  }
  if (cmd == "build")
    return cmd_build(args);
  if (cmd == "plan")
    return cmd_plan(args);
  if (cmd == "inspect")
    return cmd_inspect(args);
  if (cmd == "run")
    return cmd_run(args);
  if (cmd == "probe")
    return cmd_probe(args);
  if (cmd == "cache")
    return cmd_cache(args);
  if (cmd == "config")
    return cmd_config(args);
  if (cmd == "digest")
    return cmd_digest(args);
  if (cmd == "doctor")
    return cmd_doctor(args);

  std::cerr << "unknown command: " << cmd << "\n";
  print_usage();
  return 2;
}
