#include <arpa/inet.h>
#include <netinet/in.h>
#include <signal.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "stagecraft/assembler.hpp"
#include "stagecraft/base_registry.hpp"
#include "stagecraft/build.hpp"
#include "stagecraft/cas.hpp"
#include "stagecraft/config.hpp"
#include "stagecraft/fingerprint.hpp"
#include "stagecraft/hash.hpp"
#include "stagecraft/jsonlite.hpp"
#include "stagecraft/layer_cache.hpp"
#include "stagecraft/observability.hpp"
#include "stagecraft/planner.hpp"
#include "stagecraft/probe.hpp"
#include "stagecraft/recipe.hpp"
#include "stagecraft/sandbox.hpp"
#include "stagecraft/snapshot.hpp"
#include "stagecraft/supervisor.hpp"
#include "stagecraft/version.hpp"

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

// Fresh directory under the system temp dir, removed on scope exit.
struct TempDir {
  std::string path;
  explicit TempDir(const std::string& name) {
    path = (fs::temp_directory_path() /
            ("stagecraft_" + name + "_" + std::to_string(::getpid())))
               .string();
    stagecraft::remove_materialized(path);
    fs::create_directories(path);
  }
  ~TempDir() { stagecraft::remove_materialized(path); }
};

void write_text(const std::string& path, const std::string& text) {
  fs::create_directories(fs::path(path).parent_path());
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  ofs << text;
}

std::string read_text(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

// Build context, content store, layer cache and base registry rooted in one
// temp dir.
struct Workspace {
  TempDir dir;
  std::string context;
  std::shared_ptr<stagecraft::ContentStore> store;
  std::unique_ptr<stagecraft::LayerCache> cache;
  std::unique_ptr<stagecraft::LocalBaseRegistry> bases;

  explicit Workspace(const std::string& name) : dir(name) {
    context = dir.path + "/ctx";
    fs::create_directories(context);
    store = std::make_shared<stagecraft::ContentStore>(dir.path + "/cache/cas");
    cache = std::make_unique<stagecraft::LayerCache>(store, dir.path + "/cache");
    bases = std::make_unique<stagecraft::LocalBaseRegistry>(dir.path + "/bases", store);
  }

  // A second LayerCache over the same directories, with an empty in-memory
  // index.
  void reopen() {
    store = std::make_shared<stagecraft::ContentStore>(dir.path + "/cache/cas");
    cache = std::make_unique<stagecraft::LayerCache>(store, dir.path + "/cache");
    bases = std::make_unique<stagecraft::LocalBaseRegistry>(dir.path + "/bases", store);
  }

  stagecraft::BuildResult build(const std::string& stagefile, const std::string& target = "",
                                std::uint64_t step_timeout_ms = 0,
                                const std::atomic<bool>* cancel = nullptr) {
    auto parsed = stagecraft::parse_stagefile(stagefile);
    expect(parsed.ok, "stagefile must parse: " + parsed.error.message());
    stagecraft::BuildOptions options;
    options.target = target;
    options.context.context_dir = context;
    options.context.work_root = dir.path + "/work";
    options.context.step_timeout_ms = step_timeout_ms;
    options.context.cancel = cancel;
    return stagecraft::build_image(parsed.recipe, options, *cache, *store, *bases);
  }
};

std::vector<std::string> fingerprints_of(const stagecraft::BuildResult& r,
                                         const std::string& stage) {
  std::vector<std::string> out;
  for (const auto& s : r.steps) {
    if (s.stage == stage) out.push_back(s.fingerprint);
  }
  return out;
}

const char* kServiceRecipe = R"SF(# service image
FROM scratch AS base
WORKDIR /app
ENV DATABASE_URL=sqlite:///./app.db \
    PYTHONUNBUFFERED=1
COPY requirements.txt .
RUN echo "installed $(cat requirements.txt)" > deps.txt

FROM base AS service
COPY src/ src/
EXPOSE 8001
HEALTHCHECK --interval=5s --timeout=3s --start-period=30s --retries=3 \
    CMD ["/bin/sh", "-c", "exit 0"]
CMD ["/bin/sh", "-c", "exec sleep 30"]
)SF";

void write_service_context(const std::string& context) {
  write_text(context + "/requirements.txt", "fastapi==0.110\n");
  write_text(context + "/src/main.py", "print('hello')\n");
  write_text(context + "/src/pkg/util.py", "X = 1\n");
}

// ============================================================================
// Hashing and JSON
// ============================================================================

void test_blake3_known_vectors() {
  expect(stagecraft::blake3_hex("") ==
             "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(stagecraft::blake3_hex("hello") ==
             "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_domain_separation() {
  const std::string payload = "{\"a\":1}";
  const auto cas = stagecraft::cas_content_hash(payload);
  const auto fp = stagecraft::fingerprint_hash(payload);
  const auto tree = stagecraft::tree_hash(payload);
  const auto img = stagecraft::descriptor_hash(payload);
  expect(cas != fp && fp != tree && tree != img && cas != img,
         "each domain prefix must yield a distinct digest");
  expect(stagecraft::is_hex_digest(fp), "fingerprint is 64 lowercase hex chars");
  expect(!stagecraft::is_hex_digest("ABC"), "short or upper-case digests rejected");
}

void test_json_canonicalization() {
  std::optional<stagecraft::jsonlite::JsonError> err;
  const auto a = stagecraft::jsonlite::canonicalize_json("{\"b\":1, \"a\":[true,null]}", &err);
  expect(!err, "valid JSON canonicalizes");
  expect(a == "{\"a\":[true,null],\"b\":1}", "keys sorted, whitespace removed");

  stagecraft::jsonlite::parse("{\"a\":1,\"a\":2}", &err);
  expect(err.has_value(), "duplicate keys rejected");
  stagecraft::jsonlite::parse("[1,2]", &err);
  expect(err.has_value(), "non-object root rejected");
}

// ============================================================================
// Stagefile parsing
// ============================================================================

void test_parse_service_recipe() {
  const auto r = stagecraft::parse_stagefile(kServiceRecipe);
  expect(r.ok, "service recipe parses: " + r.error.message());
  expect(r.recipe.stages.size() == 2, "two stages");
  const auto& base = r.recipe.stages[0];
  expect(base.name == "base" && base.base == "scratch", "FROM scratch AS base");
  expect(base.instructions.size() == 4, "base has four instructions");

  const auto* env = std::get_if<stagecraft::EnvInstr>(&base.instructions[1].body);
  expect(env && env->vars.size() == 2, "continued ENV line holds two variables");
  expect(env->vars[0].first == "DATABASE_URL" && env->vars[0].second == "sqlite:///./app.db",
         "ENV value kept verbatim");

  const auto* run = std::get_if<stagecraft::RunInstr>(&base.instructions[3].body);
  expect(run && run->command.shell_form, "shell-form RUN");
  expect(run->command.argv.size() == 3 && run->command.argv[0] == "/bin/sh" &&
             run->command.argv[1] == "-c",
         "shell form expands to /bin/sh -c");

  const auto& service = r.recipe.stages[1];
  expect(service.base == "base", "second stage builds on the first");
  const auto* hc = std::get_if<stagecraft::HealthcheckInstr>(&service.instructions[2].body);
  expect(hc != nullptr, "HEALTHCHECK parsed");
  expect(hc->interval_ms == 5000 && hc->timeout_ms == 3000 && hc->start_period_ms == 30000 &&
             hc->retries == 3,
         "HEALTHCHECK options parsed");
  const auto* cmd = std::get_if<stagecraft::EntrypointInstr>(&service.instructions[3].body);
  expect(cmd && !cmd->command.shell_form && cmd->command.argv.size() == 3, "exec-form CMD");
}

void test_parse_errors_carry_line() {
  auto r = stagecraft::parse_stagefile("FROM scratch\nENV A=1\nFROBNICATE x\n");
  expect(!r.ok, "unknown instruction rejected");
  expect(r.error.code == stagecraft::ErrorCode::stagefile_parse_error, "parse error code");
  expect(contains(r.error.detail, "line 3"), "error names line 3: " + r.error.detail);

  r = stagecraft::parse_stagefile("RUN echo hi\n");
  expect(!r.ok && contains(r.error.detail, "before FROM"), "instruction before FROM");

  r = stagecraft::parse_stagefile("FROM scratch\nEXPOSE 70000\n");
  expect(!r.ok && contains(r.error.detail, "line 2"), "port out of range");

  r = stagecraft::parse_stagefile("FROM scratch\nCOPY ../secret /x\n");
  expect(!r.ok, "COPY outside the context rejected");

  r = stagecraft::parse_stagefile("FROM scratch\nHEALTHCHECK --bogus=1 CMD true\n");
  expect(!r.ok, "unknown HEALTHCHECK option rejected");

  r = stagecraft::parse_stagefile("# only a comment\n");
  expect(!r.ok, "recipe without FROM rejected");
}

void test_parse_forms_and_defaults() {
  const auto r = stagecraft::parse_stagefile(
      "from scratch\n"
      "env LEGACY some value with spaces\n"
      "expose 8001 9000/udp\n"
      "healthcheck CMD stagecraft probe http://127.0.0.1:8001/\n"
      "entrypoint [\"/bin/true\"]\n"
      "FROM 0\n"
      "HEALTHCHECK NONE\n");
  expect(r.ok, "lower-case keywords accepted: " + r.error.message());
  expect(r.recipe.stages[0].name == "0" && r.recipe.stages[1].name == "1",
         "unnamed stages are named by index");
  const auto& ins = r.recipe.stages[0].instructions;
  const auto* env = std::get_if<stagecraft::EnvInstr>(&ins[0].body);
  expect(env->vars[0].first == "LEGACY" && env->vars[0].second == "some value with spaces",
         "ENV K V legacy form");
  const auto* ex = std::get_if<stagecraft::ExposeInstr>(&ins[1].body);
  expect(ex->ports == std::vector<int>({8001, 9000}), "EXPOSE ports with protocol suffix");
  const auto* hc = std::get_if<stagecraft::HealthcheckInstr>(&ins[2].body);
  expect(hc->interval_ms == 30000 && hc->timeout_ms == 30000 && hc->start_period_ms == 0 &&
             hc->retries == 3,
         "HEALTHCHECK defaults");
  const auto* none = std::get_if<stagecraft::HealthcheckInstr>(
      &r.recipe.stages[1].instructions[0].body);
  expect(none && none->none, "HEALTHCHECK NONE");
}

void test_canonical_instruction_spelling() {
  const auto a = stagecraft::parse_stagefile("FROM scratch\nCMD [\"/bin/app\", \"--port\", \"8001\"]\n");
  const auto b = stagecraft::parse_stagefile("FROM scratch\nentrypoint   [\"/bin/app\",\"--port\",\"8001\"]\n");
  expect(a.ok && b.ok, "both spellings parse");
  const auto ja = stagecraft::jsonlite::to_json(
      stagecraft::canonicalize_instruction(a.recipe.stages[0].instructions[0]));
  const auto jb = stagecraft::jsonlite::to_json(
      stagecraft::canonicalize_instruction(b.recipe.stages[0].instructions[0]));
  expect(ja == jb, "CMD and ENTRYPOINT canonicalize identically");
  expect(contains(ja, "set-entrypoint"), "canonical op name");

  const auto c = stagecraft::parse_stagefile("FROM scratch\nRUN echo  hi\n");
  const auto d = stagecraft::parse_stagefile("FROM scratch\nRUN echo hi\n");
  const auto jc = stagecraft::jsonlite::to_json(
      stagecraft::canonicalize_instruction(c.recipe.stages[0].instructions[0]));
  const auto jd = stagecraft::jsonlite::to_json(
      stagecraft::canonicalize_instruction(d.recipe.stages[0].instructions[0]));
  expect(jc != jd, "shell text is significant inside RUN");
}

void test_parse_duration() {
  expect(stagecraft::parse_duration_ms("30s") == 30000, "30s");
  expect(stagecraft::parse_duration_ms("1m30s") == 90000, "1m30s");
  expect(stagecraft::parse_duration_ms("500ms") == 500, "500ms");
  expect(stagecraft::parse_duration_ms("1.5s") == 1500, "1.5s");
  expect(stagecraft::parse_duration_ms("0") == 0, "bare zero");
  expect(!stagecraft::parse_duration_ms("10").has_value(), "unit required");
  expect(!stagecraft::parse_duration_ms("5x").has_value(), "unknown unit");
  expect(!stagecraft::parse_duration_ms("1.2.3s").has_value(), "two decimal points");
  expect(!stagecraft::parse_duration_ms(".s").has_value(), "no digits");
  const auto r = stagecraft::parse_stagefile("FROM scratch\nHEALTHCHECK --interval=1.2.3s CMD true\n");
  expect(!r.ok && contains(r.error.detail, "1.2.3s"), "malformed HEALTHCHECK duration rejected");
}

// ============================================================================
// Planner
// ============================================================================

stagecraft::Recipe recipe_of(const std::string& text) {
  auto r = stagecraft::parse_stagefile(text);
  expect(r.ok, "recipe parses: " + r.error.message());
  return r.recipe;
}

void test_plan_order_and_tie_break() {
  Workspace ws("plan_order");
  // "app" references "deps" which is declared after it.
  const auto recipe = recipe_of(
      "FROM deps AS app\nCMD [\"/bin/true\"]\n"
      "FROM scratch AS tools\n"
      "FROM scratch AS deps\n");
  const auto plan = stagecraft::plan_build(recipe, *ws.bases);
  expect(plan.ok, "plan succeeds");
  // tools (1) and deps (2) are ready first, in declaration order.
  expect(plan.order == std::vector<std::size_t>({1, 2, 0}), "stable topological order");
  expect(plan.target == 2, "default target is the last declared stage");

  const auto again = stagecraft::plan_build(recipe, *ws.bases);
  expect(again.order == plan.order, "planning is deterministic");

  const auto targeted = stagecraft::plan_build(recipe, *ws.bases, "app");
  expect(targeted.ok && targeted.target == 0, "explicit target");
}

void test_plan_cycle_detected() {
  Workspace ws("plan_cycle");
  const auto recipe = recipe_of("FROM b AS a\nFROM a AS b\nFROM scratch AS c\n");
  const auto plan = stagecraft::plan_build(recipe, *ws.bases);
  expect(!plan.ok, "cycle fails planning");
  expect(plan.error.code == stagecraft::ErrorCode::cyclic_dependency, "cyclic_dependency code");
  expect(plan.error.category() == stagecraft::ErrorCategory::planning, "planning category");
  expect(plan.cycle.size() == 3 && plan.cycle.front() == plan.cycle.back(),
         "cycle path is closed");
  expect(contains(plan.error.detail, "a") && contains(plan.error.detail, "b"),
         "cycle path names both stages");

  const auto self = stagecraft::plan_build(recipe_of("FROM x AS x\n"), *ws.bases);
  expect(self.error.code == stagecraft::ErrorCode::cyclic_dependency, "self reference is a cycle");
}

void test_plan_errors() {
  Workspace ws("plan_errors");
  auto plan = stagecraft::plan_build(recipe_of("FROM nowhere:1.0\n"), *ws.bases);
  expect(plan.error.code == stagecraft::ErrorCode::unknown_base, "unknown base");

  plan = stagecraft::plan_build(recipe_of("FROM scratch AS a\nFROM scratch AS a\n"), *ws.bases);
  expect(plan.error.code == stagecraft::ErrorCode::duplicate_stage, "duplicate stage");

  plan = stagecraft::plan_build(recipe_of("FROM scratch AS a\n"), *ws.bases, "missing");
  expect(plan.error.code == stagecraft::ErrorCode::unknown_target, "unknown target");

  fs::create_directories(ws.dir.path + "/bases/python_3.11-slim");
  plan = stagecraft::plan_build(recipe_of("FROM python:3.11-slim\n"), *ws.bases);
  expect(plan.ok, "base directory named after the sanitized reference resolves");
  expect(stagecraft::LocalBaseRegistry::sanitize("python:3.11-slim") ==
             stagecraft::LocalBaseRegistry::sanitize("python_3.11-slim"),
         "':' and '_' spellings share one base directory");
  expect(ws.bases->contains("python_3.11-slim"), "underscore spelling resolves to the same base");
}

// ============================================================================
// Content store and layer cache
// ============================================================================

void test_cas_put_get_and_corruption() {
  TempDir tmp("cas");
  stagecraft::ContentStore cas(tmp.path + "/cas");
  const std::string digest = cas.put("hello layer");
  expect(stagecraft::is_hex_digest(digest), "put returns digest");
  expect(digest == stagecraft::cas_content_hash("hello layer"), "key is the cas: hash");
  expect(cas.put("hello layer") == digest, "dedup returns same digest");
  expect(cas.get(digest).value_or("") == "hello layer", "get returns bytes");

  write_text(cas.object_path(digest), "tampered");
  expect(!cas.get(digest).has_value(), "corrupted object is never returned");
  const auto report = cas.verify();
  expect(!report.ok() && report.corrupted.size() == 1, "verify reports the corrupted object");
  expect(cas.put("hello layer") == digest, "put repairs a corrupted object");
  expect(cas.get(digest).has_value(), "repaired object readable");
}

void test_layer_cache_persistence_and_integrity() {
  Workspace ws("layer_cache");
  auto snap = std::make_shared<stagecraft::Snapshot>();
  snap->fingerprint = stagecraft::fingerprint_hash("{\"test\":1}");
  snap->config.env["A"] = "1";
  snap->tree["etc"] = stagecraft::FileEntry{stagecraft::EntryKind::directory, "", 0, 0755, ""};
  stagecraft::FileEntry f;
  f.digest = ws.store->put("config");
  f.size = 6;
  snap->tree["etc/app.conf"] = f;

  expect(!ws.cache->get(snap->fingerprint).has_value(), "miss before put");
  expect(ws.cache->put(snap->fingerprint, snap), "put succeeds");
  expect(!ws.cache->put(stagecraft::fingerprint_hash("other"), snap),
         "put under a foreign fingerprint rejected");

  ws.reopen();
  auto loaded = ws.cache->get(snap->fingerprint);
  expect(loaded.has_value(), "entry survives a reopen");
  expect((*loaded)->tree == snap->tree && (*loaded)->config == snap->config,
         "snapshot round-trips through the record");
  expect(ws.cache->stats().hits == 1, "hit counted");
  expect(ws.cache->verify().ok(), "verify passes on intact cache");

  // Corrupt the file blob the snapshot references.
  write_text(ws.store->object_path(f.digest), "garbage");
  ws.reopen();
  const auto report = ws.cache->verify();
  expect(!report.ok() && report.broken.size() == 1, "verify flags the layer with a bad blob");
}

void test_layer_cache_concurrent_readers() {
  Workspace ws("layer_cache_mt");
  auto snap = std::make_shared<stagecraft::Snapshot>();
  snap->fingerprint = stagecraft::fingerprint_hash("{\"mt\":1}");
  expect(ws.cache->put(snap->fingerprint, snap), "seed entry");
  std::atomic<int> hits{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 50; ++i) {
        if (ws.cache->get(snap->fingerprint)) hits.fetch_add(1);
        ws.cache->put(snap->fingerprint, snap);
      }
    });
  }
  for (auto& t : threads) t.join();
  expect(hits.load() == 400, "every concurrent read hits");
}

void test_sync_and_capture_tree() {
  TempDir tmp("sync_tree");
  stagecraft::ContentStore cas(tmp.path + "/cas");
  const std::string root = tmp.path + "/rootfs";

  stagecraft::FileTree tree;
  tree["app"] = stagecraft::FileEntry{stagecraft::EntryKind::directory, "", 0, 0755, ""};
  tree["app/run.sh"] =
      stagecraft::FileEntry{stagecraft::EntryKind::file, cas.put("#!/bin/sh\n"), 10, 0755, ""};
  tree["app/link"] = stagecraft::FileEntry{stagecraft::EntryKind::symlink, "", 0, 0777, "run.sh"};
  auto sync = stagecraft::sync_tree(tree, root, cas, nullptr);
  expect(sync.ok, "full sync: " + sync.error);
  expect(read_text(root + "/app/run.sh") == "#!/bin/sh\n", "file materialized");
  expect(fs::is_symlink(root + "/app/link"), "symlink materialized");

  auto captured = stagecraft::capture_tree(root, cas, "off");
  expect(captured.ok && captured.tree == tree, "capture reproduces the synced tree");

  stagecraft::FileTree next = tree;
  next.erase("app/link");
  next["app/data.txt"] =
      stagecraft::FileEntry{stagecraft::EntryKind::file, cas.put("data"), 4, 0644, ""};
  sync = stagecraft::sync_tree(next, root, cas, &tree);
  expect(sync.ok, "incremental sync");
  expect(sync.written == 1 && sync.removed == 1, "only the difference is applied");
  expect(!fs::exists(fs::symlink_status(root + "/app/link")), "removed entry gone");
  expect(stagecraft::tree_digest(next) != stagecraft::tree_digest(tree), "tree digest tracks content");
}

// ============================================================================
// Build: fingerprints, caching, execution
// ============================================================================

// Property: identical inputs give identical fingerprints and descriptors,
// even in an unrelated cache.
void test_build_determinism() {
  Workspace a("determinism_a");
  Workspace b("determinism_b");
  write_service_context(a.context);
  write_service_context(b.context);

  const auto ra = a.build(kServiceRecipe);
  const auto rb = b.build(kServiceRecipe);
  expect(ra.ok, "first build succeeds: " + ra.error.message());
  expect(rb.ok, "second build succeeds: " + rb.error.message());
  expect(ra.steps.size() == 8 && rb.steps.size() == 8, "every step reported");
  for (std::size_t i = 0; i < ra.steps.size(); ++i) {
    expect(ra.steps[i].fingerprint == rb.steps[i].fingerprint,
           "fingerprint " + std::to_string(i) + " is deterministic");
  }
  expect(ra.image->digest == rb.image->digest, "descriptor digest is deterministic");
  expect(stagecraft::descriptor_to_json(*ra.image) == stagecraft::descriptor_to_json(*rb.image),
         "descriptor bytes are deterministic");
  expect(!contains(stagecraft::descriptor_to_json(*ra.image), a.dir.path),
         "descriptor carries no host paths");
}

// Property: an unchanged rebuild executes nothing.
void test_rebuild_is_fully_cached() {
  Workspace ws("rebuild");
  write_service_context(ws.context);
  const auto first = ws.build(kServiceRecipe);
  expect(first.ok, "first build: " + first.error.message());
  expect(first.metrics.steps_executed == 8 && first.metrics.cache_hits == 0,
         "cold build executes every step");

  ws.reopen();
  const auto second = ws.build(kServiceRecipe);
  expect(second.ok, "rebuild: " + second.error.message());
  expect(second.metrics.steps_executed == 0, "rebuild executes zero steps");
  expect(second.metrics.cache_hits == 8, "every step is a cache hit");
  expect(second.image->digest == first.image->digest, "rebuild yields the same descriptor");
}

// Property: editing one instruction invalidates it and everything after it,
// including dependent stages, and nothing before it.
void test_change_invalidates_suffix() {
  Workspace ws("invalidate");
  const std::string v1 =
      "FROM scratch AS a\nENV A=1\nRUN echo one > one.txt\nENV B=2\nCMD [\"/bin/true\"]\n"
      "FROM a AS b\nRUN echo two > two.txt\n"
      "FROM scratch AS c\nENV C=3\nCMD [\"/bin/true\"]\n";
  std::string v2 = v1;
  v2.replace(v2.find("echo one"), 8, "echo uno");

  const auto r1 = ws.build(v1, "b");
  expect(r1.ok, "v1 builds: " + r1.error.message());
  const auto r2 = ws.build(v2, "b");
  expect(r2.ok, "v2 builds: " + r2.error.message());

  const auto a1 = fingerprints_of(r1, "a"), a2 = fingerprints_of(r2, "a");
  expect(a1[0] == a2[0], "step before the change is reused");
  for (std::size_t i = 1; i < a1.size(); ++i) {
    expect(a1[i] != a2[i], "step " + std::to_string(i) + " after the change is invalidated");
  }
  const auto b1 = fingerprints_of(r1, "b"), b2 = fingerprints_of(r2, "b");
  expect(b1[0] != b2[0], "dependent stage is invalidated");
  expect(fingerprints_of(r1, "c") == fingerprints_of(r2, "c"), "independent stage untouched");
  expect(r2.metrics.cache_hits == 3, "ENV A plus stage c are cache hits");
}

// Property: a failing step leaves no descriptor and is not cached; earlier
// steps stay cached.
void test_failed_step_not_cached() {
  Workspace ws("failure");
  const std::string recipe =
      "FROM scratch AS app\nENV A=1\nRUN echo ok > ok.txt\nRUN echo broken >&2; exit 3\n"
      "ENV B=2\nCMD [\"/bin/true\"]\n";
  const auto r = ws.build(recipe);
  expect(!r.ok, "build fails");
  expect(!r.image.has_value(), "no descriptor on failure");
  expect(r.error.code == stagecraft::ErrorCode::instruction_failed, "instruction_failed");
  expect(r.error.category() == stagecraft::ErrorCategory::execution, "execution category");
  expect(r.error.stage == "app" && r.error.instruction_index == 2, "failing step located");
  expect(r.error.exit_code == 3, "exit code carried");
  expect(contains(r.error.detail, "broken"), "stderr tail in detail");
  expect(r.steps.size() == 2, "two steps completed before the failure");
  expect(ws.cache->contains(r.steps[0].fingerprint) && ws.cache->contains(r.steps[1].fingerprint),
         "completed steps cached");
  expect(stagecraft::is_hex_digest(r.error.fingerprint), "failing fingerprint reported");
  expect(!ws.cache->contains(r.error.fingerprint), "failed step never cached");

  const auto again = ws.build(recipe);
  expect(!again.ok && again.metrics.cache_hits == 2, "retry resumes at the failed step");
}

void test_run_sees_env_and_workdir() {
  Workspace ws("run_env");
  const auto r = ws.build(
      "FROM scratch\nENV GREETING=\"hello world\"\nWORKDIR /srv/app\n"
      "RUN echo \"$GREETING\" > greeting.txt && pwd > /dev/null\n"
      "RUN test -f \"$STAGECRAFT_ROOTFS/srv/app/greeting.txt\"\n"
      "CMD [\"/bin/true\"]\n");
  expect(r.ok, "build succeeds: " + r.error.message());
  auto snap = ws.cache->get(r.image->fingerprint);
  expect(snap.has_value(), "final snapshot cached");
  const auto& tree = (*snap)->tree;
  expect(tree.count("srv") && tree.count("srv/app"), "WORKDIR directories recorded");
  auto it = tree.find("srv/app/greeting.txt");
  expect(it != tree.end(), "RUN output captured relative to the workdir");
  expect(ws.store->get(it->second.digest).value_or("") == "hello world\n", "RUN saw ENV");
  expect(r.image->workdir == "/srv/app", "descriptor workdir");
}

void test_copy_semantics() {
  Workspace ws("copy");
  write_text(ws.context + "/requirements.txt", "flask\n");
  write_text(ws.context + "/app/main.py", "main\n");
  write_text(ws.context + "/app/lib/util.py", "util\n");
  write_text(ws.context + "/.stagecraft/junk", "never copied\n");
  const auto r = ws.build(
      "FROM scratch\nWORKDIR /srv\n"
      "COPY requirements.txt .\n"
      "COPY app/ app/\n"
      "COPY app/main.py /opt/entry.py\n"
      "COPY requirements.txt app/main.py /multi/\n"
      "COPY . /ctx\n"
      "CMD [\"/bin/true\"]\n");
  expect(r.ok, "build succeeds: " + r.error.message());
  const auto tree = (*ws.cache->get(r.image->fingerprint))->tree;
  expect(tree.count("srv/requirements.txt"), "file into workdir");
  expect(tree.count("srv/app/main.py") && tree.count("srv/app/lib/util.py"),
         "directory source copies its contents");
  expect(!tree.count("srv/app/app"), "directory itself not nested");
  expect(tree.count("opt") && tree.count("opt/entry.py"), "file renamed, parent created");
  expect(tree.count("multi/requirements.txt") && tree.count("multi/main.py"),
         "multiple sources into a directory");
  expect(tree.count("ctx/app/main.py"), "context root copied");
  expect(!tree.count("ctx/.stagecraft") && !tree.count("ctx/.stagecraft/junk"),
         ".stagecraft never copied");
  expect(ws.store->get(tree.at("opt/entry.py").digest).value_or("") == "main\n",
         "copied content stored");
}

void test_copy_inputs_drive_fingerprint() {
  Workspace ws("copy_inputs");
  write_text(ws.context + "/app/main.py", "v1\n");
  const std::string recipe = "FROM scratch\nCOPY app /app\nCMD [\"/bin/true\"]\n";
  const auto r1 = ws.build(recipe);
  write_text(ws.context + "/app/main.py", "v2\n");
  const auto r2 = ws.build(recipe);
  expect(r1.ok && r2.ok, "both builds succeed");
  expect(r1.steps[0].fingerprint != r2.steps[0].fingerprint, "content change invalidates COPY");
  write_text(ws.context + "/.stagecraft/tmp/noise", "x");
  const auto r3 = ws.build(recipe);
  expect(r3.steps[0].fingerprint == r2.steps[0].fingerprint,
         "files under .stagecraft do not affect fingerprints");
  expect(r3.metrics.steps_executed == 0, "unchanged context is fully cached");

  const auto missing = ws.build("FROM scratch\nCOPY nope.txt /x\n");
  expect(missing.error.code == stagecraft::ErrorCode::input_missing, "missing source");
  expect(missing.error.instruction_index == 0, "missing source located");
}

void test_step_timeout_and_cancel() {
  Workspace ws("timeout");
  const auto started = std::chrono::steady_clock::now();
  const auto r = ws.build("FROM scratch\nRUN sleep 10\n", "", 200);
  const auto elapsed = std::chrono::steady_clock::now() - started;
  expect(!r.ok && r.error.code == stagecraft::ErrorCode::timeout, "step deadline enforced");
  expect(r.error.exit_code == 124, "timeout exit code");
  expect(elapsed < 5s, "timed-out step killed promptly");

  std::atomic<bool> cancel{false};
  std::thread canceller([&] {
    std::this_thread::sleep_for(200ms);
    cancel.store(true);
  });
  const auto c = ws.build("FROM scratch\nRUN sleep 10\n", "", 0, &cancel);
  canceller.join();
  expect(!c.ok && c.error.code == stagecraft::ErrorCode::build_cancelled, "build cancelled");
  expect(!ws.cache->contains(c.error.fingerprint), "cancelled step discarded");
}

void test_base_directory_and_registered_base() {
  Workspace ws("bases");
  write_text(ws.dir.path + "/bases/python_3.11-slim/usr/bin/python3", "#!/bin/sh\n");
  const std::string recipe = "FROM python:3.11-slim\nRUN test -f usr/bin/python3\nCMD [\"python3\"]\n";
  const auto r1 = ws.build(recipe);
  expect(r1.ok, "base directory build: " + r1.error.message());
  expect(r1.image->layer_fingerprints.size() == 3, "base plus two steps in the layer chain");

  // Editing the base invalidates every layer built on it.
  write_text(ws.dir.path + "/bases/python_3.11-slim/etc/os-release", "slim\n");
  ws.reopen();
  const auto r2 = ws.build(recipe);
  expect(r2.ok && r2.steps[0].fingerprint != r1.steps[0].fingerprint,
         "base content is part of the fingerprint");

  stagecraft::RuntimeConfig cfg;
  cfg.env["PATH"] = "/usr/local/bin:/usr/bin:/bin";
  cfg.entrypoint = {"/bin/true"};
  fs::create_directories(ws.dir.path + "/registered");
  ws.bases->register_base("runtime:1", ws.dir.path + "/registered", cfg);
  const auto r3 = ws.build("FROM runtime:1\nEXPOSE 8001\n");
  expect(r3.ok, "registered base build: " + r3.error.message());
  expect(r3.image->entrypoint == std::vector<std::string>({"/bin/true"}),
         "entrypoint inherited from the base config");
  expect(r3.image->env.at("PATH") == "/usr/local/bin:/usr/bin:/bin", "env inherited");
}

// ============================================================================
// Image assembly
// ============================================================================

void test_assembler_errors() {
  Workspace ws("assembler");
  auto r = ws.build("FROM scratch\nENV A=1\n");
  expect(!r.ok && r.error.code == stagecraft::ErrorCode::no_entrypoint, "no entrypoint");
  expect(r.error.category() == stagecraft::ErrorCategory::assembly, "assembly category");

  r = ws.build("FROM scratch\nHEALTHCHECK --interval=0s CMD true\nCMD [\"/bin/true\"]\n");
  expect(!r.ok && r.error.code == stagecraft::ErrorCode::invalid_healthcheck,
         "zero interval rejected");
  r = ws.build("FROM scratch\nHEALTHCHECK --start-period=-5s CMD true\nCMD [\"/bin/true\"]\n");
  expect(!r.ok && r.error.code == stagecraft::ErrorCode::invalid_healthcheck,
         "negative start period rejected");
  r = ws.build("FROM scratch\nHEALTHCHECK --retries=0 CMD true\nCMD [\"/bin/true\"]\n");
  expect(!r.ok && r.error.code == stagecraft::ErrorCode::invalid_healthcheck,
         "zero retries rejected");

  r = ws.build(
      "FROM scratch AS a\nHEALTHCHECK CMD true\nCMD [\"/bin/true\"]\n"
      "FROM a\nHEALTHCHECK NONE\n");
  expect(r.ok && !r.image->healthcheck.has_value(), "HEALTHCHECK NONE clears the inherited check");
}

void test_descriptor_json() {
  Workspace ws("descriptor");
  write_service_context(ws.context);
  const auto r = ws.build(kServiceRecipe);
  expect(r.ok, "build: " + r.error.message());
  const auto& img = *r.image;
  expect(img.exposed_ports == std::set<int>({8001}), "exposed ports");
  expect(img.env.at("DATABASE_URL") == "sqlite:///./app.db", "env defaults");
  expect(img.healthcheck && img.healthcheck->retries == 3, "healthcheck carried");
  expect(img.stage_order == std::vector<std::string>({"base", "service"}), "stage order");
  expect(img.target_stage == "service", "target stage");
  expect(img.layer_fingerprints.back() == img.fingerprint, "last layer is the image fingerprint");

  const std::string json = stagecraft::descriptor_to_json(img);
  stagecraft::BuildError err;
  const auto parsed = stagecraft::descriptor_from_json(json, &err);
  expect(parsed.has_value(), "descriptor parses: " + err.message());
  expect(parsed->digest == img.digest && parsed->entrypoint == img.entrypoint,
         "descriptor fields survive parsing");

  std::string tampered = json;
  tampered.replace(tampered.find("8001"), 4, "8002");
  expect(!stagecraft::descriptor_from_json(tampered, &err).has_value(),
         "edited descriptor fails its digest check");
  expect(err.code == stagecraft::ErrorCode::json_parse_error, "reported as input error");
}

// ============================================================================
// Health state machine
// ============================================================================

stagecraft::HealthcheckSpec make_check(std::int64_t interval, std::int64_t start_period,
                                       int retries) {
  stagecraft::HealthcheckSpec hc;
  hc.command = {"/bin/true"};
  hc.interval_ms = interval;
  hc.timeout_ms = 3000;
  hc.start_period_ms = start_period;
  hc.retries = retries;
  return hc;
}

// Property: start-period 30s, interval 5s, retries 3, service answers from
// t=12s.
void test_health_timeline() {
  using stagecraft::ProcessState;
  stagecraft::HealthStateMachine m(make_check(5000, 30000, 3));
  expect(m.on_launch().empty(), "no transition at launch with a healthcheck");
  expect(m.probe_time_ms(1) == 5000 && m.probe_time_ms(3) == 15000, "probe schedule");

  expect(m.on_probe(false, 5000).empty(), "failure at 5s inside start period ignored");
  expect(m.on_probe(false, 10000).empty(), "failure at 10s inside start period ignored");
  expect(m.state() == ProcessState::starting && m.consecutive_failures() == 0,
         "still Starting, nothing counted");

  auto ts = m.on_probe(true, 15000);
  expect(ts.size() == 2, "Starting -> Ready -> Healthy");
  expect(ts[0].to == ProcessState::ready && ts[1].to == ProcessState::healthy, "Ready is transient");
  expect(ts[1].at_ms == 15000, "Healthy at 15s");

  expect(m.on_probe(false, 20000).empty(), "first failure tolerated");
  expect(m.on_probe(false, 25000).empty(), "second failure tolerated");
  ts = m.on_probe(false, 30000);
  expect(ts.size() == 1 && ts[0].to == ProcessState::unhealthy, "third failure -> Unhealthy");
  expect(m.consecutive_failures() == 3, "three consecutive failures");

  ts = m.on_probe(true, 35000);
  expect(ts.size() == 1 && ts[0].from == ProcessState::unhealthy &&
             ts[0].to == ProcessState::healthy,
         "one success -> Healthy");
  expect(m.consecutive_failures() == 0, "success resets the failure count");

  ts = m.on_exit(0, 40000, "exited");
  expect(ts.size() == 1 && ts[0].to == ProcessState::terminated, "exit -> Terminated");
  expect(m.on_probe(true, 45000).empty(), "no transitions after Terminated");
}

void test_health_start_period_exceeded() {
  using stagecraft::ProcessState;
  stagecraft::HealthStateMachine m(make_check(5000, 10000, 3));
  expect(m.on_probe(false, 5000).empty(), "inside start period");
  auto ts = m.on_probe(false, 10000);
  expect(ts.size() == 1 && ts[0].to == ProcessState::unhealthy,
         "failure at the end of the start period without success -> Unhealthy");

  // Interval longer than the start period: the first slot decides.
  stagecraft::HealthStateMachine sparse(make_check(60000, 10000, 3));
  expect(sparse.probe_time_ms(1) == 60000, "first slot after the start period");
  ts = sparse.on_probe(false, sparse.probe_time_ms(1));
  expect(ts.size() == 1 && ts[0].to == ProcessState::unhealthy && ts[0].at_ms == 60000,
         "Unhealthy at the first failed slot, not at start-period");

  stagecraft::HealthStateMachine none(std::nullopt);
  ts = none.on_launch();
  expect(ts.size() == 1 && ts[0].to == ProcessState::ready, "no healthcheck -> Ready at launch");
  expect(none.on_probe(false, 5000).empty(), "probes ignored without a healthcheck");
}

// ============================================================================
// Supervisor (real processes)
// ============================================================================

stagecraft::ImageDescriptor image_running(const std::vector<std::string>& entrypoint) {
  stagecraft::ImageDescriptor img;
  img.format_version = stagecraft::version::DESCRIPTOR_FORMAT_VERSION;
  img.entrypoint = entrypoint;
  img.env["MODE"] = "dev";
  return img;
}

void test_supervisor_without_healthcheck() {
  stagecraft::BootstrapSupervisor sup(image_running({"/bin/sh", "-c", "exec sleep 30"}), {});
  expect(sup.start(), "launch succeeds");
  expect(sup.pid() > 0, "pid known");
  expect(sup.wait_for(stagecraft::ProcessState::ready, 2s), "Ready without healthcheck");
  const auto started = std::chrono::steady_clock::now();
  sup.cancel();
  expect(std::chrono::steady_clock::now() - started < 3s, "cancel is prompt");
  expect(sup.state() == stagecraft::ProcessState::terminated, "Terminated after cancel");
  expect(sup.exit_code().has_value(), "exit code recorded");
  expect(sup.runtime_error().ok(), "cancel is not a runtime error");
  sup.cancel();
}

void test_supervisor_health_transitions() {
  TempDir tmp("supervisor_health");
  const std::string flag = tmp.path + "/healthy";
  auto img = image_running({"/bin/sh", "-c", "exec sleep 30"});
  auto hc = make_check(50, 0, 2);
  hc.command = {"/bin/sh", "-c", "test -f '" + flag + "'"};
  img.healthcheck = hc;

  stagecraft::BootstrapSupervisor sup(img, {});
  expect(sup.start(), "launch");
  expect(sup.wait_for(stagecraft::ProcessState::unhealthy, 3s),
         "failing probe with zero start period -> Unhealthy");
  expect(sup.runtime_error().code == stagecraft::ErrorCode::start_period_exceeded,
         "start_period_exceeded reported");
  expect(sup.runtime_error().category() == stagecraft::ErrorCategory::runtime, "runtime category");

  write_text(flag, "1");
  expect(sup.wait_for(stagecraft::ProcessState::healthy, 3s), "success -> Healthy");
  fs::remove(flag);
  const auto before = sup.transitions().size();
  bool back_unhealthy = false;
  for (int i = 0; i < 150 && !back_unhealthy; ++i) {
    const auto ts = sup.transitions();
    for (std::size_t k = before; k < ts.size(); ++k) {
      back_unhealthy = back_unhealthy || ts[k].to == stagecraft::ProcessState::unhealthy;
    }
    std::this_thread::sleep_for(20ms);
  }
  expect(back_unhealthy, "retries consecutive failures -> Unhealthy again");
  expect(sup.state() != stagecraft::ProcessState::terminated, "mark-only policy keeps it running");
  sup.cancel();
  expect(sup.transitions().back().to == stagecraft::ProcessState::terminated, "history ends Terminated");
}

// A healthcheck that never returns is killed at its timeout and counted as
// a failure; its process group does not outlive the supervisor.
void test_supervisor_healthcheck_timeout_counts_as_failure() {
  TempDir tmp("supervisor_hc_timeout");
  const std::string pids = tmp.path + "/hc.pids";
  auto img = image_running({"/bin/sh", "-c", "exec sleep 30"});
  auto hc = make_check(50, 0, 1);
  hc.timeout_ms = 100;
  hc.command = {"/bin/sh", "-c", "echo $$ >> '" + pids + "'; exec sleep 60"};
  img.healthcheck = hc;

  stagecraft::BootstrapSupervisor sup(img, {});
  const auto started = std::chrono::steady_clock::now();
  expect(sup.start(), "launch");
  expect(sup.wait_for(stagecraft::ProcessState::unhealthy, 1500ms),
         "timed-out healthcheck -> Unhealthy");
  expect(std::chrono::steady_clock::now() - started < 1500ms,
         "healthcheck killed at its timeout, not after sleep 60");
  sup.cancel();

  std::ifstream ifs(pids);
  int checked = 0;
  for (pid_t pgid = 0; ifs >> pgid; ++checked) {
    errno = 0;
    expect(::kill(-pgid, 0) != 0 && errno == ESRCH,
           "healthcheck process group " + std::to_string(pgid) + " is gone");
  }
  expect(checked >= 1, "at least one healthcheck ran");
}

void test_supervisor_terminate_policy() {
  auto img = image_running({"/bin/sh", "-c", "exec sleep 30"});
  auto hc = make_check(50, 0, 1);
  hc.command = {"/bin/false"};
  img.healthcheck = hc;
  stagecraft::SupervisorOptions opts;
  opts.policy = stagecraft::make_policy("terminate-on-unhealthy");
  opts.grace = 200ms;
  expect(opts.policy != nullptr, "policy by name");
  expect(stagecraft::make_policy("restart-always") == nullptr, "unknown policy name");

  stagecraft::BootstrapSupervisor sup(img, opts);
  expect(sup.start(), "launch");
  const auto code = sup.wait_terminated(5s);
  expect(code.has_value(), "policy terminated the process");
  expect(contains(sup.transitions().back().reason, "terminate-on-unhealthy"),
         "termination reason names the policy");
}

void test_supervisor_exit_and_env_override() {
  const std::vector<std::string> ep = {"/bin/sh", "-c", "test \"$MODE\" = prod"};
  {
    stagecraft::SupervisorOptions opts;
    opts.env_overrides["MODE"] = "prod";
    stagecraft::BootstrapSupervisor sup(image_running(ep), opts);
    expect(sup.start(), "launch");
    const auto code = sup.wait_terminated(5s);
    expect(code == 0, "override reached the process");
    expect(sup.runtime_error().ok(), "clean exit is not an error");
  }
  {
    stagecraft::BootstrapSupervisor sup(image_running(ep), {});
    expect(sup.start(), "launch");
    const auto code = sup.wait_terminated(5s);
    expect(code == 1, "descriptor default used without override");
    expect(sup.runtime_error().code == stagecraft::ErrorCode::process_crashed, "process_crashed");
    expect(sup.runtime_error().exit_code == 1, "crash exit code");
  }
}

void test_supervisor_spawn_failure() {
  stagecraft::BootstrapSupervisor sup(image_running({"/nonexistent/stagecraft-entry"}), {});
  expect(!sup.start(), "launch fails");
  expect(sup.state() == stagecraft::ProcessState::terminated, "Terminated immediately");
  const auto err = sup.runtime_error();
  expect(err.code == stagecraft::ErrorCode::spawn_failed, "spawn_failed");
  expect(err.category() == stagecraft::ErrorCategory::runtime, "spawn failure is a runtime error here");
}

// Build an image, materialize it, and run its entrypoint inside the rootfs.
void test_build_then_run() {
  Workspace ws("build_run");
  write_text(ws.context + "/marker.txt", "present\n");
  const auto r = ws.build(
      "FROM scratch\nWORKDIR /app\nCOPY marker.txt .\n"
      "CMD test -f marker.txt && test \"$DATABASE_URL\" = sqlite:///./app.db\n"
      "ENV DATABASE_URL=sqlite:///./app.db\n");
  expect(r.ok, "build: " + r.error.message());
  const auto snap = ws.cache->get(r.image->fingerprint);
  expect(snap.has_value(), "image snapshot cached");
  const std::string rootfs = ws.dir.path + "/rootfs";
  const auto sync = stagecraft::sync_tree((*snap)->tree, rootfs, *ws.store, nullptr);
  expect(sync.ok, "materialize rootfs");

  stagecraft::SupervisorOptions opts;
  opts.rootfs = rootfs;
  stagecraft::BootstrapSupervisor sup(*r.image, opts);
  expect(sup.start(), "launch");
  expect(sup.wait_terminated(5s) == 0, "entrypoint ran in rootfs workdir with image env");
}

// ============================================================================
// Probes
// ============================================================================

// One-shot HTTP server on 127.0.0.1; returns the port.
int serve_once(const std::string& response, std::thread* server) {
  const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = 0;
  expect(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0, "bind");
  expect(::listen(fd, 4) == 0, "listen");
  socklen_t len = sizeof(addr);
  ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
  *server = std::thread([fd, response] {
    const int c = ::accept(fd, nullptr, nullptr);
    if (c >= 0) {
      char buf[1024];
      (void)!::recv(c, buf, sizeof(buf), 0);
      (void)!::send(c, response.data(), response.size(), 0);
      ::close(c);
    }
    ::close(fd);
  });
  return ntohs(addr.sin_port);
}

void test_probe_url_parsing() {
  auto t = stagecraft::parse_probe_url("http://localhost:8001/health");
  expect(t && t->scheme == "http" && t->host == "localhost" && t->port == "8001" &&
             t->path == "/health",
         "http URL");
  t = stagecraft::parse_probe_url("http://example.test");
  expect(t && t->port == "80" && t->path == "/", "http default port and path");
  t = stagecraft::parse_probe_url("tcp://[::1]:5432");
  expect(t && t->host == "::1" && t->port == "5432", "bracketed IPv6");
  expect(!stagecraft::parse_probe_url("tcp://host").has_value(), "tcp needs a port");
  expect(!stagecraft::parse_probe_url("https://host/").has_value(), "https unsupported");
}

void test_http_and_tcp_probes() {
  std::thread server;
  int port = serve_once("HTTP/1.0 200 OK\r\nContent-Length: 2\r\n\r\nok", &server);
  auto r = stagecraft::probe_url("http://127.0.0.1:" + std::to_string(port) + "/", 2000);
  server.join();
  expect(r.ok && r.status_code == 200, "HTTP 200 is healthy: " + r.error);

  port = serve_once("HTTP/1.1 503 Service Unavailable\r\n\r\n", &server);
  r = stagecraft::probe_url("http://127.0.0.1:" + std::to_string(port) + "/", 2000);
  server.join();
  expect(!r.ok && r.status_code == 503, "HTTP 503 is unhealthy");

  port = serve_once("", &server);
  r = stagecraft::probe_url("tcp://127.0.0.1:" + std::to_string(port), 2000);
  server.join();
  expect(r.ok, "TCP accept is healthy: " + r.error);

  // The port just closed.
  r = stagecraft::probe_url("tcp://127.0.0.1:" + std::to_string(port), 500);
  expect(!r.ok && !r.error.empty(), "closed port is unhealthy");
}

// ============================================================================
// Process runner
// ============================================================================

void test_run_process_basics() {
  stagecraft::ProcessSpec spec;
  spec.command = "/bin/sh";
  spec.argv = {"-c", "echo out; echo err >&2; exit 7"};
  auto r = stagecraft::run_process(spec);
  expect(r.exit_code == 7, "exit code propagated");
  expect(r.stdout_text == "out\n" && r.stderr_text == "err\n", "output captured");

  spec.argv = {"-c", "env"};
  spec.env = {{"ONLY", "this"}, {"PATH", stagecraft::kDefaultPath}};
  r = stagecraft::run_process(spec);
  expect(contains(r.stdout_text, "ONLY=this") && !contains(r.stdout_text, "HOME="),
         "child environment is exactly ProcessSpec::env");

  spec.command = "definitely-not-a-command";
  r = stagecraft::run_process(spec);
  expect(r.spawn_failed && r.exit_code == 127, "missing executable -> 127");
}

// ============================================================================
// Configuration, errors, observability
// ============================================================================

void test_config_validation() {
  auto r = stagecraft::validate_config(
      "{\"config_version\":\"1\",\"cache_dir\":\"/tmp/c\",\"step_timeout_ms\":1000}");
  expect(r.ok && r.warnings.empty(), "valid config");

  r = stagecraft::validate_config("{\"compression\":\"brotli\",\"bogus\":1}");
  expect(!r.ok, "bad compression is an error");
  bool unknown_warned = false, version_warned = false;
  for (const auto& w : r.warnings) {
    unknown_warned = unknown_warned || contains(w, "bogus");
    version_warned = version_warned || contains(w, "config_version");
  }
  expect(unknown_warned && version_warned, "unknown key and missing version are warnings");

  r = stagecraft::validate_config("{\"step_timeout_ms\":\"soon\"}");
  expect(!r.ok, "wrong type is an error");
  r = stagecraft::validate_config("{\"max_output_bytes\":0}");
  expect(!r.ok, "zero output cap rejected");

  TempDir tmp("config");
  write_text(tmp.path + "/engine.json",
             "{\"config_version\":\"1\",\"bases_dir\":\"/srv/bases\",\"step_timeout_ms\":250}");
  stagecraft::ConfigValidationResult vr;
  const auto cfg = stagecraft::load_config(tmp.path + "/engine.json", stagecraft::EngineConfig{}, &vr);
  expect(vr.ok, "config file loads");
  expect(cfg.bases_dir == "/srv/bases" && cfg.step_timeout_ms == 250, "file overrides defaults");
  expect(cfg.cache_root == ".stagecraft/cache/v1", "unset keys keep defaults");
}

void test_error_taxonomy() {
  using stagecraft::ErrorCategory;
  using stagecraft::ErrorCode;
  expect(stagecraft::category_of(ErrorCode::cyclic_dependency) == ErrorCategory::planning, "planning");
  expect(stagecraft::category_of(ErrorCode::timeout) == ErrorCategory::execution, "execution");
  expect(stagecraft::category_of(ErrorCode::no_entrypoint) == ErrorCategory::assembly, "assembly");
  expect(stagecraft::category_of(ErrorCode::process_crashed) == ErrorCategory::runtime, "runtime");
  expect(stagecraft::category_of(ErrorCode::config_invalid) == ErrorCategory::input, "input");

  auto err = stagecraft::make_error(ErrorCode::instruction_failed, "boom");
  err.stage = "base";
  err.instruction_index = 2;
  err.exit_code = 100;
  expect(contains(err.message(), "stage 'base' step 3: exit code 100"), "message format");
  std::optional<stagecraft::jsonlite::JsonError> jerr;
  const auto obj = stagecraft::jsonlite::parse(err.to_json(), &jerr);
  expect(!jerr, "error JSON is valid");
  expect(stagecraft::jsonlite::get_string(obj, "category") == "ExecutionError", "category in JSON");
}

int g_step_events = 0;
int g_failed_step_events = 0;
void count_step(const stagecraft::StepEvent& ev) {
  g_step_events++;
  if (!ev.ok) g_failed_step_events++;
}

void test_step_events_and_stats() {
  stagecraft::set_step_event_hook(count_step);
  auto& stats = stagecraft::global_engine_stats();
  const auto builds_before = stats.builds_failed.load();
  Workspace ws("events");
  ws.build("FROM scratch\nENV A=1\nRUN exit 1\n");
  stagecraft::set_step_event_hook(nullptr);
  expect(g_step_events == 2 && g_failed_step_events == 1, "one event per step, failures included");
  expect(stats.builds_failed.load() == builds_before + 1, "failed build counted");
  const std::string json = stats.to_json();
  expect(contains(json, "instruction_failed"), "failures by code in stats JSON");

  stagecraft::HealthEvent hev;
  hev.from = "Starting";
  hev.to = "Ready";
  hev.reason = "launched without healthcheck";
  std::optional<stagecraft::jsonlite::JsonError> jerr;
  stagecraft::jsonlite::parse(stagecraft::health_event_to_json(hev), &jerr);
  expect(!jerr, "health event JSON is valid");
}

void test_event_log_sink() {
  TempDir tmp("event_log");
  const std::string log = tmp.path + "/events.jsonl";
  stagecraft::set_event_log_path(log);
  Workspace ws("event_log_build");
  const auto r = ws.build("FROM scratch\nENV A=1\nCMD [\"/bin/true\"]\n");
  stagecraft::set_event_log_path("");
  expect(r.ok, "build succeeds");
  const std::string text = read_text(log);
  std::size_t lines = 0;
  for (char c : text) lines += c == '\n';
  expect(lines == 2, "one JSON line per step");
  expect(contains(text, r.steps[0].fingerprint), "event carries the fingerprint");
}

void test_version_manifest() {
  const auto m = stagecraft::version::current_manifest();
  expect(m.fingerprint_schema == stagecraft::version::FINGERPRINT_SCHEMA_VERSION, "schema version");
  expect(m.hash_primitive == "blake3", "hash primitive");
  std::optional<stagecraft::jsonlite::JsonError> err;
  stagecraft::jsonlite::parse(stagecraft::version::manifest_to_json(m), &err);
  expect(!err, "manifest JSON valid");
}

}  // namespace

int main() {
  std::cout << "=== stagecraft tests ===\n";

  std::cout << "\n[Hashing and JSON]\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation", test_domain_separation);
  run_test("JSON canonicalization", test_json_canonicalization);
  run_test("version manifest", test_version_manifest);

  std::cout << "\n[Stagefile]\n";
  run_test("service recipe", test_parse_service_recipe);
  run_test("parse errors carry line", test_parse_errors_carry_line);
  run_test("forms and defaults", test_parse_forms_and_defaults);
  run_test("canonical instruction spelling", test_canonical_instruction_spelling);
  run_test("durations", test_parse_duration);

  std::cout << "\n[Planner]\n";
  run_test("order and tie-break", test_plan_order_and_tie_break);
  run_test("cycle detected", test_plan_cycle_detected);
  run_test("planning errors", test_plan_errors);

  std::cout << "\n[Content store and layer cache]\n";
  run_test("CAS put/get and corruption", test_cas_put_get_and_corruption);
  run_test("layer cache persistence and integrity", test_layer_cache_persistence_and_integrity);
  run_test("layer cache concurrent readers", test_layer_cache_concurrent_readers);
  run_test("sync and capture tree", test_sync_and_capture_tree);

  std::cout << "\n[Build]\n";
  run_test("determinism", test_build_determinism);
  run_test("rebuild is fully cached", test_rebuild_is_fully_cached);
  run_test("change invalidates suffix", test_change_invalidates_suffix);
  run_test("failed step not cached", test_failed_step_not_cached);
  run_test("RUN sees env and workdir", test_run_sees_env_and_workdir);
  run_test("COPY semantics", test_copy_semantics);
  run_test("COPY inputs drive fingerprint", test_copy_inputs_drive_fingerprint);
  run_test("step timeout and cancel", test_step_timeout_and_cancel);
  run_test("base directory and registered base", test_base_directory_and_registered_base);

  std::cout << "\n[Image assembly]\n";
  run_test("assembler errors", test_assembler_errors);
  run_test("descriptor JSON", test_descriptor_json);

  std::cout << "\n[Health state machine]\n";
  run_test("health timeline", test_health_timeline);
  run_test("start period exceeded", test_health_start_period_exceeded);

  std::cout << "\n[Supervisor]\n";
  run_test("without healthcheck", test_supervisor_without_healthcheck);
  run_test("health transitions", test_supervisor_health_transitions);
  run_test("healthcheck timeout counts as failure",
           test_supervisor_healthcheck_timeout_counts_as_failure);
  run_test("terminate policy", test_supervisor_terminate_policy);
  run_test("exit and env override", test_supervisor_exit_and_env_override);
  run_test("spawn failure", test_supervisor_spawn_failure);
  run_test("build then run", test_build_then_run);

  std::cout << "\n[Probes and processes]\n";
  run_test("probe URL parsing", test_probe_url_parsing);
  run_test("HTTP and TCP probes", test_http_and_tcp_probes);
  run_test("run_process basics", test_run_process_basics);

  std::cout << "\n[Configuration and observability]\n";
  run_test("config validation", test_config_validation);
  run_test("error taxonomy", test_error_taxonomy);
  run_test("step events and stats", test_step_events_and_stats);
  run_test("event log sink", test_event_log_sink);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
