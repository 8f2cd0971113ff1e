#include "stagecraft/executor.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <sstream>

#include "stagecraft/fingerprint.hpp"
#include "stagecraft/observability.hpp"
#include "stagecraft/sandbox.hpp"

namespace fs = std::filesystem;

namespace stagecraft {

namespace {

constexpr std::size_t kStderrTail = 512;

std::string join_rel(const std::string& a, const std::string& b) {
  if (a.empty()) return b;
  if (b.empty()) return a;
  return a + "/" + b;
}

// "/app/src" -> "app/src", "/" -> "".
std::string to_rel(const std::string& abs) {
  return abs.size() > 1 ? abs.substr(1) : std::string();
}

std::string tail(const std::string& s, std::size_t n) {
  std::string t = s.size() > n ? s.substr(s.size() - n) : s;
  while (!t.empty() && (t.back() == '\n' || t.back() == '\r' || t.back() == ' ')) t.pop_back();
  return t;
}

// Insert a 0755 directory entry for every component of `rel`. Returns false
// and names the offending path when a non-directory is in the way.
bool ensure_dirs(FileTree& tree, const std::string& rel, std::string* blocked) {
  if (rel.empty()) return true;
  std::size_t pos = 0;
  while (true) {
    const std::size_t slash = rel.find('/', pos);
    const std::string prefix = rel.substr(0, slash);
    auto it = tree.find(prefix);
    if (it == tree.end()) {
      FileEntry d;
      d.kind = EntryKind::directory;
      d.mode = 0755;
      tree.emplace(prefix, d);
    } else if (it->second.kind != EntryKind::directory) {
      if (blocked) *blocked = prefix;
      return false;
    }
    if (slash == std::string::npos) return true;
    pos = slash + 1;
  }
}

// Drop `rel` and everything below it.
void erase_subtree(FileTree& tree, const std::string& rel) {
  tree.erase(rel);
  const std::string prefix = rel + "/";
  auto it = tree.lower_bound(prefix);
  while (it != tree.end() && it->first.compare(0, prefix.size(), prefix) == 0) {
    it = tree.erase(it);
  }
}

bool is_dir_entry(const FileTree& tree, const std::string& rel) {
  if (rel.empty()) return true;
  auto it = tree.find(rel);
  return it != tree.end() && it->second.kind == EntryKind::directory;
}

std::string random_suffix() {
  std::random_device rd;
  std::ostringstream o;
  o << std::hex << ::getpid() << "-" << rd() << rd();
  return o.str();
}

}  // namespace

std::string resolve_in_workdir(const std::string& workdir, const std::string& path) {
  fs::path p = (!path.empty() && path.front() == '/')
                   ? fs::path(path)
                   : fs::path(workdir.empty() ? "/" : workdir) / path;
  std::string s = p.lexically_normal().generic_string();
  while (s.size() > 1 && s.back() == '/') s.pop_back();
  if (s.empty() || s.front() != '/') s = "/" + s;
  return s;
}

StageExecutor::StageExecutor(ILayerCache& cache, IContentStore& store, BuildContext ctx)
    : cache_(cache), store_(store), ctx_(std::move(ctx)) {}

StageExecutor::~StageExecutor() {
  if (!scratch_.empty()) remove_materialized(scratch_);
}

const std::string& StageExecutor::scratch_rootfs() {
  if (!scratch_.empty()) return scratch_;
  const fs::path parent = ctx_.work_root.empty()
                              ? fs::path(ctx_.context_dir) / ".stagecraft" / "tmp"
                              : fs::path(ctx_.work_root);
  std::error_code ec;
  fs::create_directories(parent, ec);
  if (ec) return scratch_;
  const fs::path dir = parent / ("rootfs-" + random_suffix());
  fs::create_directories(dir, ec);
  if (!ec) scratch_ = fs::absolute(dir, ec).string();
  return scratch_;
}

StageResult StageExecutor::run(const Stage& stage, const SnapshotHandle& base) {
  StageResult res;
  SnapshotHandle current = base;

  for (std::size_t i = 0; i < stage.instructions.size(); ++i) {
    const Instruction& instr = stage.instructions[i];
    const auto started = std::chrono::steady_clock::now();

    StepEvent ev;
    ev.stage = stage.name;
    ev.index = static_cast<int>(i);
    ev.instruction = instr.keyword;

    auto fail = [&](BuildError err) {
      err.stage = stage.name;
      err.instruction_index = static_cast<int>(i);
      if (err.fingerprint.empty()) err.fingerprint = ev.fingerprint;
      ev.ok = false;
      ev.error_code = to_string(err.code);
      ev.duration_ns = static_cast<uint64_t>(
          std::chrono::duration_cast<std::chrono::nanoseconds>(
              std::chrono::steady_clock::now() - started).count());
      emit_step_event(ev);
      res.error = std::move(err);
      return res;
    };

    if (cancelled()) {
      return fail(make_error(ErrorCode::build_cancelled, "cancelled before step"));
    }

    InputDigests inputs;
    if (const auto* copy = std::get_if<CopyInstr>(&instr.body)) {
      std::string missing;
      if (!collect_copy_inputs(ctx_.context_dir, *copy, &inputs, &missing)) {
        return fail(make_error(ErrorCode::input_missing,
                               "COPY source '" + missing + "' not found in build context"));
      }
    }

    const std::string fp = compute_fingerprint(current->fingerprint, instr, inputs);
    ev.fingerprint = fp;

    bool cached = false;
    if (auto hit = cache_.get(fp)) {
      current = *hit;
      cached = true;
    } else {
      StepOutcome out;
      if (const auto* r = std::get_if<RunInstr>(&instr.body)) {
        out = execute_run(*r, *current);
      } else if (const auto* c = std::get_if<CopyInstr>(&instr.body)) {
        out = execute_copy(*c, *current);
      } else {
        out = execute_metadata(instr, *current);
      }
      if (!out.ok) return fail(std::move(out.error));
      // A step that finished after cancellation was requested is discarded.
      if (cancelled()) {
        on_disk_.reset();
        return fail(make_error(ErrorCode::build_cancelled, "cancelled during step"));
      }

      auto snap = std::make_shared<Snapshot>();
      snap->fingerprint = fp;
      snap->parent_fingerprint = current->fingerprint;
      snap->base_ref = current->base_ref;
      snap->created_by = instr.summary();
      snap->tree = std::move(out.tree);
      snap->config = std::move(out.config);
      if (!cache_.put(fp, snap)) {
        return fail(make_error(ErrorCode::cache_integrity_failed,
                               "layer cache rejected the snapshot"));
      }
      current = std::move(snap);
    }

    ev.cached = cached;
    ev.duration_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now() - started).count());
    emit_step_event(ev);

    StepRecord rec;
    rec.stage = stage.name;
    rec.index = static_cast<int>(i);
    rec.keyword = instr.keyword;
    rec.summary = instr.summary();
    rec.fingerprint = fp;
    rec.cached = cached;
    rec.duration_ns = ev.duration_ns;
    if (on_step_) on_step_(rec);
    res.steps.push_back(std::move(rec));
  }

  res.ok = true;
  res.snapshot = current;
  return res;
}

StageExecutor::StepOutcome StageExecutor::execute_metadata(const Instruction& instr,
                                                           const Snapshot& parent) {
  StepOutcome out;
  out.tree = parent.tree;
  out.config = parent.config;
  RuntimeConfig& cfg = out.config;

  if (const auto* env = std::get_if<EnvInstr>(&instr.body)) {
    for (const auto& [k, v] : env->vars) cfg.env[k] = v;
  } else if (const auto* ex = std::get_if<ExposeInstr>(&instr.body)) {
    cfg.exposed_ports.insert(ex->ports.begin(), ex->ports.end());
  } else if (const auto* hc = std::get_if<HealthcheckInstr>(&instr.body)) {
    if (hc->none) {
      cfg.healthcheck.reset();
    } else {
      HealthcheckSpec spec;
      spec.command = hc->command.argv;
      spec.interval_ms = hc->interval_ms;
      spec.timeout_ms = hc->timeout_ms;
      spec.start_period_ms = hc->start_period_ms;
      spec.retries = hc->retries;
      cfg.healthcheck = std::move(spec);
    }
  } else if (const auto* ep = std::get_if<EntrypointInstr>(&instr.body)) {
    cfg.entrypoint = ep->command.argv;
  } else if (const auto* wd = std::get_if<WorkdirInstr>(&instr.body)) {
    const std::string abs = resolve_in_workdir(cfg.workdir, wd->path);
    std::string blocked;
    if (!ensure_dirs(out.tree, to_rel(abs), &blocked)) {
      out.error = make_error(ErrorCode::instruction_failed,
                             "WORKDIR " + abs + ": '/" + blocked + "' is not a directory");
      return out;
    }
    cfg.workdir = abs;
  }
  out.ok = true;
  return out;
}

StageExecutor::StepOutcome StageExecutor::execute_run(const RunInstr& run,
                                                      const Snapshot& parent) {
  StepOutcome out;
  const std::string& root = scratch_rootfs();
  if (root.empty()) {
    out.error = make_error(ErrorCode::spawn_failed, "cannot create scratch root filesystem");
    return out;
  }

  auto sync = sync_tree(parent.tree, root, store_, on_disk_ ? &*on_disk_ : nullptr);
  if (!sync.ok) {
    on_disk_.reset();
    out.error = make_error(ErrorCode::cache_integrity_failed, sync.error);
    return out;
  }
  on_disk_ = parent.tree;

  const std::string cwd = root + parent.config.workdir;
  std::error_code ec;
  fs::create_directories(cwd, ec);

  ProcessSpec spec;
  spec.command = run.command.argv.front();
  spec.argv.assign(run.command.argv.begin() + 1, run.command.argv.end());
  spec.env = parent.config.env;
  if (!spec.env.contains("PATH")) spec.env["PATH"] = kDefaultPath;
  spec.env["STAGECRAFT_ROOTFS"] = root;
  spec.cwd = cwd;
  spec.timeout_ms = ctx_.step_timeout_ms;
  spec.max_output_bytes = ctx_.max_output_bytes;
  spec.cancel = ctx_.cancel;

  const ProcessResult pr = run_process(spec);
  if (pr.spawn_failed || pr.exit_code != 0) {
    on_disk_.reset();
    if (pr.cancelled) {
      out.error = make_error(ErrorCode::build_cancelled, "RUN interrupted");
    } else if (pr.timed_out) {
      out.error = make_error(ErrorCode::timeout,
                             "RUN exceeded " + std::to_string(ctx_.step_timeout_ms) + "ms");
    } else if (pr.spawn_failed) {
      out.error = make_error(ErrorCode::spawn_failed, pr.error_message);
    } else {
      std::string detail = "exit code " + std::to_string(pr.exit_code);
      const std::string err = tail(pr.stderr_text, kStderrTail);
      if (!err.empty()) detail += ": " + err;
      out.error = make_error(ErrorCode::instruction_failed, detail);
    }
    out.error.exit_code = pr.exit_code;
    return out;
  }

  auto captured = capture_tree(root, store_, ctx_.compression);
  if (!captured.ok) {
    on_disk_.reset();
    out.error = make_error(ErrorCode::instruction_failed, captured.error);
    return out;
  }
  on_disk_ = captured.tree;
  out.tree = std::move(captured.tree);
  out.config = parent.config;
  out.ok = true;
  return out;
}

StageExecutor::StepOutcome StageExecutor::execute_copy(const CopyInstr& copy,
                                                       const Snapshot& parent) {
  StepOutcome out;
  out.tree = parent.tree;
  out.config = parent.config;
  FileTree& tree = out.tree;

  const std::string dest_abs = resolve_in_workdir(parent.config.workdir, copy.dest);
  const std::string dest_rel = to_rel(dest_abs);
  const bool dest_is_dir = copy.dest.back() == '/' || copy.sources.size() > 1 ||
                           is_dir_entry(tree, dest_rel);

  std::string blocked;
  auto place = [&](const std::string& rel, FileEntry e) -> bool {
    const auto slash = rel.rfind('/');
    if (slash != std::string::npos && !ensure_dirs(tree, rel.substr(0, slash), &blocked))
      return false;
    auto it = tree.find(rel);
    if (it != tree.end() && it->second.kind == EntryKind::directory &&
        e.kind != EntryKind::directory) {
      erase_subtree(tree, rel);
    }
    if (e.kind == EntryKind::directory && it != tree.end() &&
        it->second.kind == EntryKind::directory) {
      it->second.mode = e.mode;
      return true;
    }
    tree[rel] = std::move(e);
    return true;
  };

  // Describe one host path as a tree entry, storing file contents.
  auto load = [&](const fs::path& host, FileEntry* e, std::string* why) -> bool {
    struct stat st{};
    if (::lstat(host.c_str(), &st) != 0) {
      *why = "cannot stat";
      return false;
    }
    e->mode = static_cast<std::uint32_t>(st.st_mode & 07777);
    std::error_code ec;
    if (S_ISLNK(st.st_mode)) {
      e->kind = EntryKind::symlink;
      e->link_target = fs::read_symlink(host, ec).string();
      e->mode = 0777;
      if (ec) *why = ec.message();
      return !ec;
    }
    if (S_ISDIR(st.st_mode)) {
      e->kind = EntryKind::directory;
      return true;
    }
    if (!S_ISREG(st.st_mode)) {
      *why = "not a regular file";
      return false;
    }
    std::ifstream ifs(host, std::ios::binary);
    if (!ifs) {
      *why = "cannot read";
      return false;
    }
    const std::string data((std::istreambuf_iterator<char>(ifs)),
                           std::istreambuf_iterator<char>());
    e->kind = EntryKind::file;
    e->size = data.size();
    e->digest = store_.put(data, ctx_.compression);
    if (e->digest.empty()) *why = "content store write failed";
    return !e->digest.empty();
  };

  auto fail = [&](ErrorCode code, const std::string& detail) {
    out.error = make_error(code, "COPY " + detail);
    return out;
  };

  if (dest_is_dir && !ensure_dirs(tree, dest_rel, &blocked)) {
    return fail(ErrorCode::instruction_failed, "destination '/" + blocked + "' is not a directory");
  }

  const fs::path context(ctx_.context_dir);
  for (const auto& src : copy.sources) {
    const fs::path host = (context / src).lexically_normal();
    std::string rel_src = fs::path(src).lexically_normal().generic_string();
    if (rel_src == ".") rel_src.clear();
    while (!rel_src.empty() && rel_src.back() == '/') rel_src.pop_back();

    std::error_code ec;
    const auto st = fs::symlink_status(host, ec);
    if (ec || !fs::exists(st)) {
      return fail(ErrorCode::input_missing, "source '" + src + "' not found");
    }

    if (fs::is_directory(st)) {
      // Directory sources copy their contents, not the directory itself.
      if (!ensure_dirs(tree, dest_rel, &blocked)) {
        return fail(ErrorCode::instruction_failed,
                    "destination '/" + blocked + "' is not a directory");
      }
      auto it = fs::recursive_directory_iterator(host, fs::directory_options::none, ec);
      for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        const std::string rel = it->path().lexically_relative(host).generic_string();
        if (is_context_internal(join_rel(rel_src, rel))) {
          if (it->is_directory(ec)) it.disable_recursion_pending();
          continue;
        }
        FileEntry e;
        std::string why;
        if (!load(it->path(), &e, &why)) {
          return fail(ErrorCode::instruction_failed, "'" + join_rel(src, rel) + "': " + why);
        }
        if (!place(join_rel(dest_rel, rel), std::move(e))) {
          return fail(ErrorCode::instruction_failed, "'/" + blocked + "' is not a directory");
        }
      }
      if (ec) return fail(ErrorCode::instruction_failed, "walk '" + src + "': " + ec.message());
      continue;
    }

    const std::string target =
        dest_is_dir ? join_rel(dest_rel, host.filename().string()) : dest_rel;
    if (target.empty()) {
      return fail(ErrorCode::instruction_failed, "cannot replace the root directory");
    }
    FileEntry e;
    std::string why;
    if (!load(host, &e, &why)) {
      return fail(ErrorCode::instruction_failed, "'" + src + "': " + why);
    }
    if (!place(target, std::move(e))) {
      return fail(ErrorCode::instruction_failed, "'/" + blocked + "' is not a directory");
    }
  }

  out.ok = true;
  return out;
}

}  // namespace stagecraft
