#include "stagecraft/fingerprint.hpp"

#include <sys/stat.h>

#include <filesystem>
#include <sstream>

#include "stagecraft/hash.hpp"
#include "stagecraft/version.hpp"

namespace fs = std::filesystem;

namespace stagecraft {

namespace {

std::string octal(std::uint32_t mode) {
  std::ostringstream o;
  o << std::oct << (mode & 07777);
  return o.str();
}

// Returns false when the path cannot be stat'ed.
bool describe_path(const fs::path& p, std::string* out) {
  struct stat st{};
  if (::lstat(p.c_str(), &st) != 0) return false;
  const auto mode = static_cast<std::uint32_t>(st.st_mode);
  if (S_ISLNK(st.st_mode)) {
    std::error_code ec;
    *out = "symlink:" + fs::read_symlink(p, ec).string() + ":777";
  } else if (S_ISDIR(st.st_mode)) {
    *out = "dir::" + octal(mode);
  } else if (S_ISREG(st.st_mode)) {
    const std::string digest = hash_file_blake3_hex(p.string());
    if (digest.empty()) return false;
    *out = "file:" + digest + ":" + octal(mode);
  } else {
    *out = "special::" + octal(mode);
  }
  return true;
}

}  // namespace

std::string compute_fingerprint(const std::string& parent_fingerprint,
                                const Instruction& instr,
                                const InputDigests& inputs) {
  jsonlite::Object o;
  o["v"] = static_cast<std::uint64_t>(version::FINGERPRINT_SCHEMA_VERSION);
  o["parent"] = parent_fingerprint;
  o["instr"] = canonicalize_instruction(instr);
  o["inputs"] = jsonlite::to_object(inputs);
  return fingerprint_hash(jsonlite::to_json(o));
}

std::string base_fingerprint(const std::string& ref, const std::string& tree_digest,
                             const std::string& config_json) {
  jsonlite::Object o;
  o["v"] = static_cast<std::uint64_t>(version::FINGERPRINT_SCHEMA_VERSION);
  o["ref"] = ref;
  o["tree"] = tree_digest;
  o["config"] = config_json;
  return hash_domain("base:", jsonlite::to_json(o));
}

bool is_context_internal(const std::string& rel) {
  return rel == ".stagecraft" || rel.rfind(".stagecraft/", 0) == 0;
}

bool collect_copy_inputs(const std::string& context_dir, const CopyInstr& copy,
                         InputDigests* inputs, std::string* missing) {
  const fs::path context(context_dir);
  for (size_t i = 0; i < copy.sources.size(); ++i) {
    const std::string& src = copy.sources[i];
    const fs::path host = (context / src).lexically_normal();
    std::string rel_src = fs::path(src).lexically_normal().generic_string();
    if (rel_src == "." || rel_src == "./") rel_src.clear();
    if (!rel_src.empty() && rel_src.back() == '/') rel_src.pop_back();

    // Key prefix includes the source position so "COPY a b ." and
    // "COPY b a ." fingerprint differently.
    const std::string prefix = std::to_string(i) + ":" + src;

    std::error_code ec;
    if (!fs::exists(fs::symlink_status(host, ec)) || is_context_internal(rel_src)) {
      if (missing) *missing = src;
      return false;
    }
    std::string desc;
    if (!describe_path(host, &desc)) {
      if (missing) *missing = src;
      return false;
    }
    (*inputs)[prefix] = desc;
    if (!fs::is_directory(fs::symlink_status(host, ec))) continue;

    auto it = fs::recursive_directory_iterator(host, fs::directory_options::none, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
      const std::string rel = it->path().lexically_relative(host).generic_string();
      const std::string ctx_rel = rel_src.empty() ? rel : rel_src + "/" + rel;
      if (is_context_internal(ctx_rel)) {
        if (it->is_directory(ec)) it.disable_recursion_pending();
        continue;
      }
      if (!describe_path(it->path(), &desc)) {
        if (missing) *missing = src + "/" + rel;
        return false;
      }
      (*inputs)[prefix + "/" + rel] = desc;
    }
    if (ec) {
      if (missing) *missing = src;
      return false;
    }
  }
  return true;
}

}  // namespace stagecraft
