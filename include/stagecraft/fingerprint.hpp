#pragma once

// stagecraft/fingerprint.hpp - Layer cache keys.
//
// fingerprint = BLAKE3("fp:" || canonical JSON
//     {"v": FINGERPRINT_SCHEMA_VERSION, "parent": <parent fp>,
//      "instr": <canonical instruction>, "inputs": {<name>: <digest>}})
//
// Stage names never enter a fingerprint: two stages with identical bases and
// instructions share their layers.

#include <map>
#include <string>

#include "stagecraft/recipe.hpp"

namespace stagecraft {

// Input name -> "<kind>:<digest-or-target>:<mode>".
using InputDigests = std::map<std::string, std::string>;

std::string compute_fingerprint(const std::string& parent_fingerprint,
                                const Instruction& instr,
                                const InputDigests& inputs);

// Fingerprint of an external base: hashes {ref, tree digest, runtime config
// JSON} in the "base:" domain so a base can never collide with a step
// fingerprint.
std::string base_fingerprint(const std::string& ref, const std::string& tree_digest,
                             const std::string& config_json = "");

// Hash every file, directory and symlink a COPY instruction reads from the
// build context. Paths under the context's .stagecraft/ directory are
// excluded. Returns false and fills *missing with the first source that does
// not exist.
bool collect_copy_inputs(const std::string& context_dir, const CopyInstr& copy,
                         InputDigests* inputs, std::string* missing);

// True for context-relative paths that COPY never reads (".stagecraft").
bool is_context_internal(const std::string& context_relative_path);

}  // namespace stagecraft
