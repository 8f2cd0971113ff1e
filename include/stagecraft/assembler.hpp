#pragma once

// stagecraft/assembler.hpp - Final snapshot -> ImageDescriptor.
//
// The descriptor is the only build artifact handed to `run`. It contains no
// timestamps and no host paths, so two builds of the same recipe over the
// same inputs produce byte-identical descriptors and the same digest.
//
// DIGEST:
//   digest = BLAKE3("img:" || canonical JSON of every field except "digest")

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "stagecraft/snapshot.hpp"
#include "stagecraft/types.hpp"

namespace stagecraft {

struct ImageDescriptor {
  std::uint32_t format_version{0};
  std::string target_stage;
  std::string fingerprint;    // fingerprint of the final snapshot
  std::string rootfs_digest;  // tree digest of the final snapshot
  std::vector<std::string> stage_order;
  std::vector<std::string> layer_fingerprints;  // target stage ancestry, base first
  std::set<int> exposed_ports;
  std::map<std::string, std::string> env;
  std::vector<std::string> entrypoint;
  std::string workdir{"/"};
  std::optional<HealthcheckSpec> healthcheck;
  std::string digest;
};

struct AssembleResult {
  bool ok{false};
  BuildError error;
  ImageDescriptor image;
};

AssembleResult assemble_image(const Snapshot& final_snapshot, const std::string& target_stage,
                              const std::vector<std::string>& stage_order,
                              const std::vector<std::string>& layer_fingerprints);

// Checks applied by assemble_image; exposed for `run` on hand-edited
// descriptors.
BuildError validate_healthcheck(const HealthcheckSpec& hc);

std::string descriptor_to_json(const ImageDescriptor& image);
std::optional<ImageDescriptor> descriptor_from_json(const std::string& text, BuildError* error);

// Digest over every field except `digest` itself.
std::string compute_descriptor_digest(const ImageDescriptor& image);

}  // namespace stagecraft
