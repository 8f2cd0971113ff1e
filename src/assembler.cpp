#include "stagecraft/assembler.hpp"

#include "stagecraft/hash.hpp"
#include "stagecraft/jsonlite.hpp"
#include "stagecraft/version.hpp"

namespace stagecraft {

namespace {

jsonlite::Object descriptor_body(const ImageDescriptor& image) {
  jsonlite::Object o;
  o["format_version"] = static_cast<std::uint64_t>(image.format_version);
  o["target_stage"] = image.target_stage;
  o["fingerprint"] = image.fingerprint;
  o["rootfs_digest"] = image.rootfs_digest;
  o["stage_order"] = jsonlite::to_array(image.stage_order);
  o["layers"] = jsonlite::to_array(image.layer_fingerprints);

  RuntimeConfig cfg;
  cfg.env = image.env;
  cfg.workdir = image.workdir;
  cfg.exposed_ports = image.exposed_ports;
  cfg.entrypoint = image.entrypoint;
  cfg.healthcheck = image.healthcheck;
  o["config"] = runtime_config_to_value(cfg);
  return o;
}

}  // namespace

BuildError validate_healthcheck(const HealthcheckSpec& hc) {
  if (hc.command.empty())
    return make_error(ErrorCode::invalid_healthcheck, "healthcheck command is empty");
  if (hc.interval_ms <= 0)
    return make_error(ErrorCode::invalid_healthcheck, "interval must be positive");
  if (hc.timeout_ms <= 0)
    return make_error(ErrorCode::invalid_healthcheck, "timeout must be positive");
  if (hc.start_period_ms < 0)
    return make_error(ErrorCode::invalid_healthcheck, "start-period must not be negative");
  if (hc.retries < 1)
    return make_error(ErrorCode::invalid_healthcheck, "retries must be at least 1");
  return {};
}

AssembleResult assemble_image(const Snapshot& final_snapshot, const std::string& target_stage,
                              const std::vector<std::string>& stage_order,
                              const std::vector<std::string>& layer_fingerprints) {
  AssembleResult r;
  const RuntimeConfig& cfg = final_snapshot.config;
  if (cfg.entrypoint.empty()) {
    r.error = make_error(ErrorCode::no_entrypoint,
                         "no CMD or ENTRYPOINT in the ancestry of stage '" + target_stage + "'");
    r.error.stage = target_stage;
    r.error.fingerprint = final_snapshot.fingerprint;
    return r;
  }
  if (cfg.healthcheck) {
    BuildError err = validate_healthcheck(*cfg.healthcheck);
    if (!err.ok()) {
      err.stage = target_stage;
      err.fingerprint = final_snapshot.fingerprint;
      r.error = std::move(err);
      return r;
    }
  }

  ImageDescriptor& img = r.image;
  img.format_version = version::DESCRIPTOR_FORMAT_VERSION;
  img.target_stage = target_stage;
  img.fingerprint = final_snapshot.fingerprint;
  img.rootfs_digest = tree_digest(final_snapshot.tree);
  img.stage_order = stage_order;
  img.layer_fingerprints = layer_fingerprints;
  img.exposed_ports = cfg.exposed_ports;
  img.env = cfg.env;
  img.entrypoint = cfg.entrypoint;
  img.workdir = cfg.workdir;
  img.healthcheck = cfg.healthcheck;
  img.digest = compute_descriptor_digest(img);
  r.ok = true;
  return r;
}

std::string compute_descriptor_digest(const ImageDescriptor& image) {
  return descriptor_hash(jsonlite::to_json(descriptor_body(image)));
}

std::string descriptor_to_json(const ImageDescriptor& image) {
  auto o = descriptor_body(image);
  o["digest"] = image.digest;
  return jsonlite::to_json(o);
}

std::optional<ImageDescriptor> descriptor_from_json(const std::string& text, BuildError* error) {
  auto fail = [&](const std::string& detail) -> std::optional<ImageDescriptor> {
    if (error) *error = make_error(ErrorCode::json_parse_error, detail);
    return std::nullopt;
  };

  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(text, &err);
  if (err) return fail(err->code + ": " + err->message);

  ImageDescriptor img;
  img.format_version = static_cast<std::uint32_t>(jsonlite::get_u64(obj, "format_version"));
  if (img.format_version != version::DESCRIPTOR_FORMAT_VERSION) {
    return fail("unsupported descriptor format_version " + std::to_string(img.format_version));
  }
  img.target_stage = jsonlite::get_string(obj, "target_stage");
  img.fingerprint = jsonlite::get_string(obj, "fingerprint");
  img.rootfs_digest = jsonlite::get_string(obj, "rootfs_digest");
  img.stage_order = jsonlite::get_string_array(obj, "stage_order");
  img.layer_fingerprints = jsonlite::get_string_array(obj, "layers");
  img.digest = jsonlite::get_string(obj, "digest");

  const auto* cfg_obj = jsonlite::get_object(obj, "config");
  auto cfg = cfg_obj ? runtime_config_from_value(*cfg_obj) : std::nullopt;
  if (!cfg) return fail("descriptor config is missing or malformed");
  img.env = std::move(cfg->env);
  img.workdir = std::move(cfg->workdir);
  img.exposed_ports = std::move(cfg->exposed_ports);
  img.entrypoint = std::move(cfg->entrypoint);
  img.healthcheck = std::move(cfg->healthcheck);

  if (!is_hex_digest(img.fingerprint)) return fail("descriptor fingerprint is not a digest");
  if (img.digest != compute_descriptor_digest(img)) {
    return fail("descriptor digest does not match its contents");
  }
  return img;
}

}  // namespace stagecraft
