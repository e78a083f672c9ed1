#include "proofarm/version.hpp"

#include "proofarm/hash.hpp"
#include "proofarm/jsonlite.hpp"

namespace proofarm {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.hash_primitive = "blake3 " + blake3_library_version();
#if defined(PROOFARM_WITH_ZSTD)
  m.zstd_enabled = true;
#endif
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  jsonlite::Object o;
  o["version"] = m.semver;
  o["hash_algorithm"] = static_cast<std::uint64_t>(m.hash_algorithm);
  o["artifact_store_format"] = static_cast<std::uint64_t>(m.artifact_store_format);
  o["result_record"] = static_cast<std::uint64_t>(m.result_record);
  o["event_log"] = static_cast<std::uint64_t>(m.event_log);
  o["hash_primitive"] = m.hash_primitive;
  o["zstd"] = m.zstd_enabled;
  o["build_timestamp"] = m.build_timestamp;
  return jsonlite::to_json(o);
}

}  // namespace version
}  // namespace proofarm
