#pragma once

// proofarm/version.hpp — Version manifest for every persisted format.
//
// INVARIANT:
//   A reader never accepts a record whose format version is newer than the
//   constant compiled in here. Changing the layout of a persisted format
//   requires a bump of its constant.

#include <cstdint>
#include <string>

namespace proofarm {
namespace version {

#ifndef PROOFARM_VERSION_STRING
#define PROOFARM_VERSION_STRING "0.1.0"
#endif

// Version 1 = BLAKE3, 32-byte output, lowercase hex, domain-prefixed inputs.
constexpr std::uint32_t HASH_ALGORITHM_VERSION = 1;

// Version 1 = objects/AB/CD/<digest> with JSON .meta sidecars and refs/<key>.
constexpr std::uint32_t ARTIFACT_STORE_FORMAT_VERSION = 1;

// Version 1 = {"record_hash":..., "result":{...}} lines in results.ndjson.
constexpr std::uint32_t RESULT_RECORD_VERSION = 1;

// Version 1 = one JobEvent object per line.
constexpr std::uint32_t EVENT_LOG_VERSION = 1;

struct VersionManifest {
  std::string semver{PROOFARM_VERSION_STRING};
  std::uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  std::uint32_t artifact_store_format{ARTIFACT_STORE_FORMAT_VERSION};
  std::uint32_t result_record{RESULT_RECORD_VERSION};
  std::uint32_t event_log{EVENT_LOG_VERSION};
  std::string hash_primitive;      // "blake3 <library version>"
  bool zstd_enabled{false};
  std::string build_timestamp;
};

VersionManifest current_manifest();

std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace proofarm
