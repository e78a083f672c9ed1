#pragma once

// proofarm/hash.hpp — BLAKE3 digests for artifacts and results.
//
// Domain separation: every stored object kind hashes with its own prefix
// ("art:", "res:") so a digest of one kind can never be replayed as
// another. The prefixes are part of the on-disk layout; changing one orphans
// every object written with the old prefix.

#include <string>
#include <string_view>

namespace proofarm {

// 64-char lowercase hex BLAKE3-256 of payload.
std::string blake3_hex(std::string_view payload);

std::string hash_domain(std::string_view domain, std::string_view payload);
std::string artifact_content_hash(std::string_view raw_bytes);
std::string result_record_hash(std::string_view canonical_result_json);

// True for exactly 64 lowercase hex characters.
bool is_valid_digest(std::string_view digest);

std::string blake3_library_version();

}  // namespace proofarm
