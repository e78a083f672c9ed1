#include "proofarm/hash.hpp"

// BLAKE3 is the only hash primitive. A build without libblake3 does not link.

#include <array>
#include <initializer_list>

#include <blake3.h>

namespace proofarm {
namespace {

// Hashes the concatenation of parts and returns lowercase hex.
std::string blake3_concat_hex(std::initializer_list<std::string_view> parts) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  for (const auto part : parts) {
    blake3_hasher_update(&hasher, part.data(), part.size());
  }
  std::array<unsigned char, BLAKE3_OUT_LEN> digest{};
  blake3_hasher_finalize(&hasher, digest.data(), digest.size());

  static constexpr char kHex[] = "0123456789abcdef";
  std::string hex(digest.size() * 2, '0');
  for (std::size_t i = 0; i < digest.size(); ++i) {
    hex[2 * i] = kHex[digest[i] >> 4];
    hex[2 * i + 1] = kHex[digest[i] & 0x0f];
  }
  return hex;
}

}  // namespace

std::string blake3_hex(std::string_view payload) { return blake3_concat_hex({payload}); }

std::string hash_domain(std::string_view domain, std::string_view payload) {
  return blake3_concat_hex({domain, payload});
}

std::string artifact_content_hash(std::string_view raw_bytes) { return hash_domain("art:", raw_bytes); }

std::string result_record_hash(std::string_view canonical_result_json) {
  return hash_domain("res:", canonical_result_json);
}

bool is_valid_digest(std::string_view digest) {
  if (digest.size() != 2 * BLAKE3_OUT_LEN) return false;
  for (const char c : digest) {
    const bool hex_digit = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    if (!hex_digit) return false;
  }
  return true;
}

std::string blake3_library_version() {
  const char* v = blake3_version();
  return v != nullptr ? std::string(v) : std::string("unknown");
}

}  // namespace proofarm
