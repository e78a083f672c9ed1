#include "proofarm/artifact_store.hpp"

#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

#if defined(PROOFARM_WITH_ZSTD)
#include <zstd.h>
#endif

#include "proofarm/hash.hpp"
#include "proofarm/jsonlite.hpp"
#include "proofarm/log.hpp"

namespace fs = std::filesystem;

namespace proofarm {

namespace {

#if defined(PROOFARM_WITH_ZSTD)
std::string compress_zstd(const std::string& data) {
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  const size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}

std::optional<std::string> decompress_zstd(const std::string& data, std::size_t original_size) {
  std::string out;
  out.resize(original_size);
  const size_t n = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
  if (ZSTD_isError(n)) return std::nullopt;
  out.resize(n);
  return out;
}
#endif

std::string make_tmp_name(const fs::path& dir) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  return (dir / (".tmp_" + std::to_string(rng()))).string();
}

bool atomic_write(const fs::path& target, const std::string& data, std::string* error) {
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec) {
    if (error) *error = "create " + target.parent_path().string() + ": " + ec.message();
    return false;
  }
  const std::string tmp = make_tmp_name(target.parent_path());
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      if (error) *error = "open " + tmp + " for writing failed";
      return false;
    }
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!ofs) {
      std::remove(tmp.c_str());
      if (error) *error = "write " + tmp + " failed";
      return false;
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    std::remove(tmp.c_str());
    if (error) *error = "rename into " + target.string() + ": " + ec.message();
    return false;
  }
  return true;
}

std::optional<std::string> read_file(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) return std::nullopt;
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

bool safe_key(const std::string& key) {
  if (key.empty() || key.front() == '/') return false;
  for (const auto& part : fs::path(key)) {
    if (part == "..") return false;
  }
  return true;
}

std::string meta_json(const StoredObjectInfo& info) {
  jsonlite::Object o;
  o["digest"] = info.digest;
  o["encoding"] = info.encoding;
  o["original_size"] = info.original_size;
  o["stored_size"] = info.stored_size;
  o["stored_blob_hash"] = info.stored_blob_hash;
  o["created_at"] = info.created_at;
  return jsonlite::to_json(o);
}

}  // namespace

std::string bundle_key(const std::string& key_prefix, const Theorem& theorem) {
  const std::string& name = theorem.content_digest.empty() ? theorem.id : theorem.content_digest;
  return key_prefix.empty() ? name : key_prefix + "/" + name;
}

std::string artifact_key(const std::string& key_prefix, const ProofArtifact& artifact) {
  return key_prefix.empty() ? artifact.id : key_prefix + "/" + artifact.id;
}

LocalArtifactStore::LocalArtifactStore(StorageConfig config) : config_(std::move(config)) {
  std::error_code ec;
  fs::create_directories(fs::path(config_.root) / "objects", ec);
  if (ec) log_warn("store", "cannot create " + config_.root + "/objects: " + ec.message());
}

std::string LocalArtifactStore::object_path(const std::string& digest) const {
  return (fs::path(config_.root) / "objects" / digest.substr(0, 2) / digest.substr(2, 2) / digest).string();
}

std::optional<std::string> LocalArtifactStore::download_code_bundle(const std::string& key, std::string* error) {
  if (!safe_key(key)) {
    if (error) *error = "invalid bundle key: " + key;
    return std::nullopt;
  }
  const fs::path p = fs::path(config_.root) / "bundles" / key;
  std::error_code ec;
  if (!fs::exists(p, ec)) {
    if (error) *error = "Failed to download code bundle: " + key + " not found";
    return std::nullopt;
  }
  log_debug("store", "resolved bundle " + key + " -> " + p.string());
  return p.string();
}

std::string LocalArtifactStore::put_object(const std::string& bytes, std::string* error) {
  const std::string digest = artifact_content_hash(bytes);
  if (!is_valid_digest(digest)) {
    if (error) *error = "digest computation failed";
    return {};
  }
  const fs::path target = object_path(digest);
  const fs::path meta = target.string() + ".meta";
  std::error_code ec;
  if (fs::exists(target, ec) && fs::exists(meta, ec)) {
    const auto existing = get_object(digest);
    if (!existing || *existing != bytes) {
      if (error) *error = "stored object " + digest + " failed integrity check";
      return {};
    }
    return digest;
  }

  std::string stored = bytes;
  std::string encoding = "identity";
#if defined(PROOFARM_WITH_ZSTD)
  if (config_.compress_artifacts) {
    auto c = compress_zstd(bytes);
    if (!c.empty() && c.size() < bytes.size()) {
      stored = std::move(c);
      encoding = "zstd";
    }
  }
#endif

  if (!atomic_write(target, stored, error)) return {};

  StoredObjectInfo info;
  info.digest = digest;
  info.encoding = encoding;
  info.original_size = bytes.size();
  info.stored_size = stored.size();
  info.stored_blob_hash = blake3_hex(stored);
  info.created_at = static_cast<std::uint64_t>(std::time(nullptr));
  if (!atomic_write(meta, meta_json(info), error)) {
    fs::remove(target, ec);
    return {};
  }
  return digest;
}

bool LocalArtifactStore::upload_artifact(const std::string& key, const std::string& bytes, std::string* error) {
  if (!safe_key(key)) {
    if (error) *error = "invalid artifact key: " + key;
    return false;
  }
  const std::string digest = put_object(bytes, error);
  if (digest.empty()) return false;
  if (!atomic_write(fs::path(config_.root) / "refs" / key, digest, error)) return false;
  log_debug("store", "uploaded " + key + " -> " + digest);
  return true;
}

std::optional<StoredObjectInfo> LocalArtifactStore::info(const std::string& digest) const {
  if (!is_valid_digest(digest)) return std::nullopt;
  const auto text = read_file(object_path(digest) + ".meta");
  if (!text) return std::nullopt;
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(*text, &err);
  if (err) return std::nullopt;
  StoredObjectInfo info;
  info.digest = jsonlite::get_string(obj, "digest");
  info.encoding = jsonlite::get_string(obj, "encoding", "identity");
  info.original_size = jsonlite::get_u64(obj, "original_size");
  info.stored_size = jsonlite::get_u64(obj, "stored_size");
  info.stored_blob_hash = jsonlite::get_string(obj, "stored_blob_hash");
  info.created_at = jsonlite::get_u64(obj, "created_at");
  if (info.digest != digest) return std::nullopt;
  return info;
}

std::optional<std::string> LocalArtifactStore::get_object(const std::string& digest) const {
  if (!is_valid_digest(digest)) return std::nullopt;
  auto data = read_file(object_path(digest));
  if (!data) return std::nullopt;
  const auto meta = info(digest);
  if (!meta) return std::nullopt;

  if (blake3_hex(*data) != meta->stored_blob_hash) {
    log_warn("store", "blob hash mismatch for " + digest);
    return std::nullopt;
  }
  if (meta->encoding == "zstd") {
#if defined(PROOFARM_WITH_ZSTD)
    auto plain = decompress_zstd(*data, meta->original_size);
    if (!plain) return std::nullopt;
    data = std::move(plain);
#else
    log_warn("store", digest + " is zstd-encoded but zstd support is not built in");
    return std::nullopt;
#endif
  } else if (meta->encoding != "identity") {
    return std::nullopt;
  }

  if (artifact_content_hash(*data) != digest) {
    log_warn("store", "content digest mismatch for " + digest);
    return std::nullopt;
  }
  return data;
}

std::optional<std::string> LocalArtifactStore::get_artifact(const std::string& key) const {
  if (!safe_key(key)) return std::nullopt;
  const auto digest = read_file(fs::path(config_.root) / "refs" / key);
  if (!digest) return std::nullopt;
  return get_object(*digest);
}

bool LocalArtifactStore::store_job_result(const JobResult& result, std::string* error) {
  const std::string json = job_result_to_json(result);
  const std::string line = "{\"record_hash\":\"" + result_record_hash(json) + "\",\"result\":" + json + "}\n";
  const fs::path p = fs::path(config_.root) / "results.ndjson";

  std::lock_guard<std::mutex> lk(results_mu_);
  std::error_code ec;
  fs::create_directories(p.parent_path(), ec);
  std::ofstream ofs(p, std::ios::binary | std::ios::app);
  if (!ofs) {
    if (error) *error = "open " + p.string() + " for append failed";
    return false;
  }
  ofs.write(line.data(), static_cast<std::streamsize>(line.size()));
  ofs.flush();
  if (!ofs) {
    if (error) *error = "append to " + p.string() + " failed";
    return false;
  }
  return true;
}

std::vector<std::string> LocalArtifactStore::read_job_results() const {
  std::vector<std::string> out;
  std::ifstream ifs(fs::path(config_.root) / "results.ndjson");
  std::string line;
  while (std::getline(ifs, line)) {
    if (!line.empty()) out.push_back(line);
  }
  return out;
}

}  // namespace proofarm
