#pragma once

// proofarm/artifact_store.hpp — Code bundles in, proof artifacts and job
// results out.
//
// IArtifactStore is the seam the worker pool and result collector use.
// LocalArtifactStore is the filesystem backend:
//
//   <root>/bundles/<key>              code bundles (file or directory), read-only
//   <root>/objects/ab/cd/<digest>     artifact blobs, content-addressed
//   <root>/objects/ab/cd/<digest>.meta
//   <root>/refs/<key>                 artifact key -> digest
//   <root>/results.ndjson             one line per JobResult
//
// INVARIANTS:
//   - Artifact digest = artifact_content_hash(original bytes) ("art:" domain).
//   - Blob and meta files are written tmp+rename, so readers never observe a
//     partial object.
//   - Reads verify the stored blob hash, then the domain digest of the
//     decoded bytes; any mismatch reads as absent.
//   - Keys are relative paths without "..": a key can never escape root.

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "proofarm/config.hpp"
#include "proofarm/types.hpp"

namespace proofarm {

class IArtifactStore {
 public:
  virtual ~IArtifactStore() = default;

  // Local filesystem path of the bundle, or nullopt with *error set.
  virtual std::optional<std::string> download_code_bundle(const std::string& key, std::string* error) = 0;

  virtual bool upload_artifact(const std::string& key, const std::string& bytes, std::string* error) = 0;

  virtual bool store_job_result(const JobResult& result, std::string* error) = 0;
};

struct StoredObjectInfo {
  std::string digest;
  std::string encoding;          // identity | zstd
  std::uint64_t original_size{0};
  std::uint64_t stored_size{0};
  std::string stored_blob_hash;  // plain BLAKE3 of the stored bytes
  std::uint64_t created_at{0};
};

class LocalArtifactStore : public IArtifactStore {
 public:
  explicit LocalArtifactStore(StorageConfig config);

  std::optional<std::string> download_code_bundle(const std::string& key, std::string* error) override;
  bool upload_artifact(const std::string& key, const std::string& bytes, std::string* error) override;
  bool store_job_result(const JobResult& result, std::string* error) override;

  // Resolves a key written by upload_artifact() and returns verified bytes.
  std::optional<std::string> get_artifact(const std::string& key) const;
  std::optional<std::string> get_object(const std::string& digest) const;
  std::optional<StoredObjectInfo> info(const std::string& digest) const;

  // Raw lines of results.ndjson, oldest first.
  std::vector<std::string> read_job_results() const;

  const std::string& root() const { return config_.root; }

 private:
  std::string object_path(const std::string& digest) const;
  std::string put_object(const std::string& bytes, std::string* error);

  StorageConfig config_;
  std::mutex results_mu_;
};

// Bundles live under <key_prefix>/<content digest>; artifacts under
// <key_prefix>/<artifact id>.
std::string bundle_key(const std::string& key_prefix, const Theorem& theorem);
std::string artifact_key(const std::string& key_prefix, const ProofArtifact& artifact);

}  // namespace proofarm
