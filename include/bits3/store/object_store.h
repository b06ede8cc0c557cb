#pragma once

#include <chrono>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "bits3/crypto/sha256.h"

namespace bits3::store {

// Per-store multipart constraints. The last part of an upload may be smaller
// than min_part_size.
struct StoreLimits {
  uint64_t min_part_size{5ull * 1024 * 1024};
  uint64_t max_part_size{5ull * 1024 * 1024 * 1024};
  uint32_t max_parts{10'000};
};

struct CompletedPart {
  uint32_t sequence{0};
  std::string tag;
};

struct ObjectInfo {
  std::string key;
  uint64_t size{0};
  std::chrono::system_clock::time_point last_modified{};
  std::string storage_class;
};

// Remote side of a multipart upload. Implementations report failures by
// throwing bits3::Error with code errors::kStoreRequestFailed and a
// Retryability that tells the caller whether the same request may be sent
// again. All operations must be safe to call from several threads.
class ObjectStore {
public:
  virtual ~ObjectStore() = default;

  virtual StoreLimits Limits() const = 0;

  // Throws if |bucket| does not exist or is not accessible.
  virtual void CheckBucket(const std::string& bucket) = 0;

  virtual std::string OpenMultipartUpload(const std::string& bucket,
                                          const std::string& key,
                                          const std::string& storage_class) = 0;

  // Returns the store-assigned part tag. Re-sending the same sequence
  // replaces the earlier copy.
  virtual std::string UploadPart(const std::string& upload_id,
                                 uint32_t sequence,
                                 std::span<const uint8_t> bytes,
                                 const crypto::Sha256Digest& digest) = 0;

  // |parts| must be sorted by sequence and name every uploaded part.
  virtual void CompleteMultipartUpload(const std::string& upload_id,
                                       const std::vector<CompletedPart>& parts) = 0;

  // Releases staged parts. Aborting an unknown, aborted or completed upload
  // is a no-op.
  virtual void AbortMultipartUpload(const std::string& upload_id) = 0;

  virtual std::vector<ObjectInfo> ListObjects(const std::string& bucket) = 0;

  virtual void DeleteObject(const std::string& bucket, const std::string& key) = 0;
};

}  // namespace bits3::store
