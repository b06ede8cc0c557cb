#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "bits3/store/object_store.h"

namespace bits3::store {

// ObjectStore over a local directory tree: <root>/<bucket>/<key>. Parts are
// staged under <bucket>/.multipart/<upload-id>/ and the object appears only
// when completion renames the assembled file into place. The storage class
// is accepted but not persisted.
class DirectoryObjectStore : public ObjectStore {
public:
  // Test seams. Set before the store is shared between threads.
  struct Hooks {
    // Runs after the object is in place, before the staging directory is removed.
    std::function<void(const std::filesystem::path& staging)> before_cleanup;
  };

  explicit DirectoryObjectStore(std::filesystem::path root, StoreLimits limits = StoreLimits{});

  StoreLimits Limits() const override { return limits_; }
  void CheckBucket(const std::string& bucket) override;
  std::string OpenMultipartUpload(const std::string& bucket, const std::string& key,
                                  const std::string& storage_class) override;
  std::string UploadPart(const std::string& upload_id, uint32_t sequence,
                         std::span<const uint8_t> bytes,
                         const crypto::Sha256Digest& digest) override;
  void CompleteMultipartUpload(const std::string& upload_id,
                               const std::vector<CompletedPart>& parts) override;
  void AbortMultipartUpload(const std::string& upload_id) override;
  std::vector<ObjectInfo> ListObjects(const std::string& bucket) override;
  void DeleteObject(const std::string& bucket, const std::string& key) override;

  const std::filesystem::path& root() const noexcept { return root_; }
  void SetHooks(Hooks hooks) { hooks_ = std::move(hooks); }

private:
  std::filesystem::path BucketPath(const std::string& bucket) const;
  std::filesystem::path StagingPath(const std::string& upload_id) const;

  std::filesystem::path root_;
  StoreLimits limits_;
  Hooks hooks_;
};

}  // namespace bits3::store
