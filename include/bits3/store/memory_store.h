#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "bits3/store/object_store.h"

namespace bits3::store {

// Thread-safe in-memory ObjectStore. Tests inject faults through Hooks: a
// hook that throws makes the corresponding request fail with that error.
class MemoryObjectStore : public ObjectStore {
public:
  struct Hooks {
    std::function<void(const std::string& bucket, const std::string& key)> before_open;
    // |attempt| counts calls for this sequence, starting at 1.
    std::function<void(uint32_t sequence, uint32_t attempt)> before_upload_part;
    std::function<void(const std::vector<CompletedPart>& parts)> before_complete;
    std::function<void(const std::string& upload_id)> before_abort;
    std::function<void(const std::string& bucket, const std::string& key)> before_delete;
  };

  struct Counters {
    uint32_t check_bucket_calls{0};
    uint32_t open_calls{0};
    uint32_t upload_part_calls{0};
    uint32_t complete_calls{0};
    uint32_t abort_calls{0};
    uint32_t delete_calls{0};
  };

  explicit MemoryObjectStore(StoreLimits limits = StoreLimits{1, 5ull * 1024 * 1024 * 1024, 10'000});

  void CreateBucket(const std::string& bucket);
  // Seeds an already completed object.
  void PutObject(const std::string& bucket, const std::string& key, std::vector<uint8_t> bytes,
                 std::chrono::system_clock::time_point last_modified);
  void SetHooks(Hooks hooks);
  void SetClock(std::function<std::chrono::system_clock::time_point()> clock);

  std::optional<std::vector<uint8_t>> GetObject(const std::string& bucket,
                                                const std::string& key) const;
  Counters counters() const;
  uint32_t UploadCallsFor(uint32_t sequence) const;
  std::vector<CompletedPart> last_completed_parts() const;
  size_t open_upload_count() const;
  uint32_t peak_concurrent_uploads() const noexcept { return peak_concurrent_.load(); }

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

private:
  struct StoredObject {
    std::vector<uint8_t> bytes;
    std::chrono::system_clock::time_point last_modified{};
    std::string storage_class;
  };
  struct StoredPart {
    std::vector<uint8_t> bytes;
    std::string tag;
  };
  struct Upload {
    std::string bucket;
    std::string key;
    std::string storage_class;
    std::map<uint32_t, StoredPart> parts;
  };

  Hooks HooksCopy() const;

  const StoreLimits limits_;
  mutable std::mutex mutex_;
  Hooks hooks_;
  std::function<std::chrono::system_clock::time_point()> clock_;
  std::map<std::string, std::map<std::string, StoredObject>> buckets_;
  std::map<std::string, Upload> uploads_;
  std::set<std::string> finished_uploads_;
  std::map<uint32_t, uint32_t> upload_attempts_;
  std::vector<CompletedPart> last_completed_;
  Counters counters_;
  uint64_t next_upload_{1};
  std::atomic<uint32_t> concurrent_{0};
  std::atomic<uint32_t> peak_concurrent_{0};
};

}  // namespace bits3::store
