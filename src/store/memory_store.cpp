#include "bits3/store/memory_store.h"

#include <algorithm>
#include <utility>

#include "bits3/common.h"
#include "bits3/crypto/sha256.h"
#include "bits3/store/io_util.h"

namespace bits3::store {

namespace {

class ConcurrencyProbe {
public:
  ConcurrencyProbe(std::atomic<uint32_t>& current, std::atomic<uint32_t>& peak) : current_(current) {
    const uint32_t now = ++current_;
    uint32_t seen = peak.load();
    while (now > seen && !peak.compare_exchange_weak(seen, now)) {
    }
  }
  ~ConcurrencyProbe() { --current_; }

private:
  std::atomic<uint32_t>& current_;
};

}  // namespace

MemoryObjectStore::MemoryObjectStore(StoreLimits limits)
    : limits_(limits), clock_([] { return std::chrono::system_clock::now(); }) {}

void MemoryObjectStore::CreateBucket(const std::string& bucket) {
  std::lock_guard<std::mutex> lock(mutex_);
  buckets_[bucket];
}

void MemoryObjectStore::PutObject(const std::string& bucket, const std::string& key,
                                  std::vector<uint8_t> bytes,
                                  std::chrono::system_clock::time_point last_modified) {
  std::lock_guard<std::mutex> lock(mutex_);
  buckets_[bucket][key] = StoredObject{std::move(bytes), last_modified, "STANDARD"};
}

void MemoryObjectStore::SetHooks(Hooks hooks) {
  std::lock_guard<std::mutex> lock(mutex_);
  hooks_ = std::move(hooks);
}

void MemoryObjectStore::SetClock(std::function<std::chrono::system_clock::time_point()> clock) {
  std::lock_guard<std::mutex> lock(mutex_);
  clock_ = std::move(clock);
}

MemoryObjectStore::Hooks MemoryObjectStore::HooksCopy() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return hooks_;
}

std::optional<std::vector<uint8_t>> MemoryObjectStore::GetObject(const std::string& bucket,
                                                                 const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto b = buckets_.find(bucket);
  if (b == buckets_.end()) {
    return std::nullopt;
  }
  auto o = b->second.find(key);
  if (o == b->second.end()) {
    return std::nullopt;
  }
  return o->second.bytes;
}

MemoryObjectStore::Counters MemoryObjectStore::counters() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return counters_;
}

uint32_t MemoryObjectStore::UploadCallsFor(uint32_t sequence) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = upload_attempts_.find(sequence);
  return it == upload_attempts_.end() ? 0 : it->second;
}

std::vector<CompletedPart> MemoryObjectStore::last_completed_parts() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_completed_;
}

size_t MemoryObjectStore::open_upload_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return uploads_.size();
}

void MemoryObjectStore::CheckBucket(const std::string& bucket) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++counters_.check_bucket_calls;
  if (buckets_.find(bucket) == buckets_.end()) {
    throw StoreRequestError("bucket " + bucket + " does not exist", Retryability::kFatal, 404);
  }
}

std::string MemoryObjectStore::OpenMultipartUpload(const std::string& bucket,
                                                   const std::string& key,
                                                   const std::string& storage_class) {
  auto hooks = HooksCopy();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++counters_.open_calls;
  }
  if (hooks.before_open) {
    hooks.before_open(bucket, key);
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (buckets_.find(bucket) == buckets_.end()) {
    throw StoreRequestError("bucket " + bucket + " does not exist", Retryability::kFatal, 404);
  }
  auto id = "upload-" + std::to_string(next_upload_++);
  uploads_[id] = Upload{bucket, key, storage_class, {}};
  upload_attempts_.clear();
  return id;
}

std::string MemoryObjectStore::UploadPart(const std::string& upload_id, uint32_t sequence,
                                          std::span<const uint8_t> bytes,
                                          const crypto::Sha256Digest& digest) {
  ConcurrencyProbe probe(concurrent_, peak_concurrent_);
  auto hooks = HooksCopy();
  uint32_t attempt = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++counters_.upload_part_calls;
    attempt = ++upload_attempts_[sequence];
  }
  if (hooks.before_upload_part) {
    hooks.before_upload_part(sequence, attempt);
  }
  if (crypto::SHA256_Hash(bytes) != digest) {
    throw StoreRequestError("part " + std::to_string(sequence) + " digest mismatch",
                            Retryability::kFatal, 400);
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = uploads_.find(upload_id);
  if (it == uploads_.end()) {
    throw StoreRequestError("no such upload " + upload_id, Retryability::kFatal, 404);
  }
  StoredPart part;
  part.bytes.assign(bytes.begin(), bytes.end());
  part.tag = ToHex(std::span<const uint8_t>(digest).first(16));
  auto tag = part.tag;
  it->second.parts[sequence] = std::move(part);
  return tag;
}

void MemoryObjectStore::CompleteMultipartUpload(const std::string& upload_id,
                                                const std::vector<CompletedPart>& parts) {
  auto hooks = HooksCopy();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++counters_.complete_calls;
    last_completed_ = parts;
  }
  if (hooks.before_complete) {
    hooks.before_complete(parts);
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = uploads_.find(upload_id);
  if (it == uploads_.end()) {
    throw StoreRequestError("no such upload " + upload_id, Retryability::kFatal, 404);
  }
  auto& upload = it->second;
  if (parts.empty()) {
    throw StoreRequestError("completion needs at least one part", Retryability::kFatal, 400);
  }
  StoredObject object;
  uint32_t previous = 0;
  for (size_t i = 0; i < parts.size(); ++i) {
    const auto& part = parts[i];
    if (part.sequence <= previous) {
      throw StoreRequestError("parts not in ascending order", Retryability::kFatal, 400);
    }
    previous = part.sequence;
    auto stored = upload.parts.find(part.sequence);
    if (stored == upload.parts.end() || stored->second.tag != part.tag) {
      throw StoreRequestError("part " + std::to_string(part.sequence) + " not found or tag mismatch",
                              Retryability::kFatal, 400);
    }
    if (i + 1 < parts.size() && stored->second.bytes.size() < limits_.min_part_size) {
      throw StoreRequestError("part " + std::to_string(part.sequence) + " below minimum size",
                              Retryability::kFatal, 400);
    }
    object.bytes.insert(object.bytes.end(), stored->second.bytes.begin(), stored->second.bytes.end());
  }
  object.last_modified = clock_();
  object.storage_class = upload.storage_class;
  buckets_[upload.bucket][upload.key] = std::move(object);
  uploads_.erase(it);
  finished_uploads_.insert(upload_id);
}

void MemoryObjectStore::AbortMultipartUpload(const std::string& upload_id) {
  auto hooks = HooksCopy();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++counters_.abort_calls;
  }
  if (hooks.before_abort) {
    hooks.before_abort(upload_id);
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (uploads_.erase(upload_id) > 0) {
    finished_uploads_.insert(upload_id);
  }
}

std::vector<ObjectInfo> MemoryObjectStore::ListObjects(const std::string& bucket) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto b = buckets_.find(bucket);
  if (b == buckets_.end()) {
    throw StoreRequestError("bucket " + bucket + " does not exist", Retryability::kFatal, 404);
  }
  std::vector<ObjectInfo> out;
  for (const auto& [key, object] : b->second) {
    out.push_back(ObjectInfo{key, object.bytes.size(), object.last_modified, object.storage_class});
  }
  return out;
}

void MemoryObjectStore::DeleteObject(const std::string& bucket, const std::string& key) {
  auto hooks = HooksCopy();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++counters_.delete_calls;
  }
  if (hooks.before_delete) {
    hooks.before_delete(bucket, key);
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto b = buckets_.find(bucket);
  if (b != buckets_.end()) {
    b->second.erase(key);
  }
}

}  // namespace bits3::store
