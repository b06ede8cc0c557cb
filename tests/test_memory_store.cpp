#include "bits3/crypto/sha256.h"
#include "bits3/error.h"
#include "bits3/store/io_util.h"
#include "bits3/store/memory_store.h"
#include "test_support.h"

#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

namespace {

using bits3::store::CompletedPart;
using bits3::store::MemoryObjectStore;

std::string Upload(MemoryObjectStore& store, const std::string& id, uint32_t sequence,
                   const std::vector<uint8_t>& bytes) {
  return store.UploadPart(id, sequence, bytes, bits3::crypto::SHA256_Hash(bytes));
}

bool FailsWithStoreError(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const bits3::Error& e) {
    return e.code == bits3::errors::kStoreRequestFailed;
  }
  return false;
}

}  // namespace

int main() {
  MemoryObjectStore store(bits3::store::StoreLimits{4, 1024, 10});
  assert(FailsWithStoreError([&]() { store.CheckBucket("backups"); }));
  store.CreateBucket("backups");
  store.CheckBucket("backups");

  const auto first = bits3::testing::PatternBytes(8, 1);
  const auto second = bits3::testing::PatternBytes(3, 2);

  {
    auto id = store.OpenMultipartUpload("backups", "a.tar.bs3", "GLACIER");
    // Parts may arrive out of order; the completion list decides the layout.
    auto tag2 = Upload(store, id, 2, second);
    auto tag1 = Upload(store, id, 1, first);
    assert(tag1 != tag2 && tag1.size() == 32);
    assert(!store.GetObject("backups", "a.tar.bs3").has_value() && "nothing visible before complete");
    store.CompleteMultipartUpload(id, {{1, tag1}, {2, tag2}});
    auto object = store.GetObject("backups", "a.tar.bs3");
    assert(object.has_value());
    std::vector<uint8_t> expected = first;
    expected.insert(expected.end(), second.begin(), second.end());
    assert(*object == expected);
    auto listed = store.ListObjects("backups");
    assert(listed.size() == 1 && listed[0].size == expected.size());
    assert(listed[0].storage_class == "GLACIER");
    assert(store.open_upload_count() == 0);
  }

  {
    auto id = store.OpenMultipartUpload("backups", "b", "STANDARD");
    auto tag1 = Upload(store, id, 1, second);
    auto tag2 = Upload(store, id, 2, first);
    assert(FailsWithStoreError([&]() { store.CompleteMultipartUpload(id, {{1, tag1}, {2, tag2}}); }) &&
           "non-final parts below the minimum are rejected");
    assert(FailsWithStoreError([&]() { store.CompleteMultipartUpload(id, {{2, tag2}, {1, tag1}}); }));
    assert(FailsWithStoreError([&]() { store.CompleteMultipartUpload(id, {{1, "bogus"}}); }));
    assert(FailsWithStoreError([&]() { store.CompleteMultipartUpload(id, {}); }));

    auto bad_digest = bits3::crypto::SHA256_Hash(first);
    assert(FailsWithStoreError([&]() { store.UploadPart(id, 3, second, bad_digest); }));

    store.AbortMultipartUpload(id);
    store.AbortMultipartUpload(id);
    assert(store.open_upload_count() == 0);
    assert(FailsWithStoreError([&]() { Upload(store, id, 3, first); }));
    assert(!store.GetObject("backups", "b").has_value());
  }

  {
    MemoryObjectStore::Hooks hooks;
    hooks.before_upload_part = [](uint32_t sequence, uint32_t attempt) {
      if (sequence == 1 && attempt == 1) {
        throw bits3::store::StoreRequestError("throttled", bits3::Retryability::kRetryable, 503);
      }
    };
    store.SetHooks(hooks);
    auto id = store.OpenMultipartUpload("backups", "c", "STANDARD");
    bool retryable = false;
    try {
      Upload(store, id, 1, first);
    } catch (const bits3::Error& e) {
      retryable = e.Retryable();
    }
    assert(retryable);
    auto tag = Upload(store, id, 1, first);
    assert(store.UploadCallsFor(1) == 2);
    store.CompleteMultipartUpload(id, {{1, tag}});
    assert((store.last_completed_parts().size() == 1 && store.last_completed_parts()[0].tag == tag));
    store.SetHooks({});
  }

  {
    const auto base = std::chrono::system_clock::time_point{} + std::chrono::hours(24 * 365);
    store.PutObject("backups", "old", {1, 2, 3}, base);
    store.SetClock([base]() { return base + std::chrono::hours(1); });
    auto id = store.OpenMultipartUpload("backups", "new", "STANDARD");
    auto tag = Upload(store, id, 1, first);
    store.CompleteMultipartUpload(id, {{1, tag}});
    for (const auto& info : store.ListObjects("backups")) {
      if (info.key == "old") {
        assert(info.last_modified == base);
      } else if (info.key == "new") {
        assert(info.last_modified == base + std::chrono::hours(1));
      }
    }
    store.DeleteObject("backups", "old");
    store.DeleteObject("backups", "old");
    assert(!store.GetObject("backups", "old").has_value());
  }

  const auto counters = store.counters();
  assert(counters.abort_calls == 2 && counters.delete_calls == 2);
  assert(counters.check_bucket_calls == 2);

  std::cout << "memory store tests ok\n";
  return 0;
}
