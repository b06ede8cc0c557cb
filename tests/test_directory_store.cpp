#include "bits3/crypto/sha256.h"
#include "bits3/error.h"
#include "bits3/orchestrator/event_bus.h"
#include "bits3/store/directory_store.h"
#include "test_support.h"

#include <cassert>
#include <filesystem>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using bits3::store::DirectoryObjectStore;

std::string Upload(DirectoryObjectStore& store, const std::string& id, uint32_t sequence,
                   const std::vector<uint8_t>& bytes) {
  return store.UploadPart(id, sequence, bytes, bits3::crypto::SHA256_Hash(bytes));
}

bool FailsWithStoreError(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const bits3::Error& e) {
    return e.code == bits3::errors::kStoreRequestFailed && !e.Retryable();
  }
  return false;
}

size_t StagedUploads(const std::filesystem::path& bucket) {
  const auto staging = bucket / ".multipart";
  if (!std::filesystem::exists(staging)) {
    return 0;
  }
  size_t count = 0;
  for (const auto& entry : std::filesystem::directory_iterator(staging)) {
    (void)entry;
    ++count;
  }
  return count;
}

}  // namespace

int main() {
  bits3::testing::TempDir root("directory_store");
  DirectoryObjectStore store(root.path(), bits3::store::StoreLimits{16, 1024 * 1024, 100});
  assert(DirectoryObjectStore(root.path()).Limits().min_part_size == 5ull * 1024 * 1024);

  assert(FailsWithStoreError([&]() { store.CheckBucket("backups"); }));
  std::filesystem::create_directories(root.path() / "backups");
  store.CheckBucket("backups");
  assert(FailsWithStoreError([&]() { store.CheckBucket("../escape"); }));

  const auto first = bits3::testing::PatternBytes(32, 1);
  const auto second = bits3::testing::PatternBytes(7, 2);
  const auto bucket = root.path() / "backups";

  {
    auto id = store.OpenMultipartUpload("backups", "hosts/alpha.tar.bs3", "DEEP_ARCHIVE");
    assert(StagedUploads(bucket) == 1);
    auto tag2 = Upload(store, id, 2, second);
    auto tag1 = Upload(store, id, 1, first);
    // Re-sending a part replaces it.
    assert(Upload(store, id, 1, first) == tag1);
    assert(!std::filesystem::exists(bucket / "hosts/alpha.tar.bs3"));
    store.CompleteMultipartUpload(id, {{1, tag1}, {2, tag2}});

    auto object = bits3::testing::ReadFile(bucket / "hosts/alpha.tar.bs3");
    std::vector<uint8_t> expected = first;
    expected.insert(expected.end(), second.begin(), second.end());
    assert(object == expected);
    assert(StagedUploads(bucket) == 0 && "completion removes the staging directory");
  }

  {
    auto id = store.OpenMultipartUpload("backups", "beta", "STANDARD");
    auto tag1 = Upload(store, id, 1, second);
    auto tag2 = Upload(store, id, 2, first);
    assert(FailsWithStoreError([&]() { store.CompleteMultipartUpload(id, {{1, tag1}, {2, tag2}}); }));
    assert(FailsWithStoreError([&]() { store.CompleteMultipartUpload(id, {{1, tag1}, {3, tag2}}); }));
    assert(FailsWithStoreError([&]() {
      store.UploadPart(id, 3, first, bits3::crypto::SHA256_Hash(second));
    }));

    // The listing ignores staged parts.
    auto listed = store.ListObjects("backups");
    assert(listed.size() == 1 && listed[0].key == "hosts/alpha.tar.bs3");
    assert(listed[0].size == first.size() + second.size());

    store.AbortMultipartUpload(id);
    assert(StagedUploads(bucket) == 0);
    store.AbortMultipartUpload(id);
    assert(FailsWithStoreError([&]() { Upload(store, id, 1, first); }));
    assert(!std::filesystem::exists(bucket / "beta"));
  }

  for (const char* key : {"../outside", "a/../../b", "./x", ".multipart/evil", "/abs", ""}) {
    assert(FailsWithStoreError([&]() { store.OpenMultipartUpload("backups", key, "STANDARD"); }));
  }
  assert(FailsWithStoreError([&]() { store.AbortMultipartUpload("backups/not-hex!"); }));
  assert(FailsWithStoreError([&]() { store.AbortMultipartUpload("no-slash"); }));

  store.DeleteObject("backups", "hosts/alpha.tar.bs3");
  store.DeleteObject("backups", "hosts/alpha.tar.bs3");
  assert(store.ListObjects("backups").empty());

  // Once the object is in place, a failed staging cleanup is only a warning.
  {
    DirectoryObjectStore::Hooks hooks;
    hooks.before_cleanup = [](const std::filesystem::path&) {
      throw std::runtime_error("device busy");
    };
    store.SetHooks(hooks);
    std::vector<std::string> warnings;
    auto& bus = bits3::orchestrator::EventBus::Instance();
    auto sub = bus.Subscribe([&](const bits3::orchestrator::Event& event) {
      if (event.severity == bits3::orchestrator::EventSeverity::kWarning) {
        warnings.push_back(event.event_id);
      }
    });

    auto id = store.OpenMultipartUpload("backups", "gamma", "STANDARD");
    auto tag = Upload(store, id, 1, second);
    store.CompleteMultipartUpload(id, {{1, tag}});
    bus.Unsubscribe(sub);
    store.SetHooks({});

    assert(bits3::testing::ReadFile(bucket / "gamma") == second);
    assert(warnings.size() == 1 && warnings[0] == "store.cleanup_failed");
    assert(StagedUploads(bucket) == 1);
    store.AbortMultipartUpload(id);
    assert(StagedUploads(bucket) == 0);
    store.DeleteObject("backups", "gamma");
  }

  std::cout << "directory store tests ok\n";
  return 0;
}
