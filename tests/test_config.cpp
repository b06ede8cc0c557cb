#include "bits3/config.h"
#include "bits3/error.h"
#include "test_support.h"

#include <algorithm>
#include <cassert>
#include <functional>
#include <iostream>
#include <string>

namespace {

bits3::store::StoreLimits TestLimits() {
  return bits3::store::StoreLimits{1024, 1024 * 1024, 100};
}

std::string RejectedField(const std::function<void(bits3::PipelineConfig&)>& mutate) {
  auto config = bits3::testing::FastConfig("/tmp/photos");
  mutate(config);
  try {
    bits3::ValidateConfig(config, TestLimits());
  } catch (const bits3::Error& e) {
    assert(e.code == bits3::errors::kConfiguration);
    assert(!e.Retryable());
    auto it = std::find_if(e.context.begin(), e.context.end(),
                           [](const std::string& entry) { return entry.rfind("field=", 0) == 0; });
    assert(it != e.context.end());
    return it->substr(6);
  }
  return {};
}

}  // namespace

int main() {
  using bits3::PipelineConfig;

  assert(RejectedField([](PipelineConfig&) {}).empty() && "the fast test config is valid");

  assert(RejectedField([](PipelineConfig& c) { c.source_path.clear(); }) == "source_path");
  assert(RejectedField([](PipelineConfig& c) { c.bucket.clear(); }) == "bucket");
  assert(RejectedField([](PipelineConfig& c) { c.key.clear(); }) == "key");
  assert(RejectedField([](PipelineConfig& c) { c.secret.clear(); }) == "secret");
  assert(RejectedField([](PipelineConfig& c) { c.part_size_bytes = 1023; }) == "part_size_bytes");
  assert(RejectedField([](PipelineConfig& c) { c.part_size_bytes = 1024 * 1024 + 1; }) ==
         "part_size_bytes");
  assert(RejectedField([](PipelineConfig& c) { c.part_size_bytes = 1024; }).empty() &&
         "the store minimum itself is allowed");
  assert(RejectedField([](PipelineConfig& c) { c.max_in_flight_parts = 0; }) ==
         "max_in_flight_parts");
  assert(RejectedField([](PipelineConfig& c) {
           c.max_in_flight_parts = bits3::kMaxInFlightParts + 1;
         }) == "max_in_flight_parts");
  assert(RejectedField([](PipelineConfig& c) { c.retry_limit = 0; }).empty() &&
         "zero retries means a single attempt");
  assert(RejectedField([](PipelineConfig& c) { c.retry_limit = bits3::kMaxRetryLimit + 1; }) ==
         "retry_limit");
  assert(RejectedField([](PipelineConfig& c) {
           c.retry_max_delay = std::chrono::milliseconds(0);
         }) == "retry_delay");
  assert(RejectedField([](PipelineConfig& c) { c.cipher_segment_size = 100; }) ==
         "cipher_segment_size");
  assert(RejectedField([](PipelineConfig& c) { c.kdf.iterations = 1000; }) == "kdf.iterations");
  assert(RejectedField([](PipelineConfig& c) { c.storage_class = "REDUCED"; }) ==
         "storage_class");
  assert(RejectedField([](PipelineConfig& c) { c.read_chunk_size = 0; }) == "read_chunk_size");
  assert(RejectedField([](PipelineConfig& c) { c.queue_depth = 0; }) == "queue_depth");
  assert(RejectedField([](PipelineConfig& c) {
           c.progress_enabled = true;
           c.progress_interval = std::chrono::milliseconds(0);
         }) == "progress_interval");
  if (!bits3::crypto::Argon2Available()) {
    assert(RejectedField([](PipelineConfig& c) {
             c.kdf.algorithm = bits3::crypto::KdfAlgorithm::kArgon2id;
           }) == "kdf.algorithm");
  }

  for (const char* storage_class : {"STANDARD", "STANDARD_IA", "GLACIER", "DEEP_ARCHIVE"}) {
    assert(bits3::IsValidStorageClass(storage_class));
  }
  assert(!bits3::IsValidStorageClass("standard"));
  assert(!bits3::IsValidStorageClass(""));
  assert(bits3::NormalizeStorageClass("standard_ia") == "STANDARD_IA");
  assert(bits3::NormalizeStorageClass("Deep_Archive") == "DEEP_ARCHIVE");
  assert(bits3::IsValidStorageClass(bits3::NormalizeStorageClass("glacier")));
  assert(!bits3::IsValidStorageClass(bits3::NormalizeStorageClass("reduced")));
  assert(PipelineConfig{}.storage_class == bits3::kDefaultStorageClass);

  assert(bits3::DefaultObjectKey("/srv/snapshots/2024-05-01") == "2024-05-01.tar.bs3");
  assert(bits3::DefaultObjectKey("/srv/snapshots/daily/") == "daily.tar.bs3");

  std::cout << "config tests ok\n";
  return 0;
}
