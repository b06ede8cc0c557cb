#include "bits3/config.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>

#include "bits3/error.h"

namespace bits3 {

namespace {

constexpr std::array<std::string_view, 4> kStorageClasses{
    "STANDARD", "STANDARD_IA", "GLACIER", "DEEP_ARCHIVE"};

[[noreturn]] void Reject(const std::string& field, const std::string& why) {
  throw MakeError(errors::kConfiguration, field + ": " + why, Retryability::kFatal,
                  {"field=" + field});
}

void ValidateKdf(const crypto::KdfParams& kdf) {
  switch (kdf.algorithm) {
    case crypto::KdfAlgorithm::kPbkdf2Sha256:
      if (kdf.iterations < crypto::kMinPbkdf2Iterations) {
        Reject("kdf.iterations", "PBKDF2 needs at least " +
                                     std::to_string(crypto::kMinPbkdf2Iterations) + " iterations");
      }
      return;
    case crypto::KdfAlgorithm::kArgon2id:
      if (!crypto::Argon2Available()) {
        Reject("kdf.algorithm", "argon2id is not available in this build");
      }
      if (kdf.iterations < crypto::kMinArgon2TimeCost) {
        Reject("kdf.iterations", "argon2id time cost must be at least 1");
      }
      if (kdf.memory_kib < crypto::kMinArgon2MemoryKib) {
        Reject("kdf.memory_kib", "argon2id needs at least " +
                                     std::to_string(crypto::kMinArgon2MemoryKib) + " KiB");
      }
      if (kdf.parallelism == 0 || kdf.parallelism > 64) {
        Reject("kdf.parallelism", "must be between 1 and 64");
      }
      return;
  }
  Reject("kdf.algorithm", "unknown algorithm");
}

}  // namespace

bool IsValidStorageClass(std::string_view storage_class) noexcept {
  for (auto candidate : kStorageClasses) {
    if (candidate == storage_class) {
      return true;
    }
  }
  return false;
}

std::string NormalizeStorageClass(std::string_view storage_class) {
  std::string out(storage_class);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return out;
}

std::string DefaultObjectKey(const std::filesystem::path& source) {
  auto name = source.filename();
  if (name.empty()) {
    name = source.parent_path().filename();  // trailing separator
  }
  return name.string() + std::string(kObjectKeySuffix);
}

void ValidateConfig(const PipelineConfig& config, const store::StoreLimits& limits) {
  if (config.source_path.empty()) {
    Reject("source_path", "must not be empty");
  }
  if (config.bucket.empty()) {
    Reject("bucket", "must not be empty");
  }
  if (config.key.empty()) {
    Reject("key", "must not be empty");
  }
  if (config.secret.empty()) {
    Reject("secret", "must not be empty");
  }
  if (config.part_size_bytes < limits.min_part_size ||
      config.part_size_bytes > limits.max_part_size) {
    Reject("part_size_bytes", "must be between " + std::to_string(limits.min_part_size) +
                                  " and " + std::to_string(limits.max_part_size));
  }
  if (config.max_in_flight_parts == 0 || config.max_in_flight_parts > kMaxInFlightParts) {
    Reject("max_in_flight_parts", "must be between 1 and " + std::to_string(kMaxInFlightParts));
  }
  if (config.retry_limit > kMaxRetryLimit) {
    Reject("retry_limit", "must not exceed " + std::to_string(kMaxRetryLimit));
  }
  if (config.retry_base_delay.count() < 0 || config.retry_max_delay < config.retry_base_delay) {
    Reject("retry_delay", "base delay must be non-negative and not exceed the max delay");
  }
  if (config.cipher_segment_size < core::kMinSegmentSize ||
      config.cipher_segment_size > core::kMaxSegmentSize) {
    Reject("cipher_segment_size", "must be between " + std::to_string(core::kMinSegmentSize) +
                                      " and " + std::to_string(core::kMaxSegmentSize));
  }
  ValidateKdf(config.kdf);
  if (!IsValidStorageClass(config.storage_class)) {
    Reject("storage_class", "unknown storage class '" + config.storage_class + "'");
  }
  if (config.read_chunk_size == 0) {
    Reject("read_chunk_size", "must be positive");
  }
  if (config.queue_depth == 0) {
    Reject("queue_depth", "must be positive");
  }
  if (config.progress_enabled && config.progress_interval.count() <= 0) {
    Reject("progress_interval", "must be positive");
  }
}

}  // namespace bits3
