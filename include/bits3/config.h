#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "bits3/core/stream_header.h"
#include "bits3/crypto/kdf.h"
#include "bits3/store/object_store.h"

namespace bits3 {

inline constexpr uint32_t kMaxInFlightParts = 64;
inline constexpr uint32_t kMaxRetryLimit = 100;
inline constexpr std::string_view kDefaultStorageClass = "STANDARD_IA";
inline constexpr std::string_view kObjectKeySuffix = ".tar.bs3";

// Fully resolved input of one pipeline run. Built by the CLI layer, checked
// by ValidateConfig before any stage starts.
struct PipelineConfig {
  std::filesystem::path source_path;
  std::string bucket;
  std::string key;
  std::string secret;

  uint64_t part_size_bytes{64ull * 1024 * 1024};
  uint32_t max_in_flight_parts{3};
  uint32_t retry_limit{5};
  bool progress_enabled{false};

  std::chrono::milliseconds retry_base_delay{200};
  std::chrono::milliseconds retry_max_delay{10'000};
  uint32_t cipher_segment_size{core::kDefaultSegmentSize};
  crypto::KdfParams kdf{};
  std::string storage_class{kDefaultStorageClass};
  size_t read_chunk_size{256 * 1024};
  size_t queue_depth{4};
  std::chrono::milliseconds progress_interval{1000};
};

// Throws bits3::Error (errors::kConfiguration) naming the first offending field.
void ValidateConfig(const PipelineConfig& config, const store::StoreLimits& limits);

bool IsValidStorageClass(std::string_view storage_class) noexcept;
// Storage class names are accepted in any case; this yields the store's spelling.
std::string NormalizeStorageClass(std::string_view storage_class);

// "<name>.tar.bs3" for the last component of |source|.
std::string DefaultObjectKey(const std::filesystem::path& source);

}  // namespace bits3
