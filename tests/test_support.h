#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "bits3/config.h"
#include "bits3/crypto/random.h"

namespace bits3::testing {

class TempDir {
public:
  explicit TempDir(std::string_view tag) {
    static std::atomic<uint64_t> counter{0};
    auto base = std::filesystem::temp_directory_path();
    auto name = "bits3_" + std::string(tag) + "_" +
                std::to_string(static_cast<unsigned long long>(
                    std::chrono::steady_clock::now().time_since_epoch().count())) +
                "_" + std::to_string(counter.fetch_add(1));
    path_ = base / name;
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const noexcept { return path_; }

private:
  std::filesystem::path path_;
};

inline void WriteFile(const std::filesystem::path& path, std::string_view content) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
}

inline std::vector<uint8_t> ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Deterministic filler for salts and nonce prefixes.
inline crypto::RandomSource CountingRandom(uint8_t seed = 1) {
  return [seed](std::span<uint8_t> out) {
    uint8_t value = seed;
    for (auto& b : out) {
      b = value++;
    }
  };
}

inline std::vector<uint8_t> PatternBytes(size_t size, uint8_t seed = 0) {
  std::vector<uint8_t> out(size);
  uint32_t state = 0x9E3779B9u ^ seed;
  for (auto& b : out) {
    state = state * 1664525u + 1013904223u;
    b = static_cast<uint8_t>(state >> 24);
  }
  return out;
}

// Smallest settings the validator accepts, so tests run quickly.
inline PipelineConfig FastConfig(const std::filesystem::path& source) {
  PipelineConfig config;
  config.source_path = source;
  config.bucket = "backups";
  config.key = DefaultObjectKey(source);
  config.secret = "correct horse battery staple";
  config.part_size_bytes = 64 * 1024;
  config.max_in_flight_parts = 2;
  config.retry_limit = 3;
  config.retry_base_delay = std::chrono::milliseconds(1);
  config.retry_max_delay = std::chrono::milliseconds(5);
  config.cipher_segment_size = 4 * 1024;
  config.kdf.iterations = crypto::kMinPbkdf2Iterations;
  config.read_chunk_size = 8 * 1024;
  config.queue_depth = 2;
  return config;
}

}  // namespace bits3::testing
