#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

#include "bits3/crypto/sha256.h"

namespace bits3::pipeline {

enum class PartStatus : uint8_t { kPending, kUploading, kUploaded, kFailed };

std::string_view PartStatusName(PartStatus status) noexcept;

// A sealed slice of the encrypted stream. The buffer is shared and immutable,
// so a retried upload resends exactly the bytes of the first attempt.
struct Part {
  uint32_t sequence{0};
  std::shared_ptr<const std::vector<uint8_t>> bytes;
  crypto::Sha256Digest digest{};

  size_t size() const noexcept { return bytes ? bytes->size() : 0; }
  std::span<const uint8_t> view() const noexcept {
    return bytes ? std::span<const uint8_t>(*bytes) : std::span<const uint8_t>();
  }
};

// Cuts the ciphertext stream into parts of exactly |part_size| bytes; only
// the last part may be shorter, and an empty last part is never emitted.
// |on_part_start| runs before the first byte of each part is buffered and may
// block; the upload stage uses it to hold the stream until a slot is free.
class Chunker {
public:
  using PartSink = std::function<void(Part)>;
  using PartStart = std::function<void()>;

  Chunker(uint64_t part_size, PartSink sink, PartStart on_part_start = {});

  void Append(std::span<const uint8_t> bytes);
  // Emits the trailing partial part, if any. Further calls are errors.
  void Finish();

  uint32_t parts_emitted() const noexcept { return next_sequence_ - 1; }
  uint64_t bytes_consumed() const noexcept { return bytes_consumed_; }

private:
  void Seal();

  uint64_t part_size_;
  PartSink sink_;
  PartStart on_part_start_;
  std::vector<uint8_t> current_;
  uint32_t next_sequence_{1};
  uint64_t bytes_consumed_{0};
  bool finished_{false};
};

}  // namespace bits3::pipeline
