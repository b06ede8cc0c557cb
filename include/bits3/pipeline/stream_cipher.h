#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "bits3/core/stream_header.h"
#include "bits3/crypto/aes_gcm.h"
#include "bits3/crypto/kdf.h"
#include "bits3/crypto/random.h"

namespace bits3::pipeline {

// Encrypted length of |plaintext_bytes| including the stream header.
uint64_t EstimateEncryptedSize(uint64_t plaintext_bytes, uint32_t segment_size);

// Segmented AES-256-GCM encryption of an unbounded byte stream.
//
// Begin() derives the key and returns the serialized header. Update() may be
// fed arbitrary chunk sizes; it seals a segment only once it knows another
// byte follows, so the last segment can carry the final flag. Finalize()
// seals that last segment, which is empty when the input was empty.
class StreamEncryptor {
public:
  StreamEncryptor(std::string_view secret, const crypto::KdfParams& kdf, uint32_t segment_size,
                  const crypto::RandomSource& random);
  ~StreamEncryptor();

  StreamEncryptor(const StreamEncryptor&) = delete;
  StreamEncryptor& operator=(const StreamEncryptor&) = delete;

  std::array<uint8_t, core::kStreamHeaderSize> Begin();
  void Update(std::span<const uint8_t> plaintext, std::vector<uint8_t>& out);
  void Finalize(std::vector<uint8_t>& out);

  uint64_t plaintext_bytes() const noexcept { return plaintext_bytes_; }
  uint64_t segments_sealed() const noexcept { return segments_sealed_; }

private:
  void Seal(std::span<const uint8_t> segment, bool final_segment, std::vector<uint8_t>& out);
  void EnsureState(bool expect_started) const;

  std::vector<uint8_t> secret_;
  core::StreamHeader header_{};
  std::array<uint8_t, core::kStreamHeaderSize> header_bytes_{};
  std::array<uint8_t, crypto::AES256_GCM::KEY_SIZE> key_{};
  std::vector<uint8_t> pending_;
  uint64_t plaintext_bytes_{0};
  uint64_t segments_sealed_{0};
  bool started_{false};
  bool finalized_{false};
};

// Inverse of StreamEncryptor. Reads the header from the stream itself, so
// only the secret is needed. Any tampering, reordering or truncation raises
// errors::kAuthenticationFailed.
class StreamDecryptor {
public:
  explicit StreamDecryptor(std::string_view secret);
  ~StreamDecryptor();

  StreamDecryptor(const StreamDecryptor&) = delete;
  StreamDecryptor& operator=(const StreamDecryptor&) = delete;

  void Update(std::span<const uint8_t> ciphertext, std::vector<uint8_t>& out);
  void Finalize(std::vector<uint8_t>& out);

  const core::StreamHeader& header() const noexcept { return header_; }

private:
  void Open(std::span<const uint8_t> record, bool final_segment, std::vector<uint8_t>& out);
  size_t RecordSize() const noexcept {
    return static_cast<size_t>(header_.segment_size) + crypto::AES256_GCM::TAG_SIZE;
  }

  std::vector<uint8_t> secret_;
  core::StreamHeader header_{};
  std::array<uint8_t, core::kStreamHeaderSize> header_bytes_{};
  std::array<uint8_t, crypto::AES256_GCM::KEY_SIZE> key_{};
  std::vector<uint8_t> pending_;
  uint64_t segments_opened_{0};
  bool have_header_{false};
  bool finalized_{false};
};

}  // namespace bits3::pipeline
