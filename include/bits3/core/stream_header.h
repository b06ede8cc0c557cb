#pragma once

#include <array>
#include <cstdint>
#include <span>

#include "bits3/crypto/kdf.h"

namespace bits3::core {

// Fixed-size header prefixed to every encrypted object. The serialized bytes
// are bound into each segment as associated data.
//
//   0  magic "BS3E"         24 salt[32]
//   4  version              56 nonce_prefix[7]
//   5  kdf id               63 reserved
//   6  cipher id
//   7  reserved
//   8  kdf iterations   (u32 BE)
//  12  kdf memory KiB   (u32 BE)
//  16  kdf parallelism  (u32 BE)
//  20  segment size     (u32 BE)
inline constexpr size_t kStreamHeaderSize = 64;
inline constexpr size_t kSaltSize = 32;
inline constexpr size_t kNoncePrefixSize = 7;
inline constexpr std::array<uint8_t, 4> kStreamMagic{'B', 'S', '3', 'E'};
inline constexpr uint8_t kStreamVersion = 1;
inline constexpr uint8_t kCipherAes256Gcm = 1;

inline constexpr uint32_t kDefaultSegmentSize = 64 * 1024;
inline constexpr uint32_t kMinSegmentSize = 4 * 1024;
inline constexpr uint32_t kMaxSegmentSize = 16 * 1024 * 1024;

struct StreamHeader {
  uint8_t version{kStreamVersion};
  uint8_t cipher{kCipherAes256Gcm};
  crypto::KdfParams kdf{};
  uint32_t segment_size{kDefaultSegmentSize};
  std::array<uint8_t, kSaltSize> salt{};
  std::array<uint8_t, kNoncePrefixSize> nonce_prefix{};
};

std::array<uint8_t, kStreamHeaderSize> SerializeStreamHeader(const StreamHeader& header);

// Throws bits3::Error (errors::kAuthenticationFailed) on a malformed or
// unsupported header.
StreamHeader ParseStreamHeader(std::span<const uint8_t> bytes);

}  // namespace bits3::core
