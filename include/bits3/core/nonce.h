#pragma once

#include <array>
#include <cstdint>
#include <limits>
#include <span>

#include "bits3/core/stream_header.h"
#include "bits3/crypto/aes_gcm.h"

namespace bits3::core {

inline constexpr uint64_t kMaxSegments = std::numeric_limits<uint32_t>::max();

// prefix(7) || counter(4, big-endian) || final(1)
std::array<uint8_t, crypto::AES256_GCM::NONCE_SIZE> MakeSegmentNonce(
    std::span<const uint8_t, kNoncePrefixSize> prefix, uint32_t counter, bool final_segment);

}  // namespace bits3::core
