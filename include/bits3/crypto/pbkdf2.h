#pragma once

#include <array>
#include <cstdint>
#include <span>

namespace bits3::crypto {

// Single-block PBKDF2 (32-byte output) over the provider's HMAC-SHA256.
std::array<uint8_t, 32> PBKDF2_HMAC_SHA256(std::span<const uint8_t> password,
                                           std::span<const uint8_t> salt,
                                           uint32_t iterations);

}  // namespace bits3::crypto
