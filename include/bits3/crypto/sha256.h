#pragma once
#include <array>
#include <cstdint>
#include <span>

namespace bits3::crypto {

using Sha256Digest = std::array<uint8_t, 32>;

Sha256Digest SHA256_Hash(std::span<const uint8_t> data);

}  // namespace bits3::crypto
