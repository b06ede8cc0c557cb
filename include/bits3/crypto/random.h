#pragma once

#include <cstdint>
#include <functional>
#include <span>

namespace bits3::crypto {

// Fills a buffer with random bytes. The pipeline takes one of these so tests
// can pin salts and nonce prefixes.
using RandomSource = std::function<void(std::span<uint8_t>)>;

void SystemRandomBytes(std::span<uint8_t> out);

RandomSource SystemRandomSource();

}  // namespace bits3::crypto
