#include "bits3/core/nonce.h"

#include <algorithm>

#include "bits3/common.h"

namespace bits3::core {

std::array<uint8_t, crypto::AES256_GCM::NONCE_SIZE> MakeSegmentNonce(
    std::span<const uint8_t, kNoncePrefixSize> prefix, uint32_t counter, bool final_segment) {
  std::array<uint8_t, crypto::AES256_GCM::NONCE_SIZE> nonce{};
  std::copy(prefix.begin(), prefix.end(), nonce.begin());
  StoreBigEndian<uint32_t>(std::span<uint8_t>(nonce).subspan(kNoncePrefixSize, 4), counter);
  nonce[nonce.size() - 1] = final_segment ? 1 : 0;
  return nonce;
}

}  // namespace bits3::core
