#include "bits3/crypto/pbkdf2.h"

#include <algorithm>
#include <vector>

#include "bits3/common.h"
#include "bits3/crypto/hmac_sha256.h"
#include "bits3/security/zeroizer.h"

namespace bits3::crypto {

std::array<uint8_t, 32> PBKDF2_HMAC_SHA256(std::span<const uint8_t> password,
                                           std::span<const uint8_t> salt,
                                           uint32_t iterations) {
  iterations = std::max<uint32_t>(iterations, 1u);

  std::array<uint8_t, 32> output{};
  security::Zeroizer::ScopeWiper<uint8_t> output_guard(output.data(), output.size());

  // U1 = PRF(P, S || INT(1))
  std::vector<uint8_t> block(salt.begin(), salt.end());
  block.resize(salt.size() + 4u, 0);
  StoreBigEndian<uint32_t>(std::span<uint8_t>(block).subspan(salt.size()), 1u);

  auto u = HMAC_SHA256::Compute(password, block);
  security::Zeroizer::ScopeWiper<uint8_t> u_guard(u.data(), u.size());
  output = u;

  for (uint32_t i = 1; i < iterations; ++i) {
    u = HMAC_SHA256::Compute(password, u);
    for (size_t j = 0; j < output.size(); ++j) {
      output[j] ^= u[j];
    }
  }

  output_guard.Release();
  return output;
}

}  // namespace bits3::crypto
