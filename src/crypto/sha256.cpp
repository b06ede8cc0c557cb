#include "bits3/crypto/sha256.h"

#include "bits3/crypto/provider.h"

namespace bits3::crypto {

Sha256Digest SHA256_Hash(std::span<const uint8_t> data) {
  auto provider = GetCryptoProviderShared();
  return provider->SHA256(data);
}

}  // namespace bits3::crypto
