#include "bits3/crypto/kdf.h"

#if defined(BITS3_HAVE_ARGON2) && BITS3_HAVE_ARGON2
#include <argon2.h>
#endif

#include <string>

#include "bits3/crypto/pbkdf2.h"
#include "bits3/error.h"

namespace bits3::crypto {

namespace {

std::array<uint8_t, 32> DeriveArgon2id(const KdfParams& params,
                                       std::span<const uint8_t> secret,
                                       std::span<const uint8_t> salt) {
#if defined(BITS3_HAVE_ARGON2) && BITS3_HAVE_ARGON2
  std::array<uint8_t, 32> output{};
  int rc = argon2id_hash_raw(params.iterations, params.memory_kib, params.parallelism,
                             secret.data(), secret.size(), salt.data(), salt.size(),
                             output.data(), output.size());
  if (rc != ARGON2_OK) {
    throw Error(ErrorDomain::Crypto, errors::kEncryptionFailure,
                std::string("Argon2id derivation failed: ") + argon2_error_message(rc), rc);
  }
  return output;
#else
  (void)params;
  (void)secret;
  (void)salt;
  throw Error(ErrorDomain::Crypto, errors::kEncryptionFailure,
              "Argon2id requested but this build has no libargon2");
#endif
}

}  // namespace

bool Argon2Available() noexcept {
#if defined(BITS3_HAVE_ARGON2) && BITS3_HAVE_ARGON2
  return true;
#else
  return false;
#endif
}

std::string_view KdfAlgorithmName(KdfAlgorithm algorithm) noexcept {
  switch (algorithm) {
    case KdfAlgorithm::kPbkdf2Sha256:
      return "pbkdf2-sha256";
    case KdfAlgorithm::kArgon2id:
      return "argon2id";
  }
  return "unknown";
}

bool ParseKdfAlgorithm(std::string_view name, KdfAlgorithm& out) noexcept {
  if (name == "pbkdf2-sha256" || name == "pbkdf2") {
    out = KdfAlgorithm::kPbkdf2Sha256;
    return true;
  }
  if (name == "argon2id") {
    out = KdfAlgorithm::kArgon2id;
    return true;
  }
  return false;
}

std::array<uint8_t, 32> DeriveKey(const KdfParams& params,
                                  std::span<const uint8_t> secret,
                                  std::span<const uint8_t> salt) {
  switch (params.algorithm) {
    case KdfAlgorithm::kPbkdf2Sha256:
      return PBKDF2_HMAC_SHA256(secret, salt, params.iterations);
    case KdfAlgorithm::kArgon2id:
      return DeriveArgon2id(params, secret, salt);
  }
  throw Error(ErrorDomain::Crypto, errors::kEncryptionFailure, "Unknown KDF algorithm");
}

}  // namespace bits3::crypto
