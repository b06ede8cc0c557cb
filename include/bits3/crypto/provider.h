#pragma once

#include <array>
#include <memory>
#include <span>
#include <vector>

#include "bits3/crypto/aes_gcm.h"

namespace bits3::crypto {

class CryptoProvider {
public:
  virtual ~CryptoProvider() = default;

  virtual AES256_GCM::EncryptionResult EncryptAES256GCM(
      std::span<const uint8_t> plaintext,
      std::span<const uint8_t> aad,
      std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
      std::span<const uint8_t, AES256_GCM::KEY_SIZE> key) = 0;

  // Writes the plaintext into |destination| (at least ciphertext.size() bytes)
  // and returns the number of bytes written.
  virtual size_t DecryptAES256GCM(
      std::span<const uint8_t> ciphertext,
      std::span<const uint8_t> aad,
      std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
      std::span<const uint8_t, AES256_GCM::TAG_SIZE> tag,
      std::span<const uint8_t, AES256_GCM::KEY_SIZE> key,
      std::span<uint8_t> destination) = 0;

  virtual std::array<uint8_t, 32> HMACSHA256(
      std::span<const uint8_t> key,
      std::span<const uint8_t> message) = 0;

  virtual std::array<uint8_t, 32> SHA256(
      std::span<const uint8_t> data) = 0;
};

class OpenSSLCryptoProvider : public CryptoProvider {
public:
  AES256_GCM::EncryptionResult EncryptAES256GCM(
      std::span<const uint8_t> plaintext,
      std::span<const uint8_t> aad,
      std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
      std::span<const uint8_t, AES256_GCM::KEY_SIZE> key) override;

  size_t DecryptAES256GCM(
      std::span<const uint8_t> ciphertext,
      std::span<const uint8_t> aad,
      std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
      std::span<const uint8_t, AES256_GCM::TAG_SIZE> tag,
      std::span<const uint8_t, AES256_GCM::KEY_SIZE> key,
      std::span<uint8_t> destination) override;

  std::array<uint8_t, 32> HMACSHA256(
      std::span<const uint8_t> key,
      std::span<const uint8_t> message) override;

  std::array<uint8_t, 32> SHA256(
      std::span<const uint8_t> data) override;
};

std::shared_ptr<CryptoProvider> GetCryptoProviderShared();
void SetCryptoProvider(std::shared_ptr<CryptoProvider> provider);
// Runs the AES-GCM known-answer test once per process; throws on mismatch.
void EnsureCryptoProviderInitialized();

}  // namespace bits3::crypto
