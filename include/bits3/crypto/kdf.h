#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string_view>

namespace bits3::crypto {

enum class KdfAlgorithm : uint8_t {
  kPbkdf2Sha256 = 1,
  kArgon2id = 2,
};

// |iterations| is the PBKDF2 round count, or the Argon2id time cost.
// |memory_kib| and |parallelism| only apply to Argon2id.
struct KdfParams {
  KdfAlgorithm algorithm{KdfAlgorithm::kPbkdf2Sha256};
  uint32_t iterations{600'000};
  uint32_t memory_kib{64 * 1024};
  uint32_t parallelism{1};
};

inline constexpr uint32_t kMinPbkdf2Iterations = 100'000;
inline constexpr uint32_t kMinArgon2TimeCost = 1;
inline constexpr uint32_t kMinArgon2MemoryKib = 8 * 1024;

bool Argon2Available() noexcept;

std::string_view KdfAlgorithmName(KdfAlgorithm algorithm) noexcept;
// Accepts "pbkdf2-sha256" and "argon2id"; returns false otherwise.
bool ParseKdfAlgorithm(std::string_view name, KdfAlgorithm& out) noexcept;

// Derives a 32-byte AES key from |secret| and |salt|. Throws bits3::Error
// (errors::kEncryptionFailure) when the algorithm fails or is unavailable.
std::array<uint8_t, 32> DeriveKey(const KdfParams& params,
                                  std::span<const uint8_t> secret,
                                  std::span<const uint8_t> salt);

}  // namespace bits3::crypto
