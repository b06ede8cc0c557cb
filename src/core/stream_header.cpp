#include "bits3/core/stream_header.h"

#include <algorithm>
#include <string>

#include "bits3/common.h"
#include "bits3/error.h"

namespace bits3::core {

namespace {

[[noreturn]] void ThrowBadHeader(const std::string& why) {
  throw MakeError(errors::kAuthenticationFailed, "Invalid stream header: " + why);
}

}  // namespace

std::array<uint8_t, kStreamHeaderSize> SerializeStreamHeader(const StreamHeader& header) {
  std::array<uint8_t, kStreamHeaderSize> out{};
  std::span<uint8_t> view(out);
  std::copy(kStreamMagic.begin(), kStreamMagic.end(), out.begin());
  out[4] = header.version;
  out[5] = static_cast<uint8_t>(header.kdf.algorithm);
  out[6] = header.cipher;
  StoreBigEndian<uint32_t>(view.subspan(8), header.kdf.iterations);
  StoreBigEndian<uint32_t>(view.subspan(12), header.kdf.memory_kib);
  StoreBigEndian<uint32_t>(view.subspan(16), header.kdf.parallelism);
  StoreBigEndian<uint32_t>(view.subspan(20), header.segment_size);
  std::copy(header.salt.begin(), header.salt.end(), out.begin() + 24);
  std::copy(header.nonce_prefix.begin(), header.nonce_prefix.end(), out.begin() + 56);
  return out;
}

StreamHeader ParseStreamHeader(std::span<const uint8_t> bytes) {
  if (bytes.size() < kStreamHeaderSize) {
    ThrowBadHeader("truncated");
  }
  if (!std::equal(kStreamMagic.begin(), kStreamMagic.end(), bytes.begin())) {
    ThrowBadHeader("bad magic");
  }
  StreamHeader header;
  header.version = bytes[4];
  if (header.version != kStreamVersion) {
    ThrowBadHeader("unsupported version " + std::to_string(header.version));
  }
  switch (bytes[5]) {
    case static_cast<uint8_t>(crypto::KdfAlgorithm::kPbkdf2Sha256):
    case static_cast<uint8_t>(crypto::KdfAlgorithm::kArgon2id):
      header.kdf.algorithm = static_cast<crypto::KdfAlgorithm>(bytes[5]);
      break;
    default:
      ThrowBadHeader("unknown kdf id " + std::to_string(bytes[5]));
  }
  header.cipher = bytes[6];
  if (header.cipher != kCipherAes256Gcm) {
    ThrowBadHeader("unknown cipher id " + std::to_string(header.cipher));
  }
  header.kdf.iterations = LoadBigEndian<uint32_t>(bytes.subspan(8));
  header.kdf.memory_kib = LoadBigEndian<uint32_t>(bytes.subspan(12));
  header.kdf.parallelism = LoadBigEndian<uint32_t>(bytes.subspan(16));
  header.segment_size = LoadBigEndian<uint32_t>(bytes.subspan(20));
  if (header.segment_size < kMinSegmentSize || header.segment_size > kMaxSegmentSize) {
    ThrowBadHeader("segment size out of range");
  }
  std::copy_n(bytes.begin() + 24, kSaltSize, header.salt.begin());
  std::copy_n(bytes.begin() + 56, kNoncePrefixSize, header.nonce_prefix.begin());
  return header;
}

}  // namespace bits3::core
