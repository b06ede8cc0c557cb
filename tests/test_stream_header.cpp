#include "bits3/core/nonce.h"
#include "bits3/core/stream_header.h"
#include "bits3/error.h"

#include <array>
#include <cassert>
#include <cstdint>
#include <iostream>

namespace {

bool RejectsHeader(std::span<const uint8_t> bytes) {
  try {
    (void)bits3::core::ParseStreamHeader(bytes);
  } catch (const bits3::Error& e) {
    return e.code == bits3::errors::kAuthenticationFailed;
  }
  return false;
}

}  // namespace

int main() {
  using namespace bits3;

  core::StreamHeader header;
  header.kdf.algorithm = crypto::KdfAlgorithm::kArgon2id;
  header.kdf.iterations = 3;
  header.kdf.memory_kib = 65536;
  header.kdf.parallelism = 4;
  header.segment_size = 128 * 1024;
  for (size_t i = 0; i < header.salt.size(); ++i) {
    header.salt[i] = static_cast<uint8_t>(0xA0 + i);
  }
  header.nonce_prefix = {1, 2, 3, 4, 5, 6, 7};

  auto bytes = core::SerializeStreamHeader(header);
  assert(bytes.size() == 64);
  assert(bytes[0] == 'B' && bytes[1] == 'S' && bytes[2] == '3' && bytes[3] == 'E');
  assert(bytes[4] == 1 && bytes[5] == 2 && bytes[6] == 1);
  // segment size is big-endian at offset 20
  assert(bytes[20] == 0x00 && bytes[21] == 0x02 && bytes[22] == 0x00 && bytes[23] == 0x00);
  assert(bytes[24] == 0xA0 && bytes[55] == 0xA0 + 31);
  assert(bytes[56] == 1 && bytes[62] == 7 && bytes[63] == 0);

  auto parsed = core::ParseStreamHeader(bytes);
  assert(parsed.kdf.algorithm == crypto::KdfAlgorithm::kArgon2id);
  assert(parsed.kdf.iterations == 3 && parsed.kdf.memory_kib == 65536 &&
         parsed.kdf.parallelism == 4);
  assert(parsed.segment_size == header.segment_size);
  assert(parsed.salt == header.salt && parsed.nonce_prefix == header.nonce_prefix);

  assert(RejectsHeader(std::span<const uint8_t>(bytes).first(63)));
  auto bad = bytes;
  bad[0] = 'X';
  assert(RejectsHeader(bad));
  bad = bytes;
  bad[4] = 2;
  assert(RejectsHeader(bad) && "unknown versions are refused");
  bad = bytes;
  bad[5] = 9;
  assert(RejectsHeader(bad));
  bad = bytes;
  bad[20] = 0x7F;
  assert(RejectsHeader(bad) && "segment size must be in range");

  auto nonce = core::MakeSegmentNonce(header.nonce_prefix, 0x01020304u, false);
  const std::array<uint8_t, 12> expected{1, 2, 3, 4, 5, 6, 7, 0x01, 0x02, 0x03, 0x04, 0x00};
  assert(nonce == expected);
  auto last = core::MakeSegmentNonce(header.nonce_prefix, 0x01020304u, true);
  assert(last[11] == 1 && "final flag occupies the last byte");

  std::cout << "stream header tests ok\n";
  return 0;
}
