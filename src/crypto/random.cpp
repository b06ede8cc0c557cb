#include "bits3/crypto/random.h"

#include <openssl/rand.h>

#include <cerrno>

#if defined(__linux__)
#include <sys/random.h>
#endif

#include "bits3/error.h"

namespace bits3::crypto {

void SystemRandomBytes(std::span<uint8_t> out) {
  if (out.empty()) {
    return;
  }
#if defined(__linux__)
  size_t offset = 0;
  while (offset < out.size()) {
    ssize_t result = ::getrandom(out.data() + offset, out.size() - offset, 0);
    if (result < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;  // fall back to the OpenSSL DRBG below
    }
    offset += static_cast<size_t>(result);
  }
  if (offset == out.size()) {
    return;
  }
  out = out.subspan(offset);
#endif
  if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
    throw Error(ErrorDomain::Crypto, errors::kEncryptionFailure,
                "RAND_bytes failed to produce random data");
  }
}

RandomSource SystemRandomSource() {
  return [](std::span<uint8_t> out) { SystemRandomBytes(out); };
}

}  // namespace bits3::crypto
