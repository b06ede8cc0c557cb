#include "bits3/security/zeroizer.h"

#include <openssl/crypto.h>

#include <atomic>

namespace bits3::security {

void Zeroizer::Wipe(std::span<uint8_t> data) noexcept {
  if (data.empty()) {
    return;
  }
  OPENSSL_cleanse(data.data(), data.size());
  std::atomic_thread_fence(std::memory_order_seq_cst);
}

void Zeroizer::WipeString(std::string& text) noexcept {
  if (text.capacity() == 0) {
    return;
  }
  text.resize(text.capacity());
  Wipe(std::span<uint8_t>(reinterpret_cast<uint8_t*>(text.data()), text.size()));
  text.clear();
}

}  // namespace bits3::security
