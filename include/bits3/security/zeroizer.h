#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace bits3::security {

class Zeroizer {
public:
  static void Wipe(std::span<uint8_t> data) noexcept;

  template <typename T>
  static void WipeVector(std::vector<T>& vec) noexcept {
    if (vec.empty()) {
      return;
    }
    const std::size_t bytes = vec.size() * sizeof(T);
    Wipe(std::span<uint8_t>(reinterpret_cast<uint8_t*>(vec.data()), bytes));
  }

  // Wipes the whole capacity, not just size(), since short strings may have
  // been reallocated while being built.
  static void WipeString(std::string& text) noexcept;

  template <typename T>
  class ScopeWiper {
  public:
    explicit ScopeWiper(std::span<T> span) noexcept : span_(span) {}
    ScopeWiper(T* ptr, std::size_t count) noexcept : ScopeWiper(std::span<T>(ptr, count)) {}

    ScopeWiper(const ScopeWiper&) = delete;
    ScopeWiper& operator=(const ScopeWiper&) = delete;

    ~ScopeWiper() noexcept {
      if (span_.empty()) {
        return;
      }
      Zeroizer::Wipe(std::span<uint8_t>(reinterpret_cast<uint8_t*>(span_.data()),
                                        span_.size_bytes()));
    }

    // Keeps the data; used when the buffer is handed back to the caller.
    void Release() noexcept { span_ = {}; }

  private:
    std::span<T> span_;
  };
};

}  // namespace bits3::security
