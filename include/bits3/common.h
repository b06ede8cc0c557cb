#pragma once
#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>

namespace bits3 {
namespace detail {
template <class T>
[[nodiscard]] constexpr T ManualByteSwap(T value) noexcept {
  static_assert(std::is_trivially_copyable_v<T>, "ManualByteSwap requires trivially copyable types");
  auto source = std::bit_cast<std::array<std::uint8_t, sizeof(T)>>(value);
  std::array<std::uint8_t, sizeof(T)> reversed{};
  for (std::size_t i = 0; i < source.size(); ++i) {
    reversed[i] = source[source.size() - 1U - i];
  }
  return std::bit_cast<T>(reversed);
}
}  // namespace detail

inline constexpr bool kIsLittleEndian = std::endian::native == std::endian::little;

template <class T>
  requires std::is_unsigned_v<T>
inline constexpr T ToBigEndian(T value) noexcept {
  return kIsLittleEndian ? detail::ManualByteSwap(value) : value;
}

template <class T>
  requires std::is_unsigned_v<T>
inline void StoreBigEndian(std::span<std::uint8_t> out, T value) noexcept {
  for (std::size_t i = 0; i < sizeof(T); ++i) {
    out[i] = static_cast<std::uint8_t>(value >> (8U * (sizeof(T) - 1U - i)));
  }
}

template <class T>
  requires std::is_unsigned_v<T>
[[nodiscard]] inline T LoadBigEndian(std::span<const std::uint8_t> in) noexcept {
  T value = 0;
  for (std::size_t i = 0; i < sizeof(T); ++i) {
    value = static_cast<T>((value << 8U) | in[i]);
  }
  return value;
}

inline std::string ToHex(std::span<const std::uint8_t> bytes) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (auto b : bytes) {
    out.push_back(kDigits[b >> 4]);
    out.push_back(kDigits[b & 0x0F]);
  }
  return out;
}

inline std::span<const std::uint8_t> AsBytes(std::string_view text) noexcept {
  return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}

inline std::string PathToUtf8String(const std::filesystem::path& path) {
  return path.generic_string();
}
}  // namespace bits3
