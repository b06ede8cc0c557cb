#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bits3 {
  enum class ErrorDomain : std::uint16_t {
    Security = 0x01,
    IO = 0x02,
    Crypto = 0x03,
    Validation = 0x04,
    Config = 0x05,
    Store = 0x06,
    State = 0x07,
    Internal = 0x7F
  };

  // Each domain reserves a span of codes so collaborator error numbers can be
  // carried in native_code without colliding with ours.
  inline constexpr int kErrorDomainSpan = 0x0100;

  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    switch (domain) {
    case ErrorDomain::Security:
      return 0x0100;
    case ErrorDomain::IO:
      return 0x0200;
    case ErrorDomain::Crypto:
      return 0x0300;
    case ErrorDomain::Validation:
      return 0x0400;
    case ErrorDomain::Config:
      return 0x0500;
    case ErrorDomain::Store:
      return 0x0600;
    case ErrorDomain::State:
      return 0x0700;
    case ErrorDomain::Internal:
      return 0x7F00;
    }
    return 0; // unreachable but placates compilers without warnings enabled
  }

  inline constexpr int ErrorDomainMax(ErrorDomain domain) {
    return ErrorDomainBase(domain) + kErrorDomainSpan - 1;
  }

  inline constexpr bool IsFrameworkErrorCode(ErrorDomain domain, int code) {
    return code >= ErrorDomainBase(domain) && code <= ErrorDomainMax(domain);
  }

  enum class Retryability : std::uint8_t {
    kFatal = 0,
    kTransient,
    kRetryable
  };

  namespace errors {
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    // Run-level taxonomy. These are the kinds a run can end with.
    inline constexpr int kConfiguration = Make(ErrorDomain::Config, 0x01);
    inline constexpr int kSourceUnreadable = Make(ErrorDomain::IO, 0x01);
    inline constexpr int kPartialRead = Make(ErrorDomain::IO, 0x02);
    inline constexpr int kEncryptionFailure = Make(ErrorDomain::Crypto, 0x01);
    inline constexpr int kAuthenticationFailed = Make(ErrorDomain::Crypto, 0x02);
    inline constexpr int kSessionOpenFailure = Make(ErrorDomain::Store, 0x01);
    inline constexpr int kPartUploadFailure = Make(ErrorDomain::Store, 0x02);
    inline constexpr int kCompletionFailure = Make(ErrorDomain::Store, 0x03);
    inline constexpr int kCancelled = Make(ErrorDomain::State, 0x01);

    // Raw failure reported by a store collaborator before the coordinator
    // classifies it into one of the kinds above.
    inline constexpr int kStoreRequestFailed = Make(ErrorDomain::Store, 0x10);
    inline constexpr int kInternal = Make(ErrorDomain::Internal, 0x01);
  } // namespace errors

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    int code;
    std::optional<int> native_code;
    Retryability retryability{Retryability::kFatal};
    std::vector<std::string> context;
    explicit Error(ErrorDomain d, int c, std::string msg,
                   std::optional<int> native = std::nullopt,
                   Retryability retry = Retryability::kFatal,
                   std::vector<std::string> ctx = {})
        : std::runtime_error(std::move(msg)),
          domain(d),
          code(c),
          native_code(native),
          retryability(retry),
          context(std::move(ctx)) {}

    bool Retryable() const noexcept { return retryability != Retryability::kFatal; }
  };

  // Stable taxonomy name for a code, e.g. "PartUploadFailure".
  std::string_view ErrorKindName(int code) noexcept;

  // "<kind>: <message> [ctx1, ctx2]" for user-facing reports.
  std::string DescribeError(const Error& err);

  Error MakeError(int code, std::string message,
                  Retryability retry = Retryability::kFatal,
                  std::vector<std::string> context = {});

  // Re-labels |cause| as |code|, keeping its message and context and
  // appending |context_entry|.
  Error Reclassify(const Error& cause, int code, std::string context_entry);
} // namespace bits3
