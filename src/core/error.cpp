#include "bits3/error.h"

#include <sstream>

namespace bits3 {

namespace {

ErrorDomain DomainForCode(int code) {
  for (auto domain : {ErrorDomain::Security, ErrorDomain::IO, ErrorDomain::Crypto,
                      ErrorDomain::Validation, ErrorDomain::Config, ErrorDomain::Store,
                      ErrorDomain::State}) {
    if (IsFrameworkErrorCode(domain, code)) {
      return domain;
    }
  }
  return ErrorDomain::Internal;
}

}  // namespace

std::string_view ErrorKindName(int code) noexcept {
  switch (code) {
    case errors::kConfiguration:
      return "ConfigurationError";
    case errors::kSourceUnreadable:
      return "SourceUnreadable";
    case errors::kPartialRead:
      return "PartialReadError";
    case errors::kEncryptionFailure:
      return "EncryptionFailure";
    case errors::kAuthenticationFailed:
      return "AuthenticationFailed";
    case errors::kSessionOpenFailure:
      return "SessionOpenFailure";
    case errors::kPartUploadFailure:
      return "PartUploadFailure";
    case errors::kCompletionFailure:
      return "CompletionFailure";
    case errors::kCancelled:
      return "Cancelled";
    case errors::kStoreRequestFailed:
      return "StoreRequestFailed";
    default:
      return "InternalError";
  }
}

std::string DescribeError(const Error& err) {
  std::ostringstream oss;
  oss << ErrorKindName(err.code) << ": " << err.what();
  if (err.native_code) {
    oss << " (native " << *err.native_code << ")";
  }
  if (!err.context.empty()) {
    oss << " [";
    for (size_t i = 0; i < err.context.size(); ++i) {
      if (i != 0) {
        oss << ", ";
      }
      oss << err.context[i];
    }
    oss << "]";
  }
  return oss.str();
}

Error MakeError(int code, std::string message, Retryability retry,
                std::vector<std::string> context) {
  return Error{DomainForCode(code), code, std::move(message), std::nullopt, retry,
               std::move(context)};
}

Error Reclassify(const Error& cause, int code, std::string context_entry) {
  auto context = cause.context;
  context.push_back(std::move(context_entry));
  return Error{DomainForCode(code), code, cause.what(), cause.native_code,
               Retryability::kFatal, std::move(context)};
}

}  // namespace bits3
