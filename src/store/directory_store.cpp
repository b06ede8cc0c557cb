#include "bits3/store/directory_store.h"

#include <sys/stat.h>

#include <array>
#include <chrono>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

#include "bits3/common.h"
#include "bits3/crypto/random.h"
#include "bits3/crypto/sha256.h"
#include "bits3/orchestrator/event_bus.h"
#include "bits3/store/io_util.h"

namespace bits3::store {

namespace {

constexpr const char* kStagingDir = ".multipart";
constexpr const char* kTargetFile = "target";

[[noreturn]] void ThrowFilesystem(const std::string& what, const std::error_code& ec) {
  throw StoreRequestError(what + ": " + ec.message(), ClassifyNativeError(ec.value()), ec.value());
}

bool IsSafeName(const std::string& name) {
  if (name.empty() || name.front() == '/') {
    return false;
  }
  for (const auto& component : std::filesystem::path(name)) {
    if (component == ".." || component == "." || component == kStagingDir) {
      return false;
    }
  }
  return true;
}

std::string PartFileName(uint32_t sequence) {
  // Zero padded so a directory listing sorts in sequence order.
  auto digits = std::to_string(sequence);
  return "part-" + std::string(digits.size() < 5 ? 5 - digits.size() : 0, '0') + digits;
}

// Upload ids are "<bucket>/<hex>" so abort and complete find their staging
// directory without extra state.
bool SplitUploadId(const std::string& upload_id, std::string& bucket, std::string& token) {
  auto slash = upload_id.rfind('/');
  if (slash == std::string::npos || slash == 0 || slash + 1 == upload_id.size()) {
    return false;
  }
  bucket = upload_id.substr(0, slash);
  token = upload_id.substr(slash + 1);
  return IsSafeName(bucket) && token.find_first_not_of("0123456789abcdef") == std::string::npos;
}

std::string ReadTarget(const std::filesystem::path& staging) {
  std::ifstream in(staging / kTargetFile, std::ios::binary);
  if (!in) {
    throw StoreRequestError("upload staging is missing its target", Retryability::kFatal);
  }
  std::string key((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  return key;
}

}  // namespace

DirectoryObjectStore::DirectoryObjectStore(std::filesystem::path root, StoreLimits limits)
    : root_(std::move(root)), limits_(limits) {}

std::filesystem::path DirectoryObjectStore::BucketPath(const std::string& bucket) const {
  if (!IsSafeName(bucket)) {
    throw StoreRequestError("invalid bucket name '" + bucket + "'", Retryability::kFatal);
  }
  return root_ / bucket;
}

std::filesystem::path DirectoryObjectStore::StagingPath(const std::string& upload_id) const {
  std::string bucket;
  std::string token;
  if (!SplitUploadId(upload_id, bucket, token)) {
    throw StoreRequestError("malformed upload id '" + upload_id + "'", Retryability::kFatal);
  }
  return BucketPath(bucket) / kStagingDir / token;
}

void DirectoryObjectStore::CheckBucket(const std::string& bucket) {
  std::error_code ec;
  auto path = BucketPath(bucket);
  if (!std::filesystem::is_directory(path, ec)) {
    throw StoreRequestError("bucket " + bucket + " does not exist under " +
                                PathToUtf8String(root_),
                            Retryability::kFatal, ec ? std::optional<int>(ec.value()) : std::nullopt);
  }
}

std::string DirectoryObjectStore::OpenMultipartUpload(const std::string& bucket,
                                                      const std::string& key,
                                                      const std::string& storage_class) {
  (void)storage_class;
  CheckBucket(bucket);
  if (!IsSafeName(key)) {
    throw StoreRequestError("invalid object key '" + key + "'", Retryability::kFatal);
  }
  std::array<uint8_t, 16> token{};
  crypto::SystemRandomBytes(token);
  const auto upload_id = bucket + "/" + ToHex(token);
  const auto staging = StagingPath(upload_id);

  std::error_code ec;
  std::filesystem::create_directories(staging, ec);
  if (ec) {
    ThrowFilesystem("cannot create staging directory " + PathToUtf8String(staging), ec);
  }
  AtomicWriteFile(staging / kTargetFile, AsBytes(key));
  return upload_id;
}

std::string DirectoryObjectStore::UploadPart(const std::string& upload_id, uint32_t sequence,
                                             std::span<const uint8_t> bytes,
                                             const crypto::Sha256Digest& digest) {
  if (crypto::SHA256_Hash(bytes) != digest) {
    throw StoreRequestError("part " + std::to_string(sequence) + " digest mismatch",
                            Retryability::kFatal);
  }
  const auto staging = StagingPath(upload_id);
  std::error_code ec;
  if (!std::filesystem::is_directory(staging, ec)) {
    throw StoreRequestError("no such upload " + upload_id, Retryability::kFatal);
  }
  AtomicWriteFile(staging / PartFileName(sequence), bytes);
  return ToHex(std::span<const uint8_t>(digest).first(16));
}

void DirectoryObjectStore::CompleteMultipartUpload(const std::string& upload_id,
                                                   const std::vector<CompletedPart>& parts) {
  const auto staging = StagingPath(upload_id);
  std::error_code ec;
  if (!std::filesystem::is_directory(staging, ec)) {
    throw StoreRequestError("no such upload " + upload_id, Retryability::kFatal);
  }
  if (parts.empty()) {
    throw StoreRequestError("completion needs at least one part", Retryability::kFatal);
  }

  std::vector<std::filesystem::path> sources;
  sources.reserve(parts.size());
  uint32_t previous = 0;
  for (size_t i = 0; i < parts.size(); ++i) {
    const auto& part = parts[i];
    if (part.sequence <= previous) {
      throw StoreRequestError("parts not in ascending order", Retryability::kFatal);
    }
    previous = part.sequence;
    auto path = staging / PartFileName(part.sequence);
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
      throw StoreRequestError("part " + std::to_string(part.sequence) + " was never uploaded",
                              Retryability::kFatal);
    }
    if (i + 1 < parts.size() && size < limits_.min_part_size) {
      throw StoreRequestError("part " + std::to_string(part.sequence) + " below minimum size",
                              Retryability::kFatal);
    }
    sources.push_back(std::move(path));
  }

  // staging is <bucket>/.multipart/<token>
  const auto target = staging.parent_path().parent_path() / ReadTarget(staging);
  std::filesystem::create_directories(target.parent_path(), ec);
  if (ec) {
    ThrowFilesystem("cannot create " + PathToUtf8String(target.parent_path()), ec);
  }
  AtomicConcatenate(target, sources);

  // The object is durable now; leftover staging only costs disk space.
  std::string cleanup_error;
  try {
    if (hooks_.before_cleanup) {
      hooks_.before_cleanup(staging);
    }
    std::filesystem::remove_all(staging, ec);
    if (ec) {
      cleanup_error = ec.message();
    }
  } catch (const std::exception& e) {
    cleanup_error = e.what();
  }
  if (!cleanup_error.empty()) {
    orchestrator::PublishEvent(orchestrator::EventCategory::kDiagnostics,
                               orchestrator::EventSeverity::kWarning, "store.cleanup_failed",
                               "Completed upload left its staging directory behind",
                               {orchestrator::EventField("upload_id", upload_id),
                                orchestrator::EventField("staging", PathToUtf8String(staging)),
                                orchestrator::EventField("cause", cleanup_error)});
  }
}

void DirectoryObjectStore::AbortMultipartUpload(const std::string& upload_id) {
  const auto staging = StagingPath(upload_id);
  std::error_code ec;
  std::filesystem::remove_all(staging, ec);
  if (ec) {
    ThrowFilesystem("cannot remove staging directory " + PathToUtf8String(staging), ec);
  }
}

std::vector<ObjectInfo> DirectoryObjectStore::ListObjects(const std::string& bucket) {
  CheckBucket(bucket);
  const auto base = BucketPath(bucket);
  std::vector<ObjectInfo> out;
  std::error_code ec;
  std::filesystem::recursive_directory_iterator it(base, ec);
  if (ec) {
    ThrowFilesystem("cannot list " + PathToUtf8String(base), ec);
  }
  std::filesystem::recursive_directory_iterator end;
  for (; it != end; it.increment(ec)) {
    if (ec) {
      ThrowFilesystem("cannot list " + PathToUtf8String(base), ec);
    }
    if (it->path().filename() == kStagingDir) {
      it.disable_recursion_pending();
      continue;
    }
    struct stat st {};
    if (::lstat(it->path().c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
      continue;
    }
    ObjectInfo info;
    info.key = it->path().lexically_relative(base).generic_string();
    info.size = static_cast<uint64_t>(st.st_size);
    info.last_modified = std::chrono::system_clock::from_time_t(st.st_mtime);
    out.push_back(std::move(info));
  }
  if (ec) {
    ThrowFilesystem("cannot list " + PathToUtf8String(base), ec);
  }
  return out;
}

void DirectoryObjectStore::DeleteObject(const std::string& bucket, const std::string& key) {
  if (!IsSafeName(key)) {
    throw StoreRequestError("invalid object key '" + key + "'", Retryability::kFatal);
  }
  std::error_code ec;
  std::filesystem::remove(BucketPath(bucket) / key, ec);
  if (ec) {
    ThrowFilesystem("cannot delete " + key, ec);
  }
}

}  // namespace bits3::store
