#include "bits3/store/io_util.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <utility>
#include <vector>

#include "bits3/common.h"
#include "bits3/crypto/random.h"

namespace bits3::store {

namespace {

constexpr const char* kAtomicWriteErrorMessage = "Atomic file write failed";

[[noreturn]] void ThrowIoError(const std::string& what, const std::filesystem::path& path, int err) {
  throw Error(ErrorDomain::Store, errors::kStoreRequestFailed,
              std::string(kAtomicWriteErrorMessage) + ": " + what + " " + PathToUtf8String(path) +
                  ": " + std::strerror(err),
              err, ClassifyNativeError(err), {"path=" + PathToUtf8String(path)});
}

class FileDescriptor {
public:
  explicit FileDescriptor(int fd) : fd_(fd) {}
  FileDescriptor(const FileDescriptor&) = delete;
  FileDescriptor& operator=(const FileDescriptor&) = delete;
  ~FileDescriptor() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }
  int get() const noexcept { return fd_; }
  // Closes explicitly so the error can be reported.
  int Close() noexcept {
    int rc = ::close(fd_);
    fd_ = -1;
    return rc;
  }

private:
  int fd_;
};

// Removes the temporary file unless the rename succeeded.
class TempFileGuard {
public:
  explicit TempFileGuard(std::filesystem::path path) : path_(std::move(path)) {}
  TempFileGuard(const TempFileGuard&) = delete;
  TempFileGuard& operator=(const TempFileGuard&) = delete;
  ~TempFileGuard() {
    if (!path_.empty()) {
      std::error_code ec;
      std::filesystem::remove(path_, ec);
    }
  }
  void Release() noexcept { path_.clear(); }

private:
  std::filesystem::path path_;
};

std::filesystem::path MakeTempPath(const std::filesystem::path& target) {
  std::array<uint8_t, 8> token{};
  crypto::SystemRandomBytes(token);
  auto name = "." + target.filename().string() + "." + ToHex(token) + ".tmp";
  return target.parent_path() / name;
}

void WriteAll(int fd, std::span<const uint8_t> payload, const std::filesystem::path& path) {
  size_t offset = 0;
  while (offset < payload.size()) {
    ssize_t written = ::write(fd, payload.data() + offset, payload.size() - offset);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      ThrowIoError("write failed", path, errno);
    }
    offset += static_cast<size_t>(written);
  }
}

void CopyInto(int out_fd, const std::filesystem::path& out_path,
              const std::filesystem::path& source, std::vector<uint8_t>& buffer) {
  FileDescriptor in(::open(source.c_str(), O_RDONLY | O_CLOEXEC));
  if (in.get() < 0) {
    ThrowIoError("open failed", source, errno);
  }
  while (true) {
    ssize_t got = ::read(in.get(), buffer.data(), buffer.size());
    if (got < 0) {
      if (errno == EINTR) {
        continue;
      }
      ThrowIoError("read failed", source, errno);
    }
    if (got == 0) {
      return;
    }
    WriteAll(out_fd, std::span<const uint8_t>(buffer.data(), static_cast<size_t>(got)), out_path);
  }
}

template <typename Fill>
void WriteThroughTemp(const std::filesystem::path& target, const AtomicWriteHooks& hooks,
                      Fill&& fill) {
  auto dir = target.parent_path();
  if (dir.empty()) {
    dir = std::filesystem::current_path();
  }
  const auto temp_path = MakeTempPath(target);
  TempFileGuard cleanup(temp_path);

  FileDescriptor fd(::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600));
  if (fd.get() < 0) {
    ThrowIoError("open failed", temp_path, errno);
  }
  fill(fd.get(), temp_path);
  if (::fsync(fd.get()) != 0) {
    ThrowIoError("fsync failed", temp_path, errno);
  }
  if (fd.Close() != 0) {
    ThrowIoError("close failed", temp_path, errno);
  }

  if (hooks.before_rename) {
    hooks.before_rename(temp_path, target);
  }
  if (::rename(temp_path.c_str(), target.c_str()) != 0) {
    ThrowIoError("rename failed", target, errno);
  }
  cleanup.Release();
  SyncDirectory(dir);
}

}  // namespace

Retryability ClassifyNativeError(int native) {
  switch (native) {
    case EINTR:
    case EAGAIN:
#if defined(EWOULDBLOCK) && EWOULDBLOCK != EAGAIN
    case EWOULDBLOCK:
#endif
      return Retryability::kRetryable;
    case EBUSY:
    case ETIMEDOUT:
    case EIO:
      return Retryability::kTransient;
    default:
      break;
  }
  return Retryability::kFatal;
}

Error StoreRequestError(std::string message, Retryability retry, std::optional<int> native) {
  return Error(ErrorDomain::Store, errors::kStoreRequestFailed, std::move(message), native, retry);
}

void SyncDirectory(const std::filesystem::path& dir) {
  FileDescriptor fd(::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
  if (fd.get() < 0) {
    ThrowIoError("open directory failed", dir, errno);
  }
  if (::fsync(fd.get()) != 0 && errno != EINVAL) {
    ThrowIoError("fsync directory failed", dir, errno);
  }
}

void AtomicWriteFile(const std::filesystem::path& target, std::span<const uint8_t> payload,
                     const AtomicWriteHooks& hooks) {
  WriteThroughTemp(target, hooks, [&](int fd, const std::filesystem::path& temp) {
    WriteAll(fd, payload, temp);
  });
}

void AtomicConcatenate(const std::filesystem::path& target,
                       std::span<const std::filesystem::path> sources,
                       const AtomicWriteHooks& hooks) {
  std::vector<uint8_t> buffer(1024 * 1024);
  WriteThroughTemp(target, hooks, [&](int fd, const std::filesystem::path& temp) {
    for (const auto& source : sources) {
      CopyInto(fd, temp, source, buffer);
    }
  });
}

}  // namespace bits3::store
