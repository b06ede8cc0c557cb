#include "bits3/archive/directory_reader.h"

#include <sys/stat.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <functional>
#include <system_error>
#include <utility>
#include <vector>

#include "bits3/common.h"
#include "bits3/error.h"
#include "bits3/orchestrator/event_bus.h"

namespace bits3::archive {

namespace {

namespace fs = std::filesystem;

enum class EntryKind { kDirectory, kFile, kSymlink, kOther };

struct Entry {
  std::string name;  // archive name
  fs::path path;
  EntryKind kind{EntryKind::kOther};
  EntryMetadata meta{};
  uint64_t size{0};
};

[[noreturn]] void ThrowPartialRead(const std::string& what, const fs::path& path, int err) {
  throw Error(ErrorDomain::IO, errors::kPartialRead,
              what + " " + PathToUtf8String(path) + ": " + std::strerror(err), err,
              Retryability::kFatal, {"stage=reader"});
}

// lstat, so symlinks are reported as themselves.
bool StatEntry(const fs::path& path, Entry& entry, int& err) {
  struct stat st {};
  if (::lstat(path.c_str(), &st) != 0) {
    err = errno;
    return false;
  }
  entry.meta.mode = static_cast<uint32_t>(st.st_mode & 07777);
  entry.meta.uid = st.st_uid;
  entry.meta.gid = st.st_gid;
  entry.meta.mtime = static_cast<int64_t>(st.st_mtime);
  if (S_ISDIR(st.st_mode)) {
    entry.kind = EntryKind::kDirectory;
  } else if (S_ISREG(st.st_mode)) {
    entry.kind = EntryKind::kFile;
    entry.size = static_cast<uint64_t>(st.st_size);
  } else if (S_ISLNK(st.st_mode)) {
    entry.kind = EntryKind::kSymlink;
  } else {
    entry.kind = EntryKind::kOther;
  }
  return true;
}

// Children of |dir| sorted by name. Returns false with |ec| set on failure.
bool ListChildren(const fs::path& dir, std::vector<fs::path>& out, std::error_code& ec) {
  out.clear();
  fs::directory_iterator it(dir, ec);
  if (ec) {
    return false;
  }
  for (fs::directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      return false;
    }
    out.push_back(it->path());
  }
  std::sort(out.begin(), out.end(), [](const fs::path& a, const fs::path& b) {
    return a.filename().native() < b.filename().native();
  });
  return true;
}

std::string ChildName(const std::string& parent, const fs::path& child) {
  return parent + "/" + child.filename().string();
}

void WalkForEstimate(const fs::path& dir, const std::string& name, uint64_t& total) {
  std::error_code ec;
  std::vector<fs::path> children;
  if (!ListChildren(dir, children, ec)) {
    return;
  }
  for (const auto& child : children) {
    Entry entry;
    int err = 0;
    if (!StatEntry(child, entry, err)) {
      continue;
    }
    const auto child_name = ChildName(name, child);
    switch (entry.kind) {
      case EntryKind::kDirectory:
        total += TarEntrySize(child_name + "/", {}, 0, entry.meta);
        WalkForEstimate(child, child_name, total);
        break;
      case EntryKind::kFile:
        total += TarEntrySize(child_name, {}, entry.size, entry.meta);
        break;
      case EntryKind::kSymlink: {
        auto target = fs::read_symlink(child, ec);
        total += TarEntrySize(child_name, ec ? std::string() : target.string(), 0, entry.meta);
        break;
      }
      case EntryKind::kOther:
        break;
    }
  }
}

class TreeStreamer {
public:
  TreeStreamer(TarWriter& writer, size_t chunk_size, ReadStats& stats)
      : writer_(writer), chunk_size_(chunk_size), stats_(stats) {}

  void Directory(const fs::path& dir, const std::string& name) {
    std::error_code ec;
    std::vector<fs::path> children;
    if (!ListChildren(dir, children, ec)) {
      ThrowPartialRead("cannot list", dir, ec.value());
    }
    for (const auto& child : children) {
      Entry entry;
      int err = 0;
      if (!StatEntry(child, entry, err)) {
        ThrowPartialRead("cannot stat", child, err);
      }
      entry.name = ChildName(name, child);
      entry.path = child;
      Visit(entry);
    }
  }

private:
  void Visit(const Entry& entry) {
    switch (entry.kind) {
      case EntryKind::kDirectory:
        writer_.AppendDirectory(entry.name, entry.meta);
        ++stats_.directories;
        Directory(entry.path, entry.name);
        break;
      case EntryKind::kFile:
        File(entry);
        break;
      case EntryKind::kSymlink: {
        std::error_code ec;
        auto target = fs::read_symlink(entry.path, ec);
        if (ec) {
          ThrowPartialRead("cannot read link", entry.path, ec.value());
        }
        writer_.AppendSymlink(entry.name, target.string(), entry.meta);
        ++stats_.symlinks;
        break;
      }
      case EntryKind::kOther:
        ++stats_.skipped;
        orchestrator::PublishEvent(orchestrator::EventCategory::kDiagnostics,
                                   orchestrator::EventSeverity::kWarning, "reader.skip_special",
                                   "Skipping special file",
                                   {orchestrator::EventField("entry", entry.name)});
        break;
    }
  }

  void File(const Entry& entry) {
    std::ifstream in(entry.path, std::ios::in | std::ios::binary);
    if (!in) {
      ThrowPartialRead("cannot open", entry.path, errno);
    }
    BodyReader body = [&in, &entry](std::span<uint8_t> buffer) -> size_t {
      in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
      if (in.bad()) {
        ThrowPartialRead("read failed", entry.path, errno);
      }
      return static_cast<size_t>(in.gcount());
    };
    writer_.AppendFile(entry.name, entry.meta, entry.size, body, chunk_size_);
    ++stats_.files;
    stats_.file_bytes += entry.size;
  }

  TarWriter& writer_;
  size_t chunk_size_;
  ReadStats& stats_;
};

}  // namespace

DirectoryReader::DirectoryReader(std::filesystem::path root, size_t read_chunk_size)
    : root_(std::move(root)), read_chunk_size_(read_chunk_size == 0 ? 64 * 1024 : read_chunk_size) {
  std::error_code ec;
  const auto status = fs::status(root_, ec);
  if (ec || !fs::exists(status)) {
    throw Error(ErrorDomain::IO, errors::kSourceUnreadable,
                "source directory does not exist: " + PathToUtf8String(root_),
                ec ? std::optional<int>(ec.value()) : std::nullopt, Retryability::kFatal,
                {"stage=reader"});
  }
  if (!fs::is_directory(status)) {
    throw Error(ErrorDomain::IO, errors::kSourceUnreadable,
                "source is not a directory: " + PathToUtf8String(root_), std::nullopt,
                Retryability::kFatal, {"stage=reader"});
  }
  auto normal = root_.lexically_normal();
  root_name_ = normal.filename().string();
  if (root_name_.empty()) {
    root_name_ = normal.parent_path().filename().string();
  }
  if (root_name_.empty() || root_name_ == "." || root_name_ == "..") {
    root_name_ = fs::absolute(root_, ec).lexically_normal().filename().string();
  }
  if (root_name_.empty()) {
    root_name_ = "root";
  }
}

ReadStats DirectoryReader::Stream(const ByteSink& sink) const {
  ReadStats stats;
  TarWriter writer(sink);

  struct stat st {};
  if (::stat(root_.c_str(), &st) != 0) {
    ThrowPartialRead("cannot stat", root_, errno);
  }
  EntryMetadata root_meta;
  root_meta.mode = static_cast<uint32_t>(st.st_mode & 07777);
  root_meta.uid = st.st_uid;
  root_meta.gid = st.st_gid;
  root_meta.mtime = static_cast<int64_t>(st.st_mtime);
  writer.AppendDirectory(root_name_, root_meta);
  ++stats.directories;

  TreeStreamer streamer(writer, read_chunk_size_, stats);
  streamer.Directory(root_, root_name_);
  writer.Finalize();
  return stats;
}

uint64_t DirectoryReader::EstimateArchiveSize() const {
  uint64_t total = TarEntrySize(root_name_ + "/", {}, 0, EntryMetadata{});
  WalkForEstimate(root_, root_name_, total);
  return TarArchiveSize(total);
}

}  // namespace bits3::archive
