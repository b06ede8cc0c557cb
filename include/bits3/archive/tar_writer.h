#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bits3::archive {

inline constexpr size_t kBlockSize = 512;
inline constexpr size_t kRecordSize = 20 * kBlockSize;  // default blocking factor

using ByteSink = std::function<void(std::span<const uint8_t>)>;

// Fills the buffer with the next piece of a file body and returns the number
// of bytes written; 0 means the body ended early.
using BodyReader = std::function<size_t(std::span<uint8_t>)>;

struct EntryMetadata {
  uint32_t mode{0};
  uint64_t uid{0};
  uint64_t gid{0};
  int64_t mtime{0};
};

// Sequential POSIX ustar writer. Names, link targets, ids and sizes that do
// not fit the ustar fields are carried in a pax extended header. User and
// group names are left empty so the same tree archives identically on any
// host.
class TarWriter {
public:
  explicit TarWriter(ByteSink sink);

  void AppendDirectory(std::string_view name, const EntryMetadata& meta);
  // Streams exactly |size| bytes from |body|. A short body throws
  // errors::kPartialRead naming |name|.
  void AppendFile(std::string_view name, const EntryMetadata& meta, uint64_t size,
                  const BodyReader& body, size_t chunk_size = 64 * 1024);
  void AppendSymlink(std::string_view name, std::string_view target, const EntryMetadata& meta);
  // End-of-archive marker, then zero fill to a whole record.
  void Finalize();

  uint64_t bytes_written() const noexcept { return bytes_written_; }

private:
  void WriteEntryHeader(std::string_view name, char typeflag, uint64_t size,
                        const EntryMetadata& meta, std::string_view linkname);
  void Emit(std::span<const uint8_t> bytes);
  void PadToBlock();

  ByteSink sink_;
  uint64_t bytes_written_{0};
  bool finalized_{false};
};

// Archive bytes consumed by one entry: optional pax header, ustar header and
// the padded body.
uint64_t TarEntrySize(std::string_view name, std::string_view linkname, uint64_t size,
                      const EntryMetadata& meta);

// Trailer plus record padding for an archive whose entries total |entries| bytes.
uint64_t TarArchiveSize(uint64_t entries);

// "<len> <key>=<value>\n" as defined by POSIX pax.
std::string PaxRecord(std::string_view key, std::string_view value);

}  // namespace bits3::archive
