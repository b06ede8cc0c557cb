#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include "bits3/archive/tar_writer.h"

namespace bits3::archive {

struct ReadStats {
  uint64_t directories{0};
  uint64_t files{0};
  uint64_t symlinks{0};
  uint64_t skipped{0};  // sockets, fifos, devices
  uint64_t file_bytes{0};
};

// Serializes a directory tree as a tar stream. Entries are named
// "<root-name>/<relative path>", the root directory comes first, and each
// directory's children are visited in byte-wise name order, so an unchanged
// tree always produces the same archive.
class DirectoryReader {
public:
  // Throws errors::kSourceUnreadable if |root| is missing or not a directory.
  explicit DirectoryReader(std::filesystem::path root, size_t read_chunk_size = 256 * 1024);

  // Writes the complete archive, trailer included, to |sink|. An entry that
  // cannot be listed, stat'ed or read throws errors::kPartialRead. Exceptions
  // thrown by |sink| propagate unchanged.
  ReadStats Stream(const ByteSink& sink) const;

  // Archive length from a stat-only scan. Entries that vanish or cannot be
  // listed are left out, so this is an estimate.
  uint64_t EstimateArchiveSize() const;

  const std::filesystem::path& root() const noexcept { return root_; }
  const std::string& root_name() const noexcept { return root_name_; }

private:
  std::filesystem::path root_;
  std::string root_name_;
  size_t read_chunk_size_;
};

}  // namespace bits3::archive
