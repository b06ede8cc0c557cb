#include "bits3/pipeline/chunker.h"

#include <algorithm>
#include <limits>
#include <utility>

#include "bits3/error.h"

namespace bits3::pipeline {

namespace {
constexpr uint64_t kReserveCap = 16ull * 1024 * 1024;
}  // namespace

std::string_view PartStatusName(PartStatus status) noexcept {
  switch (status) {
    case PartStatus::kPending:
      return "pending";
    case PartStatus::kUploading:
      return "uploading";
    case PartStatus::kUploaded:
      return "uploaded";
    case PartStatus::kFailed:
      return "failed";
  }
  return "unknown";
}

Chunker::Chunker(uint64_t part_size, PartSink sink, PartStart on_part_start)
    : part_size_(part_size), sink_(std::move(sink)), on_part_start_(std::move(on_part_start)) {
  if (part_size_ == 0) {
    throw MakeError(errors::kConfiguration, "part size must be positive");
  }
}

void Chunker::Append(std::span<const uint8_t> bytes) {
  if (finished_) {
    throw MakeError(errors::kInternal, "Chunker::Append after Finish");
  }
  bytes_consumed_ += bytes.size();
  while (!bytes.empty()) {
    if (current_.empty()) {
      if (on_part_start_) {
        on_part_start_();
      }
      current_.reserve(static_cast<size_t>(std::min<uint64_t>(part_size_, kReserveCap)));
    }
    const size_t room = static_cast<size_t>(part_size_ - current_.size());
    const size_t take = std::min(room, bytes.size());
    current_.insert(current_.end(), bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(take));
    bytes = bytes.subspan(take);
    if (current_.size() == part_size_) {
      Seal();
    }
  }
}

void Chunker::Finish() {
  if (finished_) {
    throw MakeError(errors::kInternal, "Chunker::Finish called twice");
  }
  finished_ = true;
  if (!current_.empty()) {
    Seal();
  }
}

void Chunker::Seal() {
  if (next_sequence_ == std::numeric_limits<uint32_t>::max()) {
    throw MakeError(errors::kInternal, "part sequence exhausted");
  }
  Part part;
  part.sequence = next_sequence_++;
  part.digest = crypto::SHA256_Hash(current_);
  part.bytes = std::make_shared<const std::vector<uint8_t>>(std::move(current_));
  current_ = {};
  sink_(std::move(part));
}

}  // namespace bits3::pipeline
