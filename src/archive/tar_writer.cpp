#include "bits3/archive/tar_writer.h"

#include <algorithm>
#include <array>
#include <cstring>
#include <optional>

#include "bits3/error.h"

namespace bits3::archive {

namespace {

constexpr size_t kNameField = 100;
constexpr size_t kPrefixField = 155;
constexpr uint64_t kMaxOctal7 = 07777777;            // mode/uid/gid
constexpr uint64_t kMaxOctal11 = 077777777777ull;    // size/mtime

using Block = std::array<uint8_t, kBlockSize>;

struct SplitName {
  std::string_view prefix;
  std::string_view name;
};

// ustar stores long paths as prefix + '/' + name.
std::optional<SplitName> SplitUstarName(std::string_view path) {
  if (path.size() <= kNameField) {
    return SplitName{{}, path};
  }
  if (path.size() > kPrefixField + 1 + kNameField) {
    return std::nullopt;
  }
  for (size_t pos = path.find('/'); pos != std::string_view::npos; pos = path.find('/', pos + 1)) {
    if (pos > kPrefixField) {
      break;
    }
    const auto tail = path.substr(pos + 1);
    if (!tail.empty() && tail.size() <= kNameField) {
      return SplitName{path.substr(0, pos), tail};
    }
  }
  return std::nullopt;
}

void PutString(Block& block, size_t offset, size_t width, std::string_view value) {
  std::memcpy(block.data() + offset, value.data(), std::min(width, value.size()));
}

// Zero-padded octal, NUL terminated, filling |width| bytes.
void PutOctal(Block& block, size_t offset, size_t width, uint64_t value) {
  for (size_t i = width - 1; i-- > 0;) {
    block[offset + i] = static_cast<uint8_t>('0' + (value & 7));
    value >>= 3;
  }
  block[offset + width - 1] = 0;
}

struct PaxNeeds {
  std::string records;
};

PaxNeeds CollectPax(std::string_view name, std::string_view linkname, uint64_t size,
                    const EntryMetadata& meta) {
  PaxNeeds needs;
  if (!SplitUstarName(name)) {
    needs.records += PaxRecord("path", name);
  }
  if (linkname.size() > kNameField) {
    needs.records += PaxRecord("linkpath", linkname);
  }
  if (size > kMaxOctal11) {
    needs.records += PaxRecord("size", std::to_string(size));
  }
  if (meta.uid > kMaxOctal7) {
    needs.records += PaxRecord("uid", std::to_string(meta.uid));
  }
  if (meta.gid > kMaxOctal7) {
    needs.records += PaxRecord("gid", std::to_string(meta.gid));
  }
  return needs;
}

uint64_t Padded(uint64_t size) {
  return (size + kBlockSize - 1) / kBlockSize * kBlockSize;
}

std::string PaxHeaderName(std::string_view name) {
  auto slash = name.find_last_of('/', name.size() > 1 ? name.size() - 2 : 0);
  auto base = slash == std::string_view::npos ? name : name.substr(slash + 1);
  std::string out = "PaxHeaders/";
  out.append(base.substr(0, kNameField - out.size()));
  return out;
}

}  // namespace

std::string PaxRecord(std::string_view key, std::string_view value) {
  // The length prefix counts its own digits.
  const size_t body = key.size() + value.size() + 3;  // ' ', '=', '\n'
  size_t total = body + std::to_string(body).size();
  if (std::to_string(total).size() + body != total) {
    total = body + std::to_string(total).size();
  }
  std::string record = std::to_string(total);
  record.push_back(' ');
  record.append(key);
  record.push_back('=');
  record.append(value);
  record.push_back('\n');
  return record;
}

uint64_t TarEntrySize(std::string_view name, std::string_view linkname, uint64_t size,
                      const EntryMetadata& meta) {
  uint64_t total = kBlockSize + Padded(size);
  const auto pax = CollectPax(name, linkname, size, meta);
  if (!pax.records.empty()) {
    total += kBlockSize + Padded(pax.records.size());
  }
  return total;
}

uint64_t TarArchiveSize(uint64_t entries) {
  const uint64_t with_trailer = entries + 2 * kBlockSize;
  return (with_trailer + kRecordSize - 1) / kRecordSize * kRecordSize;
}

TarWriter::TarWriter(ByteSink sink) : sink_(std::move(sink)) {}

void TarWriter::Emit(std::span<const uint8_t> bytes) {
  if (bytes.empty()) {
    return;
  }
  sink_(bytes);
  bytes_written_ += bytes.size();
}

void TarWriter::PadToBlock() {
  static const Block kZero{};
  const size_t remainder = static_cast<size_t>(bytes_written_ % kBlockSize);
  if (remainder != 0) {
    Emit(std::span<const uint8_t>(kZero.data(), kBlockSize - remainder));
  }
}

void TarWriter::WriteEntryHeader(std::string_view name, char typeflag, uint64_t size,
                                 const EntryMetadata& meta, std::string_view linkname) {
  if (finalized_) {
    throw MakeError(errors::kInternal, "tar entry appended after Finalize");
  }
  const auto pax = CollectPax(name, linkname, size, meta);
  if (!pax.records.empty()) {
    EntryMetadata pax_meta = meta;
    pax_meta.uid = 0;
    pax_meta.gid = 0;
    pax_meta.mode = 0644;
    WriteEntryHeader(PaxHeaderName(name), 'x', pax.records.size(), pax_meta, {});
    Emit(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(pax.records.data()),
                                  pax.records.size()));
    PadToBlock();
  }

  Block block{};
  const auto split = SplitUstarName(name);
  if (split) {
    PutString(block, 0, kNameField, split->name);
    PutString(block, 345, kPrefixField, split->prefix);
  } else {
    PutString(block, 0, kNameField, name.substr(0, kNameField));
  }
  PutOctal(block, 100, 8, meta.mode & 07777);
  PutOctal(block, 108, 8, meta.uid > kMaxOctal7 ? 0 : meta.uid);
  PutOctal(block, 116, 8, meta.gid > kMaxOctal7 ? 0 : meta.gid);
  PutOctal(block, 124, 12, size > kMaxOctal11 ? 0 : size);
  const uint64_t mtime = meta.mtime < 0 ? 0 : static_cast<uint64_t>(meta.mtime);
  PutOctal(block, 136, 12, std::min<uint64_t>(mtime, kMaxOctal11));
  block[156] = static_cast<uint8_t>(typeflag);
  PutString(block, 157, kNameField, linkname.substr(0, std::min(linkname.size(), kNameField)));
  PutString(block, 257, 6, std::string_view("ustar\0", 6));
  PutString(block, 263, 2, "00");
  PutOctal(block, 329, 8, 0);
  PutOctal(block, 337, 8, 0);

  // Checksum is computed with its own field set to spaces.
  std::memset(block.data() + 148, ' ', 8);
  uint32_t checksum = 0;
  for (auto b : block) {
    checksum += b;
  }
  PutOctal(block, 148, 7, checksum);
  block[155] = ' ';

  Emit(block);
}

void TarWriter::AppendDirectory(std::string_view name, const EntryMetadata& meta) {
  std::string dir_name(name);
  if (dir_name.empty() || dir_name.back() != '/') {
    dir_name.push_back('/');
  }
  WriteEntryHeader(dir_name, '5', 0, meta, {});
}

void TarWriter::AppendSymlink(std::string_view name, std::string_view target,
                              const EntryMetadata& meta) {
  WriteEntryHeader(name, '2', 0, meta, target);
}

void TarWriter::AppendFile(std::string_view name, const EntryMetadata& meta, uint64_t size,
                           const BodyReader& body, size_t chunk_size) {
  WriteEntryHeader(name, '0', size, meta, {});
  std::vector<uint8_t> buffer(std::max<size_t>(chunk_size, kBlockSize));
  uint64_t remaining = size;
  while (remaining > 0) {
    const size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, buffer.size()));
    const size_t got = body(std::span<uint8_t>(buffer.data(), want));
    if (got == 0) {
      throw MakeError(errors::kPartialRead,
                      "file ended " + std::to_string(remaining) + " bytes early",
                      Retryability::kFatal, {"stage=reader", "entry=" + std::string(name)});
    }
    Emit(std::span<const uint8_t>(buffer.data(), std::min(got, want)));
    remaining -= std::min(got, want);
  }
  PadToBlock();
}

void TarWriter::Finalize() {
  if (finalized_) {
    return;
  }
  static const Block kZero{};
  Emit(kZero);
  Emit(kZero);
  const size_t remainder = static_cast<size_t>(bytes_written_ % kRecordSize);
  if (remainder != 0) {
    std::vector<uint8_t> fill(kRecordSize - remainder, 0);
    Emit(fill);
  }
  finalized_ = true;
}

}  // namespace bits3::archive
