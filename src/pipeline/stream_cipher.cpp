#include "bits3/pipeline/stream_cipher.h"

#include <algorithm>

#include "bits3/core/nonce.h"
#include "bits3/error.h"
#include "bits3/security/zeroizer.h"

namespace bits3::pipeline {

namespace {

[[noreturn]] void ThrowEncryption(const std::string& message) {
  throw MakeError(errors::kEncryptionFailure, message, Retryability::kFatal, {"stage=cipher"});
}

void Append(std::vector<uint8_t>& out, std::span<const uint8_t> bytes) {
  out.insert(out.end(), bytes.begin(), bytes.end());
}

}  // namespace

uint64_t EstimateEncryptedSize(uint64_t plaintext_bytes, uint32_t segment_size) {
  // The stream always ends with a final segment; a non-empty input whose
  // length is a multiple of the segment size ends on a full one.
  uint64_t segments = plaintext_bytes == 0 ? 1 : (plaintext_bytes + segment_size - 1) / segment_size;
  return core::kStreamHeaderSize + plaintext_bytes + segments * crypto::AES256_GCM::TAG_SIZE;
}

StreamEncryptor::StreamEncryptor(std::string_view secret, const crypto::KdfParams& kdf,
                                 uint32_t segment_size, const crypto::RandomSource& random)
    : secret_(secret.begin(), secret.end()) {
  if (segment_size < core::kMinSegmentSize || segment_size > core::kMaxSegmentSize) {
    ThrowEncryption("segment size out of range");
  }
  header_.kdf = kdf;
  header_.segment_size = segment_size;
  random(header_.salt);
  random(header_.nonce_prefix);
  pending_.reserve(segment_size);
}

StreamEncryptor::~StreamEncryptor() {
  security::Zeroizer::Wipe(key_);
  security::Zeroizer::WipeVector(secret_);
  security::Zeroizer::WipeVector(pending_);
}

void StreamEncryptor::EnsureState(bool expect_started) const {
  if (finalized_) {
    ThrowEncryption("stream already finalized");
  }
  if (started_ != expect_started) {
    ThrowEncryption(expect_started ? "Begin() not called" : "Begin() called twice");
  }
}

std::array<uint8_t, core::kStreamHeaderSize> StreamEncryptor::Begin() {
  EnsureState(false);
  header_bytes_ = core::SerializeStreamHeader(header_);
  key_ = crypto::DeriveKey(header_.kdf, secret_, header_.salt);
  security::Zeroizer::WipeVector(secret_);
  secret_.clear();
  started_ = true;
  return header_bytes_;
}

void StreamEncryptor::Seal(std::span<const uint8_t> segment, bool final_segment,
                           std::vector<uint8_t>& out) {
  if (segments_sealed_ > core::kMaxSegments) {
    ThrowEncryption("segment counter exhausted");
  }
  const auto nonce = core::MakeSegmentNonce(header_.nonce_prefix,
                                            static_cast<uint32_t>(segments_sealed_), final_segment);
  auto sealed = crypto::AES256_GCM_Encrypt(segment, header_bytes_, nonce, key_);
  if (sealed.ciphertext.size() != segment.size()) {
    ThrowEncryption("cipher returned a short segment");
  }
  Append(out, sealed.ciphertext);
  Append(out, sealed.tag);
  ++segments_sealed_;
}

void StreamEncryptor::Update(std::span<const uint8_t> plaintext, std::vector<uint8_t>& out) {
  EnsureState(true);
  const size_t segment = header_.segment_size;
  size_t offset = 0;
  while (offset < plaintext.size()) {
    if (pending_.size() == segment) {
      Seal(pending_, false, out);
      pending_.clear();
    }
    if (pending_.empty()) {
      while (plaintext.size() - offset > segment) {
        Seal(plaintext.subspan(offset, segment), false, out);
        offset += segment;
      }
    }
    const size_t take = std::min(segment - pending_.size(), plaintext.size() - offset);
    pending_.insert(pending_.end(), plaintext.begin() + static_cast<std::ptrdiff_t>(offset),
                    plaintext.begin() + static_cast<std::ptrdiff_t>(offset + take));
    offset += take;
  }
  plaintext_bytes_ += plaintext.size();
}

void StreamEncryptor::Finalize(std::vector<uint8_t>& out) {
  EnsureState(true);
  Seal(pending_, true, out);
  security::Zeroizer::WipeVector(pending_);
  pending_.clear();
  security::Zeroizer::Wipe(key_);
  finalized_ = true;
}

StreamDecryptor::StreamDecryptor(std::string_view secret) : secret_(secret.begin(), secret.end()) {}

StreamDecryptor::~StreamDecryptor() {
  security::Zeroizer::Wipe(key_);
  security::Zeroizer::WipeVector(secret_);
}

void StreamDecryptor::Open(std::span<const uint8_t> record, bool final_segment,
                           std::vector<uint8_t>& out) {
  if (segments_opened_ > core::kMaxSegments) {
    throw MakeError(errors::kAuthenticationFailed, "too many segments");
  }
  const size_t body = record.size() - crypto::AES256_GCM::TAG_SIZE;
  const auto nonce = core::MakeSegmentNonce(header_.nonce_prefix,
                                            static_cast<uint32_t>(segments_opened_), final_segment);
  std::span<const uint8_t, crypto::AES256_GCM::TAG_SIZE> tag(record.data() + body,
                                                            crypto::AES256_GCM::TAG_SIZE);
  auto plain = crypto::AES256_GCM_Decrypt(record.first(body), header_bytes_, nonce, tag, key_);
  Append(out, plain);
  ++segments_opened_;
}

void StreamDecryptor::Update(std::span<const uint8_t> ciphertext, std::vector<uint8_t>& out) {
  if (finalized_) {
    throw MakeError(errors::kAuthenticationFailed, "data after end of stream");
  }
  pending_.insert(pending_.end(), ciphertext.begin(), ciphertext.end());
  if (!have_header_) {
    if (pending_.size() < core::kStreamHeaderSize) {
      return;
    }
    header_ = core::ParseStreamHeader(pending_);
    std::copy_n(pending_.begin(), core::kStreamHeaderSize, header_bytes_.begin());
    key_ = crypto::DeriveKey(header_.kdf, secret_, header_.salt);
    pending_.erase(pending_.begin(), pending_.begin() + core::kStreamHeaderSize);
    have_header_ = true;
  }
  // Hold back at least one record; only Finalize knows which one is last.
  const size_t record = RecordSize();
  size_t offset = 0;
  while (pending_.size() - offset > record) {
    Open(std::span<const uint8_t>(pending_).subspan(offset, record), false, out);
    offset += record;
  }
  pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(offset));
}

void StreamDecryptor::Finalize(std::vector<uint8_t>& out) {
  if (finalized_) {
    return;
  }
  if (!have_header_) {
    throw MakeError(errors::kAuthenticationFailed, "stream shorter than its header");
  }
  if (pending_.size() < crypto::AES256_GCM::TAG_SIZE) {
    throw MakeError(errors::kAuthenticationFailed, "stream truncated before final segment");
  }
  Open(pending_, true, out);
  pending_.clear();
  finalized_ = true;
}

}  // namespace bits3::pipeline
