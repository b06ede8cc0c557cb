#include "bits3/orchestrator/pipeline.h"

#include <algorithm>
#include <memory>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

#include "bits3/archive/directory_reader.h"
#include "bits3/common.h"
#include "bits3/orchestrator/event_bus.h"
#include "bits3/pipeline/bounded_queue.h"
#include "bits3/pipeline/cancellation.h"
#include "bits3/pipeline/chunker.h"
#include "bits3/pipeline/stream_cipher.h"
#include "bits3/security/zeroizer.h"
#include "bits3/upload/upload_coordinator.h"

namespace bits3::orchestrator {

namespace {

using Buffer = std::vector<uint8_t>;
using BufferQueue = pipeline::BoundedQueue<Buffer>;

constexpr auto kInterruptPoll = std::chrono::milliseconds(50);

// Adds "stage=<name>" unless the error already names a stage.
Error WithStage(Error err, const char* stage) {
  for (const auto& entry : err.context) {
    if (entry.rfind("stage=", 0) == 0) {
      return err;
    }
  }
  err.context.push_back(std::string("stage=") + stage);
  return err;
}

Error FromException(const std::exception& e, int fallback_code, const char* stage) {
  if (const auto* err = dynamic_cast<const Error*>(&e)) {
    return WithStage(*err, stage);
  }
  return WithStage(MakeError(fallback_code, e.what()), stage);
}

// Push failed: the queue was cancelled, so the token holds the reason.
[[noreturn]] void ThrowStopped(const pipeline::CancellationToken& token) {
  token.ThrowIfCancelled();
  throw MakeError(errors::kInternal, "stage queue closed unexpectedly");
}

void Publish(EventSeverity severity, std::string id, std::string message,
             std::vector<EventField> fields = {}) {
  PublishEvent(EventCategory::kLifecycle, severity, std::move(id), std::move(message),
               std::move(fields));
}

RunReport FailBeforeStart(RunReport report, Error error,
                          std::chrono::steady_clock::time_point started) {
  report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  Publish(EventSeverity::kError, "pipeline.rejected", error.what(),
          {EventField("kind", std::string(ErrorKindName(error.code)))});
  report.error = std::move(error);
  return report;
}

}  // namespace

Pipeline::Pipeline(PipelineConfig config, store::ObjectStore& store, PipelineOptions options)
    : config_(std::move(config)), store_(store), options_(std::move(options)) {
  if (!options_.random) {
    options_.random = crypto::SystemRandomSource();
  }
}

Pipeline::~Pipeline() { security::Zeroizer::WipeString(config_.secret); }

RunReport Pipeline::Run() {
  const auto started = std::chrono::steady_clock::now();
  RunReport report;
  report.bucket = config_.bucket;
  report.key = config_.key;

  try {
    ValidateConfig(config_, store_.Limits());
  } catch (const Error& e) {
    return FailBeforeStart(std::move(report), e, started);
  }

  std::optional<archive::DirectoryReader> reader;
  try {
    reader.emplace(config_.source_path, config_.read_chunk_size);
  } catch (const Error& e) {
    return FailBeforeStart(std::move(report), WithStage(e, "reader"), started);
  }

  try {
    store_.CheckBucket(config_.bucket);
  } catch (const Error& e) {
    return FailBeforeStart(std::move(report),
                           Reclassify(e, errors::kSessionOpenFailure, "stage=check_bucket"),
                           started);
  }

  Publish(EventSeverity::kInfo, "pipeline.start", "Backup upload started",
          {EventField("source", PathToUtf8String(config_.source_path)),
           EventField("bucket", config_.bucket), EventField("key", config_.key),
           NumericField("part_size", config_.part_size_bytes),
           NumericField("window", config_.max_in_flight_parts)});

  BufferQueue plain_queue(config_.queue_depth);
  BufferQueue cipher_queue(config_.queue_depth);
  pipeline::CancellationToken token;
  token.OnCancel([&]() {
    plain_queue.Cancel();
    cipher_queue.Cancel();
  });

  std::unique_ptr<progress::ProgressReporter> progress;
  if (config_.progress_enabled) {
    progress = std::make_unique<progress::ProgressReporter>(options_.progress_sink,
                                                            config_.progress_interval);
    progress->SetExpectedTotal(pipeline::EstimateEncryptedSize(reader->EstimateArchiveSize(),
                                                               config_.cipher_segment_size));
    progress->Start();
  }
  auto count = [&](progress::Stage stage, uint64_t bytes) {
    if (progress) {
      progress->Add(stage, bytes);
    }
  };

  std::atomic<uint64_t> bytes_read{0};
  std::atomic<uint64_t> bytes_encrypted{0};
  std::atomic<uint64_t> bytes_acknowledged{0};
  std::atomic<uint64_t> peak_buffered{0};

  upload::UploadCoordinator coordinator(
      store_, upload::UploadTarget{config_.bucket, config_.key, config_.storage_class},
      config_.max_in_flight_parts,
      upload::RetryPolicy{config_.retry_limit, config_.retry_base_delay, config_.retry_max_delay},
      token, [&](const pipeline::Part& part) {
        bytes_acknowledged += part.size();
        count(progress::Stage::kUpload, part.size());
      });

  std::thread reader_thread([&]() {
    try {
      Buffer buffer;
      auto flush = [&]() {
        if (buffer.empty()) {
          return;
        }
        bytes_read += buffer.size();
        count(progress::Stage::kRead, buffer.size());
        if (!plain_queue.Push(std::move(buffer))) {
          ThrowStopped(token);
        }
        buffer = Buffer();
      };
      reader->Stream([&](std::span<const uint8_t> bytes) {
        token.ThrowIfCancelled();
        buffer.insert(buffer.end(), bytes.begin(), bytes.end());
        if (buffer.size() >= config_.read_chunk_size) {
          flush();
        }
      });
      flush();
      plain_queue.Close();
    } catch (const std::exception& e) {
      token.Cancel(FromException(e, errors::kPartialRead, "reader"));
    }
  });

  std::thread cipher_thread([&]() {
    try {
      pipeline::StreamEncryptor encryptor(config_.secret, config_.kdf, config_.cipher_segment_size,
                                          options_.random);
      auto emit = [&](Buffer out) {
        if (out.empty()) {
          return;
        }
        const uint64_t produced = bytes_encrypted += out.size();
        const uint64_t buffered = produced - std::min(produced, bytes_acknowledged.load());
        if (buffered > peak_buffered.load()) {
          peak_buffered.store(buffered);
        }
        count(progress::Stage::kEncrypt, out.size());
        if (!cipher_queue.Push(std::move(out))) {
          ThrowStopped(token);
        }
      };
      const auto header = encryptor.Begin();
      emit(Buffer(header.begin(), header.end()));
      while (auto chunk = plain_queue.Pop()) {
        Buffer out;
        encryptor.Update(*chunk, out);
        security::Zeroizer::WipeVector(*chunk);
        emit(std::move(out));
      }
      token.ThrowIfCancelled();
      Buffer tail;
      encryptor.Finalize(tail);
      emit(std::move(tail));
      cipher_queue.Close();
    } catch (const std::exception& e) {
      token.Cancel(FromException(e, errors::kEncryptionFailure, "cipher"));
    }
  });

  std::atomic<bool> watcher_done{false};
  std::thread interrupt_watcher;
  if (options_.interrupt != nullptr) {
    interrupt_watcher = std::thread([&]() {
      while (!watcher_done.load()) {
        if (options_.interrupt->load()) {
          token.RequestCancel("interrupted by signal");
          return;
        }
        std::this_thread::sleep_for(kInterruptPoll);
      }
    });
  }

  uint32_t parts = 0;
  try {
    // A part is only started once the window has room for it.
    pipeline::Chunker chunker(
        config_.part_size_bytes,
        [&](pipeline::Part part) {
          ++parts;
          coordinator.Submit(std::move(part));
        },
        [&]() { coordinator.AwaitSlot(); });
    while (auto chunk = cipher_queue.Pop()) {
      chunker.Append(*chunk);
    }
    token.ThrowIfCancelled();
    chunker.Finish();
    coordinator.Finish();
  } catch (const std::exception& e) {
    token.Cancel(FromException(e, errors::kInternal, "upload"));
  }

  if (coordinator.state() != upload::UploadState::kCompleted) {
    token.RequestCancel("upload did not complete");
    coordinator.Abort();
  }
  reader_thread.join();
  cipher_thread.join();
  watcher_done.store(true);
  if (interrupt_watcher.joinable()) {
    interrupt_watcher.join();
  }
  if (progress) {
    progress->Stop();
  }

  report.upload_id = coordinator.upload_id();
  report.bytes_read = bytes_read.load();
  report.bytes_encrypted = bytes_encrypted.load();
  report.bytes_uploaded = coordinator.bytes_uploaded();
  report.peak_in_flight_bytes = coordinator.peak_in_flight_bytes();
  report.peak_buffered_bytes = peak_buffered.load();
  report.parts = parts;
  report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  report.success = coordinator.state() == upload::UploadState::kCompleted;

  if (report.success) {
    Publish(EventSeverity::kInfo, "pipeline.completed", "Backup upload completed",
            {EventField("key", report.key), NumericField("bytes", report.bytes_uploaded),
             NumericField("parts", report.parts),
             NumericField("elapsed_ms", static_cast<uint64_t>(report.elapsed.count()))});
  } else {
    report.error = token.Reason();
    if (!report.error) {
      report.error = MakeError(errors::kInternal, "pipeline ended without completing");
    }
    Publish(EventSeverity::kError, "pipeline.failed", report.error->what(),
            {EventField("kind", std::string(ErrorKindName(report.error->code))),
             EventField("key", report.key)});
  }
  return report;
}

}  // namespace bits3::orchestrator
