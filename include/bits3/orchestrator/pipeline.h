#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "bits3/config.h"
#include "bits3/crypto/random.h"
#include "bits3/error.h"
#include "bits3/progress/progress_reporter.h"
#include "bits3/store/object_store.h"

namespace bits3::orchestrator {

struct PipelineOptions {
  // Salt and nonce prefix source; the system CSPRNG when empty.
  crypto::RandomSource random;
  // Receives progress snapshots when the config enables progress.
  progress::ProgressSink progress_sink;
  // Polled during the run; setting it cancels with errors::kCancelled.
  const std::atomic<bool>* interrupt{nullptr};
};

struct RunReport {
  bool success{false};
  std::optional<Error> error;
  std::string bucket;
  std::string key;
  std::string upload_id;
  uint64_t bytes_read{0};
  uint64_t bytes_encrypted{0};
  uint64_t bytes_uploaded{0};
  uint64_t peak_in_flight_bytes{0};
  // Highest count of ciphertext bytes produced but not yet uploaded; covers
  // the part being cut and the cipher queue as well as parts in flight.
  uint64_t peak_buffered_bytes{0};
  uint32_t parts{0};
  std::chrono::milliseconds elapsed{0};
};

// One directory -> tar -> AES-GCM -> parts -> multipart upload run.
//
// The reader and cipher stages run on their own threads and hand buffers
// through bounded queues; the calling thread cuts parts and feeds the upload
// coordinator. The first failure anywhere cancels every stage, an open
// upload is aborted, and that first failure is what the report carries.
class Pipeline {
public:
  Pipeline(PipelineConfig config, store::ObjectStore& store, PipelineOptions options = {});
  ~Pipeline();

  Pipeline(const Pipeline&) = delete;
  Pipeline& operator=(const Pipeline&) = delete;

  RunReport Run();

private:
  PipelineConfig config_;
  store::ObjectStore& store_;
  PipelineOptions options_;
};

}  // namespace bits3::orchestrator
