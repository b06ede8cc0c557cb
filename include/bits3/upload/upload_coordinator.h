#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "bits3/pipeline/cancellation.h"
#include "bits3/pipeline/chunker.h"
#include "bits3/store/object_store.h"

namespace bits3::upload {

enum class UploadState : uint8_t {
  kIdle,
  kSessionOpen,
  kPartInFlight,
  kCompleting,
  kCompleted,
  kAborted,
};

std::string_view UploadStateName(UploadState state) noexcept;

struct UploadTarget {
  std::string bucket;
  std::string key;
  std::string storage_class;
};

struct RetryPolicy {
  uint32_t retry_limit{5};  // retries after the first attempt
  std::chrono::milliseconds base_delay{200};
  std::chrono::milliseconds max_delay{10'000};
};

// Delay before retry number |retry| (1-based): base * 2^(retry-1), capped.
std::chrono::milliseconds BackoffDelay(const RetryPolicy& policy, uint32_t retry) noexcept;

// Drives one multipart upload. Submit() is called by a single producer with
// parts in sequence order; up to |window| of them are held and uploaded
// concurrently by worker threads. Failures cancel |token| with a classified
// error (kSessionOpenFailure, kPartUploadFailure, kCompletionFailure) and the
// owner is expected to call Abort().
class UploadCoordinator {
public:
  using PartCallback = std::function<void(const pipeline::Part&)>;

  UploadCoordinator(store::ObjectStore& store, UploadTarget target, uint32_t window,
                    RetryPolicy policy, pipeline::CancellationToken& token,
                    PartCallback on_uploaded = {});
  ~UploadCoordinator();

  UploadCoordinator(const UploadCoordinator&) = delete;
  UploadCoordinator& operator=(const UploadCoordinator&) = delete;

  // Opens the session on the first part, then blocks while the window is
  // full. Throws the token's reason once the run is cancelled.
  void Submit(pipeline::Part part);

  // Blocks until fewer than |window| parts are in flight, so the producer can
  // start buffering the next part. Throws the token's reason once the run is
  // cancelled.
  void AwaitSlot();

  // Waits for every submitted part and completes the upload with the
  // ordered (sequence, tag) list.
  void Finish();

  // Best-effort release of the open session. No-op when nothing was opened
  // or the upload already completed or aborted. A failing cleanup call is
  // logged and otherwise ignored.
  void Abort();

  UploadState state() const;
  std::string upload_id() const;
  uint64_t bytes_uploaded() const;
  uint64_t peak_in_flight_bytes() const;
  pipeline::PartStatus StatusOf(uint32_t sequence) const;
  std::vector<store::CompletedPart> completed_parts() const;

private:
  void WaitForSlot(std::unique_lock<std::mutex>& lock);
  void OpenSession();
  void StartWorkers();
  void StopWorkers();
  void WorkerLoop();
  void UploadOne(const pipeline::Part& part);
  void CompleteSession(const std::vector<store::CompletedPart>& parts);
  [[noreturn]] void Fail(Error error);

  store::ObjectStore& store_;
  const UploadTarget target_;
  const uint32_t window_;
  const RetryPolicy policy_;
  pipeline::CancellationToken& token_;
  PartCallback on_uploaded_;
  const store::StoreLimits limits_;

  mutable std::mutex mutex_;
  std::condition_variable work_cv_;
  std::condition_variable slot_cv_;
  UploadState state_{UploadState::kIdle};
  std::string upload_id_;
  std::deque<pipeline::Part> queue_;
  std::map<uint32_t, std::string> tags_;
  std::map<uint32_t, pipeline::PartStatus> status_;
  uint32_t next_sequence_{1};
  uint32_t in_flight_{0};
  uint64_t in_flight_bytes_{0};
  uint64_t peak_in_flight_bytes_{0};
  uint64_t bytes_uploaded_{0};
  bool stopping_{false};
  std::vector<std::thread> workers_;
};

}  // namespace bits3::upload
