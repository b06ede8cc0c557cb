#include "bits3/upload/upload_coordinator.h"

#include <algorithm>
#include <utility>

#include "bits3/error.h"
#include "bits3/orchestrator/event_bus.h"

namespace bits3::upload {

namespace {

using orchestrator::EventCategory;
using orchestrator::EventField;
using orchestrator::EventSeverity;
using orchestrator::NumericField;
using orchestrator::PublishEvent;

constexpr auto kPollInterval = std::chrono::milliseconds(50);

// Runs |request| until it succeeds, the error is fatal, the retry budget is
// spent or the token is cancelled. Rethrows the last error.
template <typename Request>
auto WithRetries(const RetryPolicy& policy, const pipeline::CancellationToken& token,
                 std::string_view what, uint32_t sequence, Request&& request) {
  for (uint32_t attempt = 1;; ++attempt) {
    token.ThrowIfCancelled();
    try {
      return request();
    } catch (const Error& err) {
      if (!err.Retryable() || attempt > policy.retry_limit) {
        throw;
      }
      auto delay = BackoffDelay(policy, attempt);
      PublishEvent(EventCategory::kDiagnostics, EventSeverity::kWarning, "upload.retry",
                   std::string(what) + " failed, retrying",
                   {EventField("operation", std::string(what)), NumericField("part", sequence),
                    NumericField("attempt", attempt), NumericField("delay_ms", delay.count()),
                    EventField("cause", err.what())});
      if (!token.WaitFor(delay)) {
        token.ThrowIfCancelled();
      }
    }
  }
}

Error Classify(const std::exception& cause, int code, std::string context) {
  if (const auto* err = dynamic_cast<const Error*>(&cause)) {
    if (err->code == errors::kCancelled) {
      return *err;
    }
    return Reclassify(*err, code, std::move(context));
  }
  return MakeError(code, cause.what(), Retryability::kFatal, {std::move(context)});
}

}  // namespace

std::string_view UploadStateName(UploadState state) noexcept {
  switch (state) {
    case UploadState::kIdle:
      return "idle";
    case UploadState::kSessionOpen:
      return "session-open";
    case UploadState::kPartInFlight:
      return "part-in-flight";
    case UploadState::kCompleting:
      return "completing";
    case UploadState::kCompleted:
      return "completed";
    case UploadState::kAborted:
      return "aborted";
  }
  return "unknown";
}

std::chrono::milliseconds BackoffDelay(const RetryPolicy& policy, uint32_t retry) noexcept {
  auto delay = policy.base_delay;
  for (uint32_t i = 1; i < retry && delay < policy.max_delay; ++i) {
    delay *= 2;
  }
  return std::min(delay, policy.max_delay);
}

UploadCoordinator::UploadCoordinator(store::ObjectStore& store, UploadTarget target,
                                     uint32_t window, RetryPolicy policy,
                                     pipeline::CancellationToken& token, PartCallback on_uploaded)
    : store_(store),
      target_(std::move(target)),
      window_(window == 0 ? 1 : window),
      policy_(policy),
      token_(token),
      on_uploaded_(std::move(on_uploaded)),
      limits_(store.Limits()) {}

UploadCoordinator::~UploadCoordinator() { StopWorkers(); }

void UploadCoordinator::Fail(Error error) {
  PublishEvent(EventCategory::kLifecycle, EventSeverity::kError, "upload.failed", error.what(),
               {EventField("kind", std::string(ErrorKindName(error.code))),
                EventField("key", target_.key)});
  if (!token_.Cancel(error)) {
    token_.ThrowIfCancelled();  // an earlier failure owns the run
  }
  throw error;
}

void UploadCoordinator::OpenSession() {
  std::string id;
  try {
    id = WithRetries(policy_, token_, "open", 0, [&]() {
      return store_.OpenMultipartUpload(target_.bucket, target_.key, target_.storage_class);
    });
  } catch (const std::exception& e) {
    Fail(Classify(e, errors::kSessionOpenFailure, "stage=open"));
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    upload_id_ = id;
    state_ = UploadState::kSessionOpen;
  }
  PublishEvent(EventCategory::kLifecycle, EventSeverity::kInfo, "upload.session_open",
               "Multipart upload opened",
               {EventField("bucket", target_.bucket), EventField("key", target_.key),
                EventField("upload_id", id), EventField("storage_class", target_.storage_class)});
  StartWorkers();
}

void UploadCoordinator::StartWorkers() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (uint32_t i = 0; i < window_; ++i) {
    workers_.emplace_back([this]() { WorkerLoop(); });
  }
}

void UploadCoordinator::StopWorkers() {
  std::vector<std::thread> workers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
    workers.swap(workers_);
  }
  work_cv_.notify_all();
  for (auto& worker : workers) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

void UploadCoordinator::Submit(pipeline::Part part) {
  token_.ThrowIfCancelled();
  bool need_open = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == UploadState::kCompleting || state_ == UploadState::kCompleted ||
        state_ == UploadState::kAborted) {
      throw MakeError(errors::kInternal, "part submitted after the upload finished");
    }
    if (part.sequence != next_sequence_) {
      throw MakeError(errors::kInternal, "part " + std::to_string(part.sequence) +
                                             " submitted out of order, expected " +
                                             std::to_string(next_sequence_));
    }
    need_open = state_ == UploadState::kIdle;
  }
  if (part.sequence > limits_.max_parts) {
    Fail(MakeError(errors::kPartUploadFailure,
                   "upload needs more than " + std::to_string(limits_.max_parts) + " parts",
                   Retryability::kFatal, {"part=" + std::to_string(part.sequence)}));
  }
  if (need_open) {
    OpenSession();
  }

  std::unique_lock<std::mutex> lock(mutex_);
  WaitForSlot(lock);
  ++next_sequence_;
  ++in_flight_;
  in_flight_bytes_ += part.size();
  peak_in_flight_bytes_ = std::max(peak_in_flight_bytes_, in_flight_bytes_);
  status_[part.sequence] = pipeline::PartStatus::kPending;
  state_ = UploadState::kPartInFlight;
  queue_.push_back(std::move(part));
  lock.unlock();
  work_cv_.notify_one();
}

void UploadCoordinator::AwaitSlot() {
  std::unique_lock<std::mutex> lock(mutex_);
  WaitForSlot(lock);
}

void UploadCoordinator::WaitForSlot(std::unique_lock<std::mutex>& lock) {
  while (in_flight_ >= window_ && !token_.IsCancelled()) {
    slot_cv_.wait_for(lock, kPollInterval);
  }
  if (token_.IsCancelled()) {
    lock.unlock();
    token_.ThrowIfCancelled();
  }
}

void UploadCoordinator::WorkerLoop() {
  while (true) {
    pipeline::Part part;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      work_cv_.wait(lock, [this]() { return !queue_.empty() || stopping_; });
      if (queue_.empty()) {
        return;
      }
      part = std::move(queue_.front());
      queue_.pop_front();
      status_[part.sequence] = pipeline::PartStatus::kUploading;
    }

    UploadOne(part);

    {
      std::lock_guard<std::mutex> lock(mutex_);
      --in_flight_;
      in_flight_bytes_ -= part.size();
      if (in_flight_ == 0 && state_ == UploadState::kPartInFlight) {
        state_ = UploadState::kSessionOpen;
      }
    }
    slot_cv_.notify_all();
  }
}

void UploadCoordinator::UploadOne(const pipeline::Part& part) {
  const std::string id = upload_id();
  std::string tag;
  try {
    tag = WithRetries(policy_, token_, "upload_part", part.sequence, [&]() {
      return store_.UploadPart(id, part.sequence, part.view(), part.digest);
    });
  } catch (const std::exception& e) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      status_[part.sequence] = pipeline::PartStatus::kFailed;
    }
    if (token_.IsCancelled()) {
      return;  // another stage already failed; keep its error
    }
    auto error = Classify(e, errors::kPartUploadFailure, "part=" + std::to_string(part.sequence));
    PublishEvent(EventCategory::kLifecycle, EventSeverity::kError, "upload.part_failed",
                 error.what(), {NumericField("part", part.sequence)});
    token_.Cancel(std::move(error));
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    tags_[part.sequence] = tag;
    status_[part.sequence] = pipeline::PartStatus::kUploaded;
    bytes_uploaded_ += part.size();
  }
  PublishEvent(EventCategory::kTelemetry, EventSeverity::kDebug, "upload.part_done",
               "Part uploaded",
               {NumericField("part", part.sequence), NumericField("bytes", part.size())});
  if (on_uploaded_) {
    on_uploaded_(part);
  }
}

void UploadCoordinator::Finish() {
  std::vector<store::CompletedPart> parts;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    while (in_flight_ > 0 && !token_.IsCancelled()) {
      slot_cv_.wait_for(lock, kPollInterval);
    }
  }
  token_.ThrowIfCancelled();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == UploadState::kIdle) {
      throw MakeError(errors::kInternal, "finish called before any part was submitted");
    }
    if (state_ != UploadState::kSessionOpen) {
      throw MakeError(errors::kInternal, "finish called in state " +
                                             std::string(UploadStateName(state_)));
    }
    // std::map iterates in sequence order.
    uint32_t expected = 1;
    for (const auto& [sequence, tag] : tags_) {
      if (sequence != expected) {
        throw MakeError(errors::kInternal, "part " + std::to_string(expected) + " has no tag");
      }
      parts.push_back(store::CompletedPart{sequence, tag});
      ++expected;
    }
    if (expected != next_sequence_) {
      throw MakeError(errors::kInternal, "uploaded part count does not match submitted parts");
    }
    state_ = UploadState::kCompleting;
  }
  StopWorkers();
  CompleteSession(parts);
}

void UploadCoordinator::CompleteSession(const std::vector<store::CompletedPart>& parts) {
  const std::string id = upload_id();
  try {
    WithRetries(policy_, token_, "complete", 0, [&]() {
      store_.CompleteMultipartUpload(id, parts);
    });
  } catch (const std::exception& e) {
    Fail(Classify(e, errors::kCompletionFailure, "stage=complete"));
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = UploadState::kCompleted;
  }
  PublishEvent(EventCategory::kLifecycle, EventSeverity::kInfo, "upload.completed",
               "Multipart upload completed",
               {EventField("key", target_.key), EventField("upload_id", id),
                NumericField("parts", parts.size()), NumericField("bytes", bytes_uploaded())});
}

void UploadCoordinator::Abort() {
  std::string id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == UploadState::kIdle || state_ == UploadState::kCompleted ||
        state_ == UploadState::kAborted) {
      queue_.clear();
      stopping_ = true;
    } else {
      state_ = UploadState::kAborted;
      queue_.clear();
      id = upload_id_;
    }
  }
  // Parts still being sent finish or fail before the session is released,
  // so nothing lands in the store after the abort call.
  StopWorkers();
  if (id.empty()) {
    return;
  }
  try {
    store_.AbortMultipartUpload(id);
    PublishEvent(EventCategory::kLifecycle, EventSeverity::kWarning, "upload.aborted",
                 "Multipart upload aborted",
                 {EventField("key", target_.key), EventField("upload_id", id)});
  } catch (const std::exception& e) {
    PublishEvent(EventCategory::kLifecycle, EventSeverity::kError, "upload.abort_failed",
                 std::string("Abort of multipart upload failed: ") + e.what(),
                 {EventField("key", target_.key), EventField("upload_id", id)});
  }
}

UploadState UploadCoordinator::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::string UploadCoordinator::upload_id() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return upload_id_;
}

uint64_t UploadCoordinator::bytes_uploaded() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return bytes_uploaded_;
}

uint64_t UploadCoordinator::peak_in_flight_bytes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peak_in_flight_bytes_;
}

pipeline::PartStatus UploadCoordinator::StatusOf(uint32_t sequence) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = status_.find(sequence);
  return it == status_.end() ? pipeline::PartStatus::kPending : it->second;
}

std::vector<store::CompletedPart> UploadCoordinator::completed_parts() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<store::CompletedPart> out;
  for (const auto& [sequence, tag] : tags_) {
    out.push_back(store::CompletedPart{sequence, tag});
  }
  return out;
}

}  // namespace bits3::upload
