#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

#include "bits3/error.h"

namespace bits3::pipeline {

// Shared stop signal for one pipeline run. The first Cancel() wins and its
// error becomes the run's reported failure; later calls are ignored.
class CancellationToken {
public:
  CancellationToken() = default;
  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  // Returns true if this call recorded |reason|.
  bool Cancel(Error reason);
  // User interrupt: cancels with errors::kCancelled.
  bool RequestCancel(std::string why = "interrupted");

  bool IsCancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }
  std::optional<Error> Reason() const;

  // Throws the recorded reason if cancelled.
  void ThrowIfCancelled() const;

  // Sleeps for |delay| unless cancelled first. Returns false if cancelled.
  bool WaitFor(std::chrono::milliseconds delay) const;

  // Runs |fn| on cancellation, immediately if already cancelled. Callbacks
  // run on the cancelling thread without the token's lock held.
  void OnCancel(std::function<void()> fn);

private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  std::atomic<bool> cancelled_{false};
  std::optional<Error> reason_;
  std::vector<std::function<void()>> callbacks_;
};

}  // namespace bits3::pipeline
