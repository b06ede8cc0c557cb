#include "bits3/pipeline/cancellation.h"

#include <utility>

namespace bits3::pipeline {

bool CancellationToken::Cancel(Error reason) {
  std::vector<std::function<void()>> callbacks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reason_) {
      return false;
    }
    reason_.emplace(std::move(reason));
    cancelled_.store(true, std::memory_order_release);
    callbacks.swap(callbacks_);
  }
  cv_.notify_all();
  for (auto& fn : callbacks) {
    fn();
  }
  return true;
}

bool CancellationToken::RequestCancel(std::string why) {
  return Cancel(MakeError(errors::kCancelled, std::move(why)));
}

std::optional<Error> CancellationToken::Reason() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reason_;
}

void CancellationToken::ThrowIfCancelled() const {
  if (!IsCancelled()) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  throw *reason_;
}

bool CancellationToken::WaitFor(std::chrono::milliseconds delay) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return !cv_.wait_for(lock, delay, [this]() { return reason_.has_value(); });
}

void CancellationToken::OnCancel(std::function<void()> fn) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!reason_) {
      callbacks_.push_back(std::move(fn));
      return;
    }
  }
  fn();
}

}  // namespace bits3::pipeline
