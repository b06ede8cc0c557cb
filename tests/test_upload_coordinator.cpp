#include "bits3/crypto/sha256.h"
#include "bits3/error.h"
#include "bits3/orchestrator/event_bus.h"
#include "bits3/store/io_util.h"
#include "bits3/store/memory_store.h"
#include "bits3/upload/upload_coordinator.h"
#include "test_support.h"

#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

using bits3::pipeline::CancellationToken;
using bits3::pipeline::Part;
using bits3::pipeline::PartStatus;
using bits3::store::MemoryObjectStore;
using bits3::upload::RetryPolicy;
using bits3::upload::UploadCoordinator;
using bits3::upload::UploadState;
using bits3::upload::UploadTarget;

constexpr size_t kPartBytes = 1000;

Part MakePart(uint32_t sequence) {
  auto bytes = bits3::testing::PatternBytes(kPartBytes, static_cast<uint8_t>(sequence));
  Part part;
  part.sequence = sequence;
  part.digest = bits3::crypto::SHA256_Hash(bytes);
  part.bytes = std::make_shared<const std::vector<uint8_t>>(std::move(bytes));
  return part;
}

RetryPolicy FastRetries(uint32_t limit = 3) {
  RetryPolicy policy;
  policy.retry_limit = limit;
  policy.base_delay = std::chrono::milliseconds(1);
  policy.max_delay = std::chrono::milliseconds(4);
  return policy;
}

UploadTarget Target() { return UploadTarget{"backups", "snap.tar.bs3", "STANDARD_IA"}; }

bool HasContext(const bits3::Error& e, const std::string& entry) {
  return std::find(e.context.begin(), e.context.end(), entry) != e.context.end();
}

// Submits |count| parts and finishes; returns the error that stopped the run.
std::optional<bits3::Error> RunParts(UploadCoordinator& coordinator, uint32_t count) {
  try {
    for (uint32_t sequence = 1; sequence <= count; ++sequence) {
      coordinator.Submit(MakePart(sequence));
    }
    coordinator.Finish();
  } catch (const bits3::Error& e) {
    return e;
  }
  return std::nullopt;
}

void TestOutOfOrderCompletion() {
  MemoryObjectStore store;
  store.CreateBucket("backups");
  MemoryObjectStore::Hooks hooks;
  hooks.before_upload_part = [](uint32_t sequence, uint32_t) {
    if (sequence == 1) {
      std::this_thread::sleep_for(std::chrono::milliseconds(80));
    }
  };
  store.SetHooks(hooks);

  CancellationToken token;
  std::atomic<uint64_t> reported{0};
  UploadCoordinator coordinator(store, Target(), 3, FastRetries(), token,
                                [&](const Part& part) { reported += part.size(); });
  auto error = RunParts(coordinator, 4);
  assert(!error.has_value());
  assert(coordinator.state() == UploadState::kCompleted);
  assert(coordinator.upload_id() == "upload-1");

  auto completed = store.last_completed_parts();
  assert(completed.size() == 4);
  for (uint32_t i = 0; i < completed.size(); ++i) {
    assert(completed[i].sequence == i + 1 && "completion list is sorted by sequence");
  }
  assert(coordinator.completed_parts().size() == 4);
  assert(coordinator.bytes_uploaded() == 4 * kPartBytes && reported.load() == 4 * kPartBytes);
  assert(coordinator.peak_in_flight_bytes() <= 3 * kPartBytes);
  assert(store.peak_concurrent_uploads() <= 3);
  assert(coordinator.StatusOf(2) == PartStatus::kUploaded);

  std::vector<uint8_t> expected;
  for (uint32_t sequence = 1; sequence <= 4; ++sequence) {
    auto part = MakePart(sequence);
    expected.insert(expected.end(), part.view().begin(), part.view().end());
  }
  assert(store.GetObject("backups", "snap.tar.bs3") == expected);

  coordinator.Abort();
  assert(store.counters().abort_calls == 0 && "abort after completion is a no-op");
}

void TestTransientFailureIsRetried() {
  MemoryObjectStore store;
  store.CreateBucket("backups");
  MemoryObjectStore::Hooks hooks;
  hooks.before_upload_part = [](uint32_t sequence, uint32_t attempt) {
    if (sequence == 2 && attempt == 1) {
      throw bits3::store::StoreRequestError("slow down", bits3::Retryability::kTransient, 503);
    }
  };
  store.SetHooks(hooks);

  auto& bus = bits3::orchestrator::EventBus::Instance();
  std::atomic<int> retries{0};
  auto id = bus.Subscribe([&](const bits3::orchestrator::Event& event) {
    if (event.event_id == "upload.retry") {
      ++retries;
    }
  });

  CancellationToken token;
  UploadCoordinator coordinator(store, Target(), 2, FastRetries(), token);
  assert(!RunParts(coordinator, 3).has_value());
  bus.Unsubscribe(id);

  assert(store.UploadCallsFor(2) == 2);
  assert(store.UploadCallsFor(1) == 1 && store.UploadCallsFor(3) == 1);
  assert(retries.load() == 1);
  assert(coordinator.state() == UploadState::kCompleted);
}

void TestPermanentFailureAborts() {
  MemoryObjectStore store;
  store.CreateBucket("backups");
  MemoryObjectStore::Hooks hooks;
  hooks.before_upload_part = [](uint32_t sequence, uint32_t) {
    if (sequence == 2) {
      throw bits3::store::StoreRequestError("access denied", bits3::Retryability::kFatal, 403);
    }
  };
  store.SetHooks(hooks);

  CancellationToken token;
  UploadCoordinator coordinator(store, Target(), 2, FastRetries(), token);
  auto error = RunParts(coordinator, 5);
  assert(error.has_value());
  assert(error->code == bits3::errors::kPartUploadFailure);
  assert(HasContext(*error, "part=2"));
  assert(error->native_code == 403);
  assert(token.IsCancelled());
  assert(store.UploadCallsFor(2) == 1 && "fatal errors are not retried");
  assert(coordinator.StatusOf(2) == PartStatus::kFailed);

  coordinator.Abort();
  coordinator.Abort();
  const auto counters = store.counters();
  assert(counters.abort_calls == 1);
  assert(counters.complete_calls == 0);
  assert(coordinator.state() == UploadState::kAborted);
  assert(store.open_upload_count() == 0);
  assert(!store.GetObject("backups", "snap.tar.bs3").has_value());
}

void TestRetryBudgetExhausted() {
  MemoryObjectStore store;
  store.CreateBucket("backups");
  MemoryObjectStore::Hooks hooks;
  hooks.before_upload_part = [](uint32_t sequence, uint32_t) {
    if (sequence == 1) {
      throw bits3::store::StoreRequestError("timeout", bits3::Retryability::kRetryable);
    }
  };
  store.SetHooks(hooks);

  CancellationToken token;
  UploadCoordinator coordinator(store, Target(), 1, FastRetries(2), token);
  auto error = RunParts(coordinator, 1);
  assert(error.has_value() && error->code == bits3::errors::kPartUploadFailure);
  assert(!error->Retryable());
  assert(store.UploadCallsFor(1) == 3 && "one attempt plus two retries");
  coordinator.Abort();
  assert(store.counters().abort_calls == 1);
}

void TestSessionOpenFailure() {
  MemoryObjectStore store;
  store.CreateBucket("backups");
  MemoryObjectStore::Hooks hooks;
  hooks.before_open = [](const std::string&, const std::string&) {
    throw bits3::store::StoreRequestError("forbidden", bits3::Retryability::kFatal, 403);
  };
  store.SetHooks(hooks);

  CancellationToken token;
  UploadCoordinator coordinator(store, Target(), 2, FastRetries(), token);
  auto error = RunParts(coordinator, 2);
  assert(error.has_value() && error->code == bits3::errors::kSessionOpenFailure);
  assert(HasContext(*error, "stage=open"));
  assert(coordinator.state() == UploadState::kIdle);
  coordinator.Abort();
  assert(store.counters().abort_calls == 0 && "nothing was opened");
  assert(store.counters().upload_part_calls == 0);
}

void TestCompletionFailure() {
  MemoryObjectStore store;
  store.CreateBucket("backups");
  MemoryObjectStore::Hooks hooks;
  hooks.before_complete = [](const std::vector<bits3::store::CompletedPart>&) {
    throw bits3::store::StoreRequestError("invalid part order", bits3::Retryability::kFatal, 400);
  };
  store.SetHooks(hooks);

  CancellationToken token;
  UploadCoordinator coordinator(store, Target(), 2, FastRetries(), token);
  auto error = RunParts(coordinator, 2);
  assert(error.has_value() && error->code == bits3::errors::kCompletionFailure);
  assert(HasContext(*error, "stage=complete"));
  assert(coordinator.state() == UploadState::kCompleting);
  coordinator.Abort();
  assert(store.counters().complete_calls == 1);
  assert(store.counters().abort_calls == 1);
  assert(coordinator.state() == UploadState::kAborted);
}

void TestWindowBackpressure() {
  MemoryObjectStore store;
  store.CreateBucket("backups");
  std::atomic<bool> release{false};
  MemoryObjectStore::Hooks hooks;
  hooks.before_upload_part = [&](uint32_t sequence, uint32_t) {
    while (sequence == 1 && !release.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
  };
  store.SetHooks(hooks);

  CancellationToken token;
  UploadCoordinator coordinator(store, Target(), 1, FastRetries(), token);
  coordinator.Submit(MakePart(1));
  std::atomic<bool> second_accepted{false};
  std::thread producer([&]() {
    coordinator.Submit(MakePart(2));
    second_accepted = true;
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  assert(!second_accepted.load() && "a full window blocks the producer");
  assert(coordinator.peak_in_flight_bytes() == kPartBytes);
  release = true;
  producer.join();
  coordinator.Finish();
  assert(coordinator.peak_in_flight_bytes() == kPartBytes);
  assert(store.peak_concurrent_uploads() == 1);
}

void TestAwaitSlot() {
  MemoryObjectStore store;
  store.CreateBucket("backups");
  std::atomic<bool> release{false};
  MemoryObjectStore::Hooks hooks;
  hooks.before_upload_part = [&](uint32_t sequence, uint32_t) {
    while (sequence == 1 && !release.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
  };
  store.SetHooks(hooks);

  {
    CancellationToken token;
    UploadCoordinator coordinator(store, Target(), 1, FastRetries(), token);
    coordinator.AwaitSlot();  // nothing in flight yet
    coordinator.Submit(MakePart(1));
    std::atomic<bool> slot_free{false};
    std::thread producer([&]() {
      coordinator.AwaitSlot();
      slot_free = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    assert(!slot_free.load() && "no slot while the window is full");
    release = true;
    producer.join();
    coordinator.Submit(MakePart(2));
    coordinator.Finish();
    assert(coordinator.state() == UploadState::kCompleted);
  }

  release = false;
  {
    CancellationToken token;
    UploadCoordinator coordinator(store, Target(), 1, FastRetries(), token);
    coordinator.Submit(MakePart(1));
    std::optional<bits3::Error> stopped;
    std::thread producer([&]() {
      try {
        coordinator.AwaitSlot();
      } catch (const bits3::Error& e) {
        stopped = e;
      }
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    token.RequestCancel("stop");
    producer.join();
    assert(stopped.has_value() && stopped->code == bits3::errors::kCancelled);
    release = true;
    coordinator.Abort();
    assert(coordinator.state() == UploadState::kAborted);
  }
}

void TestGuards() {
  MemoryObjectStore store(bits3::store::StoreLimits{1, 1024 * 1024, 2});
  store.CreateBucket("backups");

  {
    CancellationToken token;
    UploadCoordinator coordinator(store, Target(), 2, FastRetries(), token);
    auto error = RunParts(coordinator, 3);
    assert(error.has_value() && error->code == bits3::errors::kPartUploadFailure);
    assert(HasContext(*error, "part=3"));
    coordinator.Abort();
  }

  {
    CancellationToken token;
    UploadCoordinator coordinator(store, Target(), 2, FastRetries(), token);
    bool rejected = false;
    try {
      coordinator.Submit(MakePart(2));
    } catch (const bits3::Error& e) {
      rejected = e.code == bits3::errors::kInternal;
    }
    assert(rejected && "parts must arrive in sequence order");
  }

  {
    CancellationToken token;
    token.RequestCancel("stop");
    UploadCoordinator coordinator(store, Target(), 2, FastRetries(), token);
    auto error = RunParts(coordinator, 1);
    assert(error.has_value() && error->code == bits3::errors::kCancelled);
  }
}

void TestBackoffDelay() {
  RetryPolicy policy;
  policy.base_delay = std::chrono::milliseconds(200);
  policy.max_delay = std::chrono::milliseconds(10'000);
  using bits3::upload::BackoffDelay;
  assert(BackoffDelay(policy, 1).count() == 200);
  assert(BackoffDelay(policy, 2).count() == 400);
  assert(BackoffDelay(policy, 3).count() == 800);
  assert(BackoffDelay(policy, 6).count() == 6400);
  assert(BackoffDelay(policy, 7).count() == 10'000);
  assert(BackoffDelay(policy, 40).count() == 10'000);
}

}  // namespace

int main() {
  TestBackoffDelay();
  TestOutOfOrderCompletion();
  TestTransientFailureIsRetried();
  TestPermanentFailureAborts();
  TestRetryBudgetExhausted();
  TestSessionOpenFailure();
  TestCompletionFailure();
  TestWindowBackpressure();
  TestAwaitSlot();
  TestGuards();
  assert(bits3::upload::UploadStateName(UploadState::kPartInFlight) == "part-in-flight");
  std::cout << "upload coordinator tests ok\n";
  return 0;
}
