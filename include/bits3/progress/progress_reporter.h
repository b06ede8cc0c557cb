#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace bits3::progress {

enum class Stage : uint8_t { kRead = 0, kEncrypt = 1, kUpload = 2 };
inline constexpr size_t kStageCount = 3;

std::string_view StageName(Stage stage) noexcept;

struct StageSnapshot {
  uint64_t bytes{0};
  double bytes_per_second{0.0};
};

struct ProgressSnapshot {
  std::array<StageSnapshot, kStageCount> stages{};
  uint64_t expected_total{0};  // expected uploaded bytes, 0 when unknown
  std::chrono::milliseconds elapsed{0};
  std::optional<double> percent;
  std::optional<std::chrono::seconds> eta;
  bool final{false};

  const StageSnapshot& at(Stage stage) const { return stages[static_cast<size_t>(stage)]; }
};

using ProgressSink = std::function<void(const ProgressSnapshot&)>;

// Samples per-stage byte counters on a fixed tick and hands snapshots to a
// display thread through a single slot. Producers only touch atomics, and
// when the sink is still busy with the previous snapshot the pending one is
// replaced and counted as dropped.
class ProgressReporter {
public:
  ProgressReporter(ProgressSink sink, std::chrono::milliseconds interval);
  ~ProgressReporter();

  ProgressReporter(const ProgressReporter&) = delete;
  ProgressReporter& operator=(const ProgressReporter&) = delete;

  void Add(Stage stage, uint64_t bytes) noexcept {
    counters_[static_cast<size_t>(stage)].fetch_add(bytes, std::memory_order_relaxed);
  }
  uint64_t Total(Stage stage) const noexcept {
    return counters_[static_cast<size_t>(stage)].load(std::memory_order_relaxed);
  }
  void SetExpectedTotal(uint64_t bytes) noexcept { expected_total_.store(bytes); }

  void Start();
  // Stops both threads after delivering one last snapshot marked final.
  void Stop();

  uint64_t delivered() const noexcept { return delivered_.load(); }
  uint64_t dropped() const noexcept { return dropped_.load(); }

private:
  ProgressSnapshot Sample(bool final);
  void Offer(ProgressSnapshot snapshot);
  void TickerLoop();
  void DisplayLoop();

  ProgressSink sink_;
  const std::chrono::milliseconds interval_;
  std::array<std::atomic<uint64_t>, kStageCount> counters_{};
  std::atomic<uint64_t> expected_total_{0};
  std::atomic<uint64_t> delivered_{0};
  std::atomic<uint64_t> dropped_{0};

  // Sampling state, owned by whichever thread calls Sample().
  std::chrono::steady_clock::time_point started_{};
  std::chrono::steady_clock::time_point last_tick_{};
  std::array<uint64_t, kStageCount> last_bytes_{};
  std::array<double, kStageCount> last_rates_{};

  std::mutex mutex_;
  std::condition_variable tick_cv_;
  std::condition_variable slot_cv_;
  std::optional<ProgressSnapshot> slot_;
  bool stopping_{false};
  bool display_done_{false};
  bool running_{false};
  std::thread ticker_;
  std::thread display_;
};

// "\r<label>  <done> MB / <total> MB  (<pct>%)  <rate> MB/s  ETA mm:ss".
// Without a known total the size and percentage show the uploaded bytes only.
std::string RenderProgressLine(std::string_view label, const ProgressSnapshot& snapshot);

}  // namespace bits3::progress
