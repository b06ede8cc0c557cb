#include "bits3/progress/progress_reporter.h"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>

namespace bits3::progress {

namespace {

constexpr double kMegabyte = 1024.0 * 1024.0;

std::string FormatEta(std::chrono::seconds eta) {
  auto total = eta.count();
  std::ostringstream oss;
  if (total >= 3600) {
    oss << total / 3600 << ':';
    total %= 3600;
    oss << std::setw(2) << std::setfill('0');
  }
  oss << total / 60 << ':' << std::setw(2) << std::setfill('0') << total % 60;
  return oss.str();
}

}  // namespace

std::string_view StageName(Stage stage) noexcept {
  switch (stage) {
    case Stage::kRead:
      return "read";
    case Stage::kEncrypt:
      return "encrypt";
    case Stage::kUpload:
      return "upload";
  }
  return "unknown";
}

ProgressReporter::ProgressReporter(ProgressSink sink, std::chrono::milliseconds interval)
    : sink_(std::move(sink)), interval_(interval.count() > 0 ? interval : std::chrono::milliseconds(1000)) {}

ProgressReporter::~ProgressReporter() { Stop(); }

void ProgressReporter::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) {
    return;
  }
  running_ = true;
  started_ = std::chrono::steady_clock::now();
  last_tick_ = started_;
  ticker_ = std::thread([this]() { TickerLoop(); });
  display_ = std::thread([this]() { DisplayLoop(); });
}

void ProgressReporter::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
      return;
    }
    running_ = false;
    stopping_ = true;
  }
  tick_cv_.notify_all();
  if (ticker_.joinable()) {
    ticker_.join();
  }
  Offer(Sample(true));
  {
    std::lock_guard<std::mutex> lock(mutex_);
    display_done_ = true;
  }
  slot_cv_.notify_all();
  if (display_.joinable()) {
    display_.join();
  }
}

ProgressSnapshot ProgressReporter::Sample(bool final) {
  const auto now = std::chrono::steady_clock::now();
  const double dt = std::chrono::duration<double>(now - last_tick_).count();

  ProgressSnapshot snap;
  snap.final = final;
  snap.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - started_);
  snap.expected_total = expected_total_.load();
  for (size_t i = 0; i < kStageCount; ++i) {
    const uint64_t bytes = counters_[i].load(std::memory_order_relaxed);
    // A stop right after a tick would give a meaningless rate; keep the last one.
    if (dt > 0.01) {
      last_rates_[i] = static_cast<double>(bytes - last_bytes_[i]) / dt;
      last_bytes_[i] = bytes;
    }
    snap.stages[i] = StageSnapshot{bytes, last_rates_[i]};
  }
  if (dt > 0.01) {
    last_tick_ = now;
  }

  const auto& upload = snap.at(Stage::kUpload);
  if (snap.expected_total > 0) {
    snap.percent = std::min(100.0, 100.0 * static_cast<double>(upload.bytes) /
                                       static_cast<double>(snap.expected_total));
    if (upload.bytes >= snap.expected_total) {
      snap.eta = std::chrono::seconds(0);
    } else if (upload.bytes_per_second > 0.0) {
      const double remaining = static_cast<double>(snap.expected_total - upload.bytes);
      snap.eta = std::chrono::seconds(static_cast<int64_t>(remaining / upload.bytes_per_second));
    }
  }
  return snap;
}

void ProgressReporter::Offer(ProgressSnapshot snapshot) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (slot_) {
      dropped_.fetch_add(1);
    }
    slot_ = std::move(snapshot);
  }
  slot_cv_.notify_one();
}

void ProgressReporter::TickerLoop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stopping_) {
    if (tick_cv_.wait_for(lock, interval_, [this]() { return stopping_; })) {
      return;
    }
    lock.unlock();
    Offer(Sample(false));
    lock.lock();
  }
}

void ProgressReporter::DisplayLoop() {
  while (true) {
    ProgressSnapshot snapshot;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      slot_cv_.wait(lock, [this]() { return slot_.has_value() || display_done_; });
      if (!slot_) {
        return;
      }
      snapshot = std::move(*slot_);
      slot_.reset();
    }
    if (sink_) {
      sink_(snapshot);
    }
    delivered_.fetch_add(1);
  }
}

std::string RenderProgressLine(std::string_view label, const ProgressSnapshot& snapshot) {
  const auto& upload = snapshot.at(Stage::kUpload);
  std::ostringstream oss;
  oss << '\r' << label << "  " << std::fixed << std::setprecision(1)
      << static_cast<double>(upload.bytes) / kMegabyte << " MB";
  if (snapshot.expected_total > 0) {
    oss << " / " << static_cast<double>(snapshot.expected_total) / kMegabyte << " MB";
  }
  if (snapshot.percent) {
    oss << "  (" << std::setprecision(2) << *snapshot.percent << "%)";
  }
  oss << "  " << std::setprecision(1) << upload.bytes_per_second / kMegabyte << " MB/s";
  if (snapshot.eta) {
    oss << "  ETA " << FormatEta(*snapshot.eta);
  }
  return oss.str();
}

}  // namespace bits3::progress
