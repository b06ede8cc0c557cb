#include "bits3/progress/progress_reporter.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace bits3::progress;

constexpr uint64_t kMiB = 1024 * 1024;

void TestRenderLine() {
  ProgressSnapshot snap;
  snap.stages[static_cast<size_t>(Stage::kUpload)] = StageSnapshot{5 * kMiB, 2.5 * kMiB};
  snap.expected_total = 20 * kMiB;
  snap.percent = 25.0;
  snap.eta = std::chrono::seconds(75);
  assert(RenderProgressLine("photos", snap) ==
         "\rphotos  5.0 MB / 20.0 MB  (25.00%)  2.5 MB/s  ETA 1:15");

  snap.eta = std::chrono::seconds(3 * 3600 + 5 * 60 + 9);
  assert(RenderProgressLine("photos", snap).find("ETA 3:05:09") != std::string::npos);

  ProgressSnapshot unknown;
  unknown.stages[static_cast<size_t>(Stage::kUpload)] = StageSnapshot{kMiB / 2, 0.0};
  assert(RenderProgressLine("x", unknown) == "\rx  0.5 MB  0.0 MB/s");
}

void TestFinalSnapshot() {
  std::mutex mutex;
  std::vector<ProgressSnapshot> seen;
  ProgressReporter reporter(
      [&](const ProgressSnapshot& snap) {
        std::lock_guard<std::mutex> lock(mutex);
        seen.push_back(snap);
      },
      std::chrono::milliseconds(10));
  reporter.SetExpectedTotal(1000);
  reporter.Start();
  reporter.Add(Stage::kRead, 900);
  reporter.Add(Stage::kEncrypt, 950);
  reporter.Add(Stage::kUpload, 400);
  std::this_thread::sleep_for(std::chrono::milliseconds(60));
  reporter.Add(Stage::kUpload, 600);
  reporter.Stop();
  reporter.Stop();

  std::lock_guard<std::mutex> lock(mutex);
  assert(seen.size() >= 2 && "ticks arrive while running");
  const auto& last = seen.back();
  assert(last.final);
  for (size_t i = 0; i + 1 < seen.size(); ++i) {
    assert(!seen[i].final);
  }
  assert(last.at(Stage::kRead).bytes == 900);
  assert(last.at(Stage::kEncrypt).bytes == 950);
  assert(last.at(Stage::kUpload).bytes == 1000);
  assert(last.percent.has_value() && *last.percent == 100.0);
  assert(last.eta.has_value() && last.eta->count() == 0);
  assert(reporter.Total(Stage::kUpload) == 1000);
  assert(reporter.delivered() == seen.size());
}

void TestSlowSinkDropsSnapshots() {
  std::atomic<int> calls{0};
  ProgressReporter reporter(
      [&](const ProgressSnapshot&) {
        ++calls;
        std::this_thread::sleep_for(std::chrono::milliseconds(60));
      },
      std::chrono::milliseconds(5));
  reporter.Start();
  std::atomic<bool> done{false};
  // Producers never wait on the display.
  std::thread producer([&]() {
    for (int i = 0; i < 1000; ++i) {
      reporter.Add(Stage::kUpload, 1);
    }
    done = true;
  });
  producer.join();
  assert(done.load());
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  reporter.Stop();
  assert(reporter.dropped() > 0);
  assert(reporter.delivered() == static_cast<uint64_t>(calls.load()));
  assert(reporter.Total(Stage::kUpload) == 1000);
}

}  // namespace

int main() {
  TestRenderLine();
  TestFinalSnapshot();
  TestSlowSinkDropsSnapshots();
  assert(StageName(Stage::kEncrypt) == "encrypt");
  std::cout << "progress tests ok\n";
  return 0;
}
