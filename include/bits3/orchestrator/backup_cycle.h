#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "bits3/config.h"
#include "bits3/orchestrator/pipeline.h"
#include "bits3/store/object_store.h"

namespace bits3::orchestrator {

inline constexpr uint32_t kDefaultUploadIntervalDays = 90;
inline constexpr uint32_t kDefaultKeepUploads = 1;
inline constexpr const char* kLastSnapshotName = "last_snapshot";

// Finds the first "last_snapshot" entry below |backup_root| (the root itself
// first, then subdirectories in name order) and returns its resolved target.
// The entry must be a symlink to a directory; anything else throws
// errors::kSourceUnreadable.
std::filesystem::path ResolveSnapshotDirectory(const std::filesystem::path& backup_root);

// True when |objects| is empty or the newest one is more than
// |interval_days| whole days older than |now|.
bool UploadIsDue(const std::vector<store::ObjectInfo>& objects, uint32_t interval_days,
                 std::chrono::system_clock::time_point now);

struct PruneResult {
  std::vector<std::string> deleted;
  std::vector<std::string> failed;
};

// Deletes all but the |keep| most recently modified objects. A failed
// delete is logged and recorded, never thrown.
PruneResult PruneOldUploads(store::ObjectStore& store, const std::string& bucket, uint32_t keep);

struct CycleConfig {
  std::filesystem::path backup_root;
  // source_path is filled from the snapshot; an empty key defaults to
  // "<snapshot-name>.tar.bs3".
  PipelineConfig pipeline;
  uint32_t upload_interval_days{kDefaultUploadIntervalDays};
  uint32_t keep{kDefaultKeepUploads};
};

enum class CycleOutcome : uint8_t { kUploaded, kNotDue, kFailed };

std::string_view CycleOutcomeName(CycleOutcome outcome) noexcept;

struct CycleReport {
  CycleOutcome outcome{CycleOutcome::kFailed};
  std::optional<Error> error;
  std::optional<RunReport> run;
  std::filesystem::path snapshot;
  PruneResult pruned;
};

// Bucket check, interval check, snapshot lookup, upload, retention.
CycleReport RunBackupCycle(const CycleConfig& config, store::ObjectStore& store,
                           PipelineOptions options = {},
                           std::chrono::system_clock::time_point now =
                               std::chrono::system_clock::now());

}  // namespace bits3::orchestrator
