#include "bits3/orchestrator/backup_cycle.h"

#include <algorithm>
#include <system_error>
#include <utility>

#include "bits3/common.h"
#include "bits3/orchestrator/event_bus.h"

namespace bits3::orchestrator {

namespace {

[[noreturn]] void ThrowNotBackup(const std::filesystem::path& root, const std::string& why) {
  throw MakeError(errors::kSourceUnreadable,
                  PathToUtf8String(root) + " does not look like a Back In Time directory: " + why,
                  Retryability::kFatal, {"stage=snapshot"});
}

std::optional<std::filesystem::path> FindLastSnapshot(const std::filesystem::path& dir) {
  std::error_code ec;
  const auto candidate = dir / kLastSnapshotName;
  if (std::filesystem::exists(std::filesystem::symlink_status(candidate, ec))) {
    return candidate;
  }
  std::vector<std::filesystem::path> children;
  for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    if (it->is_directory(ec) && !it->is_symlink(ec)) {
      children.push_back(it->path());
    }
  }
  std::sort(children.begin(), children.end());
  for (const auto& child : children) {
    if (auto found = FindLastSnapshot(child)) {
      return found;
    }
  }
  return std::nullopt;
}

}  // namespace

std::filesystem::path ResolveSnapshotDirectory(const std::filesystem::path& backup_root) {
  std::error_code ec;
  if (!std::filesystem::is_directory(backup_root, ec)) {
    ThrowNotBackup(backup_root, "not a directory");
  }
  auto found = FindLastSnapshot(backup_root);
  if (!found) {
    ThrowNotBackup(backup_root, "no last_snapshot entry");
  }
  if (!std::filesystem::is_symlink(*found, ec)) {
    ThrowNotBackup(backup_root, PathToUtf8String(*found) + " is not a symlink");
  }
  auto resolved = std::filesystem::canonical(*found, ec);
  if (ec || !std::filesystem::is_directory(resolved, ec)) {
    ThrowNotBackup(backup_root, PathToUtf8String(*found) + " does not point to a directory");
  }
  return resolved;
}

bool UploadIsDue(const std::vector<store::ObjectInfo>& objects, uint32_t interval_days,
                 std::chrono::system_clock::time_point now) {
  if (objects.empty()) {
    return true;
  }
  auto newest = std::max_element(objects.begin(), objects.end(),
                                 [](const store::ObjectInfo& a, const store::ObjectInfo& b) {
                                   return a.last_modified < b.last_modified;
                                 });
  const auto age = std::chrono::floor<std::chrono::days>(now - newest->last_modified);
  if (age.count() > static_cast<int64_t>(interval_days)) {
    return true;
  }
  PublishEvent(EventCategory::kLifecycle, EventSeverity::kInfo, "cycle.not_due",
               "Last upload was only " + std::to_string(age.count()) + " days ago. Nothing to do.",
               {EventField("newest", newest->key),
                NumericField("age_days", static_cast<uint64_t>(std::max<int64_t>(0, age.count())))});
  return false;
}

PruneResult PruneOldUploads(store::ObjectStore& store, const std::string& bucket, uint32_t keep) {
  PruneResult result;
  auto objects = store.ListObjects(bucket);
  if (objects.size() <= keep) {
    return result;
  }
  std::sort(objects.begin(), objects.end(),
            [](const store::ObjectInfo& a, const store::ObjectInfo& b) {
              return a.last_modified < b.last_modified;
            });
  const size_t stale = objects.size() - keep;
  for (size_t i = 0; i < stale; ++i) {
    const auto& key = objects[i].key;
    try {
      store.DeleteObject(bucket, key);
      result.deleted.push_back(key);
      PublishEvent(EventCategory::kLifecycle, EventSeverity::kInfo, "cycle.pruned",
                   "Deleted old upload", {EventField("bucket", bucket), EventField("key", key)});
    } catch (const std::exception& e) {
      result.failed.push_back(key);
      PublishEvent(EventCategory::kLifecycle, EventSeverity::kWarning, "cycle.prune_failed",
                   std::string("Deleting old upload failed: ") + e.what(),
                   {EventField("bucket", bucket), EventField("key", key)});
    }
  }
  return result;
}

std::string_view CycleOutcomeName(CycleOutcome outcome) noexcept {
  switch (outcome) {
    case CycleOutcome::kUploaded:
      return "uploaded";
    case CycleOutcome::kNotDue:
      return "not-due";
    case CycleOutcome::kFailed:
      return "failed";
  }
  return "unknown";
}

CycleReport RunBackupCycle(const CycleConfig& config, store::ObjectStore& store,
                           PipelineOptions options, std::chrono::system_clock::time_point now) {
  CycleReport report;
  const auto& bucket = config.pipeline.bucket;
  try {
    if (config.keep == 0) {
      throw MakeError(errors::kConfiguration, "keep: must be at least 1", Retryability::kFatal,
                      {"field=keep"});
    }
    try {
      store.CheckBucket(bucket);
    } catch (const Error& e) {
      throw Reclassify(e, errors::kSessionOpenFailure, "stage=check_bucket");
    }

    std::vector<store::ObjectInfo> existing;
    try {
      existing = store.ListObjects(bucket);
    } catch (const Error& e) {
      throw Reclassify(e, errors::kSessionOpenFailure, "stage=list");
    }
    if (!UploadIsDue(existing, config.upload_interval_days, now)) {
      report.outcome = CycleOutcome::kNotDue;
      return report;
    }

    report.snapshot = ResolveSnapshotDirectory(config.backup_root);
    PipelineConfig pipeline_config = config.pipeline;
    pipeline_config.source_path = report.snapshot;
    if (pipeline_config.key.empty()) {
      pipeline_config.key = DefaultObjectKey(report.snapshot);
    }

    Pipeline pipeline(std::move(pipeline_config), store, std::move(options));
    report.run = pipeline.Run();
    if (!report.run->success) {
      report.error = report.run->error;
      return report;
    }
  } catch (const Error& e) {
    report.error = e;
    PublishEvent(EventCategory::kLifecycle, EventSeverity::kError, "cycle.failed", e.what(),
                 {EventField("kind", std::string(ErrorKindName(e.code)))});
    return report;
  }

  report.outcome = CycleOutcome::kUploaded;
  try {
    report.pruned = PruneOldUploads(store, bucket, config.keep);
  } catch (const std::exception& e) {
    PublishEvent(EventCategory::kLifecycle, EventSeverity::kWarning, "cycle.prune_failed",
                 std::string("Listing uploads for retention failed: ") + e.what(),
                 {EventField("bucket", bucket)});
  }
  return report;
}

}  // namespace bits3::orchestrator
