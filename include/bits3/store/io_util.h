#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <string>

#include "bits3/error.h"

namespace bits3::store {

// Maps an errno value to how a store caller should treat the failure.
Retryability ClassifyNativeError(int native);

// bits3::Error with code errors::kStoreRequestFailed.
Error StoreRequestError(std::string message, Retryability retry = Retryability::kFatal,
                        std::optional<int> native = std::nullopt);

struct AtomicWriteHooks {
  std::function<void(const std::filesystem::path& temp, const std::filesystem::path& target)>
      before_rename;
};

// Writes |payload| to a temporary file next to |target|, fsyncs it and
// renames it into place, then syncs the directory.
void AtomicWriteFile(const std::filesystem::path& target, std::span<const uint8_t> payload,
                     const AtomicWriteHooks& hooks = {});

// Produces |target| by concatenating |sources| in order through a synced
// temporary file and a rename.
void AtomicConcatenate(const std::filesystem::path& target,
                       std::span<const std::filesystem::path> sources,
                       const AtomicWriteHooks& hooks = {});

void SyncDirectory(const std::filesystem::path& dir);

}  // namespace bits3::store
