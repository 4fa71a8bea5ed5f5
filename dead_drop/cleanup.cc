// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "dead_drop/cleanup.h"

#include <utility>

#include <absl/strings/str_join.h>
#include <base/logging.h>

#include "dead_drop/status.h"
#include "dead_drop/utils.h"
#include "dead_drop/volatile_store.h"

namespace dead_drop {

namespace {

// Random overwrite first, so the blocks never get released with their old
// content.
absl::Status EraseFile(const base::FilePath& path) {
  absl::Status status = Utils::Get()->OverwriteWithRandom(path);
  if (!status.ok())
    return status;

  return Utils::Get()->DeleteFile(path);
}

}  // namespace

absl::Status CleanupReport::ToStatus() const {
  if (ok())
    return absl::OkStatus();

  return absl::InternalError("Cleanup steps failed: " +
                             absl::StrJoin(failed_steps, ", "));
}

CleanupAction::CleanupAction(EncryptionService* encryption)
    : encryption_(encryption) {
  DCHECK(encryption_);
}

CleanupReport CleanupAction::Run(const DestructUnit& unit,
                                 const CleanupScope& scope) {
  LOG(INFO) << "Running cleanup for " << unit;
  LOG_IF(INFO, !scope.unmount_volume) << "Leaving " << unit.mount_path();
  LOG_IF(INFO, !scope.close_mapping) << "Leaving " << unit.mapper_name();

  CleanupReport report;
  const std::pair<const char*, absl::Status> steps[] = {
      {"unmount volume", scope.unmount_volume
                             ? UnmountVolume(unit.mount_path())
                             : absl::OkStatus()},
      {"close mapping", scope.close_mapping ? CloseMapping(unit.mapper_name())
                                            : absl::OkStatus()},
      {"erase image", EraseImage(unit.image_path())},
      {"erase volatile store contents",
       EraseStoreContents(unit.ramdisk_path())},
      {"remove volatile store", TeardownVolatileStore(unit.ramdisk_path())},
  };

  for (const auto& [name, status] : steps) {
    if (status.ok())
      continue;
    LOG(ERROR) << "Cleanup step \"" << name << "\" failed: " << status;
    report.failed_steps.push_back(name);
  }

  LOG_IF(INFO, report.ok()) << "Cleanup completed";
  return report;
}

absl::Status CleanupAction::UnmountVolume(const base::FilePath& mount_path) {
  absl::StatusOr<bool> mounted = Utils::Get()->IsMountPoint(mount_path);
  if (!mounted.ok())
    return mounted.status();

  if (*mounted) {
    absl::Status status = Utils::Get()->Umount(mount_path.value());
    if (!status.ok())
      return status;
    LOG(INFO) << "Unmounted " << mount_path;
  }

  // Only an empty directory is removed. Anything left inside it lives on the
  // persistent file system and is not ours.
  if (!Utils::Get()->DirectoryExists(mount_path).ok())
    return absl::OkStatus();

  return Utils::Get()->DeleteFile(mount_path);
}

absl::Status CleanupAction::CloseMapping(const std::string& mapper_name) {
  if (!encryption_->IsOpen(mapper_name))
    return absl::OkStatus();

  absl::Status status = encryption_->Close(mapper_name);
  if (!status.ok())
    return status;

  LOG(INFO) << "Closed mapping " << mapper_name;
  return absl::OkStatus();
}

absl::Status CleanupAction::EraseImage(const base::FilePath& image_path) {
  if (!Utils::Get()->PathExists(image_path).ok())
    return absl::OkStatus();

  absl::Status status = EraseFile(image_path);
  if (!status.ok())
    return status;

  LOG(INFO) << "Erased " << image_path;
  return absl::OkStatus();
}

absl::Status CleanupAction::EraseStoreContents(
    const base::FilePath& ramdisk_path) {
  absl::StatusOr<std::vector<base::FilePath>> files =
      Utils::Get()->EnumerateFiles(ramdisk_path);
  if (absl::IsNotFound(files.status()))
    return absl::OkStatus();
  if (!files.ok())
    return files.status();

  // Keep going past a failing file so the others still get erased.
  absl::Status result = absl::OkStatus();
  for (const base::FilePath& file : *files) {
    absl::Status status = EraseFile(file);
    if (!status.ok()) {
      LOG(ERROR) << "Cannot erase " << file << ": " << status;
      result.Update(status);
    }
  }

  VLOG(1) << "Erased " << files->size() << " files in " << ramdisk_path;
  return result;
}

}  // namespace dead_drop
