// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef DEAD_DROP_CLEANUP_H_
#define DEAD_DROP_CLEANUP_H_

#include <string>
#include <vector>

#include <absl/status/status.h>

#include "dead_drop/destruct_unit.h"
#include "dead_drop/encryption_service.h"

namespace dead_drop {

// Outcome of one CleanupAction::Run(). Lists the steps that failed, in order.
struct CleanupReport {
  std::vector<std::string> failed_steps;

  bool ok() const { return failed_steps.empty(); }
  // Single status summarizing the report.
  absl::Status ToStatus() const;
};

// Parts of a session a cleanup may touch besides the image and the volatile
// store. A session that aborts early only owns what it created.
struct CleanupScope {
  bool unmount_volume = true;
  bool close_mapping = true;
};

// Erases everything a dead-drop session may have left behind: the mounted
// volume, the mapping, the image and the volatile store. Every step checks
// the current state first and does nothing when its target is already gone,
// so running the action again is harmless. A failing step is logged and the
// following steps still run.
class CleanupAction {
 public:
  explicit CleanupAction(EncryptionService* encryption);
  CleanupAction(const CleanupAction&) = delete;
  CleanupAction& operator=(const CleanupAction&) = delete;

  CleanupReport Run(const DestructUnit& unit,
                    const CleanupScope& scope = CleanupScope());

 private:
  absl::Status UnmountVolume(const base::FilePath& mount_path);
  absl::Status CloseMapping(const std::string& mapper_name);
  absl::Status EraseImage(const base::FilePath& image_path);
  absl::Status EraseStoreContents(const base::FilePath& ramdisk_path);

  EncryptionService* const encryption_;
};

}  // namespace dead_drop

#endif  // DEAD_DROP_CLEANUP_H_
