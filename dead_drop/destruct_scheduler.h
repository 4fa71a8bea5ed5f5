// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef DEAD_DROP_DESTRUCT_SCHEDULER_H_
#define DEAD_DROP_DESTRUCT_SCHEDULER_H_

#include <string>

#include <absl/status/status.h>
#include <base/files/file_path.h>
#include <base/time/time.h>

#include "dead_drop/destruct_unit.h"

namespace dead_drop {

// Environment of the detached destruct unit. Nothing else is inherited.
constexpr char kDestructUnitPath[] = "PATH=/usr/sbin:/usr/bin:/sbin:/bin";

// Builds destruct units and starts them as detached process trees.
class DestructScheduler {
 public:
  DestructScheduler(const std::string& mapper_name,
                    const base::FilePath& cryptsetup_path);
  DestructScheduler(const DestructScheduler&) = delete;
  DestructScheduler& operator=(const DestructScheduler&) = delete;

  // Returns an inert unit erasing the given session after |primary_delay|,
  // then again kFailsafeGrace later.
  DestructUnit BuildUnit(const base::FilePath& ramdisk_path,
                         const base::FilePath& image_path,
                         const base::FilePath& mount_path,
                         base::TimeDelta primary_delay) const;

  // Starts |unit| in its own session, detached from this process and its
  // terminal. Once this returns OK nothing the caller does can stop the unit.
  // Any failure is an ActivationError and nothing runs.
  absl::Status Activate(const DestructUnit& unit);

 private:
  const std::string mapper_name_;
  const base::FilePath cryptsetup_path_;
};

}  // namespace dead_drop

#endif  // DEAD_DROP_DESTRUCT_SCHEDULER_H_
