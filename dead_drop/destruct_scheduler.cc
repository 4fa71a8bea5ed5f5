// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "dead_drop/destruct_scheduler.h"

#include <utility>
#include <vector>

#include <base/logging.h>

#include "dead_drop/status.h"
#include "dead_drop/utils.h"

namespace dead_drop {

DestructScheduler::DestructScheduler(const std::string& mapper_name,
                                     const base::FilePath& cryptsetup_path)
    : mapper_name_(mapper_name), cryptsetup_path_(cryptsetup_path) {}

DestructUnit DestructScheduler::BuildUnit(const base::FilePath& ramdisk_path,
                                          const base::FilePath& image_path,
                                          const base::FilePath& mount_path,
                                          base::TimeDelta primary_delay) const {
  return DestructUnit(primary_delay, primary_delay + kFailsafeGrace,
                      ramdisk_path, image_path, mount_path, mapper_name_,
                      cryptsetup_path_);
}

absl::Status DestructScheduler::Activate(const DestructUnit& unit) {
  // The unit must not depend on the caller's PATH or working directory.
  absl::StatusOr<base::FilePath> self = Utils::Get()->GetSelfExecutable();
  if (!self.ok())
    return WithErrorKind(self.status(), ErrorKind::kActivation,
                         "Cannot locate the destruct unit binary");

  std::vector<std::string> argv = {self->value()};
  for (std::string& arg : unit.ToArguments())
    argv.push_back(std::move(arg));

  absl::StatusOr<pid_t> pid =
      Utils::Get()->SpawnDetached(argv, {kDestructUnitPath});
  if (!pid.ok())
    return WithErrorKind(pid.status(), ErrorKind::kActivation,
                         "Cannot start the destruct unit");

  LOG(INFO) << "Destruct unit " << unit << " running as pid " << *pid;
  return absl::OkStatus();
}

}  // namespace dead_drop
