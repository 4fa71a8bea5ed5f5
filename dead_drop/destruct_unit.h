// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef DEAD_DROP_DESTRUCT_UNIT_H_
#define DEAD_DROP_DESTRUCT_UNIT_H_

#include <iostream>
#include <string>
#include <vector>

#include <absl/status/statusor.h>
#include <base/command_line.h>
#include <base/files/file_path.h>
#include <base/time/time.h>

namespace dead_drop {

// Switch selecting the destruct unit entry point of the dead_drop binary.
constexpr char kDestructUnitSwitch[] = "destruct_unit";

// The failsafe trigger fires this long after the primary one.
constexpr base::TimeDelta kFailsafeGrace = base::Seconds(180);

// Everything the detached destruct unit needs to erase a session. Refers to
// the volatile store, the image and the unlocked volume by path and name only,
// so it stays valid whatever state they are in when it fires.
class DestructUnit {
 public:
  DestructUnit(base::TimeDelta primary_delay,
               base::TimeDelta failsafe_delay,
               const base::FilePath& ramdisk_path,
               const base::FilePath& image_path,
               const base::FilePath& mount_path,
               const std::string& mapper_name,
               const base::FilePath& cryptsetup_path);

  // Parses the switches written by ToArguments().
  static absl::StatusOr<DestructUnit> FromCommandLine(
      const base::CommandLine& command_line);

  // Returns the switches, entry point selector included, that reproduce this
  // unit through FromCommandLine().
  std::vector<std::string> ToArguments() const;

  base::TimeDelta primary_delay() const { return primary_delay_; }
  base::TimeDelta failsafe_delay() const { return failsafe_delay_; }
  const base::FilePath& ramdisk_path() const { return ramdisk_path_; }
  const base::FilePath& image_path() const { return image_path_; }
  const base::FilePath& mount_path() const { return mount_path_; }
  const std::string& mapper_name() const { return mapper_name_; }
  const base::FilePath& cryptsetup_path() const { return cryptsetup_path_; }

  friend std::ostream& operator<<(std::ostream& out, const DestructUnit& u) {
    out << "[";
    out << "primary=" << u.primary_delay_ << " ";
    out << "failsafe=" << u.failsafe_delay_ << " ";
    out << "ramdisk=" << u.ramdisk_path_ << " ";
    out << "image=" << u.image_path_ << " ";
    out << "mount=" << u.mount_path_ << " ";
    out << "mapper=" << u.mapper_name_;
    out << "]";

    return out;
  }

 private:
  const base::TimeDelta primary_delay_;
  const base::TimeDelta failsafe_delay_;
  const base::FilePath ramdisk_path_;
  const base::FilePath image_path_;
  const base::FilePath mount_path_;
  const std::string mapper_name_;
  const base::FilePath cryptsetup_path_;
};

}  // namespace dead_drop

#endif  // DEAD_DROP_DESTRUCT_UNIT_H_
