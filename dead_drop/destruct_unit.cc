// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "dead_drop/destruct_unit.h"

#include <string>

#include <absl/strings/numbers.h>

#include "dead_drop/status.h"

namespace dead_drop {

namespace {

constexpr char kPrimaryMsSwitch[] = "unit_primary_ms";
constexpr char kFailsafeMsSwitch[] = "unit_failsafe_ms";
constexpr char kRamdiskSwitch[] = "unit_ramdisk";
constexpr char kImageSwitch[] = "unit_image";
constexpr char kMountSwitch[] = "unit_mount";
constexpr char kMapperSwitch[] = "unit_mapper";
constexpr char kCryptsetupSwitch[] = "unit_cryptsetup";

std::string MakeSwitch(const char* name, const std::string& value) {
  return std::string("--") + name + "=" + value;
}

absl::StatusOr<base::TimeDelta> GetDelaySwitch(
    const base::CommandLine& command_line, const char* name) {
  const std::string value = command_line.GetSwitchValueASCII(name);
  int64_t ms;
  if (!absl::SimpleAtoi(value, &ms) || ms < 0)
    return ConfigError(std::string("Invalid --") + name + " \"" + value + "\"");
  return base::Milliseconds(ms);
}

absl::StatusOr<base::FilePath> GetPathSwitch(
    const base::CommandLine& command_line, const char* name) {
  const base::FilePath path = command_line.GetSwitchValuePath(name);
  if (!path.IsAbsolute() || path.ReferencesParent())
    return ConfigError(std::string("--") + name +
                       " must be an absolute path: \"" + path.value() + "\"");
  return path;
}

}  // namespace

DestructUnit::DestructUnit(base::TimeDelta primary_delay,
                           base::TimeDelta failsafe_delay,
                           const base::FilePath& ramdisk_path,
                           const base::FilePath& image_path,
                           const base::FilePath& mount_path,
                           const std::string& mapper_name,
                           const base::FilePath& cryptsetup_path)
    : primary_delay_(primary_delay),
      failsafe_delay_(failsafe_delay),
      ramdisk_path_(ramdisk_path),
      image_path_(image_path),
      mount_path_(mount_path),
      mapper_name_(mapper_name),
      cryptsetup_path_(cryptsetup_path) {}

// static
absl::StatusOr<DestructUnit> DestructUnit::FromCommandLine(
    const base::CommandLine& command_line) {
  absl::StatusOr<base::TimeDelta> primary =
      GetDelaySwitch(command_line, kPrimaryMsSwitch);
  if (!primary.ok())
    return primary.status();
  absl::StatusOr<base::TimeDelta> failsafe =
      GetDelaySwitch(command_line, kFailsafeMsSwitch);
  if (!failsafe.ok())
    return failsafe.status();
  if (*failsafe != *primary + kFailsafeGrace)
    return ConfigError("The failsafe deadline must follow the primary one by " +
                       std::to_string(kFailsafeGrace.InSeconds()) + "s");

  absl::StatusOr<base::FilePath> ramdisk =
      GetPathSwitch(command_line, kRamdiskSwitch);
  if (!ramdisk.ok())
    return ramdisk.status();
  absl::StatusOr<base::FilePath> image =
      GetPathSwitch(command_line, kImageSwitch);
  if (!image.ok())
    return image.status();
  absl::StatusOr<base::FilePath> mount =
      GetPathSwitch(command_line, kMountSwitch);
  if (!mount.ok())
    return mount.status();
  absl::StatusOr<base::FilePath> cryptsetup =
      GetPathSwitch(command_line, kCryptsetupSwitch);
  if (!cryptsetup.ok())
    return cryptsetup.status();

  const std::string mapper = command_line.GetSwitchValueASCII(kMapperSwitch);
  if (mapper.empty() || mapper.find('/') != std::string::npos)
    return ConfigError("Invalid --" + std::string(kMapperSwitch) + " \"" +
                       mapper + "\"");

  return DestructUnit(*primary, *failsafe, *ramdisk, *image, *mount, mapper,
                      *cryptsetup);
}

std::vector<std::string> DestructUnit::ToArguments() const {
  return {
      std::string("--") + kDestructUnitSwitch,
      MakeSwitch(kPrimaryMsSwitch,
                 std::to_string(primary_delay_.InMilliseconds())),
      MakeSwitch(kFailsafeMsSwitch,
                 std::to_string(failsafe_delay_.InMilliseconds())),
      MakeSwitch(kRamdiskSwitch, ramdisk_path_.value()),
      MakeSwitch(kImageSwitch, image_path_.value()),
      MakeSwitch(kMountSwitch, mount_path_.value()),
      MakeSwitch(kMapperSwitch, mapper_name_),
      MakeSwitch(kCryptsetupSwitch, cryptsetup_path_.value()),
  };
}

}  // namespace dead_drop
