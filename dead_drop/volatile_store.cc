// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "dead_drop/volatile_store.h"

#include <sys/mount.h>

#include <base/logging.h>

#include "dead_drop/status.h"
#include "dead_drop/utils.h"

namespace dead_drop {

absl::StatusOr<VolatileStore> ProvisionVolatileStore(
    const base::FilePath& path, const std::string& capacity) {
  if (Utils::Get()->GetEffectiveUid() != 0)
    return PrivilegeError("Mounting a volatile store requires root");

  absl::StatusOr<uint64_t> capacity_bytes = Utils::Get()->ParseSize(capacity);
  if (!capacity_bytes.ok())
    return WithErrorKind(capacity_bytes.status(), ErrorKind::kMount,
                         "Invalid volatile store capacity");
  if (*capacity_bytes == 0)
    return MountError("Volatile store capacity must not be zero");

  absl::Status status = Utils::Get()->CreateDirectory(path);
  if (!status.ok())
    return WithErrorKind(status, ErrorKind::kMount, "");

  status = Utils::Get()->SetPosixFilePermissions(path, 0700);
  if (!status.ok())
    return WithErrorKind(status, ErrorKind::kMount, "");

  // A second mount on top would hide whatever is mounted there, and the
  // teardown would then remove the wrong file system.
  absl::StatusOr<bool> mounted = Utils::Get()->IsMountPoint(path);
  if (!mounted.ok())
    return WithErrorKind(mounted.status(), ErrorKind::kMount, "");
  if (*mounted)
    return MountError(path.value() + " is already occupied by a mount");

  status = Utils::Get()->Mount(
      "tmpfs", path.value(), "tmpfs", MS_NOSUID | MS_NODEV | MS_NOEXEC,
      "size=" + std::to_string(*capacity_bytes) + ",mode=0700");
  if (!status.ok())
    return WithErrorKind(status, ErrorKind::kMount, "");

  LOG(INFO) << "Mounted a " << *capacity_bytes << "-byte tmpfs at " << path;
  return VolatileStore{.mount_path = path, .capacity_bytes = *capacity_bytes};
}

absl::Status TeardownVolatileStore(const base::FilePath& path) {
  absl::StatusOr<bool> mounted = Utils::Get()->IsMountPoint(path);
  if (!mounted.ok())
    return mounted.status();

  if (*mounted) {
    absl::Status status = Utils::Get()->Umount(path.value());
    if (!status.ok())
      return status;
    LOG(INFO) << "Unmounted " << path;
  }

  if (!Utils::Get()->DirectoryExists(path).ok())
    return absl::OkStatus();

  return Utils::Get()->DeletePathRecursively(path);
}

}  // namespace dead_drop
