// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef DEAD_DROP_VOLATILE_STORE_H_
#define DEAD_DROP_VOLATILE_STORE_H_

#include <cstdint>
#include <string>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <base/files/file_path.h>

namespace dead_drop {

// A memory-backed file system of fixed capacity.
struct VolatileStore {
  base::FilePath mount_path;
  uint64_t capacity_bytes = 0;
};

// Mounts a tmpfs of exactly |capacity| (a byte count with an optional K, M or
// G suffix) at |path|, creating the directory if needed.
// Fails with PrivilegeError when not running as root, and with MountError
// when |capacity| is invalid, |path| is already a mount point, or the mount
// itself fails. Never retries.
absl::StatusOr<VolatileStore> ProvisionVolatileStore(
    const base::FilePath& path, const std::string& capacity);

// Unmounts |path| if it is a mount point and removes the directory. Succeeds
// when there is nothing left to do.
absl::Status TeardownVolatileStore(const base::FilePath& path);

}  // namespace dead_drop

#endif  // DEAD_DROP_VOLATILE_STORE_H_
