// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef DEAD_DROP_ENCRYPTION_SERVICE_H_
#define DEAD_DROP_ENCRYPTION_SERVICE_H_

#include <memory>
#include <string>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <base/files/file_path.h>
#include <brillo/secure_blob.h>

namespace dead_drop {

// Returns /dev/mapper/<name>.
base::FilePath GetMapperDevicePath(const std::string& name);

// Narrow interface to the system volume-encryption service.
class EncryptionService {
 public:
  // Returns the implementation backed by the cryptsetup tool at
  // |cryptsetup_path|.
  static std::unique_ptr<EncryptionService> Create(
      const base::FilePath& cryptsetup_path);

  virtual ~EncryptionService() = default;

  // EncryptionService is neither copyable nor movable.
  EncryptionService(const EncryptionService&) = delete;
  EncryptionService& operator=(const EncryptionService&) = delete;

  // Unlocks the LUKS volume in |image| and exposes it as |name|. Returns the
  // path of the plaintext block device.
  // A rejected |secret| gives an Unauthenticated status; any other failure
  // gives a MountError.
  virtual absl::StatusOr<base::FilePath> Open(
      const base::FilePath& image,
      const std::string& name,
      const brillo::SecureBlob& secret) = 0;

  // Removes the mapping |name|, which revokes its key from kernel memory.
  // Succeeds when |name| is not open.
  virtual absl::Status Close(const std::string& name) = 0;

  // Checks the current kernel state, never a cached one.
  virtual bool IsOpen(const std::string& name) = 0;

 protected:
  EncryptionService() = default;
};

}  // namespace dead_drop

#endif  // DEAD_DROP_ENCRYPTION_SERVICE_H_
