// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef DEAD_DROP_UNLOCK_CONTROLLER_H_
#define DEAD_DROP_UNLOCK_CONTROLLER_H_

#include <ostream>
#include <string>

#include <absl/status/statusor.h>
#include <base/files/file_path.h>

#include "dead_drop/encryption_service.h"
#include "dead_drop/passphrase_prompt.h"

namespace dead_drop {

// An encrypted volume exposed as a plaintext block device and mounted.
struct UnlockedVolume {
  std::string mapper_name;
  base::FilePath block_device_path;
  base::FilePath mount_path;
};

enum class UnlockState {
  kAwaitingPassphrase,
  kUnlocking,
  kUnlocked,
  kMounting,
  kMounted,
  kFailed,
};

std::ostream& operator<<(std::ostream& out, UnlockState state);

// Passphrases tried before the session gives up.
constexpr int kMaxUnlockAttempts = 3;

// Drives the encryption service through a bounded number of passphrase
// attempts, then mounts the unlocked block device.
class UnlockController {
 public:
  UnlockController(EncryptionService* encryption,
                   PassphrasePrompt* prompt,
                   const base::FilePath& mount_program,
                   const std::string& mount_options,
                   std::ostream& output);
  UnlockController(const UnlockController&) = delete;
  UnlockController& operator=(const UnlockController&) = delete;

  // Fails with AuthExhaustedError once kMaxUnlockAttempts passphrases have been
  // rejected, without prompting again, and with MountError when the mapping
  // already exists, the unlock fails for another reason, or the mount fails.
  // A mount failure closes the mapping opened here before returning.
  absl::StatusOr<UnlockedVolume> UnlockAndMount(
      const base::FilePath& image_path,
      const std::string& mapper_name,
      const base::FilePath& mount_path);

  UnlockState state() const { return state_; }
  int attempts_made() const { return attempts_made_; }
  // True while a mapping opened by this controller is still open.
  bool mapping_open() const { return mapping_open_; }

 private:
  void SetState(UnlockState state);

  // Runs the passphrase loop. Returns the block device on success.
  absl::StatusOr<base::FilePath> Unlock(const base::FilePath& image_path,
                                        const std::string& mapper_name);

  absl::Status MountVolume(const base::FilePath& device,
                           const base::FilePath& mount_path);

  EncryptionService* const encryption_;
  PassphrasePrompt* const prompt_;
  const base::FilePath mount_program_;
  const std::string mount_options_;
  std::ostream& output_;

  UnlockState state_ = UnlockState::kAwaitingPassphrase;
  int attempts_made_ = 0;
  bool mapping_open_ = false;
};

}  // namespace dead_drop

#endif  // DEAD_DROP_UNLOCK_CONTROLLER_H_
