// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "dead_drop/unlock_controller.h"

#include <string>

#include <absl/status/status.h>
#include <base/logging.h>
#include <brillo/secure_blob.h>

#include "dead_drop/status.h"
#include "dead_drop/utils.h"

namespace dead_drop {

std::ostream& operator<<(std::ostream& out, UnlockState state) {
  switch (state) {
    case UnlockState::kAwaitingPassphrase:
      return out << "AwaitingPassphrase";
    case UnlockState::kUnlocking:
      return out << "Unlocking";
    case UnlockState::kUnlocked:
      return out << "Unlocked";
    case UnlockState::kMounting:
      return out << "Mounting";
    case UnlockState::kMounted:
      return out << "Mounted";
    case UnlockState::kFailed:
      return out << "Failed";
  }
  return out << "Unknown";
}

UnlockController::UnlockController(EncryptionService* encryption,
                                   PassphrasePrompt* prompt,
                                   const base::FilePath& mount_program,
                                   const std::string& mount_options,
                                   std::ostream& output)
    : encryption_(encryption),
      prompt_(prompt),
      mount_program_(mount_program),
      mount_options_(mount_options),
      output_(output) {
  DCHECK(encryption_);
  DCHECK(prompt_);
}

void UnlockController::SetState(UnlockState state) {
  VLOG(1) << "Unlock state " << state_ << " -> " << state;
  state_ = state;
}

absl::StatusOr<UnlockedVolume> UnlockController::UnlockAndMount(
    const base::FilePath& image_path,
    const std::string& mapper_name,
    const base::FilePath& mount_path) {
  // The kernel allows a single mapping per name. One that already exists
  // belongs to someone else and is never reused.
  if (encryption_->IsOpen(mapper_name)) {
    SetState(UnlockState::kFailed);
    return MountError("Mapping " + mapper_name + " already exists");
  }

  absl::StatusOr<base::FilePath> device = Unlock(image_path, mapper_name);
  if (!device.ok())
    return device.status();

  SetState(UnlockState::kMounting);
  absl::Status status = MountVolume(*device, mount_path);
  if (!status.ok()) {
    SetState(UnlockState::kFailed);
    absl::Status close_status = encryption_->Close(mapper_name);
    if (!close_status.ok()) {
      LOG(ERROR) << "Cannot close " << mapper_name << ": " << close_status;
      // mapping_open_ stays set: the mapping is still ours to close.
      return WithErrorKind(status, ErrorKind::kMount,
                           "Volume unlocked as " + mapper_name +
                               " but not mounted, and closing it failed (" +
                               std::string(close_status.message()) + ")");
    }
    mapping_open_ = false;
    return WithErrorKind(
        status, ErrorKind::kMount,
        "Volume unlocked as " + mapper_name + " but not mounted; closed it");
  }

  SetState(UnlockState::kMounted);
  LOG(INFO) << "Mounted " << *device << " at " << mount_path;
  return UnlockedVolume{.mapper_name = mapper_name,
                        .block_device_path = *device,
                        .mount_path = mount_path};
}

absl::StatusOr<base::FilePath> UnlockController::Unlock(
    const base::FilePath& image_path, const std::string& mapper_name) {
  for (int attempt = 1; attempt <= kMaxUnlockAttempts; ++attempt) {
    SetState(UnlockState::kAwaitingPassphrase);

    absl::StatusOr<base::FilePath> device;
    {
      // The passphrase lives in this scope only. SecureBlob wipes it on
      // destruction.
      absl::StatusOr<brillo::SecureBlob> passphrase = prompt_->ReadPassphrase(
          "Enter LUKS passphrase (attempt " + std::to_string(attempt) + "/" +
          std::to_string(kMaxUnlockAttempts) + "): ");
      if (!passphrase.ok()) {
        SetState(UnlockState::kFailed);
        return passphrase.status();
      }

      SetState(UnlockState::kUnlocking);
      ++attempts_made_;
      device = encryption_->Open(image_path, mapper_name, *passphrase);
    }

    if (device.ok()) {
      SetState(UnlockState::kUnlocked);
      mapping_open_ = true;
      output_ << "LUKS device opened successfully" << std::endl;
      return device;
    }

    if (!absl::IsUnauthenticated(device.status())) {
      SetState(UnlockState::kFailed);
      return WithErrorKind(device.status(), ErrorKind::kMount,
                           "Cannot unlock " + image_path.value());
    }

    LOG(WARNING) << "Passphrase attempt " << attempt << "/"
                 << kMaxUnlockAttempts << " rejected";
    output_ << "Failed to open LUKS device: " << device.status().message()
            << std::endl;
  }

  SetState(UnlockState::kFailed);
  output_ << "Maximum attempts reached." << std::endl;
  return AuthExhaustedError("Passphrase rejected " +
                            std::to_string(kMaxUnlockAttempts) + " times");
}

absl::Status UnlockController::MountVolume(const base::FilePath& device,
                                           const base::FilePath& mount_path) {
  absl::Status status = Utils::Get()->CreateDirectory(mount_path);
  if (!status.ok())
    return status;

  status = Utils::Get()->SetPosixFilePermissions(mount_path, 0700);
  if (!status.ok())
    return status;

  absl::StatusOr<bool> mounted = Utils::Get()->IsMountPoint(mount_path);
  if (!mounted.ok())
    return mounted.status();
  if (*mounted)
    return MountError(mount_path.value() + " is already occupied by a mount");

  // The mount tool detects the file system type inside the volume.
  return Utils::Get()->RunProcessHelper({mount_program_.value(), "-o",
                                         mount_options_, device.value(),
                                         mount_path.value()});
}

}  // namespace dead_drop
