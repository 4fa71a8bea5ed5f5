// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "dead_drop/dead_drop.h"

#include <string>

#include <base/functional/bind.h>
#include <base/logging.h>

#include "dead_drop/cleanup.h"
#include "dead_drop/image_fetcher.h"
#include "dead_drop/session_shell.h"
#include "dead_drop/status.h"
#include "dead_drop/unlock_controller.h"
#include "dead_drop/utils.h"
#include "dead_drop/volatile_store.h"

namespace dead_drop {

DeadDrop::DeadDrop(const Config& config,
                   Downloader* downloader,
                   EncryptionService* encryption,
                   PassphrasePrompt* prompt,
                   const base::TickClock* clock,
                   std::istream& input,
                   std::ostream& output)
    : config_(config),
      downloader_(downloader),
      encryption_(encryption),
      prompt_(prompt),
      clock_(clock),
      input_(input),
      output_(output),
      scheduler_(config.mapper_name, config.cryptsetup_path) {}

absl::Status DeadDrop::Run(std::optional<base::TimeDelta> lifetime) {
  output_ << "LUKS Token Self-Destruct System" << std::endl;
  output_ << "========================================" << std::endl;

  absl::Status status = RunPipeline(lifetime);
  if (status.ok())
    return status;

  LOG(ERROR) << "Session failed: " << status;
  output_ << "\nError: " << status.message() << std::endl;

  if (provisioned_ && !activated_) {
    output_ << "Erasing everything set up so far..." << std::endl;
    absl::Status cleanup_status =
        Cleanup(CleanupScope{.unmount_volume = volume_mounted_,
                             .close_mapping = mapping_opened_});
    if (!cleanup_status.ok())
      output_ << "Cleanup incomplete: " << cleanup_status.message()
              << std::endl;
  }
  return status;
}

absl::Status DeadDrop::RunPipeline(std::optional<base::TimeDelta> lifetime) {
  absl::Status status = CheckPrivilege();
  if (!status.ok())
    return status;

  output_ << "Creating " << config_.ramdisk_size << " RAM disk at "
          << config_.ramdisk_path.value() << "..." << std::endl;
  absl::StatusOr<VolatileStore> store =
      ProvisionVolatileStore(config_.ramdisk_path, config_.ramdisk_size);
  if (!store.ok())
    return store.status();
  provisioned_ = true;
  output_ << "RAM disk created at " << store->mount_path.value() << std::endl;

  output_ << "Downloading LUKS volume from " << config_.image_url << "..."
          << std::endl;
  ImageFetcher fetcher(downloader_);
  absl::StatusOr<EncryptedImage> image = fetcher.Fetch(
      config_.image_url, config_.image_path,
      base::BindRepeating(&DeadDrop::ReportProgress, base::Unretained(this)));
  output_ << std::endl;
  if (!image.ok())
    return image.status();
  output_ << "Downloaded LUKS volume to " << image->local_path.value() << " ("
          << image->size_bytes << " bytes)" << std::endl;

  base::TimeDelta primary_delay;
  if (lifetime) {
    absl::StatusOr<LifetimeChoice> choice =
        FindLifetime(config_.lifetime_choices, *lifetime);
    if (!choice.ok())
      return choice.status();
    output_ << "Selected: " << choice->description << std::endl;
    primary_delay = choice->lifetime;
  } else {
    absl::StatusOr<base::TimeDelta> selected =
        SelectLifetime(input_, output_, config_.lifetime_choices);
    if (!selected.ok())
      return selected.status();
    primary_delay = *selected;
  }

  const DestructUnit unit =
      scheduler_.BuildUnit(store->mount_path, image->local_path,
                           config_.mount_point, primary_delay);
  output_ << "Self-destruct prepared: primary after "
          << FormatRemainingTime(unit.primary_delay()) << ", failsafe after "
          << FormatRemainingTime(unit.failsafe_delay()) << std::endl;

  output_ << "\nMounting LUKS volume..." << std::endl;
  UnlockController controller(encryption_, prompt_, config_.mount_path,
                              config_.volume_mount_options, output_);
  absl::StatusOr<UnlockedVolume> volume = controller.UnlockAndMount(
      image->local_path, config_.mapper_name, config_.mount_point);
  mapping_opened_ = controller.mapping_open();
  if (!volume.ok())
    return volume.status();
  volume_mounted_ = true;
  output_ << "LUKS volume mounted at " << volume->mount_path.value()
          << std::endl;

  // The window starts now, so the time spent unlocking is not taken from it.
  status = scheduler_.Activate(unit);
  if (!status.ok())
    return status;
  activated_ = true;
  const base::TimeTicks primary_deadline =
      clock_->NowTicks() + unit.primary_delay();

  output_ << "\nLUKS token system ready! Timer: "
          << FormatRemainingTime(unit.primary_delay()) << std::endl;
  output_ << "The RAM disk will self-destruct automatically!" << std::endl;

  SessionShell shell(volume->mount_path, config_.secret_files,
                     config_.max_display_bytes, primary_deadline, clock_,
                     input_, output_);
  status = shell.Run();
  if (!status.ok())
    return status;

  output_ << "\nSession ended. Self-destruct timers remain active."
          << std::endl;
  return absl::OkStatus();
}

absl::Status DeadDrop::DestroyNow() {
  absl::Status status = CheckPrivilege();
  if (!status.ok())
    return status;

  output_ << "Initiating self-destruct sequence..." << std::endl;
  status = Cleanup(CleanupScope());
  if (!status.ok()) {
    output_ << "Self-destruct incomplete: " << status.message() << std::endl;
    return status;
  }

  output_ << "Self-destruct completed" << std::endl;
  return absl::OkStatus();
}

absl::Status DeadDrop::CheckPrivilege() {
  if (Utils::Get()->GetEffectiveUid() != 0)
    return PrivilegeError(
        "This program requires root privileges for LUKS operations");
  return absl::OkStatus();
}

absl::Status DeadDrop::Cleanup(const CleanupScope& scope) {
  const DestructUnit unit =
      scheduler_.BuildUnit(config_.ramdisk_path, config_.image_path,
                           config_.mount_point, base::TimeDelta());
  CleanupAction action(encryption_);
  return action.Run(unit, scope).ToStatus();
}

void DeadDrop::ReportProgress(int percent) {
  output_ << "\rDownload progress: " << percent << "%" << std::flush;
}

}  // namespace dead_drop
