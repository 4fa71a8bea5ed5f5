// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef DEAD_DROP_DEAD_DROP_H_
#define DEAD_DROP_DEAD_DROP_H_

#include <iostream>
#include <optional>

#include <absl/status/status.h>
#include <base/time/tick_clock.h>
#include <base/time/time.h>

#include "dead_drop/cleanup.h"
#include "dead_drop/config.h"
#include "dead_drop/destruct_scheduler.h"
#include "dead_drop/downloader.h"
#include "dead_drop/encryption_service.h"
#include "dead_drop/passphrase_prompt.h"

namespace dead_drop {

// Drives one dead-drop session from provisioning to the secret reader.
class DeadDrop {
 public:
  DeadDrop(const Config& config,
           Downloader* downloader,
           EncryptionService* encryption,
           PassphrasePrompt* prompt,
           const base::TickClock* clock,
           std::istream& input,
           std::ostream& output);
  DeadDrop(const DeadDrop&) = delete;
  DeadDrop& operator=(const DeadDrop&) = delete;

  // Provisions the volatile store, fetches the image, picks the lifetime
  // (|lifetime| when set, the menu otherwise), unlocks and mounts the volume,
  // activates the destruct unit and runs the session shell.
  // A failure before activation erases whatever was set up so far.
  absl::Status Run(std::optional<base::TimeDelta> lifetime);

  // Runs the cleanup right now against the configured paths.
  absl::Status DestroyNow();

 private:
  absl::Status RunPipeline(std::optional<base::TimeDelta> lifetime);
  absl::Status CheckPrivilege();
  // Runs the cleanup in this process and reports failing steps.
  absl::Status Cleanup(const CleanupScope& scope);
  void ReportProgress(int percent);

  const Config& config_;
  Downloader* const downloader_;
  EncryptionService* const encryption_;
  PassphrasePrompt* const prompt_;
  const base::TickClock* const clock_;
  std::istream& input_;
  std::ostream& output_;
  DestructScheduler scheduler_;

  // Set once something exists that the abort cleanup has to remove. A
  // mapping or mount found already in place belongs to someone else.
  bool provisioned_ = false;
  bool mapping_opened_ = false;
  bool volume_mounted_ = false;
  bool activated_ = false;
};

}  // namespace dead_drop

#endif  // DEAD_DROP_DEAD_DROP_H_
