// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef DEAD_DROP_SESSION_SHELL_H_
#define DEAD_DROP_SESSION_SHELL_H_

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <base/files/file_path.h>
#include <base/time/tick_clock.h>
#include <base/time/time.h>

#include "dead_drop/config.h"

namespace dead_drop {

// Shows the lifetime menu on |output| and reads choices from |input| until a
// valid one is entered. End of input gives a Cancelled status.
absl::StatusOr<base::TimeDelta> SelectLifetime(
    std::istream& input,
    std::ostream& output,
    const std::vector<LifetimeChoice>& choices);

// Returns the choice whose lifetime is exactly |lifetime|, or a ConfigError.
absl::StatusOr<LifetimeChoice> FindLifetime(
    const std::vector<LifetimeChoice>& choices, base::TimeDelta lifetime);

// "M:SS" rendering of a remaining time. Negative values render as 0:00.
std::string FormatRemainingTime(base::TimeDelta remaining);

// Interactive reader for the fixed list of secret files of a mounted volume.
class SessionShell {
 public:
  // |primary_deadline| is when the destruct unit fires, on |clock|.
  SessionShell(const base::FilePath& mount_path,
               const std::vector<std::string>& files,
               size_t max_display_bytes,
               base::TimeTicks primary_deadline,
               const base::TickClock* clock,
               std::istream& input,
               std::ostream& output);
  SessionShell(const SessionShell&) = delete;
  SessionShell& operator=(const SessionShell&) = delete;

  // Runs the menu until the operator is done, input ends or the volume
  // disappears. Never erases anything.
  absl::Status Run();

  // Returns the content of the listed file |name|, or a NotFoundError when
  // the volume does not hold it.
  absl::StatusOr<std::string> DisplayFile(const std::string& name);

 private:
  // Re-reads the mount table.
  bool IsVolumeMounted();
  // Returns the index of the file picked, or nullopt at end of input.
  std::optional<size_t> ReadChoice();
  bool AskAnother();

  const base::FilePath mount_path_;
  const std::vector<std::string> files_;
  const size_t max_display_bytes_;
  const base::TimeTicks primary_deadline_;
  const base::TickClock* const clock_;
  std::istream& input_;
  std::ostream& output_;
};

}  // namespace dead_drop

#endif  // DEAD_DROP_SESSION_SHELL_H_
