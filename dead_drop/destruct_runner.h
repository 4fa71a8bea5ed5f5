// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef DEAD_DROP_DESTRUCT_RUNNER_H_
#define DEAD_DROP_DESTRUCT_RUNNER_H_

#include <sys/types.h>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <base/functional/callback.h>
#include <base/time/time.h>

#include "dead_drop/destruct_unit.h"

namespace dead_drop {

constexpr char kPrimaryTriggerName[] = "dd-primary";
constexpr char kFailsafeTriggerName[] = "dd-failsafe";

struct TriggerPids {
  pid_t primary = -1;
  pid_t failsafe = -1;
};

// Body of the detached destruct unit. Starts one process per trigger, each
// sleeping until its own deadline and then running the cleanup. The triggers
// share nothing but the start instant: either one alone is enough to erase
// the session.
class DestructRunner {
 public:
  // Runs in the trigger process. Returns true when everything was erased.
  using CleanupCallback = base::RepeatingCallback<bool()>;

  DestructRunner(const DestructUnit& unit, CleanupCallback cleanup);
  DestructRunner(const DestructRunner&) = delete;
  DestructRunner& operator=(const DestructRunner&) = delete;

  // Ignores the signals a closing terminal sends, starts both triggers and
  // waits for them. Returns the exit code of the unit.
  int Run();

  // Forks the primary and failsafe trigger processes. Their deadlines are
  // |start| plus the unit delays, on the monotonic clock.
  absl::StatusOr<TriggerPids> StartTriggers(base::TimeTicks start);

  // Reaps both triggers. Returns an error if either could not be waited for.
  absl::Status WaitForTriggers(const TriggerPids& pids);

 private:
  absl::StatusOr<pid_t> StartTrigger(const char* name,
                                     base::TimeTicks deadline);

  const DestructUnit& unit_;
  CleanupCallback cleanup_;
};

// Blocks until the monotonic clock reaches |deadline|, across signal
// interruptions.
void SleepUntil(base::TimeTicks deadline);

}  // namespace dead_drop

#endif  // DEAD_DROP_DESTRUCT_RUNNER_H_
