// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "dead_drop/destruct_runner.h"

#include <errno.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>

#include <string>
#include <utility>

#include <base/logging.h>
#include <base/posix/eintr_wrapper.h>

#include "dead_drop/status.h"

namespace dead_drop {

void SleepUntil(base::TimeTicks deadline) {
  // TimeTicks counts CLOCK_MONOTONIC on Linux.
  const struct timespec target = (deadline - base::TimeTicks()).ToTimeSpec();
  int ret;
  do {
    ret = clock_nanosleep(CLOCK_MONOTONIC, TIMER_ABSTIME, &target, nullptr);
  } while (ret == EINTR);

  if (ret != 0)
    LOG(ERROR) << "clock_nanosleep failed: " << ret;
}

DestructRunner::DestructRunner(const DestructUnit& unit,
                               CleanupCallback cleanup)
    : unit_(unit), cleanup_(std::move(cleanup)) {}

int DestructRunner::Run() {
  // Inherited by both triggers.
  signal(SIGHUP, SIG_IGN);
  signal(SIGINT, SIG_IGN);
  signal(SIGPIPE, SIG_IGN);

  absl::StatusOr<TriggerPids> pids = StartTriggers(base::TimeTicks::Now());
  if (!pids.ok()) {
    // One trigger may already be running. It keeps its deadline whatever
    // happens here.
    LOG(ERROR) << "Cannot start the destruct triggers: " << pids.status();
    return EXIT_FAILURE;
  }

  absl::Status status = WaitForTriggers(*pids);
  if (!status.ok()) {
    LOG(ERROR) << status;
    return EXIT_FAILURE;
  }

  LOG(INFO) << "Destruct unit done";
  return EXIT_SUCCESS;
}

absl::StatusOr<TriggerPids> DestructRunner::StartTriggers(
    base::TimeTicks start) {
  TriggerPids pids;

  absl::StatusOr<pid_t> primary =
      StartTrigger(kPrimaryTriggerName, start + unit_.primary_delay());
  if (!primary.ok())
    return primary.status();
  pids.primary = *primary;

  // Started whatever the primary does later on.
  absl::StatusOr<pid_t> failsafe =
      StartTrigger(kFailsafeTriggerName, start + unit_.failsafe_delay());
  if (!failsafe.ok())
    return failsafe.status();
  pids.failsafe = *failsafe;

  LOG(INFO) << kPrimaryTriggerName << " (pid " << pids.primary << ") fires in "
            << unit_.primary_delay() << ", " << kFailsafeTriggerName
            << " (pid " << pids.failsafe << ") in " << unit_.failsafe_delay();
  return pids;
}

absl::StatusOr<pid_t> DestructRunner::StartTrigger(const char* name,
                                                   base::TimeTicks deadline) {
  const pid_t pid = fork();
  if (pid < 0)
    return ErrnoToStatus(errno, std::string("Cannot fork ") + name);

  if (pid > 0)
    return pid;

  // Trigger process.
  if (prctl(PR_SET_NAME, name, 0, 0, 0) < 0)
    PLOG(WARNING) << "Cannot name the trigger " << name;

  SleepUntil(deadline);
  LOG(INFO) << name << " fired";
  const bool erased = cleanup_.Run();
  LOG_IF(ERROR, !erased) << name << " could not erase everything";
  _exit(erased ? EXIT_SUCCESS : EXIT_FAILURE);
}

absl::Status DestructRunner::WaitForTriggers(const TriggerPids& pids) {
  absl::Status result = absl::OkStatus();
  for (const auto& [name, pid] : {std::pair{kPrimaryTriggerName, pids.primary},
                                  std::pair{kFailsafeTriggerName,
                                            pids.failsafe}}) {
    int wstatus = 0;
    if (HANDLE_EINTR(waitpid(pid, &wstatus, 0)) < 0) {
      result.Update(ErrnoToStatus(errno, std::string("Cannot wait for ") +
                                             name));
      continue;
    }

    if (WIFEXITED(wstatus)) {
      LOG(INFO) << name << " exited with " << WEXITSTATUS(wstatus);
    } else if (WIFSIGNALED(wstatus)) {
      LOG(WARNING) << name << " killed by signal " << WTERMSIG(wstatus);
    }
  }
  return result;
}

}  // namespace dead_drop
