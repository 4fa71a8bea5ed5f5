// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "dead_drop/interrupt.h"

#include <signal.h>

#include <base/logging.h>

namespace dead_drop {

namespace {

volatile sig_atomic_t interrupted = 0;

void OnInterrupt(int) {
  interrupted = 1;
}

}  // namespace

void InstallInterruptHandler() {
  struct sigaction action = {};
  action.sa_handler = OnInterrupt;
  sigemptyset(&action.sa_mask);
  // No SA_RESTART: the interrupted read must fail with EINTR.
  action.sa_flags = 0;
  if (sigaction(SIGINT, &action, nullptr) < 0)
    PLOG(WARNING) << "Cannot install the SIGINT handler";
}

bool InterruptRequested() {
  return interrupted != 0;
}

void ClearInterrupt() {
  interrupted = 0;
}

}  // namespace dead_drop
