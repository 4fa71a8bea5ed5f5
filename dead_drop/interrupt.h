// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef DEAD_DROP_INTERRUPT_H_
#define DEAD_DROP_INTERRUPT_H_

namespace dead_drop {

// Makes SIGINT abort the current step instead of killing the process, so the
// session can clean up. The handler records the interrupt, and the blocking
// read in progress fails with EINTR.
void InstallInterruptHandler();

// True once SIGINT arrived since the last ClearInterrupt().
bool InterruptRequested();

void ClearInterrupt();

}  // namespace dead_drop

#endif  // DEAD_DROP_INTERRUPT_H_
