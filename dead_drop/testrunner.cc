// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include <gtest/gtest.h>

#include <base/at_exit.h>
#include <base/test/test_timeouts.h>
#include <brillo/syslog_logging.h>
#include <brillo/test_helpers.h>

int main(int argc, char** argv) {
  base::AtExitManager at_exit_manager;
  SetUpTests(&argc, argv, true);
  // Tests examine logs through brillo::LogToString() and brillo::GetLog().
  brillo::InitLog(brillo::kLogToStderr);
  TestTimeouts::Initialize();
  return RUN_ALL_TESTS();
}
