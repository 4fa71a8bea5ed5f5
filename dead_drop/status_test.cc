// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "dead_drop/status.h"

#include <errno.h>
#include <sysexits.h>

#include <absl/strings/match.h>
#include <gtest/gtest.h>

namespace dead_drop {

TEST(StatusTest, ErrorKindsSurviveContext) {
  absl::Status status = MountError("tmpfs refused");
  EXPECT_EQ(GetErrorKind(status), ErrorKind::kMount);
  EXPECT_EQ(status.code(), absl::StatusCode::kInternal);

  status = WithErrorKind(absl::NotFoundError("gone"), ErrorKind::kWrite,
                         "Cannot write image");
  EXPECT_EQ(GetErrorKind(status), ErrorKind::kWrite);
  EXPECT_EQ(status.code(), absl::StatusCode::kNotFound);
  EXPECT_EQ(status.message(), "Cannot write image: gone");

  EXPECT_EQ(GetErrorKind(absl::InternalError("plain")), ErrorKind::kOther);
  EXPECT_EQ(GetErrorKind(absl::OkStatus()), ErrorKind::kNone);
  EXPECT_TRUE(WithErrorKind(absl::OkStatus(), ErrorKind::kMount, "x").ok());
}

TEST(StatusTest, ErrnoToStatus) {
  absl::Status status = ErrnoToStatus(ENOENT, "Cannot open /x");
  EXPECT_EQ(status.code(), absl::StatusCode::kNotFound);
  EXPECT_TRUE(absl::StartsWith(status.message(), "Cannot open /x: "));

  EXPECT_EQ(ErrnoToStatus(EACCES, "y").code(),
            absl::StatusCode::kPermissionDenied);
}

TEST(StatusTest, ErrnoToStatusWithoutErrno) {
  absl::Status status = ErrnoToStatus(0, "Cannot read /x");
  EXPECT_FALSE(status.ok());
  EXPECT_EQ(status.code(), absl::StatusCode::kInternal);
  EXPECT_EQ(status.message(), "Cannot read /x");
}

TEST(StatusTest, ExitCodes) {
  EXPECT_EQ(ExitCodeForStatus(absl::OkStatus()), EX_OK);
  EXPECT_EQ(ExitCodeForStatus(PrivilegeError("")), EX_NOPERM);
  EXPECT_EQ(ExitCodeForStatus(MountError("")), EX_OSERR);
  EXPECT_EQ(ExitCodeForStatus(NetworkError("")), EX_UNAVAILABLE);
  EXPECT_EQ(ExitCodeForStatus(WriteError("")), EX_CANTCREAT);
  EXPECT_EQ(ExitCodeForStatus(AuthExhaustedError("")), EX_DATAERR);
  EXPECT_EQ(ExitCodeForStatus(ActivationError("")), EX_SOFTWARE);
  EXPECT_EQ(ExitCodeForStatus(ConfigError("")), EX_CONFIG);
  EXPECT_EQ(ExitCodeForStatus(absl::CancelledError("")), EX_TEMPFAIL);
  EXPECT_EQ(ExitCodeForStatus(absl::InternalError("")), EX_SOFTWARE);
}

}  // namespace dead_drop
