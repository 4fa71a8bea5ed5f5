// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef DEAD_DROP_STATUS_H_
#define DEAD_DROP_STATUS_H_

#include <string>
#include <string_view>

#include <absl/status/status.h>

namespace dead_drop {

// Failure classes a dead-drop session can end with. The kind travels with the
// absl::Status as a payload, so the canonical code stays free to describe the
// underlying cause.
enum class ErrorKind {
  kNone,
  kPrivilege,
  kMount,
  kNetwork,
  kWrite,
  kAuthExhausted,
  kNotFound,
  kActivation,
  kConfig,
  kOther,
};

// Converts |err| (an errno value) into a status carrying |message| and the
// system description of the error. An |err| of 0 still yields an error.
absl::Status ErrnoToStatus(int err, std::string_view message);

absl::Status PrivilegeError(std::string_view message);
absl::Status MountError(std::string_view message);
absl::Status NetworkError(std::string_view message);
absl::Status WriteError(std::string_view message);
absl::Status AuthExhaustedError(std::string_view message);
absl::Status NotFoundError(std::string_view message);
absl::Status ActivationError(std::string_view message);
absl::Status ConfigError(std::string_view message);

// Tags an existing error with |kind|, keeping its code and prefixing
// |context| to its message. OK statuses are returned unchanged.
absl::Status WithErrorKind(const absl::Status& status,
                           ErrorKind kind,
                           std::string_view context);

// Returns kNone for OK statuses and kOther for errors without a kind.
ErrorKind GetErrorKind(const absl::Status& status);

std::string ErrorKindName(ErrorKind kind);

// Maps the kind of |status| to a sysexits(3) exit code.
int ExitCodeForStatus(const absl::Status& status);

}  // namespace dead_drop

#endif  // DEAD_DROP_STATUS_H_
