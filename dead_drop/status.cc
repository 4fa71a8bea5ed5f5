// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "dead_drop/status.h"

#include <sysexits.h>

#include <utility>

#include <absl/strings/cord.h>
#include <absl/strings/str_cat.h>
#include <base/posix/safe_strerror.h>

namespace dead_drop {

namespace {

constexpr char kErrorKindPayloadUrl[] = "type.chromium.org/dead_drop.ErrorKind";

absl::Status Tag(absl::Status status, ErrorKind kind) {
  status.SetPayload(kErrorKindPayloadUrl, absl::Cord(ErrorKindName(kind)));
  return status;
}

ErrorKind ErrorKindFromName(std::string_view name) {
  for (ErrorKind kind :
       {ErrorKind::kPrivilege, ErrorKind::kMount, ErrorKind::kNetwork,
        ErrorKind::kWrite, ErrorKind::kAuthExhausted, ErrorKind::kNotFound,
        ErrorKind::kActivation, ErrorKind::kConfig}) {
    if (name == ErrorKindName(kind))
      return kind;
  }
  return ErrorKind::kOther;
}

}  // namespace

absl::Status ErrnoToStatus(int err, std::string_view message) {
  // Not every failing call sets errno.
  if (err == 0)
    return absl::InternalError(message);
  return absl::Status(absl::ErrnoToStatusCode(err),
                      absl::StrCat(message, ": ", base::safe_strerror(err)));
}

absl::Status PrivilegeError(std::string_view message) {
  return Tag(absl::PermissionDeniedError(message), ErrorKind::kPrivilege);
}

absl::Status MountError(std::string_view message) {
  return Tag(absl::InternalError(message), ErrorKind::kMount);
}

absl::Status NetworkError(std::string_view message) {
  return Tag(absl::UnavailableError(message), ErrorKind::kNetwork);
}

absl::Status WriteError(std::string_view message) {
  return Tag(absl::DataLossError(message), ErrorKind::kWrite);
}

absl::Status AuthExhaustedError(std::string_view message) {
  return Tag(absl::UnauthenticatedError(message), ErrorKind::kAuthExhausted);
}

absl::Status NotFoundError(std::string_view message) {
  return Tag(absl::NotFoundError(message), ErrorKind::kNotFound);
}

absl::Status ActivationError(std::string_view message) {
  return Tag(absl::FailedPreconditionError(message), ErrorKind::kActivation);
}

absl::Status ConfigError(std::string_view message) {
  return Tag(absl::InvalidArgumentError(message), ErrorKind::kConfig);
}

absl::Status WithErrorKind(const absl::Status& status,
                           ErrorKind kind,
                           std::string_view context) {
  if (status.ok())
    return status;

  absl::Status tagged(status.code(),
                      context.empty()
                          ? std::string(status.message())
                          : absl::StrCat(context, ": ", status.message()));
  return Tag(std::move(tagged), kind);
}

ErrorKind GetErrorKind(const absl::Status& status) {
  if (status.ok())
    return ErrorKind::kNone;

  const auto payload = status.GetPayload(kErrorKindPayloadUrl);
  if (!payload)
    return ErrorKind::kOther;

  return ErrorKindFromName(std::string(*payload));
}

std::string ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNone:
      return "None";
    case ErrorKind::kPrivilege:
      return "PrivilegeError";
    case ErrorKind::kMount:
      return "MountError";
    case ErrorKind::kNetwork:
      return "NetworkError";
    case ErrorKind::kWrite:
      return "WriteError";
    case ErrorKind::kAuthExhausted:
      return "AuthExhaustedError";
    case ErrorKind::kNotFound:
      return "NotFoundError";
    case ErrorKind::kActivation:
      return "ActivationError";
    case ErrorKind::kConfig:
      return "ConfigError";
    case ErrorKind::kOther:
      return "Error";
  }
  return "Error";
}

int ExitCodeForStatus(const absl::Status& status) {
  switch (GetErrorKind(status)) {
    case ErrorKind::kNone:
      return EX_OK;
    case ErrorKind::kPrivilege:
      return EX_NOPERM;
    case ErrorKind::kMount:
      return EX_OSERR;
    case ErrorKind::kNetwork:
      return EX_UNAVAILABLE;
    case ErrorKind::kWrite:
      return EX_CANTCREAT;
    case ErrorKind::kAuthExhausted:
      return EX_DATAERR;
    case ErrorKind::kActivation:
      return EX_SOFTWARE;
    case ErrorKind::kConfig:
      return EX_CONFIG;
    case ErrorKind::kNotFound:
    case ErrorKind::kOther:
      break;
  }
  if (absl::IsCancelled(status))
    return EX_TEMPFAIL;
  return EX_SOFTWARE;
}

}  // namespace dead_drop
