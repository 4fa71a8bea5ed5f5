// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "dead_drop/encryption_service.h"

#include <memory>
#include <string>
#include <vector>

#include <base/logging.h>
#include <base/strings/string_util.h>

#include "dead_drop/status.h"
#include "dead_drop/utils.h"

namespace dead_drop {
namespace {

// cryptsetup(8) exit codes.
constexpr int kCryptsetupNoPermission = 2;
constexpr int kCryptsetupDeviceBusy = 5;

class CryptsetupService : public EncryptionService {
 public:
  explicit CryptsetupService(const base::FilePath& cryptsetup_path)
      : cryptsetup_path_(cryptsetup_path) {}
  ~CryptsetupService() override = default;

  absl::StatusOr<base::FilePath> Open(
      const base::FilePath& image,
      const std::string& name,
      const brillo::SecureBlob& secret) override;
  absl::Status Close(const std::string& name) override;
  bool IsOpen(const std::string& name) override;

 private:
  const base::FilePath cryptsetup_path_;
};

absl::StatusOr<base::FilePath> CryptsetupService::Open(
    const base::FilePath& image,
    const std::string& name,
    const brillo::SecureBlob& secret) {
  // "--key-file=-" makes cryptsetup read the passphrase verbatim from stdin,
  // up to EOF.
  const std::vector<std::string> command = {
      cryptsetup_path_.value(), "open", "--type", "luks", "--key-file=-",
      image.value(), name};

  std::string output;
  absl::StatusOr<int> exit_code =
      Utils::Get()->RunProcessWithInput(command, secret, &output);
  if (!exit_code.ok())
    return WithErrorKind(exit_code.status(), ErrorKind::kMount,
                         "Cannot run cryptsetup");

  base::TrimWhitespaceASCII(output, base::TRIM_ALL, &output);
  switch (*exit_code) {
    case EXIT_SUCCESS:
      break;
    case kCryptsetupNoPermission:
      LOG(WARNING) << "cryptsetup rejected the passphrase for " << image;
      return absl::UnauthenticatedError(
          output.empty() ? "No key available with this passphrase" : output);
    case kCryptsetupDeviceBusy:
      return MountError("Mapping " + name + " is busy: " + output);
    default:
      return MountError("cryptsetup open exited with " +
                        std::to_string(*exit_code) + ": " + output);
  }

  LOG(INFO) << "Unlocked " << image << " as " << name;
  return GetMapperDevicePath(name);
}

absl::Status CryptsetupService::Close(const std::string& name) {
  if (!IsOpen(name)) {
    VLOG(1) << "Mapping " << name << " is not open";
    return absl::OkStatus();
  }

  absl::Status status =
      Utils::Get()->RunProcessHelper({cryptsetup_path_.value(), "close", name});
  if (!status.ok())
    return status;

  LOG(INFO) << "Closed mapping " << name;
  return absl::OkStatus();
}

bool CryptsetupService::IsOpen(const std::string& name) {
  return Utils::Get()->PathExists(GetMapperDevicePath(name)).ok();
}

}  // namespace

base::FilePath GetMapperDevicePath(const std::string& name) {
  return base::FilePath(kDevMapperDir).Append(name);
}

std::unique_ptr<EncryptionService> EncryptionService::Create(
    const base::FilePath& cryptsetup_path) {
  return std::make_unique<CryptsetupService>(cryptsetup_path);
}

}  // namespace dead_drop
