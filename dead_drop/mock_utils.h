// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef DEAD_DROP_MOCK_UTILS_H_
#define DEAD_DROP_MOCK_UTILS_H_

#include "dead_drop/utils.h"

#include <string>
#include <vector>

#include <gmock/gmock.h>

namespace dead_drop {

class MockUtils : public dead_drop::Utils {
 public:
  MockUtils() = default;
  MockUtils& operator=(const MockUtils&) = delete;
  MockUtils(const MockUtils&) = delete;

  MOCK_METHOD(absl::Status,
              RunProcessHelper,
              (const std::vector<std::string>& commands),
              (override));
  MOCK_METHOD(absl::Status,
              RunProcessHelper,
              (const std::vector<std::string>& commands, std::string* output),
              (override));
  MOCK_METHOD(absl::StatusOr<int>,
              RunProcessWithInput,
              (const std::vector<std::string>& commands,
               const brillo::SecureBlob& input,
               std::string* output),
              (override));
  MOCK_METHOD(absl::Status,
              ReadFileToStringWithMaxSize,
              (const base::FilePath& path,
               std::string* contents,
               size_t max_size),
              (override));
  MOCK_METHOD(absl::Status,
              ReadFileToString,
              (const base::FilePath& path, std::string* contents),
              (override));
  MOCK_METHOD(absl::Status,
              DeleteFile,
              (const base::FilePath& path),
              (override));
  MOCK_METHOD(absl::Status,
              DeletePathRecursively,
              (const base::FilePath& path),
              (override));
  MOCK_METHOD(absl::Status,
              PathExists,
              (const base::FilePath& path),
              (override));
  MOCK_METHOD(absl::Status,
              DirectoryExists,
              (const base::FilePath& path),
              (override));
  MOCK_METHOD(absl::Status,
              CreateDirectory,
              (const base::FilePath& path),
              (override));
  MOCK_METHOD(absl::Status,
              SetPosixFilePermissions,
              (const base::FilePath& path, int mode),
              (override));
  MOCK_METHOD(absl::Status,
              Mount,
              (const std::string& source,
               const std::string& target,
               const std::string& fs_type,
               uint64_t mount_flags,
               const std::string& data),
              (override));
  MOCK_METHOD(absl::Status, Umount, (const std::string& target), (override));
  MOCK_METHOD(absl::StatusOr<bool>,
              IsMountPoint,
              (const base::FilePath& path),
              (override));
  MOCK_METHOD(absl::Status,
              OverwriteWithRandom,
              (const base::FilePath& path),
              (override));
  MOCK_METHOD(absl::StatusOr<std::vector<base::FilePath>>,
              EnumerateFiles,
              (const base::FilePath& dir),
              (override));
  MOCK_METHOD(absl::StatusOr<base::FilePath>,
              GetSelfExecutable,
              (),
              (override));
  MOCK_METHOD(uid_t, GetEffectiveUid, (), (override));
  MOCK_METHOD(absl::StatusOr<pid_t>,
              SpawnDetached,
              (const std::vector<std::string>& argv,
               const std::vector<std::string>& env),
              (override));
};

}  // namespace dead_drop

#endif  // DEAD_DROP_MOCK_UTILS_H_
