// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "dead_drop/mock_utils.h"
#include "dead_drop/volatile_store.h"

#include <sys/mount.h>

#include <gtest/gtest.h>

#include "dead_drop/status.h"

using testing::_;
using testing::Return;

namespace dead_drop {
namespace {
const base::FilePath kStorePath("/tmp/luks_ramdisk");
}  // namespace

class VolatileStoreTest : public ::testing::Test {
 public:
  void SetUp() override {
    // Init Utils and then replace with mocked one.
    Utils::OverrideForTesting(&mock_util_);
  }

 protected:
  MockUtils mock_util_;
};

TEST_F(VolatileStoreTest, Provision) {
  EXPECT_CALL(mock_util_, GetEffectiveUid()).WillOnce(Return(0));
  EXPECT_CALL(mock_util_, CreateDirectory(kStorePath))
      .WillOnce(Return(absl::OkStatus()));
  EXPECT_CALL(mock_util_, SetPosixFilePermissions(kStorePath, 0700))
      .WillOnce(Return(absl::OkStatus()));
  EXPECT_CALL(mock_util_, IsMountPoint(kStorePath)).WillOnce(Return(false));
  EXPECT_CALL(mock_util_,
              Mount("tmpfs", kStorePath.value(), "tmpfs",
                    MS_NOSUID | MS_NODEV | MS_NOEXEC, "size=5242880,mode=0700"))
      .WillOnce(Return(absl::OkStatus()));

  absl::StatusOr<VolatileStore> store =
      ProvisionVolatileStore(kStorePath, "5M");
  ASSERT_TRUE(store.ok()) << store.status();
  EXPECT_EQ(store->mount_path, kStorePath);
  EXPECT_EQ(store->capacity_bytes, 5 * kMiB);
}

TEST_F(VolatileStoreTest, RequiresRoot) {
  EXPECT_CALL(mock_util_, GetEffectiveUid()).WillOnce(Return(1000));
  EXPECT_CALL(mock_util_, Mount(_, _, _, _, _)).Times(0);

  EXPECT_EQ(GetErrorKind(ProvisionVolatileStore(kStorePath, "5M").status()),
            ErrorKind::kPrivilege);
}

TEST_F(VolatileStoreTest, InvalidCapacity) {
  EXPECT_CALL(mock_util_, GetEffectiveUid()).WillRepeatedly(Return(0));
  EXPECT_CALL(mock_util_, Mount(_, _, _, _, _)).Times(0);

  EXPECT_EQ(GetErrorKind(ProvisionVolatileStore(kStorePath, "five").status()),
            ErrorKind::kMount);
  EXPECT_EQ(GetErrorKind(ProvisionVolatileStore(kStorePath, "0").status()),
            ErrorKind::kMount);
}

TEST_F(VolatileStoreTest, RefusesOccupiedPath) {
  EXPECT_CALL(mock_util_, GetEffectiveUid()).WillOnce(Return(0));
  EXPECT_CALL(mock_util_, CreateDirectory(kStorePath))
      .WillOnce(Return(absl::OkStatus()));
  EXPECT_CALL(mock_util_, SetPosixFilePermissions(kStorePath, 0700))
      .WillOnce(Return(absl::OkStatus()));
  EXPECT_CALL(mock_util_, IsMountPoint(kStorePath)).WillOnce(Return(true));
  EXPECT_CALL(mock_util_, Mount(_, _, _, _, _)).Times(0);

  absl::Status status = ProvisionVolatileStore(kStorePath, "5M").status();
  EXPECT_EQ(GetErrorKind(status), ErrorKind::kMount);
  EXPECT_NE(status.message().find("occupied"), std::string::npos);
}

TEST_F(VolatileStoreTest, MountFailure) {
  EXPECT_CALL(mock_util_, GetEffectiveUid()).WillOnce(Return(0));
  EXPECT_CALL(mock_util_, CreateDirectory(kStorePath))
      .WillOnce(Return(absl::OkStatus()));
  EXPECT_CALL(mock_util_, SetPosixFilePermissions(kStorePath, 0700))
      .WillOnce(Return(absl::OkStatus()));
  EXPECT_CALL(mock_util_, IsMountPoint(kStorePath)).WillOnce(Return(false));
  EXPECT_CALL(mock_util_, Mount(_, _, _, _, _))
      .WillOnce(Return(absl::PermissionDeniedError("Failed to mount")));

  EXPECT_EQ(GetErrorKind(ProvisionVolatileStore(kStorePath, "5M").status()),
            ErrorKind::kMount);
}

TEST_F(VolatileStoreTest, Teardown) {
  EXPECT_CALL(mock_util_, IsMountPoint(kStorePath)).WillOnce(Return(true));
  EXPECT_CALL(mock_util_, Umount(kStorePath.value()))
      .WillOnce(Return(absl::OkStatus()));
  EXPECT_CALL(mock_util_, DirectoryExists(kStorePath))
      .WillOnce(Return(absl::OkStatus()));
  EXPECT_CALL(mock_util_, DeletePathRecursively(kStorePath))
      .WillOnce(Return(absl::OkStatus()));

  EXPECT_TRUE(TeardownVolatileStore(kStorePath).ok());
}

TEST_F(VolatileStoreTest, TeardownOfMissingStoreIsNoop) {
  EXPECT_CALL(mock_util_, IsMountPoint(kStorePath)).WillOnce(Return(false));
  EXPECT_CALL(mock_util_, Umount(_)).Times(0);
  EXPECT_CALL(mock_util_, DirectoryExists(kStorePath))
      .WillOnce(Return(absl::NotFoundError("gone")));
  EXPECT_CALL(mock_util_, DeletePathRecursively(_)).Times(0);

  EXPECT_TRUE(TeardownVolatileStore(kStorePath).ok());
}

}  // namespace dead_drop
