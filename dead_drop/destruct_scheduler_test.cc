// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "dead_drop/destruct_scheduler.h"
#include "dead_drop/mock_utils.h"

#include <gtest/gtest.h>

#include "dead_drop/status.h"

using testing::_;
using testing::ElementsAre;
using testing::Return;

namespace dead_drop {
namespace {
const base::FilePath kRamdisk("/tmp/luks_ramdisk");
const base::FilePath kImage("/tmp/LUKS-TOKEN-2MB.img");
const base::FilePath kMount("/tmp/LUKS-TOKEN-2MB");
const base::FilePath kSelf("/usr/sbin/dead_drop");
}  // namespace

class DestructSchedulerTest : public ::testing::Test {
 public:
  void SetUp() override {
    // Init Utils and then replace with mocked one.
    Utils::OverrideForTesting(&mock_util_);
  }

 protected:
  DestructScheduler scheduler_{"luks_token",
                               base::FilePath("/sbin/cryptsetup")};
  MockUtils mock_util_;
};

TEST_F(DestructSchedulerTest, ActivateSpawnsDetachedUnit) {
  const DestructUnit unit =
      scheduler_.BuildUnit(kRamdisk, kImage, kMount, base::Seconds(60));

  EXPECT_CALL(mock_util_, GetSelfExecutable()).WillOnce(Return(kSelf));
  EXPECT_CALL(
      mock_util_,
      SpawnDetached(
          ElementsAre(kSelf.value(), "--destruct_unit",
                      "--unit_primary_ms=60000", "--unit_failsafe_ms=240000",
                      "--unit_ramdisk=/tmp/luks_ramdisk",
                      "--unit_image=/tmp/LUKS-TOKEN-2MB.img",
                      "--unit_mount=/tmp/LUKS-TOKEN-2MB",
                      "--unit_mapper=luks_token",
                      "--unit_cryptsetup=/sbin/cryptsetup"),
          ElementsAre("PATH=/usr/sbin:/usr/bin:/sbin:/bin")))
      .WillOnce(Return(4242));

  EXPECT_TRUE(scheduler_.Activate(unit).ok());
}

TEST_F(DestructSchedulerTest, SpawnFailureIsActivationError) {
  const DestructUnit unit =
      scheduler_.BuildUnit(kRamdisk, kImage, kMount, base::Seconds(60));

  EXPECT_CALL(mock_util_, GetSelfExecutable()).WillOnce(Return(kSelf));
  EXPECT_CALL(mock_util_, SpawnDetached(_, _))
      .WillOnce(Return(absl::PermissionDeniedError("Cannot execute")));

  EXPECT_EQ(GetErrorKind(scheduler_.Activate(unit)), ErrorKind::kActivation);
}

TEST_F(DestructSchedulerTest, UnresolvableBinaryIsActivationError) {
  const DestructUnit unit =
      scheduler_.BuildUnit(kRamdisk, kImage, kMount, base::Seconds(60));

  EXPECT_CALL(mock_util_, GetSelfExecutable())
      .WillOnce(Return(absl::NotFoundError("Cannot resolve /proc/self/exe")));
  EXPECT_CALL(mock_util_, SpawnDetached(_, _)).Times(0);

  EXPECT_EQ(GetErrorKind(scheduler_.Activate(unit)), ErrorKind::kActivation);
}

}  // namespace dead_drop
