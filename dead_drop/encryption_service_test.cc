// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "dead_drop/encryption_service.h"
#include "dead_drop/mock_utils.h"

#include <memory>

#include <gtest/gtest.h>

#include "dead_drop/status.h"

using testing::_;
using testing::DoAll;
using testing::ElementsAre;
using testing::Return;
using testing::SetArgPointee;

namespace dead_drop {
namespace {
const base::FilePath kImage("/tmp/LUKS-TOKEN-2MB.img");
const base::FilePath kMapperDevice("/dev/mapper/luks_token");
constexpr char kMapperName[] = "luks_token";
}  // namespace

class EncryptionServiceTest : public ::testing::Test {
 public:
  void SetUp() override {
    service_ = EncryptionService::Create(base::FilePath("/sbin/cryptsetup"));
    // Init Utils and then replace with mocked one.
    Utils::OverrideForTesting(&mock_util_);
  }

 protected:
  std::unique_ptr<EncryptionService> service_;
  MockUtils mock_util_;
};

TEST_F(EncryptionServiceTest, OpenPassesSecretOnStdin) {
  const brillo::SecureBlob secret("correct horse");
  EXPECT_CALL(mock_util_,
              RunProcessWithInput(
                  ElementsAre("/sbin/cryptsetup", "open", "--type", "luks",
                              "--key-file=-", kImage.value(), kMapperName),
                  secret, _))
      .WillOnce(Return(0));

  absl::StatusOr<base::FilePath> device =
      service_->Open(kImage, kMapperName, secret);
  ASSERT_TRUE(device.ok()) << device.status();
  EXPECT_EQ(*device, kMapperDevice);
}

TEST_F(EncryptionServiceTest, WrongPassphrase) {
  EXPECT_CALL(mock_util_, RunProcessWithInput(_, _, _))
      .WillOnce(DoAll(
          SetArgPointee<2>("No key available with this passphrase."),
          Return(2)));

  absl::StatusOr<base::FilePath> device =
      service_->Open(kImage, kMapperName, brillo::SecureBlob("wrong"));
  EXPECT_TRUE(absl::IsUnauthenticated(device.status()));
}

TEST_F(EncryptionServiceTest, OtherFailuresAreMountErrors) {
  EXPECT_CALL(mock_util_, RunProcessWithInput(_, _, _))
      .WillOnce(Return(5))
      .WillOnce(Return(1))
      .WillOnce(Return(absl::NotFoundError("No such file")));

  for (int i = 0; i < 3; ++i) {
    EXPECT_EQ(GetErrorKind(service_
                               ->Open(kImage, kMapperName,
                                      brillo::SecureBlob("secret"))
                               .status()),
              ErrorKind::kMount);
  }
}

TEST_F(EncryptionServiceTest, Close) {
  EXPECT_CALL(mock_util_, PathExists(kMapperDevice))
      .WillOnce(Return(absl::OkStatus()));
  EXPECT_CALL(mock_util_, RunProcessHelper(ElementsAre("/sbin/cryptsetup",
                                                       "close", kMapperName)))
      .WillOnce(Return(absl::OkStatus()));

  EXPECT_TRUE(service_->Close(kMapperName).ok());
}

TEST_F(EncryptionServiceTest, CloseWhenNotOpen) {
  EXPECT_CALL(mock_util_, PathExists(kMapperDevice))
      .WillOnce(Return(absl::NotFoundError("absent")));
  EXPECT_CALL(mock_util_, RunProcessHelper(_)).Times(0);

  EXPECT_TRUE(service_->Close(kMapperName).ok());
}

}  // namespace dead_drop
