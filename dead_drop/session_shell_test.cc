// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "dead_drop/mock_utils.h"
#include "dead_drop/session_shell.h"

#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <base/test/simple_test_tick_clock.h>
#include <gtest/gtest.h>

#include "dead_drop/status.h"

using testing::_;
using testing::DoAll;
using testing::HasSubstr;
using testing::Return;
using testing::SetArgPointee;

namespace dead_drop {
namespace {
const base::FilePath kMount("/tmp/LUKS-TOKEN-2MB");
const base::FilePath kNotes("/tmp/LUKS-TOKEN-2MB/Notes.txt");
const base::FilePath kToken("/tmp/LUKS-TOKEN-2MB/GitHub Token");
constexpr size_t kMaxBytes = 65536;

const std::vector<LifetimeChoice> kChoices = {
    {base::Seconds(60), "1 minute"},
    {base::Seconds(300), "5 minutes"},
    {base::Seconds(600), "10 minutes"},
};
}  // namespace

TEST(SelectLifetimeTest, ValidChoice) {
  std::istringstream input("2\n");
  std::ostringstream output;

  absl::StatusOr<base::TimeDelta> lifetime =
      SelectLifetime(input, output, kChoices);
  ASSERT_TRUE(lifetime.ok()) << lifetime.status();
  EXPECT_EQ(*lifetime, base::Seconds(300));
  EXPECT_EQ(output.str(),
            "\nSelect TOKEN LIFETIME:\n"
            "1. 1 minute\n"
            "2. 5 minutes\n"
            "3. 10 minutes\n"
            "\nEnter your choice (1-3): "
            "Selected: 5 minutes\n");
}

TEST(SelectLifetimeTest, RepromptsUntilValid) {
  std::istringstream input("0\nten\n4\n  3 \n");
  std::ostringstream output;

  absl::StatusOr<base::TimeDelta> lifetime =
      SelectLifetime(input, output, kChoices);
  ASSERT_TRUE(lifetime.ok());
  EXPECT_EQ(*lifetime, base::Seconds(600));
  EXPECT_THAT(output.str(),
              HasSubstr("Invalid choice. Please enter a number from 1 to 3."));
}

TEST(SelectLifetimeTest, EndOfInputCancels) {
  std::istringstream input("9\n");
  std::ostringstream output;

  EXPECT_TRUE(
      absl::IsCancelled(SelectLifetime(input, output, kChoices).status()));
}

TEST(SelectLifetimeTest, FindLifetime) {
  absl::StatusOr<LifetimeChoice> choice =
      FindLifetime(kChoices, base::Seconds(600));
  ASSERT_TRUE(choice.ok());
  EXPECT_EQ(choice->description, "10 minutes");

  EXPECT_EQ(GetErrorKind(FindLifetime(kChoices, base::Seconds(61)).status()),
            ErrorKind::kConfig);
}

TEST(FormatRemainingTimeTest, Format) {
  EXPECT_EQ(FormatRemainingTime(base::Seconds(600)), "10:00");
  EXPECT_EQ(FormatRemainingTime(base::Seconds(65)), "1:05");
  EXPECT_EQ(FormatRemainingTime(base::Milliseconds(999)), "0:00");
  EXPECT_EQ(FormatRemainingTime(base::Seconds(-5)), "0:00");
}

class SessionShellTest : public ::testing::Test {
 public:
  void SetUp() override {
    // Init Utils and then replace with mocked one.
    Utils::OverrideForTesting(&mock_util_);
    clock_.SetNowTicks(base::TimeTicks() + base::Hours(1));
  }

 protected:
  std::unique_ptr<SessionShell> MakeShell(const std::string& input) {
    input_.str(input);
    return std::make_unique<SessionShell>(
        kMount, std::vector<std::string>{"Notes.txt", "GitHub Token"},
        kMaxBytes, clock_.NowTicks() + base::Seconds(300), &clock_, input_,
        output_);
  }

  MockUtils mock_util_;
  base::SimpleTestTickClock clock_;
  std::istringstream input_;
  std::ostringstream output_;
};

TEST_F(SessionShellTest, DisplaysSelectedFile) {
  EXPECT_CALL(mock_util_, IsMountPoint(kMount)).WillRepeatedly(Return(true));
  EXPECT_CALL(mock_util_, PathExists(kToken))
      .WillOnce(Return(absl::OkStatus()));
  EXPECT_CALL(mock_util_, ReadFileToStringWithMaxSize(kToken, _, kMaxBytes))
      .WillOnce(
          DoAll(SetArgPointee<1>("ghp_example"), Return(absl::OkStatus())));

  auto shell = MakeShell("2\nn\n");
  EXPECT_TRUE(shell->Run().ok());

  const std::string output = output_.str();
  EXPECT_THAT(output, HasSubstr("Time left before self-destruct: 5:00"));
  EXPECT_THAT(output, HasSubstr("1. Notes.txt\n2. GitHub Token\n"));
  const std::string separator(50, '=');
  EXPECT_THAT(output, HasSubstr("Contents of GitHub Token:\n" + separator +
                                "\nghp_example\n" + separator + "\n"));
  EXPECT_THAT(output, HasSubstr("View another file? (y/n): "));
}

TEST_F(SessionShellTest, MissingFileIsRecoverable) {
  EXPECT_CALL(mock_util_, IsMountPoint(kMount)).WillRepeatedly(Return(true));
  EXPECT_CALL(mock_util_, PathExists(kNotes))
      .WillOnce(Return(absl::NotFoundError("absent")));
  EXPECT_CALL(mock_util_, PathExists(kToken))
      .WillOnce(Return(absl::OkStatus()));
  EXPECT_CALL(mock_util_, ReadFileToStringWithMaxSize(kToken, _, kMaxBytes))
      .WillOnce(DoAll(SetArgPointee<1>("token\n"), Return(absl::OkStatus())));

  auto shell = MakeShell("1\ny\n7\n2\nN\n");
  EXPECT_TRUE(shell->Run().ok());

  const std::string output = output_.str();
  EXPECT_THAT(output, HasSubstr("File Notes.txt not found in the volume"));
  EXPECT_THAT(output,
              HasSubstr("Invalid choice. Please enter a number from 1 to 2."));
  EXPECT_THAT(output, HasSubstr("token\n====="));
}

TEST_F(SessionShellTest, RemainingTimeCountsDown) {
  EXPECT_CALL(mock_util_, IsMountPoint(kMount)).WillRepeatedly(Return(true));
  EXPECT_CALL(mock_util_, PathExists(_))
      .WillRepeatedly(Return(absl::NotFoundError("absent")));

  auto shell = MakeShell("1\ny\n");
  clock_.Advance(base::Seconds(100));
  EXPECT_TRUE(shell->Run().ok());
  EXPECT_THAT(output_.str(), HasSubstr("Time left before self-destruct: 3:20"));
}

TEST_F(SessionShellTest, EndsWhenVolumeIsGone) {
  EXPECT_CALL(mock_util_, IsMountPoint(kMount))
      .WillOnce(Return(true))
      .WillOnce(Return(false));
  EXPECT_CALL(mock_util_, ReadFileToStringWithMaxSize(_, _, _)).Times(0);

  auto shell = MakeShell("1\n");
  EXPECT_TRUE(shell->Run().ok());
  EXPECT_THAT(output_.str(), HasSubstr("no longer mounted"));
}

TEST_F(SessionShellTest, DisplayFile) {
  EXPECT_CALL(mock_util_, IsMountPoint(kMount)).WillRepeatedly(Return(true));
  EXPECT_CALL(mock_util_, PathExists(kNotes))
      .WillOnce(Return(absl::NotFoundError("absent")));

  auto shell = MakeShell("");
  EXPECT_EQ(GetErrorKind(shell->DisplayFile("Notes.txt").status()),
            ErrorKind::kNotFound);
  // Only the listed files can be read.
  EXPECT_TRUE(
      absl::IsInvalidArgument(shell->DisplayFile("../etc/shadow").status()));
}

}  // namespace dead_drop
