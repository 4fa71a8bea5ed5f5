// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "dead_drop/session_shell.h"

#include <algorithm>
#include <string_view>

#include <base/logging.h>
#include <base/strings/string_number_conversions.h>
#include <base/strings/string_util.h>
#include <base/strings/stringprintf.h>

#include "dead_drop/status.h"
#include "dead_drop/utils.h"

namespace dead_drop {

namespace {

constexpr char kSeparator[] =
    "==================================================";

// Reads one trimmed line. Returns false at end of input.
bool ReadLine(std::istream& input, std::string* line) {
  if (!std::getline(input, *line))
    return false;
  *line = std::string(
      base::TrimWhitespaceASCII(*line, base::TrimPositions::TRIM_ALL));
  return true;
}

// Parses a 1-based menu choice. Returns the 0-based index.
std::optional<size_t> ParseChoice(std::string_view text, size_t count) {
  size_t choice;
  if (!base::StringToSizeT(text, &choice) || choice < 1 || choice > count)
    return std::nullopt;
  return choice - 1;
}

}  // namespace

absl::StatusOr<base::TimeDelta> SelectLifetime(
    std::istream& input,
    std::ostream& output,
    const std::vector<LifetimeChoice>& choices) {
  if (choices.empty())
    return ConfigError("No lifetime choices configured");

  output << "\nSelect TOKEN LIFETIME:" << std::endl;
  for (size_t i = 0; i < choices.size(); ++i)
    output << i + 1 << ". " << choices[i].description << std::endl;

  while (true) {
    output << "\nEnter your choice (1-" << choices.size() << "): ";
    std::string line;
    if (!ReadLine(input, &line)) {
      output << std::endl;
      return absl::CancelledError("No lifetime selected");
    }

    const std::optional<size_t> index = ParseChoice(line, choices.size());
    if (!index) {
      output << "Invalid choice. Please enter a number from 1 to "
             << choices.size() << "." << std::endl;
      continue;
    }

    output << "Selected: " << choices[*index].description << std::endl;
    return choices[*index].lifetime;
  }
}

absl::StatusOr<LifetimeChoice> FindLifetime(
    const std::vector<LifetimeChoice>& choices, base::TimeDelta lifetime) {
  const auto it = std::find_if(choices.begin(), choices.end(),
                               [lifetime](const LifetimeChoice& choice) {
                                 return choice.lifetime == lifetime;
                               });
  if (it == choices.end())
    return ConfigError("Lifetime of " +
                       base::NumberToString(lifetime.InSeconds()) +
                       " seconds is not one of the configured choices");
  return *it;
}

std::string FormatRemainingTime(base::TimeDelta remaining) {
  const int64_t seconds = std::max<int64_t>(remaining.InSeconds(), 0);
  return base::StringPrintf("%d:%02d", static_cast<int>(seconds / 60),
                            static_cast<int>(seconds % 60));
}

SessionShell::SessionShell(const base::FilePath& mount_path,
                           const std::vector<std::string>& files,
                           size_t max_display_bytes,
                           base::TimeTicks primary_deadline,
                           const base::TickClock* clock,
                           std::istream& input,
                           std::ostream& output)
    : mount_path_(mount_path),
      files_(files),
      max_display_bytes_(max_display_bytes),
      primary_deadline_(primary_deadline),
      clock_(clock),
      input_(input),
      output_(output) {
  DCHECK(clock_);
}

absl::Status SessionShell::Run() {
  while (true) {
    if (!IsVolumeMounted()) {
      output_ << "\nThe volume is no longer mounted: the session has been "
                 "destroyed."
              << std::endl;
      return absl::OkStatus();
    }

    output_ << "\nTime left before self-destruct: "
            << FormatRemainingTime(primary_deadline_ - clock_->NowTicks())
            << std::endl;
    output_ << "\nAvailable files:" << std::endl;
    for (size_t i = 0; i < files_.size(); ++i)
      output_ << i + 1 << ". " << files_[i] << std::endl;

    const std::optional<size_t> index = ReadChoice();
    if (!index)
      return absl::OkStatus();

    const std::string& name = files_[*index];
    absl::StatusOr<std::string> content = DisplayFile(name);
    if (content.ok()) {
      output_ << "\nContents of " << name << ":" << std::endl;
      output_ << kSeparator << std::endl;
      output_ << *content;
      if (!content->empty() && content->back() != '\n')
        output_ << std::endl;
      output_ << kSeparator << std::endl;
    } else if (GetErrorKind(content.status()) == ErrorKind::kNotFound) {
      output_ << "File " << name << " not found in the volume" << std::endl;
    } else if (absl::IsFailedPrecondition(content.status())) {
      output_ << "\nThe volume is no longer mounted: the session has been "
                 "destroyed."
              << std::endl;
      return absl::OkStatus();
    } else {
      LOG(ERROR) << "Cannot read " << name << ": " << content.status();
      output_ << "Error reading file: " << content.status().message()
              << std::endl;
    }

    if (!AskAnother())
      return absl::OkStatus();
  }
}

absl::StatusOr<std::string> SessionShell::DisplayFile(
    const std::string& name) {
  if (std::find(files_.begin(), files_.end(), name) == files_.end())
    return absl::InvalidArgumentError(name + " is not a listed file");

  // The destruct unit may have fired since the menu was shown.
  if (!IsVolumeMounted())
    return absl::FailedPreconditionError(mount_path_.value() +
                                         " is no longer mounted");

  const base::FilePath path = mount_path_.Append(name);
  if (!Utils::Get()->PathExists(path).ok())
    return NotFoundError(name + " not found in " + mount_path_.value());

  std::string content;
  absl::Status status = Utils::Get()->ReadFileToStringWithMaxSize(
      path, &content, max_display_bytes_);
  if (!status.ok())
    return status;

  return content;
}

bool SessionShell::IsVolumeMounted() {
  absl::StatusOr<bool> mounted = Utils::Get()->IsMountPoint(mount_path_);
  if (!mounted.ok()) {
    LOG(ERROR) << "Cannot check " << mount_path_ << ": " << mounted.status();
    return false;
  }
  return *mounted;
}

std::optional<size_t> SessionShell::ReadChoice() {
  while (true) {
    output_ << "\nEnter your choice (1-" << files_.size() << "): ";
    std::string line;
    if (!ReadLine(input_, &line)) {
      output_ << std::endl;
      return std::nullopt;
    }

    const std::optional<size_t> index = ParseChoice(line, files_.size());
    if (index)
      return index;

    output_ << "Invalid choice. Please enter a number from 1 to "
            << files_.size() << "." << std::endl;
  }
}

bool SessionShell::AskAnother() {
  output_ << "\nView another file? (y/n): ";
  std::string line;
  if (!ReadLine(input_, &line)) {
    output_ << std::endl;
    return false;
  }
  return base::ToLowerASCII(line) == "y";
}

}  // namespace dead_drop
