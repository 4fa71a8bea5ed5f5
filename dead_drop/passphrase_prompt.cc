// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "dead_drop/passphrase_prompt.h"

#include <errno.h>
#include <termios.h>
#include <unistd.h>

#include <absl/cleanup/cleanup.h>
#include <absl/status/status.h>
#include <base/logging.h>

#include "dead_drop/status.h"

namespace dead_drop {

namespace {
// LUKS accepts passphrases up to 512 characters.
constexpr size_t kMaxPassphraseLength = 512;
}  // namespace

absl::StatusOr<brillo::SecureBlob> TerminalPassphrasePrompt::ReadPassphrase(
    const std::string& prompt) {
  output_ << prompt << std::flush;

  struct termios original_attr;
  const bool is_tty = tcgetattr(input_fd_, &original_attr) == 0;
  if (is_tty) {
    struct termios new_attr = original_attr;
    new_attr.c_lflag &= ~(ECHO);
    new_attr.c_lflag |= ECHONL;
    if (tcsetattr(input_fd_, TCSAFLUSH, &new_attr) != 0)
      return ErrnoToStatus(errno, "Cannot turn off terminal echo");
  }
  absl::Cleanup restore_echo = [&] {
    if (is_tty)
      tcsetattr(input_fd_, TCSAFLUSH, &original_attr);
  };

  brillo::SecureBlob passphrase;
  passphrase.reserve(kMaxPassphraseLength + 1);
  char c = 0;
  absl::Cleanup clear_last_char = [&c] { brillo::SecureClearBytes(&c, 1); };
  while (true) {
    // EINTR is not retried: an interrupt aborts the prompt.
    const ssize_t n = read(input_fd_, &c, 1);
    if (n < 0) {
      if (errno == EINTR)
        return absl::CancelledError("Passphrase entry interrupted");
      return ErrnoToStatus(errno, "Cannot read the passphrase");
    }
    if (n == 0) {
      if (passphrase.empty())
        return absl::CancelledError("No passphrase entered");
      break;
    }
    if (c == '\n')
      break;
    if (passphrase.size() == kMaxPassphraseLength)
      return absl::InvalidArgumentError("Passphrase is too long");
    passphrase.push_back(static_cast<uint8_t>(c));
  }

  if (!passphrase.empty() && passphrase.back() == '\r')
    passphrase.pop_back();

  return passphrase;
}

}  // namespace dead_drop
