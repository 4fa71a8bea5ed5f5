// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef DEAD_DROP_PASSPHRASE_PROMPT_H_
#define DEAD_DROP_PASSPHRASE_PROMPT_H_

#include <ostream>
#include <string>

#include <absl/status/statusor.h>
#include <brillo/secure_blob.h>

namespace dead_drop {

class PassphrasePrompt {
 public:
  virtual ~PassphrasePrompt() = default;

  // Shows |prompt| and reads one line without echoing it. The trailing line
  // break is not part of the result. Fails with a Cancelled status on end of
  // input or interruption.
  virtual absl::StatusOr<brillo::SecureBlob> ReadPassphrase(
      const std::string& prompt) = 0;
};

// Reads from a terminal file descriptor, with echo turned off for the
// duration of the read.
class TerminalPassphrasePrompt : public PassphrasePrompt {
 public:
  TerminalPassphrasePrompt(int input_fd, std::ostream& output)
      : input_fd_(input_fd), output_(output) {}
  TerminalPassphrasePrompt(const TerminalPassphrasePrompt&) = delete;
  TerminalPassphrasePrompt& operator=(const TerminalPassphrasePrompt&) = delete;

  absl::StatusOr<brillo::SecureBlob> ReadPassphrase(
      const std::string& prompt) override;

 private:
  const int input_fd_;
  std::ostream& output_;
};

}  // namespace dead_drop

#endif  // DEAD_DROP_PASSPHRASE_PROMPT_H_
