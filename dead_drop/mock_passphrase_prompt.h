// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef DEAD_DROP_MOCK_PASSPHRASE_PROMPT_H_
#define DEAD_DROP_MOCK_PASSPHRASE_PROMPT_H_

#include <gmock/gmock.h>

#include <string>

#include "dead_drop/passphrase_prompt.h"

namespace dead_drop {

class MockPassphrasePrompt : public PassphrasePrompt {
 public:
  MockPassphrasePrompt() = default;
  MockPassphrasePrompt(const MockPassphrasePrompt&) = delete;
  MockPassphrasePrompt& operator=(const MockPassphrasePrompt&) = delete;

  MOCK_METHOD(absl::StatusOr<brillo::SecureBlob>,
              ReadPassphrase,
              (const std::string& prompt),
              (override));
};

}  // namespace dead_drop

#endif  // DEAD_DROP_MOCK_PASSPHRASE_PROMPT_H_
