// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef DEAD_DROP_MOCK_ENCRYPTION_SERVICE_H_
#define DEAD_DROP_MOCK_ENCRYPTION_SERVICE_H_

#include <gmock/gmock.h>

#include <string>

#include "dead_drop/encryption_service.h"

namespace dead_drop {

class MockEncryptionService : public EncryptionService {
 public:
  MockEncryptionService() = default;
  MockEncryptionService(const MockEncryptionService&) = delete;
  MockEncryptionService& operator=(const MockEncryptionService&) = delete;

  ~MockEncryptionService() override = default;

  MOCK_METHOD(absl::StatusOr<base::FilePath>,
              Open,
              (const base::FilePath& image,
               const std::string& name,
               const brillo::SecureBlob& secret),
              (override));
  MOCK_METHOD(absl::Status, Close, (const std::string& name), (override));
  MOCK_METHOD(bool, IsOpen, (const std::string& name), (override));
};

}  // namespace dead_drop

#endif  // DEAD_DROP_MOCK_ENCRYPTION_SERVICE_H_
