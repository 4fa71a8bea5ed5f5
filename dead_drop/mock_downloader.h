// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef DEAD_DROP_MOCK_DOWNLOADER_H_
#define DEAD_DROP_MOCK_DOWNLOADER_H_

#include <gmock/gmock.h>

#include <string>

#include "dead_drop/downloader.h"

namespace dead_drop {

class MockDownloader : public Downloader {
 public:
  MockDownloader() = default;
  MockDownloader(const MockDownloader&) = delete;
  MockDownloader& operator=(const MockDownloader&) = delete;

  ~MockDownloader() override = default;

  MOCK_METHOD(absl::Status,
              Download,
              (const std::string& url,
               const DataCallback& on_data,
               const TransferCallback& on_transfer),
              (override));
};

}  // namespace dead_drop

#endif  // DEAD_DROP_MOCK_DOWNLOADER_H_
