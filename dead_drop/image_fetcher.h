// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef DEAD_DROP_IMAGE_FETCHER_H_
#define DEAD_DROP_IMAGE_FETCHER_H_

#include <cstdint>
#include <string>
#include <utility>

#include <absl/status/statusor.h>
#include <base/files/file_path.h>
#include <base/functional/callback.h>

#include "dead_drop/downloader.h"

namespace dead_drop {

// A downloaded image holding an encrypted volume. Opaque until unlocked.
struct EncryptedImage {
  std::string source_url;
  base::FilePath local_path;
  int64_t size_bytes = 0;
};

// Turns byte counts into whole percentages. Each percentage is reported at
// most once and never goes down. Nothing is reported while the total is
// unknown.
class ProgressTracker {
 public:
  using ProgressCallback = base::RepeatingCallback<void(int percent)>;

  explicit ProgressTracker(ProgressCallback callback)
      : callback_(std::move(callback)) {}
  ProgressTracker(const ProgressTracker&) = delete;
  ProgressTracker& operator=(const ProgressTracker&) = delete;

  void Update(int64_t received, int64_t total);

  int last_percent() const { return last_percent_; }

 private:
  ProgressCallback callback_;
  int last_percent_ = -1;
};

class ImageFetcher {
 public:
  explicit ImageFetcher(Downloader* downloader) : downloader_(downloader) {}
  ImageFetcher(const ImageFetcher&) = delete;
  ImageFetcher& operator=(const ImageFetcher&) = delete;

  // Streams |url| into |dest_path|, replacing any existing file.
  // Fails with NetworkError on transport failure and WriteError on local
  // failure. On failure |dest_path| may hold a partial image that must not be
  // used.
  absl::StatusOr<EncryptedImage> Fetch(
      const std::string& url,
      const base::FilePath& dest_path,
      ProgressTracker::ProgressCallback progress);

 private:
  Downloader* const downloader_;
};

}  // namespace dead_drop

#endif  // DEAD_DROP_IMAGE_FETCHER_H_
