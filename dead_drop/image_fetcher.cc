// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "dead_drop/image_fetcher.h"

#include <algorithm>
#include <string_view>
#include <utility>

#include <absl/status/status.h>
#include <base/files/file.h>
#include <base/functional/bind.h>
#include <base/logging.h>

#include "dead_drop/status.h"

namespace dead_drop {

void ProgressTracker::Update(int64_t received, int64_t total) {
  if (total <= 0 || received < 0)
    return;

  const int percent =
      static_cast<int>(std::min<int64_t>(received, total) * 100 / total);
  if (percent <= last_percent_)
    return;

  last_percent_ = percent;
  if (callback_)
    callback_.Run(percent);
}

absl::StatusOr<EncryptedImage> ImageFetcher::Fetch(
    const std::string& url,
    const base::FilePath& dest_path,
    ProgressTracker::ProgressCallback progress) {
  base::File file(dest_path,
                  base::File::FLAG_CREATE_ALWAYS | base::File::FLAG_WRITE);
  if (!file.IsValid())
    return WriteError("Cannot create " + dest_path.value() + ": " +
                      base::File::ErrorToString(file.error_details()));

  int64_t written = 0;
  int64_t announced_total = 0;
  absl::Status write_status = absl::OkStatus();
  ProgressTracker tracker(std::move(progress));

  auto on_data = base::BindRepeating(
      [](base::File* file, int64_t* written, absl::Status* write_status,
         const base::FilePath& path, std::string_view chunk) -> bool {
        const int n = file->WriteAtCurrentPos(chunk.data(),
                                              static_cast<int>(chunk.size()));
        if (n < 0 || static_cast<size_t>(n) != chunk.size()) {
          *write_status = WriteError(
              "Cannot write " + path.value() + ": " +
              base::File::ErrorToString(base::File::GetLastFileError()));
          return false;
        }
        *written += n;
        return true;
      },
      base::Unretained(&file), base::Unretained(&written),
      base::Unretained(&write_status), dest_path);

  auto on_transfer = base::BindRepeating(
      [](ProgressTracker* tracker, int64_t* announced_total, int64_t received,
         int64_t total) {
        if (total > 0)
          *announced_total = total;
        tracker->Update(received, total);
      },
      base::Unretained(&tracker), base::Unretained(&announced_total));

  LOG(INFO) << "Downloading " << url << " to " << dest_path;
  absl::Status status = downloader_->Download(url, on_data, on_transfer);
  if (!write_status.ok())
    return write_status;
  if (!status.ok()) {
    if (absl::IsCancelled(status) ||
        GetErrorKind(status) == ErrorKind::kNetwork)
      return status;
    return WithErrorKind(status, ErrorKind::kNetwork, "Download failed");
  }

  if (announced_total > 0 && written != announced_total)
    return NetworkError("Truncated download of " + url + ": received " +
                        std::to_string(written) + " of " +
                        std::to_string(announced_total) + " bytes");

  if (!file.Flush())
    return WriteError("Cannot flush " + dest_path.value());

  LOG(INFO) << "Downloaded " << written << " bytes to " << dest_path;
  return EncryptedImage{
      .source_url = url, .local_path = dest_path, .size_bytes = written};
}

}  // namespace dead_drop
