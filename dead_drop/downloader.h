// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef DEAD_DROP_DOWNLOADER_H_
#define DEAD_DROP_DOWNLOADER_H_

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <base/functional/callback.h>

namespace dead_drop {

// Streams a remote resource to a caller-provided sink.
class Downloader {
 public:
  // Receives each chunk of the body in order. Returning false aborts the
  // transfer.
  using DataCallback = base::RepeatingCallback<bool(std::string_view)>;
  // Receives the number of body bytes received so far and the total size, or
  // 0 as the total when the server did not announce it.
  using TransferCallback =
      base::RepeatingCallback<void(int64_t received, int64_t total)>;

  // Returns the libcurl-backed implementation.
  static std::unique_ptr<Downloader> Create();

  virtual ~Downloader() = default;

  // Downloader is neither copyable nor movable.
  Downloader(const Downloader&) = delete;
  Downloader& operator=(const Downloader&) = delete;

  // Performs a single GET of |url|. Fails with NetworkError on transport or
  // HTTP failure, with an Aborted status when |on_data| stopped the transfer,
  // and with a Cancelled status once SIGINT was received.
  virtual absl::Status Download(const std::string& url,
                                const DataCallback& on_data,
                                const TransferCallback& on_transfer) = 0;

 protected:
  Downloader() = default;
};

}  // namespace dead_drop

#endif  // DEAD_DROP_DOWNLOADER_H_
