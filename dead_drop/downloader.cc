// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "dead_drop/downloader.h"

#include <memory>
#include <string>

#include <base/logging.h>
#include <curl/curl.h>
#include <curl/easy.h>

#include "dead_drop/interrupt.h"
#include "dead_drop/status.h"

namespace dead_drop {
namespace {

constexpr long kConnectTimeoutSeconds = 30;  // NOLINT(runtime/int)
constexpr char kUserAgent[] = "dead_drop/1.0";

// Frees the resources allocated by curl_easy_init.
struct FreeCurlEasyhandle {
  void operator()(CURL* ptr) const { curl_easy_cleanup(ptr); }
};

// The destructor needs to call curl_easy_cleanup instead of
// operator delete.
typedef std::unique_ptr<CURL, FreeCurlEasyhandle> ScopedCurlEasyhandle;

// State shared with the libcurl callbacks during one transfer.
struct TransferState {
  const Downloader::DataCallback* on_data;
  const Downloader::TransferCallback* on_transfer;
  bool aborted = false;
  bool interrupted = false;
};

size_t WriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  TransferState* state = static_cast<TransferState*>(userdata);
  const size_t length = size * nmemb;
  if (!state->on_data->Run(std::string_view(ptr, length))) {
    state->aborted = true;
    // Any value other than |length| makes libcurl fail with
    // CURLE_WRITE_ERROR.
    return 0;
  }
  return length;
}

int TransferInfoCallback(void* userdata,
                         curl_off_t dltotal,
                         curl_off_t dlnow,
                         curl_off_t /*ultotal*/,
                         curl_off_t /*ulnow*/) {
  TransferState* state = static_cast<TransferState*>(userdata);
  // libcurl retries a poll() interrupted by SIGINT, so the transfer only
  // stops when this callback asks for it.
  if (InterruptRequested()) {
    state->interrupted = true;
    return 1;
  }
  state->on_transfer->Run(static_cast<int64_t>(dlnow),
                          static_cast<int64_t>(dltotal));
  return 0;
}

class CurlDownloader : public Downloader {
 public:
  CurlDownloader() {
    [[maybe_unused]] static const CURLcode global_init =
        curl_global_init(CURL_GLOBAL_DEFAULT);
    LOG_IF(ERROR, global_init != CURLE_OK)
        << "Failed to initialize curl: " << curl_easy_strerror(global_init);
  }
  ~CurlDownloader() override = default;

  absl::Status Download(const std::string& url,
                        const DataCallback& on_data,
                        const TransferCallback& on_transfer) override;
};

absl::Status CurlDownloader::Download(const std::string& url,
                                      const DataCallback& on_data,
                                      const TransferCallback& on_transfer) {
  if (InterruptRequested())
    return absl::CancelledError("Download of " + url + " interrupted");

  ScopedCurlEasyhandle curl(curl_easy_init());
  if (!curl)
    return NetworkError("Failed to initialize curl");

  TransferState state = {.on_data = &on_data, .on_transfer = &on_transfer};
  char error_buffer[CURL_ERROR_SIZE] = {};

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, kUserAgent);
  // Image hosts redirect to their storage backend.
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_PROTOCOLS_STR, "http,https");
  curl_easy_setopt(curl.get(), CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
  curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, kConnectTimeoutSeconds);
  // Fail on HTTP status >= 400 instead of storing the error page.
  curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &WriteCallback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &state);
  curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION,
                   &TransferInfoCallback);
  curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &state);

  const CURLcode result = curl_easy_perform(curl.get());
  if (state.interrupted)
    return absl::CancelledError("Download of " + url + " interrupted");
  if (state.aborted)
    return absl::AbortedError("Transfer of " + url + " aborted by the sink");

  if (result != CURLE_OK) {
    std::string message = error_buffer[0] ? std::string(error_buffer)
                                          : curl_easy_strerror(result);
    long response_code = 0;  // NOLINT(runtime/int)
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response_code);
    if (response_code != 0)
      message += " (HTTP " + std::to_string(response_code) + ")";
    return NetworkError("Cannot download " + url + ": " + message);
  }

  return absl::OkStatus();
}

}  // namespace

std::unique_ptr<Downloader> Downloader::Create() {
  return std::make_unique<CurlDownloader>();
}

}  // namespace dead_drop
