// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "dead_drop/downloader.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

#include <memory>
#include <string>
#include <string_view>

#include <base/files/file_util.h>
#include <base/files/scoped_temp_dir.h>
#include <base/files/scoped_file.h>
#include <base/functional/bind.h>
#include <base/posix/eintr_wrapper.h>
#include <gtest/gtest.h>

#include "dead_drop/interrupt.h"
#include "dead_drop/status.h"

namespace dead_drop {
namespace {

bool Collect(std::string* body, std::string_view chunk) {
  body->append(chunk);
  return true;
}

void IgnoreTransfer(int64_t received, int64_t total) {}

// Stores the chunk, then interrupts the process as Ctrl-C would.
bool CollectThenInterrupt(std::string* body, std::string_view chunk) {
  body->append(chunk);
  raise(SIGINT);
  return true;
}

// Answers one request with the start of a large body, then holds the
// connection open without sending anything more.
void ServeStalledResponse(int listen_fd) {
  base::ScopedFD conn(HANDLE_EINTR(accept(listen_fd, nullptr, nullptr)));
  if (!conn.is_valid())
    _exit(EXIT_FAILURE);

  char request[4096];
  if (HANDLE_EINTR(read(conn.get(), request, sizeof(request))) <= 0)
    _exit(EXIT_FAILURE);

  const std::string response =
      "HTTP/1.1 200 OK\r\n"
      "Content-Length: 2097152\r\n"
      "\r\n"
      "first chunk";
  if (!base::WriteFileDescriptor(conn.get(), response))
    _exit(EXIT_FAILURE);

  // Wait for the client to hang up, for at most 30 seconds.
  struct pollfd pfd = {.fd = conn.get(), .events = POLLIN};
  HANDLE_EINTR(poll(&pfd, 1, 30 * 1000));
  _exit(EXIT_SUCCESS);
}

}  // namespace

class CurlDownloaderTest : public ::testing::Test {
 public:
  void SetUp() override {
    downloader_ = Downloader::Create();
    InstallInterruptHandler();
    ClearInterrupt();
  }

  void TearDown() override {
    ClearInterrupt();
    if (server_pid_ > 0) {
      kill(server_pid_, SIGKILL);
      HANDLE_EINTR(waitpid(server_pid_, nullptr, 0));
    }
  }

 protected:
  absl::Status Download(const std::string& url) {
    return downloader_->Download(
        url, base::BindRepeating(&Collect, base::Unretained(&body_)),
        base::BindRepeating(&IgnoreTransfer));
  }

  // Starts ServeStalledResponse() in a child process on a loopback port and
  // returns the URL it answers.
  std::string StartStalledServer() {
    base::ScopedFD listener(socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
    EXPECT_TRUE(listener.is_valid());

    struct sockaddr_in addr = {};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    EXPECT_EQ(bind(listener.get(), reinterpret_cast<sockaddr*>(&addr),
                   sizeof(addr)),
              0);
    EXPECT_EQ(listen(listener.get(), 1), 0);
    socklen_t addr_len = sizeof(addr);
    EXPECT_EQ(getsockname(listener.get(), reinterpret_cast<sockaddr*>(&addr),
                          &addr_len),
              0);

    server_pid_ = fork();
    if (server_pid_ == 0)
      ServeStalledResponse(listener.get());
    EXPECT_GT(server_pid_, 0);

    return "http://127.0.0.1:" + std::to_string(ntohs(addr.sin_port)) +
           "/LUKS-TOKEN-2MB.img";
  }

  std::unique_ptr<Downloader> downloader_;
  std::string body_;
  pid_t server_pid_ = -1;
};

// Only HTTP(S) is fetched, so a local file is never read.
TEST_F(CurlDownloaderTest, RejectsNonHttpProtocols) {
  base::ScopedTempDir temp_dir;
  ASSERT_TRUE(temp_dir.CreateUniqueTempDir());
  const base::FilePath file = temp_dir.GetPath().Append("image.img");
  ASSERT_TRUE(base::WriteFile(file, "local content"));

  absl::Status status = Download("file://" + file.value());
  EXPECT_EQ(GetErrorKind(status), ErrorKind::kNetwork) << status;
  EXPECT_TRUE(body_.empty());
}

TEST_F(CurlDownloaderTest, MalformedUrl) {
  EXPECT_EQ(GetErrorKind(Download("http://")), ErrorKind::kNetwork);
}

TEST_F(CurlDownloaderTest, InterruptStopsStalledTransfer) {
  const std::string url = StartStalledServer();

  absl::Status status = downloader_->Download(
      url, base::BindRepeating(&CollectThenInterrupt, base::Unretained(&body_)),
      base::BindRepeating(&IgnoreTransfer));
  EXPECT_TRUE(absl::IsCancelled(status)) << status;
  EXPECT_FALSE(body_.empty());
}

TEST_F(CurlDownloaderTest, InterruptBeforeTransfer) {
  raise(SIGINT);
  ASSERT_TRUE(InterruptRequested());

  absl::Status status = Download("http://127.0.0.1:1/LUKS-TOKEN-2MB.img");
  EXPECT_TRUE(absl::IsCancelled(status)) << status;
  EXPECT_TRUE(body_.empty());
}

}  // namespace dead_drop
