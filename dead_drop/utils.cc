// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "dead_drop/status.h"
#include "dead_drop/utils.h"

#include <dirent.h>
#include <fcntl.h>
#include <linux/close_range.h>
#include <signal.h>
#include <sys/mount.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <limits>
#include <string>
#include <utility>

#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <base/files/file.h>
#include <base/files/file_enumerator.h>
#include <base/files/file_util.h>
#include <base/files/scoped_file.h>
#include <base/logging.h>
#include <base/posix/eintr_wrapper.h>
#include <base/rand_util.h>
#include <base/strings/string_split.h>
#include <brillo/files/file_util.h>
#include <brillo/process/process.h>

namespace dead_drop {

namespace {
Utils* util_ = nullptr;

// Size of the random blocks written over a file being erased.
constexpr int64_t kOverwriteChunkSize = kMiB;

// Records sent by the intermediate and the detached child of SpawnDetached()
// to the parent.
struct SpawnReport {
  enum Kind : int32_t {
    kDetachedPid = 0,
    kSetsidFailed = 1,
    kForkFailed = 2,
    kExecFailed = 3,
  };
  int32_t kind;
  int32_t value;
};

// Async-signal-safe write of a SpawnReport, for use between fork() and exec().
void SendReport(int fd, SpawnReport::Kind kind, int32_t value) {
  const SpawnReport report = {kind, value};
  [[maybe_unused]] ssize_t n = HANDLE_EINTR(write(fd, &report, sizeof(report)));
}

// Marks every descriptor above stderr close-on-exec, so that only the standard
// streams reach the exec'ed program while |report_fd| stays usable until the
// exec. Falls back to walking /proc/self/fd on kernels without close_range(2).
bool CloseInheritedFds(int report_fd) {
  if (syscall(SYS_close_range, STDERR_FILENO + 1, ~0U, CLOSE_RANGE_CLOEXEC) ==
      0)
    return true;
  if (errno != ENOSYS && errno != EINVAL)
    return false;

  DIR* dir = opendir("/proc/self/fd");
  if (!dir)
    return false;
  const int dir_fd = dirfd(dir);
  bool ok = true;
  while (struct dirent* entry = readdir(dir)) {
    int fd;
    if (!absl::SimpleAtoi(entry->d_name, &fd) || fd <= STDERR_FILENO ||
        fd == dir_fd || fd == report_fd)
      continue;
    if (fcntl(fd, F_SETFD, FD_CLOEXEC) < 0 && errno != EBADF)
      ok = false;
  }
  closedir(dir);
  return ok;
}

// Builds a null-terminated array of pointers into |strings|.
std::vector<char*> ToCStringArray(const std::vector<std::string>& strings) {
  std::vector<char*> array;
  array.reserve(strings.size() + 1);
  for (const std::string& s : strings)
    array.push_back(const_cast<char*>(s.c_str()));
  array.push_back(nullptr);
  return array;
}

// Decodes the \ooo escapes used by the kernel in /proc mount tables.
std::string DecodeMountInfoEscapes(std::string_view field) {
  std::string out;
  out.reserve(field.size());
  for (size_t i = 0; i < field.size(); ++i) {
    if (field[i] == '\\' && i + 3 < field.size() &&
        std::all_of(field.begin() + i + 1, field.begin() + i + 4,
                    [](char c) { return c >= '0' && c <= '7'; })) {
      out.push_back(static_cast<char>((field[i + 1] - '0') * 64 +
                                      (field[i + 2] - '0') * 8 +
                                      (field[i + 3] - '0')));
      i += 3;
    } else {
      out.push_back(field[i]);
    }
  }
  return out;
}

}  // namespace

Utils* Utils::Get() {
  [[maybe_unused]] static bool created = []() -> bool {
    if (!util_)
      util_ = new Utils;
    return true;
  }();

  return util_;
}

void Utils::OverrideForTesting(Utils* util) {
  util_ = util;
}

// Helper function to run binary.
// On success, store stdout in |output| and return absl::OkStatus()
// On failure, return an error carrying the exit code and the output.
absl::Status Utils::RunProcessHelper(const std::vector<std::string>& commands,
                                     std::string* output) {
  if (commands.empty())
    return absl::InvalidArgumentError("Empty input for RunProcessHelper.");

  brillo::ProcessImpl process;
  for (auto& com : commands)
    process.AddArg(com);

  process.RedirectOutputToMemory(true);

  const int exit_code = process.Run();
  if (exit_code < 0)
    return absl::InternalError("Cannot run " + commands[0]);
  if (exit_code != EXIT_SUCCESS)
    return absl::InternalError(commands[0] + " exited with " +
                               std::to_string(exit_code) + ": " +
                               process.GetOutputString(STDOUT_FILENO));

  *output = process.GetOutputString(STDOUT_FILENO);

  return absl::OkStatus();
}

// Same as the previous one, but log stdout instead of send it back.
absl::Status Utils::RunProcessHelper(const std::vector<std::string>& commands) {
  std::string output;
  absl::Status status = RunProcessHelper(commands, &output);
  if (!status.ok())
    return status;

  if (!output.empty())
    LOG(INFO) << commands[0] << ": " << output;

  return absl::OkStatus();
}

absl::StatusOr<int> Utils::RunProcessWithInput(
    const std::vector<std::string>& commands,
    const brillo::SecureBlob& input,
    std::string* output) {
  if (commands.empty())
    return absl::InvalidArgumentError("Empty input for RunProcessWithInput.");

  int fds[2];
  if (pipe2(fds, O_CLOEXEC) < 0)
    return ErrnoToStatus(errno, "Cannot create stdin pipe");
  base::ScopedFD read_fd(fds[0]);
  base::ScopedFD write_fd(fds[1]);

  brillo::ProcessImpl process;
  for (auto& com : commands)
    process.AddArg(com);

  process.BindFd(read_fd.get(), STDIN_FILENO);
  process.RedirectOutputToMemory(true);

  if (!process.Start())
    return ErrnoToStatus(errno, "Cannot start " + commands[0]);

  // The child holds its own copy of the read end.
  read_fd.reset();

  const uint8_t* data = input.data();
  size_t remaining = input.size();
  while (remaining > 0) {
    const ssize_t written =
        HANDLE_EINTR(write(write_fd.get(), data, remaining));
    if (written < 0) {
      // The child may exit before consuming its input, e.g. on a usage error.
      // Its exit code tells what happened.
      PLOG(WARNING) << "Cannot write the input of " << commands[0];
      break;
    }
    data += written;
    remaining -= static_cast<size_t>(written);
  }
  write_fd.reset();

  const int exit_code = process.Wait();
  *output = process.GetOutputString(STDOUT_FILENO);
  if (exit_code < 0)
    return absl::InternalError("Cannot wait for " + commands[0]);

  return exit_code;
}

absl::Status Utils::ReadFileToStringWithMaxSize(const base::FilePath& path,
                                                std::string* contents,
                                                size_t max_size) {
  if (!base::ReadFileToStringWithMaxSize(path, contents, max_size)) {
    // |contents| holds the first |max_size| bytes when the file is larger.
    if (contents->size() == max_size)
      return absl::OutOfRangeError(path.value() + " is larger than " +
                                   std::to_string(max_size) + " bytes");
    return ErrnoToStatus(errno, "Failed to read " + path.value());
  }

  return absl::OkStatus();
}

absl::Status Utils::ReadFileToString(const base::FilePath& path,
                                     std::string* contents) {
  return ReadFileToStringWithMaxSize(path, contents,
                                     std::numeric_limits<size_t>::max());
}

absl::Status Utils::DeleteFile(const base::FilePath& path) {
  if (!brillo::DeleteFile(path))
    return ErrnoToStatus(errno, "Failed to delete " + path.value());

  return absl::OkStatus();
}

absl::Status Utils::DeletePathRecursively(const base::FilePath& path) {
  if (!brillo::DeletePathRecursively(path))
    return ErrnoToStatus(errno, "Failed to delete " + path.value());

  return absl::OkStatus();
}

absl::Status Utils::PathExists(const base::FilePath& path) {
  if (!base::PathExists(path))
    return ErrnoToStatus(errno, path.value() + " does not exist.");

  return absl::OkStatus();
}

absl::Status Utils::DirectoryExists(const base::FilePath& path) {
  if (!base::DirectoryExists(path))
    return absl::NotFoundError(path.value() + " is not a directory.");

  return absl::OkStatus();
}

absl::Status Utils::CreateDirectory(const base::FilePath& path) {
  if (!base::CreateDirectory(path))
    return ErrnoToStatus(errno, "Can not create " + path.value());

  return absl::OkStatus();
}

absl::Status Utils::SetPosixFilePermissions(const base::FilePath& path,
                                            int mode) {
  if (!base::SetPosixFilePermissions(path, mode))
    return ErrnoToStatus(errno, "Failed to set permission for " + path.value() +
                                    " to " + std::to_string(mode));

  return absl::OkStatus();
}

absl::Status Utils::Mount(const std::string& source,
                          const std::string& target,
                          const std::string& fs_type,
                          uint64_t mount_flags,
                          const std::string& data) {
  if (mount(source.c_str(), target.c_str(), fs_type.c_str(), mount_flags,
            data.c_str()) == -1)
    return ErrnoToStatus(errno, "Failed to mount " + target);

  return absl::OkStatus();
}

absl::Status Utils::Umount(const std::string& target) {
  if (umount(target.c_str()) == -1)
    return ErrnoToStatus(errno, "Failed to umount " + target);

  return absl::OkStatus();
}

absl::StatusOr<bool> Utils::IsMountPoint(const base::FilePath& path) {
  // The kernel lists canonical paths. A path that cannot be resolved does not
  // exist, so nothing is mounted there.
  const base::FilePath real_path = base::MakeAbsoluteFilePath(path);
  if (real_path.empty())
    return false;

  std::string mountinfo;
  absl::Status status =
      ReadFileToString(base::FilePath(kProcMountInfo), &mountinfo);
  if (!status.ok())
    return status;

  const std::vector<base::FilePath> mount_points = ParseMountPoints(mountinfo);
  return std::find(mount_points.begin(), mount_points.end(), real_path) !=
         mount_points.end();
}

absl::Status Utils::OverwriteWithRandom(const base::FilePath& path) {
  base::File file(path, base::File::FLAG_OPEN | base::File::FLAG_WRITE);
  if (!file.IsValid())
    return ErrnoToStatus(errno, "Cannot open " + path.value() +
                                    " for overwriting");

  const int64_t length = file.GetLength();
  if (length < 0)
    return ErrnoToStatus(errno, "Cannot get the size of " + path.value());

  for (int64_t offset = 0; offset < length;) {
    const int64_t chunk = std::min(kOverwriteChunkSize, length - offset);
    const std::string random_bytes =
        base::RandBytesAsString(static_cast<size_t>(chunk));
    const int written = file.Write(offset, random_bytes.data(),
                                   static_cast<int>(random_bytes.size()));
    if (written <= 0)
      return ErrnoToStatus(errno, "Cannot overwrite " + path.value() +
                                      " at offset " + std::to_string(offset));
    offset += written;
  }

  if (!file.Flush())
    return ErrnoToStatus(errno, "Cannot flush " + path.value());

  VLOG(1) << "Overwrote " << length << " bytes of " << path;
  return absl::OkStatus();
}

absl::StatusOr<std::vector<base::FilePath>> Utils::EnumerateFiles(
    const base::FilePath& dir) {
  if (!base::DirectoryExists(dir))
    return absl::NotFoundError(dir.value() + " is not a directory.");

  std::vector<base::FilePath> files;
  base::FileEnumerator enumerator(dir, /*recursive=*/true,
                                  base::FileEnumerator::FILES);
  for (base::FilePath file = enumerator.Next(); !file.empty();
       file = enumerator.Next()) {
    files.push_back(file);
  }
  return files;
}

absl::StatusOr<base::FilePath> Utils::GetSelfExecutable() {
  base::FilePath self;
  if (!base::ReadSymbolicLink(base::FilePath("/proc/self/exe"), &self))
    return ErrnoToStatus(errno, "Cannot resolve /proc/self/exe");

  return self;
}

uid_t Utils::GetEffectiveUid() {
  return geteuid();
}

absl::StatusOr<pid_t> Utils::SpawnDetached(
    const std::vector<std::string>& argv,
    const std::vector<std::string>& env) {
  if (argv.empty())
    return absl::InvalidArgumentError("Empty input for SpawnDetached.");

  // Everything the children touch is prepared before fork().
  std::vector<char*> c_argv = ToCStringArray(argv);
  std::vector<char*> c_env = ToCStringArray(env);

  int fds[2];
  if (pipe2(fds, O_CLOEXEC) < 0)
    return ErrnoToStatus(errno, "Cannot create report pipe");
  base::ScopedFD report_read(fds[0]);
  base::ScopedFD report_write(fds[1]);

  const pid_t child = fork();
  if (child < 0)
    return ErrnoToStatus(errno, "Cannot fork");

  if (child == 0) {
    // Intermediate child: leave the caller's session and process group.
    if (setsid() < 0) {
      SendReport(report_write.get(), SpawnReport::kSetsidFailed, errno);
      _exit(EXIT_FAILURE);
    }

    const pid_t detached = fork();
    if (detached < 0) {
      SendReport(report_write.get(), SpawnReport::kForkFailed, errno);
      _exit(EXIT_FAILURE);
    }

    if (detached > 0) {
      // Exiting orphans the detached child, which gets reparented to init.
      SendReport(report_write.get(), SpawnReport::kDetachedPid, detached);
      _exit(EXIT_SUCCESS);
    }

    // Detached child: not a session leader, so it can never reacquire a
    // controlling terminal.
    umask(077);
    if (chdir("/") < 0) {
      SendReport(report_write.get(), SpawnReport::kExecFailed, errno);
      _exit(EXIT_FAILURE);
    }

    const int null_fd = open("/dev/null", O_RDWR);
    if (null_fd < 0) {
      SendReport(report_write.get(), SpawnReport::kExecFailed, errno);
      _exit(EXIT_FAILURE);
    }
    dup2(null_fd, STDIN_FILENO);
    dup2(null_fd, STDOUT_FILENO);
    dup2(null_fd, STDERR_FILENO);

    if (!CloseInheritedFds(report_write.get())) {
      SendReport(report_write.get(), SpawnReport::kExecFailed, errno);
      _exit(EXIT_FAILURE);
    }

    // Start from a clean signal mask.
    sigset_t empty_mask;
    sigemptyset(&empty_mask);
    sigprocmask(SIG_SETMASK, &empty_mask, nullptr);

    execve(c_argv[0], c_argv.data(), c_env.data());
    SendReport(report_write.get(), SpawnReport::kExecFailed, errno);
    _exit(127);
  }

  // The parent only reads. EOF comes once the intermediate child exited and
  // the detached child either exec'ed or exited.
  report_write.reset();

  pid_t detached_pid = -1;
  absl::Status status = absl::OkStatus();
  SpawnReport report;
  while (HANDLE_EINTR(read(report_read.get(), &report, sizeof(report))) ==
         static_cast<ssize_t>(sizeof(report))) {
    switch (report.kind) {
      case SpawnReport::kDetachedPid:
        detached_pid = report.value;
        break;
      case SpawnReport::kSetsidFailed:
        status = ErrnoToStatus(report.value, "Cannot create a new session");
        break;
      case SpawnReport::kForkFailed:
        status = ErrnoToStatus(report.value, "Cannot fork the detached child");
        break;
      case SpawnReport::kExecFailed:
        status = ErrnoToStatus(report.value, "Cannot execute " + argv[0]);
        break;
    }
  }

  int wstatus = 0;
  if (HANDLE_EINTR(waitpid(child, &wstatus, 0)) < 0)
    PLOG(WARNING) << "Cannot reap intermediate child " << child;

  if (!status.ok())
    return status;

  if (detached_pid <= 0)
    return absl::InternalError("No detached process was reported");

  return detached_pid;
}

absl::StatusOr<uint64_t> Utils::ParseSize(const std::string& str) {
  std::string_view value = absl::StripAsciiWhitespace(str);
  if (value.empty())
    return absl::InvalidArgumentError("Empty size");

  uint64_t multiplier = 1;
  switch (absl::ascii_toupper(value.back())) {
    case 'K':
      multiplier = 1024;
      break;
    case 'M':
      multiplier = kMiB;
      break;
    case 'G':
      multiplier = 1024 * kMiB;
      break;
    default:
      break;
  }
  if (multiplier != 1)
    value.remove_suffix(1);

  uint64_t number;
  if (value.empty() ||
      !std::all_of(value.begin(), value.end(), absl::ascii_isdigit) ||
      !absl::SimpleAtoi(value, &number))
    return absl::InvalidArgumentError("Failed to convert " + str +
                                      " to a size.");

  if (number > std::numeric_limits<uint64_t>::max() / multiplier)
    return absl::OutOfRangeError(str + " is too large.");

  return number * multiplier;
}

std::vector<base::FilePath> ParseMountPoints(std::string_view mountinfo) {
  std::vector<base::FilePath> mount_points;
  for (std::string_view line : base::SplitStringPiece(
           mountinfo, "\n", base::TRIM_WHITESPACE, base::SPLIT_WANT_NONEMPTY)) {
    // mount_id parent_id major:minor root mount_point options ...
    const std::vector<std::string_view> fields = base::SplitStringPiece(
        line, " ", base::KEEP_WHITESPACE, base::SPLIT_WANT_NONEMPTY);
    if (fields.size() < 5) {
      LOG(WARNING) << "Ignoring malformed mountinfo line: " << line;
      continue;
    }
    mount_points.emplace_back(DecodeMountInfoEscapes(fields[4]));
  }
  return mount_points;
}

}  // namespace dead_drop
