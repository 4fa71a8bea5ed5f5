// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef DEAD_DROP_UTILS_H_
#define DEAD_DROP_UTILS_H_

#include <sys/types.h>

#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <base/files/file_path.h>
#include <brillo/secure_blob.h>

namespace dead_drop {

constexpr char kDevMapperDir[] = "/dev/mapper";
constexpr char kProcMountInfo[] = "/proc/self/mountinfo";
constexpr uint64_t kMiB = 1048576;

// Process, file and mount primitives used by every component. All access to
// the kernel and the file system goes through the singleton returned by
// Get(), so tests can swap it for a MockUtils.
class Utils {
 public:
  static Utils* Get();
  static void OverrideForTesting(Utils* util);

  // Virtual for testing
  virtual absl::Status RunProcessHelper(
      const std::vector<std::string>& commands);
  virtual absl::Status RunProcessHelper(
      const std::vector<std::string>& commands, std::string* output);
  // Runs |commands| with |input| written to its stdin through a pipe, and
  // returns the exit code. |output| receives the combined stdout and stderr.
  // |input| is never placed in the argument list or the environment.
  virtual absl::StatusOr<int> RunProcessWithInput(
      const std::vector<std::string>& commands,
      const brillo::SecureBlob& input,
      std::string* output);
  virtual absl::Status ReadFileToStringWithMaxSize(const base::FilePath& path,
                                                   std::string* contents,
                                                   size_t max_size);
  virtual absl::Status ReadFileToString(const base::FilePath& path,
                                        std::string* contents);
  virtual absl::Status DeleteFile(const base::FilePath& path);
  virtual absl::Status DeletePathRecursively(const base::FilePath& path);
  virtual absl::Status PathExists(const base::FilePath& path);
  virtual absl::Status DirectoryExists(const base::FilePath& path);
  virtual absl::Status CreateDirectory(const base::FilePath& path);
  virtual absl::Status SetPosixFilePermissions(const base::FilePath& path,
                                               int mode);
  virtual absl::Status Mount(const std::string& source,
                             const std::string& target,
                             const std::string& fs_type,
                             uint64_t mount_flags,
                             const std::string& data);
  virtual absl::Status Umount(const std::string& target);
  // Re-reads the mount table on every call.
  virtual absl::StatusOr<bool> IsMountPoint(const base::FilePath& path);
  // Overwrites the whole length of the regular file at |path| with random
  // bytes and flushes it to the backing device. The file is left in place.
  virtual absl::Status OverwriteWithRandom(const base::FilePath& path);
  // Lists the regular files below |dir|, recursively.
  virtual absl::StatusOr<std::vector<base::FilePath>> EnumerateFiles(
      const base::FilePath& dir);
  virtual absl::StatusOr<base::FilePath> GetSelfExecutable();
  virtual uid_t GetEffectiveUid();
  // Starts |argv| in a new session, detached from the caller's process group
  // and standard streams, with |env| as its whole environment and "/" as its
  // working directory. Returns the pid of the detached process once its
  // exec() succeeded.
  virtual absl::StatusOr<pid_t> SpawnDetached(
      const std::vector<std::string>& argv,
      const std::vector<std::string>& env);

  absl::StatusOr<uint64_t> ParseSize(const std::string& str);

 private:
  Utils() = default;
  Utils& operator=(const Utils&) = delete;
  Utils(const Utils&) = delete;

  virtual ~Utils() = default;

  friend class MockUtils;
};

// Returns the mount points listed in |mountinfo|, the content of a
// /proc/<pid>/mountinfo file, with octal escapes decoded.
std::vector<base::FilePath> ParseMountPoints(std::string_view mountinfo);

}  // namespace dead_drop

#endif  // DEAD_DROP_UTILS_H_
