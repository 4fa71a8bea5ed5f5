// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "dead_drop/config.h"

#include <set>
#include <utility>

#include <absl/strings/numbers.h>
#include <base/logging.h>
#include <base/strings/string_split.h>
#include <base/strings/string_util.h>
#include <brillo/key_value_store.h>

#include "dead_drop/status.h"

namespace dead_drop {

namespace {

constexpr char kRamdiskPathKey[] = "ramdisk_path";
constexpr char kRamdiskSizeKey[] = "ramdisk_size";
constexpr char kImageUrlKey[] = "image_url";
constexpr char kImagePathKey[] = "image_path";
constexpr char kMapperNameKey[] = "mapper_name";
constexpr char kMountPointKey[] = "mount_point";
constexpr char kVolumeMountOptionsKey[] = "volume_mount_options";
constexpr char kCryptsetupPathKey[] = "cryptsetup_path";
constexpr char kMountPathKey[] = "mount_path";
constexpr char kLifetimesKey[] = "lifetimes_seconds";
constexpr char kMinSessionKey[] = "min_session_seconds";
constexpr char kSecretFilesKey[] = "secret_files";

std::string DescribeLifetime(int64_t seconds) {
  if (seconds % 60 == 0) {
    const int64_t minutes = seconds / 60;
    return std::to_string(minutes) + (minutes == 1 ? " minute" : " minutes");
  }
  return std::to_string(seconds) + (seconds == 1 ? " second" : " seconds");
}

absl::StatusOr<int64_t> ParseSeconds(const std::string& key,
                                     const std::string& value) {
  int64_t seconds;
  if (!absl::SimpleAtoi(value, &seconds) || seconds < 0)
    return ConfigError(key + ": invalid number of seconds \"" + value + "\"");
  return seconds;
}

std::vector<std::string> SplitList(const std::string& value) {
  return base::SplitString(value, ",", base::TRIM_WHITESPACE,
                           base::SPLIT_WANT_NONEMPTY);
}

// Applies one key of the configuration file to |config|.
absl::Status ApplyKey(const std::string& key,
                      const std::string& value,
                      Config* config) {
  if (key == kRamdiskPathKey) {
    config->ramdisk_path = base::FilePath(value);
  } else if (key == kRamdiskSizeKey) {
    config->ramdisk_size = value;
  } else if (key == kImageUrlKey) {
    config->image_url = value;
  } else if (key == kImagePathKey) {
    config->image_path = base::FilePath(value);
  } else if (key == kMapperNameKey) {
    config->mapper_name = value;
  } else if (key == kMountPointKey) {
    config->mount_point = base::FilePath(value);
  } else if (key == kVolumeMountOptionsKey) {
    config->volume_mount_options = value;
  } else if (key == kCryptsetupPathKey) {
    config->cryptsetup_path = base::FilePath(value);
  } else if (key == kMountPathKey) {
    config->mount_path = base::FilePath(value);
  } else if (key == kLifetimesKey) {
    config->lifetime_choices.clear();
    for (const std::string& item : SplitList(value)) {
      absl::StatusOr<int64_t> seconds = ParseSeconds(key, item);
      if (!seconds.ok())
        return seconds.status();
      config->lifetime_choices.push_back(
          {base::Seconds(*seconds), DescribeLifetime(*seconds)});
    }
  } else if (key == kMinSessionKey) {
    absl::StatusOr<int64_t> seconds = ParseSeconds(key, value);
    if (!seconds.ok())
      return seconds.status();
    config->min_session = base::Seconds(*seconds);
  } else if (key == kSecretFilesKey) {
    config->secret_files = SplitList(value);
  } else {
    return ConfigError("Unknown configuration key \"" + key + "\"");
  }
  return absl::OkStatus();
}

}  // namespace

absl::Status Config::Validate() const {
  for (const auto& [name, path] :
       {std::pair{"ramdisk_path", &ramdisk_path},
        std::pair{"image_path", &image_path},
        std::pair{"mount_point", &mount_point},
        std::pair{"cryptsetup_path", &cryptsetup_path},
        std::pair{"mount_path", &mount_path}}) {
    if (!path->IsAbsolute() || path->ReferencesParent())
      return ConfigError(std::string(name) + " must be an absolute path: " +
                         path->value());
  }

  if (ramdisk_path == mount_point)
    return ConfigError("ramdisk_path and mount_point must differ");

  if (mapper_name.empty() ||
      mapper_name.find_first_of("/ ") != std::string::npos)
    return ConfigError("Invalid mapper name \"" + mapper_name + "\"");

  if (!base::StartsWith(image_url, "https://") &&
      !base::StartsWith(image_url, "http://"))
    return ConfigError("image_url must be an HTTP(S) URL: " + image_url);

  if (lifetime_choices.empty())
    return ConfigError("No lifetime choices configured");

  for (const LifetimeChoice& choice : lifetime_choices) {
    if (choice.lifetime < min_session)
      return ConfigError("Lifetime " + choice.description +
                         " is shorter than the minimum session of " +
                         DescribeLifetime(min_session.InSeconds()));
  }

  if (secret_files.empty())
    return ConfigError("No secret files configured");

  for (const std::string& name : secret_files) {
    const base::FilePath file(name);
    if (file.IsAbsolute() || file.ReferencesParent() ||
        name.find('/') != std::string::npos)
      return ConfigError("Invalid secret file name \"" + name + "\"");
  }

  return absl::OkStatus();
}

absl::StatusOr<Config> LoadConfig(const base::FilePath& path) {
  return LoadConfig(path, Config());
}

absl::StatusOr<Config> LoadConfig(const base::FilePath& path,
                                  const Config& base) {
  brillo::KeyValueStore store;
  if (!store.Load(path))
    return ConfigError("Cannot parse configuration file " + path.value());

  Config config = base;
  for (const std::string& key : store.GetKeys()) {
    std::string value;
    if (!store.GetString(key, &value))
      continue;
    absl::Status status = ApplyKey(key, value, &config);
    if (!status.ok())
      return WithErrorKind(status, ErrorKind::kConfig, path.value());
  }

  VLOG(1) << "Loaded configuration " << config << " from " << path;
  return config;
}

}  // namespace dead_drop
