// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef DEAD_DROP_CONFIG_H_
#define DEAD_DROP_CONFIG_H_

#include <iostream>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <base/files/file_path.h>
#include <base/time/time.h>

namespace dead_drop {

// One entry of the lifetime menu.
struct LifetimeChoice {
  base::TimeDelta lifetime;
  std::string description;
};

// Everything a dead-drop session needs to know about its environment. Built
// once at startup, validated, then handed to every component by const
// reference.
struct Config {
  // Volatile store.
  base::FilePath ramdisk_path{"/tmp/luks_ramdisk"};
  std::string ramdisk_size = "5M";

  // Encrypted image.
  std::string image_url =
      "https://github.com/GlitchLinux/LUKS-TOKEN/raw/refs/heads/main/"
      "LUKS-TOKEN-2MB.img";
  base::FilePath image_path{"/tmp/LUKS-TOKEN-2MB.img"};

  // Unlocked volume.
  std::string mapper_name = "luks_token";
  base::FilePath mount_point{"/tmp/LUKS-TOKEN-2MB"};
  std::string volume_mount_options = "nosuid,nodev,noexec";

  // External tools.
  base::FilePath cryptsetup_path{"/sbin/cryptsetup"};
  base::FilePath mount_path{"/bin/mount"};

  // Destruct unit.
  std::vector<LifetimeChoice> lifetime_choices = {
      {base::Seconds(60), "1 minute"},
      {base::Seconds(300), "5 minutes"},
      {base::Seconds(600), "10 minutes"},
  };
  // No configured lifetime may be shorter than this, so the operator always
  // gets at least this long with the mounted volume.
  base::TimeDelta min_session = base::Seconds(30);

  // Session shell.
  std::vector<std::string> secret_files = {"Notes.txt", "GitHub Token"};
  size_t max_display_bytes = 64 * 1024;

  absl::Status Validate() const;

  friend std::ostream& operator<<(std::ostream& out, const Config& c) {
    out << "[";
    out << "ramdisk_path=" << c.ramdisk_path << " ";
    out << "ramdisk_size=" << c.ramdisk_size << " ";
    out << "image_url=" << c.image_url << " ";
    out << "image_path=" << c.image_path << " ";
    out << "mapper_name=" << c.mapper_name << " ";
    out << "mount_point=" << c.mount_point << " ";
    out << "min_session=" << c.min_session;
    out << "]";

    return out;
  }
};

// Returns the defaults overridden by the keys found in the KeyValueStore file
// at |path|. Unknown keys are rejected.
absl::StatusOr<Config> LoadConfig(const base::FilePath& path);

// Same, starting from |base| instead of the defaults.
absl::StatusOr<Config> LoadConfig(const base::FilePath& path,
                                  const Config& base);

}  // namespace dead_drop

#endif  // DEAD_DROP_CONFIG_H_
