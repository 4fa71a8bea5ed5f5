// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include <signal.h>
#include <sysexits.h>
#include <unistd.h>

#include <iostream>
#include <memory>
#include <optional>
#include <utility>

#include <absl/status/status.h>
#include <base/command_line.h>
#include <base/files/file_path.h>
#include <base/functional/bind.h>
#include <base/logging.h>
#include <base/time/default_tick_clock.h>
#include <brillo/flag_helper.h>
#include <brillo/syslog_logging.h>

#include "dead_drop/cleanup.h"
#include "dead_drop/config.h"
#include "dead_drop/dead_drop.h"
#include "dead_drop/destruct_runner.h"
#include "dead_drop/destruct_unit.h"
#include "dead_drop/downloader.h"
#include "dead_drop/encryption_service.h"
#include "dead_drop/interrupt.h"
#include "dead_drop/passphrase_prompt.h"
#include "dead_drop/status.h"

namespace {

bool RunCleanup(dead_drop::CleanupAction* action,
                const dead_drop::DestructUnit* unit) {
  return action->Run(*unit).ok();
}

// Entry point of the detached destruct unit. Started by
// DestructScheduler::Activate() with no terminal attached.
int RunDestructUnit(const base::CommandLine& command_line) {
  brillo::InitLog(brillo::kLogToSyslog);

  absl::StatusOr<dead_drop::DestructUnit> unit =
      dead_drop::DestructUnit::FromCommandLine(command_line);
  if (!unit.ok()) {
    LOG(ERROR) << "Invalid destruct unit: " << unit.status();
    return EX_USAGE;
  }

  const dead_drop::DestructUnit& destruct_unit = *unit;
  std::unique_ptr<dead_drop::EncryptionService> encryption =
      dead_drop::EncryptionService::Create(destruct_unit.cryptsetup_path());
  dead_drop::CleanupAction action(encryption.get());
  dead_drop::DestructRunner runner(
      destruct_unit,
      base::BindRepeating(&RunCleanup, base::Unretained(&action),
                          base::Unretained(&destruct_unit)));
  return runner.Run();
}

}  // namespace

int main(int argc, char* argv[]) {
  // The destruct unit switches are not flags of the interactive program.
  base::CommandLine::Init(argc, argv);
  const base::CommandLine* command_line =
      base::CommandLine::ForCurrentProcess();
  if (command_line->HasSwitch(dead_drop::kDestructUnitSwitch))
    return RunDestructUnit(*command_line);

  DEFINE_string(config, "", "Path of a key=value file overriding defaults");
  DEFINE_string(url, "", "URL of the encrypted image, overrides the config");
  DEFINE_int64(lifetime_seconds, 0,
               "Token lifetime in seconds; must be one of the configured "
               "choices. Asked interactively when 0");
  DEFINE_bool(destroy_now, false,
              "Erase the volume, image and RAM disk immediately and exit");
  brillo::FlagHelper::Init(argc, argv, "LUKS dead-drop with self-destruct");
  brillo::InitLog(brillo::kLogToSyslog | brillo::kLogToStderrIfTty);

  if (!command_line->GetArgs().empty()) {
    LOG(ERROR) << "Unhandled arguments; please see --help for more info.";
    return EX_USAGE;
  }
  if (FLAGS_lifetime_seconds < 0) {
    LOG(ERROR) << "--lifetime_seconds must not be negative";
    return EX_USAGE;
  }

  dead_drop::Config config;
  if (!FLAGS_config.empty()) {
    absl::StatusOr<dead_drop::Config> loaded =
        dead_drop::LoadConfig(base::FilePath(FLAGS_config));
    if (!loaded.ok()) {
      LOG(ERROR) << loaded.status();
      return dead_drop::ExitCodeForStatus(loaded.status());
    }
    config = *std::move(loaded);
  }
  if (!FLAGS_url.empty())
    config.image_url = FLAGS_url;

  absl::Status status = config.Validate();
  if (!status.ok()) {
    LOG(ERROR) << "Invalid configuration: " << status;
    return dead_drop::ExitCodeForStatus(status);
  }

  signal(SIGPIPE, SIG_IGN);
  dead_drop::InstallInterruptHandler();

  std::unique_ptr<dead_drop::Downloader> downloader =
      dead_drop::Downloader::Create();
  std::unique_ptr<dead_drop::EncryptionService> encryption =
      dead_drop::EncryptionService::Create(config.cryptsetup_path);
  dead_drop::TerminalPassphrasePrompt prompt(STDIN_FILENO, std::cout);

  dead_drop::DeadDrop session(config, downloader.get(), encryption.get(),
                              &prompt, base::DefaultTickClock::GetInstance(),
                              std::cin, std::cout);

  if (FLAGS_destroy_now) {
    status = session.DestroyNow();
  } else {
    std::optional<base::TimeDelta> lifetime;
    if (FLAGS_lifetime_seconds > 0)
      lifetime = base::Seconds(FLAGS_lifetime_seconds);
    status = session.Run(lifetime);
  }

  if (!status.ok()) {
    LOG(ERROR) << "dead_drop failed ("
               << dead_drop::ErrorKindName(dead_drop::GetErrorKind(status))
               << "): " << status;
    return dead_drop::ExitCodeForStatus(status);
  }

  return EX_OK;
}
